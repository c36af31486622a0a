#pragma once

#include <fmt/core.h>
#include <fmt/color.h>

// Setup debug printing.
#ifdef GEOTRACK_DEBUG_PRINT
#define dprint(...) fmt::print(__VA_ARGS__)
#else
#define dprint(...)
#endif

namespace geotrack {

	// Helper for std::visit with a set of lambdas.
	template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
	template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

}
