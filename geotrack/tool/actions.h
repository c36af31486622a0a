#pragma once

#include <functional>
#include <iosfwd>
#include <optional>

#include "geotrack/conversions.h"
#include "geotrack/detail/argparse.hpp"

namespace geotrack {

	// Exit codes of the geotrack tool.
	enum ExitCode : int {
		ExitOk         = 0,
		ExitUsage      = 1, // bad or missing options, unreadable input
		ExitConversion = 2, // unsupported projection, unknown coordinate kind
	};

	void print_usage(std::ostream& os);

	// -s/--srid, required.
	Srid require_srid(const ArgParser& parser);

	// --srid wins over --base. An ENU base is rejected: it has no absolute position.
	std::optional<Base> get_base(const ArgParser& parser);

	// Runs @fn on --point, or on every triple read from @in when --point is absent.
	// Blank lines and lines starting with '#' are skipped.
	void for_each_point(const ArgParser& parser, std::istream& in, const std::function<void(const Triple&)>& fn);

	// Runs the action named by -a/--action, results go to @out and errors to @err.
	// Never throws for a geotrack error, returns the exit code instead.
	int run_tool(int argc, char** argv, std::istream& in, std::ostream& out, std::ostream& err);

}
