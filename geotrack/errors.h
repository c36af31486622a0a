#pragma once

#include <fmt/core.h>
#include <stdexcept>
#include <string>

namespace geotrack {

	// Thrown when an SRID code names a projection (or a projection direction) that is not implemented.
	// @direction is either "forward" or "inverse".
	struct UnsupportedProjectionError : public std::runtime_error {
		int srid;
		std::string direction;

		inline UnsupportedProjectionError(int srid, const std::string& direction)
			: std::runtime_error(fmt::format("UnsupportedProjectionError(srid={}, dir={})", srid, direction)), srid(srid), direction(direction)
		{ }
	};

	// Thrown by make_coords when the kind token is not one of ENU/GEO/ECEF (or their *COORDS forms).
	struct UnknownCoordsKindError : public std::runtime_error {
		const std::string kind;

		inline UnknownCoordsKindError(const std::string& kind)
			: std::runtime_error(fmt::format("UnknownCoordsKindError(kind='{}')", kind)), kind(kind)
		{ }
	};

	// Bad command line usage.
	struct InvalidArgumentError : public std::runtime_error {
		inline InvalidArgumentError(const std::string& msg)
			: std::runtime_error(fmt::format("InvalidArgumentError({})", msg))
		{ }
	};

}
