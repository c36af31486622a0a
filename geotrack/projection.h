#pragma once

#include "geotrack/coords.h"

namespace geotrack {

	// A spatial reference id naming a projected coordinate system.
	// Wrapped so that it can never be mistaken for a coordinate value.
	struct Srid {
		int code;

		inline explicit Srid(int code) : code(code) {}
		inline bool operator==(const Srid& o) const { return code == o.code; }
	};

	constexpr int Lambert93Srid = 2154;
	constexpr int UtmSridFirst  = 32600;
	constexpr int UtmSridLast   = 32799;
	constexpr int UtmSouthSrid  = 32700;

	enum class ProjectionKind {
		Lambert93, Utm
	};

	struct ProjectionSpec {
		ProjectionKind kind;
		int zone   = 0;    // Utm only, 1..60
		bool north = true; // Utm only
	};

	// Throws UnsupportedProjectionError for anything that is not 2154 or a valid UTM zone code.
	// @direction ("forward" or "inverse") is only used to fill in the error.
	ProjectionSpec parse_srid(Srid srid, const std::string& direction);

	// Geographic -> projected (E = easting, N = northing, U = height).
	// Only Lambert-93 has a forward form.
	EnuCoords project(const GeoCoords& p, Srid srid);

	// Projected -> geographic. Lambert-93 and UTM.
	GeoCoords unproject(const EnuCoords& p, Srid srid);

	// The individual projections. Angles in degrees, heights pass through.
	EnuCoords lambert93_forward(const GeoCoords& p);
	GeoCoords lambert93_inverse(const EnuCoords& p);
	GeoCoords utm_inverse(const EnuCoords& p, int zone, bool north);

	// Central meridian of a UTM zone, degrees.
	inline constexpr double utm_central_longitude(int zone) { return (zone - 1) * 6 - 180 + 3; }

}
