#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "projection.h"
#include "errors.h"

using namespace geotrack;
using Catch::Matchers::WithinAbs;

TEST_CASE( "ParseSrid", "[projection]" ) {
	REQUIRE(parse_srid(Srid { 2154 }, "inverse").kind == ProjectionKind::Lambert93);

	ProjectionSpec n = parse_srid(Srid { 32631 }, "inverse");
	REQUIRE(n.kind == ProjectionKind::Utm);
	REQUIRE(n.zone == 31);
	REQUIRE(n.north);

	ProjectionSpec s = parse_srid(Srid { 32756 }, "inverse");
	REQUIRE(s.kind == ProjectionKind::Utm);
	REQUIRE(s.zone == 56);
	REQUIRE(not s.north);

	REQUIRE(parse_srid(Srid { 32601 }, "inverse").zone == 1);
	REQUIRE(parse_srid(Srid { 32760 }, "inverse").zone == 60);

	// Inside the UTM code range but not a zone.
	REQUIRE_THROWS_AS(parse_srid(Srid { 32600 }, "inverse"), UnsupportedProjectionError);
	REQUIRE_THROWS_AS(parse_srid(Srid { 32661 }, "inverse"), UnsupportedProjectionError);
	REQUIRE_THROWS_AS(parse_srid(Srid { 32799 }, "inverse"), UnsupportedProjectionError);

	REQUIRE_THROWS_AS(parse_srid(Srid { 4326 }, "inverse"), UnsupportedProjectionError);
	REQUIRE_THROWS_AS(parse_srid(Srid { 32599 }, "inverse"), UnsupportedProjectionError);
	REQUIRE_THROWS_AS(parse_srid(Srid { 32800 }, "inverse"), UnsupportedProjectionError);
}

TEST_CASE( "UnsupportedSrid", "[projection]" ) {
	try {
		project(GeoCoords { 2.3522, 48.8566 }, Srid { 9999 });
		FAIL("expected a throw");
	} catch (const UnsupportedProjectionError& e) {
		REQUIRE(e.srid == 9999);
		REQUIRE(e.direction == "forward");
	}

	try {
		unproject(EnuCoords { 0, 0 }, Srid { 9999 });
		FAIL("expected a throw");
	} catch (const UnsupportedProjectionError& e) {
		REQUIRE(e.srid == 9999);
		REQUIRE(e.direction == "inverse");
	}

	// Invalid zones report the direction they were asked for.
	try {
		unproject(EnuCoords { 500000, 0 }, Srid { 32661 });
		FAIL("expected a throw");
	} catch (const UnsupportedProjectionError& e) {
		REQUIRE(e.direction == "inverse");
	}
	try {
		parse_srid(Srid { 4326 }, "forward");
		FAIL("expected a throw");
	} catch (const UnsupportedProjectionError& e) {
		REQUIRE(e.direction == "forward");
	}

	// UTM only has an inverse.
	try {
		project(GeoCoords { 3, 45 }, Srid { 32631 });
		FAIL("expected a throw");
	} catch (const UnsupportedProjectionError& e) {
		REQUIRE(e.srid == 32631);
		REQUIRE(e.direction == "forward");
	}
}

TEST_CASE( "Lambert93", "[projection]" ) {
	const GeoCoords paris { 2.3522, 48.8566, 35 };

	EnuCoords l = project(paris, Srid { 2154 });
	REQUIRE_THAT(l.E, WithinAbs(652469.0227, 1e-2));
	REQUIRE_THAT(l.N, WithinAbs(6862035.2595, 1e-2));
	REQUIRE(l.U == 35);

	GeoCoords g = unproject(l, Srid { 2154 });
	REQUIRE_THAT(g.lon, WithinAbs(paris.lon, 1e-6));
	REQUIRE_THAT(g.lat, WithinAbs(paris.lat, 1e-6));
	REQUIRE(g.hgt == 35);

	// The central meridian (3 deg) maps to the false easting.
	REQUIRE_THAT(lambert93_forward(GeoCoords { 3, 46.5 }).E, WithinAbs(700000, 1e-6));

	// Round trip over metropolitan France.
	for (double lon = -4.5; lon <= 8; lon += 1.25) {
		for (double lat = 42.5; lat <= 51; lat += 0.85) {
			GeoCoords q = lambert93_inverse(lambert93_forward(GeoCoords { lon, lat }));
			REQUIRE_THAT(q.lon, WithinAbs(lon, 1e-6));
			REQUIRE_THAT(q.lat, WithinAbs(lat, 1e-6));
		}
	}
}

TEST_CASE( "UtmInverse", "[projection]" ) {
	// Origin of zone 31 north: the equator on the central meridian.
	GeoCoords o = unproject(EnuCoords { 500000, 0, 12 }, Srid { 32631 });
	REQUIRE_THAT(o.lon, WithinAbs(3, 1e-9));
	REQUIRE_THAT(o.lat, WithinAbs(0, 1e-9));
	REQUIRE(o.hgt == 12);

	// Same point seen from the southern zone.
	GeoCoords os = unproject(EnuCoords { 500000, 10000000 }, Srid { 32731 });
	REQUIRE_THAT(os.lon, WithinAbs(3, 1e-9));
	REQUIRE_THAT(os.lat, WithinAbs(0, 1e-9));

	// Eiffel tower, 31N.
	GeoCoords e = utm_inverse(EnuCoords { 448251.795, 5411932.678 }, 31, true);
	REQUIRE_THAT(e.lon, WithinAbs(2.2944999971625557, 1e-7));
	REQUIRE_THAT(e.lat, WithinAbs(48.85820000223301, 1e-7));

	// Sydney, 56S.
	GeoCoords s = unproject(EnuCoords { 334786.0, 6252080.0 }, Srid { 32756 });
	REQUIRE_THAT(s.lon, WithinAbs(151.21402286083332, 1e-7));
	REQUIRE_THAT(s.lat, WithinAbs(-33.85866391608052, 1e-7));

	REQUIRE(utm_central_longitude(1) == -177);
	REQUIRE(utm_central_longitude(31) == 3);
	REQUIRE(utm_central_longitude(60) == 177);
}
