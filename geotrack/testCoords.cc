#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <fmt/core.h>

#include <cmath>
#include <sstream>

#include "coords.h"
#include "ellipsoid.h"
#include "errors.h"

using namespace geotrack;
using Catch::Matchers::WithinAbs;

TEST_CASE( "Rendering", "[coords]" ) {
	REQUIRE(GeoCoords(2.3522, 48.8566, 35).str() == "[lon= 2.352200000, lat=48.856600000, hgt= 35.000]");
	REQUIRE(GeoCoords(-122.419416, -37.5, -12.25).str() == "[lon=-122.419416000, lat=-37.500000000, hgt=-12.250]");
	REQUIRE(EnuCoords(1.5, -2.25).str() == "[E=       1.500, N=      -2.250, U=       0.000]");
	REQUIRE(EcefCoords(4200937.804351203, 172560.72143257965, 4780107.699250484).str() == "[X= 4200937.804, Y=  172560.721, Z= 4780107.699]");

	// fmt and iostreams give the same text.
	EnuCoords p { 10, 20, 30 };
	std::ostringstream ss;
	ss << p;
	REQUIRE(ss.str() == p.str());
	REQUIRE(fmt::format("{}", p) == p.str());
	REQUIRE(str(AnyCoords { p }) == p.str());
}

TEST_CASE( "KindTokens", "[coords]" ) {
	REQUIRE(parse_coords_kind("ENU") == CoordsKind::Enu);
	REQUIRE(parse_coords_kind("EnuCoords") == CoordsKind::Enu);
	REQUIRE(parse_coords_kind("geo") == CoordsKind::Geo);
	REQUIRE(parse_coords_kind("GEOCOORDS") == CoordsKind::Geo);
	REQUIRE(parse_coords_kind("Ecef") == CoordsKind::Ecef);
	REQUIRE(parse_coords_kind("ecefcoords") == CoordsKind::Ecef);

	REQUIRE_THROWS_AS(parse_coords_kind("wgs84"), UnknownCoordsKindError);
	REQUIRE_THROWS_AS(parse_coords_kind(""), UnknownCoordsKindError);

	try {
		make_coords(1, 2, 3, "lambert");
		FAIL("expected a throw");
	} catch (const UnknownCoordsKindError& e) {
		REQUIRE(e.kind == "lambert");
	}
}

TEST_CASE( "MakeCoords", "[coords]" ) {
	AnyCoords g = make_coords(1, 2, 3, "GEO");
	REQUIRE(std::holds_alternative<GeoCoords>(g));
	REQUIRE(std::get<GeoCoords>(g) == GeoCoords(1, 2, 3));

	AnyCoords x = make_coords(1, 2, 3, "ecef");
	REQUIRE(std::holds_alternative<EcefCoords>(x));
	REQUIRE(std::get<EcefCoords>(x) == EcefCoords(1, 2, 3));

	AnyCoords e = make_coords(1, 2, 3, CoordsKind::Enu);
	REQUIRE(std::holds_alternative<EnuCoords>(e));
	REQUIRE(std::get<EnuCoords>(e) == EnuCoords(1, 2, 3));
}

TEST_CASE( "EnuVectorOps", "[coords]" ) {
	const EnuCoords a { 3, 4, 12 };
	REQUIRE(a.norm() == 13);
	REQUIRE(a.norm2D() == 5);
	REQUIRE(a.dot(EnuCoords { 1, 1, 1 }) == 19);

	REQUIRE((EnuCoords { 5, 5, 5 } - EnuCoords { 1, 2, 3 }) == EnuCoords { 4, 3, 2 });
	REQUIRE((EnuCoords { 5, 5, 5 } + EnuCoords { 1, 2, 3 }) == EnuCoords { 6, 7, 8 });

	REQUIRE(a.scaled(2) == EnuCoords { 6, 8, 12 });
	REQUIRE(a.translated(1, 2) == EnuCoords { 4, 6, 12 });
	REQUIRE(a.translated(1, 2, 3) == EnuCoords { 4, 6, 15 });

	EnuCoords r = EnuCoords { 1, 0, 5 }.rotated(kPi / 2);
	REQUIRE_THAT(r.E, WithinAbs(0, 1e-12));
	REQUIRE_THAT(r.N, WithinAbs(1, 1e-12));
	REQUIRE(r.U == 5);

	// A full turn is the identity.
	EnuCoords rr = a.rotated(2 * kPi);
	REQUIRE_THAT(rr.E, WithinAbs(a.E, 1e-12));
	REQUIRE_THAT(rr.N, WithinAbs(a.N, 1e-12));

	// Nothing mutates the receiver.
	REQUIRE(a == EnuCoords { 3, 4, 12 });
}

TEST_CASE( "EcefVectorOps", "[coords]" ) {
	const EcefCoords a { 1, 2, 2 };
	REQUIRE(a.norm() == 3);
	REQUIRE(a.dot(EcefCoords { 2, 0, 1 }) == 4);
	REQUIRE(a.scaled(-2) == EcefCoords { -2, -4, -4 });
	REQUIRE((a - a) == EcefCoords {});
	REQUIRE((a + a) == a.scaled(2));
}

TEST_CASE( "EnuRelations", "[coords]" ) {
	const EnuCoords o { 1, 1, 1 };
	const EnuCoords t { 4, 5, 13 };

	REQUIRE(o.distanceTo(t) == 13);
	REQUIRE(o.distance2DTo(t) == 5);
	REQUIRE_THAT(o.elevationTo(t), WithinAbs(std::atan2(12., 5.), 1e-15));
	REQUIRE_THAT(o.azimuthTo(t), WithinAbs(std::atan2(3., 4.), 1e-15));

	// Target below and to the south-west.
	REQUIRE(t.elevationTo(o) < 0);
	REQUIRE_THAT(t.azimuthTo(o), WithinAbs(std::atan2(-3., -4.), 1e-15));

	REQUIRE(o.distanceTo(t) == t.distanceTo(o));
	REQUIRE(o.elevationTo(o) == 0);
	REQUIRE(o.azimuthTo(o) == 0);
}

TEST_CASE( "NanIsAPredicate", "[coords]" ) {
	REQUIRE(not GeoCoords(1, 2, 3).isNan());
	REQUIRE(GeoCoords(NaN, 2, 3).isNan());
	REQUIRE(EcefCoords(1, NaN, 3).isNan());
	REQUIRE(EnuCoords(1, 2, NaN).isNan());

	// NaN flows through arithmetic.
	REQUIRE((EnuCoords(1, 2, 3) + EnuCoords(NaN, 0, 0)).isNan());
	REQUIRE(std::isnan(EnuCoords(NaN, 0, 0).norm()));
}

TEST_CASE( "EigenInterop", "[coords]" ) {
	const GeoCoords g { 1, 2, 3 };
	REQUIRE(GeoCoords::fromVec(g.vec()) == g);
	REQUIRE(EcefCoords::fromVec(Vector3d { 4, 5, 6 }) == EcefCoords { 4, 5, 6 });
	REQUIRE(EnuCoords { 7, 8, 9 }.vec() == Vector3d { 7, 8, 9 });
	REQUIRE(g.x() == 1);
	REQUIRE(g.y() == 2);
	REQUIRE(g.z() == 3);
}
