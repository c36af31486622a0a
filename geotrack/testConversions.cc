#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>
#include <vector>

#include "conversions.h"
#include "ellipsoid.h"
#include "errors.h"

using namespace geotrack;
using Catch::Matchers::WithinAbs;

namespace {

// A spread of points over the globe, away from the poles and the antimeridian.
std::vector<GeoCoords> samplePoints() {
	std::vector<GeoCoords> out;
	for (double lon = -179.5; lon < 180; lon += 29.)
		for (double lat = -89.5; lat < 90; lat += 17.9)
			for (double hgt : { -420., 0., 35., 8848. })
				out.push_back(GeoCoords { lon, lat, hgt });
	return out;
}

void requireNear(const EcefCoords& a, const EcefCoords& b, double tol) {
	REQUIRE_THAT(a.X, WithinAbs(b.X, tol));
	REQUIRE_THAT(a.Y, WithinAbs(b.Y, tol));
	REQUIRE_THAT(a.Z, WithinAbs(b.Z, tol));
}

void requireNear(const EnuCoords& a, const EnuCoords& b, double tol) {
	REQUIRE_THAT(a.E, WithinAbs(b.E, tol));
	REQUIRE_THAT(a.N, WithinAbs(b.N, tol));
	REQUIRE_THAT(a.U, WithinAbs(b.U, tol));
}

}

TEST_CASE( "KnownEcef", "[conversions]" ) {
	requireNear(geodetic_to_ecef(GeoCoords { 0, 0, 0 }), EcefCoords { Re, 0, 0 }, 1e-6);
	requireNear(geodetic_to_ecef(GeoCoords { 90, 0, 0 }), EcefCoords { 0, Re, 0 }, 1e-6);
	requireNear(geodetic_to_ecef(GeoCoords { 0, 90, 0 }), EcefCoords { 0, 0, Rb }, 1e-6);
	requireNear(geodetic_to_ecef(GeoCoords { 0, 0, 100 }), EcefCoords { Re + 100, 0, 0 }, 1e-6);
	requireNear(geodetic_to_ecef(GeoCoords { 2.3522, 48.8566, 35 }),
			EcefCoords { 4200937.804351203, 172560.72143257965, 4780107.699250484 }, 1e-6);

	GeoCoords g = ecef_to_geodetic(EcefCoords { Re, 0, 0 });
	REQUIRE_THAT(g.lon, WithinAbs(0, 1e-12));
	REQUIRE_THAT(g.lat, WithinAbs(0, 1e-12));
	REQUIRE_THAT(g.hgt, WithinAbs(0, 1e-6));
}

TEST_CASE( "GeodeticEcefRoundTrip", "[conversions]" ) {
	for (const auto& p : samplePoints()) {
		GeoCoords q = ecef_to_geodetic(geodetic_to_ecef(p));
		REQUIRE_THAT(q.lon, WithinAbs(p.lon, 1e-7));
		REQUIRE_THAT(q.lat, WithinAbs(p.lat, 1e-7));
		REQUIRE_THAT(q.hgt, WithinAbs(p.hgt, 1e-3));
	}
}

TEST_CASE( "EcefEnuRoundTrip", "[conversions]" ) {
	const std::vector<GeoCoords> bases { { 0, 0, 0 }, { 2.3522, 48.8566, 35 }, { -70.5, -33.4, 2500 }, { 151.2, -33.9, 0 }, { 10, 88, 0 } };

	for (const auto& b : bases) {
		const EcefCoords base = geodetic_to_ecef(b);
		for (const auto& p : samplePoints()) {
			const EcefCoords q = geodetic_to_ecef(p);
			requireNear(enu_to_ecef(ecef_to_enu(q, base), base), q, 1e-6);
		}
	}
}

TEST_CASE( "EnuAxes", "[conversions]" ) {
	// At lon=lat=0: east is +Y, north is +Z, up is +X.
	const GeoCoords base { 0, 0, 0 };
	requireNear(ecef_to_enu(EcefCoords { Re, 10, 20 }, base), EnuCoords { 10, 20, 0 }, 1e-9);
	requireNear(ecef_to_enu(EcefCoords { Re + 100, 0, 0 }, base), EnuCoords { 0, 0, 100 }, 1e-9);

	// At the base itself everything is zero.
	requireNear(geodetic_to_enu(base, base), EnuCoords { 0, 0, 0 }, 1e-9);

	// Height above the base is pure up.
	const GeoCoords paris { 2.3522, 48.8566, 35 };
	requireNear(geodetic_to_enu(GeoCoords { paris.lon, paris.lat, 135 }, paris), EnuCoords { 0, 0, 100 }, 1e-6);

	// Rotation is orthonormal.
	RowMatrix3d R = ecef_to_enu_rotation(geodetic_to_ecef(paris));
	REQUIRE((R * R.transpose() - Matrix3d::Identity()).norm() < 1e-12);
	REQUIRE_THAT(R.determinant(), WithinAbs(1, 1e-12));
}

TEST_CASE( "BaseVariants", "[conversions]" ) {
	const GeoCoords paris { 2.3522, 48.8566, 35 };
	const GeoCoords p { 2.2945, 48.8584, 330 };

	// Geographic and ECEF bases agree.
	const EnuCoords a = geodetic_to_enu(p, paris);
	const EnuCoords b = geodetic_to_enu(p, geodetic_to_ecef(paris));
	requireNear(a, b, 1e-9);

	GeoCoords back = enu_to_geodetic(a, paris);
	REQUIRE_THAT(back.lon, WithinAbs(p.lon, 1e-9));
	REQUIRE_THAT(back.lat, WithinAbs(p.lat, 1e-9));
	REQUIRE_THAT(back.hgt, WithinAbs(p.hgt, 1e-6));

	// An Srid base is a projection.
	REQUIRE(geodetic_to_enu(p, Srid { 2154 }) == project(p, Srid { 2154 }));
	const EnuCoords utm { 448251.795, 5411932.678, 12 };
	REQUIRE(enu_to_geodetic(utm, Srid { 32631 }) == unproject(utm, Srid { 32631 }));

	REQUIRE_THROWS_AS(geodetic_to_enu(p, Srid { 9999 }), UnsupportedProjectionError);
	REQUIRE_THROWS_AS(base_to_ecef(Srid { 2154 }), InvalidArgumentError);
}

TEST_CASE( "EnuRebase", "[conversions]" ) {
	const GeoCoords b1 { 2.3522, 48.8566, 35 };
	const GeoCoords b2 { 4.8357, 45.7640, 170 };
	const GeoCoords p { 3.0573, 50.6292, 20 };

	const EnuCoords e1 = geodetic_to_enu(p, b1);
	const EnuCoords e2 = enu_to_enu(e1, b1, b2);
	requireNear(e2, geodetic_to_enu(p, b2), 1e-6);

	requireNear(enu_to_enu(e2, b2, b1), e1, 1e-6);
	requireNear(enu_to_enu(e1, b1, b1), e1, 1e-6);
}

TEST_CASE( "BatchMatchesSingle", "[conversions]" ) {
	const std::vector<GeoCoords> pts = samplePoints();
	const int n = static_cast<int>(pts.size());

	std::vector<double> llh;
	for (const auto& p : pts) { llh.push_back(p.lon); llh.push_back(p.lat); llh.push_back(p.hgt); }

	std::vector<double> xyz(llh.size());
	geodetic_to_ecef(xyz.data(), n, llh.data());
	for (int i = 0; i < n; i++) {
		const EcefCoords q = geodetic_to_ecef(pts[i]);
		REQUIRE(xyz[i * 3 + 0] == q.X);
		REQUIRE(xyz[i * 3 + 1] == q.Y);
		REQUIRE(xyz[i * 3 + 2] == q.Z);
	}

	// In place.
	std::vector<double> buf = xyz;
	ecef_to_geodetic(buf.data(), n, buf.data());
	for (int i = 0; i < n; i++) {
		const GeoCoords g = ecef_to_geodetic(EcefCoords { xyz[i * 3 + 0], xyz[i * 3 + 1], xyz[i * 3 + 2] });
		REQUIRE(buf[i * 3 + 0] == g.lon);
		REQUIRE(buf[i * 3 + 1] == g.lat);
		REQUIRE(buf[i * 3 + 2] == g.hgt);
	}
}

TEST_CASE( "ConvertAny", "[conversions]" ) {
	const GeoCoords paris { 2.3522, 48.8566, 35 };
	const GeoCoords p { 2.2945, 48.8584, 330 };

	AnyCoords x = convert(p, CoordsKind::Ecef);
	REQUIRE(std::get<EcefCoords>(x) == geodetic_to_ecef(p));

	AnyCoords same = convert(p, CoordsKind::Geo);
	REQUIRE(std::get<GeoCoords>(same) == p);

	AnyCoords e = convert(x, CoordsKind::Enu, Base { paris });
	requireNear(std::get<EnuCoords>(e), geodetic_to_enu(p, paris), 1e-9);

	AnyCoords g = convert(e, CoordsKind::Geo, Base { paris });
	REQUIRE_THAT(std::get<GeoCoords>(g).lat, WithinAbs(p.lat, 1e-9));

	// Projection base.
	AnyCoords l93 = convert(p, CoordsKind::Enu, Base { Srid { 2154 } });
	REQUIRE(std::get<EnuCoords>(l93) == project(p, Srid { 2154 }));
	AnyCoords l93x = convert(l93, CoordsKind::Ecef, Base { Srid { 2154 } });
	requireNear(std::get<EcefCoords>(l93x), geodetic_to_ecef(p), 1e-3);

	REQUIRE_THROWS_AS(convert(EnuCoords { 1, 2, 3 }, CoordsKind::Geo), InvalidArgumentError);
	REQUIRE_THROWS_AS(convert(p, CoordsKind::Enu), InvalidArgumentError);
}

TEST_CASE( "Relations", "[conversions]" ) {
	const GeoCoords o { 0, 0, 0 };

	// Straight up.
	REQUIRE_THAT(o.elevationTo(GeoCoords { 0, 0, 100 }), WithinAbs(kPi / 2, 1e-9));
	REQUIRE_THAT(o.distanceTo(GeoCoords { 0, 0, 100 }), WithinAbs(100, 1e-6));
	REQUIRE_THAT(o.distance2DTo(GeoCoords { 0, 0, 100 }), WithinAbs(0, 1e-6));

	// Due east along the equator.
	REQUIRE_THAT(o.azimuthTo(GeoCoords { 1, 0, 0 }), WithinAbs(kPi / 2, 1e-12));
	REQUIRE(o.elevationTo(GeoCoords { 1, 0, 0 }) < 0);

	// ECEF, at lon=lat=0.
	const EcefCoords x { Re, 0, 0 };
	REQUIRE_THAT(x.azimuthTo(EcefCoords { Re, 0, 100 }), WithinAbs(0, 1e-12));
	REQUIRE_THAT(x.azimuthTo(EcefCoords { Re, 100, 0 }), WithinAbs(kPi / 2, 1e-12));
	REQUIRE_THAT(x.azimuthTo(EcefCoords { Re, -100, 0 }), WithinAbs(-kPi / 2, 1e-12));
	// Due south sits on the branch cut, either sign is fine.
	REQUIRE_THAT(std::abs(x.azimuthTo(EcefCoords { Re, 0, -100 })), WithinAbs(kPi, 1e-12));
	REQUIRE_THAT(x.elevationTo(EcefCoords { Re + 50, 0, 50 }), WithinAbs(kPi / 4, 1e-12));
	REQUIRE_THAT(x.distance2DTo(EcefCoords { Re + 50, 30, 40 }), WithinAbs(50, 1e-9));

	// Zero offset is not an error.
	const GeoCoords paris { 2.3522, 48.8566, 35 };
	REQUIRE(paris.elevationTo(paris) == 0);
	REQUIRE(paris.azimuthTo(paris) == 0);
	REQUIRE(x.elevationTo(x) == 0);
	REQUIRE(x.azimuthTo(x) == 0);
}

TEST_CASE( "DistanceSymmetry", "[conversions]" ) {
	const std::vector<GeoCoords> pts = samplePoints();
	for (size_t i = 1; i < pts.size(); i += 7) {
		const GeoCoords& a = pts[i - 1];
		const GeoCoords& b = pts[i];
		REQUIRE(a.distanceTo(b) == b.distanceTo(a));

		const EcefCoords xa = geodetic_to_ecef(a), xb = geodetic_to_ecef(b);
		REQUIRE(xa.distanceTo(xb) == xb.distanceTo(xa));

		const EnuCoords ea = geodetic_to_enu(a, pts[0]), eb = geodetic_to_enu(b, pts[0]);
		REQUIRE(ea.distanceTo(eb) == eb.distanceTo(ea));
	}
}

TEST_CASE( "NanPropagates", "[conversions]" ) {
	REQUIRE(geodetic_to_ecef(GeoCoords { NaN, 0, 0 }).isNan());
	REQUIRE(ecef_to_geodetic(EcefCoords { 0, 0, NaN }).isNan());
	REQUIRE(ecef_to_enu(EcefCoords { NaN, 0, 0 }, GeoCoords { 0, 0, 0 }).isNan());
}
