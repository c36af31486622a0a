#include "conversions.h"

#include "ellipsoid.h"
#include "errors.h"
#include "detail/common.h"

#include <cmath>

namespace geotrack {

EcefCoords geodetic_to_ecef(const GeoCoords& p) {
	const double lamb = p.lon * kDegToRad;
	const double phi  = p.lat * kDegToRad;
	const double e    = Eccentricity;

	const double cos_phi = std::cos(phi), cos_lamb = std::cos(lamb);
	const double sin_phi = std::sin(phi), sin_lamb = std::sin(lamb);
	const double n_phi   = Re / std::sqrt(1 - (e * sin_phi) * (e * sin_phi));

	return EcefCoords {
		(n_phi + p.hgt) * cos_phi * cos_lamb,
		(n_phi + p.hgt) * cos_phi * sin_lamb,
		((1 - e * e) * n_phi + p.hgt) * sin_phi };
}

GeoCoords ecef_to_geodetic(const EcefCoords& p) {
	const double e  = Eccentricity;
	const double hh = Re * Re - Rb * Rb;

	const double pp = std::sqrt(p.X * p.X + p.Y * p.Y);
	const double t  = std::atan2(p.Z * Re, pp * Rb);
	const double st = std::sin(t), ct = std::cos(t);

	const double lon = std::atan2(p.Y, p.X);
	const double lat = std::atan2(p.Z + hh / Rb * st * st * st, pp - hh / Re * ct * ct * ct);

	const double n_phi = Re / std::sqrt(1 - (e * std::sin(lat)) * (e * std::sin(lat)));
	const double hgt   = pp / std::cos(lat) - n_phi;

	return GeoCoords { lon * kRadToDeg, lat * kRadToDeg, hgt };
}

void geodetic_to_ecef(double* out, int n, const double* llh) {
	for (int i = 0; i < n; i++) {
		// OKAY: the input triple is fully read before out is written.
		const EcefCoords q = geodetic_to_ecef(GeoCoords { llh[i * 3 + 0], llh[i * 3 + 1], llh[i * 3 + 2] });
		out[i * 3 + 0] = q.X;
		out[i * 3 + 1] = q.Y;
		out[i * 3 + 2] = q.Z;
	}
}

void ecef_to_geodetic(double* out, int n, const double* xyz) {
	for (int i = 0; i < n; i++) {
		const GeoCoords q = ecef_to_geodetic(EcefCoords { xyz[i * 3 + 0], xyz[i * 3 + 1], xyz[i * 3 + 2] });
		out[i * 3 + 0] = q.lon;
		out[i * 3 + 1] = q.lat;
		out[i * 3 + 2] = q.hgt;
	}
}

RowMatrix3d ecef_to_enu_rotation(const EcefCoords& base) {
	const GeoCoords g = ecef_to_geodetic(base);
	const double blon = g.lon * kDegToRad;
	const double blat = g.lat * kDegToRad;

	const double slon = std::sin(blon), clon = std::cos(blon);
	const double slat = std::sin(blat), clat = std::cos(blat);

	RowMatrix3d R;
	R <<        -slon,         clon,    0,
	      -clon * slat, -slon * slat, clat,
	       clon * clat,  slon * clat, slat;
	return R;
}

EnuCoords ecef_to_enu(const EcefCoords& p, const EcefCoords& base) {
	const RowMatrix3d R = ecef_to_enu_rotation(base);
	return EnuCoords::fromVec(R * (p - base).vec());
}

EnuCoords ecef_to_enu(const EcefCoords& p, const GeoCoords& base) {
	return ecef_to_enu(p, geodetic_to_ecef(base));
}

EcefCoords enu_to_ecef(const EnuCoords& p, const EcefCoords& base) {
	const RowMatrix3d R = ecef_to_enu_rotation(base);
	return EcefCoords::fromVec(R.transpose() * p.vec()) + base;
}

EcefCoords enu_to_ecef(const EnuCoords& p, const GeoCoords& base) {
	return enu_to_ecef(p, geodetic_to_ecef(base));
}

EcefCoords base_to_ecef(const Base& base) {
	return std::visit(overloaded {
			[](const GeoCoords& b) { return geodetic_to_ecef(b); },
			[](const EcefCoords& b) { return b; },
			[](const Srid& b) -> EcefCoords {
				throw InvalidArgumentError(fmt::format("srid {} is a projection, not a tangent plane base", b.code));
			}
		}, base);
}

EnuCoords geodetic_to_enu(const GeoCoords& p, const Base& base) {
	if (auto srid = std::get_if<Srid>(&base)) {
		dprint(" - [geodetic_to_enu] redirect to projection {}\n", srid->code);
		return project(p, *srid);
	}
	return ecef_to_enu(geodetic_to_ecef(p), base_to_ecef(base));
}

GeoCoords enu_to_geodetic(const EnuCoords& p, const Base& base) {
	if (auto srid = std::get_if<Srid>(&base)) {
		dprint(" - [enu_to_geodetic] redirect to projection {}\n", srid->code);
		return unproject(p, *srid);
	}
	return ecef_to_geodetic(enu_to_ecef(p, base_to_ecef(base)));
}

EnuCoords enu_to_enu(const EnuCoords& p, const EcefCoords& from, const EcefCoords& to) {
	return ecef_to_enu(enu_to_ecef(p, from), to);
}

EnuCoords enu_to_enu(const EnuCoords& p, const GeoCoords& from, const GeoCoords& to) {
	return enu_to_enu(p, geodetic_to_ecef(from), geodetic_to_ecef(to));
}

namespace {

const Base& require_base(const std::optional<Base>& base) {
	if (not base.has_value()) throw InvalidArgumentError("ENU coordinates need a base");
	return *base;
}

EcefCoords any_to_ecef(const AnyCoords& p, const std::optional<Base>& base) {
	return std::visit(overloaded {
			[](const GeoCoords& q) { return geodetic_to_ecef(q); },
			[](const EcefCoords& q) { return q; },
			[&base](const EnuCoords& q) {
				const Base& b = require_base(base);
				if (auto srid = std::get_if<Srid>(&b)) return geodetic_to_ecef(unproject(q, *srid));
				return enu_to_ecef(q, base_to_ecef(b));
			}
		}, p);
}

}

AnyCoords convert(const AnyCoords& p, CoordsKind to, const std::optional<Base>& base) {
	if (p.index() == static_cast<size_t>(to)) return p;

	// Geo <-> projected never touches ECEF.
	if (base.has_value() and std::holds_alternative<Srid>(*base)) {
		if (auto g = std::get_if<GeoCoords>(&p); g and to == CoordsKind::Enu) return geodetic_to_enu(*g, *base);
		if (auto e = std::get_if<EnuCoords>(&p); e and to == CoordsKind::Geo) return enu_to_geodetic(*e, *base);
	}

	const EcefCoords q = any_to_ecef(p, base);
	dprint(" - [convert] pivot {}\n", q);

	switch (to) {
		case CoordsKind::Geo: return ecef_to_geodetic(q);
		case CoordsKind::Ecef: return q;
		case CoordsKind::Enu: {
			const Base& b = require_base(base);
			if (auto srid = std::get_if<Srid>(&b)) return project(ecef_to_geodetic(q), *srid);
			return ecef_to_enu(q, base_to_ecef(b));
		}
	}
	throw InvalidArgumentError(fmt::format("cannot convert to kind {}", static_cast<int>(to)));
}

}
