#include "coords.h"

#include "conversions.h"
#include "errors.h"
#include "detail/common.h"

#include <algorithm>
#include <cctype>
#include <ostream>

namespace geotrack {

// ------------------------------------------
//   Rendering
// ------------------------------------------

std::string GeoCoords::str() const {
	return fmt::format("[lon={:12.9f}, lat={:11.9f}, hgt={:7.3f}]", lon, lat, hgt);
}

std::string EcefCoords::str() const {
	return fmt::format("[X={:12.3f}, Y={:12.3f}, Z={:12.3f}]", X, Y, Z);
}

std::string EnuCoords::str() const {
	return fmt::format("[E={:12.3f}, N={:12.3f}, U={:12.3f}]", E, N, U);
}

std::ostream& operator<<(std::ostream& os, const GeoCoords& p) { return os << p.str(); }
std::ostream& operator<<(std::ostream& os, const EcefCoords& p) { return os << p.str(); }
std::ostream& operator<<(std::ostream& os, const EnuCoords& p) { return os << p.str(); }

std::string str(const AnyCoords& c) {
	return std::visit([](const auto& p) { return p.str(); }, c);
}

// ------------------------------------------
//   Relations
// ------------------------------------------
//
// Everything reduces to the target expressed in the local tangent plane of the origin.
//

double GeoCoords::distanceTo(const GeoCoords& p) const {
	return geodetic_to_ecef(*this).distanceTo(geodetic_to_ecef(p));
}
double GeoCoords::distance2DTo(const GeoCoords& p) const {
	return ecef_to_enu(geodetic_to_ecef(p), *this).norm2D();
}
double GeoCoords::elevationTo(const GeoCoords& p) const {
	return geodetic_to_ecef(*this).elevationTo(geodetic_to_ecef(p));
}
double GeoCoords::azimuthTo(const GeoCoords& p) const {
	return geodetic_to_ecef(*this).azimuthTo(geodetic_to_ecef(p));
}

double EcefCoords::distanceTo(const EcefCoords& p) const {
	return (p - *this).norm();
}
double EcefCoords::distance2DTo(const EcefCoords& p) const {
	return ecef_to_enu(p, *this).norm2D();
}
double EcefCoords::elevationTo(const EcefCoords& p) const {
	const EnuCoords v = ecef_to_enu(p, *this);
	return std::atan2(v.U, v.norm2D());
}
double EcefCoords::azimuthTo(const EcefCoords& p) const {
	const EnuCoords v = ecef_to_enu(p, *this);
	return std::atan2(v.E, v.N);
}

EnuCoords EnuCoords::rotated(double theta) const {
	const double cr = std::cos(theta);
	const double sr = std::sin(theta);
	return EnuCoords { cr * E - sr * N, sr * E + cr * N, U };
}

double EnuCoords::distanceTo(const EnuCoords& p) const {
	return (p - *this).norm();
}
double EnuCoords::distance2DTo(const EnuCoords& p) const {
	return (p - *this).norm2D();
}
double EnuCoords::elevationTo(const EnuCoords& p) const {
	const EnuCoords v = p - *this;
	return std::atan2(v.U, v.norm2D());
}
double EnuCoords::azimuthTo(const EnuCoords& p) const {
	const EnuCoords v = p - *this;
	return std::atan2(v.E, v.N);
}

// ------------------------------------------
//   Factory
// ------------------------------------------

CoordsKind parse_coords_kind(const std::string& token) {
	std::string s { token };
	std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });

	if (s == "ENUCOORDS" or s == "ENU") return CoordsKind::Enu;
	if (s == "GEOCOORDS" or s == "GEO") return CoordsKind::Geo;
	if (s == "ECEFCOORDS" or s == "ECEF") return CoordsKind::Ecef;
	throw UnknownCoordsKindError(token);
}

const char* to_string(CoordsKind kind) {
	switch (kind) {
		case CoordsKind::Geo: return "geo";
		case CoordsKind::Ecef: return "ecef";
		case CoordsKind::Enu: return "enu";
	}
	return "?";
}

AnyCoords make_coords(double x, double y, double z, CoordsKind kind) {
	switch (kind) {
		case CoordsKind::Geo: return GeoCoords { x, y, z };
		case CoordsKind::Ecef: return EcefCoords { x, y, z };
		case CoordsKind::Enu: return EnuCoords { x, y, z };
	}
	throw UnknownCoordsKindError(std::to_string(static_cast<int>(kind)));
}

AnyCoords make_coords(double x, double y, double z, const std::string& kind) {
	return make_coords(x, y, z, parse_coords_kind(kind));
}

}
