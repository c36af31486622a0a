#pragma once

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <cmath>
#include <iosfwd>
#include <limits>
#include <string>
#include <variant>

#include "geotrack/detail/eigen.h"

namespace geotrack {

	constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

	//
	// Geographic coordinates.
	// Longitude and latitude in decimal degrees, height in meters above the ellipsoid.
	// Nothing is range checked: out of range or NaN values just propagate through the conversions.
	//
	struct GeoCoords {
		double lon = 0;
		double lat = 0;
		double hgt = 0;

		inline GeoCoords() {}
		inline GeoCoords(double lon, double lat, double hgt=0.) : lon(lon), lat(lat), hgt(hgt) {}

		inline double x() const { return lon; }
		inline double y() const { return lat; }
		inline double z() const { return hgt; }

		inline Vector3d vec() const { return Vector3d { lon, lat, hgt }; }
		static inline GeoCoords fromVec(const Vector3d& v) { return GeoCoords { v(0), v(1), v(2) }; }

		inline bool isNan() const { return std::isnan(lon) or std::isnan(lat) or std::isnan(hgt); }
		inline bool operator==(const GeoCoords& o) const { return lon == o.lon and lat == o.lat and hgt == o.hgt; }
		inline bool operator!=(const GeoCoords& o) const { return not (*this == o); }

		// Straight-line (chord) distance, through ECEF.
		double distanceTo(const GeoCoords& p) const;
		// Planimetric norm of @p in the local tangent plane of this point.
		double distance2DTo(const GeoCoords& p) const;
		// Radians. Positive when @p is above the local horizontal of this point.
		double elevationTo(const GeoCoords& p) const;
		// Radians, clockwise from local north, in (-pi, pi].
		double azimuthTo(const GeoCoords& p) const;

		std::string str() const;
	};

	//
	// Earth-Centered-Earth-Fixed coordinates, meters.
	//
	struct EcefCoords {
		double X = 0;
		double Y = 0;
		double Z = 0;

		inline EcefCoords() {}
		inline EcefCoords(double X, double Y, double Z) : X(X), Y(Y), Z(Z) {}

		inline double x() const { return X; }
		inline double y() const { return Y; }
		inline double z() const { return Z; }

		inline Vector3d vec() const { return Vector3d { X, Y, Z }; }
		static inline EcefCoords fromVec(const Vector3d& v) { return EcefCoords { v(0), v(1), v(2) }; }

		inline bool isNan() const { return std::isnan(X) or std::isnan(Y) or std::isnan(Z); }
		inline bool operator==(const EcefCoords& o) const { return X == o.X and Y == o.Y and Z == o.Z; }
		inline bool operator!=(const EcefCoords& o) const { return not (*this == o); }

		inline double dot(const EcefCoords& p) const { return X*p.X + Y*p.Y + Z*p.Z; }
		inline double norm() const { return std::sqrt(dot(*this)); }

		inline EcefCoords operator+(const EcefCoords& p) const { return EcefCoords { X+p.X, Y+p.Y, Z+p.Z }; }
		inline EcefCoords operator-(const EcefCoords& p) const { return EcefCoords { X-p.X, Y-p.Y, Z-p.Z }; }
		inline EcefCoords scaled(double f) const { return EcefCoords { X*f, Y*f, Z*f }; }

		double distanceTo(const EcefCoords& p) const;
		double distance2DTo(const EcefCoords& p) const;
		double elevationTo(const EcefCoords& p) const;
		double azimuthTo(const EcefCoords& p) const;

		std::string str() const;
	};

	//
	// Local East-North-Up coordinates, meters.
	// The base point is NOT stored here: the caller must pass the same base that produced the value
	// to any conversion back to an absolute frame.
	//
	// All of the vector operations return a new value.
	//
	struct EnuCoords {
		double E = 0;
		double N = 0;
		double U = 0;

		inline EnuCoords() {}
		inline EnuCoords(double E, double N, double U=0.) : E(E), N(N), U(U) {}

		inline double x() const { return E; }
		inline double y() const { return N; }
		inline double z() const { return U; }

		inline Vector3d vec() const { return Vector3d { E, N, U }; }
		static inline EnuCoords fromVec(const Vector3d& v) { return EnuCoords { v(0), v(1), v(2) }; }

		inline bool isNan() const { return std::isnan(E) or std::isnan(N) or std::isnan(U); }
		inline bool operator==(const EnuCoords& o) const { return E == o.E and N == o.N and U == o.U; }
		inline bool operator!=(const EnuCoords& o) const { return not (*this == o); }

		inline double dot(const EnuCoords& p) const { return E*p.E + N*p.N + U*p.U; }
		inline double norm() const { return std::sqrt(dot(*this)); }
		inline double norm2D() const { return std::sqrt(E*E + N*N); }

		inline EnuCoords operator+(const EnuCoords& p) const { return EnuCoords { E+p.E, N+p.N, U+p.U }; }
		inline EnuCoords operator-(const EnuCoords& p) const { return EnuCoords { E-p.E, N-p.N, U-p.U }; }

		// 2D rotation of (E,N), counter-clockwise, @theta in radians.
		EnuCoords rotated(double theta) const;
		// 2D homothety of (E,N). U is untouched.
		inline EnuCoords scaled(double h) const { return EnuCoords { E*h, N*h, U }; }
		inline EnuCoords translated(double tx, double ty, double tz=0.) const { return EnuCoords { E+tx, N+ty, U+tz }; }

		// Both points must be relative to the same base.
		double distanceTo(const EnuCoords& p) const;
		double distance2DTo(const EnuCoords& p) const;
		double elevationTo(const EnuCoords& p) const;
		double azimuthTo(const EnuCoords& p) const;

		std::string str() const;
	};

	std::ostream& operator<<(std::ostream& os, const GeoCoords& p);
	std::ostream& operator<<(std::ostream& os, const EcefCoords& p);
	std::ostream& operator<<(std::ostream& os, const EnuCoords& p);


	// Same order as the AnyCoords alternatives.
	enum class CoordsKind {
		Geo, Ecef, Enu
	};

	using AnyCoords = std::variant<GeoCoords, EcefCoords, EnuCoords>;

	// Case insensitive: "GEO"/"GEOCOORDS", "ECEF"/"ECEFCOORDS", "ENU"/"ENUCOORDS".
	// Throws UnknownCoordsKindError otherwise.
	CoordsKind parse_coords_kind(const std::string& token);
	const char* to_string(CoordsKind kind);

	// Build one of the coordinate types from a raw triple (x,y,z are lon/lat/hgt, X/Y/Z or E/N/U).
	AnyCoords make_coords(double x, double y, double z, CoordsKind kind);
	AnyCoords make_coords(double x, double y, double z, const std::string& kind);

	std::string str(const AnyCoords& c);

}

template <> struct fmt::formatter<geotrack::GeoCoords> : ostream_formatter {};
template <> struct fmt::formatter<geotrack::EcefCoords> : ostream_formatter {};
template <> struct fmt::formatter<geotrack::EnuCoords> : ostream_formatter {};
