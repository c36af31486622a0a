#pragma once

#include <optional>
#include <variant>

#include "geotrack/coords.h"
#include "geotrack/projection.h"

namespace geotrack {

	//
	// A conversion base.
	// Geographic and ECEF bases anchor a local tangent plane. An Srid base replaces the tangent
	// plane with a map projection (see projection.h).
	//
	using Base = std::variant<GeoCoords, EcefCoords, Srid>;

	// ------------------------------------------
	//   Geodetic <-> ECEF
	// ------------------------------------------

	EcefCoords geodetic_to_ecef(const GeoCoords& p);

	// Bowring's closed form. No iteration, sub-mm for terrestrial heights.
	GeoCoords ecef_to_geodetic(const EcefCoords& p);

	// Packed (lon,lat,hgt) / (X,Y,Z) triples, degrees and meters.
	// @out may be the same buffer as the input.
	void geodetic_to_ecef(double* out, int n, const double* llh);
	void ecef_to_geodetic(double* out, int n, const double* xyz);

	// ------------------------------------------
	//   ECEF <-> ENU
	// ------------------------------------------

	// Rows are the local east, north and up axes expressed in ECEF.
	RowMatrix3d ecef_to_enu_rotation(const EcefCoords& base);

	EnuCoords ecef_to_enu(const EcefCoords& p, const EcefCoords& base);
	EnuCoords ecef_to_enu(const EcefCoords& p, const GeoCoords& base);
	EcefCoords enu_to_ecef(const EnuCoords& p, const EcefCoords& base);
	EcefCoords enu_to_ecef(const EnuCoords& p, const GeoCoords& base);

	// ------------------------------------------
	//   Geodetic <-> ENU
	// ------------------------------------------

	// With an Srid base these are project() / unproject().
	EnuCoords geodetic_to_enu(const GeoCoords& p, const Base& base);
	GeoCoords enu_to_geodetic(const EnuCoords& p, const Base& base);

	// Re-express @p (relative to @from) relative to @to. Goes through ECEF.
	EnuCoords enu_to_enu(const EnuCoords& p, const EcefCoords& from, const EcefCoords& to);
	EnuCoords enu_to_enu(const EnuCoords& p, const GeoCoords& from, const GeoCoords& to);

	// Normalize a tangent plane base to ECEF. Throws InvalidArgumentError for an Srid base,
	// which has no ECEF position.
	EcefCoords base_to_ecef(const Base& base);

	// ------------------------------------------
	//   Any -> any
	// ------------------------------------------

	// Convert between any two kinds. ECEF is the pivot, except that an Srid base goes through the
	// projection. ENU on either side requires @base, otherwise InvalidArgumentError is thrown.
	AnyCoords convert(const AnyCoords& p, CoordsKind to, const std::optional<Base>& base = std::nullopt);

}
