#include "projection.h"

#include "ellipsoid.h"
#include "errors.h"

#include <cmath>

namespace geotrack {

namespace {

// ------------------------------------------
//   Lambert-93 (RGF93, SRID 2154)
// ------------------------------------------

// GRS80 first eccentricity, as published with the projection parameters.
constexpr double L93_E       = 0.08181919106;
constexpr double L93_Xp      = 700000.000;
constexpr double L93_Yp      = 12655612.050;
constexpr double L93_n       = 0.725607765053267;
constexpr double L93_C       = 11754255.4260960;
constexpr double L93_lambda0 = 0.0523598775598299;

// The inverse refines latitude a fixed number of times. Kept fixed so outputs are reproducible.
constexpr int L93_InverseIterations = 10;

// ------------------------------------------
//   UTM
// ------------------------------------------

constexpr double UTM_K0          = 0.9996;
constexpr double UTM_E           = 0.00669438;
constexpr double UTM_FalseEast   = 500000.;
constexpr double UTM_FalseNorth  = 10000000.;

}

ProjectionSpec parse_srid(Srid srid, const std::string& direction) {
	if (srid.code == Lambert93Srid) return ProjectionSpec { ProjectionKind::Lambert93 };

	if (srid.code >= UtmSridFirst and srid.code <= UtmSridLast) {
		ProjectionSpec spec { ProjectionKind::Utm };
		spec.zone  = srid.code % 100;
		spec.north = srid.code < UtmSouthSrid;
		if (spec.zone < 1 or spec.zone > 60) throw UnsupportedProjectionError(srid.code, direction);
		return spec;
	}

	throw UnsupportedProjectionError(srid.code, direction);
}

EnuCoords project(const GeoCoords& p, Srid srid) {
	const ProjectionSpec spec = parse_srid(srid, "forward");
	if (spec.kind == ProjectionKind::Lambert93) return lambert93_forward(p);
	throw UnsupportedProjectionError(srid.code, "forward");
}

GeoCoords unproject(const EnuCoords& p, Srid srid) {
	const ProjectionSpec spec = parse_srid(srid, "inverse");
	switch (spec.kind) {
		case ProjectionKind::Lambert93: return lambert93_inverse(p);
		case ProjectionKind::Utm: return utm_inverse(p, spec.zone, spec.north);
	}
	throw UnsupportedProjectionError(srid.code, "inverse");
}

EnuCoords lambert93_forward(const GeoCoords& p) {
	const double lon = p.lon * kDegToRad;
	const double phi = p.lat * kDegToRad;
	const double esp = L93_E * std::sin(phi);

	// Isometric latitude.
	double latiso = std::pow((1 - esp) / (1 + esp), L93_E / 2);
	latiso = std::log(std::tan(kPi / 4 + phi / 2) * latiso);

	const double r     = L93_C * std::exp(-L93_n * latiso);
	const double gamma = L93_n * (lon - L93_lambda0);

	return EnuCoords {
		L93_Xp + r * std::sin(gamma),
		L93_Yp - r * std::cos(gamma),
		p.hgt };
}

GeoCoords lambert93_inverse(const EnuCoords& p) {
	const double dx = p.E - L93_Xp;
	const double dy = p.N - L93_Yp;

	const double lon    = std::atan(-dx / dy) / L93_n + L93_lambda0;
	const double latiso = -std::log(std::sqrt(dx * dx + dy * dy) / L93_C) / L93_n;

	double phi = 2 * std::atan(std::exp(latiso)) - kPi / 2;
	for (int i = 0; i < L93_InverseIterations; i++) {
		const double esp = L93_E * std::sin(phi);
		phi = 2 * std::atan(std::pow((1 + esp) / (1 - esp), L93_E / 2) * std::exp(latiso));
		phi -= kPi / 2;
	}

	return GeoCoords { lon * kRadToDeg, phi * kRadToDeg, p.U };
}

// --------------------------------------------------------------------------
// Copyright (C) 2012 Tobias Bieniek <Tobias.Bieniek@gmx.de>
// Permission is hereby granted, free of charge, to any person obtaining a
// copy of this software and associated documentation files (the "Software"),
// to deal in the Software without restriction, including without limitation
// the rights to use, copy, modify, merge, publish, distribute, sublicense,
// and/or sell copies of the Software, and to permit persons to whom the
// Software is furnished to do so, subject to the following conditions:
// The above copyright notice and this permission notice shall be included in
//  all copies or substantial portions of the Software.
// --------------------------------------------------------------------------
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL
// THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
// FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
// DEALINGS IN THE SOFTWARE.
// --------------------------------------------------------------------------
//
// Series inverse: footpoint latitude from the meridian arc, then the usual expansions in
// d = x / (N k0) to sixth order.
//
GeoCoords utm_inverse(const EnuCoords& p, int zone, bool north) {
	const double x = p.E - UTM_FalseEast;
	const double y = north ? p.N : p.N - UTM_FalseNorth;

	constexpr double E   = UTM_E;
	constexpr double E2  = E * E;
	constexpr double E3  = E2 * E;
	constexpr double EP2 = E / (1. - E);

	const double sqrt_e = std::sqrt(1 - E);
	const double e1     = (1 - sqrt_e) / (1 + sqrt_e);
	const double e1_2   = e1 * e1;
	const double e1_3   = e1_2 * e1;
	const double e1_4   = e1_3 * e1;
	const double e1_5   = e1_4 * e1;

	constexpr double M1 = 1 - E / 4 - 3 * E2 / 64 - 5 * E3 / 256;

	const double P2 = 3. / 2 * e1 - 27. / 32 * e1_3 + 269. / 512 * e1_5;
	const double P3 = 21. / 16 * e1_2 - 55. / 32 * e1_4;
	const double P4 = 151. / 96 * e1_3 - 417. / 128 * e1_5;
	const double P5 = 1097. / 512 * e1_4;

	const double m  = y / UTM_K0;
	const double mu = m / (Re * M1);

	// Footpoint latitude.
	const double p_rad = mu
		+ P2 * std::sin(2 * mu)
		+ P3 * std::sin(4 * mu)
		+ P4 * std::sin(6 * mu)
		+ P5 * std::sin(8 * mu);

	const double p_sin  = std::sin(p_rad);
	const double p_sin2 = p_sin * p_sin;
	const double p_cos  = std::cos(p_rad);

	const double p_tan  = p_sin / p_cos;
	const double p_tan2 = p_tan * p_tan;
	const double p_tan4 = p_tan2 * p_tan2;

	const double ep_sin      = 1 - E * p_sin2;
	const double ep_sin_sqrt = std::sqrt(ep_sin);

	const double n  = Re / ep_sin_sqrt;
	const double r  = (1 - E) / ep_sin;
	const double c  = EP2 * p_cos * p_cos;
	const double c2 = c * c;

	const double d  = x / (n * UTM_K0);
	const double d2 = d * d;
	const double d3 = d2 * d;
	const double d4 = d3 * d;
	const double d5 = d4 * d;
	const double d6 = d5 * d;

	const double lat = p_rad - (p_tan / r) * (
			d2 / 2
			- d4 / 24 * (5 + 3 * p_tan2 + 10 * c - 4 * c2 - 9 * EP2)
			+ d6 / 720 * (61 + 90 * p_tan2 + 298 * c + 45 * p_tan4 - 252 * EP2 - 3 * c2));

	double lon = (d
			- d3 / 6 * (1 + 2 * p_tan2 + c)
			+ d5 / 120 * (5 - 2 * c + 28 * p_tan2 - 3 * c2 + 8 * EP2 + 24 * p_tan4)) / p_cos;
	lon += utm_central_longitude(zone) * kDegToRad;

	return GeoCoords { lon * kRadToDeg, lat * kRadToDeg, p.U };
}

}
