#pragma once

#include <cmath>

namespace geotrack {

// WGS84 reference ellipsoid.
constexpr double Re = 6378137.0;
constexpr double Fe = 1. / 298.257223563;

// Derived quantities.
constexpr double E2 = Fe * (2. - Fe);
constexpr double Rb = Re * (1. - Fe);

// std::sqrt is not constexpr, so the first eccentricity is computed once at load.
inline const double Eccentricity = std::sqrt(E2);

constexpr double kPi = 3.14159265358979323846;
constexpr double kDegToRad = kPi / 180.;
constexpr double kRadToDeg = 180. / kPi;

}
