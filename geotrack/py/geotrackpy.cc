#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "geotrack/conversions.h"
#include "geotrack/projection.h"
#include "geotrack/errors.h"

namespace py = pybind11;

using namespace geotrack;

namespace {

// Checks for a C-contiguous (n,3) float64 array and returns n.
int verifyTriplesOrThrow(const py::buffer_info& bi) {
	if (bi.ndim != 2 or bi.shape[1] != 3)
		throw std::runtime_error("Expected an (n,3) array, got ndim=" + std::to_string(bi.ndim));
	if (bi.strides[1] != sizeof(double) or bi.strides[0] != 3 * sizeof(double))
		throw std::runtime_error("Expected a C-contiguous array.");
	return static_cast<int>(bi.shape[0]);
}

template <class Fn>
py::array_t<double> convertArray(py::array_t<double, py::array::c_style | py::array::forcecast> in, Fn&& fn) {
	auto bi = in.request();
	int n = verifyTriplesOrThrow(bi);

	py::array_t<double> out({ bi.shape[0], static_cast<py::ssize_t>(3) });
	fn(static_cast<double*>(out.request().ptr), n, static_cast<const double*>(bi.ptr));
	return out;
}

Base toBase(const py::object& o) {
	if (py::isinstance<py::int_>(o)) return Base { Srid { o.cast<int>() } };
	if (py::isinstance<GeoCoords>(o)) return Base { o.cast<GeoCoords>() };
	if (py::isinstance<EcefCoords>(o)) return Base { o.cast<EcefCoords>() };
	throw py::type_error("base must be GeoCoords, EcefCoords or an int srid");
}

}  // namespace


PYBIND11_MODULE(geotrackpy, m) {

	py::register_exception<UnsupportedProjectionError>(m, "UnsupportedProjectionError");
	py::register_exception<UnknownCoordsKindError>(m, "UnknownCoordsKindError");
	py::register_exception<InvalidArgumentError>(m, "InvalidArgumentError", PyExc_ValueError);

	py::class_<GeoCoords>(m, "GeoCoords")
		.def(py::init<double,double,double>(), py::arg("lon"), py::arg("lat"), py::arg("hgt")=0.)
		.def_readwrite("lon", &GeoCoords::lon)
		.def_readwrite("lat", &GeoCoords::lat)
		.def_readwrite("hgt", &GeoCoords::hgt)
		.def("isNan", &GeoCoords::isNan)
		.def("toECEFCoords", [](const GeoCoords& p) { return geodetic_to_ecef(p); })
		.def("toENUCoords", [](const GeoCoords& p, const py::object& base) { return geodetic_to_enu(p, toBase(base)); })
		.def("distanceTo", &GeoCoords::distanceTo)
		.def("distance2DTo", &GeoCoords::distance2DTo)
		.def("elevationTo", &GeoCoords::elevationTo)
		.def("azimuthTo", &GeoCoords::azimuthTo)
		.def("__eq__", &GeoCoords::operator==)
		.def("__str__", &GeoCoords::str)
		.def("__repr__", &GeoCoords::str);

	py::class_<EcefCoords>(m, "ECEFCoords")
		.def(py::init<double,double,double>(), py::arg("X"), py::arg("Y"), py::arg("Z"))
		.def_readwrite("X", &EcefCoords::X)
		.def_readwrite("Y", &EcefCoords::Y)
		.def_readwrite("Z", &EcefCoords::Z)
		.def("isNan", &EcefCoords::isNan)
		.def("norm", &EcefCoords::norm)
		.def("dot", &EcefCoords::dot)
		.def("scaled", &EcefCoords::scaled)
		.def("toGeoCoords", [](const EcefCoords& p) { return ecef_to_geodetic(p); })
		.def("toENUCoords", [](const EcefCoords& p, const py::object& base) { return ecef_to_enu(p, base_to_ecef(toBase(base))); })
		.def("distanceTo", &EcefCoords::distanceTo)
		.def("distance2DTo", &EcefCoords::distance2DTo)
		.def("elevationTo", &EcefCoords::elevationTo)
		.def("azimuthTo", &EcefCoords::azimuthTo)
		.def("__add__", &EcefCoords::operator+)
		.def("__sub__", &EcefCoords::operator-)
		.def("__eq__", &EcefCoords::operator==)
		.def("__str__", &EcefCoords::str)
		.def("__repr__", &EcefCoords::str);

	py::class_<EnuCoords>(m, "ENUCoords")
		.def(py::init<double,double,double>(), py::arg("E"), py::arg("N"), py::arg("U")=0.)
		.def_readwrite("E", &EnuCoords::E)
		.def_readwrite("N", &EnuCoords::N)
		.def_readwrite("U", &EnuCoords::U)
		.def("isNan", &EnuCoords::isNan)
		.def("norm", &EnuCoords::norm)
		.def("norm2D", &EnuCoords::norm2D)
		.def("dot", &EnuCoords::dot)
		.def("rotated", &EnuCoords::rotated)
		.def("scaled", &EnuCoords::scaled)
		.def("translated", &EnuCoords::translated, py::arg("tx"), py::arg("ty"), py::arg("tz")=0.)
		.def("toECEFCoords", [](const EnuCoords& p, const py::object& base) { return enu_to_ecef(p, base_to_ecef(toBase(base))); })
		.def("toGeoCoords", [](const EnuCoords& p, const py::object& base) { return enu_to_geodetic(p, toBase(base)); })
		.def("toENUCoords", [](const EnuCoords& p, const py::object& b1, const py::object& b2) {
				return enu_to_enu(p, base_to_ecef(toBase(b1)), base_to_ecef(toBase(b2))); })
		.def("distanceTo", &EnuCoords::distanceTo)
		.def("distance2DTo", &EnuCoords::distance2DTo)
		.def("elevationTo", &EnuCoords::elevationTo)
		.def("azimuthTo", &EnuCoords::azimuthTo)
		.def("__add__", &EnuCoords::operator+)
		.def("__sub__", &EnuCoords::operator-)
		.def("__eq__", &EnuCoords::operator==)
		.def("__str__", &EnuCoords::str)
		.def("__repr__", &EnuCoords::str);

	m.def("makeCoords", [](double x, double y, double z, const std::string& kind) { return make_coords(x, y, z, kind); });
	m.def("project", [](const GeoCoords& p, int srid) { return project(p, Srid { srid }); });
	m.def("unproject", [](const EnuCoords& p, int srid) { return unproject(p, Srid { srid }); });

	m.def("geodetic_to_ecef", [](py::array_t<double, py::array::c_style | py::array::forcecast> llh) {
			return convertArray(llh, [](double* out, int n, const double* in) { geodetic_to_ecef(out, n, in); }); });
	m.def("ecef_to_geodetic", [](py::array_t<double, py::array::c_style | py::array::forcecast> xyz) {
			return convertArray(xyz, [](double* out, int n, const double* in) { ecef_to_geodetic(out, n, in); }); });
}
