#include "actions.h"

#include <fmt/core.h>
#include <fmt/color.h>
#include <fmt/ostream.h>

#include <istream>
#include <ostream>
#include <sstream>
#include <string>

#include "geotrack/errors.h"
#include "geotrack/ellipsoid.h"
#include "geotrack/projection.h"

namespace geotrack {

void print_usage(std::ostream& os) {
	fmt::print(os,
		"usage: geotrack -a <action> [options]\n"
		"  actions:\n"
		"    convert    --point x y z --from K --to K [--base x y z --baseKind geo|ecef | --srid S]\n"
		"    project    --point lon lat h --srid S\n"
		"    unproject  --point e n u --srid S\n"
		"    distance   --point x y z --target x y z --from K\n"
		"    angles     --point x y z --target x y z --from K\n"
		"  K is one of geo, ecef, enu. Without --point, triples are read from stdin.\n");
}

Srid require_srid(const ArgParser& parser) {
	return Srid { parser.get2OrDie<int>("-s", "--srid") };
}

std::optional<Base> get_base(const ArgParser& parser) {
	if (parser.have2("-s", "--srid")) {
		return Base { require_srid(parser) };
	}
	if (not parser.have("--base")) return {};

	const Triple b = parser.get<Triple>("--base").value();
	const CoordsKind kind = parse_coords_kind(parser.get<std::string>("--baseKind", "geo").value());
	if (kind == CoordsKind::Geo) return Base { GeoCoords { b[0], b[1], b[2] } };
	if (kind == CoordsKind::Ecef) return Base { EcefCoords { b[0], b[1], b[2] } };
	throw InvalidArgumentError("--baseKind must be geo or ecef");
}

void for_each_point(const ArgParser& parser, std::istream& in, const std::function<void(const Triple&)>& fn) {
	if (parser.have2("-p", "--point")) {
		fn(parser.get2<Triple>("-p", "--point").value());
		return;
	}

	std::string line;
	int lineNo = 0;
	while (std::getline(in, line)) {
		lineNo++;
		if (line.empty() or line[0] == '#') continue;

		std::istringstream ss(line);
		Triple t;
		if (not (ss >> t[0] >> t[1] >> t[2])) {
			throw InvalidArgumentError(fmt::format("stdin line {}: expected three numbers, got '{}'", lineNo, line));
		}
		fn(t);
	}
}

namespace {

void progress(std::ostream& out, bool verbose, const std::string& msg) {
	if (verbose) out << fmt::format(fmt::fg(fmt::color::light_green), " - {}\n", msg);
}

void do_convert(const ArgParser& parser, std::istream& in, std::ostream& out, bool verbose) {
	const CoordsKind from = parse_coords_kind(parser.get2OrDie<std::string>("-f", "--from"));
	const CoordsKind to   = parse_coords_kind(parser.get2OrDie<std::string>("-t", "--to"));
	const auto base = get_base(parser);

	progress(out, verbose, fmt::format("converting {} -> {}", to_string(from), to_string(to)));

	for_each_point(parser, in, [&](const Triple& t) {
		const AnyCoords p = make_coords(t[0], t[1], t[2], from);
		fmt::print(out, "{}\n", str(convert(p, to, base)));
	});
}

void do_project(const ArgParser& parser, std::istream& in, std::ostream& out, bool verbose) {
	const Srid srid = require_srid(parser);
	progress(out, verbose, fmt::format("projecting to srid {}", srid.code));

	for_each_point(parser, in, [&](const Triple& t) {
		fmt::print(out, "{}\n", project(GeoCoords { t[0], t[1], t[2] }, srid));
	});
}

void do_unproject(const ArgParser& parser, std::istream& in, std::ostream& out, bool verbose) {
	const Srid srid = require_srid(parser);
	progress(out, verbose, fmt::format("unprojecting from srid {}", srid.code));

	for_each_point(parser, in, [&](const Triple& t) {
		fmt::print(out, "{}\n", unproject(EnuCoords { t[0], t[1], t[2] }, srid));
	});
}

// Both points are of the same kind, so the alternative of @b always matches @a.
template <class Fn>
void with_pair(const AnyCoords& a, const AnyCoords& b, Fn&& fn) {
	std::visit([&](const auto& pa) {
		using T = std::decay_t<decltype(pa)>;
		fn(pa, std::get<T>(b));
	}, a);
}

void do_distance(const ArgParser& parser, std::ostream& out) {
	const std::string kind = parser.get2OrDie<std::string>("-f", "--from");
	const Triple a = parser.get2OrDie<Triple>("-p", "--point");
	const Triple b = parser.get2OrDie<Triple>("-g", "--target");

	with_pair(make_coords(a[0], a[1], a[2], kind), make_coords(b[0], b[1], b[2], kind), [&out](const auto& pa, const auto& pb) {
		fmt::print(out, "distance   {:.3f} m\n", pa.distanceTo(pb));
		fmt::print(out, "distance2D {:.3f} m\n", pa.distance2DTo(pb));
	});
}

void do_angles(const ArgParser& parser, std::ostream& out) {
	const std::string kind = parser.get2OrDie<std::string>("-f", "--from");
	const Triple a = parser.get2OrDie<Triple>("-p", "--point");
	const Triple b = parser.get2OrDie<Triple>("-g", "--target");

	with_pair(make_coords(a[0], a[1], a[2], kind), make_coords(b[0], b[1], b[2], kind), [&out](const auto& pa, const auto& pb) {
		fmt::print(out, "elevation {:.6f} deg\n", pa.elevationTo(pb) * kRadToDeg);
		fmt::print(out, "azimuth   {:.6f} deg\n", pa.azimuthTo(pb) * kRadToDeg);
	});
}

void print_error(std::ostream& err, const std::exception& e) {
	err << fmt::format(fmt::fg(fmt::color::red), "error: {}\n", e.what());
}

}

int run_tool(int argc, char** argv, std::istream& in, std::ostream& out, std::ostream& err) {

	try {
		ArgParser parser(argc, argv);

		if (parser.have2("-h", "--help")) {
			print_usage(out);
			return ExitOk;
		}

		auto action_ = parser.getChoice2("-a", "--action", "convert", "project", "unproject", "distance", "angles");
		if (not action_.has_value()) {
			print_usage(err);
			return ExitUsage;
		}
		const std::string action = action_.value();
		const bool verbose = parser.get2<bool>("-v", "--verbose", false).value();

		if (action == "convert") do_convert(parser, in, out, verbose);
		else if (action == "project") do_project(parser, in, out, verbose);
		else if (action == "unproject") do_unproject(parser, in, out, verbose);
		else if (action == "distance") do_distance(parser, out);
		else if (action == "angles") do_angles(parser, out);

	} catch (const InvalidArgumentError& e) {
		print_error(err, e);
		print_usage(err);
		return ExitUsage;
	} catch (const UnsupportedProjectionError& e) {
		print_error(err, e);
		return ExitConversion;
	} catch (const UnknownCoordsKindError& e) {
		print_error(err, e);
		return ExitConversion;
	}

	return ExitOk;
}

}
