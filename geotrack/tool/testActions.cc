#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

#include "actions.h"
#include "geotrack/errors.h"

using namespace geotrack;
using Catch::Matchers::ContainsSubstring;

namespace {

struct ToolRun {
	int rc;
	std::string out;
	std::string err;

	inline int lines() const { return static_cast<int>(std::count(out.begin(), out.end(), '\n')); }
};

ToolRun runTool(std::vector<std::string> args, const std::string& input = "") {
	args.insert(args.begin(), "geotrack");
	std::vector<char*> ptrs;
	for (auto& a : args) ptrs.push_back(a.data());

	std::istringstream in(input);
	std::ostringstream out, err;
	int rc = run_tool(static_cast<int>(ptrs.size()), ptrs.data(), in, out, err);
	return ToolRun { rc, out.str(), err.str() };
}

ArgParser parseArgs(std::vector<std::string> args) {
	args.insert(args.begin(), "geotrack");
	std::vector<char*> ptrs;
	for (auto& a : args) ptrs.push_back(a.data());
	return ArgParser(static_cast<int>(ptrs.size()), ptrs.data());
}

}

TEST_CASE( "StdinTriples", "[tool]" ) {
	ToolRun r = runTool({ "-a", "project", "--srid", "2154" },
			"# lon lat hgt\n"
			"\n"
			"2.3522 48.8566 35\n"
			"3 46.5 0\n");
	REQUIRE(r.rc == ExitOk);
	REQUIRE(r.lines() == 2);
	REQUIRE_THAT(r.out, ContainsSubstring("652469.023"));
	REQUIRE_THAT(r.out, ContainsSubstring("6862035.260"));
	REQUIRE_THAT(r.out, ContainsSubstring("[E=  700000.000,"));

	// Nothing to read is not an error.
	ToolRun empty = runTool({ "-a", "project", "--srid", "2154" }, "");
	REQUIRE(empty.rc == ExitOk);
	REQUIRE(empty.out.empty());

	// --point takes precedence over stdin.
	ToolRun p = runTool({ "-a", "project", "--srid", "2154", "--point", "3", "46.5", "0" }, "not numbers\n");
	REQUIRE(p.rc == ExitOk);
	REQUIRE(p.lines() == 1);
}

TEST_CASE( "StdinBadLine", "[tool]" ) {
	ToolRun r = runTool({ "-a", "project", "--srid", "2154" },
			"# header\n"
			"2.3522 48.8566 35\n"
			"1 2\n");
	REQUIRE(r.rc == ExitUsage);
	REQUIRE_THAT(r.err, ContainsSubstring("stdin line 3"));
	REQUIRE_THAT(r.err, ContainsSubstring("'1 2'"));

	// Lines before the bad one were already written.
	REQUIRE(r.lines() == 1);
}

TEST_CASE( "BaseSelection", "[tool]" ) {
	REQUIRE(not get_base(parseArgs({ "-a", "convert" })).has_value());

	auto s = get_base(parseArgs({ "--srid", "2154", "--base", "1", "2", "3" }));
	REQUIRE(std::get<Srid>(s.value()) == Srid { 2154 });
	auto s2 = get_base(parseArgs({ "--base", "1", "2", "3", "-s", "32631" }));
	REQUIRE(std::get<Srid>(s2.value()) == Srid { 32631 });

	auto g = get_base(parseArgs({ "--base", "2.35", "48.85", "35" }));
	REQUIRE(std::get<GeoCoords>(g.value()) == GeoCoords { 2.35, 48.85, 35 });

	auto x = get_base(parseArgs({ "--base", "6378137", "0", "0", "--baseKind", "ECEF" }));
	REQUIRE(std::get<EcefCoords>(x.value()) == EcefCoords { 6378137, 0, 0 });

	REQUIRE_THROWS_AS(get_base(parseArgs({ "--base", "1", "2", "3", "--baseKind", "enu" })), InvalidArgumentError);
	REQUIRE_THROWS_AS(get_base(parseArgs({ "--base", "1", "2", "3", "--baseKind", "utm" })), UnknownCoordsKindError);
	REQUIRE_THROWS_AS(get_base(parseArgs({ "--base", "1", "2" })), InvalidArgumentError);

	ToolRun r = runTool({ "-a", "convert", "-f", "geo", "-t", "enu", "-p", "1", "2", "3", "--base", "1", "2", "3", "--baseKind", "enu" });
	REQUIRE(r.rc == ExitUsage);
	REQUIRE_THAT(r.err, ContainsSubstring("--baseKind"));
}

TEST_CASE( "ConvertAction", "[tool]" ) {
	ToolRun r = runTool({ "-a", "convert", "--from", "geo", "--to", "ecef", "--point", "0", "0", "0" });
	REQUIRE(r.rc == ExitOk);
	REQUIRE(r.out == "[X= 6378137.000, Y=       0.000, Z=       0.000]\n");

	// An srid base makes geo -> enu a projection.
	ToolRun l = runTool({ "-a", "convert", "-f", "geo", "-t", "enu", "--srid", "2154", "-p", "3", "46.5", "0" });
	ToolRun pr = runTool({ "-a", "project", "--srid", "2154", "-p", "3", "46.5", "0" });
	REQUIRE(l.rc == ExitOk);
	REQUIRE(l.out == pr.out);

	ToolRun v = runTool({ "-a", "project", "-v", "--srid", "2154", "-p", "3", "46.5", "0" });
	REQUIRE_THAT(v.out, ContainsSubstring(" - projecting to srid 2154"));
}

TEST_CASE( "PairActions", "[tool]" ) {
	ToolRun d = runTool({ "-a", "distance", "-f", "enu", "-p", "0", "0", "0", "-g", "3", "4", "12" });
	REQUIRE(d.rc == ExitOk);
	REQUIRE(d.out == "distance   13.000 m\ndistance2D 5.000 m\n");

	ToolRun a = runTool({ "-a", "angles", "-f", "enu", "-p", "0", "0", "0", "-g", "1", "0", "0" });
	REQUIRE(a.rc == ExitOk);
	REQUIRE(a.out == "elevation 0.000000 deg\nazimuth   90.000000 deg\n");

	REQUIRE(runTool({ "-a", "distance", "-f", "enu", "-p", "0", "0", "0" }).rc == ExitUsage);
}

TEST_CASE( "ExitCodes", "[tool]" ) {
	ToolRun h = runTool({ "--help" });
	REQUIRE(h.rc == ExitOk);
	REQUIRE_THAT(h.out, ContainsSubstring("usage"));

	// Usage errors.
	REQUIRE(runTool({}).rc == ExitUsage);
	REQUIRE(runTool({ "-a", "warp" }).rc == ExitUsage);
	REQUIRE(runTool({ "-a", "project", "-p", "1", "2", "3" }).rc == ExitUsage);
	REQUIRE(runTool({ "-a", "project", "--srid", "2154", "--srid=2154" }).rc == ExitUsage);
	REQUIRE(runTool({ "-a", "convert", "-f", "enu", "-t", "geo", "-p", "1", "2", "3" }).rc == ExitUsage);

	// Integer options are range checked instead of wrapping or truncating.
	for (const char* srid : { "4294969450", "2154.9", "99999999999999999999" }) {
		ToolRun r = runTool({ "-a", "project", "--srid", srid, "--point", "2.3522", "48.8566", "35" });
		REQUIRE(r.rc == ExitUsage);
		REQUIRE(r.out.empty());
	}

	// Conversion errors.
	ToolRun bad = runTool({ "-a", "project", "--srid", "9999", "-p", "2.3522", "48.8566", "35" });
	REQUIRE(bad.rc == ExitConversion);
	REQUIRE_THAT(bad.err, ContainsSubstring("srid=9999"));
	REQUIRE_THAT(bad.err, ContainsSubstring("dir=forward"));

	ToolRun utm = runTool({ "-a", "project", "--srid", "32631", "-p", "3", "45", "0" });
	REQUIRE(utm.rc == ExitConversion);
	REQUIRE_THAT(utm.err, ContainsSubstring("dir=forward"));

	ToolRun badInv = runTool({ "-a", "unproject", "--srid", "32661", "-p", "500000", "0", "0" });
	REQUIRE(badInv.rc == ExitConversion);
	REQUIRE_THAT(badInv.err, ContainsSubstring("dir=inverse"));

	REQUIRE(runTool({ "-a", "convert", "-f", "wgs84", "-t", "ecef", "-p", "1", "2", "3" }).rc == ExitConversion);
}
