#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "argparse.hpp"

using namespace geotrack;

namespace {

// Owns the strings so argv stays valid for the parser's lifetime.
struct Argv {
	std::vector<std::string> strs;
	std::vector<char*> ptrs;

	Argv(std::vector<std::string> s) : strs(std::move(s)) {
		for (auto& x : strs) ptrs.push_back(x.data());
	}

	ArgParser parse() {
		return ArgParser(static_cast<int>(ptrs.size()), ptrs.data());
	}
};

}

TEST_CASE( "ArgParserValues", "[argparse]" ) {
	Argv args({ "geotrack", "-a", "convert", "--point", "-1.5", "48.8", "-35", "--srid=2154", "-v", "--from", "geo" });
	ArgParser p = args.parse();

	REQUIRE(p.get<std::string>("-a").value() == "convert");
	REQUIRE(p.getChoice2("-a", "--action", "convert", "project").value() == "convert");

	Triple t = p.get2<Triple>("-p", "--point").value();
	REQUIRE(t[0] == -1.5);
	REQUIRE(t[1] == 48.8);
	REQUIRE(t[2] == -35);

	REQUIRE(p.get2OrDie<int>("-s", "--srid") == 2154);
	REQUIRE(p.get<bool>("-v").value());
	REQUIRE(p.get2<bool>("-q", "--quiet", false).value() == false);
	REQUIRE(p.get<std::string>("--baseKind", "geo").value() == "geo");

	REQUIRE(p.have("--from"));
	REQUIRE(p.have2("-f", "--from"));
	REQUIRE(not p.have("--base"));
	REQUIRE(not p.get<double>("--base").has_value());
}

TEST_CASE( "ArgParserErrors", "[argparse]" ) {
	Argv args({ "geotrack", "-a", "warp", "--point", "1", "2", "--srid", "abc" });
	ArgParser p = args.parse();

	REQUIRE_THROWS_AS(p.getChoice("-a", "convert", "project"), InvalidArgumentError);
	REQUIRE_THROWS_AS(p.get<Triple>("--point"), InvalidArgumentError);
	REQUIRE_THROWS_AS(p.get<int>("--srid"), InvalidArgumentError);
	REQUIRE_THROWS_AS(p.get2OrDie<std::string>("-t", "--to"), InvalidArgumentError);
	REQUIRE_THROWS_AS(p.get<int>("-5"), InvalidArgumentError);
	REQUIRE_THROWS_AS(p.get<int>("srid"), InvalidArgumentError);

	Argv dup({ "geotrack", "--srid", "2154", "--srid=32631" });
	REQUIRE_THROWS_AS(dup.parse(), InvalidArgumentError);
}

TEST_CASE( "ArgParserIntegers", "[argparse]" ) {
	// 4294969450 == 2^32 + 2154, would wrap to 2154 in an int.
	Argv args({ "geotrack", "--wrap", "4294969450", "--frac", "2154.9", "--huge", "99999999999999999999",
			"--neg", "-32631", "--exp", "2e3", "--ok=32631" });
	ArgParser p = args.parse();

	REQUIRE_THROWS_AS(p.get<int>("--wrap"), InvalidArgumentError);
	REQUIRE(p.get<long long>("--wrap").value() == 4294969450LL);
	REQUIRE_THROWS_AS(p.get<int>("--frac"), InvalidArgumentError);
	REQUIRE_THROWS_AS(p.get<int>("--huge"), InvalidArgumentError);
	REQUIRE_THROWS_AS(p.get<long long>("--huge"), InvalidArgumentError);
	REQUIRE_THROWS_AS(p.get<int>("--exp"), InvalidArgumentError);
	REQUIRE_THROWS_AS(p.get<unsigned>("--neg"), InvalidArgumentError);

	REQUIRE(p.get<int>("--neg").value() == -32631);
	REQUIRE(p.get<int>("--ok").value() == 32631);

	// Still a plain number to the float scanner.
	REQUIRE(p.get<double>("--frac").value() == 2154.9);
}
