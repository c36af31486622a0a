#pragma once

#include <fmt/core.h>

#include <array>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "geotrack/errors.h"

namespace geotrack {

using Str = std::string;

inline bool is_a_number(const Str& s) {
	if (s.empty()) return false;
	size_t idx = 0;
	try {
		std::stod(s, &idx);
	} catch (const std::invalid_argument&) {
		return false;
	} catch (const std::out_of_range&) {
		return false;
	}
	return idx == s.length();
}

// Three numbers given as one option, e.g. "--point 2.35 48.85 35".
using Triple = std::array<double,3>;

// ad-hoc (zero-config) cli argument parser.
//
// Call some variation of get<T>() to get assigned values.
//
// Note: Keys are not allowed to be numbers, because that would make
// parsing lists of numbers impossible (cannot tell if "-p 1 -1 2" is a
// three-length block assigned to key "p", or if the "-1" is starting a new key)
//
class ArgParser {
	public:

		inline ArgParser(int argc, char** argv) {
			parse(argc, argv);
		}

		inline Str getKeyWithoutDashes(const Str& k) const {
			if (k.length() > 2 and k[0] == '-' and k[1] == '-') {
				return k.substr(2);
			}
			else if (k.length() > 1 and k[0] == '-') {
				return k.substr(1);
			} else {
				throw InvalidArgumentError(fmt::format("invalid key '{}', must start with - or --", k));
			}
		}

		template <class T>
		inline std::optional<T> get(const Str& k) const {
			if (is_a_number(k)) {
				throw InvalidArgumentError("ArgParser keys are NOT allowed to be numbers.");
			}

			auto it = map.find(getKeyWithoutDashes(k));
			if (it != map.end()) {
				return scanAs<T>(k, it->second);
			}
			return {};
		}

		template <class T>
		inline std::optional<T> get(const Str& k, const T& def) const {
			auto r = get<T>(k);
			if (r.has_value()) return r;
			return def;
		}

		template <class ...Choices>
		inline std::optional<std::string> getChoice(const Str& k, Choices... choices_) const {
			auto vv = get<Str>(k);
			if (not vv.has_value()) return {};
			auto v = vv.value();

			std::vector<std::string> choices { choices_... };
			for (auto& c : choices) {
				if (v == c) return c;
			}

			throw InvalidArgumentError(fmt::format("invalid choice '{}' for {}", v, k));
		}

		template <class T>
		inline std::optional<T> get2(const Str& k1, const Str& k2) const {
			auto a = get<T>(k1);
			if (a.has_value()) return a;
			return get<T>(k2);
		}
		template <class T>
		inline std::optional<T> get2(const Str& k1, const Str& k2, const T &def) const {
			auto a = get<T>(k1);
			if (a.has_value()) return a;
			return get<T>(k2, def);
		}
		template <class T>
		inline T get2OrDie(const Str& k1, const Str& k2) const {
			auto a = get2<T>(k1, k2);
			if (not a.has_value()) throw InvalidArgumentError(fmt::format("missing required option {}/{}", k1, k2));
			return a.value();
		}
		template <class ...Choices>
		inline std::optional<std::string> getChoice2(const Str& k1, const Str& k2, Choices... choices_) const {
			auto a = getChoice(k1, choices_...);
			if (a.has_value()) return a;
			return getChoice(k2, choices_...);
		}

		inline bool have(const Str& k1) const {
			return map.find(getKeyWithoutDashes(k1)) != map.end();
		}
		inline bool have2(const Str& k1, const Str& k2) const {
			return have(k1) or have(k2);
		}


	private:
		std::unordered_map<Str, std::vector<Str>> map;

		inline void parse(int argc, char** argv) {
			for (int i=1; i<argc; i++) {
				Str arg{argv[i]};

				if (arg.empty() or arg[0] != '-' or is_a_number(arg)) continue;

				size_t kstart = 0;
				while (kstart < arg.length() and arg[kstart] == '-') kstart++;
				arg = arg.substr(kstart);

				if (arg.find("=") != std::string::npos) {
					auto f = arg.find("=");
					std::string k = arg.substr(0, f);
					std::string v = arg.substr(f+1);

					if (map.find(k) != map.end()) throw InvalidArgumentError(fmt::format("duplicate key '{}'", k));
					map[k] = {v};
				} else {
					std::vector<Str> vals;

					// Properly parse numbers.
					while (i+1 < argc and (argv[i+1][0] != '-' or is_a_number(argv[i+1]))) {
						vals.push_back(Str{argv[++i]});
					}

					if (map.find(arg) != map.end()) throw InvalidArgumentError(fmt::format("duplicate key '{}'", arg));
					map[arg] = vals;
				}
			}
		}

		template <class T>
		inline T scanAs(const Str& k, const std::vector<Str>& ss) const {
			if constexpr(std::is_same_v<std::vector<std::string>,T>) {
				// Scan space-seperated strings.
				return ss;
			}
			else if constexpr(std::is_same_v<std::vector<double>,T>) {
				std::vector<double> out;
				for (const auto& s : ss) out.push_back(toDouble(k, s));
				return out;
			}
			else if constexpr(std::is_same_v<Triple,T>) {
				if (ss.size() != 3) {
					throw InvalidArgumentError(fmt::format("{} needs exactly three numbers, got {}", k, ss.size()));
				}
				return Triple { toDouble(k, ss[0]), toDouble(k, ss[1]), toDouble(k, ss[2]) };
			}
			else if constexpr(std::is_same_v<bool,T>) {
				// A bare flag is true.
				if (ss.empty()) return true;
				if (ss.size() != 1) {
					throw InvalidArgumentError(fmt::format("{} takes one value, but the parsed size of the value-set was {}", k, ss.size()));
				}
				const Str& s = ss[0];
				return not (s == "0" or s == "off" or s == "no" or s == "n" or s == "N" or s == "false" or s == "False");
			}
			else {
				// All of these are scalars.
				if (ss.size() != 1) {
					throw InvalidArgumentError(fmt::format("{} takes one value, but the parsed size of the value-set was {}", k, ss.size()));
				}
				const Str& s = ss[0];

				if constexpr(std::is_integral_v<T>) {
					return toInteger<T>(k, s);
				}
				else if constexpr(std::is_floating_point_v<T>) {
					return static_cast<T>(toDouble(k, s));
				}
				else {
					static_assert(std::is_same_v<Str,T>, "ArgParser cannot scan this type");
					return s;
				}
			}
		}

		// Whole string must be an integer that fits in T: no fraction, no wrap around.
		template <class T>
		static inline T toInteger(const Str& k, const Str& s) {
			size_t idx = 0;
			long long v = 0;
			try {
				v = std::stoll(s, &idx);
			} catch (const std::invalid_argument&) {
				throw InvalidArgumentError(fmt::format("{} expects an integer, got '{}'", k, s));
			} catch (const std::out_of_range&) {
				throw InvalidArgumentError(fmt::format("{} is out of range, got '{}'", k, s));
			}
			if (idx != s.length()) throw InvalidArgumentError(fmt::format("{} expects an integer, got '{}'", k, s));

			if constexpr(std::is_signed_v<T>) {
				if (v < static_cast<long long>(std::numeric_limits<T>::min()) or v > static_cast<long long>(std::numeric_limits<T>::max()))
					throw InvalidArgumentError(fmt::format("{} is out of range, got '{}'", k, s));
			} else {
				if (v < 0 or static_cast<unsigned long long>(v) > static_cast<unsigned long long>(std::numeric_limits<T>::max()))
					throw InvalidArgumentError(fmt::format("{} is out of range, got '{}'", k, s));
			}
			return static_cast<T>(v);
		}

		static inline double toDouble(const Str& k, const Str& s) {
			if (not is_a_number(s)) throw InvalidArgumentError(fmt::format("{} expects a number, got '{}'", k, s));
			return std::stod(s);
		}

};

}
