#pragma once

#include <cstdint>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace scru128::apps {

// Option describes a single command-line flag accepted by an app or subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure; it is expected to explain
// the failure on stderr.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag
// to its handler, and returns the populated config.
// Non-flag tokens are skipped (callers handle positional arguments separately).
// Returns nullopt if a handler rejected its value, a value is missing, or an unknown flag
// was given; every problem is reported to stderr before returning.
template <typename Config>
std::optional<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  Config config = std::move(default_config);
  bool ok = true;

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      if (opt->requires_value) {
        if (i + 1 < argc) {
          const std::string value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
          if (!opt->handler(config, value)) {
            ok = false;
          }
        } else {
          std::cerr << "Option " << arg << " requires a value\n";
          ok = false;
        }
      } else {
        if (!opt->handler(config, "")) {
          ok = false;
        }
      }
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      ok = false;
    }
  }

  if (!ok) {
    return std::nullopt;
  }
  return config;
}

// parse_uint64 accepts a non-empty string of decimal digits that fits in 64 bits.
inline std::optional<std::uint64_t> parse_uint64(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  for (const char c : value) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
  }
  try {
    return static_cast<std::uint64_t>(std::stoull(value));
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

// print_options writes one "  --name <value>  description" line per option.
template <typename Config>
void print_options(std::ostream& out, const std::vector<Option<Config>>& options) {
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n      "
        << opt.description << "\n";
  }
}

}  // namespace scru128::apps
