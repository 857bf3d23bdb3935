#pragma once

#include "beacon/core/result.h"

#include <functional>
#include <iomanip>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace beacon::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
// handler returns false when the value is invalid; it may print the reason.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1] and dispatches each flag to its
// handler. Unknown flags, missing values and rejected values all fail the
// parse; the error names the first offending flag.
template <typename Config>
core::Result<Config, std::string> parse_options(int argc,
                                                char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                                const std::vector<Option<Config>>& options,
                                                int start = 1, Config default_config = {}) {
  using R = core::Result<Config, std::string>;
  Config config = std::move(default_config);

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      return R::err("unknown option: " + arg);
    }

    const Option<Config>* opt = it->second;
    std::string value;
    if (opt->requires_value) {
      if (i + 1 >= argc) {
        return R::err("option " + arg + " requires a value");
      }
      value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }
    if (!opt->handler(config, value)) {
      return R::err("invalid value for " + arg + ": " + value);
    }
  }

  return R::ok(std::move(config));
}

// print_usage lists each option with its description, one per line.
template <typename Config>
void print_usage(std::ostream& out, const std::string& synopsis,
                 const std::vector<Option<Config>>& options) {
  out << "Usage: " << synopsis << "\n";
  for (const auto& opt : options) {
    const std::string flag = opt.requires_value ? opt.name + " <value>" : opt.name;
    out << "  " << std::left << std::setw(28) << flag << opt.description << "\n";
  }
}

}  // namespace beacon::apps
