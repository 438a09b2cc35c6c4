#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace simb::apps {

// Option describes a single command-line flag accepted by an app.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure. The parser
// keeps processing the remaining flags either way and counts the failures.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedOptions {
  Config config;     // NOLINT(readability-identifier-naming)
  int failures{0};   // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised flag
// to its handler. A value is taken from "--flag=value" or from the next token.
// Unknown flags are reported to stderr and ignored. Non-flag tokens are skipped.
// A missing value or a handler returning false counts as a failure.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{.config = std::move(default_config), .failures = 0};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    std::string inline_value;
    bool has_inline_value = false;
    if (const auto eq = arg.find('='); arg.rfind("--", 0) == 0 && eq != std::string::npos) {
      inline_value = arg.substr(eq + 1);
      arg.resize(eq);
      has_inline_value = true;
    }

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      if (!arg.empty() && arg[0] == '-') {
        std::cerr << "Unknown option: " << arg << "\n";
      }
      continue;
    }

    const Option<Config>* opt = it->second;
    bool ok = true;
    if (!opt->requires_value) {
      if (has_inline_value) {
        std::cerr << "Option " << arg << " does not take a value\n";
        ok = false;
      } else {
        ok = opt->handler(parsed.config, "");
      }
    } else if (has_inline_value) {
      ok = opt->handler(parsed.config, inline_value);
    } else if (i + 1 < argc) {
      ok = opt->handler(parsed.config,
                        argv[++i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    } else {
      std::cerr << "Option " << arg << " requires a value\n";
      ok = false;
    }

    if (!ok) {
      ++parsed.failures;
    }
  }

  return parsed;
}

}  // namespace simb::apps
