// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/app_config.hpp"

#include "util/files.hpp"
#include "util/string_parsing.hpp"

#include <array>
#include <string_view>

namespace serverbook {
namespace app {

namespace {

constexpr std::array<std::string_view, 7> kLogLevels = {"trace", "debug", "info", "warn", "error", "critical", "off"};

bool IsLogLevel(const std::string& level) {
  for (auto known : kLogLevels) {
    if (level == known) {
      return true;
    }
  }
  return false;
}

}  // anonymous namespace

OptionResult ApplyOption(const std::string& arg, AppConfig& config, std::string& error) {
  if (arg.starts_with("--datadir=")) {
    std::string value = arg.substr(10);
    if (value.empty()) {
      error = "--datadir requires a non-empty path";
      return OptionResult::Invalid;
    }
    config.datadir = value;
    return OptionResult::Consumed;
  }

  if (arg.starts_with("--loglevel=")) {
    std::string value = util::ToLowerASCII(arg.substr(11));
    if (!IsLogLevel(value)) {
      error = "--loglevel must be one of trace, debug, info, warn, error, critical, off";
      return OptionResult::Invalid;
    }
    config.log_level = value;
    return OptionResult::Consumed;
  }

  if (arg == "--logfile") {
    config.log_to_file = true;
    return OptionResult::Consumed;
  }

  if (arg.starts_with("--")) {
    error = "Unknown option: " + arg;
    return OptionResult::Invalid;
  }
  return OptionResult::NotAnOption;
}

bool ResolveDefaults(AppConfig& config) {
  if (config.datadir.empty()) {
    config.datadir = util::get_default_datadir();
  }
  return !config.datadir.empty();
}

}  // namespace app
}  // namespace serverbook
