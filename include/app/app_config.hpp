// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace serverbook {
namespace app {

// Process-level settings. Store parameters are compile-time constants
// (store/store_config.hpp) and are not configurable here.
struct AppConfig {
  std::filesystem::path datadir;  // empty = util::get_default_datadir()
  std::string log_level = "warn";
  bool log_to_file = false;  // <datadir>/debug.log

  std::filesystem::path LogFilePath() const { return datadir / "debug.log"; }
};

enum class OptionResult {
  Consumed,     // arg was an option and has been applied
  NotAnOption,  // positional argument, left for the caller
  Invalid,      // recognized option with a bad value (see error)
};

// Apply one "--name[=value]" argument to config
OptionResult ApplyOption(const std::string& arg, AppConfig& config, std::string& error);

// Fill in defaults for anything left unset. Returns false if no data
// directory can be determined.
bool ResolveDefaults(AppConfig& config);

}  // namespace app
}  // namespace serverbook
