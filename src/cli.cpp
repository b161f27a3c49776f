// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/app_config.hpp"
#include "app/connect_controller.hpp"
#include "store/server_lists.hpp"
#include "util/endpoint.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace serverbook;

namespace {

// The CLI has no game client to hand the target to; it reports it instead.
class PrintingConnectionSink : public app::ConnectionSink {
public:
  void SetTargetServer(const std::string &host, uint16_t port) override {
    target_ = util::FormatHostPort(host, port);
  }
  void StartConnection() override { std::cout << "Target server set to " << target_ << std::endl; }

private:
  std::string target_;
};

void PrintUsage(const char *program_name) {
  std::cout << "ServerBook CLI - Manage remembered game servers\n\n"
            << "Usage: " << program_name << " [options] <command> [params]\n\n"
            << "Options:\n"
            << "  --datadir=<path>     Data directory (default: ~/.serverbook)\n"
            << "  --loglevel=<level>   trace, debug, info, warn, error, critical, off (default: warn)\n"
            << "  --logfile            Also log to <datadir>/debug.log\n"
            << "  --help               Show this help message\n\n"
            << "Lists: favorites (100, insertion order), history (10, most recent first),\n"
            << "       recent (5, most recent first)\n\n"
            << "Commands:\n"
            << "  list <list>                      Show a list\n"
            << "  add <list> <host:port> [name]    Add or refresh a server\n"
            << "  remove <list> <host:port>        Remove a server\n"
            << "  clear <list>                     Remove every server from a list\n"
            << "  rename <host:port> <name>        Set the name shown for a history entry\n"
            << "  connect <host> <port>            Validate and record a connection attempt\n"
            << "\n"
            << "IPv6 addresses are written in brackets: [2001:db8::1]:7777\n"
            << std::endl;
}

std::string JoinParams(const std::vector<std::string> &params, size_t from) {
  std::string out;
  for (size_t i = from; i < params.size(); ++i) {
    if (!out.empty()) {
      out += ' ';
    }
    out += params[i];
  }
  return out;
}

bool RequireParams(const std::string &command, const std::vector<std::string> &params, size_t min_count) {
  if (params.size() < min_count) {
    std::cerr << "Error: '" << command << "' needs " << min_count << " parameter(s)\n";
    return false;
  }
  return true;
}

store::BoundedRecencyStore *SelectList(store::ServerLists &lists, const std::string &name) {
  auto kind = store::ParseStoreKind(name);
  if (!kind) {
    std::cerr << "Error: unknown list '" << name << "' (expected favorites, history or recent)\n";
    return nullptr;
  }
  return &lists.Get(*kind);
}

bool ParseEndpoint(const std::string &text, std::string &host, uint16_t &port) {
  if (!util::ParseHostPort(text, host, port)) {
    std::cerr << "Error: invalid address '" << text << "' (expected host:port or [IPv6]:port)\n";
    return false;
  }
  return true;
}

int CmdList(store::BoundedRecencyStore &list) {
  auto entries = list.Snapshot();
  std::cout << list.Config().name << " (" << entries.size() << "/" << list.Capacity() << ", "
            << store::OrderPolicyName(list.Policy()) << " order)\n";
  size_t index = 1;
  for (const auto &entry : entries) {
    std::cout << "  " << index++ << ". " << entry.DisplayText();
    if (entry.HasDisplayName()) {
      std::cout << " (" << entry.Address() << ")";
    }
    std::cout << "  last contact: " << (entry.last_contact > 0 ? util::FormatTime(entry.last_contact) : "never")
              << "\n";
  }
  return 0;
}

int CmdRename(store::ServerLists &lists, const std::vector<std::string> &params) {
  std::string host;
  uint16_t port = 0;
  if (!ParseEndpoint(params[0], host, port)) {
    return 1;
  }
  if (!lists.History().UpdateDisplayName(host, port, JoinParams(params, 1))) {
    std::cerr << "Error: " << util::FormatHostPort(host, port) << " is not in history\n";
    return 1;
  }
  std::cout << "Renamed " << util::FormatHostPort(host, port) << std::endl;
  return 0;
}

int RunCommand(store::ServerLists &lists, const std::string &command, const std::vector<std::string> &params) {
  if (command == "list") {
    if (!RequireParams(command, params, 1))
      return 1;
    auto *list = SelectList(lists, params[0]);
    return list ? CmdList(*list) : 1;
  }

  if (command == "add" || command == "remove") {
    if (!RequireParams(command, params, 2))
      return 1;
    auto *list = SelectList(lists, params[0]);
    std::string host;
    uint16_t port = 0;
    if (!list || !ParseEndpoint(params[1], host, port)) {
      return 1;
    }
    if (command == "add") {
      std::string name = JoinParams(params, 2);
      list->Upsert(host, port, name.empty() ? std::nullopt : std::optional<std::string>(name));
      std::cout << "Saved " << util::FormatHostPort(host, port) << " to " << list->Config().name << std::endl;
    } else if (list->Remove(host, port)) {
      std::cout << "Removed " << util::FormatHostPort(host, port) << " from " << list->Config().name << std::endl;
    } else {
      std::cout << util::FormatHostPort(host, port) << " is not in " << list->Config().name << std::endl;
    }
    return list->LastSaveResult() == store::SaveResult::Success ? 0 : 1;
  }

  if (command == "clear") {
    if (!RequireParams(command, params, 1))
      return 1;
    auto *list = SelectList(lists, params[0]);
    if (!list)
      return 1;
    list->Clear();
    std::cout << "Cleared " << list->Config().name << std::endl;
    return list->LastSaveResult() == store::SaveResult::Success ? 0 : 1;
  }

  if (command == "rename") {
    if (!RequireParams(command, params, 2))
      return 1;
    return CmdRename(lists, params);
  }

  if (command == "connect") {
    if (!RequireParams(command, params, 2))
      return 1;
    auto input = app::ConnectController::ValidateConnectInput(params[0], params[1]);
    if (!input.ok) {
      std::cerr << "Error: " << input.message << "\n";
      return 1;
    }
    PrintingConnectionSink sink;
    app::ConnectController controller(lists, sink);
    std::cout << controller.ConnectToInput(params[0], params[1]) << std::endl;
    return 0;
  }

  std::cerr << "Error: unknown command '" << command << "'\n";
  return 1;
}

}  // namespace

int main(int argc, char *argv[]) {
  try {
    if (argc < 2) {
      PrintUsage(argv[0]);
      return 1;
    }

    // Parse options
    app::AppConfig config;
    std::string command;
    std::vector<std::string> params;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      }

      // Options are only recognized before the command; names may start with "--"
      if (command.empty()) {
        std::string error;
        switch (app::ApplyOption(arg, config, error)) {
        case app::OptionResult::Consumed:
          continue;
        case app::OptionResult::Invalid:
          std::cerr << "Error: " << error << "\n";
          return 1;
        case app::OptionResult::NotAnOption:
          command = arg;
          continue;
        }
      }
      params.push_back(arg);
    }

    if (!app::ResolveDefaults(config)) {
      std::cerr << "Error: HOME environment variable not set.\n"
                << "Cannot determine default data directory.\n"
                << "Please set HOME or use --datadir explicitly.\n";
      return 1;
    }

    if (command.empty()) {
      std::cerr << "Error: No command specified\n";
      PrintUsage(argv[0]);
      return 1;
    }

    // The file sink opens its file immediately, so the directory must exist first
    if (config.log_to_file && !util::ensure_directory(config.datadir)) {
      std::cerr << "Warning: cannot create " << config.datadir.string() << ", logging to console only\n";
    }
    util::LogManager::Initialize(config.log_level, config.log_to_file, config.LogFilePath().string());

    int rc = 1;
    {
      store::ServerLists lists(config.datadir);
      if (!lists.Open()) {
        std::cerr << "Error: cannot open data directory " << config.datadir.string()
                  << " (is another instance running?)\n";
      } else {
        rc = RunCommand(lists, command, params);
      }
    }

    util::LogManager::Shutdown();
    return rc;

  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
