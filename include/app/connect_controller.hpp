// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 ConnectController - the logic behind the connect dialog and server lists UI

 Purpose
 - Validate the host/port text a player typed
 - Record every connection attempt in the recent-servers list and every
   successful connection in the history list
 - Hand the target to the host's ConnectionSink
 - Turn store snapshots into rows the UI can render

 Widgets stay in the host; this class never touches them. Status strings
 returned here are what the dialog shows in its status line.
*/

#include "app/connection_sink.hpp"
#include "store/server_entry.hpp"
#include "store/server_lists.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace serverbook {
namespace app {

// Result of validating the connect dialog fields
struct ConnectInput {
  bool ok{false};
  std::string host;   // trimmed
  uint16_t port{0};
  std::string message;  // user-facing error when !ok
};

// One clickable row in a server list
struct ServerRow {
  std::string label;  // ServerEntry::DisplayText()
  std::string host;
  uint16_t port{0};
};

class ConnectController {
public:
  static constexpr const char* MSG_HOST_REQUIRED = "IP address is required.";
  static constexpr const char* MSG_HOST_INVALID = "Invalid server address.";
  static constexpr const char* MSG_PORT_INVALID = "Invalid port. Enter a number between 1 and 65535.";
  static constexpr const char* MSG_CONNECT_ERROR = "Error initiating connection.";

  ConnectController(store::ServerLists& lists, ConnectionSink& sink);

  static ConnectInput ValidateConnectInput(const std::string& host_text, const std::string& port_text);

  // Connect button: validate, remember in recent servers, start connecting.
  // Returns the status line.
  std::string ConnectToInput(const std::string& host_text, const std::string& port_text);

  // Click on a recent/history/favorite row
  std::string ConnectToEntry(const store::ServerEntry& entry);
  std::string ConnectToRow(const ServerRow& row);

  // Connection manager callbacks
  void OnConnected(const std::string& host, uint16_t port,
                   const std::optional<std::string>& server_name = std::nullopt);
  void OnServerNameKnown(const std::string& host, uint16_t port, const std::string& server_name);

  bool AddFavorite(const std::string& host, uint16_t port, const std::optional<std::string>& name = std::nullopt);
  bool RemoveFavorite(const std::string& host, uint16_t port);
  bool IsFavorite(const std::string& host, uint16_t port) const;
  void ClearHistory();
  void ClearRecent();

  std::vector<ServerRow> RecentRows() const;
  std::vector<ServerRow> HistoryRows() const;
  std::vector<ServerRow> FavoriteRows() const;

private:
  std::string StartConnection(const std::string& host, uint16_t port, const std::string& label);

  store::ServerLists& lists_;
  ConnectionSink& sink_;
};

}  // namespace app
}  // namespace serverbook
