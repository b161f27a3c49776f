// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/connect_controller.hpp"

#include "util/endpoint.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"

#include <exception>

namespace serverbook {
namespace app {

namespace {

std::vector<ServerRow> ToRows(const std::vector<store::ServerEntry>& entries) {
  std::vector<ServerRow> rows;
  rows.reserve(entries.size());
  for (const auto& entry : entries) {
    rows.push_back(ServerRow{entry.DisplayText(), entry.host, entry.port});
  }
  return rows;
}

}  // anonymous namespace

ConnectController::ConnectController(store::ServerLists& lists, ConnectionSink& sink) : lists_(lists), sink_(sink) {}

ConnectInput ConnectController::ValidateConnectInput(const std::string& host_text, const std::string& port_text) {
  ConnectInput input;
  input.host = util::TrimWhitespace(host_text);

  if (input.host.empty()) {
    input.message = MSG_HOST_REQUIRED;
    return input;
  }
  if (!util::IsValidHost(input.host)) {
    input.message = MSG_HOST_INVALID;
    return input;
  }

  auto port = util::SafeParsePort(util::TrimWhitespace(port_text));
  if (!port) {
    input.message = MSG_PORT_INVALID;
    return input;
  }

  input.port = *port;
  input.ok = true;
  return input;
}

std::string ConnectController::ConnectToInput(const std::string& host_text, const std::string& port_text) {
  ConnectInput input = ValidateConnectInput(host_text, port_text);
  if (!input.ok) {
    LOG_APP_DEBUG("Rejected connect input '{}' / '{}': {}", host_text, port_text, input.message);
    return input.message;
  }

  lists_.Recent().Upsert(input.host, input.port);
  return StartConnection(input.host, input.port, util::FormatHostPort(input.host, input.port));
}

std::string ConnectController::ConnectToEntry(const store::ServerEntry& entry) {
  // Refreshes the entry's position in the recent list
  lists_.Recent().Upsert(entry.host, entry.port);
  return StartConnection(entry.host, entry.port, entry.DisplayText());
}

std::string ConnectController::ConnectToRow(const ServerRow& row) {
  lists_.Recent().Upsert(row.host, row.port);
  return StartConnection(row.host, row.port, row.label);
}

std::string ConnectController::StartConnection(const std::string& host, uint16_t port, const std::string& label) {
  try {
    sink_.SetTargetServer(host, port);
    sink_.StartConnection();
  } catch (const std::exception& e) {
    LOG_APP_ERROR("Failed to start connection to {}: {}", util::FormatHostPort(host, port), e.what());
    return MSG_CONNECT_ERROR;
  }

  LOG_APP_INFO("Connecting to {}", util::FormatHostPort(host, port));
  return "Connecting to " + label + "...";
}

void ConnectController::OnConnected(const std::string& host, uint16_t port,
                                    const std::optional<std::string>& server_name) {
  if (lists_.History().Upsert(host, port, server_name)) {
    LOG_APP_INFO("Added server to history: {}", util::FormatHostPort(host, port));
  }
}

void ConnectController::OnServerNameKnown(const std::string& host, uint16_t port, const std::string& server_name) {
  if (lists_.History().UpdateDisplayName(host, port, server_name)) {
    LOG_APP_DEBUG("Updated server name in history: {} ({})", server_name, util::FormatHostPort(host, port));
  }
  // Favorites show the same server under its real name once it is known
  if (!server_name.empty() && lists_.Favorites().Contains(host, port)) {
    lists_.Favorites().UpdateDisplayName(host, port, server_name);
  }
}

bool ConnectController::AddFavorite(const std::string& host, uint16_t port, const std::optional<std::string>& name) {
  return lists_.Favorites().Upsert(host, port, name);
}

bool ConnectController::RemoveFavorite(const std::string& host, uint16_t port) {
  return lists_.Favorites().Remove(host, port);
}

bool ConnectController::IsFavorite(const std::string& host, uint16_t port) const {
  return lists_.Favorites().Contains(host, port);
}

void ConnectController::ClearHistory() {
  lists_.History().Clear();
}

void ConnectController::ClearRecent() {
  lists_.Recent().Clear();
}

std::vector<ServerRow> ConnectController::RecentRows() const {
  return ToRows(lists_.Recent().Snapshot());
}

std::vector<ServerRow> ConnectController::HistoryRows() const {
  return ToRows(lists_.History().Snapshot());
}

std::vector<ServerRow> ConnectController::FavoriteRows() const {
  return ToRows(lists_.Favorites().Snapshot());
}

}  // namespace app
}  // namespace serverbook
