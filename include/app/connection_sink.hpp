// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 ConnectionSink - abstract interface to the host's connection manager

 Establishing the connection is the host's business; the connect controller
 only names the target and asks for the connection to start. Implementations
 may throw std::exception on failure.
*/

#include <cstdint>
#include <string>

namespace serverbook {
namespace app {

class ConnectionSink {
public:
  virtual ~ConnectionSink() = default;

  virtual void SetTargetServer(const std::string& host, uint16_t port) = 0;

  virtual void StartConnection() = 0;
};

}  // namespace app
}  // namespace serverbook
