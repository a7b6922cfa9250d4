// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "common/states.h"
#include <cstdint>
#include <string>
#include <vector>

#include "proto/server.pb.h"

namespace warden {

// Point in time view of a managed server.
struct ServerStatusSnapshot {
  std::string id;
  std::string name;
  ServerState state = ServerState::kStopped;
  int pid = 0; // 0 if there is no process.
  int64_t uptime_secs = 0;
  int player_count = 0;
  std::vector<std::string> players;
  double cpu_percent = 0;
  uint64_t resident_bytes = 0;
  double tps = 0; // 0 if never reported.

  void ToProto(proto::ServerStatus *dest) const;
};

} // namespace warden
