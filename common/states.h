// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include <iostream>

#include "proto/server.pb.h"

namespace warden {

enum class ServerState {
  kStopped,
  kStarting,
  kRunning,
  kStopping,
  kCrashed,
};

inline const char *ServerStateName(ServerState s) {
  switch (s) {
  case ServerState::kStopped:
    return "stopped";
  case ServerState::kStarting:
    return "starting";
  case ServerState::kRunning:
    return "running";
  case ServerState::kStopping:
    return "stopping";
  case ServerState::kCrashed:
    return "crashed";
  }
  return "unknown";
}

// True if there is (or might be) an OS process attached.
inline bool HasProcess(ServerState s) {
  return s == ServerState::kStarting || s == ServerState::kRunning ||
         s == ServerState::kStopping;
}

inline proto::ServerState ServerStateToProto(ServerState s) {
  switch (s) {
  case ServerState::kStopped:
    return proto::STOPPED;
  case ServerState::kStarting:
    return proto::STARTING;
  case ServerState::kRunning:
    return proto::RUNNING;
  case ServerState::kStopping:
    return proto::STOPPING;
  case ServerState::kCrashed:
    return proto::CRASHED;
  }
  return proto::STOPPED;
}

inline ServerState ServerStateFromProto(proto::ServerState s) {
  switch (s) {
  case proto::STARTING:
    return ServerState::kStarting;
  case proto::RUNNING:
    return ServerState::kRunning;
  case proto::STOPPING:
    return ServerState::kStopping;
  case proto::CRASHED:
    return ServerState::kCrashed;
  default:
    return ServerState::kStopped;
  }
}

inline std::ostream &operator<<(std::ostream &os, ServerState s) {
  os << ServerStateName(s);
  return os;
}

} // namespace warden
