// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "common/states.h"
#include "proto/server.pb.h"

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace warden {

enum class ServerKind {
  kVanilla,
  kPaper,
  kSpigot,
  kForge,
  kFabric,
  kPurpur,
  kSponge,
  kBungeeCord,
  kWaterfall,
  kVelocity,
};

const char *ServerKindName(ServerKind kind);
absl::StatusOr<ServerKind> ParseServerKind(const std::string &name);

proto::ServerKind ServerKindToProto(ServerKind kind);
ServerKind ServerKindFromProto(proto::ServerKind kind);

// Proxies forward players to backend servers.  They don't take the
// "nogui" argument and don't have an EULA file.
inline bool IsProxy(ServerKind kind) {
  return kind == ServerKind::kBungeeCord || kind == ServerKind::kWaterfall ||
         kind == ServerKind::kVelocity;
}

// Console command that asks the server to shut down cleanly.
const char *DefaultStopCommand(ServerKind kind);

// Regular expressions for the line a server prints when it is ready.
std::vector<std::string> DefaultReadinessPatterns(ServerKind kind);

// G1 tuning flags added to every launch unless configured otherwise.
const std::vector<std::string> &DefaultJvmFlags();

constexpr int kDefaultPort = 25565;
constexpr int kDefaultMaxPlayers = 20;
constexpr int kDefaultMinRamMb = 1024;
constexpr int kDefaultMaxRamMb = 2048;

struct ServerDefinition {
  std::string id;
  std::string name;
  ServerKind kind = ServerKind::kVanilla;
  std::string version;
  std::string directory;
  std::string jar_file = "server.jar";
  std::string java_path = "java";
  int min_ram_mb = kDefaultMinRamMb;
  int max_ram_mb = kDefaultMaxRamMb;
  std::string jvm_flags; // Whitespace separated.
  int port = kDefaultPort;
  bool auto_start = false;
  bool auto_restart = true;
  int max_players = kDefaultMaxPlayers;

  // Last known runtime state.
  ServerState status = ServerState::kStopped;
  int pid = 0;

  uint64_t created_at = 0; // Nanoseconds since epoch.
  uint64_t updated_at = 0;

  // Checks the fields that a caller supplies.  The id and directory may be
  // empty since they are assigned on creation.
  absl::Status Validate() const;

  void ToProto(proto::ServerDefinition *dest) const;
  void FromProto(const proto::ServerDefinition &src);
};

std::ostream &operator<<(std::ostream &os, const ServerDefinition &def);

// The command line used to run a server.
struct LaunchCommand {
  std::string executable;
  std::vector<std::string> args;

  std::string ToString() const;
};

// Arguments are the heap sizes, the server's own flags, the default flags
// and then the jar.  Game servers also get "nogui".
LaunchCommand BuildLaunchCommand(const ServerDefinition &def,
                                 const std::vector<std::string> &default_flags);

} // namespace warden
