// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "common/server_definition.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"

namespace warden {

const char *ServerKindName(ServerKind kind) {
  switch (kind) {
  case ServerKind::kVanilla:
    return "vanilla";
  case ServerKind::kPaper:
    return "paper";
  case ServerKind::kSpigot:
    return "spigot";
  case ServerKind::kForge:
    return "forge";
  case ServerKind::kFabric:
    return "fabric";
  case ServerKind::kPurpur:
    return "purpur";
  case ServerKind::kSponge:
    return "sponge";
  case ServerKind::kBungeeCord:
    return "bungeecord";
  case ServerKind::kWaterfall:
    return "waterfall";
  case ServerKind::kVelocity:
    return "velocity";
  }
  return "unknown";
}

absl::StatusOr<ServerKind> ParseServerKind(const std::string &name) {
  static constexpr ServerKind kAllKinds[] = {
      ServerKind::kVanilla,    ServerKind::kPaper,     ServerKind::kSpigot,
      ServerKind::kForge,      ServerKind::kFabric,    ServerKind::kPurpur,
      ServerKind::kSponge,     ServerKind::kBungeeCord, ServerKind::kWaterfall,
      ServerKind::kVelocity,
  };
  std::string lower = absl::AsciiStrToLower(name);
  for (ServerKind kind : kAllKinds) {
    if (lower == ServerKindName(kind)) {
      return kind;
    }
  }
  return absl::InvalidArgumentError(
      absl::StrFormat("Unknown server kind %s", name));
}

proto::ServerKind ServerKindToProto(ServerKind kind) {
  switch (kind) {
  case ServerKind::kVanilla:
    return proto::VANILLA;
  case ServerKind::kPaper:
    return proto::PAPER;
  case ServerKind::kSpigot:
    return proto::SPIGOT;
  case ServerKind::kForge:
    return proto::FORGE;
  case ServerKind::kFabric:
    return proto::FABRIC;
  case ServerKind::kPurpur:
    return proto::PURPUR;
  case ServerKind::kSponge:
    return proto::SPONGE;
  case ServerKind::kBungeeCord:
    return proto::BUNGEECORD;
  case ServerKind::kWaterfall:
    return proto::WATERFALL;
  case ServerKind::kVelocity:
    return proto::VELOCITY;
  }
  return proto::KIND_UNKNOWN;
}

ServerKind ServerKindFromProto(proto::ServerKind kind) {
  switch (kind) {
  case proto::PAPER:
    return ServerKind::kPaper;
  case proto::SPIGOT:
    return ServerKind::kSpigot;
  case proto::FORGE:
    return ServerKind::kForge;
  case proto::FABRIC:
    return ServerKind::kFabric;
  case proto::PURPUR:
    return ServerKind::kPurpur;
  case proto::SPONGE:
    return ServerKind::kSponge;
  case proto::BUNGEECORD:
    return ServerKind::kBungeeCord;
  case proto::WATERFALL:
    return ServerKind::kWaterfall;
  case proto::VELOCITY:
    return ServerKind::kVelocity;
  default:
    return ServerKind::kVanilla;
  }
}

const char *DefaultStopCommand(ServerKind kind) {
  switch (kind) {
  case ServerKind::kBungeeCord:
  case ServerKind::kWaterfall:
    return "end";
  case ServerKind::kVelocity:
    return "shutdown";
  default:
    return "stop";
  }
}

std::vector<std::string> DefaultReadinessPatterns(ServerKind kind) {
  switch (kind) {
  case ServerKind::kBungeeCord:
  case ServerKind::kWaterfall:
    return {R"(Listening on /)"};
  default:
    return {R"(Done \([0-9.,]+s\)!)"};
  }
}

const std::vector<std::string> &DefaultJvmFlags() {
  static const std::vector<std::string> flags = {
      "-XX:+UseG1GC",
      "-XX:+ParallelRefProcEnabled",
      "-XX:MaxGCPauseMillis=200",
      "-XX:+UnlockExperimentalVMOptions",
      "-XX:+DisableExplicitGC",
      "-XX:+AlwaysPreTouch",
      "-XX:G1NewSizePercent=30",
      "-XX:G1MaxNewSizePercent=40",
      "-XX:G1HeapRegionSize=8M",
      "-XX:G1ReservePercent=20",
      "-XX:G1HeapWastePercent=5",
      "-XX:G1MixedGCCountTarget=4",
      "-XX:InitiatingHeapOccupancyPercent=15",
      "-XX:G1MixedGCLiveThresholdPercent=90",
      "-XX:G1RSetUpdatingPauseTimePercent=5",
      "-XX:SurvivorRatio=32",
      "-XX:+PerfDisableSharedMem",
      "-XX:MaxTenuringThreshold=1",
  };
  return flags;
}

absl::Status ServerDefinition::Validate() const {
  if (name.empty()) {
    return absl::InvalidArgumentError("Server name cannot be empty");
  }
  if (jar_file.empty()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Server %s has no jar file", name));
  }
  if (java_path.empty()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Server %s has no java path", name));
  }
  if (min_ram_mb <= 0 || max_ram_mb <= 0) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Server %s: heap sizes must be positive (min %d, max %d)", name,
        min_ram_mb, max_ram_mb));
  }
  if (min_ram_mb > max_ram_mb) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Server %s: minimum heap %dM is larger than maximum %dM", name,
        min_ram_mb, max_ram_mb));
  }
  if (port < 0 || port > 65535) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Server %s: invalid port %d", name, port));
  }
  if (max_players < 0) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Server %s: invalid max players %d", name, max_players));
  }
  return absl::OkStatus();
}

void ServerDefinition::ToProto(proto::ServerDefinition *dest) const {
  dest->set_id(id);
  dest->set_name(name);
  dest->set_kind(ServerKindToProto(kind));
  dest->set_version(version);
  dest->set_directory(directory);
  dest->set_jar_file(jar_file);
  dest->set_java_path(java_path);
  dest->set_min_ram_mb(min_ram_mb);
  dest->set_max_ram_mb(max_ram_mb);
  dest->set_jvm_flags(jvm_flags);
  dest->set_port(port);
  dest->set_auto_start(auto_start);
  dest->set_auto_restart(auto_restart);
  dest->set_max_players(max_players);
  dest->set_status(ServerStateToProto(status));
  dest->set_pid(pid);
  dest->set_created_at(created_at);
  dest->set_updated_at(updated_at);
}

void ServerDefinition::FromProto(const proto::ServerDefinition &src) {
  id = src.id();
  name = src.name();
  kind = ServerKindFromProto(src.kind());
  version = src.version();
  directory = src.directory();
  jar_file = src.jar_file();
  java_path = src.java_path();
  min_ram_mb = src.min_ram_mb();
  max_ram_mb = src.max_ram_mb();
  jvm_flags = src.jvm_flags();
  port = src.port();
  auto_start = src.auto_start();
  auto_restart = src.auto_restart();
  max_players = src.max_players();
  status = ServerStateFromProto(src.status());
  pid = src.pid();
  created_at = src.created_at();
  updated_at = src.updated_at();
}

std::ostream &operator<<(std::ostream &os, const ServerDefinition &def) {
  os << "id: " << def.id << " name: " << def.name
     << " kind: " << ServerKindName(def.kind) << " version: " << def.version
     << " directory: " << def.directory << " jar: " << def.jar_file
     << " status: " << def.status;
  return os;
}

std::string LaunchCommand::ToString() const {
  if (args.empty()) {
    return executable;
  }
  return absl::StrFormat("%s %s", executable, absl::StrJoin(args, " "));
}

LaunchCommand BuildLaunchCommand(const ServerDefinition &def,
                                 const std::vector<std::string> &default_flags) {
  LaunchCommand cmd;
  cmd.executable = def.java_path;
  cmd.args.push_back(absl::StrFormat("-Xms%dM", def.min_ram_mb));
  cmd.args.push_back(absl::StrFormat("-Xmx%dM", def.max_ram_mb));

  for (absl::string_view flag :
       absl::StrSplit(def.jvm_flags, absl::ByAnyChar(" \t\n"),
                      absl::SkipEmpty())) {
    cmd.args.emplace_back(flag);
  }
  for (auto &flag : default_flags) {
    cmd.args.push_back(flag);
  }

  cmd.args.push_back("-jar");
  cmd.args.push_back(def.jar_file);
  if (!IsProxy(def.kind)) {
    cmd.args.push_back("nogui");
  }
  return cmd;
}

} // namespace warden
