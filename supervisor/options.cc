// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "supervisor/options.h"
#include "absl/strings/str_format.h"
#include "toolbelt/fd.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/text_format.h>

namespace warden {

absl::Status SupervisorOptions::FromProto(const proto::SupervisorConfig &config) {
  if (config.has_servers_root()) {
    servers_root = config.servers_root();
  }
  if (config.has_startup_timeout_secs()) {
    startup_timeout_secs = config.startup_timeout_secs();
  }
  if (config.has_stop_timeout_secs()) {
    stop_timeout_secs = config.stop_timeout_secs();
  }
  if (config.has_kill_grace_secs()) {
    kill_grace_secs = config.kill_grace_secs();
  }
  if (config.has_log_buffer_lines()) {
    if (config.log_buffer_lines() <= 0) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Invalid log buffer size %d", config.log_buffer_lines()));
    }
    log_buffer_lines = config.log_buffer_lines();
  }
  if (config.has_event_queue_capacity()) {
    if (config.event_queue_capacity() <= 0) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Invalid event queue capacity %d", config.event_queue_capacity()));
    }
    event_queue_capacity = config.event_queue_capacity();
  }
  if (config.has_sample_interval_secs()) {
    sample_interval_secs = config.sample_interval_secs();
  }
  if (config.has_accept_eula()) {
    accept_eula = config.accept_eula();
  }

  if (config.has_restart()) {
    const proto::RestartPolicy &r = config.restart();
    if (r.has_max_attempts()) {
      restart.max_attempts = r.max_attempts();
    }
    if (r.has_base_delay_secs()) {
      restart.base_delay_ms = r.base_delay_secs() * 1000;
    }
    if (r.has_max_delay_secs()) {
      restart.max_delay_ms = r.max_delay_secs() * 1000;
    }
    if (r.has_crash_reset_secs()) {
      restart.crash_reset_secs = r.crash_reset_secs();
    }
  }

  for (auto &rule : config.readiness()) {
    if (rule.kind() == proto::KIND_UNKNOWN) {
      return absl::InvalidArgumentError("Readiness rule has no server kind");
    }
    auto &patterns = readiness[ServerKindFromProto(rule.kind())];
    patterns.assign(rule.pattern().begin(), rule.pattern().end());
  }
  for (auto &cmd : config.stop_command()) {
    if (cmd.kind() == proto::KIND_UNKNOWN || cmd.command().empty()) {
      return absl::InvalidArgumentError(
          "Stop command needs a server kind and a command");
    }
    stop_commands[ServerKindFromProto(cmd.kind())] = cmd.command();
  }
  if (config.default_jvm_flag_size() > 0) {
    jvm_flags.assign(config.default_jvm_flag().begin(),
                     config.default_jvm_flag().end());
  }
  return absl::OkStatus();
}

std::vector<std::string>
SupervisorOptions::ReadinessPatterns(ServerKind kind) const {
  auto it = readiness.find(kind);
  if (it != readiness.end()) {
    return it->second;
  }
  return DefaultReadinessPatterns(kind);
}

std::string SupervisorOptions::StopCommand(ServerKind kind) const {
  auto it = stop_commands.find(kind);
  if (it != stop_commands.end()) {
    return it->second;
  }
  return DefaultStopCommand(kind);
}

absl::StatusOr<proto::SupervisorConfig>
LoadSupervisorConfig(const std::string &filename) {
  toolbelt::FileDescriptor fd(open(filename.c_str(), O_RDONLY));
  if (!fd.Valid()) {
    return absl::InternalError(absl::StrFormat(
        "Failed to open config file %s: %s", filename, strerror(errno)));
  }

  google::protobuf::io::FileInputStream in(fd.Fd());
  proto::SupervisorConfig config;
  if (!google::protobuf::TextFormat::Parse(&in, &config)) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Failed to parse config from %s", filename));
  }
  return config;
}

} // namespace warden
