// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "common/event_bus.h"
#include "common/log_buffer.h"
#include "common/server_definition.h"
#include "proto/config.pb.h"

#include <algorithm>
#include <string>
#include <vector>

namespace warden {

// Auto-restart policy after a crash.  The delay before restart n is
// min(base * n, max).
struct RestartPolicy {
  int max_attempts = 5;
  int base_delay_ms = 5000;
  int max_delay_ms = 30000;
  // A process that ran at least this long resets the crash count.
  int crash_reset_secs = 600;

  int DelayMs(int crashes) const {
    return std::min(base_delay_ms * std::max(crashes, 1), max_delay_ms);
  }
};

struct SupervisorOptions {
  std::string servers_root = "servers";
  int startup_timeout_secs = 300;
  int stop_timeout_secs = 30;
  int kill_grace_secs = 10;
  // Pause between the stop and start of a restart.
  int restart_pause_ms = 2000;
  size_t log_buffer_lines = LogBuffer::kDefaultCapacity;
  size_t event_queue_capacity = kDefaultEventQueueCapacity;
  int sample_interval_secs = 5;
  bool accept_eula = true;
  RestartPolicy restart;
  std::vector<std::string> jvm_flags = DefaultJvmFlags();

  // Per-kind overrides.
  absl::flat_hash_map<ServerKind, std::vector<std::string>> readiness;
  absl::flat_hash_map<ServerKind, std::string> stop_commands;

  // Fields not set in the config keep their defaults.
  absl::Status FromProto(const proto::SupervisorConfig &config);

  std::vector<std::string> ReadinessPatterns(ServerKind kind) const;
  std::string StopCommand(ServerKind kind) const;
};

// Parses a SupervisorConfig from a text format protobuf file.
absl::StatusOr<proto::SupervisorConfig>
LoadSupervisorConfig(const std::string &filename);

} // namespace warden
