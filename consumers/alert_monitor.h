// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "common/alarm.h"
#include "common/server_status.h"
#include "consumers/consumer.h"
#include "proto/config.pb.h"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace warden {

// Zero for a memory threshold disables it.
struct AlertThresholds {
  bool enabled = true;
  double cpu_warning = 80;
  double cpu_critical = 95;
  double memory_warning_mb = 0;
  double memory_critical_mb = 0;
  double tps_warning = 15;
  double tps_critical = 10;
  int cooldown_secs = 300;

  void FromProto(const proto::AlertThresholds &src);
};

// Raises and clears alarms based on resource usage and crashes.
class AlertMonitor : public Consumer {
public:
  using Notifier = std::function<void(const Alarm &)>;

  AlertMonitor(toolbelt::Logger &logger, AlertThresholds thresholds,
               Notifier notifier = nullptr)
      : Consumer("alert_monitor", kStatusEvents | kCrashEvents, logger),
        thresholds_(thresholds), notifier_(std::move(notifier)) {}

  // Evaluate the supervisor's status snapshots every interval.  Stops when
  // the event subscription is closed.  Call after Attach.
  void AttachEvaluator(Supervisor &supervisor, int interval_secs);

  // Check the snapshots against the thresholds.  Times are in nanoseconds.
  void Evaluate(const std::vector<ServerStatusSnapshot> &snapshots,
                uint64_t now);

  void HandleEvent(const ServerEvent &event) override;

  // Currently raised alarms, ordered by id.
  std::vector<Alarm> ActiveAlarms() const;

  const AlertThresholds &Thresholds() const { return thresholds_; }

private:
  using Key = std::pair<std::string, Alarm::Type>;

  void Check(const ServerStatusSnapshot &s, Alarm::Type type, double value,
             uint64_t now);
  void Raise(Alarm alarm, uint64_t now);
  void Clear(const std::string &server_id, Alarm::Type type, uint64_t now);
  void Notify(const Alarm &alarm);
  std::string ServerName(const std::string &server_id) const;

  AlertThresholds thresholds_;
  Notifier notifier_;
  absl::flat_hash_map<Key, Alarm> active_;
  // When a notification was last sent for a server and metric.
  absl::flat_hash_map<Key, uint64_t> last_raised_;
  // Raised within the cooldown so never notified.
  absl::flat_hash_set<Key> suppressed_;
  absl::flat_hash_map<std::string, std::string> server_names_;
};

} // namespace warden
