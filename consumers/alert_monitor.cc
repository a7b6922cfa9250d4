// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "consumers/alert_monitor.h"
#include "absl/strings/str_format.h"
#include "supervisor/supervisor.h"
#include "toolbelt/clock.h"

#include <algorithm>

namespace warden {

namespace {
constexpr uint64_t kNanosPerSecond = 1000000000ULL;
constexpr double kBytesPerMb = 1024.0 * 1024.0;
} // namespace

void AlertThresholds::FromProto(const proto::AlertThresholds &src) {
  enabled = src.enabled();
  if (src.has_cpu_warning()) {
    cpu_warning = src.cpu_warning();
  }
  if (src.has_cpu_critical()) {
    cpu_critical = src.cpu_critical();
  }
  if (src.has_memory_warning_mb()) {
    memory_warning_mb = src.memory_warning_mb();
  }
  if (src.has_memory_critical_mb()) {
    memory_critical_mb = src.memory_critical_mb();
  }
  if (src.has_tps_warning()) {
    tps_warning = src.tps_warning();
  }
  if (src.has_tps_critical()) {
    tps_critical = src.tps_critical();
  }
  if (src.has_cooldown_secs()) {
    cooldown_secs = src.cooldown_secs();
  }
}

void AlertMonitor::AttachEvaluator(Supervisor &supervisor, int interval_secs) {
  if (!thresholds_.enabled || interval_secs <= 0) {
    return;
  }
  supervisor.AddCoroutine(std::make_unique<co::Coroutine>(
      supervisor.Scheduler(),
      [this, &supervisor, interval_secs](co::Coroutine *c) {
        for (;;) {
          c->Sleep(interval_secs);
          if (subscription_ == nullptr || subscription_->IsClosed()) {
            return;
          }
          Evaluate(supervisor.AllStatusSnapshots(), toolbelt::Now());
        }
      },
      "alert_monitor.evaluator"));
}

std::string AlertMonitor::ServerName(const std::string &server_id) const {
  auto it = server_names_.find(server_id);
  if (it == server_names_.end()) {
    return server_id;
  }
  return it->second;
}

void AlertMonitor::Evaluate(const std::vector<ServerStatusSnapshot> &snapshots,
                            uint64_t now) {
  if (!thresholds_.enabled) {
    return;
  }
  for (auto &s : snapshots) {
    server_names_[s.id] = s.name;
    if (!HasProcess(s.state)) {
      Clear(s.id, Alarm::Type::kCpu, now);
      Clear(s.id, Alarm::Type::kMemory, now);
      Clear(s.id, Alarm::Type::kTps, now);
      continue;
    }
    Check(s, Alarm::Type::kCpu, s.cpu_percent, now);
    Check(s, Alarm::Type::kMemory, s.resident_bytes / kBytesPerMb, now);
    // TPS is only meaningful once the server is up and has reported it.
    if (s.state == ServerState::kRunning && s.tps > 0) {
      Check(s, Alarm::Type::kTps, s.tps, now);
    } else {
      Clear(s.id, Alarm::Type::kTps, now);
    }
  }
}

void AlertMonitor::Check(const ServerStatusSnapshot &s, Alarm::Type type,
                         double value, uint64_t now) {
  Alarm::Severity severity = Alarm::Severity::kUnknown;
  double threshold = 0;
  const char *what = "";
  switch (type) {
  case Alarm::Type::kCpu:
    what = "CPU usage";
    if (value >= thresholds_.cpu_critical) {
      severity = Alarm::Severity::kCritical;
      threshold = thresholds_.cpu_critical;
    } else if (value >= thresholds_.cpu_warning) {
      severity = Alarm::Severity::kWarning;
      threshold = thresholds_.cpu_warning;
    }
    break;
  case Alarm::Type::kMemory:
    what = "Memory usage";
    if (thresholds_.memory_critical_mb > 0 &&
        value >= thresholds_.memory_critical_mb) {
      severity = Alarm::Severity::kCritical;
      threshold = thresholds_.memory_critical_mb;
    } else if (thresholds_.memory_warning_mb > 0 &&
               value >= thresholds_.memory_warning_mb) {
      severity = Alarm::Severity::kWarning;
      threshold = thresholds_.memory_warning_mb;
    }
    break;
  case Alarm::Type::kTps:
    // Lower is worse.
    what = "TPS";
    if (value <= thresholds_.tps_critical) {
      severity = Alarm::Severity::kCritical;
      threshold = thresholds_.tps_critical;
    } else if (value <= thresholds_.tps_warning) {
      severity = Alarm::Severity::kWarning;
      threshold = thresholds_.tps_warning;
    }
    break;
  default:
    return;
  }
  if (severity == Alarm::Severity::kUnknown) {
    Clear(s.id, type, now);
    return;
  }
  Raise(Alarm{.server_id = s.id,
              .server_name = s.name,
              .type = type,
              .severity = severity,
              .value = value,
              .threshold = threshold,
              .details = absl::StrFormat("%s is %.1f (threshold %.1f)", what,
                                         value, threshold)},
        now);
}

void AlertMonitor::Raise(Alarm alarm, uint64_t now) {
  Key key{alarm.server_id, alarm.type};
  bool escalation = false;
  // A severity change on an alarm observers already know about.
  bool announced = false;
  if (auto it = active_.find(key); it != active_.end()) {
    if (it->second.severity == alarm.severity) {
      // Already raised at this level, just track the value.
      it->second.value = alarm.value;
      return;
    }
    escalation = alarm.severity == Alarm::Severity::kCritical;
    announced = !suppressed_.contains(key);
  }
  alarm.id = absl::StrFormat("%s/%s", alarm.server_id, TypeName(alarm.type));
  alarm.status = Alarm::Status::kRaised;
  alarm.timestamp = now;
  active_[key] = alarm;

  // Crash alarms and escalations bypass the cooldown.  So does a change to
  // an alarm that was already notified.
  if (alarm.type != Alarm::Type::kCrash && !escalation && !announced) {
    if (auto it = last_raised_.find(key); it != last_raised_.end() &&
        now - it->second <
            static_cast<uint64_t>(thresholds_.cooldown_secs) * kNanosPerSecond) {
      suppressed_.insert(key);
      return;
    }
  }
  suppressed_.erase(key);
  last_raised_[key] = now;
  Notify(alarm);
}

void AlertMonitor::Clear(const std::string &server_id, Alarm::Type type,
                         uint64_t now) {
  auto it = active_.find(Key{server_id, type});
  if (it == active_.end()) {
    return;
  }
  Alarm alarm = std::move(it->second);
  active_.erase(it);
  if (suppressed_.erase(Key{server_id, type}) > 0) {
    // Nobody was told about it.
    return;
  }
  alarm.status = Alarm::Status::kCleared;
  alarm.timestamp = now;
  Notify(alarm);
}

void AlertMonitor::Notify(const Alarm &alarm) {
  toolbelt::LogLevel level = toolbelt::LogLevel::kInfo;
  if (alarm.status == Alarm::Status::kRaised) {
    level = alarm.severity == Alarm::Severity::kCritical
                ? toolbelt::LogLevel::kError
                : toolbelt::LogLevel::kWarning;
  }
  logger_.Log(level, "Alarm %s %s: %s %s: %s", alarm.id.c_str(),
              StatusName(alarm.status), alarm.server_name.c_str(),
              SeverityName(alarm.severity), alarm.details.c_str());
  if (notifier_ != nullptr) {
    notifier_(alarm);
  }
}

void AlertMonitor::HandleEvent(const ServerEvent &event) {
  if (!thresholds_.enabled) {
    return;
  }
  switch (event.type) {
  case EventType::kCrashed: {
    const Crash &crash = std::get<Crash>(event.event);
    Raise(Alarm{.server_id = event.server_id,
                .server_name = ServerName(event.server_id),
                .type = Alarm::Type::kCrash,
                .severity = Alarm::Severity::kCritical,
                .details = crash.reason},
          event.timestamp);
    break;
  }
  case EventType::kStatusChanged:
    if (std::get<StatusChange>(event.event).new_state ==
        ServerState::kRunning) {
      Clear(event.server_id, Alarm::Type::kCrash, event.timestamp);
    }
    break;
  default:
    break;
  }
}

std::vector<Alarm> AlertMonitor::ActiveAlarms() const {
  std::vector<Alarm> result;
  for (auto & [ key, alarm ] : active_) {
    result.push_back(alarm);
  }
  std::sort(result.begin(), result.end(),
            [](const Alarm &a, const Alarm &b) { return a.id < b.id; });
  return result;
}

} // namespace warden
