// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "consumers/status_reporter.h"
#include "common/text_proto.h"
#include "toolbelt/clock.h"

namespace warden {

void StatusReporter::Attach(Supervisor &supervisor, int interval_secs) {
  if (interval_secs <= 0) {
    interval_secs = 5;
  }
  supervisor.AddCoroutine(std::make_unique<co::Coroutine>(
      supervisor.Scheduler(),
      [this, &supervisor, interval_secs](co::Coroutine *c) {
        for (;;) {
          c->Sleep(interval_secs);
          if (supervisor.IsShuttingDown()) {
            return;
          }
          if (absl::Status status =
                  Write(supervisor.AllStatusSnapshots(), toolbelt::Now());
              !status.ok()) {
            logger_.Log(toolbelt::LogLevel::kError,
                        "Failed to write status report: %s",
                        status.ToString().c_str());
          }
        }
      },
      "status_reporter"));
}

proto::StatusReport
StatusReporter::BuildReport(const std::vector<ServerStatusSnapshot> &snapshots,
                            uint64_t now) const {
  proto::StatusReport report;
  report.set_timestamp(now);
  for (auto &s : snapshots) {
    s.ToProto(report.add_servers());
  }
  if (alerts_ != nullptr) {
    for (auto &alarm : alerts_->ActiveAlarms()) {
      alarm.ToProto(report.add_alarms());
    }
  }
  return report;
}

absl::Status
StatusReporter::Write(const std::vector<ServerStatusSnapshot> &snapshots,
                      uint64_t now) {
  if (absl::Status status =
          WriteTextProtoFile(filename_, BuildReport(snapshots, now));
      !status.ok()) {
    return status;
  }
  num_written_++;
  return absl::OkStatus();
}

} // namespace warden
