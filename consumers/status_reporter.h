// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/status/status.h"
#include "common/server_status.h"
#include "consumers/alert_monitor.h"
#include "proto/report.pb.h"
#include "supervisor/supervisor.h"
#include "toolbelt/logging.h"

#include <string>
#include <utility>
#include <vector>

namespace warden {

// Periodically writes the status of every server and the active alarms to
// a text format file for outside monitoring.
class StatusReporter {
public:
  // alerts may be null, in which case no alarms are reported.
  StatusReporter(toolbelt::Logger &logger, std::string filename,
                 const AlertMonitor *alerts = nullptr)
      : logger_(logger), filename_(std::move(filename)), alerts_(alerts) {}

  // Write a report every interval until the supervisor shuts down.
  void Attach(Supervisor &supervisor, int interval_secs);

  proto::StatusReport
  BuildReport(const std::vector<ServerStatusSnapshot> &snapshots,
              uint64_t now) const;

  absl::Status Write(const std::vector<ServerStatusSnapshot> &snapshots,
                     uint64_t now);

  int NumWritten() const { return num_written_; }

private:
  toolbelt::Logger &logger_;
  std::string filename_;
  const AlertMonitor *alerts_;
  int num_written_ = 0;
};

} // namespace warden
