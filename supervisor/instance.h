// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "common/event.h"
#include "common/log_buffer.h"
#include "common/server_definition.h"
#include "common/server_status.h"
#include "common/states.h"
#include "supervisor/child_process.h"
#include "supervisor/classifier.h"
#include "toolbelt/triggerfd.h"

#include <memory>
#include <string>
#include <vector>

#include "coroutine.h"

namespace warden {

class Supervisor;

struct PlayerInfo {
  std::string uuid; // Empty if the server never told us.
  uint64_t joined_at;
};

// A managed server.  This owns at most one OS process at a time and
// moves through the states:
//
//   stopped -> starting -> running -> stopping -> stopped
//
// with crashed reachable from starting and running when the process dies
// unexpectedly.  Start, Stop, Restart and Kill are serialized by an
// operation lock.  Callers waiting for the lock yield to other
// coroutines.
class Instance : public std::enable_shared_from_this<Instance> {
public:
  Instance(Supervisor &supervisor, ServerDefinition def,
           std::shared_ptr<const Classifier> classifier);

  absl::Status Init();

  const std::string &Id() const { return def_.id; }
  const std::string &Name() const { return def_.name; }
  const ServerDefinition &Definition() const { return def_; }

  // Replaces the definition.  A running process keeps the settings it
  // was started with.
  void SetDefinition(ServerDefinition def,
                     std::shared_ptr<const Classifier> classifier);

  ServerState State() const { return state_; }
  int Pid() const { return def_.pid; }
  int ConsecutiveCrashes() const { return consecutive_crashes_; }
  int NumAutoRestarts() const { return num_auto_restarts_; }
  bool RestartPending() const { return restart_pending_; }
  bool IsRetired() const { return retired_; }

  absl::Status Start(co::Coroutine *c);
  absl::Status Stop(co::Coroutine *c);
  absl::Status Restart(co::Coroutine *c);
  absl::Status Kill(co::Coroutine *c);

  // Gets the instance to stopped, gracefully if possible.
  absl::Status EnsureStopped(co::Coroutine *c);

  absl::Status SendCommand(const std::string &text);

  std::vector<std::string> TailLogs(size_t n) const { return logs_.Tail(n); }
  const LogBuffer &Logs() const { return logs_; }

  ServerStatusSnapshot Snapshot() const;

  void SetResourceUsage(double cpu_percent, uint64_t resident_bytes);

  // No more automatic restarts.  Used on shutdown and delete.
  void Retire();
  // Undoes Retire when a delete fails.
  void Unretire() { retired_ = false; }

private:
  // Everything belonging to one spawned process.
  struct ProcessRun {
    uint64_t generation;
    std::shared_ptr<ChildProcess> child;
    std::shared_ptr<const Classifier> classifier;
    std::string stop_command;
    uint64_t started_at;
    bool reader_done = false;
  };

  class OperationLock {
  public:
    OperationLock(Instance &instance, co::Coroutine *c);
    ~OperationLock() { instance_.op_busy_ = false; }

  private:
    Instance &instance_;
  };

  absl::Status StartLocked(co::Coroutine *c, bool manual);
  absl::Status StopLocked(co::Coroutine *c);
  absl::Status KillLocked(co::Coroutine *c);
  absl::Status AutoRestart(uint64_t epoch, co::Coroutine *c);

  absl::StatusOr<std::unique_ptr<ChildProcess>> Launch();
  absl::Status WriteEula();

  void ReaderCoroutine(std::shared_ptr<ProcessRun> run, co::Coroutine *c);
  void WatcherCoroutine(std::shared_ptr<ProcessRun> run, co::Coroutine *c);
  void ReadinessCoroutine(std::shared_ptr<ProcessRun> run, co::Coroutine *c);

  void HandleLine(const std::shared_ptr<ProcessRun> &run, std::string line,
                  bool is_stderr);
  void OnProcessExit(const std::shared_ptr<ProcessRun> &run,
                     const ExitStatus &status);

  // Returns true if the process went away within the timeout.
  bool WaitForExit(const std::shared_ptr<ProcessRun> &run, int timeout_ms,
                   co::Coroutine *c);
  void KillProcess(const std::shared_ptr<ProcessRun> &run, co::Coroutine *c);
  void ReleaseProcess();

  void MaybeScheduleRestart();
  void CancelPendingRestart();

  void SetState(ServerState state, int pid);

  template <typename T> void Emit(EventType type, T payload);

  uint64_t NextTimestamp();

  Supervisor &supervisor_;
  ServerDefinition def_;
  std::shared_ptr<const Classifier> classifier_;

  ServerState state_ = ServerState::kStopped;
  std::shared_ptr<ProcessRun> run_;
  uint64_t generation_ = 0;
  bool stop_requested_ = false;
  bool op_busy_ = false;
  bool retired_ = false;

  int consecutive_crashes_ = 0;
  int num_auto_restarts_ = 0;
  uint64_t restart_epoch_ = 0;
  bool restart_pending_ = false;

  LogBuffer logs_;
  absl::flat_hash_map<std::string, PlayerInfo> players_;
  // Player uuids reported before the join line.
  absl::flat_hash_map<std::string, std::string> uuids_;

  double cpu_percent_ = 0;
  uint64_t resident_bytes_ = 0;
  double tps_ = 0;

  uint64_t last_timestamp_ = 0;
  toolbelt::TriggerFd ready_trigger_;
};

} // namespace warden
