// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "supervisor/instance.h"
#include "supervisor/supervisor.h"

#include "absl/strings/ascii.h"
#include "absl/strings/str_format.h"
#include "toolbelt/clock.h"
#include "toolbelt/fd.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace warden {

namespace {
constexpr int kLockPollMs = 10;
constexpr int kExitPollMs = 20;
// How long the exit watcher waits for the reader to drain the pipes.
constexpr int kDrainIterations = 50;
constexpr size_t kMaxLineLength = 16384;
constexpr uint64_t kNanosPerSecond = 1000000000ULL;
} // namespace

Instance::OperationLock::OperationLock(Instance &instance, co::Coroutine *c)
    : instance_(instance) {
  while (instance_.op_busy_) {
    c->Millisleep(kLockPollMs);
  }
  instance_.op_busy_ = true;
}

Instance::Instance(Supervisor &supervisor, ServerDefinition def,
                   std::shared_ptr<const Classifier> classifier)
    : supervisor_(supervisor), def_(std::move(def)),
      classifier_(std::move(classifier)),
      logs_(supervisor.Options().log_buffer_lines) {
  state_ = def_.status;
}

absl::Status Instance::Init() {
  if (absl::Status status = ready_trigger_.Open(); !status.ok()) {
    return absl::InternalError(
        absl::StrFormat("Failed to open ready trigger for server %s: %s",
                        Id(), status.ToString()));
  }
  return absl::OkStatus();
}

void Instance::SetDefinition(ServerDefinition def,
                             std::shared_ptr<const Classifier> classifier) {
  // Runtime fields belong to us.
  def.id = def_.id;
  def.status = def_.status;
  def.pid = def_.pid;
  def.created_at = def_.created_at;
  def_ = std::move(def);
  classifier_ = std::move(classifier);
}

uint64_t Instance::NextTimestamp() {
  uint64_t now = toolbelt::Now();
  if (now < last_timestamp_) {
    now = last_timestamp_;
  }
  last_timestamp_ = now;
  return now;
}

template <typename T> void Instance::Emit(EventType type, T payload) {
  auto event = std::make_shared<ServerEvent>();
  event->server_id = Id();
  event->type = type;
  event->timestamp = NextTimestamp();
  event->event = std::move(payload);
  supervisor_.Publish(std::move(event));
}

void Instance::SetState(ServerState state, int pid) {
  if (state == state_ && pid == def_.pid) {
    return;
  }
  ServerState old_state = state_;
  state_ = state;
  def_.status = state;
  def_.pid = pid;
  supervisor_.RecordStatus(Id(), state, pid);
  supervisor_.Log(Id(), toolbelt::LogLevel::kInfo, "%s -> %s (pid %d)",
                  ServerStateName(old_state), ServerStateName(state), pid);
  if (old_state != state) {
    Emit(EventType::kStatusChanged,
         StatusChange{.old_state = old_state, .new_state = state, .pid = pid});
  }
}

absl::Status Instance::Start(co::Coroutine *c) {
  OperationLock lock(*this, c);
  return StartLocked(c, /*manual=*/true);
}

absl::Status Instance::StartLocked(co::Coroutine *c, bool manual) {
  if (state_ != ServerState::kStopped && state_ != ServerState::kCrashed) {
    return absl::FailedPreconditionError(
        absl::StrFormat("Server %s is %s and cannot be started", Id(),
                        ServerStateName(state_)));
  }
  if (retired_) {
    return absl::FailedPreconditionError(
        absl::StrFormat("Server %s is shutting down", Id()));
  }
  CancelPendingRestart();
  if (manual) {
    consecutive_crashes_ = 0;
  }

  absl::StatusOr<std::unique_ptr<ChildProcess>> child = Launch();
  if (!child.ok()) {
    supervisor_.Log(Id(), toolbelt::LogLevel::kError,
                    "Failed to start server: %s",
                    child.status().ToString().c_str());
    SetState(ServerState::kCrashed, 0);
    Emit(EventType::kCrashed,
         Crash{.reason = std::string(child.status().message()),
               .exited = false,
               .exit_status = 0,
               .signal = 0});
    return absl::InternalError(absl::StrFormat(
        "Failed to start server %s: %s", Id(), child.status().message()));
  }

  const SupervisorOptions &opts = supervisor_.Options();
  auto run = std::make_shared<ProcessRun>();
  run->generation = ++generation_;
  run->child = std::move(*child);
  run->classifier = classifier_;
  run->stop_command = opts.StopCommand(def_.kind);
  run->started_at = toolbelt::Now();
  run_ = run;

  stop_requested_ = false;
  players_.clear();
  uuids_.clear();
  tps_ = 0;
  cpu_percent_ = 0;
  resident_bytes_ = 0;
  ready_trigger_.Clear();

  SetState(ServerState::kStarting, run->child->GetPid());

  auto self = shared_from_this();
  supervisor_.AddCoroutine(std::make_unique<co::Coroutine>(
      supervisor_.Scheduler(),
      [self, run](co::Coroutine *c2) { self->ReaderCoroutine(run, c2); },
      absl::StrFormat("reader.%s.%d", Id(), run->generation)));
  supervisor_.AddCoroutine(std::make_unique<co::Coroutine>(
      supervisor_.Scheduler(),
      [self, run](co::Coroutine *c2) { self->WatcherCoroutine(run, c2); },
      absl::StrFormat("watcher.%s.%d", Id(), run->generation)));
  supervisor_.AddCoroutine(std::make_unique<co::Coroutine>(
      supervisor_.Scheduler(),
      [self, run](co::Coroutine *c2) { self->ReadinessCoroutine(run, c2); },
      absl::StrFormat("readiness.%s.%d", Id(), run->generation)));
  return absl::OkStatus();
}

absl::Status Instance::WriteEula() {
  std::string filename = absl::StrFormat("%s/eula.txt", def_.directory);
  toolbelt::FileDescriptor fd(
      open(filename.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!fd.Valid()) {
    return absl::InternalError(absl::StrFormat("Failed to open %s: %s",
                                               filename, strerror(errno)));
  }
  constexpr char kEula[] = "eula=true\n";
  ssize_t n = ::write(fd.Fd(), kEula, sizeof(kEula) - 1);
  if (n != sizeof(kEula) - 1) {
    return absl::InternalError(absl::StrFormat("Failed to write %s: %s",
                                               filename, strerror(errno)));
  }
  return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<ChildProcess>> Instance::Launch() {
  const SupervisorOptions &opts = supervisor_.Options();

  struct stat st;
  if (::stat(def_.directory.c_str(), &st) == -1 || !S_ISDIR(st.st_mode)) {
    return absl::InternalError(absl::StrFormat(
        "Server directory %s does not exist", def_.directory));
  }
  std::string jar = def_.jar_file[0] == '/'
                        ? def_.jar_file
                        : absl::StrFormat("%s/%s", def_.directory,
                                          def_.jar_file);
  if (::stat(jar.c_str(), &st) == -1) {
    return absl::InternalError(
        absl::StrFormat("Server jar %s not found", jar));
  }

  if (opts.accept_eula && !IsProxy(def_.kind)) {
    if (absl::Status status = WriteEula(); !status.ok()) {
      return status;
    }
  }

  LaunchCommand cmd = BuildLaunchCommand(def_, opts.jvm_flags);
  supervisor_.Log(Id(), toolbelt::LogLevel::kInfo, "Launching %s",
                  cmd.ToString().c_str());

  SpawnOptions spawn = {.executable = cmd.executable,
                        .args = std::move(cmd.args),
                        .working_dir = def_.directory,
                        .env = {{"WARDEN_SERVER_ID", def_.id}}};
  return ChildProcess::Spawn(spawn);
}

void Instance::ReaderCoroutine(std::shared_ptr<ProcessRun> run,
                               co::Coroutine *c) {
  int out_fd = run->child->StdoutFd();
  int err_fd = run->child->StderrFd();
  std::vector<int> fds = {out_fd, err_fd};
  std::string partial[2];
  char buffer[4096];

  while (!fds.empty()) {
    int fd = c->Wait(fds, POLLIN);
    if (fd == -1) {
      continue;
    }
    bool is_stderr = fd == err_fd;
    std::string &pending = partial[is_stderr ? 1 : 0];
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n <= 0) {
      if (n == -1 && (errno == EINTR || errno == EAGAIN)) {
        continue;
      }
      // EOF or a read error.  Either way this stream is finished.
      if (!pending.empty()) {
        HandleLine(run, std::move(pending), is_stderr);
        pending.clear();
      }
      fds.erase(std::remove(fds.begin(), fds.end(), fd), fds.end());
      continue;
    }
    pending.append(buffer, n);
    size_t pos;
    while ((pos = pending.find('\n')) != std::string::npos) {
      std::string line = pending.substr(0, pos);
      pending.erase(0, pos + 1);
      HandleLine(run, std::move(line), is_stderr);
    }
    if (pending.size() > kMaxLineLength) {
      HandleLine(run, std::move(pending), is_stderr);
      pending.clear();
    }
  }
  run->reader_done = true;
}

void Instance::HandleLine(const std::shared_ptr<ProcessRun> &run,
                          std::string line, bool is_stderr) {
  if (run->generation != generation_) {
    // A newer process has been started.
    return;
  }
  absl::StripAsciiWhitespace(&line);
  if (line.empty()) {
    return;
  }
  std::string recorded = is_stderr ? "[STDERR] " + line : line;
  logs_.Append(recorded);
  Emit(EventType::kLogLine,
       LogLine{.line = std::move(recorded), .is_stderr = is_stderr});

  std::optional<Classification> cls = run->classifier->Classify(line);
  if (!cls.has_value()) {
    return;
  }
  switch (cls->kind) {
  case Classification::Kind::kReady:
    if (state_ == ServerState::kStarting && run == run_) {
      supervisor_.Log(Id(), toolbelt::LogLevel::kInfo, "Server is ready");
      SetState(ServerState::kRunning, def_.pid);
      ready_trigger_.Trigger();
    }
    break;

  case Classification::Kind::kPlayerJoin: {
    std::string uuid;
    if (auto it = uuids_.find(cls->name); it != uuids_.end()) {
      uuid = it->second;
    }
    players_[cls->name] = {.uuid = uuid, .joined_at = toolbelt::Now()};
    supervisor_.Log(Id(), toolbelt::LogLevel::kDebug, "Player %s joined",
                    cls->name.c_str());
    Emit(EventType::kPlayerJoin,
         PlayerPresence{.name = cls->name,
                        .uuid = uuid,
                        .player_count = static_cast<int>(players_.size())});
    break;
  }

  case Classification::Kind::kPlayerLeave: {
    std::string uuid;
    if (auto it = players_.find(cls->name); it != players_.end()) {
      uuid = it->second.uuid;
      players_.erase(it);
    }
    supervisor_.Log(Id(), toolbelt::LogLevel::kDebug, "Player %s left",
                    cls->name.c_str());
    Emit(EventType::kPlayerLeave,
         PlayerPresence{.name = cls->name,
                        .uuid = uuid,
                        .player_count = static_cast<int>(players_.size())});
    break;
  }

  case Classification::Kind::kPlayerUuid:
    uuids_[cls->name] = cls->detail;
    if (auto it = players_.find(cls->name); it != players_.end()) {
      it->second.uuid = cls->detail;
    }
    break;

  case Classification::Kind::kTps:
    tps_ = cls->tps;
    break;

  case Classification::Kind::kChat:
    Emit(EventType::kChat,
         ChatMessage{.name = cls->name, .text = cls->detail});
    break;

  case Classification::Kind::kAdvancement:
    Emit(EventType::kAdvancement,
         Advancement{.name = cls->name, .advancement = cls->detail});
    break;

  case Classification::Kind::kDeath:
    Emit(EventType::kDeath, Death{.name = cls->name, .message = cls->detail});
    break;

  case Classification::Kind::kCrashReport:
    // Whether it crashed is up to the exit status.
    supervisor_.Log(Id(), toolbelt::LogLevel::kWarning,
                    "Server printed a crash report");
    break;
  }
}

void Instance::WatcherCoroutine(std::shared_ptr<ProcessRun> run,
                                co::Coroutine *c) {
  ExitStatus status = run->child->WaitForExit(c);

  // Let the reader pick up anything the process wrote before it died.
  for (int i = 0; i < kDrainIterations && !run->reader_done; i++) {
    c->Millisleep(kExitPollMs);
  }
  OnProcessExit(run, status);
}

void Instance::ReadinessCoroutine(std::shared_ptr<ProcessRun> run,
                                  co::Coroutine *c) {
  int timeout_secs = supervisor_.Options().startup_timeout_secs;
  c->Wait(ready_trigger_.GetPollFd().Fd(), POLLIN,
          static_cast<uint64_t>(timeout_secs) * kNanosPerSecond);
  if (run != run_ || state_ != ServerState::kStarting) {
    return;
  }
  supervisor_.Log(Id(), toolbelt::LogLevel::kWarning,
                  "No readiness marker within %d seconds, assuming running",
                  timeout_secs);
  SetState(ServerState::kRunning, def_.pid);
}

void Instance::ReleaseProcess() {
  run_ = nullptr;
  players_.clear();
  cpu_percent_ = 0;
  resident_bytes_ = 0;
  // Wake the readiness coroutine.
  ready_trigger_.Trigger();
}

void Instance::OnProcessExit(const std::shared_ptr<ProcessRun> &run,
                             const ExitStatus &status) {
  if (run != run_) {
    supervisor_.Log(Id(), toolbelt::LogLevel::kDebug,
                    "Abandoned process %d %s", run->child->GetPid(),
                    status.ToString().c_str());
    return;
  }
  ReleaseProcess();

  if (stop_requested_) {
    supervisor_.Log(Id(), toolbelt::LogLevel::kInfo, "Server stopped: %s",
                    status.ToString().c_str());
    SetState(ServerState::kStopped, 0);
    return;
  }
  if (status.Clean()) {
    supervisor_.Log(Id(), toolbelt::LogLevel::kInfo,
                    "Server exited cleanly without a stop request");
    SetState(ServerState::kStopped, 0);
    return;
  }

  uint64_t ran_secs = (toolbelt::Now() - run->started_at) / kNanosPerSecond;
  if (ran_secs >= static_cast<uint64_t>(
                      supervisor_.Options().restart.crash_reset_secs)) {
    consecutive_crashes_ = 0;
  }
  consecutive_crashes_++;

  supervisor_.Log(Id(), toolbelt::LogLevel::kError,
                  "Server crashed after %d seconds: %s (%d consecutive)",
                  static_cast<int>(ran_secs), status.ToString().c_str(),
                  consecutive_crashes_);
  SetState(ServerState::kCrashed, 0);
  Emit(EventType::kCrashed, Crash{.reason = status.ToString(),
                                  .exited = status.exited,
                                  .exit_status = status.status,
                                  .signal = status.signal});
  MaybeScheduleRestart();
}

void Instance::MaybeScheduleRestart() {
  if (!def_.auto_restart || retired_) {
    return;
  }
  const RestartPolicy &policy = supervisor_.Options().restart;
  if (consecutive_crashes_ > policy.max_attempts) {
    supervisor_.Log(Id(), toolbelt::LogLevel::kError,
                    "Crashed %d times in a row, not restarting until a "
                    "manual start",
                    consecutive_crashes_);
    return;
  }
  int delay_ms = policy.DelayMs(consecutive_crashes_);
  uint64_t epoch = ++restart_epoch_;
  restart_pending_ = true;
  supervisor_.Log(Id(), toolbelt::LogLevel::kWarning,
                  "Restarting in %d ms (attempt %d of %d)", delay_ms,
                  consecutive_crashes_, policy.max_attempts);

  supervisor_.AddCoroutine(std::make_unique<co::Coroutine>(
      supervisor_.Scheduler(),
      [self = shared_from_this(), epoch, delay_ms](co::Coroutine *c) {
        c->Millisleep(delay_ms);
        if (absl::Status status = self->AutoRestart(epoch, c); !status.ok()) {
          self->supervisor_.Log(self->Id(), toolbelt::LogLevel::kError,
                                "Automatic restart failed: %s",
                                status.ToString().c_str());
        }
      },
      absl::StrFormat("restart.%s", Id())));
}

void Instance::CancelPendingRestart() {
  if (restart_pending_) {
    restart_epoch_++;
    restart_pending_ = false;
  }
}

absl::Status Instance::AutoRestart(uint64_t epoch, co::Coroutine *c) {
  if (epoch != restart_epoch_) {
    // Cancelled.
    return absl::OkStatus();
  }
  OperationLock lock(*this, c);
  // Things might have changed while we waited for the lock.
  if (epoch != restart_epoch_ || retired_ ||
      state_ != ServerState::kCrashed) {
    return absl::OkStatus();
  }
  restart_pending_ = false;
  num_auto_restarts_++;
  return StartLocked(c, /*manual=*/false);
}

bool Instance::WaitForExit(const std::shared_ptr<ProcessRun> &run,
                           int timeout_ms, co::Coroutine *c) {
  for (int waited = 0; run_ == run && waited < timeout_ms;
       waited += kExitPollMs) {
    c->Millisleep(kExitPollMs);
  }
  return run_ != run;
}

void Instance::KillProcess(const std::shared_ptr<ProcessRun> &run,
                           co::Coroutine *c) {
  if (absl::Status status = run->child->Signal(SIGKILL); !status.ok()) {
    supervisor_.Log(Id(), toolbelt::LogLevel::kError, "%s",
                    status.ToString().c_str());
  }
  int grace_ms = supervisor_.Options().kill_grace_secs * 1000;
  if (WaitForExit(run, grace_ms, c)) {
    return;
  }
  // The OS didn't confirm the exit in time.  Forget about the process,
  // the watcher will still reap it.
  supervisor_.Log(Id(), toolbelt::LogLevel::kError,
                  "Process %d did not exit after SIGKILL, abandoning it",
                  run->child->GetPid());
  ReleaseProcess();
  SetState(ServerState::kStopped, 0);
}

absl::Status Instance::Stop(co::Coroutine *c) {
  OperationLock lock(*this, c);
  return StopLocked(c);
}

absl::Status Instance::StopLocked(co::Coroutine *c) {
  if (state_ != ServerState::kStarting && state_ != ServerState::kRunning) {
    return absl::FailedPreconditionError(
        absl::StrFormat("Server %s is %s and cannot be stopped", Id(),
                        ServerStateName(state_)));
  }
  std::shared_ptr<ProcessRun> run = run_;
  stop_requested_ = true;
  SetState(ServerState::kStopping, def_.pid);

  if (absl::Status status = run->child->WriteInput(run->stop_command + "\n");
      !status.ok()) {
    supervisor_.Log(Id(), toolbelt::LogLevel::kWarning,
                    "Failed to send stop command: %s",
                    status.ToString().c_str());
  }

  int timeout_secs = supervisor_.Options().stop_timeout_secs;
  if (!WaitForExit(run, timeout_secs * 1000, c)) {
    supervisor_.Log(Id(), toolbelt::LogLevel::kWarning,
                    "Server did not stop within %d seconds, killing it",
                    timeout_secs);
    KillProcess(run, c);
  }
  return absl::OkStatus();
}

absl::Status Instance::Restart(co::Coroutine *c) {
  OperationLock lock(*this, c);
  if (state_ == ServerState::kStarting || state_ == ServerState::kRunning) {
    if (absl::Status status = StopLocked(c); !status.ok()) {
      return status;
    }
    int pause_ms = supervisor_.Options().restart_pause_ms;
    if (pause_ms > 0) {
      c->Millisleep(pause_ms);
    }
  }
  return StartLocked(c, /*manual=*/true);
}

absl::Status Instance::Kill(co::Coroutine *c) {
  if (state_ == ServerState::kStopping && run_ != nullptr) {
    // A stop holds the operation lock while it waits.  Kill the process
    // now so the stop finishes quickly.
    supervisor_.Log(Id(), toolbelt::LogLevel::kInfo,
                    "Killing process %d during stop", def_.pid);
    if (absl::Status status = run_->child->Signal(SIGKILL); !status.ok()) {
      supervisor_.Log(Id(), toolbelt::LogLevel::kError, "%s",
                      status.ToString().c_str());
    }
    OperationLock lock(*this, c);
    return absl::OkStatus();
  }
  OperationLock lock(*this, c);
  return KillLocked(c);
}

absl::Status Instance::KillLocked(co::Coroutine *c) {
  switch (state_) {
  case ServerState::kStopped:
    return absl::FailedPreconditionError(
        absl::StrFormat("Server %s is already stopped", Id()));
  case ServerState::kCrashed:
    CancelPendingRestart();
    SetState(ServerState::kStopped, 0);
    return absl::OkStatus();
  default:
    break;
  }
  stop_requested_ = true;
  std::shared_ptr<ProcessRun> run = run_;
  if (run == nullptr) {
    SetState(ServerState::kStopped, 0);
    return absl::OkStatus();
  }
  supervisor_.Log(Id(), toolbelt::LogLevel::kInfo, "Killing process %d",
                  run->child->GetPid());
  KillProcess(run, c);
  return absl::OkStatus();
}

absl::Status Instance::EnsureStopped(co::Coroutine *c) {
  if (state_ == ServerState::kStarting || state_ == ServerState::kRunning) {
    absl::Status status = Stop(c);
    if (state_ == ServerState::kStopped) {
      return absl::OkStatus();
    }
    if (!status.ok()) {
      supervisor_.Log(Id(), toolbelt::LogLevel::kWarning,
                      "Graceful stop failed: %s", status.ToString().c_str());
    }
  }
  if (state_ == ServerState::kStopped) {
    return absl::OkStatus();
  }
  absl::Status status = Kill(c);
  if (!status.ok() && state_ == ServerState::kStopped) {
    return absl::OkStatus();
  }
  return status;
}

void Instance::Retire() {
  retired_ = true;
  CancelPendingRestart();
}

absl::Status Instance::SendCommand(const std::string &text) {
  if (!HasProcess(state_) || run_ == nullptr) {
    return absl::FailedPreconditionError(
        absl::StrFormat("Server %s has no running process (%s)", Id(),
                        ServerStateName(state_)));
  }
  supervisor_.Log(Id(), toolbelt::LogLevel::kDebug, "Sending command: %s",
                  text.c_str());
  return run_->child->WriteInput(text + "\n");
}

void Instance::SetResourceUsage(double cpu_percent, uint64_t resident_bytes) {
  if (run_ == nullptr) {
    return;
  }
  cpu_percent_ = cpu_percent;
  resident_bytes_ = resident_bytes;
}

ServerStatusSnapshot Instance::Snapshot() const {
  ServerStatusSnapshot s;
  s.id = def_.id;
  s.name = def_.name;
  s.state = state_;
  if (run_ != nullptr) {
    s.pid = run_->child->GetPid();
    s.uptime_secs = (toolbelt::Now() - run_->started_at) / kNanosPerSecond;
  }
  s.player_count = static_cast<int>(players_.size());
  for (auto & [ name, info ] : players_) {
    s.players.push_back(name);
  }
  std::sort(s.players.begin(), s.players.end());
  s.cpu_percent = cpu_percent_;
  s.resident_bytes = resident_bytes_;
  s.tps = tps_;
  return s;
}

} // namespace warden
