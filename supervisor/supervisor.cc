// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "supervisor/supervisor.h"
#include "absl/strings/str_format.h"
#include "toolbelt/clock.h"

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <filesystem>
#include <random>
#include <system_error>

namespace warden {

namespace {
constexpr int kShutdownPollMs = 20;
}

Supervisor::Supervisor(co::CoroutineScheduler &scheduler,
                       SupervisorOptions options, std::string store_filename,
                       bool log_to_output, std::string log_level,
                       bool log_events)
    : co_scheduler_(scheduler), options_(std::move(options)),
      logger_("warden", log_to_output), log_events_(log_events),
      store_(std::move(store_filename)) {
  if (!log_level.empty()) {
    logger_.SetLogLevel(log_level);
  }
}

Supervisor::~Supervisor() {
  // The coroutines refer to the instances so they go first.
  coroutines_.clear();
  instances_.clear();
}

void Supervisor::Stop() { co_scheduler_.Stop(); }

void Supervisor::RunNow(std::function<void(co::Coroutine *)> fn) {
  AddCoroutine(std::make_unique<co::Coroutine>(
      co_scheduler_, [fn = std::move(fn)](co::Coroutine *c) { fn(c); },
      "RunNow"));
}

void Supervisor::Log(const std::string &source, toolbelt::LogLevel level,
                     const char *fmt, ...) {
  char buffer[1024];
  va_list ap;
  va_start(ap, fmt);
  vsnprintf(buffer, sizeof(buffer), fmt, ap);
  va_end(ap);
  logger_.Log(level, "%s: %s", source.c_str(), buffer);
}

absl::Status Supervisor::Run() {
  logger_.Log(toolbelt::LogLevel::kInfo,
              "Supervisor running with store %s and servers in %s",
              store_.Filename().empty() ? "<memory>" : store_.Filename().c_str(),
              options_.servers_root.c_str());

  if (absl::Status status = shutdown_trigger_.Open(); !status.ok()) {
    return status;
  }
  if (absl::Status status = LoadDefinitions(); !status.ok()) {
    return status;
  }

  // Register a callback to be called when a coroutine completes.  The
  // supervisor keeps track of all coroutines created.
  // This deletes them when they are done.
  co_scheduler_.SetCompletionCallback(
      [this](co::Coroutine *c) { coroutines_.erase(c); });

  AddCoroutine(std::make_unique<co::Coroutine>(
      co_scheduler_, [this](co::Coroutine *c) { AutoStart(c); }, "AutoStart"));

  if (options_.sample_interval_secs > 0) {
    AddCoroutine(std::make_unique<co::Coroutine>(
        co_scheduler_, [this](co::Coroutine *c) { SamplerCoroutine(c); },
        "Sampler"));
  }

  AddCoroutine(std::make_unique<co::Coroutine>(
      co_scheduler_, [this](co::Coroutine *c) { ShutdownCoroutine(c); },
      "Shutdown"));

  // Run the coroutine main loop.
  co_scheduler_.Run();

  logger_.Log(toolbelt::LogLevel::kInfo, "Supervisor stopped");
  return absl::OkStatus();
}

void Supervisor::ShutdownCoroutine(co::Coroutine *c) {
  c->Wait(shutdown_trigger_.GetPollFd().Fd(), POLLIN);
  shutdown_trigger_.Clear();
  logger_.Log(toolbelt::LogLevel::kInfo, "Shutdown requested");
  if (absl::Status status = Shutdown(c); !status.ok()) {
    logger_.Log(toolbelt::LogLevel::kError, "Shutdown failed: %s",
                status.ToString().c_str());
  }
  Stop();
}

absl::Status Supervisor::LoadDefinitions() {
  if (absl::Status status = store_.Load(); !status.ok()) {
    return status;
  }
  for (auto &def : store_.List()) {
    if (def.status != ServerState::kStopped || def.pid != 0) {
      Log(def.id, toolbelt::LogLevel::kInfo,
          "Resetting stale status %s (pid %d) to stopped",
          ServerStateName(def.status), def.pid);
      def.status = ServerState::kStopped;
      def.pid = 0;
      if (absl::Status status =
              store_.UpdateStatus(def.id, ServerState::kStopped, 0);
          !status.ok()) {
        return status;
      }
    }
    if (FindInstance(def.id) != nullptr) {
      continue;
    }
    if (absl::StatusOr<std::shared_ptr<Instance>> inst = AddInstance(def);
        !inst.ok()) {
      return inst.status();
    }
  }
  logger_.Log(toolbelt::LogLevel::kInfo, "Loaded %d server definitions",
              static_cast<int>(instances_.size()));
  return absl::OkStatus();
}

void Supervisor::AutoStart(co::Coroutine *c) {
  for (auto &def : List()) {
    if (!def.auto_start) {
      continue;
    }
    std::shared_ptr<Instance> inst = FindInstance(def.id);
    if (inst == nullptr) {
      continue;
    }
    Log(def.id, toolbelt::LogLevel::kInfo, "Auto-starting %s",
        def.name.c_str());
    if (absl::Status status = inst->Start(c); !status.ok()) {
      Log(def.id, toolbelt::LogLevel::kError, "Auto-start failed: %s",
          status.ToString().c_str());
    }
  }
}

absl::Status Supervisor::Shutdown(co::Coroutine *c) {
  if (shutting_down_) {
    return absl::OkStatus();
  }
  shutting_down_ = true;
  logger_.Log(toolbelt::LogLevel::kInfo, "Shutting down %d servers",
              static_cast<int>(instances_.size()));

  for (auto & [ id, inst ] : instances_) {
    inst->Retire();
  }

  // One coroutine per server so that slow ones don't hold up the others.
  int outstanding = 0;
  absl::Status result = absl::OkStatus();
  for (auto & [ id, inst ] : instances_) {
    if (inst->State() == ServerState::kStopped) {
      continue;
    }
    outstanding++;
    AddCoroutine(std::make_unique<co::Coroutine>(
        co_scheduler_,
        [this, inst = inst, &outstanding, &result](co::Coroutine *c2) {
          if (absl::Status status = inst->EnsureStopped(c2); !status.ok()) {
            Log(inst->Id(), toolbelt::LogLevel::kError,
                "Failed to stop on shutdown: %s", status.ToString().c_str());
            result = status;
          }
          outstanding--;
        },
        absl::StrFormat("shutdown.%s", id)));
  }
  while (outstanding > 0) {
    c->Millisleep(kShutdownPollMs);
  }

  instances_.clear();
  bus_.CloseAll();
  logger_.Log(toolbelt::LogLevel::kInfo, "All servers stopped");
  return result;
}

absl::StatusOr<std::shared_ptr<const Classifier>>
Supervisor::ClassifierFor(ServerKind kind) {
  auto it = classifiers_.find(kind);
  if (it != classifiers_.end()) {
    return it->second;
  }
  absl::StatusOr<std::shared_ptr<const Classifier>> classifier =
      Classifier::Create(options_.ReadinessPatterns(kind));
  if (!classifier.ok()) {
    return classifier.status();
  }
  classifiers_.emplace(kind, *classifier);
  return *classifier;
}

absl::StatusOr<std::shared_ptr<Instance>>
Supervisor::AddInstance(ServerDefinition def) {
  absl::StatusOr<std::shared_ptr<const Classifier>> classifier =
      ClassifierFor(def.kind);
  if (!classifier.ok()) {
    return classifier.status();
  }
  std::string id = def.id;
  auto inst = std::make_shared<Instance>(*this, std::move(def), *classifier);
  if (absl::Status status = inst->Init(); !status.ok()) {
    return status;
  }
  instances_.emplace(id, inst);
  return inst;
}

absl::StatusOr<std::shared_ptr<Instance>>
Supervisor::FindOrError(const std::string &id) const {
  std::shared_ptr<Instance> inst = FindInstance(id);
  if (inst == nullptr) {
    return absl::NotFoundError(absl::StrFormat("No such server %s", id));
  }
  return inst;
}

std::string Supervisor::GenerateId() {
  static std::random_device rd;
  static std::mt19937_64 gen(rd());
  for (;;) {
    uint64_t hi = gen();
    uint64_t lo = gen();
    // Version 4, variant 1.
    hi = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;
    std::string id = absl::StrFormat(
        "%08x-%04x-%04x-%04x-%012x", static_cast<uint32_t>(hi >> 32),
        static_cast<uint32_t>((hi >> 16) & 0xffff),
        static_cast<uint32_t>(hi & 0xffff),
        static_cast<uint32_t>(lo >> 48), lo & 0xffffffffffffULL);
    if (!store_.Contains(id) && FindInstance(id) == nullptr) {
      return id;
    }
  }
}

absl::StatusOr<std::string> Supervisor::Create(ServerDefinition def) {
  if (shutting_down_) {
    return absl::FailedPreconditionError("Supervisor is shutting down");
  }
  if (absl::Status status = def.Validate(); !status.ok()) {
    return status;
  }
  if (def.id.empty()) {
    def.id = GenerateId();
  } else if (store_.Contains(def.id) || FindInstance(def.id) != nullptr) {
    return absl::AlreadyExistsError(
        absl::StrFormat("Server %s already exists", def.id));
  }
  if (def.directory.empty()) {
    def.directory =
        (std::filesystem::path(options_.servers_root) / def.id).string();
  }
  std::error_code ec;
  std::filesystem::create_directories(def.directory, ec);
  if (ec) {
    return absl::InternalError(
        absl::StrFormat("Failed to create server directory %s: %s",
                        def.directory, ec.message()));
  }

  def.status = ServerState::kStopped;
  def.pid = 0;
  def.created_at = WallClockNanos();

  // Check the readiness patterns before anything is stored.
  if (absl::StatusOr<std::shared_ptr<const Classifier>> classifier =
          ClassifierFor(def.kind);
      !classifier.ok()) {
    return classifier.status();
  }

  if (absl::Status status = store_.Put(def); !status.ok()) {
    Log(def.id, toolbelt::LogLevel::kError, "Failed to store definition: %s",
        status.ToString().c_str());
    return status;
  }
  absl::StatusOr<std::shared_ptr<Instance>> inst = AddInstance(def);
  if (!inst.ok()) {
    if (absl::Status status = store_.Remove(def.id); !status.ok()) {
      Log(def.id, toolbelt::LogLevel::kError,
          "Failed to remove definition: %s", status.ToString().c_str());
    }
    return inst.status();
  }
  Log(def.id, toolbelt::LogLevel::kInfo, "Created %s server %s in %s",
      ServerKindName(def.kind), def.name.c_str(), def.directory.c_str());
  return def.id;
}

absl::StatusOr<ServerDefinition>
Supervisor::Get(const std::string &id) const {
  absl::StatusOr<std::shared_ptr<Instance>> inst = FindOrError(id);
  if (!inst.ok()) {
    return inst.status();
  }
  return (*inst)->Definition();
}

std::vector<ServerDefinition> Supervisor::List() const {
  std::vector<ServerDefinition> result;
  result.reserve(instances_.size());
  for (auto & [ id, inst ] : instances_) {
    result.push_back(inst->Definition());
  }
  std::sort(result.begin(), result.end(),
            [](const ServerDefinition &a, const ServerDefinition &b) {
              if (a.created_at != b.created_at) {
                return a.created_at < b.created_at;
              }
              return a.id < b.id;
            });
  return result;
}

absl::Status Supervisor::Update(const std::string &id, ServerDefinition def) {
  absl::StatusOr<std::shared_ptr<Instance>> inst = FindOrError(id);
  if (!inst.ok()) {
    return inst.status();
  }
  if (absl::Status status = def.Validate(); !status.ok()) {
    return status;
  }
  const ServerDefinition &current = (*inst)->Definition();
  def.id = id;
  if (def.directory.empty()) {
    def.directory = current.directory;
  }
  def.status = current.status;
  def.pid = current.pid;
  def.created_at = current.created_at;

  absl::StatusOr<std::shared_ptr<const Classifier>> classifier =
      ClassifierFor(def.kind);
  if (!classifier.ok()) {
    return classifier.status();
  }
  if (absl::Status status = store_.Put(def); !status.ok()) {
    Log(id, toolbelt::LogLevel::kError, "Failed to store definition: %s",
        status.ToString().c_str());
    return status;
  }
  (*inst)->SetDefinition(std::move(def), *classifier);
  Log(id, toolbelt::LogLevel::kInfo, "Definition updated");
  return absl::OkStatus();
}

absl::Status Supervisor::Delete(const std::string &id, bool purge_files,
                                co::Coroutine *c) {
  absl::StatusOr<std::shared_ptr<Instance>> inst = FindOrError(id);
  if (!inst.ok()) {
    return inst.status();
  }
  std::shared_ptr<Instance> instance = *inst;
  instance->Retire();
  // The server stays registered if anything below fails.
  auto restore = [this, &instance]() {
    if (!shutting_down_) {
      instance->Unretire();
    }
  };
  if (absl::Status status = instance->EnsureStopped(c); !status.ok()) {
    restore();
    return absl::InternalError(absl::StrFormat(
        "Failed to stop server %s for deletion: %s", id, status.ToString()));
  }
  if (absl::Status status = store_.Remove(id); !status.ok()) {
    Log(id, toolbelt::LogLevel::kError, "Failed to remove definition: %s",
        status.ToString().c_str());
    restore();
    return status;
  }
  instances_.erase(id);

  if (purge_files) {
    std::string dir = instance->Definition().directory;
    if (dir.empty() || dir == "/") {
      return absl::InvalidArgumentError(
          absl::StrFormat("Refusing to remove directory '%s'", dir));
    }
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    if (ec) {
      return absl::InternalError(absl::StrFormat(
          "Failed to remove server directory %s: %s", dir, ec.message()));
    }
  }
  Log(id, toolbelt::LogLevel::kInfo, "Deleted%s",
      purge_files ? " with files" : "");
  return absl::OkStatus();
}

absl::Status Supervisor::Start(const std::string &id, co::Coroutine *c) {
  absl::StatusOr<std::shared_ptr<Instance>> inst = FindOrError(id);
  if (!inst.ok()) {
    return inst.status();
  }
  return (*inst)->Start(c);
}

absl::Status Supervisor::Stop(const std::string &id, co::Coroutine *c) {
  absl::StatusOr<std::shared_ptr<Instance>> inst = FindOrError(id);
  if (!inst.ok()) {
    return inst.status();
  }
  return (*inst)->Stop(c);
}

absl::Status Supervisor::Restart(const std::string &id, co::Coroutine *c) {
  absl::StatusOr<std::shared_ptr<Instance>> inst = FindOrError(id);
  if (!inst.ok()) {
    return inst.status();
  }
  return (*inst)->Restart(c);
}

absl::Status Supervisor::Kill(const std::string &id, co::Coroutine *c) {
  absl::StatusOr<std::shared_ptr<Instance>> inst = FindOrError(id);
  if (!inst.ok()) {
    return inst.status();
  }
  return (*inst)->Kill(c);
}

absl::Status Supervisor::SendCommand(const std::string &id,
                                     const std::string &text) {
  absl::StatusOr<std::shared_ptr<Instance>> inst = FindOrError(id);
  if (!inst.ok()) {
    return inst.status();
  }
  return (*inst)->SendCommand(text);
}

absl::StatusOr<std::vector<std::string>>
Supervisor::TailLogs(const std::string &id, size_t n) const {
  absl::StatusOr<std::shared_ptr<Instance>> inst = FindOrError(id);
  if (!inst.ok()) {
    return inst.status();
  }
  return (*inst)->TailLogs(n);
}

absl::StatusOr<ServerStatusSnapshot>
Supervisor::StatusSnapshot(const std::string &id) const {
  absl::StatusOr<std::shared_ptr<Instance>> inst = FindOrError(id);
  if (!inst.ok()) {
    return inst.status();
  }
  return (*inst)->Snapshot();
}

std::vector<ServerStatusSnapshot> Supervisor::AllStatusSnapshots() const {
  std::vector<ServerStatusSnapshot> result;
  for (auto &def : List()) {
    if (std::shared_ptr<Instance> inst = FindInstance(def.id);
        inst != nullptr) {
      result.push_back(inst->Snapshot());
    }
  }
  return result;
}

absl::StatusOr<std::shared_ptr<Subscription>>
Supervisor::Subscribe(const std::string &name, int event_mask) {
  return bus_.Subscribe(name, event_mask, options_.event_queue_capacity);
}

void Supervisor::Publish(std::shared_ptr<const ServerEvent> event) {
  if (log_events_) {
    proto::ServerEvent p;
    event->ToProto(&p);
    logger_.Log(toolbelt::LogLevel::kInfo, "%s: event %s: %s",
                event->server_id.c_str(), EventTypeName(event->type),
                p.ShortDebugString().c_str());
  }
  bus_.Publish(std::move(event));
}

void Supervisor::RecordStatus(const std::string &id, ServerState state,
                              int pid) {
  if (absl::Status status = store_.UpdateStatus(id, state, pid);
      !status.ok()) {
    Log(id, toolbelt::LogLevel::kError, "Failed to record status %s: %s",
        ServerStateName(state), status.ToString().c_str());
  }
}

void Supervisor::SamplerCoroutine(co::Coroutine *c) {
  for (;;) {
    c->Sleep(options_.sample_interval_secs);
    if (shutting_down_) {
      return;
    }
    uint64_t now = toolbelt::Now();
    absl::flat_hash_set<int> live;
    for (auto & [ id, inst ] : instances_) {
      int pid = inst->Pid();
      if (pid <= 0 || !HasProcess(inst->State())) {
        continue;
      }
      live.insert(pid);
      absl::StatusOr<ResourceUsage> usage = sampler_.Sample(pid, now);
      if (!usage.ok()) {
        // The process may have just gone away.
        logger_.Log(toolbelt::LogLevel::kVerboseDebug, "%s: %s", id.c_str(),
                    usage.status().ToString().c_str());
        continue;
      }
      inst->SetResourceUsage(usage->cpu_percent, usage->resident_bytes);
    }
    // Processes that exited since the last pass.
    sampler_.Retain(live);
  }
}

} // namespace warden
