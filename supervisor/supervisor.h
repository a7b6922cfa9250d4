// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "common/event.h"
#include "common/event_bus.h"
#include "common/server_definition.h"
#include "common/server_status.h"
#include "supervisor/classifier.h"
#include "supervisor/definition_store.h"
#include "supervisor/instance.h"
#include "supervisor/options.h"
#include "supervisor/sampler.h"
#include "toolbelt/logging.h"
#include "toolbelt/triggerfd.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "coroutine.h"

namespace warden {

// Owns all the managed servers.  Every server is addressed by its id.
// All work is done in coroutines running on the given scheduler.
class Supervisor {
public:
  Supervisor(co::CoroutineScheduler &scheduler, SupervisorOptions options,
             std::string store_filename, bool log_to_output,
             std::string log_level = "info", bool log_events = false);
  ~Supervisor();

  // Loads the stored definitions, starts the auto-start servers and runs
  // the scheduler until Stop is called.
  absl::Status Run();

  // Stops the scheduler right away.
  void Stop();

  // Shut down all servers and then stop.  Safe to call from a signal
  // handler.
  void RequestShutdown() { shutdown_trigger_.Trigger(); }

  // Run the function in a new coroutine.
  void RunNow(std::function<void(co::Coroutine *)> fn);

  // Load the definitions from the store and build instances for them.  Any
  // status other than stopped is left over from a previous run and is
  // reset.
  absl::Status LoadDefinitions();

  // Start all servers marked for auto-start.  Failures are logged.
  void AutoStart(co::Coroutine *c);

  // Stop every server (concurrently) and wait for them all.
  absl::Status Shutdown(co::Coroutine *c);

  absl::StatusOr<std::string> Create(ServerDefinition def);
  absl::StatusOr<ServerDefinition> Get(const std::string &id) const;
  std::vector<ServerDefinition> List() const;
  absl::Status Update(const std::string &id, ServerDefinition def);
  absl::Status Delete(const std::string &id, bool purge_files,
                      co::Coroutine *c);

  absl::Status Start(const std::string &id, co::Coroutine *c);
  absl::Status Stop(const std::string &id, co::Coroutine *c);
  absl::Status Restart(const std::string &id, co::Coroutine *c);
  absl::Status Kill(const std::string &id, co::Coroutine *c);
  absl::Status SendCommand(const std::string &id, const std::string &text);

  absl::StatusOr<std::vector<std::string>> TailLogs(const std::string &id,
                                                    size_t n) const;
  absl::StatusOr<ServerStatusSnapshot>
  StatusSnapshot(const std::string &id) const;
  std::vector<ServerStatusSnapshot> AllStatusSnapshots() const;

  absl::StatusOr<std::shared_ptr<Subscription>>
  Subscribe(const std::string &name, int event_mask = kAllEvents);
  void Unsubscribe(const std::shared_ptr<Subscription> &sub) {
    bus_.Unsubscribe(sub);
  }

  std::shared_ptr<Instance> FindInstance(const std::string &id) const {
    auto it = instances_.find(id);
    if (it == instances_.end()) {
      return nullptr;
    }
    return it->second;
  }

  bool IsShuttingDown() const { return shutting_down_; }

  co::CoroutineScheduler &Scheduler() { return co_scheduler_; }
  const SupervisorOptions &Options() const { return options_; }
  toolbelt::Logger &GetLogger() { return logger_; }
  EventBus &Bus() { return bus_; }
  DefinitionStore &Store() { return store_; }

  void AddCoroutine(std::unique_ptr<co::Coroutine> c) {
    coroutines_.insert(std::move(c));
  }

  void Publish(std::shared_ptr<const ServerEvent> event);

  // Called on every state transition of an instance.
  void RecordStatus(const std::string &id, ServerState state, int pid);

  void Log(const std::string &source, toolbelt::LogLevel level,
           const char *fmt, ...);

private:
  absl::StatusOr<std::shared_ptr<const Classifier>>
  ClassifierFor(ServerKind kind);
  absl::StatusOr<std::shared_ptr<Instance>> AddInstance(ServerDefinition def);
  absl::StatusOr<std::shared_ptr<Instance>>
  FindOrError(const std::string &id) const;
  std::string GenerateId();

  void SamplerCoroutine(co::Coroutine *c);
  void ShutdownCoroutine(co::Coroutine *c);

  co::CoroutineScheduler &co_scheduler_;
  SupervisorOptions options_;
  toolbelt::Logger logger_;
  bool log_events_;

  DefinitionStore store_;
  EventBus bus_;
  Sampler sampler_;

  absl::flat_hash_map<std::string, std::shared_ptr<Instance>> instances_;
  absl::flat_hash_map<ServerKind, std::shared_ptr<const Classifier>>
      classifiers_;

  // All coroutines are owned by this set.
  absl::flat_hash_set<std::unique_ptr<co::Coroutine>> coroutines_;

  toolbelt::TriggerFd shutdown_trigger_;
  bool shutting_down_ = false;
};

} // namespace warden
