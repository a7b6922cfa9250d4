// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "consumers/alert_monitor.h"
#include "consumers/chat_relay.h"
#include "consumers/player_tracker.h"
#include "consumers/status_reporter.h"
#include "supervisor/options.h"
#include "supervisor/supervisor.h"
#include "coroutine.h"

#include <iostream>
#include <signal.h>

warden::Supervisor *g_supervisor;
co::CoroutineScheduler *g_scheduler;

static void Signal(int sig) {
  if (sig == SIGQUIT && g_scheduler != nullptr) {
    g_scheduler->Show();
  }
  if (g_supervisor != nullptr) {
    g_supervisor->RequestShutdown();
  }
  if (sig == SIGINT || sig == SIGTERM) {
    return;
  }
  signal(sig, SIG_DFL);
  raise(sig);
}

ABSL_FLAG(std::string, config, "",
          "Supervisor configuration file (text format protobuf)");
ABSL_FLAG(std::string, store, "warden_servers.pb.txt",
          "File holding the server definitions");
ABSL_FLAG(std::string, servers_root, "",
          "Directory under which server directories are created (overrides "
          "config)");
ABSL_FLAG(bool, silent, false, "Don't log messages to output");
ABSL_FLAG(std::string, log_level, "info",
          "Log level (verbose, debug, info, warning, error)");
ABSL_FLAG(bool, log_events, false, "Log every server event");
ABSL_FLAG(bool, relay, false, "Relay chat and events for all servers");
ABSL_FLAG(std::string, status_file, "",
          "Periodically write server status and alarms to this file");

int main(int argc, char **argv) {
  absl::ParseCommandLine(argc, argv);

  co::CoroutineScheduler scheduler;
  g_scheduler = &scheduler;

  signal(SIGINT, Signal);
  signal(SIGTERM, Signal);
  signal(SIGQUIT, Signal);
  signal(SIGHUP, Signal);
  signal(SIGPIPE, SIG_IGN);

  warden::SupervisorOptions options;
  warden::AlertThresholds thresholds;
  if (std::string config_file = absl::GetFlag(FLAGS_config);
      !config_file.empty()) {
    absl::StatusOr<warden::proto::SupervisorConfig> config =
        warden::LoadSupervisorConfig(config_file);
    if (!config.ok()) {
      std::cerr << "Failed to load config: " << config.status().ToString()
                << std::endl;
      exit(1);
    }
    if (absl::Status status = options.FromProto(*config); !status.ok()) {
      std::cerr << "Invalid config " << config_file << ": "
                << status.ToString() << std::endl;
      exit(1);
    }
    if (config->has_alerts()) {
      thresholds.FromProto(config->alerts());
    }
  }
  if (std::string root = absl::GetFlag(FLAGS_servers_root); !root.empty()) {
    options.servers_root = root;
  }
  int sample_interval = options.sample_interval_secs;

  auto supervisor = std::make_unique<warden::Supervisor>(
      scheduler, std::move(options), absl::GetFlag(FLAGS_store),
      !absl::GetFlag(FLAGS_silent), absl::GetFlag(FLAGS_log_level),
      absl::GetFlag(FLAGS_log_events));
  g_supervisor = supervisor.get();

  toolbelt::Logger &logger = supervisor->GetLogger();
  warden::PlayerTracker players(logger);
  warden::ChatRelay relay(logger,
                          std::make_unique<warden::LoggingRelaySink>(logger));
  warden::AlertMonitor alerts(logger, thresholds);

  for (warden::Consumer *consumer :
       std::vector<warden::Consumer *>{&players, &relay, &alerts}) {
    if (absl::Status status = consumer->Attach(*supervisor); !status.ok()) {
      std::cerr << "Failed to attach " << consumer->Name() << ": "
                << status.ToString() << std::endl;
      exit(1);
    }
  }
  alerts.AttachEvaluator(*supervisor, sample_interval);

  std::unique_ptr<warden::StatusReporter> reporter;
  if (std::string status_file = absl::GetFlag(FLAGS_status_file);
      !status_file.empty()) {
    reporter = std::make_unique<warden::StatusReporter>(logger, status_file,
                                                        &alerts);
    reporter->Attach(*supervisor, sample_interval);
  }

  if (absl::GetFlag(FLAGS_relay)) {
    // Definitions are loaded by the time this runs.
    supervisor->RunNow([&supervisor, &relay](co::Coroutine *c) {
      for (auto &def : supervisor->List()) {
        relay.Enable(def.id, def.name);
      }
    });
  }

  if (absl::Status status = supervisor->Run(); !status.ok()) {
    std::cerr << "Failed to run warden: " << status.ToString() << std::endl;
    exit(1);
  }
  g_supervisor = nullptr;
}
