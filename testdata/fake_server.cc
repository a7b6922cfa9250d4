// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

// Stands in for a game server in tests.  Accepts (and ignores) the JVM
// arguments and writes vanilla style console lines.  Options:
//   --no-ready          never print the readiness line
//   --ignore-stop       ignore the stop command and SIGTERM
//   --crash-after-ms=N  exit with the exit code after N ms
//   --exit-code=N       exit code for a crash (default 1)
//   --ready-delay-ms=N  wait before printing the readiness line
// Console commands:
//   stop, join <name>, leave <name>, say <name> <text>, tps <value>,
//   crash, spam <n>, anything else is echoed.

#include <iostream>
#include <poll.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <string>
#include <time.h>
#include <unistd.h>

static void Info(const std::string &msg) {
  printf("[12:00:00] [Server thread/INFO]: %s\n", msg.c_str());
  fflush(stdout);
}

static int64_t NowMs() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return int64_t(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

static void IgnoreSignal(int sig) {}

int main(int argc, char **argv) {
  bool ready = true;
  bool ignore_stop = false;
  int crash_after_ms = -1;
  int exit_code = 1;
  int ready_delay_ms = 0;
  for (int i = 1; i < argc; i++) {
    if (strcmp(argv[i], "--no-ready") == 0) {
      ready = false;
    } else if (strcmp(argv[i], "--ignore-stop") == 0) {
      ignore_stop = true;
    } else if (strncmp(argv[i], "--crash-after-ms=", 17) == 0) {
      crash_after_ms = atoi(argv[i] + 17);
    } else if (strncmp(argv[i], "--exit-code=", 12) == 0) {
      exit_code = atoi(argv[i] + 12);
    } else if (strncmp(argv[i], "--ready-delay-ms=", 17) == 0) {
      ready_delay_ms = atoi(argv[i] + 17);
    }
  }
  if (ignore_stop) {
    signal(SIGTERM, IgnoreSignal);
    signal(SIGINT, IgnoreSignal);
  }

  int64_t start = NowMs();
  Info("Starting minecraft server version 1.20.4");
  fprintf(stderr, "WARNING: fake server in use\n");
  fflush(stderr);
  if (ready_delay_ms > 0) {
    usleep(ready_delay_ms * 1000);
  }
  if (ready) {
    Info("Done (0.512s)! For help, type \"help\"");
  }

  std::string pending;
  for (;;) {
    int timeout = -1;
    if (crash_after_ms >= 0) {
      int64_t left = start + crash_after_ms - NowMs();
      if (left <= 0) {
        fprintf(stderr, "Exception in server tick loop\n");
        fflush(stderr);
        exit(exit_code);
      }
      timeout = static_cast<int>(left);
    }
    struct pollfd fd = {.fd = STDIN_FILENO, .events = POLLIN};
    int e = poll(&fd, 1, timeout);
    if (e <= 0) {
      continue;
    }
    char buf[4096];
    ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
    if (n <= 0) {
      // Stdin closed, keep running until signalled.
      pause();
      continue;
    }
    pending.append(buf, n);
    size_t nl;
    while ((nl = pending.find('\n')) != std::string::npos) {
      std::string cmd = pending.substr(0, nl);
      pending.erase(0, nl + 1);
      if (cmd == "stop" || cmd == "end" || cmd == "shutdown") {
        if (ignore_stop) {
          Info("Ignoring stop");
          continue;
        }
        Info("Stopping the server");
        exit(0);
      } else if (cmd.rfind("join ", 0) == 0) {
        std::string name = cmd.substr(5);
        Info("UUID of player " + name + " is 069a79f4-44e9-4726-a5be-fca90e38aaf5");
        Info(name + " joined the game");
      } else if (cmd.rfind("leave ", 0) == 0) {
        Info(cmd.substr(6) + " left the game");
      } else if (cmd.rfind("say ", 0) == 0) {
        std::string rest = cmd.substr(4);
        size_t sp = rest.find(' ');
        Info("<" + rest.substr(0, sp) + "> " +
             (sp == std::string::npos ? "" : rest.substr(sp + 1)));
      } else if (cmd.rfind("tps ", 0) == 0) {
        Info("TPS from last 1m, 5m, 15m: " + cmd.substr(4) + ", 20.0, 20.0");
      } else if (cmd.rfind("spam ", 0) == 0) {
        int count = atoi(cmd.c_str() + 5);
        for (int i = 0; i < count; i++) {
          Info("line " + std::to_string(i));
        }
      } else if (cmd == "crash") {
        fprintf(stderr, "Crashing on request\n");
        fflush(stderr);
        exit(exit_code);
      } else {
        Info("echo " + cmd);
      }
    }
  }
}
