// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "toolbelt/fd.h"
#include "toolbelt/pipe.h"

#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

#include "coroutine.h"

namespace warden {

struct SpawnOptions {
  // Absolute path or a bare name looked up in PATH.
  std::string executable;
  std::vector<std::string> args;
  std::string working_dir;
  // Added to (or replacing) the supervisor's environment.
  absl::flat_hash_map<std::string, std::string> env;
};

struct ExitStatus {
  bool exited = false; // False if terminated by a signal.
  int status = 0;      // Exit status if exited.
  int signal = 0;      // Signal number if not exited.

  bool Clean() const { return exited && status == 0; }
  std::string ToString() const;
};

// A child process with pipes connected to its stdin, stdout and stderr.
// On Linux a pidfd is used to notify us of the exit.
class ChildProcess {
public:
  ~ChildProcess();

  static absl::StatusOr<std::unique_ptr<ChildProcess>>
  Spawn(const SpawnOptions &opts);

  int GetPid() const { return pid_; }
  bool IsRunning() const { return running_; }

  int StdoutFd() { return stdout_.ReadFd().Fd(); }
  int StderrFd() { return stderr_.ReadFd().Fd(); }

  // Writes all of data to the process's stdin without blocking.  Fails with
  // Unavailable if the pipe is full.
  absl::Status WriteInput(const std::string &data);

  // Close the stdin pipe.  The process sees EOF.
  void CloseInput() { stdin_.WriteFd().Reset(); }

  absl::Status Signal(int sig);

  // Wait until the process exits and reap it.  Yields to other coroutines
  // while waiting.
  ExitStatus WaitForExit(co::Coroutine *c);

  // Non-blocking reap.  Returns true if the process has exited.
  bool Reap();

  const ExitStatus &GetExitStatus() const { return exit_status_; }

private:
  ChildProcess() = default;

  void SetExitStatus(int wait_status);

  pid_t pid_ = 0;
  bool running_ = false;
  toolbelt::FileDescriptor pid_fd_;
  toolbelt::Pipe stdin_;
  toolbelt::Pipe stdout_;
  toolbelt::Pipe stderr_;
  ExitStatus exit_status_;
};

// Looks up a bare program name in PATH.  Names containing a slash are
// returned as is.
std::string FindExecutable(const std::string &name);

} // namespace warden
