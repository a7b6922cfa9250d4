// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "supervisor/child_process.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#if defined(__linux__) && WARDEN_HAVE_PIDFD
#include <linux/wait.h> // For P_PIDFD
#include <syscall.h>
static int pidfd_open(pid_t pid, unsigned int flags) {
  return syscall(__NR_pidfd_open, pid, flags);
}

static int pidfd_send_signal(int pidfd, int sig, siginfo_t *info,
                             unsigned int flags) {
  return syscall(__NR_pidfd_send_signal, pidfd, sig, info, flags);
}
#endif

extern char **environ;

namespace warden {

std::string ExitStatus::ToString() const {
  if (exited) {
    return absl::StrFormat("exited with status %d", status);
  }
  return absl::StrFormat("killed by signal %d (%s)", signal, strsignal(signal));
}

std::string FindExecutable(const std::string &name) {
  if (name.find('/') != std::string::npos) {
    return name;
  }
  const char *path = getenv("PATH");
  if (path == nullptr) {
    return name;
  }
  for (absl::string_view dir : absl::StrSplit(path, ':', absl::SkipEmpty())) {
    std::string candidate = absl::StrFormat("%s/%s", dir, name);
    if (access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }
  return name;
}

static absl::Status SetCloseOnExec(toolbelt::FileDescriptor &fd) {
  int flags = fcntl(fd.Fd(), F_GETFD);
  if (flags == -1 || fcntl(fd.Fd(), F_SETFD, flags | FD_CLOEXEC) == -1) {
    return absl::InternalError(
        absl::StrFormat("Failed to set close-on-exec: %s", strerror(errno)));
  }
  return absl::OkStatus();
}

static absl::Status SetNonBlocking(toolbelt::FileDescriptor &fd) {
  int flags = fcntl(fd.Fd(), F_GETFL);
  if (flags == -1 || fcntl(fd.Fd(), F_SETFL, flags | O_NONBLOCK) == -1) {
    return absl::InternalError(
        absl::StrFormat("Failed to set non-blocking: %s", strerror(errno)));
  }
  return absl::OkStatus();
}

ChildProcess::~ChildProcess() {
  // Don't leave zombies around.  The process is not killed here.
  if (running_) {
    Reap();
  }
}

absl::StatusOr<std::unique_ptr<ChildProcess>>
ChildProcess::Spawn(const SpawnOptions &opts) {
  // Detect a missing executable before the fork so that the caller gets
  // a good error instead of a process that exits immediately.
  std::string exe = FindExecutable(opts.executable);
  struct stat st;
  int e = ::stat(exe.c_str(), &st);
  if (e == -1) {
    return absl::InternalError(
        absl::StrFormat("Can't find executable %s", opts.executable));
  }
  if (!S_ISREG(st.st_mode) ||
      (st.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH)) == 0) {
    return absl::InternalError(
        absl::StrFormat("%s is not a file or is not executable", exe));
  }
  if (!opts.working_dir.empty()) {
    e = ::stat(opts.working_dir.c_str(), &st);
    if (e == -1 || !S_ISDIR(st.st_mode)) {
      return absl::InternalError(absl::StrFormat(
          "Working directory %s does not exist", opts.working_dir));
    }
  }

  std::unique_ptr<ChildProcess> proc(new ChildProcess());

  for (toolbelt::Pipe *p : {&proc->stdin_, &proc->stdout_, &proc->stderr_}) {
    absl::StatusOr<toolbelt::Pipe> pipe = toolbelt::Pipe::Create();
    if (!pipe.ok()) {
      return pipe.status();
    }
    *p = std::move(*pipe);
  }

  // Our ends of the pipes must not leak into other children.
  for (toolbelt::FileDescriptor *fd :
       {&proc->stdin_.WriteFd(), &proc->stdout_.ReadFd(),
        &proc->stderr_.ReadFd()}) {
    if (absl::Status status = SetCloseOnExec(*fd); !status.ok()) {
      return status;
    }
  }
  if (absl::Status status = SetNonBlocking(proc->stdin_.WriteFd());
      !status.ok()) {
    return status;
  }

  // Build everything the child needs before the fork.
  std::vector<const char *> argv;
  argv.push_back(exe.c_str());
  for (auto &arg : opts.args) {
    argv.push_back(arg.c_str());
  }
  argv.push_back(nullptr);

  std::vector<std::string> env_strings;
  for (char **ep = environ; *ep != nullptr; ep++) {
    absl::string_view var(*ep);
    size_t eq = var.find('=');
    std::string name(var.substr(0, eq));
    if (opts.env.find(name) != opts.env.end()) {
      continue;
    }
    env_strings.emplace_back(var);
  }
  for (auto & [ name, value ] : opts.env) {
    env_strings.push_back(absl::StrFormat("%s=%s", name, value));
  }
  std::vector<const char *> env;
  env.reserve(env_strings.size() + 1);
  for (auto &var : env_strings) {
    env.push_back(var.c_str());
  }
  env.push_back(nullptr);

  proc->pid_ = fork();
  if (proc->pid_ == -1) {
    return absl::InternalError(
        absl::StrFormat("Fork failed: %s", strerror(errno)));
  }
  if (proc->pid_ == 0) {
    // Child.  Redirect the standard streams to the pipes.
    if (dup2(proc->stdin_.ReadFd().Fd(), STDIN_FILENO) == -1 ||
        dup2(proc->stdout_.WriteFd().Fd(), STDOUT_FILENO) == -1 ||
        dup2(proc->stderr_.WriteFd().Fd(), STDERR_FILENO) == -1) {
      std::cerr << "Failed to redirect standard streams: " << strerror(errno)
                << std::endl;
      _exit(127);
    }
    proc->stdin_.ReadFd().Reset();
    proc->stdout_.WriteFd().Reset();
    proc->stderr_.WriteFd().Reset();

    if (!opts.working_dir.empty() && chdir(opts.working_dir.c_str()) == -1) {
      std::cerr << "Failed to change directory to " << opts.working_dir << ": "
                << strerror(errno) << std::endl;
      _exit(127);
    }

    // Own process group so that terminal signals to the supervisor don't
    // reach the server directly.
    setpgrp();

    // Default signal handling for the child.
    signal(SIGPIPE, SIG_DFL);
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);

    execve(exe.c_str(),
           reinterpret_cast<char *const *>(const_cast<char **>(argv.data())),
           reinterpret_cast<char *const *>(const_cast<char **>(env.data())));
    std::cerr << "Failed to exec " << argv[0] << ": " << strerror(errno)
              << std::endl;
    _exit(127);
  }
  proc->running_ = true;

#if defined(__linux__) && WARDEN_HAVE_PIDFD
  int pidfd = pidfd_open(proc->pid_, 0);
  if (pidfd == -1) {
    absl::Status status = absl::InternalError(absl::StrFormat(
        "Failed to open pidfd for pid %d: %s", proc->pid_, strerror(errno)));
    kill(proc->pid_, SIGKILL);
    proc->Reap();
    return status;
  }
  proc->pid_fd_.SetFd(pidfd);
#endif

  // Close the child's ends of the pipes in the parent.
  proc->stdin_.ReadFd().Reset();
  proc->stdout_.WriteFd().Reset();
  proc->stderr_.WriteFd().Reset();
  return proc;
}

absl::Status ChildProcess::WriteInput(const std::string &data) {
  if (!stdin_.WriteFd().Valid()) {
    return absl::FailedPreconditionError(
        absl::StrFormat("Input to process %d is closed", pid_));
  }
  const char *buf = data.data();
  size_t remaining = data.size();
  while (remaining > 0) {
    ssize_t n = ::write(stdin_.WriteFd().Fd(), buf, remaining);
    if (n == -1) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN) {
        return absl::UnavailableError(
            absl::StrFormat("Input pipe to process %d is full", pid_));
      }
      return absl::InternalError(absl::StrFormat(
          "Failed to write to process %d: %s", pid_, strerror(errno)));
    }
    remaining -= n;
    buf += n;
  }
  return absl::OkStatus();
}

absl::Status ChildProcess::Signal(int sig) {
  if (!running_) {
    return absl::FailedPreconditionError(
        absl::StrFormat("Process %d is not running", pid_));
  }
#if defined(__linux__) && WARDEN_HAVE_PIDFD
  int e = pidfd_send_signal(pid_fd_.Fd(), sig, nullptr, 0);
#else
  int e = kill(pid_, sig);
#endif
  if (e != 0) {
    return absl::InternalError(absl::StrFormat(
        "Failed to send signal %d to pid %d: %s", sig, pid_, strerror(errno)));
  }
  return absl::OkStatus();
}

void ChildProcess::SetExitStatus(int wait_status) {
  running_ = false;
  if (WIFEXITED(wait_status)) {
    exit_status_ = {.exited = true, .status = WEXITSTATUS(wait_status)};
  } else if (WIFSIGNALED(wait_status)) {
    exit_status_ = {.exited = false, .signal = WTERMSIG(wait_status)};
  }
}

bool ChildProcess::Reap() {
  if (!running_) {
    return true;
  }
  int status = 0;
  pid_t pid = waitpid(pid_, &status, WNOHANG);
  if (pid == 0) {
    // Process is running.
    return false;
  }
  if (pid == pid_) {
    SetExitStatus(status);
    return true;
  }
  // Someone else reaped it.  We can't know how it died.
  running_ = false;
  exit_status_ = {.exited = false, .signal = 0};
  return true;
}

ExitStatus ChildProcess::WaitForExit(co::Coroutine *c) {
#if defined(__linux__) && WARDEN_HAVE_PIDFD
  while (running_) {
    c->Wait(pid_fd_.Fd(), POLLIN);
    if (Reap()) {
      break;
    }
  }
#else
  constexpr int kWaitTimeMs = 50;
  while (!Reap()) {
    c->Millisleep(kWaitTimeMs);
  }
#endif
  return exit_status_;
}

} // namespace warden
