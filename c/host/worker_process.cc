// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#include "./worker_process.h"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>  // NOLINT(build/c++11)
#include <thread>  // NOLINT(build/c++11)

#include "../common/constants.h"
#include "../common/platform.h"
#include <safepix/exit_diagnosis.h>

namespace safepix {
namespace internal {
namespace host {

namespace {

void CloseFd(int* fd) {
  if (*fd >= 0) {
    close(*fd);
    *fd = -1;
  }
}

void ClosePipe(int fds[2]) {
  CloseFd(&fds[0]);
  CloseFd(&fds[1]);
}

}  // namespace

WorkerProcess::~WorkerProcess() {
  CloseFd(&stdin_fd_);
  CloseFd(&stdout_fd_);
  CloseFd(&stderr_fd_);
  if (is_running()) Kill();
}

SafepixStatus WorkerProcess::Spawn(const std::vector<std::string>& argv,
                                   int stdin_fd, bool capture_stderr) {
  if (argv.empty() || pid_ > 0) return SAFEPIX_INVALID_PARAM;

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  bool ok = pipe2(out_pipe, O_CLOEXEC) == 0;
  if (ok && stdin_fd < 0) ok = pipe2(in_pipe, O_CLOEXEC) == 0;
  if (ok && capture_stderr) ok = pipe2(err_pipe, O_CLOEXEC) == 0;
  if (!ok) {
    SAFEPIX_LOG_ERROR() << "Failed to create pipes: " << strerror(errno)
                        << SAFEPIX_ENDL();
    ClosePipe(in_pipe);
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    return SAFEPIX_IO_ERROR;
  }

  // Prepared before fork; the child must not allocate.
  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (size_t i = 0; i < argv.size(); ++i) {
    args.push_back(const_cast<char*>(argv[i].c_str()));
  }
  args.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    SAFEPIX_LOG_ERROR() << "fork failed: " << strerror(errno)
                        << SAFEPIX_ENDL();
    ClosePipe(in_pipe);
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    return SAFEPIX_IO_ERROR;
  }

  if (pid == 0) {
    int child_in = (stdin_fd >= 0) ? stdin_fd : in_pipe[0];
    int child_err = capture_stderr ? err_pipe[1] : open("/dev/null", O_WRONLY);
    if (dup2(child_in, STDIN_FILENO) < 0 ||
        dup2(out_pipe[1], STDOUT_FILENO) < 0 || child_err < 0 ||
        dup2(child_err, STDERR_FILENO) < 0) {
      _exit(126);
    }
    signal(SIGPIPE, SIG_DFL);
    execvp(args[0], args.data());
    _exit(errno == ENOENT ? 127 : 126);
  }

  pid_ = pid;
  exited_ = false;
  CloseFd(&in_pipe[0]);
  CloseFd(&out_pipe[1]);
  CloseFd(&err_pipe[1]);
  stdin_fd_ = in_pipe[1];
  stdout_fd_ = out_pipe[0];
  stderr_fd_ = err_pipe[0];
  if (stdin_fd_ >= 0) {
    // A worker that dies early must not take the host down with SIGPIPE;
    // writes report EPIPE instead.
    signal(SIGPIPE, SIG_IGN);
  }
  SAFEPIX_LOG_DEBUG() << "Started worker " << argv[0] << " as pid " << pid_
                      << SAFEPIX_ENDL();
  return SAFEPIX_OK;
}

int WorkerProcess::ReleaseStdout() {
  int fd = stdout_fd_;
  stdout_fd_ = -1;
  return fd;
}

int WorkerProcess::ReleaseStderr() {
  int fd = stderr_fd_;
  stderr_fd_ = -1;
  return fd;
}

void WorkerProcess::CloseStdin() { CloseFd(&stdin_fd_); }

bool WorkerProcess::Reap(bool block) {
  if (pid_ <= 0) return false;
  if (exited_) return true;
  int status = 0;
  pid_t result;
  do {
    result = waitpid(pid_, &status, block ? 0 : WNOHANG);
  } while (result < 0 && errno == EINTR);
  if (result == 0) return false;
  if (result < 0) {
    SAFEPIX_LOG_ERROR() << "waitpid failed: " << strerror(errno)
                        << SAFEPIX_ENDL();
    // The child is gone as far as we can tell.
    exited_ = true;
    exit_code_ = kExitCodeTimedOut;
    return true;
  }
  exited_ = true;
  if (WIFEXITED(status)) {
    exit_code_ = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit_code_ = 128 + WTERMSIG(status);
  } else {
    exit_code_ = kExitCodeTimedOut;
  }
  return true;
}

int WorkerProcess::Wait(int timeout_ms) {
  if (pid_ <= 0) return kExitCodeTimedOut;
  const std::chrono::steady_clock::time_point deadline =
      std::chrono::steady_clock::now() +
      std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms);
  while (!Reap(false)) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return kExitCodeTimedOut;
    }
    std::this_thread::sleep_for(
        std::chrono::milliseconds(kWaitPollIntervalMs));
  }
  return exit_code_;
}

void WorkerProcess::Kill() {
  if (!is_running()) return;
  SAFEPIX_LOG_WARNING() << "Killing worker pid " << pid_ << SAFEPIX_ENDL();
  kill(pid_, SIGKILL);
  Reap(true);
}

}  // namespace host
}  // namespace internal
}  // namespace safepix
