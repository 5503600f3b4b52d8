// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

// Launching of the isolated worker and access to its standard streams.

#ifndef SAFEPIX_HOST_WORKER_PROCESS_H_
#define SAFEPIX_HOST_WORKER_PROCESS_H_

#include <sys/types.h>

#include <string>
#include <vector>

#include <safepix/status.h>

namespace safepix {
namespace internal {
namespace host {

class WorkerProcess {
 public:
  WorkerProcess() {}
  // Closes remaining descriptors; kills and reaps a still running worker.
  ~WorkerProcess();

  WorkerProcess(const WorkerProcess&) = delete;
  WorkerProcess& operator=(const WorkerProcess&) = delete;

  // Starts |argv| (argv[0] is looked up in PATH). If |stdin_fd| >= 0, the
  // worker reads it directly; otherwise a pipe is created and exposed via
  // stdin_fd(). stderr is piped if |capture_stderr|, else sent to /dev/null.
  // Creating the stdin pipe makes the host ignore SIGPIPE for good.
  SafepixStatus Spawn(const std::vector<std::string>& argv, int stdin_fd,
                      bool capture_stderr);

  // Descriptors are owned by the process object until released.
  int stdin_fd() const { return stdin_fd_; }
  int ReleaseStdout();
  int ReleaseStderr();

  void CloseStdin();

  // Waits at most |timeout_ms| for the worker to exit. Returns the exit
  // code (128 + N when killed by signal N), or kExitCodeTimedOut.
  int Wait(int timeout_ms);

  void Kill();

  bool is_running() const { return pid_ > 0 && !exited_; }
  pid_t pid() const { return pid_; }

 private:
  bool Reap(bool block);

  pid_t pid_ = -1;
  bool exited_ = false;
  int exit_code_ = 0;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;
};

}  // namespace host
}  // namespace internal
}  // namespace safepix

#endif  // SAFEPIX_HOST_WORKER_PROCESS_H_
