// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

// Mapping of worker exit codes to user-facing failure causes.

#ifndef SAFEPIX_HOST_EXIT_DIAGNOSIS_H_
#define SAFEPIX_HOST_EXIT_DIAGNOSIS_H_

#include <map>
#include <string>

namespace safepix {

enum struct WorkerFailure {
  UNKNOWN = 0,
  UNEXPECTED_EXIT,
  UNSPECIFIED,
  DOC_FORMAT_UNSUPPORTED,
  CONVERTER_FAILURE,
  INVALID_INTERMEDIATE,
  PAGE_COUNT_ERROR,
  NO_PAGE_COUNT,
  MAX_PAGES_EXCEEDED,
  PAGE_COUNT_MISMATCH,
  RASTERIZER_FAILURE,
  RASTERIZER_INVALID_HEADER,
  RASTERIZER_INVALID_DEPTH,
  WORKER_LAUNCH_FAILED,
  RESOURCE_LIMIT,
  WORKER_CRASHED,
  INTERRUPTED,
  TIMED_OUT,
};

// Exit code used when the worker did not exit before the deadline.
static const int kExitCodeTimedOut = -1;

struct ExitDiagnosis {
  int exit_code = 0;
  WorkerFailure cause = WorkerFailure::UNKNOWN;
  std::string message;
};

// Table of known exit codes. Processes killed by signal N are expected to be
// reported with exit code 128 + N.
class ExitDiagnoser {
 public:
  ExitDiagnoser();

  ExitDiagnosis Diagnose(int exit_code) const;

  // Overrides or extends the table.
  void Register(int exit_code, WorkerFailure cause, const std::string& message);

 private:
  struct Entry {
    WorkerFailure cause;
    std::string message;
  };
  std::map<int, Entry> table_;
};

// Shared instance with the built-in table; constructed on first use.
const ExitDiagnoser& DefaultExitDiagnoser();

const char* WorkerFailureName(WorkerFailure cause);

}  // namespace safepix

#endif  // SAFEPIX_HOST_EXIT_DIAGNOSIS_H_
