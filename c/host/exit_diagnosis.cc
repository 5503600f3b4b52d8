// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#include <safepix/exit_diagnosis.h>

#include <signal.h>

namespace safepix {

namespace {

// Base of the error codes the worker uses for its own failures.
const int kErrorShift = 100;
// Shell convention for "terminated by signal".
const int kSignalShift = 128;

}  // namespace

ExitDiagnoser::ExitDiagnoser() {
  Register(0, WorkerFailure::UNEXPECTED_EXIT,
           "The conversion process exited without producing any output");
  Register(1, WorkerFailure::UNSPECIFIED, "Unspecified error");

  Register(kErrorShift + 10, WorkerFailure::DOC_FORMAT_UNSUPPORTED,
           "The document format is not supported");
  Register(kErrorShift + 20, WorkerFailure::CONVERTER_FAILURE,
           "Converting the document to PDF failed");
  Register(kErrorShift + 30, WorkerFailure::INVALID_INTERMEDIATE,
           "Invalid intermediate conversion");
  Register(kErrorShift + 40, WorkerFailure::PAGE_COUNT_ERROR,
           "Unable to get page count");
  Register(kErrorShift + 41, WorkerFailure::NO_PAGE_COUNT,
           "The number of pages could not be extracted");
  Register(kErrorShift + 42, WorkerFailure::MAX_PAGES_EXCEEDED,
           "The number of pages exceeds the maximum supported");
  Register(kErrorShift + 43, WorkerFailure::PAGE_COUNT_MISMATCH,
           "The number of pages changed during the conversion");
  Register(kErrorShift + 50, WorkerFailure::RASTERIZER_FAILURE,
           "Converting the document pages to pixels failed");
  Register(kErrorShift + 51, WorkerFailure::RASTERIZER_INVALID_HEADER,
           "The rasterizer produced an invalid page header");
  Register(kErrorShift + 52, WorkerFailure::RASTERIZER_INVALID_DEPTH,
           "The rasterizer produced an unexpected color depth");

  Register(126, WorkerFailure::WORKER_LAUNCH_FAILED,
           "The conversion process could not be executed");
  Register(127, WorkerFailure::WORKER_LAUNCH_FAILED,
           "The conversion process could not be found");

  Register(kSignalShift + SIGKILL, WorkerFailure::RESOURCE_LIMIT,
           "The conversion process was killed, most likely because it "
           "exceeded a resource limit");
  Register(kSignalShift + SIGSEGV, WorkerFailure::WORKER_CRASHED,
           "The conversion process crashed");
  Register(kSignalShift + SIGBUS, WorkerFailure::WORKER_CRASHED,
           "The conversion process crashed");
  Register(kSignalShift + SIGABRT, WorkerFailure::WORKER_CRASHED,
           "The conversion process crashed");
  Register(kSignalShift + SIGILL, WorkerFailure::WORKER_CRASHED,
           "The conversion process crashed");
  Register(kSignalShift + SIGFPE, WorkerFailure::WORKER_CRASHED,
           "The conversion process crashed");
  Register(kSignalShift + SIGTERM, WorkerFailure::INTERRUPTED,
           "Something interrupted the conversion and it could not be "
           "completed");
  Register(kSignalShift + SIGINT, WorkerFailure::INTERRUPTED,
           "Something interrupted the conversion and it could not be "
           "completed");

  Register(kExitCodeTimedOut, WorkerFailure::TIMED_OUT,
           "The conversion process did not finish in time");
}

void ExitDiagnoser::Register(int exit_code, WorkerFailure cause,
                             const std::string& message) {
  Entry& entry = table_[exit_code];
  entry.cause = cause;
  entry.message = message;
}

ExitDiagnosis ExitDiagnoser::Diagnose(int exit_code) const {
  ExitDiagnosis result;
  result.exit_code = exit_code;
  std::map<int, Entry>::const_iterator it = table_.find(exit_code);
  if (it != table_.end()) {
    result.cause = it->second.cause;
    result.message = it->second.message;
  } else {
    result.cause = WorkerFailure::UNKNOWN;
    result.message =
        "The conversion process failed with code " + std::to_string(exit_code);
  }
  return result;
}

const ExitDiagnoser& DefaultExitDiagnoser() {
  static const ExitDiagnoser* instance = new ExitDiagnoser();
  return *instance;
}

const char* WorkerFailureName(WorkerFailure cause) {
  switch (cause) {
    case WorkerFailure::UNKNOWN: return "UNKNOWN";
    case WorkerFailure::UNEXPECTED_EXIT: return "UNEXPECTED_EXIT";
    case WorkerFailure::UNSPECIFIED: return "UNSPECIFIED";
    case WorkerFailure::DOC_FORMAT_UNSUPPORTED: return "DOC_FORMAT_UNSUPPORTED";
    case WorkerFailure::CONVERTER_FAILURE: return "CONVERTER_FAILURE";
    case WorkerFailure::INVALID_INTERMEDIATE: return "INVALID_INTERMEDIATE";
    case WorkerFailure::PAGE_COUNT_ERROR: return "PAGE_COUNT_ERROR";
    case WorkerFailure::NO_PAGE_COUNT: return "NO_PAGE_COUNT";
    case WorkerFailure::MAX_PAGES_EXCEEDED: return "MAX_PAGES_EXCEEDED";
    case WorkerFailure::PAGE_COUNT_MISMATCH: return "PAGE_COUNT_MISMATCH";
    case WorkerFailure::RASTERIZER_FAILURE: return "RASTERIZER_FAILURE";
    case WorkerFailure::RASTERIZER_INVALID_HEADER:
      return "RASTERIZER_INVALID_HEADER";
    case WorkerFailure::RASTERIZER_INVALID_DEPTH:
      return "RASTERIZER_INVALID_DEPTH";
    case WorkerFailure::WORKER_LAUNCH_FAILED: return "WORKER_LAUNCH_FAILED";
    case WorkerFailure::RESOURCE_LIMIT: return "RESOURCE_LIMIT";
    case WorkerFailure::WORKER_CRASHED: return "WORKER_CRASHED";
    case WorkerFailure::INTERRUPTED: return "INTERRUPTED";
    case WorkerFailure::TIMED_OUT: return "TIMED_OUT";
  }
  return "UNKNOWN";
}

}  // namespace safepix
