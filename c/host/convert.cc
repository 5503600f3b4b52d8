// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#include <safepix/convert.h>

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <mutex>   // NOLINT(build/c++11)
#include <thread>  // NOLINT(build/c++11)
#include <utility>

#include "../common/constants.h"
#include "../common/file_util.h"
#include "../common/platform.h"
#include <safepix/sidecar.h>
#include "./framed_reader.h"
#include "./page_sink.h"
#include "./protocol_decoder.h"
#include "./time_budget.h"
#include "./worker_process.h"

namespace safepix {

using ::safepix::internal::host::BytesToMiB;
using ::safepix::internal::host::CalculateTimeout;
using ::safepix::internal::host::DecoderOptions;
using ::safepix::internal::host::FramedReader;
using ::safepix::internal::host::PageSink;
using ::safepix::internal::host::ProtocolDecoder;
using ::safepix::internal::host::SecondsToMilliseconds;
using ::safepix::internal::host::TimeBudget;
using ::safepix::internal::host::TimeoutPolicy;
using ::safepix::internal::host::WorkerProcess;

namespace {

const char kDefaultStagingDir[] = "/tmp/safepix";
const char kConvertedFileName[] = "safe-output-compressed.pdf";
const int kDefaultExitWaitMs = 5000;

// Held for the whole duration of a conversion.
std::mutex& SessionMutex() {
  static std::mutex* mutex = new std::mutex();
  return *mutex;
}

std::string FailureMessage(SafepixStatus status) {
  switch (status) {
    case SAFEPIX_SHORT_READ:
      return "The conversion process sent incomplete data";
    case SAFEPIX_EMPTY_RESULT:
      return "The document has no pages";
    case SAFEPIX_TOO_MANY_PAGES:
      return "The number of pages exceeds the maximum supported";
    case SAFEPIX_PAGE_TOO_LARGE:
      return "A page of the document is too large";
    case SAFEPIX_ASSEMBLY_ERROR:
      return "Creating the safe PDF failed";
    default:
      return std::string("Conversion failed: ") + SafepixStatusString(status);
  }
}

/**
 * Worker plus the thread feeding its stdin in developer mode.
 *
 * On destruction, a worker that is still running is killed; this also
 * unblocks the feeder, which is then joined.
 */
class Session {
 public:
  Session() {}
  ~Session() { Finish(0); }

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  WorkerProcess* worker() { return &worker_; }

  // Kills the worker right away.
  void Abort() { Finish(0); }

  // Starts writing the sidecar bundle and the document to the worker stdin.
  void StartFeeding(std::vector<uint8_t>&& bundle, std::string&& document) {
    feeder_ = std::thread(&Session::Feed, this, std::move(bundle),
                          std::move(document));
  }

  // Gives the worker |exit_wait_ms| to exit on its own.
  void Finish(int exit_wait_ms) {
    if (worker_.is_running() &&
        worker_.Wait(exit_wait_ms) == kExitCodeTimedOut) {
      worker_.Kill();
    }
    if (feeder_.joinable()) feeder_.join();
  }

 private:
  void Feed(std::vector<uint8_t> bundle, std::string document) {
    const int fd = worker_.stdin_fd();
    SafepixStatus status = TeleportPayload(fd, bundle.data(), bundle.size());
    if (status == SAFEPIX_OK &&
        !WriteToFd(fd, reinterpret_cast<const uint8_t*>(document.data()),
                   document.size())) {
      status = SAFEPIX_IO_ERROR;
    }
    if (status != SAFEPIX_OK) {
      // The worker exit code tells more; the decoder will report it.
      SAFEPIX_LOG_WARNING() << "Failed to feed the worker" << SAFEPIX_ENDL();
    }
    worker_.CloseStdin();
  }

  WorkerProcess worker_;
  std::thread feeder_;
};

// Reads at most |max_chars| of the worker diagnostics within |timeout_ms|.
void LogWorkerOutput(int stderr_fd, int timeout_ms, size_t max_chars) {
  FramedReader reader(stderr_fd);
  std::vector<uint8_t> untrusted_log;
  if (reader.ReadUpTo(max_chars, timeout_ms, &untrusted_log) != SAFEPIX_OK) {
    SAFEPIX_LOG_WARNING() << "Failed to read the conversion output"
                          << SAFEPIX_ENDL();
    return;
  }
  std::string text(untrusted_log.begin(), untrusted_log.end());
  SAFEPIX_LOG_INFO() << "Conversion output (doc to pixels)\n"
                     << "----- DOC TO PIXELS LOG START -----\n"
                     << SanitizeWorkerLog(text)
                     << "----- DOC TO PIXELS LOG END -----" << SAFEPIX_ENDL();
}

}  // namespace

bool DevModeFromEnvironment() {
  const char* value = getenv(kDevModeEnv);
  return value != nullptr && std::string(value) == "1";
}

std::vector<std::string> DefaultWorkerCommand(bool dev_mode) {
  std::vector<std::string> command;
  command.push_back("/usr/bin/qrexec-client-vm");
  command.push_back("@dispvm:dz-dvm");
  command.push_back(dev_mode ? "dz.ConvertDev" : "dz.Convert");
  return command;
}

ConvertOptions::ConvertOptions()
    : dev_mode(DevModeFromEnvironment()),
      staging_dir(kDefaultStagingDir),
      startup_seconds(kStartupTimeSeconds),
      min_timeout_seconds(kTimeoutMin),
      timeout_per_mib_seconds(kTimeoutPerMiB),
      timeout_per_page_seconds(kTimeoutPerPage),
      max_pages(kMaxPages),
      max_page_width(kMaxPageWidth),
      max_page_height(kMaxPageHeight),
      exit_wait_ms(kDefaultExitWaitMs),
      max_log_chars(kMaxConversionLogChars),
      diagnoser(nullptr) {}

std::string SanitizeWorkerLog(const std::string& text) {
  std::string result(text);
  for (size_t i = 0; i < result.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(result[i]);
    if (c == '\n' || c == '\t') continue;
    if (c < 0x20 || c >= 0x7F) result[i] = '?';
  }
  if (!result.empty() && result[result.size() - 1] != '\n') result += '\n';
  return result;
}

SafepixStatus Convert(Document* document, const std::string& ocr_lang,
                      const ConvertOptions& options,
                      const ProgressReporter& progress) {
  if (document == nullptr) return SAFEPIX_INVALID_PARAM;
  std::unique_lock<std::mutex> lock(SessionMutex(), std::try_to_lock);
  if (!lock.owns_lock()) {
    SAFEPIX_LOG_ERROR() << "Another conversion is in progress"
                        << SAFEPIX_ENDL();
    return SAFEPIX_BUSY;
  }

  const auto report = [document, &progress](bool error,
                                            const std::string& text,
                                            double percentage) {
    if (error) document->MarkAsFailed();
    if (progress) progress(document, error, text, percentage);
  };
  const auto fail = [&report](SafepixStatus status, const std::string& text,
                              double percentage) -> SafepixStatus {
    report(true, text, percentage);
    return status;
  };

  document->MarkAsConverting();
  const std::string converted_path =
      options.converted_path.empty()
          ? JoinPath(options.staging_dir, kConvertedFileName)
          : options.converted_path;

  PageSink sink(options.staging_dir);
  SafepixStatus status = sink.Reset();
  if (status != SAFEPIX_OK) {
    return fail(status, "Failed to prepare the staging directory", 0.0);
  }
  if (!RemoveFileIfExists(converted_path)) {
    return fail(SAFEPIX_IO_ERROR, "Failed to remove a previous result", 0.0);
  }

  uint64_t input_size = 0;
  if (!GetFileSize(document->input_filename(), &input_size)) {
    return fail(SAFEPIX_IO_ERROR, "Failed to open the document", 0.0);
  }

  std::vector<std::string> command = options.worker_command;
  if (command.empty()) command = DefaultWorkerCommand(options.dev_mode);

  Session session;
  WorkerProcess* worker = session.worker();
  if (options.dev_mode) {
    if (options.sidecar_dir.empty()) {
      return fail(SAFEPIX_INVALID_PARAM,
                  "Developer mode requires a sidecar directory", 0.0);
    }
    std::vector<uint8_t> bundle;
    status = BundleDirectory(options.sidecar_dir, &bundle);
    if (status != SAFEPIX_OK) {
      return fail(status, "Failed to bundle the sidecar directory", 0.0);
    }
    std::string content;
    if (!ReadFile(document->input_filename(), &content)) {
      return fail(SAFEPIX_IO_ERROR, "Failed to read the document", 0.0);
    }
    status = worker->Spawn(command, -1, true);
    if (status != SAFEPIX_OK) {
      return fail(status, "Failed to start the conversion process", 0.0);
    }
    session.StartFeeding(std::move(bundle), std::move(content));
  } else {
    int input_fd = open(document->input_filename().c_str(),
                        O_RDONLY | O_CLOEXEC);
    if (input_fd < 0) {
      return fail(SAFEPIX_IO_ERROR, "Failed to open the document", 0.0);
    }
    status = worker->Spawn(command, input_fd, false);
    close(input_fd);
    if (status != SAFEPIX_OK) {
      return fail(status, "Failed to start the conversion process", 0.0);
    }
  }

  const bool ocr = !ocr_lang.empty();
  DecoderOptions decoder_options;
  decoder_options.input_size = input_size;
  decoder_options.ocr = ocr;
  decoder_options.max_pages = options.max_pages;
  decoder_options.max_page_width = options.max_page_width;
  decoder_options.max_page_height = options.max_page_height;
  decoder_options.exit_wait_ms = options.exit_wait_ms;

  TimeoutPolicy policy;
  policy.startup_seconds = options.startup_seconds;
  policy.min_seconds = options.min_timeout_seconds;
  policy.seconds_per_mib = options.timeout_per_mib_seconds;
  policy.seconds_per_page = options.timeout_per_page_seconds;
  TimeBudget budget(policy);
  budget.Start(input_size);
  FramedReader reader(worker->ReleaseStdout());
  const ExitDiagnoser* diagnoser =
      options.diagnoser ? options.diagnoser : &DefaultExitDiagnoser();
  ProtocolDecoder decoder(
      &reader, &budget, &sink, diagnoser,
      [worker](int timeout_ms) { return worker->Wait(timeout_ms); },
      [&report](bool error, const std::string& text, double percentage) {
        report(error, text, percentage);
      },
      decoder_options);
  status = decoder.Decode();
  const double percentage = decoder.state().percentage;
  if (status != SAFEPIX_OK) {
    if (options.dev_mode) {
      // Bounded by the exit grace period and by the session budget.
      session.Abort();
      LogWorkerOutput(worker->ReleaseStderr(),
                      std::min(options.exit_wait_ms, budget.Remaining()),
                      options.max_log_chars);
    }
    const std::string text = decoder.state().has_diagnosis
                                 ? decoder.state().diagnosis.message
                                 : FailureMessage(status);
    return fail(status, text, percentage);
  }

  if (options.dev_mode) {
    LogWorkerOutput(worker->ReleaseStderr(),
                    SecondsToMilliseconds(
                        CalculateTimeout(BytesToMiB(input_size), 0, policy)),
                    options.max_log_chars);
  }
  session.Finish(options.exit_wait_ms);

  const ProgressCallback assembly_progress =
      [&report](bool error, const std::string& text, double value) {
        report(error, text, value);
      };
  if (options.assembler) {
    status = options.assembler(ocr_lang, assembly_progress);
  } else {
    PixelsToPdf pixels_to_pdf(options.staging_dir, decoder.state().num_pages,
                              converted_path, percentage);
    status = pixels_to_pdf.Convert(ocr_lang, assembly_progress);
  }
  if (status != SAFEPIX_OK) {
    return fail(status, FailureMessage(status), percentage);
  }

  report(false, "Safe PDF created", 100.0);
  if (!MoveFile(converted_path, document->output_filename())) {
    return fail(SAFEPIX_IO_ERROR, "Failed to move the safe PDF to " +
                                      document->output_filename(),
                100.0);
  }
  document->MarkAsSafe();
  return SAFEPIX_OK;
}

}  // namespace safepix
