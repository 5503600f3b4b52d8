// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

/* API for converting an untrusted document into a safe PDF */

#ifndef SAFEPIX_HOST_CONVERT_H_
#define SAFEPIX_HOST_CONVERT_H_

#include <string>
#include <vector>

#include <safepix/document.h>
#include <safepix/exit_diagnosis.h>
#include <safepix/pixels_to_pdf.h>
#include <safepix/progress.h>
#include <safepix/status.h>
#include <safepix/types.h>

namespace safepix {

// Environment variable that turns developer mode on by default.
static const char kDevModeEnv[] = "SAFEPIX_DEV";

// Returns true if kDevModeEnv is set to "1".
bool DevModeFromEnvironment();

// Worker invocation used when ConvertOptions::worker_command is empty.
std::vector<std::string> DefaultWorkerCommand(bool dev_mode);

struct ConvertOptions {
  ConvertOptions();

  // argv of the isolated worker; it reads the document on stdin and writes
  // the pixel stream to stdout.
  std::vector<std::string> worker_command;

  // Send |sidecar_dir| ahead of the document and collect the worker's
  // diagnostic output.
  bool dev_mode;
  std::string sidecar_dir;

  // Receives the staged pages; wiped before every session.
  std::string staging_dir;
  // Where the assembler writes the PDF before it is moved to the document's
  // output file name. Defaults to a file in |staging_dir|.
  std::string converted_path;

  // Session timeout, in seconds: startup allowance before the page count,
  // then max(min, per_mib * MiB + per_page * pages).
  double startup_seconds;
  double min_timeout_seconds;
  double timeout_per_mib_seconds;
  double timeout_per_page_seconds;
  uint32_t max_pages;
  uint32_t max_page_width;
  uint32_t max_page_height;
  // Bound on waiting for the worker exit status after a failed read.
  int exit_wait_ms;
  size_t max_log_chars;

  // Replaces PixelsToPdf when set.
  PdfAssembler assembler;
  // Defaults to DefaultExitDiagnoser() when null.
  const ExitDiagnoser* diagnoser;
};

/**
 * Converts |document| and moves the result to its output file name.
 *
 * Only one conversion may run per process; a concurrent call returns
 * SAFEPIX_BUSY without touching |document|. On failure the document is
 * marked as failed and the cause is reported once through |progress| as an
 * error. An empty |ocr_lang| disables OCR.
 *
 * In developer mode the worker stdin is a pipe, and the process-wide SIGPIPE
 * disposition is set to SIG_IGN so that a worker exiting early cannot kill
 * the host. It is not restored; embedders relying on SIGPIPE must reinstall
 * their handler.
 */
SafepixStatus Convert(Document* document, const std::string& ocr_lang,
                      const ConvertOptions& options,
                      const ProgressReporter& progress);

// Replaces control and non-ASCII characters of worker diagnostic text.
std::string SanitizeWorkerLog(const std::string& text);

}  // namespace safepix

#endif  // SAFEPIX_HOST_CONVERT_H_
