// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include <safepix/convert.h>
#include <safepix/document.h>
#include <safepix/status.h>

namespace {

void PrintUsage() {
  fprintf(stderr,
          "Usage: safepix [OPTIONS] FILE [OUTPUT_FILE, default=FILE-safe.pdf]\n"
          "  --ocr-lang=LANG      request OCR in LANG\n"
          "  --dev                developer mode (also SAFEPIX_DEV=1)\n"
          "  --sidecar-dir=DIR    directory sent to the worker in dev mode\n"
          "  --staging-dir=DIR    where pages are staged [/tmp/safepix]\n"
          "  --worker=PROGRAM     worker program [qrexec-client-vm]\n"
          "  --worker-arg=ARG     worker argument; may be repeated\n");
}

bool StartsWith(const std::string& arg, const std::string& prefix,
                std::string* value) {
  if (arg.compare(0, prefix.size(), prefix) != 0) return false;
  *value = arg.substr(prefix.size());
  return true;
}

void PrintProgress(safepix::Document* document, bool error,
                   const std::string& text, double percentage) {
  fprintf(error ? stderr : stdout, "%s [%5.1f%%] %s%s\n",
          document->input_filename().c_str(), percentage,
          error ? "ERROR: " : "", text.c_str());
  fflush(error ? stderr : stdout);
}

}  // namespace

int main(int argc, char** argv) {
  safepix::ConvertOptions options;
  std::string ocr_lang;
  std::string worker_program;
  std::vector<std::string> worker_args;
  std::vector<std::string> files;

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);
    std::string value;
    if (arg == "--dev") {
      options.dev_mode = true;
    } else if (StartsWith(arg, "--ocr-lang=", &value)) {
      ocr_lang = value;
    } else if (StartsWith(arg, "--sidecar-dir=", &value)) {
      options.sidecar_dir = value;
    } else if (StartsWith(arg, "--staging-dir=", &value)) {
      options.staging_dir = value;
    } else if (StartsWith(arg, "--worker=", &value)) {
      worker_program = value;
    } else if (StartsWith(arg, "--worker-arg=", &value)) {
      worker_args.push_back(value);
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage();
      return EXIT_SUCCESS;
    } else if (arg.size() > 1 && arg[0] == '-') {
      fprintf(stderr, "Unknown option: %s\n", arg.c_str());
      PrintUsage();
      return EXIT_FAILURE;
    } else {
      files.push_back(arg);
    }
  }

  if (files.size() != 1 && files.size() != 2) {
    PrintUsage();
    return EXIT_FAILURE;
  }
  if (files[0].empty()) {
    fprintf(stderr, "Empty input file name.\n");
    return EXIT_FAILURE;
  }
  if (!worker_program.empty()) {
    options.worker_command.push_back(worker_program);
    options.worker_command.insert(options.worker_command.end(),
                                  worker_args.begin(), worker_args.end());
  } else if (!worker_args.empty()) {
    fprintf(stderr, "--worker-arg requires --worker.\n");
    return EXIT_FAILURE;
  }

  safepix::Document document(files[0],
                             files.size() == 2 ? files[1] : std::string());
  safepix::SafepixStatus status =
      safepix::Convert(&document, ocr_lang, options, PrintProgress);
  if (status != safepix::SAFEPIX_OK) {
    fprintf(stderr, "Conversion of %s failed: %s\n", files[0].c_str(),
            safepix::SafepixStatusString(status));
    return EXIT_FAILURE;
  }
  fprintf(stdout, "Safe PDF written to %s\n",
          document.output_filename().c_str());
  return EXIT_SUCCESS;
}
