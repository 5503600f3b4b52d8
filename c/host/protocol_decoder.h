// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

// Decoder of the pixel stream produced by the isolated worker.
//
// Wire format (all integers big-endian):
//   uint16 num_pages
//   num_pages times: uint16 width, uint16 height, width * height * 3 bytes

#ifndef SAFEPIX_HOST_PROTOCOL_DECODER_H_
#define SAFEPIX_HOST_PROTOCOL_DECODER_H_

#include <functional>
#include <vector>

#include "../common/constants.h"
#include <safepix/exit_diagnosis.h>
#include <safepix/progress.h>
#include <safepix/status.h>
#include <safepix/types.h>

namespace safepix {
namespace internal {
namespace host {

class FramedReader;
class PageSink;
class TimeBudget;

enum struct Stage {
  PAGE_COUNT = 0,
  PAGE_HEADER,
  PAGE_BUFFER,
  DONE,
  ERROR
};

// Waits at most |timeout_ms| for the worker to exit and returns its exit
// code, or kExitCodeTimedOut.
typedef std::function<int(int)> ExitStatusProvider;

struct DecoderOptions {
  uint64_t input_size = 0;
  // Pixel decoding covers only the first half of the progress range when OCR
  // runs afterwards.
  bool ocr = false;
  uint32_t max_pages = kMaxPages;
  uint32_t max_page_width = kMaxPageWidth;
  uint32_t max_page_height = kMaxPageHeight;
  int exit_wait_ms = 5000;
};

struct DecoderState {
  Stage stage = Stage::PAGE_COUNT;
  // Stage at which decoding failed; meaningful only when stage is ERROR.
  Stage failed_stage = Stage::PAGE_COUNT;
  SafepixStatus result = SAFEPIX_OK;

  uint16_t num_pages = 0;
  // 1-based index of the page being read.
  size_t page = 0;
  uint16_t width = 0;
  uint16_t height = 0;

  double percentage = 0.0;
  double percentage_per_page = 0.0;

  bool has_diagnosis = false;
  ExitDiagnosis diagnosis;
};

class ProtocolDecoder {
 public:
  // All pointers are borrowed and must outlive the decoder.
  ProtocolDecoder(FramedReader* reader, TimeBudget* budget, PageSink* sink,
                  const ExitDiagnoser* diagnoser,
                  const ExitStatusProvider& exit_status,
                  const ProgressCallback& progress,
                  const DecoderOptions& options);

  // Runs the decoder to completion. Returns SAFEPIX_OK once all pages are
  // persisted. Once failed, decoder stays failed.
  SafepixStatus Decode();

  const DecoderState& state() const { return state_; }

 private:
  Stage ReadPageCount();
  Stage ReadPageHeader();
  Stage ReadPageBuffer();
  Stage Finish();
  Stage Fail(SafepixStatus result);
  void Report(const std::string& message);

  FramedReader* reader_;
  TimeBudget* budget_;
  PageSink* sink_;
  const ExitDiagnoser* diagnoser_;
  ExitStatusProvider exit_status_;
  ProgressCallback progress_;
  DecoderOptions options_;
  DecoderState state_;
  std::vector<uint8_t> pixels_;
};

}  // namespace host
}  // namespace internal
}  // namespace safepix

#endif  // SAFEPIX_HOST_PROTOCOL_DECODER_H_
