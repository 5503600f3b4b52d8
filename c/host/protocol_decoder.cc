// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#include "./protocol_decoder.h"

#include <string>

#include "../common/platform.h"
#include "./framed_reader.h"
#include "./page_sink.h"
#include "./time_budget.h"

namespace safepix {
namespace internal {
namespace host {

ProtocolDecoder::ProtocolDecoder(FramedReader* reader, TimeBudget* budget,
                                 PageSink* sink, const ExitDiagnoser* diagnoser,
                                 const ExitStatusProvider& exit_status,
                                 const ProgressCallback& progress,
                                 const DecoderOptions& options)
    : reader_(reader),
      budget_(budget),
      sink_(sink),
      diagnoser_(diagnoser),
      exit_status_(exit_status),
      progress_(progress),
      options_(options) {}

Stage ProtocolDecoder::Fail(SafepixStatus result) {
  state_.result = result;
  // Preserve current stage for error reporting.
  state_.failed_stage = state_.stage;
  return Stage::ERROR;
}

void ProtocolDecoder::Report(const std::string& message) {
  if (progress_) progress_(false, message, state_.percentage);
}

Stage ProtocolDecoder::ReadPageCount() {
  uint16_t num_pages = 0;
  SafepixStatus status = reader_->ReadUint16(budget_->Remaining(), &num_pages);
  if (status != SAFEPIX_OK) {
    // Most likely the worker died before producing any output; its exit code
    // is the only meaningful source of diagnosis.
    const ShortRead& sr = reader_->last_short_read();
    SAFEPIX_LOG_ERROR() << "No page count from worker (got " << sr.got
                        << " of " << sr.expected << " bytes)"
                        << SAFEPIX_ENDL();
    int exit_code = kExitCodeTimedOut;
    if (exit_status_) exit_code = exit_status_(options_.exit_wait_ms);
    const ExitDiagnoser& diagnoser =
        diagnoser_ ? *diagnoser_ : DefaultExitDiagnoser();
    state_.diagnosis = diagnoser.Diagnose(exit_code);
    state_.has_diagnosis = true;
    SAFEPIX_LOG_ERROR() << "Worker exit code " << exit_code << ": "
                        << WorkerFailureName(state_.diagnosis.cause)
                        << SAFEPIX_ENDL();
    return Fail(SAFEPIX_WORKER_FAILED);
  }

  if (num_pages == 0) {
    SAFEPIX_LOG_ERROR() << "Worker reported zero pages" << SAFEPIX_ENDL();
    return Fail(SAFEPIX_EMPTY_RESULT);
  }
  if (num_pages > options_.max_pages) {
    SAFEPIX_LOG_ERROR() << "Worker reported " << num_pages
                        << " pages, limit is " << options_.max_pages
                        << SAFEPIX_ENDL();
    return Fail(SAFEPIX_TOO_MANY_PAGES);
  }

  state_.num_pages = num_pages;
  state_.percentage_per_page = (options_.ocr ? 50.0 : 100.0) / num_pages;
  budget_->Rescale(options_.input_size, num_pages);
  state_.page = 1;
  return Stage::PAGE_HEADER;
}

Stage ProtocolDecoder::ReadPageHeader() {
  uint16_t width = 0;
  uint16_t height = 0;
  SafepixStatus status = reader_->ReadUint16(budget_->Remaining(), &width);
  if (status == SAFEPIX_OK) {
    status = reader_->ReadUint16(budget_->Remaining(), &height);
  }
  if (status != SAFEPIX_OK) {
    SAFEPIX_LOG_ERROR() << "Truncated header of page " << state_.page
                        << SAFEPIX_ENDL();
    return Fail(status);
  }
  if (width > options_.max_page_width || height > options_.max_page_height) {
    SAFEPIX_LOG_ERROR() << "Page " << state_.page << " is too large: "
                        << width << "x" << height << SAFEPIX_ENDL();
    return Fail(SAFEPIX_PAGE_TOO_LARGE);
  }
  state_.width = width;
  state_.height = height;
  return Stage::PAGE_BUFFER;
}

Stage ProtocolDecoder::ReadPageBuffer() {
  SAFEPIX_DCHECK(state_.page >= 1 && state_.page <= state_.num_pages);
  const size_t size =
      static_cast<size_t>(state_.width) * state_.height * kNumChannels;
  SafepixStatus status =
      reader_->ReadExact(size, budget_->Remaining(), &pixels_);
  if (status != SAFEPIX_OK) {
    SAFEPIX_LOG_ERROR() << "Truncated pixels of page " << state_.page
                        << SAFEPIX_ENDL();
    return Fail(status);
  }
  status = sink_->Persist(state_.page, state_.width, state_.height, pixels_);
  if (status != SAFEPIX_OK) return Fail(status);

  if (state_.page == state_.num_pages) {
    // Land exactly on the target, regardless of rounding.
    state_.percentage = options_.ocr ? 50.0 : 100.0;
  } else {
    state_.percentage += state_.percentage_per_page;
  }
  Report("Converting page " + std::to_string(state_.page) + "/" +
         std::to_string(state_.num_pages) + " to pixels");

  if (state_.page == state_.num_pages) return Stage::DONE;
  ++state_.page;
  return Stage::PAGE_HEADER;
}

Stage ProtocolDecoder::Finish() {
  // Ensure nothing else is read after all pages are obtained.
  reader_->Close();
  Report("Converted document to pixels");
  return Stage::DONE;
}

SafepixStatus ProtocolDecoder::Decode() {
  while (true) {
    switch (state_.stage) {
      case Stage::PAGE_COUNT:
        state_.stage = ReadPageCount();
        break;

      case Stage::PAGE_HEADER:
        state_.stage = ReadPageHeader();
        break;

      case Stage::PAGE_BUFFER:
        state_.stage = ReadPageBuffer();
        if (state_.stage == Stage::DONE) state_.stage = Finish();
        break;

      case Stage::DONE:
        return SAFEPIX_OK;

      case Stage::ERROR:
        return state_.result;

      default:
        /* Unreachable */
        state_.stage = Fail(SAFEPIX_INVALID_PARAM);
        break;
    }
  }
}

}  // namespace host
}  // namespace internal
}  // namespace safepix
