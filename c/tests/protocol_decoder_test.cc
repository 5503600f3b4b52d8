// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#include <chrono>  // NOLINT(build/c++11)
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "../common/file_util.h"
#include "../host/framed_reader.h"
#include "../host/page_sink.h"
#include "../host/protocol_decoder.h"
#include "../host/time_budget.h"
#include "./test_utils.h"

namespace safepix {

using ::safepix::internal::host::DecoderOptions;
using ::safepix::internal::host::DecoderState;
using ::safepix::internal::host::ExitStatusProvider;
using ::safepix::internal::host::FramedReader;
using ::safepix::internal::host::LoadStagedPage;
using ::safepix::internal::host::PageSink;
using ::safepix::internal::host::ProtocolDecoder;
using ::safepix::internal::host::Stage;
using ::safepix::internal::host::TimeBudget;
using ::safepix::internal::host::TimeoutPolicy;

namespace {

struct DecodeResult {
  SafepixStatus status;
  DecoderState state;
  std::vector<ProgressEvent> events;
  size_t consumed;
  int exit_status_calls = 0;
  std::string staging_dir;
};

DecodeResult Decode(int fd, const DecoderOptions& options, int exit_code,
                    TimeBudget* budget) {
  DecodeResult result;
  result.staging_dir = MakeTempDir();
  PageSink sink(result.staging_dir);
  EXPECT_EQ(SAFEPIX_OK, sink.Reset());
  FramedReader reader(fd);
  ExitStatusProvider exit_status = [&result,
                                    exit_code](int timeout_ms) -> int {
    EXPECT_GE(timeout_ms, 0);
    ++result.exit_status_calls;
    return exit_code;
  };
  ProgressCallback progress = [&result](bool error, const std::string& text,
                                        double percentage) {
    result.events.push_back({error, text, percentage});
  };
  ProtocolDecoder decoder(&reader, budget, &sink, nullptr, exit_status,
                          progress, options);
  result.status = decoder.Decode();
  result.state = decoder.state();
  result.consumed = reader.consumed();
  return result;
}

DecodeResult Decode(const std::vector<uint8_t>& stream,
                    const DecoderOptions& options, int exit_code = 0) {
  TimeBudget budget(0.0);
  budget.Start(options.input_size);
  return Decode(MakeInputFd(stream), options, exit_code, &budget);
}

// Budget of |seconds| both before and after the page count is known.
TimeoutPolicy ShortPolicy(double seconds) {
  TimeoutPolicy policy;
  policy.startup_seconds = 0.0;
  policy.min_seconds = seconds;
  policy.seconds_per_mib = 0.0;
  policy.seconds_per_page = 0.0;
  return policy;
}

int64_t MillisecondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start).count();
}

}  // namespace

TEST(ProtocolDecoderTest, SinglePage) {
  std::vector<uint8_t> stream = {0x00, 0x01, 0x00, 0x02, 0x00, 0x02};
  for (uint8_t i = 0; i < 12; ++i) stream.push_back(i);

  DecodeResult result = Decode(stream, DecoderOptions());
  ASSERT_EQ(SAFEPIX_OK, result.status);
  EXPECT_EQ(Stage::DONE, result.state.stage);
  EXPECT_EQ(1u, result.state.num_pages);
  EXPECT_EQ(0, result.exit_status_calls);

  ASSERT_EQ(2u, result.events.size());
  EXPECT_FALSE(result.events[0].error);
  EXPECT_EQ("Converting page 1/1 to pixels", result.events[0].text);
  EXPECT_DOUBLE_EQ(100.0, result.events[0].percentage);
  EXPECT_EQ("Converted document to pixels", result.events[1].text);
  EXPECT_DOUBLE_EQ(100.0, result.events[1].percentage);

  uint32_t width = 0;
  uint32_t height = 0;
  std::string pixels;
  ASSERT_EQ(SAFEPIX_OK,
            LoadStagedPage(result.staging_dir, 1, &width, &height, &pixels));
  EXPECT_EQ(2u, width);
  EXPECT_EQ(2u, height);
  EXPECT_EQ(std::string(stream.begin() + 6, stream.end()), pixels);
}

TEST(ProtocolDecoderTest, ZeroPagesIsEmptyResult) {
  DecodeResult result = Decode({0x00, 0x00}, DecoderOptions());
  EXPECT_EQ(SAFEPIX_EMPTY_RESULT, result.status);
  EXPECT_EQ(Stage::ERROR, result.state.stage);
  EXPECT_EQ(Stage::PAGE_COUNT, result.state.failed_stage);
  EXPECT_FALSE(result.state.has_diagnosis);
  EXPECT_TRUE(result.events.empty());
}

TEST(ProtocolDecoderTest, MissingPageCountIsDiagnosed) {
  DecodeResult result = Decode({0x00}, DecoderOptions(), 137);
  EXPECT_EQ(SAFEPIX_WORKER_FAILED, result.status);
  EXPECT_EQ(Stage::PAGE_COUNT, result.state.failed_stage);
  EXPECT_EQ(1, result.exit_status_calls);
  ASSERT_TRUE(result.state.has_diagnosis);
  EXPECT_EQ(137, result.state.diagnosis.exit_code);
  EXPECT_EQ(WorkerFailure::RESOURCE_LIMIT, result.state.diagnosis.cause);
  EXPECT_TRUE(result.events.empty());
}

TEST(ProtocolDecoderTest, EmptyStreamWithCleanExit) {
  DecodeResult result = Decode({}, DecoderOptions(), 0);
  EXPECT_EQ(SAFEPIX_WORKER_FAILED, result.status);
  ASSERT_TRUE(result.state.has_diagnosis);
  EXPECT_EQ(WorkerFailure::UNEXPECTED_EXIT, result.state.diagnosis.cause);
}

TEST(ProtocolDecoderTest, ConsumesExactlyTheAnnouncedBytes) {
  std::vector<PageSize> pages = {{3, 2}, {0, 5}, {1, 1}, {4, 4}};
  std::vector<uint8_t> stream = MakePageStream(pages);
  size_t expected = 2;
  for (size_t i = 0; i < pages.size(); ++i) {
    expected += 4 + 3 * pages[i].first * pages[i].second;
  }
  ASSERT_EQ(expected, stream.size());
  // Trailing garbage must never be looked at.
  stream.resize(stream.size() + 1000, 0xAB);

  DecodeResult result = Decode(stream, DecoderOptions());
  ASSERT_EQ(SAFEPIX_OK, result.status);
  EXPECT_EQ(expected, result.consumed);
  EXPECT_EQ(4u, result.state.num_pages);
  for (size_t i = 0; i < pages.size(); ++i) {
    uint32_t width = 0;
    uint32_t height = 0;
    std::string pixels;
    ASSERT_EQ(SAFEPIX_OK, LoadStagedPage(result.staging_dir, i + 1, &width,
                                         &height, &pixels));
    EXPECT_EQ(pages[i].first, width);
    EXPECT_EQ(pages[i].second, height);
    std::vector<uint8_t> expected_pixels =
        PagePixels(i + 1, pages[i].first, pages[i].second);
    EXPECT_EQ(std::string(expected_pixels.begin(), expected_pixels.end()),
              pixels);
  }
}

TEST(ProtocolDecoderTest, ProgressIsMonotoneAndExact) {
  std::vector<PageSize> pages(7, PageSize(1, 1));
  DecodeResult result = Decode(MakePageStream(pages), DecoderOptions());
  ASSERT_EQ(SAFEPIX_OK, result.status);
  ASSERT_EQ(8u, result.events.size());
  double last = 0.0;
  for (size_t i = 0; i < result.events.size(); ++i) {
    EXPECT_GE(result.events[i].percentage, last);
    last = result.events[i].percentage;
  }
  EXPECT_EQ(100.0, result.events[6].percentage);
  EXPECT_EQ("Converting page 3/7 to pixels", result.events[2].text);
}

TEST(ProtocolDecoderTest, OcrStopsAtHalf) {
  DecoderOptions options;
  options.ocr = true;
  std::vector<PageSize> pages(3, PageSize(2, 1));
  DecodeResult result = Decode(MakePageStream(pages), options);
  ASSERT_EQ(SAFEPIX_OK, result.status);
  EXPECT_EQ(50.0, result.state.percentage);
  EXPECT_NEAR(50.0 / 3, result.events[0].percentage, 1e-9);
}

TEST(ProtocolDecoderTest, TruncatedHeader) {
  std::vector<uint8_t> stream = MakePageStream({{1, 1}, {1, 1}});
  stream.resize(2 + 4 + 3 + 3);
  DecodeResult result = Decode(stream, DecoderOptions());
  EXPECT_EQ(SAFEPIX_SHORT_READ, result.status);
  EXPECT_EQ(Stage::PAGE_HEADER, result.state.failed_stage);
  EXPECT_EQ(2u, result.state.page);
  EXPECT_FALSE(result.state.has_diagnosis);
}

TEST(ProtocolDecoderTest, TruncatedPageIsNotPersisted) {
  std::vector<uint8_t> stream = MakePageStream({{1, 1}, {2, 2}});
  stream.resize(stream.size() - 1);
  DecodeResult result = Decode(stream, DecoderOptions());
  EXPECT_EQ(SAFEPIX_SHORT_READ, result.status);
  EXPECT_EQ(Stage::PAGE_BUFFER, result.state.failed_stage);
  PageSink paths(result.staging_dir);
  EXPECT_TRUE(FileExists(paths.PixelsPath(1)));
  EXPECT_FALSE(FileExists(paths.PixelsPath(2)));
  EXPECT_FALSE(FileExists(paths.WidthPath(2)));
  ASSERT_EQ(1u, result.events.size());
}

TEST(ProtocolDecoderTest, PageTooLarge) {
  DecoderOptions options;
  options.max_page_width = 4;
  std::vector<uint8_t> stream;
  AppendUint16(&stream, 1);
  AppendUint16(&stream, 5);
  AppendUint16(&stream, 1);
  DecodeResult result = Decode(stream, options);
  EXPECT_EQ(SAFEPIX_PAGE_TOO_LARGE, result.status);
  EXPECT_EQ(Stage::PAGE_HEADER, result.state.failed_stage);
}

TEST(ProtocolDecoderTest, TooManyPages) {
  DecoderOptions options;
  options.max_pages = 2;
  DecodeResult result = Decode(MakePageStream({{1, 1}, {1, 1}, {1, 1}}),
                               options);
  EXPECT_EQ(SAFEPIX_TOO_MANY_PAGES, result.status);
  EXPECT_EQ(0u, result.state.page);
}

TEST(ProtocolDecoderTest, ErrorIsSticky) {
  TimeBudget budget(0.0);
  budget.Start(0);
  PageSink sink(MakeTempDir());
  ASSERT_EQ(SAFEPIX_OK, sink.Reset());
  FramedReader reader(MakeInputFd({0x00, 0x00}));
  ProtocolDecoder decoder(&reader, &budget, &sink, nullptr,
                          ExitStatusProvider(), ProgressCallback(),
                          DecoderOptions());
  EXPECT_EQ(SAFEPIX_EMPTY_RESULT, decoder.Decode());
  EXPECT_EQ(SAFEPIX_EMPTY_RESULT, decoder.Decode());
}

TEST(ProtocolDecoderTest, StalledPageCountIsBoundedByBudget) {
  TestPipe pipe;
  TimeBudget budget(0.0);
  budget.StartWithTimeout(0.1);
  auto start = std::chrono::steady_clock::now();
  DecodeResult result =
      Decode(pipe.TakeReadEnd(), DecoderOptions(), kExitCodeTimedOut, &budget);
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  EXPECT_EQ(SAFEPIX_WORKER_FAILED, result.status);
  ASSERT_TRUE(result.state.has_diagnosis);
  EXPECT_EQ(WorkerFailure::TIMED_OUT, result.state.diagnosis.cause);
  EXPECT_GE(elapsed.count(), 90);
  EXPECT_LT(elapsed.count(), 2000);
}

TEST(ProtocolDecoderTest, StalledPageHeaderIsBoundedByRescaledBudget) {
  TestPipe pipe;
  std::vector<uint8_t> count;
  AppendUint16(&count, 3);
  pipe.Write(count);
  TimeBudget budget(ShortPolicy(0.2));
  budget.Start(0);

  auto start = std::chrono::steady_clock::now();
  DecodeResult result =
      Decode(pipe.TakeReadEnd(), DecoderOptions(), 0, &budget);
  int64_t elapsed = MillisecondsSince(start);
  EXPECT_EQ(SAFEPIX_SHORT_READ, result.status);
  EXPECT_EQ(Stage::PAGE_HEADER, result.state.failed_stage);
  EXPECT_EQ(3u, result.state.num_pages);
  EXPECT_TRUE(budget.IsExpired());
  EXPECT_GE(elapsed, 150);
  EXPECT_LT(elapsed, 2000);
}

TEST(ProtocolDecoderTest, StalledPageBufferIsBoundedByRescaledBudget) {
  TestPipe pipe;
  // First page complete, second page stops half way through its pixels.
  std::vector<uint8_t> stream = MakePageStream({{2, 2}, {4, 4}});
  stream.resize(stream.size() - 24);
  pipe.Write(stream);
  TimeBudget budget(ShortPolicy(0.2));
  budget.Start(0);

  auto start = std::chrono::steady_clock::now();
  DecodeResult result =
      Decode(pipe.TakeReadEnd(), DecoderOptions(), 0, &budget);
  int64_t elapsed = MillisecondsSince(start);
  EXPECT_EQ(SAFEPIX_SHORT_READ, result.status);
  EXPECT_EQ(Stage::PAGE_BUFFER, result.state.failed_stage);
  EXPECT_EQ(2u, result.state.page);
  EXPECT_FALSE(result.state.has_diagnosis);
  ASSERT_EQ(1u, result.events.size());
  EXPECT_GE(elapsed, 150);
  EXPECT_LT(elapsed, 2000);
}

}  // namespace safepix
