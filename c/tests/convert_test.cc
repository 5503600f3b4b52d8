// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#include <chrono>  // NOLINT(build/c++11)
#include <future>  // NOLINT(build/c++11)
#include <string>
#include <thread>  // NOLINT(build/c++11)
#include <vector>

#include "gtest/gtest.h"
#include "../common/file_util.h"
#include "../common/platform.h"
#include <safepix/convert.h>
#include <safepix/document.h>
#include <safepix/exit_diagnosis.h>
#include <safepix/sidecar.h>
#include "./test_utils.h"

namespace safepix {

namespace {

struct Fixture {
  std::string dir;
  std::string input;
  std::string output;
  ConvertOptions options;
  std::vector<ProgressEvent> events;

  explicit Fixture(const std::string& document = "untrusted document") {
    dir = MakeTempDir();
    input = JoinPath(dir, "input.docx");
    output = JoinPath(dir, "input-safe.pdf");
    EXPECT_TRUE(WriteFile(input, document));
    options.dev_mode = false;
    options.staging_dir = JoinPath(dir, "staging");
  }

  // Worker that swallows the document and then replays |stream|.
  void ReplayWorker(const std::vector<uint8_t>& stream) {
    std::string stream_path = JoinPath(dir, "stream");
    EXPECT_TRUE(WriteFile(stream_path, stream.data(), stream.size()));
    Worker("cat > /dev/null; cat " + ShellQuote(stream_path));
  }

  void Worker(const std::string& script) {
    options.worker_command.clear();
    options.worker_command.push_back("sh");
    options.worker_command.push_back("-c");
    options.worker_command.push_back(script);
  }

  SafepixStatus Run(Document* document, const std::string& ocr_lang = "") {
    return Convert(document, ocr_lang, options,
                   [this](Document* doc, bool error, const std::string& text,
                          double percentage) {
                     EXPECT_TRUE(doc != nullptr);
                     events.push_back({error, text, percentage});
                   });
  }

  void EnableDevMode() {
    options.sidecar_dir = JoinPath(dir, "sidecar");
    EXPECT_TRUE(ResetDirectory(options.sidecar_dir));
    options.dev_mode = true;
  }

  size_t NumErrors() const {
    size_t count = 0;
    for (size_t i = 0; i < events.size(); ++i) count += events[i].error;
    return count;
  }
};

int64_t MillisecondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start).count();
}

}  // namespace

TEST(ConvertTest, ConvertsDocument) {
  Fixture fixture;
  fixture.ReplayWorker(MakePageStream({{2, 2}, {1, 3}}));
  Document document(fixture.input);
  EXPECT_EQ(fixture.output, document.output_filename());

  ASSERT_EQ(SAFEPIX_OK, fixture.Run(&document));
  EXPECT_TRUE(document.is_safe());
  EXPECT_EQ(0u, fixture.NumErrors());

  std::string pdf;
  ASSERT_TRUE(ReadFile(fixture.output, &pdf));
  EXPECT_EQ(0u, pdf.find("%PDF-"));
  EXPECT_FALSE(FileExists(
      JoinPath(fixture.options.staging_dir, "safe-output-compressed.pdf")));

  std::vector<std::string> texts;
  for (size_t i = 0; i < fixture.events.size(); ++i) {
    texts.push_back(fixture.events[i].text);
  }
  std::vector<std::string> expected = {
      "Converting page 1/2 to pixels",
      "Converting page 2/2 to pixels",
      "Converted document to pixels",
      "Converting page 1/2 from pixels to PDF",
      "Converting page 2/2 from pixels to PDF",
      "Safe PDF created"};
  EXPECT_EQ(expected, texts);
  EXPECT_EQ(100.0, fixture.events.back().percentage);
}

TEST(ConvertTest, ProgressIsMonotoneWithOcr) {
  Fixture fixture;
  fixture.ReplayWorker(MakePageStream({{1, 1}, {1, 1}, {1, 1}}));
  Document document(fixture.input, fixture.output);
  ASSERT_EQ(SAFEPIX_OK, fixture.Run(&document, "eng"));
  double last = 0.0;
  for (size_t i = 0; i < fixture.events.size(); ++i) {
    EXPECT_GE(fixture.events[i].percentage, last);
    last = fixture.events[i].percentage;
  }
  EXPECT_EQ(50.0, fixture.events[2].percentage);
  EXPECT_EQ(100.0, last);
}

TEST(ConvertTest, KilledWorkerIsDiagnosed) {
  Fixture fixture;
  fixture.Worker("cat > /dev/null; printf x; kill -KILL $$");
  Document document(fixture.input, fixture.output);
  EXPECT_EQ(SAFEPIX_WORKER_FAILED, fixture.Run(&document));
  EXPECT_TRUE(document.is_failed());
  ASSERT_EQ(1u, fixture.events.size());
  EXPECT_TRUE(fixture.events[0].error);
  EXPECT_EQ(DefaultExitDiagnoser().Diagnose(137).message,
            fixture.events[0].text);
  EXPECT_FALSE(FileExists(fixture.output));
}

TEST(ConvertTest, WorkerErrorCodeIsDiagnosed) {
  Fixture fixture;
  fixture.Worker("cat > /dev/null; exit 110");
  Document document(fixture.input, fixture.output);
  EXPECT_EQ(SAFEPIX_WORKER_FAILED, fixture.Run(&document));
  ASSERT_EQ(1u, fixture.NumErrors());
  EXPECT_EQ(DefaultExitDiagnoser().Diagnose(110).message,
            fixture.events.back().text);
}

TEST(ConvertTest, CustomDiagnoser) {
  Fixture fixture;
  fixture.Worker("cat > /dev/null; exit 77");
  ExitDiagnoser diagnoser;
  diagnoser.Register(77, WorkerFailure::CONVERTER_FAILURE, "custom failure");
  fixture.options.diagnoser = &diagnoser;
  Document document(fixture.input, fixture.output);
  EXPECT_EQ(SAFEPIX_WORKER_FAILED, fixture.Run(&document));
  EXPECT_EQ("custom failure", fixture.events.back().text);
}

TEST(ConvertTest, EmptyResult) {
  Fixture fixture;
  fixture.ReplayWorker({0x00, 0x00});
  Document document(fixture.input, fixture.output);
  EXPECT_EQ(SAFEPIX_EMPTY_RESULT, fixture.Run(&document));
  EXPECT_TRUE(document.is_failed());
  EXPECT_EQ(1u, fixture.NumErrors());
}

TEST(ConvertTest, TruncatedStream) {
  Fixture fixture;
  std::vector<uint8_t> stream = MakePageStream({{4, 4}});
  stream.resize(stream.size() - 5);
  fixture.ReplayWorker(stream);
  Document document(fixture.input, fixture.output);
  EXPECT_EQ(SAFEPIX_SHORT_READ, fixture.Run(&document));
  EXPECT_TRUE(document.is_failed());
  EXPECT_FALSE(FileExists(fixture.output));
}

TEST(ConvertTest, MissingInput) {
  Fixture fixture;
  fixture.ReplayWorker(MakePageStream({{1, 1}}));
  Document document(JoinPath(fixture.dir, "missing.pdf"), fixture.output);
  EXPECT_EQ(SAFEPIX_IO_ERROR, fixture.Run(&document));
  EXPECT_TRUE(document.is_failed());
}

TEST(ConvertTest, AssemblerOverride) {
  Fixture fixture;
  fixture.ReplayWorker(MakePageStream({{1, 1}}));
  std::string converted = JoinPath(fixture.dir, "converted.pdf");
  fixture.options.converted_path = converted;
  fixture.options.assembler = [converted](const std::string& ocr_lang,
                                          const ProgressCallback& progress)
      -> SafepixStatus {
    EXPECT_EQ("", ocr_lang);
    progress(false, "Assembling", 100.0);
    return WriteFile(converted, std::string("pdf")) ? SAFEPIX_OK
                                                    : SAFEPIX_IO_ERROR;
  };
  Document document(fixture.input, fixture.output);
  ASSERT_EQ(SAFEPIX_OK, fixture.Run(&document));
  std::string content;
  ASSERT_TRUE(ReadFile(fixture.output, &content));
  EXPECT_EQ("pdf", content);
  EXPECT_FALSE(FileExists(converted));
}

TEST(ConvertTest, AssemblerFailure) {
  Fixture fixture;
  fixture.ReplayWorker(MakePageStream({{1, 1}}));
  fixture.options.assembler = [](const std::string&, const ProgressCallback&) {
    return SAFEPIX_ASSEMBLY_ERROR;
  };
  Document document(fixture.input, fixture.output);
  EXPECT_EQ(SAFEPIX_ASSEMBLY_ERROR, fixture.Run(&document));
  EXPECT_TRUE(document.is_failed());
  EXPECT_EQ(1u, fixture.NumErrors());
  EXPECT_FALSE(FileExists(fixture.output));
}

TEST(ConvertTest, SecondSessionIsBusy) {
  Fixture fixture;
  fixture.ReplayWorker(MakePageStream({{1, 1}}));
  std::promise<void> entered;
  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();
  fixture.options.assembler = [&entered, released](const std::string&,
                                                   const ProgressCallback&)
      -> SafepixStatus {
    entered.set_value();
    released.wait();
    return SAFEPIX_ASSEMBLY_ERROR;
  };
  Document first(fixture.input, fixture.output);
  SafepixStatus first_status = SAFEPIX_OK;
  std::thread session([&fixture, &first, &first_status]() {
    first_status = fixture.Run(&first);
  });

  entered.get_future().wait();
  Fixture other;
  other.ReplayWorker(MakePageStream({{1, 1}}));
  Document second(other.input, other.output);
  EXPECT_EQ(SAFEPIX_BUSY, other.Run(&second));
  EXPECT_EQ(Document::UNCONVERTED, second.state());
  EXPECT_TRUE(other.events.empty());

  release.set_value();
  session.join();
  EXPECT_EQ(SAFEPIX_ASSEMBLY_ERROR, first_status);

  // Guard is released once the session is over.
  EXPECT_EQ(SAFEPIX_OK, other.Run(&second));
}

TEST(ConvertTest, DevModeSendsSidecarFirst) {
  Fixture fixture("document bytes");
  std::string sidecar = JoinPath(fixture.dir, "sidecar");
  ASSERT_TRUE(ResetDirectory(sidecar));
  ASSERT_TRUE(WriteFile(JoinPath(sidecar, "worker.py"), std::string("code")));
  std::string captured = JoinPath(fixture.dir, "captured");
  std::string stream_path = JoinPath(fixture.dir, "stream");
  std::vector<uint8_t> stream = MakePageStream({{1, 1}});
  ASSERT_TRUE(WriteFile(stream_path, stream.data(), stream.size()));
  fixture.Worker("cat > " + ShellQuote(captured) + "; cat " +
                 ShellQuote(stream_path) + "; echo 'worker log' >&2");
  fixture.options.dev_mode = true;
  fixture.options.sidecar_dir = sidecar;

  Document document(fixture.input, fixture.output);
  ASSERT_EQ(SAFEPIX_OK, fixture.Run(&document));

  std::string sent;
  ASSERT_TRUE(ReadFile(captured, &sent));
  ASSERT_GE(sent.size(), 4u);
  const uint8_t* data = reinterpret_cast<const uint8_t*>(sent.data());
  size_t bundle_size = SAFEPIX_LOAD32BE(data);
  ASSERT_LE(4 + bundle_size, sent.size());
  std::vector<BundleEntry> entries;
  ASSERT_EQ(SAFEPIX_OK, ExtractBundle(data + 4, bundle_size, &entries));
  ASSERT_EQ(1u, entries.size());
  EXPECT_EQ("worker.py", entries[0].path);
  EXPECT_EQ("code", entries[0].data);
  EXPECT_EQ("document bytes", sent.substr(4 + bundle_size));
}

TEST(ConvertTest, DevModeRequiresSidecar) {
  Fixture fixture;
  fixture.ReplayWorker(MakePageStream({{1, 1}}));
  fixture.options.dev_mode = true;
  Document document(fixture.input, fixture.output);
  EXPECT_EQ(SAFEPIX_INVALID_PARAM, fixture.Run(&document));
  EXPECT_TRUE(document.is_failed());
}

TEST(ConvertTest, StalledPageHeaderIsBoundedByBudget) {
  Fixture fixture;
  fixture.Worker("cat > /dev/null; printf '\\000\\001'; sleep 200");
  fixture.options.startup_seconds = 0.0;
  fixture.options.min_timeout_seconds = 0.3;
  fixture.options.timeout_per_page_seconds = 0.0;
  Document document(fixture.input, fixture.output);

  auto start = std::chrono::steady_clock::now();
  EXPECT_EQ(SAFEPIX_SHORT_READ, fixture.Run(&document));
  int64_t elapsed = MillisecondsSince(start);
  EXPECT_GE(elapsed, 250);
  EXPECT_LT(elapsed, 5000);
  EXPECT_TRUE(document.is_failed());
  EXPECT_EQ(1u, fixture.NumErrors());
}

TEST(ConvertTest, DevModeFailureDoesNotWaitForWorkerLog) {
  Fixture fixture;
  fixture.EnableDevMode();
  // stdout is closed after the page count, stderr stays open.
  fixture.Worker("cat > /dev/null; echo 'worker log' >&2; "
                 "printf '\\000\\001'; exec 1>&-; sleep 200");
  fixture.options.exit_wait_ms = 500;
  Document document(fixture.input, fixture.output);

  auto start = std::chrono::steady_clock::now();
  EXPECT_EQ(SAFEPIX_SHORT_READ, fixture.Run(&document));
  EXPECT_LT(MillisecondsSince(start), 5000);
  EXPECT_TRUE(document.is_failed());
}

TEST(ConvertTest, DevModeStallIsBoundedByBudget) {
  Fixture fixture;
  fixture.EnableDevMode();
  fixture.Worker("cat > /dev/null; printf '\\000\\001'; sleep 200");
  fixture.options.startup_seconds = 0.0;
  fixture.options.min_timeout_seconds = 0.3;
  fixture.options.timeout_per_page_seconds = 0.0;
  Document document(fixture.input, fixture.output);

  auto start = std::chrono::steady_clock::now();
  EXPECT_EQ(SAFEPIX_SHORT_READ, fixture.Run(&document));
  int64_t elapsed = MillisecondsSince(start);
  EXPECT_GE(elapsed, 250);
  // Budget exhausted: the worker log is not waited for.
  EXPECT_LT(elapsed, 3000);
}

TEST(ConvertTest, SanitizeWorkerLog) {
  EXPECT_EQ("line 1\n\tline 2\n", SanitizeWorkerLog("line 1\n\tline 2"));
  EXPECT_EQ("a?b?c\n", SanitizeWorkerLog("a\x1b" "b\xff" "c\n"));
  EXPECT_EQ("", SanitizeWorkerLog(""));
}

TEST(ConvertTest, DefaultWorkerCommand) {
  EXPECT_EQ("dz.Convert", DefaultWorkerCommand(false).back());
  EXPECT_EQ("dz.ConvertDev", DefaultWorkerCommand(true).back());
}

}  // namespace safepix
