// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#ifndef SAFEPIX_HOST_DOCUMENT_H_
#define SAFEPIX_HOST_DOCUMENT_H_

#include <string>

namespace safepix {

// Suffix appended to the input name when no output name is given.
static const char kSafeSuffix[] = "-safe.pdf";

class Document {
 public:
  enum State {
    UNCONVERTED,
    CONVERTING,
    SAFE,
    FAILED,
  };

  // |output_filename| defaults to the input name with its extension replaced
  // by kSafeSuffix.
  explicit Document(const std::string& input_filename,
                    const std::string& output_filename = std::string());

  const std::string& input_filename() const { return input_filename_; }
  const std::string& output_filename() const { return output_filename_; }
  State state() const { return state_; }

  void MarkAsConverting() { state_ = CONVERTING; }
  void MarkAsSafe() { state_ = SAFE; }
  void MarkAsFailed() { state_ = FAILED; }

  bool is_failed() const { return state_ == FAILED; }
  bool is_safe() const { return state_ == SAFE; }

 private:
  std::string input_filename_;
  std::string output_filename_;
  State state_ = UNCONVERTED;
};

std::string DefaultOutputFilename(const std::string& input_filename);

}  // namespace safepix

#endif  // SAFEPIX_HOST_DOCUMENT_H_
