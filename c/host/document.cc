// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#include <safepix/document.h>

namespace safepix {

std::string DefaultOutputFilename(const std::string& input_filename) {
  size_t slash = input_filename.find_last_of('/');
  size_t dot = input_filename.find_last_of('.');
  // Only strip an extension of the last path component, and not a leading
  // dot of a hidden file.
  size_t name_start = (slash == std::string::npos) ? 0 : slash + 1;
  if (dot == std::string::npos || dot <= name_start) {
    return input_filename + kSafeSuffix;
  }
  return input_filename.substr(0, dot) + kSafeSuffix;
}

Document::Document(const std::string& input_filename,
                   const std::string& output_filename)
    : input_filename_(input_filename),
      output_filename_(output_filename.empty()
                           ? DefaultOutputFilename(input_filename)
                           : output_filename) {}

}  // namespace safepix
