// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#include "./page_sink.h"

#include "../common/constants.h"
#include "../common/file_util.h"
#include "../common/platform.h"

namespace safepix {
namespace internal {
namespace host {

namespace {

bool ParseDimension(const std::string& text, uint32_t* value) {
  if (text.empty() || text.size() > 5) return false;
  uint32_t result = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c < '0' || c > '9') return false;
    result = result * 10 + static_cast<uint32_t>(c - '0');
  }
  if (result > 0xFFFF) return false;
  *value = result;
  return true;
}

}  // namespace

std::string PageSink::PagePath(size_t page, const char* extension) const {
  return JoinPath(staging_dir_,
                  "page-" + std::to_string(page) + "." + extension);
}

std::string PageSink::WidthPath(size_t page) const {
  return PagePath(page, "width");
}

std::string PageSink::HeightPath(size_t page) const {
  return PagePath(page, "height");
}

std::string PageSink::PixelsPath(size_t page) const {
  return PagePath(page, "rgb");
}

SafepixStatus PageSink::Reset() {
  num_persisted_ = 0;
  if (staging_dir_.empty()) return SAFEPIX_INVALID_PARAM;
  return ResetDirectory(staging_dir_) ? SAFEPIX_OK : SAFEPIX_IO_ERROR;
}

SafepixStatus PageSink::Persist(size_t page, uint16_t width, uint16_t height,
                                const std::vector<uint8_t>& pixels) {
  const size_t expected = static_cast<size_t>(width) * height * kNumChannels;
  if (pixels.size() != expected) {
    SAFEPIX_LOG_ERROR() << "Refusing to persist page " << page << ": got "
                        << pixels.size() << " bytes, expected " << expected
                        << SAFEPIX_ENDL();
    return SAFEPIX_INVALID_PARAM;
  }
  if (!WriteFile(WidthPath(page), std::to_string(width)) ||
      !WriteFile(HeightPath(page), std::to_string(height)) ||
      !WriteFile(PixelsPath(page), pixels.data(), pixels.size())) {
    return SAFEPIX_IO_ERROR;
  }
  ++num_persisted_;
  return SAFEPIX_OK;
}

SafepixStatus LoadStagedPage(const std::string& staging_dir, size_t page,
                             uint32_t* width, uint32_t* height,
                             std::string* pixels) {
  PageSink paths(staging_dir);
  std::string width_text;
  std::string height_text;
  if (!ReadFile(paths.WidthPath(page), &width_text) ||
      !ReadFile(paths.HeightPath(page), &height_text) ||
      !ReadFile(paths.PixelsPath(page), pixels)) {
    return SAFEPIX_IO_ERROR;
  }
  if (!ParseDimension(width_text, width) ||
      !ParseDimension(height_text, height)) {
    SAFEPIX_LOG_ERROR() << "Malformed dimensions of staged page " << page
                        << SAFEPIX_ENDL();
    return SAFEPIX_INVALID_PARAM;
  }
  const size_t expected = static_cast<size_t>(*width) * *height * kNumChannels;
  if (pixels->size() != expected) {
    SAFEPIX_LOG_ERROR() << "Staged page " << page << " has " << pixels->size()
                        << " bytes, expected " << expected << SAFEPIX_ENDL();
    return SAFEPIX_INVALID_PARAM;
  }
  return SAFEPIX_OK;
}

}  // namespace host
}  // namespace internal
}  // namespace safepix
