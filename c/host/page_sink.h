// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

// Staging storage for decoded pages.

#ifndef SAFEPIX_HOST_PAGE_SINK_H_
#define SAFEPIX_HOST_PAGE_SINK_H_

#include <string>
#include <vector>

#include <safepix/status.h>
#include <safepix/types.h>

namespace safepix {
namespace internal {
namespace host {

/**
 * Persists pages as "page-<i>.width", "page-<i>.height" (decimal text) and
 * "page-<i>.rgb" (raw pixels) in a staging directory; |i| is 1-based.
 */
class PageSink {
 public:
  explicit PageSink(const std::string& staging_dir)
      : staging_dir_(staging_dir) {}

  // Clears the staging directory; done before every session.
  SafepixStatus Reset();

  // |pixels| must hold exactly width * height * 3 bytes.
  SafepixStatus Persist(size_t page, uint16_t width, uint16_t height,
                        const std::vector<uint8_t>& pixels);

  const std::string& staging_dir() const { return staging_dir_; }
  size_t num_persisted() const { return num_persisted_; }

  std::string WidthPath(size_t page) const;
  std::string HeightPath(size_t page) const;
  std::string PixelsPath(size_t page) const;

 private:
  std::string PagePath(size_t page, const char* extension) const;

  std::string staging_dir_;
  size_t num_persisted_ = 0;
};

// Reads back a page written by PageSink. Fails if the pixel file size does
// not match the stored dimensions.
SafepixStatus LoadStagedPage(const std::string& staging_dir, size_t page,
                             uint32_t* width, uint32_t* height,
                             std::string* pixels);

}  // namespace host
}  // namespace internal
}  // namespace safepix

#endif  // SAFEPIX_HOST_PAGE_SINK_H_
