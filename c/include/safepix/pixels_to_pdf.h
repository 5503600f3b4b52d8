// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

// Assembly of staged page rasters into a PDF.

#ifndef SAFEPIX_PDF_PIXELS_TO_PDF_H_
#define SAFEPIX_PDF_PIXELS_TO_PDF_H_

#include <functional>
#include <string>

#include <safepix/progress.h>
#include <safepix/status.h>
#include <safepix/types.h>

namespace safepix {

// Downstream stage: (ocr_lang, progress) -> status. An empty |ocr_lang|
// means no OCR.
typedef std::function<SafepixStatus(const std::string&,
                                    const ProgressCallback&)>
    PdfAssembler;

// Resolution the worker renders pages at; maps pixels to PDF points.
static const double kRenderDpi = 150.0;

/**
 * Writes one image-only page per staged raster, in page order.
 *
 * Progress continues from |start_percentage| and reaches 100 after the last
 * page. No text layer is produced; a requested OCR language is logged and
 * ignored.
 */
class PixelsToPdf {
 public:
  PixelsToPdf(const std::string& staging_dir, size_t num_pages,
              const std::string& output_path, double start_percentage);

  SafepixStatus Convert(const std::string& ocr_lang,
                        const ProgressCallback& progress);

 private:
  std::string staging_dir_;
  size_t num_pages_;
  std::string output_path_;
  double start_percentage_;
};

}  // namespace safepix

#endif  // SAFEPIX_PDF_PIXELS_TO_PDF_H_
