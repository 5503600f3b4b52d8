// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#include <safepix/pixels_to_pdf.h>

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <cstdio>
#include <cstring>

#include "../common/constants.h"
#include "../common/platform.h"
#include "../host/page_sink.h"

namespace safepix {

namespace {

float Points(uint32_t pixels) {
  float points = static_cast<float>(pixels * 72.0 / kRenderDpi);
  return points < 1.0f ? 1.0f : points;
}

void LogMupdfWarning(void* user, const char* message) {
  SAFEPIX_UNUSED(user);
  SAFEPIX_LOG_WARNING() << "mupdf: " << message << SAFEPIX_ENDL();
}

void LogMupdfError(void* user, const char* message) {
  SAFEPIX_UNUSED(user);
  SAFEPIX_LOG_ERROR() << "mupdf: " << message << SAFEPIX_ENDL();
}

// Owns the MuPDF context and the document being assembled.
class OutputDocument {
 public:
  OutputDocument() : ctx_(nullptr), doc_(nullptr) {}

  ~OutputDocument() {
    if (ctx_ == nullptr) return;
    pdf_drop_document(ctx_, doc_);
    fz_drop_context(ctx_);
  }

  OutputDocument(const OutputDocument&) = delete;
  OutputDocument& operator=(const OutputDocument&) = delete;

  bool Init() {
    ctx_ = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (ctx_ == nullptr) return false;
    fz_set_warning_callback(ctx_, LogMupdfWarning, nullptr);
    fz_set_error_callback(ctx_, LogMupdfError, nullptr);
    pdf_document* doc = nullptr;
    fz_var(doc);
    fz_try(ctx_) { doc = pdf_create_document(ctx_); }
    fz_catch(ctx_) { return false; }
    doc_ = doc;
    return true;
  }

  // Appends a page of the raster's size showing the raster. A raster without
  // pixels gives a blank page.
  bool AddPage(uint32_t width, uint32_t height, const std::string& pixels);

  bool Save(const std::string& path);

 private:
  fz_context* ctx_;
  pdf_document* doc_;
};

bool OutputDocument::AddPage(uint32_t width, uint32_t height,
                             const std::string& pixels) {
  const bool has_image = (width > 0 && height > 0);
  const float page_width = Points(width);
  const float page_height = Points(height);
  fz_context* ctx = ctx_;
  fz_pixmap* pixmap = nullptr;
  fz_image* image = nullptr;
  pdf_obj* image_ref = nullptr;
  pdf_obj* resources = nullptr;
  fz_buffer* contents = nullptr;
  pdf_obj* page = nullptr;
  bool ok = true;
  fz_var(pixmap);
  fz_var(image);
  fz_var(image_ref);
  fz_var(resources);
  fz_var(contents);
  fz_var(page);
  fz_var(ok);

  fz_try(ctx) {
    resources = pdf_new_dict(ctx, doc_, 1);
    contents = fz_new_buffer(ctx, 64);
    if (has_image) {
      pixmap = fz_new_pixmap(ctx, fz_device_rgb(ctx), static_cast<int>(width),
                             static_cast<int>(height), nullptr, 0);
      const size_t row_size = static_cast<size_t>(width) * kNumChannels;
      const size_t stride =
          static_cast<size_t>(fz_pixmap_stride(ctx, pixmap));
      unsigned char* samples = fz_pixmap_samples(ctx, pixmap);
      for (uint32_t y = 0; y < height; ++y) {
        memcpy(samples + y * stride, pixels.data() + y * row_size, row_size);
      }
      image = fz_new_image_from_pixmap(ctx, pixmap, nullptr);
      image_ref = pdf_add_image(ctx, doc_, image);
      pdf_obj* xobjects = pdf_dict_put_dict(ctx, resources, PDF_NAME(XObject),
                                            1);
      pdf_dict_puts(ctx, xobjects, "Im0", image_ref);
      fz_append_printf(ctx, contents, "q %g 0 0 %g 0 0 cm /Im0 Do Q\n",
                       page_width, page_height);
    }
    fz_rect mediabox = fz_make_rect(0, 0, page_width, page_height);
    page = pdf_add_page(ctx, doc_, mediabox, 0, resources, contents);
    pdf_insert_page(ctx, doc_, -1, page);
  }
  fz_always(ctx) {
    pdf_drop_obj(ctx, page);
    fz_drop_buffer(ctx, contents);
    pdf_drop_obj(ctx, resources);
    pdf_drop_obj(ctx, image_ref);
    fz_drop_image(ctx, image);
    fz_drop_pixmap(ctx, pixmap);
  }
  fz_catch(ctx) { ok = false; }
  return ok;
}

bool OutputDocument::Save(const std::string& path) {
  fz_context* ctx = ctx_;
  bool ok = true;
  fz_var(ok);
  fz_try(ctx) {
    pdf_write_options options = pdf_default_write_options;
    options.do_compress = 1;
    options.do_compress_images = 1;
    pdf_save_document(ctx, doc_, path.c_str(), &options);
  }
  fz_catch(ctx) { ok = false; }
  return ok;
}

}  // namespace

PixelsToPdf::PixelsToPdf(const std::string& staging_dir, size_t num_pages,
                         const std::string& output_path,
                         double start_percentage)
    : staging_dir_(staging_dir),
      num_pages_(num_pages),
      output_path_(output_path),
      start_percentage_(start_percentage) {}

SafepixStatus PixelsToPdf::Convert(const std::string& ocr_lang,
                                   const ProgressCallback& progress) {
  if (num_pages_ == 0) return SAFEPIX_INVALID_PARAM;
  if (!ocr_lang.empty()) {
    SAFEPIX_LOG_WARNING() << "OCR (" << ocr_lang
                          << ") is not available; pages are assembled "
                             "without a text layer" << SAFEPIX_ENDL();
  }

  OutputDocument out;
  if (!out.Init()) {
    SAFEPIX_LOG_ERROR() << "Failed to create a PDF document" << SAFEPIX_ENDL();
    return SAFEPIX_ASSEMBLY_ERROR;
  }

  SafepixStatus status = SAFEPIX_OK;
  double percentage = start_percentage_;
  const double percentage_per_page = (100.0 - start_percentage_) / num_pages_;
  for (size_t i = 0; i < num_pages_; ++i) {
    const size_t page = i + 1;
    uint32_t width = 0;
    uint32_t height = 0;
    std::string pixels;
    status = internal::host::LoadStagedPage(staging_dir_, page, &width,
                                            &height, &pixels);
    if (status != SAFEPIX_OK || !out.AddPage(width, height, pixels)) {
      status = SAFEPIX_ASSEMBLY_ERROR;
      break;
    }
    percentage = (page == num_pages_) ? 100.0
                                      : percentage + percentage_per_page;
    if (progress) {
      progress(false,
               "Converting page " + std::to_string(page) + "/" +
                   std::to_string(num_pages_) + " from pixels to PDF",
               percentage);
    }
  }

  if (status == SAFEPIX_OK && !out.Save(output_path_)) {
    status = SAFEPIX_IO_ERROR;
  }
  if (status != SAFEPIX_OK) {
    SAFEPIX_LOG_ERROR() << "Failed to assemble " << output_path_ << ": "
                        << SafepixStatusString(status) << SAFEPIX_ENDL();
    remove(output_path_.c_str());
  }
  return status;
}

}  // namespace safepix
