// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#include <safepix/status.h>

namespace safepix {

const char* SafepixStatusString(SafepixStatus status) {
  switch (status) {
    case SAFEPIX_OK:
      return "ok";
    case SAFEPIX_SHORT_READ:
      return "short read from worker (protocol desynchronized)";
    case SAFEPIX_EMPTY_RESULT:
      return "worker reported no pages";
    case SAFEPIX_WORKER_FAILED:
      return "worker failed before producing a page count";
    case SAFEPIX_TOO_MANY_PAGES:
      return "worker announced too many pages";
    case SAFEPIX_PAGE_TOO_LARGE:
      return "worker announced an oversized page";
    case SAFEPIX_IO_ERROR:
      return "I/O error";
    case SAFEPIX_INVALID_PARAM:
      return "invalid parameter";
    case SAFEPIX_BUSY:
      return "another conversion is in progress";
    case SAFEPIX_MEMORY_ERROR:
      return "out of memory";
    case SAFEPIX_COMPRESSION_ERROR:
      return "compression error";
    case SAFEPIX_DECOMPRESSION_ERROR:
      return "decompression error";
    case SAFEPIX_ASSEMBLY_ERROR:
      return "PDF assembly failed";
  }
  return "unknown status";
}

}  // namespace safepix
