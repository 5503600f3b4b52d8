// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#ifndef SAFEPIX_COMMON_STATUS_H_
#define SAFEPIX_COMMON_STATUS_H_

namespace safepix {

typedef enum {
  SAFEPIX_OK = 0,

  // Fewer bytes than required arrived before the deadline or EOF.
  SAFEPIX_SHORT_READ,

  // Worker announced zero pages.
  SAFEPIX_EMPTY_RESULT,

  // Worker produced no page count; see the exit diagnosis for the cause.
  SAFEPIX_WORKER_FAILED,

  // Values announced by the worker exceed the configured limits.
  SAFEPIX_TOO_MANY_PAGES,
  SAFEPIX_PAGE_TOO_LARGE,

  SAFEPIX_IO_ERROR,
  SAFEPIX_INVALID_PARAM,

  // Another conversion session is active in this process.
  SAFEPIX_BUSY,

  SAFEPIX_MEMORY_ERROR,
  SAFEPIX_COMPRESSION_ERROR,
  SAFEPIX_DECOMPRESSION_ERROR,
  SAFEPIX_ASSEMBLY_ERROR,
} SafepixStatus;

// Returns a static, human-readable name of |status|.
const char* SafepixStatusString(SafepixStatus status);

}  // namespace safepix

#endif  // SAFEPIX_COMMON_STATUS_H_
