// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

/* Macros for compiler / platform specific features and build options.

   Build options are:
    * SAFEPIX_DEBUG enables "asserts" and extensive logging
    * SAFEPIX_DISABLE_LOG disables logging (useful for fuzzing)
    * SAFEPIX_ENABLE_LOG enables debug logging
*/

#ifndef SAFEPIX_COMMON_PLATFORM_H_
#define SAFEPIX_COMMON_PLATFORM_H_

#include <cstdio>
#include <cstdlib>  /* abort */
#include <cstring>  /* memcpy */
#include <iostream>
#include <vector>

#include <safepix/types.h>

// Implicitly enable SAFEPIX_DEBUG when sanitizers are on.
#if !defined(SAFEPIX_DEBUG) && (SAFEPIX_SANITIZED || !defined(NDEBUG))
#define SAFEPIX_DEBUG 1
#endif

#if defined(__GNUC__) || defined(__clang__)
#define SAFEPIX_INLINE inline __attribute__((__always_inline__))
#define SAFEPIX_UNUSED_FUNCTION static SAFEPIX_INLINE __attribute__((unused))
#else
#define SAFEPIX_INLINE inline
#define SAFEPIX_UNUSED_FUNCTION static SAFEPIX_INLINE
#endif

/* Wire integers are big-endian; read / store them byte-wise. */
static SAFEPIX_INLINE uint16_t SAFEPIX_LOAD16BE(const void* p) {
  const uint8_t* in = (const uint8_t*)p;
  return (uint16_t)((in[0] << 8) | in[1]);
}
static SAFEPIX_INLINE uint32_t SAFEPIX_LOAD32BE(const void* p) {
  const uint8_t* in = (const uint8_t*)p;
  uint32_t value = (uint32_t)(in[0]) << 24;
  value |= (uint32_t)(in[1]) << 16;
  value |= (uint32_t)(in[2]) << 8;
  value |= (uint32_t)(in[3]);
  return value;
}
static SAFEPIX_INLINE void SAFEPIX_STORE32BE(void* p, uint32_t v) {
  uint8_t* out = (uint8_t*)p;
  out[0] = (uint8_t)(v >> 24);
  out[1] = (uint8_t)(v >> 16);
  out[2] = (uint8_t)(v >> 8);
  out[3] = (uint8_t)v;
}

// "else" branch is never evaluated, but provides the sink.
#define SAFEPIX_VOID_LOG() if (true) {} else std::cerr

#define SAFEPIX_LOG_(LEVEL) std::cerr << "[" #LEVEL "] "
#define SAFEPIX_ENDL() std::endl

#if defined(SAFEPIX_DISABLE_LOG)
#define SAFEPIX_LOG_DEBUG() SAFEPIX_VOID_LOG()
#define SAFEPIX_LOG_INFO() SAFEPIX_VOID_LOG()
#define SAFEPIX_LOG_WARNING() SAFEPIX_VOID_LOG()
#define SAFEPIX_LOG_ERROR() SAFEPIX_VOID_LOG()
#else  // defined(SAFEPIX_DISABLE_LOG)
#if defined(SAFEPIX_ENABLE_LOG)
#define SAFEPIX_LOG_DEBUG() SAFEPIX_LOG_(DEBUG)
#else  //  defined(SAFEPIX_ENABLE_LOG)
#define SAFEPIX_LOG_DEBUG() SAFEPIX_VOID_LOG()
#endif  //  defined(SAFEPIX_ENABLE_LOG)
#define SAFEPIX_LOG_INFO() SAFEPIX_LOG_(INFO)
#define SAFEPIX_LOG_WARNING() SAFEPIX_LOG_(WARNING)
#define SAFEPIX_LOG_ERROR() SAFEPIX_LOG_(ERROR)
#endif  // defined(SAFEPIX_DISABLE_LOG)

namespace safepix {
// Reports a broken internal invariant and terminates; never returns.
static inline void CheckFailed(const char* condition, const char* f, int l) {
  fprintf(stderr, "%s:%d: check failed: %s\n", f, l, condition);
  fflush(stderr);
  abort();
}

static SAFEPIX_INLINE void Append(std::vector<uint8_t>* dst,
                                  const uint8_t* begin, size_t length) {
  dst->insert(dst->end(), begin, begin + length);
}
}  // namespace safepix

#define SAFEPIX_CHECK(V)                                 \
  do {                                                   \
    if (!(V)) {                                          \
      ::safepix::CheckFailed(#V, __FILE__, __LINE__);    \
    }                                                    \
  } while (false)

#if defined(SAFEPIX_DEBUG)
#define SAFEPIX_DCHECK(V) SAFEPIX_CHECK(V)
#else
#define SAFEPIX_DCHECK(V) do {} while (false)
#endif

#define SAFEPIX_UNUSED(X) (void)(X)

SAFEPIX_UNUSED_FUNCTION void SafepixSuppressUnusedFunctions(void) {
  SAFEPIX_UNUSED(&SafepixSuppressUnusedFunctions);
  SAFEPIX_UNUSED(&SAFEPIX_LOAD16BE);
  SAFEPIX_UNUSED(&SAFEPIX_LOAD32BE);
  SAFEPIX_UNUSED(&SAFEPIX_STORE32BE);
  SAFEPIX_UNUSED(
      static_cast<void (*)(std::vector<uint8_t>*, const uint8_t*, size_t)>(
          &safepix::Append));
}

#endif  // SAFEPIX_COMMON_PLATFORM_H_
