// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

/* Deadline-bounded reads from an untrusted byte stream */

#ifndef SAFEPIX_HOST_FRAMED_READER_H_
#define SAFEPIX_HOST_FRAMED_READER_H_

#include <vector>

#include <safepix/status.h>
#include <safepix/types.h>

namespace safepix {
namespace internal {
namespace host {

struct ShortRead {
  size_t expected = 0;
  size_t got = 0;
};

/**
 * Reader over a file descriptor fed by the worker.
 *
 * The descriptor is switched to non-blocking mode; every read waits with
 * poll(2) for at most the given timeout. Bytes are consumed in arrival order
 * and never pushed back. The reader owns the descriptor.
 */
class FramedReader {
 public:
  explicit FramedReader(int fd);
  ~FramedReader();

  FramedReader(const FramedReader&) = delete;
  FramedReader& operator=(const FramedReader&) = delete;

  // Accumulates exactly |n| bytes into |out|. Returns SAFEPIX_SHORT_READ if
  // EOF or the timeout comes first; details are in last_short_read().
  SafepixStatus ReadExact(size_t n, int timeout_ms, std::vector<uint8_t>* out);

  // Same as ReadExact, but fewer than |n| bytes is not an error.
  SafepixStatus ReadUpTo(size_t n, int timeout_ms, std::vector<uint8_t>* out);

  // Big-endian 2-byte unsigned integer.
  SafepixStatus ReadUint16(int timeout_ms, uint16_t* value);

  // Stops reading; any further bytes are never looked at.
  void Close();

  bool is_open() const { return fd_ >= 0; }
  const ShortRead& last_short_read() const { return last_short_read_; }
  // Total number of bytes consumed so far.
  size_t consumed() const { return consumed_; }

 private:
  SafepixStatus Fill(size_t n, int timeout_ms, std::vector<uint8_t>* out,
                     bool* eof);

  int fd_;
  size_t consumed_ = 0;
  ShortRead last_short_read_;
};

}  // namespace host
}  // namespace internal
}  // namespace safepix

#endif  // SAFEPIX_HOST_FRAMED_READER_H_
