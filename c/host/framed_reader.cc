// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#include "./framed_reader.h"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>  // NOLINT(build/c++11)

#include "../common/platform.h"

namespace safepix {
namespace internal {
namespace host {

namespace {

typedef std::chrono::steady_clock Clock;

// Reads are done in slices, so that the buffer grows with the data actually
// received rather than with the size announced by the worker.
const size_t kReadSliceSize = 1 << 16;

int MillisecondsUntil(Clock::time_point deadline) {
  Clock::time_point now = Clock::now();
  if (now >= deadline) return 0;
  auto left =
      std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
  // Round up, so that poll does not return just before the deadline.
  return static_cast<int>(left.count()) + 1;
}

}  // namespace

FramedReader::FramedReader(int fd) : fd_(fd) {
  if (fd_ < 0) return;
  int flags = fcntl(fd_, F_GETFL);
  if (flags == -1 || fcntl(fd_, F_SETFL, flags | O_NONBLOCK) == -1) {
    SAFEPIX_LOG_WARNING() << "Failed to make descriptor " << fd_
                          << " non-blocking" << SAFEPIX_ENDL();
  }
}

FramedReader::~FramedReader() { Close(); }

void FramedReader::Close() {
  if (fd_ < 0) return;
  close(fd_);
  fd_ = -1;
}

SafepixStatus FramedReader::Fill(size_t n, int timeout_ms,
                                 std::vector<uint8_t>* out, bool* eof) {
  *eof = false;
  out->clear();
  if (fd_ < 0) return SAFEPIX_IO_ERROR;
  if (timeout_ms < 0) timeout_ms = 0;
  const Clock::time_point deadline =
      Clock::now() + std::chrono::milliseconds(timeout_ms);

  uint8_t slice[kReadSliceSize];
  while (out->size() < n) {
    size_t wanted = std::min(n - out->size(), kReadSliceSize);
    ssize_t bytes_read = read(fd_, slice, wanted);
    if (bytes_read > 0) {
      Append(out, slice, static_cast<size_t>(bytes_read));
      consumed_ += static_cast<size_t>(bytes_read);
      continue;
    }
    if (bytes_read == 0) {
      *eof = true;
      return SAFEPIX_OK;
    }
    if (errno == EINTR) continue;
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      SAFEPIX_LOG_ERROR() << "Read from worker failed: " << strerror(errno)
                          << SAFEPIX_ENDL();
      return SAFEPIX_IO_ERROR;
    }

    int wait_ms = MillisecondsUntil(deadline);
    if (wait_ms == 0) return SAFEPIX_OK;
    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int ready = poll(&pfd, 1, wait_ms);
    if (ready == 0) return SAFEPIX_OK;  // Timed out.
    if (ready < 0) {
      if (errno == EINTR) continue;
      SAFEPIX_LOG_ERROR() << "poll failed: " << strerror(errno)
                          << SAFEPIX_ENDL();
      return SAFEPIX_IO_ERROR;
    }
    if (pfd.revents & POLLNVAL) return SAFEPIX_IO_ERROR;
    // POLLIN / POLLHUP / POLLERR: the next read reports data, EOF or error.
  }
  return SAFEPIX_OK;
}

SafepixStatus FramedReader::ReadExact(size_t n, int timeout_ms,
                                      std::vector<uint8_t>* out) {
  bool eof;
  SafepixStatus status = Fill(n, timeout_ms, out, &eof);
  if (status != SAFEPIX_OK) return status;
  if (out->size() != n) {
    last_short_read_.expected = n;
    last_short_read_.got = out->size();
    SAFEPIX_LOG_DEBUG() << "Short read: expected " << n << " got "
                        << out->size() << (eof ? " (EOF)" : " (timeout)")
                        << SAFEPIX_ENDL();
    return SAFEPIX_SHORT_READ;
  }
  return SAFEPIX_OK;
}

SafepixStatus FramedReader::ReadUpTo(size_t n, int timeout_ms,
                                     std::vector<uint8_t>* out) {
  bool eof;
  return Fill(n, timeout_ms, out, &eof);
}

SafepixStatus FramedReader::ReadUint16(int timeout_ms, uint16_t* value) {
  std::vector<uint8_t> buf;
  SafepixStatus status = ReadExact(2, timeout_ms, &buf);
  if (status != SAFEPIX_OK) return status;
  *value = SAFEPIX_LOAD16BE(buf.data());
  return SAFEPIX_OK;
}

}  // namespace host
}  // namespace internal
}  // namespace safepix
