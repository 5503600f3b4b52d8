// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

// Constants of the worker pixel-stream protocol.

#ifndef SAFEPIX_COMMON_CONSTANTS_H_
#define SAFEPIX_COMMON_CONSTANTS_H_

#include <safepix/types.h>

namespace safepix {

// Each pixel is sent as 3 interleaved 8-bit channels (R, G, B).
static const size_t kNumChannels = 3;

// Size of the sidecar length prefix, written as big-endian uint32.
static const size_t kSidecarLengthSize = 4;

// Limits applied to values announced by the worker.
static const uint32_t kMaxPages = 10000;
static const uint32_t kMaxPageWidth = 10000;
static const uint32_t kMaxPageHeight = 10000;

// Timeout model, in seconds.
static const double kTimeoutPerPage = 30.0;
static const double kTimeoutPerMiB = 30.0;
static const double kTimeoutMin = 60.0;
// The maximum time an isolated worker takes to start up.
static const double kStartupTimeSeconds = 5 * 60;

// Cap on diagnostic text read from the worker's error channel.
static const size_t kMaxConversionLogChars = 150 * 50;

// Delay between reaping attempts while waiting for the worker to exit.
static const int kWaitPollIntervalMs = 10;

}  // namespace safepix

#endif  // SAFEPIX_COMMON_CONSTANTS_H_
