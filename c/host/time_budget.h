// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

// Deadline shared by all blocking reads of a conversion session.

#ifndef SAFEPIX_HOST_TIME_BUDGET_H_
#define SAFEPIX_HOST_TIME_BUDGET_H_

#include <chrono>  // NOLINT(build/c++11)

#include "../common/constants.h"
#include <safepix/types.h>

namespace safepix {
namespace internal {
namespace host {

// Timeout rates; defaults come from constants.h.
struct TimeoutPolicy {
  TimeoutPolicy();

  // Extra allowance for worker startup, granted once by Start().
  double startup_seconds;
  double min_seconds;
  double seconds_per_mib;
  double seconds_per_page;
};

// Returns the conversion timeout in seconds for a document of |size_mib|
// MiB. |pages| == 0 means the page count is not known yet.
double CalculateTimeout(double size_mib, size_t pages,
                        const TimeoutPolicy& policy = TimeoutPolicy());

// Converts |seconds| to milliseconds, clamped to [0, INT_MAX].
int SecondsToMilliseconds(double seconds);

// Converts a byte count to MiB.
double BytesToMiB(uint64_t size_bytes);

class TimeBudget {
 public:
  typedef std::chrono::steady_clock Clock;

  TimeBudget();
  explicit TimeBudget(double startup_seconds);
  explicit TimeBudget(const TimeoutPolicy& policy);

  // Initial ceiling: size based timeout plus worker startup allowance.
  void Start(uint64_t input_size_bytes);

  // Page-count-aware ceiling, counted from now.
  void Rescale(uint64_t input_size_bytes, size_t page_count);

  // Arbitrary ceiling, counted from now.
  void StartWithTimeout(double seconds);

  // Milliseconds left before the deadline; never negative.
  int Remaining() const;

  bool IsExpired() const { return Remaining() == 0; }

  const TimeoutPolicy& policy() const { return policy_; }

 private:
  TimeoutPolicy policy_;
  Clock::time_point deadline_;
};

}  // namespace host
}  // namespace internal
}  // namespace safepix

#endif  // SAFEPIX_HOST_TIME_BUDGET_H_
