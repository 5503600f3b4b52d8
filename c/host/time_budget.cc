// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#include "./time_budget.h"

#include <algorithm>
#include <limits>

namespace safepix {
namespace internal {
namespace host {

TimeoutPolicy::TimeoutPolicy()
    : startup_seconds(kStartupTimeSeconds),
      min_seconds(kTimeoutMin),
      seconds_per_mib(kTimeoutPerMiB),
      seconds_per_page(kTimeoutPerPage) {}

double CalculateTimeout(double size_mib, size_t pages,
                        const TimeoutPolicy& policy) {
  double timeout = policy.seconds_per_mib * size_mib;
  if (pages > 0) {
    timeout += policy.seconds_per_page * static_cast<double>(pages);
  }
  return std::max(policy.min_seconds, timeout);
}

int SecondsToMilliseconds(double seconds) {
  const double ms = seconds * 1000.0;
  if (!(ms > 0.0)) return 0;
  const double max_ms = std::numeric_limits<int>::max();
  if (ms >= max_ms) return std::numeric_limits<int>::max();
  return static_cast<int>(ms);
}

double BytesToMiB(uint64_t size_bytes) {
  return static_cast<double>(size_bytes) / (1024.0 * 1024.0);
}

TimeBudget::TimeBudget() : deadline_(Clock::now()) {}

TimeBudget::TimeBudget(double startup_seconds) : deadline_(Clock::now()) {
  policy_.startup_seconds = startup_seconds;
}

TimeBudget::TimeBudget(const TimeoutPolicy& policy)
    : policy_(policy), deadline_(Clock::now()) {}

void TimeBudget::Start(uint64_t input_size_bytes) {
  StartWithTimeout(CalculateTimeout(BytesToMiB(input_size_bytes), 0, policy_) +
                   policy_.startup_seconds);
}

void TimeBudget::Rescale(uint64_t input_size_bytes, size_t page_count) {
  StartWithTimeout(
      CalculateTimeout(BytesToMiB(input_size_bytes), page_count, policy_));
}

void TimeBudget::StartWithTimeout(double seconds) {
  if (seconds < 0) seconds = 0;
  deadline_ = Clock::now() +
              std::chrono::duration_cast<Clock::duration>(
                  std::chrono::duration<double>(seconds));
}

int TimeBudget::Remaining() const {
  Clock::time_point now = Clock::now();
  if (now >= deadline_) return 0;
  int64_t left = std::chrono::duration_cast<std::chrono::milliseconds>(
                     deadline_ - now).count();
  const int64_t max_ms = std::numeric_limits<int>::max();
  return static_cast<int>(std::min(left, max_ms));
}

}  // namespace host
}  // namespace internal
}  // namespace safepix
