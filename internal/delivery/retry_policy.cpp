#include "retry_policy.hpp"

#include <algorithm>

namespace alo::delivery {

uint64_t RetryPolicy::BackoffMs(uint32_t attempts, uint64_t retry_after_ms) const {
  const uint32_t exponent = std::min<uint32_t>(attempts > 0 ? attempts - 1 : 0, 20);
  const uint64_t base     = std::max<uint64_t>(base_backoff_ms, 1);
  const uint64_t cap      = std::max<uint64_t>(max_backoff_ms, 1);

  uint64_t delay = base << exponent;
  // shifted past the cap, or overflowed
  if ((delay >> exponent) != base || delay > cap) delay = cap;

  return std::max<uint64_t>({delay, retry_after_ms, 1});
}

} // namespace alo::delivery
