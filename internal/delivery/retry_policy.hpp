#pragma once

#include <cstdint>

namespace alo::delivery {

/*
  Transient failure schedule.

  delay(attempts) = min(max_backoff, base_backoff * 2^min(attempts - 1, 20)),
  at least 1 ms, raised to the transport's retry-after hint. After
  max_attempts dispatches the failure becomes permanent.
*/
struct RetryPolicy {
  uint32_t max_attempts    = 5;
  uint64_t base_backoff_ms = 1000;
  uint64_t max_backoff_ms  = 300000;

  uint64_t BackoffMs(uint32_t attempts, uint64_t retry_after_ms = 0) const;

  bool Exhausted(uint32_t attempts) const {
    return attempts >= max_attempts;
  }
};

} // namespace alo::delivery
