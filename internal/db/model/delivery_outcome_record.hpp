#pragma once

#include <cstdint>
#include <string>

#include "alo/campaign/v1/types.pb.h"

namespace alo::db::model {

// One row per (campaign, subscriber) the delivery engine has visited.
struct DeliveryOutcomeRecord {
  std::string campaign_id;
  std::string subscriber_id;

  alo::campaign::v1::DeliveryStatus status = alo::campaign::v1::DELIVERY_STATUS_PENDING;

  uint32_t attempts           = 0;
  uint64_t last_attempt_at_ms = 0;
  uint64_t next_attempt_at_ms = 0;

  std::string last_error;
};

struct OutcomeTally {
  uint64_t pending          = 0;
  uint64_t sent             = 0;
  uint64_t failed_transient = 0;
  uint64_t failed_permanent = 0;

  uint64_t Total() const {
    return pending + sent + failed_transient + failed_permanent;
  }
};

} // namespace alo::db::model
