#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "alo/push/v1/push_gateway.pb.h"
#include "internal/db/model/subscriber_record.hpp"

namespace alo::push {

enum class DispatchStatus {
  kSent,
  kGone,      // endpoint permanently unsubscribed
  kTransient, // retry later
  kRejected,  // payload refused, retrying will not help
};

struct DispatchResult {
  DispatchStatus status = DispatchStatus::kSent;
  std::string    detail;
  uint64_t       retry_after_ms = 0;
};

constexpr std::string_view DispatchStatusName(DispatchStatus status) {
  switch (status) {
    case DispatchStatus::kSent:
      return "sent";
    case DispatchStatus::kGone:
      return "gone";
    case DispatchStatus::kTransient:
      return "transient";
    case DispatchStatus::kRejected:
      return "rejected";
  }
  return "unknown";
}

/*
  Delivers one push message to one subscriber.

  Implementations must be safe to call from several threads at once and
  must bound each call by their own timeout. Errors are reported through
  DispatchResult; an exception is treated as a transient failure.
*/
class PushTransport {
 public:
  virtual ~PushTransport() = default;

  virtual DispatchResult Send(const db::model::SubscriberRecord& subscriber, const alo::push::v1::PushMessage& message) = 0;
};

} // namespace alo::push
