#include "dry_run_transport.hpp"

#include "internal/observability/logging.hpp"

namespace alo::push {

DispatchResult DryRunTransport::Send(const db::model::SubscriberRecord& subscriber, const alo::push::v1::PushMessage& message) {
  ALO_LOG_DEBUG("dry-run push", {observability::StringField("campaign_id", message.campaign_id()),
                                 observability::StringField("subscriber_id", subscriber.id),
                                 observability::StringField("title", message.title())});
  sent_.fetch_add(1);
  return DispatchResult{DispatchStatus::kSent, "dry-run", 0};
}

} // namespace alo::push
