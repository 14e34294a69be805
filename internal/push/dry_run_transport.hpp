#pragma once

#include <atomic>

#include "push_transport.hpp"

namespace alo::push {

// Logs every message and reports it as sent.
class DryRunTransport final : public PushTransport {
 public:
  DispatchResult Send(const db::model::SubscriberRecord& subscriber, const alo::push::v1::PushMessage& message) override;

  uint64_t SentCount() const {
    return sent_.load();
  }

 private:
  std::atomic<uint64_t> sent_{0};
};

} // namespace alo::push
