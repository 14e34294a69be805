#include "delivery_queue.hpp"

namespace alo::delivery {

void DeliveryQueue::Enqueue(const std::string& campaign_id) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_ || !pending_.insert(campaign_id).second) return;
    queue_.push_back(campaign_id);
  }
  cv_.notify_one();
}

std::optional<std::string> DeliveryQueue::Dequeue(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);

  cv_.wait_for(lock, timeout, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ || queue_.empty()) return std::nullopt;

  std::string id = std::move(queue_.front());
  queue_.pop_front();
  pending_.erase(id);
  return id;
}

std::size_t DeliveryQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

void DeliveryQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

bool DeliveryQueue::IsShutdown() const {
  std::lock_guard lock(mutex_);
  return shutdown_;
}

} // namespace alo::delivery
