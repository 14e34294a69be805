#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

namespace alo::delivery {

/*
  Thread-safe blocking queue of campaign ids for delivery workers.

  Ids are hints: the worker still claims the campaign through the
  repository, so a stale or duplicate id is harmless. An id already
  waiting in the queue is not added twice.
*/
class DeliveryQueue {
 public:
  void Enqueue(const std::string& campaign_id);

  // Waits up to `timeout`; nullopt on timeout or shutdown.
  std::optional<std::string> Dequeue(std::chrono::milliseconds timeout);

  std::size_t Size() const;

  void Shutdown();
  bool IsShutdown() const;

 private:
  mutable std::mutex              mutex_;
  std::condition_variable         cv_;
  std::deque<std::string>         queue_;
  std::unordered_set<std::string> pending_;
  bool                            shutdown_ = false;
};

} // namespace alo::delivery
