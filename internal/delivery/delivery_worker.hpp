#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "delivery_engine.hpp"
#include "delivery_queue.hpp"
#include "internal/util/time.hpp"

namespace alo::delivery {

/*
  Background threads that feed campaigns to the delivery engine.

  Each thread takes an id from the queue; when none arrives within
  poll_interval it asks the repository for claimable campaigns, which
  covers restarts and expired claims of crashed workers.
*/
class DeliveryWorker {
 public:
  DeliveryWorker(std::shared_ptr<DeliveryQueue> queue, std::shared_ptr<DeliveryEngine> engine, std::shared_ptr<db::Repository> repository,
                 std::size_t workers, std::chrono::milliseconds poll_interval, util::NowFn now = util::Now);
  ~DeliveryWorker();

  void Start();
  void Stop();

 private:
  void Run();
  void Deliver(const std::string& campaign_id);

  std::shared_ptr<DeliveryQueue>  queue_;
  std::shared_ptr<DeliveryEngine> engine_;
  std::shared_ptr<db::Repository> repository_;
  std::size_t                     workers_;
  std::chrono::milliseconds       poll_interval_;
  util::NowFn                     now_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace alo::delivery
