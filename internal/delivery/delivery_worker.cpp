#include "delivery_worker.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace alo::delivery {

DeliveryWorker::DeliveryWorker(std::shared_ptr<DeliveryQueue> queue, std::shared_ptr<DeliveryEngine> engine,
                               std::shared_ptr<db::Repository> repository, std::size_t workers, std::chrono::milliseconds poll_interval,
                               util::NowFn now)
    : queue_(std::move(queue)),
      engine_(std::move(engine)),
      repository_(std::move(repository)),
      workers_(workers == 0 ? 1 : workers),
      poll_interval_(poll_interval.count() <= 0 ? std::chrono::milliseconds(5000) : poll_interval),
      now_(std::move(now)) {
}

DeliveryWorker::~DeliveryWorker() {
  Stop();
}

void DeliveryWorker::Start() {
  if (running_.exchange(true)) return;
  for (std::size_t i = 0; i < workers_; ++i) threads_.emplace_back(&DeliveryWorker::Run, this);
  ALO_LOG_INFO("delivery workers started", {observability::IntField("workers", static_cast<int64_t>(workers_))});
}

void DeliveryWorker::Stop() {
  if (!running_.exchange(false)) return;
  engine_->Shutdown();
  queue_->Shutdown();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();
  ALO_LOG_INFO("delivery workers stopped");
}

void DeliveryWorker::Deliver(const std::string& campaign_id) {
  try {
    engine_->Run(campaign_id);
  } catch (const std::exception& e) {
    ALO_LOG_ERROR("delivery run failed", {observability::StringField("campaign_id", campaign_id), observability::StringField("error", e.what())});
  }
}

void DeliveryWorker::Run() {
  while (running_) {
    if (auto id = queue_->Dequeue(poll_interval_)) {
      Deliver(*id);
      continue;
    }
    if (!running_) break;

    std::vector<std::string> claimable;
    try {
      auto tx   = repository_->Begin();
      claimable = repository_->ListClaimable(*tx, util::ToUnixMillis(now_()), workers_);
      tx->Commit();
    } catch (const std::exception& e) {
      ALO_LOG_ERROR("delivery poll failed", {observability::StringField("error", e.what())});
      continue;
    }

    for (const auto& id : claimable) {
      if (!running_) break;
      Deliver(id);
    }
  }
}

} // namespace alo::delivery
