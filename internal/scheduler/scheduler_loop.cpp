#include "scheduler_loop.hpp"

#include "internal/observability/logging.hpp"

namespace alo::scheduler {

PeriodicLoop::PeriodicLoop(std::string name, std::chrono::milliseconds interval, std::function<void()> task)
    : name_(std::move(name)), interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1000)), task_(std::move(task)) {
}

PeriodicLoop::~PeriodicLoop() {
  Stop();
}

void PeriodicLoop::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&PeriodicLoop::Loop, this);
  ALO_LOG_INFO("periodic loop started", {observability::StringField("loop", name_), observability::IntField("interval_ms", interval_.count())});
}

void PeriodicLoop::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void PeriodicLoop::Loop() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);
      if (cv_.wait_for(lock, interval_, [this] { return !running_.load(); })) return;
    }

    try {
      task_();
    } catch (const std::exception& e) {
      ALO_LOG_ERROR("periodic task failed", {observability::StringField("loop", name_), observability::StringField("error", e.what())});
    }
  }
}

} // namespace alo::scheduler
