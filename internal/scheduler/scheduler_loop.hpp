#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace alo::scheduler {

/*
  Runs a task on a fixed interval on its own thread until stopped.

  The first run happens one interval after Start. Stop interrupts the
  wait immediately and joins. Exceptions from the task are logged and
  the loop keeps going.
*/
class PeriodicLoop {
 public:
  PeriodicLoop(std::string name, std::chrono::milliseconds interval, std::function<void()> task);
  ~PeriodicLoop();

  PeriodicLoop(const PeriodicLoop&)            = delete;
  PeriodicLoop& operator=(const PeriodicLoop&) = delete;

  void Start();
  void Stop();

  bool IsRunning() const {
    return running_.load();
  }

 private:
  void Loop();

  std::string               name_;
  std::chrono::milliseconds interval_;
  std::function<void()>     task_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace alo::scheduler
