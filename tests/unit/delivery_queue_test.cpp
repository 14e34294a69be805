#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "internal/delivery/delivery_queue.hpp"

namespace {

using alo::delivery::DeliveryQueue;
using namespace std::chrono_literals;

void TestFifoAndDeduplication() {
  DeliveryQueue q;
  q.Enqueue("a");
  q.Enqueue("b");
  q.Enqueue("a");
  assert(q.Size() == 2);

  assert(*q.Dequeue(10ms) == "a");

  // no longer waiting, so it may be queued again
  q.Enqueue("a");
  assert(*q.Dequeue(10ms) == "b");
  assert(*q.Dequeue(10ms) == "a");
  assert(q.Size() == 0);
}

void TestDequeueTimesOut() {
  DeliveryQueue q;
  const auto    start = std::chrono::steady_clock::now();
  assert(!q.Dequeue(20ms).has_value());
  assert(std::chrono::steady_clock::now() - start >= 20ms);
}

void TestDequeueWakesOnEnqueue() {
  DeliveryQueue q;
  std::thread   producer([&] {
    std::this_thread::sleep_for(20ms);
    q.Enqueue("late");
  });

  auto id = q.Dequeue(5s);
  producer.join();
  assert(id.has_value() && *id == "late");
}

void TestShutdownReleasesWaiters() {
  DeliveryQueue q;
  std::thread   waiter([&] { assert(!q.Dequeue(10s).has_value()); });

  std::this_thread::sleep_for(20ms);
  q.Shutdown();
  waiter.join();

  assert(q.IsShutdown());
  q.Enqueue("ignored");
  assert(q.Size() == 0);
}

} // namespace

int main() {
  TestFifoAndDeduplication();
  TestDequeueTimesOut();
  TestDequeueWakesOnEnqueue();
  TestShutdownReleasesWaiters();

  std::cout << "alo_unit_delivery_queue: pass\n";
  return 0;
}
