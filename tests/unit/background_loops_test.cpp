#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "internal/audience/audience_resolver.hpp"
#include "internal/campaign/campaign_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/delivery/delivery_engine.hpp"
#include "internal/delivery/delivery_queue.hpp"
#include "internal/delivery/delivery_worker.hpp"
#include "internal/push/dry_run_transport.hpp"
#include "internal/scheduler/scheduler_loop.hpp"
#include "internal/segment/segment_catalog.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono_literals;
using namespace alo::campaign::v1;

// Polls `done` for up to `limit`.
template <typename Fn>
bool WaitUntil(Fn&& done, std::chrono::milliseconds limit = 5s) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (done()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return done();
}

void TestPeriodicLoopRunsAndSurvivesErrors() {
  std::atomic<int>            runs{0};
  alo::scheduler::PeriodicLoop loop("test", 5ms, [&] {
    if (++runs % 2 == 0) throw std::runtime_error("every other run fails");
  });

  loop.Start();
  assert(loop.IsRunning());
  assert(WaitUntil([&] { return runs.load() >= 4; }));
  loop.Stop();
  assert(!loop.IsRunning());

  const int after_stop = runs.load();
  std::this_thread::sleep_for(30ms);
  assert(runs.load() == after_stop);
}

void TestPeriodicLoopStopsWithoutWaitingForInterval() {
  std::atomic<int>            runs{0};
  alo::scheduler::PeriodicLoop loop("slow", 1h, [&] { ++runs; });
  loop.Start();

  const auto started = std::chrono::steady_clock::now();
  loop.Stop();
  assert(std::chrono::steady_clock::now() - started < 5s);
  assert(runs.load() == 0);
}

struct Stack {
  Stack() {
    alo::delivery::DeliveryOptions options;
    options.worker_id   = "loop-test";
    options.batch_size  = 2;
    options.retry.base_backoff_ms = 1;

    alo::util::NowFn now = [clock = clock_ms] { return alo::util::FromUnixMillis(clock->load()); };
    engine = std::make_shared<alo::delivery::DeliveryEngine>(repo, catalog, resolver, std::make_shared<alo::push::DryRunTransport>(), options, now);
    worker = std::make_unique<alo::delivery::DeliveryWorker>(queue, engine, repo, 2, 20ms, now);

    for (const char* id : {"s1", "s2", "s3"}) {
      alo::db::model::SubscriberRecord s;
      s.id       = id;
      s.endpoint = std::string("https://push.example/") + id;
      s.country  = "PT";

      auto       tx     = repo->Begin();
      const auto result = repo->UpsertSubscriber(*tx, s);
      assert(result);
      tx->Commit();
    }
  }

  Campaign Status(const std::string& id) {
    return manager.Get(id);
  }

  std::shared_ptr<std::atomic<uint64_t>>             clock_ms = std::make_shared<std::atomic<uint64_t>>(alo::util::ToUnixMillis(alo::util::Now()));
  std::shared_ptr<alo::db::memory::MemoryRepository> repo     = std::make_shared<alo::db::memory::MemoryRepository>();
  std::shared_ptr<alo::segment::SegmentCatalog>      catalog  = std::make_shared<alo::segment::SegmentCatalog>(repo, 1s);
  std::shared_ptr<alo::audience::AudienceResolver>   resolver = std::make_shared<alo::audience::AudienceResolver>(repo, catalog);
  std::shared_ptr<alo::delivery::DeliveryQueue>      queue    = std::make_shared<alo::delivery::DeliveryQueue>();
  alo::campaign::CampaignManager                     manager{repo, catalog, queue, alo::segment::DuplicateTypePolicy::kReject};
  std::shared_ptr<alo::delivery::DeliveryEngine>     engine;
  std::unique_ptr<alo::delivery::DeliveryWorker>     worker;
};

Campaign Draft() {
  Campaign c;
  c.mutable_content()->set_title("Hello");
  c.mutable_content()->set_body("World");
  return c;
}

void TestWorkerDeliversPublishedCampaign() {
  Stack s;
  s.worker->Start();

  const auto id = s.manager.Save(Draft()).id();
  s.manager.Publish(id);

  assert(WaitUntil([&] { return s.Status(id).status() == CAMPAIGN_STATUS_COMPLETED; }));
  const auto done = s.Status(id);
  assert(done.counters().audience_count() == 3);
  assert(done.counters().sent_count() == 3);
  assert(done.counters().failed_count() == 0);

  s.worker->Stop();
}

void TestWorkerPicksUpCampaignsMissingFromQueue() {
  Stack s;

  // published before any worker ran, then the queue hint is lost
  const auto id = s.manager.Save(Draft()).id();
  s.manager.Publish(id);
  assert(s.queue->Dequeue(10ms).has_value());

  s.worker->Start();
  assert(WaitUntil([&] { return s.Status(id).status() == CAMPAIGN_STATUS_COMPLETED; }));
  s.worker->Stop();
}

void TestWorkerPollsWithItsOwnClock() {
  Stack s;

  const auto id = s.manager.Save(Draft()).id();
  s.manager.Publish(id);
  assert(s.queue->Dequeue(10ms).has_value());

  // a crashed worker left a claim one hour out; the delivery clock is two hours ahead
  const uint64_t wall_ms = alo::util::ToUnixMillis(alo::util::Now());
  {
    auto tx      = s.repo->Begin();
    auto current = s.repo->GetCampaign(*tx, id);
    assert(current);
    auto stalled                = *current;
    stalled.status              = CAMPAIGN_STATUS_SENDING;
    stalled.version             = current->version + 1;
    stalled.claimed_by          = "crashed";
    stalled.claim_expires_at_ms = wall_ms + 3600000;
    const auto result           = s.repo->UpdateCampaignIf(*tx, stalled, current->status, current->version);
    assert(result);
    tx->Commit();
  }
  s.clock_ms->store(wall_ms + 7200000);

  s.worker->Start();
  assert(WaitUntil([&] { return s.Status(id).status() == CAMPAIGN_STATUS_COMPLETED; }));
  assert(s.Status(id).counters().sent_count() == 3);
  s.worker->Stop();
}

} // namespace

int main() {
  TestPeriodicLoopRunsAndSurvivesErrors();
  TestPeriodicLoopStopsWithoutWaitingForInterval();
  TestWorkerDeliversPublishedCampaign();
  TestWorkerPicksUpCampaignsMissingFromQueue();
  TestWorkerPollsWithItsOwnClock();

  std::cout << "alo_unit_background_loops: pass\n";
  return 0;
}
