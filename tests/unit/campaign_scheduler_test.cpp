#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/delivery/delivery_queue.hpp"
#include "internal/scheduler/campaign_scheduler.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace alo::campaign::v1;
using alo::db::memory::MemoryRepository;
using alo::db::model::CampaignRecord;
using alo::delivery::DeliveryQueue;
using alo::scheduler::CampaignScheduler;

constexpr uint64_t kNowMs = 1'700'000'000'000ULL;

void InsertScheduled(MemoryRepository& repo, const std::string& id, uint64_t send_at_ms) {
  CampaignRecord r;
  r.id            = id;
  r.title         = "t";
  r.body          = "b";
  r.status        = CAMPAIGN_STATUS_SCHEDULED;
  r.version       = 2;
  r.send_at_ms    = send_at_ms;
  r.created_at_ms = kNowMs - 1000;
  r.updated_at_ms = kNowMs - 1000;

  auto tx     = repo.Begin();
  auto result = repo.InsertCampaign(*tx, r);
  assert(result);
  tx->Commit();
}

CampaignRecord Load(MemoryRepository& repo, const std::string& id) {
  auto tx = repo.Begin();
  auto r  = repo.GetCampaign(*tx, id);
  tx->Commit();
  assert(r.has_value());
  return *r;
}

void TestPromotesOnlyDueCampaigns() {
  auto repo  = std::make_shared<MemoryRepository>();
  auto queue = std::make_shared<DeliveryQueue>();

  InsertScheduled(*repo, "past", kNowMs - 60'000);
  InsertScheduled(*repo, "exact", kNowMs);
  InsertScheduled(*repo, "future", kNowMs + 60'000);

  CampaignScheduler scheduler(repo, queue, 10);
  auto              report = scheduler.Sweep(alo::util::FromUnixMillis(kNowMs));

  assert(report.promoted == 2);
  assert(report.race_lost == 0);

  auto past = Load(*repo, "past");
  assert(past.status == CAMPAIGN_STATUS_QUEUED);
  assert(past.version == 3);
  assert(past.queued_at_ms == kNowMs);
  assert(Load(*repo, "exact").status == CAMPAIGN_STATUS_QUEUED);
  assert(Load(*repo, "future").status == CAMPAIGN_STATUS_SCHEDULED);

  assert(queue->Size() == 2);

  // a second sweep at the same instant finds nothing
  assert(scheduler.Sweep(alo::util::FromUnixMillis(kNowMs)).promoted == 0);

  // the future campaign becomes due later
  assert(scheduler.Sweep(alo::util::FromUnixMillis(kNowMs + 60'000)).promoted == 1);
  assert(Load(*repo, "future").status == CAMPAIGN_STATUS_QUEUED);
}

void TestPagesThroughLargeBacklog() {
  auto repo = std::make_shared<MemoryRepository>();
  for (int i = 0; i < 25; ++i) InsertScheduled(*repo, "c" + std::to_string(i), kNowMs - 1000 - i);

  CampaignScheduler scheduler(repo, nullptr, 4);
  assert(scheduler.Sweep(alo::util::FromUnixMillis(kNowMs)).promoted == 25);
}

void TestConcurrentSweepsPromoteOnce() {
  constexpr int kCampaigns = 200;
  constexpr int kSweepers  = 8;

  auto repo  = std::make_shared<MemoryRepository>();
  auto queue = std::make_shared<DeliveryQueue>();
  for (int i = 0; i < kCampaigns; ++i) InsertScheduled(*repo, "c" + std::to_string(i), kNowMs - 1);

  std::atomic<uint64_t>    promoted{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kSweepers; ++t) {
    threads.emplace_back([&] {
      CampaignScheduler scheduler(repo, queue, 16);
      promoted += scheduler.Sweep(alo::util::FromUnixMillis(kNowMs)).promoted;
    });
  }
  for (auto& t : threads) t.join();

  assert(promoted.load() == kCampaigns);
  assert(queue->Size() == kCampaigns);

  for (int i = 0; i < kCampaigns; ++i) {
    auto r = Load(*repo, "c" + std::to_string(i));
    assert(r.status == CAMPAIGN_STATUS_QUEUED);
    assert(r.version == 3);
  }
}

} // namespace

int main() {
  TestPromotesOnlyDueCampaigns();
  TestPagesThroughLargeBacklog();
  TestConcurrentSweepsPromoteOnce();

  std::cout << "alo_unit_campaign_scheduler: pass\n";
  return 0;
}
