#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/audience/audience_resolver.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/delivery/delivery_engine.hpp"
#include "internal/push/push_transport.hpp"
#include "internal/segment/segment_catalog.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace alo::campaign::v1;
using alo::audience::AudienceResolver;
using alo::db::memory::MemoryRepository;
using alo::db::model::CampaignRecord;
using alo::db::model::DeliveryOutcomeRecord;
using alo::db::model::SubscriberRecord;
using alo::delivery::DeliveryEngine;
using alo::delivery::DeliveryOptions;
using alo::push::DispatchResult;
using alo::push::DispatchStatus;
using alo::segment::SegmentCatalog;

// ------------------------------------------------------------
// Scripted transport
// ------------------------------------------------------------

/*
  Replies per subscriber from a script; the last entry repeats. Unknown
  subscribers are sent. A "throw" entry raises from Send.
*/
class ScriptedTransport final : public alo::push::PushTransport {
 public:
  struct Step {
    DispatchStatus status = DispatchStatus::kSent;
    bool           raise  = false;
  };

  void Script(const std::string& subscriber_id, std::vector<Step> steps) {
    std::lock_guard lock(mutex_);
    scripts_[subscriber_id] = std::move(steps);
  }

  // runs after the reply is chosen, outside any repository transaction
  void OnSend(std::function<void(const std::string&)> hook) {
    hook_ = std::move(hook);
  }

  DispatchResult Send(const SubscriberRecord& subscriber, const alo::push::v1::PushMessage& message) override {
    Step step;
    {
      std::lock_guard lock(mutex_);
      assert(!message.title().empty());
      const auto call = calls_[subscriber.id]++;
      auto       it   = scripts_.find(subscriber.id);
      if (it != scripts_.end() && !it->second.empty()) {
        step = it->second[std::min<std::size_t>(call, it->second.size() - 1)];
      }
    }
    if (hook_) hook_(subscriber.id);
    if (step.raise) throw std::runtime_error("connection reset");
    return DispatchResult{step.status, "", 0};
  }

  uint64_t Calls(const std::string& subscriber_id) {
    std::lock_guard lock(mutex_);
    auto            it = calls_.find(subscriber_id);
    return it == calls_.end() ? 0 : it->second;
  }

  uint64_t TotalCalls() {
    std::lock_guard lock(mutex_);
    uint64_t        total = 0;
    for (const auto& [id, n] : calls_) total += n;
    return total;
  }

 private:
  std::mutex                                     mutex_;
  std::map<std::string, std::vector<Step>>       scripts_;
  std::map<std::string, uint64_t>                calls_;
  std::function<void(const std::string&)>        hook_;
};

constexpr ScriptedTransport::Step kSent{DispatchStatus::kSent, false};
constexpr ScriptedTransport::Step kGone{DispatchStatus::kGone, false};
constexpr ScriptedTransport::Step kRejected{DispatchStatus::kRejected, false};
constexpr ScriptedTransport::Step kTransient{DispatchStatus::kTransient, false};
constexpr ScriptedTransport::Step kThrow{DispatchStatus::kSent, true};

// ------------------------------------------------------------
// Fixture
// ------------------------------------------------------------

struct Fixture {
  explicit Fixture(std::size_t max_concurrency = 4, std::chrono::milliseconds claim_lease = std::chrono::milliseconds(60000),
                   std::size_t batch_size = 3) {
    options.worker_id              = "test-worker";
    options.batch_size             = batch_size;
    options.max_concurrency        = max_concurrency;
    options.claim_lease            = claim_lease;
    options.retry.max_attempts     = 3;
    options.retry.base_backoff_ms  = 1;
    options.retry.max_backoff_ms   = 5;
    engine = std::make_unique<DeliveryEngine>(repo, catalog, resolver, transport, options);
  }

  // a second engine on the same store, as another worker process would be
  std::unique_ptr<DeliveryEngine> OtherWorker(const std::string& worker_id) {
    auto other_options      = options;
    other_options.worker_id = worker_id;
    return std::make_unique<DeliveryEngine>(repo, catalog, resolver, transport, other_options);
  }

  void AddSubscriber(const std::string& id, const std::string& country, bool active = true) {
    SubscriberRecord s;
    s.id              = id;
    s.endpoint        = "https://push.example/" + id;
    s.country         = country;
    s.browser         = "chrome";
    s.last_seen_at_ms = alo::util::ToUnixMillis(alo::util::Now());
    s.active          = active;

    auto       tx     = repo->Begin();
    const auto result = repo->UpsertSubscriber(*tx, s);
    assert(result);
    tx->Commit();
  }

  CampaignRecord MakeCampaign(const std::string& id, const std::string& country) {
    CampaignRecord r;
    r.id      = id;
    r.title   = "Flash sale";
    r.body    = "Everything 20% off";
    r.url     = "https://shop.example/sale";
    r.status  = CAMPAIGN_STATUS_QUEUED;
    r.version = 2;
    SegmentFilter f;
    f.set_type("country");
    f.add_values(country);
    r.segments.push_back(f);
    return r;
  }

  void Insert(const CampaignRecord& r) {
    auto       tx     = repo->Begin();
    const auto result = repo->InsertCampaign(*tx, r);
    assert(result);
    tx->Commit();
  }

  CampaignRecord Load(const std::string& id) {
    auto tx = repo->Begin();
    auto r  = repo->GetCampaign(*tx, id);
    tx->Commit();
    assert(r.has_value());
    return *r;
  }

  DeliveryOutcomeRecord Outcome(const std::string& campaign_id, const std::string& subscriber_id) {
    auto tx  = repo->Begin();
    auto out = repo->GetOutcomes(*tx, campaign_id, {subscriber_id});
    tx->Commit();
    assert(out.size() == 1);
    return out.front();
  }

  bool Active(const std::string& subscriber_id) {
    auto tx = repo->Begin();
    auto s  = repo->GetSubscriber(*tx, subscriber_id);
    tx->Commit();
    assert(s.has_value());
    return s->active;
  }

  DeliveryOptions                    options;
  std::shared_ptr<MemoryRepository>  repo      = std::make_shared<MemoryRepository>();
  std::shared_ptr<SegmentCatalog>    catalog   = std::make_shared<SegmentCatalog>(repo, std::chrono::milliseconds(1000));
  std::shared_ptr<AudienceResolver>  resolver  = std::make_shared<AudienceResolver>(repo, catalog);
  std::shared_ptr<ScriptedTransport> transport = std::make_shared<ScriptedTransport>();
  std::unique_ptr<DeliveryEngine>    engine;
};

// ------------------------------------------------------------
// Tests
// ------------------------------------------------------------

void TestRunCompletesWithTallies() {
  Fixture f;
  f.AddSubscriber("s1", "PT");
  f.AddSubscriber("s2", "PT");
  f.AddSubscriber("s3", "PT");
  f.AddSubscriber("s4", "PT");
  f.AddSubscriber("s5", "PT");
  f.AddSubscriber("s6", "BR");
  f.AddSubscriber("s7", "PT", false);

  f.transport->Script("s2", {kGone});
  f.transport->Script("s3", {kRejected});
  f.transport->Script("s4", {kTransient, kSent});
  f.transport->Script("s5", {kThrow});
  f.Insert(f.MakeCampaign("c1", "PT"));

  auto report = f.engine->Run("c1");
  assert(report.claimed);
  assert(!report.interrupted);
  assert(report.final_status == CAMPAIGN_STATUS_COMPLETED);
  assert(report.audience_count == 5);
  assert(report.sent == 2);
  assert(report.failed == 3);
  // 5 first-pass sends, one retry of s4, two of s5
  assert(report.dispatched == 8);

  auto c = f.Load("c1");
  assert(c.status == CAMPAIGN_STATUS_COMPLETED);
  assert(c.audience_count == 5);
  assert(c.sent_count == 2);
  assert(c.failed_count == 3);
  assert(c.started_at_ms > 0);
  assert(c.completed_at_ms >= c.started_at_ms);
  assert(c.claimed_by == "test-worker");

  assert(f.transport->Calls("s1") == 1);
  assert(f.transport->Calls("s4") == 2);
  assert(f.transport->Calls("s5") == 3);
  assert(f.transport->Calls("s6") == 0);
  assert(f.transport->Calls("s7") == 0);

  assert(f.Outcome("c1", "s1").status == DELIVERY_STATUS_SENT);
  assert(f.Outcome("c1", "s2").status == DELIVERY_STATUS_FAILED_PERMANENT);
  assert(f.Outcome("c1", "s3").status == DELIVERY_STATUS_FAILED_PERMANENT);

  auto s4 = f.Outcome("c1", "s4");
  assert(s4.status == DELIVERY_STATUS_SENT);
  assert(s4.attempts == 2);

  auto s5 = f.Outcome("c1", "s5");
  assert(s5.status == DELIVERY_STATUS_FAILED_PERMANENT);
  assert(s5.attempts == 3);
  assert(s5.last_error.find("connection reset") != std::string::npos);

  // gone endpoints are deactivated, nobody else is
  assert(!f.Active("s2"));
  assert(f.Active("s3"));
  assert(f.Active("s5"));
}

void TestCompletedCampaignIsNotClaimedAgain() {
  Fixture f;
  f.AddSubscriber("s1", "PT");
  f.Insert(f.MakeCampaign("c1", "PT"));

  assert(f.engine->Run("c1").final_status == CAMPAIGN_STATUS_COMPLETED);
  auto again = f.engine->Run("c1");
  assert(!again.claimed);
  assert(f.transport->Calls("s1") == 1);

  assert(!f.engine->Run("missing").claimed);
}

void TestLiveClaimIsRespected() {
  Fixture f;
  f.AddSubscriber("s1", "PT");

  auto c                = f.MakeCampaign("c1", "PT");
  c.status              = CAMPAIGN_STATUS_SENDING;
  c.claimed_by          = "other-worker";
  c.claim_expires_at_ms = alo::util::ToUnixMillis(alo::util::Now()) + 600000;
  f.Insert(c);

  auto report = f.engine->Run("c1");
  assert(!report.claimed);
  assert(f.transport->TotalCalls() == 0);
  assert(f.Load("c1").claimed_by == "other-worker");
}

void TestExpiredClaimResumesWithoutResending() {
  Fixture f;
  for (int i = 0; i < 7; ++i) f.AddSubscriber("s" + std::to_string(i), "PT");

  auto c                = f.MakeCampaign("c1", "PT");
  c.status              = CAMPAIGN_STATUS_SENDING;
  c.claimed_by          = "crashed-worker";
  c.claim_expires_at_ms = 1;
  c.started_at_ms       = 1;
  f.Insert(c);

  // the crashed worker already delivered to s0..s2
  {
    auto tx = f.repo->Begin();
    for (int i = 0; i < 3; ++i) {
      DeliveryOutcomeRecord o;
      o.campaign_id   = "c1";
      o.subscriber_id = "s" + std::to_string(i);
      o.status        = DELIVERY_STATUS_SENT;
      o.attempts      = 1;
      const auto result = f.repo->UpsertOutcome(*tx, o);
      assert(result);
    }
    tx->Commit();
  }

  auto report = f.engine->Run("c1");
  assert(report.claimed);
  assert(report.final_status == CAMPAIGN_STATUS_COMPLETED);
  assert(report.dispatched == 4);
  assert(report.sent == 7);

  for (int i = 0; i < 3; ++i) assert(f.transport->Calls("s" + std::to_string(i)) == 0);
  for (int i = 3; i < 7; ++i) assert(f.transport->Calls("s" + std::to_string(i)) == 1);

  auto stored = f.Load("c1");
  assert(stored.claimed_by == "test-worker");
  assert(stored.started_at_ms == 1);
}

void TestEmptyAudienceCompletes() {
  Fixture f;
  f.AddSubscriber("s1", "PT");
  f.Insert(f.MakeCampaign("c1", "XX"));

  auto report = f.engine->Run("c1");
  assert(report.final_status == CAMPAIGN_STATUS_COMPLETED);
  assert(report.audience_count == 0);
  assert(report.sent == 0);
  assert(report.failed == 0);
  assert(f.transport->TotalCalls() == 0);
}

void TestInvalidContentFailsBeforeSending() {
  Fixture f;
  f.AddSubscriber("s1", "PT");

  auto bad_image  = f.MakeCampaign("c1", "PT");
  bad_image.image = "http://cdn.example/banner.png";
  f.Insert(bad_image);

  auto report = f.engine->Run("c1");
  assert(report.claimed);
  assert(report.final_status == CAMPAIGN_STATUS_FAILED);
  assert(!report.failure_reason.empty());

  auto stored = f.Load("c1");
  assert(stored.status == CAMPAIGN_STATUS_FAILED);
  assert(stored.failure_reason == report.failure_reason);
  assert(stored.completed_at_ms > 0);

  auto unknown = f.MakeCampaign("c2", "PT");
  unknown.segments.front().set_type("zodiac");
  f.Insert(unknown);
  assert(f.engine->Run("c2").final_status == CAMPAIGN_STATUS_FAILED);
  assert(f.Load("c2").failure_reason.find("zodiac") != std::string::npos);

  assert(f.transport->TotalCalls() == 0);
}

void TestRecipientDeactivatedBeforeRetryIsClosed() {
  Fixture f(1);
  f.AddSubscriber("s1", "PT");
  f.transport->Script("s1", {kTransient});
  f.transport->OnSend([&](const std::string& id) {
    auto       tx     = f.repo->Begin();
    const auto result = f.repo->SetSubscriberActive(*tx, id, false, 0);
    assert(result);
    tx->Commit();
  });
  f.Insert(f.MakeCampaign("c1", "PT"));

  auto report = f.engine->Run("c1");
  assert(report.final_status == CAMPAIGN_STATUS_COMPLETED);
  assert(report.failed == 1);
  assert(f.transport->Calls("s1") == 1);

  auto outcome = f.Outcome("c1", "s1");
  assert(outcome.status == DELIVERY_STATUS_FAILED_PERMANENT);
  assert(outcome.last_error == "subscriber no longer active");
}

void TestParallelDispatchSendsEachOnce() {
  Fixture f(8);
  for (int i = 0; i < 50; ++i) f.AddSubscriber("p" + std::to_string(100 + i), "PT");
  f.Insert(f.MakeCampaign("c1", "PT"));

  auto report = f.engine->Run("c1");
  assert(report.sent == 50);
  assert(f.transport->TotalCalls() == 50);
  for (int i = 0; i < 50; ++i) assert(f.transport->Calls("p" + std::to_string(100 + i)) == 1);
}

void TestShutdownInterruptsRun() {
  Fixture f;
  f.AddSubscriber("s1", "PT");
  f.Insert(f.MakeCampaign("c1", "PT"));

  f.engine->Shutdown();
  auto report = f.engine->Run("c1");
  assert(report.claimed);
  assert(report.interrupted);
  assert(report.final_status == CAMPAIGN_STATUS_SENDING);
  assert(f.Load("c1").status == CAMPAIGN_STATUS_SENDING);
  assert(f.transport->TotalCalls() == 0);
}

void TestSlowBatchKeepsItsClaim() {
  // one batch of ten 60 ms sends takes twice the lease
  Fixture f(1, std::chrono::milliseconds(300), 10);
  for (int i = 0; i < 10; ++i) f.AddSubscriber("s" + std::to_string(i), "PT");
  f.transport->OnSend([](const std::string&) { std::this_thread::sleep_for(std::chrono::milliseconds(60)); });
  f.Insert(f.MakeCampaign("c1", "PT"));

  alo::delivery::DeliveryReport first;
  std::thread                   runner([&] { first = f.engine->Run("c1"); });

  std::this_thread::sleep_for(std::chrono::milliseconds(350));
  auto other  = f.OtherWorker("worker-b");
  auto second = other->Run("c1");
  runner.join();

  assert(!second.claimed);
  assert(first.claimed);
  assert(first.final_status == CAMPAIGN_STATUS_COMPLETED);
  assert(first.sent == 10);
  for (int i = 0; i < 10; ++i) assert(f.transport->Calls("s" + std::to_string(i)) == 1);
}

void TestLostClaimRecordsNothing() {
  Fixture f(1);
  f.AddSubscriber("s1", "PT");
  f.Insert(f.MakeCampaign("c1", "PT"));

  // another worker takes the campaign over while s1 is being sent
  std::atomic<bool> taken{false};
  f.transport->OnSend([&](const std::string&) {
    if (taken.exchange(true)) return;
    auto tx      = f.repo->Begin();
    auto current = f.repo->GetCampaign(*tx, "c1");
    assert(current);
    auto stolen       = *current;
    stolen.version    = current->version + 1;
    stolen.claimed_by = "worker-b";
    const auto result = f.repo->UpdateCampaignIf(*tx, stolen, current->status, current->version);
    assert(result);
    tx->Commit();
  });

  auto report = f.engine->Run("c1");
  assert(report.claimed);
  assert(report.interrupted);
  assert(report.final_status == CAMPAIGN_STATUS_SENDING);

  auto stored = f.Load("c1");
  assert(stored.status == CAMPAIGN_STATUS_SENDING);
  assert(stored.claimed_by == "worker-b");

  auto tx       = f.repo->Begin();
  auto outcomes = f.repo->GetOutcomes(*tx, "c1", {"s1"});
  tx->Commit();
  assert(outcomes.empty());
}

void TestGoneEndpointSkippedByLaterQueuedCampaign() {
  Fixture f;
  f.AddSubscriber("s1", "PT");
  f.AddSubscriber("s2", "PT");
  f.AddSubscriber("s3", "PT");
  f.transport->Script("s2", {kGone});

  // both queued before s2 is found gone
  f.Insert(f.MakeCampaign("c1", "PT"));
  f.Insert(f.MakeCampaign("c2", "PT"));

  assert(f.engine->Run("c1").final_status == CAMPAIGN_STATUS_COMPLETED);
  assert(f.transport->Calls("s2") == 1);

  auto report = f.engine->Run("c2");
  assert(report.final_status == CAMPAIGN_STATUS_COMPLETED);
  assert(report.audience_count == 2);
  assert(report.sent == 2);
  assert(f.transport->Calls("s2") == 1);
  assert(f.transport->Calls("s1") == 2);
  assert(f.transport->Calls("s3") == 2);
}

void TestRerunWithEveryRecipientSentOnlyFinalizes() {
  Fixture f;
  for (int i = 0; i < 3; ++i) f.AddSubscriber("s" + std::to_string(i), "PT");

  // the previous owner sent everything and died before finalizing
  auto c                = f.MakeCampaign("c1", "PT");
  c.status              = CAMPAIGN_STATUS_SENDING;
  c.claimed_by          = "crashed-worker";
  c.claim_expires_at_ms = 1;
  f.Insert(c);
  {
    auto tx = f.repo->Begin();
    for (int i = 0; i < 3; ++i) {
      DeliveryOutcomeRecord o;
      o.campaign_id     = "c1";
      o.subscriber_id   = "s" + std::to_string(i);
      o.status          = DELIVERY_STATUS_SENT;
      o.attempts        = 1;
      const auto result = f.repo->UpsertOutcome(*tx, o);
      assert(result);
    }
    tx->Commit();
  }

  auto report = f.engine->Run("c1");
  assert(report.claimed);
  assert(report.final_status == CAMPAIGN_STATUS_COMPLETED);
  assert(report.dispatched == 0);
  assert(report.sent == 3);
  assert(report.failed == 0);
  assert(f.transport->TotalCalls() == 0);
  assert(f.Load("c1").status == CAMPAIGN_STATUS_COMPLETED);
}

void TestMergedFiltersAreNotWrittenBack() {
  Fixture f;
  f.AddSubscriber("s1", "PT");
  f.AddSubscriber("s2", "BR");
  f.AddSubscriber("s3", "ES");

  auto c = f.MakeCampaign("c1", "PT");
  SegmentFilter again;
  again.set_type("country");
  again.add_values("BR");
  c.segments.push_back(again);
  f.Insert(c);

  f.options.duplicate_policy = alo::segment::DuplicateTypePolicy::kMerge;
  auto merging               = f.OtherWorker("merging-worker");

  auto report = merging->Run("c1");
  assert(report.final_status == CAMPAIGN_STATUS_COMPLETED);
  assert(report.audience_count == 2);
  assert(f.transport->Calls("s3") == 0);

  auto stored = f.Load("c1");
  assert(stored.segments.size() == 2);
  assert(stored.segments[0].values_size() == 1 && stored.segments[0].values(0) == "PT");
  assert(stored.segments[1].values_size() == 1 && stored.segments[1].values(0) == "BR");
}

} // namespace

int main() {
  TestRunCompletesWithTallies();
  TestCompletedCampaignIsNotClaimedAgain();
  TestLiveClaimIsRespected();
  TestExpiredClaimResumesWithoutResending();
  TestEmptyAudienceCompletes();
  TestInvalidContentFailsBeforeSending();
  TestRecipientDeactivatedBeforeRetryIsClosed();
  TestParallelDispatchSendsEachOnce();
  TestShutdownInterruptsRun();
  TestSlowBatchKeepsItsClaim();
  TestLostClaimRecordsNothing();
  TestGoneEndpointSkippedByLaterQueuedCampaign();
  TestRerunWithEveryRecipientSentOnlyFinalizes();
  TestMergedFiltersAreNotWrittenBack();

  std::cout << "alo_unit_delivery_engine: pass\n";
  return 0;
}
