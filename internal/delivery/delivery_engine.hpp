#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "alo/campaign/v1/types.pb.h"
#include "internal/audience/audience_resolver.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/push/push_transport.hpp"
#include "internal/segment/segment_catalog.hpp"
#include "internal/util/time.hpp"
#include "retry_policy.hpp"

namespace alo::delivery {

struct DeliveryOptions {
  std::string                  worker_id       = "worker";
  std::size_t                  batch_size      = 500;
  std::size_t                  max_concurrency = 16;
  std::chrono::milliseconds    claim_lease{120000};
  RetryPolicy                  retry;
  segment::DuplicateTypePolicy duplicate_policy = segment::DuplicateTypePolicy::kReject;
};

struct DeliveryReport {
  // false when another worker holds the campaign or it is not claimable
  bool claimed = false;
  // set when a shutdown or a lost claim stopped the run before the end
  bool interrupted = false;

  alo::campaign::v1::CampaignStatus final_status = alo::campaign::v1::CAMPAIGN_STATUS_UNSPECIFIED;
  std::string                       failure_reason;

  uint64_t audience_count = 0;
  uint64_t dispatched     = 0; // transport calls made by this run
  uint64_t sent           = 0; // final tallies over all runs
  uint64_t failed         = 0;
};

/*
  Takes one queued campaign to completed or failed.

  Run(id):
    1. claim queued (or sending with an expired claim) -> sending
    2. validate payload and filters; failure -> failed, nothing sent
    3. walk the audience in batches, skipping recipients with a final or
       not-yet-due outcome; dispatch in parallel up to max_concurrency
    4. record one outcome per recipient; gone endpoints deactivate the
       subscriber
    5. retry transient failures until none remain
    6. sending -> completed with tallies from the outcome rows

  The claim is renewed every claim_lease/3 while a batch is in flight,
  and every outcome write carries a conditional write on the claim, so a
  worker that lost the campaign stops dispatching and records nothing.
  Shutdown() interrupts waits; an interrupted campaign stays sending
  until its claim expires.
*/
class DeliveryEngine {
 public:
  DeliveryEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<segment::SegmentCatalog> catalog,
                 std::shared_ptr<audience::AudienceResolver> resolver, std::shared_ptr<push::PushTransport> transport, DeliveryOptions options,
                 util::NowFn now = util::Now);

  DeliveryReport Run(const std::string& campaign_id);

  void Shutdown();
  bool IsShuttingDown() const {
    return shutdown_.load();
  }

  const DeliveryOptions& Options() const {
    return options_;
  }

 private:
  struct BatchStats {
    uint64_t dispatched = 0;
    uint64_t transient  = 0;
    bool     claim_lost = false;
  };

  bool Claim(const std::string& campaign_id, db::model::CampaignRecord& campaign);

  // Throws ExecutionFailure when the payload or filters cannot be sent.
  // Returns the normalized filters; the stored campaign is left as is.
  std::vector<alo::campaign::v1::SegmentFilter> CheckExecutable(const db::model::CampaignRecord& campaign) const;

  // Conditional write of `updated` over `current` inside `tx`, renewing
  // the claim. false when the claim was lost to another worker.
  bool WriteIf(db::Transaction& tx, const db::model::CampaignRecord& current, db::model::CampaignRecord& updated);

  // Conditional write of `mutate(campaign)`, renewing the claim. false
  // when the claim was lost to another worker.
  bool Update(db::model::CampaignRecord& campaign, const std::function<void(db::model::CampaignRecord&)>& mutate);

  BatchStats ProcessBatch(db::model::CampaignRecord& campaign, const alo::push::v1::PushMessage& message,
                          const std::vector<std::string>& subscriber_ids);

  // Sends to every target until done or the claim is lost; renews the
  // claim on `campaign` while sends are in flight. `sent[i]` is set for
  // every target the transport was called for.
  std::vector<push::DispatchResult> Dispatch(db::model::CampaignRecord& campaign, const std::vector<db::model::SubscriberRecord>& targets,
                                             const alo::push::v1::PushMessage& message, std::vector<char>& sent, bool& claim_lost);

  std::chrono::milliseconds HeartbeatInterval() const;

  push::DispatchResult SendOne(const db::model::SubscriberRecord& subscriber, const alo::push::v1::PushMessage& message);

  // Sleeps up to `wait`; false when woken by Shutdown.
  bool WaitFor(std::chrono::milliseconds wait);

  uint64_t NowMs() const {
    return util::ToUnixMillis(now_());
  }

  std::shared_ptr<db::Repository>             repository_;
  std::shared_ptr<segment::SegmentCatalog>    catalog_;
  std::shared_ptr<audience::AudienceResolver> resolver_;
  std::shared_ptr<push::PushTransport>        transport_;
  DeliveryOptions                             options_;
  util::NowFn                                 now_;

  std::mutex              wait_mutex_;
  std::condition_variable wait_cv_;
  std::atomic<bool>       shutdown_{false};
};

} // namespace alo::delivery
