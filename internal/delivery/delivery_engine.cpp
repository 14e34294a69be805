#include "delivery_engine.hpp"

#include <algorithm>
#include <string_view>
#include <thread>
#include <unordered_map>

#include "internal/campaign/campaign_codec.hpp"
#include "internal/campaign/campaign_validation.hpp"
#include "internal/model/campaign_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/db_error.hpp"
#include "internal/util/errors.hpp"

namespace alo::delivery {

using namespace alo::campaign::v1;
using db::model::CampaignRecord;
using db::model::DeliveryOutcomeRecord;
using db::model::SubscriberRecord;

namespace {

constexpr std::string_view kInactiveRecipient = "subscriber no longer active";

bool IsFinal(DeliveryStatus status) {
  return status == DELIVERY_STATUS_SENT || status == DELIVERY_STATUS_FAILED_PERMANENT;
}

std::string_view OutcomeName(DeliveryStatus status) {
  switch (status) {
    case DELIVERY_STATUS_SENT:
      return "sent";
    case DELIVERY_STATUS_FAILED_TRANSIENT:
      return "failed_transient";
    case DELIVERY_STATUS_FAILED_PERMANENT:
      return "failed_permanent";
    default:
      return "pending";
  }
}

double ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

} // namespace

DeliveryEngine::DeliveryEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<segment::SegmentCatalog> catalog,
                               std::shared_ptr<audience::AudienceResolver> resolver, std::shared_ptr<push::PushTransport> transport,
                               DeliveryOptions options, util::NowFn now)
    : repository_(std::move(repository)),
      catalog_(std::move(catalog)),
      resolver_(std::move(resolver)),
      transport_(std::move(transport)),
      options_(std::move(options)),
      now_(std::move(now)) {
  if (options_.batch_size == 0) options_.batch_size = 500;
  if (options_.max_concurrency == 0) options_.max_concurrency = 1;
  if (options_.claim_lease.count() <= 0) options_.claim_lease = std::chrono::milliseconds(120000);
}

void DeliveryEngine::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    shutdown_ = true;
  }
  wait_cv_.notify_all();
}

bool DeliveryEngine::WaitFor(std::chrono::milliseconds wait) {
  std::unique_lock<std::mutex> lock(wait_mutex_);
  return !wait_cv_.wait_for(lock, wait, [&] { return shutdown_.load(); });
}

// ------------------------------------------------------------
// Claim
// ------------------------------------------------------------

bool DeliveryEngine::Claim(const std::string& campaign_id, CampaignRecord& campaign) {
  const uint64_t now_ms = NowMs();

  auto tx      = repository_->Begin();
  auto current = repository_->GetCampaign(*tx, campaign_id);
  if (!current) {
    ALO_LOG_DEBUG("delivery claim skipped: campaign gone", {observability::StringField("campaign_id", campaign_id)});
    return false;
  }

  const bool queued   = current->status == CAMPAIGN_STATUS_QUEUED;
  const bool takeover = current->status == CAMPAIGN_STATUS_SENDING && current->claim_expires_at_ms < now_ms;
  if (!queued && !takeover) {
    return false;
  }

  auto updated                = *current;
  updated.status              = CAMPAIGN_STATUS_SENDING;
  updated.version             = current->version + 1;
  updated.claimed_by          = options_.worker_id;
  updated.claim_expires_at_ms = now_ms + static_cast<uint64_t>(options_.claim_lease.count());
  updated.updated_at_ms       = now_ms;
  if (updated.started_at_ms == 0) updated.started_at_ms = now_ms;

  auto result = repository_->UpdateCampaignIf(*tx, updated, current->status, current->version);
  if (result.code == db::ErrorCode::Conflict || result.code == db::ErrorCode::NotFound) {
    tx->Rollback();
    ALO_LOG_DEBUG("delivery claim lost", {observability::StringField("campaign_id", campaign_id)});
    return false;
  }
  util::ThrowIfDbError(result, "claim campaign " + campaign_id);
  tx->Commit();

  if (takeover) {
    ALO_LOG_WARN("delivery took over expired claim",
                 {observability::StringField("campaign_id", campaign_id), observability::StringField("previous_worker", current->claimed_by)});
  }
  campaign = std::move(updated);
  return true;
}

bool DeliveryEngine::WriteIf(db::Transaction& tx, const CampaignRecord& current, CampaignRecord& updated) {
  const uint64_t now_ms = NowMs();

  updated.version       = current.version + 1;
  updated.updated_at_ms = now_ms;
  if (updated.status == CAMPAIGN_STATUS_SENDING) {
    updated.claim_expires_at_ms = now_ms + static_cast<uint64_t>(options_.claim_lease.count());
  }

  if (!model::CanTransition(current.status, updated.status)) {
    throw util::InvalidState("campaign " + current.id + " cannot move from " + std::string(model::StatusName(current.status)) + " to " +
                             std::string(model::StatusName(updated.status)));
  }

  auto result = repository_->UpdateCampaignIf(tx, updated, current.status, current.version);
  if (result.code == db::ErrorCode::Conflict || result.code == db::ErrorCode::NotFound) {
    ALO_LOG_WARN("delivery claim lost", {observability::StringField("campaign_id", current.id), observability::StringField("worker", options_.worker_id)});
    return false;
  }
  util::ThrowIfDbError(result, "update campaign " + current.id);
  return true;
}

bool DeliveryEngine::Update(CampaignRecord& campaign, const std::function<void(CampaignRecord&)>& mutate) {
  auto updated = campaign;
  mutate(updated);

  auto tx = repository_->Begin();
  if (!WriteIf(*tx, campaign, updated)) {
    tx->Rollback();
    return false;
  }
  tx->Commit();

  campaign = std::move(updated);
  return true;
}

// ------------------------------------------------------------
// Dispatch
// ------------------------------------------------------------

push::DispatchResult DeliveryEngine::SendOne(const SubscriberRecord& subscriber, const alo::push::v1::PushMessage& message) {
  try {
    return transport_->Send(subscriber, message);
  } catch (const std::exception& e) {
    return push::DispatchResult{push::DispatchStatus::kTransient, std::string("transport error: ") + e.what(), 0};
  }
}

std::chrono::milliseconds DeliveryEngine::HeartbeatInterval() const {
  return std::max(std::chrono::milliseconds(1), options_.claim_lease / 3);
}

std::vector<push::DispatchResult> DeliveryEngine::Dispatch(CampaignRecord& campaign, const std::vector<SubscriberRecord>& targets,
                                                           const alo::push::v1::PushMessage& message, std::vector<char>& sent, bool& claim_lost) {
  std::vector<push::DispatchResult> results(targets.size());
  sent.assign(targets.size(), 0);
  if (targets.empty()) return results;

  std::atomic<std::size_t> next{0};
  std::atomic<bool>        stop{false};
  std::mutex               done_mutex;
  std::condition_variable  done_cv;
  std::size_t              running = std::min(options_.max_concurrency, targets.size());

  auto work = [&] {
    for (std::size_t i = next.fetch_add(1); i < targets.size() && !stop.load(); i = next.fetch_add(1)) {
      results[i] = SendOne(targets[i], message);
      sent[i]    = 1;
    }
    std::lock_guard<std::mutex> lock(done_mutex);
    if (--running == 0) done_cv.notify_all();
  };

  const std::size_t        parallel = running;
  std::vector<std::thread> threads;
  threads.reserve(parallel);
  for (std::size_t i = 0; i < parallel; ++i) threads.emplace_back(work);

  auto join_all = [&] {
    for (auto& t : threads) t.join();
  };

  // this thread keeps the claim alive while the senders run
  try {
    std::unique_lock<std::mutex> lock(done_mutex);
    while (!done_cv.wait_for(lock, HeartbeatInterval(), [&] { return running == 0; })) {
      lock.unlock();
      const bool renewed = Update(campaign, [](CampaignRecord&) {});
      lock.lock();
      if (!renewed) {
        stop       = true;
        claim_lost = true;
        break;
      }
    }
  } catch (const std::exception&) {
    stop = true;
    join_all();
    throw;
  }
  join_all();

  return results;
}

DeliveryEngine::BatchStats DeliveryEngine::ProcessBatch(CampaignRecord& campaign, const alo::push::v1::PushMessage& message,
                                                        const std::vector<std::string>& subscriber_ids) {
  BatchStats stats;
  if (subscriber_ids.empty()) return stats;

  const auto     started = std::chrono::steady_clock::now();
  const uint64_t now_ms  = NowMs();

  std::unordered_map<std::string, DeliveryOutcomeRecord> outcomes;
  std::unordered_map<std::string, SubscriberRecord>      subscribers;
  {
    auto tx = repository_->Begin();
    for (auto& o : repository_->GetOutcomes(*tx, campaign.id, subscriber_ids)) outcomes.emplace(o.subscriber_id, std::move(o));
    for (auto& s : repository_->GetSubscribers(*tx, subscriber_ids)) subscribers.emplace(s.id, std::move(s));
    tx->Commit();
  }

  std::vector<SubscriberRecord>      targets;
  std::vector<DeliveryOutcomeRecord> closed; // transient outcomes whose subscriber went away
  for (const auto& id : subscriber_ids) {
    auto prior = outcomes.find(id);
    if (prior != outcomes.end()) {
      if (IsFinal(prior->second.status)) continue;
      if (prior->second.status == DELIVERY_STATUS_FAILED_TRANSIENT && prior->second.next_attempt_at_ms > now_ms) continue;
    }

    auto sub = subscribers.find(id);
    if (sub == subscribers.end() || !sub->second.active) {
      if (prior != outcomes.end() && prior->second.status == DELIVERY_STATUS_FAILED_TRANSIENT) {
        auto outcome               = prior->second;
        outcome.status             = DELIVERY_STATUS_FAILED_PERMANENT;
        outcome.next_attempt_at_ms = 0;
        outcome.last_error         = std::string(kInactiveRecipient);
        closed.push_back(std::move(outcome));
      }
      continue;
    }
    targets.push_back(sub->second);
  }

  std::vector<char> sent;
  bool              claim_lost = false;
  const auto        results    = Dispatch(campaign, targets, message, sent, claim_lost);
  stats.dispatched             = static_cast<uint64_t>(std::count(sent.begin(), sent.end(), 1));
  if (claim_lost) {
    // nothing is recorded without the claim
    stats.claim_lost = true;
    return stats;
  }

  std::vector<DeliveryOutcomeRecord> written;
  std::vector<std::string>           gone;
  written.reserve(targets.size() + closed.size());
  for (std::size_t i = 0; i < targets.size(); ++i) {
    const auto& subscriber = targets[i];
    const auto& result     = results[i];

    DeliveryOutcomeRecord outcome;
    outcome.campaign_id        = campaign.id;
    outcome.subscriber_id      = subscriber.id;
    auto prior                 = outcomes.find(subscriber.id);
    outcome.attempts           = (prior == outcomes.end() ? 0 : prior->second.attempts) + 1;
    outcome.last_attempt_at_ms = now_ms;

    switch (result.status) {
      case push::DispatchStatus::kSent:
        outcome.status = DELIVERY_STATUS_SENT;
        break;
      case push::DispatchStatus::kGone:
        outcome.status     = DELIVERY_STATUS_FAILED_PERMANENT;
        outcome.last_error = result.detail.empty() ? "endpoint gone" : result.detail;
        gone.push_back(subscriber.id);
        break;
      case push::DispatchStatus::kRejected:
        outcome.status     = DELIVERY_STATUS_FAILED_PERMANENT;
        outcome.last_error = result.detail.empty() ? "payload rejected" : result.detail;
        break;
      case push::DispatchStatus::kTransient:
        outcome.last_error = result.detail.empty() ? "transient failure" : result.detail;
        if (options_.retry.Exhausted(outcome.attempts)) {
          outcome.status = DELIVERY_STATUS_FAILED_PERMANENT;
        } else {
          outcome.status             = DELIVERY_STATUS_FAILED_TRANSIENT;
          outcome.next_attempt_at_ms = now_ms + options_.retry.BackoffMs(outcome.attempts, result.retry_after_ms);
          ++stats.transient;
        }
        break;
    }
    written.push_back(std::move(outcome));
  }
  for (auto& outcome : closed) written.push_back(std::move(outcome));

  // outcomes are only recorded by the worker that still holds the claim
  {
    auto tx      = repository_->Begin();
    auto renewed = campaign;
    if (!WriteIf(*tx, campaign, renewed)) {
      tx->Rollback();
      stats.claim_lost = true;
      return stats;
    }
    for (const auto& outcome : written) {
      util::ThrowIfDbError(repository_->UpsertOutcome(*tx, outcome), "record outcome " + campaign.id + "/" + outcome.subscriber_id);
    }
    for (const auto& id : gone) {
      auto result = repository_->SetSubscriberActive(*tx, id, false, now_ms);
      if (result.code == db::ErrorCode::NotFound) continue;
      util::ThrowIfDbError(result, "deactivate subscriber " + id);
    }
    tx->Commit();
    campaign = std::move(renewed);
  }

  if (!gone.empty()) catalog_->InvalidateValues();

  std::unordered_map<std::string_view, uint64_t> by_status;
  for (const auto& outcome : written) ++by_status[OutcomeName(outcome.status)];
  auto& metrics = observability::Metrics::Instance();
  for (const auto& [status, count] : by_status) metrics.RecordDeliveryOutcome(status, count);
  metrics.ObserveBatchDurationMs(ElapsedMs(started));

  return stats;
}

std::vector<SegmentFilter> DeliveryEngine::CheckExecutable(const CampaignRecord& campaign) const {
  auto content_problems = alo::campaign::ValidateContent(campaign);
  if (!content_problems.empty()) {
    throw util::ExecutionFailure(content_problems.front());
  }
  try {
    auto filters = segment::NormalizeFilters(campaign.segments, options_.duplicate_policy);
    for (const auto& filter : filters) catalog_->Require(filter.type());
    return filters;
  } catch (const util::InvalidArgument& e) {
    throw util::ExecutionFailure(e.what());
  } catch (const util::UnknownDimension& e) {
    throw util::ExecutionFailure(e.what());
  }
}

// ------------------------------------------------------------
// Run
// ------------------------------------------------------------

DeliveryReport DeliveryEngine::Run(const std::string& campaign_id) {
  observability::SpanScope span("delivery.run");
  span.SetAttribute("campaign_id", campaign_id);

  DeliveryReport report;
  CampaignRecord campaign;
  if (!Claim(campaign_id, campaign)) {
    report.final_status = CAMPAIGN_STATUS_UNSPECIFIED;
    return report;
  }
  report.claimed = true;
  ALO_LOG_INFO("delivery started", {observability::StringField("campaign_id", campaign_id), observability::StringField("worker", options_.worker_id)});

  // Content or filters that cannot be executed fail the campaign before
  // any recipient is contacted.
  std::string                problem;
  std::vector<SegmentFilter> filters;
  try {
    filters = CheckExecutable(campaign);
  } catch (const util::ExecutionFailure& e) {
    problem = e.what();
  }

  if (!problem.empty()) {
    report.interrupted = !Update(campaign, [&](CampaignRecord& r) {
      r.status              = CAMPAIGN_STATUS_FAILED;
      r.failure_reason      = problem;
      r.completed_at_ms     = NowMs();
      r.claim_expires_at_ms = 0;
    });
    report.final_status   = report.interrupted ? CAMPAIGN_STATUS_SENDING : CAMPAIGN_STATUS_FAILED;
    report.failure_reason = problem;
    if (!report.interrupted) {
      observability::Metrics::Instance().RecordCampaignFinished("failed");
      span.RecordException(problem);
      ALO_LOG_ERROR("delivery failed", {observability::StringField("campaign_id", campaign_id), observability::StringField("reason", problem)});
    }
    return report;
  }

  const auto message  = alo::campaign::ToPushMessage(campaign);
  auto       audience = resolver_->Resolve(filters, options_.batch_size);
  report.audience_count = audience.count;
  if (!Update(campaign, [&](CampaignRecord& r) { r.audience_count = audience.count; })) {
    report.interrupted  = true;
    report.final_status = CAMPAIGN_STATUS_SENDING;
    return report;
  }

  // first pass over the audience
  for (auto batch = audience.members->NextBatch(); !batch.empty(); batch = audience.members->NextBatch()) {
    if (IsShuttingDown()) {
      report.interrupted = true;
      break;
    }
    const auto stats = ProcessBatch(campaign, message, batch);
    report.dispatched += stats.dispatched;
    if (stats.claim_lost) {
      report.interrupted = true;
      break;
    }
  }

  // retry rounds until no transient failure is left
  while (!report.interrupted) {
    if (IsShuttingDown()) {
      report.interrupted = true;
      break;
    }

    std::vector<DeliveryOutcomeRecord> retryable;
    {
      auto tx   = repository_->Begin();
      retryable = repository_->ListRetryableOutcomes(*tx, campaign.id, options_.batch_size);
      tx->Commit();
    }
    if (retryable.empty()) break;

    const uint64_t now_ms = NowMs();
    if (retryable.front().next_attempt_at_ms > now_ms) {
      const auto wait = std::min<uint64_t>(retryable.front().next_attempt_at_ms - now_ms, options_.claim_lease.count() / 2);
      if (!WaitFor(std::chrono::milliseconds(std::max<uint64_t>(wait, 1)))) {
        report.interrupted = true;
        break;
      }
      if (!Update(campaign, [](CampaignRecord&) {})) report.interrupted = true;
      continue;
    }

    std::vector<std::string> ids;
    ids.reserve(retryable.size());
    for (const auto& outcome : retryable) ids.push_back(outcome.subscriber_id);

    const auto stats = ProcessBatch(campaign, message, ids);
    report.dispatched += stats.dispatched;
    if (stats.claim_lost) report.interrupted = true;
  }

  if (report.interrupted) {
    report.final_status = CAMPAIGN_STATUS_SENDING;
    ALO_LOG_WARN("delivery interrupted", {observability::StringField("campaign_id", campaign_id),
                                          observability::IntField("dispatched", static_cast<int64_t>(report.dispatched))});
    return report;
  }

  db::model::OutcomeTally tally;
  {
    auto tx = repository_->Begin();
    tally   = repository_->CountOutcomes(*tx, campaign.id);
    tx->Commit();
  }

  const bool finished = Update(campaign, [&](CampaignRecord& r) {
    r.status              = CAMPAIGN_STATUS_COMPLETED;
    r.sent_count          = tally.sent;
    r.failed_count        = tally.failed_permanent + tally.failed_transient;
    r.completed_at_ms     = NowMs();
    r.claim_expires_at_ms = 0;
  });
  if (!finished) {
    report.interrupted  = true;
    report.final_status = CAMPAIGN_STATUS_SENDING;
    return report;
  }

  report.final_status = CAMPAIGN_STATUS_COMPLETED;
  report.sent         = campaign.sent_count;
  report.failed       = campaign.failed_count;

  span.SetAttribute("audience", static_cast<int64_t>(report.audience_count));
  span.SetAttribute("sent", static_cast<int64_t>(report.sent));
  span.SetAttribute("failed", static_cast<int64_t>(report.failed));
  observability::Metrics::Instance().RecordCampaignFinished("completed");
  ALO_LOG_INFO("delivery completed", {observability::StringField("campaign_id", campaign_id),
                                      observability::IntField("audience", static_cast<int64_t>(report.audience_count)),
                                      observability::IntField("sent", static_cast<int64_t>(report.sent)),
                                      observability::IntField("failed", static_cast<int64_t>(report.failed))});
  return report;
}

} // namespace alo::delivery
