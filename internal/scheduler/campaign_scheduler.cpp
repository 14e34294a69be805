#include "campaign_scheduler.hpp"

#include <vector>

#include "internal/delivery/delivery_queue.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/db_error.hpp"

namespace alo::scheduler {

using alo::campaign::v1::CAMPAIGN_STATUS_QUEUED;

CampaignScheduler::CampaignScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<delivery::DeliveryQueue> queue, std::size_t sweep_batch)
    : repository_(std::move(repository)), queue_(std::move(queue)), sweep_batch_(sweep_batch == 0 ? 100 : sweep_batch) {
}

SweepReport CampaignScheduler::Sweep(util::TimePoint now) {
  observability::SpanScope span("scheduler.sweep");

  const uint64_t           now_ms = util::ToUnixMillis(now);
  SweepReport              report;
  std::vector<std::string> promoted_ids;

  // Page until a sweep finds nothing due. Every page commits before the
  // next read, so promoted rows drop out of the due set.
  for (;;) {
    std::vector<db::model::CampaignRecord> due;
    {
      auto tx = repository_->Begin();
      due     = repository_->ListDueScheduled(*tx, now_ms, sweep_batch_);
      tx->Commit();
    }
    if (due.empty()) break;

    uint64_t page_promoted = 0;
    for (const auto& campaign : due) {
      auto updated          = campaign;
      updated.status        = CAMPAIGN_STATUS_QUEUED;
      updated.version       = campaign.version + 1;
      updated.queued_at_ms  = now_ms;
      updated.updated_at_ms = now_ms;

      auto tx     = repository_->Begin();
      auto result = repository_->UpdateCampaignIf(*tx, updated, campaign.status, campaign.version);
      if (result.code == db::ErrorCode::Conflict || result.code == db::ErrorCode::NotFound) {
        tx->Rollback();
        ++report.race_lost;
        ALO_LOG_DEBUG("scheduler race lost", {observability::StringField("campaign_id", campaign.id)});
        continue;
      }
      util::ThrowIfDbError(result, "promote campaign " + campaign.id);
      tx->Commit();

      ++report.promoted;
      ++page_promoted;
      promoted_ids.push_back(campaign.id);
    }

    // a full page lost entirely to other sweepers: they are draining it
    if (due.size() < sweep_batch_ || page_promoted == 0) break;
  }

  if (queue_) {
    for (const auto& id : promoted_ids) queue_->Enqueue(id);
  }

  span.SetAttribute("promoted", static_cast<int64_t>(report.promoted));
  span.SetAttribute("race_lost", static_cast<int64_t>(report.race_lost));
  observability::Metrics::Instance().RecordSweepPromotions(report.promoted, report.race_lost);
  if (report.promoted > 0 || report.race_lost > 0) {
    ALO_LOG_INFO("scheduler sweep", {observability::IntField("promoted", static_cast<int64_t>(report.promoted)),
                                     observability::IntField("race_lost", static_cast<int64_t>(report.race_lost))});
  }
  return report;
}

} // namespace alo::scheduler
