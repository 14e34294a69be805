#include "campaign_manager.hpp"

#include <algorithm>

#include "campaign_codec.hpp"
#include "campaign_validation.hpp"
#include "internal/delivery/delivery_queue.hpp"
#include "internal/model/campaign_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/db_error.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace alo::campaign {

using alo::campaign::v1::Campaign;
using alo::campaign::v1::CampaignStatus;
using namespace alo::campaign::v1;

CampaignManager::CampaignManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<segment::SegmentCatalog> catalog,
                                 std::shared_ptr<delivery::DeliveryQueue> queue, segment::DuplicateTypePolicy duplicate_policy, util::NowFn now)
    : repository_(std::move(repository)),
      catalog_(std::move(catalog)),
      queue_(std::move(queue)),
      duplicate_policy_(duplicate_policy),
      now_(std::move(now)) {
}

db::model::CampaignRecord CampaignManager::Load(db::Transaction& tx, const std::string& id) {
  auto record = repository_->GetCampaign(tx, id);
  if (!record) {
    throw util::NotFound("campaign not found: " + id);
  }
  return *record;
}

void CampaignManager::Store(db::Transaction& tx, const db::model::CampaignRecord& updated, const db::model::CampaignRecord& previous) {
  if (!model::CanTransition(previous.status, updated.status)) {
    throw util::InvalidState("campaign " + previous.id + " cannot move from " + std::string(model::StatusName(previous.status)) + " to " +
                             std::string(model::StatusName(updated.status)));
  }
  util::ThrowIfDbError(repository_->UpdateCampaignIf(tx, updated, previous.status, previous.version), "update campaign " + previous.id);
}

// ------------------------------------------------------------
// Save
// ------------------------------------------------------------

Campaign CampaignManager::Save(const Campaign& campaign) {
  const uint64_t now_ms = util::ToUnixMillis(now_());

  db::model::CampaignRecord edited;
  ApplyEditable(campaign, edited);
  edited.segments = ValidateCampaign(edited, *catalog_, duplicate_policy_);

  if (campaign.id().empty()) {
    edited.id            = util::NewId();
    edited.status        = CAMPAIGN_STATUS_DRAFT;
    edited.version       = 1;
    edited.created_at_ms = now_ms;
    edited.updated_at_ms = now_ms;

    auto tx = repository_->Begin();
    util::ThrowIfDbError(repository_->InsertCampaign(*tx, edited), "insert campaign");
    tx->Commit();

    ALO_LOG_INFO("campaign created", {observability::StringField("campaign_id", edited.id)});
    return ToProto(edited);
  }

  auto tx      = repository_->Begin();
  auto current = Load(*tx, campaign.id());

  if (!model::IsEditable(current.status)) {
    throw util::InvalidState("campaign " + current.id + " is " + std::string(model::StatusName(current.status)) + " and can no longer be edited");
  }
  if (campaign.version() != 0 && campaign.version() != current.version) {
    throw util::Conflict("campaign " + current.id + " was modified: expected version " + std::to_string(campaign.version()) + ", stored " +
                         std::to_string(current.version));
  }

  auto updated = current;
  ApplyEditable(campaign, updated);
  updated.segments       = edited.segments;
  updated.status         = CAMPAIGN_STATUS_DRAFT;
  updated.version        = current.version + 1;
  updated.updated_at_ms  = now_ms;
  updated.failure_reason = "";

  Store(*tx, updated, current);
  tx->Commit();

  ALO_LOG_INFO("campaign saved", {observability::StringField("campaign_id", updated.id), observability::IntField("version", updated.version)});
  return ToProto(updated);
}

// ------------------------------------------------------------
// Publish / Cancel
// ------------------------------------------------------------

Campaign CampaignManager::Publish(const std::string& id) {
  const uint64_t now_ms = util::ToUnixMillis(now_());

  auto tx      = repository_->Begin();
  auto current = Load(*tx, id);

  if (!model::IsEditable(current.status)) {
    throw util::InvalidState("campaign " + id + " is " + std::string(model::StatusName(current.status)) + " and cannot be published");
  }

  auto updated     = current;
  updated.segments = ValidateCampaign(current, *catalog_, duplicate_policy_);
  updated.version  = current.version + 1;
  updated.updated_at_ms = now_ms;

  // a send_at in the past still goes through the scheduler on its next sweep
  if (current.send_at_ms != 0) {
    updated.status = CAMPAIGN_STATUS_SCHEDULED;
  } else {
    updated.status       = CAMPAIGN_STATUS_QUEUED;
    updated.queued_at_ms = now_ms;
  }

  Store(*tx, updated, current);
  tx->Commit();

  if (updated.status == CAMPAIGN_STATUS_QUEUED && queue_) {
    queue_->Enqueue(id);
  }

  ALO_LOG_INFO("campaign published", {observability::StringField("campaign_id", id),
                                      observability::StringField("status", model::StatusName(updated.status)),
                                      observability::IntField("send_at_ms", static_cast<int64_t>(updated.send_at_ms))});
  return ToProto(updated);
}

Campaign CampaignManager::Cancel(const std::string& id) {
  auto tx      = repository_->Begin();
  auto current = Load(*tx, id);

  if (!model::IsCancellable(current.status)) {
    throw util::InvalidState("campaign " + id + " is " + std::string(model::StatusName(current.status)) + " and cannot be cancelled");
  }

  auto updated          = current;
  updated.status        = CAMPAIGN_STATUS_CANCELLED;
  updated.version       = current.version + 1;
  updated.updated_at_ms = util::ToUnixMillis(now_());

  Store(*tx, updated, current);
  tx->Commit();

  ALO_LOG_INFO("campaign cancelled", {observability::StringField("campaign_id", id)});
  return ToProto(updated);
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

Campaign CampaignManager::Get(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = Load(*tx, id);
  tx->Commit();
  return ToProto(record);
}

std::vector<Campaign> CampaignManager::List(CampaignStatus status, std::size_t limit) {
  if (limit == 0) limit = kDefaultListLimit;
  limit = std::min(limit, kMaxListLimit);

  auto tx      = repository_->Begin();
  auto records = repository_->ListCampaigns(*tx, status, limit);
  tx->Commit();

  std::vector<Campaign> out;
  out.reserve(records.size());
  for (const auto& record : records) out.push_back(ToProto(record));
  return out;
}

CampaignStats CampaignManager::Stats() {
  CampaignStats stats;
  auto          tx         = repository_->Begin();
  stats.by_status          = repository_->CountCampaignsByStatus(*tx);
  stats.active_subscribers = repository_->CountActiveSubscribers(*tx);
  tx->Commit();
  return stats;
}

} // namespace alo::campaign
