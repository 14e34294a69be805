#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/audience_query.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/campaign_record.hpp"
#include "internal/db/model/delivery_outcome_record.hpp"
#include "internal/db/model/subscriber_record.hpp"

namespace alo::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - UpdateCampaignIf is a compare-and-set on (status, version); it is the
    only way a campaign changes after insert
  - Outcome upserts are keyed on (campaign_id, subscriber_id)

  The DB is the source of truth for:
    campaign lifecycle
    subscriber active flag
    delivery outcomes
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Campaigns
  // ---------------------------------------------------------------------

  virtual Result InsertCampaign(Transaction&, const model::CampaignRecord&) = 0;

  virtual std::optional<model::CampaignRecord> GetCampaign(Transaction&, const std::string& id) = 0;

  // Writes `updated` only if the stored row still has expected_status and
  // expected_version. Conflict when it moved on, NotFound when it is gone.
  virtual Result UpdateCampaignIf(Transaction&, const model::CampaignRecord& updated, alo::campaign::v1::CampaignStatus expected_status,
                                  uint64_t expected_version) = 0;

  // Newest first. CAMPAIGN_STATUS_UNSPECIFIED lists every status.
  virtual std::vector<model::CampaignRecord> ListCampaigns(Transaction&, alo::campaign::v1::CampaignStatus status, std::size_t limit) = 0;

  // status = scheduled AND send_at_ms <= now_ms, oldest send_at first.
  virtual std::vector<model::CampaignRecord> ListDueScheduled(Transaction&, uint64_t now_ms, std::size_t limit) = 0;

  // queued, or sending with a claim that expired before now_ms.
  virtual std::vector<std::string> ListClaimable(Transaction&, uint64_t now_ms, std::size_t limit) = 0;

  virtual Result DeleteDraftsOlderThan(Transaction&, uint64_t cutoff_ms, uint64_t& deleted) = 0;

  virtual std::map<alo::campaign::v1::CampaignStatus, uint64_t> CountCampaignsByStatus(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Subscribers
  // ---------------------------------------------------------------------

  virtual Result UpsertSubscriber(Transaction&, const model::SubscriberRecord&) = 0;

  virtual std::optional<model::SubscriberRecord> GetSubscriber(Transaction&, const std::string& id) = 0;

  // Missing ids are skipped. Order is unspecified.
  virtual std::vector<model::SubscriberRecord> GetSubscribers(Transaction&, const std::vector<std::string>& ids) = 0;

  virtual Result SetSubscriberActive(Transaction&, const std::string& id, bool active, uint64_t updated_at_ms) = 0;

  // Cardinality of the audience without materializing ids.
  virtual uint64_t CountAudience(Transaction&, const AudienceQuery&) = 0;

  // Keyset page: matching ids strictly greater than after_id, ascending.
  virtual std::vector<std::string> ListAudience(Transaction&, const AudienceQuery&, const std::string& after_id, std::size_t limit) = 0;

  // Distinct non-empty values observed on active subscribers, ascending.
  virtual std::vector<std::string> ListDistinctAttributeValues(Transaction&, SubscriberAttribute) = 0;

  virtual uint64_t CountActiveSubscribers(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Delivery outcomes
  // ---------------------------------------------------------------------

  virtual Result UpsertOutcome(Transaction&, const model::DeliveryOutcomeRecord&) = 0;

  virtual std::vector<model::DeliveryOutcomeRecord> GetOutcomes(Transaction&, const std::string& campaign_id,
                                                                const std::vector<std::string>& subscriber_ids) = 0;

  // failed-transient outcomes of a campaign, earliest next_attempt_at_ms first.
  virtual std::vector<model::DeliveryOutcomeRecord> ListRetryableOutcomes(Transaction&, const std::string& campaign_id, std::size_t limit) = 0;

  virtual model::OutcomeTally CountOutcomes(Transaction&, const std::string& campaign_id) = 0;
};

} // namespace alo::db
