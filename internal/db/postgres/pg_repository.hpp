#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace alo::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result                               InsertCampaign(Transaction&, const model::CampaignRecord&) override;
  std::optional<model::CampaignRecord> GetCampaign(Transaction&, const std::string& id) override;
  Result UpdateCampaignIf(Transaction&, const model::CampaignRecord&, alo::campaign::v1::CampaignStatus expected_status, uint64_t expected_version) override;
  std::vector<model::CampaignRecord> ListCampaigns(Transaction&, alo::campaign::v1::CampaignStatus status, std::size_t limit) override;
  std::vector<model::CampaignRecord> ListDueScheduled(Transaction&, uint64_t now_ms, std::size_t limit) override;
  std::vector<std::string>           ListClaimable(Transaction&, uint64_t now_ms, std::size_t limit) override;
  Result                             DeleteDraftsOlderThan(Transaction&, uint64_t cutoff_ms, uint64_t& deleted) override;
  std::map<alo::campaign::v1::CampaignStatus, uint64_t> CountCampaignsByStatus(Transaction&) override;

  Result                                 UpsertSubscriber(Transaction&, const model::SubscriberRecord&) override;
  std::optional<model::SubscriberRecord> GetSubscriber(Transaction&, const std::string& id) override;
  std::vector<model::SubscriberRecord>   GetSubscribers(Transaction&, const std::vector<std::string>& ids) override;
  Result                                 SetSubscriberActive(Transaction&, const std::string& id, bool active, uint64_t updated_at_ms) override;
  uint64_t                               CountAudience(Transaction&, const AudienceQuery&) override;
  std::vector<std::string> ListAudience(Transaction&, const AudienceQuery&, const std::string& after_id, std::size_t limit) override;
  std::vector<std::string> ListDistinctAttributeValues(Transaction&, SubscriberAttribute) override;
  uint64_t                 CountActiveSubscribers(Transaction&) override;

  Result                                    UpsertOutcome(Transaction&, const model::DeliveryOutcomeRecord&) override;
  std::vector<model::DeliveryOutcomeRecord> GetOutcomes(Transaction&, const std::string& campaign_id,
                                                        const std::vector<std::string>& subscriber_ids) override;
  std::vector<model::DeliveryOutcomeRecord> ListRetryableOutcomes(Transaction&, const std::string& campaign_id, std::size_t limit) override;
  model::OutcomeTally                       CountOutcomes(Transaction&, const std::string& campaign_id) override;

 private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception& e);
};

} // namespace alo::db::postgres
