#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace alo::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertCampaign(Transaction&, const model::CampaignRecord&) override;
  std::optional<model::CampaignRecord> GetCampaign(Transaction&, const std::string&) override;
  Result UpdateCampaignIf(Transaction&, const model::CampaignRecord&, alo::campaign::v1::CampaignStatus, uint64_t) override;
  std::vector<model::CampaignRecord> ListCampaigns(Transaction&, alo::campaign::v1::CampaignStatus, std::size_t) override;
  std::vector<model::CampaignRecord> ListDueScheduled(Transaction&, uint64_t, std::size_t) override;
  std::vector<std::string> ListClaimable(Transaction&, uint64_t, std::size_t) override;
  Result DeleteDraftsOlderThan(Transaction&, uint64_t, uint64_t&) override;
  std::map<alo::campaign::v1::CampaignStatus, uint64_t> CountCampaignsByStatus(Transaction&) override;

  Result UpsertSubscriber(Transaction&, const model::SubscriberRecord&) override;
  std::optional<model::SubscriberRecord> GetSubscriber(Transaction&, const std::string&) override;
  std::vector<model::SubscriberRecord> GetSubscribers(Transaction&, const std::vector<std::string>&) override;
  Result SetSubscriberActive(Transaction&, const std::string&, bool, uint64_t) override;
  uint64_t CountAudience(Transaction&, const AudienceQuery&) override;
  std::vector<std::string> ListAudience(Transaction&, const AudienceQuery&, const std::string&, std::size_t) override;
  std::vector<std::string> ListDistinctAttributeValues(Transaction&, SubscriberAttribute) override;
  uint64_t CountActiveSubscribers(Transaction&) override;

  Result UpsertOutcome(Transaction&, const model::DeliveryOutcomeRecord&) override;
  std::vector<model::DeliveryOutcomeRecord> GetOutcomes(Transaction&, const std::string&, const std::vector<std::string>&) override;
  std::vector<model::DeliveryOutcomeRecord> ListRetryableOutcomes(Transaction&, const std::string&, std::size_t) override;
  model::OutcomeTally CountOutcomes(Transaction&, const std::string&) override;

 private:
  friend class MemoryTransaction;

  using OutcomeKey = std::pair<std::string, std::string>;

  struct State {
    std::unordered_map<std::string, model::CampaignRecord> campaigns;
    // ordered by id for keyset paging
    std::map<std::string, model::SubscriberRecord>        subscribers;
    std::map<OutcomeKey, model::DeliveryOutcomeRecord>    outcomes;
  };

  std::mutex                   mutex_;
  std::atomic<std::thread::id> owner_{};
  State                        state_;
};

} // namespace alo::db::memory
