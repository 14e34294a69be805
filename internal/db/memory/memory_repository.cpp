#include "memory_repository.hpp"

#include <algorithm>
#include <optional>
#include <set>

#include "memory_tx.hpp"

namespace alo::db::memory {

using alo::campaign::v1::CampaignStatus;
using namespace alo::campaign::v1;

namespace {

// Capture the current value under `key` so Rollback() can restore it.
template <typename Map>
void Remember(MemoryTransaction& tx, Map& map, const typename Map::key_type& key) {
  std::optional<typename Map::mapped_type> previous;
  if (auto it = map.find(key); it != map.end()) {
    previous = it->second;
  }
  tx.OnRollback([&map, key, previous] {
    if (previous) {
      map[key] = *previous;
    } else {
      map.erase(key);
    }
  });
}

const std::string& AttributeValue(const model::SubscriberRecord& s, SubscriberAttribute attribute) {
  switch (attribute) {
    case SubscriberAttribute::kBrowser:
      return s.browser;
    case SubscriberAttribute::kOs:
      return s.os;
    case SubscriberAttribute::kDevice:
      return s.device;
    case SubscriberAttribute::kCountry:
      return s.country;
    case SubscriberAttribute::kLanguage:
      return s.language;
  }
  return s.country;
}

bool InRange(uint64_t value, const TimeRange& range) {
  return value >= range.from_ms && (range.until_ms == 0 || value < range.until_ms);
}

bool Matches(const AudienceQuery& query, const model::SubscriberRecord& s) {
  if (query.match_nothing || !s.active) {
    return false;
  }

  for (const auto& match : query.attributes) {
    const auto& value = AttributeValue(s, match.attribute);
    if (std::find(match.values.begin(), match.values.end(), value) == match.values.end()) {
      return false;
    }
  }

  for (const auto& match : query.last_seen) {
    const bool any = std::any_of(match.ranges.begin(), match.ranges.end(), [&](const TimeRange& r) { return InRange(s.last_seen_at_ms, r); });
    if (!any) {
      return false;
    }
  }

  return true;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Campaigns
// ------------------------------------------------------------------

Result MemoryRepository::InsertCampaign(Transaction& t, const model::CampaignRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.campaigns.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "campaign exists: " + r.id);
  Remember(TX(t), s.campaigns, r.id);
  s.campaigns[r.id] = r;
  return Result::Ok();
}

std::optional<model::CampaignRecord> MemoryRepository::GetCampaign(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.campaigns.find(id);
  if (it == s.campaigns.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateCampaignIf(Transaction& t, const model::CampaignRecord& r, CampaignStatus expected_status, uint64_t expected_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.campaigns.find(r.id);
  if (it == s.campaigns.end()) return Result::Err(ErrorCode::NotFound, "campaign not found: " + r.id);
  if (it->second.status != expected_status || it->second.version != expected_version) {
    return Result::Err(ErrorCode::Conflict, "campaign changed concurrently: " + r.id);
  }
  Remember(TX(t), s.campaigns, r.id);
  it->second = r;
  return Result::Ok();
}

std::vector<model::CampaignRecord> MemoryRepository::ListCampaigns(Transaction& t, CampaignStatus status, std::size_t limit) {
  const auto&                        s = TX(t).View();
  std::vector<model::CampaignRecord> out;
  for (const auto& [_, record] : s.campaigns) {
    if (status == CAMPAIGN_STATUS_UNSPECIFIED || record.status == status) {
      out.push_back(record);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.id < b.id;
  });
  if (limit > 0 && out.size() > limit) out.resize(limit);
  return out;
}

std::vector<model::CampaignRecord> MemoryRepository::ListDueScheduled(Transaction& t, uint64_t now_ms, std::size_t limit) {
  const auto&                        s = TX(t).View();
  std::vector<model::CampaignRecord> out;
  for (const auto& [_, record] : s.campaigns) {
    if (record.status == CAMPAIGN_STATUS_SCHEDULED && record.send_at_ms <= now_ms) {
      out.push_back(record);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.send_at_ms != b.send_at_ms) return a.send_at_ms < b.send_at_ms;
    return a.id < b.id;
  });
  if (limit > 0 && out.size() > limit) out.resize(limit);
  return out;
}

std::vector<std::string> MemoryRepository::ListClaimable(Transaction& t, uint64_t now_ms, std::size_t limit) {
  const auto&                        s = TX(t).View();
  std::vector<model::CampaignRecord> candidates;
  for (const auto& [_, record] : s.campaigns) {
    const bool queued  = record.status == CAMPAIGN_STATUS_QUEUED;
    const bool expired = record.status == CAMPAIGN_STATUS_SENDING && record.claim_expires_at_ms < now_ms;
    if (queued || expired) candidates.push_back(record);
  }
  std::sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) {
    if (a.queued_at_ms != b.queued_at_ms) return a.queued_at_ms < b.queued_at_ms;
    return a.id < b.id;
  });

  std::vector<std::string> out;
  for (const auto& record : candidates) {
    if (limit > 0 && out.size() >= limit) break;
    out.push_back(record.id);
  }
  return out;
}

Result MemoryRepository::DeleteDraftsOlderThan(Transaction& t, uint64_t cutoff_ms, uint64_t& deleted) {
  auto& s = TX(t).Mutable();
  deleted = 0;

  std::vector<std::string> victims;
  for (const auto& [id, record] : s.campaigns) {
    if (record.status == CAMPAIGN_STATUS_DRAFT && record.updated_at_ms < cutoff_ms) {
      victims.push_back(id);
    }
  }

  for (const auto& id : victims) {
    Remember(TX(t), s.campaigns, id);
    s.campaigns.erase(id);
    ++deleted;
  }
  return Result::Ok();
}

std::map<CampaignStatus, uint64_t> MemoryRepository::CountCampaignsByStatus(Transaction& t) {
  const auto&                        s = TX(t).View();
  std::map<CampaignStatus, uint64_t> out;
  for (const auto& [_, record] : s.campaigns) {
    ++out[record.status];
  }
  return out;
}

// ------------------------------------------------------------------
// Subscribers
// ------------------------------------------------------------------

Result MemoryRepository::UpsertSubscriber(Transaction& t, const model::SubscriberRecord& r) {
  auto& s = TX(t).Mutable();
  Remember(TX(t), s.subscribers, r.id);
  s.subscribers[r.id] = r;
  return Result::Ok();
}

std::optional<model::SubscriberRecord> MemoryRepository::GetSubscriber(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.subscribers.find(id);
  if (it == s.subscribers.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SubscriberRecord> MemoryRepository::GetSubscribers(Transaction& t, const std::vector<std::string>& ids) {
  const auto&                          s = TX(t).View();
  std::vector<model::SubscriberRecord> out;
  out.reserve(ids.size());
  for (const auto& id : ids) {
    if (auto it = s.subscribers.find(id); it != s.subscribers.end()) {
      out.push_back(it->second);
    }
  }
  return out;
}

Result MemoryRepository::SetSubscriberActive(Transaction& t, const std::string& id, bool active, uint64_t updated_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.subscribers.find(id);
  if (it == s.subscribers.end()) return Result::Err(ErrorCode::NotFound, "subscriber not found: " + id);
  Remember(TX(t), s.subscribers, id);
  it->second.active        = active;
  it->second.updated_at_ms = updated_at_ms;
  return Result::Ok();
}

uint64_t MemoryRepository::CountAudience(Transaction& t, const AudienceQuery& query) {
  const auto& s = TX(t).View();
  if (query.match_nothing) return 0;

  uint64_t count = 0;
  for (const auto& [_, subscriber] : s.subscribers) {
    if (Matches(query, subscriber)) ++count;
  }
  return count;
}

std::vector<std::string> MemoryRepository::ListAudience(Transaction& t, const AudienceQuery& query, const std::string& after_id, std::size_t limit) {
  const auto&              s = TX(t).View();
  std::vector<std::string> out;
  if (query.match_nothing || limit == 0) return out;

  for (auto it = s.subscribers.upper_bound(after_id); it != s.subscribers.end() && out.size() < limit; ++it) {
    if (Matches(query, it->second)) out.push_back(it->first);
  }
  return out;
}

std::vector<std::string> MemoryRepository::ListDistinctAttributeValues(Transaction& t, SubscriberAttribute attribute) {
  const auto&           s = TX(t).View();
  std::set<std::string> values;
  for (const auto& [_, subscriber] : s.subscribers) {
    if (!subscriber.active) continue;
    const auto& value = AttributeValue(subscriber, attribute);
    if (!value.empty()) values.insert(value);
  }
  return {values.begin(), values.end()};
}

uint64_t MemoryRepository::CountActiveSubscribers(Transaction& t) {
  const auto& s = TX(t).View();
  return static_cast<uint64_t>(std::count_if(s.subscribers.begin(), s.subscribers.end(), [](const auto& entry) { return entry.second.active; }));
}

// ------------------------------------------------------------------
// Delivery outcomes
// ------------------------------------------------------------------

Result MemoryRepository::UpsertOutcome(Transaction& t, const model::DeliveryOutcomeRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.campaigns.contains(r.campaign_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "outcome for unknown campaign: " + r.campaign_id);
  }
  const OutcomeKey key{r.campaign_id, r.subscriber_id};
  Remember(TX(t), s.outcomes, key);
  s.outcomes[key] = r;
  return Result::Ok();
}

std::vector<model::DeliveryOutcomeRecord> MemoryRepository::GetOutcomes(Transaction& t, const std::string& campaign_id,
                                                                        const std::vector<std::string>& subscriber_ids) {
  const auto&                               s = TX(t).View();
  std::vector<model::DeliveryOutcomeRecord> out;
  for (const auto& subscriber_id : subscriber_ids) {
    if (auto it = s.outcomes.find({campaign_id, subscriber_id}); it != s.outcomes.end()) {
      out.push_back(it->second);
    }
  }
  return out;
}

std::vector<model::DeliveryOutcomeRecord> MemoryRepository::ListRetryableOutcomes(Transaction& t, const std::string& campaign_id, std::size_t limit) {
  const auto&                               s = TX(t).View();
  std::vector<model::DeliveryOutcomeRecord> out;
  for (auto it = s.outcomes.lower_bound({campaign_id, std::string()}); it != s.outcomes.end() && it->first.first == campaign_id; ++it) {
    if (it->second.status == DELIVERY_STATUS_FAILED_TRANSIENT) out.push_back(it->second);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.next_attempt_at_ms != b.next_attempt_at_ms) return a.next_attempt_at_ms < b.next_attempt_at_ms;
    return a.subscriber_id < b.subscriber_id;
  });
  if (limit > 0 && out.size() > limit) out.resize(limit);
  return out;
}

model::OutcomeTally MemoryRepository::CountOutcomes(Transaction& t, const std::string& campaign_id) {
  const auto&         s = TX(t).View();
  model::OutcomeTally tally;
  for (auto it = s.outcomes.lower_bound({campaign_id, std::string()}); it != s.outcomes.end() && it->first.first == campaign_id; ++it) {
    switch (it->second.status) {
      case DELIVERY_STATUS_SENT:
        ++tally.sent;
        break;
      case DELIVERY_STATUS_FAILED_TRANSIENT:
        ++tally.failed_transient;
        break;
      case DELIVERY_STATUS_FAILED_PERMANENT:
        ++tally.failed_permanent;
        break;
      default:
        ++tally.pending;
        break;
    }
  }
  return tally;
}

} // namespace alo::db::memory
