#include "pg_repository.hpp"

#include <optional>
#include <type_traits>
#include <variant>

#include "internal/db/sql/audience_sql.hpp"
#include "internal/db/sql/segment_codec.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace alo::db::postgres {

using alo::campaign::v1::CampaignStatus;
using alo::campaign::v1::DeliveryStatus;

namespace {

int64_t I64(uint64_t v) {
  return static_cast<int64_t>(v);
}

// NULL is "no limit" in Postgres.
std::optional<int64_t> Limit(std::size_t limit) {
  if (limit == 0) return std::nullopt;
  return static_cast<int64_t>(limit);
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string() : std::string(f.c_str());
}

void AppendParam(pqxx::params& params, const sql::Param& param) {
  std::visit(
      [&](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          params.append(std::optional<int64_t>{});
        } else if constexpr (std::is_same_v<T, uint64_t>) {
          params.append(static_cast<int64_t>(value));
        } else {
          params.append(value);
        }
      },
      param);
}

// Every campaign column except id, in ALO_CAMPAIGN_COLUMNS order.
void AppendCampaignFields(pqxx::params& p, const model::CampaignRecord& r) {
  p.append(r.name);
  p.append(r.title);
  p.append(r.body);
  p.append(r.url);
  p.append(r.image);
  p.append(r.icon);
  p.append(r.badge);
  p.append(r.require_interaction ? 1 : 0);
  p.append(r.renotify ? 1 : 0);
  p.append(r.silent ? 1 : 0);
  p.append(sql::EncodeSegments(r.segments));
  p.append(I64(r.send_at_ms));
  p.append(static_cast<int>(r.status));
  p.append(I64(r.version));
  p.append(I64(r.created_at_ms));
  p.append(I64(r.updated_at_ms));
  p.append(I64(r.queued_at_ms));
  p.append(I64(r.started_at_ms));
  p.append(I64(r.completed_at_ms));
  p.append(I64(r.audience_count));
  p.append(I64(r.sent_count));
  p.append(I64(r.failed_count));
  p.append(r.failure_reason);
  p.append(r.claimed_by);
  p.append(I64(r.claim_expires_at_ms));
}

model::CampaignRecord ReadCampaign(const pqxx::row& row) {
  model::CampaignRecord r;
  r.id                  = Text(row[0]);
  r.name                = Text(row[1]);
  r.title               = Text(row[2]);
  r.body                = Text(row[3]);
  r.url                 = Text(row[4]);
  r.image               = Text(row[5]);
  r.icon                = Text(row[6]);
  r.badge               = Text(row[7]);
  r.require_interaction = row[8].as<int>() != 0;
  r.renotify            = row[9].as<int>() != 0;
  r.silent              = row[10].as<int>() != 0;
  r.segments            = sql::DecodeSegments(Text(row[11]));
  r.send_at_ms          = row[12].as<uint64_t>();
  r.status              = static_cast<CampaignStatus>(row[13].as<int>());
  r.version             = row[14].as<uint64_t>();
  r.created_at_ms       = row[15].as<uint64_t>();
  r.updated_at_ms       = row[16].as<uint64_t>();
  r.queued_at_ms        = row[17].as<uint64_t>();
  r.started_at_ms       = row[18].as<uint64_t>();
  r.completed_at_ms     = row[19].as<uint64_t>();
  r.audience_count      = row[20].as<uint64_t>();
  r.sent_count          = row[21].as<uint64_t>();
  r.failed_count        = row[22].as<uint64_t>();
  r.failure_reason      = Text(row[23]);
  r.claimed_by          = Text(row[24]);
  r.claim_expires_at_ms = row[25].as<uint64_t>();
  return r;
}

model::SubscriberRecord ReadSubscriber(const pqxx::row& row) {
  model::SubscriberRecord r;
  r.id              = Text(row[0]);
  r.endpoint        = Text(row[1]);
  r.credentials     = Text(row[2]);
  r.browser         = Text(row[3]);
  r.os              = Text(row[4]);
  r.device          = Text(row[5]);
  r.country         = Text(row[6]);
  r.language        = Text(row[7]);
  r.last_seen_at_ms = row[8].as<uint64_t>();
  r.active          = row[9].as<int>() != 0;
  r.created_at_ms   = row[10].as<uint64_t>();
  r.updated_at_ms   = row[11].as<uint64_t>();
  return r;
}

model::DeliveryOutcomeRecord ReadOutcome(const pqxx::row& row) {
  model::DeliveryOutcomeRecord r;
  r.campaign_id        = Text(row[0]);
  r.subscriber_id      = Text(row[1]);
  r.status             = static_cast<DeliveryStatus>(row[2].as<int>());
  r.attempts           = row[3].as<uint32_t>();
  r.last_attempt_at_ms = row[4].as<uint64_t>();
  r.next_attempt_at_ms = row[5].as<uint64_t>();
  r.last_error         = Text(row[6]);
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Campaigns
// ------------------------------------------------------------------

Result PgRepository::InsertCampaign(Transaction& t, const model::CampaignRecord& r) {
  try {
    pqxx::params p;
    p.append(r.id);
    AppendCampaignFields(p, r);
    TX(t).Work().exec_prepared("insert_campaign", p);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CampaignRecord> PgRepository::GetCampaign(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("select_campaign", id);
  if (res.empty()) return std::nullopt;
  return ReadCampaign(res[0]);
}

Result PgRepository::UpdateCampaignIf(Transaction& t, const model::CampaignRecord& r, CampaignStatus expected_status, uint64_t expected_version) {
  try {
    pqxx::params p;
    AppendCampaignFields(p, r);
    p.append(r.id);
    p.append(static_cast<int>(expected_status));
    p.append(I64(expected_version));

    auto& work = TX(t).Work();
    auto  res  = work.exec_prepared("update_campaign_if", p);
    if (res.affected_rows() > 0) return Result::Ok();

    if (!work.exec_prepared("campaign_exists", r.id).empty()) {
      return Result::Err(ErrorCode::Conflict, "campaign changed concurrently: " + r.id);
    }
    return Result::Err(ErrorCode::NotFound, "campaign not found: " + r.id);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::CampaignRecord> PgRepository::ListCampaigns(Transaction& t, CampaignStatus status, std::size_t limit) {
  auto& work = TX(t).Work();
  auto  res  = status == alo::campaign::v1::CAMPAIGN_STATUS_UNSPECIFIED
                   ? work.exec_prepared("list_campaigns", Limit(limit))
                   : work.exec_prepared("list_campaigns_by_status", static_cast<int>(status), Limit(limit));

  std::vector<model::CampaignRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadCampaign(row));
  return out;
}

std::vector<model::CampaignRecord> PgRepository::ListDueScheduled(Transaction& t, uint64_t now_ms, std::size_t limit) {
  auto res = TX(t).Work().exec_prepared("list_due_scheduled", static_cast<int>(alo::campaign::v1::CAMPAIGN_STATUS_SCHEDULED), I64(now_ms), Limit(limit));

  std::vector<model::CampaignRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadCampaign(row));
  return out;
}

std::vector<std::string> PgRepository::ListClaimable(Transaction& t, uint64_t now_ms, std::size_t limit) {
  auto res = TX(t).Work().exec_prepared("list_claimable", static_cast<int>(alo::campaign::v1::CAMPAIGN_STATUS_QUEUED),
                                        static_cast<int>(alo::campaign::v1::CAMPAIGN_STATUS_SENDING), I64(now_ms), Limit(limit));

  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(Text(row[0]));
  return out;
}

Result PgRepository::DeleteDraftsOlderThan(Transaction& t, uint64_t cutoff_ms, uint64_t& deleted) {
  deleted = 0;
  try {
    auto res = TX(t).Work().exec_prepared("delete_drafts_older_than", static_cast<int>(alo::campaign::v1::CAMPAIGN_STATUS_DRAFT), I64(cutoff_ms));
    deleted  = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::map<CampaignStatus, uint64_t> PgRepository::CountCampaignsByStatus(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("count_campaigns_by_status");

  std::map<CampaignStatus, uint64_t> out;
  for (const auto& row : res) out[static_cast<CampaignStatus>(row[0].as<int>())] = row[1].as<uint64_t>();
  return out;
}

// ------------------------------------------------------------------
// Subscribers
// ------------------------------------------------------------------

Result PgRepository::UpsertSubscriber(Transaction& t, const model::SubscriberRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_subscriber", r.id, r.endpoint, r.credentials, r.browser, r.os, r.device, r.country, r.language,
                               I64(r.last_seen_at_ms), r.active ? 1 : 0, I64(r.created_at_ms), I64(r.updated_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SubscriberRecord> PgRepository::GetSubscriber(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("select_subscriber", id);
  if (res.empty()) return std::nullopt;
  return ReadSubscriber(res[0]);
}

std::vector<model::SubscriberRecord> PgRepository::GetSubscribers(Transaction& t, const std::vector<std::string>& ids) {
  std::vector<model::SubscriberRecord> out;
  if (ids.empty()) return out;

  sql::Placeholders placeholders(sql::PlaceholderStyle::kDollar);
  const std::string query = "SELECT " ALO_SUBSCRIBER_COLUMNS " FROM subscriber WHERE id IN (" + sql::InList(ids.size(), placeholders) + ");";

  pqxx::params p;
  for (const auto& id : ids) p.append(id);

  auto res = TX(t).Work().exec_params(query, p);
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadSubscriber(row));
  return out;
}

Result PgRepository::SetSubscriberActive(Transaction& t, const std::string& id, bool active, uint64_t updated_at_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("set_subscriber_active", active ? 1 : 0, I64(updated_at_ms), id);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "subscriber not found: " + id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::CountAudience(Transaction& t, const AudienceQuery& query) {
  if (query.match_nothing) return 0;

  sql::Placeholders placeholders(sql::PlaceholderStyle::kDollar);
  auto              where = sql::BuildAudienceWhere(query, placeholders);

  pqxx::params p;
  for (const auto& param : where.params) AppendParam(p, param);

  auto res = TX(t).Work().exec_params("SELECT COUNT(*) FROM subscriber WHERE " + where.sql + ";", p);
  return res.empty() ? 0 : res[0][0].as<uint64_t>();
}

std::vector<std::string> PgRepository::ListAudience(Transaction& t, const AudienceQuery& query, const std::string& after_id, std::size_t limit) {
  std::vector<std::string> out;
  if (query.match_nothing || limit == 0) return out;

  sql::Placeholders placeholders(sql::PlaceholderStyle::kDollar);
  auto              where = sql::BuildAudienceWhere(query, placeholders);
  const std::string after = placeholders.Next();
  const std::string lim   = placeholders.Next();

  pqxx::params p;
  for (const auto& param : where.params) AppendParam(p, param);
  p.append(after_id);
  p.append(static_cast<int64_t>(limit));

  auto res = TX(t).Work().exec_params("SELECT id FROM subscriber WHERE " + where.sql + " AND id>" + after + " ORDER BY id ASC LIMIT " + lim + ";", p);
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(Text(row[0]));
  return out;
}

std::vector<std::string> PgRepository::ListDistinctAttributeValues(Transaction& t, SubscriberAttribute attribute) {
  const std::string column = std::string(AttributeColumn(attribute));
  auto res = TX(t).Work().exec("SELECT DISTINCT " + column + " FROM subscriber WHERE active=1 AND " + column + "<>'' ORDER BY " + column + " ASC;");

  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(Text(row[0]));
  return out;
}

uint64_t PgRepository::CountActiveSubscribers(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("count_active_subscribers");
  return res.empty() ? 0 : res[0][0].as<uint64_t>();
}

// ------------------------------------------------------------------
// Delivery outcomes
// ------------------------------------------------------------------

Result PgRepository::UpsertOutcome(Transaction& t, const model::DeliveryOutcomeRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_outcome", r.campaign_id, r.subscriber_id, static_cast<int>(r.status), static_cast<int>(r.attempts),
                               I64(r.last_attempt_at_ms), I64(r.next_attempt_at_ms), r.last_error);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::DeliveryOutcomeRecord> PgRepository::GetOutcomes(Transaction& t, const std::string& campaign_id,
                                                                    const std::vector<std::string>& subscriber_ids) {
  std::vector<model::DeliveryOutcomeRecord> out;
  if (subscriber_ids.empty()) return out;

  sql::Placeholders placeholders(sql::PlaceholderStyle::kDollar, 2);
  const std::string query = "SELECT " ALO_OUTCOME_COLUMNS " FROM delivery_outcome WHERE campaign_id=$1 AND subscriber_id IN (" +
                            sql::InList(subscriber_ids.size(), placeholders) + ");";

  pqxx::params p;
  p.append(campaign_id);
  for (const auto& id : subscriber_ids) p.append(id);

  auto res = TX(t).Work().exec_params(query, p);
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadOutcome(row));
  return out;
}

std::vector<model::DeliveryOutcomeRecord> PgRepository::ListRetryableOutcomes(Transaction& t, const std::string& campaign_id, std::size_t limit) {
  auto res = TX(t).Work().exec_prepared("list_retryable_outcomes", campaign_id, static_cast<int>(alo::campaign::v1::DELIVERY_STATUS_FAILED_TRANSIENT),
                                        Limit(limit));

  std::vector<model::DeliveryOutcomeRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadOutcome(row));
  return out;
}

model::OutcomeTally PgRepository::CountOutcomes(Transaction& t, const std::string& campaign_id) {
  auto res = TX(t).Work().exec_prepared("count_outcomes_by_status", campaign_id);

  model::OutcomeTally tally;
  for (const auto& row : res) {
    const auto count = row[1].as<uint64_t>();
    switch (static_cast<DeliveryStatus>(row[0].as<int>())) {
      case alo::campaign::v1::DELIVERY_STATUS_SENT:
        tally.sent += count;
        break;
      case alo::campaign::v1::DELIVERY_STATUS_FAILED_TRANSIENT:
        tally.failed_transient += count;
        break;
      case alo::campaign::v1::DELIVERY_STATUS_FAILED_PERMANENT:
        tally.failed_permanent += count;
        break;
      default:
        tally.pending += count;
        break;
    }
  }
  return tally;
}

} // namespace alo::db::postgres
