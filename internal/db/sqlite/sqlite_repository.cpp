#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <type_traits>
#include <variant>

#include "internal/db/sql/audience_sql.hpp"
#include "internal/db/sql/segment_codec.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace alo::db::sqlite {

using alo::campaign::v1::CampaignStatus;
using alo::campaign::v1::DeliveryStatus;
using alo::db::ErrorCode;
using alo::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr PrepareOrThrow(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return StmtPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

// LIMIT -1 is "no limit" in SQLite.
void BindLimit(sqlite3_stmt* st, int idx, std::size_t limit) {
  sqlite3_bind_int64(st, idx, limit == 0 ? -1 : static_cast<sqlite3_int64>(limit));
}

void BindParam(sqlite3_stmt* st, int idx, const sql::Param& param) {
  std::visit(
      [&](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          sqlite3_bind_null(st, idx);
        } else if constexpr (std::is_same_v<T, std::string>) {
          BindText(st, idx, value);
        } else if constexpr (std::is_same_v<T, int32_t>) {
          BindI32(st, idx, value);
        } else {
          sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(value));
        }
      },
      param);
}

int BindParams(sqlite3_stmt* st, int first_idx, const sql::Params& params) {
  int idx = first_idx;
  for (const auto& param : params) {
    BindParam(st, idx++, param);
  }
  return idx;
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

// Binds every campaign column except id, in ALO_CAMPAIGN_COLUMNS order.
int BindCampaignFields(sqlite3_stmt* st, int idx, const model::CampaignRecord& r) {
  BindText(st, idx++, r.name);
  BindText(st, idx++, r.title);
  BindText(st, idx++, r.body);
  BindText(st, idx++, r.url);
  BindText(st, idx++, r.image);
  BindText(st, idx++, r.icon);
  BindText(st, idx++, r.badge);
  BindI32(st, idx++, r.require_interaction ? 1 : 0);
  BindI32(st, idx++, r.renotify ? 1 : 0);
  BindI32(st, idx++, r.silent ? 1 : 0);
  BindText(st, idx++, sql::EncodeSegments(r.segments));
  BindU64(st, idx++, r.send_at_ms);
  BindI32(st, idx++, static_cast<int>(r.status));
  BindU64(st, idx++, r.version);
  BindU64(st, idx++, r.created_at_ms);
  BindU64(st, idx++, r.updated_at_ms);
  BindU64(st, idx++, r.queued_at_ms);
  BindU64(st, idx++, r.started_at_ms);
  BindU64(st, idx++, r.completed_at_ms);
  BindU64(st, idx++, r.audience_count);
  BindU64(st, idx++, r.sent_count);
  BindU64(st, idx++, r.failed_count);
  BindText(st, idx++, r.failure_reason);
  BindText(st, idx++, r.claimed_by);
  BindU64(st, idx++, r.claim_expires_at_ms);
  return idx;
}

model::CampaignRecord ReadCampaign(sqlite3_stmt* st) {
  model::CampaignRecord r;
  r.id                  = ColText(st, 0);
  r.name                = ColText(st, 1);
  r.title               = ColText(st, 2);
  r.body                = ColText(st, 3);
  r.url                 = ColText(st, 4);
  r.image               = ColText(st, 5);
  r.icon                = ColText(st, 6);
  r.badge               = ColText(st, 7);
  r.require_interaction = ColI32(st, 8) != 0;
  r.renotify            = ColI32(st, 9) != 0;
  r.silent              = ColI32(st, 10) != 0;
  r.segments            = sql::DecodeSegments(ColText(st, 11));
  r.send_at_ms          = ColU64(st, 12);
  r.status              = static_cast<CampaignStatus>(ColI32(st, 13));
  r.version             = ColU64(st, 14);
  r.created_at_ms       = ColU64(st, 15);
  r.updated_at_ms       = ColU64(st, 16);
  r.queued_at_ms        = ColU64(st, 17);
  r.started_at_ms       = ColU64(st, 18);
  r.completed_at_ms     = ColU64(st, 19);
  r.audience_count      = ColU64(st, 20);
  r.sent_count          = ColU64(st, 21);
  r.failed_count        = ColU64(st, 22);
  r.failure_reason      = ColText(st, 23);
  r.claimed_by          = ColText(st, 24);
  r.claim_expires_at_ms = ColU64(st, 25);
  return r;
}

model::SubscriberRecord ReadSubscriber(sqlite3_stmt* st) {
  model::SubscriberRecord r;
  r.id              = ColText(st, 0);
  r.endpoint        = ColText(st, 1);
  r.credentials     = ColText(st, 2);
  r.browser         = ColText(st, 3);
  r.os              = ColText(st, 4);
  r.device          = ColText(st, 5);
  r.country         = ColText(st, 6);
  r.language        = ColText(st, 7);
  r.last_seen_at_ms = ColU64(st, 8);
  r.active          = ColI32(st, 9) != 0;
  r.created_at_ms   = ColU64(st, 10);
  r.updated_at_ms   = ColU64(st, 11);
  return r;
}

model::DeliveryOutcomeRecord ReadOutcome(sqlite3_stmt* st) {
  model::DeliveryOutcomeRecord r;
  r.campaign_id        = ColText(st, 0);
  r.subscriber_id      = ColText(st, 1);
  r.status             = static_cast<DeliveryStatus>(ColI32(st, 2));
  r.attempts           = static_cast<uint32_t>(ColI32(st, 3));
  r.last_attempt_at_ms = ColU64(st, 4);
  r.next_attempt_at_ms = ColU64(st, 5);
  r.last_error         = ColText(st, 6);
  return r;
}

template <typename Fn>
void StepRows(sqlite3* db, sqlite3_stmt* st, Fn&& on_row) {
  int rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    on_row(st);
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Campaigns
// ------------------------------------------------------------------

Result SqliteRepository::InsertCampaign(Transaction& t, const model::CampaignRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::INSERT_CAMPAIGN, -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  StmtPtr st(raw, &sqlite3_finalize);

  BindText(st.get(), 1, r.id);
  BindCampaignFields(st.get(), 2, r);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::CampaignRecord> SqliteRepository::GetCampaign(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_CAMPAIGN);
  BindText(st.get(), 1, id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  return ReadCampaign(st.get());
}

Result SqliteRepository::UpdateCampaignIf(Transaction& t, const model::CampaignRecord& r, CampaignStatus expected_status, uint64_t expected_version) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::UPDATE_CAMPAIGN_IF, -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  StmtPtr st(raw, &sqlite3_finalize);

  int idx = BindCampaignFields(st.get(), 1, r);
  BindText(st.get(), idx++, r.id);
  BindI32(st.get(), idx++, static_cast<int>(expected_status));
  BindU64(st.get(), idx++, expected_version);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) > 0) return Result::Ok();

  auto exists = PrepareOrThrow(db, sql::CAMPAIGN_EXISTS);
  BindText(exists.get(), 1, r.id);
  if (sqlite3_step(exists.get()) == SQLITE_ROW) {
    return Result::Err(ErrorCode::Conflict, "campaign changed concurrently: " + r.id);
  }
  return Result::Err(ErrorCode::NotFound, "campaign not found: " + r.id);
}

std::vector<model::CampaignRecord> SqliteRepository::ListCampaigns(Transaction& t, CampaignStatus status, std::size_t limit) {
  auto* db = TX(t).Handle();

  const bool all = status == alo::campaign::v1::CAMPAIGN_STATUS_UNSPECIFIED;
  auto       st  = PrepareOrThrow(db, all ? sql::LIST_CAMPAIGNS : sql::LIST_CAMPAIGNS_BY_STATUS);
  int        idx = 1;
  if (!all) BindI32(st.get(), idx++, static_cast<int>(status));
  BindLimit(st.get(), idx, limit);

  std::vector<model::CampaignRecord> out;
  StepRows(db, st.get(), [&](sqlite3_stmt* row) { out.push_back(ReadCampaign(row)); });
  return out;
}

std::vector<model::CampaignRecord> SqliteRepository::ListDueScheduled(Transaction& t, uint64_t now_ms, std::size_t limit) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::LIST_DUE_SCHEDULED);
  BindI32(st.get(), 1, alo::campaign::v1::CAMPAIGN_STATUS_SCHEDULED);
  BindU64(st.get(), 2, now_ms);
  BindLimit(st.get(), 3, limit);

  std::vector<model::CampaignRecord> out;
  StepRows(db, st.get(), [&](sqlite3_stmt* row) { out.push_back(ReadCampaign(row)); });
  return out;
}

std::vector<std::string> SqliteRepository::ListClaimable(Transaction& t, uint64_t now_ms, std::size_t limit) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::LIST_CLAIMABLE);
  BindI32(st.get(), 1, alo::campaign::v1::CAMPAIGN_STATUS_QUEUED);
  BindI32(st.get(), 2, alo::campaign::v1::CAMPAIGN_STATUS_SENDING);
  BindU64(st.get(), 3, now_ms);
  BindLimit(st.get(), 4, limit);

  std::vector<std::string> out;
  StepRows(db, st.get(), [&](sqlite3_stmt* row) { out.push_back(ColText(row, 0)); });
  return out;
}

Result SqliteRepository::DeleteDraftsOlderThan(Transaction& t, uint64_t cutoff_ms, uint64_t& deleted) {
  auto* db = TX(t).Handle();
  deleted  = 0;

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::DELETE_DRAFTS_OLDER_THAN, -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  StmtPtr st(raw, &sqlite3_finalize);
  BindI32(st.get(), 1, alo::campaign::v1::CAMPAIGN_STATUS_DRAFT);
  BindU64(st.get(), 2, cutoff_ms);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result) deleted = static_cast<uint64_t>(sqlite3_changes(db));
  return result;
}

std::map<CampaignStatus, uint64_t> SqliteRepository::CountCampaignsByStatus(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::COUNT_CAMPAIGNS_BY_STATUS);

  std::map<CampaignStatus, uint64_t> out;
  StepRows(db, st.get(), [&](sqlite3_stmt* row) { out[static_cast<CampaignStatus>(ColI32(row, 0))] = ColU64(row, 1); });
  return out;
}

// ------------------------------------------------------------------
// Subscribers
// ------------------------------------------------------------------

Result SqliteRepository::UpsertSubscriber(Transaction& t, const model::SubscriberRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::UPSERT_SUBSCRIBER, -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  StmtPtr st(raw, &sqlite3_finalize);

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.endpoint);
  BindText(st.get(), 3, r.credentials);
  BindText(st.get(), 4, r.browser);
  BindText(st.get(), 5, r.os);
  BindText(st.get(), 6, r.device);
  BindText(st.get(), 7, r.country);
  BindText(st.get(), 8, r.language);
  BindU64(st.get(), 9, r.last_seen_at_ms);
  BindI32(st.get(), 10, r.active ? 1 : 0);
  BindU64(st.get(), 11, r.created_at_ms);
  BindU64(st.get(), 12, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::SubscriberRecord> SqliteRepository::GetSubscriber(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_SUBSCRIBER);
  BindText(st.get(), 1, id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  return ReadSubscriber(st.get());
}

std::vector<model::SubscriberRecord> SqliteRepository::GetSubscribers(Transaction& t, const std::vector<std::string>& ids) {
  std::vector<model::SubscriberRecord> out;
  if (ids.empty()) return out;

  auto*             db = TX(t).Handle();
  sql::Placeholders placeholders(sql::PlaceholderStyle::kQuestion);
  auto              st = PrepareOrThrow(db, "SELECT " ALO_SUBSCRIBER_COLUMNS " FROM subscriber WHERE id IN (" + sql::InList(ids.size(), placeholders) + ");");

  int idx = 1;
  for (const auto& id : ids) BindText(st.get(), idx++, id);

  StepRows(db, st.get(), [&](sqlite3_stmt* row) { out.push_back(ReadSubscriber(row)); });
  return out;
}

Result SqliteRepository::SetSubscriberActive(Transaction& t, const std::string& id, bool active, uint64_t updated_at_ms) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::SET_SUBSCRIBER_ACTIVE, -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  StmtPtr st(raw, &sqlite3_finalize);
  BindI32(st.get(), 1, active ? 1 : 0);
  BindU64(st.get(), 2, updated_at_ms);
  BindText(st.get(), 3, id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "subscriber not found: " + id);
  }
  return result;
}

uint64_t SqliteRepository::CountAudience(Transaction& t, const AudienceQuery& query) {
  if (query.match_nothing) return 0;

  auto*             db = TX(t).Handle();
  sql::Placeholders placeholders(sql::PlaceholderStyle::kQuestion);
  auto              where = sql::BuildAudienceWhere(query, placeholders);
  auto              st    = PrepareOrThrow(db, "SELECT COUNT(*) FROM subscriber WHERE " + where.sql + ";");
  BindParams(st.get(), 1, where.params);

  uint64_t count = 0;
  StepRows(db, st.get(), [&](sqlite3_stmt* row) { count = ColU64(row, 0); });
  return count;
}

std::vector<std::string> SqliteRepository::ListAudience(Transaction& t, const AudienceQuery& query, const std::string& after_id, std::size_t limit) {
  std::vector<std::string> out;
  if (query.match_nothing || limit == 0) return out;

  auto*             db = TX(t).Handle();
  sql::Placeholders placeholders(sql::PlaceholderStyle::kQuestion);
  auto              where = sql::BuildAudienceWhere(query, placeholders);
  auto              st    = PrepareOrThrow(db, "SELECT id FROM subscriber WHERE " + where.sql + " AND id>? ORDER BY id ASC LIMIT ?;");

  int idx = BindParams(st.get(), 1, where.params);
  BindText(st.get(), idx++, after_id);
  BindLimit(st.get(), idx, limit);

  StepRows(db, st.get(), [&](sqlite3_stmt* row) { out.push_back(ColText(row, 0)); });
  return out;
}

std::vector<std::string> SqliteRepository::ListDistinctAttributeValues(Transaction& t, SubscriberAttribute attribute) {
  auto*             db     = TX(t).Handle();
  const std::string column = std::string(AttributeColumn(attribute));
  auto st = PrepareOrThrow(db, "SELECT DISTINCT " + column + " FROM subscriber WHERE active=1 AND " + column + "<>'' ORDER BY " + column + " ASC;");

  std::vector<std::string> out;
  StepRows(db, st.get(), [&](sqlite3_stmt* row) { out.push_back(ColText(row, 0)); });
  return out;
}

uint64_t SqliteRepository::CountActiveSubscribers(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::COUNT_ACTIVE_SUBSCRIBERS);

  uint64_t count = 0;
  StepRows(db, st.get(), [&](sqlite3_stmt* row) { count = ColU64(row, 0); });
  return count;
}

// ------------------------------------------------------------------
// Delivery outcomes
// ------------------------------------------------------------------

Result SqliteRepository::UpsertOutcome(Transaction& t, const model::DeliveryOutcomeRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::UPSERT_OUTCOME, -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  StmtPtr st(raw, &sqlite3_finalize);

  BindText(st.get(), 1, r.campaign_id);
  BindText(st.get(), 2, r.subscriber_id);
  BindI32(st.get(), 3, static_cast<int>(r.status));
  BindI32(st.get(), 4, static_cast<int>(r.attempts));
  BindU64(st.get(), 5, r.last_attempt_at_ms);
  BindU64(st.get(), 6, r.next_attempt_at_ms);
  BindText(st.get(), 7, r.last_error);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::DeliveryOutcomeRecord> SqliteRepository::GetOutcomes(Transaction& t, const std::string& campaign_id,
                                                                        const std::vector<std::string>& subscriber_ids) {
  std::vector<model::DeliveryOutcomeRecord> out;
  if (subscriber_ids.empty()) return out;

  auto*             db = TX(t).Handle();
  sql::Placeholders placeholders(sql::PlaceholderStyle::kQuestion);
  placeholders.Next();
  auto st = PrepareOrThrow(db, "SELECT " ALO_OUTCOME_COLUMNS " FROM delivery_outcome WHERE campaign_id=? AND subscriber_id IN (" +
                                   sql::InList(subscriber_ids.size(), placeholders) + ");");

  int idx = 1;
  BindText(st.get(), idx++, campaign_id);
  for (const auto& id : subscriber_ids) BindText(st.get(), idx++, id);

  StepRows(db, st.get(), [&](sqlite3_stmt* row) { out.push_back(ReadOutcome(row)); });
  return out;
}

std::vector<model::DeliveryOutcomeRecord> SqliteRepository::ListRetryableOutcomes(Transaction& t, const std::string& campaign_id, std::size_t limit) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::LIST_RETRYABLE_OUTCOMES);
  BindText(st.get(), 1, campaign_id);
  BindI32(st.get(), 2, alo::campaign::v1::DELIVERY_STATUS_FAILED_TRANSIENT);
  BindLimit(st.get(), 3, limit);

  std::vector<model::DeliveryOutcomeRecord> out;
  StepRows(db, st.get(), [&](sqlite3_stmt* row) { out.push_back(ReadOutcome(row)); });
  return out;
}

model::OutcomeTally SqliteRepository::CountOutcomes(Transaction& t, const std::string& campaign_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::COUNT_OUTCOMES_BY_STATUS);
  BindText(st.get(), 1, campaign_id);

  model::OutcomeTally tally;
  StepRows(db, st.get(), [&](sqlite3_stmt* row) {
    const auto count = ColU64(row, 1);
    switch (static_cast<DeliveryStatus>(ColI32(row, 0))) {
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
  });
  return tally;
}

} // namespace alo::db::sqlite
