#pragma once

namespace alo::db::sql {

/*
  Canonical SQL (SQLite dialect, `?` placeholders).

  Column order of the *_COLUMNS lists is the read order used by the
  row mappers in every backend.
*/

#define ALO_CAMPAIGN_COLUMNS                                                                                                              \
  "id,name,title,body,url,image,icon,badge,require_interaction,renotify,silent,segments,send_at_ms,status,version,created_at_ms,"        \
  "updated_at_ms,queued_at_ms,started_at_ms,completed_at_ms,audience_count,sent_count,failed_count,failure_reason,claimed_by,"           \
  "claim_expires_at_ms"

#define ALO_SUBSCRIBER_COLUMNS "id,endpoint,credentials,browser,os,device,country,language,last_seen_at_ms,active,created_at_ms,updated_at_ms"

#define ALO_OUTCOME_COLUMNS "campaign_id,subscriber_id,status,attempts,last_attempt_at_ms,next_attempt_at_ms,last_error"

// campaigns

static constexpr const char* INSERT_CAMPAIGN =
    "INSERT INTO campaign(" ALO_CAMPAIGN_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_CAMPAIGN = "SELECT " ALO_CAMPAIGN_COLUMNS " FROM campaign WHERE id=?;";

static constexpr const char* UPDATE_CAMPAIGN_IF =
    "UPDATE campaign SET name=?,title=?,body=?,url=?,image=?,icon=?,badge=?,require_interaction=?,renotify=?,silent=?,segments=?,"
    "send_at_ms=?,status=?,version=?,created_at_ms=?,updated_at_ms=?,queued_at_ms=?,started_at_ms=?,completed_at_ms=?,audience_count=?,"
    "sent_count=?,failed_count=?,failure_reason=?,claimed_by=?,claim_expires_at_ms=?"
    " WHERE id=? AND status=? AND version=?;";

static constexpr const char* CAMPAIGN_EXISTS = "SELECT 1 FROM campaign WHERE id=?;";

static constexpr const char* LIST_CAMPAIGNS = "SELECT " ALO_CAMPAIGN_COLUMNS " FROM campaign ORDER BY created_at_ms DESC, id ASC LIMIT ?;";

static constexpr const char* LIST_CAMPAIGNS_BY_STATUS =
    "SELECT " ALO_CAMPAIGN_COLUMNS " FROM campaign WHERE status=? ORDER BY created_at_ms DESC, id ASC LIMIT ?;";

static constexpr const char* LIST_DUE_SCHEDULED =
    "SELECT " ALO_CAMPAIGN_COLUMNS " FROM campaign WHERE status=? AND send_at_ms<=? ORDER BY send_at_ms ASC, id ASC LIMIT ?;";

static constexpr const char* LIST_CLAIMABLE =
    "SELECT id FROM campaign WHERE status=? OR (status=? AND claim_expires_at_ms<?) ORDER BY queued_at_ms ASC, id ASC LIMIT ?;";

static constexpr const char* DELETE_DRAFTS_OLDER_THAN = "DELETE FROM campaign WHERE status=? AND updated_at_ms<?;";

static constexpr const char* COUNT_CAMPAIGNS_BY_STATUS = "SELECT status, COUNT(*) FROM campaign GROUP BY status;";

// subscribers

static constexpr const char* UPSERT_SUBSCRIBER =
    "INSERT INTO subscriber(" ALO_SUBSCRIBER_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " endpoint=excluded.endpoint,"
    " credentials=excluded.credentials,"
    " browser=excluded.browser,"
    " os=excluded.os,"
    " device=excluded.device,"
    " country=excluded.country,"
    " language=excluded.language,"
    " last_seen_at_ms=excluded.last_seen_at_ms,"
    " active=excluded.active,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_SUBSCRIBER = "SELECT " ALO_SUBSCRIBER_COLUMNS " FROM subscriber WHERE id=?;";

static constexpr const char* SET_SUBSCRIBER_ACTIVE = "UPDATE subscriber SET active=?, updated_at_ms=? WHERE id=?;";

static constexpr const char* COUNT_ACTIVE_SUBSCRIBERS = "SELECT COUNT(*) FROM subscriber WHERE active=1;";

// delivery outcomes

static constexpr const char* UPSERT_OUTCOME =
    "INSERT INTO delivery_outcome(" ALO_OUTCOME_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?)"
    " ON CONFLICT(campaign_id,subscriber_id) DO UPDATE SET"
    " status=excluded.status,"
    " attempts=excluded.attempts,"
    " last_attempt_at_ms=excluded.last_attempt_at_ms,"
    " next_attempt_at_ms=excluded.next_attempt_at_ms,"
    " last_error=excluded.last_error;";

static constexpr const char* LIST_RETRYABLE_OUTCOMES =
    "SELECT " ALO_OUTCOME_COLUMNS " FROM delivery_outcome WHERE campaign_id=? AND status=?"
    " ORDER BY next_attempt_at_ms ASC, subscriber_id ASC LIMIT ?;";

static constexpr const char* COUNT_OUTCOMES_BY_STATUS = "SELECT status, COUNT(*) FROM delivery_outcome WHERE campaign_id=? GROUP BY status;";

} // namespace alo::db::sql
