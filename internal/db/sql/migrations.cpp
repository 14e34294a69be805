#include "migrations.hpp"

namespace alo::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS campaign (id TEXT PRIMARY KEY, name TEXT NOT NULL, title TEXT NOT NULL, body TEXT NOT NULL, "
      "url TEXT NOT NULL DEFAULT '', image TEXT NOT NULL DEFAULT '', icon TEXT NOT NULL DEFAULT '', badge TEXT NOT NULL DEFAULT '', "
      "require_interaction INTEGER NOT NULL DEFAULT 0, renotify INTEGER NOT NULL DEFAULT 0, silent INTEGER NOT NULL DEFAULT 0, "
      "segments TEXT NOT NULL DEFAULT '', send_at_ms INTEGER NOT NULL DEFAULT 0, status INTEGER NOT NULL, version INTEGER NOT NULL, "
      "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, queued_at_ms INTEGER NOT NULL DEFAULT 0, "
      "started_at_ms INTEGER NOT NULL DEFAULT 0, completed_at_ms INTEGER NOT NULL DEFAULT 0, audience_count INTEGER NOT NULL DEFAULT 0, "
      "sent_count INTEGER NOT NULL DEFAULT 0, failed_count INTEGER NOT NULL DEFAULT 0, failure_reason TEXT NOT NULL DEFAULT '', "
      "claimed_by TEXT NOT NULL DEFAULT '', claim_expires_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS campaign_status_send_at ON campaign(status, send_at_ms);",
      "CREATE TABLE IF NOT EXISTS subscriber (id TEXT PRIMARY KEY, endpoint TEXT NOT NULL, credentials TEXT NOT NULL DEFAULT '', "
      "browser TEXT NOT NULL DEFAULT '', os TEXT NOT NULL DEFAULT '', device TEXT NOT NULL DEFAULT '', country TEXT NOT NULL DEFAULT '', "
      "language TEXT NOT NULL DEFAULT '', last_seen_at_ms INTEGER NOT NULL DEFAULT 0, active INTEGER NOT NULL DEFAULT 1, "
      "created_at_ms INTEGER NOT NULL DEFAULT 0, updated_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS subscriber_active_country ON subscriber(active, country);",
      "CREATE INDEX IF NOT EXISTS subscriber_active_last_seen ON subscriber(active, last_seen_at_ms);",
      "CREATE TABLE IF NOT EXISTS delivery_outcome (campaign_id TEXT NOT NULL REFERENCES campaign(id) ON DELETE CASCADE, "
      "subscriber_id TEXT NOT NULL, status INTEGER NOT NULL, attempts INTEGER NOT NULL DEFAULT 0, last_attempt_at_ms INTEGER NOT NULL DEFAULT 0, "
      "next_attempt_at_ms INTEGER NOT NULL DEFAULT 0, last_error TEXT NOT NULL DEFAULT '', PRIMARY KEY (campaign_id, subscriber_id));",
      "CREATE INDEX IF NOT EXISTS delivery_outcome_retry ON delivery_outcome(campaign_id, status, next_attempt_at_ms);",
      "CREATE TABLE IF NOT EXISTS alo_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO alo_schema_migrations(version, applied_at_ms) VALUES (1, CAST(strftime('%s','now') AS INTEGER) * 1000);"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS campaign (id TEXT PRIMARY KEY, name TEXT NOT NULL, title TEXT NOT NULL, body TEXT NOT NULL, "
      "url TEXT NOT NULL DEFAULT '', image TEXT NOT NULL DEFAULT '', icon TEXT NOT NULL DEFAULT '', badge TEXT NOT NULL DEFAULT '', "
      "require_interaction SMALLINT NOT NULL DEFAULT 0, renotify SMALLINT NOT NULL DEFAULT 0, silent SMALLINT NOT NULL DEFAULT 0, "
      "segments TEXT NOT NULL DEFAULT '', send_at_ms BIGINT NOT NULL DEFAULT 0, status SMALLINT NOT NULL, version BIGINT NOT NULL, "
      "created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, queued_at_ms BIGINT NOT NULL DEFAULT 0, "
      "started_at_ms BIGINT NOT NULL DEFAULT 0, completed_at_ms BIGINT NOT NULL DEFAULT 0, audience_count BIGINT NOT NULL DEFAULT 0, "
      "sent_count BIGINT NOT NULL DEFAULT 0, failed_count BIGINT NOT NULL DEFAULT 0, failure_reason TEXT NOT NULL DEFAULT '', "
      "claimed_by TEXT NOT NULL DEFAULT '', claim_expires_at_ms BIGINT NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS campaign_status_send_at ON campaign(status, send_at_ms);",
      "CREATE TABLE IF NOT EXISTS subscriber (id TEXT PRIMARY KEY, endpoint TEXT NOT NULL, credentials TEXT NOT NULL DEFAULT '', "
      "browser TEXT NOT NULL DEFAULT '', os TEXT NOT NULL DEFAULT '', device TEXT NOT NULL DEFAULT '', country TEXT NOT NULL DEFAULT '', "
      "language TEXT NOT NULL DEFAULT '', last_seen_at_ms BIGINT NOT NULL DEFAULT 0, active SMALLINT NOT NULL DEFAULT 1, "
      "created_at_ms BIGINT NOT NULL DEFAULT 0, updated_at_ms BIGINT NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS subscriber_active_country ON subscriber(active, country);",
      "CREATE INDEX IF NOT EXISTS subscriber_active_last_seen ON subscriber(active, last_seen_at_ms);",
      "CREATE TABLE IF NOT EXISTS delivery_outcome (campaign_id TEXT NOT NULL REFERENCES campaign(id) ON DELETE CASCADE, "
      "subscriber_id TEXT NOT NULL, status SMALLINT NOT NULL, attempts INTEGER NOT NULL DEFAULT 0, last_attempt_at_ms BIGINT NOT NULL DEFAULT 0, "
      "next_attempt_at_ms BIGINT NOT NULL DEFAULT 0, last_error TEXT NOT NULL DEFAULT '', PRIMARY KEY (campaign_id, subscriber_id));",
      "CREATE INDEX IF NOT EXISTS delivery_outcome_retry ON delivery_outcome(campaign_id, status, next_attempt_at_ms);",
      "CREATE TABLE IF NOT EXISTS alo_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());",
      "INSERT INTO alo_schema_migrations(version) VALUES (1) ON CONFLICT DO NOTHING;"};
  return kSchema;
}

} // namespace alo::db::sql
