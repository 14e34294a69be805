#include "pg_pool.hpp"

#include "internal/db/sql/sql_queries.hpp"

namespace alo::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
        return Wrap(conn.release());
      } catch (...) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
  }
}

std::string PgPool::ToDollarPlaceholders(const std::string& sql) {
  std::string out;
  out.reserve(sql.size() + 32);
  int  next      = 1;
  bool in_quotes = false;
  for (char c : sql) {
    if (c == '\'') in_quotes = !in_quotes;
    if (c == '?' && !in_quotes) {
      out += '$';
      out += std::to_string(next++);
      continue;
    }
    out += c;
  }
  return out;
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  const auto prepare = [&conn](const char* name, const char* sql) { conn.prepare(name, ToDollarPlaceholders(sql)); };

  prepare("insert_campaign", sql::INSERT_CAMPAIGN);
  prepare("select_campaign", sql::SELECT_CAMPAIGN);
  prepare("update_campaign_if", sql::UPDATE_CAMPAIGN_IF);
  prepare("campaign_exists", sql::CAMPAIGN_EXISTS);
  prepare("list_campaigns", sql::LIST_CAMPAIGNS);
  prepare("list_campaigns_by_status", sql::LIST_CAMPAIGNS_BY_STATUS);
  prepare("list_due_scheduled", sql::LIST_DUE_SCHEDULED);
  prepare("list_claimable", sql::LIST_CLAIMABLE);
  prepare("delete_drafts_older_than", sql::DELETE_DRAFTS_OLDER_THAN);
  prepare("count_campaigns_by_status", sql::COUNT_CAMPAIGNS_BY_STATUS);

  prepare("upsert_subscriber", sql::UPSERT_SUBSCRIBER);
  prepare("select_subscriber", sql::SELECT_SUBSCRIBER);
  prepare("set_subscriber_active", sql::SET_SUBSCRIBER_ACTIVE);
  prepare("count_active_subscribers", sql::COUNT_ACTIVE_SUBSCRIBERS);

  prepare("upsert_outcome", sql::UPSERT_OUTCOME);
  prepare("list_retryable_outcomes", sql::LIST_RETRYABLE_OUTCOMES);
  prepare("count_outcomes_by_status", sql::COUNT_OUTCOMES_BY_STATUS);
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace alo::db::postgres
