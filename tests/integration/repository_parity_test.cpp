#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"

#if ALO_WITH_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if ALO_WITH_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using namespace alo::campaign::v1;
using alo::db::AttributeMatch;
using alo::db::AudienceQuery;
using alo::db::ErrorCode;
using alo::db::LastSeenMatch;
using alo::db::Repository;
using alo::db::SubscriberAttribute;
using alo::db::TimeRange;
using alo::db::memory::MemoryRepository;
using alo::db::model::CampaignRecord;
using alo::db::model::DeliveryOutcomeRecord;
using alo::db::model::SubscriberRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository; // empty store
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

SegmentFilter Filter(const std::string& type, std::vector<std::string> values) {
  SegmentFilter f;
  f.set_type(type);
  for (auto& v : values) f.add_values(v);
  return f;
}

CampaignRecord MakeCampaign(const std::string& id, CampaignStatus status, uint64_t created_at_ms) {
  CampaignRecord r;
  r.id                  = id;
  r.name                = "name-" + id;
  r.title               = "Título " + id;
  r.body                = "body with 'quotes' and \"double quotes\"";
  r.url                 = "https://shop.example/" + id;
  r.icon                = "https://cdn.example/icon.png";
  r.require_interaction = true;
  r.silent              = true;
  r.segments            = {Filter("country", {"PT", "BR"}), Filter("engagement", {"active"})};
  r.status              = status;
  r.version             = 1;
  r.created_at_ms       = created_at_ms;
  r.updated_at_ms       = created_at_ms;
  return r;
}

void Insert(Repository& repo, const CampaignRecord& r) {
  auto       tx     = repo.Begin();
  const auto result = repo.InsertCampaign(*tx, r);
  assert(result);
  tx->Commit();
}

void AddSubscriber(Repository& repo, const std::string& id, const std::string& country, const std::string& browser, uint64_t last_seen_ms,
                   bool active = true) {
  SubscriberRecord s;
  s.id              = id;
  s.endpoint        = "https://push.example/" + id;
  s.credentials     = "{\"p256dh\":\"k\"}";
  s.browser         = browser;
  s.os              = "android";
  s.device          = "mobile";
  s.country         = country;
  s.language        = "pt";
  s.last_seen_at_ms = last_seen_ms;
  s.active          = active;

  auto       tx     = repo.Begin();
  const auto result = repo.UpsertSubscriber(*tx, s);
  assert(result);
  tx->Commit();
}

// ------------------------------------------------------------
// Campaigns
// ------------------------------------------------------------

void VerifyCampaignRoundTrip(Repository& repo) {
  auto original       = MakeCampaign("round-trip", CAMPAIGN_STATUS_DRAFT, 1000);
  original.send_at_ms = 5000;
  Insert(repo, original);

  {
    auto       tx        = repo.Begin();
    const auto duplicate = repo.InsertCampaign(*tx, original);
    assert(duplicate.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  auto tx     = repo.Begin();
  auto loaded = repo.GetCampaign(*tx, "round-trip");
  tx->Commit();

  assert(loaded.has_value());
  assert(loaded->title == original.title);
  assert(loaded->body == original.body);
  assert(loaded->url == original.url);
  assert(loaded->icon == original.icon);
  assert(loaded->image.empty());
  assert(loaded->require_interaction);
  assert(!loaded->renotify);
  assert(loaded->silent);
  assert(loaded->send_at_ms == 5000);
  assert(loaded->status == CAMPAIGN_STATUS_DRAFT);
  assert(loaded->version == 1);
  assert(loaded->segments.size() == 2);
  assert(loaded->segments[0].type() == "country");
  assert(loaded->segments[0].values_size() == 2);
  assert(loaded->segments[0].values(1) == "BR");
  assert(loaded->segments[1].type() == "engagement");
}

void VerifyConditionalUpdate(Repository& repo) {
  Insert(repo, MakeCampaign("cas", CAMPAIGN_STATUS_QUEUED, 1000));

  CampaignRecord snapshot;
  {
    auto tx = repo.Begin();
    auto r  = repo.GetCampaign(*tx, "cas");
    tx->Commit();
    assert(r.has_value());
    snapshot = *r;
  }

  auto claimed                = snapshot;
  claimed.status              = CAMPAIGN_STATUS_SENDING;
  claimed.version             = snapshot.version + 1;
  claimed.claimed_by          = "worker-a";
  claimed.claim_expires_at_ms = 9000;
  {
    auto       tx     = repo.Begin();
    const auto result = repo.UpdateCampaignIf(*tx, claimed, snapshot.status, snapshot.version);
    assert(result);
    tx->Commit();
  }

  // a second claimant working from the same snapshot loses
  auto rival       = snapshot;
  rival.status     = CAMPAIGN_STATUS_SENDING;
  rival.version    = snapshot.version + 1;
  rival.claimed_by = "worker-b";
  {
    auto       tx     = repo.Begin();
    const auto result = repo.UpdateCampaignIf(*tx, rival, snapshot.status, snapshot.version);
    assert(result.code == ErrorCode::Conflict);
    tx->Rollback();
  }

  {
    auto missing = rival;
    missing.id   = "no-such-campaign";
    auto       tx     = repo.Begin();
    const auto result = repo.UpdateCampaignIf(*tx, missing, snapshot.status, snapshot.version);
    assert(result.code == ErrorCode::NotFound);
    tx->Rollback();
  }

  auto tx     = repo.Begin();
  auto stored = repo.GetCampaign(*tx, "cas");
  tx->Commit();
  assert(stored->claimed_by == "worker-a");
  assert(stored->claim_expires_at_ms == 9000);
  assert(stored->version == snapshot.version + 1);
}

void VerifyRollback(Repository& repo) {
  {
    auto       tx     = repo.Begin();
    const auto result = repo.InsertCampaign(*tx, MakeCampaign("rolled-back", CAMPAIGN_STATUS_DRAFT, 1));
    assert(result);
    tx->Rollback();
  }
  {
    // destructor without commit
    auto       tx     = repo.Begin();
    const auto result = repo.InsertCampaign(*tx, MakeCampaign("abandoned", CAMPAIGN_STATUS_DRAFT, 1));
    assert(result);
  }

  auto tx = repo.Begin();
  assert(!repo.GetCampaign(*tx, "rolled-back").has_value());
  assert(!repo.GetCampaign(*tx, "abandoned").has_value());
  tx->Commit();
}

void VerifyCampaignQueries(Repository& repo) {
  auto due_early       = MakeCampaign("due-early", CAMPAIGN_STATUS_SCHEDULED, 100);
  due_early.send_at_ms = 1000;
  auto due_late        = MakeCampaign("due-late", CAMPAIGN_STATUS_SCHEDULED, 200);
  due_late.send_at_ms  = 2000;
  auto not_due         = MakeCampaign("not-due", CAMPAIGN_STATUS_SCHEDULED, 300);
  not_due.send_at_ms   = 9000;

  auto queued         = MakeCampaign("queued", CAMPAIGN_STATUS_QUEUED, 400);
  queued.queued_at_ms = 10;
  auto expired                = MakeCampaign("expired", CAMPAIGN_STATUS_SENDING, 500);
  expired.queued_at_ms        = 5;
  expired.claim_expires_at_ms = 2000;
  auto live                = MakeCampaign("live", CAMPAIGN_STATUS_SENDING, 600);
  live.claim_expires_at_ms = 999999;

  auto stale_draft = MakeCampaign("stale-draft", CAMPAIGN_STATUS_DRAFT, 50);
  auto fresh_draft = MakeCampaign("fresh-draft", CAMPAIGN_STATUS_DRAFT, 5000);
  auto old_done    = MakeCampaign("old-done", CAMPAIGN_STATUS_COMPLETED, 10);

  for (const auto& c : {due_early, due_late, not_due, queued, expired, live, stale_draft, fresh_draft, old_done}) Insert(repo, c);

  auto tx = repo.Begin();

  const auto due = repo.ListDueScheduled(*tx, 2000, 10);
  assert(due.size() == 2);
  assert(due[0].id == "due-early");
  assert(due[1].id == "due-late");
  assert(repo.ListDueScheduled(*tx, 2000, 1).size() == 1);

  const auto claimable = repo.ListClaimable(*tx, 3000, 10);
  assert(claimable.size() == 2);
  assert(claimable[0] == "expired");
  assert(claimable[1] == "queued");

  const auto all = repo.ListCampaigns(*tx, CAMPAIGN_STATUS_UNSPECIFIED, 100);
  assert(all.size() == 9);
  assert(all.front().id == "fresh-draft");
  assert(all.back().id == "old-done");
  assert(repo.ListCampaigns(*tx, CAMPAIGN_STATUS_SCHEDULED, 100).size() == 3);
  assert(repo.ListCampaigns(*tx, CAMPAIGN_STATUS_UNSPECIFIED, 4).size() == 4);

  auto by_status = repo.CountCampaignsByStatus(*tx);
  assert(by_status[CAMPAIGN_STATUS_SCHEDULED] == 3);
  assert(by_status[CAMPAIGN_STATUS_SENDING] == 2);
  assert(by_status[CAMPAIGN_STATUS_DRAFT] == 2);
  assert(by_status[CAMPAIGN_STATUS_COMPLETED] == 1);

  uint64_t   deleted = 0;
  const auto result  = repo.DeleteDraftsOlderThan(*tx, 1000, deleted);
  assert(result);
  assert(deleted == 1);
  assert(!repo.GetCampaign(*tx, "stale-draft").has_value());
  assert(repo.GetCampaign(*tx, "fresh-draft").has_value());
  assert(repo.GetCampaign(*tx, "old-done").has_value());

  tx->Commit();
}

// ------------------------------------------------------------
// Subscribers and audience
// ------------------------------------------------------------

void VerifyAudience(Repository& repo) {
  const uint64_t now = 100 * 86400000ULL;
  AddSubscriber(repo, "a1", "PT", "chrome", now - 1000);
  AddSubscriber(repo, "a2", "PT", "firefox", now - 10 * 86400000ULL);
  AddSubscriber(repo, "a3", "BR", "chrome", 0);
  AddSubscriber(repo, "a4", "PT", "chrome", now, false);
  AddSubscriber(repo, "a5", "ES", "safari", now - 1000);

  auto tx = repo.Begin();

  assert(repo.CountActiveSubscribers(*tx) == 4);

  AudienceQuery everyone;
  assert(repo.CountAudience(*tx, everyone) == 4);

  AudienceQuery pt_or_br;
  pt_or_br.attributes.push_back(AttributeMatch{SubscriberAttribute::kCountry, {"PT", "BR"}});
  assert(repo.CountAudience(*tx, pt_or_br) == 3);

  AudienceQuery pt_and_chrome = pt_or_br;
  pt_and_chrome.attributes.push_back(AttributeMatch{SubscriberAttribute::kBrowser, {"chrome"}});
  assert(repo.CountAudience(*tx, pt_and_chrome) == 2);

  AudienceQuery seen_this_week;
  seen_this_week.last_seen.push_back(LastSeenMatch{{TimeRange{now - 7 * 86400000ULL, 0}}});
  assert(repo.CountAudience(*tx, seen_this_week) == 2);

  AudienceQuery never_or_recent;
  never_or_recent.last_seen.push_back(LastSeenMatch{{TimeRange{0, 1}, TimeRange{now - 7 * 86400000ULL, 0}}});
  assert(repo.CountAudience(*tx, never_or_recent) == 3);

  AudienceQuery nothing;
  nothing.match_nothing = true;
  assert(repo.CountAudience(*tx, nothing) == 0);
  assert(repo.ListAudience(*tx, nothing, "", 10).empty());

  // keyset paging in id order
  auto page1 = repo.ListAudience(*tx, everyone, "", 2);
  assert(page1.size() == 2 && page1[0] == "a1" && page1[1] == "a2");
  auto page2 = repo.ListAudience(*tx, everyone, page1.back(), 2);
  assert(page2.size() == 2 && page2[0] == "a3" && page2[1] == "a5");
  assert(repo.ListAudience(*tx, everyone, page2.back(), 2).empty());

  const auto countries = repo.ListDistinctAttributeValues(*tx, SubscriberAttribute::kCountry);
  assert(countries.size() == 3);
  assert(countries[0] == "BR" && countries[1] == "ES" && countries[2] == "PT");

  const auto found = repo.GetSubscribers(*tx, {"a1", "missing", "a4"});
  assert(found.size() == 2);

  auto a1 = repo.GetSubscriber(*tx, "a1");
  assert(a1.has_value());
  assert(a1->credentials == "{\"p256dh\":\"k\"}");
  assert(a1->active);

  const auto deactivated = repo.SetSubscriberActive(*tx, "a1", false, now);
  assert(deactivated);
  assert(repo.CountActiveSubscribers(*tx) == 3);
  assert(repo.SetSubscriberActive(*tx, "missing", false, now).code == ErrorCode::NotFound);

  tx->Commit();
}

// ------------------------------------------------------------
// Delivery outcomes
// ------------------------------------------------------------

void VerifyOutcomes(Repository& repo) {
  Insert(repo, MakeCampaign("delivering", CAMPAIGN_STATUS_SENDING, 1));
  Insert(repo, MakeCampaign("other", CAMPAIGN_STATUS_SENDING, 2));

  auto outcome = [](const std::string& campaign, const std::string& subscriber, DeliveryStatus status, uint64_t next_ms) {
    DeliveryOutcomeRecord o;
    o.campaign_id        = campaign;
    o.subscriber_id      = subscriber;
    o.status             = status;
    o.attempts           = 1;
    o.last_attempt_at_ms = 100;
    o.next_attempt_at_ms = next_ms;
    o.last_error         = status == DELIVERY_STATUS_SENT ? "" : "err";
    return o;
  };

  auto tx = repo.Begin();
  for (const auto& o : {outcome("delivering", "u1", DELIVERY_STATUS_SENT, 0), outcome("delivering", "u2", DELIVERY_STATUS_FAILED_TRANSIENT, 900),
                        outcome("delivering", "u3", DELIVERY_STATUS_FAILED_TRANSIENT, 300),
                        outcome("delivering", "u4", DELIVERY_STATUS_FAILED_PERMANENT, 0), outcome("other", "u2", DELIVERY_STATUS_FAILED_TRANSIENT, 1)}) {
    const auto result = repo.UpsertOutcome(*tx, o);
    assert(result);
  }

  auto retryable = repo.ListRetryableOutcomes(*tx, "delivering", 10);
  assert(retryable.size() == 2);
  assert(retryable[0].subscriber_id == "u3");
  assert(retryable[1].subscriber_id == "u2");

  // second attempt replaces the row
  auto retried     = outcome("delivering", "u3", DELIVERY_STATUS_SENT, 0);
  retried.attempts = 2;
  const auto upsert = repo.UpsertOutcome(*tx, retried);
  assert(upsert);

  auto rows = repo.GetOutcomes(*tx, "delivering", {"u3", "u9"});
  assert(rows.size() == 1);
  assert(rows[0].status == DELIVERY_STATUS_SENT);
  assert(rows[0].attempts == 2);

  const auto tally = repo.CountOutcomes(*tx, "delivering");
  assert(tally.sent == 2);
  assert(tally.failed_transient == 1);
  assert(tally.failed_permanent == 1);
  assert(tally.Total() == 4);
  assert(repo.CountOutcomes(*tx, "other").Total() == 1);
  tx->Commit();

  // outcomes belong to an existing campaign
  auto orphan_tx = repo.Begin();
  assert(!repo.UpsertOutcome(*orphan_tx, outcome("no-such-campaign", "u1", DELIVERY_STATUS_SENT, 0)));
  orphan_tx->Rollback();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  Insert(*repo, MakeCampaign("durable", CAMPAIGN_STATUS_QUEUED, 42));
  AddSubscriber(*repo, "durable-sub", "PT", "chrome", 7);

  backend.restart(repo);

  auto tx = repo->Begin();
  auto c  = repo->GetCampaign(*tx, "durable");
  assert(c.has_value());
  assert(c->status == CAMPAIGN_STATUS_QUEUED);
  assert(c->segments.size() == 2);
  assert(repo->GetSubscriber(*tx, "durable-sub").has_value());
  tx->Commit();
}

// ------------------------------------------------------------
// Backends
// ------------------------------------------------------------

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if ALO_WITH_SQLITE
class SqliteExecutor final : public alo::db::sql::MigrationExecutor {
 public:
  explicit SqliteExecutor(alo::db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  alo::db::sqlite::SqliteDB& db_;
};

BackendFactory MakeSqliteFactory() {
  auto dir = std::filesystem::temp_directory_path() / ("alo_integration_sqlite_" + std::to_string(NowMs()));
  std::filesystem::create_directories(dir);
  auto counter = std::make_shared<int>(0);

  auto open = [](const std::filesystem::path& path) {
    auto           db = std::make_shared<alo::db::sqlite::SqliteDB>(path.string());
    SqliteExecutor executor(*db);
    alo::db::sql::RunMigrations(executor, alo::db::sql::SqliteSchema());
    return std::make_shared<alo::db::sqlite::SqliteRepository>(std::move(db));
  };
  auto current = std::make_shared<std::filesystem::path>();

  return BackendFactory{
      .name = "sqlite",
      .make_repository =
          [=]() {
            *current = dir / ("repo_" + std::to_string((*counter)++) + ".db");
            return open(*current);
          },
      .supports_restart = []() { return true; },
      .restart          = [=](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = open(*current);
      },
      .cleanup = [dir]() { std::filesystem::remove_all(dir); },
  };
}
#endif

#if ALO_WITH_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("ALO_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("ALO_TEST_POSTGRES_URI is not set");
  }

  auto conninfo = std::string(uri);
  auto open     = [conninfo](bool truncate) {
    auto pool = std::make_shared<alo::db::postgres::PgPool>(conninfo);
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);
      for (const auto& sql : alo::db::sql::PostgresSchema()) tx.exec(sql);
      if (truncate) tx.exec("TRUNCATE delivery_outcome, campaign, subscriber;");
      tx.commit();
    }
    return std::make_shared<alo::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = [open]() { return open(true); },
      .supports_restart = []() { return true; },
      .restart          = [open](std::shared_ptr<Repository>& repo) { repo = open(false); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";

  // every check starts from an empty store
  const std::vector<std::function<void(Repository&)>> checks = {
      VerifyCampaignRoundTrip, VerifyConditionalUpdate, VerifyRollback, VerifyCampaignQueries, VerifyAudience, VerifyOutcomes,
  };
  for (const auto& check : checks) {
    auto repo = backend.make_repository();
    check(*repo);
  }

  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if ALO_WITH_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if ALO_WITH_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "alo_integration_repository_parity: pass\n";
  return 0;
}
