#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/cleanup/draft_cleanup.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace alo::campaign::v1;
using alo::cleanup::DraftCleanup;
using alo::db::memory::MemoryRepository;
using alo::db::model::CampaignRecord;

constexpr uint64_t kNowMs = 1'700'000'000'000ULL;
constexpr uint64_t kDay   = alo::util::kMillisPerDay;

void Insert(MemoryRepository& repo, const std::string& id, CampaignStatus status, uint64_t updated_at_ms) {
  CampaignRecord r;
  r.id            = id;
  r.status        = status;
  r.version       = 1;
  r.created_at_ms = updated_at_ms;
  r.updated_at_ms = updated_at_ms;

  auto       tx     = repo.Begin();
  const auto result = repo.InsertCampaign(*tx, r);
  assert(result);
  tx->Commit();
}

bool Exists(MemoryRepository& repo, const std::string& id) {
  auto tx    = repo.Begin();
  auto found = repo.GetCampaign(*tx, id).has_value();
  tx->Commit();
  return found;
}

void TestDeletesOnlyStaleDrafts() {
  auto repo = std::make_shared<MemoryRepository>();
  Insert(*repo, "stale-draft", CAMPAIGN_STATUS_DRAFT, kNowMs - 40 * kDay);
  Insert(*repo, "fresh-draft", CAMPAIGN_STATUS_DRAFT, kNowMs - 10 * kDay);
  Insert(*repo, "old-cancelled", CAMPAIGN_STATUS_CANCELLED, kNowMs - 90 * kDay);
  Insert(*repo, "old-completed", CAMPAIGN_STATUS_COMPLETED, kNowMs - 90 * kDay);
  Insert(*repo, "old-scheduled", CAMPAIGN_STATUS_SCHEDULED, kNowMs - 90 * kDay);

  DraftCleanup cleanup(repo, [] { return alo::util::FromUnixMillis(kNowMs); });
  assert(cleanup.CleanupDrafts(31) == 1);

  assert(!Exists(*repo, "stale-draft"));
  assert(Exists(*repo, "fresh-draft"));
  assert(Exists(*repo, "old-cancelled"));
  assert(Exists(*repo, "old-completed"));
  assert(Exists(*repo, "old-scheduled"));

  // idempotent
  assert(cleanup.CleanupDrafts(31) == 0);

  // a shorter retention reaches the fresher draft
  assert(cleanup.CleanupDrafts(7) == 1);
  assert(!Exists(*repo, "fresh-draft"));
}

void TestRetentionLongerThanEpochDeletesNothing() {
  auto repo = std::make_shared<MemoryRepository>();
  Insert(*repo, "ancient", CAMPAIGN_STATUS_DRAFT, 1);

  DraftCleanup cleanup(repo, [] { return alo::util::FromUnixMillis(10 * kDay); });
  assert(cleanup.CleanupDrafts(365) == 0);
  assert(Exists(*repo, "ancient"));
}

} // namespace

int main() {
  TestDeletesOnlyStaleDrafts();
  TestRetentionLongerThanEpochDeletesNothing();

  std::cout << "alo_unit_draft_cleanup: pass\n";
  return 0;
}
