#include "draft_cleanup.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/db_error.hpp"

namespace alo::cleanup {

DraftCleanup::DraftCleanup(std::shared_ptr<db::Repository> repository, util::NowFn now)
    : repository_(std::move(repository)), now_(std::move(now)) {
}

uint64_t DraftCleanup::CleanupDrafts(uint32_t retention_days) {
  observability::SpanScope span("cleanup.drafts");

  const uint64_t now_ms    = util::ToUnixMillis(now_());
  const uint64_t retention = static_cast<uint64_t>(retention_days) * util::kMillisPerDay;
  const uint64_t cutoff_ms = now_ms > retention ? now_ms - retention : 0;

  uint64_t deleted = 0;
  auto     tx      = repository_->Begin();
  util::ThrowIfDbError(repository_->DeleteDraftsOlderThan(*tx, cutoff_ms, deleted), "delete drafts");
  tx->Commit();

  span.SetAttribute("deleted", static_cast<int64_t>(deleted));
  ALO_LOG_INFO("draft cleanup", {observability::IntField("retention_days", retention_days), observability::IntField("deleted", static_cast<int64_t>(deleted))});
  return deleted;
}

} // namespace alo::cleanup
