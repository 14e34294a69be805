#pragma once

#include <cstdint>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace alo::cleanup {

// Deletes drafts not edited for `retention_days`. Other statuses are never touched.
class DraftCleanup {
 public:
  DraftCleanup(std::shared_ptr<db::Repository> repository, util::NowFn now = util::Now);

  // Returns the number of deleted drafts.
  uint64_t CleanupDrafts(uint32_t retention_days);

 private:
  std::shared_ptr<db::Repository> repository_;
  util::NowFn                     now_;
};

} // namespace alo::cleanup
