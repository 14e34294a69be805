#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "alo/campaign/v1/types.pb.h"
#include "internal/db/api/audience_query.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/segment/segment_catalog.hpp"
#include "internal/util/time.hpp"

namespace alo::audience {

/*
  Lazy, restartable sequence of audience member ids.

  Keyset pagination over subscriber id: every page is read in its own
  short transaction, so attribute changes between pages are observed.
  NextBatch is serialized internally; concurrent callers get disjoint
  pages. Never call it while holding a transaction on the same thread.
*/
class AudienceCursor {
 public:
  AudienceCursor(std::shared_ptr<db::Repository> repository, db::AudienceQuery query, std::size_t page_size, std::string after_id = {});

  // Empty once the audience is exhausted.
  std::vector<std::string> NextBatch();

  // Last id handed out; a cursor started after it resumes here.
  std::string Position() const;

  bool Exhausted() const;

 private:
  std::shared_ptr<db::Repository> repository_;
  db::AudienceQuery               query_;
  std::size_t                     page_size_;

  mutable std::mutex mutex_;
  std::string        after_id_;
  bool               exhausted_ = false;
};

struct ResolvedAudience {
  uint64_t                        count = 0;
  std::unique_ptr<AudienceCursor> members;
};

/*
  Evaluates segment filters against subscriber storage.

  AND across filters, OR within a filter, active subscribers only. An
  empty filter list selects every active subscriber; a filter with no
  values selects nobody.
*/
class AudienceResolver {
 public:
  AudienceResolver(std::shared_ptr<db::Repository> repository, std::shared_ptr<segment::SegmentCatalog> catalog, util::NowFn now = util::Now);

  // Throws UnknownDimension.
  db::AudienceQuery BuildQuery(const std::vector<alo::campaign::v1::SegmentFilter>& filters) const;

  uint64_t Count(const std::vector<alo::campaign::v1::SegmentFilter>& filters);

  std::unique_ptr<AudienceCursor> Members(const std::vector<alo::campaign::v1::SegmentFilter>& filters, std::size_t page_size,
                                          std::string after_id = {});

  ResolvedAudience Resolve(const std::vector<alo::campaign::v1::SegmentFilter>& filters, std::size_t page_size);

 private:
  uint64_t CountQuery(const db::AudienceQuery& query);

  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<segment::SegmentCatalog> catalog_;
  util::NowFn                              now_;
};

} // namespace alo::audience
