#include "audience_resolver.hpp"

#include <stdexcept>

namespace alo::audience {

using alo::campaign::v1::SegmentFilter;

// ------------------------------------------------------------
// AudienceCursor
// ------------------------------------------------------------

AudienceCursor::AudienceCursor(std::shared_ptr<db::Repository> repository, db::AudienceQuery query, std::size_t page_size, std::string after_id)
    : repository_(std::move(repository)), query_(std::move(query)), page_size_(page_size), after_id_(std::move(after_id)) {
  if (page_size_ == 0) {
    throw std::invalid_argument("audience page size must be positive");
  }
  exhausted_ = query_.match_nothing;
}

std::vector<std::string> AudienceCursor::NextBatch() {
  std::lock_guard lock(mutex_);
  if (exhausted_) return {};

  std::vector<std::string> page;
  {
    auto tx = repository_->Begin();
    page    = repository_->ListAudience(*tx, query_, after_id_, page_size_);
    tx->Commit();
  }

  if (page.size() < page_size_) exhausted_ = true;
  if (!page.empty()) after_id_ = page.back();
  return page;
}

std::string AudienceCursor::Position() const {
  std::lock_guard lock(mutex_);
  return after_id_;
}

bool AudienceCursor::Exhausted() const {
  std::lock_guard lock(mutex_);
  return exhausted_;
}

// ------------------------------------------------------------
// AudienceResolver
// ------------------------------------------------------------

AudienceResolver::AudienceResolver(std::shared_ptr<db::Repository> repository, std::shared_ptr<segment::SegmentCatalog> catalog, util::NowFn now)
    : repository_(std::move(repository)), catalog_(std::move(catalog)), now_(std::move(now)) {
}

db::AudienceQuery AudienceResolver::BuildQuery(const std::vector<SegmentFilter>& filters) const {
  db::AudienceQuery query;
  const uint64_t    now_ms = util::ToUnixMillis(now_());

  // every type is checked even once the result is known to be empty
  for (const auto& filter : filters) {
    const auto& dimension = catalog_->Require(filter.type());

    if (filter.values().empty()) {
      query.match_nothing = true;
      continue;
    }

    if (dimension.source == segment::DimensionSource::kEngagement) {
      db::LastSeenMatch match;
      for (const auto& value : filter.values()) {
        if (auto range = segment::EngagementRange(value, now_ms)) {
          match.ranges.push_back(*range);
        }
      }
      query.last_seen.push_back(std::move(match));
      continue;
    }

    db::AttributeMatch match;
    match.attribute = dimension.attribute;
    match.values.assign(filter.values().begin(), filter.values().end());
    query.attributes.push_back(std::move(match));
  }

  return query;
}

uint64_t AudienceResolver::CountQuery(const db::AudienceQuery& query) {
  if (query.match_nothing) return 0;

  auto     tx    = repository_->Begin();
  uint64_t count = repository_->CountAudience(*tx, query);
  tx->Commit();
  return count;
}

uint64_t AudienceResolver::Count(const std::vector<SegmentFilter>& filters) {
  return CountQuery(BuildQuery(filters));
}

std::unique_ptr<AudienceCursor> AudienceResolver::Members(const std::vector<SegmentFilter>& filters, std::size_t page_size, std::string after_id) {
  return std::make_unique<AudienceCursor>(repository_, BuildQuery(filters), page_size, std::move(after_id));
}

ResolvedAudience AudienceResolver::Resolve(const std::vector<SegmentFilter>& filters, std::size_t page_size) {
  auto query = BuildQuery(filters);

  ResolvedAudience out;
  out.count   = CountQuery(query);
  out.members = std::make_unique<AudienceCursor>(repository_, std::move(query), page_size);
  return out;
}

} // namespace alo::audience
