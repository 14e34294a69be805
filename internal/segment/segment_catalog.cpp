#include "segment_catalog.hpp"

#include <algorithm>
#include <unordered_map>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace alo::segment {

using alo::campaign::v1::DIMENSION_KIND_DATA_DERIVED;
using alo::campaign::v1::DIMENSION_KIND_FIXED;
using alo::campaign::v1::SegmentDimension;
using alo::campaign::v1::SegmentFilter;

namespace {

const std::vector<Dimension>& Registry() {
  static const std::vector<Dimension> kDimensions = {
      {"browser", "Browser", "Browser the subscription was created in", DIMENSION_KIND_FIXED, DimensionSource::kAttribute,
       db::SubscriberAttribute::kBrowser, {"chrome", "edge", "firefox", "opera", "safari", "samsung", "other"}},
      {"os", "Operating system", "Operating system of the subscribed device", DIMENSION_KIND_FIXED, DimensionSource::kAttribute,
       db::SubscriberAttribute::kOs, {"android", "chromeos", "ios", "linux", "macos", "windows", "other"}},
      {"device", "Device type", "Form factor of the subscribed device", DIMENSION_KIND_FIXED, DimensionSource::kAttribute,
       db::SubscriberAttribute::kDevice, {"desktop", "mobile", "tablet"}},
      {"country", "Country", "Country resolved at subscription time", DIMENSION_KIND_DATA_DERIVED, DimensionSource::kAttribute,
       db::SubscriberAttribute::kCountry, {}},
      {"language", "Language", "Preferred browser language", DIMENSION_KIND_DATA_DERIVED, DimensionSource::kAttribute,
       db::SubscriberAttribute::kLanguage, {}},
      {"engagement", "Engagement", "active: seen within 7 days, idle: 7 to 30 days, dormant: over 30 days", DIMENSION_KIND_FIXED,
       DimensionSource::kEngagement, db::SubscriberAttribute::kBrowser, {"active", "idle", "dormant"}},
  };
  return kDimensions;
}

uint64_t DaysAgo(uint64_t now_ms, uint64_t days) {
  const uint64_t span = days * util::kMillisPerDay;
  return now_ms > span ? now_ms - span : 0;
}

} // namespace

DuplicateTypePolicy ParseDuplicateTypePolicy(std::string_view name) {
  if (name.empty() || name == "reject") return DuplicateTypePolicy::kReject;
  if (name == "merge") return DuplicateTypePolicy::kMerge;
  throw util::InvalidArgument("unknown duplicate_type_policy: " + std::string(name));
}

std::optional<db::TimeRange> EngagementRange(std::string_view value, uint64_t now_ms) {
  const uint64_t active_from = DaysAgo(now_ms, kEngagementActiveDays);
  const uint64_t idle_from   = DaysAgo(now_ms, kEngagementIdleDays);

  if (value == "active") return db::TimeRange{active_from, 0};
  // an upper bound clamped to the epoch would read as unbounded
  if (value == "idle") {
    if (active_from == 0) return std::nullopt;
    return db::TimeRange{idle_from, active_from};
  }
  // never-seen subscribers (last_seen 0) count as dormant
  if (value == "dormant") {
    if (idle_from == 0) return std::nullopt;
    return db::TimeRange{0, idle_from};
  }
  return std::nullopt;
}

// ------------------------------------------------------------
// SegmentCatalog
// ------------------------------------------------------------

SegmentCatalog::SegmentCatalog(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds value_ttl, util::NowFn now)
    : repository_(std::move(repository)), now_(std::move(now)), cache_(value_ttl) {
}

std::vector<SegmentDimension> SegmentCatalog::ListDimensions() const {
  std::vector<SegmentDimension> out;
  out.reserve(Registry().size());
  for (const auto& dimension : Registry()) {
    SegmentDimension d;
    d.set_id(dimension.id);
    d.set_display_name(dimension.display_name);
    d.set_description(dimension.description);
    d.set_kind(dimension.kind);
    out.push_back(std::move(d));
  }
  return out;
}

const Dimension* SegmentCatalog::Find(std::string_view dimension_id) const {
  const auto& registry = Registry();
  auto it = std::find_if(registry.begin(), registry.end(), [&](const Dimension& d) { return d.id == dimension_id; });
  return it == registry.end() ? nullptr : &*it;
}

const Dimension& SegmentCatalog::Require(std::string_view dimension_id) const {
  const auto* dimension = Find(dimension_id);
  if (!dimension) {
    throw util::UnknownDimension(std::string(dimension_id));
  }
  return *dimension;
}

std::vector<std::string> SegmentCatalog::ListValues(const std::string& dimension_id) {
  const auto& dimension = Require(dimension_id);
  if (dimension.kind == DIMENSION_KIND_FIXED) {
    return dimension.fixed_values;
  }

  const auto now = now_();
  if (auto cached = cache_.Get(dimension.id, now)) {
    return *cached;
  }

  std::vector<std::string> values;
  {
    auto tx = repository_->Begin();
    values  = repository_->ListDistinctAttributeValues(*tx, dimension.attribute);
    tx->Commit();
  }

  ALO_LOG_DEBUG("segment values loaded", {observability::StringField("dimension", dimension.id),
                                          observability::IntField("count", static_cast<int64_t>(values.size()))});
  cache_.Put(dimension.id, values, now);
  return values;
}

void SegmentCatalog::InvalidateValues() {
  cache_.Clear();
}

// ------------------------------------------------------------
// Filter normalization
// ------------------------------------------------------------

std::vector<SegmentFilter> NormalizeFilters(const std::vector<SegmentFilter>& filters, DuplicateTypePolicy policy) {
  std::vector<SegmentFilter>                   out;
  std::unordered_map<std::string, std::size_t> position;

  for (const auto& filter : filters) {
    auto it = position.find(filter.type());
    if (it == position.end()) {
      position.emplace(filter.type(), out.size());
      out.push_back(filter);
      continue;
    }

    if (policy == DuplicateTypePolicy::kReject) {
      throw util::InvalidArgument("segment type appears more than once: " + filter.type());
    }

    auto& merged = out[it->second];
    for (const auto& value : filter.values()) {
      if (std::find(merged.values().begin(), merged.values().end(), value) == merged.values().end()) {
        merged.add_values(value);
      }
    }
  }

  return out;
}

} // namespace alo::segment
