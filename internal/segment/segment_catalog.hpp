#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "alo/campaign/v1/types.pb.h"
#include "internal/db/api/audience_query.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "value_cache.hpp"

namespace alo::segment {

// How a filter list naming the same dimension twice is treated.
enum class DuplicateTypePolicy {
  kReject,
  kMerge,
};

// "reject" | "merge"; anything else is InvalidArgument.
DuplicateTypePolicy ParseDuplicateTypePolicy(std::string_view name);

// Where a dimension's values are matched against a subscriber.
enum class DimensionSource {
  kAttribute,  // equality on a subscriber attribute
  kEngagement, // last_seen_at ranges relative to now
};

struct Dimension {
  std::string                      id;
  std::string                      display_name;
  std::string                      description;
  alo::campaign::v1::DimensionKind kind;
  DimensionSource                  source;
  db::SubscriberAttribute          attribute; // kAttribute only
  std::vector<std::string>         fixed_values;
};

// Engagement buckets, by days since last seen.
inline constexpr uint64_t kEngagementActiveDays = 7;
inline constexpr uint64_t kEngagementIdleDays   = 30;

// Range of last_seen_at_ms covered by an engagement value. nullopt if the
// value is unknown or the bucket cannot contain anyone yet at now_ms.
std::optional<db::TimeRange> EngagementRange(std::string_view value, uint64_t now_ms);

/*
  Registry of segment dimensions.

  Fixed dimensions list constant values. Data-derived dimensions read the
  distinct values of active subscribers from the repository and keep them
  in a TTL cache, dropped by InvalidateValues().
*/
class SegmentCatalog {
 public:
  SegmentCatalog(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds value_ttl, util::NowFn now = util::Now);

  std::vector<alo::campaign::v1::SegmentDimension> ListDimensions() const;

  // Throws UnknownDimension.
  std::vector<std::string> ListValues(const std::string& dimension_id);

  // nullptr when not registered.
  const Dimension* Find(std::string_view dimension_id) const;

  // Throws UnknownDimension.
  const Dimension& Require(std::string_view dimension_id) const;

  void InvalidateValues();

 private:
  std::shared_ptr<db::Repository> repository_;
  util::NowFn                     now_;
  ValueCache                      cache_;
};

/*
  Applies the duplicate-type policy.

  kReject: InvalidArgument on a second filter of the same type.
  kMerge: values of same-type filters are unioned into the first
  occurrence, which keeps its position.
*/
std::vector<alo::campaign::v1::SegmentFilter> NormalizeFilters(const std::vector<alo::campaign::v1::SegmentFilter>& filters,
                                                               DuplicateTypePolicy                                   policy);

} // namespace alo::segment
