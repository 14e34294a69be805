#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace alo::db {

/*
  Backend-neutral audience predicate.

  Every clause must hold (AND); within a clause any value / range may
  match (OR). Only active subscribers are ever selected.
*/

enum class SubscriberAttribute {
  kBrowser,
  kOs,
  kDevice,
  kCountry,
  kLanguage,
};

constexpr std::string_view AttributeColumn(SubscriberAttribute attribute) {
  switch (attribute) {
    case SubscriberAttribute::kBrowser:
      return "browser";
    case SubscriberAttribute::kOs:
      return "os";
    case SubscriberAttribute::kDevice:
      return "device";
    case SubscriberAttribute::kCountry:
      return "country";
    case SubscriberAttribute::kLanguage:
      return "language";
  }
  return "";
}

struct AttributeMatch {
  SubscriberAttribute      attribute;
  std::vector<std::string> values;
};

// [from_ms, until_ms); until_ms == 0 means unbounded.
struct TimeRange {
  uint64_t from_ms  = 0;
  uint64_t until_ms = 0;
};

struct LastSeenMatch {
  std::vector<TimeRange> ranges;
};

struct AudienceQuery {
  std::vector<AttributeMatch> attributes;
  std::vector<LastSeenMatch>  last_seen;

  // Set when some filter selected no values: the audience is empty.
  bool match_nothing = false;
};

} // namespace alo::db
