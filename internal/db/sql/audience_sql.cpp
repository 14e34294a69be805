#include "audience_sql.hpp"

namespace alo::db::sql {

std::string InList(std::size_t count, Placeholders& placeholders) {
  std::string out;
  for (std::size_t i = 0; i < count; ++i) {
    if (i > 0) out += ',';
    out += placeholders.Next();
  }
  return out;
}

SqlFragment BuildAudienceWhere(const AudienceQuery& query, Placeholders& placeholders) {
  SqlFragment fragment;
  fragment.sql = "active=1";

  if (query.match_nothing) {
    fragment.sql += " AND 1=0";
    return fragment;
  }

  for (const auto& match : query.attributes) {
    if (match.values.empty()) {
      fragment.sql += " AND 1=0";
      continue;
    }
    fragment.sql += " AND " + std::string(AttributeColumn(match.attribute)) + " IN (" + InList(match.values.size(), placeholders) + ")";
    for (const auto& value : match.values) {
      fragment.params.emplace_back(value);
    }
  }

  for (const auto& match : query.last_seen) {
    if (match.ranges.empty()) {
      fragment.sql += " AND 1=0";
      continue;
    }

    std::string any;
    for (const auto& range : match.ranges) {
      if (!any.empty()) any += " OR ";
      any += "(last_seen_at_ms>=" + placeholders.Next();
      fragment.params.emplace_back(static_cast<int64_t>(range.from_ms));
      if (range.until_ms != 0) {
        any += " AND last_seen_at_ms<" + placeholders.Next();
        fragment.params.emplace_back(static_cast<int64_t>(range.until_ms));
      }
      any += ")";
    }
    fragment.sql += " AND (" + any + ")";
  }

  return fragment;
}

} // namespace alo::db::sql
