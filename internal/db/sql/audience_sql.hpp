#pragma once

#include "internal/db/api/audience_query.hpp"
#include "sql_params.hpp"

namespace alo::db::sql {

/*
  Renders an AudienceQuery as a WHERE predicate over the subscriber table.
  The predicate always includes active=1.
*/
SqlFragment BuildAudienceWhere(const AudienceQuery& query, Placeholders& placeholders);

// "?,?,?" / "$3,$4,$5" for an IN list of `count` items.
std::string InList(std::size_t count, Placeholders& placeholders);

} // namespace alo::db::sql
