#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace alo::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ? ? ?

  Both use ordered binding.
*/

using Param = std::variant<std::nullptr_t, int32_t, int64_t, uint64_t, std::string>;

using Params = std::vector<Param>;

enum class PlaceholderStyle {
  kQuestion,
  kDollar,
};

// Hands out positional placeholders in binding order.
class Placeholders {
 public:
  explicit Placeholders(PlaceholderStyle style, std::size_t first_index = 1) : style_(style), next_(first_index) {
  }

  std::string Next() {
    if (style_ == PlaceholderStyle::kQuestion) {
      ++next_;
      return "?";
    }
    return "$" + std::to_string(next_++);
  }

  std::size_t NextIndex() const {
    return next_;
  }

 private:
  PlaceholderStyle style_;
  std::size_t      next_;
};

struct SqlFragment {
  std::string sql;
  Params      params;
};

} // namespace alo::db::sql
