#pragma once

#include <chrono>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/util/time.hpp"

namespace alo::segment {

/*
  TTL cache of data-derived segment values, keyed by dimension id.

  Thread-safe. Entries older than the TTL read as misses; Remove and
  Clear drop them immediately.
*/
class ValueCache {
 public:
  explicit ValueCache(std::chrono::milliseconds ttl);

  void Put(const std::string& dimension_id, std::vector<std::string> values, util::TimePoint now);

  std::optional<std::vector<std::string>> Get(const std::string& dimension_id, util::TimePoint now) const;

  void Remove(const std::string& dimension_id);
  void Clear();

 private:
  struct Entry {
    std::vector<std::string> values;
    util::TimePoint          loaded_at;
  };

  std::chrono::milliseconds ttl_;

  mutable std::shared_mutex              mutex_;
  std::unordered_map<std::string, Entry> cache_;
};

} // namespace alo::segment
