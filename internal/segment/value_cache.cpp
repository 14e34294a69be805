#include "value_cache.hpp"

#include <mutex>

namespace alo::segment {

ValueCache::ValueCache(std::chrono::milliseconds ttl) : ttl_(ttl) {
}

// ------------------------------------------------------------
// Put
// ------------------------------------------------------------

void ValueCache::Put(const std::string& dimension_id, std::vector<std::string> values, util::TimePoint now) {
  std::unique_lock lock(mutex_);
  cache_[dimension_id] = Entry{std::move(values), now};
}

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

std::optional<std::vector<std::string>> ValueCache::Get(const std::string& dimension_id, util::TimePoint now) const {
  std::shared_lock lock(mutex_);

  auto it = cache_.find(dimension_id);
  if (it == cache_.end()) return std::nullopt;

  // a clock that went backwards also counts as stale
  if (now < it->second.loaded_at || now - it->second.loaded_at >= ttl_) return std::nullopt;

  return it->second.values;
}

// ------------------------------------------------------------
// Invalidation
// ------------------------------------------------------------

void ValueCache::Remove(const std::string& dimension_id) {
  std::unique_lock lock(mutex_);
  cache_.erase(dimension_id);
}

void ValueCache::Clear() {
  std::unique_lock lock(mutex_);
  cache_.clear();
}

} // namespace alo::segment
