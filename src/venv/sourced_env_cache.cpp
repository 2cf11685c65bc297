#include "subrepl/venv/sourced_env_cache.hpp"

#include <mutex>
#include <utility>

namespace subrepl::venv {

SourcedEnvCache::SourcedEnvCache(Storage storage)
    : storage_(std::move(storage)) {}

auto SourcedEnvCache::find(std::string const& tag) const -> std::optional<env::Environment> {
  std::lock_guard lock(storage_mutex_);
  if (auto it = storage_.find(tag); it != storage_.end()) {
    return it->second;
  }
  return std::nullopt;
}

bool SourcedEnvCache::contains(std::string const& tag) const {
  std::lock_guard lock(storage_mutex_);
  return storage_.contains(tag);
}

void SourcedEnvCache::store(std::string const& tag, env::Environment environment) {
  std::lock_guard lock(storage_mutex_);
  storage_.insert_or_assign(tag, std::move(environment));
}

auto SourcedEnvCache::size() const -> size_t {
  std::lock_guard lock(storage_mutex_);
  return storage_.size();
}

void SourcedEnvCache::clear() {
  std::lock_guard lock(storage_mutex_);
  storage_.clear();
}

auto SourcedEnvCache::lock_sourcing() -> std::unique_lock<std::mutex> {
  return std::unique_lock(sourcing_mutex_);
}

} // namespace subrepl::venv
