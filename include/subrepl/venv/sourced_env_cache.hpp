#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "subrepl/env/environment.hpp"

namespace subrepl::venv {

// Environments captured by sourcing an activate script, keyed by tag. One
// instance is meant to be shared by every resolver in the process. Entries
// never expire; they are only replaced by a forced re-source.
class SourcedEnvCache {
public:
  using Storage = std::unordered_map<std::string, env::Environment>;

private:
  Storage            storage_;
  mutable std::mutex storage_mutex_;
  std::mutex         sourcing_mutex_;

public:
  SourcedEnvCache() = default;
  explicit SourcedEnvCache(Storage storage);

  SourcedEnvCache(SourcedEnvCache const&)            = delete;
  SourcedEnvCache& operator=(SourcedEnvCache const&) = delete;

  [[nodiscard]] auto find(std::string const& tag) const -> std::optional<env::Environment>;
  [[nodiscard]] bool contains(std::string const& tag) const;
  void               store(std::string const& tag, env::Environment environment);
  [[nodiscard]] auto size() const -> size_t;
  void               clear();

  // Held by a resolver across check-then-populate, so concurrent first use
  // sources only once.
  [[nodiscard]] auto lock_sourcing() -> std::unique_lock<std::mutex>;
};

} // namespace subrepl::venv
