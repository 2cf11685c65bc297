#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace subrepl::env {

using Environment = std::unordered_map<std::string, std::string>;

// Snapshot of the environment this process inherited.
auto inherited_environment() -> Environment;

// "KEY=VALUE" entries, sorted by key, ready to become an envp block.
auto to_entries(Environment const& env) -> std::vector<std::string>;

auto sorted(Environment const& env) -> std::vector<std::pair<std::string, std::string>>;

// Overwrites keys of `target` with those of `overrides`.
void merge(Environment& target, Environment const& overrides);

} // namespace subrepl::env
