#include "subrepl/env/environment.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#ifdef _WIN32
#include <stdlib.h>
#else
extern "C" {
  extern char** environ; // NOLINT
}
#endif

namespace subrepl::env {

auto inherited_environment() -> Environment {
  Environment result;
#ifdef _WIN32
  char** entries = _environ;
#else
  char** entries = ::environ;
#endif
  if (entries == nullptr) {
    return result;
  }
  for (char** entry = entries; *entry != nullptr; ++entry) {
    std::string_view kv{*entry};
    // Windows keeps per-drive cwd entries such as "=C:=C:\\"; skip them
    if (auto pos = kv.find('=', 1); pos != std::string_view::npos) {
      result.insert_or_assign(std::string(kv.substr(0, pos)), std::string(kv.substr(pos + 1)));
    }
  }
  return result;
}

auto sorted(Environment const& env) -> std::vector<std::pair<std::string, std::string>> {
  std::vector<std::pair<std::string, std::string>> entries(env.begin(), env.end());
  std::ranges::sort(entries, {}, &std::pair<std::string, std::string>::first);
  return entries;
}

auto to_entries(Environment const& env) -> std::vector<std::string> {
  std::vector<std::string> entries;
  entries.reserve(env.size());
  for (auto const& [key, value] : sorted(env)) {
    entries.push_back(key + "=" + value);
  }
  return entries;
}

void merge(Environment& target, Environment const& overrides) {
  for (auto const& [key, value] : overrides) {
    target.insert_or_assign(key, value);
  }
}

} // namespace subrepl::env
