#include "subrepl/process/executable_lookup.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#ifndef _WIN32
#include <unistd.h>
#endif

#include "subrepl/core/string_utils.hpp"

namespace subrepl::process {

namespace fs = std::filesystem;

namespace {

auto lookup_var(env::Environment const& env, std::string_view key) -> std::string {
  if (auto it = env.find(std::string(key)); it != env.end()) {
    return it->second;
  }
  return {};
}

auto is_file(fs::path const& path) -> bool {
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

} // namespace

auto has_directory_part(std::string_view path) noexcept -> bool {
  return path.find_first_of("/\\") != std::string_view::npos;
}

auto find_executable(std::string_view executable, env::Environment const& env, char list_separator)
    -> std::optional<std::string> {
  if (executable.empty()) {
    return std::nullopt;
  }
  if (has_directory_part(executable)) {
    return std::string(executable);
  }

  std::vector<std::string> extensions;
  if (fs::path(executable).has_extension()) {
    extensions.emplace_back();
  } else {
    auto pathext = lookup_var(env, core::constant::PATHEXT);
    if (pathext.empty()) {
      pathext = core::constant::DEFAULT_PATHEXT;
    }
    for (auto& ext : core::util::split(pathext, list_separator)) {
      if (!ext.empty()) {
        extensions.push_back(std::move(ext));
      }
    }
  }

  for (auto const& dir : core::util::split(lookup_var(env, core::constant::PATH), list_separator)) {
    if (dir.empty()) {
      continue;
    }
    for (auto const& ext : extensions) {
      auto candidate = fs::path(dir) / (std::string(executable) + ext);
      if (is_file(candidate)) {
        return candidate.string();
      }
    }
  }
  return std::nullopt;
}

auto search_path(std::string_view name, env::Environment const& env, char list_separator)
    -> std::optional<std::string> {
  if (name.empty() || has_directory_part(name)) {
    return std::nullopt;
  }

  for (auto const& dir : core::util::split(lookup_var(env, core::constant::PATH), list_separator)) {
    // An empty entry means the current directory
    auto candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / std::string(name);
    if (!is_file(candidate)) {
      continue;
    }
#ifndef _WIN32
    if (access(candidate.c_str(), X_OK) != 0) {
      continue;
    }
#endif
    return candidate.string();
  }
  return std::nullopt;
}

} // namespace subrepl::process
