#pragma once

#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace subrepl::venv {

struct VirtualEnv {
  std::string                tag_;
  std::string                root_;    // the environment directory itself
  std::string                bin_dir_; // <root>/bin or <root>\Scripts
  std::optional<std::string> wrapper_dir_;

  // The activate script inside this environment's bin directory
  [[nodiscard]] auto activate_script() const -> std::string;
};

// Keyed by tag, so iteration is sorted
using VirtualEnvMap = std::map<std::string, VirtualEnv>;

// Scans every root for <root>/*/<bin>, skipping hidden directories. When two
// roots provide the same tag, the later root wins.
auto discover(std::span<std::string const> venv_paths) -> VirtualEnvMap;

auto tags(VirtualEnvMap const& envs) -> std::vector<std::string>;

} // namespace subrepl::venv
