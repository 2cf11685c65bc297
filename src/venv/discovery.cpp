#include "subrepl/venv/discovery.hpp"

#include <filesystem>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include "subrepl/core/constant.hpp"
#include "subrepl/core/log.hpp"
#include "subrepl/core/tilde.hpp"

namespace subrepl::venv {

namespace fs = std::filesystem;

auto VirtualEnv::activate_script() const -> std::string {
  return (fs::path(bin_dir_) / core::constant::ACTIVATE_SCRIPT).string();
}

auto discover(std::span<std::string const> venv_paths) -> VirtualEnvMap {
  VirtualEnvMap found;

  for (auto const& raw_root : venv_paths) {
    fs::path root = core::tilde::expand_tilde(raw_root);

    std::error_code ec;
    fs::directory_iterator it(root, ec);
    if (ec) {
      core::log::debug("skipping virtualenv root '{}': {}", root.string(), ec.message());
      continue;
    }

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
      if (ec) {
        core::log::debug("error scanning '{}': {}", root.string(), ec.message());
        break;
      }

      fs::path env_dir = it->path();
      if (env_dir.filename().string().starts_with('.')) {
        continue;
      }
      fs::path bin_dir = env_dir / core::constant::VENV_BIN_DIR;

      std::error_code probe_ec;
      if (!fs::is_directory(bin_dir, probe_ec)) {
        continue;
      }

      VirtualEnv venv{
          .tag_         = env_dir.filename().string(),
          .root_        = env_dir.string(),
          .bin_dir_     = bin_dir.string(),
          .wrapper_dir_ = std::nullopt,
      };
      if (fs::path wrappers = bin_dir / core::constant::WRAPPERS_SUBDIR; fs::is_directory(wrappers, probe_ec)) {
        venv.wrapper_dir_ = wrappers.string();
      }

      // Later roots override earlier ones
      found.insert_or_assign(venv.tag_, std::move(venv));
    }
  }

  return found;
}

auto tags(VirtualEnvMap const& envs) -> std::vector<std::string> {
  std::vector<std::string> result;
  result.reserve(envs.size());
  for (auto const& [tag, _] : envs) {
    result.push_back(tag);
  }
  return result;
}

} // namespace subrepl::venv
