#include "subrepl/venv/resolver.hpp"

#include <algorithm>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "subrepl/core/log.hpp"
#include "subrepl/core/string_utils.hpp"
#include "subrepl/core/tilde.hpp"
#include "subrepl/env/env_dump.hpp"
#include "subrepl/env/interpolate.hpp"

namespace subrepl::venv {

namespace fs = std::filesystem;

namespace {

void dump_environment(std::string_view label, env::Environment const& environment) {
  if (!core::log::debug_enabled()) {
    return;
  }
  core::log::debug("--> env {}\n{}", label, fmt::join(env::to_entries(environment), "\n"));
}

} // namespace

VirtualEnvResolver::VirtualEnvResolver(SourcedEnvCache& cache, process::CommandRunner& runner) noexcept
    : cache_(&cache), runner_(&runner) {}

bool VirtualEnvResolver::is_root_tag(std::string_view tag) noexcept {
  return std::ranges::find(core::constant::ROOT_TAGS, tag) != core::constant::ROOT_TAGS.end();
}

auto VirtualEnvResolver::source_command(std::string const& script, std::string const& tag) -> std::vector<std::string> {
  // --login makes bash read the profile, which is what puts conda on PATH
  return {
      "bash",
      "--login",
      "-c",
      fmt::format(". {} {}; env", core::util::shell_quote(script), core::util::shell_quote(tag)),
  };
}

auto VirtualEnvResolver::activate_script_for(ResolveRequest const& request, VirtualEnv const& venv) const -> std::string {
  if (request.conda_minor_ == 3 || request.venv_paths_.empty()) {
    return venv.activate_script();
  }

  // Older conda: one activate script in the installation root, next to envs/
  std::string first_root = core::tilde::expand_tilde(request.venv_paths_.front());
  while (first_root.size() > 1 && (first_root.back() == '/' || first_root.back() == '\\')) {
    first_root.pop_back();
  }
  fs::path installation = fs::path(first_root).parent_path();
  return (installation / "bin" / core::constant::ACTIVATE_SCRIPT).string();
}

void VirtualEnvResolver::source_all(ResolveRequest const& request, VirtualEnvMap const& envs) {
  for (auto const& [tag, venv] : envs) {
    auto cmd    = source_command(activate_script_for(request, venv), tag);
    auto result = runner_->capture(cmd, nullptr);
    if (!result) {
      core::log::warn("cannot source virtualenv '{}': {}", tag, result.error());
      continue;
    }
    if (result->exit_code_ != 0) {
      core::log::warn("sourcing virtualenv '{}' exited with status {}", tag, result->exit_code_);
      continue;
    }

    auto sourced = env::parse_env_dump(result->output_);
    if (sourced.empty()) {
      core::log::warn("sourcing virtualenv '{}' produced no environment", tag);
      continue;
    }
    core::log::debug("sourced virtualenv '{}' ({} variables)", tag, sourced.size());
    cache_->store(tag, std::move(sourced));
  }
}

auto VirtualEnvResolver::resolve(ResolveRequest const& request, env::Environment base)
    -> core::Result<env::Environment, core::ResolutionError> {
  auto const& tag = request.target_tag_;
  if (is_root_tag(tag)) {
    core::log::debug("'{}' is the root environment, nothing to activate", tag);
    return base;
  }

  auto envs = discover(request.venv_paths_);
  core::log::debug("virtualenvs found: {}", fmt::join(tags(envs), ", "));

  auto it = envs.find(tag);
  if (it == envs.end()) {
    return std::unexpected(core::ResolutionError(
        tag, tags(envs), fmt::format("searched: {}", fmt::join(request.venv_paths_, ", "))
    ));
  }
  auto const& venv = it->second;

  if (request.use_wrapped_ && venv.wrapper_dir_) {
    std::string path = *venv.wrapper_dir_;
    path.push_back(core::constant::PATH_LIST_SEPARATOR);
    path += venv.bin_dir_;
    if (auto old = base.find(std::string(core::constant::PATH)); old != base.end() && !old->second.empty()) {
      path.push_back(core::constant::PATH_LIST_SEPARATOR);
      path += old->second;
    }
    base.insert_or_assign(std::string(core::constant::PATH), std::move(path));
    core::log::debug("using conda wrappers in '{}'", *venv.wrapper_dir_);
    return base;
  }

  std::optional<env::Environment> delta;
  {
    auto sourcing = cache_->lock_sourcing();
    if (request.force_source_ || !cache_->contains(tag)) {
      source_all(request, envs);
    }
    delta = cache_->find(tag);
  }
  if (!delta) {
    return std::unexpected(core::ResolutionError(tag, tags(envs), "sourcing the activate script failed"));
  }

  dump_environment("before", base);
  env::merge(base, env::interpolate_lenient(base, *delta));
  dump_environment("after", base);
  return base;
}

} // namespace subrepl::venv
