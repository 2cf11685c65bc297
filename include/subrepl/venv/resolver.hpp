#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "subrepl/core/constant.hpp"
#include "subrepl/core/errors.hpp"
#include "subrepl/core/result.hpp"
#include "subrepl/env/environment.hpp"
#include "subrepl/process/command_runner.hpp"
#include "subrepl/venv/discovery.hpp"
#include "subrepl/venv/sourced_env_cache.hpp"

namespace subrepl::venv {

struct ResolveRequest {
  std::vector<std::string> venv_paths_;
  std::string              target_tag_;
  bool                     use_wrapped_  = false;
  bool                     force_source_ = false;
  int                      conda_minor_  = core::constant::DEFAULT_CONDA_MINOR;
};

class VirtualEnvResolver {
  SourcedEnvCache*        cache_;
  process::CommandRunner* runner_;

public:
  VirtualEnvResolver(SourcedEnvCache& cache, process::CommandRunner& runner) noexcept;

  // Returns `base` with the target environment activated in it.
  auto resolve(ResolveRequest const& request, env::Environment base) -> core::Result<env::Environment, core::ResolutionError>;

  [[nodiscard]] static bool is_root_tag(std::string_view tag) noexcept;

  // `bash --login -c '. <script> <tag>; env'`
  [[nodiscard]] static auto source_command(std::string const& script, std::string const& tag) -> std::vector<std::string>;

private:
  void source_all(ResolveRequest const& request, VirtualEnvMap const& envs);
  auto activate_script_for(ResolveRequest const& request, VirtualEnv const& venv) const -> std::string;
};

} // namespace subrepl::venv
