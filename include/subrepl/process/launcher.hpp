#pragma once

#include <optional>
#include <span>
#include <string>
#include <vector>

#include "subrepl/core/errors.hpp"
#include "subrepl/core/result.hpp"
#include "subrepl/env/environment.hpp"
#include "subrepl/process/platform.hpp"
#include "subrepl/process/process_chain.hpp"

namespace subrepl::process {

struct LaunchRequest {
  std::vector<std::string>   cmd_;
  env::Environment           env_;
  std::optional<std::string> cwd_;
  bool                       filter_enabled_ = false;
  std::vector<std::string>   filter_command_ = {"cat"};
};

class ProcessLauncher {
  StartupPolicy const* startup_;
  bool                 manual_executable_lookup_;

public:
  ProcessLauncher(StartupPolicy const& startup, bool manual_executable_lookup) noexcept;
  explicit ProcessLauncher(Platform const& platform) noexcept;

  auto launch(LaunchRequest const& request) const -> core::Result<ProcessChain, core::LaunchError>;

  [[nodiscard]] auto resolve_command(std::vector<std::string> cmd, env::Environment const& env) const
      -> std::vector<std::string>;

  static auto check_supported(std::span<std::string const> cmd) -> core::Result<void, core::UnsupportedError>;

  // The requested directory if it exists; otherwise the child inherits ours.
  static auto effective_cwd(std::optional<std::string> const& cwd) -> std::optional<std::string>;
};

} // namespace subrepl::process
