#pragma once

#include <optional>

#include "subrepl/config/settings.hpp"
#include "subrepl/core/errors.hpp"
#include "subrepl/core/result.hpp"
#include "subrepl/env/encoding.hpp"
#include "subrepl/env/environment.hpp"
#include "subrepl/process/command_runner.hpp"

namespace subrepl::env {

class EnvironmentBuilder {
  config::Settings const*  settings_;
  process::CommandRunner* runner_;

public:
  EnvironmentBuilder(config::Settings const& settings, process::CommandRunner& runner) noexcept;

  // Runs the configured getenv command and parses its dump.
  auto login_shell_environment() -> core::Result<Environment>;

  // The login shell environment when one is configured, otherwise the one we
  // inherited. Never fails: problems are logged and the inherited one is used.
  auto acquire_base() -> Environment;

  // base (acquired when absent) + default templates + `extend` templates,
  // encoded, plus the autocomplete variables.
  auto build(
      std::optional<Environment> base,
      Environment const&         extend,
      Encoding                   encoding,
      std::optional<int>         autocomplete_port
  ) -> core::Result<Environment, core::TemplateError>;
};

} // namespace subrepl::env
