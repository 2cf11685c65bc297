#include "subrepl/env/environment_builder.hpp"

#include <expected>
#include <string>
#include <utility>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "subrepl/core/constant.hpp"
#include "subrepl/core/log.hpp"
#include "subrepl/env/env_dump.hpp"
#include "subrepl/env/interpolate.hpp"

namespace subrepl::env {

EnvironmentBuilder::EnvironmentBuilder(config::Settings const& settings, process::CommandRunner& runner) noexcept
    : settings_(&settings), runner_(&runner) {}

auto EnvironmentBuilder::login_shell_environment() -> core::Result<Environment> {
  auto const& cmd = settings_->getenv_command_;
  if (cmd.empty()) {
    return std::unexpected("no getenv command configured");
  }

  auto captured = runner_->capture(cmd, nullptr);
  if (!captured) {
    return std::unexpected(captured.error());
  }
  if (captured->exit_code_ != 0) {
    return std::unexpected(fmt::format("'{}' exited with status {}", fmt::join(cmd, " "), captured->exit_code_));
  }

  auto parsed = parse_env_dump(captured->output_);
  if (parsed.empty()) {
    return std::unexpected(fmt::format("'{}' printed no environment", fmt::join(cmd, " ")));
  }
  return parsed;
}

auto EnvironmentBuilder::acquire_base() -> Environment {
#ifndef _WIN32
  if (!settings_->getenv_command_.empty()) {
    auto login = login_shell_environment();
    if (login) {
      return std::move(*login);
    }
    core::log::warn("cannot get login shell environment, using the inherited one: {}", login.error());
  }
#endif
  return inherited_environment();
}

auto EnvironmentBuilder::build(
    std::optional<Environment> base,
    Environment const&         extend,
    Encoding                   encoding,
    std::optional<int>         autocomplete_port
) -> core::Result<Environment, core::TemplateError> {
  Environment env = base ? std::move(*base) : acquire_base();

  for (auto const* templates : {&settings_->default_extend_env_, &extend}) {
    auto resolved = interpolate(env, *templates);
    if (!resolved) {
      return std::unexpected(std::move(resolved.error()));
    }
    merge(env, *resolved);
  }

  Environment result = encode_environment(env, encoding);

  // clang-format off
  result.insert_or_assign(std::string(core::constant::AC_PORT_VAR),
                          autocomplete_port ? std::to_string(*autocomplete_port)
                                            : std::string(core::constant::AC_PORT_ABSENT));
  result.insert_or_assign(std::string(core::constant::AC_IP_VAR), settings_->autocomplete_server_ip_);
  // clang-format on

  return result;
}

} // namespace subrepl::env
