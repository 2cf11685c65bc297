#pragma once

#include "subrepl/cli/arg_parser.hpp"
#include "subrepl/config/settings.hpp"
#include "subrepl/core/result.hpp"
#include "subrepl/repl/session.hpp"

namespace subrepl::cli {

auto create_default_arg_parser() -> ArgumentParser;

auto settings_from_arguments(Arguments const& args) -> core::Result<config::Settings>;

// The command comes from the positional arguments.
auto launch_options_from_arguments(Arguments const& args) -> core::Result<repl::LaunchOptions>;

// "KEY=TEMPLATE,KEY2=TEMPLATE2"
auto parse_env_templates(std::string_view list) -> core::Result<env::Environment>;

} // namespace subrepl::cli
