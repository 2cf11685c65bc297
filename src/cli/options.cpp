#include "subrepl/cli/options.hpp"

#include <expected>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include "subrepl/core/constant.hpp"
#include "subrepl/core/string_utils.hpp"
#include "subrepl/env/encoding.hpp"

namespace subrepl::cli {

auto create_default_arg_parser() -> ArgumentParser {
  // clang-format off
  ArgumentParser parser(std::string(core::constant::EXE_NAME), std::string(core::constant::EXE_DESC));

  parser.add_argument("cwd", "C")
    .takes_value("dir")
    .desc("Working directory of the child, ignored when it does not exist");
  parser.add_argument("soft-quit", "q")
    .takes_value("text")
    .desc("Text written to the child before it is killed");
  parser.add_argument("env", "e")
    .takes_value("pairs")
    .desc("Comma separated KEY=TEMPLATE pairs; {NAME} expands to the value of NAME");
  parser.add_argument("name", "n")
    .takes_value("name")
    .desc("Name reported for the session instead of the command line");
  parser.add_argument("filter", "f")
    .desc("Pipe the child's output through the filter command");
  parser.add_argument("filter-command")
    .takes_value("command")
    .default_value("cat")
    .desc("Whitespace separated filter command line");
  parser.add_argument("venv")
    .desc("Activate the virtualenv named by PY_VERSION before launching");
  parser.add_argument("venv-paths")
    .takes_value("paths")
    .desc("Directories holding virtualenvs, separated like PATH");
  parser.add_argument("use-wrapped")
    .desc("Prefer conda exec wrappers over sourcing the activate script");
  parser.add_argument("force-source")
    .desc("Source activate scripts again even when cached");
  parser.add_argument("conda-minor")
    .takes_value("minor")
    .default_value("3")
    .desc("Conda minor version; 3 uses each environment's own activate script");
  parser.add_argument("getenv-command")
    .takes_value("command")
    .desc("Whitespace separated command printing the login environment; empty disables it");
  parser.add_argument("encoding")
    .takes_value("encoding")
    .default_value("utf-8")
    .desc("Encoding of the child environment: utf-8, ascii or latin-1");
  parser.add_argument("debug", "d")
    .desc("Print diagnostic messages");
  parser.add_argument("help", "h")
    .desc("Show help message");
  parser.add_argument("version", "V")
    .desc("Show version message");

  return parser;
  // clang-format on
}

auto parse_env_templates(std::string_view list) -> core::Result<env::Environment> {
  env::Environment templates;
  for (auto const& item : core::util::split(list, ',')) {
    if (item.empty()) {
      continue;
    }
    auto eq_pos = item.find('=');
    if (eq_pos == std::string::npos || eq_pos == 0) {
      return std::unexpected(fmt::format("expected KEY=TEMPLATE, got '{}'", item));
    }
    templates.insert_or_assign(item.substr(0, eq_pos), item.substr(eq_pos + 1));
  }
  return templates;
}

auto settings_from_arguments(Arguments const& args) -> core::Result<config::Settings> {
  config::Settings settings;

  settings.debug_        = args.has("debug");
  settings.use_wrapped_  = args.has("use-wrapped");
  settings.force_source_ = args.has("force-source");

  if (auto conda_minor = args.get<int>("conda-minor")) {
    settings.conda_minor_ = *conda_minor;
  } else if (args.has("conda-minor")) {
    return std::unexpected(fmt::format("invalid --conda-minor '{}'", *args.get<std::string>("conda-minor")));
  }

  if (auto paths = args.get<std::string>("venv-paths")) {
    for (auto& path : core::util::split(*paths, core::constant::PATH_LIST_SEPARATOR)) {
      if (!path.empty()) {
        settings.python_virtualenv_paths_.push_back(std::move(path));
      }
    }
  }

  if (auto getenv = args.get<std::string>("getenv-command")) {
    settings.getenv_command_ = core::util::split_whitespace(*getenv);
  } else {
    settings.getenv_command_ = config::Settings::default_getenv_command();
  }

  if (auto filter = args.get<std::string>("filter-command")) {
    auto filter_command = core::util::split_whitespace(*filter);
    if (filter_command.empty()) {
      return std::unexpected("--filter-command must not be empty");
    }
    settings.filter_command_ = std::move(filter_command);
  }

  return settings;
}

auto launch_options_from_arguments(Arguments const& args) -> core::Result<repl::LaunchOptions> {
  repl::LaunchOptions options;

  options.cmd_ = args.positional_;
  if (options.cmd_.empty()) {
    return std::unexpected("no command given");
  }

  options.cwd_             = args.get<std::string>("cwd");
  options.external_id_     = args.get<std::string>("name");
  options.filter_warnings_ = args.has("filter");
  if (auto soft_quit = args.get<std::string>("soft-quit")) {
    options.soft_quit_ = *soft_quit;
  }

  if (auto env_list = args.get<std::string>("env")) {
    auto templates = parse_env_templates(*env_list);
    if (!templates) {
      return std::unexpected(templates.error());
    }
    options.extend_env_ = std::move(*templates);
  }

  if (auto name = args.get<std::string>("encoding")) {
    auto encoding = env::parse_encoding(*name);
    if (!encoding) {
      return std::unexpected(fmt::format("unsupported encoding '{}'", *name));
    }
    options.encoding_ = *encoding;
  }

  return options;
}

} // namespace subrepl::cli
