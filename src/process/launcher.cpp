#include "subrepl/process/launcher.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "subrepl/core/constant.hpp"
#include "subrepl/core/file_descriptor.hpp"
#include "subrepl/core/log.hpp"
#include "subrepl/core/signal.hpp"
#include "subrepl/core/syscall.hpp"
#include "subrepl/process/executable_lookup.hpp"

namespace subrepl::process {

namespace {

auto pipe_or_error(std::string_view which) -> core::Result<std::pair<core::FileDescriptor, core::FileDescriptor>, core::SpawnError> {
  auto pipe = core::make_pipe();
  if (!pipe) {
    return std::unexpected(core::SpawnError(fmt::format("{} pipe: {}", which, pipe.error())));
  }
  return std::move(*pipe);
}

} // namespace

ProcessLauncher::ProcessLauncher(StartupPolicy const& startup, bool manual_executable_lookup) noexcept
    : startup_(&startup), manual_executable_lookup_(manual_executable_lookup) {}

ProcessLauncher::ProcessLauncher(Platform const& platform) noexcept
    : ProcessLauncher(*platform.startup_, platform.manual_executable_lookup_) {}

auto ProcessLauncher::check_supported(std::span<std::string const> cmd) -> core::Result<void, core::UnsupportedError> {
  if (!cmd.empty() && cmd.front() == core::constant::UNSUPPORTED_MARKER) {
    return std::unexpected(core::UnsupportedError(std::vector<std::string>(cmd.begin() + 1, cmd.end())));
  }
  return {};
}

auto ProcessLauncher::effective_cwd(std::optional<std::string> const& cwd) -> std::optional<std::string> {
  if (!cwd || cwd->empty()) {
    return std::nullopt;
  }
  std::error_code ec;
  if (!std::filesystem::is_directory(*cwd, ec)) {
    core::log::debug("working directory '{}' does not exist, inheriting ours", *cwd);
    return std::nullopt;
  }
  return cwd;
}

auto ProcessLauncher::resolve_command(std::vector<std::string> cmd, env::Environment const& env) const
    -> std::vector<std::string> {
  if (cmd.empty()) {
    return cmd;
  }

  auto resolved = manual_executable_lookup_ ? find_executable(cmd[0], env) : search_path(cmd[0], env);
  if (resolved) {
    core::log::debug("resolved '{}' to '{}'", cmd[0], *resolved);
    cmd[0] = std::move(*resolved);
  }
  return cmd;
}

auto ProcessLauncher::launch(LaunchRequest const& request) const -> core::Result<ProcessChain, core::LaunchError> {
  if (auto supported = check_supported(request.cmd_); !supported) {
    return std::unexpected(std::move(supported.error()));
  }
  if (request.cmd_.empty()) {
    return std::unexpected(core::SpawnError("empty command"));
  }
  if (request.filter_enabled_ && request.filter_command_.empty()) {
    return std::unexpected(core::SpawnError("empty filter command"));
  }

  core::signal::ignore_broken_pipe();

  auto cmd   = resolve_command(request.cmd_, request.env_);
  auto cwd   = effective_cwd(request.cwd_);
  auto flags = startup_->flags();
  core::log::debug("launching: {}", fmt::join(cmd, " "));

  auto input_pipe = pipe_or_error("stdin");
  if (!input_pipe) {
    return std::unexpected(std::move(input_pipe.error()));
  }
  auto output_pipe = pipe_or_error("stdout");
  if (!output_pipe) {
    return std::unexpected(std::move(output_pipe.error()));
  }
  auto& [child_stdin, input]          = *input_pipe;
  auto& [primary_output, child_stdout] = *output_pipe;

  ChildProcess primary(std::move(cmd), cwd);
  primary.set_environment(request.env_);
  primary.set_startup_flags(flags);
  primary.set_stdin(std::move(child_stdin));
  primary.set_stdout(std::move(child_stdout));

  if (auto started = primary.start(); !started) {
    return std::unexpected(std::move(started.error()));
  }

  if (!request.filter_enabled_) {
    core::FileDescriptor output = std::move(primary_output);
#ifndef _WIN32
    if (auto nb = core::syscall::set_nonblocking(output.get()); !nb) {
      return std::unexpected(core::SpawnError(
          fmt::format("fcntl(O_NONBLOCK): {}", core::syscall::error_string(nb.error())), nb.error()
      ));
    }
#endif
    return ProcessChain(Direct{std::move(primary)}, std::move(input), std::move(output));
  }

  auto filter_pipe = pipe_or_error("filter");
  if (!filter_pipe) {
    return std::unexpected(std::move(filter_pipe.error()));
  }
  auto& [output, filter_stdout] = *filter_pipe;

  ChildProcess filter(resolve_command(request.filter_command_, request.env_), cwd);
  filter.set_environment(request.env_);
  filter.set_startup_flags(flags);
  filter.set_stdin(std::move(primary_output));
  filter.set_stdout(std::move(filter_stdout));

  if (auto started = filter.start(); !started) {
    // primary goes out of scope here and is reaped
    return std::unexpected(std::move(started.error()));
  }

#ifndef _WIN32
  if (auto nb = core::syscall::set_nonblocking(output.get()); !nb) {
    return std::unexpected(core::SpawnError(
        fmt::format("fcntl(O_NONBLOCK): {}", core::syscall::error_string(nb.error())), nb.error()
    ));
  }
#endif
  return ProcessChain(
      Filtered{std::move(primary), std::move(filter)}, std::move(input), std::move(output)
  );
}

} // namespace subrepl::process
