#include "subrepl/process/command_runner.hpp"

#include <array>
#include <cerrno>
#include <expected>
#include <span>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "subrepl/core/constant.hpp"
#include "subrepl/core/file_descriptor.hpp"
#include "subrepl/core/log.hpp"
#include "subrepl/core/syscall.hpp"
#include "subrepl/process/child_process.hpp"

namespace subrepl::process {

auto SystemCommandRunner::capture(std::span<std::string const> argv, env::Environment const* env)
    -> core::Result<CaptureResult> {
  if (argv.empty()) {
    return std::unexpected("empty command");
  }

  auto pipe = core::make_pipe();
  if (!pipe) {
    return std::unexpected(pipe.error());
  }
  auto& [read_end, write_end] = *pipe;

  ChildProcess child(std::vector<std::string>(argv.begin(), argv.end()));
  if (env != nullptr) {
    child.set_environment(*env);
  }
  // stderr stays ours so the helper's complaints reach the user
  child.set_stdout(std::move(write_end), false);

  if (auto started = child.start(); !started) {
    return std::unexpected(started.error().message());
  }
  core::log::debug("capturing output of: {}", fmt::join(argv, " "));

  CaptureResult result;
  std::array<char, core::constant::DEFAULT_PIPE_BUFFER_SIZE> buffer{};
  while (true) {
    auto n = core::syscall::read_handle(read_end.get(), buffer.data(), buffer.size());
    if (!n) {
      if (n.error() == EINTR) {
        continue;
      }
      return std::unexpected(fmt::format("reading from '{}': {}", argv[0], core::syscall::error_string(n.error())));
    }
    if (*n == 0) {
      break;
    }
    result.output_.append(buffer.data(), *n);
  }

  auto code = child.wait();
  if (!code) {
    return std::unexpected(fmt::format("waiting for '{}': {}", argv[0], core::syscall::error_string(code.error())));
  }
  result.exit_code_ = *code;
  return result;
}

} // namespace subrepl::process
