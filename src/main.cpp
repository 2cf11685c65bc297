#include <atomic>
#include <chrono>
#include <cstdio>
#include <functional>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>

#include <fmt/core.h>

#include "subrepl/cli/arg_parser.hpp"
#include "subrepl/cli/options.hpp"
#include "subrepl/core/constant.hpp"
#include "subrepl/core/errors.hpp"
#include "subrepl/core/log.hpp"
#include "subrepl/core/syscall.hpp"
#include "subrepl/process/command_runner.hpp"
#include "subrepl/process/platform.hpp"
#include "subrepl/repl/session.hpp"
#include "subrepl/venv/sourced_env_cache.hpp"

#ifndef _WIN32
#include <unistd.h>
#endif

namespace {

using namespace subrepl;

void pump_output(repl::Session& session, std::atomic<bool>& finished) {
  while (true) {
    auto bytes = session.read_bytes();
    if (!bytes) {
      core::log::error("reading from child: {}", core::syscall::error_string(bytes.error()));
      break;
    }
    if (bytes->empty()) {
      break;
    }
    std::fwrite(bytes->data(), 1, bytes->size(), stdout);
    std::fflush(stdout);
  }
  finished = true;
}

// Returns true when our stdin hit EOF, false when the child went away first
bool forward_input(repl::Session& session, std::atomic<bool> const& finished) {
#ifndef _WIN32
  std::string buffer(core::constant::DEFAULT_PIPE_BUFFER_SIZE, '\0');
  while (!finished) {
    auto ready = core::syscall::wait_readable(STDIN_FILENO, std::chrono::milliseconds(100));
    if (!ready) {
      core::log::error("waiting for input: {}", core::syscall::error_string(ready.error()));
      return true;
    }
    if (!*ready) {
      continue;
    }

    auto n = core::syscall::read_handle(STDIN_FILENO, buffer.data(), buffer.size());
    if (!n) {
      core::log::error("reading input: {}", core::syscall::error_string(n.error()));
      return true;
    }
    if (*n == 0) {
      return true;
    }
    if (auto written = session.write_bytes(std::string_view(buffer.data(), *n)); !written) {
      core::log::debug("child stopped reading: {}", core::syscall::error_string(written.error()));
      return false;
    }
  }
  return false;
#else
  std::string line;
  while (!finished && std::getline(std::cin, line)) {
    line.push_back('\n');
    if (auto written = session.write_bytes(line); !written) {
      core::log::debug("child stopped reading: {}", core::syscall::error_string(written.error()));
      return false;
    }
  }
  return !finished;
#endif
}

} // namespace

int main(int argc, char* argv[]) {
  auto parser = cli::create_default_arg_parser();
  auto args   = parser.parse(argc, argv);

  if (!args) {
    fmt::print(stderr, "Error: {}\n\n", args.error());
    parser.print_help();
    return 1;
  }

  if (args->has("help")) {
    parser.print_help();
    return 0;
  }
  if (args->has("version")) {
    cli::ArgumentParser::print_version();
    return 0;
  }

  auto settings = cli::settings_from_arguments(*args);
  if (!settings) {
    fmt::print(stderr, "Error: {}\n", settings.error());
    return 1;
  }
  core::log::set_debug(settings->debug_);

  auto options = cli::launch_options_from_arguments(*args);
  if (!options) {
    fmt::print(stderr, "Error: {}\n", options.error());
    return 1;
  }

  auto                         platform = process::Platform::probe();
  process::SystemCommandRunner runner;
  venv::SourcedEnvCache        cache;
  repl::Services               services{platform, runner, cache, {}};

  auto session = args->has("venv") ? repl::Session::launch_in_virtualenv(*options, *settings, services)
                                   : repl::Session::launch(*options, *settings, services);
  if (!session) {
    core::log::error("{}", core::describe(session.error()));
    return 2;
  }
  core::log::debug("session '{}' started", (*session)->name());

  std::atomic<bool> finished{false};
  std::thread       reader(pump_output, std::ref(**session), std::ref(finished));

  if (forward_input(**session, finished)) {
    if (auto killed = (*session)->kill(); !killed) {
      core::log::error("cannot kill child: {}", core::syscall::error_string(killed.error()));
    }
  }

  reader.join();
  return 0;
}
