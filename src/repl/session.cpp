#include "subrepl/repl/session.hpp"

#include <csignal>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "subrepl/core/constant.hpp"
#include "subrepl/core/log.hpp"
#include "subrepl/core/signal.hpp"
#include "subrepl/env/environment_builder.hpp"
#include "subrepl/process/launcher.hpp"
#include "subrepl/venv/resolver.hpp"

namespace subrepl::repl {

Session::Session(
    Key,
    process::ProcessChain                chain,
    io::ReadStrategy&                    read_strategy,
    std::unique_ptr<AutocompleteService> autocomplete,
    LaunchOptions const&                 options
)
    : autocomplete_(std::move(autocomplete))
    , chain_(std::move(chain))
    , bridge_(read_strategy)
    , external_id_(options.external_id_)
    , soft_quit_(options.soft_quit_)
    , encoding_(options.encoding_) {}

auto Session::launch(LaunchOptions const& options, config::Settings const& settings, Services const& services)
    -> LaunchResult {
  if (auto supported = process::ProcessLauncher::check_supported(options.cmd_); !supported) {
    return std::unexpected(std::move(supported.error()));
  }

  std::unique_ptr<AutocompleteService> autocomplete;
  if (options.autocomplete_server_ && services.autocomplete_factory_) {
    autocomplete = services.autocomplete_factory_(settings.autocomplete_server_ip_);
    if (autocomplete) {
      autocomplete->start();
    }
  }

  env::EnvironmentBuilder builder(settings, services.runner_);
  auto                    env = builder.build(
      options.env_, options.extend_env_, options.encoding_, autocomplete ? autocomplete->port() : std::nullopt
  );
  if (!env) {
    return std::unexpected(std::move(env.error()));
  }

  process::ProcessLauncher launcher(services.platform_);
  process::LaunchRequest   request{
        .cmd_            = options.cmd_,
        .env_            = std::move(*env),
        .cwd_            = options.cwd_,
        .filter_enabled_ = options.filter_warnings_,
        .filter_command_ = settings.filter_command_,
  };
  auto chain = launcher.launch(request);
  if (!chain) {
    return std::unexpected(std::move(chain.error()));
  }

  return std::make_unique<Session>(
      Key{}, std::move(*chain), *services.platform_.read_strategy_, std::move(autocomplete), options
  );
}

auto Session::launch_in_virtualenv(LaunchOptions const& options, config::Settings const& settings, Services const& services)
    -> LaunchResult {
  if (auto supported = process::ProcessLauncher::check_supported(options.cmd_); !supported) {
    return std::unexpected(std::move(supported.error()));
  }

  LaunchOptions venv_options = options;
  venv_options.extend_env_.try_emplace(
      std::string(core::constant::PY_VERSION_VAR), std::string(core::constant::DEFAULT_PY_VERSION)
  );
  venv_options.extend_env_.try_emplace(
      std::string(core::constant::PYTHONIOENCODING_VAR), std::string(core::constant::DEFAULT_PYTHONIOENCODING)
  );
  auto const& tag = venv_options.extend_env_.at(std::string(core::constant::PY_VERSION_VAR));

  env::EnvironmentBuilder builder(settings, services.runner_);
  env::Environment        base = options.env_ ? *options.env_ : builder.acquire_base();

  venv::VirtualEnvResolver resolver(services.cache_, services.runner_);
  venv::ResolveRequest     request{
          .venv_paths_   = settings.python_virtualenv_paths_,
          .target_tag_   = tag,
          .use_wrapped_  = settings.use_wrapped_,
          .force_source_ = settings.force_source_,
          .conda_minor_  = settings.conda_minor_,
  };
  auto resolved = resolver.resolve(request, std::move(base));
  if (!resolved) {
    return std::unexpected(std::move(resolved.error()));
  }
  if (auto path = resolved->find(std::string(core::constant::PATH)); path != resolved->end()) {
    core::log::debug("PATH used: {}", path->second);
  }

  venv_options.env_ = std::move(*resolved);
  return launch(venv_options, settings, services);
}

auto Session::name() -> std::string {
  if (external_id_ && !external_id_->empty()) {
    return *external_id_;
  }
  return fmt::format("{}", fmt::join(chain_.primary().args(), " "));
}

bool Session::is_alive() {
  return chain_.is_alive();
}

auto Session::read_bytes() -> core::syscall::Result<std::string> {
  return bridge_.read_bytes(chain_.output());
}

auto Session::write_bytes(std::string_view bytes) -> core::syscall::Result<void> {
  return io::IoBridge::write_bytes(chain_.input(), bytes);
}

auto Session::kill() -> core::syscall::Result<void> {
  killed_ = true;

  if (!soft_quit_.empty()) {
    auto payload = env::encode(soft_quit_, encoding_).value_or(soft_quit_);
    if (auto written = write_bytes(payload); !written) {
      core::log::debug("soft quit not delivered: {}", core::syscall::error_string(written.error()));
    }
  }

  return chain_.kill_all();
}

auto Session::send_signal(int sig) -> core::syscall::Result<void> {
  if (sig == SIGTERM) {
    killed_ = true;
  }
  if (!is_alive()) {
    return {};
  }
  return chain_.signal_all(sig);
}

auto Session::available_signals() -> std::map<std::string, int> {
  return core::signal::signal_table();
}

bool Session::autocomplete_available() const {
  return autocomplete_ && autocomplete_->connected();
}

auto Session::autocomplete_port() const -> std::optional<int> {
  if (!autocomplete_) {
    return std::nullopt;
  }
  return autocomplete_->port();
}

auto Session::autocomplete_completions(CompletionRequest const& request) -> std::vector<std::string> {
  if (!autocomplete_) {
    return {};
  }
  return autocomplete_->complete(request);
}

} // namespace subrepl::repl
