#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "subrepl/config/settings.hpp"
#include "subrepl/core/errors.hpp"
#include "subrepl/core/result.hpp"
#include "subrepl/core/syscall.hpp"
#include "subrepl/env/encoding.hpp"
#include "subrepl/env/environment.hpp"
#include "subrepl/io/io_bridge.hpp"
#include "subrepl/process/command_runner.hpp"
#include "subrepl/process/platform.hpp"
#include "subrepl/process/process_chain.hpp"
#include "subrepl/repl/autocomplete.hpp"
#include "subrepl/venv/sourced_env_cache.hpp"

namespace subrepl::repl {

struct LaunchOptions {
  std::vector<std::string>        cmd_;
  std::optional<env::Environment> env_; // acquired from the system when absent
  std::optional<std::string>      cwd_;
  env::Environment                extend_env_;
  std::string                     soft_quit_;
  bool                            autocomplete_server_ = false;
  bool                            filter_warnings_     = false;
  std::optional<std::string>      external_id_;
  env::Encoding                   encoding_ = env::Encoding::Utf8;
};

// Long-lived collaborators shared by every session. All of them must outlive
// the sessions launched with them.
struct Services {
  process::Platform const& platform_;
  process::CommandRunner&  runner_;
  venv::SourcedEnvCache&   cache_;
  AutocompleteFactory      autocomplete_factory_; // empty disables autocomplete
};

// One interactive child process, optionally behind a filter, with its pipes.
class Session {
  std::unique_ptr<AutocompleteService> autocomplete_;
  process::ProcessChain                chain_;
  io::IoBridge                         bridge_;
  std::optional<std::string>           external_id_;
  std::string                          soft_quit_;
  env::Encoding                        encoding_;
  bool                                 killed_ = false;

  // Only launch() can construct a session
  struct Key {
    explicit Key() = default;
  };

public:
  Session(
      Key,
      process::ProcessChain                chain,
      io::ReadStrategy&                    read_strategy,
      std::unique_ptr<AutocompleteService> autocomplete,
      LaunchOptions const&                 options
  );

  using LaunchResult = core::Result<std::unique_ptr<Session>, core::LaunchError>;

  static auto launch(LaunchOptions const& options, config::Settings const& settings, Services const& services)
      -> LaunchResult;

  // Same as launch, with the virtualenv named by the PY_VERSION extension
  // variable activated first.
  static auto launch_in_virtualenv(LaunchOptions const& options, config::Settings const& settings, Services const& services)
      -> LaunchResult;

  Session(Session const&)            = delete;
  Session& operator=(Session const&) = delete;

  [[nodiscard]] auto name() -> std::string;
  [[nodiscard]] bool is_alive();

  auto read_bytes() -> core::syscall::Result<std::string>;
  auto write_bytes(std::string_view bytes) -> core::syscall::Result<void>;

  // Asks the child to quit with the soft quit payload, then kills the whole
  // chain without waiting for it to comply.
  auto kill() -> core::syscall::Result<void>;
  auto send_signal(int sig) -> core::syscall::Result<void>;

  [[nodiscard]] static auto available_signals() -> std::map<std::string, int>;

  [[nodiscard]] bool killed() const noexcept {
    return killed_;
  }

  [[nodiscard]] bool at_eof() const noexcept {
    return bridge_.at_eof();
  }

  [[nodiscard]] bool autocomplete_available() const;
  [[nodiscard]] auto autocomplete_port() const -> std::optional<int>;
  auto               autocomplete_completions(CompletionRequest const& request) -> std::vector<std::string>;

  [[nodiscard]] auto chain() noexcept -> process::ProcessChain& {
    return chain_;
  }
};

} // namespace subrepl::repl
