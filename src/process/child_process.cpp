#include "subrepl/process/child_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "subrepl/core/constant.hpp"
#include "subrepl/core/log.hpp"

namespace subrepl::process {

extern "C" {
  extern char** environ; // NOLINT
}

namespace {

auto to_pointer_array(std::vector<std::string> const& strings) -> std::vector<char*> {
  std::vector<char*> pointers;
  pointers.reserve(strings.size() + 1);
  for (auto const& s : strings) {
    pointers.push_back(const_cast<char*>(s.c_str()));
  }
  pointers.push_back(nullptr);
  return pointers;
}

// Owns the posix_spawn attribute objects for the duration of one start()
class SpawnSetup {
  posix_spawn_file_actions_t actions_{};
  posix_spawnattr_t          attrs_{};
  bool                       actions_ready_ = false;
  bool                       attrs_ready_   = false;

public:
  SpawnSetup() = default;

  SpawnSetup(SpawnSetup const&)            = delete;
  SpawnSetup& operator=(SpawnSetup const&) = delete;

  ~SpawnSetup() {
    if (attrs_ready_) {
      posix_spawnattr_destroy(&attrs_);
    }
    if (actions_ready_) {
      posix_spawn_file_actions_destroy(&actions_);
    }
  }

  auto init() -> int {
    if (int err = posix_spawn_file_actions_init(&actions_)) {
      return err;
    }
    actions_ready_ = true;
    if (int err = posix_spawnattr_init(&attrs_)) {
      return err;
    }
    attrs_ready_ = true;
    return 0;
  }

  auto actions() noexcept -> posix_spawn_file_actions_t* {
    return &actions_;
  }

  auto attrs() noexcept -> posix_spawnattr_t* {
    return &attrs_;
  }
};

auto spawn_failure(std::string_view what, int err) -> core::SpawnError {
  return core::SpawnError(fmt::format("{}: {}", what, core::syscall::error_string(err)), err);
}

} // namespace

ChildProcess::ChildProcess(std::vector<std::string> args, std::optional<std::string> working_dir)
    : args_(std::move(args)), working_dir_(std::move(working_dir)) {}

ChildProcess::~ChildProcess() {
  reap();
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : args_(std::move(other.args_))
    , working_dir_(std::move(other.working_dir_))
    , environment_(std::move(other.environment_))
    , startup_(other.startup_)
    , status_(other.status_)
    , exit_code_(other.exit_code_)
    , pid_(other.pid_)
    , stdin_fd_(std::move(other.stdin_fd_))
    , stdout_fd_(std::move(other.stdout_fd_))
    , merge_stderr_(other.merge_stderr_) {
  other.pid_    = -1;
  other.status_ = ProcessStatus::NotStarted;
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
  if (this != &other) {
    reap();

    args_         = std::move(other.args_);
    working_dir_  = std::move(other.working_dir_);
    environment_  = std::move(other.environment_);
    startup_      = other.startup_;
    status_       = other.status_;
    exit_code_    = other.exit_code_;
    pid_          = other.pid_;
    stdin_fd_     = std::move(other.stdin_fd_);
    stdout_fd_    = std::move(other.stdout_fd_);
    merge_stderr_ = other.merge_stderr_;

    other.pid_    = -1;
    other.status_ = ProcessStatus::NotStarted;
  }
  return *this;
}

void ChildProcess::set_environment(env::Environment const& env) {
  environment_ = env::to_entries(env);
}

void ChildProcess::set_startup_flags(StartupFlags flags) noexcept {
  startup_ = flags;
}

void ChildProcess::set_stdin(core::FileDescriptor fd) noexcept {
  stdin_fd_ = std::move(fd);
}

void ChildProcess::set_stdout(core::FileDescriptor fd, bool merge_stderr) noexcept {
  stdout_fd_    = std::move(fd);
  merge_stderr_ = merge_stderr;
}

auto ChildProcess::start() -> core::Result<void, core::SpawnError> {
  if (status_ != ProcessStatus::NotStarted) {
    return std::unexpected(core::SpawnError("process already started", EALREADY));
  }
  if (args_.empty() || args_[0].empty()) {
    return std::unexpected(core::SpawnError("empty command", EINVAL));
  }
  if (!startup_.empty()) {
    core::log::debug("startup flags have no meaning here, ignoring them");
  }

  SpawnSetup setup;
  if (int err = setup.init()) {
    return std::unexpected(spawn_failure("posix_spawn setup failed", err));
  }

  // Pipe ends are close-on-exec; only the dup2 targets survive into the child
  if (stdin_fd_) {
    if (int err = posix_spawn_file_actions_adddup2(setup.actions(), stdin_fd_.get(), STDIN_FILENO)) {
      return std::unexpected(spawn_failure("posix_spawn_file_actions_adddup2 (stdin) failed", err));
    }
  }
  if (stdout_fd_) {
    if (int err = posix_spawn_file_actions_adddup2(setup.actions(), stdout_fd_.get(), STDOUT_FILENO)) {
      return std::unexpected(spawn_failure("posix_spawn_file_actions_adddup2 (stdout) failed", err));
    }
    if (merge_stderr_) {
      if (int err = posix_spawn_file_actions_adddup2(setup.actions(), stdout_fd_.get(), STDERR_FILENO)) {
        return std::unexpected(spawn_failure("posix_spawn_file_actions_adddup2 (stderr) failed", err));
      }
    }
  }
  if (working_dir_.has_value()) {
    if (int err = posix_spawn_file_actions_addchdir_np(setup.actions(), working_dir_->c_str())) {
      return std::unexpected(spawn_failure("posix_spawn_file_actions_addchdir_np failed", err));
    }
  }

  // We ignore SIGPIPE ourselves; the child must get the default disposition back
  sigset_t default_signals;
  sigemptyset(&default_signals);
  sigaddset(&default_signals, SIGPIPE);
  sigset_t empty_mask;
  sigemptyset(&empty_mask);

  if (int err = posix_spawnattr_setsigdefault(setup.attrs(), &default_signals)) {
    return std::unexpected(spawn_failure("posix_spawnattr_setsigdefault failed", err));
  }
  if (int err = posix_spawnattr_setsigmask(setup.attrs(), &empty_mask)) {
    return std::unexpected(spawn_failure("posix_spawnattr_setsigmask failed", err));
  }
  if (int err = posix_spawnattr_setflags(setup.attrs(), POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK)) {
    return std::unexpected(spawn_failure("posix_spawnattr_setflags failed", err));
  }

  auto argv = to_pointer_array(args_);

  std::vector<char*> envp;
  if (environment_) {
    envp = to_pointer_array(*environment_);
  }
  char** env_block = environment_ ? envp.data() : environ;

  int err = 0;
  if (args_[0].find('/') != std::string::npos) {
    err = posix_spawn(&pid_, argv[0], setup.actions(), setup.attrs(), argv.data(), env_block);
  } else {
    err = posix_spawnp(&pid_, argv[0], setup.actions(), setup.attrs(), argv.data(), env_block);
  }

  // The child has its own copies now
  stdin_fd_.reset();
  stdout_fd_.reset();

  if (err != 0) {
    pid_ = -1;
    return std::unexpected(spawn_failure(fmt::format("cannot spawn '{}'", args_[0]), err));
  }

  core::log::debug("spawned '{}' as pid {}", args_[0], pid_);
  status_ = ProcessStatus::Running;
  return {};
}

void ChildProcess::record_exit(int wait_status) {
  if (WIFSIGNALED(wait_status)) {
    status_    = ProcessStatus::Terminated;
    exit_code_ = core::constant::SIGNAL_EXIT_CODE_OFFSET + WTERMSIG(wait_status);
  } else {
    status_    = ProcessStatus::Exited;
    exit_code_ = WIFEXITED(wait_status) ? WEXITSTATUS(wait_status) : -1;
  }
}

auto ChildProcess::try_wait() -> core::syscall::Result<std::optional<int>> {
  if (status_ == ProcessStatus::NotStarted) {
    return std::unexpected(ECHILD);
  }
  if (status_ != ProcessStatus::Running) {
    return exit_code_;
  }

  auto result = core::syscall::try_wait_process(pid_);
  if (!result) {
    if (result.error() == ECHILD) {
      // Somebody else reaped it; the exit code is lost
      status_    = ProcessStatus::Exited;
      exit_code_ = -1;
      return exit_code_;
    }
    return std::unexpected(result.error());
  }
  if (!result->has_value()) {
    return std::nullopt;
  }

  record_exit(**result);
  return exit_code_;
}

auto ChildProcess::wait() -> core::syscall::Result<int> {
  if (status_ == ProcessStatus::NotStarted) {
    return std::unexpected(ECHILD);
  }
  if (status_ != ProcessStatus::Running) {
    return *exit_code_;
  }

  auto result = core::syscall::wait_for_process(pid_);
  if (!result) {
    if (result.error() == ECHILD) {
      status_    = ProcessStatus::Exited;
      exit_code_ = -1;
      return *exit_code_;
    }
    return std::unexpected(result.error());
  }

  record_exit(*result);
  return *exit_code_;
}

bool ChildProcess::is_running() {
  auto result = try_wait();
  if (!result) {
    return status_ == ProcessStatus::Running;
  }
  return !result->has_value();
}

auto ChildProcess::kill() -> core::syscall::Result<void> {
  return send_signal(SIGKILL);
}

auto ChildProcess::send_signal(int sig) -> core::syscall::Result<void> {
  if (status_ != ProcessStatus::Running || pid_ <= 0) {
    return {};
  }

  auto result = core::syscall::kill_process(pid_, sig);
  if (!result && result.error() != ESRCH) {
    return std::unexpected(result.error());
  }
  return {};
}

void ChildProcess::reap() noexcept {
  if (status_ != ProcessStatus::Running || pid_ <= 0) {
    return;
  }
  if (auto killed = core::syscall::kill_process(pid_, SIGKILL); !killed && killed.error() != ESRCH) {
    core::log::debug("cannot kill pid {}: {}", pid_, core::syscall::error_string(killed.error()));
  }
  if (auto waited = core::syscall::wait_for_process(pid_); waited) {
    record_exit(*waited);
  } else {
    status_ = ProcessStatus::Exited;
  }
}

} // namespace subrepl::process
