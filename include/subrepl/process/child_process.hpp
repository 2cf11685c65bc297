#pragma once

#include <optional>
#include <string>
#include <vector>

#include "subrepl/core/errors.hpp"
#include "subrepl/core/file_descriptor.hpp"
#include "subrepl/core/result.hpp"
#include "subrepl/core/syscall.hpp"
#include "subrepl/env/environment.hpp"
#include "subrepl/process/platform.hpp"

namespace subrepl::process {

#ifdef _WIN32
using ProcessId = unsigned long;
#else
using ProcessId = pid_t;
#endif

enum class ProcessStatus {
  NotStarted,
  Running,
  Exited,
  Terminated,
};

class ChildProcess {
  std::vector<std::string>                args_;
  std::optional<std::string>              working_dir_;
  std::optional<std::vector<std::string>> environment_;
  StartupFlags                            startup_;
  ProcessStatus                           status_ = ProcessStatus::NotStarted;
  std::optional<int>                      exit_code_;

#ifdef _WIN32
  ProcessId            pid_ = 0;
  core::FileDescriptor process_handle_;
#else
  ProcessId pid_ = -1;
#endif

  // Child-side pipe ends, handed over at start() and closed in the parent after
  core::FileDescriptor stdin_fd_;
  core::FileDescriptor stdout_fd_;
  bool                 merge_stderr_ = true;

public:
  explicit ChildProcess(std::vector<std::string> args, std::optional<std::string> working_dir = std::nullopt);

  // A child still running when its handle goes away is killed and reaped.
  ~ChildProcess();

  ChildProcess(ChildProcess const&)            = delete;
  ChildProcess& operator=(ChildProcess const&) = delete;
  ChildProcess(ChildProcess&& other) noexcept;
  ChildProcess& operator=(ChildProcess&& other) noexcept;

  // Without this the child inherits our environment.
  void set_environment(env::Environment const& env);
  void set_startup_flags(StartupFlags flags) noexcept;

  void set_stdin(core::FileDescriptor fd) noexcept;
  // With merge_stderr the child's stderr goes to the same pipe; otherwise it
  // inherits ours.
  void set_stdout(core::FileDescriptor fd, bool merge_stderr = true) noexcept;

  auto start() -> core::Result<void, core::SpawnError>;

  // Exit code once the child is gone, nullopt while it still runs.
  auto try_wait() -> core::syscall::Result<std::optional<int>>;
  auto wait() -> core::syscall::Result<int>;

  // Polls: a child that exited since the last call is reaped here.
  [[nodiscard]] bool is_running();

  // SIGKILL, or TerminateProcess on Windows. No-op once the child is gone.
  auto kill() -> core::syscall::Result<void>;
  auto send_signal(int sig) -> core::syscall::Result<void>;

  [[nodiscard]] ProcessId pid() const noexcept {
    return pid_;
  }

  [[nodiscard]] ProcessStatus status() const noexcept {
    return status_;
  }

  [[nodiscard]] std::optional<int> exit_code() const noexcept {
    return exit_code_;
  }

  [[nodiscard]] std::vector<std::string> const& args() const noexcept {
    return args_;
  }

private:
  void record_exit(int wait_status);
  void reap() noexcept;
};

} // namespace subrepl::process
