#include "subrepl/process/child_process.hpp"

#include <csignal>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <windows.h>

#include "subrepl/core/log.hpp"

namespace subrepl::process {

namespace {

// Quotes one argument the way the MSVC runtime splits command lines
auto quote_argument(std::string_view arg) -> std::string {
  if (!arg.empty() && arg.find_first_of(" \t\"") == std::string_view::npos) {
    return std::string(arg);
  }

  std::string quoted = "\"";
  size_t      backslashes = 0;
  for (char c : arg) {
    if (c == '\\') {
      ++backslashes;
      continue;
    }
    if (c == '"') {
      quoted.append(backslashes * 2 + 1, '\\');
    } else {
      quoted.append(backslashes, '\\');
    }
    quoted.push_back(c);
    backslashes = 0;
  }
  quoted.append(backslashes * 2, '\\');
  quoted.push_back('"');
  return quoted;
}

auto build_command_line(std::vector<std::string> const& args) -> std::string {
  std::string line;
  for (auto const& arg : args) {
    if (!line.empty()) {
      line.push_back(' ');
    }
    line += quote_argument(arg);
  }
  return line;
}

// Sorted "K=V\0" entries followed by a terminating NUL
auto build_environment_block(std::vector<std::string> const& entries) -> std::vector<char> {
  std::vector<char> block;
  for (auto const& entry : entries) {
    block.insert(block.end(), entry.begin(), entry.end());
    block.push_back('\0');
  }
  block.push_back('\0');
  return block;
}

auto make_inheritable(HANDLE handle) -> bool {
  return SetHandleInformation(handle, HANDLE_FLAG_INHERIT, HANDLE_FLAG_INHERIT) != 0;
}

auto spawn_failure(std::string_view what, DWORD err) -> core::SpawnError {
  return core::SpawnError(
      fmt::format("{}: {}", what, core::syscall::error_string(static_cast<int>(err))), static_cast<int>(err)
  );
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
    , process_handle_(std::move(other.process_handle_))
    , stdin_fd_(std::move(other.stdin_fd_))
    , stdout_fd_(std::move(other.stdout_fd_))
    , merge_stderr_(other.merge_stderr_) {
  other.pid_    = 0;
  other.status_ = ProcessStatus::NotStarted;
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
  if (this != &other) {
    reap();

    args_           = std::move(other.args_);
    working_dir_    = std::move(other.working_dir_);
    environment_    = std::move(other.environment_);
    startup_        = other.startup_;
    status_         = other.status_;
    exit_code_      = other.exit_code_;
    pid_            = other.pid_;
    process_handle_ = std::move(other.process_handle_);
    stdin_fd_       = std::move(other.stdin_fd_);
    stdout_fd_      = std::move(other.stdout_fd_);
    merge_stderr_   = other.merge_stderr_;

    other.pid_    = 0;
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
    return std::unexpected(core::SpawnError("process already started", ERROR_ALREADY_EXISTS));
  }
  if (args_.empty() || args_[0].empty()) {
    return std::unexpected(core::SpawnError("empty command", ERROR_INVALID_PARAMETER));
  }

  STARTUPINFOA startup_info{};
  startup_info.cb          = sizeof(startup_info);
  startup_info.dwFlags     = startup_.startup_flags_ | STARTF_USESTDHANDLES;
  startup_info.wShowWindow = startup_.show_window_;
  startup_info.hStdInput   = GetStdHandle(STD_INPUT_HANDLE);
  startup_info.hStdOutput  = GetStdHandle(STD_OUTPUT_HANDLE);
  startup_info.hStdError   = GetStdHandle(STD_ERROR_HANDLE);

  // Only the child-side pipe ends become inheritable, and only for this call
  if (stdin_fd_) {
    if (!make_inheritable(stdin_fd_.get())) {
      return std::unexpected(spawn_failure("SetHandleInformation (stdin) failed", GetLastError()));
    }
    startup_info.hStdInput = stdin_fd_.get();
  }
  if (stdout_fd_) {
    if (!make_inheritable(stdout_fd_.get())) {
      return std::unexpected(spawn_failure("SetHandleInformation (stdout) failed", GetLastError()));
    }
    startup_info.hStdOutput = stdout_fd_.get();
    if (merge_stderr_) {
      startup_info.hStdError = stdout_fd_.get();
    }
  }

  auto              command_line = build_command_line(args_);
  std::vector<char> command_buffer(command_line.begin(), command_line.end());
  command_buffer.push_back('\0');

  std::vector<char> env_block;
  if (environment_) {
    env_block = build_environment_block(*environment_);
  }

  PROCESS_INFORMATION info{};
  BOOL                created = CreateProcessA(
      nullptr,
      command_buffer.data(),
      nullptr,
      nullptr,
      TRUE,
      startup_.creation_flags_,
      environment_ ? env_block.data() : nullptr,
      working_dir_ ? working_dir_->c_str() : nullptr,
      &startup_info,
      &info
  );
  DWORD error = created ? 0 : GetLastError();

  stdin_fd_.reset();
  stdout_fd_.reset();

  if (!created) {
    return std::unexpected(spawn_failure(fmt::format("cannot spawn '{}'", args_[0]), error));
  }

  CloseHandle(info.hThread);
  process_handle_.reset(info.hProcess);
  pid_    = info.dwProcessId;
  status_ = ProcessStatus::Running;
  core::log::debug("spawned '{}' as pid {}", args_[0], pid_);
  return {};
}

void ChildProcess::record_exit(int wait_status) {
  status_    = ProcessStatus::Exited;
  exit_code_ = wait_status;
  process_handle_.reset();
}

auto ChildProcess::try_wait() -> core::syscall::Result<std::optional<int>> {
  if (status_ == ProcessStatus::NotStarted) {
    return std::unexpected(static_cast<int>(ERROR_INVALID_HANDLE));
  }
  if (status_ != ProcessStatus::Running) {
    return exit_code_;
  }

  DWORD wait_result = WaitForSingleObject(process_handle_.get(), 0);
  if (wait_result == WAIT_TIMEOUT) {
    return std::nullopt;
  }
  if (wait_result == WAIT_FAILED) {
    return std::unexpected(static_cast<int>(GetLastError()));
  }

  DWORD code = 0;
  if (GetExitCodeProcess(process_handle_.get(), &code) == 0) {
    return std::unexpected(static_cast<int>(GetLastError()));
  }
  record_exit(static_cast<int>(code));
  return exit_code_;
}

auto ChildProcess::wait() -> core::syscall::Result<int> {
  if (status_ == ProcessStatus::NotStarted) {
    return std::unexpected(static_cast<int>(ERROR_INVALID_HANDLE));
  }
  if (status_ != ProcessStatus::Running) {
    return *exit_code_;
  }

  if (WaitForSingleObject(process_handle_.get(), INFINITE) == WAIT_FAILED) {
    return std::unexpected(static_cast<int>(GetLastError()));
  }
  DWORD code = 0;
  if (GetExitCodeProcess(process_handle_.get(), &code) == 0) {
    return std::unexpected(static_cast<int>(GetLastError()));
  }
  record_exit(static_cast<int>(code));
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
  if (status_ != ProcessStatus::Running) {
    return {};
  }
  if (TerminateProcess(process_handle_.get(), 1) == 0) {
    DWORD error = GetLastError();
    // Already on its way out
    if (error == ERROR_ACCESS_DENIED) {
      return {};
    }
    return std::unexpected(static_cast<int>(error));
  }
  return {};
}

auto ChildProcess::send_signal(int sig) -> core::syscall::Result<void> {
  if (status_ != ProcessStatus::Running) {
    return {};
  }
  switch (sig) {
    case SIGINT:
      if (GenerateConsoleCtrlEvent(CTRL_C_EVENT, pid_) == 0) {
        return std::unexpected(static_cast<int>(GetLastError()));
      }
      return {};
    case SIGBREAK:
      if (GenerateConsoleCtrlEvent(CTRL_BREAK_EVENT, pid_) == 0) {
        return std::unexpected(static_cast<int>(GetLastError()));
      }
      return {};
    default: return kill();
  }
}

void ChildProcess::reap() noexcept {
  if (status_ != ProcessStatus::Running) {
    return;
  }
  TerminateProcess(process_handle_.get(), 1);
  WaitForSingleObject(process_handle_.get(), INFINITE);
  DWORD code = 0;
  GetExitCodeProcess(process_handle_.get(), &code);
  record_exit(static_cast<int>(code));
}

} // namespace subrepl::process
