#include "subrepl/core/syscall.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <expected>
#include <optional>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <pwd.h>
#include <sys/wait.h>
#include <unistd.h>

namespace subrepl::core::syscall {

auto close_handle(NativeHandle handle) -> Result<void> {
  if (close(handle) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

auto create_pipe() -> Result<std::array<NativeHandle, 2>> {
  std::array<int, 2> fds{-1, -1};
  if (pipe2(fds.data(), O_CLOEXEC) == -1) {
    return std::unexpected(errno);
  }
  return fds;
}

auto write_handle(NativeHandle handle, std::string_view data) -> Result<size_t> {
  ssize_t result = write(handle, data.data(), data.size());
  if (result == -1) {
    return std::unexpected(errno);
  }
  return static_cast<size_t>(result);
}

auto read_handle(NativeHandle handle, char* buffer, size_t size) -> Result<size_t> {
  ssize_t result = read(handle, buffer, size);
  if (result == -1) {
    return std::unexpected(errno);
  }
  return static_cast<size_t>(result);
}

auto error_string(int error_code) -> std::string {
  return std::strerror(error_code);
}

auto kill_process(pid_t pid, int signal) -> Result<void> {
  if (kill(pid, signal) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

auto wait_for_process(pid_t pid) -> Result<int> {
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      return std::unexpected(errno);
    }
  }
  return status;
}

auto try_wait_process(pid_t pid) -> Result<std::optional<int>> {
  int   status = 0;
  pid_t result = waitpid(pid, &status, WNOHANG);
  if (result == -1) {
    return std::unexpected(errno);
  }
  if (result == 0) {
    return std::nullopt;
  }
  return status;
}

auto set_nonblocking(int fd) -> Result<void> {
  int flags = fcntl(fd, F_GETFL);
  if (flags == -1) {
    return std::unexpected(errno);
  }
  if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

auto wait_readable(int fd, std::optional<std::chrono::milliseconds> timeout) -> Result<bool> {
  pollfd pfd{};
  pfd.fd     = fd;
  pfd.events = POLLIN;

  int timeout_ms = timeout ? static_cast<int>(timeout->count()) : -1;
  int result     = poll(&pfd, 1, timeout_ms);
  if (result == -1) {
    return std::unexpected(errno);
  }
  return result > 0;
}

auto get_uid() noexcept -> uid_t {
  return getuid();
}

auto get_user_info(uid_t uid) -> Result<UserInfo> {
  passwd* pw = getpwuid(uid);
  if (pw == nullptr) {
    return std::unexpected(errno != 0 ? errno : ENOENT);
  }

  return UserInfo{
      .name_ = pw->pw_name != nullptr ? std::string{pw->pw_name} : std::string{},
      .home_ = pw->pw_dir != nullptr ? std::string{pw->pw_dir} : std::string{},
      .uid_  = pw->pw_uid,
  };
}

auto get_user_info(std::string const& username) -> Result<UserInfo> {
  passwd* pw = getpwnam(username.c_str());
  if (pw == nullptr) {
    return std::unexpected(errno != 0 ? errno : ENOENT);
  }

  return UserInfo{
      .name_ = pw->pw_name != nullptr ? std::string{pw->pw_name} : std::string{},
      .home_ = pw->pw_dir != nullptr ? std::string{pw->pw_dir} : std::string{},
      .uid_  = pw->pw_uid,
  };
}

} // namespace subrepl::core::syscall
