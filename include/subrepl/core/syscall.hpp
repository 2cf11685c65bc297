#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "subrepl/core/file_descriptor.hpp"

#ifndef _WIN32
#include <sys/types.h>
#endif

namespace subrepl::core::syscall {

template<typename T>
using Result = std::expected<T, int>;

auto close_handle(NativeHandle handle) -> Result<void>;
auto create_pipe() -> Result<std::array<NativeHandle, 2>>;
auto write_handle(NativeHandle handle, std::string_view data) -> Result<size_t>;
auto read_handle(NativeHandle handle, char* buffer, size_t size) -> Result<size_t>;
auto error_string(int error_code) -> std::string;

#ifndef _WIN32

auto kill_process(pid_t pid, int signal) -> Result<void>;
auto wait_for_process(pid_t pid) -> Result<int>;
// Returns the raw wait status once the child has exited, nullopt while it runs.
auto try_wait_process(pid_t pid) -> Result<std::optional<int>>;

auto set_nonblocking(int fd) -> Result<void>;
// Blocks until fd is readable or hung up. With a timeout, returns false when
// it expires first.
auto wait_readable(int fd, std::optional<std::chrono::milliseconds> timeout = std::nullopt) -> Result<bool>;

struct UserInfo {
  std::string name_;
  std::string home_;
  uid_t       uid_;
};

auto get_uid() noexcept -> uid_t;
auto get_user_info(uid_t uid) -> Result<UserInfo>;
auto get_user_info(std::string const& username) -> Result<UserInfo>;

#endif

} // namespace subrepl::core::syscall
