#include "subrepl/core/file_descriptor.hpp"

#include <expected>
#include <string>
#include <utility>

#include <fmt/core.h>

#include "subrepl/core/syscall.hpp"

namespace subrepl::core {

FileDescriptor::FileDescriptor(NativeHandle fd, bool owning) noexcept
    : fd_(fd), owning_(owning) {}

FileDescriptor::~FileDescriptor() noexcept {
  if (owning_ && fd_ != INVALID_HANDLE) {
    [[maybe_unused]] auto _ = syscall::close_handle(fd_);
    // Ignore errors in destructor
  }
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(other.fd_), owning_(other.owning_) {
  other.fd_     = INVALID_HANDLE;
  other.owning_ = false;
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
  if (this != &other) {
    reset(other.fd_, other.owning_);
    other.fd_     = INVALID_HANDLE;
    other.owning_ = false;
  }
  return *this;
}

auto FileDescriptor::get() const noexcept -> NativeHandle {
  return fd_;
}

auto FileDescriptor::release() noexcept -> NativeHandle {
  NativeHandle fd = fd_;
  fd_             = INVALID_HANDLE;
  owning_         = false;
  return fd;
}

void FileDescriptor::reset(NativeHandle fd, bool owning) noexcept {
  if (owning_ && fd_ != INVALID_HANDLE) {
    [[maybe_unused]] auto _ = syscall::close_handle(fd_);
  }
  fd_     = fd;
  owning_ = owning;
}

auto FileDescriptor::valid() const noexcept -> bool {
  return fd_ != INVALID_HANDLE;
}

auto make_pipe() -> Result<std::pair<FileDescriptor, FileDescriptor>> {
  auto pipe_result = syscall::create_pipe();
  if (!pipe_result) {
    return std::unexpected(fmt::format("Failed to create pipe: {}", syscall::error_string(pipe_result.error())));
  }
  auto fds = *pipe_result;
  return std::make_pair(FileDescriptor(fds[0]), FileDescriptor(fds[1]));
}

} // namespace subrepl::core
