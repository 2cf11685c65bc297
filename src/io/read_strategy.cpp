#include "subrepl/io/read_strategy.hpp"

#include <cerrno>
#include <expected>
#include <string>

namespace subrepl::io {

#ifndef _WIN32

SelectReadStrategy::SelectReadStrategy(size_t chunk_size) noexcept
    : chunk_size_(chunk_size) {}

auto SelectReadStrategy::read(core::NativeHandle handle) -> core::syscall::Result<std::string> {
  std::string buffer(chunk_size_, '\0');
  while (true) {
    auto ready = core::syscall::wait_readable(handle);
    if (!ready) {
      if (ready.error() == EINTR) {
        continue;
      }
      return std::unexpected(ready.error());
    }

    auto n = core::syscall::read_handle(handle, buffer.data(), buffer.size());
    if (!n) {
      // Readiness can be spurious on a nonblocking descriptor
      if (n.error() == EINTR || n.error() == EAGAIN || n.error() == EWOULDBLOCK) {
        continue;
      }
      return std::unexpected(n.error());
    }
    buffer.resize(*n);
    return buffer;
  }
}

#endif

auto BytePollReadStrategy::read(core::NativeHandle handle) -> core::syscall::Result<std::string> {
  char byte = 0;
  while (true) {
    auto n = core::syscall::read_handle(handle, &byte, 1);
    if (!n) {
#ifndef _WIN32
      if (n.error() == EINTR) {
        continue;
      }
      if (n.error() == EAGAIN || n.error() == EWOULDBLOCK) {
        if (auto ready = core::syscall::wait_readable(handle); !ready && ready.error() != EINTR) {
          return std::unexpected(ready.error());
        }
        continue;
      }
#endif
      return std::unexpected(n.error());
    }
    if (*n == 0) {
      return std::string{};
    }
    if (byte == '\r') {
      continue;
    }
    return std::string(1, byte);
  }
}

} // namespace subrepl::io
