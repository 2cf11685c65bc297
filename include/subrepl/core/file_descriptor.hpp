#pragma once

#include <string>
#include <utility>

#include "subrepl/core/result.hpp"

namespace subrepl::core {

#ifdef _WIN32
using NativeHandle = void*;
inline constexpr NativeHandle INVALID_HANDLE = nullptr;
#else
using NativeHandle = int;
inline constexpr NativeHandle INVALID_HANDLE = -1;
#endif

// Owns a pipe end or, on Windows, any kernel handle.
class FileDescriptor {
  NativeHandle fd_;
  bool         owning_;

public:
  explicit FileDescriptor(NativeHandle fd = INVALID_HANDLE, bool owning = true) noexcept;
  ~FileDescriptor() noexcept;

  FileDescriptor(FileDescriptor const&)            = delete;
  FileDescriptor& operator=(FileDescriptor const&) = delete;

  FileDescriptor(FileDescriptor&& other) noexcept;
  FileDescriptor& operator=(FileDescriptor&& other) noexcept;

  [[nodiscard]] auto get() const noexcept -> NativeHandle;
  auto               release() noexcept -> NativeHandle;
  void               reset(NativeHandle fd = INVALID_HANDLE, bool owning = true) noexcept;
  [[nodiscard]] auto valid() const noexcept -> bool;

  constexpr explicit operator bool() const noexcept {
    return fd_ != INVALID_HANDLE;
  }
};

// Returns {read end, write end}. Neither end is inherited by spawned children
// until the spawner explicitly hands it over.
auto make_pipe() -> Result<std::pair<FileDescriptor, FileDescriptor>>;

} // namespace subrepl::core
