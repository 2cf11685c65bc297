#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "subrepl/core/constant.hpp"
#include "subrepl/core/file_descriptor.hpp"
#include "subrepl/core/syscall.hpp"

namespace subrepl::io {

// How bytes are pulled out of the child's visible output stream. An empty
// string means the stream is closed.
class ReadStrategy {
public:
  virtual ~ReadStrategy() = default;

  virtual auto read(core::NativeHandle handle) -> core::syscall::Result<std::string> = 0;

  [[nodiscard]] virtual auto name() const noexcept -> std::string_view = 0;
};

#ifndef _WIN32

// Waits for readiness, then takes whatever is there, up to one chunk.
class SelectReadStrategy final : public ReadStrategy {
  size_t chunk_size_;

public:
  explicit SelectReadStrategy(size_t chunk_size = core::constant::DEFAULT_PIPE_BUFFER_SIZE) noexcept;

  auto read(core::NativeHandle handle) -> core::syscall::Result<std::string> override;

  [[nodiscard]] auto name() const noexcept -> std::string_view override {
    return "select";
  }
};

#endif

// For pipes that cannot report how much is pending: one byte per call.
// Carriage returns are dropped so CRLF reaches the caller as LF.
class BytePollReadStrategy final : public ReadStrategy {
public:
  auto read(core::NativeHandle handle) -> core::syscall::Result<std::string> override;

  [[nodiscard]] auto name() const noexcept -> std::string_view override {
    return "byte-poll";
  }
};

} // namespace subrepl::io
