#pragma once

#include <string>
#include <string_view>

#include "subrepl/core/file_descriptor.hpp"
#include "subrepl/core/syscall.hpp"
#include "subrepl/io/read_strategy.hpp"

namespace subrepl::io {

class IoBridge {
  ReadStrategy* strategy_;
  bool          eof_ = false;

public:
  explicit IoBridge(ReadStrategy& strategy) noexcept;

  // Blocks until at least one byte arrives. Returns an empty string once the
  // stream has closed; later calls keep returning empty without touching the
  // handle.
  auto read_bytes(core::NativeHandle output) -> core::syscall::Result<std::string>;

  // Writes everything, retrying short writes. Nothing is buffered on our side,
  // so the child sees the bytes as soon as this returns.
  static auto write_bytes(core::NativeHandle input, std::string_view bytes) -> core::syscall::Result<void>;

  [[nodiscard]] bool at_eof() const noexcept {
    return eof_;
  }

  [[nodiscard]] auto strategy() const noexcept -> ReadStrategy const& {
    return *strategy_;
  }
};

} // namespace subrepl::io
