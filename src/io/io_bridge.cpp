#include "subrepl/io/io_bridge.hpp"

#include <cerrno>
#include <expected>
#include <string>
#include <string_view>

namespace subrepl::io {

IoBridge::IoBridge(ReadStrategy& strategy) noexcept
    : strategy_(&strategy) {}

auto IoBridge::read_bytes(core::NativeHandle output) -> core::syscall::Result<std::string> {
  if (eof_) {
    return std::string{};
  }
  auto result = strategy_->read(output);
  if (result && result->empty()) {
    eof_ = true;
  }
  return result;
}

auto IoBridge::write_bytes(core::NativeHandle input, std::string_view bytes) -> core::syscall::Result<void> {
  while (!bytes.empty()) {
    auto written = core::syscall::write_handle(input, bytes);
    if (!written) {
      if (written.error() == EINTR) {
        continue;
      }
      return std::unexpected(written.error());
    }
    bytes.remove_prefix(*written);
  }
  return {};
}

} // namespace subrepl::io
