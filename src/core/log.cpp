#include "subrepl/core/log.hpp"

#include <atomic>

namespace subrepl::core::log {

namespace {

std::atomic<bool> debug_flag{false};

} // namespace

void set_debug(bool enabled) noexcept {
  debug_flag.store(enabled);
}

bool debug_enabled() noexcept {
  return debug_flag.load();
}

} // namespace subrepl::core::log
