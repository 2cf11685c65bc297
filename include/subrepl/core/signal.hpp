#pragma once

#include <map>
#include <string>

#include "subrepl/core/syscall.hpp"

namespace subrepl::core::signal {

// Signal names mapped to their numeric values on this platform.
auto signal_table() -> std::map<std::string, int>;

auto ignore_signal(int sig) -> syscall::Result<void>;

// Writing to the stdin of a child that already exited must come back as EPIPE
// instead of terminating the host. Safe to call any number of times.
void ignore_broken_pipe() noexcept;

} // namespace subrepl::core::signal
