#pragma once

#include <cstdio>
#include <utility>

#include <fmt/core.h>

#include "subrepl/core/constant.hpp"

namespace subrepl::core::log {

void               set_debug(bool enabled) noexcept;
[[nodiscard]] bool debug_enabled() noexcept;

template<typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
  if (!debug_enabled()) {
    return;
  }
  fmt::print(stderr, "{}: {}\n", constant::EXE_NAME, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args) {
  fmt::print(stderr, "{}: warning: {}\n", constant::EXE_NAME, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) {
  fmt::print(stderr, "{}: error: {}\n", constant::EXE_NAME, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace subrepl::core::log
