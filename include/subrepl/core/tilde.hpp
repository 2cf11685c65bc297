#pragma once

#include <string>
#include <string_view>

namespace subrepl::core::tilde {

auto has_tilde_expansion(std::string_view word) noexcept -> bool;

// Expands a leading "~" or "~user" the way a shell does. Words that cannot be
// expanded are returned unchanged.
auto expand_tilde(std::string_view word) -> std::string;

} // namespace subrepl::core::tilde
