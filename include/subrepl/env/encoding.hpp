#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "subrepl/env/environment.hpp"

namespace subrepl::env {

enum class Encoding {
  Utf8,
  Ascii,
  Latin1,
};

auto parse_encoding(std::string_view name) -> std::optional<Encoding>;
auto encoding_name(Encoding encoding) noexcept -> std::string_view;

// Converts UTF-8 text to the target encoding; nullopt when it cannot be represented.
auto encode(std::string_view text, Encoding encoding) -> std::optional<std::string>;

// Encodes every pair, silently dropping those that cannot be encoded or that
// cannot appear in a process environment block at all.
auto encode_environment(Environment const& env, Encoding encoding) -> Environment;

} // namespace subrepl::env
