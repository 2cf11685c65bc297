#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace subrepl::core::util {

// Splits on every delimiter, keeping empty fields.
auto split(std::string_view sv, char delimiter) -> std::vector<std::string>;

// Splits on runs of whitespace, dropping empty fields.
auto split_whitespace(std::string_view sv) -> std::vector<std::string>;

// Wraps text in single quotes for a POSIX shell command line.
auto shell_quote(std::string_view text) -> std::string;

} // namespace subrepl::core::util
