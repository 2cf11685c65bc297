#include "subrepl/core/string_utils.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace subrepl::core::util {

auto split(std::string_view sv, char delimiter) -> std::vector<std::string> {
  std::vector<std::string> parts;
  size_t                   start = 0;
  while (true) {
    size_t pos = sv.find(delimiter, start);
    if (pos == std::string_view::npos) {
      parts.emplace_back(sv.substr(start));
      break;
    }
    parts.emplace_back(sv.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

auto split_whitespace(std::string_view sv) -> std::vector<std::string> {
  std::vector<std::string> parts;
  std::string              current;
  for (char c : sv) {
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      if (!current.empty()) {
        parts.push_back(std::move(current));
        current.clear();
      }
      continue;
    }
    current.push_back(c);
  }
  if (!current.empty()) {
    parts.push_back(std::move(current));
  }
  return parts;
}

auto shell_quote(std::string_view text) -> std::string {
  std::string quoted;
  quoted.reserve(text.size() + 2);
  quoted.push_back('\'');
  for (char c : text) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

} // namespace subrepl::core::util
