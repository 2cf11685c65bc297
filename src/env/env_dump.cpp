#include "subrepl/env/env_dump.hpp"

#include <optional>
#include <string>
#include <string_view>

#include "subrepl/core/log.hpp"

namespace subrepl::env {

auto parse_env_dump(std::string_view output) -> Environment {
  Environment                result;
  std::optional<std::string> previous_key;

  size_t start = 0;
  while (start < output.size()) {
    size_t end = output.find('\n', start);
    if (end == std::string_view::npos) {
      end = output.size();
    }
    std::string_view line = output.substr(start, end - start);
    start                 = end + 1;

    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }

    size_t eq_pos = line.find('=');
    if (eq_pos == std::string_view::npos) {
      // Continuation of a value that contained a newline
      if (!previous_key) {
        core::log::debug("ignoring leading env dump line without '=': '{}'", line);
        continue;
      }
      auto& value = result[*previous_key];
      value.push_back('\n');
      value.append(line);
      continue;
    }

    std::string key(line.substr(0, eq_pos));
    result.insert_or_assign(key, std::string(line.substr(eq_pos + 1)));
    previous_key = std::move(key);
  }

  return result;
}

} // namespace subrepl::env
