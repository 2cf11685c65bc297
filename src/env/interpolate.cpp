#include "subrepl/env/interpolate.hpp"

#include <expected>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include "subrepl/core/log.hpp"

namespace subrepl::env {

auto format_template(std::string_view tmpl, Environment const& env) -> core::Result<std::string> {
  std::string out;
  out.reserve(tmpl.size());

  for (size_t i = 0; i < tmpl.size(); ++i) {
    char c = tmpl[i];

    if (c == '{') {
      if (i + 1 < tmpl.size() && tmpl[i + 1] == '{') {
        out.push_back('{');
        ++i;
        continue;
      }

      size_t close = tmpl.find('}', i + 1);
      if (close == std::string_view::npos) {
        return std::unexpected(fmt::format("unterminated '{{' at offset {}", i));
      }

      std::string_view field = tmpl.substr(i + 1, close - i - 1);
      std::string_view name  = field.substr(0, field.find_first_of("!:"));
      if (name.empty()) {
        return std::unexpected(fmt::format("empty field name at offset {}", i));
      }
      if (name.find('{') != std::string_view::npos) {
        return std::unexpected(fmt::format("unexpected '{{' in field name '{}'", name));
      }

      auto it = env.find(std::string(name));
      if (it == env.end()) {
        return std::unexpected(fmt::format("unknown variable '{}'", name));
      }
      if (field.size() > name.size()) {
        core::log::debug("ignoring '{}' in field '{{{}}}', value inserted as is", field.substr(name.size()), field);
      }
      out += it->second;
      i = close;
      continue;
    }

    if (c == '}') {
      if (i + 1 < tmpl.size() && tmpl[i + 1] == '}') {
        out.push_back('}');
        ++i;
        continue;
      }
      return std::unexpected(fmt::format("single '}}' at offset {}", i));
    }

    out.push_back(c);
  }

  return out;
}

auto interpolate(Environment const& env, Environment const& templates) -> core::Result<Environment, core::TemplateError> {
  Environment result;
  result.reserve(templates.size());
  for (auto const& [key, tmpl] : templates) {
    auto value = format_template(tmpl, env);
    if (!value) {
      return std::unexpected(core::TemplateError{key, value.error()});
    }
    result.emplace(key, std::move(*value));
  }
  return result;
}

auto interpolate_lenient(Environment const& env, Environment const& templates) -> Environment {
  Environment result;
  result.reserve(templates.size());
  for (auto const& [key, tmpl] : templates) {
    if (auto value = format_template(tmpl, env)) {
      result.emplace(key, std::move(*value));
    } else {
      core::log::debug("keeping {} verbatim: {}", key, value.error());
      result.emplace(key, tmpl);
    }
  }
  return result;
}

} // namespace subrepl::env
