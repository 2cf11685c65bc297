#pragma once

#include <charconv>
#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>

#include "subrepl/core/result.hpp"

namespace subrepl::cli {

template<typename T>
concept ArgType = std::convertible_to<T, std::string> || requires(T t, char const* ptr, char const* end) {
  std::from_chars(ptr, end, t);
};

class Option;
class Arguments;

class ArgumentParser {
  std::string         name_;
  std::string         desc_;
  std::vector<Option> options_;

public:
  explicit ArgumentParser(std::string name = "", std::string desc = "") noexcept;

  // Everything after a bare "--" is positional, even if it looks like an option.
  auto parse(int argc, char const* const* argv) -> core::Result<Arguments>;
  auto add_argument(std::string name, std::string short_name = "") noexcept -> Option&;
  void print_help() const noexcept;

  static void print_version() noexcept;

private:
  [[nodiscard]] auto find_long(std::string_view name) const -> Option const*;
  [[nodiscard]] auto find_short(char name) const -> Option const*;
};

class Option {
  std::string                name_;
  std::string                short_name_;
  std::string                description_;
  std::optional<std::string> default_value_;
  std::optional<std::string> value_name_; // set for options that take a value

public:
  Option(std::string name, std::string short_name) noexcept;

  auto desc(std::string desc) noexcept -> Option&;
  auto default_value(std::string value) noexcept -> Option&;
  // The option consumes the next argument, even one starting with '-'
  auto takes_value(std::string value_name = "value") noexcept -> Option&;

  friend class ArgumentParser;
};

class Arguments {
  std::unordered_map<std::string, std::string> args_;

public:
  std::vector<std::string> positional_;

  Arguments() = default;

  [[nodiscard]] bool has(std::string const& name) const noexcept;

  template<ArgType T>
  [[nodiscard]] auto get(std::string const& name) const -> std::optional<T> {
    auto it = args_.find(name);
    if (it == args_.end()) {
      return std::nullopt;
    }

    std::string const& str = it->second;

    if constexpr (std::convertible_to<T, std::string>) {
      return str;
    } else {
      T value = 0;

      auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
      if (ec != std::errc{} || ptr != str.data() + str.size()) {
        return std::nullopt;
      }
      return value;
    }
  }

  friend class ArgumentParser;
};

} // namespace subrepl::cli
