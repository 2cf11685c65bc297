#include "subrepl/core/tilde.hpp"

#include <cstdlib>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include "subrepl/core/syscall.hpp"

namespace subrepl::core::tilde {

namespace {

auto get_user_home(std::string const& username) -> std::string {
  if (username.empty()) {
#ifdef _WIN32
    if (char const* profile = std::getenv("USERPROFILE"); profile != nullptr && *profile != '\0') {
      return profile;
    }
#endif
    if (char const* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
      return home;
    }
#ifndef _WIN32
    if (auto user_info_result = syscall::get_user_info(syscall::get_uid());
        user_info_result && !user_info_result->home_.empty()) {
      return user_info_result->home_;
    }
#endif
    return "";
  }

#ifndef _WIN32
  if (auto user_info_result = syscall::get_user_info(username);
      user_info_result && !user_info_result->home_.empty()) {
    return user_info_result->home_;
  }
#endif

  return "";
}

constexpr auto is_username_char(char c) noexcept -> bool {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-' ||
         c == '.';
}

constexpr auto is_separator(char c) noexcept -> bool {
#ifdef _WIN32
  return c == '/' || c == '\\';
#else
  return c == '/';
#endif
}

} // anonymous namespace

auto has_tilde_expansion(std::string_view word) noexcept -> bool {
  if (word.empty() || word[0] != '~') {
    return false;
  }

  size_t username_end = 1;
  while (username_end < word.size() && !is_separator(word[username_end])) {
    if (!is_username_char(word[username_end])) {
      return false;
    }
    ++username_end;
  }

  return true;
}

auto expand_tilde(std::string_view word) -> std::string {
  if (!has_tilde_expansion(word)) {
    return std::string(word);
  }

  size_t slash_pos = 1;
  while (slash_pos < word.size() && !is_separator(word[slash_pos])) {
    ++slash_pos;
  }

  std::string      username(word.substr(1, slash_pos - 1));
  std::string_view path_part = word.substr(slash_pos);

  std::string home_dir = get_user_home(username);
  if (home_dir.empty()) {
    return std::string(word);
  }

  return fmt::format("{}{}", home_dir, path_part);
}

} // namespace subrepl::core::tilde
