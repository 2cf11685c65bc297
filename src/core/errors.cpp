#include "subrepl/core/errors.hpp"

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace subrepl::core {

UnsupportedError::UnsupportedError(std::vector<std::string> reasons)
    : reasons_(std::move(reasons)) {}

std::string UnsupportedError::message() const {
  return fmt::format("{}", fmt::join(reasons_, "\n"));
}

ResolutionError::ResolutionError(std::string tag, std::vector<std::string> available, std::string detail)
    : tag_(std::move(tag)), available_(std::move(available)), detail_(std::move(detail)) {}

std::string ResolutionError::message() const {
  auto msg = fmt::format("virtual environment '{}' not found", tag_);
  if (!detail_.empty()) {
    msg += fmt::format(" ({})", detail_);
  }
  if (available_.empty()) {
    return msg + "; no virtual environments discovered";
  }
  return fmt::format("{}; available: {}", msg, fmt::join(available_, ", "));
}

TemplateError::TemplateError(std::string key, std::string message)
    : key_(std::move(key)), message_(std::move(message)) {}

std::string TemplateError::message() const {
  return fmt::format("cannot interpolate '{}': {}", key_, message_);
}

SpawnError::SpawnError(std::string_view msg, int code)
    : message_(msg), error_code_(code) {}

std::string SpawnError::message() const {
  return message_;
}

int SpawnError::error_code() const noexcept {
  return error_code_;
}

auto describe(LaunchError const& error) -> std::string {
  return std::visit(
      [](auto const& e) -> std::string {
        using E = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<E, UnsupportedError>) {
          return fmt::format("unsupported:\n{}", e.message());
        } else if constexpr (std::is_same_v<E, ResolutionError>) {
          return fmt::format("resolution failed: {}", e.message());
        } else if constexpr (std::is_same_v<E, TemplateError>) {
          return fmt::format("bad environment template: {}", e.message());
        } else {
          return fmt::format("launch failed: {}", e.message());
        }
      },
      error
  );
}

} // namespace subrepl::core
