#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace subrepl::core {

// The configuration declares this kind of REPL unusable here. Raised before
// any process is spawned.
struct UnsupportedError {
  std::vector<std::string> reasons_;

  explicit UnsupportedError(std::vector<std::string> reasons);

  [[nodiscard]] std::string message() const;
};

// The requested virtual environment tag was not found on disk.
struct ResolutionError {
  std::string              tag_;
  std::vector<std::string> available_;
  std::string              detail_;

  ResolutionError(std::string tag, std::vector<std::string> available, std::string detail = "");

  [[nodiscard]] std::string message() const;
};

// An extension template could not be interpolated.
struct TemplateError {
  std::string key_;
  std::string message_;

  TemplateError(std::string key, std::string message);

  [[nodiscard]] std::string message() const;
};

struct SpawnError {
  std::string message_;
  int         error_code_;

  explicit SpawnError(std::string_view msg, int code = 0);

  [[nodiscard]] std::string message() const;
  [[nodiscard]] int         error_code() const noexcept;
};

using LaunchError = std::variant<UnsupportedError, ResolutionError, TemplateError, SpawnError>;

[[nodiscard]] auto describe(LaunchError const& error) -> std::string;

} // namespace subrepl::core
