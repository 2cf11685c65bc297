#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace subrepl::repl {

struct CompletionRequest {
  std::string         whole_line_;
  size_t              pos_in_line_ = 0;
  std::string         prefix_;
  std::string         whole_prefix_;
  std::vector<size_t> locations_;
};

// The completion server a REPL connects back to through SUBLIMEREPL_AC_IP and
// SUBLIMEREPL_AC_PORT. Implemented outside this library.
class AutocompleteService {
public:
  virtual ~AutocompleteService() = default;

  virtual void start() = 0;

  // nullopt until the service is listening
  [[nodiscard]] virtual auto port() const -> std::optional<int> = 0;
  [[nodiscard]] virtual bool connected() const = 0;

  virtual auto complete(CompletionRequest const& request) -> std::vector<std::string> = 0;
};

// Receives the configured server address
using AutocompleteFactory = std::function<std::unique_ptr<AutocompleteService>(std::string const& ip)>;

} // namespace subrepl::repl
