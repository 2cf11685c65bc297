#pragma once

#include <span>
#include <string>

#include "subrepl/core/result.hpp"
#include "subrepl/env/environment.hpp"

namespace subrepl::process {

struct CaptureResult {
  std::string output_;
  int         exit_code_ = 0;
};

// Runs a short-lived helper command to completion and collects its stdout.
class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  // A null env runs the command in the inherited environment.
  virtual auto capture(std::span<std::string const> argv, env::Environment const* env) -> core::Result<CaptureResult> = 0;
};

class SystemCommandRunner final : public CommandRunner {
public:
  auto capture(std::span<std::string const> argv, env::Environment const* env) -> core::Result<CaptureResult> override;
};

} // namespace subrepl::process
