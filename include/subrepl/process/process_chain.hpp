#pragma once

#include <variant>

#include "subrepl/core/file_descriptor.hpp"
#include "subrepl/core/syscall.hpp"
#include "subrepl/process/child_process.hpp"

namespace subrepl::process {

struct Direct {
  ChildProcess primary_;
};

// The filter reads the primary's output; its own output is what callers see.
struct Filtered {
  ChildProcess primary_;
  ChildProcess filter_;
};

using Stages = std::variant<Direct, Filtered>;

class ProcessChain {
  // Declared first so the pipe ends below are closed before the children are reaped
  Stages               stages_;
  core::FileDescriptor input_;
  core::FileDescriptor output_;

public:
  ProcessChain(Stages stages, core::FileDescriptor input, core::FileDescriptor output) noexcept;

  ProcessChain(ProcessChain const&)                = delete;
  ProcessChain& operator=(ProcessChain const&)     = delete;
  ProcessChain(ProcessChain&&) noexcept            = default;
  ProcessChain& operator=(ProcessChain&&) noexcept = default;
  ~ProcessChain()                                  = default;

  [[nodiscard]] auto primary() noexcept -> ChildProcess&;
  // nullptr when there is no filter stage
  [[nodiscard]] auto filter() noexcept -> ChildProcess*;
  [[nodiscard]] bool filtered() const noexcept;

  // The primary runs and, when present, so does the filter.
  [[nodiscard]] bool is_alive();

  // Kills the primary, then the filter. Reports the first failure after trying both.
  auto kill_all() -> core::syscall::Result<void>;
  auto signal_all(int sig) -> core::syscall::Result<void>;

  [[nodiscard]] auto input() const noexcept -> core::NativeHandle {
    return input_.get();
  }

  [[nodiscard]] auto output() const noexcept -> core::NativeHandle {
    return output_.get();
  }
};

} // namespace subrepl::process
