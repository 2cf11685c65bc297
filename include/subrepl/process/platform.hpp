#pragma once

#include <memory>

#include "subrepl/io/read_strategy.hpp"

namespace subrepl::process {

// Window and console flags handed to the OS at spawn time. The values match
// the Win32 constants; POSIX spawning requires them all to be zero.
struct StartupFlags {
  static constexpr unsigned long  USE_SHOW_WINDOW = 0x00000001; // STARTF_USESHOWWINDOW
  static constexpr unsigned short SHOW_NORMAL     = 1;          // SW_SHOWNORMAL
  static constexpr unsigned long  NO_WINDOW       = 0x08000000; // CREATE_NO_WINDOW

  unsigned long  startup_flags_  = 0;
  unsigned short show_window_    = 0;
  unsigned long  creation_flags_ = 0;

  [[nodiscard]] bool empty() const noexcept {
    return startup_flags_ == 0 && show_window_ == 0 && creation_flags_ == 0;
  }
};

class StartupPolicy {
public:
  virtual ~StartupPolicy() = default;

  [[nodiscard]] virtual auto flags() const -> StartupFlags = 0;
};

// Shows the child's window normally and keeps it from opening a new console.
class FlaggedStartup final : public StartupPolicy {
public:
  [[nodiscard]] auto flags() const -> StartupFlags override;
};

class PlainStartup final : public StartupPolicy {
public:
  [[nodiscard]] auto flags() const -> StartupFlags override;
};

struct Platform {
  std::unique_ptr<io::ReadStrategy> read_strategy_;
  std::unique_ptr<StartupPolicy>    startup_;
  // The OS will not search PATH for us; the launcher resolves cmd[0] itself
  bool manual_executable_lookup_ = false;

  // Picks the implementations matching the platform we are running on.
  static auto probe() -> Platform;
};

} // namespace subrepl::process
