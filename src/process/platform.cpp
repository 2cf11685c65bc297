#include "subrepl/process/platform.hpp"

#include <memory>

namespace subrepl::process {

auto FlaggedStartup::flags() const -> StartupFlags {
  return StartupFlags{
      .startup_flags_  = StartupFlags::USE_SHOW_WINDOW,
      .show_window_    = StartupFlags::SHOW_NORMAL,
      .creation_flags_ = StartupFlags::NO_WINDOW,
  };
}

auto PlainStartup::flags() const -> StartupFlags {
  return StartupFlags{};
}

auto Platform::probe() -> Platform {
  Platform platform;
#ifdef _WIN32
  // Anonymous pipes on Windows cannot be polled for readiness
  platform.read_strategy_            = std::make_unique<io::BytePollReadStrategy>();
  platform.startup_                  = std::make_unique<FlaggedStartup>();
  platform.manual_executable_lookup_ = true;
#else
  platform.read_strategy_            = std::make_unique<io::SelectReadStrategy>();
  platform.startup_                  = std::make_unique<PlainStartup>();
  platform.manual_executable_lookup_ = false;
#endif
  return platform;
}

} // namespace subrepl::process
