#include "subrepl/config/settings.hpp"

#include <string>
#include <vector>

namespace subrepl::config {

auto Settings::default_getenv_command() -> std::vector<std::string> {
#ifdef _WIN32
  return {};
#else
  return {"/bin/bash", "--login", "-c", "env"};
#endif
}

} // namespace subrepl::config
