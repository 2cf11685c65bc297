#pragma once

#include <string_view>

#include "subrepl/env/environment.hpp"

namespace subrepl::env {

// Parses the output of `env`. A line without '=' continues the value of the
// previous variable, joined with a newline.
auto parse_env_dump(std::string_view output) -> Environment;

} // namespace subrepl::env
