#pragma once

#include <string>
#include <vector>

#include "subrepl/core/constant.hpp"
#include "subrepl/env/environment.hpp"

namespace subrepl::config {

struct Settings {
  std::string autocomplete_server_ip_ = std::string(core::constant::AC_DEFAULT_IP);

  // Command printing a KEY=VALUE dump of a login shell environment. Empty
  // means the inherited environment is used as is.
  std::vector<std::string> getenv_command_;

  // Templates applied to every launched environment before the caller's own
  env::Environment default_extend_env_;

  std::vector<std::string> python_virtualenv_paths_;
  bool                     use_wrapped_  = false;
  bool                     force_source_ = false;
  int                      conda_minor_  = core::constant::DEFAULT_CONDA_MINOR;

  std::vector<std::string> filter_command_ = {"cat"};

  bool debug_ = false;

  // The login shell query used when no explicit getenv command is configured
  static auto default_getenv_command() -> std::vector<std::string>;
};

} // namespace subrepl::config
