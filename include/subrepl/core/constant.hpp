#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace subrepl::core::constant {

inline constexpr std::string_view EXE_NAME = "subrepl";
inline constexpr std::string_view EXE_DESC = "Interactive subprocess REPL runner";
inline constexpr std::string_view VERSION  = "v0.1.0";

// Variables injected into every child so it can reach the autocomplete service
inline constexpr std::string_view AC_PORT_VAR    = "SUBLIMEREPL_AC_PORT";
inline constexpr std::string_view AC_IP_VAR      = "SUBLIMEREPL_AC_IP";
inline constexpr std::string_view AC_PORT_ABSENT = "None";
inline constexpr std::string_view AC_DEFAULT_IP  = "127.0.0.1";

inline constexpr std::string_view HOME            = "HOME";
inline constexpr std::string_view PATH            = "PATH";
inline constexpr std::string_view PATHEXT         = "PATHEXT";
inline constexpr std::string_view DEFAULT_PATHEXT = ".EXE";

// First argument of a command that the configuration declares unusable
inline constexpr std::string_view UNSUPPORTED_MARKER = "[unsupported]";

inline constexpr std::string_view PY_VERSION_VAR           = "PY_VERSION";
inline constexpr std::string_view DEFAULT_PY_VERSION       = "py3";
inline constexpr std::string_view PYTHONIOENCODING_VAR     = "PYTHONIOENCODING";
inline constexpr std::string_view DEFAULT_PYTHONIOENCODING = "utf-8";

inline constexpr std::string_view                ACTIVATE_SCRIPT     = "activate";
inline constexpr std::string_view                WRAPPERS_SUBDIR     = "wrappers/conda";
inline constexpr std::array<std::string_view, 2> ROOT_TAGS           = {"root", "base"};
inline constexpr int                             DEFAULT_CONDA_MINOR = 3;

#ifdef _WIN32
inline constexpr std::string_view VENV_BIN_DIR        = "Scripts";
inline constexpr char             PATH_LIST_SEPARATOR = ';';
#else
inline constexpr std::string_view VENV_BIN_DIR        = "bin";
inline constexpr char             PATH_LIST_SEPARATOR = ':';
#endif

inline constexpr std::size_t DEFAULT_PIPE_BUFFER_SIZE = 8192;
inline constexpr int         SIGNAL_EXIT_CODE_OFFSET  = 128;

} // namespace subrepl::core::constant
