#include "subrepl/core/signal.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <expected>
#include <map>
#include <mutex>
#include <string>

#include "subrepl/core/log.hpp"

namespace subrepl::core::signal {

auto signal_table() -> std::map<std::string, int> {
  // clang-format off
  return {
    {"SIGABRT", SIGABRT},
    {"SIGFPE", SIGFPE},
    {"SIGILL", SIGILL},
    {"SIGINT", SIGINT},
    {"SIGSEGV", SIGSEGV},
    {"SIGTERM", SIGTERM},
#ifdef _WIN32
    {"SIGBREAK", SIGBREAK},
#else
    {"SIGALRM", SIGALRM},
    {"SIGBUS", SIGBUS},
    {"SIGCHLD", SIGCHLD},
    {"SIGCONT", SIGCONT},
    {"SIGHUP", SIGHUP},
    {"SIGKILL", SIGKILL},
    {"SIGPIPE", SIGPIPE},
    {"SIGPROF", SIGPROF},
    {"SIGQUIT", SIGQUIT},
    {"SIGSTOP", SIGSTOP},
    {"SIGSYS", SIGSYS},
    {"SIGTRAP", SIGTRAP},
    {"SIGTSTP", SIGTSTP},
    {"SIGTTIN", SIGTTIN},
    {"SIGTTOU", SIGTTOU},
    {"SIGURG", SIGURG},
    {"SIGUSR1", SIGUSR1},
    {"SIGUSR2", SIGUSR2},
    {"SIGVTALRM", SIGVTALRM},
    {"SIGWINCH", SIGWINCH},
    {"SIGXCPU", SIGXCPU},
    {"SIGXFSZ", SIGXFSZ},
#endif
  };
  // clang-format on
}

auto ignore_signal(int sig) -> syscall::Result<void> {
#ifdef _WIN32
  if (std::signal(sig, SIG_IGN) == SIG_ERR) {
    return std::unexpected(errno);
  }
#else
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = SIG_IGN;
  sigemptyset(&sa.sa_mask);

  if (sigaction(sig, &sa, nullptr) == -1) {
    return std::unexpected(errno);
  }
#endif
  return {};
}

void ignore_broken_pipe() noexcept {
#ifndef _WIN32
  static std::once_flag once;
  std::call_once(once, [] {
    if (auto result = ignore_signal(SIGPIPE); !result) {
      log::warn("cannot ignore SIGPIPE: {}", syscall::error_string(result.error()));
    }
  });
#endif
}

} // namespace subrepl::core::signal
