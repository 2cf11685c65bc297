#include "subrepl/process/process_chain.hpp"

#include <expected>
#include <type_traits>
#include <utility>
#include <variant>

namespace subrepl::process {

ProcessChain::ProcessChain(Stages stages, core::FileDescriptor input, core::FileDescriptor output) noexcept
    : stages_(std::move(stages)), input_(std::move(input)), output_(std::move(output)) {}

auto ProcessChain::primary() noexcept -> ChildProcess& {
  return std::visit([](auto& stage) -> ChildProcess& { return stage.primary_; }, stages_);
}

auto ProcessChain::filter() noexcept -> ChildProcess* {
  if (auto* filtered = std::get_if<Filtered>(&stages_)) {
    return &filtered->filter_;
  }
  return nullptr;
}

bool ProcessChain::filtered() const noexcept {
  return std::holds_alternative<Filtered>(stages_);
}

bool ProcessChain::is_alive() {
  return std::visit(
      [](auto& stage) -> bool {
        using T = std::decay_t<decltype(stage)>;
        if constexpr (std::is_same_v<T, Filtered>) {
          // Poll both so an exited filter is reaped even when the primary is gone
          bool primary_running = stage.primary_.is_running();
          bool filter_running  = stage.filter_.is_running();
          return primary_running && filter_running;
        } else {
          return stage.primary_.is_running();
        }
      },
      stages_
  );
}

auto ProcessChain::kill_all() -> core::syscall::Result<void> {
  auto primary_result = primary().kill();
  if (auto* f = filter()) {
    auto filter_result = f->kill();
    if (primary_result && !filter_result) {
      return filter_result;
    }
  }
  return primary_result;
}

auto ProcessChain::signal_all(int sig) -> core::syscall::Result<void> {
  auto primary_result = primary().send_signal(sig);
  if (auto* f = filter()) {
    auto filter_result = f->send_signal(sig);
    if (primary_result && !filter_result) {
      return filter_result;
    }
  }
  return primary_result;
}

} // namespace subrepl::process
