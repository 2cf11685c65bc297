#include <cerrno>
#include <csignal>

#include <gtest/gtest.h>

#include "subrepl/core/file_descriptor.hpp"
#include "subrepl/core/signal.hpp"
#include "subrepl/core/syscall.hpp"

namespace subrepl::core::signal::test {

TEST(SignalTableTest, ContainsCommonSignals) {
  auto table = signal_table();
  EXPECT_EQ(table.at("SIGINT"), SIGINT);
  EXPECT_EQ(table.at("SIGTERM"), SIGTERM);
  EXPECT_EQ(table.at("SIGKILL"), SIGKILL);
  EXPECT_EQ(table.at("SIGHUP"), SIGHUP);
  EXPECT_EQ(table.at("SIGUSR1"), SIGUSR1);
  EXPECT_EQ(table.at("SIGWINCH"), SIGWINCH);
  for (auto const& [name, number] : table) {
    EXPECT_TRUE(name.starts_with("SIG")) << name;
    EXPECT_GT(number, 0) << name;
  }
}

TEST(SignalTableTest, BrokenPipeBecomesEpipe) {
  ignore_broken_pipe();
  ignore_broken_pipe();

  auto pipe = make_pipe();
  ASSERT_TRUE(pipe.has_value());
  auto [read_end, write_end] = std::move(*pipe);
  read_end.reset();

  auto written = syscall::write_handle(write_end.get(), "data");
  ASSERT_FALSE(written.has_value());
  EXPECT_EQ(written.error(), EPIPE);
}

} // namespace subrepl::core::signal::test
