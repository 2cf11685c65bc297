#include <gtest/gtest.h>

#include "subrepl/env/env_dump.hpp"

namespace subrepl::env::test {

TEST(EnvDumpTest, FoldsContinuationLines) {
  auto env = parse_env_dump("FOO=bar\nbaz\nQUX=1");

  EXPECT_EQ(env.size(), 2U);
  EXPECT_EQ(env.at("FOO"), "bar\nbaz");
  EXPECT_EQ(env.at("QUX"), "1");
}

TEST(EnvDumpTest, SplitsOnFirstEquals) {
  auto env = parse_env_dump("OPTS=a=b=c\nEMPTY=\n");

  EXPECT_EQ(env.at("OPTS"), "a=b=c");
  EXPECT_EQ(env.at("EMPTY"), "");
}

TEST(EnvDumpTest, StripsCarriageReturns) {
  auto env = parse_env_dump("A=1\r\nB=2\r\n");

  EXPECT_EQ(env.at("A"), "1");
  EXPECT_EQ(env.at("B"), "2");
}

TEST(EnvDumpTest, IgnoresLeadingOrphanLine) {
  auto env = parse_env_dump("motd banner\nA=1");

  EXPECT_EQ(env.size(), 1U);
  EXPECT_EQ(env.at("A"), "1");
}

TEST(EnvDumpTest, LaterDuplicateWins) {
  auto env = parse_env_dump("A=1\nA=2");
  EXPECT_EQ(env.at("A"), "2");
}

TEST(EnvDumpTest, EmptyOutput) {
  EXPECT_TRUE(parse_env_dump("").empty());
}

} // namespace subrepl::env::test
