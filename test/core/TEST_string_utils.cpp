#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "subrepl/core/string_utils.hpp"

namespace subrepl::core::util::test {

TEST(StringUtilsTest, SplitKeepsEmptyFields) {
  EXPECT_EQ(split("a::b:", ':'), (std::vector<std::string>{"a", "", "b", ""}));
  EXPECT_EQ(split("", ':'), (std::vector<std::string>{""}));
  EXPECT_EQ(split("single", ':'), (std::vector<std::string>{"single"}));
}

TEST(StringUtilsTest, SplitWhitespaceDropsEmptyFields) {
  EXPECT_EQ(split_whitespace("  /bin/bash\t--login  -c env \n"), (std::vector<std::string>{"/bin/bash", "--login", "-c", "env"}));
  EXPECT_TRUE(split_whitespace("   ").empty());
}

TEST(StringUtilsTest, ShellQuote) {
  EXPECT_EQ(shell_quote("plain"), "'plain'");
  EXPECT_EQ(shell_quote("with space"), "'with space'");
  EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
  EXPECT_EQ(shell_quote(""), "''");
}

} // namespace subrepl::core::util::test
