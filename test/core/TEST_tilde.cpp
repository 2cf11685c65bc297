#include <cstdlib>
#include <string>

#include <gtest/gtest.h>
#include <pwd.h>
#include <unistd.h>

#include "subrepl/core/tilde.hpp"
#include "test_utils.h"

namespace subrepl::core::tilde::test {

class TildeExpansionTest : public ::testing::Test {
protected:
  subrepl::test::ScopedEnvVar home_{"HOME", "/home/tester"};

  static auto get_current_username() -> std::string {
    if (struct passwd* pw = getpwuid(getuid()); pw != nullptr && pw->pw_name != nullptr) {
      return std::string(pw->pw_name);
    }
    return "";
  }
};

TEST_F(TildeExpansionTest, SimpleTilde) {
  EXPECT_EQ(expand_tilde("~"), "/home/tester");
}

TEST_F(TildeExpansionTest, TildeWithPath) {
  EXPECT_EQ(expand_tilde("~/envs"), "/home/tester/envs");
  EXPECT_EQ(expand_tilde("~/anaconda3/envs/py3"), "/home/tester/anaconda3/envs/py3");
}

TEST_F(TildeExpansionTest, NamedUser) {
  auto username = get_current_username();
  if (username.empty()) {
    GTEST_SKIP() << "no passwd entry for the current user";
  }
  struct passwd* pw = getpwnam(username.c_str());
  ASSERT_NE(pw, nullptr);
  EXPECT_EQ(expand_tilde("~" + username + "/envs"), std::string(pw->pw_dir) + "/envs");
}

TEST_F(TildeExpansionTest, UnknownUserIsUnchanged) {
  EXPECT_EQ(expand_tilde("~no_such_user_subrepl/envs"), "~no_such_user_subrepl/envs");
}

TEST_F(TildeExpansionTest, NoTilde) {
  EXPECT_FALSE(has_tilde_expansion("/opt/envs"));
  EXPECT_FALSE(has_tilde_expansion("envs/~"));
  EXPECT_EQ(expand_tilde("/opt/envs"), "/opt/envs");
  EXPECT_EQ(expand_tilde(""), "");
}

} // namespace subrepl::core::tilde::test
