#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "subrepl/venv/discovery.hpp"
#include "test_utils.h"

namespace subrepl::venv::test {

using subrepl::test::ScopedEnvVar;
using subrepl::test::TempDir;

class DiscoveryTest : public ::testing::Test {
protected:
  TempDir tmp_;

  void make_env(std::string const& root, std::string const& tag, bool with_activate = true) {
    tmp_.make_dir(root + "/" + tag + "/bin");
    if (with_activate) {
      tmp_.write_file(root + "/" + tag + "/bin/activate", "# activate\n");
    }
  }

  auto root(std::string const& name) const -> std::string {
    return (tmp_.path() / name).string();
  }
};

TEST_F(DiscoveryTest, EveryBinDirectoryCounts) {
  make_env("envs", "py3");
  make_env("envs", "py2");
  make_env("envs", "bare", false);
  tmp_.make_dir("envs/no-bin");
  tmp_.write_file("envs/not-a-dir");

  std::vector<std::string> paths{root("envs")};
  auto                     found = discover(paths);

  EXPECT_EQ(tags(found), (std::vector<std::string>{"bare", "py2", "py3"}));
  EXPECT_EQ(found.at("py3").bin_dir_, root("envs") + "/py3/bin");
  EXPECT_EQ(found.at("py3").activate_script(), root("envs") + "/py3/bin/activate");
  EXPECT_FALSE(found.at("py3").wrapper_dir_.has_value());
}

TEST_F(DiscoveryTest, SkipsHiddenDirectories) {
  make_env("envs", "py3");
  make_env("envs", ".cache", false);
  make_env("envs", ".hidden");

  std::vector<std::string> paths{root("envs")};
  EXPECT_EQ(tags(discover(paths)), std::vector<std::string>{"py3"});
}

TEST_F(DiscoveryTest, DetectsWrapperDirectory) {
  make_env("envs", "py3");
  tmp_.make_dir("envs/py3/bin/wrappers/conda");

  std::vector<std::string> paths{root("envs")};
  auto                     found = discover(paths);

  ASSERT_TRUE(found.at("py3").wrapper_dir_.has_value());
  EXPECT_EQ(*found.at("py3").wrapper_dir_, root("envs") + "/py3/bin/wrappers/conda");
}

TEST_F(DiscoveryTest, LaterRootWinsOnTagCollision) {
  make_env("first", "py3");
  make_env("second", "py3");

  std::vector<std::string> paths{root("first"), root("second")};
  auto                     found = discover(paths);

  ASSERT_EQ(found.size(), 1U);
  EXPECT_EQ(found.at("py3").root_, root("second") + "/py3");
}

TEST_F(DiscoveryTest, EmptyOrMissingRoots) {
  EXPECT_TRUE(discover({}).empty());

  std::vector<std::string> paths{root("does-not-exist")};
  EXPECT_TRUE(discover(paths).empty());
}

TEST_F(DiscoveryTest, ExpandsTildeInRoots) {
  ScopedEnvVar home("HOME", tmp_.path().string());
  make_env("envs", "py3");

  std::vector<std::string> paths{"~/envs"};
  auto                     found = discover(paths);

  ASSERT_EQ(found.size(), 1U);
  EXPECT_EQ(found.at("py3").bin_dir_, root("envs") + "/py3/bin");
}

} // namespace subrepl::venv::test
