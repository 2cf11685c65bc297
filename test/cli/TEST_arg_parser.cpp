#include <array>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "subrepl/cli/arg_parser.hpp"

namespace subrepl::cli::test {

class ArgumentParserTest : public ::testing::Test {
protected:
  void SetUp() override {
    parser_ = std::make_unique<ArgumentParser>("subrepl", "Test parser");
  }

  void TearDown() override {
    parser_.reset();
  }

  std::unique_ptr<ArgumentParser> parser_;
};

TEST_F(ArgumentParserTest, FlagOption) {
  parser_->add_argument("filter", "f").desc("Filter warnings");
  parser_->add_argument("debug", "d").desc("Debug logging");

  auto argv   = std::array<char const*, 3>{"subrepl", "--filter", "--debug"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->has("filter"));
  EXPECT_TRUE(result->has("debug"));
  EXPECT_EQ(result->get<std::string>("filter"), "true");
  EXPECT_FALSE(result->has("help"));
}

TEST_F(ArgumentParserTest, CombinedShortOptions) {
  parser_->add_argument("filter", "f").desc("Filter warnings");
  parser_->add_argument("debug", "d").desc("Debug logging");
  parser_->add_argument("help", "h").desc("Show help");

  auto argv   = std::array<char const*, 2>{"subrepl", "-fdh"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->has("filter"));
  EXPECT_TRUE(result->has("debug"));
  EXPECT_TRUE(result->has("help"));
}

TEST_F(ArgumentParserTest, ShortValueOptionEndsGroup) {
  parser_->add_argument("debug", "d").desc("Debug logging");
  parser_->add_argument("cwd", "C").takes_value("dir").desc("Working directory");

  auto argv   = std::array<char const*, 3>{"subrepl", "-dC", "/tmp"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->has("debug"));
  EXPECT_EQ(result->get<std::string>("cwd"), "/tmp");
}

TEST_F(ArgumentParserTest, ShortValueMayBeAttached) {
  parser_->add_argument("debug", "d");
  parser_->add_argument("cwd", "C").takes_value("dir");

  auto argv   = std::array<char const*, 2>{"subrepl", "-C/srv/dd"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->get<std::string>("cwd"), "/srv/dd");
  EXPECT_FALSE(result->has("debug"));
}

TEST_F(ArgumentParserTest, ValuesMayStartWithDash) {
  parser_->add_argument("soft-quit", "q").takes_value("text");
  parser_->add_argument("conda-minor").takes_value("minor");
  parser_->add_argument("debug", "d");

  auto argv   = std::array<char const*, 5>{"subrepl", "--soft-quit", "-1", "--conda-minor", "-d"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->get<std::string>("soft-quit"), "-1");
  EXPECT_EQ(result->get<int>("soft-quit"), -1);
  EXPECT_EQ(result->get<std::string>("conda-minor"), "-d");
  EXPECT_FALSE(result->has("debug"));

  auto short_argv = std::array<char const*, 3>{"subrepl", "-q", "--"};
  auto short_form = parser_->parse(short_argv.size(), short_argv.data());
  ASSERT_TRUE(short_form.has_value());
  EXPECT_EQ(short_form->get<std::string>("soft-quit"), "--");
}

TEST_F(ArgumentParserTest, OptionValues) {
  parser_->add_argument("cwd", "C").takes_value().desc("Working directory");
  parser_->add_argument("conda-minor").takes_value().desc("Conda minor version");

  auto argv   = std::array<char const*, 5>{"subrepl", "-C", "/srv/project", "--conda-minor", "4"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->get<std::string>("cwd"), "/srv/project");
  EXPECT_EQ(result->get<int>("conda-minor"), 4);
}

TEST_F(ArgumentParserTest, LongOptionWithEquals) {
  parser_->add_argument("env", "e").takes_value().desc("Environment templates");
  parser_->add_argument("soft-quit", "q").takes_value().desc("Soft quit payload");

  auto argv   = std::array<char const*, 3>{"subrepl", "--env=GREETING=hi {NAME}", "--soft-quit="};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->get<std::string>("env"), "GREETING=hi {NAME}");
  ASSERT_TRUE(result->has("soft-quit"));
  EXPECT_EQ(result->get<std::string>("soft-quit"), "");
}

TEST_F(ArgumentParserTest, IntegerValueMustBeWhole) {
  parser_->add_argument("conda-minor").takes_value();

  auto argv   = std::array<char const*, 2>{"subrepl", "--conda-minor=3x"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(result->get<int>("conda-minor").has_value());
  EXPECT_EQ(result->get<std::string>("conda-minor"), "3x");
}

TEST_F(ArgumentParserTest, DefaultValues) {
  parser_->add_argument("encoding").takes_value().default_value("utf-8").desc("Session encoding");
  parser_->add_argument("debug", "d").desc("Debug logging");

  auto argv   = std::array<char const*, 2>{"subrepl", "-d"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->has("encoding"));
  EXPECT_EQ(result->get<std::string>("encoding"), "utf-8");
}

TEST_F(ArgumentParserTest, ExplicitValueOverridesDefault) {
  parser_->add_argument("encoding").takes_value().default_value("utf-8");

  auto argv   = std::array<char const*, 3>{"subrepl", "--encoding", "ascii"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->get<std::string>("encoding"), "ascii");
}

TEST_F(ArgumentParserTest, PositionalArguments) {
  parser_->add_argument("debug", "d");

  auto argv   = std::array<char const*, 4>{"subrepl", "python3", "-d", "repl.py"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->positional_, (std::vector<std::string>{"python3", "repl.py"}));
  EXPECT_TRUE(result->has("debug"));
}

TEST_F(ArgumentParserTest, EverythingAfterDoubleHyphenIsPositional) {
  parser_->add_argument("debug", "d");
  parser_->add_argument("cwd", "C").takes_value();

  auto argv   = std::array<char const*, 7>{"subrepl", "-C", "/tmp", "--", "python3", "-i", "--debug"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->positional_, (std::vector<std::string>{"python3", "-i", "--debug"}));
  EXPECT_FALSE(result->has("debug"));
  EXPECT_EQ(result->get<std::string>("cwd"), "/tmp");
}

TEST_F(ArgumentParserTest, DoubleHyphenOnly) {
  parser_->add_argument("debug", "d");

  auto argv   = std::array<char const*, 2>{"subrepl", "--"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->positional_.empty());
}

TEST_F(ArgumentParserTest, LoneHyphenIsPositional) {
  parser_->add_argument("debug", "");

  auto argv   = std::array<char const*, 2>{"subrepl", "-"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->positional_, std::vector<std::string>{"-"});
}

TEST_F(ArgumentParserTest, UnknownOption) {
  parser_->add_argument("debug", "d");

  auto argv   = std::array<char const*, 3>{"subrepl", "--verbose", "--quiet"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), "Unknown option: --verbose");
}

TEST_F(ArgumentParserTest, UnknownShortOptionInGroup) {
  parser_->add_argument("debug", "d");
  parser_->add_argument("help", "h");

  auto argv   = std::array<char const*, 2>{"subrepl", "-dxh"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), "Unknown option: -x");
}

TEST_F(ArgumentParserTest, FlagWithValue) {
  parser_->add_argument("debug", "d");

  auto argv   = std::array<char const*, 2>{"subrepl", "--debug=yes"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), "Flag option --debug does not accept a value");
}

TEST_F(ArgumentParserTest, MissingValue) {
  parser_->add_argument("cwd", "C").takes_value("dir");

  auto long_argv = std::array<char const*, 2>{"subrepl", "--cwd"};
  auto long_form = parser_->parse(long_argv.size(), long_argv.data());
  ASSERT_FALSE(long_form.has_value());
  EXPECT_EQ(long_form.error(), "Option --cwd requires a value");

  auto short_argv = std::array<char const*, 2>{"subrepl", "-C"};
  auto short_form = parser_->parse(short_argv.size(), short_argv.data());
  ASSERT_FALSE(short_form.has_value());
  EXPECT_EQ(short_form.error(), "Option -C requires a value");
}

} // namespace subrepl::cli::test
