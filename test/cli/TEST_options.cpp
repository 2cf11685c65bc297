#include <array>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "subrepl/cli/options.hpp"

namespace subrepl::cli::test {

template<size_t N>
auto parse(std::array<char const*, N> const& argv) -> core::Result<Arguments> {
  auto parser = create_default_arg_parser();
  return parser.parse(static_cast<int>(argv.size()), argv.data());
}

TEST(EnvTemplatesTest, ParsesPairs) {
  auto templates = parse_env_templates("GREETING=hi {NAME},PATH=/opt/bin:{PATH}");

  ASSERT_TRUE(templates.has_value());
  EXPECT_EQ(templates->size(), 2U);
  EXPECT_EQ(templates->at("GREETING"), "hi {NAME}");
  EXPECT_EQ(templates->at("PATH"), "/opt/bin:{PATH}");
}

TEST(EnvTemplatesTest, ValueMayContainEquals) {
  auto templates = parse_env_templates("OPTS=-Dx=1,,EMPTY=");

  ASSERT_TRUE(templates.has_value());
  EXPECT_EQ(templates->at("OPTS"), "-Dx=1");
  EXPECT_EQ(templates->at("EMPTY"), "");
}

TEST(EnvTemplatesTest, MissingKeyIsRejected) {
  EXPECT_FALSE(parse_env_templates("NOEQUALS").has_value());
  EXPECT_FALSE(parse_env_templates("=value").has_value());
}

TEST(OptionsTest, DefaultSettings) {
  auto args = parse(std::array<char const*, 2>{"subrepl", "python3"});
  ASSERT_TRUE(args.has_value());

  auto settings = settings_from_arguments(*args);
  ASSERT_TRUE(settings.has_value());
  EXPECT_EQ(settings->conda_minor_, 3);
  EXPECT_EQ(settings->filter_command_, std::vector<std::string>{"cat"});
  EXPECT_EQ(settings->getenv_command_, config::Settings::default_getenv_command());
  EXPECT_TRUE(settings->python_virtualenv_paths_.empty());
  EXPECT_FALSE(settings->use_wrapped_);
  EXPECT_FALSE(settings->force_source_);
  EXPECT_FALSE(settings->debug_);
}

TEST(OptionsTest, VirtualEnvSettings) {
  auto args = parse(std::array<char const*, 8>{
      "subrepl", "--venv-paths=/opt/envs::~/.virtualenvs", "--use-wrapped", "--force-source", "--conda-minor", "4",
      "--", "python"
  });
  ASSERT_TRUE(args.has_value());

  auto settings = settings_from_arguments(*args);
  ASSERT_TRUE(settings.has_value());
  EXPECT_EQ(settings->python_virtualenv_paths_, (std::vector<std::string>{"/opt/envs", "~/.virtualenvs"}));
  EXPECT_TRUE(settings->use_wrapped_);
  EXPECT_TRUE(settings->force_source_);
  EXPECT_EQ(settings->conda_minor_, 4);
}

TEST(OptionsTest, InvalidCondaMinor) {
  auto args = parse(std::array<char const*, 3>{"subrepl", "--conda-minor=three", "python"});
  ASSERT_TRUE(args.has_value());

  auto settings = settings_from_arguments(*args);
  ASSERT_FALSE(settings.has_value());
  EXPECT_EQ(settings.error(), "invalid --conda-minor 'three'");
}

TEST(OptionsTest, GetenvCommand) {
  auto custom = parse(std::array<char const*, 3>{"subrepl", "--getenv-command=/usr/bin/env -i", "python"});
  ASSERT_TRUE(custom.has_value());
  auto custom_settings = settings_from_arguments(*custom);
  ASSERT_TRUE(custom_settings.has_value());
  EXPECT_EQ(custom_settings->getenv_command_, (std::vector<std::string>{"/usr/bin/env", "-i"}));

  auto disabled = parse(std::array<char const*, 3>{"subrepl", "--getenv-command=", "python"});
  ASSERT_TRUE(disabled.has_value());
  auto disabled_settings = settings_from_arguments(*disabled);
  ASSERT_TRUE(disabled_settings.has_value());
  EXPECT_TRUE(disabled_settings->getenv_command_.empty());
}

TEST(OptionsTest, FilterCommand) {
  auto args = parse(std::array<char const*, 4>{"subrepl", "-f", "--filter-command=grep -v Warning", "python"});
  ASSERT_TRUE(args.has_value());

  auto settings = settings_from_arguments(*args);
  ASSERT_TRUE(settings.has_value());
  EXPECT_EQ(settings->filter_command_, (std::vector<std::string>{"grep", "-v", "Warning"}));

  auto options = launch_options_from_arguments(*args);
  ASSERT_TRUE(options.has_value());
  EXPECT_TRUE(options->filter_warnings_);

  auto empty = parse(std::array<char const*, 3>{"subrepl", "--filter-command=", "python"});
  ASSERT_TRUE(empty.has_value());
  EXPECT_FALSE(settings_from_arguments(*empty).has_value());
}

TEST(OptionsTest, LaunchOptions) {
  auto args = parse(std::array<char const*, 11>{
      "subrepl", "-C", "/srv", "-q", "quit()", "-n", "python", "--env=PY_VERSION=py27,GREETING=hi", "--", "python",
      "-i"
  });
  ASSERT_TRUE(args.has_value());

  auto options = launch_options_from_arguments(*args);
  ASSERT_TRUE(options.has_value());
  EXPECT_EQ(options->cmd_, (std::vector<std::string>{"python", "-i"}));
  EXPECT_EQ(options->cwd_, "/srv");
  EXPECT_EQ(options->soft_quit_, "quit()");
  EXPECT_EQ(options->external_id_, "python");
  EXPECT_EQ(options->extend_env_.at("PY_VERSION"), "py27");
  EXPECT_EQ(options->extend_env_.at("GREETING"), "hi");
  EXPECT_EQ(options->encoding_, env::Encoding::Utf8);
  EXPECT_FALSE(options->filter_warnings_);
  EXPECT_FALSE(options->env_.has_value());
}

TEST(OptionsTest, SoftQuitMayStartWithDash) {
  auto args = parse(std::array<char const*, 5>{"subrepl", "--soft-quit", "-quit", "--", "repl"});
  ASSERT_TRUE(args.has_value());

  auto options = launch_options_from_arguments(*args);
  ASSERT_TRUE(options.has_value());
  EXPECT_EQ(options->soft_quit_, "-quit");
  EXPECT_EQ(options->cmd_, std::vector<std::string>{"repl"});
}

TEST(OptionsTest, Encoding) {
  auto latin = parse(std::array<char const*, 3>{"subrepl", "--encoding=latin-1", "python"});
  ASSERT_TRUE(latin.has_value());
  auto options = launch_options_from_arguments(*latin);
  ASSERT_TRUE(options.has_value());
  EXPECT_EQ(options->encoding_, env::Encoding::Latin1);

  auto unknown = parse(std::array<char const*, 3>{"subrepl", "--encoding=ebcdic", "python"});
  ASSERT_TRUE(unknown.has_value());
  auto failed = launch_options_from_arguments(*unknown);
  ASSERT_FALSE(failed.has_value());
  EXPECT_EQ(failed.error(), "unsupported encoding 'ebcdic'");
}

TEST(OptionsTest, CommandIsRequired) {
  auto args = parse(std::array<char const*, 2>{"subrepl", "-d"});
  ASSERT_TRUE(args.has_value());

  auto options = launch_options_from_arguments(*args);
  ASSERT_FALSE(options.has_value());
  EXPECT_EQ(options.error(), "no command given");
}

TEST(OptionsTest, BadEnvTemplateList) {
  auto args = parse(std::array<char const*, 3>{"subrepl", "--env=oops", "python"});
  ASSERT_TRUE(args.has_value());

  EXPECT_FALSE(launch_options_from_arguments(*args).has_value());
}

} // namespace subrepl::cli::test
