#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>
#include <stdlib.h>

#include "subrepl/core/result.hpp"
#include "subrepl/env/environment.hpp"
#include "subrepl/process/command_runner.hpp"
#include "subrepl/repl/autocomplete.hpp"

namespace subrepl::test {

namespace fs = std::filesystem;

/// Scratch directory removed again when the test ends
class TempDir {
  fs::path path_;

public:
  TempDir() {
    std::string pattern = (fs::temp_directory_path() / "subrepl-test-XXXXXX").string();
    if (char* created = mkdtemp(pattern.data()); created != nullptr) {
      path_ = created;
    } else {
      ADD_FAILURE() << "mkdtemp failed";
    }
  }

  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  TempDir(TempDir const&)            = delete;
  TempDir& operator=(TempDir const&) = delete;

  [[nodiscard]] auto path() const -> fs::path const& {
    return path_;
  }

  auto make_dir(fs::path const& relative) const -> fs::path {
    auto dir = path_ / relative;
    fs::create_directories(dir);
    return dir;
  }

  auto write_file(fs::path const& relative, std::string_view content = "", bool executable = false) const -> fs::path {
    auto file = path_ / relative;
    fs::create_directories(file.parent_path());
    std::ofstream(file) << content;
    if (executable) {
      fs::permissions(file, fs::perms::owner_all, fs::perm_options::add);
    }
    return file;
  }
};

/// Sets an environment variable for the lifetime of the object
class ScopedEnvVar {
  std::string                name_;
  std::optional<std::string> saved_;

public:
  ScopedEnvVar(std::string name, std::string const& value)
      : name_(std::move(name)) {
    if (char const* old = std::getenv(name_.c_str()); old != nullptr) {
      saved_ = old;
    }
    setenv(name_.c_str(), value.c_str(), 1);
  }

  ~ScopedEnvVar() {
    if (saved_) {
      setenv(name_.c_str(), saved_->c_str(), 1);
    } else {
      unsetenv(name_.c_str());
    }
  }

  ScopedEnvVar(ScopedEnvVar const&)            = delete;
  ScopedEnvVar& operator=(ScopedEnvVar const&) = delete;
};

/// Records every command instead of running it
class FakeCommandRunner final : public process::CommandRunner {
public:
  using Handler = std::function<core::Result<process::CaptureResult>(std::vector<std::string> const&)>;

  std::vector<std::vector<std::string>> calls_;
  Handler                               handler_;

  explicit FakeCommandRunner(Handler handler = {})
      : handler_(std::move(handler)) {}

  auto capture(std::span<std::string const> argv, env::Environment const*) -> core::Result<process::CaptureResult> override {
    calls_.emplace_back(argv.begin(), argv.end());
    if (!handler_) {
      return process::CaptureResult{};
    }
    return handler_(calls_.back());
  }

  [[nodiscard]] auto call_count() const -> size_t {
    return calls_.size();
  }
};

class FakeAutocomplete final : public repl::AutocompleteService {
public:
  std::optional<int>                     port_;
  bool                                   connected_ = false;
  bool*                                  started_   = nullptr;
  std::vector<repl::CompletionRequest>*  requests_  = nullptr;

  void start() override {
    if (started_ != nullptr) {
      *started_ = true;
    }
  }

  [[nodiscard]] auto port() const -> std::optional<int> override {
    return port_;
  }

  [[nodiscard]] bool connected() const override {
    return connected_;
  }

  auto complete(repl::CompletionRequest const& request) -> std::vector<std::string> override {
    if (requests_ != nullptr) {
      requests_->push_back(request);
    }
    return {request.prefix_ + "_completion"};
  }
};

} // namespace subrepl::test
