#include "subrepl/cli/arg_parser.hpp"

#include <algorithm>
#include <expected>
#include <string_view>
#include <utility>

#include <fmt/core.h>

#include "subrepl/core/constant.hpp"

namespace subrepl::cli {

bool Arguments::has(std::string const& name) const noexcept {
  return args_.contains(name);
}

Option::Option(std::string name, std::string short_name) noexcept
    : name_{std::move(name)}, short_name_{std::move(short_name)} {}

auto Option::desc(std::string desc) noexcept -> Option& {
  description_ = std::move(desc);
  return *this;
}

auto Option::takes_value(std::string value_name) noexcept -> Option& {
  value_name_ = std::move(value_name);
  return *this;
}

auto Option::default_value(std::string value) noexcept -> Option& {
  default_value_ = std::move(value);
  return *this;
}

ArgumentParser::ArgumentParser(std::string name, std::string desc) noexcept
    : name_{std::move(name)}, desc_{std::move(desc)} {}

auto ArgumentParser::add_argument(std::string name, std::string short_name) noexcept -> Option& {
  options_.emplace_back(std::move(name), std::move(short_name));
  return options_.back();
}

auto ArgumentParser::find_long(std::string_view name) const -> Option const* {
  auto it = std::ranges::find_if(options_, [name](Option const& opt) { return opt.name_ == name; });
  return it == options_.end() ? nullptr : &*it;
}

auto ArgumentParser::find_short(char name) const -> Option const* {
  auto it = std::ranges::find_if(options_, [name](Option const& opt) {
    return !opt.short_name_.empty() && opt.short_name_.front() == name;
  });
  return it == options_.end() ? nullptr : &*it;
}

auto ArgumentParser::parse(int argc, char const* const* argv) -> core::Result<Arguments> {
  Arguments result;

  for (auto const& option : options_) {
    if (option.default_value_) {
      result.args_[option.name_] = *option.default_value_;
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string_view arg{argv[i]};

    if (arg == "--") {
      for (++i; i < argc; ++i) {
        result.positional_.emplace_back(argv[i]);
      }
      break;
    }

    if (arg.starts_with("--")) {
      // --name, --name=value or --name value
      std::string_view name   = arg.substr(2);
      size_t           eq_pos = name.find('=');
      name                    = name.substr(0, eq_pos);

      Option const* option = find_long(name);
      if (option == nullptr) {
        return std::unexpected(fmt::format("Unknown option: --{}", name));
      }

      if (!option->value_name_) {
        if (eq_pos != std::string_view::npos) {
          return std::unexpected(fmt::format("Flag option --{} does not accept a value", name));
        }
        result.args_[option->name_] = "true";
      } else if (eq_pos != std::string_view::npos) {
        result.args_[option->name_] = std::string(arg.substr(2 + eq_pos + 1));
      } else if (i + 1 < argc) {
        result.args_[option->name_] = argv[++i];
      } else {
        return std::unexpected(fmt::format("Option --{} requires a value", name));
      }
    } else if (arg.starts_with("-") && arg.size() > 1) {
      // -abc groups flags; a value option takes the rest of the group or the next argument
      for (size_t j = 1; j < arg.size(); ++j) {
        Option const* option = find_short(arg[j]);
        if (option == nullptr) {
          return std::unexpected(fmt::format("Unknown option: -{}", arg[j]));
        }

        if (!option->value_name_) {
          result.args_[option->name_] = "true";
          continue;
        }

        if (j + 1 < arg.size()) {
          result.args_[option->name_] = std::string(arg.substr(j + 1));
        } else if (i + 1 < argc) {
          result.args_[option->name_] = argv[++i];
        } else {
          return std::unexpected(fmt::format("Option -{} requires a value", arg[j]));
        }
        break;
      }
    } else {
      result.positional_.emplace_back(arg);
    }
  }

  return result;
}

void ArgumentParser::print_help() const noexcept {
  fmt::print("Usage: {}", name_);
  if (!options_.empty()) {
    fmt::print(" [OPTIONS]");
  }
  fmt::print(" -- <command> [args...]\n\n");

  if (!desc_.empty()) {
    fmt::print("{}\n\n", desc_);
  }

  if (!options_.empty()) {
    fmt::print("Options:\n");
    for (auto const& option : options_) {
      fmt::print("  ");

      if (!option.short_name_.empty()) {
        fmt::print("-{}", option.short_name_);
        if (!option.name_.empty()) {
          fmt::print(", ");
        }
      }

      if (!option.name_.empty()) {
        fmt::print("--{}", option.name_);
      }

      if (option.value_name_) {
        fmt::print(" <{}>", *option.value_name_);
      }

      if (!option.description_.empty()) {
        fmt::print("\n    {}", option.description_);
      }

      if (option.default_value_) {
        fmt::print(" (default: {})", *option.default_value_);
      }

      fmt::print("\n");
    }
  }
}

void ArgumentParser::print_version() noexcept {
  fmt::print("{} {} {}\n", core::constant::EXE_NAME, core::constant::EXE_DESC, core::constant::VERSION);
}

} // namespace subrepl::cli
