#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "subrepl/core/constant.hpp"
#include "subrepl/env/environment.hpp"

namespace subrepl::process {

// Windows-style lookup: each PATH directory is tried with each PATHEXT
// extension, unless the name already carries an extension. A name with a
// directory part is returned untouched. The first existing file wins.
auto find_executable(
    std::string_view        executable,
    env::Environment const& env,
    char                    list_separator = core::constant::PATH_LIST_SEPARATOR
) -> std::optional<std::string>;

// POSIX-style lookup of a bare name against env's PATH, executable files only.
auto search_path(
    std::string_view        name,
    env::Environment const& env,
    char                    list_separator = core::constant::PATH_LIST_SEPARATOR
) -> std::optional<std::string>;

[[nodiscard]] auto has_directory_part(std::string_view path) noexcept -> bool;

} // namespace subrepl::process
