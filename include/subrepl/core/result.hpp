#pragma once

#include <expected>
#include <string>

namespace subrepl::core {

template<typename T, typename U = std::string>
using Result = std::expected<T, U>;

} // namespace subrepl::core
