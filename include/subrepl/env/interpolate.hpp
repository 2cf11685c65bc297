#pragma once

#include <string_view>

#include "subrepl/core/errors.hpp"
#include "subrepl/core/result.hpp"
#include "subrepl/env/environment.hpp"

namespace subrepl::env {

// Substitutes {NAME} fields with env values. "{{" and "}}" are literal braces;
// a "!conversion" or ":format" suffix on a field is accepted and ignored.
auto format_template(std::string_view tmpl, Environment const& env) -> core::Result<std::string>;

// Resolves every template against `env` in a single pass. Templates never see
// each other's results. The first failing template aborts the whole phase.
auto interpolate(Environment const& env, Environment const& templates) -> core::Result<Environment, core::TemplateError>;

// Like interpolate, but a template that fails is kept verbatim. Used for
// sourced shell environments, whose values routinely contain braces.
auto interpolate_lenient(Environment const& env, Environment const& templates) -> Environment;

} // namespace subrepl::env
