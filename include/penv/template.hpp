#pragma once

#include <penv/result.hpp>
#include <map>
#include <string>

namespace penv {

using TemplateVars = std::map<std::string, std::string>;

// Substitute {{ name }} placeholders. Undefined names and unclosed braces
// are errors. "\{{" produces a literal "{{".
Result<std::string> render_template(const std::string& tmpl, const TemplateVars& vars);

} // namespace penv
