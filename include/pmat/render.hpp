#pragma once

#include <pmat/result.hpp>
#include <string>
#include <unordered_map>

namespace pmat {

using RenderVars = std::unordered_map<std::string, std::string>;

// Render a template with {{ var }} substitution and the block forms
//   {{#if var}} ... {{else}} ... {{/if}}
//   {{#unless var}} ... {{/unless}}
// A variable is truthy when defined and not "", "false" or "0".
// \{{ produces a literal {{. Undefined variables in substitutions,
// unclosed braces and unbalanced blocks are errors (rpc code -32004).
Result<std::string> render_template(const std::string& tmpl, const RenderVars& vars);

} // namespace pmat
