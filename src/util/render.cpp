#include <pmat/render.hpp>
#include <algorithm>
#include <vector>

namespace pmat {

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

static int line_at(const std::string& s, size_t pos) {
    return 1 + static_cast<int>(std::count(s.begin(), s.begin() + std::min(pos, s.size()), '\n'));
}

static PmatError render_error(const std::string& tmpl, size_t pos, std::string msg,
                              std::string hint = "") {
    PmatError e(PmatError::BadRequest, std::move(msg), std::move(hint));
    e.line = line_at(tmpl, pos);
    e.with_rpc_code(rpc_codes::RenderError);
    return e;
}

static std::string available_vars_hint(const RenderVars& vars) {
    if (vars.empty()) return "no variables defined";
    std::vector<std::string> keys;
    keys.reserve(vars.size());
    for (const auto& kv : vars) keys.push_back(kv.first);
    std::sort(keys.begin(), keys.end());
    std::string hint = "available variables: ";
    for (size_t i = 0; i < keys.size(); ++i) {
        if (i) hint += ", ";
        hint += keys[i];
    }
    return hint;
}

static bool truthy(const RenderVars& vars, const std::string& name) {
    auto it = vars.find(name);
    if (it == vars.end()) return false;
    const auto& v = it->second;
    return !v.empty() && v != "false" && v != "0";
}

namespace {

// One open {{#if}} / {{#unless}} block
struct Frame {
    std::string kind;
    size_t open_pos;
    bool parent_active;
    bool cond;
    bool in_else = false;

    bool active() const { return parent_active && (in_else ? !cond : cond); }
};

} // namespace

Result<std::string> render_template(const std::string& tmpl, const RenderVars& vars) {
    std::string out;
    out.reserve(tmpl.size());
    std::vector<Frame> stack;
    auto emitting = [&stack]() { return stack.empty() || stack.back().active(); };

    size_t i = 0;
    while (i < tmpl.size()) {
        if (i + 2 < tmpl.size() && tmpl[i] == '\\' && tmpl[i + 1] == '{' && tmpl[i + 2] == '{') {
            if (emitting()) out += "{{";
            i += 3;
            continue;
        }

        if (i + 1 < tmpl.size() && tmpl[i] == '{' && tmpl[i + 1] == '{') {
            size_t end = tmpl.find("}}", i + 2);
            if (end == std::string::npos) {
                return render_error(tmpl, i, "unclosed '{{' in template");
            }
            std::string tag = trim(tmpl.substr(i + 2, end - i - 2));
            size_t tag_pos = i;
            i = end + 2;

            if (tag.empty()) {
                return render_error(tmpl, tag_pos, "empty tag in template");
            }

            if (tag[0] == '#') {
                auto space = tag.find(' ');
                std::string kind = tag.substr(1, space == std::string::npos ? std::string::npos : space - 1);
                if (kind != "if" && kind != "unless") {
                    return render_error(tmpl, tag_pos, "unsupported block '#" + kind + "'");
                }
                if (space == std::string::npos) {
                    return render_error(tmpl, tag_pos, "'#" + kind + "' needs a variable name");
                }
                bool cond = truthy(vars, trim(tag.substr(space + 1)));
                if (kind == "unless") cond = !cond;
                stack.push_back({kind, tag_pos, emitting(), cond});
                continue;
            }
            if (tag == "else") {
                if (stack.empty() || stack.back().in_else) {
                    return render_error(tmpl, tag_pos, "'else' outside of a block");
                }
                stack.back().in_else = true;
                continue;
            }
            if (tag[0] == '/') {
                std::string kind = trim(tag.substr(1));
                if (stack.empty() || stack.back().kind != kind) {
                    return render_error(tmpl, tag_pos, "unbalanced '{{/" + kind + "}}'");
                }
                stack.pop_back();
                continue;
            }

            if (!emitting()) continue;
            auto it = vars.find(tag);
            if (it == vars.end()) {
                return render_error(tmpl, tag_pos,
                    "undefined variable '" + tag + "' in template",
                    available_vars_hint(vars));
            }
            out += it->second;
            continue;
        }

        if (emitting()) out.push_back(tmpl[i]);
        i++;
    }

    if (!stack.empty()) {
        return render_error(tmpl, stack.back().open_pos,
            "unclosed '{{#" + stack.back().kind + "}}' block");
    }
    return Result<std::string>::ok(std::move(out));
}

} // namespace pmat
