#include <pmat/templates/template_registry.hpp>
#include <pmat/json.hpp>
#include <pmat/log.hpp>
#include <pmat/sha256.hpp>

#include <algorithm>
#include <cctype>
#include <future>
#include <map>
#include <regex>
#include <set>

namespace pmat::templates {

static const char* URI_SCHEME = "template://";

const char* param_type_name(ParamType t) {
    switch (t) {
        case ParamType::ProjectName: return "project_name";
        case ParamType::SemVer: return "semver";
        case ParamType::GitHubUsername: return "github_username";
        case ParamType::LicenseIdentifier: return "license";
        case ParamType::Boolean: return "boolean";
        case ParamType::String: return "string";
    }
    return "string";
}

std::optional<ParamType> parse_param_type(const std::string& s) {
    if (s == "project_name") return ParamType::ProjectName;
    if (s == "semver") return ParamType::SemVer;
    if (s == "github_username") return ParamType::GitHubUsername;
    if (s == "license") return ParamType::LicenseIdentifier;
    if (s == "boolean") return ParamType::Boolean;
    if (s == "string") return ParamType::String;
    return std::nullopt;
}

int toolchain_priority(const std::string& toolchain) {
    if (toolchain == "rust") return 1;
    if (toolchain == "deno") return 2;
    if (toolchain == "python-uv") return 3;
    return 4;
}

static PmatError invalid_uri(const std::string& uri, const std::string& why) {
    PmatError e(PmatError::BadRequest, "invalid template uri '" + uri + "': " + why,
                "expected template://<toolchain>/<category>/<name>");
    e.with_rpc_code(rpc_codes::InvalidUri);
    return e;
}

static PmatError template_not_found(const std::string& what) {
    PmatError e(PmatError::NotFound, "template not found: " + what,
                "run `pmat list` to see available templates");
    e.with_rpc_code(rpc_codes::TemplateNotFound);
    return e;
}

Result<TemplateUri> TemplateUri::parse(const std::string& uri) {
    if (uri.rfind(URI_SCHEME, 0) != 0) return invalid_uri(uri, "missing template:// scheme");
    std::string rest = uri.substr(std::string(URI_SCHEME).size());
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t slash = rest.find('/', start);
        parts.push_back(rest.substr(start, slash == std::string::npos ? std::string::npos
                                                                      : slash - start));
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    if (parts.size() != 3) return invalid_uri(uri, "expected three path segments");
    for (const auto& p : parts) {
        if (p.empty()) return invalid_uri(uri, "empty path segment");
    }
    return Result<TemplateUri>::ok({parts[0], parts[1], parts[2]});
}

std::string TemplateUri::to_string() const {
    return std::string(URI_SCHEME) + toolchain + "/" + category + "/" + name;
}

// ---------------------------------------------------------------------------
// Loading
// ---------------------------------------------------------------------------

static Result<ParameterSpec> parse_parameter(const Json::Value& j, const std::string& uri) {
    ParameterSpec p;
    auto name = json::require_string(j, "name");
    if (name.is_err() || name.value().empty()) {
        return PmatError{PmatError::Internal, "template " + uri + " has a parameter without a name"};
    }
    p.name = name.value();

    auto type = json::get_string(j, "type", "string");
    if (type.is_err()) return std::move(type).error();
    auto parsed = parse_param_type(type.value());
    if (!parsed) {
        return PmatError{PmatError::Internal,
                         "template " + uri + ": unknown parameter type '" + type.value() + "'"};
    }
    p.type = *parsed;

    auto required = json::get_bool(j, "required", false);
    if (required.is_err()) return std::move(required).error();
    p.required = required.value();

    if (j.isMember("default")) p.default_value = j["default"].asString();
    if (j.isMember("pattern")) {
        p.pattern = j["pattern"].asString();
        try {
            std::regex check(*p.pattern);
        } catch (const std::regex_error& e) {
            return PmatError{PmatError::Internal, "template " + uri + ": parameter " + p.name +
                             " has an invalid pattern: " + e.what()};
        }
    }
    auto desc = json::get_string(j, "description");
    if (desc.is_err()) return std::move(desc).error();
    p.description = desc.value();
    return Result<ParameterSpec>::ok(std::move(p));
}

static Result<TemplateResource> parse_resource(const EmbeddedTemplate& src) {
    auto meta = json::parse(src.metadata);
    if (meta.is_err()) {
        return PmatError(PmatError::Internal, "malformed embedded template metadata")
            .with_cause(meta.error());
    }
    const Json::Value& m = meta.value();

    TemplateResource t;
    auto uri = json::require_string(m, "uri");
    if (uri.is_err()) return PmatError(PmatError::Internal, "embedded template without uri");
    t.uri = uri.value();
    auto parsed = TemplateUri::parse(t.uri);
    if (parsed.is_err()) {
        return PmatError(PmatError::Internal, "embedded template has a bad uri")
            .with_cause(parsed.error());
    }
    t.toolchain = parsed.value().toolchain;
    t.category = parsed.value().category;
    t.name = m.get("name", parsed.value().name).asString();
    if (t.name != parsed.value().name) {
        return PmatError{PmatError::Internal, "template " + t.uri + ": name does not match uri"};
    }
    t.description = m.get("description", "").asString();
    t.filename = m.get("filename", t.category + ".txt").asString();

    auto version = Version::parse(m.get("version", "1.0.0").asString());
    if (version.is_err()) {
        return PmatError(PmatError::Internal, "template " + t.uri + ": bad version")
            .with_cause(version.error());
    }
    t.version = version.value();

    std::set<std::string> seen;
    for (const auto& pj : m["parameters"]) {
        auto p = parse_parameter(pj, t.uri);
        if (p.is_err()) return std::move(p).error();
        if (!seen.insert(p.value().name).second) {
            return PmatError{PmatError::Internal,
                             "template " + t.uri + ": duplicate parameter '" + p.value().name + "'"};
        }
        t.parameters.push_back(std::move(p).value());
    }

    t.content = src.content;
    t.content_hash = SHA256::hash_hex(t.content);
    return Result<TemplateResource>::ok(std::move(t));
}

Result<TemplateRegistry> TemplateRegistry::load(const std::vector<EmbeddedTemplate>& sources) {
    TemplateRegistry reg;
    std::set<std::string> uris;
    for (const auto& src : sources) {
        auto t = parse_resource(src);
        if (t.is_err()) return std::move(t).error();
        if (!uris.insert(t.value().uri).second) {
            return PmatError{PmatError::Internal, "duplicate template uri " + t.value().uri};
        }
        reg.templates_.push_back(std::make_shared<const TemplateResource>(std::move(t).value()));
    }
    log::debug("loaded %zu templates", reg.templates_.size());
    return Result<TemplateRegistry>::ok(std::move(reg));
}

Result<TemplateRegistry> TemplateRegistry::load_embedded() {
    return load(embedded_templates());
}

// ---------------------------------------------------------------------------
// Lookup
// ---------------------------------------------------------------------------

std::vector<TemplatePtr> TemplateRegistry::list(const std::string& toolchain,
                                                const std::string& category) const {
    std::vector<TemplatePtr> out;
    for (const auto& t : templates_) {
        if (!toolchain.empty() && t->toolchain != toolchain) continue;
        if (!category.empty() && t->category != category) continue;
        out.push_back(t);
    }
    std::sort(out.begin(), out.end(), [](const TemplatePtr& a, const TemplatePtr& b) {
        int pa = toolchain_priority(a->toolchain);
        int pb = toolchain_priority(b->toolchain);
        if (pa != pb) return pa < pb;
        if (a->version != b->version) return a->version > b->version;
        return a->uri < b->uri;
    });
    return out;
}

Result<TemplatePtr> TemplateRegistry::find(const std::string& uri) const {
    auto parsed = TemplateUri::parse(uri);
    if (parsed.is_err()) return std::move(parsed).error();
    for (const auto& t : templates_) {
        if (t->uri == uri) return Result<TemplatePtr>::ok(t);
    }
    return template_not_found(uri);
}

Result<TemplatePtr> TemplateRegistry::resolve(const std::string& spec,
                                              const std::string& category) const {
    if (spec.rfind(URI_SCHEME, 0) == 0) return find(spec);

    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t slash = spec.find('/', start);
        parts.push_back(spec.substr(start, slash == std::string::npos ? std::string::npos
                                                                      : slash - start));
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    if (parts.size() == 3) {
        if (!category.empty() && category != parts[1]) {
            return invalid_uri(spec, "category '" + category + "' does not match");
        }
        return find(std::string(URI_SCHEME) + spec);
    }
    if (parts.size() != 2 || parts[0].empty() || parts[1].empty()) {
        return invalid_uri(spec, "expected <toolchain>/<name>");
    }

    std::vector<TemplatePtr> matches;
    for (const auto& t : list(parts[0], category)) {
        if (t->name == parts[1]) matches.push_back(t);
    }
    if (matches.empty()) return template_not_found(spec);
    if (matches.size() > 1) {
        std::string names;
        for (const auto& m : matches) names += (names.empty() ? "" : ", ") + m->uri;
        PmatError e(PmatError::BadRequest, "ambiguous template '" + spec + "'",
                    "one of: " + names);
        e.with_rpc_code(rpc_codes::InvalidUri);
        return e;
    }
    return Result<TemplatePtr>::ok(matches.front());
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<SearchHit> TemplateRegistry::search(const std::string& query,
                                                const std::string& toolchain,
                                                size_t limit) const {
    std::string q = lower(query);
    std::vector<SearchHit> hits;
    for (const auto& t : list(toolchain)) {
        SearchHit hit;
        hit.tmpl = t;
        std::string name = lower(t->name);
        if (name.find(q) != std::string::npos) {
            hit.relevance += name == q ? 10.0 : 5.0;
            hit.matches.push_back("name: " + t->name);
        }
        if (lower(t->description).find(q) != std::string::npos) {
            hit.relevance += 3.0;
            hit.matches.push_back("description");
        }
        for (const auto& p : t->parameters) {
            if (lower(p.name).find(q) != std::string::npos) {
                hit.relevance += 1.0;
                hit.matches.push_back("parameter: " + p.name);
            }
        }
        if (!hit.matches.empty()) hits.push_back(std::move(hit));
    }
    // list() order breaks ties
    std::stable_sort(hits.begin(), hits.end(), [](const SearchHit& a, const SearchHit& b) {
        return a.relevance > b.relevance;
    });
    if (limit > 0 && hits.size() > limit) hits.resize(limit);
    return hits;
}

// ---------------------------------------------------------------------------
// Parameters
// ---------------------------------------------------------------------------

static bool full_match(const std::string& pattern, const std::string& value) {
    return std::regex_match(value, std::regex(pattern));
}

static std::optional<std::string> type_error(ParamType type, const std::string& value) {
    static const std::set<std::string> licenses = {
        "MIT", "Apache-2.0", "GPL-2.0", "GPL-3.0", "LGPL-2.1", "LGPL-3.0", "AGPL-3.0",
        "BSD-2-Clause", "BSD-3-Clause", "MPL-2.0", "ISC", "Unlicense", "0BSD",
        "MIT OR Apache-2.0",
    };
    switch (type) {
        case ParamType::ProjectName:
            if (value.size() > 64) return std::string("must be at most 64 characters");
            if (!full_match("[A-Za-z][A-Za-z0-9_-]*", value)) {
                return std::string("must start with a letter and contain only letters, digits, '-' or '_'");
            }
            return std::nullopt;
        case ParamType::SemVer:
            if (Version::parse(value).is_err()) return std::string("not a semantic version");
            return std::nullopt;
        case ParamType::GitHubUsername:
            if (value.size() > 39 || value.find("--") != std::string::npos ||
                !full_match("[A-Za-z0-9]([A-Za-z0-9-]*[A-Za-z0-9])?", value)) {
                return std::string("not a valid GitHub username");
            }
            return std::nullopt;
        case ParamType::LicenseIdentifier:
            if (!licenses.count(value)) return std::string("unknown SPDX license identifier");
            return std::nullopt;
        case ParamType::Boolean: {
            std::string v = lower(value);
            if (v != "true" && v != "false" && v != "1" && v != "0" && v != "yes" && v != "no") {
                return std::string("expected true or false");
            }
            return std::nullopt;
        }
        case ParamType::String:
            return std::nullopt;
    }
    return std::nullopt;
}

std::vector<ValidationIssue> TemplateRegistry::check_parameters(const TemplateResource& t,
                                                                const TemplateParams& params) {
    std::map<std::string, std::string> given(params.begin(), params.end());
    std::vector<ValidationIssue> issues;
    for (const auto& spec : t.parameters) {
        auto it = given.find(spec.name);
        if (it == given.end()) {
            if (spec.required) issues.push_back({spec.name, "required parameter missing"});
            continue;
        }
        const std::string& value = it->second;
        if (value.empty()) {
            if (spec.required) issues.push_back({spec.name, "must not be empty"});
            continue;
        }
        if (auto err = type_error(spec.type, value)) {
            issues.push_back({spec.name, *err});
            continue;
        }
        if (spec.pattern && !full_match(*spec.pattern, value)) {
            issues.push_back({spec.name, "value does not match pattern: " + *spec.pattern});
        }
    }
    return issues;
}

Result<std::vector<ValidationIssue>> TemplateRegistry::validate(const std::string& uri,
                                                                const TemplateParams& params) const {
    auto t = find(uri);
    if (t.is_err()) return std::move(t).error();
    return Result<std::vector<ValidationIssue>>::ok(check_parameters(*t.value(), params));
}

// ---------------------------------------------------------------------------
// Generation
// ---------------------------------------------------------------------------

static std::string normalize_bool(const std::string& v) {
    std::string l = lower(v);
    return (l == "true" || l == "1" || l == "yes") ? "true" : "false";
}

Result<GeneratedFile> TemplateRegistry::generate(const std::string& uri,
                                                 const TemplateParams& params) const {
    auto found = find(uri);
    if (found.is_err()) return std::move(found).error();
    const TemplateResource& t = *found.value();

    auto issues = check_parameters(t, params);
    if (!issues.empty()) {
        PmatError e = PmatError::validation(issues.front().parameter, issues.front().reason);
        e.with_rpc_code(rpc_codes::TemplateValidation);
        return e;
    }

    RenderVars vars;
    for (const auto& spec : t.parameters) {
        if (spec.default_value) vars[spec.name] = *spec.default_value;
    }
    for (const auto& kv : params) vars[kv.first] = kv.second;
    for (const auto& spec : t.parameters) {
        auto it = vars.find(spec.name);
        if (spec.type == ParamType::Boolean && it != vars.end()) it->second = normalize_bool(it->second);
    }

    // Digest over the sorted effective variables
    std::map<std::string, std::string> sorted(vars.begin(), vars.end());
    SHA256 h;
    h.update_field(t.content_hash);
    for (const auto& kv : sorted) {
        h.update_field(kv.first);
        h.update_field(kv.second);
    }
    cache::TemplateKey key{t.uri, SHA256::hex(h.finalize())};

    std::string rendered;
    if (auto hit = cache_ ? cache_->get(key) : nullptr) {
        rendered = *hit;
    } else {
        auto r = render_template(t.content, vars);
        if (r.is_err()) {
            PmatError e = PmatError(PmatError::BadRequest, "cannot render " + t.uri)
                .with_cause(r.error());
            e.with_rpc_code(rpc_codes::RenderError);
            return e;
        }
        rendered = std::move(r).value();
        if (cache_) {
            auto st = cache_->put(key, rendered);
            if (st.is_err()) log::warn("template cache write failed: %s", st.error().message.c_str());
        }
    }

    auto project = vars.find("project_name");
    std::string dir = project != vars.end() && !project->second.empty() ? project->second : "project";

    GeneratedFile f;
    f.uri = t.uri;
    f.path = dir + "/" + t.filename;
    f.checksum = SHA256::hash_hex(rendered);
    f.content = std::move(rendered);
    f.toolchain = t.toolchain;
    return Result<GeneratedFile>::ok(std::move(f));
}

Result<ScaffoldResult> TemplateRegistry::scaffold(const std::string& toolchain,
                                                  const std::vector<std::string>& template_names,
                                                  const TemplateParams& params,
                                                  size_t parallel) const {
    auto available = list(toolchain);
    if (available.empty()) {
        return PmatError(PmatError::NotFound, "no templates for toolchain '" + toolchain + "'",
                         "known toolchains: rust, deno, python-uv")
            .with_rpc_code(rpc_codes::TemplateNotFound);
    }

    // Each requested name is a category (makefile) or a template name (cli-binary)
    std::vector<std::pair<std::string, std::string>> work;   // (requested, uri)
    ScaffoldResult result;
    if (template_names.empty()) {
        std::set<std::string> seen;
        for (const auto& t : available) {
            if (seen.insert(t->category).second) work.emplace_back(t->category, t->uri);
        }
    } else {
        for (const auto& name : template_names) {
            std::string uri;
            for (const auto& t : available) {
                if (t->category == name || t->name == name) {
                    uri = t->uri;
                    break;
                }
            }
            if (uri.empty()) {
                result.errors.push_back({name, template_not_found(toolchain + "/" + name)});
            } else {
                work.emplace_back(name, uri);
            }
        }
    }

    std::vector<Result<GeneratedFile>> outcomes;
    outcomes.reserve(work.size());
    if (parallel <= 1) {
        for (const auto& w : work) outcomes.push_back(generate(w.second, params));
    } else {
        for (size_t i = 0; i < work.size(); i += parallel) {
            std::vector<std::future<Result<GeneratedFile>>> batch;
            for (size_t j = i; j < work.size() && j < i + parallel; ++j) {
                const std::string uri = work[j].second;
                batch.push_back(std::async(std::launch::async,
                                           [this, uri, &params] { return generate(uri, params); }));
            }
            for (auto& fut : batch) outcomes.push_back(fut.get());
        }
    }

    for (size_t i = 0; i < work.size(); ++i) {
        if (outcomes[i].is_ok()) {
            result.files.push_back(std::move(outcomes[i]).value());
        } else {
            result.errors.push_back({work[i].first, outcomes[i].error()});
        }
    }
    return Result<ScaffoldResult>::ok(std::move(result));
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

Json::Value to_json(const ParameterSpec& p) {
    Json::Value j(Json::objectValue);
    j["name"] = p.name;
    j["type"] = param_type_name(p.type);
    j["required"] = p.required;
    if (p.default_value) j["default"] = *p.default_value;
    if (p.pattern) j["pattern"] = *p.pattern;
    j["description"] = p.description;
    return j;
}

Json::Value to_json(const TemplateResource& t, bool include_content) {
    Json::Value j(Json::objectValue);
    j["uri"] = t.uri;
    j["name"] = t.name;
    j["description"] = t.description;
    j["toolchain"] = t.toolchain;
    j["category"] = t.category;
    j["filename"] = t.filename;
    j["content_hash"] = t.content_hash;
    j["version"] = t.version.to_string();
    Json::Value params(Json::arrayValue);
    for (const auto& p : t.parameters) params.append(to_json(p));
    j["parameters"] = params;
    if (include_content) j["content"] = t.content;
    return j;
}

Json::Value to_json(const GeneratedFile& f) {
    Json::Value j(Json::objectValue);
    j["uri"] = f.uri;
    j["path"] = f.path;
    j["content"] = f.content;
    j["checksum"] = f.checksum;
    j["toolchain"] = f.toolchain;
    return j;
}

} // namespace pmat::templates
