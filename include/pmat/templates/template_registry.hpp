#pragma once

#include <pmat/cache/persistent_cache.hpp>
#include <pmat/cache/strategies.hpp>
#include <pmat/render.hpp>
#include <pmat/result.hpp>
#include <pmat/templates/embedded.hpp>
#include <pmat/version.hpp>
#include <json/json.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pmat::templates {

enum class ParamType { ProjectName, SemVer, GitHubUsername, LicenseIdentifier, Boolean, String };

const char* param_type_name(ParamType t);
std::optional<ParamType> parse_param_type(const std::string& s);

struct ParameterSpec {
    std::string name;
    ParamType type = ParamType::String;
    bool required = false;
    std::optional<std::string> default_value;
    std::optional<std::string> pattern;   // ECMAScript regex, whole-value match
    std::string description;
};

// template://<toolchain>/<category>/<name>
struct TemplateUri {
    std::string toolchain;
    std::string category;
    std::string name;

    // BadRequest with rpc code -32002 when malformed
    static Result<TemplateUri> parse(const std::string& uri);
    std::string to_string() const;
};

struct TemplateResource {
    std::string uri;
    std::string name;
    std::string description;
    std::string toolchain;
    std::string category;
    std::string filename;       // output file name inside the project directory
    std::string content_hash;   // SHA-256 hex of content
    Version version;
    std::vector<ParameterSpec> parameters;
    std::string content;
};

using TemplatePtr = std::shared_ptr<const TemplateResource>;

struct ValidationIssue {
    std::string parameter;
    std::string reason;
};

struct SearchHit {
    TemplatePtr tmpl;
    double relevance = 0;
    std::vector<std::string> matches;
};

struct GeneratedFile {
    std::string uri;
    std::string path;       // <project_name>/<filename>
    std::string content;
    std::string checksum;   // SHA-256 hex of content
    std::string toolchain;
};

struct ScaffoldFailure {
    std::string template_name;
    PmatError error;
};

struct ScaffoldResult {
    std::vector<GeneratedFile> files;
    std::vector<ScaffoldFailure> errors;
};

using TemplateParams = std::vector<std::pair<std::string, std::string>>;

// Lower sorts first: rust, deno, python-uv, then anything else
int toolchain_priority(const std::string& toolchain);

// Immutable after load; safe to share across threads. Rendered output goes
// through the template cache when one is attached.
class TemplateRegistry {
public:
    // Internal error on malformed metadata or duplicate names
    static Result<TemplateRegistry> load(const std::vector<EmbeddedTemplate>& sources);
    static Result<TemplateRegistry> load_embedded();

    void attach_cache(cache::PersistentCache<cache::TemplateStrategy>* cache) { cache_ = cache; }

    // Sorted by toolchain priority, then newest version, then uri
    std::vector<TemplatePtr> list(const std::string& toolchain = "",
                                  const std::string& category = "") const;

    // NotFound (-32001) or malformed uri (-32002)
    Result<TemplatePtr> find(const std::string& uri) const;

    // Accepts a full uri, <toolchain>/<category>/<name>, or <toolchain>/<name>
    // (with category narrowing the match when given)
    Result<TemplatePtr> resolve(const std::string& spec, const std::string& category = "") const;

    // Relevance: exact name 10, name contains 5, description 3, parameter 1
    std::vector<SearchHit> search(const std::string& query, const std::string& toolchain = "",
                                  size_t limit = 0) const;

    static std::vector<ValidationIssue> check_parameters(const TemplateResource& t,
                                                         const TemplateParams& params);

    Result<std::vector<ValidationIssue>> validate(const std::string& uri,
                                                  const TemplateParams& params) const;

    // ValidationFailed (-32003) on the first bad parameter, render errors
    // carry -32004
    Result<GeneratedFile> generate(const std::string& uri, const TemplateParams& params) const;

    // Empty templates = every category the toolchain has. Per-template
    // failures are collected, not returned.
    Result<ScaffoldResult> scaffold(const std::string& toolchain,
                                    const std::vector<std::string>& template_names,
                                    const TemplateParams& params, size_t parallel = 1) const;

    size_t size() const { return templates_.size(); }

private:
    std::vector<TemplatePtr> templates_;
    cache::PersistentCache<cache::TemplateStrategy>* cache_ = nullptr;
};

Json::Value to_json(const ParameterSpec& p);
Json::Value to_json(const TemplateResource& t, bool include_content = false);
Json::Value to_json(const GeneratedFile& f);

} // namespace pmat::templates
