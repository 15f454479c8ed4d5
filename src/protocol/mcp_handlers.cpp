#include <pmat/protocol/handlers.hpp>
#include <pmat/app_context.hpp>
#include <pmat/json.hpp>
#include <pmat/log.hpp>

#include <functional>
#include <vector>

namespace pmat::protocol {

namespace {

const char* DEFAULT_PROTOCOL_VERSION = "2024-11-05";
const char* SERVER_NAME = "pmat";

struct ToolArg {
    const char* name;
    const char* type;
    const char* description;
    bool required;
};

// An MCP tool is a core method plus a renaming of its arguments
struct Tool {
    const char* name;
    const char* description;
    const char* method;
    std::vector<ToolArg> args;
    std::vector<std::pair<const char*, const char*>> renames;   // tool arg -> method param
};

const std::vector<Tool>& tools() {
    static const std::vector<Tool> all = {
        {"generate_template",
         "Generate one project file (Makefile, README.md, .gitignore, Cargo.toml) from a template",
         "generate",
         {{"resource_uri", "string", "Template URI, e.g. template://rust/makefile/cli", true},
          {"parameters", "object", "Template parameters as key-value pairs", true}},
         {{"resource_uri", "template"}}},
        {"list_templates", "List the available templates, optionally filtered", "list",
         {{"toolchain", "string", "Filter by toolchain (rust, deno, python-uv)", false},
          {"category", "string", "Filter by category (makefile, readme, gitignore)", false}},
         {}},
        {"validate_template", "Check template parameters without generating anything", "validate",
         {{"resource_uri", "string", "Template URI to validate against", true},
          {"parameters", "object", "Parameters to validate", true}},
         {{"resource_uri", "uri"}}},
        {"scaffold_project", "Generate every template of a toolchain into <project_name>/",
         "scaffold",
         {{"toolchain", "string", "Toolchain (rust, deno, python-uv)", true},
          {"templates", "array", "Categories or template names; empty means all", false},
          {"parameters", "object", "Parameters shared by every template", true}},
         {}},
        {"search_templates", "Search template names, descriptions and parameters", "search",
         {{"query", "string", "Search text", true},
          {"toolchain", "string", "Optional toolchain filter", false}},
         {}},
        {"analyze_code_churn", "Change frequency per file from git history", "analyze.churn",
         {{"project_path", "string", "Repository to analyze (default: .)", false},
          {"period_days", "integer", "Days of history (default: 30)", false}},
         {{"project_path", "path"}, {"period_days", "days"}}},
        {"analyze_complexity", "Cyclomatic and cognitive complexity per function",
         "analyze.complexity",
         {{"project_path", "string", "Path to analyze (default: .)", false},
          {"max_cyclomatic", "integer", "Cyclomatic threshold", false},
          {"max_cognitive", "integer", "Cognitive threshold", false},
          {"include", "array", "Glob patterns to include", false}},
         {{"project_path", "path"}}},
        {"analyze_dag", "Dependency graph of local imports", "analyze.dag",
         {{"project_path", "string", "Path to analyze (default: .)", false},
          {"dag_type", "string", "import or module", false}},
         {{"project_path", "path"}}},
        {"analyze_dead_code", "Functions never referenced from the analyzed sources",
         "analyze.dead-code",
         {{"project_path", "string", "Path to analyze (default: .)", false}},
         {{"project_path", "path"}}},
        {"analyze_defect_probability", "Defect probability per file from complexity and churn",
         "analyze.defect-prediction",
         {{"project_path", "string", "Path to analyze (default: .)", false}},
         {{"project_path", "path"}}},
        {"analyze_satd", "Self-admitted technical debt comments", "analyze.satd",
         {{"project_path", "string", "Path to analyze (default: .)", false}},
         {{"project_path", "path"}}},
        {"generate_context", "Project context for an assistant: files, symbols, hotspots",
         "context",
         {{"project_path", "string", "Path to analyze (default: .)", false},
          {"format", "string", "markdown or json (default: markdown)", false}},
         {{"project_path", "path"}}},
        {"refactor_start", "Start a refactor session over the given targets", "refactor.start",
         {{"targets", "array", "Files to refactor", true},
          {"config", "object", "Refactor configuration overrides", false}},
         {}},
        {"refactor_next_iteration", "Advance a refactor session by one step", "refactor.advance",
         {{"session_id", "string", "Session id", true}},
         {}},
        {"refactor_get_state", "State of a refactor session", "refactor.status",
         {{"session_id", "string", "Session id (default: most recent)", false}},
         {}},
        {"refactor_stop", "Stop a refactor session and delete its snapshot", "refactor.stop",
         {{"session_id", "string", "Session id", true}},
         {}},
    };
    return all;
}

const Tool* find_tool(const std::string& name) {
    for (const auto& t : tools()) {
        if (name == t.name) return &t;
    }
    return nullptr;
}

Json::Value input_schema(const Tool& tool) {
    Json::Value props(Json::objectValue);
    Json::Value required(Json::arrayValue);
    for (const auto& a : tool.args) {
        Json::Value p(Json::objectValue);
        p["type"] = a.type;
        p["description"] = a.description;
        if (std::string(a.type) == "array") p["items"]["type"] = "string";
        props[a.name] = p;
        if (a.required) required.append(a.name);
    }
    Json::Value schema(Json::objectValue);
    schema["type"] = "object";
    schema["properties"] = props;
    if (!required.empty()) schema["required"] = required;
    return schema;
}

Json::Value server_info() {
    Json::Value info(Json::objectValue);
    info["name"] = SERVER_NAME;
    info["version"] = version_string();
    info["description"] =
        "Project scaffolding, code analysis and refactoring over one request model";
    Json::Value toolchains(Json::arrayValue);
    for (const char* t : {"rust", "deno", "python-uv"}) toolchains.append(t);
    info["supportedToolchains"] = toolchains;
    return info;
}

// ---------------------------------------------------------------------------
// Prompts
// ---------------------------------------------------------------------------

struct PromptArg {
    const char* name;
    const char* description;
    bool required;
};

struct Prompt {
    const char* name;
    const char* toolchain;
    const char* description;
    std::vector<PromptArg> args;
};

const std::vector<Prompt>& prompts() {
    static const std::vector<Prompt> all = {
        {"scaffold-rust-project", "rust",
         "Create a complete Rust project structure with Makefile, README, and .gitignore",
         {{"project_name", "Name of the Rust project", true},
          {"project_type", "Type of project: cli or library-crate", true},
          {"has_tests", "Include test targets in Makefile", false},
          {"has_benchmarks", "Include benchmark targets in Makefile", false}}},
        {"scaffold-deno-project", "deno", "Create a complete Deno/TypeScript project structure",
         {{"project_name", "Name of the Deno project", true},
          {"project_type", "Type of project: cli or web-service", true},
          {"permissions", "Deno permissions needed (comma-separated)", false}}},
        {"scaffold-python-project", "python-uv", "Create a complete Python UV project structure",
         {{"project_name", "Name of the Python project", true},
          {"project_type", "Type of project: cli or library-package", true},
          {"python_version", "Python version to use (e.g., 3.12)", false}}},
    };
    return all;
}

Json::Value prompt_json(const Prompt& p) {
    Json::Value j(Json::objectValue);
    j["name"] = p.name;
    j["description"] = p.description;
    Json::Value args(Json::arrayValue);
    for (const auto& a : p.args) {
        Json::Value aj(Json::objectValue);
        aj["name"] = a.name;
        aj["description"] = a.description;
        aj["required"] = a.required;
        args.append(aj);
    }
    j["arguments"] = args;
    return j;
}

Result<Json::Value> handle_prompts_get(const Json::Value& params) {
    auto name = json::require_string(params, "name");
    if (name.is_err()) return std::move(name).error();
    const Json::Value& args = params["arguments"];
    if (!args.isNull() && !args.isObject()) {
        return PmatError::validation("arguments", "expected an object");
    }

    for (const auto& p : prompts()) {
        if (name.value() != p.name) continue;
        std::string text = std::string("Scaffold a new ") + p.toolchain + " project";
        if (args.isObject() && args.isMember("project_name")) {
            text += " named '" + args["project_name"].asString() + "'";
        }
        text += " using the scaffold_project tool with toolchain '" + std::string(p.toolchain) +
                "'.";
        for (const auto& a : p.args) {
            if (args.isObject() && args.isMember(a.name) && std::string(a.name) != "project_name") {
                text += "\n- " + std::string(a.name) + ": " + args[a.name].asString();
            }
        }

        Json::Value content(Json::objectValue);
        content["type"] = "text";
        content["text"] = text;
        Json::Value message(Json::objectValue);
        message["role"] = "user";
        message["content"] = content;

        Json::Value out = prompt_json(p);
        out["messages"] = Json::Value(Json::arrayValue);
        out["messages"].append(message);
        return Result<Json::Value>::ok(out);
    }
    return PmatError(PmatError::BadRequest, "unknown prompt: " + name.value());
}

// ---------------------------------------------------------------------------
// Tools
// ---------------------------------------------------------------------------

Result<Json::Value> handle_tools_call(const ProtocolService& service, const Json::Value& params,
                                      const CancelToken& cancel) {
    auto name = json::require_string(params, "name");
    if (name.is_err()) return std::move(name).error();

    if (name.value() == "get_server_info") {
        Json::Value out(Json::objectValue);
        out["content"] = Json::Value(Json::arrayValue);
        Json::Value text(Json::objectValue);
        text["type"] = "text";
        text["text"] = json::pretty(server_info());
        out["content"].append(text);
        out["result"] = server_info();
        return Result<Json::Value>::ok(out);
    }

    const Tool* tool = find_tool(name.value());
    if (!tool) return PmatError(PmatError::BadRequest, "unknown tool: " + name.value());

    const Json::Value& args = params["arguments"];
    if (!args.isNull() && !args.isObject()) {
        return PmatError::validation("arguments", "expected an object");
    }
    Json::Value method_params(Json::objectValue);
    if (args.isObject()) {
        for (const auto& key : args.getMemberNames()) {
            std::string target = key;
            for (const auto& r : tool->renames) {
                if (key == r.first) target = r.second;
            }
            method_params[target] = args[key];
        }
    }

    UnifiedRequest req = UnifiedRequest::make(tool->method, method_params, Source::Rpc);
    req.deadline = cancel.deadline();
    UnifiedResponse resp = service.handle(std::move(req));
    if (!resp.ok) return *resp.error;

    Json::Value text(Json::objectValue);
    text["type"] = "text";
    if (resp.body.isObject() && resp.body["content"].isString()) {
        text["text"] = resp.body["content"];
    } else {
        text["text"] = json::pretty(resp.body);
    }
    Json::Value out(Json::objectValue);
    out["content"] = Json::Value(Json::arrayValue);
    out["content"].append(text);
    out["isError"] = false;
    out["result"] = resp.body;
    return Result<Json::Value>::ok(out);
}

} // namespace

void register_mcp_handlers(ProtocolService& service, AppContext& ctx) {
    AppContext* app = &ctx;
    const ProtocolService* svc = &service;

    service.add("initialize", [](const Json::Value& params, const CancelToken&) {
        auto version = json::get_string(params, "protocolVersion", DEFAULT_PROTOCOL_VERSION);
        if (version.is_err()) return Result<Json::Value>(std::move(version).error());

        Json::Value caps(Json::objectValue);
        caps["tools"] = Json::Value(Json::objectValue);
        caps["resources"] = Json::Value(Json::objectValue);
        caps["prompts"] = Json::Value(Json::objectValue);

        Json::Value out(Json::objectValue);
        out["protocolVersion"] = version.value();
        out["capabilities"] = caps;
        out["serverInfo"] = server_info();
        return Result<Json::Value>::ok(out);
    });

    service.add("tools/list", [](const Json::Value&, const CancelToken&) {
        Json::Value list(Json::arrayValue);
        Json::Value info(Json::objectValue);
        info["name"] = "get_server_info";
        info["description"] = "Name, version and capabilities of this server";
        info["inputSchema"]["type"] = "object";
        info["inputSchema"]["properties"] = Json::Value(Json::objectValue);
        list.append(info);
        for (const auto& t : tools()) {
            Json::Value tj(Json::objectValue);
            tj["name"] = t.name;
            tj["description"] = t.description;
            tj["inputSchema"] = input_schema(t);
            list.append(tj);
        }
        Json::Value out(Json::objectValue);
        out["tools"] = list;
        return Result<Json::Value>::ok(out);
    });

    service.add("tools/call", [svc](const Json::Value& params, const CancelToken& cancel) {
        return handle_tools_call(*svc, params, cancel);
    });

    service.add("prompts/list", [](const Json::Value&, const CancelToken&) {
        Json::Value list(Json::arrayValue);
        for (const auto& p : prompts()) list.append(prompt_json(p));
        Json::Value out(Json::objectValue);
        out["prompts"] = list;
        return Result<Json::Value>::ok(out);
    });

    service.add("prompts/get", [](const Json::Value& params, const CancelToken&) {
        return handle_prompts_get(params);
    });

    service.add("resources/list", [app](const Json::Value&, const CancelToken&) {
        Json::Value list(Json::arrayValue);
        for (const auto& t : app->templates().list()) {
            Json::Value r(Json::objectValue);
            r["uri"] = t->uri;
            r["name"] = t->toolchain + "/" + t->category + "/" + t->name;
            r["description"] = t->description;
            r["mimeType"] = "text/plain";
            list.append(r);
        }
        Json::Value out(Json::objectValue);
        out["resources"] = list;
        return Result<Json::Value>::ok(out);
    });

    service.add("resources/read", [app](const Json::Value& params, const CancelToken&) {
        auto uri = json::require_string(params, "uri");
        if (uri.is_err()) return Result<Json::Value>(std::move(uri).error());
        auto tmpl = app->templates().find(uri.value());
        if (tmpl.is_err()) return Result<Json::Value>(std::move(tmpl).error());

        Json::Value c(Json::objectValue);
        c["uri"] = tmpl.value()->uri;
        c["mimeType"] = "text/plain";
        c["text"] = tmpl.value()->content;
        Json::Value out(Json::objectValue);
        out["contents"] = Json::Value(Json::arrayValue);
        out["contents"].append(c);
        return Result<Json::Value>::ok(out);
    });

    // Sent by clients after initialize; nothing to do
    service.add("notifications/initialized", [](const Json::Value&, const CancelToken&) {
        return Result<Json::Value>::ok(Json::Value(Json::nullValue));
    });

    log::trace("registered %zu MCP tools and %zu prompts", tools().size() + 1, prompts().size());
}

} // namespace pmat::protocol
