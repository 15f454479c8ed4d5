#include <pmat/protocol/cli_adapter.hpp>
#include <pmat/analysis/kind.hpp>
#include <pmat/app_context.hpp>
#include <pmat/json.hpp>
#include <pmat/log.hpp>
#include <pmat/protocol/http_adapter.hpp>
#include <pmat/protocol/rpc_adapter.hpp>
#include <pmat/refactor/snapshot_store.hpp>

#include <CLI/CLI.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <iomanip>
#include <istream>
#include <ostream>
#include <sstream>

namespace fs = std::filesystem;

namespace pmat::protocol {

namespace {

// "42" -> 42, "true" -> true, "0.5" -> 0.5, anything else stays a string
Json::Value option_value(const std::string& text) {
    auto parsed = json::parse(text);
    if (parsed.is_ok() && (parsed.value().isNumeric() || parsed.value().isBool())) {
        return parsed.value();
    }
    return Json::Value(text);
}

std::optional<std::string> key_values(const std::vector<std::string>& pairs, Json::Value& out,
                                      bool typed) {
    for (const auto& kv : pairs) {
        size_t eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) return kv;
        std::string value = kv.substr(eq + 1);
        out[kv.substr(0, eq)] = typed ? option_value(value) : Json::Value(value);
    }
    return std::nullopt;
}

std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream in(s);
    std::string item;
    while (std::getline(in, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

// refactor-<id>.json names a snapshot file inside the checkpoint directory
std::string session_from_checkpoint(const std::string& checkpoint) {
    fs::path p(checkpoint);
    if (p.extension() != ".json") return "";
    std::string stem = p.stem().string();
    const std::string prefix = "refactor-";
    return stem.rfind(prefix, 0) == 0 ? stem.substr(prefix.size()) : "";
}

YAML::Node yaml_from_json(const Json::Value& v) {
    switch (v.type()) {
        case Json::objectValue: {
            YAML::Node node(YAML::NodeType::Map);
            for (const auto& key : v.getMemberNames()) node[key] = yaml_from_json(v[key]);
            return node;
        }
        case Json::arrayValue: {
            YAML::Node node(YAML::NodeType::Sequence);
            for (const auto& item : v) node.push_back(yaml_from_json(item));
            return node;
        }
        case Json::booleanValue: return YAML::Node(v.asBool());
        case Json::intValue: return YAML::Node(static_cast<long long>(v.asInt64()));
        case Json::uintValue: return YAML::Node(static_cast<unsigned long long>(v.asUInt64()));
        case Json::realValue: return YAML::Node(v.asDouble());
        case Json::stringValue: return YAML::Node(v.asString());
        case Json::nullValue: break;
    }
    return YAML::Node(YAML::NodeType::Null);
}

std::string emit_yaml(const Json::Value& v) {
    YAML::Emitter emitter;
    emitter << yaml_from_json(v);
    return std::string(emitter.c_str()) + "\n";
}

std::string template_table(const Json::Value& rows) {
    std::ostringstream out;
    out << std::left << std::setw(42) << "URI" << std::setw(11) << "TOOLCHAIN" << std::setw(10)
        << "VERSION" << "DESCRIPTION\n";
    for (const auto& t : rows) {
        out << std::setw(42) << t["uri"].asString() << std::setw(11) << t["toolchain"].asString()
            << std::setw(10) << t["version"].asString() << t["description"].asString() << "\n";
    }
    return out.str();
}

std::string scalar_text(const Json::Value& v) {
    if (v.isString()) return v.asString();
    return json::compact(v);
}

// Two-column key/value listing of an object's scalar members
std::string object_table(const Json::Value& obj) {
    std::ostringstream out;
    for (const auto& key : obj.getMemberNames()) {
        const Json::Value& v = obj[key];
        if (v.isObject() || v.isArray()) continue;
        out << std::left << std::setw(28) << key << scalar_text(v) << "\n";
    }
    return out.str();
}

void print_error(std::ostream& err, const PmatError& e) {
    err << "error[" << PmatError::code_name(e.code) << "]: " << e.message;
    if (!e.hint.empty()) err << " (hint: " << e.hint << ")";
    err << "\n";
}

int fail(std::ostream& err, const PmatError& e) {
    print_error(err, e);
    return e.exit_code();
}

int write_generated(const CliInvocation& inv, const Json::Value& body, std::ostream& out,
                    std::ostream& err) {
    if (inv.output_path.empty()) {
        out << body["content"].asString();
        return 0;
    }
    fs::path target(inv.output_path);
    fs::path parent = target.parent_path();
    std::error_code ec;
    if (!parent.empty() && !fs::is_directory(parent, ec) && !inv.create_dirs) {
        return fail(err, PmatError(PmatError::IO, "directory does not exist: " + parent.string(),
                                   "pass --create-dirs to create it"));
    }
    auto st = refactor::write_file_atomic(target, body["content"].asString());
    if (st.is_err()) return fail(err, st.error());
    log::info("wrote %s (sha256 %s)", target.c_str(), body["checksum"].asString().c_str());
    return 0;
}

int write_scaffold(const CliInvocation& inv, const Json::Value& body, std::ostream& out,
                   std::ostream& err) {
    for (const auto& f : body["files"]) {
        fs::path target = fs::path(inv.output_dir) / f["path"].asString();
        auto st = refactor::write_file_atomic(target, f["content"].asString());
        if (st.is_err()) return fail(err, st.error());
        out << "created " << target.string() << "\n";
    }
    for (const auto& e : body["errors"]) {
        err << "warning: " << e["template"].asString() << ": "
            << e["error"]["message"].asString() << "\n";
    }
    return body["errors"].empty() ? 0 : 1;
}

int serve_refactor(AppContext& ctx, const CliInvocation& inv, std::ostream& out,
                   std::ostream& err) {
    const Json::Value& p = inv.request.params;
    bool has_targets = p.isMember("targets") && !p["targets"].empty();
    UnifiedRequest first = UnifiedRequest::make(has_targets ? "refactor.start" : "refactor.resume",
                                                p, Source::Cli);
    UnifiedResponse resp = ctx.dispatch(std::move(first));
    if (!resp.ok) return fail(err, *resp.error);

    std::string id = resp.body["session_id"].asString();
    Json::Value status = resp.body;
    while (status["current_phase"].asString() != "done" &&
           status["current_phase"].asString() != "failed" && !status["paused"].asBool()) {
        Json::Value params(Json::objectValue);
        params["session_id"] = id;
        UnifiedResponse step = ctx.dispatch(UnifiedRequest::make("refactor.advance", params,
                                                                 Source::Cli));
        if (!step.ok) return fail(err, *step.error);
        status = step.body;
        log::info("refactor %s: %s", id.c_str(), status["current_phase"].asString().c_str());
    }
    out << render_output("refactor.status", status, inv.format);
    return 0;
}

} // namespace

std::string render_output(const std::string& method, const Json::Value& body,
                          const std::string& format) {
    if (format == "yaml") return emit_yaml(body);
    if (format == "markdown" && body.isObject() && body["content"].isString()) {
        return body["content"].asString();
    }
    if (format == "table") {
        if ((method == "list" || method == "search") && body.isArray()) {
            return template_table(body);
        }
        if (body.isObject() && body["summary"].isObject()) return object_table(body["summary"]);
        if (body.isObject()) return object_table(body);
    }
    return json::pretty(body) + "\n";
}

std::optional<int> parse_cli(const std::vector<std::string>& args, CliInvocation& inv,
                             std::ostream& out, std::ostream& err) {
    CLI::App app{"pmat: project scaffolding, code analysis and refactoring"};
    app.set_version_flag("--version", version_string());

    bool mcp = false;
    app.add_flag("--mcp", mcp, "Serve JSON-RPC on stdin/stdout");
    app.add_flag("-v,--verbose", inv.verbosity, "Log verbosity (-v debug, -vv trace)");
    app.add_option("--config", inv.config_path, "Configuration file (TOML)");
    app.add_option("--root", inv.project_root, "Project root for relative paths");
    app.require_subcommand(0, 1);

    std::vector<std::string> params;
    std::string toolchain, category, format;

    auto* list = app.add_subcommand("list", "List templates");
    list->add_option("--toolchain", toolchain, "rust, deno or python-uv");
    list->add_option("--category", category, "makefile, readme, gitignore, cargo");
    list->add_option("--format", format, "table, json or yaml")
        ->check(CLI::IsMember({"table", "json", "yaml"}));

    std::string query;
    int64_t limit = 0;
    auto* search = app.add_subcommand("search", "Search templates");
    search->add_option("query", query, "Search text")->required();
    search->add_option("--toolchain", toolchain, "Toolchain filter");
    search->add_option("--limit", limit, "Maximum results");
    search->add_option("--format", format, "table, json or yaml")
        ->check(CLI::IsMember({"table", "json", "yaml"}));

    std::vector<std::string> names;
    auto* generate = app.add_subcommand("generate", "Render one template");
    generate->add_option("template", names,
                         "<category> <template>, <toolchain>/<name>, or a template uri")
        ->required()->expected(1, 2);
    generate->add_option("-p,--param", params, "Template parameter key=value");
    generate->add_option("-o,--output", inv.output_path, "Write to this file");
    generate->add_flag("--create-dirs", inv.create_dirs, "Create missing parent directories");

    std::string templates_list;
    int64_t parallel = 1;
    auto* scaffold = app.add_subcommand("scaffold", "Generate a toolchain's templates");
    scaffold->add_option("toolchain", toolchain, "rust, deno or python-uv")->required();
    scaffold->add_option("--templates", templates_list, "Comma separated categories or names");
    scaffold->add_option("-p,--param", params, "Template parameter key=value");
    scaffold->add_option("--parallel", parallel, "Concurrent renders")
        ->check(CLI::PositiveNumber);
    scaffold->add_option("--output-dir", inv.output_dir, "Directory for the project folder");

    std::string uri;
    auto* validate = app.add_subcommand("validate", "Check template parameters");
    validate->add_option("uri", uri, "Template uri or <toolchain>/<name>")->required();
    validate->add_option("-p,--param", params, "Template parameter key=value");

    std::string path = ".";
    bool large = false;
    auto* context = app.add_subcommand("context", "Project context for an assistant");
    context->add_option("-p,--path", path, "Project path");
    context->add_option("--format", format, "markdown or json")
        ->check(CLI::IsMember({"markdown", "json"}));
    context->add_flag("--include-large-files", large, "Do not skip large files");

    std::string kind;
    std::vector<std::string> includes, options;
    auto* analyze = app.add_subcommand("analyze", "Run one analysis");
    analyze->add_option("kind", kind, "complexity, dead-code, satd, dag, churn, ...")->required();
    analyze->add_option("path", path, "File or directory (default: .)");
    analyze->add_option("--include", includes, "Glob of files to include");
    analyze->add_option("--set", options, "Analyzer option key=value");
    analyze->add_option("--format", format, "json, yaml or table")
        ->check(CLI::IsMember({"table", "json", "yaml"}));
    analyze->add_flag("--include-large-files", large, "Do not skip large files");

    std::string action, session;
    std::vector<std::string> targets;
    auto* refactor_cmd = app.add_subcommand("refactor", "Refactor sessions");
    refactor_cmd->add_option("action", action, "serve, status, stop or resume")
        ->required()->check(CLI::IsMember({"serve", "status", "stop", "resume"}));
    refactor_cmd->add_option("targets", targets, "Files to refactor (serve)");
    refactor_cmd->add_option("--checkpoint", inv.checkpoint,
                             "Checkpoint directory or snapshot file");
    refactor_cmd->add_option("--session", session, "Session id");
    refactor_cmd->add_option("--set", options, "Refactor option key=value (serve)");
    refactor_cmd->add_option("--format", format, "json, yaml or table")
        ->check(CLI::IsMember({"table", "json", "yaml"}));

    std::string protocol = "cli";
    bool no_browser = false;
    auto* demo = app.add_subcommand("demo", "Run the analyses over a project");
    demo->add_option("--path", path, "Project path");
    demo->add_option("--protocol", protocol, "cli, http or rpc")
        ->check(CLI::IsMember({"cli", "http", "rpc"}));
    demo->add_option("--port", inv.port, "HTTP port");
    demo->add_flag("--no-browser", no_browser, "Accepted for compatibility");

    auto* serve = app.add_subcommand("serve", "Serve the HTTP surface");
    serve->add_option("--port", inv.port, "Port (0 picks a free one)");

    std::vector<const char*> argv;
    argv.push_back("pmat");
    for (const auto& a : args) argv.push_back(a.c_str());
    try {
        app.parse(static_cast<int>(argv.size()), argv.data());
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e, out, err);
        return code == 0 ? 0 : 2;
    }

    if (mcp) {
        inv.mode = CliMode::Rpc;
        return std::nullopt;
    }
    if (app.get_subcommands().empty()) {
        err << app.help();
        return 2;
    }

    Json::Value p(Json::objectValue);
    auto usage = [&err](const std::string& msg) {
        err << "error[BadRequest]: " << msg << "\n";
        return std::optional<int>(2);
    };
    auto set_params = [&](bool typed) -> std::optional<int> {
        Json::Value kv(Json::objectValue);
        if (auto bad = key_values(params, kv, typed)) return usage("expected key=value, got '" + *bad + "'");
        if (!kv.empty()) p["parameters"] = kv;
        return std::nullopt;
    };
    auto finish = [&](const std::string& method, const std::string& default_format) {
        inv.request = UnifiedRequest::make(method, p, Source::Cli);
        inv.format = format.empty() ? default_format : format;
        return std::optional<int>();
    };

    if (list->parsed()) {
        if (!toolchain.empty()) p["toolchain"] = toolchain;
        if (!category.empty()) p["category"] = category;
        return finish("list", "table");
    }
    if (search->parsed()) {
        p["query"] = query;
        if (!toolchain.empty()) p["toolchain"] = toolchain;
        if (limit > 0) p["limit"] = Json::Int64(limit);
        return finish("search", "table");
    }
    if (generate->parsed()) {
        if (auto code = set_params(false)) return code;
        if (names.size() == 2) {
            p["category"] = names[0];
            p["template"] = names[1];
        } else {
            p["template"] = names[0];
        }
        return finish("generate", "json");
    }
    if (scaffold->parsed()) {
        if (auto code = set_params(false)) return code;
        p["toolchain"] = toolchain;
        p["templates"] = json::string_array(split_list(templates_list));
        p["parallel"] = Json::Int64(parallel);
        inv.write_files = true;
        return finish("scaffold", "json");
    }
    if (validate->parsed()) {
        if (auto code = set_params(false)) return code;
        p["uri"] = uri;
        return finish("validate", "json");
    }
    if (context->parsed()) {
        p["path"] = path;
        p["format"] = format.empty() ? "markdown" : format;
        if (large) p["include_large_files"] = true;
        return finish("context", p["format"].asString());
    }
    if (analyze->parsed()) {
        auto parsed_kind = analysis::parse_kind(kind);
        if (!parsed_kind) return usage("unknown analysis kind '" + kind + "'");
        if (auto bad = key_values(options, p, true)) {
            return usage("expected key=value, got '" + *bad + "'");
        }
        p["path"] = path;
        if (!includes.empty()) p["include"] = json::string_array(includes);
        if (large) p["include_large_files"] = true;
        return finish(std::string("analyze.") + analysis::kind_name(*parsed_kind), "json");
    }
    if (refactor_cmd->parsed()) {
        if (session.empty()) session = session_from_checkpoint(inv.checkpoint);
        if (!session.empty()) p["session_id"] = session;
        if (action == "serve") {
            Json::Value config(Json::objectValue);
            if (auto bad = key_values(options, config, true)) {
                return usage("expected key=value, got '" + *bad + "'");
            }
            if (!targets.empty()) {
                p["targets"] = json::string_array(targets);
                p["config"] = config;
            }
            inv.mode = CliMode::RefactorServe;
            inv.request = UnifiedRequest::make("refactor.serve", p, Source::Cli);
            inv.format = format.empty() ? "json" : format;
            return std::nullopt;
        }
        if (action == "stop" && session.empty()) {
            return usage("refactor stop needs --session or a snapshot file as --checkpoint");
        }
        return finish("refactor." + action, "json");
    }
    if (demo->parsed()) {
        if (protocol == "rpc") {
            inv.mode = CliMode::Rpc;
            return std::nullopt;
        }
        if (protocol == "http") {
            inv.mode = CliMode::Http;
            return std::nullopt;
        }
        p["path"] = path;
        return finish("demo", "json");
    }
    if (serve->parsed()) {
        inv.mode = CliMode::Http;
        return std::nullopt;
    }
    return usage("unknown command");
}

void apply_cli_overrides(const CliInvocation& inv, Config& config) {
    if (!inv.checkpoint.empty()) {
        fs::path p(inv.checkpoint);
        config.refactor.checkpoint_dir =
            p.extension() == ".json" ? p.parent_path().string() : p.string();
        if (config.refactor.checkpoint_dir.empty()) config.refactor.checkpoint_dir = ".";
    }
    if (inv.port) config.server.port = *inv.port;
}

int run_cli(AppContext& ctx, const CliInvocation& inv, std::istream& in, std::ostream& out,
            std::ostream& err) {
    switch (inv.mode) {
        case CliMode::Rpc: {
            RpcAdapter rpc(ctx.service());
            rpc.serve(in, out);
            return 0;
        }
        case CliMode::Http: {
            HttpServer server(ctx.service(), ctx.config().server);
            auto st = server.start();
            if (st.is_err()) return fail(err, st.error());
            err << "listening on http://" << ctx.config().server.host << ":" << server.port()
                << "\n";
            server.run();
            return 0;
        }
        case CliMode::RefactorServe:
            return serve_refactor(ctx, inv, out, err);
        case CliMode::Request:
            break;
    }

    UnifiedResponse resp = ctx.dispatch(inv.request);
    if (!resp.ok) return fail(err, *resp.error);

    if (inv.request.method == "generate") return write_generated(inv, resp.body, out, err);
    if (inv.request.method == "scaffold" && inv.write_files) {
        return write_scaffold(inv, resp.body, out, err);
    }
    if (inv.request.method == "validate" && !resp.body["valid"].asBool()) {
        out << render_output(inv.request.method, resp.body, inv.format);
        return 1;
    }
    out << render_output(inv.request.method, resp.body, inv.format);
    return 0;
}

} // namespace pmat::protocol
