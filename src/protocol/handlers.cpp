#include <pmat/protocol/handlers.hpp>
#include <pmat/app_context.hpp>
#include <pmat/glob.hpp>
#include <pmat/json.hpp>
#include <pmat/log.hpp>

#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace pmat::protocol {

using analysis::AnalysisKind;

namespace {

Result<templates::TemplateParams> template_params(const Json::Value& params) {
    if (!params.isMember("parameters") || params["parameters"].isNull()) {
        return Result<templates::TemplateParams>::ok({});
    }
    if (!params["parameters"].isObject()) {
        return PmatError::validation("parameters", "expected an object");
    }
    return json::string_pairs(params["parameters"]);
}

// ---------------------------------------------------------------------------
// Templates
// ---------------------------------------------------------------------------

Result<Json::Value> handle_list(AppContext& ctx, const Json::Value& params) {
    auto toolchain = json::get_string(params, "toolchain");
    if (toolchain.is_err()) return std::move(toolchain).error();
    auto category = json::get_string(params, "category");
    if (category.is_err()) return std::move(category).error();

    Json::Value out(Json::arrayValue);
    for (const auto& t : ctx.templates().list(toolchain.value(), category.value())) {
        out.append(templates::to_json(*t));
    }
    return Result<Json::Value>::ok(out);
}

Result<Json::Value> handle_search(AppContext& ctx, const Json::Value& params) {
    auto query = json::require_string(params, "query");
    if (query.is_err()) return std::move(query).error();
    auto toolchain = json::get_string(params, "toolchain");
    if (toolchain.is_err()) return std::move(toolchain).error();
    auto limit = json::get_int(params, "limit", 0);
    if (limit.is_err()) return std::move(limit).error();
    if (limit.value() < 0) return PmatError::validation("limit", "must not be negative");

    Json::Value out(Json::arrayValue);
    for (const auto& hit : ctx.templates().search(query.value(), toolchain.value(),
                                                  static_cast<size_t>(limit.value()))) {
        Json::Value h = templates::to_json(*hit.tmpl);
        h["relevance"] = hit.relevance;
        h["matches"] = json::string_array(hit.matches);
        out.append(h);
    }
    return Result<Json::Value>::ok(out);
}

Result<Json::Value> handle_generate(AppContext& ctx, const Json::Value& params) {
    auto spec = json::get_string(params, "template");
    if (spec.is_err()) return std::move(spec).error();
    std::string name = spec.value();
    if (name.empty()) {
        auto uri = json::require_string(params, "uri");
        if (uri.is_err()) {
            return PmatError::validation("template", "a template name or uri is required");
        }
        name = uri.value();
    }
    auto category = json::get_string(params, "category");
    if (category.is_err()) return std::move(category).error();
    auto vars = template_params(params);
    if (vars.is_err()) return std::move(vars).error();

    auto tmpl = ctx.templates().resolve(name, category.value());
    if (tmpl.is_err()) return std::move(tmpl).error();
    auto file = ctx.templates().generate(tmpl.value()->uri, vars.value());
    if (file.is_err()) return std::move(file).error();
    return Result<Json::Value>::ok(templates::to_json(file.value()));
}

Result<Json::Value> handle_scaffold(AppContext& ctx, const Json::Value& params) {
    auto toolchain = json::require_string(params, "toolchain");
    if (toolchain.is_err()) return std::move(toolchain).error();
    auto names = json::get_string_list(params, "templates");
    if (names.is_err()) return std::move(names).error();
    auto parallel = json::get_int(params, "parallel", 1);
    if (parallel.is_err()) return std::move(parallel).error();
    if (parallel.value() < 1) return PmatError::validation("parallel", "must be at least 1");
    auto vars = template_params(params);
    if (vars.is_err()) return std::move(vars).error();

    auto result = ctx.templates().scaffold(toolchain.value(), names.value(), vars.value(),
                                           static_cast<size_t>(parallel.value()));
    if (result.is_err()) return std::move(result).error();

    Json::Value files(Json::arrayValue);
    for (const auto& f : result.value().files) files.append(templates::to_json(f));
    Json::Value errors(Json::arrayValue);
    for (const auto& failure : result.value().errors) {
        Json::Value e(Json::objectValue);
        e["template"] = failure.template_name;
        e["error"] = error_object(failure.error);
        errors.append(e);
    }
    Json::Value out(Json::objectValue);
    out["toolchain"] = toolchain.value();
    out["files"] = files;
    out["errors"] = errors;
    return Result<Json::Value>::ok(out);
}

Result<Json::Value> handle_validate(AppContext& ctx, const Json::Value& params) {
    auto uri = json::require_string(params, "uri");
    if (uri.is_err()) return std::move(uri).error();
    auto vars = template_params(params);
    if (vars.is_err()) return std::move(vars).error();

    auto tmpl = ctx.templates().resolve(uri.value());
    if (tmpl.is_err()) return std::move(tmpl).error();
    auto issues = ctx.templates().validate(tmpl.value()->uri, vars.value());
    if (issues.is_err()) return std::move(issues).error();

    Json::Value errors(Json::arrayValue);
    for (const auto& issue : issues.value()) {
        Json::Value e(Json::objectValue);
        e["parameter"] = issue.parameter;
        e["reason"] = issue.reason;
        errors.append(e);
    }
    Json::Value out(Json::objectValue);
    out["uri"] = tmpl.value()->uri;
    out["valid"] = issues.value().empty();
    out["errors"] = errors;
    return Result<Json::Value>::ok(out);
}

// ---------------------------------------------------------------------------
// Analysis
// ---------------------------------------------------------------------------

// Keys consumed here rather than passed on to the analyzer
bool is_input_key(const std::string& key) {
    return key == "path" || key == "include" || key == "include_large_files";
}

Result<analysis::ResultPtr> run_analysis(AppContext& ctx, AnalysisKind kind,
                                         const Json::Value& params, const CancelToken& cancel) {
    auto path = json::get_string(params, "path", ".");
    if (path.is_err()) return std::move(path).error();
    auto include = json::get_string_list(params, "include");
    if (include.is_err()) return std::move(include).error();
    auto large = json::get_bool(params, "include_large_files", false);
    if (large.is_err()) return std::move(large).error();

    std::string root = ctx.resolve_path(path.value());
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return PmatError(PmatError::NotFound, "path does not exist: " + root);
    }

    DiscoverOptions discover;
    discover.patterns = include.value();
    if (large.value()) discover.max_file_bytes = 0;
    auto files = discover_files(root, discover);
    if (files.is_err()) return std::move(files).error();

    Json::Value options(Json::objectValue);
    for (const auto& key : params.getMemberNames()) {
        if (!is_input_key(key)) options[key] = params[key];
    }

    // A regular file is analyzed from its parent directory
    std::string job_root = root;
    if (fs::is_regular_file(root, ec)) job_root = fs::path(root).parent_path().string();
    if (job_root.empty()) job_root = ".";
    return ctx.scheduler().submit(kind, job_root, std::move(files).value(), options, cancel);
}

Result<Json::Value> handle_analyze(AppContext& ctx, AnalysisKind kind, const Json::Value& params,
                                   const CancelToken& cancel) {
    auto result = run_analysis(ctx, kind, params, cancel);
    if (result.is_err()) return std::move(result).error();
    Json::Value out = *result.value();
    out["kind"] = analysis::kind_name(kind);
    return Result<Json::Value>::ok(out);
}

Result<Json::Value> handle_context(AppContext& ctx, const Json::Value& params,
                                   const CancelToken& cancel) {
    auto format = json::get_string(params, "format", "markdown");
    if (format.is_err()) return std::move(format).error();
    if (format.value() != "markdown" && format.value() != "json") {
        return PmatError::validation("format", "expected markdown or json");
    }
    auto result = run_analysis(ctx, AnalysisKind::DeepContext, params, cancel);
    if (result.is_err()) return std::move(result).error();

    if (format.value() == "json") return Result<Json::Value>::ok(*result.value());
    Json::Value out(Json::objectValue);
    out["format"] = "markdown";
    out["content"] = render_context_markdown(*result.value());
    return Result<Json::Value>::ok(out);
}

// ---------------------------------------------------------------------------
// Refactor
// ---------------------------------------------------------------------------

Result<Json::Value> session_json(Result<refactor::RefactorStateMachine> sm) {
    if (sm.is_err()) return std::move(sm).error();
    return Result<Json::Value>::ok(sm.value().status_json());
}

Result<Json::Value> handle_refactor_start(AppContext& ctx, const Json::Value& params) {
    auto targets = json::get_string_list(params, "targets");
    if (targets.is_err()) return std::move(targets).error();
    Json::Value config = params.isMember("config") ? params["config"] : Json::Value(Json::objectValue);
    if (!config.isObject()) return PmatError::validation("config", "expected an object");

    std::vector<std::string> resolved;
    for (const auto& t : targets.value()) resolved.push_back(ctx.resolve_path(t));
    return session_json(ctx.sessions().start(resolved, config));
}

Result<Json::Value> handle_refactor_advance(AppContext& ctx, const Json::Value& params) {
    auto id = json::require_string(params, "session_id");
    if (id.is_err()) return std::move(id).error();
    return session_json(ctx.sessions().advance(id.value()));
}

Result<Json::Value> handle_refactor_status(AppContext& ctx, const Json::Value& params) {
    auto id = json::get_string(params, "session_id");
    if (id.is_err()) return std::move(id).error();
    return session_json(ctx.sessions().status(id.value()));
}

Result<Json::Value> handle_refactor_stop(AppContext& ctx, const Json::Value& params) {
    auto id = json::require_string(params, "session_id");
    if (id.is_err()) return std::move(id).error();
    PMAT_TRY(ctx.sessions().stop(id.value()));
    Json::Value out(Json::objectValue);
    out["session_id"] = id.value();
    out["stopped"] = true;
    return Result<Json::Value>::ok(out);
}

Result<Json::Value> handle_refactor_resume(AppContext& ctx, const Json::Value& params) {
    auto id = json::get_string(params, "session_id");
    if (id.is_err()) return std::move(id).error();
    return session_json(ctx.sessions().resume(id.value()));
}

// ---------------------------------------------------------------------------
// Demo and cache
// ---------------------------------------------------------------------------

Result<Json::Value> handle_demo(AppContext& ctx, const Json::Value& params,
                                const CancelToken& cancel) {
    Json::Value input(Json::objectValue);
    input["path"] = params.get("path", ".");

    Json::Value out(Json::objectValue);
    out["version"] = version_string();
    out["templates"] = static_cast<Json::UInt64>(ctx.templates().size());

    Json::Value analyses(Json::objectValue);
    for (AnalysisKind kind : {AnalysisKind::Complexity, AnalysisKind::Satd, AnalysisKind::Dag,
                              AnalysisKind::DeepContext}) {
        auto r = run_analysis(ctx, kind, input, cancel);
        if (r.is_err()) {
            analyses[analysis::kind_name(kind)]["error"] = error_object(r.error());
            continue;
        }
        const Json::Value& body = *r.value();
        if (kind == AnalysisKind::Dag) {
            Json::Value dag(Json::objectValue);
            dag["node_count"] = body["node_count"];
            dag["edge_count"] = body["edge_count"];
            dag["has_cycles"] = body["has_cycles"];
            analyses["dag"] = dag;
        } else if (kind == AnalysisKind::DeepContext) {
            analyses["deep-context"] = body["project"];
        } else {
            analyses[analysis::kind_name(kind)] = body["summary"];
        }
    }
    out["analyses"] = analyses;
    out["cache"] = ctx.caches().diagnostics(3);
    return Result<Json::Value>::ok(out);
}

Result<Json::Value> handle_cache_clear(AppContext& ctx) {
    auto before = ctx.caches().totals();
    ctx.caches().clear_all();
    Json::Value out(Json::objectValue);
    out["cleared"] = true;
    out["bytes_freed"] = Json::Int64(before.total_bytes);
    return Result<Json::Value>::ok(out);
}

} // namespace

std::string render_context_markdown(const Json::Value& c) {
    std::ostringstream md;
    const Json::Value& p = c["project"];
    md << "# Project Context: " << p["root"].asString() << "\n\n";
    md << "## Summary\n\n";
    md << "- Files: " << p["total_files"].asInt() << "\n";
    md << "- Lines: " << p["total_lines"].asInt() << "\n";
    md << "- Functions: " << p["total_functions"].asInt() << "\n";
    md << "- Technical debt items: " << p["satd_items"].asInt() << "\n";

    const Json::Value& langs = p["languages"];
    if (!langs.empty()) {
        md << "\n## Languages\n\n| Language | Files | Lines |\n|---|---|---|\n";
        for (const auto& name : langs.getMemberNames()) {
            md << "| " << name << " | " << langs[name]["files"].asInt() << " | "
               << langs[name]["lines"].asInt() << " |\n";
        }
    }

    if (!c["hotspots"].empty()) {
        md << "\n## Complexity Hotspots\n\n| Function | Location | Cyclomatic | Cognitive |\n"
           << "|---|---|---|---|\n";
        for (const auto& h : c["hotspots"]) {
            md << "| `" << h["function"].asString() << "` | " << h["path"].asString() << ":"
               << h["line"].asInt() << " | " << h["cyclomatic"].asInt() << " | "
               << h["cognitive"].asInt() << " |\n";
        }
    }

    const Json::Value& deps = c["dependencies"];
    md << "\n## Dependencies\n\n";
    md << "- Modules: " << deps["node_count"].asInt() << "\n";
    md << "- Edges: " << deps["edge_count"].asInt() << "\n";
    md << "- Cycles: " << (deps["has_cycles"].asBool() ? "yes" : "no") << "\n";

    md << "\n## Files\n\n";
    for (const auto& f : c["files"]) {
        md << "### " << f["path"].asString() << "\n\n";
        md << "- Language: " << f["language"].asString() << ", " << f["lines"].asInt()
           << " lines, max cyclomatic " << f["max_cyclomatic"].asInt() << "\n";
        if (!f["symbols"].empty()) {
            md << "- Functions:";
            for (const auto& s : f["symbols"]) md << " `" << s.asString() << "`";
            md << "\n";
        }
        md << "\n";
    }
    return md.str();
}

void register_core_handlers(ProtocolService& service, AppContext& ctx) {
    AppContext* app = &ctx;

    service.add("list", [app](const Json::Value& p, const CancelToken&) {
        return handle_list(*app, p);
    });
    service.add("search", [app](const Json::Value& p, const CancelToken&) {
        return handle_search(*app, p);
    });
    service.add("generate", [app](const Json::Value& p, const CancelToken&) {
        return handle_generate(*app, p);
    });
    service.add("scaffold", [app](const Json::Value& p, const CancelToken&) {
        return handle_scaffold(*app, p);
    });
    service.add("validate", [app](const Json::Value& p, const CancelToken&) {
        return handle_validate(*app, p);
    });
    service.add("context", [app](const Json::Value& p, const CancelToken& cancel) {
        return handle_context(*app, p, cancel);
    });

    for (AnalysisKind kind : analysis::all_kinds()) {
        service.add(std::string("analyze.") + analysis::kind_name(kind),
                    [app, kind](const Json::Value& p, const CancelToken& cancel) {
                        return handle_analyze(*app, kind, p, cancel);
                    });
    }

    service.add("refactor.start", [app](const Json::Value& p, const CancelToken&) {
        return handle_refactor_start(*app, p);
    });
    service.add("refactor.advance", [app](const Json::Value& p, const CancelToken&) {
        return handle_refactor_advance(*app, p);
    });
    service.add("refactor.status", [app](const Json::Value& p, const CancelToken&) {
        return handle_refactor_status(*app, p);
    });
    service.add("refactor.stop", [app](const Json::Value& p, const CancelToken&) {
        return handle_refactor_stop(*app, p);
    });
    service.add("refactor.resume", [app](const Json::Value& p, const CancelToken&) {
        return handle_refactor_resume(*app, p);
    });

    service.add("demo", [app](const Json::Value& p, const CancelToken& cancel) {
        return handle_demo(*app, p, cancel);
    });
    service.add("cache.stats", [app](const Json::Value& p, const CancelToken&) {
        auto limit = json::get_int(p, "hot_limit", 5);
        if (limit.is_err()) return Result<Json::Value>(std::move(limit).error());
        if (limit.value() < 0) {
            return Result<Json::Value>(PmatError::validation("hot_limit", "must not be negative"));
        }
        return Result<Json::Value>::ok(
            app->caches().diagnostics(static_cast<size_t>(limit.value())));
    });
    service.add("cache.clear", [app](const Json::Value&, const CancelToken&) {
        return handle_cache_clear(*app);
    });
}

} // namespace pmat::protocol
