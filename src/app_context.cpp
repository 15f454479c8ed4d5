#include <pmat/app_context.hpp>
#include <pmat/log.hpp>
#include <pmat/protocol/handlers.hpp>

#include <filesystem>

namespace fs = std::filesystem;

namespace pmat {

const char* version_string() {
    return PMAT_VERSION_STRING;
}

std::string AppContext::resolve_path(const std::string& path) const {
    if (path.empty()) return project_root_;
    fs::path p(path);
    if (p.is_absolute() || project_root_.empty() || project_root_ == ".") return path;
    return (fs::path(project_root_) / p).string();
}

Result<std::unique_ptr<AppContext>> AppContext::create(const Config& config,
                                                       const std::string& project_root) {
    std::unique_ptr<AppContext> ctx(new AppContext(config, project_root));

    auto defaults = refactor::RefactorConfig::create(config.refactor);
    if (defaults.is_err()) return std::move(defaults).error();

    auto caches = cache::CacheManager::create(config.cache);
    if (caches.is_err()) return std::move(caches).error();
    ctx->caches_ = std::move(caches).value();

    auto registry = templates::TemplateRegistry::load_embedded();
    if (registry.is_err()) return std::move(registry).error();
    ctx->templates_ = std::make_unique<templates::TemplateRegistry>(std::move(registry).value());
    ctx->templates_->attach_cache(&ctx->caches_->templates());

    analysis::register_builtin_analyzers(ctx->analyzers_);
    size_t workers = static_cast<size_t>(defaults.value().parallel_workers);
    ctx->scheduler_ = std::make_unique<analysis::Scheduler>(ctx->analyzers_, *ctx->caches_, workers);

    ctx->metrics_ = std::make_unique<refactor::SchedulerMetricsProvider>(*ctx->scheduler_);
    ctx->commit_hook_ = std::make_unique<refactor::GitCommitHook>(project_root);
    ctx->sessions_ = std::make_unique<refactor::SessionManager>(
        *ctx->metrics_, ctx->commit_hook_.get(),
        ctx->resolve_path(config.refactor.checkpoint_dir), defaults.value());

    protocol::register_core_handlers(ctx->service_, *ctx);
    protocol::register_mcp_handlers(ctx->service_, *ctx);

    log::debug("context ready: %zu templates, %zu analyzers, %zu workers, checkpoints in %s",
               ctx->templates_->size(), ctx->analyzers_.kinds().size(), workers,
               ctx->sessions_->store().dir().c_str());
    return Result<std::unique_ptr<AppContext>>::ok(std::move(ctx));
}

} // namespace pmat
