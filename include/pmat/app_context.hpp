#pragma once

#include <pmat/analysis/analyzers.hpp>
#include <pmat/analysis/scheduler.hpp>
#include <pmat/cache/cache_manager.hpp>
#include <pmat/config.hpp>
#include <pmat/protocol/service.hpp>
#include <pmat/refactor/metrics.hpp>
#include <pmat/refactor/session_manager.hpp>
#include <pmat/result.hpp>
#include <pmat/templates/template_registry.hpp>
#include <memory>
#include <string>

namespace pmat {

const char* version_string();

// Everything a handler may touch, created once in main and passed by
// reference. Members are torn down in reverse order, so the scheduler's
// workers are joined before the caches and registries go away.
class AppContext {
public:
    // project_root anchors relative paths in requests and the checkpoint dir
    static Result<std::unique_ptr<AppContext>> create(const Config& config,
                                                      const std::string& project_root = ".");

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    const Config& config() const { return config_; }
    const std::string& project_root() const { return project_root_; }

    // Relative paths are taken against the project root
    std::string resolve_path(const std::string& path) const;

    cache::CacheManager& caches() { return *caches_; }
    const templates::TemplateRegistry& templates() const { return *templates_; }
    const analysis::AnalyzerRegistry& analyzers() const { return analyzers_; }
    analysis::Scheduler& scheduler() { return *scheduler_; }
    refactor::SessionManager& sessions() { return *sessions_; }
    const protocol::ProtocolService& service() const { return service_; }

    protocol::UnifiedResponse dispatch(protocol::UnifiedRequest request) const {
        return service_.handle(std::move(request));
    }

private:
    AppContext(Config config, std::string project_root)
        : config_(std::move(config)), project_root_(std::move(project_root)) {}

    Config config_;
    std::string project_root_;
    std::unique_ptr<cache::CacheManager> caches_;
    std::unique_ptr<templates::TemplateRegistry> templates_;
    analysis::AnalyzerRegistry analyzers_;
    std::unique_ptr<analysis::Scheduler> scheduler_;
    std::unique_ptr<refactor::SchedulerMetricsProvider> metrics_;
    std::unique_ptr<refactor::CommitHook> commit_hook_;
    std::unique_ptr<refactor::SessionManager> sessions_;
    protocol::ProtocolService service_;
};

} // namespace pmat
