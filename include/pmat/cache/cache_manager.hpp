#pragma once

#include <pmat/cache/persistent_cache.hpp>
#include <pmat/cache/strategies.hpp>
#include <pmat/config.hpp>
#include <json/json.h>
#include <memory>

namespace pmat::cache {

// One cache per strategy, sharing the memory budget by fixed proportion
// (ast 40%, analysis 30%, template/dag/churn 10% each) and, when
// persistence is enabled, one BlobStore.
class CacheManager {
public:
    explicit CacheManager(const CacheSettings& settings,
                          std::unique_ptr<BlobStore> store = nullptr);

    // Opens the on-disk store when settings.persistent is set
    static Result<std::unique_ptr<CacheManager>> create(const CacheSettings& settings);

    PersistentCache<AstStrategy>& ast() { return ast_; }
    PersistentCache<TemplateStrategy>& templates() { return template_; }
    PersistentCache<DagStrategy>& dag() { return dag_; }
    PersistentCache<ChurnStrategy>& churn() { return churn_; }
    PersistentCache<AnalysisStrategy>& analysis() { return analysis_; }

    const CacheSettings& settings() const { return settings_; }
    bool persistent() const { return store_ != nullptr && store_->is_open(); }

    // File watching is not implemented; the flag is reported only
    bool watch_enabled() const { return settings_.enable_watch; }

    StatsSnapshot totals() const;
    Json::Value diagnostics(size_t hot_limit = 5) const;

    void clear_all();
    size_t evict_all();

    static size_t budget_share(int64_t max_memory_mb, int percent);

private:
    CacheSettings settings_;
    std::unique_ptr<BlobStore> store_;
    PersistentCache<AstStrategy> ast_;
    PersistentCache<TemplateStrategy> template_;
    PersistentCache<DagStrategy> dag_;
    PersistentCache<ChurnStrategy> churn_;
    PersistentCache<AnalysisStrategy> analysis_;
};

} // namespace pmat::cache
