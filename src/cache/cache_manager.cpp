#include <pmat/cache/cache_manager.hpp>
#include <pmat/log.hpp>

namespace pmat::cache {

size_t CacheManager::budget_share(int64_t max_memory_mb, int percent) {
    if (max_memory_mb <= 0) return 0;
    return static_cast<size_t>(max_memory_mb) * 1024 * 1024 / 100 * static_cast<size_t>(percent);
}

CacheManager::CacheManager(const CacheSettings& settings, std::unique_ptr<BlobStore> store)
    : settings_(settings),
      store_(std::move(store)),
      ast_(AstStrategy(settings.ttl_ast_secs),
           budget_share(settings.max_memory_mb, 40), store_.get()),
      template_(TemplateStrategy(settings.ttl_template_secs),
                budget_share(settings.max_memory_mb, 10), store_.get()),
      dag_(DagStrategy(settings.ttl_dag_secs),
           budget_share(settings.max_memory_mb, 10), store_.get()),
      churn_(ChurnStrategy(settings.ttl_churn_secs, 20, settings.git_branch_aware),
             budget_share(settings.max_memory_mb, 10), store_.get()),
      analysis_(AnalysisStrategy(settings.ttl_analysis_secs),
                budget_share(settings.max_memory_mb, 30), store_.get()) {
    if (settings_.enable_watch) {
        log::debug("cache: PAIML_CACHE_ENABLE_WATCH is set; file watching is advisory only");
    }
}

Result<std::unique_ptr<CacheManager>> CacheManager::create(const CacheSettings& settings) {
    std::unique_ptr<BlobStore> store;
    if (settings.persistent) {
        store = std::make_unique<BlobStore>();
        auto st = store->open(BlobStore::default_path(settings.dir));
        if (st.is_err()) {
            return PmatError(PmatError::IO, "persistent cache unavailable")
                .with_cause(st.error());
        }
    }
    return Result<std::unique_ptr<CacheManager>>::ok(
        std::make_unique<CacheManager>(settings, std::move(store)));
}

StatsSnapshot CacheManager::totals() const {
    StatsSnapshot total;
    auto add = [&total](const StatsSnapshot& s) {
        total.hits += s.hits;
        total.misses += s.misses;
        total.evictions += s.evictions;
        total.total_bytes += s.total_bytes;
    };
    add(ast_.stats().snapshot());
    add(template_.stats().snapshot());
    add(dag_.stats().snapshot());
    add(churn_.stats().snapshot());
    add(analysis_.stats().snapshot());
    return total;
}

static Json::Value stats_json(const StatsSnapshot& s) {
    Json::Value j(Json::objectValue);
    j["hits"] = Json::UInt64(s.hits);
    j["misses"] = Json::UInt64(s.misses);
    j["evictions"] = Json::UInt64(s.evictions);
    j["total_bytes"] = Json::Int64(s.total_bytes);
    j["total_requests"] = Json::UInt64(s.total_requests());
    j["hit_rate"] = s.hit_rate();
    return j;
}

template<typename C>
static Json::Value cache_json(const C& cache, size_t hot_limit) {
    CacheMetrics m = cache.metrics();
    Json::Value j = stats_json(m.stats);
    j["entries"] = Json::UInt64(m.entries);
    j["max_entries"] = Json::UInt64(m.max_entries);
    j["max_bytes"] = Json::UInt64(m.max_bytes);
    j["ttl_secs"] = Json::Int64(m.ttl_secs);

    Json::Value hot(Json::arrayValue);
    for (const auto& e : cache.hot_entries(hot_limit)) {
        Json::Value h(Json::objectValue);
        h["key"] = e.key;
        h["access_count"] = Json::UInt64(e.access_count);
        h["size_bytes"] = Json::UInt64(e.size_bytes);
        h["age_secs"] = e.age_secs;
        hot.append(h);
    }
    j["hot_entries"] = hot;
    return j;
}

Json::Value CacheManager::diagnostics(size_t hot_limit) const {
    Json::Value j(Json::objectValue);
    j["memory_budget_mb"] = Json::Int64(settings_.max_memory_mb);
    j["persistent"] = persistent();
    j["watch_enabled"] = watch_enabled();
    j["git_branch_aware"] = settings_.git_branch_aware;
    j["totals"] = stats_json(totals());

    Json::Value caches(Json::objectValue);
    caches["ast"] = cache_json(ast_, hot_limit);
    caches["template"] = cache_json(template_, hot_limit);
    caches["dag"] = cache_json(dag_, hot_limit);
    caches["churn"] = cache_json(churn_, hot_limit);
    caches["analysis"] = cache_json(analysis_, hot_limit);
    j["caches"] = caches;
    return j;
}

void CacheManager::clear_all() {
    ast_.clear();
    template_.clear();
    dag_.clear();
    churn_.clear();
    analysis_.clear();
    log::info("cache: cleared all caches");
}

size_t CacheManager::evict_all() {
    return ast_.evict_if_needed() + template_.evict_if_needed() + dag_.evict_if_needed()
        + churn_.evict_if_needed() + analysis_.evict_if_needed();
}

} // namespace pmat::cache
