#include <catch2/catch.hpp>
#include <pmat/cache/cache_manager.hpp>
#include <filesystem>

namespace fs = std::filesystem;
using namespace pmat;
using namespace pmat::cache;

TEST_CASE("cache manager splits the memory budget", "[cache_manager]") {
    REQUIRE(CacheManager::budget_share(100, 40) == 100u * 1024 * 1024 / 100 * 40);
    REQUIRE(CacheManager::budget_share(0, 40) == 0);
    REQUIRE(CacheManager::budget_share(-5, 40) == 0);

    CacheSettings settings;
    settings.max_memory_mb = 10;
    CacheManager mgr(settings);
    REQUIRE(mgr.ast().metrics().max_bytes == CacheManager::budget_share(10, 40));
    REQUIRE(mgr.analysis().metrics().max_bytes == CacheManager::budget_share(10, 30));
    REQUIRE(mgr.templates().metrics().max_bytes == CacheManager::budget_share(10, 10));
    REQUIRE(mgr.dag().metrics().max_bytes == CacheManager::budget_share(10, 10));
    REQUIRE(mgr.churn().metrics().max_bytes == CacheManager::budget_share(10, 10));
}

TEST_CASE("cache manager uses per-strategy ttls", "[cache_manager]") {
    CacheSettings settings;
    settings.ttl_ast_secs = 11;
    settings.ttl_dag_secs = 22;
    CacheManager mgr(settings);
    REQUIRE(mgr.ast().metrics().ttl_secs == 11);
    REQUIRE(mgr.dag().metrics().ttl_secs == 22);
    REQUIRE(mgr.churn().metrics().ttl_secs == 1800);
}

TEST_CASE("cache manager totals add up every cache", "[cache_manager]") {
    CacheManager mgr{CacheSettings{}};
    Json::Value v(Json::objectValue);
    v["score"] = 1;
    REQUIRE(mgr.analysis().put("fp1", v).is_ok());
    REQUIRE(mgr.analysis().get("fp1") != nullptr);
    REQUIRE(mgr.analysis().get("fp2") == nullptr);
    REQUIRE(mgr.dag().get(DagKey{"/r", "import", "d"}) == nullptr);

    auto t = mgr.totals();
    REQUIRE(t.hits == 1);
    REQUIRE(t.misses == 2);
    REQUIRE(t.total_bytes > 0);
}

TEST_CASE("cache manager diagnostics report", "[cache_manager]") {
    CacheSettings settings;
    settings.git_branch_aware = true;
    CacheManager mgr(settings);
    Json::Value v(Json::objectValue);
    v["x"] = "y";
    REQUIRE(mgr.analysis().put("hot", v).is_ok());
    for (int i = 0; i < 3; ++i) REQUIRE(mgr.analysis().get("hot") != nullptr);

    auto d = mgr.diagnostics(5);
    REQUIRE(d["memory_budget_mb"].asInt() == 100);
    REQUIRE_FALSE(d["persistent"].asBool());
    REQUIRE_FALSE(d["watch_enabled"].asBool());
    REQUIRE(d["git_branch_aware"].asBool());
    REQUIRE(d["totals"]["hits"].asUInt64() == 3);
    for (const char* name : {"ast", "template", "dag", "churn", "analysis"}) {
        REQUIRE(d["caches"].isMember(name));
    }
    const auto& hot = d["caches"]["analysis"]["hot_entries"];
    REQUIRE(hot.size() == 1);
    REQUIRE(hot[0]["key"].asString() == "hot");
    REQUIRE(hot[0]["access_count"].asUInt64() >= 3);
}

TEST_CASE("cache manager clear_all empties every cache", "[cache_manager]") {
    CacheManager mgr{CacheSettings{}};
    REQUIRE(mgr.analysis().put("a", Json::Value(1)).is_ok());
    REQUIRE(mgr.dag().put(DagKey{"/r", "import", "d"}, Json::Value(Json::objectValue)).is_ok());
    REQUIRE(mgr.analysis().len() == 1);
    mgr.clear_all();
    REQUIRE(mgr.analysis().len() == 0);
    REQUIRE(mgr.dag().len() == 0);
    REQUIRE(mgr.evict_all() == 0);
}

TEST_CASE("cache manager create opens the persistent store", "[cache_manager]") {
    auto dir = fs::temp_directory_path() / "pmat_test_cache_manager";
    fs::remove_all(dir);

    CacheSettings settings;
    settings.persistent = true;
    settings.dir = dir.string();
    {
        auto mgr = CacheManager::create(settings);
        REQUIRE(mgr.is_ok());
        REQUIRE(mgr.value()->persistent());
        REQUIRE(mgr.value()->analysis().put("durable", Json::Value("v")).is_ok());
    }
    {
        auto mgr = CacheManager::create(settings);
        REQUIRE(mgr.is_ok());
        auto v = mgr.value()->analysis().get("durable");
        REQUIRE(v != nullptr);
        REQUIRE(v->asString() == "v");
    }
    fs::remove_all(dir);
}

TEST_CASE("cache manager create without persistence stays in memory", "[cache_manager]") {
    auto mgr = CacheManager::create(CacheSettings{});
    REQUIRE(mgr.is_ok());
    REQUIRE_FALSE(mgr.value()->persistent());
}
