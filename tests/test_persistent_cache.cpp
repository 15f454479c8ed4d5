#include <catch2/catch.hpp>
#include <pmat/cache/persistent_cache.hpp>
#include <pmat/cache/strategies.hpp>
#include <sqlite3.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace pmat;
using namespace pmat::cache;

static fs::path fresh_dir(const std::string& name) {
    auto dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

TEST_CASE("blob store round trip and namespaces", "[persistent]") {
    auto dir = fresh_dir("pmat_test_blob");
    BlobStore store;
    REQUIRE(store.open((dir / "c.db").string()).is_ok());
    REQUIRE(store.is_open());

    REQUIRE(store.store("a", "k", {1, 2, 3}, 3, 100).is_ok());
    REQUIRE(store.store("b", "k", {9}, 1, 100).is_ok());
    auto rec = store.load("a", "k");
    REQUIRE(rec.is_ok());
    REQUIRE(rec.value().value == std::vector<uint8_t>{1, 2, 3});
    REQUIRE(rec.value().created_at == 100);

    REQUIRE(store.load("a", "missing").error().code == PmatError::NotFound);
    REQUIRE(store.count("a").value() == 1);
    REQUIRE(store.clear("a").is_ok());
    REQUIRE(store.count("a").value() == 0);
    REQUIRE(store.count("b").value() == 1);
    REQUIRE(store.clear().is_ok());
    REQUIRE(store.count("b").value() == 0);
    store.close();
    REQUIRE_FALSE(store.is_open());
    fs::remove_all(dir);
}

TEST_CASE("blob store open fails on an unusable path", "[persistent]") {
    auto dir = fresh_dir("pmat_test_blob_bad");
    std::ofstream(dir / "plain") << "not a directory";
    BlobStore store;
    auto st = store.open((dir / "plain" / "c.db").string());
    REQUIRE(st.is_err());
    REQUIRE(st.error().code == PmatError::IO);
    fs::remove_all(dir);
}

TEST_CASE("put is durable across store reopen", "[persistent]") {
    auto dir = fresh_dir("pmat_test_durable");
    auto db = (dir / "c.db").string();
    TemplateKey key{"template://rust/makefile/cli", "digest"};
    {
        BlobStore store;
        REQUIRE(store.open(db).is_ok());
        PersistentCache<TemplateStrategy> cache(TemplateStrategy(), 0, &store);
        REQUIRE(cache.is_persistent());
        REQUIRE(cache.put(key, std::string("all: build\n")).is_ok());
    }
    BlobStore store;
    REQUIRE(store.open(db).is_ok());
    PersistentCache<TemplateStrategy> cache(TemplateStrategy(), 0, &store);
    REQUIRE(cache.len() == 0);
    auto v = cache.get(key);
    REQUIRE(v);
    REQUIRE(*v == "all: build\n");
    REQUIRE(cache.len() == 1);
    REQUIRE(cache.stats().snapshot().hits == 1);
    fs::remove_all(dir);
}

TEST_CASE("undecodable rows degrade to a miss and are dropped", "[persistent]") {
    auto dir = fresh_dir("pmat_test_corrupt");
    BlobStore store;
    REQUIRE(store.open((dir / "c.db").string()).is_ok());
    TemplateStrategy strategy;
    TemplateKey key{"template://deno/readme/app", ""};
    REQUIRE(store.store(strategy.name(), strategy.cache_key(key), {0xde, 0xad}, 2, 0).is_ok());

    PersistentCache<TemplateStrategy> cache(strategy, 0, &store);
    REQUIRE_FALSE(cache.get(key));
    REQUIRE(cache.stats().snapshot().misses == 1);
    REQUIRE(store.count(strategy.name()).value() == 0);
    fs::remove_all(dir);
}

TEST_CASE("a failed store write leaves nothing in memory", "[persistent]") {
    auto dir = fresh_dir("pmat_test_write_fail");
    auto db = (dir / "c.db").string();
    BlobStore store;
    REQUIRE(store.open(db).is_ok());
    {
        sqlite3* raw = nullptr;
        REQUIRE(sqlite3_open(db.c_str(), &raw) == SQLITE_OK);
        REQUIRE(sqlite3_exec(raw,
                             "CREATE TRIGGER refuse BEFORE INSERT ON entries "
                             "BEGIN SELECT RAISE(ABORT, 'writes refused'); END;",
                             nullptr, nullptr, nullptr) == SQLITE_OK);
        sqlite3_close(raw);
    }

    PersistentCache<TemplateStrategy> cache(TemplateStrategy(), 0, &store);
    TemplateKey key{"template://rust/makefile/cli", "digest"};
    auto st = cache.put(key, std::string("all: build\n"));
    REQUIRE(st.is_err());
    REQUIRE(st.error().code == PmatError::IO);
    REQUIRE(cache.len() == 0);
    REQUIRE_FALSE(cache.get(key));
    store.close();
    fs::remove_all(dir);
}

TEST_CASE("expired rows are not returned", "[persistent]") {
    auto dir = fresh_dir("pmat_test_expired");
    BlobStore store;
    REQUIRE(store.open((dir / "c.db").string()).is_ok());
    TemplateStrategy strategy(60);
    TemplateKey key{"template://python-uv/gitignore/app", ""};
    REQUIRE(store.store(strategy.name(), strategy.cache_key(key), strategy.encode("x"), 1, 1).is_ok());

    PersistentCache<TemplateStrategy> cache(strategy, 0, &store);
    REQUIRE_FALSE(cache.get(key));
    REQUIRE(cache.stats().snapshot().evictions == 1);
    fs::remove_all(dir);
}

TEST_CASE("remove and clear reach the store", "[persistent]") {
    auto dir = fresh_dir("pmat_test_remove");
    BlobStore store;
    REQUIRE(store.open((dir / "c.db").string()).is_ok());
    PersistentCache<AnalysisStrategy> cache(AnalysisStrategy(), 0, &store);
    Json::Value doc(Json::objectValue);
    doc["files"] = 3;
    REQUIRE(cache.put("fp1", doc).is_ok());
    REQUIRE(cache.put("fp2", doc).is_ok());

    auto removed = cache.remove("fp1");
    REQUIRE(removed);
    REQUIRE((*removed)["files"].asInt() == 3);
    REQUIRE(store.count("analysis").value() == 1);

    cache.clear();
    REQUIRE(cache.len() == 0);
    REQUIRE(store.count("analysis").value() == 0);
    fs::remove_all(dir);
}

TEST_CASE("memory-only cache behaves without a store", "[persistent]") {
    PersistentCache<AnalysisStrategy> cache(AnalysisStrategy(), 0);
    REQUIRE_FALSE(cache.is_persistent());
    REQUIRE(cache.put("fp", Json::Value("x")).is_ok());
    REQUIRE(cache.get("fp")->asString() == "x");
    REQUIRE_FALSE(cache.get("other"));
    auto s = cache.stats().snapshot();
    REQUIRE(s.hits == 1);
    REQUIRE(s.misses == 1);
}

TEST_CASE("file summaries survive encode and decode", "[persistent]") {
    analysis::FileSummary s;
    s.path = "src/lib.rs";
    s.language = analysis::Language::Rust;
    s.lines = 12;
    s.functions.push_back({"parse", 1, 10, 4, 3, 2});
    s.satd.push_back({3, "TODO", "Design", "Low", "TODO: split"});
    s.imports = {"crate::util"};

    AstStrategy strategy;
    auto bytes = strategy.encode(s);
    auto back = strategy.decode(bytes.data(), bytes.size());
    REQUIRE(back.is_ok());
    REQUIRE(back.value().functions.at(0).cyclomatic == 4);
    REQUIRE(back.value().satd.at(0).marker == "TODO");

    bytes.resize(bytes.size() / 2);
    auto truncated = strategy.decode(bytes.data(), bytes.size());
    REQUIRE(truncated.is_err());
    REQUIRE(truncated.error().code == PmatError::Serialization);
}
