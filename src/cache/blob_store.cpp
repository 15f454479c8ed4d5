#include <pmat/cache/blob_store.hpp>
#include <pmat/log.hpp>
#include <sqlite3.h>

#include <cstdlib>
#include <filesystem>
#include <mutex>

namespace fs = std::filesystem;

namespace pmat::cache {

static const std::string SCHEMA_VERSION = "1";

struct BlobStore::Impl {
    sqlite3* db = nullptr;
    std::mutex mu;

    sqlite3_stmt* stmt_load = nullptr;
    sqlite3_stmt* stmt_store = nullptr;
    sqlite3_stmt* stmt_remove = nullptr;
    sqlite3_stmt* stmt_count = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_load);
        fin(stmt_store);
        fin(stmt_remove);
        fin(stmt_count);
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        if (!db) return PmatError::io("cache database is not open");
        if (out) return ok_status();
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return PmatError::io(std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status exec(const char* sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return PmatError::io("SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    Status init_schema() {
        PMAT_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS entries ("
            "  ns TEXT NOT NULL,"
            "  key TEXT NOT NULL,"
            "  value BLOB,"
            "  size_bytes INTEGER,"
            "  created_at INTEGER,"
            "  PRIMARY KEY (ns, key)"
            ");"
        ));

        std::string version;
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db,
            "SELECT value FROM schema_info WHERE key='version'", -1, &stmt, nullptr);
        if (rc == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
            const char* ver = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            if (ver) version = ver;
        }
        if (stmt) sqlite3_finalize(stmt);

        if (version == SCHEMA_VERSION) return ok_status();
        if (!version.empty()) {
            log::info("cache schema %s is outdated, clearing persistent cache", version.c_str());
            PMAT_TRY(exec("DELETE FROM entries;"));
        }
        std::string ver_sql = "INSERT OR REPLACE INTO schema_info (key, value) "
            "VALUES ('version', '" + SCHEMA_VERSION + "');";
        return exec(ver_sql.c_str());
    }

    Status setup() {
        PMAT_TRY(exec(
            "PRAGMA journal_mode=WAL;"
            "PRAGMA synchronous=FULL;"
            "PRAGMA busy_timeout=5000;"
        ));
        return init_schema();
    }
};

BlobStore::BlobStore() : impl_(std::make_unique<Impl>()) {}
BlobStore::~BlobStore() = default;
BlobStore::BlobStore(BlobStore&&) noexcept = default;
BlobStore& BlobStore::operator=(BlobStore&&) noexcept = default;

std::string BlobStore::default_path(const std::string& dir) {
    if (!dir.empty()) return (fs::path(dir) / "pmat_cache.db").string();
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";
    return std::string(home) + "/.pmat/cache/pmat_cache.db";
}

Status BlobStore::open(const std::string& db_path) {
    close();
    std::lock_guard<std::mutex> lock(impl_->mu);

    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return PmatError::io("failed to create cache directory: " + parent.string());
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        std::string msg = impl_->db ? sqlite3_errmsg(impl_->db) : "unknown";
        if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
        return PmatError::io("failed to open cache database: " + msg).with_file(db_path);
    }

    auto setup_result = impl_->setup();
    if (setup_result.is_err()) {
        // Corrupt file: start over once
        log::warn("cache database %s unusable (%s), recreating",
                  db_path.c_str(), setup_result.error().message.c_str());
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        std::error_code ec;
        fs::remove(db_path, ec);
        fs::remove(db_path + "-wal", ec);
        fs::remove(db_path + "-shm", ec);
        rc = sqlite3_open(db_path.c_str(), &impl_->db);
        if (rc != SQLITE_OK) {
            if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
            return PmatError::io("failed to recreate cache database").with_file(db_path);
        }
        PMAT_TRY(impl_->setup());
    }

    log::debug("opened persistent cache %s", db_path.c_str());
    return ok_status();
}

void BlobStore::close() {
    std::lock_guard<std::mutex> lock(impl_->mu);
    if (impl_->db) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool BlobStore::is_open() const {
    return impl_->db != nullptr;
}

Result<BlobRecord> BlobStore::load(const std::string& ns, const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mu);
    PMAT_TRY(impl_->prepare(
        "SELECT value, size_bytes, created_at FROM entries WHERE ns=? AND key=?",
        impl_->stmt_load));

    sqlite3_stmt* s = impl_->stmt_load;
    sqlite3_reset(s);
    sqlite3_bind_text(s, 1, ns.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 2, key.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(s);
    if (rc == SQLITE_ROW) {
        BlobRecord rec;
        const auto* blob = static_cast<const uint8_t*>(sqlite3_column_blob(s, 0));
        int len = sqlite3_column_bytes(s, 0);
        if (blob && len > 0) rec.value.assign(blob, blob + len);
        rec.size_bytes = sqlite3_column_int64(s, 1);
        rec.created_at = sqlite3_column_int64(s, 2);
        sqlite3_reset(s);
        return Result<BlobRecord>::ok(std::move(rec));
    }
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) {
        return PmatError::io(std::string("cache read failed: ") + sqlite3_errmsg(impl_->db), true);
    }
    return PmatError(PmatError::NotFound, "no cached value for " + ns + "/" + key);
}

Status BlobStore::store(const std::string& ns, const std::string& key,
                        const std::vector<uint8_t>& value, int64_t size_bytes,
                        int64_t created_at) {
    std::lock_guard<std::mutex> lock(impl_->mu);
    PMAT_TRY(impl_->prepare(
        "INSERT OR REPLACE INTO entries (ns, key, value, size_bytes, created_at) "
        "VALUES (?, ?, ?, ?, ?)",
        impl_->stmt_store));

    sqlite3_stmt* s = impl_->stmt_store;
    sqlite3_reset(s);
    sqlite3_bind_text(s, 1, ns.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 2, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(s, 3, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(s, 4, size_bytes);
    sqlite3_bind_int64(s, 5, created_at);

    int rc = sqlite3_step(s);
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) {
        return PmatError::io(std::string("cache write failed: ") + sqlite3_errmsg(impl_->db),
                             rc == SQLITE_BUSY || rc == SQLITE_LOCKED);
    }
    return ok_status();
}

Status BlobStore::remove(const std::string& ns, const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mu);
    PMAT_TRY(impl_->prepare("DELETE FROM entries WHERE ns=? AND key=?", impl_->stmt_remove));

    sqlite3_stmt* s = impl_->stmt_remove;
    sqlite3_reset(s);
    sqlite3_bind_text(s, 1, ns.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 2, key.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(s);
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) {
        return PmatError::io(std::string("cache delete failed: ") + sqlite3_errmsg(impl_->db));
    }
    return ok_status();
}

Status BlobStore::clear(const std::string& ns) {
    std::lock_guard<std::mutex> lock(impl_->mu);
    if (!impl_->db) return PmatError::io("cache database is not open");
    if (ns.empty()) return impl_->exec("DELETE FROM entries;");

    sqlite3_stmt* s = nullptr;
    int rc = sqlite3_prepare_v2(impl_->db, "DELETE FROM entries WHERE ns=?", -1, &s, nullptr);
    if (rc != SQLITE_OK) {
        return PmatError::io(std::string("SQLite prepare failed: ") + sqlite3_errmsg(impl_->db));
    }
    sqlite3_bind_text(s, 1, ns.c_str(), -1, SQLITE_TRANSIENT);
    rc = sqlite3_step(s);
    sqlite3_finalize(s);
    if (rc != SQLITE_DONE) {
        return PmatError::io(std::string("cache clear failed: ") + sqlite3_errmsg(impl_->db));
    }
    return ok_status();
}

Result<int64_t> BlobStore::count(const std::string& ns) {
    std::lock_guard<std::mutex> lock(impl_->mu);
    PMAT_TRY(impl_->prepare("SELECT COUNT(*) FROM entries WHERE ns=?", impl_->stmt_count));

    sqlite3_stmt* s = impl_->stmt_count;
    sqlite3_reset(s);
    sqlite3_bind_text(s, 1, ns.c_str(), -1, SQLITE_TRANSIENT);
    int64_t n = 0;
    if (sqlite3_step(s) == SQLITE_ROW) n = sqlite3_column_int64(s, 0);
    sqlite3_reset(s);
    return Result<int64_t>::ok(n);
}

} // namespace pmat::cache
