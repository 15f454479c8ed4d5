#pragma once

#include <pmat/result.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pmat::cache {

struct BlobRecord {
    std::vector<uint8_t> value;
    int64_t size_bytes = 0;
    int64_t created_at = 0;   // unix seconds
};

// SQLite-backed blob table shared by every persistent cache. Rows are
// partitioned by namespace (one per strategy). Every store commits with
// synchronous=FULL before returning.
class BlobStore {
public:
    BlobStore();
    ~BlobStore();
    BlobStore(BlobStore&&) noexcept;
    BlobStore& operator=(BlobStore&&) noexcept;

    Status open(const std::string& db_path);
    void close();
    bool is_open() const;

    // <dir>/pmat_cache.db, with dir defaulting to ~/.pmat/cache
    static std::string default_path(const std::string& dir = "");

    // NotFound when absent
    Result<BlobRecord> load(const std::string& ns, const std::string& key);
    Status store(const std::string& ns, const std::string& key,
                 const std::vector<uint8_t>& value, int64_t size_bytes,
                 int64_t created_at);
    Status remove(const std::string& ns, const std::string& key);

    // Empty ns clears every namespace
    Status clear(const std::string& ns = "");
    Result<int64_t> count(const std::string& ns);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pmat::cache
