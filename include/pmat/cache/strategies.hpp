#pragma once

#include <pmat/analysis/source_scan.hpp>
#include <pmat/cache/codec.hpp>
#include <pmat/result.hpp>
#include <json/json.h>
#include <cstdint>
#include <string>

namespace pmat::cache {

// Values stored as JSON documents share one size estimate and codec
struct JsonCodec {
    size_t size_of(const Json::Value& v) const;
    ser::Bytes encode(const Json::Value& v) const;
    Result<Json::Value> decode(const uint8_t* data, size_t len) const;
};

struct AstKey {
    std::string path;
    int64_t mtime_ns = 0;
};

// Per-file source summaries. Valid while the file exists; a changed file
// has a new mtime and therefore a new key.
class AstStrategy {
public:
    using Key = AstKey;
    using Value = analysis::FileSummary;

    explicit AstStrategy(int64_t ttl_secs = 300, size_t max_size = 100)
        : ttl_(ttl_secs), max_size_(max_size) {}

    const char* name() const { return "ast"; }
    std::string cache_key(const Key& key) const;
    bool validate(const Key& key, const Value& value) const;
    int64_t ttl_secs() const { return ttl_; }
    size_t max_size() const { return max_size_; }
    size_t size_of(const Value& v) const { return v.approx_bytes(); }
    ser::Bytes encode(const Value& v) const;
    Result<Value> decode(const uint8_t* data, size_t len) const;

private:
    int64_t ttl_;
    size_t max_size_;
};

struct TemplateKey {
    std::string uri;
    std::string params_digest;   // empty = raw template content
};

// Rendered template output
class TemplateStrategy {
public:
    using Key = TemplateKey;
    using Value = std::string;

    explicit TemplateStrategy(int64_t ttl_secs = 600, size_t max_size = 50)
        : ttl_(ttl_secs), max_size_(max_size) {}

    const char* name() const { return "template"; }
    std::string cache_key(const Key& key) const;
    bool validate(const Key&, const Value&) const { return true; }
    int64_t ttl_secs() const { return ttl_; }
    size_t max_size() const { return max_size_; }
    size_t size_of(const Value& v) const { return v.size() + 32; }
    ser::Bytes encode(const Value& v) const;
    Result<Value> decode(const uint8_t* data, size_t len) const;

private:
    int64_t ttl_;
    size_t max_size_;
};

struct DagKey {
    std::string root;
    std::string dag_type;
    std::string content_digest;   // combined hash of the inputs
};

// Dependency graphs. Valid while the root path exists.
class DagStrategy : public JsonCodec {
public:
    using Key = DagKey;
    using Value = Json::Value;

    explicit DagStrategy(int64_t ttl_secs = 180, size_t max_size = 20)
        : ttl_(ttl_secs), max_size_(max_size) {}

    const char* name() const { return "dag"; }
    std::string cache_key(const Key& key) const;
    bool validate(const Key& key, const Value& value) const;
    int64_t ttl_secs() const { return ttl_; }
    size_t max_size() const { return max_size_; }

private:
    int64_t ttl_;
    size_t max_size_;
};

struct ChurnKey {
    std::string repo;
    int period_days = 30;
    std::string head;     // HEAD commit sha
    std::string branch;
};

// Git churn reports. Keyed by HEAD so a new commit is a new entry; the
// branch joins the key only in branch-aware mode.
class ChurnStrategy : public JsonCodec {
public:
    using Key = ChurnKey;
    using Value = Json::Value;

    explicit ChurnStrategy(int64_t ttl_secs = 1800, size_t max_size = 20,
                           bool branch_aware = false)
        : ttl_(ttl_secs), max_size_(max_size), branch_aware_(branch_aware) {}

    const char* name() const { return "churn"; }
    std::string cache_key(const Key& key) const;
    bool validate(const Key&, const Value&) const { return true; }
    int64_t ttl_secs() const { return ttl_; }
    size_t max_size() const { return max_size_; }
    bool branch_aware() const { return branch_aware_; }

private:
    int64_t ttl_;
    size_t max_size_;
    bool branch_aware_;
};

// Analysis results keyed by fingerprint (already a digest)
class AnalysisStrategy : public JsonCodec {
public:
    using Key = std::string;
    using Value = Json::Value;

    explicit AnalysisStrategy(int64_t ttl_secs = 600, size_t max_size = 256)
        : ttl_(ttl_secs), max_size_(max_size) {}

    const char* name() const { return "analysis"; }
    std::string cache_key(const Key& key) const { return key; }
    bool validate(const Key&, const Value&) const { return true; }
    int64_t ttl_secs() const { return ttl_; }
    size_t max_size() const { return max_size_; }

private:
    int64_t ttl_;
    size_t max_size_;
};

} // namespace pmat::cache
