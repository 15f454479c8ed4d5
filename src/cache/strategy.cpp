#include <pmat/cache/strategies.hpp>
#include <pmat/json.hpp>
#include <pmat/sha256.hpp>

#include <filesystem>

namespace fs = std::filesystem;

namespace pmat::cache {

static const char SUMMARY_MAGIC[] = "PFS\x01";
static const char TEXT_MAGIC[] = "PTX\x01";
static const char JSON_MAGIC[] = "PJS\x01";
static constexpr size_t MAGIC_LEN = 4;

static std::string keyed(const char* ns, std::initializer_list<std::string> parts) {
    SHA256 h;
    h.update_field(ns);
    for (const auto& p : parts) h.update_field(p);
    return SHA256::hex(h.finalize());
}

static PmatError corrupt(const char* what) {
    return PmatError(PmatError::Serialization, std::string("corrupt cached ") + what);
}

// ---------------------------------------------------------------------------
// JSON-valued strategies
// ---------------------------------------------------------------------------

size_t JsonCodec::size_of(const Json::Value& v) const {
    return json::compact(v).size() + 64;
}

ser::Bytes JsonCodec::encode(const Json::Value& v) const {
    ser::Bytes buf(JSON_MAGIC, JSON_MAGIC + MAGIC_LEN);
    ser::write_string(buf, json::compact(v));
    return buf;
}

Result<Json::Value> JsonCodec::decode(const uint8_t* data, size_t len) const {
    const uint8_t* p = data;
    const uint8_t* end = data + len;
    std::string text;
    if (!ser::read_magic(p, end, JSON_MAGIC, MAGIC_LEN) || !ser::read_string(p, end, text)) {
        return corrupt("json document");
    }
    auto parsed = json::parse(text);
    if (parsed.is_err()) return corrupt("json document");
    return parsed;
}

// ---------------------------------------------------------------------------
// AST
// ---------------------------------------------------------------------------

std::string AstStrategy::cache_key(const Key& key) const {
    return keyed("ast", {key.path, std::to_string(key.mtime_ns)});
}

bool AstStrategy::validate(const Key& key, const Value&) const {
    std::error_code ec;
    return fs::exists(key.path, ec);
}

ser::Bytes AstStrategy::encode(const Value& v) const {
    ser::Bytes buf(SUMMARY_MAGIC, SUMMARY_MAGIC + MAGIC_LEN);
    buf.reserve(256 + v.functions.size() * 32);

    ser::write_string(buf, v.path);
    ser::write_byte(buf, static_cast<uint8_t>(v.language));
    ser::write_string(buf, v.content_hash);
    ser::write_int(buf, v.mtime_ns);
    ser::write_int(buf, v.lines);
    ser::write_int(buf, v.code_lines);
    ser::write_int(buf, v.comment_lines);
    ser::write_int(buf, v.blank_lines);

    ser::write_varint(buf, v.functions.size());
    for (const auto& fn : v.functions) {
        ser::write_string(buf, fn.name);
        ser::write_int(buf, fn.start_line);
        ser::write_int(buf, fn.end_line);
        ser::write_int(buf, fn.cyclomatic);
        ser::write_int(buf, fn.cognitive);
        ser::write_int(buf, fn.max_nesting);
    }

    ser::write_varint(buf, v.satd.size());
    for (const auto& item : v.satd) {
        ser::write_int(buf, item.line);
        ser::write_string(buf, item.marker);
        ser::write_string(buf, item.category);
        ser::write_string(buf, item.severity);
        ser::write_string(buf, item.text);
    }

    ser::write_varint(buf, v.imports.size());
    for (const auto& s : v.imports) ser::write_string(buf, s);
    ser::write_varint(buf, v.identifiers.size());
    for (const auto& s : v.identifiers) ser::write_string(buf, s);
    return buf;
}

static bool read_strings(const uint8_t*& p, const uint8_t* end, std::vector<std::string>& out) {
    uint64_t n;
    if (!ser::read_varint(p, end, n)) return false;
    if (n > static_cast<uint64_t>(end - p)) return false;
    out.resize(static_cast<size_t>(n));
    for (auto& s : out) {
        if (!ser::read_string(p, end, s)) return false;
    }
    return true;
}

Result<AstStrategy::Value> AstStrategy::decode(const uint8_t* data, size_t len) const {
    const uint8_t* p = data;
    const uint8_t* end = data + len;
    Value v;
    uint8_t lang = 0;

    if (!ser::read_magic(p, end, SUMMARY_MAGIC, MAGIC_LEN)) return corrupt("file summary");
    bool ok = ser::read_string(p, end, v.path)
        && ser::read_byte(p, end, lang)
        && ser::read_string(p, end, v.content_hash)
        && ser::read_int(p, end, v.mtime_ns)
        && ser::read_int(p, end, v.lines)
        && ser::read_int(p, end, v.code_lines)
        && ser::read_int(p, end, v.comment_lines)
        && ser::read_int(p, end, v.blank_lines);
    if (!ok || lang > static_cast<uint8_t>(analysis::Language::Unknown)) {
        return corrupt("file summary");
    }
    v.language = static_cast<analysis::Language>(lang);

    uint64_t n;
    if (!ser::read_varint(p, end, n) || n > static_cast<uint64_t>(end - p)) {
        return corrupt("file summary");
    }
    v.functions.resize(static_cast<size_t>(n));
    for (auto& fn : v.functions) {
        ok = ser::read_string(p, end, fn.name)
            && ser::read_int(p, end, fn.start_line)
            && ser::read_int(p, end, fn.end_line)
            && ser::read_int(p, end, fn.cyclomatic)
            && ser::read_int(p, end, fn.cognitive)
            && ser::read_int(p, end, fn.max_nesting);
        if (!ok) return corrupt("file summary");
    }

    if (!ser::read_varint(p, end, n) || n > static_cast<uint64_t>(end - p)) {
        return corrupt("file summary");
    }
    v.satd.resize(static_cast<size_t>(n));
    for (auto& item : v.satd) {
        ok = ser::read_int(p, end, item.line)
            && ser::read_string(p, end, item.marker)
            && ser::read_string(p, end, item.category)
            && ser::read_string(p, end, item.severity)
            && ser::read_string(p, end, item.text);
        if (!ok) return corrupt("file summary");
    }

    if (!read_strings(p, end, v.imports) || !read_strings(p, end, v.identifiers)) {
        return corrupt("file summary");
    }
    return Result<Value>::ok(std::move(v));
}

// ---------------------------------------------------------------------------
// Template
// ---------------------------------------------------------------------------

std::string TemplateStrategy::cache_key(const Key& key) const {
    return keyed("template", {key.uri, key.params_digest});
}

ser::Bytes TemplateStrategy::encode(const Value& v) const {
    ser::Bytes buf(TEXT_MAGIC, TEXT_MAGIC + MAGIC_LEN);
    ser::write_string(buf, v);
    return buf;
}

Result<TemplateStrategy::Value> TemplateStrategy::decode(const uint8_t* data, size_t len) const {
    const uint8_t* p = data;
    const uint8_t* end = data + len;
    std::string text;
    if (!ser::read_magic(p, end, TEXT_MAGIC, MAGIC_LEN) || !ser::read_string(p, end, text)) {
        return corrupt("template output");
    }
    return Result<Value>::ok(std::move(text));
}

// ---------------------------------------------------------------------------
// DAG and churn
// ---------------------------------------------------------------------------

std::string DagStrategy::cache_key(const Key& key) const {
    return keyed("dag", {key.root, key.dag_type, key.content_digest});
}

bool DagStrategy::validate(const Key& key, const Value&) const {
    std::error_code ec;
    return fs::exists(key.root, ec);
}

std::string ChurnStrategy::cache_key(const Key& key) const {
    if (branch_aware_) {
        return keyed("churn", {key.repo, std::to_string(key.period_days), key.head, key.branch});
    }
    return keyed("churn", {key.repo, std::to_string(key.period_days), key.head});
}

} // namespace pmat::cache
