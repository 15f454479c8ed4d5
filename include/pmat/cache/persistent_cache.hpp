#pragma once

#include <pmat/cache/blob_store.hpp>
#include <pmat/cache/content_cache.hpp>
#include <pmat/log.hpp>
#include <chrono>

namespace pmat::cache {

// Memory front backed by an optional BlobStore. Without a store this is the
// in-memory backend with a Status-returning put. With a store, the strategy
// must also provide
//   ser::Bytes encode(const Value&) const
//   Result<Value> decode(const uint8_t*, size_t) const
// Reads that fail to load or decode degrade to a miss; put commits to the
// store before returning and leaves logging of a failed write to the caller.
// A put whose write fails is not kept in memory either.
template<typename S>
class PersistentCache {
public:
    using Key = typename S::Key;
    using Value = typename S::Value;
    using ValuePtr = std::shared_ptr<const Value>;

    PersistentCache(S strategy, size_t max_bytes, BlobStore* store = nullptr)
        : front_(std::move(strategy), max_bytes), store_(store) {}

    bool is_persistent() const { return store_ != nullptr && store_->is_open(); }

    // record = false leaves the hit/miss counters alone
    ValuePtr get(const Key& key, bool record = true) {
        if (auto v = front_.get(key, false)) {
            if (record) front_.stats().record_hit();
            return v;
        }
        if (is_persistent()) {
            if (auto v = load_from_store(key)) {
                if (record) front_.stats().record_hit();
                return v;
            }
        }
        if (record) front_.stats().record_miss();
        return nullptr;
    }

    Status put(const Key& key, Value value) {
        return put(key, std::make_shared<const Value>(std::move(value)));
    }

    // The cached entry shares ptr with the caller
    Status put(const Key& key, ValuePtr ptr) {
        front_.put(key, ptr);
        if (!is_persistent()) return ok_status();

        const S& s = front_.strategy();
        auto bytes = s.encode(*ptr);
        auto st = store_->store(s.name(), s.cache_key(key), bytes,
                                static_cast<int64_t>(s.size_of(*ptr)), wall_secs());
        if (st.is_err()) front_.remove(key);
        return st;
    }

    ValuePtr remove(const Key& key) {
        auto prior = front_.remove(key);
        if (is_persistent()) {
            const S& s = front_.strategy();
            if (!prior) prior = load_from_store(key, false);
            auto st = store_->remove(s.name(), s.cache_key(key));
            if (st.is_err()) {
                log::warn("cache[%s]: persistent delete failed: %s", s.name(),
                          st.error().message.c_str());
            }
        }
        return prior;
    }

    void clear() {
        front_.clear();
        if (is_persistent()) {
            auto st = store_->clear(front_.strategy().name());
            if (st.is_err()) {
                log::warn("cache[%s]: persistent clear failed: %s",
                          front_.strategy().name(), st.error().message.c_str());
            }
        }
    }

    // Expiry on disk is checked when a row is read back
    size_t evict_if_needed() { return front_.evict_if_needed(); }

    size_t len() const { return front_.len(); }
    CacheMetrics metrics() const { return front_.metrics(); }
    std::vector<HotEntry> hot_entries(size_t limit) const { return front_.hot_entries(limit); }
    size_t invalidate_matching(const std::function<bool(const std::string&)>& pred) {
        return front_.invalidate_matching(pred);
    }

    CacheStats& stats() { return front_.stats(); }
    const CacheStats& stats() const { return front_.stats(); }
    const S& strategy() const { return front_.strategy(); }

private:
    static int64_t wall_secs() {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    void drop_stored(const std::string& ck) {
        auto st = store_->remove(front_.strategy().name(), ck);
        if (st.is_err()) {
            log::debug("cache[%s]: could not drop %s: %s", front_.strategy().name(),
                       ck.c_str(), st.error().message.c_str());
        }
    }

    // Promotes a valid stored value into the front. Any failure is a miss.
    ValuePtr load_from_store(const Key& key, bool promote = true) {
        const S& s = front_.strategy();
        std::string ck = s.cache_key(key);
        auto rec = store_->load(s.name(), ck);
        if (rec.is_err()) {
            if (rec.error().code != PmatError::NotFound) {
                log::debug("cache[%s]: read failed, treating as miss: %s", s.name(),
                           rec.error().message.c_str());
            }
            return nullptr;
        }

        int64_t ttl = s.ttl_secs();
        if (ttl > 0 && wall_secs() - rec.value().created_at > ttl) {
            drop_stored(ck);
            front_.stats().record_eviction(0);
            return nullptr;
        }

        const auto& bytes = rec.value().value;
        auto decoded = s.decode(bytes.data(), bytes.size());
        if (decoded.is_err()) {
            log::debug("cache[%s]: undecodable entry %s: %s", s.name(), ck.c_str(),
                       decoded.error().message.c_str());
            drop_stored(ck);
            return nullptr;
        }
        if (!s.validate(key, decoded.value())) {
            drop_stored(ck);
            return nullptr;
        }

        auto ptr = std::make_shared<const Value>(std::move(decoded).value());
        if (promote) front_.put(key, ptr);
        return ptr;
    }

    ContentCache<S> front_;
    BlobStore* store_;
};

} // namespace pmat::cache
