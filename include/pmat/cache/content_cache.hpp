#pragma once

#include <pmat/cache/strategy.hpp>
#include <pmat/log.hpp>
#include <algorithm>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pmat::cache {

// In-memory content-addressed cache, polymorphic over a strategy S that
// provides:
//   using Key, Value
//   std::string cache_key(const Key&) const
//   bool validate(const Key&, const Value&) const
//   int64_t ttl_secs() const            (0 = no expiry)
//   size_t max_size() const             (entry bound)
//   size_t size_of(const Value&) const
//   const char* name() const
//
// Readers share the lock and touch per-entry atomics; writers are exclusive.
// Recency is a key list, least recent at the front, with each entry holding
// its node. Readers move their node to the back under lru_mu_.
template<typename S>
class ContentCache {
public:
    using Key = typename S::Key;
    using Value = typename S::Value;
    using ValuePtr = std::shared_ptr<const Value>;
    using Entry = CacheEntry<Value>;

    explicit ContentCache(S strategy, size_t max_bytes = 0)
        : strategy_(std::move(strategy)), max_bytes_(max_bytes) {}

    ContentCache(const ContentCache&) = delete;
    ContentCache& operator=(const ContentCache&) = delete;

    // record = false leaves hit/miss counters to a caller that layers
    // another tier behind this one
    ValuePtr get(const Key& key, bool record = true) {
        return get_hashed(strategy_.cache_key(key), &key, record);
    }

    // Lookup by precomputed cache key; the validation predicate is skipped
    // because the original key is not available.
    ValuePtr get_by_cache_key(const std::string& ck, bool record = true) {
        return get_hashed(ck, nullptr, record);
    }

    void put(const Key& key, Value value) {
        put_hashed(strategy_.cache_key(key), std::make_shared<const Value>(std::move(value)));
    }

    void put(const Key& key, ValuePtr value) {
        put_hashed(strategy_.cache_key(key), std::move(value));
    }

    void put_by_cache_key(const std::string& ck, ValuePtr value) {
        put_hashed(ck, std::move(value));
    }

    ValuePtr remove(const Key& key) {
        return remove_by_cache_key(strategy_.cache_key(key));
    }

    ValuePtr remove_by_cache_key(const std::string& ck) {
        std::unique_lock<std::shared_mutex> lock(mu_);
        auto it = entries_.find(ck);
        if (it == entries_.end()) return nullptr;
        ValuePtr v = it->second.entry->value;
        stats_.add_bytes(-static_cast<int64_t>(it->second.entry->size_bytes));
        erase_locked(it);
        return v;
    }

    // Drops every entry in one step; counters other than bytes are kept.
    void clear() {
        std::unique_lock<std::shared_mutex> lock(mu_);
        entries_.clear();
        lru_.clear();
        stats_.add_bytes(-live_bytes_);
        live_bytes_ = 0;
    }

    // Purge expired entries, then evict least recently used entries while
    // over the entry or byte bound. Returns the number removed.
    size_t evict_if_needed() {
        std::unique_lock<std::shared_mutex> lock(mu_);
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (expired(*it->second.entry)) {
                stats_.record_eviction(it->second.entry->size_bytes);
                it = erase_locked(it);
                ++removed;
            } else {
                ++it;
            }
        }
        removed += enforce_bounds_locked("");
        return removed;
    }

    size_t len() const {
        std::shared_lock<std::shared_mutex> lock(mu_);
        return entries_.size();
    }

    bool contains(const Key& key) const {
        std::shared_lock<std::shared_mutex> lock(mu_);
        return entries_.count(strategy_.cache_key(key)) > 0;
    }

    CacheMetrics metrics() const {
        CacheMetrics m;
        m.name = strategy_.name();
        m.max_entries = strategy_.max_size();
        m.max_bytes = max_bytes_;
        m.ttl_secs = strategy_.ttl_secs();
        m.stats = stats_.snapshot();
        std::shared_lock<std::shared_mutex> lock(mu_);
        m.entries = entries_.size();
        return m;
    }

    std::vector<HotEntry> hot_entries(size_t limit) const {
        std::vector<HotEntry> out;
        {
            std::shared_lock<std::shared_mutex> lock(mu_);
            out.reserve(entries_.size());
            for (const auto& kv : entries_) {
                const Entry& e = *kv.second.entry;
                out.push_back({kv.first, e.access_count.load(), e.size_bytes, e.age_secs()});
            }
        }
        std::sort(out.begin(), out.end(), [](const HotEntry& a, const HotEntry& b) {
            if (a.access_count != b.access_count) return a.access_count > b.access_count;
            return a.key < b.key;
        });
        if (out.size() > limit) out.resize(limit);
        return out;
    }

    size_t invalidate_matching(const std::function<bool(const std::string&)>& pred) {
        std::unique_lock<std::shared_mutex> lock(mu_);
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (pred(it->first)) {
                stats_.add_bytes(-static_cast<int64_t>(it->second.entry->size_bytes));
                it = erase_locked(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    CacheStats& stats() { return stats_; }
    const CacheStats& stats() const { return stats_; }
    const S& strategy() const { return strategy_; }
    size_t max_bytes() const { return max_bytes_; }

private:
    struct Slot {
        std::unique_ptr<Entry> entry;
        std::list<std::string>::iterator lru;
    };
    using Map = std::unordered_map<std::string, Slot>;

    bool expired(const Entry& e) const {
        int64_t ttl = strategy_.ttl_secs();
        return ttl > 0 && e.age_secs() > static_cast<double>(ttl);
    }

    ValuePtr get_hashed(const std::string& ck, const Key* key, bool record) {
        {
            std::shared_lock<std::shared_mutex> lock(mu_);
            auto it = entries_.find(ck);
            if (it == entries_.end()) {
                if (record) stats_.record_miss();
                return nullptr;
            }
            Entry& e = *it->second.entry;
            if (!expired(e) && (key == nullptr || strategy_.validate(*key, *e.value))) {
                e.access_count.fetch_add(1, std::memory_order_relaxed);
                e.last_accessed_at.store(std::max(now_ticks(), e.created_at));
                {
                    std::lock_guard<std::mutex> touch(lru_mu_);
                    lru_.splice(lru_.end(), lru_, it->second.lru);
                }
                if (record) stats_.record_hit();
                return e.value;
            }
        }

        // Stale: drop it under the writer lock, unless replaced meanwhile
        std::unique_lock<std::shared_mutex> lock(mu_);
        auto it = entries_.find(ck);
        if (it != entries_.end() &&
            (expired(*it->second.entry) ||
             (key && !strategy_.validate(*key, *it->second.entry->value)))) {
            log::trace("cache[%s]: dropping stale entry %s", strategy_.name(), ck.c_str());
            stats_.record_eviction(it->second.entry->size_bytes);
            erase_locked(it);
        }
        if (record) stats_.record_miss();
        return nullptr;
    }

    void put_hashed(const std::string& ck, ValuePtr value) {
        size_t size = strategy_.size_of(*value);
        if (max_bytes_ > 0 && size > max_bytes_) {
            log::debug("cache[%s]: value of %zu bytes exceeds budget, not stored",
                       strategy_.name(), size);
            return;
        }

        std::unique_lock<std::shared_mutex> lock(mu_);
        auto it = entries_.find(ck);
        if (it != entries_.end()) {
            stats_.add_bytes(-static_cast<int64_t>(it->second.entry->size_bytes));
            erase_locked(it);
        }
        auto node = lru_.insert(lru_.end(), ck);
        entries_.emplace(ck, Slot{std::make_unique<Entry>(std::move(value), size), node});
        live_bytes_ += static_cast<int64_t>(size);
        stats_.add_bytes(static_cast<int64_t>(size));
        enforce_bounds_locked(ck);
    }

    // Caller holds the writer lock
    typename Map::iterator erase_locked(typename Map::iterator it) {
        live_bytes_ -= static_cast<int64_t>(it->second.entry->size_bytes);
        lru_.erase(it->second.lru);
        return entries_.erase(it);
    }

    // Caller holds the writer lock. Never evicts `keep`.
    size_t enforce_bounds_locked(const std::string& keep) {
        size_t removed = 0;
        size_t max_entries = strategy_.max_size();

        while (!lru_.empty() &&
               ((max_entries > 0 && entries_.size() > max_entries) ||
                (max_bytes_ > 0 && live_bytes_ > static_cast<int64_t>(max_bytes_)))) {
            if (lru_.front() == keep) break;
            auto victim = entries_.find(lru_.front());
            log::trace("cache[%s]: evicting %s", strategy_.name(), victim->first.c_str());
            stats_.record_eviction(victim->second.entry->size_bytes);
            erase_locked(victim);
            ++removed;
        }
        return removed;
    }

    S strategy_;
    size_t max_bytes_;
    mutable std::shared_mutex mu_;
    Map entries_;
    std::list<std::string> lru_;
    std::mutex lru_mu_;
    int64_t live_bytes_ = 0;
    CacheStats stats_;
};

} // namespace pmat::cache
