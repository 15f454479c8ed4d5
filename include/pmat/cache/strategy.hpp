#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace pmat::cache {

using Clock = std::chrono::steady_clock;

inline int64_t now_ticks() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        Clock::now().time_since_epoch()).count();
}

// One stored value. size_bytes never changes after construction; the
// access fields are atomics so readers can touch them under a shared lock.
template<typename V>
struct CacheEntry {
    std::shared_ptr<const V> value;
    const size_t size_bytes;
    const int64_t created_at;                // Clock ticks (ns)
    std::atomic<int64_t> last_accessed_at;   // >= created_at
    std::atomic<uint64_t> access_count{0};

    CacheEntry(std::shared_ptr<const V> v, size_t size)
        : value(std::move(v)), size_bytes(size), created_at(now_ticks()),
          last_accessed_at(created_at) {}

    double age_secs() const {
        return static_cast<double>(now_ticks() - created_at) / 1e9;
    }
};

struct StatsSnapshot {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    int64_t total_bytes = 0;

    uint64_t total_requests() const { return hits + misses; }
    double hit_rate() const {
        uint64_t total = hits + misses;
        return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
    }
};

class CacheStats {
public:
    void record_hit() { hits_.fetch_add(1, std::memory_order_relaxed); }
    void record_miss() { misses_.fetch_add(1, std::memory_order_relaxed); }
    void record_eviction(size_t bytes) {
        evictions_.fetch_add(1, std::memory_order_relaxed);
        total_bytes_.fetch_sub(static_cast<int64_t>(bytes), std::memory_order_relaxed);
    }
    void add_bytes(int64_t delta) { total_bytes_.fetch_add(delta, std::memory_order_relaxed); }

    StatsSnapshot snapshot() const {
        StatsSnapshot s;
        s.hits = hits_.load();
        s.misses = misses_.load();
        s.evictions = evictions_.load();
        s.total_bytes = total_bytes_.load();
        return s;
    }

private:
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<int64_t> total_bytes_{0};
};

struct CacheMetrics {
    std::string name;
    size_t entries = 0;
    size_t max_entries = 0;
    size_t max_bytes = 0;
    int64_t ttl_secs = 0;
    StatsSnapshot stats;
};

struct HotEntry {
    std::string key;
    uint64_t access_count = 0;
    size_t size_bytes = 0;
    double age_secs = 0;
};

} // namespace pmat::cache
