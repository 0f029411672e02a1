#pragma once
/**
 * @file bounded_cache.h
 * @brief Size- and age-bounded caches for ephemeral engine state
 *
 * Key features:
 * - Narrow cache interface (get/set/invalidate/stats) for injection
 * - Least-recently-used eviction once the entry limit is reached
 * - Per-entry time-to-live with an explicit sweep instead of finalizers
 * - Injectable clock for deterministic expiry in tests
 */

#include "tessera/core/types.h"
#include <functional>
#include <iterator>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tessera::core {

// ============================================================================
// Structs
// ============================================================================

/**
 * @brief Cache statistics
 */
struct CacheStats {
    UInt64 hits{0};             ///< Successful lookups
    UInt64 misses{0};           ///< Lookups of absent or expired keys
    UInt64 evictions{0};        ///< Entries removed by the LRU policy
    UInt64 expirations{0};      ///< Entries removed because their TTL elapsed
    SizeT size{0};              ///< Current entry count
    SizeT capacity{0};          ///< Maximum entry count

    Real hit_rate() const noexcept {
        const UInt64 total = hits + misses;
        return total > 0 ? static_cast<Real>(hits) / static_cast<Real>(total) : 0.0;
    }

    void reset() noexcept {
        hits = 0;
        misses = 0;
        evictions = 0;
        expirations = 0;
    }
};

/**
 * @brief Cache configuration
 */
struct CacheConfig {
    SizeT max_entries{5000};                    ///< LRU bound
    Milliseconds ttl{Milliseconds(30000)};      ///< Zero disables expiry
    std::function<Timestamp()> clock;           ///< Defaults to system_clock

    static CacheConfig default_config() noexcept {
        return CacheConfig{};
    }
};

// ============================================================================
// Interfaces
// ============================================================================

/**
 * @brief Interface for bounded key/value caches
 */
template <typename Key, typename Value>
class IBoundedCache {
public:
    virtual ~IBoundedCache() = default;

    virtual std::optional<Value> get(const Key& key) = 0;
    virtual void set(const Key& key, Value value) = 0;
    virtual bool invalidate(const Key& key) = 0;
    virtual void clear() = 0;

    /**
     * @brief Remove every expired entry
     * @return Number of entries removed
     */
    virtual SizeT sweep() = 0;

    /**
     * @brief Snapshot of live (non-expired) entries, most recent first
     */
    virtual std::vector<std::pair<Key, Value>> entries() = 0;

    virtual CacheStats stats() const = 0;
};

// ============================================================================
// LRU + TTL Implementation
// ============================================================================

/**
 * @brief Thread-safe LRU cache with per-entry TTL
 *
 * Entries live in a recency list (front = most recent); an index maps keys
 * to list nodes so lookups and promotions are O(1).
 */
template <typename Key, typename Value>
class LruTtlCache : public IBoundedCache<Key, Value> {
public:
    explicit LruTtlCache(CacheConfig config = CacheConfig::default_config())
        : config_(std::move(config)) {
        if (!config_.clock) {
            config_.clock = [] { return std::chrono::system_clock::now(); };
        }
        if (config_.max_entries == 0) {
            config_.max_entries = 1;
        }
        stats_.capacity = config_.max_entries;
    }

    std::optional<Value> get(const Key& key) override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = index_.find(key);
        if (it == index_.end()) {
            stats_.misses++;
            return std::nullopt;
        }

        if (is_expired(*it->second, config_.clock())) {
            erase_node(it->second);
            stats_.expirations++;
            stats_.misses++;
            return std::nullopt;
        }

        // Promote to most recently used
        entries_.splice(entries_.begin(), entries_, it->second);
        stats_.hits++;
        return it->second->value;
    }

    void set(const Key& key, Value value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const Timestamp now = config_.clock();

        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->value = std::move(value);
            it->second->stored_at = now;
            entries_.splice(entries_.begin(), entries_, it->second);
            return;
        }

        while (entries_.size() >= config_.max_entries) {
            erase_node(std::prev(entries_.end()));
            stats_.evictions++;
        }

        entries_.push_front(Entry{key, std::move(value), now});
        index_[key] = entries_.begin();
        stats_.size = entries_.size();
    }

    bool invalidate(const Key& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        erase_node(it->second);
        return true;
    }

    void clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        index_.clear();
        stats_.size = 0;
    }

    SizeT sweep() override {
        std::lock_guard<std::mutex> lock(mutex_);
        const Timestamp now = config_.clock();

        SizeT removed = 0;
        auto it = entries_.begin();
        while (it != entries_.end()) {
            auto next = std::next(it);
            if (is_expired(*it, now)) {
                erase_node(it);
                removed++;
            }
            it = next;
        }
        stats_.expirations += removed;
        return removed;
    }

    std::vector<std::pair<Key, Value>> entries() override {
        std::lock_guard<std::mutex> lock(mutex_);
        const Timestamp now = config_.clock();

        std::vector<std::pair<Key, Value>> live;
        live.reserve(entries_.size());
        for (const auto& entry : entries_) {
            if (!is_expired(entry, now)) {
                live.emplace_back(entry.key, entry.value);
            }
        }
        return live;
    }

    CacheStats stats() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    struct Entry {
        Key key;
        Value value;
        Timestamp stored_at;
    };

    using EntryList = std::list<Entry>;

    bool is_expired(const Entry& entry, Timestamp now) const {
        return config_.ttl.count() > 0 && now - entry.stored_at > config_.ttl;
    }

    void erase_node(typename EntryList::iterator node) {
        index_.erase(node->key);
        entries_.erase(node);
        stats_.size = entries_.size();
    }

    CacheConfig config_;
    mutable std::mutex mutex_;
    EntryList entries_;
    std::unordered_map<Key, typename EntryList::iterator> index_;
    CacheStats stats_;
};

} // namespace tessera::core
