#pragma once
/**
 * @file vector_clock.h
 * @brief Per-whiteboard causality tracking with vector clocks
 *
 * Key features:
 * - Vector clock value type with merge, dominance and ordering
 * - Thread-safe tracker holding one running clock per whiteboard
 * - Bounded increment history and clock health metrics
 */

#include "tessera/core/types.h"
#include <algorithm>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tessera::sync {

// ============================================================================
// Clock Ordering
// ============================================================================

/**
 * @brief Relationship between two vector clocks
 */
enum class ClockOrdering : UInt8 {
    Before,         ///< Left happens-before right
    After,          ///< Right happens-before left
    Concurrent,     ///< Neither dominates
    Equal           ///< Identical components
};

/**
 * @brief Convert ClockOrdering to string
 */
inline const char* clock_ordering_to_string(ClockOrdering ordering) {
    switch (ordering) {
        case ClockOrdering::Before: return "Before";
        case ClockOrdering::After: return "After";
        case ClockOrdering::Concurrent: return "Concurrent";
        case ClockOrdering::Equal: return "Equal";
        default: return "Unknown";
    }
}

// ============================================================================
// Vector Clock
// ============================================================================

/**
 * @brief Vector clock mapping user id to a monotonically increasing counter
 *
 * Components are kept in an ordered map so equal clocks compare and print
 * identically. Missing components read as zero.
 */
struct VectorClock {
    std::map<UserId, UInt64> clocks;

    VectorClock() = default;
    VectorClock(std::initializer_list<std::pair<const UserId, UInt64>> init)
        : clocks(init) {}

    /**
     * @brief Advance a user's own component by one
     */
    void increment(const UserId& user_id) {
        clocks[user_id]++;
    }

    UInt64 get(const UserId& user_id) const {
        auto it = clocks.find(user_id);
        return it != clocks.end() ? it->second : 0;
    }

    /**
     * @brief Set a component; never lowers an existing value
     */
    void set(const UserId& user_id, UInt64 value) {
        auto& slot = clocks[user_id];
        slot = std::max(slot, value);
    }

    /**
     * @brief Element-wise maximum with another clock
     */
    void merge(const VectorClock& other) {
        for (const auto& [user_id, value] : other.clocks) {
            auto& slot = clocks[user_id];
            slot = std::max(slot, value);
        }
    }

    /**
     * @brief Every component <= other's and at least one strictly less
     */
    bool happens_before(const VectorClock& other) const {
        return compare(other) == ClockOrdering::Before;
    }

    /**
     * @brief Neither clock dominates the other
     */
    bool concurrent_with(const VectorClock& other) const {
        return compare(other) == ClockOrdering::Concurrent;
    }

    /**
     * @brief Every component >= other's (includes equality)
     */
    bool dominates_or_equals(const VectorClock& other) const {
        const ClockOrdering ordering = compare(other);
        return ordering == ClockOrdering::After || ordering == ClockOrdering::Equal;
    }

    ClockOrdering compare(const VectorClock& other) const;

    /**
     * @brief Sum of all components (number of events observed)
     */
    UInt64 total() const;

    bool empty() const { return clocks.empty(); }

    std::string to_string() const;

    bool operator==(const VectorClock& other) const {
        return compare(other) == ClockOrdering::Equal;
    }
    bool operator!=(const VectorClock& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Tracker Structs
// ============================================================================

/**
 * @brief Health summary of a whiteboard clock
 */
struct ClockMetrics {
    UInt64 total_events{0};                     ///< Increments recorded in history
    UInt64 clock_skew{0};                       ///< Largest minus smallest component
    Real synchronization_health{1.0};           ///< 1 - skew / max component, in [0, 1]
    std::map<UserId, UInt64> user_activity;     ///< Current component per user
};

/**
 * @brief One recorded increment
 */
struct ClockEvent {
    UserId user_id;
    VectorClock clock;
    Timestamp recorded_at;
};

// ============================================================================
// Interfaces
// ============================================================================

/**
 * @brief Interface for per-whiteboard causality tracking
 */
class IVectorClockTracker {
public:
    virtual ~IVectorClockTracker() = default;

    /**
     * @brief Advance a user's counter on the whiteboard clock
     * @return The whiteboard clock after the increment
     */
    virtual VectorClock increment(const WhiteboardId& whiteboard_id, const UserId& user_id) = 0;

    /**
     * @brief Merge a received clock into the whiteboard clock
     * @return The merged whiteboard clock
     */
    virtual VectorClock observe(const WhiteboardId& whiteboard_id, const VectorClock& clock) = 0;

    virtual VectorClock get_clock(const WhiteboardId& whiteboard_id) const = 0;

    /**
     * @brief Drop all state for a whiteboard (session end)
     */
    virtual void reset(const WhiteboardId& whiteboard_id) = 0;

    virtual ClockMetrics get_clock_metrics(const WhiteboardId& whiteboard_id) const = 0;

    virtual std::vector<ClockEvent> get_history(const WhiteboardId& whiteboard_id) const = 0;

    /**
     * @brief Element-wise maximum of two clocks
     */
    static VectorClock merge(const VectorClock& a, const VectorClock& b) {
        VectorClock merged = a;
        merged.merge(b);
        return merged;
    }

    static ClockOrdering compare(const VectorClock& a, const VectorClock& b) {
        return a.compare(b);
    }
};

// ============================================================================
// Factory Functions
// ============================================================================

/**
 * @brief Create a thread-safe vector clock tracker
 * @param max_history Increments kept per whiteboard for metrics
 */
std::unique_ptr<IVectorClockTracker> create_vector_clock_tracker(SizeT max_history = 1000);

} // namespace tessera::sync
