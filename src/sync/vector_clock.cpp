/**
 * @file vector_clock.cpp
 * @brief Vector clock comparison and per-whiteboard tracker
 */

#include "tessera/sync/vector_clock.h"
#include <algorithm>
#include <deque>
#include <limits>
#include <mutex>
#include <sstream>
#include <unordered_map>

namespace tessera::sync {

// ============================================================================
// VectorClock
// ============================================================================

ClockOrdering VectorClock::compare(const VectorClock& other) const {
    bool some_less = false;
    bool some_greater = false;

    // Both maps are ordered by user id, so walk them in lockstep
    auto a = clocks.begin();
    auto b = other.clocks.begin();
    while (a != clocks.end() || b != other.clocks.end()) {
        UInt64 left = 0;
        UInt64 right = 0;
        if (b == other.clocks.end() || (a != clocks.end() && a->first < b->first)) {
            left = a->second;
            ++a;
        } else if (a == clocks.end() || b->first < a->first) {
            right = b->second;
            ++b;
        } else {
            left = a->second;
            right = b->second;
            ++a;
            ++b;
        }

        if (left < right) some_less = true;
        if (left > right) some_greater = true;
        if (some_less && some_greater) {
            return ClockOrdering::Concurrent;
        }
    }

    if (some_less) return ClockOrdering::Before;
    if (some_greater) return ClockOrdering::After;
    return ClockOrdering::Equal;
}

UInt64 VectorClock::total() const {
    UInt64 sum = 0;
    for (const auto& [user_id, value] : clocks) {
        sum += value;
    }
    return sum;
}

std::string VectorClock::to_string() const {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [user_id, value] : clocks) {
        if (!first) oss << ",";
        oss << user_id << ":" << value;
        first = false;
    }
    oss << "}";
    return oss.str();
}

// ============================================================================
// Vector Clock Tracker Implementation
// ============================================================================

class SimpleVectorClockTracker : public IVectorClockTracker {
public:
    explicit SimpleVectorClockTracker(SizeT max_history)
        : max_history_(max_history) {}

    VectorClock increment(const WhiteboardId& whiteboard_id, const UserId& user_id) override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto& board = boards_[whiteboard_id];
        board.clock.increment(user_id);

        board.history.push_back(ClockEvent{user_id, board.clock, std::chrono::system_clock::now()});
        if (board.history.size() > max_history_) {
            board.history.pop_front();
        }
        board.total_events++;

        return board.clock;
    }

    VectorClock observe(const WhiteboardId& whiteboard_id, const VectorClock& clock) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& board = boards_[whiteboard_id];
        board.clock.merge(clock);
        return board.clock;
    }

    VectorClock get_clock(const WhiteboardId& whiteboard_id) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = boards_.find(whiteboard_id);
        return it != boards_.end() ? it->second.clock : VectorClock{};
    }

    void reset(const WhiteboardId& whiteboard_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        boards_.erase(whiteboard_id);
    }

    ClockMetrics get_clock_metrics(const WhiteboardId& whiteboard_id) const override {
        std::lock_guard<std::mutex> lock(mutex_);

        ClockMetrics metrics;
        auto it = boards_.find(whiteboard_id);
        if (it == boards_.end() || it->second.clock.empty()) {
            return metrics;
        }

        const auto& board = it->second;
        metrics.total_events = board.total_events;
        metrics.user_activity = board.clock.clocks;

        UInt64 lowest = std::numeric_limits<UInt64>::max();
        UInt64 highest = 0;
        for (const auto& [user_id, value] : board.clock.clocks) {
            lowest = std::min(lowest, value);
            highest = std::max(highest, value);
        }

        metrics.clock_skew = highest - lowest;
        if (highest > 0) {
            metrics.synchronization_health = std::clamp(
                1.0 - static_cast<Real>(metrics.clock_skew) / static_cast<Real>(highest), 0.0, 1.0);
        }
        return metrics;
    }

    std::vector<ClockEvent> get_history(const WhiteboardId& whiteboard_id) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = boards_.find(whiteboard_id);
        if (it == boards_.end()) {
            return {};
        }
        return {it->second.history.begin(), it->second.history.end()};
    }

private:
    struct BoardClock {
        VectorClock clock;
        std::deque<ClockEvent> history;
        UInt64 total_events{0};
    };

    SizeT max_history_;
    mutable std::mutex mutex_;
    std::unordered_map<WhiteboardId, BoardClock> boards_;
};

// ============================================================================
// Factory Functions
// ============================================================================

std::unique_ptr<IVectorClockTracker> create_vector_clock_tracker(SizeT max_history) {
    return std::make_unique<SimpleVectorClockTracker>(max_history);
}

} // namespace tessera::sync
