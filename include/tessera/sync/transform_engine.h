#pragma once
/**
 * @file transform_engine.h
 * @brief Causal ordering and conflict scanning of incoming operations
 *
 * Key features:
 * - Structural validation with per-operation rejection
 * - Vector clock merge and causal insertion into the pending queue
 * - Conflict scan limited to the recency window
 * - Element snapshots that follow queue order, not arrival order
 * - All-or-nothing transactions over several operations
 * - Rolling performance metrics and adaptive throttling per whiteboard
 *
 * A TransformContext belongs to one whiteboard and is only mutated by that
 * whiteboard's actor.
 */

#include "tessera/core/bounded_cache.h"
#include "tessera/core/result.h"
#include "tessera/interface/config.h"
#include "tessera/sync/conflict_detector.h"
#include "tessera/sync/pending_queue.h"
#include "tessera/sync/vector_clock.h"
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tessera::sync {

// ============================================================================
// Structs
// ============================================================================

/**
 * @brief Rolling performance metrics of a whiteboard
 */
struct PerformanceMetrics {
    UInt64 operation_count{0};
    UInt64 rejected_count{0};
    Real average_latency_ms{0.0};
    Real max_latency_ms{0.0};
    UInt64 conflicts_detected{0};
    Real conflict_rate{0.0};                ///< Conflicts per accepted operation
    UInt64 resolutions_attempted{0};
    UInt64 resolutions_succeeded{0};
    Real resolution_success_rate{1.0};
    Real operation_throughput{0.0};         ///< Accepted operations per second
    SizeT queue_size{0};
    Real estimated_memory_mb{0.0};          ///< Pending queue, element states and history
};

/**
 * @brief Adaptive throttling parameters (operations per second)
 */
struct ThrottleState {
    Real current_rate{1000.0};
    Real min_rate{100.0};
    Real max_rate{10000.0};
    Real target_latency_ms{500.0};
};

using TransactionId = std::string;

/**
 * @brief Operations staged to be committed together
 */
struct Transaction {
    TransactionId id;
    UserId user_id;
    std::vector<Operation> operations;
    Timestamp created_at{};
};

/**
 * @brief Per-whiteboard working state
 */
struct TransformContext {
    WhiteboardId whiteboard_id;
    UInt64 canvas_version{0};
    PendingQueue pending;                           ///< Causally ordered
    ElementStateMap element_states;                 ///< base_states plus pending, in queue order
    ElementStateMap base_states;                    ///< Effect of operations retired from the queue
    VectorClock vector_clock;                       ///< Merged whiteboard clock
    LamportTime lamport_clock{0};
    Timestamp latest_timestamp{};                   ///< Newest accepted timestamp, capped at server time
    PerformanceMetrics metrics;
    std::deque<ConflictPtr> conflict_history;
    SizeT max_conflict_history{1000};
    OperationPairSet recorded_pairs;                ///< Conflicting pairs already reported
    std::map<UserId, Real> user_priorities;
    ThrottleState throttle;
    std::shared_ptr<core::IBoundedCache<ElementId, Bounds>> element_bounds;
    std::map<TransactionId, Transaction> transactions;   ///< Open transactions
    UInt64 next_transaction{0};
    Timestamp created_at{};

    /**
     * @brief Append to the bounded conflict history
     */
    void record_conflict(ConflictPtr conflict);

    /**
     * @brief Feed a resolution outcome into the success rate
     */
    void record_resolution(bool success);

    std::optional<Bounds> cached_bounds(const ElementId& element_id) const;

    /**
     * @brief Bring an element snapshot up to date after a queue insertion
     *
     * An insertion at the tail is applied directly. Anywhere else the
     * element is rebuilt from its base by replaying its pending operations
     * in queue order.
     */
    const ElementState& apply_at(const Operation& op, SizeT position);

    /**
     * @brief Recompute one element from base_states and the pending queue
     */
    const ElementState& rebuild_element(const ElementId& element_id);

    /**
     * @brief Queue and apply an operation produced by the engine itself
     *
     * Used for resolutions, which skip validation and conflict scanning.
     * @return Duplicate when the id is already pending
     */
    EngineResult commit_operation(const Operation& op);

    /**
     * @brief Fold an operation leaving the front of the queue into base_states
     */
    void retire(const Operation& op);
};

/**
 * @brief Result of transforming one operation
 */
struct TransformResult {
    EngineResult result{EngineResult::Success};
    std::string error;
    std::optional<Operation> transformed_operation;     ///< Annotated copy
    std::vector<ConflictPtr> conflicts;                 ///< Newly detected, most severe first
    PerformanceMetrics performance;
    SizeT queue_position{0};
    Real latency_ms{0.0};

    bool ok() const { return result == EngineResult::Success; }
};

/**
 * @brief Result of committing a transaction
 */
struct TransactionResult {
    EngineResult result{EngineResult::Success};
    std::string error;
    std::vector<TransformResult> results;               ///< One per operation, in staging order

    bool ok() const { return result == EngineResult::Success; }
};

/**
 * @brief Pending operations that pruning must keep
 */
using RetainPredicate = std::function<bool(const Operation&)>;

// ============================================================================
// Interfaces
// ============================================================================

/**
 * @brief Interface for the operation transform engine
 */
class ITransformEngine {
public:
    virtual ~ITransformEngine() = default;

    /**
     * @brief Create a fresh context for a whiteboard session
     */
    virtual TransformContext create_context(const WhiteboardId& whiteboard_id) const = 0;

    /**
     * @brief Validate, order and scan one incoming operation
     */
    virtual TransformResult transform_operation(const Operation& op, TransformContext& context) = 0;

    /**
     * @brief Give a locally created operation a fresh clock and Lamport timestamp
     */
    virtual Operation stamp_operation(Operation op, TransformContext& context) = 0;

    virtual std::vector<Operation> get_pending_operations(const TransformContext& context) const = 0;

    /**
     * @brief Evict pending operations older than the retention period
     *
     * Eviction runs from the front of the queue and stops at the first
     * operation that is still fresh or that the predicate retains.
     * @param now Reference time; sessions pass context.latest_timestamp
     * @param retain Operations to keep, e.g. evidence of unresolved conflicts
     * @return Number of operations evicted
     */
    virtual SizeT prune_pending(TransformContext& context, Timestamp now,
                                const RetainPredicate& retain = {}) = 0;

    /**
     * @brief Open a transaction for a user
     */
    virtual TransactionId begin_transaction(TransformContext& context, const UserId& user_id) = 0;

    /**
     * @brief Stage an operation; nothing is applied before commit
     * @return NotFound for an unknown transaction
     */
    virtual EngineResult add_to_transaction(TransformContext& context,
                                            const TransactionId& transaction_id,
                                            const Operation& op) = 0;

    /**
     * @brief Apply every staged operation, or none of them
     *
     * All operations are checked first. A single invalid or duplicate
     * operation discards the whole transaction and leaves the context
     * untouched. The transaction is closed either way.
     */
    virtual TransactionResult commit_transaction(TransformContext& context,
                                                 const TransactionId& transaction_id) = 0;

    /**
     * @brief Discard a transaction without applying anything
     * @return NotFound for an unknown transaction
     */
    virtual EngineResult rollback_transaction(TransformContext& context,
                                              const TransactionId& transaction_id) = 0;

    /**
     * @brief Discard tracker state for an ended session
     */
    virtual void end_session(TransformContext& context) = 0;

    virtual IVectorClockTracker& tracker() = 0;
    virtual const IConflictDetector& detector() const = 0;
};

// ============================================================================
// Factory Functions
// ============================================================================

/**
 * @brief Create a transform engine
 * @param config Engine configuration (transform, detection, performance)
 * @param tracker Clock tracker; a new one is created when null
 */
std::unique_ptr<ITransformEngine> create_transform_engine(
    const config::EngineConfig& config,
    std::unique_ptr<IVectorClockTracker> tracker = nullptr);

} // namespace tessera::sync
