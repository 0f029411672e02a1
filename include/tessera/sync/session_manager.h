#pragma once
/**
 * @file session_manager.h
 * @brief One processing actor per whiteboard
 *
 * Key features:
 * - Operations for a whiteboard run serially on its actor lane
 * - Different whiteboards proceed in parallel
 * - Automatic resolution of newly detected conflicts on the same lane
 * - Retention pruning against server time that keeps unresolved evidence
 * - Best-effort prediction channel fed by coalesced live activity
 * - Audit and notification delivery on a separate cold-path lane
 */

#include "tessera/core/bounded_cache.h"
#include "tessera/core/threading/actor_pool.h"
#include "tessera/interface/config.h"
#include "tessera/sync/conflict_predictor.h"
#include "tessera/sync/conflict_resolution.h"
#include "tessera/sync/operation_compressor.h"
#include "tessera/sync/performance_analyzer.h"
#include "tessera/sync/transform_engine.h"
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tessera::sync {

/**
 * @brief Result of submitting one operation
 */
struct OperationOutcome {
    TransformResult transform;
    std::vector<ResolutionOutcome> resolutions;     ///< One per entry of transform.conflicts
};

/**
 * @brief Result of submitting a transaction
 */
struct TransactionOutcome {
    TransactionResult transaction;
    std::vector<ResolutionOutcome> resolutions;     ///< Conflicts of every committed operation
};

/**
 * @brief Owns the engine components and the per-whiteboard contexts
 */
class SessionManager {
public:
    /**
     * @param config Validated engine configuration
     * @param audit_log Defaults to an in-memory log
     * @param notifier Defaults to the logging sink
     */
    explicit SessionManager(const config::EngineConfig& config,
                            std::shared_ptr<IAuditLog> audit_log = nullptr,
                            std::shared_ptr<INotificationSink> notifier = nullptr);

    /**
     * @brief Drains queued work, then releases every session
     */
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * @brief Transform an operation and auto-resolve its new conflicts
     *
     * Starts a session on first use of the whiteboard id.
     */
    std::future<OperationOutcome> submit_operation(const WhiteboardId& whiteboard_id, Operation op);

    /**
     * @brief Commit several operations of one user all-or-nothing
     *
     * Conflicts of the committed operations are auto-resolved as for
     * submit_operation. A rejected transaction changes nothing.
     */
    std::future<TransactionOutcome> submit_transaction(const WhiteboardId& whiteboard_id,
                                                       const UserId& user_id,
                                                       std::vector<Operation> ops);

    /**
     * @brief Stamp a server-side operation with the whiteboard clock
     */
    std::future<Operation> stamp_operation(const WhiteboardId& whiteboard_id, Operation op);

    /**
     * @brief Record a presence sample; later samples of a user replace earlier ones
     */
    void submit_activity(const WhiteboardId& whiteboard_id, const UserActivity& activity);

    /**
     * @brief Predict conflicts on the best-effort channel
     * @return std::nullopt when dropped (request in flight, predictions off, unknown whiteboard)
     */
    std::optional<std::vector<ConflictPrediction>> request_predictions(const WhiteboardId& whiteboard_id);

    /**
     * @brief Pending operations compressed for broadcast
     *
     * Operations of unresolved conflicts are preserved.
     */
    std::future<std::vector<Operation>> get_compressed_pending(const WhiteboardId& whiteboard_id);

    std::future<std::vector<Operation>> get_pending_operations(const WhiteboardId& whiteboard_id);

    std::future<std::optional<ElementState>> get_element_state(const WhiteboardId& whiteboard_id,
                                                               const ElementId& element_id);

    /**
     * @brief Queue size, throughput and latency for external backpressure
     */
    std::optional<PerformanceMetrics> get_performance_metrics(const WhiteboardId& whiteboard_id);

    std::optional<PerformanceReport> analyze_performance(const WhiteboardId& whiteboard_id);

    /**
     * @brief Discard the whiteboard's context, clock state and tracked conflicts
     * @return false for an unknown whiteboard
     */
    bool end_session(const WhiteboardId& whiteboard_id);

    std::vector<WhiteboardId> active_sessions() const;

    /**
     * @brief Block until every queued task has run
     */
    void wait_idle();

    IConflictResolutionService& resolution_service() { return *resolution_; }
    IConflictPredictor& predictor() { return *predictor_; }
    IOperationCompressor& compressor() { return *compressor_; }

private:
    struct Session;

    std::shared_ptr<Session> find_session(const WhiteboardId& whiteboard_id) const;
    std::shared_ptr<Session> get_or_create_session(const WhiteboardId& whiteboard_id);
    OperationOutcome process(Session& session, const Operation& op);

    /**
     * @brief Record an accepted operation and auto-resolve its conflicts
     */
    void settle(Session& session, const TransformResult& transform, std::vector<ResolutionOutcome>& resolutions);

    /**
     * @brief Retention pruning and periodic conflict cleanup after a change
     */
    void maintain(Session& session);

    /**
     * @brief Operations referenced by conflicts still awaiting resolution
     */
    std::unordered_set<OperationId> unresolved_operation_ids(const Session& session) const;

    config::EngineConfig config_;
    std::unique_ptr<core::ActorPool> pool_;
    std::unique_ptr<ITransformEngine> engine_;
    std::unique_ptr<IConflictResolutionService> resolution_;
    std::unique_ptr<IConflictPredictor> predictor_;
    std::unique_ptr<IOperationCompressor> compressor_;

    mutable std::mutex sessions_mutex_;
    std::unordered_map<WhiteboardId, std::shared_ptr<Session>> sessions_;
};

} // namespace tessera::sync
