#pragma once
/**
 * @file conflict_resolution.h
 * @brief Conflict analysis, automatic resolution and manual escalation
 *
 * Key features:
 * - Confidence and risk scoring from type, severity, complexity and history
 * - Bounded retry loop over the recommended and alternative strategies
 * - Apply-or-discard commits; cancellation only between attempts
 * - Append-only audit trail and user notifications on a cold path
 * - Conflict analytics read from the audit log
 *
 * Per-conflict state machine:
 *   Detected -> Analyzing -> {ResolvedAutomatic | ResolvedManualPending | Failed}
 *   ResolvedManualPending -> ResolvedManual (complete_manual_intervention)
 */

#include "tessera/core/result.h"
#include "tessera/interface/config.h"
#include "tessera/sync/conflict.h"
#include "tessera/sync/resolution_strategies.h"
#include "tessera/sync/transform_engine.h"
#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tessera::core {
class ActorPool;
}

namespace tessera::sync {

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Lifecycle state of a tracked conflict
 */
enum class ConflictState : UInt8 {
    Detected,
    Analyzing,
    ResolvedAutomatic,
    ResolvedManualPending,
    ResolvedManual,
    Failed
};

/**
 * @brief Convert ConflictState to string
 */
inline const char* conflict_state_to_string(ConflictState state) {
    switch (state) {
        case ConflictState::Detected: return "detected";
        case ConflictState::Analyzing: return "analyzing";
        case ConflictState::ResolvedAutomatic: return "resolved_automatic";
        case ConflictState::ResolvedManualPending: return "resolved_manual_pending";
        case ConflictState::ResolvedManual: return "resolved_manual";
        case ConflictState::Failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Kind of audit record
 */
enum class AuditAction : UInt8 {
    ResolvedAutomatic,
    ResolutionFailed,
    ManualInterventionRequested,
    ResolvedManual
};

/**
 * @brief Convert AuditAction to string
 */
inline const char* audit_action_to_string(AuditAction action) {
    switch (action) {
        case AuditAction::ResolvedAutomatic: return "resolved_automatic";
        case AuditAction::ResolutionFailed: return "resolution_failed";
        case AuditAction::ManualInterventionRequested: return "manual_intervention_requested";
        case AuditAction::ResolvedManual: return "resolved_manual";
        default: return "unknown";
    }
}

// ============================================================================
// Structs
// ============================================================================

/**
 * @brief Alternative to the recommended strategy
 */
struct AlternativeStrategy {
    ResolutionStrategy strategy{ResolutionStrategy::Manual};
    Real confidence{0.0};
    std::vector<std::string> pros;
    std::vector<std::string> cons;
};

/**
 * @brief Analysis result for a conflict
 */
struct ResolutionRecommendation {
    ResolutionStrategy strategy{ResolutionStrategy::Manual};
    Real confidence{0.0};                       ///< [0, 1]
    std::string reasoning;
    UInt32 estimated_resolution_time_ms{0};
    RiskLevel risk{RiskLevel::Low};
    std::vector<AlternativeStrategy> alternatives;  ///< In fallback order
};

/**
 * @brief One strategy attempt
 */
struct ResolutionAttempt {
    ResolutionStrategy strategy{ResolutionStrategy::Manual};
    bool success{false};
    std::string detail;
};

/**
 * @brief Result of automatic resolution
 */
struct ResolutionOutcome {
    bool success{false};
    std::optional<Operation> resolution;        ///< Committed resolution operation
    std::optional<ResolutionStrategy> strategy_used;
    bool requires_manual_intervention{false};
    EngineResult error{EngineResult::Success};
    std::string message;
    std::vector<ResolutionAttempt> attempts;
    Real confidence{0.0};
};

/**
 * @brief Append-only audit row
 */
struct AuditRecord {
    std::string id;
    ConflictId conflict_id;
    WhiteboardId whiteboard_id;
    ConflictType type{ConflictType::Temporal};
    ConflictSeverity severity{ConflictSeverity::Low};
    AuditAction action{AuditAction::ResolvedAutomatic};
    std::optional<ResolutionStrategy> strategy;
    std::vector<UserId> users;
    std::vector<ElementId> elements;
    Real resolution_time_ms{0.0};
    std::string detail;
    std::optional<UserId> resolver;
    Timestamp recorded_at{};
};

/**
 * @brief Closed time interval
 */
struct TimeRange {
    Timestamp start{};
    Timestamp end{};

    bool contains(Timestamp t) const { return t >= start && t <= end; }
};

/**
 * @brief Audit log filter
 */
struct AuditQuery {
    std::optional<WhiteboardId> whiteboard_id;
    std::optional<TimeRange> time_range;
};

/**
 * @brief User-visible conflict notice
 */
struct ConflictNotification {
    std::string id;
    ConflictId conflict_id;
    WhiteboardId whiteboard_id;
    std::vector<UserId> recipients;
    std::string message;
    std::vector<std::string> suggested_actions;
    Timestamp created_at{};
    bool acknowledged{false};
};

/**
 * @brief Conflict awaiting a human decision
 */
struct ManualIntervention {
    ConflictPtr conflict;
    ResolutionRecommendation recommendation;
    Timestamp requested_at{};
};

/**
 * @brief Conflict count for one hour of the day (UTC)
 */
struct HourlyCount {
    UInt32 hour{0};
    UInt64 count{0};
};

/**
 * @brief Conflicts per day (UTC)
 */
struct TrendBucket {
    Int64 day{0};               ///< Days since the Unix epoch
    UInt64 conflicts{0};
    UInt64 resolved{0};
};

/**
 * @brief Reporting view over the audit log
 */
struct ConflictAnalytics {
    UInt64 total_conflicts{0};
    std::map<ConflictType, UInt64> by_type;
    std::map<ConflictSeverity, UInt64> by_severity;
    Real resolution_success_rate{0.0};
    Real automatic_resolution_rate{0.0};
    Real average_resolution_time_ms{0.0};
    std::map<UserId, UInt64> user_participation;
    std::vector<HourlyCount> peak_hours;        ///< Most conflicts first
    std::vector<TrendBucket> trend;             ///< Oldest first, at most 30 days
    bool degraded{false};                       ///< Audit log unavailable
    std::string degraded_reason;
};

/**
 * @brief Service counters
 */
struct ResolutionServiceStats {
    UInt64 automatic_successes{0};
    UInt64 automatic_failures{0};
    UInt64 manual_requests{0};
    UInt64 persistence_failures{0};
    UInt64 notification_failures{0};
};

// ============================================================================
// Interfaces
// ============================================================================

/**
 * @brief Append-only persistence for audit records
 */
class IAuditLog {
public:
    virtual ~IAuditLog() = default;

    virtual EngineResult append_audit_record(const AuditRecord& record) = 0;

    /**
     * @brief Read records matching a filter
     * @param records Output, oldest first
     */
    virtual EngineResult query(const AuditQuery& filter, std::vector<AuditRecord>& records) const = 0;
};

/**
 * @brief Delivery of user-visible notices
 */
class INotificationSink {
public:
    virtual ~INotificationSink() = default;

    virtual EngineResult notify_users(const std::vector<UserId>& users,
                                      const ConflictNotification& notification) = 0;
};

/**
 * @brief Interface for the conflict resolution service
 */
class IConflictResolutionService {
public:
    virtual ~IConflictResolutionService() = default;

    virtual ResolutionRecommendation analyze_conflict(const Conflict& conflict) const = 0;

    /**
     * @brief Resolve a conflict without human input
     *
     * Tries the recommended strategy, then the alternatives, stopping after
     * the configured maximum number of attempts. Only a successful candidate
     * is committed, through TransformContext::commit_operation. A conflict
     * already awaiting manual review is reported as AlreadyProcessing with
     * requires_manual_intervention set, and its state is left unchanged.
     * @param cancel Checked between attempts
     */
    virtual ResolutionOutcome resolve_conflict_automatically(const ConflictPtr& conflict,
                                                             TransformContext& context,
                                                             const std::atomic<bool>* cancel = nullptr) = 0;

    /**
     * @brief Escalate a conflict to human review
     * @return Duplicate when the conflict is already pending
     */
    virtual EngineResult request_manual_intervention(
        const ConflictPtr& conflict,
        const std::optional<ResolutionRecommendation>& recommendation = std::nullopt) = 0;

    /**
     * @brief Close a pending intervention with a human-chosen resolution
     * @param context Receives the resolution when provided
     */
    virtual EngineResult complete_manual_intervention(const ConflictId& conflict_id,
                                                      const Operation& resolution,
                                                      const UserId& resolver,
                                                      TransformContext* context = nullptr) = 0;

    virtual std::vector<ManualIntervention> get_pending_manual_interventions() const = 0;

    virtual std::optional<ConflictState> get_conflict_state(const ConflictId& conflict_id) const = 0;

    /**
     * @brief Aggregate the audit log; never throws
     */
    virtual ConflictAnalytics get_conflict_analytics(
        const std::optional<WhiteboardId>& whiteboard_id = std::nullopt,
        const std::optional<TimeRange>& time_range = std::nullopt) const = 0;

    virtual std::vector<ConflictNotification> get_notifications(const UserId& user_id) const = 0;

    virtual EngineResult acknowledge_notification(const std::string& notification_id) = 0;

    /**
     * @brief Forget tracked conflicts older than the conflict timeout
     *
     * Conflicts pending manual review are kept.
     * @return Number of conflicts dropped
     */
    virtual SizeT cleanup_expired_conflicts(Timestamp now) = 0;

    /**
     * @brief Forget every conflict of a whiteboard whose session ended
     *
     * Drops tracking, pending manual reviews, notifications and the failure
     * history of the affected elements.
     * @return Number of conflicts dropped
     */
    virtual SizeT release_whiteboard(const WhiteboardId& whiteboard_id) = 0;

    /**
     * @brief Replace the implementation used for a strategy kind
     */
    virtual void register_strategy(std::shared_ptr<IResolutionStrategy> strategy) = 0;

    virtual ResolutionServiceStats get_stats() const = 0;

    virtual const config::ResolutionSettings& settings() const = 0;
};

// ============================================================================
// Factory Functions
// ============================================================================

/**
 * @brief Create an in-memory audit log
 * @param max_records Oldest records are dropped beyond this
 */
std::shared_ptr<IAuditLog> create_in_memory_audit_log(SizeT max_records = 100000);

/**
 * @brief Create a sink that writes notices to the "tessera.notify" logger
 */
std::shared_ptr<INotificationSink> create_logging_notification_sink();

/**
 * @brief Create the resolution service
 * @param audit_log Defaults to an in-memory log
 * @param notifier Defaults to the logging sink
 * @param cold_path Pool used for audit and notification delivery; inline when null
 */
std::unique_ptr<IConflictResolutionService> create_conflict_resolution_service(
    const config::ResolutionSettings& settings,
    std::shared_ptr<IAuditLog> audit_log = nullptr,
    std::shared_ptr<INotificationSink> notifier = nullptr,
    core::ActorPool* cold_path = nullptr);

} // namespace tessera::sync
