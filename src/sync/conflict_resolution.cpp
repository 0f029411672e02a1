/**
 * @file conflict_resolution.cpp
 * @brief Conflict resolution service implementation
 */

#include "tessera/sync/conflict_resolution.h"
#include "tessera/core/logging.h"
#include "tessera/core/threading/actor_pool.h"
#include "tessera/telemetry/telemetry.h"
#include <algorithm>
#include <deque>
#include <mutex>
#include <sstream>
#include <unordered_map>

namespace tessera::sync {

namespace {

constexpr const char* COLD_PATH_LANE = "tessera.cold_path";
constexpr Int64 SECONDS_PER_HOUR = 3600;
constexpr Int64 SECONDS_PER_DAY = 86400;
constexpr SizeT TREND_DAYS = 30;

Real base_confidence(ConflictType type) {
    switch (type) {
        case ConflictType::Temporal: return 0.9;
        case ConflictType::Spatial: return 0.8;
        case ConflictType::Semantic: return 0.8;
        case ConflictType::Compound: return 0.3;
        default: return 0.5;
    }
}

Real severity_adjustment(ConflictSeverity severity) {
    switch (severity) {
        case ConflictSeverity::Low: return 0.1;
        case ConflictSeverity::Medium: return 0.0;
        case ConflictSeverity::High: return -0.15;
        case ConflictSeverity::Critical: return -0.3;
        default: return 0.0;
    }
}

ResolutionStrategy strategy_for(ConflictType type) {
    switch (type) {
        case ConflictType::Spatial: return ResolutionStrategy::SpatialOffset;
        case ConflictType::Temporal: return ResolutionStrategy::LastWriterWins;
        case ConflictType::Semantic: return ResolutionStrategy::LastWriterWins;
        case ConflictType::Compound: return ResolutionStrategy::Manual;
        default: return ResolutionStrategy::Manual;
    }
}

std::vector<ResolutionStrategy> fallbacks_for(ConflictType type) {
    switch (type) {
        case ConflictType::Spatial:
            return {ResolutionStrategy::LastWriterWins, ResolutionStrategy::PriorityUser,
                    ResolutionStrategy::Manual};
        case ConflictType::Temporal:
            return {ResolutionStrategy::FirstWriterWins, ResolutionStrategy::Merge,
                    ResolutionStrategy::PriorityUser, ResolutionStrategy::Manual};
        case ConflictType::Semantic:
            return {ResolutionStrategy::Merge, ResolutionStrategy::PriorityUser,
                    ResolutionStrategy::FirstWriterWins, ResolutionStrategy::Manual};
        case ConflictType::Compound:
        default:
            return {ResolutionStrategy::PriorityUser, ResolutionStrategy::LastWriterWins};
    }
}

UInt32 estimated_time_ms(ResolutionStrategy strategy) {
    switch (strategy) {
        case ResolutionStrategy::LastWriterWins: return 50;
        case ResolutionStrategy::FirstWriterWins: return 50;
        case ResolutionStrategy::PriorityUser: return 75;
        case ResolutionStrategy::SpatialOffset: return 100;
        case ResolutionStrategy::Merge: return 150;
        case ResolutionStrategy::Manual: return 300000;
        default: return 200;
    }
}

void describe(ResolutionStrategy strategy, AlternativeStrategy& alternative) {
    switch (strategy) {
        case ResolutionStrategy::LastWriterWins:
            alternative.pros = {"Deterministic", "Fast"};
            alternative.cons = {"Discards the earlier edit"};
            break;
        case ResolutionStrategy::FirstWriterWins:
            alternative.pros = {"Preserves the original edit"};
            alternative.cons = {"Discards the latest edit"};
            break;
        case ResolutionStrategy::PriorityUser:
            alternative.pros = {"Respects user roles"};
            alternative.cons = {"Needs distinct user priorities"};
            break;
        case ResolutionStrategy::Merge:
            alternative.pros = {"Keeps both edits where possible"};
            alternative.cons = {"Only numeric clashes can be averaged"};
            break;
        case ResolutionStrategy::SpatialOffset:
            alternative.pros = {"Keeps both elements visible"};
            alternative.cons = {"Changes the layout"};
            break;
        case ResolutionStrategy::Manual:
            alternative.pros = {"Human judgement"};
            alternative.cons = {"Slow", "Interrupts the users involved"};
            break;
        default:
            break;
    }
}

std::string join(const std::vector<std::string>& items, const char* separator) {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) joined += separator;
        joined += item;
    }
    return joined;
}

Int64 seconds_since_epoch(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

/**
 * @brief Failure counters shared with cold-path tasks
 */
struct ColdPathCounters {
    std::atomic<UInt64> persistence_failures{0};
    std::atomic<UInt64> notification_failures{0};
};

} // anonymous namespace

// ============================================================================
// In-Memory Audit Log
// ============================================================================

class InMemoryAuditLog : public IAuditLog {
public:
    explicit InMemoryAuditLog(SizeT max_records)
        : max_records_(std::max<SizeT>(max_records, 1)) {}

    EngineResult append_audit_record(const AuditRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
        while (records_.size() > max_records_) {
            records_.pop_front();
        }
        return EngineResult::Success;
    }

    EngineResult query(const AuditQuery& filter, std::vector<AuditRecord>& records) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        records.clear();
        for (const auto& record : records_) {
            if (filter.whiteboard_id && record.whiteboard_id != *filter.whiteboard_id) {
                continue;
            }
            if (filter.time_range && !filter.time_range->contains(record.recorded_at)) {
                continue;
            }
            records.push_back(record);
        }
        return EngineResult::Success;
    }

private:
    SizeT max_records_;
    mutable std::mutex mutex_;
    std::deque<AuditRecord> records_;
};

std::shared_ptr<IAuditLog> create_in_memory_audit_log(SizeT max_records) {
    return std::make_shared<InMemoryAuditLog>(max_records);
}

// ============================================================================
// Logging Notification Sink
// ============================================================================

class LoggingNotificationSink : public INotificationSink {
public:
    EngineResult notify_users(const std::vector<UserId>& users,
                              const ConflictNotification& notification) override {
        logging::get_logger("tessera.notify")->info("[{}] -> {}: {}",
            notification.whiteboard_id, join(users, ","), notification.message);
        return EngineResult::Success;
    }
};

std::shared_ptr<INotificationSink> create_logging_notification_sink() {
    return std::make_shared<LoggingNotificationSink>();
}

// ============================================================================
// Conflict Resolution Service
// ============================================================================

class SimpleConflictResolutionService : public IConflictResolutionService {
public:
    SimpleConflictResolutionService(const config::ResolutionSettings& settings,
                                    std::shared_ptr<IAuditLog> audit_log,
                                    std::shared_ptr<INotificationSink> notifier,
                                    core::ActorPool* cold_path)
        : settings_(settings)
        , audit_log_(audit_log ? std::move(audit_log) : create_in_memory_audit_log())
        , notifier_(notifier ? std::move(notifier) : create_logging_notification_sink())
        , cold_path_(cold_path)
        , counters_(std::make_shared<ColdPathCounters>())
        , logger_(logging::get_logger("tessera.resolution")) {
        for (auto kind : {ResolutionStrategy::LastWriterWins, ResolutionStrategy::FirstWriterWins,
                          ResolutionStrategy::PriorityUser, ResolutionStrategy::Merge,
                          ResolutionStrategy::SpatialOffset, ResolutionStrategy::Manual}) {
            strategies_[kind] = create_resolution_strategy(kind);
        }
    }

    ResolutionRecommendation analyze_conflict(const Conflict& conflict) const override {
        ResolutionRecommendation recommendation;

        Real confidence = base_confidence(conflict.type) + severity_adjustment(conflict.severity);

        const Real op_factor = std::min(static_cast<Real>(conflict.operations.size()) / 10.0, 0.5);
        const Real field_factor = static_cast<Real>(conflict.conflicting_field_count()) / 5.0;
        const Real complexity = std::min(op_factor + field_factor, 2.0);
        confidence *= (1.0 - complexity * 0.2);

        const UInt32 failures = recent_failures(conflict.affected_elements);
        confidence -= std::min(0.3, 0.1 * static_cast<Real>(failures));
        confidence = std::clamp(confidence, 0.1, 0.95);

        const bool existence_compound = conflict.type == ConflictType::Compound &&
                                        conflict.involves_existence_change();

        if (conflict.severity == ConflictSeverity::Critical || existence_compound) {
            recommendation.risk = RiskLevel::High;
        } else if (conflict.severity == ConflictSeverity::High) {
            recommendation.risk = RiskLevel::Medium;
        } else {
            recommendation.risk = RiskLevel::Low;
        }

        recommendation.strategy = strategy_for(conflict.type);
        if (recommendation.risk == RiskLevel::High) {
            recommendation.strategy = ResolutionStrategy::Manual;
            confidence = std::min(confidence, 0.3);
        }
        recommendation.confidence = confidence;
        recommendation.estimated_resolution_time_ms = estimated_time_ms(recommendation.strategy);

        Real step = 0.9;
        for (auto strategy : fallbacks_for(conflict.type)) {
            if (strategy == recommendation.strategy) {
                continue;
            }
            AlternativeStrategy alternative;
            alternative.strategy = strategy;
            alternative.confidence = strategy == ResolutionStrategy::Manual
                ? 0.95 : std::clamp(confidence * step, 0.1, 0.95);
            describe(strategy, alternative);
            recommendation.alternatives.push_back(std::move(alternative));
            step -= 0.1;
        }

        std::ostringstream reasoning;
        reasoning << conflict_type_to_string(conflict.type) << " conflict with "
                  << conflict_severity_to_string(conflict.severity) << " severity across "
                  << conflict.operations.size() << " operations";
        if (failures > 0) {
            reasoning << ", " << failures << " recent failed resolutions on the same elements";
        }
        if (existence_compound) {
            reasoning << ", element existence at stake";
        }
        reasoning << "; " << resolution_strategy_to_string(recommendation.strategy)
                  << " recommended at " << risk_level_to_string(recommendation.risk) << " risk";
        recommendation.reasoning = reasoning.str();
        return recommendation;
    }

    ResolutionOutcome resolve_conflict_automatically(const ConflictPtr& conflict,
                                                     TransformContext& context,
                                                     const std::atomic<bool>* cancel) override {
        ResolutionOutcome outcome;
        if (!conflict) {
            outcome.error = EngineResult::NotFound;
            outcome.message = "no conflict given";
            return outcome;
        }

        const auto started = std::chrono::steady_clock::now();
        const bool enabled = settings_.automatic_resolution_enabled;

        // Check and claim in one step so a conflict is never analyzed twice
        {
            std::lock_guard<std::mutex> lock(mutex_);
            Tracked& tracked = track(conflict);
            if (pending_manual_.count(conflict->id) > 0) {
                outcome.requires_manual_intervention = true;
                outcome.error = EngineResult::AlreadyProcessing;
                outcome.message = "conflict is pending manual review";
                return outcome;
            }
            if (tracked.state == ConflictState::Analyzing ||
                tracked.state == ConflictState::ResolvedAutomatic ||
                tracked.state == ConflictState::ResolvedManual) {
                outcome.error = EngineResult::AlreadyProcessing;
                outcome.message = std::string("conflict is ") + conflict_state_to_string(tracked.state);
                return outcome;
            }
            if (enabled) {
                tracked.state = ConflictState::Analyzing;
            }
        }

        if (!enabled) {
            outcome.requires_manual_intervention = true;
            outcome.error = EngineResult::AutomaticResolutionDisabled;
            outcome.message = "automatic resolution is disabled";
            logger_->debug("Conflict {}: automatic resolution disabled, escalating", conflict->id);
            escalate(conflict, std::nullopt);
            return outcome;
        }

        const ResolutionRecommendation recommendation = analyze_conflict(*conflict);
        outcome.confidence = recommendation.confidence;

        if (recommendation.risk == RiskLevel::High ||
            recommendation.confidence < settings_.min_automatic_confidence) {
            outcome.requires_manual_intervention = true;
            outcome.error = EngineResult::RiskTooHigh;
            outcome.message = recommendation.reasoning;
            logger_->info("Conflict {}: risk {} / confidence {:.2f}, escalating to manual review",
                          conflict->id, risk_level_to_string(recommendation.risk), recommendation.confidence);
            escalate(conflict, recommendation);
            return outcome;
        }

        // Recommended strategy first, then the alternatives
        std::vector<ResolutionStrategy> plan{recommendation.strategy};
        for (const auto& alternative : recommendation.alternatives) {
            if (std::find(plan.begin(), plan.end(), alternative.strategy) == plan.end()) {
                plan.push_back(alternative.strategy);
            }
        }
        plan.erase(std::remove_if(plan.begin(), plan.end(), [](ResolutionStrategy s) {
            return s == ResolutionStrategy::Manual || s == ResolutionStrategy::Automatic;
        }), plan.end());

        StrategyContext strategy_context;
        strategy_context.user_priorities = context.user_priorities;
        strategy_context.spatial_offset_spacing = settings_.spatial_offset_spacing;
        strategy_context.geometry = [&context](const ElementId& element_id) {
            return context.cached_bounds(element_id);
        };

        const SizeT max_attempts = settings_.max_automatic_resolution_attempts;
        for (SizeT i = 0; i < plan.size() && outcome.attempts.size() < max_attempts; ++i) {
            if (cancel && cancel->load(std::memory_order_acquire)) {
                outcome.requires_manual_intervention = true;
                outcome.error = EngineResult::Cancelled;
                outcome.message = "cancelled after " + std::to_string(outcome.attempts.size()) + " attempts";
                set_state(conflict->id, ConflictState::Detected);
                logger_->info("Conflict {}: resolution cancelled", conflict->id);
                return outcome;
            }

            ResolutionAttempt attempt;
            attempt.strategy = plan[i];

            auto strategy = find_strategy(plan[i]);
            std::optional<Operation> candidate;
            if (!strategy) {
                attempt.detail = "no strategy registered";
            } else {
                try {
                    candidate = strategy->apply(*conflict, strategy_context);
                    if (!candidate) {
                        attempt.detail = "not applicable";
                    }
                } catch (const std::exception& e) {
                    attempt.detail = std::string("strategy threw: ") + e.what();
                    logger_->warn("Conflict {}: strategy {} threw: {}", conflict->id,
                                  resolution_strategy_to_string(plan[i]), e.what());
                    telemetry::record_error("resolution_strategy");
                }
            }

            if (candidate) {
                const EngineResult committed = context.commit_operation(*candidate);
                if (committed != EngineResult::Success) {
                    logger_->warn("Conflict {}: resolution {} not queued: {}", conflict->id,
                                  candidate->id, engine_result_to_string(committed));
                }
                attempt.success = true;
                attempt.detail = "applied " + candidate->id;
                outcome.success = true;
                outcome.strategy_used = plan[i];
                outcome.resolution = std::move(candidate);
            }
            outcome.attempts.push_back(std::move(attempt));
            if (outcome.success) {
                break;
            }
        }

        const Real elapsed_ms = std::chrono::duration<Real, std::milli>(
            std::chrono::steady_clock::now() - started).count();
        telemetry::metrics::engine().resolution_latency_ms.observe(elapsed_ms);
        telemetry::record_resolution(outcome.success);
        context.record_resolution(outcome.success);

        if (outcome.success) {
            finish_success(conflict, outcome, elapsed_ms);
            return outcome;
        }

        outcome.requires_manual_intervention = true;
        outcome.error = EngineResult::ResolutionExhausted;
        outcome.message = "all " + std::to_string(outcome.attempts.size()) + " strategy attempts failed";

        std::vector<std::string> history;
        for (const auto& attempt : outcome.attempts) {
            history.push_back(std::string(resolution_strategy_to_string(attempt.strategy)) + ": " + attempt.detail);
        }
        logger_->warn("Conflict {}: resolution exhausted [{}]", conflict->id, join(history, "; "));

        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.automatic_failures++;
            track(conflict).state = ConflictState::Failed;
            for (const auto& element_id : conflict->affected_elements) {
                element_failures_[element_id]++;
            }
        }

        persist(make_record(*conflict, AuditAction::ResolutionFailed, std::nullopt, elapsed_ms,
                            join(history, "; ")));
        escalate(conflict, recommendation);
        return outcome;
    }

    EngineResult request_manual_intervention(
        const ConflictPtr& conflict,
        const std::optional<ResolutionRecommendation>& recommendation) override {
        if (!conflict) {
            return EngineResult::NotFound;
        }

        const ResolutionRecommendation chosen = recommendation ? *recommendation : analyze_conflict(*conflict);
        const Timestamp now = std::chrono::system_clock::now();

        ConflictNotification notification;
        notification.conflict_id = conflict->id;
        notification.whiteboard_id = conflict->whiteboard_id;
        notification.recipients = conflict->affected_users();
        notification.message = "Conflict on " + join(conflict->affected_elements, ", ") +
                               " is pending manual review";
        if (chosen.strategy != ResolutionStrategy::Manual) {
            notification.suggested_actions.push_back(resolution_strategy_to_string(chosen.strategy));
        }
        for (const auto& alternative : chosen.alternatives) {
            if (alternative.strategy != ResolutionStrategy::Manual) {
                notification.suggested_actions.push_back(resolution_strategy_to_string(alternative.strategy));
            }
        }
        notification.created_at = now;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pending_manual_.count(conflict->id) > 0) {
                return EngineResult::Duplicate;
            }
            pending_manual_[conflict->id] = ManualIntervention{conflict, chosen, now};

            Tracked& tracked = track(conflict);
            if (tracked.state != ConflictState::Failed) {
                tracked.state = ConflictState::ResolvedManualPending;
            }
            stats_.manual_requests++;

            notification.id = "notification_" + std::to_string(++next_notification_id_);
            notifications_[conflict->id].push_back(notification);
        }

        telemetry::metrics::engine().manual_interventions.increment();
        logger_->warn("Conflict {} on whiteboard {} escalated to manual review: {}",
                      conflict->id, conflict->whiteboard_id, chosen.reasoning);

        persist(make_record(*conflict, AuditAction::ManualInterventionRequested, chosen.strategy, 0.0,
                            chosen.reasoning));
        deliver(notification);
        return EngineResult::Success;
    }

    EngineResult complete_manual_intervention(const ConflictId& conflict_id,
                                              const Operation& resolution,
                                              const UserId& resolver,
                                              TransformContext* context) override {
        ConflictPtr resolved;
        ConflictNotification notification;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pending_manual_.find(conflict_id);
            if (it == pending_manual_.end()) {
                return EngineResult::NotFound;
            }

            auto annotated = std::make_shared<Conflict>(*it->second.conflict);
            annotated->resolution_strategy = ResolutionStrategy::Manual;
            annotated->resolved_at = std::chrono::system_clock::now();
            resolved = annotated;
            pending_manual_.erase(it);

            Tracked& tracked = tracked_[conflict_id];
            tracked.conflict = resolved;
            tracked.state = ConflictState::ResolvedManual;
            for (const auto& element_id : resolved->affected_elements) {
                element_failures_.erase(element_id);
            }

            notification.id = "notification_" + std::to_string(++next_notification_id_);
            notification.conflict_id = conflict_id;
            notification.whiteboard_id = resolved->whiteboard_id;
            notification.recipients = resolved->affected_users();
            notification.message = "Conflict on " + join(resolved->affected_elements, ", ") +
                                   " was resolved by " + resolver;
            notification.created_at = *resolved->resolved_at;
            notifications_[conflict_id].push_back(notification);
        }

        if (context) {
            const EngineResult committed = context->commit_operation(resolution);
            if (committed != EngineResult::Success) {
                logger_->warn("Conflict {}: manual resolution {} not queued: {}", conflict_id,
                              resolution.id, engine_result_to_string(committed));
            }
            context->record_resolution(true);
        }

        const Real elapsed_ms = static_cast<Real>(
            millis_between(resolved->detected_at, *resolved->resolved_at));
        AuditRecord record = make_record(*resolved, AuditAction::ResolvedManual, ResolutionStrategy::Manual,
                                         std::max(0.0, elapsed_ms), "resolution " + resolution.id);
        record.resolver = resolver;
        persist(std::move(record));
        deliver(notification);

        logger_->info("Conflict {} resolved manually by {}", conflict_id, resolver);
        return EngineResult::Success;
    }

    std::vector<ManualIntervention> get_pending_manual_interventions() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ManualIntervention> pending;
        pending.reserve(pending_manual_.size());
        for (const auto& [id, intervention] : pending_manual_) {
            pending.push_back(intervention);
        }
        return pending;
    }

    std::optional<ConflictState> get_conflict_state(const ConflictId& conflict_id) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tracked_.find(conflict_id);
        if (it == tracked_.end()) {
            return std::nullopt;
        }
        return it->second.state;
    }

    ConflictAnalytics get_conflict_analytics(const std::optional<WhiteboardId>& whiteboard_id,
                                             const std::optional<TimeRange>& time_range) const override {
        ConflictAnalytics analytics;
        std::vector<AuditRecord> records;

        EngineResult status;
        std::string reason;
        try {
            status = audit_log_->query(AuditQuery{whiteboard_id, time_range}, records);
            reason = engine_result_to_string(status);
        } catch (const std::exception& e) {
            status = EngineResult::PersistenceError;
            reason = e.what();
        }

        if (status != EngineResult::Success) {
            counters_->persistence_failures++;
            telemetry::metrics::engine().persistence_failures.increment();
            logger_->error("Conflict analytics degraded, audit log query failed: {}", reason);
            analytics.degraded = true;
            analytics.degraded_reason = reason;
            return analytics;
        }

        struct Summary {
            ConflictType type{ConflictType::Temporal};
            ConflictSeverity severity{ConflictSeverity::Low};
            std::vector<UserId> users;
            Timestamp first_seen{};
            bool resolved{false};
            bool automatic{false};
        };

        std::map<ConflictId, Summary> conflicts;
        Real total_time = 0.0;
        UInt64 timed = 0;

        for (const auto& record : records) {
            auto [it, inserted] = conflicts.try_emplace(record.conflict_id);
            Summary& summary = it->second;
            if (inserted) {
                summary.type = record.type;
                summary.severity = record.severity;
                summary.users = record.users;
                summary.first_seen = record.recorded_at;
            } else {
                summary.first_seen = std::min(summary.first_seen, record.recorded_at);
            }

            if (record.action == AuditAction::ResolvedAutomatic || record.action == AuditAction::ResolvedManual) {
                summary.resolved = true;
                summary.automatic = summary.automatic || record.action == AuditAction::ResolvedAutomatic;
                total_time += record.resolution_time_ms;
                timed++;
            }
        }

        std::map<UInt32, UInt64> hours;
        std::map<Int64, TrendBucket> days;
        UInt64 resolved = 0;
        UInt64 automatic = 0;

        for (const auto& [id, summary] : conflicts) {
            analytics.by_type[summary.type]++;
            analytics.by_severity[summary.severity]++;
            for (const auto& user : summary.users) {
                analytics.user_participation[user]++;
            }

            const Int64 seconds = seconds_since_epoch(summary.first_seen);
            hours[static_cast<UInt32>((seconds / SECONDS_PER_HOUR) % 24)]++;

            TrendBucket& bucket = days[seconds / SECONDS_PER_DAY];
            bucket.day = seconds / SECONDS_PER_DAY;
            bucket.conflicts++;
            if (summary.resolved) {
                bucket.resolved++;
                resolved++;
            }
            if (summary.automatic) {
                automatic++;
            }
        }

        analytics.total_conflicts = conflicts.size();
        if (analytics.total_conflicts > 0) {
            const Real total = static_cast<Real>(analytics.total_conflicts);
            analytics.resolution_success_rate = static_cast<Real>(resolved) / total;
            analytics.automatic_resolution_rate = static_cast<Real>(automatic) / total;
        }
        if (timed > 0) {
            analytics.average_resolution_time_ms = total_time / static_cast<Real>(timed);
        }

        for (const auto& [hour, count] : hours) {
            analytics.peak_hours.push_back(HourlyCount{hour, count});
        }
        std::stable_sort(analytics.peak_hours.begin(), analytics.peak_hours.end(),
                         [](const HourlyCount& a, const HourlyCount& b) { return a.count > b.count; });

        for (const auto& [day, bucket] : days) {
            analytics.trend.push_back(bucket);
        }
        if (analytics.trend.size() > TREND_DAYS) {
            analytics.trend.erase(analytics.trend.begin(),
                                  analytics.trend.end() - static_cast<std::ptrdiff_t>(TREND_DAYS));
        }
        return analytics;
    }

    std::vector<ConflictNotification> get_notifications(const UserId& user_id) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ConflictNotification> result;
        for (const auto& [conflict_id, list] : notifications_) {
            for (const auto& notification : list) {
                const auto& recipients = notification.recipients;
                if (std::find(recipients.begin(), recipients.end(), user_id) != recipients.end()) {
                    result.push_back(notification);
                }
            }
        }
        std::sort(result.begin(), result.end(), [](const ConflictNotification& a, const ConflictNotification& b) {
            return a.created_at != b.created_at ? a.created_at < b.created_at : a.id < b.id;
        });
        return result;
    }

    EngineResult acknowledge_notification(const std::string& notification_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [conflict_id, list] : notifications_) {
            for (auto& notification : list) {
                if (notification.id == notification_id) {
                    notification.acknowledged = true;
                    return EngineResult::Success;
                }
            }
        }
        return EngineResult::NotFound;
    }

    SizeT cleanup_expired_conflicts(Timestamp now) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const Int64 timeout = settings_.conflict_timeout_ms;
        SizeT removed = 0;
        for (auto it = tracked_.begin(); it != tracked_.end();) {
            const bool pending = pending_manual_.count(it->first) > 0;
            if (!pending && it->second.state != ConflictState::Analyzing &&
                millis_between(it->second.tracked_at, now) > timeout) {
                notifications_.erase(it->first);
                it = tracked_.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
        if (removed > 0) {
            logger_->debug("Dropped {} expired conflicts", removed);
        }
        return removed;
    }

    SizeT release_whiteboard(const WhiteboardId& whiteboard_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        SizeT removed = 0;
        for (auto it = tracked_.begin(); it != tracked_.end();) {
            const ConflictPtr& conflict = it->second.conflict;
            if (!conflict || conflict->whiteboard_id != whiteboard_id) {
                ++it;
                continue;
            }
            for (const auto& element_id : conflict->affected_elements) {
                element_failures_.erase(element_id);
            }
            pending_manual_.erase(it->first);
            notifications_.erase(it->first);
            it = tracked_.erase(it);
            removed++;
        }
        if (removed > 0) {
            logger_->info("Released {} conflicts of whiteboard {}", removed, whiteboard_id);
        }
        return removed;
    }

    void register_strategy(std::shared_ptr<IResolutionStrategy> strategy) override {
        if (!strategy) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        strategies_[strategy->kind()] = std::move(strategy);
    }

    ResolutionServiceStats get_stats() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        ResolutionServiceStats stats = stats_;
        stats.persistence_failures = counters_->persistence_failures.load();
        stats.notification_failures = counters_->notification_failures.load();
        return stats;
    }

    const config::ResolutionSettings& settings() const override { return settings_; }

private:
    struct Tracked {
        ConflictPtr conflict;
        ConflictState state{ConflictState::Detected};
        Timestamp tracked_at{};
    };

    /**
     * @brief Tracking entry for a conflict, created on first sight (lock held)
     */
    Tracked& track(const ConflictPtr& conflict) {
        Tracked& tracked = tracked_[conflict->id];
        if (!tracked.conflict) {
            tracked.conflict = conflict;
            tracked.tracked_at = std::chrono::system_clock::now();
        }
        return tracked;
    }

    void escalate(const ConflictPtr& conflict, const std::optional<ResolutionRecommendation>& recommendation) {
        const EngineResult result = request_manual_intervention(conflict, recommendation);
        if (result != EngineResult::Success) {
            logger_->warn("Conflict {}: escalation returned {}", conflict->id, engine_result_to_string(result));
        }
    }

    void set_state(const ConflictId& conflict_id, ConflictState state) {
        std::lock_guard<std::mutex> lock(mutex_);
        tracked_[conflict_id].state = state;
    }

    std::shared_ptr<IResolutionStrategy> find_strategy(ResolutionStrategy kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = strategies_.find(kind);
        return it != strategies_.end() ? it->second : nullptr;
    }

    UInt32 recent_failures(const std::vector<ElementId>& elements) const {
        std::lock_guard<std::mutex> lock(mutex_);
        UInt32 failures = 0;
        for (const auto& element_id : elements) {
            auto it = element_failures_.find(element_id);
            if (it != element_failures_.end()) {
                failures = std::max(failures, it->second);
            }
        }
        return failures;
    }

    void finish_success(const ConflictPtr& conflict, const ResolutionOutcome& outcome, Real elapsed_ms) {
        auto annotated = std::make_shared<Conflict>(*conflict);
        annotated->resolution_strategy = outcome.strategy_used;
        annotated->resolved_at = std::chrono::system_clock::now();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            Tracked& tracked = tracked_[conflict->id];
            tracked.conflict = annotated;
            tracked.state = ConflictState::ResolvedAutomatic;
            stats_.automatic_successes++;
            for (const auto& element_id : conflict->affected_elements) {
                element_failures_.erase(element_id);
            }
        }

        logger_->info("Conflict {} resolved automatically with {} after {} attempts",
                      conflict->id, resolution_strategy_to_string(*outcome.strategy_used),
                      outcome.attempts.size());
        persist(make_record(*annotated, AuditAction::ResolvedAutomatic, outcome.strategy_used, elapsed_ms,
                            outcome.resolution ? "resolution " + outcome.resolution->id : std::string()));
    }

    AuditRecord make_record(const Conflict& conflict, AuditAction action,
                            std::optional<ResolutionStrategy> strategy,
                            Real resolution_time_ms, std::string detail) {
        AuditRecord record;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            record.id = "audit_" + std::to_string(++next_audit_id_);
        }
        record.conflict_id = conflict.id;
        record.whiteboard_id = conflict.whiteboard_id;
        record.type = conflict.type;
        record.severity = conflict.severity;
        record.action = action;
        record.strategy = strategy;
        record.users = conflict.affected_users();
        record.elements = conflict.affected_elements;
        record.resolution_time_ms = resolution_time_ms;
        record.detail = std::move(detail);
        record.recorded_at = std::chrono::system_clock::now();
        return record;
    }

    /**
     * @brief Append an audit record on the cold path; failures are logged and counted
     */
    void persist(AuditRecord record) {
        auto task = [log = audit_log_, counters = counters_, logger = logger_, record = std::move(record)]() {
            EngineResult status;
            std::string reason;
            try {
                status = log->append_audit_record(record);
                reason = engine_result_to_string(status);
            } catch (const std::exception& e) {
                status = EngineResult::PersistenceError;
                reason = e.what();
            }
            if (status != EngineResult::Success) {
                counters->persistence_failures++;
                telemetry::metrics::engine().persistence_failures.increment();
                logger->error("Audit record {} for conflict {} not persisted: {}",
                              record.id, record.conflict_id, reason);
            }
        };

        if (cold_path_ && cold_path_->post(COLD_PATH_LANE, task)) {
            return;
        }
        task();
    }

    /**
     * @brief Deliver a notification on the cold path; failures are logged and counted
     */
    void deliver(ConflictNotification notification) {
        auto task = [sink = notifier_, counters = counters_, logger = logger_,
                     notification = std::move(notification)]() {
            EngineResult status;
            std::string reason;
            try {
                status = sink->notify_users(notification.recipients, notification);
                reason = engine_result_to_string(status);
            } catch (const std::exception& e) {
                status = EngineResult::PersistenceError;
                reason = e.what();
            }
            if (status != EngineResult::Success) {
                counters->notification_failures++;
                telemetry::metrics::engine().notification_failures.increment();
                logger->error("Notification {} for conflict {} not delivered: {}",
                              notification.id, notification.conflict_id, reason);
            }
        };

        if (cold_path_ && cold_path_->post(COLD_PATH_LANE, task)) {
            return;
        }
        task();
    }

    config::ResolutionSettings settings_;
    std::shared_ptr<IAuditLog> audit_log_;
    std::shared_ptr<INotificationSink> notifier_;
    core::ActorPool* cold_path_;
    std::shared_ptr<ColdPathCounters> counters_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::map<ResolutionStrategy, std::shared_ptr<IResolutionStrategy>> strategies_;
    std::unordered_map<ConflictId, Tracked> tracked_;
    std::map<ConflictId, ManualIntervention> pending_manual_;
    std::map<ConflictId, std::vector<ConflictNotification>> notifications_;
    std::unordered_map<ElementId, UInt32> element_failures_;
    ResolutionServiceStats stats_;
    UInt64 next_notification_id_{0};
    UInt64 next_audit_id_{0};
};

// ============================================================================
// Factory Functions
// ============================================================================

std::unique_ptr<IConflictResolutionService> create_conflict_resolution_service(
    const config::ResolutionSettings& settings,
    std::shared_ptr<IAuditLog> audit_log,
    std::shared_ptr<INotificationSink> notifier,
    core::ActorPool* cold_path) {
    return std::make_unique<SimpleConflictResolutionService>(
        settings, std::move(audit_log), std::move(notifier), cold_path);
}

} // namespace tessera::sync
