/**
 * @file conflict_resolution_tests.cpp
 * @brief Unit tests for the conflict resolution service
 */

#include <gtest/gtest.h>
#include "tessera/sync/conflict_resolution.h"
#include "tessera/core/threading/actor_pool.h"
#include <algorithm>
#include <mutex>
#include <stdexcept>

using namespace tessera;
using namespace tessera::sync;

namespace {

const Timestamp T0 = std::chrono::system_clock::now();

Operation make_op(const std::string& id, OperationType type, const std::string& element,
                  const std::string& user, LamportTime lamport, Int64 at_ms) {
    Operation op;
    op.id = id;
    op.type = type;
    op.element_id = element;
    op.user_id = user;
    op.vector_clock.set(user, 1);
    op.lamport_timestamp = lamport;
    op.timestamp = T0 + Milliseconds(at_ms);
    return op;
}

ConflictPtr make_conflict(ConflictType type, ConflictSeverity severity, std::vector<Operation> ops,
                          ConflictEvidence evidence, const WhiteboardId& board = "board") {
    std::sort(ops.begin(), ops.end(), tie_break_less);
    auto conflict = std::make_shared<Conflict>();
    conflict->type = type;
    conflict->severity = severity;
    conflict->whiteboard_id = board;
    conflict->id = make_conflict_id(type, {ops[0].id, ops[1].id});
    for (const auto& op : ops) {
        conflict->affected_elements.push_back(op.element_id);
        conflict->detected_at = std::max(conflict->detected_at, op.timestamp);
    }
    std::sort(conflict->affected_elements.begin(), conflict->affected_elements.end());
    conflict->affected_elements.erase(
        std::unique(conflict->affected_elements.begin(), conflict->affected_elements.end()),
        conflict->affected_elements.end());
    conflict->operations = std::move(ops);
    conflict->evidence = std::move(evidence);
    return conflict;
}

/// Two users write different widths to E1
ConflictPtr width_conflict(const std::string& suffix = "") {
    auto a = make_op("op-a" + suffix, OperationType::Update, "E1", "alice", 1, 1000);
    a.payload["width"] = Int64{100};
    auto b = make_op("op-b" + suffix, OperationType::Update, "E1", "bob", 2, 1050);
    b.payload["width"] = Int64{150};
    SemanticEvidence evidence;
    evidence.incompatible_changes = {"width"};
    return make_conflict(ConflictType::Semantic, ConflictSeverity::Medium, {a, b}, evidence);
}

/// Two users pick different fill colors for E1
ConflictPtr fill_conflict() {
    auto a = make_op("op-a", OperationType::Style, "E1", "alice", 1, 1000);
    a.payload["style.fill"] = std::string("red");
    auto b = make_op("op-b", OperationType::Style, "E1", "bob", 2, 1050);
    b.payload["style.fill"] = std::string("blue");
    SemanticEvidence evidence;
    evidence.incompatible_changes = {"style.fill"};
    return make_conflict(ConflictType::Semantic, ConflictSeverity::Medium, {a, b}, evidence);
}

/// bob deletes E1 while alice restyles it
ConflictPtr delete_conflict() {
    auto a = make_op("op-x", OperationType::Style, "E1", "alice", 1, 1000);
    a.payload["style.fill"] = std::string("red");
    auto b = make_op("op-y", OperationType::Delete, "E1", "bob", 2, 1020);
    CompoundEvidence evidence;
    evidence.components = {ConflictType::Temporal};
    evidence.existence_conflict = true;
    return make_conflict(ConflictType::Compound, ConflictSeverity::Critical, {a, b}, evidence);
}

class SpyStrategy : public IResolutionStrategy {
public:
    SpyStrategy(ResolutionStrategy kind, bool throws = false)
        : kind_(kind), throws_(throws) {}

    ResolutionStrategy kind() const override { return kind_; }

    std::optional<Operation> apply(const Conflict&, const StrategyContext&) const override {
        calls++;
        if (throws_) {
            throw std::runtime_error("strategy failure");
        }
        return std::nullopt;
    }

    mutable std::atomic<int> calls{0};

private:
    ResolutionStrategy kind_;
    bool throws_;
};

class FailingAuditLog : public IAuditLog {
public:
    EngineResult append_audit_record(const AuditRecord&) override {
        return EngineResult::PersistenceError;
    }

    EngineResult query(const AuditQuery&, std::vector<AuditRecord>&) const override {
        throw std::runtime_error("audit store offline");
    }
};

class RecordingSink : public INotificationSink {
public:
    EngineResult notify_users(const std::vector<UserId>& users,
                              const ConflictNotification& notification) override {
        std::lock_guard<std::mutex> lock(mutex_);
        delivered_.emplace_back(users, notification);
        return EngineResult::Success;
    }

    SizeT count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return delivered_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<std::vector<UserId>, ConflictNotification>> delivered_;
};

} // anonymous namespace

// ============================================================================
// Conflict Resolution Service Tests
// ============================================================================

class ConflictResolutionTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = config::EngineConfig::defaults();
        engine_ = create_transform_engine(config_);
        context_ = engine_->create_context("board");

        ElementState& element = context_.element_states["E1"];
        element.element_type = "rectangle";
        element.exists = true;
        element.fields["width"] = Int64{50};
        context_.base_states["E1"] = element;

        audit_log_ = create_in_memory_audit_log();
        sink_ = std::make_shared<RecordingSink>();
        service_ = create_conflict_resolution_service(config_.resolution, audit_log_, sink_);
    }

    std::vector<AuditRecord> audit_records() const {
        std::vector<AuditRecord> records;
        EXPECT_EQ(audit_log_->query(AuditQuery{}, records), EngineResult::Success);
        return records;
    }

    config::EngineConfig config_;
    std::unique_ptr<ITransformEngine> engine_;
    TransformContext context_;
    std::shared_ptr<IAuditLog> audit_log_;
    std::shared_ptr<RecordingSink> sink_;
    std::unique_ptr<IConflictResolutionService> service_;
};

// ============================================================================
// Analysis Tests
// ============================================================================

TEST_F(ConflictResolutionTest, AnalyzeSemanticConflict) {
    auto recommendation = service_->analyze_conflict(*width_conflict());

    EXPECT_EQ(recommendation.strategy, ResolutionStrategy::LastWriterWins);
    EXPECT_NEAR(recommendation.confidence, 0.736, 1e-9);
    EXPECT_EQ(recommendation.risk, RiskLevel::Low);
    EXPECT_EQ(recommendation.estimated_resolution_time_ms, 50u);
    ASSERT_EQ(recommendation.alternatives.size(), 4u);
    EXPECT_EQ(recommendation.alternatives[0].strategy, ResolutionStrategy::Merge);
    EXPECT_EQ(recommendation.alternatives[3].strategy, ResolutionStrategy::Manual);
    EXPECT_FALSE(recommendation.alternatives[0].pros.empty());
    EXPECT_NE(recommendation.reasoning.find("semantic"), std::string::npos);
}

TEST_F(ConflictResolutionTest, AnalyzeExistenceConflictRecommendsManual) {
    auto recommendation = service_->analyze_conflict(*delete_conflict());

    EXPECT_EQ(recommendation.strategy, ResolutionStrategy::Manual);
    EXPECT_EQ(recommendation.risk, RiskLevel::High);
    EXPECT_LE(recommendation.confidence, 0.3);
    EXPECT_GE(recommendation.confidence, 0.1);
    EXPECT_NE(recommendation.reasoning.find("existence"), std::string::npos);
}

TEST_F(ConflictResolutionTest, ConfidenceStaysWithinBounds) {
    auto a = make_op("op-a", OperationType::Update, "E1", "alice", 1, 1000);
    auto b = make_op("op-b", OperationType::Update, "E1", "bob", 2, 1010);
    auto low = make_conflict(ConflictType::Temporal, ConflictSeverity::Low, {a, b}, TemporalEvidence{10, true});

    EXPECT_DOUBLE_EQ(service_->analyze_conflict(*low).confidence, 0.95);
}

// ============================================================================
// Automatic Resolution Tests
// ============================================================================

TEST_F(ConflictResolutionTest, ResolvesWithLastWriterWins) {
    auto conflict = width_conflict();
    const UInt64 version = context_.canvas_version;

    auto outcome = service_->resolve_conflict_automatically(conflict, context_);

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(outcome.strategy_used, ResolutionStrategy::LastWriterWins);
    EXPECT_FALSE(outcome.requires_manual_intervention);
    EXPECT_EQ(outcome.attempts.size(), 1u);
    ASSERT_TRUE(outcome.resolution.has_value());
    EXPECT_EQ(outcome.resolution->id, "resolution_semantic_op-a_op-b");
    EXPECT_EQ(context_.element_states.at("E1").fields.at("width"), FieldValue(Int64{150}));
    EXPECT_EQ(context_.canvas_version, version + 1);
    EXPECT_EQ(context_.metrics.resolutions_succeeded, 1u);
    EXPECT_EQ(service_->get_conflict_state(conflict->id), ConflictState::ResolvedAutomatic);

    auto records = audit_records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].action, AuditAction::ResolvedAutomatic);
    EXPECT_EQ(records[0].strategy, ResolutionStrategy::LastWriterWins);
    EXPECT_EQ(records[0].users, (std::vector<UserId>{"alice", "bob"}));
    EXPECT_EQ(service_->get_stats().automatic_successes, 1u);
}

TEST_F(ConflictResolutionTest, ResolvedConflictIsNotResolvedTwice) {
    auto conflict = width_conflict();
    ASSERT_TRUE(service_->resolve_conflict_automatically(conflict, context_).success);

    auto again = service_->resolve_conflict_automatically(conflict, context_);

    EXPECT_FALSE(again.success);
    EXPECT_EQ(again.error, EngineResult::AlreadyProcessing);
    EXPECT_EQ(audit_records().size(), 1u);
}

TEST_F(ConflictResolutionTest, HighRiskConflictEscalates) {
    auto conflict = delete_conflict();

    auto outcome = service_->resolve_conflict_automatically(conflict, context_);

    EXPECT_FALSE(outcome.success);
    EXPECT_TRUE(outcome.requires_manual_intervention);
    EXPECT_EQ(outcome.error, EngineResult::RiskTooHigh);
    EXPECT_TRUE(outcome.attempts.empty());
    EXPECT_TRUE(context_.element_states.at("E1").exists);
    EXPECT_EQ(service_->get_conflict_state(conflict->id), ConflictState::ResolvedManualPending);

    auto pending = service_->get_pending_manual_interventions();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].conflict->id, conflict->id);
    EXPECT_EQ(pending[0].recommendation.risk, RiskLevel::High);
}

TEST_F(ConflictResolutionTest, LowConfidenceEscalates) {
    config_.resolution.min_automatic_confidence = 0.8;
    auto service = create_conflict_resolution_service(config_.resolution, audit_log_, sink_);

    auto outcome = service->resolve_conflict_automatically(width_conflict(), context_);

    EXPECT_EQ(outcome.error, EngineResult::RiskTooHigh);
    EXPECT_TRUE(outcome.requires_manual_intervention);
    EXPECT_EQ(service->get_pending_manual_interventions().size(), 1u);
}

TEST_F(ConflictResolutionTest, DisabledResolutionNeverInvokesStrategies) {
    config_.resolution.automatic_resolution_enabled = false;
    auto service = create_conflict_resolution_service(config_.resolution, audit_log_, sink_);
    auto spy = std::make_shared<SpyStrategy>(ResolutionStrategy::LastWriterWins);
    service->register_strategy(spy);
    auto conflict = width_conflict();

    auto outcome = service->resolve_conflict_automatically(conflict, context_);

    EXPECT_FALSE(outcome.success);
    EXPECT_TRUE(outcome.requires_manual_intervention);
    EXPECT_EQ(outcome.error, EngineResult::AutomaticResolutionDisabled);
    EXPECT_EQ(spy->calls.load(), 0);
    EXPECT_EQ(context_.element_states.at("E1").fields.at("width"), FieldValue(Int64{50}));
    EXPECT_EQ(service->get_conflict_state(conflict->id), ConflictState::ResolvedManualPending);
    EXPECT_EQ(service->get_pending_manual_interventions().size(), 1u);
}

TEST_F(ConflictResolutionTest, ExhaustedAttemptsEscalate) {
    auto spy = std::make_shared<SpyStrategy>(ResolutionStrategy::LastWriterWins);
    service_->register_strategy(spy);
    auto conflict = fill_conflict();

    auto outcome = service_->resolve_conflict_automatically(conflict, context_);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error, EngineResult::ResolutionExhausted);
    EXPECT_TRUE(outcome.requires_manual_intervention);
    ASSERT_EQ(outcome.attempts.size(), 3u);
    EXPECT_EQ(outcome.attempts[0].strategy, ResolutionStrategy::LastWriterWins);
    EXPECT_EQ(outcome.attempts[1].strategy, ResolutionStrategy::Merge);
    EXPECT_EQ(outcome.attempts[2].strategy, ResolutionStrategy::PriorityUser);
    EXPECT_EQ(spy->calls.load(), 1);
    EXPECT_FALSE(context_.element_states.at("E1").fields.count("style.fill"));
    EXPECT_EQ(service_->get_conflict_state(conflict->id), ConflictState::Failed);
    EXPECT_EQ(service_->get_pending_manual_interventions().size(), 1u);

    auto stats = service_->get_stats();
    EXPECT_EQ(stats.automatic_failures, 1u);
    EXPECT_EQ(stats.manual_requests, 1u);

    auto records = audit_records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].action, AuditAction::ResolutionFailed);
    EXPECT_EQ(records[1].action, AuditAction::ManualInterventionRequested);

    // Recent failures on E1 lower the confidence of the next analysis
    EXPECT_NEAR(service_->analyze_conflict(*width_conflict("2")).confidence, 0.636, 1e-9);
}

TEST_F(ConflictResolutionTest, ThrowingStrategyFallsThroughToAlternative) {
    service_->register_strategy(std::make_shared<SpyStrategy>(ResolutionStrategy::LastWriterWins, true));

    auto outcome = service_->resolve_conflict_automatically(width_conflict(), context_);

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(outcome.strategy_used, ResolutionStrategy::Merge);
    ASSERT_EQ(outcome.attempts.size(), 2u);
    EXPECT_FALSE(outcome.attempts[0].success);
    EXPECT_EQ(outcome.attempts[0].detail.rfind("strategy threw", 0), 0u);
    EXPECT_EQ(context_.element_states.at("E1").fields.at("width"), FieldValue(Float64(125.0)));
}

TEST_F(ConflictResolutionTest, CancelledBeforeFirstAttempt) {
    auto conflict = width_conflict();
    std::atomic<bool> cancel{true};

    auto outcome = service_->resolve_conflict_automatically(conflict, context_, &cancel);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error, EngineResult::Cancelled);
    EXPECT_TRUE(outcome.requires_manual_intervention);
    EXPECT_TRUE(outcome.attempts.empty());
    EXPECT_EQ(context_.element_states.at("E1").fields.at("width"), FieldValue(Int64{50}));
    EXPECT_EQ(service_->get_conflict_state(conflict->id), ConflictState::Detected);
    EXPECT_TRUE(service_->get_pending_manual_interventions().empty());

    cancel = false;
    EXPECT_TRUE(service_->resolve_conflict_automatically(conflict, context_, &cancel).success);
}

TEST_F(ConflictResolutionTest, NullConflictIsNotFound) {
    auto outcome = service_->resolve_conflict_automatically(nullptr, context_);
    EXPECT_EQ(outcome.error, EngineResult::NotFound);
    EXPECT_EQ(service_->request_manual_intervention(nullptr), EngineResult::NotFound);
}

// ============================================================================
// Persistence and Notification Failure Tests
// ============================================================================

TEST_F(ConflictResolutionTest, AuditFailureDoesNotFailResolution) {
    auto service = create_conflict_resolution_service(config_.resolution,
                                                      std::make_shared<FailingAuditLog>(), sink_);

    auto outcome = service->resolve_conflict_automatically(width_conflict(), context_);

    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(service->get_stats().persistence_failures, 1u);

    auto analytics = service->get_conflict_analytics();
    EXPECT_TRUE(analytics.degraded);
    EXPECT_EQ(analytics.degraded_reason, "audit store offline");
    EXPECT_EQ(analytics.total_conflicts, 0u);
    EXPECT_EQ(service->get_stats().persistence_failures, 2u);
}

TEST_F(ConflictResolutionTest, ColdPathDeliversOnActorPool) {
    core::ActorPool pool(2);
    auto service = create_conflict_resolution_service(config_.resolution, audit_log_, sink_, &pool);

    auto outcome = service->resolve_conflict_automatically(delete_conflict(), context_);
    EXPECT_EQ(outcome.error, EngineResult::RiskTooHigh);

    pool.wait_all();
    EXPECT_EQ(audit_records().size(), 1u);
    EXPECT_EQ(sink_->count(), 1u);
    pool.shutdown();
}

// ============================================================================
// Manual Intervention Tests
// ============================================================================

TEST_F(ConflictResolutionTest, ManualRequestNotifiesAffectedUsers) {
    auto conflict = delete_conflict();

    ASSERT_EQ(service_->request_manual_intervention(conflict), EngineResult::Success);
    EXPECT_EQ(service_->request_manual_intervention(conflict), EngineResult::Duplicate);

    auto notices = service_->get_notifications("alice");
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].message, "Conflict on E1 is pending manual review");
    EXPECT_EQ(notices[0].recipients, (std::vector<UserId>{"alice", "bob"}));
    EXPECT_EQ(notices[0].suggested_actions,
              (std::vector<std::string>{"priority_user", "last_writer_wins"}));
    EXPECT_FALSE(notices[0].acknowledged);
    EXPECT_TRUE(service_->get_notifications("carol").empty());
    EXPECT_EQ(sink_->count(), 1u);

    EXPECT_EQ(service_->acknowledge_notification(notices[0].id), EngineResult::Success);
    EXPECT_TRUE(service_->get_notifications("bob")[0].acknowledged);
    EXPECT_EQ(service_->acknowledge_notification("notification_999"), EngineResult::NotFound);
}

TEST_F(ConflictResolutionTest, CompleteManualInterventionAppliesResolution) {
    auto conflict = delete_conflict();
    ASSERT_EQ(service_->resolve_conflict_automatically(conflict, context_).error, EngineResult::RiskTooHigh);

    auto resolution = make_op("manual-1", OperationType::Update, "E1", "moderator", 3, 5000);
    resolution.payload["width"] = Int64{300};

    ASSERT_EQ(service_->complete_manual_intervention(conflict->id, resolution, "moderator", &context_),
              EngineResult::Success);

    EXPECT_EQ(context_.element_states.at("E1").fields.at("width"), FieldValue(Int64{300}));
    EXPECT_EQ(service_->get_conflict_state(conflict->id), ConflictState::ResolvedManual);
    EXPECT_TRUE(service_->get_pending_manual_interventions().empty());
    EXPECT_EQ(service_->get_notifications("bob").size(), 2u);
    EXPECT_EQ(service_->get_notifications("bob")[1].message, "Conflict on E1 was resolved by moderator");

    auto records = audit_records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].action, AuditAction::ResolvedManual);
    EXPECT_EQ(records[1].resolver, UserId("moderator"));

    EXPECT_EQ(service_->complete_manual_intervention(conflict->id, resolution, "moderator"),
              EngineResult::NotFound);
    EXPECT_EQ(service_->resolve_conflict_automatically(conflict, context_).error,
              EngineResult::AlreadyProcessing);
}

TEST_F(ConflictResolutionTest, EscalatedConflictStaysPendingOnRepeatedResolve) {
    auto conflict = delete_conflict();
    ASSERT_EQ(service_->resolve_conflict_automatically(conflict, context_).error, EngineResult::RiskTooHigh);

    for (int i = 0; i < 2; ++i) {
        auto again = service_->resolve_conflict_automatically(conflict, context_);
        EXPECT_FALSE(again.success);
        EXPECT_EQ(again.error, EngineResult::AlreadyProcessing);
        EXPECT_TRUE(again.requires_manual_intervention);
        EXPECT_EQ(service_->get_conflict_state(conflict->id), ConflictState::ResolvedManualPending);
    }

    EXPECT_EQ(service_->get_pending_manual_interventions().size(), 1u);
    EXPECT_EQ(service_->get_stats().manual_requests, 1u);
    EXPECT_EQ(audit_records().size(), 1u);
}

TEST_F(ConflictResolutionTest, FailedConflictStaysFailedOnRepeatedResolve) {
    auto spy = std::make_shared<SpyStrategy>(ResolutionStrategy::LastWriterWins);
    service_->register_strategy(spy);
    auto conflict = fill_conflict();
    ASSERT_EQ(service_->resolve_conflict_automatically(conflict, context_).error,
              EngineResult::ResolutionExhausted);

    auto again = service_->resolve_conflict_automatically(conflict, context_);

    EXPECT_EQ(again.error, EngineResult::AlreadyProcessing);
    EXPECT_TRUE(again.requires_manual_intervention);
    EXPECT_TRUE(again.attempts.empty());
    EXPECT_EQ(spy->calls.load(), 1);
    EXPECT_EQ(service_->get_conflict_state(conflict->id), ConflictState::Failed);
}

TEST_F(ConflictResolutionTest, ResolutionJoinsPendingQueue) {
    auto conflict = width_conflict();

    auto outcome = service_->resolve_conflict_automatically(conflict, context_);

    ASSERT_TRUE(outcome.success);
    ASSERT_EQ(context_.pending.size(), 1u);
    EXPECT_EQ(context_.pending.at(0).id, outcome.resolution->id);
    EXPECT_EQ(context_.rebuild_element("E1").fields.at("width"), FieldValue(Int64{150}));
}

// ============================================================================
// Analytics Tests
// ============================================================================

TEST_F(ConflictResolutionTest, AnalyticsAggregateAuditLog) {
    auto automatic = width_conflict();
    auto manual = delete_conflict();
    ASSERT_TRUE(service_->resolve_conflict_automatically(automatic, context_).success);
    ASSERT_FALSE(service_->resolve_conflict_automatically(manual, context_).success);

    auto analytics = service_->get_conflict_analytics();
    EXPECT_FALSE(analytics.degraded);
    EXPECT_EQ(analytics.total_conflicts, 2u);
    EXPECT_EQ(analytics.by_type[ConflictType::Semantic], 1u);
    EXPECT_EQ(analytics.by_type[ConflictType::Compound], 1u);
    EXPECT_EQ(analytics.by_severity[ConflictSeverity::Critical], 1u);
    EXPECT_DOUBLE_EQ(analytics.resolution_success_rate, 0.5);
    EXPECT_DOUBLE_EQ(analytics.automatic_resolution_rate, 0.5);
    EXPECT_EQ(analytics.user_participation["alice"], 2u);
    EXPECT_EQ(analytics.user_participation["bob"], 2u);
    ASSERT_FALSE(analytics.peak_hours.empty());
    EXPECT_EQ(analytics.peak_hours[0].count, 2u);
    ASSERT_EQ(analytics.trend.size(), 1u);
    EXPECT_EQ(analytics.trend[0].conflicts, 2u);
    EXPECT_EQ(analytics.trend[0].resolved, 1u);

    auto resolution = make_op("manual-1", OperationType::Update, "E1", "moderator", 3, 5000);
    resolution.payload["width"] = Int64{10};
    ASSERT_EQ(service_->complete_manual_intervention(manual->id, resolution, "moderator"), EngineResult::Success);

    analytics = service_->get_conflict_analytics();
    EXPECT_DOUBLE_EQ(analytics.resolution_success_rate, 1.0);
    EXPECT_DOUBLE_EQ(analytics.automatic_resolution_rate, 0.5);
}

TEST_F(ConflictResolutionTest, AnalyticsFilters) {
    ASSERT_TRUE(service_->resolve_conflict_automatically(width_conflict(), context_).success);

    EXPECT_EQ(service_->get_conflict_analytics(WhiteboardId("board")).total_conflicts, 1u);
    EXPECT_EQ(service_->get_conflict_analytics(WhiteboardId("other")).total_conflicts, 0u);

    const Timestamp now = std::chrono::system_clock::now();
    TimeRange past{now - std::chrono::hours(48), now - std::chrono::hours(24)};
    EXPECT_EQ(service_->get_conflict_analytics(std::nullopt, past).total_conflicts, 0u);
    TimeRange recent{now - std::chrono::hours(1), now + std::chrono::hours(1)};
    EXPECT_EQ(service_->get_conflict_analytics(std::nullopt, recent).total_conflicts, 1u);
}

// ============================================================================
// Cleanup Tests
// ============================================================================

TEST_F(ConflictResolutionTest, CleanupDropsExpiredConflicts) {
    config_.resolution.conflict_timeout_ms = 1000;
    auto service = create_conflict_resolution_service(config_.resolution, audit_log_, sink_);
    auto resolved = width_conflict();
    auto pending = delete_conflict();
    ASSERT_TRUE(service->resolve_conflict_automatically(resolved, context_).success);
    service->resolve_conflict_automatically(pending, context_);

    const Timestamp now = std::chrono::system_clock::now();
    EXPECT_EQ(service->cleanup_expired_conflicts(now), 0u);
    EXPECT_EQ(service->cleanup_expired_conflicts(now + std::chrono::seconds(5)), 1u);

    EXPECT_FALSE(service->get_conflict_state(resolved->id).has_value());
    EXPECT_EQ(service->get_conflict_state(pending->id), ConflictState::ResolvedManualPending);
}

TEST_F(ConflictResolutionTest, ReleaseWhiteboardDropsItsState) {
    auto resolved = width_conflict();
    auto pending = delete_conflict();
    auto elsewhere = std::make_shared<Conflict>(*width_conflict("-other"));
    elsewhere->whiteboard_id = "other";
    ASSERT_TRUE(service_->resolve_conflict_automatically(resolved, context_).success);
    service_->resolve_conflict_automatically(pending, context_);
    ASSERT_EQ(service_->request_manual_intervention(elsewhere), EngineResult::Success);
    ASSERT_EQ(service_->get_notifications("alice").size(), 2u);

    EXPECT_EQ(service_->release_whiteboard("board"), 2u);

    EXPECT_FALSE(service_->get_conflict_state(resolved->id).has_value());
    EXPECT_FALSE(service_->get_conflict_state(pending->id).has_value());
    EXPECT_EQ(service_->get_conflict_state(elsewhere->id), ConflictState::ResolvedManualPending);
    auto remaining = service_->get_pending_manual_interventions();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].conflict->id, elsewhere->id);
    auto notices = service_->get_notifications("alice");
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].conflict_id, elsewhere->id);

    EXPECT_EQ(service_->release_whiteboard("board"), 0u);
}
