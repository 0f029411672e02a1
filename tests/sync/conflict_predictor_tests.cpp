/**
 * @file conflict_predictor_tests.cpp
 * @brief Unit tests for conflict prediction
 */

#include <gtest/gtest.h>
#include "tessera/sync/conflict_predictor.h"

using namespace tessera;
using namespace tessera::sync;

namespace {

const Timestamp T0 = Timestamp{} + std::chrono::hours(1);

UserActivity make_activity(const std::string& user, Real x, Real y, Int64 at_ms) {
    return UserActivity{user, Point(x, y), std::nullopt, T0 + Milliseconds(at_ms)};
}

Operation make_op(const std::string& id, OperationType type, const std::string& element,
                  const std::string& user, Int64 at_ms) {
    Operation op;
    op.id = id;
    op.type = type;
    op.element_id = element;
    op.user_id = user;
    op.vector_clock = VectorClock{{user, 1}};
    op.timestamp = T0 + Milliseconds(at_ms);
    return op;
}

const ConflictPrediction* find_prediction(const std::vector<ConflictPrediction>& predictions,
                                          const std::string& id) {
    for (const auto& prediction : predictions) {
        if (prediction.id == id) {
            return &prediction;
        }
    }
    return nullptr;
}

} // anonymous namespace

// ============================================================================
// Spatial Prediction Tests
// ============================================================================

class ConflictPredictorTest : public ::testing::Test {
protected:
    void SetUp() override {
        predictor_ = create_conflict_predictor();
        context_.whiteboard_id = "board";
    }

    std::unique_ptr<IConflictPredictor> predictor_;
    PredictionContext context_;
};

TEST_F(ConflictPredictorTest, NearbyCursorsPredictSpatialConflict) {
    auto predictions = predictor_->predict_conflicts(
        {}, {make_activity("alice", 0.0, 0.0, 0), make_activity("bob", 20.0, 0.0, 10)}, context_);

    ASSERT_EQ(predictions.size(), 1u);
    const auto& prediction = predictions[0];
    EXPECT_EQ(prediction.id, "spatial_alice_bob");
    EXPECT_EQ(prediction.type, ConflictType::Spatial);
    EXPECT_DOUBLE_EQ(prediction.probability, 0.8);
    EXPECT_EQ(prediction.estimated_severity, ConflictSeverity::High);
    EXPECT_EQ(prediction.affected_users, (std::vector<UserId>{"alice", "bob"}));
    EXPECT_EQ(prediction.prevention, PreventionStrategy::CoordinateUsers);
}

TEST_F(ConflictPredictorTest, SpatialSeverityFollowsDistance) {
    auto medium = predictor_->predict_conflicts(
        {}, {make_activity("alice", 0.0, 0.0, 0), make_activity("bob", 50.0, 0.0, 0)}, context_);
    ASSERT_EQ(medium.size(), 1u);
    EXPECT_EQ(medium[0].estimated_severity, ConflictSeverity::Medium);

    auto low = predictor_->predict_conflicts(
        {}, {make_activity("alice", 0.0, 0.0, 0), make_activity("bob", 80.0, 0.0, 0)}, context_);
    ASSERT_EQ(low.size(), 1u);
    EXPECT_EQ(low[0].estimated_severity, ConflictSeverity::Low);
}

TEST_F(ConflictPredictorTest, DistantCursorsPredictNothing) {
    auto predictions = predictor_->predict_conflicts(
        {}, {make_activity("alice", 0.0, 0.0, 0), make_activity("bob", 300.0, 0.0, 0)}, context_);
    EXPECT_TRUE(predictions.empty());
}

TEST_F(ConflictPredictorTest, StaleActivityIsIgnored) {
    auto predictions = predictor_->predict_conflicts(
        {}, {make_activity("alice", 0.0, 0.0, 0), make_activity("bob", 10.0, 0.0, 6000)}, context_);
    EXPECT_TRUE(predictions.empty());
}

TEST_F(ConflictPredictorTest, LatestSampleWinsPerUser) {
    auto predictions = predictor_->predict_conflicts(
        {},
        {make_activity("alice", 0.0, 0.0, 0),
         make_activity("bob", 10.0, 0.0, 0),
         make_activity("bob", 500.0, 0.0, 100)},
        context_);
    EXPECT_TRUE(predictions.empty());
}

TEST_F(ConflictPredictorTest, CachedBoundsNameAffectedElements) {
    core::CacheConfig cache_config;
    cache_config.ttl = Milliseconds(0);
    core::LruTtlCache<ElementId, Bounds> bounds(cache_config);
    bounds.set("rect", Bounds(0.0, 0.0, 50.0, 50.0));
    bounds.set("far", Bounds(1000.0, 1000.0, 10.0, 10.0));
    context_.element_bounds = &bounds;

    auto predictions = predictor_->predict_conflicts(
        {}, {make_activity("alice", 10.0, 10.0, 0), make_activity("bob", 30.0, 10.0, 0)}, context_);

    ASSERT_EQ(predictions.size(), 1u);
    EXPECT_EQ(predictions[0].affected_elements, (std::vector<ElementId>{"rect"}));
    EXPECT_EQ(predictions[0].prevention, PreventionStrategy::LockRegion);
}

// ============================================================================
// Temporal and Semantic Prediction Tests
// ============================================================================

TEST_F(ConflictPredictorTest, RapidEditsFromDifferentUsersPredictTemporal) {
    auto a = make_op("op-a", OperationType::Update, "E1", "alice", 0);
    auto b = make_op("op-b", OperationType::Update, "E1", "bob", 100);

    auto predictions = predictor_->predict_conflicts({b, a}, {}, context_);

    auto* temporal = find_prediction(predictions, "temporal_E1_op-a_op-b");
    ASSERT_NE(temporal, nullptr);
    EXPECT_DOUBLE_EQ(temporal->probability, 0.9);
    EXPECT_EQ(temporal->estimated_severity, ConflictSeverity::High);
    EXPECT_EQ(temporal->prevention, PreventionStrategy::StaggerEdits);
}

TEST_F(ConflictPredictorTest, SlowOrSameUserEditsPredictNothing) {
    auto a = make_op("op-a", OperationType::Update, "E1", "alice", 0);
    auto b = make_op("op-b", OperationType::Update, "E1", "alice", 50);
    auto c = make_op("op-c", OperationType::Update, "E1", "bob", 2000);

    EXPECT_TRUE(predictor_->predict_conflicts({a, b, c}, {}, context_).empty());
}

TEST_F(ConflictPredictorTest, DeleteDuringEditsPredictsSemanticHigh) {
    auto edit = make_op("op-a", OperationType::Update, "E1", "alice", 0);
    auto erase = make_op("op-b", OperationType::Delete, "E1", "bob", 5000);

    auto predictions = predictor_->predict_conflicts({edit, erase}, {}, context_);

    auto* semantic = find_prediction(predictions, "semantic_E1");
    ASSERT_NE(semantic, nullptr);
    EXPECT_EQ(semantic->estimated_severity, ConflictSeverity::High);
    EXPECT_EQ(semantic->prevention, PreventionStrategy::LockElement);
    EXPECT_DOUBLE_EQ(semantic->probability, 0.3);
}

TEST_F(ConflictPredictorTest, CompetingRestylesPredictSemanticMedium) {
    auto a = make_op("op-a", OperationType::Style, "E1", "alice", 0);
    a.payload["style.fill"] = std::string("red");
    auto b = make_op("op-b", OperationType::Update, "E1", "bob", 5000);
    b.payload["style.fill"] = std::string("blue");

    auto predictions = predictor_->predict_conflicts({a, b}, {}, context_);

    auto* semantic = find_prediction(predictions, "semantic_E1");
    ASSERT_NE(semantic, nullptr);
    EXPECT_EQ(semantic->estimated_severity, ConflictSeverity::Medium);
    EXPECT_EQ(semantic->prevention, PreventionStrategy::CoordinateUsers);
}

TEST_F(ConflictPredictorTest, PredictionsSortedByProbability) {
    auto a = make_op("op-a", OperationType::Delete, "E1", "alice", 0);
    auto b = make_op("op-b", OperationType::Style, "E1", "bob", 50);
    b.payload["style.fill"] = std::string("red");

    auto predictions = predictor_->predict_conflicts(
        {a, b}, {make_activity("alice", 0.0, 0.0, 0), make_activity("bob", 60.0, 0.0, 0)}, context_);

    ASSERT_GE(predictions.size(), 3u);
    for (SizeT i = 1; i < predictions.size(); ++i) {
        EXPECT_GE(predictions[i - 1].probability, predictions[i].probability);
    }
    EXPECT_EQ(predictions.front().type, ConflictType::Temporal);
}

TEST_F(ConflictPredictorTest, DisabledPredictorReturnsNothing) {
    PredictorConfig config;
    config.enabled = false;
    auto predictor = create_conflict_predictor(config);

    auto predictions = predictor->predict_conflicts(
        {}, {make_activity("alice", 0.0, 0.0, 0), make_activity("bob", 1.0, 0.0, 0)}, context_);
    EXPECT_TRUE(predictions.empty());
}

// ============================================================================
// Accuracy Tracking Tests
// ============================================================================

TEST_F(ConflictPredictorTest, AccuracyFromOutcomes) {
    predictor_->record_prediction_outcome("p1", true);
    predictor_->record_prediction_outcome("p2", true);
    predictor_->record_prediction_outcome("p3", false);
    predictor_->record_prediction_outcome("p4", true);

    auto accuracy = predictor_->get_prediction_accuracy();
    EXPECT_EQ(accuracy.total_predictions, 4u);
    EXPECT_EQ(accuracy.correct_predictions, 3u);
    EXPECT_EQ(accuracy.false_positives, 1u);
    EXPECT_DOUBLE_EQ(accuracy.accuracy, 0.75);
}

TEST_F(ConflictPredictorTest, OutcomeHistoryIsBounded) {
    PredictorConfig config;
    config.max_history = 2;
    auto predictor = create_conflict_predictor(config);

    predictor->record_prediction_outcome("p1", false);
    predictor->record_prediction_outcome("p2", true);
    predictor->record_prediction_outcome("p3", true);

    auto accuracy = predictor->get_prediction_accuracy();
    EXPECT_EQ(accuracy.total_predictions, 2u);
    EXPECT_DOUBLE_EQ(accuracy.accuracy, 1.0);
}
