/**
 * @file operation_tests.cpp
 * @brief Unit tests for the operation model, replay and validation
 */

#include <gtest/gtest.h>
#include "tessera/sync/operation.h"
#include <limits>

using namespace tessera;
using namespace tessera::sync;

namespace {

Operation make_op(const std::string& id, OperationType type, const std::string& element,
                  const std::string& user, LamportTime lamport = 1) {
    Operation op;
    op.id = id;
    op.type = type;
    op.element_id = element;
    op.user_id = user;
    op.vector_clock = VectorClock{{user, 1}};
    op.lamport_timestamp = lamport;
    return op;
}

} // anonymous namespace

// ============================================================================
// Field Value Tests
// ============================================================================

class FieldValueTest : public ::testing::Test {};

TEST_F(FieldValueTest, RendersEveryAlternative) {
    EXPECT_EQ(field_value_to_string(FieldValue{}), "null");
    EXPECT_EQ(field_value_to_string(FieldValue{true}), "true");
    EXPECT_EQ(field_value_to_string(FieldValue{Int64{42}}), "42");
    EXPECT_EQ(field_value_to_string(FieldValue{std::string("red")}), "\"red\"");
    EXPECT_EQ(field_value_to_string(FieldValue{Point(1.0, 2.0)}), "(1,2)");
    EXPECT_EQ(field_value_to_string(FieldValue{Bounds(0.0, 0.0, 10.0, 5.0)}), "[0,0 10x5]");
}

TEST_F(FieldValueTest, NumericView) {
    EXPECT_DOUBLE_EQ(*field_value_as_number(FieldValue{Int64{3}}), 3.0);
    EXPECT_DOUBLE_EQ(*field_value_as_number(FieldValue{2.5}), 2.5);
    EXPECT_FALSE(field_value_as_number(FieldValue{std::string("3")}).has_value());
    EXPECT_FALSE(field_value_as_number(FieldValue{true}).has_value());
}

// ============================================================================
// Operation Accessor Tests
// ============================================================================

class OperationTest : public ::testing::Test {};

TEST_F(OperationTest, FootprintPrefersBounds) {
    auto op = make_op("op-1", OperationType::Move, "rect", "alice");
    op.payload[fields::POSITION] = Point(5.0, 5.0);
    op.payload[fields::BOUNDS] = Bounds(1.0, 2.0, 30.0, 40.0);

    auto footprint = op.footprint();
    ASSERT_TRUE(footprint.has_value());
    EXPECT_DOUBLE_EQ(footprint->width, 30.0);
}

TEST_F(OperationTest, FootprintFromPositionIsDegenerate) {
    auto op = make_op("op-1", OperationType::Move, "rect", "alice");
    op.payload[fields::POSITION] = Point(5.0, 6.0);

    auto footprint = op.footprint();
    ASSERT_TRUE(footprint.has_value());
    EXPECT_DOUBLE_EQ(footprint->x, 5.0);
    EXPECT_DOUBLE_EQ(footprint->area(), 0.0);
}

TEST_F(OperationTest, WrongAlternativeIsNotGeometry) {
    auto op = make_op("op-1", OperationType::Update, "rect", "alice");
    op.payload[fields::POSITION] = std::string("top-left");

    EXPECT_FALSE(op.position().has_value());
    EXPECT_FALSE(op.footprint().has_value());
}

TEST_F(OperationTest, TouchesStyle) {
    auto op = make_op("op-1", OperationType::Style, "rect", "alice");
    EXPECT_FALSE(op.touches_style());
    op.payload["style.fill"] = std::string("red");
    EXPECT_TRUE(op.touches_style());
}

TEST_F(OperationTest, TieBreakOrdersByLamportThenUserThenId) {
    auto a = make_op("op-2", OperationType::Update, "rect", "bob", 1);
    auto b = make_op("op-1", OperationType::Update, "rect", "alice", 2);
    EXPECT_TRUE(tie_break_less(a, b));

    auto c = make_op("op-9", OperationType::Update, "rect", "alice", 1);
    EXPECT_TRUE(tie_break_less(c, a));

    auto d = make_op("op-3", OperationType::Update, "rect", "bob", 1);
    EXPECT_TRUE(tie_break_less(a, d));
    EXPECT_FALSE(tie_break_less(a, a));
}

TEST_F(OperationTest, SignatureIgnoresIdButNotPayload) {
    auto a = make_op("op-1", OperationType::Style, "rect", "alice");
    a.payload["style.fill"] = std::string("red");
    auto b = a;
    b.id = "op-2";

    EXPECT_EQ(operation_signature(a), operation_signature(b));

    b.payload["style.fill"] = std::string("blue");
    EXPECT_NE(operation_signature(a), operation_signature(b));
}

// ============================================================================
// Replay Tests
// ============================================================================

class ReplayTest : public ::testing::Test {};

TEST_F(ReplayTest, CreateThenUpdate) {
    auto create = make_op("op-1", OperationType::Create, "rect", "alice");
    create.element_type = "rectangle";
    create.payload["style.fill"] = std::string("blue");
    create.payload["text"] = std::string("hello");

    auto update = make_op("op-2", OperationType::Style, "rect", "bob");
    update.payload["style.fill"] = std::string("red");

    auto states = replay({create, update});
    const auto& state = states.at("rect");

    EXPECT_TRUE(state.exists);
    EXPECT_EQ(state.element_type, "rectangle");
    EXPECT_EQ(std::get<std::string>(state.fields.at("style.fill")), "red");
    EXPECT_EQ(std::get<std::string>(state.fields.at("text")), "hello");
    EXPECT_EQ(state.version, 2u);
    EXPECT_EQ(state.last_operation_id, "op-2");
    EXPECT_EQ(state.last_user_id, "bob");
}

TEST_F(ReplayTest, UpdateOfMissingElementIsIgnored) {
    auto update = make_op("op-1", OperationType::Update, "ghost", "alice");
    update.payload["text"] = std::string("x");

    auto states = replay({update});
    EXPECT_FALSE(states.at("ghost").exists);
    EXPECT_TRUE(states.at("ghost").fields.empty());
    EXPECT_EQ(states.at("ghost").version, 0u);
}

TEST_F(ReplayTest, DeleteClearsFieldsButKeepsVersion) {
    auto create = make_op("op-1", OperationType::Create, "rect", "alice");
    create.element_type = "rectangle";
    create.payload["text"] = std::string("x");
    auto erase = make_op("op-2", OperationType::Delete, "rect", "bob");

    auto states = replay({create, erase});
    const auto& state = states.at("rect");

    EXPECT_FALSE(state.exists);
    EXPECT_TRUE(state.fields.empty());
    EXPECT_EQ(state.version, 2u);
    EXPECT_EQ(state.last_operation_id, "op-2");
}

TEST_F(ReplayTest, UpdateAfterDeleteIsIgnored) {
    auto create = make_op("op-1", OperationType::Create, "rect", "alice");
    create.element_type = "rectangle";
    auto erase = make_op("op-2", OperationType::Delete, "rect", "bob");
    auto update = make_op("op-3", OperationType::Style, "rect", "alice");
    update.payload["style.fill"] = std::string("red");

    auto states = replay({create, erase, update});
    EXPECT_FALSE(states.at("rect").exists);
    EXPECT_EQ(states.at("rect").fields.count("style.fill"), 0u);
}

TEST_F(ReplayTest, StartsFromInitialState) {
    ElementStateMap initial;
    initial["rect"].exists = true;
    initial["rect"].element_type = "rectangle";

    auto update = make_op("op-1", OperationType::Update, "rect", "alice");
    update.payload["text"] = std::string("hi");

    auto states = replay({update}, initial);
    EXPECT_EQ(std::get<std::string>(states.at("rect").fields.at("text")), "hi");
}

// ============================================================================
// Compound Operation Tests
// ============================================================================

class CompoundOperationTest : public ::testing::Test {
protected:
    Operation make_compound() const {
        auto op = make_op("op-9", OperationType::Compound, "rect", "alice", 4);
        op.payload["style.fill"] = std::string("red");
        op.payload[fields::Z_INDEX] = Int64{2};
        op.payload["text"] = std::string("hi");
        op.payload[fields::POSITION] = Point(3.0, 4.0);
        return op;
    }
};

TEST_F(CompoundOperationTest, DecomposesByFieldGroup) {
    auto parts = decompose_compound_operation(make_compound());

    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0].type, OperationType::Move);
    EXPECT_EQ(parts[0].id, "op-9#move");
    EXPECT_EQ(parts[0].payload.count(fields::POSITION), 1u);
    EXPECT_EQ(parts[1].type, OperationType::Update);
    EXPECT_EQ(parts[1].payload.count("text"), 1u);
    EXPECT_EQ(parts[2].type, OperationType::Style);
    EXPECT_EQ(parts[2].payload.count("style.fill"), 1u);
    EXPECT_EQ(parts[3].type, OperationType::LayerChange);
    EXPECT_EQ(parts[3].id, "op-9#layer_change");
    for (const auto& part : parts) {
        EXPECT_EQ(part.payload.size(), 1u);
        EXPECT_EQ(part.parent_operations, (std::vector<OperationId>{"op-9"}));
        EXPECT_EQ(part.lamport_timestamp, 4u);
        EXPECT_EQ(part.element_id, "rect");
    }
}

TEST_F(CompoundOperationTest, AtomicOperationIsItsOwnPart) {
    auto op = make_op("op-1", OperationType::Style, "rect", "alice");
    op.payload["style.fill"] = std::string("red");

    auto parts = decompose_compound_operation(op);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].id, "op-1");
    EXPECT_TRUE(parts[0].parent_operations.empty());
}

TEST_F(CompoundOperationTest, AppliesEveryPartAsOneVersion) {
    auto create = make_op("op-1", OperationType::Create, "rect", "alice");
    create.element_type = "rectangle";

    auto states = replay({create, make_compound()});
    const auto& state = states.at("rect");

    EXPECT_EQ(state.version, 2u);
    EXPECT_EQ(state.last_operation_id, "op-9");
    EXPECT_EQ(state.fields.size(), 4u);
    EXPECT_EQ(std::get<Point>(state.fields.at(fields::POSITION)), Point(3.0, 4.0));
    EXPECT_EQ(std::get<Int64>(state.fields.at(fields::Z_INDEX)), 2);
}

TEST_F(CompoundOperationTest, MissingElementIsIgnored) {
    auto states = replay({make_compound()});
    EXPECT_FALSE(states.at("rect").exists);
    EXPECT_TRUE(states.at("rect").fields.empty());
}

TEST_F(CompoundOperationTest, ValidationChecksEveryPart) {
    EXPECT_FALSE(validate_operation(make_compound()).has_value());

    auto bad = make_compound();
    bad.payload[fields::BOUNDS] = Bounds(0.0, 0.0, -5.0, 10.0);
    auto error = validate_operation(bad);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->rfind("compound move part", 0), 0u);

    auto empty = make_op("op-2", OperationType::Compound, "rect", "alice");
    ASSERT_TRUE(validate_operation(empty).has_value());
    EXPECT_EQ(*validate_operation(empty), "compound operations require a payload");
}

// ============================================================================
// Validation Tests
// ============================================================================

class ValidationTest : public ::testing::Test {};

TEST_F(ValidationTest, AcceptsWellFormedOperation) {
    auto op = make_op("op-1", OperationType::Move, "rect", "alice");
    op.payload[fields::POSITION] = Point(10.0, 20.0);
    EXPECT_FALSE(validate_operation(op).has_value());
}

TEST_F(ValidationTest, RequiresIdentifiers) {
    auto op = make_op("", OperationType::Update, "rect", "alice");
    EXPECT_TRUE(validate_operation(op).has_value());

    op = make_op("op-1", OperationType::Update, "", "alice");
    EXPECT_TRUE(validate_operation(op).has_value());

    op = make_op("op-1", OperationType::Update, "rect", "alice");
    op.user_id.clear();
    EXPECT_TRUE(validate_operation(op).has_value());
}

TEST_F(ValidationTest, CreateNeedsElementTypeNotElementId) {
    auto op = make_op("op-1", OperationType::Create, "", "alice");
    EXPECT_TRUE(validate_operation(op).has_value());

    op.element_type = "rectangle";
    EXPECT_FALSE(validate_operation(op).has_value());
}

TEST_F(ValidationTest, MoveNeedsGeometry) {
    auto op = make_op("op-1", OperationType::Move, "rect", "alice");
    EXPECT_TRUE(validate_operation(op).has_value());
}

TEST_F(ValidationTest, ClockMustContainAuthor) {
    auto op = make_op("op-1", OperationType::Update, "rect", "alice");
    op.vector_clock = VectorClock{{"bob", 3}};
    EXPECT_TRUE(validate_operation(op).has_value());
}

TEST_F(ValidationTest, PayloadFieldLimit) {
    ValidationLimits limits;
    limits.max_payload_fields = 2;

    auto op = make_op("op-1", OperationType::Update, "rect", "alice");
    op.payload["a"] = Int64{1};
    op.payload["b"] = Int64{2};
    EXPECT_FALSE(validate_operation(op, limits).has_value());

    op.payload["c"] = Int64{3};
    EXPECT_TRUE(validate_operation(op, limits).has_value());
}

TEST_F(ValidationTest, RejectsCoordinatesOutsideCanvas) {
    auto op = make_op("op-1", OperationType::Move, "rect", "alice");
    op.payload[fields::POSITION] = Point(20000.0, 0.0);
    EXPECT_TRUE(validate_operation(op).has_value());

    op.payload[fields::POSITION] = Point(std::numeric_limits<Real>::quiet_NaN(), 0.0);
    EXPECT_TRUE(validate_operation(op).has_value());
}

TEST_F(ValidationTest, RejectsNegativeBounds) {
    auto op = make_op("op-1", OperationType::Move, "rect", "alice");
    op.payload[fields::BOUNDS] = Bounds(0.0, 0.0, -5.0, 10.0);
    EXPECT_TRUE(validate_operation(op).has_value());
}

TEST_F(ValidationTest, RejectsNonFiniteNumbers) {
    auto op = make_op("op-1", OperationType::Update, "rect", "alice");
    op.payload["rotation"] = std::numeric_limits<Float64>::infinity();
    EXPECT_TRUE(validate_operation(op).has_value());
}
