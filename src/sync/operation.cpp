/**
 * @file operation.cpp
 * @brief Operation helpers, replay and validation
 */

#include "tessera/sync/operation.h"
#include <cmath>
#include <sstream>

namespace tessera::sync {

namespace {

bool finite_within(Real value, Real limit) {
    return std::isfinite(value) && std::abs(value) <= limit;
}

} // anonymous namespace

// ============================================================================
// Field Values
// ============================================================================

std::string field_value_to_string(const FieldValue& value) {
    std::ostringstream oss;
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << '"' << v << '"';
        } else if constexpr (std::is_same_v<T, Point>) {
            oss << "(" << v.x << "," << v.y << ")";
        } else if constexpr (std::is_same_v<T, Bounds>) {
            oss << "[" << v.x << "," << v.y << " " << v.width << "x" << v.height << "]";
        } else {
            oss << v;
        }
    }, value);
    return oss.str();
}

std::optional<Real> field_value_as_number(const FieldValue& value) {
    if (const auto* i = std::get_if<Int64>(&value)) {
        return static_cast<Real>(*i);
    }
    if (const auto* f = std::get_if<Float64>(&value)) {
        return *f;
    }
    return std::nullopt;
}

// ============================================================================
// Operation
// ============================================================================

std::optional<Point> Operation::position() const {
    auto it = payload.find(fields::POSITION);
    if (it != payload.end()) {
        if (const auto* p = std::get_if<Point>(&it->second)) {
            return *p;
        }
    }
    return std::nullopt;
}

std::optional<Bounds> Operation::bounds() const {
    auto it = payload.find(fields::BOUNDS);
    if (it != payload.end()) {
        if (const auto* b = std::get_if<Bounds>(&it->second)) {
            return *b;
        }
    }
    return std::nullopt;
}

std::optional<Bounds> Operation::footprint() const {
    if (auto b = bounds()) {
        return b;
    }
    if (auto p = position()) {
        return Bounds{p->x, p->y, 0.0, 0.0};
    }
    return std::nullopt;
}

bool Operation::touches_style() const {
    for (const auto& [key, value] : payload) {
        if (key.rfind(fields::STYLE_PREFIX, 0) == 0) {
            return true;
        }
    }
    return false;
}

bool tie_break_less(const Operation& a, const Operation& b) {
    if (a.lamport_timestamp != b.lamport_timestamp) {
        return a.lamport_timestamp < b.lamport_timestamp;
    }
    if (a.user_id != b.user_id) {
        return a.user_id < b.user_id;
    }
    return a.id < b.id;
}

std::string operation_signature(const Operation& op) {
    std::ostringstream oss;
    oss << operation_type_to_string(op.type) << "|" << op.element_id << "|" << op.user_id
        << "|" << op.lamport_timestamp << "|";
    for (const auto& [key, value] : op.payload) {
        oss << key << "=" << field_value_to_string(value) << ";";
    }
    return oss.str();
}

// ============================================================================
// Compound Operations
// ============================================================================

namespace {

OperationType part_type_for(const std::string& key) {
    if (key == fields::POSITION || key == fields::BOUNDS) {
        return OperationType::Move;
    }
    if (key.rfind(fields::STYLE_PREFIX, 0) == 0) {
        return OperationType::Style;
    }
    if (key == fields::Z_INDEX) {
        return OperationType::LayerChange;
    }
    return OperationType::Update;
}

} // anonymous namespace

std::vector<Operation> decompose_compound_operation(const Operation& op) {
    if (op.type != OperationType::Compound) {
        return {op};
    }

    std::map<OperationType, FieldMap> grouped;
    for (const auto& [key, value] : op.payload) {
        grouped[part_type_for(key)][key] = value;
    }

    std::vector<Operation> parts;
    for (auto type : {OperationType::Move, OperationType::Update, OperationType::Style,
                      OperationType::LayerChange}) {
        auto it = grouped.find(type);
        if (it == grouped.end()) {
            continue;
        }
        Operation part = op;
        part.id = op.id + "#" + operation_type_to_string(type);
        part.type = type;
        part.payload = std::move(it->second);
        part.parent_operations = {op.id};
        parts.push_back(std::move(part));
    }
    return parts;
}

// ============================================================================
// Replay
// ============================================================================

void apply_operation(ElementState& state, const Operation& op) {
    switch (op.type) {
        case OperationType::Create:
            state.element_type = op.element_type;
            state.fields = op.payload;
            state.exists = true;
            break;

        case OperationType::Delete: {
            const UInt64 version = state.version;
            state = ElementState{};
            state.version = version;
            break;
        }

        case OperationType::Update:
        case OperationType::Move:
        case OperationType::Style:
        case OperationType::LayerChange:
            if (!state.exists) {
                return;
            }
            for (const auto& [key, value] : op.payload) {
                state.fields[key] = value;
            }
            break;

        case OperationType::Compound:
            if (!state.exists) {
                return;
            }
            for (const auto& part : decompose_compound_operation(op)) {
                for (const auto& [key, value] : part.payload) {
                    state.fields[key] = value;
                }
            }
            break;
    }

    state.version++;
    state.last_operation_id = op.id;
    state.last_user_id = op.user_id;
}

ElementStateMap replay(const std::vector<Operation>& ops, ElementStateMap initial) {
    for (const auto& op : ops) {
        apply_operation(initial[op.element_id], op);
    }
    return initial;
}

// ============================================================================
// Validation
// ============================================================================

std::optional<std::string> validate_operation(const Operation& op, const ValidationLimits& limits) {
    if (op.id.empty()) {
        return "operation id is required";
    }
    if (op.user_id.empty()) {
        return "user id is required";
    }
    if (op.type != OperationType::Create && op.element_id.empty()) {
        return std::string("element id is required for ") + operation_type_to_string(op.type) +
               " operations";
    }
    if (op.type == OperationType::Create && op.element_type.empty()) {
        return "element type is required for create operations";
    }
    if (op.type == OperationType::Move && !op.position() && !op.bounds()) {
        return "move operations require a position or bounds";
    }
    if (op.vector_clock.get(op.user_id) == 0) {
        return "vector clock is missing the author's component";
    }
    if (op.payload.size() > limits.max_payload_fields) {
        return "payload has " + std::to_string(op.payload.size()) + " fields, limit is " +
               std::to_string(limits.max_payload_fields);
    }
    if (op.type == OperationType::Compound) {
        if (op.payload.empty()) {
            return "compound operations require a payload";
        }
        for (const auto& part : decompose_compound_operation(op)) {
            if (auto error = validate_operation(part, limits)) {
                return std::string("compound ") + operation_type_to_string(part.type) + " part: " + *error;
            }
        }
        return std::nullopt;
    }

    for (const auto& [key, value] : op.payload) {
        if (key.empty()) {
            return "payload field names must be non-empty";
        }
        if (const auto* p = std::get_if<Point>(&value)) {
            if (!finite_within(p->x, limits.coordinate_limit) ||
                !finite_within(p->y, limits.coordinate_limit)) {
                return "field '" + key + "' is outside the canvas coordinate limits";
            }
        } else if (const auto* b = std::get_if<Bounds>(&value)) {
            if (!finite_within(b->x, limits.coordinate_limit) ||
                !finite_within(b->y, limits.coordinate_limit) ||
                !finite_within(b->width, limits.coordinate_limit) ||
                !finite_within(b->height, limits.coordinate_limit) ||
                b->width < 0.0 || b->height < 0.0) {
                return "field '" + key + "' has invalid bounds";
            }
        } else if (const auto* f = std::get_if<Float64>(&value)) {
            if (!std::isfinite(*f)) {
                return "field '" + key + "' is not a finite number";
            }
        }
    }

    return std::nullopt;
}

} // namespace tessera::sync
