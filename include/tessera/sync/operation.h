#pragma once
/**
 * @file operation.h
 * @brief Whiteboard operation model and replay semantics
 *
 * Key features:
 * - Statically typed payload fields (closed variant, no dynamic bags)
 * - Element state snapshots and deterministic replay
 * - Structural validation of incoming operations
 */

#include "tessera/core/types.h"
#include "tessera/sync/vector_clock.h"
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tessera::sync {

// ============================================================================
// Operation Type
// ============================================================================

/**
 * @brief Kind of edit an operation performs
 */
enum class OperationType : UInt8 {
    Create,
    Update,
    Delete,
    Move,
    Style,
    LayerChange,
    Compound
};

/**
 * @brief Convert OperationType to string
 */
inline const char* operation_type_to_string(OperationType type) {
    switch (type) {
        case OperationType::Create: return "create";
        case OperationType::Update: return "update";
        case OperationType::Delete: return "delete";
        case OperationType::Move: return "move";
        case OperationType::Style: return "style";
        case OperationType::LayerChange: return "layer_change";
        case OperationType::Compound: return "compound";
        default: return "unknown";
    }
}

/**
 * @brief Field-overwriting operation types (replay merges their payload)
 */
inline bool is_field_update(OperationType type) {
    return type == OperationType::Update || type == OperationType::Move ||
           type == OperationType::Style || type == OperationType::LayerChange;
}

/**
 * @brief Operation types that change whether an element exists
 */
inline bool changes_existence(OperationType type) {
    return type == OperationType::Create || type == OperationType::Delete;
}

// ============================================================================
// Payload
// ============================================================================

/**
 * @brief Value of a single logical field
 */
using FieldValue = std::variant<std::monostate, bool, Int64, Float64, std::string, Point, Bounds>;

/**
 * @brief Logical field name to value; ordered for deterministic iteration
 */
using FieldMap = std::map<std::string, FieldValue>;

/// Reserved payload keys
namespace fields {
inline constexpr const char* POSITION = "position";
inline constexpr const char* BOUNDS = "bounds";
inline constexpr const char* ROTATION = "rotation";
inline constexpr const char* Z_INDEX = "z_index";
inline constexpr const char* STYLE_PREFIX = "style.";
} // namespace fields

/**
 * @brief Render a field value for logs, evidence and signatures
 */
std::string field_value_to_string(const FieldValue& value);

/**
 * @brief Numeric view of a field value (Int64 or Float64)
 */
std::optional<Real> field_value_as_number(const FieldValue& value);

// ============================================================================
// Operation
// ============================================================================

/**
 * @brief Atomic, idempotent edit intent on a whiteboard element
 *
 * Operations are immutable once emitted; the engine annotates copies.
 */
struct Operation {
    OperationId id;                             ///< Unique operation id
    OperationType type{OperationType::Update};
    ElementId element_id;                       ///< Target element (may be empty for Create)
    std::string element_type;                   ///< Required for Create
    UserId user_id;                             ///< Originating user
    VectorClock vector_clock;                   ///< Author's clock at emission
    LamportTime lamport_timestamp{0};           ///< Tie-breaker for concurrent clocks
    UInt64 version{0};                          ///< Element-local version
    FieldMap payload;                           ///< Fields written by this operation
    std::vector<OperationId> parent_operations; ///< Constituents of a compound operation
    Timestamp timestamp{};                      ///< Advisory wall-clock emission time

    // Engine annotations
    bool has_conflict{false};                   ///< Set on the transformed copy
    UInt32 compressed_count{1};                 ///< Originals folded into this operation

    std::optional<Point> position() const;
    std::optional<Bounds> bounds() const;

    /**
     * @brief Geometry footprint: bounds, or a zero-size box at position
     */
    std::optional<Bounds> footprint() const;

    /**
     * @brief Whether the payload writes a style field
     */
    bool touches_style() const;
};

/**
 * @brief Deterministic total order key for concurrent operations
 *
 * Lower Lamport timestamp first, then lower user id, then lower op id.
 */
bool tie_break_less(const Operation& a, const Operation& b);

/**
 * @brief Content signature used for de-duplication
 */
std::string operation_signature(const Operation& op);

// ============================================================================
// Element State and Replay
// ============================================================================

/**
 * @brief Last known snapshot of a canvas element
 */
struct ElementState {
    std::string element_type;
    FieldMap fields;
    bool exists{false};
    UInt64 version{0};
    OperationId last_operation_id;
    UserId last_user_id;

    bool operator==(const ElementState& other) const {
        return exists == other.exists && fields == other.fields &&
               element_type == other.element_type;
    }
};

using ElementStateMap = std::unordered_map<ElementId, ElementState>;

/**
 * @brief Split a compound operation into atomic operations
 *
 * Position and bounds go to a Move, style fields to a Style, the z-index to
 * a LayerChange and all other fields to an Update. Parts keep the compound's
 * clocks and author, carry ids of the form "<id>#<type>" and list the
 * compound as their parent. Empty parts are omitted. Any other operation
 * type comes back as its only part.
 */
std::vector<Operation> decompose_compound_operation(const Operation& op);

/**
 * @brief Apply one operation to an element snapshot
 *
 * Create replaces the field set; field updates overwrite key by key and are
 * ignored when the element does not exist; Delete clears the element.
 * A compound operation applies its atomic parts together as one version.
 */
void apply_operation(ElementState& state, const Operation& op);

/**
 * @brief Replay a sequence of operations against initial element states
 */
ElementStateMap replay(const std::vector<Operation>& ops, ElementStateMap initial = {});

// ============================================================================
// Validation
// ============================================================================

/**
 * @brief Structural limits for incoming operations
 */
struct ValidationLimits {
    SizeT max_payload_fields{50};
    Real coordinate_limit{10000.0};
};

/**
 * @brief Validate an operation's structure
 *
 * A compound operation must carry a payload, and every atomic part must be
 * valid on its own.
 * @return Error message, or std::nullopt when valid
 */
std::optional<std::string> validate_operation(const Operation& op, const ValidationLimits& limits = {});

} // namespace tessera::sync
