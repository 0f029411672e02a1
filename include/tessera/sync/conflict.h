#pragma once
/**
 * @file conflict.h
 * @brief Conflict records and type-specific evidence
 *
 * Key features:
 * - Closed evidence union (one alternative per conflict type)
 * - Deterministic conflict ids from type and sorted operation ids
 * - Conflicts are shared immutably; updates produce annotated copies
 */

#include "tessera/sync/operation.h"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tessera::sync {

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Conflict classification
 */
enum class ConflictType : UInt8 {
    Spatial,        ///< Different elements with overlapping footprints
    Temporal,       ///< Same element edited within the proximity window
    Semantic,       ///< Same field written with different values
    Compound        ///< Several sub-conflicts, or element existence at stake
};

/**
 * @brief Convert ConflictType to string
 */
inline const char* conflict_type_to_string(ConflictType type) {
    switch (type) {
        case ConflictType::Spatial: return "spatial";
        case ConflictType::Temporal: return "temporal";
        case ConflictType::Semantic: return "semantic";
        case ConflictType::Compound: return "compound";
        default: return "unknown";
    }
}

/**
 * @brief Conflict severity
 */
enum class ConflictSeverity : UInt8 {
    Low,
    Medium,
    High,
    Critical
};

/**
 * @brief Convert ConflictSeverity to string
 */
inline const char* conflict_severity_to_string(ConflictSeverity severity) {
    switch (severity) {
        case ConflictSeverity::Low: return "low";
        case ConflictSeverity::Medium: return "medium";
        case ConflictSeverity::High: return "high";
        case ConflictSeverity::Critical: return "critical";
        default: return "unknown";
    }
}

/**
 * @brief Named procedure for resolving a conflict
 */
enum class ResolutionStrategy : UInt8 {
    Automatic,          ///< Engine picks per conflict type
    Manual,             ///< Escalate to a human
    Merge,              ///< Union fields, average numeric clashes
    LastWriterWins,     ///< Highest Lamport timestamp wins
    FirstWriterWins,    ///< Lowest Lamport timestamp wins
    PriorityUser,       ///< Highest user priority weight wins
    SpatialOffset       ///< Move the later element clear of the overlap
};

/**
 * @brief Convert ResolutionStrategy to string
 */
inline const char* resolution_strategy_to_string(ResolutionStrategy strategy) {
    switch (strategy) {
        case ResolutionStrategy::Automatic: return "automatic";
        case ResolutionStrategy::Manual: return "manual";
        case ResolutionStrategy::Merge: return "merge";
        case ResolutionStrategy::LastWriterWins: return "last_writer_wins";
        case ResolutionStrategy::FirstWriterWins: return "first_writer_wins";
        case ResolutionStrategy::PriorityUser: return "priority_user";
        case ResolutionStrategy::SpatialOffset: return "spatial_offset";
        default: return "unknown";
    }
}

/**
 * @brief Risk of resolving a conflict without a human
 */
enum class RiskLevel : UInt8 {
    Low,
    Medium,
    High
};

/**
 * @brief Convert RiskLevel to string
 */
inline const char* risk_level_to_string(RiskLevel risk) {
    switch (risk) {
        case RiskLevel::Low: return "low";
        case RiskLevel::Medium: return "medium";
        case RiskLevel::High: return "high";
        default: return "unknown";
    }
}

// ============================================================================
// Evidence
// ============================================================================

struct SpatialEvidence {
    Real overlap_area{0.0};
    Real overlap_percentage{0.0};   ///< Intersection over union, 0-100
    Bounds intersection;
};

struct TemporalEvidence {
    Int64 time_difference_ms{0};
    bool simultaneous{false};
};

struct SemanticEvidence {
    std::vector<std::string> incompatible_changes;                      ///< Clashing field names
    std::map<std::string, std::map<OperationId, FieldValue>> field_values;
};

struct CompoundEvidence {
    std::vector<ConflictType> components;       ///< Sub-conflicts found on the pair
    bool existence_conflict{false};             ///< Delete, or concurrent creates
    std::vector<std::string> incompatible_changes;
};

using ConflictEvidence = std::variant<SpatialEvidence, TemporalEvidence, SemanticEvidence, CompoundEvidence>;

// ============================================================================
// Conflict
// ============================================================================

/**
 * @brief Detected collision between operations of different users
 */
struct Conflict {
    ConflictId id;
    WhiteboardId whiteboard_id;
    ConflictType type{ConflictType::Temporal};
    ConflictSeverity severity{ConflictSeverity::Low};
    std::vector<Operation> operations;          ///< Canonical (tie-break) order
    std::vector<ElementId> affected_elements;   ///< Sorted, unique
    ConflictEvidence evidence;
    std::optional<ResolutionStrategy> resolution_strategy;
    Timestamp detected_at{};
    std::optional<Timestamp> resolved_at;

    std::vector<OperationId> operation_ids() const;

    /**
     * @brief Sorted, unique users owning the involved operations
     */
    std::vector<UserId> affected_users() const;

    /**
     * @brief Whether any involved operation creates or deletes an element
     */
    bool involves_existence_change() const;

    /**
     * @brief Number of clashing fields recorded in the evidence
     */
    SizeT conflicting_field_count() const;
};

using ConflictPtr = std::shared_ptr<const Conflict>;

/**
 * @brief Deterministic id: type plus sorted operation ids
 */
ConflictId make_conflict_id(ConflictType type, std::vector<OperationId> operation_ids);

/**
 * @brief Unordered operation pair, smaller id first
 */
using OperationPair = std::pair<OperationId, OperationId>;
using OperationPairSet = std::set<OperationPair>;

/**
 * @brief Order-independent key for an operation pair
 */
OperationPair make_operation_pair(const OperationId& a, const OperationId& b);

} // namespace tessera::sync
