#pragma once
/**
 * @file resolution_strategies.h
 * @brief Pure conflict resolution strategies
 *
 * A strategy inspects a conflict and proposes a resolution operation. It
 * never touches engine state; the resolution service commits a candidate
 * only when the strategy succeeds.
 */

#include "tessera/sync/conflict.h"
#include "tessera/sync/conflict_detector.h"
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace tessera::sync {

// ============================================================================
// Structs
// ============================================================================

/**
 * @brief Read-only inputs available to strategies
 */
struct StrategyContext {
    std::map<UserId, Real> user_priorities;     ///< Missing users weigh 1.0
    Real spatial_offset_spacing{10.0};
    GeometryLookup geometry;                    ///< Cached element bounds (optional)
};

// ============================================================================
// Interfaces
// ============================================================================

/**
 * @brief Interface for a resolution strategy
 */
class IResolutionStrategy {
public:
    virtual ~IResolutionStrategy() = default;

    virtual ResolutionStrategy kind() const = 0;

    /**
     * @brief Propose a resolution operation
     * @return The candidate, or std::nullopt when the strategy does not apply
     */
    virtual std::optional<Operation> apply(const Conflict& conflict, const StrategyContext& context) const = 0;
};

// ============================================================================
// Factory Functions
// ============================================================================

/**
 * @brief Create a built-in strategy
 *
 * Automatic and Manual have no built-in candidate and return a strategy
 * that never applies.
 */
std::unique_ptr<IResolutionStrategy> create_resolution_strategy(ResolutionStrategy kind);

/**
 * @brief Id given to the resolution operation of a conflict
 */
OperationId make_resolution_id(const Conflict& conflict);

} // namespace tessera::sync
