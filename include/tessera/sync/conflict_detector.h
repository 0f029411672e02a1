#pragma once
/**
 * @file conflict_detector.h
 * @brief Pairwise conflict classification
 *
 * Key features:
 * - Only concurrent operations from different users can conflict
 * - One classification per pair: compound > semantic > spatial > temporal
 * - Pure, symmetric pair classification with typed evidence
 * - Window scan with pair de-duplication
 */

#include "tessera/interface/config.h"
#include "tessera/sync/conflict.h"
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace tessera::sync {

// ============================================================================
// Structs
// ============================================================================

/**
 * @brief Detection thresholds
 */
struct DetectorConfig {
    Real spatial_overlap_threshold_pct{10.0};   ///< Minimum IoU for a spatial conflict
    Real spatial_high_pct{70.0};
    Real spatial_medium_pct{40.0};
    Int64 temporal_window_ms{1000};
    Int64 simultaneity_threshold_ms{100};
    SizeT semantic_high_field_count{5};

    static DetectorConfig from_settings(const config::DetectionSettings& settings);
};

/**
 * @brief Resolves an element's last known bounds when an operation has none
 */
using GeometryLookup = std::function<std::optional<Bounds>(const ElementId&)>;

// ============================================================================
// Interfaces
// ============================================================================

/**
 * @brief Interface for conflict detection
 */
class IConflictDetector {
public:
    virtual ~IConflictDetector() = default;

    /**
     * @brief Classify an operation pair
     *
     * Pure and symmetric: classify(a, b) and classify(b, a) produce the
     * same record. The whiteboard id is left empty.
     * @return The conflict, or std::nullopt when the pair does not collide
     */
    virtual std::optional<Conflict> classify(const Operation& a, const Operation& b,
                                             const GeometryLookup& geometry = {}) const = 0;

    /**
     * @brief Check an operation against a window of other operations
     * @param recorded_pairs Pairs already reported; new pairs are added
     * @return New conflicts, most severe first
     */
    virtual std::vector<ConflictPtr> detect(const WhiteboardId& whiteboard_id,
                                            const Operation& op,
                                            const std::vector<Operation>& window,
                                            OperationPairSet& recorded_pairs,
                                            const GeometryLookup& geometry = {}) const = 0;

    virtual const DetectorConfig& config() const = 0;
};

// ============================================================================
// Factory Functions
// ============================================================================

std::unique_ptr<IConflictDetector> create_conflict_detector(const DetectorConfig& config = {});

} // namespace tessera::sync
