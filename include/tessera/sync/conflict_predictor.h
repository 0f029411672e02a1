#pragma once
/**
 * @file conflict_predictor.h
 * @brief Advisory prediction of imminent conflicts
 *
 * Key features:
 * - Cursor proximity (spatial) predictions from live user activity
 * - Rapid cross-user edits (temporal) and risky edit mixes (semantic)
 * - Never mutates engine state; safe to drop or skip under load
 * - Bounded prediction outcome history for accuracy reporting
 */

#include "tessera/core/bounded_cache.h"
#include "tessera/interface/config.h"
#include "tessera/sync/conflict.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tessera::sync {

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Suggested action to avoid a predicted conflict
 */
enum class PreventionStrategy : UInt8 {
    StaggerEdits,
    LockRegion,
    LockElement,
    CoordinateUsers
};

/**
 * @brief Convert PreventionStrategy to string
 */
inline const char* prevention_strategy_to_string(PreventionStrategy strategy) {
    switch (strategy) {
        case PreventionStrategy::StaggerEdits: return "stagger_edits";
        case PreventionStrategy::LockRegion: return "lock_region";
        case PreventionStrategy::LockElement: return "lock_element";
        case PreventionStrategy::CoordinateUsers: return "coordinate_users";
        default: return "unknown";
    }
}

// ============================================================================
// Structs
// ============================================================================

/**
 * @brief Live presence sample for one user
 */
struct UserActivity {
    UserId user_id;
    Point cursor;
    std::optional<ElementId> selected_element;
    Timestamp timestamp{};
};

/**
 * @brief Predicted conflict
 */
struct ConflictPrediction {
    std::string id;
    ConflictType type{ConflictType::Spatial};
    Real probability{0.0};                          ///< [0, 1]
    ConflictSeverity estimated_severity{ConflictSeverity::Low};
    std::vector<UserId> affected_users;             ///< Sorted
    std::vector<ElementId> affected_elements;       ///< Sorted
    PreventionStrategy prevention{PreventionStrategy::CoordinateUsers};
    std::string description;
};

/**
 * @brief Read-only view of whiteboard state used for predictions
 */
struct PredictionContext {
    WhiteboardId whiteboard_id;
    core::IBoundedCache<ElementId, Bounds>* element_bounds{nullptr};   ///< Optional
};

/**
 * @brief Accuracy over recorded prediction outcomes
 */
struct PredictionAccuracy {
    UInt64 total_predictions{0};
    UInt64 correct_predictions{0};
    UInt64 false_positives{0};
    Real accuracy{0.0};
};

/**
 * @brief Predictor configuration
 */
struct PredictorConfig {
    bool enabled{true};
    Real cursor_proximity_threshold{100.0};
    Int64 activity_ttl_ms{5000};
    Int64 temporal_window_ms{1000};
    SizeT max_history{1000};

    static PredictorConfig from_settings(const config::PredictionSettings& prediction,
                                         const config::DetectionSettings& detection);
};

// ============================================================================
// Interfaces
// ============================================================================

/**
 * @brief Interface for conflict prediction
 */
class IConflictPredictor {
public:
    virtual ~IConflictPredictor() = default;

    /**
     * @brief Predict conflicts from recent operations and live activity
     * @return Predictions sorted by probability (descending), then id
     */
    virtual std::vector<ConflictPrediction> predict_conflicts(
        const std::vector<Operation>& recent_operations,
        const std::vector<UserActivity>& live_user_activity,
        const PredictionContext& context) const = 0;

    /**
     * @brief Record whether a predicted conflict actually happened
     */
    virtual void record_prediction_outcome(const std::string& prediction_id, bool conflict_occurred) = 0;

    virtual PredictionAccuracy get_prediction_accuracy() const = 0;

    virtual const PredictorConfig& config() const = 0;
};

// ============================================================================
// Factory Functions
// ============================================================================

std::unique_ptr<IConflictPredictor> create_conflict_predictor(const PredictorConfig& config = {});

} // namespace tessera::sync
