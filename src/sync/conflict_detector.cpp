/**
 * @file conflict_detector.cpp
 * @brief Pairwise conflict classification implementation
 */

#include "tessera/sync/conflict_detector.h"
#include <algorithm>
#include <cstdlib>

namespace tessera::sync {

DetectorConfig DetectorConfig::from_settings(const config::DetectionSettings& settings) {
    DetectorConfig config;
    config.spatial_overlap_threshold_pct = settings.spatial_overlap_threshold_pct;
    config.temporal_window_ms = settings.temporal_window_ms;
    config.simultaneity_threshold_ms = settings.simultaneity_threshold_ms;
    config.semantic_high_field_count = settings.semantic_high_field_count;
    return config;
}

namespace {

bool is_geometry_field(const std::string& field) {
    return field == fields::POSITION || field == fields::BOUNDS;
}

int severity_rank(ConflictSeverity severity) {
    return static_cast<int>(severity);
}

std::optional<Bounds> geometry_of(const Operation& op, const GeometryLookup& geometry) {
    if (auto footprint = op.footprint()) {
        return footprint;
    }
    if (geometry && !op.element_id.empty()) {
        return geometry(op.element_id);
    }
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// Simple Conflict Detector
// ============================================================================

class SimpleConflictDetector : public IConflictDetector {
public:
    explicit SimpleConflictDetector(const DetectorConfig& config)
        : config_(config) {}

    std::optional<Conflict> classify(const Operation& a, const Operation& b,
                                     const GeometryLookup& geometry) const override {
        if (a.user_id == b.user_id) {
            return std::nullopt;
        }
        if (a.vector_clock.compare(b.vector_clock) != ClockOrdering::Concurrent) {
            return std::nullopt;
        }

        const bool a_first = tie_break_less(a, b);
        const Operation& first = a_first ? a : b;
        const Operation& second = a_first ? b : a;

        Conflict conflict;
        conflict.operations = {first, second};
        conflict.detected_at = std::max(first.timestamp, second.timestamp);

        const bool same_element = !first.element_id.empty() && first.element_id == second.element_id;
        const bool classified = same_element
            ? classify_same_element(first, second, conflict)
            : classify_spatial(first, second, geometry, conflict);
        if (!classified) {
            return std::nullopt;
        }

        std::vector<ElementId> elements{first.element_id, second.element_id};
        std::sort(elements.begin(), elements.end());
        elements.erase(std::unique(elements.begin(), elements.end()), elements.end());
        conflict.affected_elements = std::move(elements);
        conflict.id = make_conflict_id(conflict.type, {first.id, second.id});
        return conflict;
    }

    std::vector<ConflictPtr> detect(const WhiteboardId& whiteboard_id,
                                    const Operation& op,
                                    const std::vector<Operation>& window,
                                    OperationPairSet& recorded_pairs,
                                    const GeometryLookup& geometry) const override {
        std::vector<ConflictPtr> conflicts;

        for (const auto& other : window) {
            if (other.id == op.id) {
                continue;
            }
            const OperationPair key = make_operation_pair(op.id, other.id);
            if (recorded_pairs.count(key) > 0) {
                continue;
            }

            auto conflict = classify(op, other, geometry);
            if (!conflict) {
                continue;
            }
            conflict->whiteboard_id = whiteboard_id;
            recorded_pairs.insert(key);
            conflicts.push_back(std::make_shared<const Conflict>(std::move(*conflict)));
        }

        std::sort(conflicts.begin(), conflicts.end(), [](const ConflictPtr& x, const ConflictPtr& y) {
            if (x->severity != y->severity) {
                return severity_rank(x->severity) > severity_rank(y->severity);
            }
            return x->id < y->id;
        });
        return conflicts;
    }

    const DetectorConfig& config() const override { return config_; }

private:
    bool classify_same_element(const Operation& first, const Operation& second, Conflict& conflict) const {
        const Int64 dt = std::abs(millis_between(first.timestamp, second.timestamp));

        // Fields written by both with different values
        SemanticEvidence semantic;
        bool geometry_clash = false;
        bool content_clash = false;
        for (const auto& [field, value] : first.payload) {
            auto it = second.payload.find(field);
            if (it == second.payload.end() || it->second == value) {
                continue;
            }
            semantic.incompatible_changes.push_back(field);
            semantic.field_values[field][first.id] = value;
            semantic.field_values[field][second.id] = it->second;
            if (is_geometry_field(field)) {
                geometry_clash = true;
            } else {
                content_clash = true;
            }
        }

        const bool existence = first.type == OperationType::Delete || second.type == OperationType::Delete ||
                               (first.type == OperationType::Create && second.type == OperationType::Create);

        if (existence || (geometry_clash && content_clash)) {
            CompoundEvidence compound;
            compound.existence_conflict = existence;
            if (!semantic.incompatible_changes.empty()) {
                compound.components.push_back(ConflictType::Semantic);
            }
            if (geometry_clash) {
                compound.components.push_back(ConflictType::Spatial);
            }
            if (dt <= config_.temporal_window_ms) {
                compound.components.push_back(ConflictType::Temporal);
            }
            if (existence) {
                compound.incompatible_changes.push_back(std::string(operation_type_to_string(first.type)) +
                                                        " vs " + operation_type_to_string(second.type));
            }
            for (const auto& field : semantic.incompatible_changes) {
                compound.incompatible_changes.push_back(field);
            }

            conflict.type = ConflictType::Compound;
            conflict.severity = ConflictSeverity::Critical;
            conflict.evidence = std::move(compound);
            return true;
        }

        if (!semantic.incompatible_changes.empty()) {
            conflict.type = ConflictType::Semantic;
            conflict.severity = semantic.incompatible_changes.size() >= config_.semantic_high_field_count
                ? ConflictSeverity::High : ConflictSeverity::Medium;
            conflict.evidence = std::move(semantic);
            return true;
        }

        if (dt <= config_.temporal_window_ms) {
            const bool simultaneous = dt < config_.simultaneity_threshold_ms;
            conflict.type = ConflictType::Temporal;
            conflict.severity = simultaneous ? ConflictSeverity::Medium : ConflictSeverity::Low;
            conflict.evidence = TemporalEvidence{dt, simultaneous};
            return true;
        }

        return false;
    }

    bool classify_spatial(const Operation& first, const Operation& second,
                          const GeometryLookup& geometry, Conflict& conflict) const {
        if (first.element_id.empty() || second.element_id.empty()) {
            return false;
        }

        const auto first_bounds = geometry_of(first, geometry);
        const auto second_bounds = geometry_of(second, geometry);
        if (!first_bounds || !second_bounds) {
            return false;
        }

        const Real percentage = first_bounds->overlap_ratio(*second_bounds) * 100.0;
        if (percentage <= 0.0 || percentage < config_.spatial_overlap_threshold_pct) {
            return false;
        }

        SpatialEvidence evidence;
        evidence.intersection = first_bounds->intersection(*second_bounds);
        evidence.overlap_area = evidence.intersection.area();
        evidence.overlap_percentage = percentage;

        conflict.type = ConflictType::Spatial;
        if (percentage >= config_.spatial_high_pct) {
            conflict.severity = ConflictSeverity::High;
        } else if (percentage >= config_.spatial_medium_pct) {
            conflict.severity = ConflictSeverity::Medium;
        } else {
            conflict.severity = ConflictSeverity::Low;
        }
        conflict.evidence = evidence;
        return true;
    }

    DetectorConfig config_;
};

// ============================================================================
// Factory Functions
// ============================================================================

std::unique_ptr<IConflictDetector> create_conflict_detector(const DetectorConfig& config) {
    return std::make_unique<SimpleConflictDetector>(config);
}

} // namespace tessera::sync
