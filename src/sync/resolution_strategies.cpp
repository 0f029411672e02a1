/**
 * @file resolution_strategies.cpp
 * @brief Built-in resolution strategies
 */

#include "tessera/sync/resolution_strategies.h"
#include <algorithm>

namespace tessera::sync {

OperationId make_resolution_id(const Conflict& conflict) {
    return "resolution_" + conflict.id;
}

namespace {

/**
 * @brief Resolution op derived from a chosen operation
 *
 * Carries the merged clock of every involved operation so it causally
 * follows all of them.
 */
Operation resolution_from(const Conflict& conflict, const Operation& basis) {
    Operation resolution = basis;
    resolution.id = make_resolution_id(conflict);
    resolution.parent_operations = conflict.operation_ids();
    resolution.has_conflict = false;
    resolution.compressed_count = 1;
    for (const auto& op : conflict.operations) {
        resolution.vector_clock.merge(op.vector_clock);
        resolution.lamport_timestamp = std::max(resolution.lamport_timestamp, op.lamport_timestamp);
        resolution.timestamp = std::max(resolution.timestamp, op.timestamp);
    }
    return resolution;
}

// ============================================================================
// Writer Order Strategies
// ============================================================================

class WriterOrderStrategy : public IResolutionStrategy {
public:
    explicit WriterOrderStrategy(bool last_wins)
        : last_wins_(last_wins) {}

    ResolutionStrategy kind() const override {
        return last_wins_ ? ResolutionStrategy::LastWriterWins : ResolutionStrategy::FirstWriterWins;
    }

    std::optional<Operation> apply(const Conflict& conflict, const StrategyContext&) const override {
        if (conflict.operations.empty()) {
            return std::nullopt;
        }
        // Operations are kept in Lamport, then user id order
        const auto winner = last_wins_
            ? std::max_element(conflict.operations.begin(), conflict.operations.end(), tie_break_less)
            : std::min_element(conflict.operations.begin(), conflict.operations.end(), tie_break_less);
        return resolution_from(conflict, *winner);
    }

private:
    bool last_wins_;
};

// ============================================================================
// Priority User Strategy
// ============================================================================

class PriorityUserStrategy : public IResolutionStrategy {
public:
    ResolutionStrategy kind() const override { return ResolutionStrategy::PriorityUser; }

    std::optional<Operation> apply(const Conflict& conflict, const StrategyContext& context) const override {
        const Operation* best = nullptr;
        Real best_weight = 0.0;
        bool tied = false;

        for (const auto& op : conflict.operations) {
            auto it = context.user_priorities.find(op.user_id);
            const Real weight = it != context.user_priorities.end() ? it->second : 1.0;
            if (!best || weight > best_weight) {
                best = &op;
                best_weight = weight;
                tied = false;
            } else if (weight == best_weight && op.user_id != best->user_id) {
                tied = true;
            }
        }

        if (!best || tied) {
            return std::nullopt;
        }
        return resolution_from(conflict, *best);
    }
};

// ============================================================================
// Merge Strategy
// ============================================================================

class MergeStrategy : public IResolutionStrategy {
public:
    ResolutionStrategy kind() const override { return ResolutionStrategy::Merge; }

    std::optional<Operation> apply(const Conflict& conflict, const StrategyContext&) const override {
        if (conflict.operations.size() < 2 || conflict.involves_existence_change()) {
            return std::nullopt;
        }
        const ElementId& element_id = conflict.operations.front().element_id;
        for (const auto& op : conflict.operations) {
            if (op.element_id != element_id) {
                return std::nullopt;
            }
        }

        // Union of fields; clashing numeric fields are averaged
        std::map<std::string, std::vector<FieldValue>> written;
        for (const auto& op : conflict.operations) {
            for (const auto& [field, value] : op.payload) {
                written[field].push_back(value);
            }
        }

        FieldMap merged;
        for (const auto& [field, values] : written) {
            const bool uniform = std::all_of(values.begin(), values.end(),
                                             [&](const FieldValue& v) { return v == values.front(); });
            if (uniform) {
                merged[field] = values.front();
                continue;
            }

            Real sum = 0.0;
            for (const auto& value : values) {
                auto number = field_value_as_number(value);
                if (!number) {
                    return std::nullopt;
                }
                sum += *number;
            }
            merged[field] = Float64(sum / static_cast<Real>(values.size()));
        }

        Operation resolution = resolution_from(conflict, conflict.operations.back());
        resolution.type = OperationType::Update;
        resolution.payload = std::move(merged);
        return resolution;
    }
};

// ============================================================================
// Spatial Offset Strategy
// ============================================================================

class SpatialOffsetStrategy : public IResolutionStrategy {
public:
    ResolutionStrategy kind() const override { return ResolutionStrategy::SpatialOffset; }

    std::optional<Operation> apply(const Conflict& conflict, const StrategyContext& context) const override {
        if (conflict.operations.size() != 2) {
            return std::nullopt;
        }
        const Operation& first = conflict.operations[0];
        const Operation& later = conflict.operations[1];
        if (first.element_id == later.element_id || later.type == OperationType::Delete) {
            return std::nullopt;
        }

        const auto first_bounds = footprint(first, context);
        const auto later_bounds = footprint(later, context);
        if (!first_bounds || !later_bounds) {
            return std::nullopt;
        }

        const Bounds overlap = first_bounds->intersection(*later_bounds);
        if (overlap.area() <= 0.0) {
            return std::nullopt;
        }

        // Shift the later element right, clear of the earlier one
        const Real dx = first_bounds->right() - later_bounds->x + context.spatial_offset_spacing;
        Bounds shifted = *later_bounds;
        shifted.x += dx;

        Operation resolution = resolution_from(conflict, later);
        resolution.type = OperationType::Move;
        resolution.payload.clear();
        resolution.payload[fields::POSITION] = Point{shifted.x, shifted.y};
        if (later.bounds() || (shifted.width > 0.0 && shifted.height > 0.0)) {
            resolution.payload[fields::BOUNDS] = shifted;
        }
        return resolution;
    }

private:
    static std::optional<Bounds> footprint(const Operation& op, const StrategyContext& context) {
        if (auto bounds = op.footprint()) {
            return bounds;
        }
        if (context.geometry) {
            return context.geometry(op.element_id);
        }
        return std::nullopt;
    }
};

// ============================================================================
// Escalation
// ============================================================================

class NeverAppliesStrategy : public IResolutionStrategy {
public:
    explicit NeverAppliesStrategy(ResolutionStrategy kind)
        : kind_(kind) {}

    ResolutionStrategy kind() const override { return kind_; }

    std::optional<Operation> apply(const Conflict&, const StrategyContext&) const override {
        return std::nullopt;
    }

private:
    ResolutionStrategy kind_;
};

} // anonymous namespace

// ============================================================================
// Factory Functions
// ============================================================================

std::unique_ptr<IResolutionStrategy> create_resolution_strategy(ResolutionStrategy kind) {
    switch (kind) {
        case ResolutionStrategy::LastWriterWins:
            return std::make_unique<WriterOrderStrategy>(true);
        case ResolutionStrategy::FirstWriterWins:
            return std::make_unique<WriterOrderStrategy>(false);
        case ResolutionStrategy::PriorityUser:
            return std::make_unique<PriorityUserStrategy>();
        case ResolutionStrategy::Merge:
            return std::make_unique<MergeStrategy>();
        case ResolutionStrategy::SpatialOffset:
            return std::make_unique<SpatialOffsetStrategy>();
        case ResolutionStrategy::Automatic:
        case ResolutionStrategy::Manual:
        default:
            return std::make_unique<NeverAppliesStrategy>(kind);
    }
}

} // namespace tessera::sync
