/**
 * @file conflict_predictor.cpp
 * @brief Conflict predictor implementation
 */

#include "tessera/sync/conflict_predictor.h"
#include "tessera/core/logging.h"
#include "tessera/telemetry/telemetry.h"
#include <algorithm>
#include <deque>
#include <map>
#include <mutex>
#include <set>

namespace tessera::sync {

PredictorConfig PredictorConfig::from_settings(const config::PredictionSettings& prediction,
                                               const config::DetectionSettings& detection) {
    PredictorConfig config;
    config.enabled = prediction.enabled;
    config.cursor_proximity_threshold = prediction.cursor_proximity_threshold;
    config.activity_ttl_ms = prediction.activity_ttl_ms;
    config.temporal_window_ms = detection.temporal_window_ms;
    return config;
}

namespace {

std::map<ElementId, std::vector<const Operation*>> group_by_element(const std::vector<Operation>& ops) {
    std::map<ElementId, std::vector<const Operation*>> groups;
    for (const auto& op : ops) {
        if (!op.element_id.empty()) {
            groups[op.element_id].push_back(&op);
        }
    }
    return groups;
}

} // anonymous namespace

// ============================================================================
// Simple Conflict Predictor
// ============================================================================

class SimpleConflictPredictor : public IConflictPredictor {
public:
    explicit SimpleConflictPredictor(const PredictorConfig& config)
        : config_(config) {}

    std::vector<ConflictPrediction> predict_conflicts(
        const std::vector<Operation>& recent_operations,
        const std::vector<UserActivity>& live_user_activity,
        const PredictionContext& context) const override {
        std::vector<ConflictPrediction> predictions;
        if (!config_.enabled) {
            return predictions;
        }

        predict_spatial(live_user_activity, context, predictions);
        predict_temporal(recent_operations, predictions);
        predict_semantic(recent_operations, predictions);

        std::sort(predictions.begin(), predictions.end(),
                  [](const ConflictPrediction& a, const ConflictPrediction& b) {
                      if (a.probability != b.probability) {
                          return a.probability > b.probability;
                      }
                      return a.id < b.id;
                  });

        if (!predictions.empty()) {
            telemetry::metrics::engine().predictions_issued.increment(
                static_cast<int64_t>(predictions.size()));
            logging::get_logger("tessera.predictor")->debug(
                "Whiteboard {}: {} conflict predictions, top probability {:.2f}",
                context.whiteboard_id, predictions.size(), predictions.front().probability);
        }
        return predictions;
    }

    void record_prediction_outcome(const std::string& prediction_id, bool conflict_occurred) override {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back(Outcome{prediction_id, conflict_occurred});
        while (history_.size() > config_.max_history) {
            history_.pop_front();
        }
    }

    PredictionAccuracy get_prediction_accuracy() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        PredictionAccuracy accuracy;
        accuracy.total_predictions = history_.size();
        for (const auto& outcome : history_) {
            if (outcome.conflict_occurred) {
                accuracy.correct_predictions++;
            } else {
                accuracy.false_positives++;
            }
        }
        if (accuracy.total_predictions > 0) {
            accuracy.accuracy = static_cast<Real>(accuracy.correct_predictions) /
                                static_cast<Real>(accuracy.total_predictions);
        }
        return accuracy;
    }

    const PredictorConfig& config() const override { return config_; }

private:
    struct Outcome {
        std::string prediction_id;
        bool conflict_occurred{false};
    };

    void predict_spatial(const std::vector<UserActivity>& activity,
                         const PredictionContext& context,
                         std::vector<ConflictPrediction>& predictions) const {
        if (activity.empty()) {
            return;
        }

        Timestamp newest = activity.front().timestamp;
        for (const auto& sample : activity) {
            newest = std::max(newest, sample.timestamp);
        }

        // Latest fresh sample per user, ordered by user id
        std::map<UserId, UserActivity> latest;
        for (const auto& sample : activity) {
            if (millis_between(sample.timestamp, newest) > config_.activity_ttl_ms) {
                continue;
            }
            auto it = latest.find(sample.user_id);
            if (it == latest.end() || it->second.timestamp < sample.timestamp) {
                latest[sample.user_id] = sample;
            }
        }

        std::vector<std::pair<ElementId, Bounds>> bounds;
        if (context.element_bounds) {
            bounds = context.element_bounds->entries();
        }

        const Real threshold = config_.cursor_proximity_threshold;
        for (auto a = latest.begin(); a != latest.end(); ++a) {
            for (auto b = std::next(a); b != latest.end(); ++b) {
                const Real distance = a->second.cursor.distance_to(b->second.cursor);
                if (distance >= threshold) {
                    continue;
                }

                ConflictPrediction prediction;
                prediction.id = "spatial_" + a->first + "_" + b->first;
                prediction.type = ConflictType::Spatial;
                prediction.probability = std::max(0.0, 1.0 - distance / threshold);
                if (distance < threshold * 0.3) {
                    prediction.estimated_severity = ConflictSeverity::High;
                } else if (distance < threshold * 0.6) {
                    prediction.estimated_severity = ConflictSeverity::Medium;
                } else {
                    prediction.estimated_severity = ConflictSeverity::Low;
                }
                prediction.affected_users = {a->first, b->first};

                std::set<ElementId> elements;
                for (const auto& [element_id, element_bounds] : bounds) {
                    if (element_bounds.contains(a->second.cursor) || element_bounds.contains(b->second.cursor)) {
                        elements.insert(element_id);
                    }
                }
                prediction.affected_elements.assign(elements.begin(), elements.end());

                prediction.prevention = prediction.affected_elements.empty()
                    ? PreventionStrategy::CoordinateUsers : PreventionStrategy::LockRegion;
                prediction.description = "Users " + a->first + " and " + b->first +
                    " are working within " + std::to_string(static_cast<Int64>(distance)) +
                    " px of each other; suggest separate areas";
                predictions.push_back(std::move(prediction));
            }
        }
    }

    void predict_temporal(const std::vector<Operation>& ops,
                          std::vector<ConflictPrediction>& predictions) const {
        for (auto& [element_id, group] : group_by_element(ops)) {
            std::sort(group.begin(), group.end(), [](const Operation* a, const Operation* b) {
                if (a->timestamp != b->timestamp) {
                    return a->timestamp < b->timestamp;
                }
                return a->id < b->id;
            });

            for (SizeT i = 1; i < group.size(); ++i) {
                const Operation& prev = *group[i - 1];
                const Operation& curr = *group[i];
                const Int64 dt = millis_between(prev.timestamp, curr.timestamp);
                if (prev.user_id == curr.user_id || dt >= config_.temporal_window_ms) {
                    continue;
                }

                ConflictPrediction prediction;
                prediction.id = "temporal_" + element_id + "_" + prev.id + "_" + curr.id;
                prediction.type = ConflictType::Temporal;
                prediction.probability = std::max(
                    0.0, 1.0 - static_cast<Real>(dt) / static_cast<Real>(config_.temporal_window_ms));
                if (dt < 200) {
                    prediction.estimated_severity = ConflictSeverity::High;
                } else if (dt < 500) {
                    prediction.estimated_severity = ConflictSeverity::Medium;
                } else {
                    prediction.estimated_severity = ConflictSeverity::Low;
                }
                prediction.affected_users = {std::min(prev.user_id, curr.user_id),
                                             std::max(prev.user_id, curr.user_id)};
                prediction.affected_elements = {element_id};
                prediction.prevention = PreventionStrategy::StaggerEdits;
                prediction.description = "Rapid edits on " + element_id + " from different users " +
                                         std::to_string(dt) + " ms apart";
                predictions.push_back(std::move(prediction));
            }
        }
    }

    void predict_semantic(const std::vector<Operation>& ops,
                          std::vector<ConflictPrediction>& predictions) const {
        for (const auto& [element_id, group] : group_by_element(ops)) {
            bool has_delete = false;
            bool has_other = false;
            std::set<UserId> users;
            std::set<UserId> style_users;
            for (const Operation* op : group) {
                users.insert(op->user_id);
                if (op->type == OperationType::Delete) {
                    has_delete = true;
                } else {
                    has_other = true;
                }
                if (op->type == OperationType::Style || op->touches_style()) {
                    style_users.insert(op->user_id);
                }
            }

            const bool delete_risk = has_delete && has_other && users.size() > 1;
            const bool style_risk = style_users.size() > 1;
            const int risks = (delete_risk ? 1 : 0) + (style_risk ? 1 : 0);
            if (risks == 0) {
                continue;
            }

            ConflictPrediction prediction;
            prediction.id = "semantic_" + element_id;
            prediction.type = ConflictType::Semantic;
            prediction.probability = std::min(1.0, risks * 0.3);
            prediction.estimated_severity = delete_risk ? ConflictSeverity::High : ConflictSeverity::Medium;
            prediction.affected_users.assign(users.begin(), users.end());
            prediction.affected_elements = {element_id};
            prediction.prevention = delete_risk ? PreventionStrategy::LockElement
                                                : PreventionStrategy::CoordinateUsers;
            prediction.description = delete_risk
                ? "Element " + element_id + " is being deleted while others edit it"
                : "Several users are restyling element " + element_id;
            predictions.push_back(std::move(prediction));
        }
    }

    PredictorConfig config_;
    mutable std::mutex mutex_;
    std::deque<Outcome> history_;
};

// ============================================================================
// Factory Functions
// ============================================================================

std::unique_ptr<IConflictPredictor> create_conflict_predictor(const PredictorConfig& config) {
    return std::make_unique<SimpleConflictPredictor>(config);
}

} // namespace tessera::sync
