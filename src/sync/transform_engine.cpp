/**
 * @file transform_engine.cpp
 * @brief Operation transform engine implementation
 */

#include "tessera/sync/transform_engine.h"
#include "tessera/core/logging.h"
#include "tessera/telemetry/telemetry.h"
#include <algorithm>
#include <cstdlib>
#include <unordered_set>

namespace tessera::sync {

// ============================================================================
// TransformContext
// ============================================================================

void TransformContext::record_conflict(ConflictPtr conflict) {
    conflict_history.push_back(std::move(conflict));
    while (conflict_history.size() > max_conflict_history) {
        conflict_history.pop_front();
    }
    metrics.conflicts_detected++;
    if (metrics.operation_count > 0) {
        metrics.conflict_rate = static_cast<Real>(metrics.conflicts_detected) /
                                static_cast<Real>(metrics.operation_count);
    }
}

void TransformContext::record_resolution(bool success) {
    metrics.resolutions_attempted++;
    if (success) {
        metrics.resolutions_succeeded++;
    }
    metrics.resolution_success_rate = static_cast<Real>(metrics.resolutions_succeeded) /
                                      static_cast<Real>(metrics.resolutions_attempted);
}

std::optional<Bounds> TransformContext::cached_bounds(const ElementId& element_id) const {
    if (!element_bounds) {
        return std::nullopt;
    }
    return element_bounds->get(element_id);
}

const ElementState& TransformContext::apply_at(const Operation& op, SizeT position) {
    if (position + 1 == pending.size()) {
        ElementState& state = element_states[op.element_id];
        apply_operation(state, op);
        return state;
    }
    return rebuild_element(op.element_id);
}

const ElementState& TransformContext::rebuild_element(const ElementId& element_id) {
    ElementState state;
    auto base = base_states.find(element_id);
    if (base != base_states.end()) {
        state = base->second;
    }
    pending.for_each([&](SizeT, const Operation& op) {
        if (op.element_id == element_id) {
            apply_operation(state, op);
        }
    });

    ElementState& current = element_states[element_id];
    current = std::move(state);
    return current;
}

EngineResult TransformContext::commit_operation(const Operation& op) {
    if (pending.contains(op.id)) {
        return EngineResult::Duplicate;
    }
    const SizeT position = pending.insert(op);
    apply_at(op, position);
    canvas_version++;
    return EngineResult::Success;
}

void TransformContext::retire(const Operation& op) {
    apply_operation(base_states[op.element_id], op);
}

// ============================================================================
// Simple Transform Engine
// ============================================================================

class SimpleTransformEngine : public ITransformEngine {
public:
    SimpleTransformEngine(const config::EngineConfig& config, std::unique_ptr<IVectorClockTracker> tracker)
        : transform_(config.transform)
        , performance_(config.performance)
        , priorities_(config.resolution.user_priority_weights)
        , tracker_(tracker ? std::move(tracker) : create_vector_clock_tracker())
        , detector_(create_conflict_detector(DetectorConfig::from_settings(config.detection)))
        , logger_(logging::get_logger("tessera.transform")) {
        limits_.max_payload_fields = transform_.max_payload_fields;
        limits_.coordinate_limit = transform_.coordinate_limit;
    }

    TransformContext create_context(const WhiteboardId& whiteboard_id) const override {
        TransformContext context;
        context.whiteboard_id = whiteboard_id;
        context.max_conflict_history = transform_.max_conflict_history;
        context.user_priorities = priorities_;
        context.throttle.target_latency_ms = static_cast<Real>(performance_.target_latency_ms);

        core::CacheConfig cache_config;
        cache_config.max_entries = transform_.element_cache_size;
        cache_config.ttl = Milliseconds(0);
        context.element_bounds = std::make_shared<core::LruTtlCache<ElementId, Bounds>>(cache_config);
        context.created_at = std::chrono::system_clock::now();
        return context;
    }

    TransformResult transform_operation(const Operation& incoming, TransformContext& context) override {
        auto& metrics = telemetry::metrics::engine();
        telemetry::Timer timer(metrics.transform_latency_ms);
        TransformResult result;

        const Operation op = prepare(incoming);

        if (auto error = validate_operation(op, limits_)) {
            logger_->debug("Rejected operation {} on whiteboard {}: {}",
                           op.id, context.whiteboard_id, *error);
            metrics.operations_rejected.increment();
            context.metrics.rejected_count++;
            result.result = EngineResult::ValidationError;
            result.error = *error;
            result.performance = context.metrics;
            return result;
        }

        if (context.pending.contains(op.id)) {
            logger_->debug("Duplicate operation {} on whiteboard {}", op.id, context.whiteboard_id);
            result.result = EngineResult::Duplicate;
            result.error = "operation " + op.id + " is already pending";
            result.performance = context.metrics;
            return result;
        }

        // Causality
        context.vector_clock = tracker_->observe(context.whiteboard_id, op.vector_clock);
        context.lamport_clock = std::max(context.lamport_clock, op.lamport_timestamp);
        context.latest_timestamp = std::max(context.latest_timestamp,
                                            std::min(op.timestamp, std::chrono::system_clock::now()));

        evict_for_capacity(context);
        result.queue_position = context.pending.insert(op);

        const GeometryLookup geometry = [&context](const ElementId& element_id) {
            return context.cached_bounds(element_id);
        };
        result.conflicts = detector_->detect(context.whiteboard_id, op,
                                             recency_window(op, result.queue_position, context),
                                             context.recorded_pairs, geometry);

        update_bounds_cache(op, context);

        const ElementState& state = context.apply_at(op, result.queue_position);
        context.canvas_version++;

        Operation transformed = op;
        transformed.has_conflict = !result.conflicts.empty();
        if (transformed.version == 0) {
            transformed.version = state.version;
        }

        context.metrics.operation_count++;
        for (const auto& conflict : result.conflicts) {
            context.record_conflict(conflict);
            telemetry::record_conflict_detected(conflict_type_to_string(conflict->type));
            logger_->info("Conflict {} on whiteboard {}: {} severity, elements [{}]",
                          conflict->id, context.whiteboard_id,
                          conflict_severity_to_string(conflict->severity),
                          join(conflict->affected_elements));
        }

        result.latency_ms = timer.stop();
        update_metrics(context, result.latency_ms);
        adjust_throttle(context);

        metrics.operations_processed.increment();
        metrics.pending_queue_depth.set(static_cast<double>(context.pending.size()));

        result.transformed_operation = std::move(transformed);
        result.performance = context.metrics;
        return result;
    }

    Operation stamp_operation(Operation op, TransformContext& context) override {
        context.vector_clock = tracker_->increment(context.whiteboard_id, op.user_id);
        context.lamport_clock++;
        op.vector_clock = context.vector_clock;
        op.lamport_timestamp = context.lamport_clock;
        if (op.timestamp == Timestamp{}) {
            op.timestamp = std::chrono::system_clock::now();
        }
        return op;
    }

    std::vector<Operation> get_pending_operations(const TransformContext& context) const override {
        return context.pending.to_vector();
    }

    SizeT prune_pending(TransformContext& context, Timestamp now, const RetainPredicate& retain) override {
        const Int64 retention = transform_.pending_retention_ms;
        std::vector<Operation> evicted;
        context.pending.prune_front([&](const Operation& op) {
            if (millis_between(op.timestamp, now) <= retention || (retain && retain(op))) {
                return false;
            }
            evicted.push_back(op);
            return true;
        });
        retire_all(context, evicted);
        context.metrics.queue_size = context.pending.size();

        if (!evicted.empty()) {
            logger_->debug("Pruned {} pending operations on whiteboard {}",
                           evicted.size(), context.whiteboard_id);
        }
        return evicted.size();
    }

    TransactionId begin_transaction(TransformContext& context, const UserId& user_id) override {
        Transaction transaction;
        transaction.id = "tx_" + user_id + "_" + std::to_string(++context.next_transaction);
        transaction.user_id = user_id;
        transaction.created_at = std::chrono::system_clock::now();

        const TransactionId id = transaction.id;
        context.transactions[id] = std::move(transaction);
        logger_->debug("Transaction {} started on whiteboard {} for {}", id, context.whiteboard_id, user_id);
        return id;
    }

    EngineResult add_to_transaction(TransformContext& context, const TransactionId& transaction_id,
                                    const Operation& op) override {
        auto it = context.transactions.find(transaction_id);
        if (it == context.transactions.end()) {
            return EngineResult::NotFound;
        }
        it->second.operations.push_back(op);
        return EngineResult::Success;
    }

    TransactionResult commit_transaction(TransformContext& context, const TransactionId& transaction_id) override {
        TransactionResult result;
        auto it = context.transactions.find(transaction_id);
        if (it == context.transactions.end()) {
            result.result = EngineResult::NotFound;
            result.error = "transaction " + transaction_id + " not found";
            return result;
        }
        const Transaction transaction = std::move(it->second);
        context.transactions.erase(it);

        // Check everything before the context changes
        std::unordered_set<OperationId> staged;
        for (const auto& incoming : transaction.operations) {
            const Operation op = prepare(incoming);
            if (auto error = validate_operation(op, limits_)) {
                result.result = EngineResult::ValidationError;
                result.error = "operation " + op.id + ": " + *error;
            } else if (context.pending.contains(op.id)) {
                result.result = EngineResult::Duplicate;
                result.error = "operation " + op.id + " is already pending";
            } else if (!staged.insert(op.id).second) {
                result.result = EngineResult::Duplicate;
                result.error = "operation " + op.id + " is staged twice";
            }
            if (!result.ok()) {
                telemetry::metrics::engine().operations_rejected.increment();
                context.metrics.rejected_count++;
                logger_->warn("Transaction {} on whiteboard {} rolled back: {}",
                              transaction_id, context.whiteboard_id, result.error);
                return result;
            }
        }

        for (const auto& op : transaction.operations) {
            result.results.push_back(transform_operation(op, context));
        }
        logger_->info("Transaction {} committed {} operations on whiteboard {}",
                      transaction_id, result.results.size(), context.whiteboard_id);
        return result;
    }

    EngineResult rollback_transaction(TransformContext& context, const TransactionId& transaction_id) override {
        auto it = context.transactions.find(transaction_id);
        if (it == context.transactions.end()) {
            logger_->warn("Rollback of unknown transaction {} on whiteboard {}",
                          transaction_id, context.whiteboard_id);
            return EngineResult::NotFound;
        }
        logger_->info("Transaction {} rolled back, {} operations discarded",
                      transaction_id, it->second.operations.size());
        context.transactions.erase(it);
        return EngineResult::Success;
    }

    void end_session(TransformContext& context) override {
        tracker_->reset(context.whiteboard_id);
        context.pending.clear();
        context.recorded_pairs.clear();
        context.element_states.clear();
        context.base_states.clear();
        context.transactions.clear();
        if (context.element_bounds) {
            context.element_bounds->clear();
        }
    }

    IVectorClockTracker& tracker() override { return *tracker_; }
    const IConflictDetector& detector() const override { return *detector_; }

private:
    static std::string join(const std::vector<ElementId>& ids) {
        std::string joined;
        for (const auto& id : ids) {
            if (!joined.empty()) joined += ",";
            joined += id;
        }
        return joined;
    }

    static Operation prepare(const Operation& incoming) {
        Operation op = incoming;
        if (op.type == OperationType::Create && op.element_id.empty()) {
            op.element_id = op.id;
        }
        return op;
    }

    /**
     * @brief Pending operations within the recency window of op
     *
     * Walks back from the tail and stops at the first operation ahead of
     * op in queue order whose timestamp is older than the window.
     */
    std::vector<Operation> recency_window(const Operation& op, SizeT position,
                                          const TransformContext& context) const {
        std::vector<Operation> window;
        const Int64 recency = transform_.recency_window_ms;
        context.pending.for_each_reverse([&](SizeT index, const Operation& other) {
            if (index == position) {
                return true;
            }
            const Int64 age = millis_between(other.timestamp, op.timestamp);
            if (std::abs(age) <= recency) {
                window.push_back(other);
                return true;
            }
            return index > position || age < 0;
        });
        std::reverse(window.begin(), window.end());
        return window;
    }

    void evict_for_capacity(TransformContext& context) {
        const SizeT capacity = std::max<SizeT>(performance_.max_queue_size, 1);
        std::vector<Operation> evicted;
        while (context.pending.size() >= capacity) {
            evicted.push_back(context.pending.erase_at(0));
        }
        if (!evicted.empty()) {
            logger_->debug("Queue full on whiteboard {}, evicted {} oldest operations",
                           context.whiteboard_id, evicted.size());
        }
        retire_all(context, evicted);
    }

    /**
     * @brief Fold evicted operations into the base and drop their recorded pairs
     */
    static void retire_all(TransformContext& context, const std::vector<Operation>& evicted) {
        if (evicted.empty()) {
            return;
        }
        std::unordered_set<OperationId> ids;
        for (const auto& op : evicted) {
            context.retire(op);
            ids.insert(op.id);
        }
        for (auto it = context.recorded_pairs.begin(); it != context.recorded_pairs.end();) {
            const bool stale = ids.count(it->first) > 0 || ids.count(it->second) > 0;
            it = stale ? context.recorded_pairs.erase(it) : std::next(it);
        }
    }

    static void update_bounds_cache(const Operation& op, TransformContext& context) {
        if (!context.element_bounds) {
            return;
        }
        if (op.type == OperationType::Delete) {
            context.element_bounds->invalidate(op.element_id);
            return;
        }
        if (auto bounds = op.bounds()) {
            context.element_bounds->set(op.element_id, *bounds);
        } else if (auto position = op.position()) {
            // Keep the known size, move the origin
            Bounds moved = context.cached_bounds(op.element_id).value_or(Bounds{});
            moved.x = position->x;
            moved.y = position->y;
            context.element_bounds->set(op.element_id, moved);
        }
    }

    static void update_metrics(TransformContext& context, Real latency_ms) {
        auto& m = context.metrics;
        const Real n = static_cast<Real>(m.operation_count);
        m.average_latency_ms += (latency_ms - m.average_latency_ms) / n;
        m.max_latency_ms = std::max(m.max_latency_ms, latency_ms);
        m.conflict_rate = static_cast<Real>(m.conflicts_detected) / n;
        m.queue_size = context.pending.size();

        const Real bytes = static_cast<Real>(context.pending.size() * sizeof(Operation) +
                                             context.element_states.size() * sizeof(ElementState) +
                                             context.conflict_history.size() * sizeof(Conflict));
        m.estimated_memory_mb = bytes / (1024.0 * 1024.0);

        const Real elapsed_s = std::max(
            1e-3, static_cast<Real>(millis_between(context.created_at, std::chrono::system_clock::now())) / 1000.0);
        m.operation_throughput = n / elapsed_s;
    }

    static void adjust_throttle(TransformContext& context) {
        auto& t = context.throttle;
        if (context.metrics.average_latency_ms > t.target_latency_ms) {
            t.current_rate = std::max(t.min_rate, t.current_rate * 0.9);
        } else {
            t.current_rate = std::min(t.max_rate, t.current_rate * 1.1);
        }
    }

    config::TransformSettings transform_;
    config::PerformanceSettings performance_;
    std::map<UserId, Real> priorities_;
    ValidationLimits limits_;
    std::unique_ptr<IVectorClockTracker> tracker_;
    std::unique_ptr<IConflictDetector> detector_;
    std::shared_ptr<spdlog::logger> logger_;
};

// ============================================================================
// Factory Functions
// ============================================================================

std::unique_ptr<ITransformEngine> create_transform_engine(
    const config::EngineConfig& config,
    std::unique_ptr<IVectorClockTracker> tracker) {
    return std::make_unique<SimpleTransformEngine>(config, std::move(tracker));
}

} // namespace tessera::sync
