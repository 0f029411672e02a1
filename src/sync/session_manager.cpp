/**
 * @file session_manager.cpp
 * @brief Per-whiteboard actor orchestration
 */

#include "tessera/sync/session_manager.h"
#include "tessera/core/logging.h"
#include "tessera/telemetry/telemetry.h"
#include <algorithm>
#include <atomic>
#include <deque>

namespace tessera::sync {

namespace {

constexpr const char* PREDICTOR_LANE = "tessera.predictor";
constexpr SizeT MAX_RECENT_OPERATIONS = 256;

template <typename T>
std::future<T> ready_future(T value) {
    std::promise<T> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

config::EngineConfig validated(const config::EngineConfig& config) {
    config.validate();
    return config;
}

} // anonymous namespace

// ============================================================================
// Session
// ============================================================================

struct SessionManager::Session {
    TransformContext context;                   ///< Touched only on the whiteboard lane
    core::LruTtlCache<UserId, UserActivity> activity;
    std::atomic<bool> prediction_in_flight{false};

    std::mutex recent_mutex;
    std::deque<Operation> recent;               ///< Accepted operations for the predictor

    Timestamp last_cleanup;                     ///< Last expired-conflict sweep

    Session(TransformContext ctx, core::CacheConfig activity_config)
        : context(std::move(ctx))
        , activity(std::move(activity_config))
        , last_cleanup(std::chrono::system_clock::now()) {}
};

// ============================================================================
// SessionManager
// ============================================================================

SessionManager::SessionManager(const config::EngineConfig& config,
                               std::shared_ptr<IAuditLog> audit_log,
                               std::shared_ptr<INotificationSink> notifier)
    : config_(validated(config))
    , pool_(std::make_unique<core::ActorPool>(config_.runtime.actor_lanes))
    , engine_(create_transform_engine(config_))
    , resolution_(create_conflict_resolution_service(config_.resolution, std::move(audit_log),
                                                     std::move(notifier), pool_.get()))
    , predictor_(create_conflict_predictor(PredictorConfig::from_settings(config_.prediction, config_.detection)))
    , compressor_(create_operation_compressor(CompressorConfig::from_settings(config_.compression)))
{
    logging::set_level(config_.runtime.log_level);
    logging::get_logger("tessera.session")->info("Session manager started with {} actor lanes",
                                                 pool_->num_lanes());
}

SessionManager::~SessionManager()
{
    // Queued tasks reference the engine components; drain them first
    pool_->shutdown();
}

std::shared_ptr<SessionManager::Session> SessionManager::find_session(const WhiteboardId& whiteboard_id) const
{
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(whiteboard_id);
    return it != sessions_.end() ? it->second : nullptr;
}

std::shared_ptr<SessionManager::Session> SessionManager::get_or_create_session(const WhiteboardId& whiteboard_id)
{
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(whiteboard_id);
    if (it != sessions_.end()) {
        return it->second;
    }

    core::CacheConfig activity_config;
    activity_config.max_entries = config_.prediction.max_tracked_cursors;
    activity_config.ttl = Milliseconds(config_.prediction.activity_ttl_ms);

    auto session = std::make_shared<Session>(engine_->create_context(whiteboard_id), activity_config);
    sessions_[whiteboard_id] = session;
    logging::get_logger("tessera.session")->debug("Started session for whiteboard {}", whiteboard_id);
    return session;
}

OperationOutcome SessionManager::process(Session& session, const Operation& op)
{
    OperationOutcome outcome;
    outcome.transform = engine_->transform_operation(op, session.context);
    if (!outcome.transform.ok()) {
        return outcome;
    }

    settle(session, outcome.transform, outcome.resolutions);
    maintain(session);
    return outcome;
}

void SessionManager::settle(Session& session, const TransformResult& transform,
                            std::vector<ResolutionOutcome>& resolutions)
{
    {
        std::lock_guard<std::mutex> lock(session.recent_mutex);
        session.recent.push_back(*transform.transformed_operation);
        while (session.recent.size() > MAX_RECENT_OPERATIONS) {
            session.recent.pop_front();
        }
    }

    for (const auto& conflict : transform.conflicts) {
        resolutions.push_back(resolution_->resolve_conflict_automatically(conflict, session.context));
    }
}

void SessionManager::maintain(Session& session)
{
    // Client timestamps are advisory; latest_timestamp is capped at server time
    std::optional<std::unordered_set<OperationId>> unresolved;
    engine_->prune_pending(session.context, session.context.latest_timestamp,
                           [&](const Operation& candidate) {
        if (!unresolved) {
            unresolved = unresolved_operation_ids(session);
        }
        return unresolved->count(candidate.id) > 0;
    });

    const Timestamp now = std::chrono::system_clock::now();
    if (millis_between(session.last_cleanup, now) >= static_cast<Int64>(config_.resolution.conflict_timeout_ms)) {
        session.last_cleanup = now;
        resolution_->cleanup_expired_conflicts(now);
    }
}

std::unordered_set<OperationId> SessionManager::unresolved_operation_ids(const Session& session) const
{
    std::unordered_set<OperationId> ids;
    for (const auto& conflict : session.context.conflict_history) {
        const auto state = resolution_->get_conflict_state(conflict->id);
        if (!state || *state == ConflictState::ResolvedAutomatic || *state == ConflictState::ResolvedManual) {
            continue;
        }
        for (const auto& op : conflict->operations) {
            ids.insert(op.id);
        }
    }
    return ids;
}

std::future<OperationOutcome> SessionManager::submit_operation(const WhiteboardId& whiteboard_id, Operation op)
{
    auto session = get_or_create_session(whiteboard_id);
    return pool_->submit(whiteboard_id, [this, session, op = std::move(op)]() {
        return process(*session, op);
    });
}

std::future<TransactionOutcome> SessionManager::submit_transaction(const WhiteboardId& whiteboard_id,
                                                                   const UserId& user_id,
                                                                   std::vector<Operation> ops)
{
    auto session = get_or_create_session(whiteboard_id);
    return pool_->submit(whiteboard_id, [this, session, user_id, ops = std::move(ops)]() {
        TransformContext& context = session->context;
        const TransactionId transaction_id = engine_->begin_transaction(context, user_id);

        TransactionOutcome outcome;
        for (const auto& op : ops) {
            const EngineResult staged = engine_->add_to_transaction(context, transaction_id, op);
            if (staged != EngineResult::Success) {
                outcome.transaction.result = staged;
                outcome.transaction.error = "transaction " + transaction_id + " closed while staging";
                return outcome;
            }
        }

        outcome.transaction = engine_->commit_transaction(context, transaction_id);
        if (!outcome.transaction.ok()) {
            return outcome;
        }
        for (const auto& transform : outcome.transaction.results) {
            settle(*session, transform, outcome.resolutions);
        }
        maintain(*session);
        return outcome;
    });
}

std::future<Operation> SessionManager::stamp_operation(const WhiteboardId& whiteboard_id, Operation op)
{
    auto session = get_or_create_session(whiteboard_id);
    return pool_->submit(whiteboard_id, [this, session, op = std::move(op)]() {
        return engine_->stamp_operation(op, session->context);
    });
}

void SessionManager::submit_activity(const WhiteboardId& whiteboard_id, const UserActivity& activity)
{
    auto session = get_or_create_session(whiteboard_id);
    session->activity.set(activity.user_id, activity);
}

std::optional<std::vector<ConflictPrediction>> SessionManager::request_predictions(const WhiteboardId& whiteboard_id)
{
    if (!config_.prediction.enabled || pool_->is_shutdown()) {
        return std::nullopt;
    }
    auto session = find_session(whiteboard_id);
    if (!session) {
        return std::nullopt;
    }

    auto logger = logging::get_logger("tessera.predictor");
    if (session->prediction_in_flight.exchange(true)) {
        logger->debug("Prediction request for whiteboard {} dropped, one already in flight", whiteboard_id);
        return std::nullopt;
    }

    auto future = pool_->submit(PREDICTOR_LANE, [this, session]() {
        std::vector<Operation> recent;
        {
            std::lock_guard<std::mutex> lock(session->recent_mutex);
            recent.assign(session->recent.begin(), session->recent.end());
        }

        std::vector<UserActivity> activity;
        for (auto& entry : session->activity.entries()) {
            activity.push_back(std::move(entry.second));
        }

        PredictionContext context;
        context.whiteboard_id = session->context.whiteboard_id;
        context.element_bounds = session->context.element_bounds.get();
        return predictor_->predict_conflicts(recent, activity, context);
    });

    std::optional<std::vector<ConflictPrediction>> predictions;
    try {
        predictions = future.get();
    } catch (const std::exception& e) {
        telemetry::record_error("prediction");
        logger->warn("Prediction for whiteboard {} failed: {}", whiteboard_id, e.what());
    }
    session->prediction_in_flight.store(false);
    return predictions;
}

std::future<std::vector<Operation>> SessionManager::get_compressed_pending(const WhiteboardId& whiteboard_id)
{
    auto session = find_session(whiteboard_id);
    if (!session) {
        return ready_future(std::vector<Operation>{});
    }

    return pool_->submit(whiteboard_id, [this, session]() {
        const auto protected_ids = unresolved_operation_ids(*session);
        const auto pending = compressor_->deduplicate_operations(session->context.pending.to_vector());
        return compressor_->compress_operations(pending, protected_ids);
    });
}

std::future<std::vector<Operation>> SessionManager::get_pending_operations(const WhiteboardId& whiteboard_id)
{
    auto session = find_session(whiteboard_id);
    if (!session) {
        return ready_future(std::vector<Operation>{});
    }
    return pool_->submit(whiteboard_id, [this, session]() {
        return engine_->get_pending_operations(session->context);
    });
}

std::future<std::optional<ElementState>> SessionManager::get_element_state(const WhiteboardId& whiteboard_id,
                                                                          const ElementId& element_id)
{
    auto session = find_session(whiteboard_id);
    if (!session) {
        return ready_future(std::optional<ElementState>{});
    }
    return pool_->submit(whiteboard_id, [session, element_id]() -> std::optional<ElementState> {
        const auto& states = session->context.element_states;
        auto it = states.find(element_id);
        if (it == states.end()) {
            return std::nullopt;
        }
        return it->second;
    });
}

std::optional<PerformanceMetrics> SessionManager::get_performance_metrics(const WhiteboardId& whiteboard_id)
{
    auto session = find_session(whiteboard_id);
    if (!session || pool_->is_shutdown()) {
        return std::nullopt;
    }
    return pool_->submit(whiteboard_id, [session]() {
        PerformanceMetrics metrics = session->context.metrics;
        metrics.queue_size = session->context.pending.size();
        return metrics;
    }).get();
}

std::optional<PerformanceReport> SessionManager::analyze_performance(const WhiteboardId& whiteboard_id)
{
    const auto metrics = get_performance_metrics(whiteboard_id);
    if (!metrics) {
        return std::nullopt;
    }
    return sync::analyze_performance(*metrics, PerformanceThresholds::from_settings(config_.performance));
}

bool SessionManager::end_session(const WhiteboardId& whiteboard_id)
{
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(whiteboard_id);
        if (it == sessions_.end()) {
            return false;
        }
        session = it->second;
        sessions_.erase(it);
    }

    if (pool_->is_shutdown()) {
        return true;
    }

    // Runs after every operation already queued for the whiteboard
    pool_->submit(whiteboard_id, [this, session, whiteboard_id]() {
        engine_->end_session(session->context);
        resolution_->release_whiteboard(whiteboard_id);
        session->activity.clear();
        std::lock_guard<std::mutex> lock(session->recent_mutex);
        session->recent.clear();
    }).get();

    logging::get_logger("tessera.session")->info("Ended session for whiteboard {}", whiteboard_id);
    return true;
}

std::vector<WhiteboardId> SessionManager::active_sessions() const
{
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    std::vector<WhiteboardId> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

void SessionManager::wait_idle()
{
    pool_->wait_all();
}

} // namespace tessera::sync
