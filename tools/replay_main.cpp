/**
 * @file replay_main.cpp
 * @brief Tessera session replay
 *
 * Replays a scripted multi-user whiteboard session through the conflict
 * engine and prints the detected conflicts, their resolutions and the
 * compressed broadcast queue.
 */

#include "tessera/tessera.h"
#include <iostream>
#include <string>

using namespace tessera;
using namespace tessera::sync;

namespace {

Operation make_op(const std::string& id, OperationType type, const std::string& element,
                  const std::string& user, VectorClock clock, Timestamp at) {
    Operation op;
    op.id = id;
    op.type = type;
    op.element_id = element;
    op.user_id = user;
    op.vector_clock = std::move(clock);
    op.timestamp = at;
    return op;
}

void print_outcome(const Operation& op, const OperationOutcome& outcome) {
    std::cout << "[" << op.id << "] " << operation_type_to_string(op.type)
              << " by " << op.user_id << " -> " << engine_result_to_string(outcome.transform.result);
    if (!outcome.transform.ok()) {
        std::cout << " (" << outcome.transform.error << ")\n";
        return;
    }
    std::cout << ", queue position " << outcome.transform.queue_position << "\n";

    for (SizeT i = 0; i < outcome.transform.conflicts.size(); ++i) {
        const auto& conflict = outcome.transform.conflicts[i];
        const auto& resolution = outcome.resolutions[i];
        std::cout << "    conflict " << conflict->id
                  << " type=" << conflict_type_to_string(conflict->type)
                  << " severity=" << conflict_severity_to_string(conflict->severity) << "\n";
        if (resolution.success) {
            std::cout << "      resolved via " << resolution_strategy_to_string(*resolution.strategy_used)
                      << " (confidence " << resolution.confidence << ")\n";
        } else {
            std::cout << "      " << engine_result_to_string(resolution.error)
                      << (resolution.requires_manual_intervention ? ", routed to manual review" : "")
                      << "\n";
        }
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string log_level;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        } else if (arg == "--help") {
            std::cout << "Tessera session replay\n\n"
                      << "Usage: " << argv[0] << " [options]\n\n"
                      << "Options:\n"
                      << "  --config <file>      Engine configuration XML\n"
                      << "  --log-level <level>  trace, debug, info, warn, error (default: info)\n"
                      << "  --help               Show this help\n";
            return 0;
        }
    }

    config::EngineConfig config;
    try {
        config = config_path.empty() ? config::EngineConfig::defaults()
                                     : config::EngineConfig::load(config_path);
        if (!log_level.empty()) {
            config.runtime.log_level = log_level;
        }
        config.validate();
    } catch (const config::ConfigurationError& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    std::cout << "========================================\n";
    std::cout << "   Tessera Session Replay\n";
    std::cout << "========================================\n";
    std::cout << "Version: " << GetVersionString() << "\n\n";

    SessionManager manager(config);
    const WhiteboardId board = "board-demo";
    const Timestamp t0 = std::chrono::system_clock::now();
    auto at = [t0](Int64 ms) { return t0 + Milliseconds(ms); };

    std::vector<Operation> script;

    // alice draws a rectangle and bob a note beside it
    auto rect = make_op("op-1", OperationType::Create, "rect", "alice", {{"alice", 1}}, at(0));
    rect.element_type = "rectangle";
    rect.payload["bounds"] = Bounds(0.0, 0.0, 100.0, 100.0);
    rect.payload["style.fill"] = std::string("blue");
    script.push_back(rect);

    auto note = make_op("op-2", OperationType::Create, "note", "bob", {{"alice", 1}, {"bob", 1}}, at(20));
    note.element_type = "sticky_note";
    note.payload["bounds"] = Bounds(300.0, 0.0, 80.0, 80.0);
    script.push_back(note);

    // Concurrent recolors of the same rectangle
    auto red = make_op("op-3", OperationType::Style, "rect", "alice", {{"alice", 2}, {"bob", 1}}, at(1000));
    red.payload["style.fill"] = std::string("red");
    script.push_back(red);

    auto green = make_op("op-4", OperationType::Style, "rect", "bob", {{"alice", 1}, {"bob", 2}}, at(1050));
    green.payload["style.fill"] = std::string("green");
    script.push_back(green);

    // bob drags the note onto the rectangle while alice resizes it
    auto drag = make_op("op-5", OperationType::Move, "note", "bob", {{"alice", 2}, {"bob", 3}}, at(2000));
    drag.payload["bounds"] = Bounds(20.0, 20.0, 80.0, 80.0);
    script.push_back(drag);

    auto resize = make_op("op-6", OperationType::Move, "rect", "alice", {{"alice", 3}, {"bob", 2}}, at(2010));
    resize.payload["bounds"] = Bounds(0.0, 0.0, 110.0, 110.0);
    script.push_back(resize);

    // carol deletes the note while bob restyles it
    auto restyle = make_op("op-7", OperationType::Style, "note", "bob", {{"alice", 3}, {"bob", 4}}, at(3000));
    restyle.payload["style.fill"] = std::string("yellow");
    script.push_back(restyle);

    auto erase = make_op("op-8", OperationType::Delete, "note", "carol",
                         {{"alice", 3}, {"bob", 3}, {"carol", 1}}, at(3020));
    script.push_back(erase);

    // alice nudges the rectangle in a burst
    for (int i = 0; i < 5; ++i) {
        auto nudge = make_op("op-nudge-" + std::to_string(i), OperationType::Move, "rect", "alice",
                             {{"alice", static_cast<UInt64>(4 + i)}, {"bob", 4}, {"carol", 1}},
                             at(4000 + i * 16));
        nudge.payload["position"] = Point(static_cast<Real>(i * 5), 0.0);
        script.push_back(nudge);
    }

    for (const auto& op : script) {
        manager.submit_activity(board, UserActivity{op.user_id, Point(0.0, 0.0), op.element_id, op.timestamp});
        print_outcome(op, manager.submit_operation(board, op).get());
    }

    std::cout << "\nPending manual interventions:\n";
    for (const auto& intervention : manager.resolution_service().get_pending_manual_interventions()) {
        std::cout << "    " << intervention.conflict->id << " (recommended "
                  << resolution_strategy_to_string(intervention.recommendation.strategy) << ")\n";
    }

    const auto pending = manager.get_pending_operations(board).get();
    const auto compressed = manager.get_compressed_pending(board).get();
    std::cout << "\nBroadcast queue: " << pending.size() << " pending, "
              << compressed.size() << " after compression\n";

    if (auto predictions = manager.request_predictions(board)) {
        std::cout << "Predicted conflicts: " << predictions->size() << "\n";
    }

    if (auto report = manager.analyze_performance(board)) {
        std::cout << "Health: " << (report->healthy() ? "ok" : "degraded")
                  << ", p95 latency " << report->latency_p95_ms << " ms\n";
    }

    manager.wait_idle();
    const auto analytics = manager.resolution_service().get_conflict_analytics(board);
    std::cout << "Audited conflicts: " << analytics.total_conflicts
              << ", success rate " << analytics.resolution_success_rate << "\n";

    manager.end_session(board);
    return 0;
}
