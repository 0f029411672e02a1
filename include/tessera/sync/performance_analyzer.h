#pragma once
/**
 * @file performance_analyzer.h
 * @brief Bottleneck detection over whiteboard performance metrics
 */

#include "tessera/interface/config.h"
#include "tessera/sync/transform_engine.h"
#include <string>
#include <vector>

namespace tessera::sync {

/**
 * @brief Kind of performance bottleneck
 */
enum class BottleneckType : UInt8 {
    Latency,
    QueueSize,
    Memory,
    ConflictRate,
    ResolutionRate
};

/**
 * @brief Convert BottleneckType to string
 */
inline const char* bottleneck_type_to_string(BottleneckType type) {
    switch (type) {
        case BottleneckType::Latency: return "latency";
        case BottleneckType::QueueSize: return "queue_size";
        case BottleneckType::Memory: return "memory";
        case BottleneckType::ConflictRate: return "conflict_rate";
        case BottleneckType::ResolutionRate: return "resolution_rate";
        default: return "unknown";
    }
}

/**
 * @brief Limits a whiteboard should stay within
 */
struct PerformanceThresholds {
    Real max_latency_ms{500.0};
    SizeT max_queue_size{1000};
    Real max_memory_mb{1024.0};
    Real max_conflict_rate{0.1};
    Real min_resolution_success_rate{0.8};

    static PerformanceThresholds from_settings(const config::PerformanceSettings& settings);
};

struct Bottleneck {
    BottleneckType type{BottleneckType::Latency};
    RiskLevel severity{RiskLevel::Medium};
    std::string description;
    std::string recommendation;
};

struct PerformanceReport {
    std::vector<Bottleneck> bottlenecks;
    Real latency_p95_ms{0.0};       ///< Process-wide transform latency
    Real latency_p99_ms{0.0};

    bool healthy() const { return bottlenecks.empty(); }
};

/**
 * @brief Flag metrics outside their thresholds, each with a recommendation
 */
PerformanceReport analyze_performance(const PerformanceMetrics& metrics,
                                      const PerformanceThresholds& thresholds);

} // namespace tessera::sync
