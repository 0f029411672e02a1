/**
 * @file performance_analyzer.cpp
 * @brief Performance bottleneck detection
 */

#include "tessera/sync/performance_analyzer.h"
#include "tessera/telemetry/telemetry.h"
#include <cstdio>

namespace tessera::sync {

PerformanceThresholds PerformanceThresholds::from_settings(const config::PerformanceSettings& settings) {
    PerformanceThresholds thresholds;
    thresholds.max_latency_ms = settings.max_latency_ms;
    thresholds.max_queue_size = settings.max_queue_size;
    thresholds.max_memory_mb = settings.max_memory_mb;
    return thresholds;
}

namespace {

std::string format_value(const char* format, Real value) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), format, value);
    return buffer;
}

} // anonymous namespace

PerformanceReport analyze_performance(const PerformanceMetrics& metrics,
                                      const PerformanceThresholds& thresholds) {
    PerformanceReport report;

    const auto& latency = telemetry::metrics::engine().transform_latency_ms;
    report.latency_p95_ms = latency.percentile(0.95);
    report.latency_p99_ms = latency.percentile(0.99);

    if (metrics.average_latency_ms > thresholds.max_latency_ms) {
        report.bottlenecks.push_back(Bottleneck{
            BottleneckType::Latency,
            metrics.average_latency_ms > 2.0 * thresholds.max_latency_ms ? RiskLevel::High : RiskLevel::Medium,
            format_value("Average transform latency is %.1f ms", metrics.average_latency_ms),
            "Enable operation compression or reduce the recency window"});
    }

    if (metrics.queue_size > thresholds.max_queue_size) {
        report.bottlenecks.push_back(Bottleneck{
            BottleneckType::QueueSize,
            metrics.queue_size > 2 * thresholds.max_queue_size ? RiskLevel::High : RiskLevel::Medium,
            "Pending queue holds " + std::to_string(metrics.queue_size) + " operations",
            "Apply backpressure at the gateway or shorten pending retention"});
    }

    if (metrics.estimated_memory_mb > thresholds.max_memory_mb) {
        report.bottlenecks.push_back(Bottleneck{
            BottleneckType::Memory,
            metrics.estimated_memory_mb > 2.0 * thresholds.max_memory_mb ? RiskLevel::High : RiskLevel::Medium,
            format_value("Whiteboard state uses about %.1f MB", metrics.estimated_memory_mb),
            "Reduce conflict history and element cache sizes"});
    }

    if (metrics.conflict_rate > thresholds.max_conflict_rate) {
        report.bottlenecks.push_back(Bottleneck{
            BottleneckType::ConflictRate,
            metrics.conflict_rate > 0.3 ? RiskLevel::High : RiskLevel::Medium,
            format_value("Conflict rate is %.1f%%", metrics.conflict_rate * 100.0),
            "Surface conflict predictions to users or lock contested regions"});
    }

    if (metrics.resolutions_attempted > 0 &&
        metrics.resolution_success_rate < thresholds.min_resolution_success_rate) {
        report.bottlenecks.push_back(Bottleneck{
            BottleneckType::ResolutionRate,
            metrics.resolution_success_rate < 0.5 ? RiskLevel::High : RiskLevel::Medium,
            format_value("Automatic resolution succeeds for %.1f%% of conflicts",
                         metrics.resolution_success_rate * 100.0),
            "Review strategy alternatives and user priority weights"});
    }

    return report;
}

} // namespace tessera::sync
