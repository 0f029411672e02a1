// Copyright Tessera Team. All Rights Reserved.
//
// Conflict Engine Telemetry
// In-process metrics for the transform, detection and resolution pipeline

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tessera::telemetry {

//==============================================================================
// Forward Declarations
//==============================================================================

class Counter;
class Gauge;
class Histogram;
class Timer;
class TelemetryRegistry;

//==============================================================================
// Metric Types
//==============================================================================

/// Metric label pair
struct Label {
    std::string key;
    std::string value;

    bool operator==(const Label& other) const {
        return key == other.key && value == other.value;
    }
};

/// Flattened metric reading
struct MetricSample {
    enum class Kind { Counter, Gauge, Histogram };

    std::string metric_name;
    Kind kind{Kind::Counter};
    std::vector<Label> labels;
    double value{0.0};              ///< Counter/gauge value, histogram sum
    uint64_t count{0};              ///< Histogram observation count
    std::chrono::system_clock::time_point timestamp;
};

//==============================================================================
// Counter - Monotonically increasing metric
//==============================================================================

class Counter {
public:
    Counter(std::string_view name, std::string_view description);

    Counter(const Counter&) = delete;
    Counter& operator=(const Counter&) = delete;

    /// Increment by amount
    void increment(int64_t amount = 1);

    /// Increment the series identified by labels
    void increment(const std::vector<Label>& labels, int64_t amount = 1);

    int64_t value() const;
    int64_t value(const std::vector<Label>& labels) const;

    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }

    std::vector<MetricSample> collect() const;

private:
    std::string name_;
    std::string description_;
    mutable std::mutex mutex_;
    std::atomic<int64_t> default_value_{0};
    std::unordered_map<std::string, int64_t> labeled_values_;
};

//==============================================================================
// Gauge - Value that can go up and down
//==============================================================================

class Gauge {
public:
    Gauge(std::string_view name, std::string_view description);

    Gauge(const Gauge&) = delete;
    Gauge& operator=(const Gauge&) = delete;

    void set(double value);
    void increment(double amount = 1.0);
    void decrement(double amount = 1.0);
    double value() const;

    const std::string& name() const { return name_; }

    std::vector<MetricSample> collect() const;

private:
    std::string name_;
    std::string description_;
    std::atomic<double> value_{0.0};
};

//==============================================================================
// Histogram - Distribution of values
//==============================================================================

class Histogram {
public:
    /// Default bucket boundaries for latency histograms (milliseconds)
    static const std::vector<double> DEFAULT_LATENCY_BUCKETS_MS;

    /// Default bucket boundaries for queue depth histograms
    static const std::vector<double> DEFAULT_DEPTH_BUCKETS;

    Histogram(std::string_view name, std::string_view description,
              std::vector<double> bucket_boundaries = DEFAULT_LATENCY_BUCKETS_MS);

    Histogram(const Histogram&) = delete;
    Histogram& operator=(const Histogram&) = delete;

    /// Record a value
    void observe(double value);

    struct Stats {
        double sum = 0.0;
        uint64_t count = 0;
        double min = 0.0;
        double max = 0.0;
        std::vector<uint64_t> bucket_counts;

        double mean() const { return count > 0 ? sum / static_cast<double>(count) : 0.0; }
    };

    Stats stats() const;

    /// Upper bucket boundary below which fraction p of observations fall
    double percentile(double p) const;

    const std::string& name() const { return name_; }

    std::vector<MetricSample> collect() const;

    void reset();

private:
    std::string name_;
    std::string description_;
    std::vector<double> bucket_boundaries_;
    mutable std::mutex mutex_;

    double sum_ = 0.0;
    uint64_t count_ = 0;
    double min_ = std::numeric_limits<double>::max();
    double max_ = std::numeric_limits<double>::lowest();
    std::vector<uint64_t> bucket_counts_;
};

//==============================================================================
// Timer - Records elapsed milliseconds into a histogram
//==============================================================================

class Timer {
public:
    explicit Timer(Histogram& histogram);
    ~Timer();

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

    /// Stop timer manually (otherwise stops in destructor)
    double stop();

    /// Elapsed milliseconds so far
    double elapsed_ms() const;

private:
    Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
    bool stopped_ = false;
};

#define TESSERA_TIMER_CONCAT_INNER(a, b) a##b
#define TESSERA_TIMER_CONCAT(a, b) TESSERA_TIMER_CONCAT_INNER(a, b)

/// RAII scoped timer macro
#define TESSERA_SCOPED_TIMER(histogram) \
    tessera::telemetry::Timer TESSERA_TIMER_CONCAT(_timer_, __LINE__)(histogram)

//==============================================================================
// Telemetry Registry - Central metric management
//==============================================================================

class TelemetryRegistry {
public:
    /// Get singleton instance
    static TelemetryRegistry& instance();

    Counter& counter(std::string_view name, std::string_view description);
    Gauge& gauge(std::string_view name, std::string_view description);
    Histogram& histogram(std::string_view name, std::string_view description,
                         std::vector<double> bucket_boundaries = Histogram::DEFAULT_LATENCY_BUCKETS_MS);

    /// Collect all metrics
    std::vector<MetricSample> collect() const;

private:
    TelemetryRegistry();
    ~TelemetryRegistry();

    TelemetryRegistry(const TelemetryRegistry&) = delete;
    TelemetryRegistry& operator=(const TelemetryRegistry&) = delete;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

//==============================================================================
// Conflict Engine Metrics
//==============================================================================

namespace metrics {

/// Pre-defined conflict engine metrics
struct ConflictEngineMetrics {
    // Operation metrics
    Counter& operations_processed;
    Counter& operations_rejected;
    Counter& operations_compressed;
    Histogram& transform_latency_ms;
    Gauge& pending_queue_depth;

    // Conflict metrics
    Counter& conflicts_detected;            ///< Labeled by type
    Counter& predictions_issued;

    // Resolution metrics
    Counter& resolutions_succeeded;
    Counter& resolutions_failed;
    Counter& manual_interventions;
    Histogram& resolution_latency_ms;

    // Cold path
    Counter& persistence_failures;
    Counter& notification_failures;

    // Error metrics
    Counter& errors_total;                  ///< Labeled by type

    static ConflictEngineMetrics& instance();

private:
    ConflictEngineMetrics();
};

/// Get pre-defined engine metrics
inline ConflictEngineMetrics& engine() {
    return ConflictEngineMetrics::instance();
}

} // namespace metrics

//==============================================================================
// Convenience Functions
//==============================================================================

inline void record_conflict_detected(std::string_view type) {
    metrics::engine().conflicts_detected.increment({{"type", std::string(type)}});
}

inline void record_resolution(bool success) {
    if (success) {
        metrics::engine().resolutions_succeeded.increment();
    } else {
        metrics::engine().resolutions_failed.increment();
    }
}

inline void record_error(std::string_view type) {
    metrics::engine().errors_total.increment({{"type", std::string(type)}});
}

} // namespace tessera::telemetry
