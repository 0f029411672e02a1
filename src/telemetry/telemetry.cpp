// Copyright Tessera Team. All Rights Reserved.

#include "tessera/telemetry/telemetry.h"

#include <algorithm>
#include <sstream>

namespace tessera::telemetry {

namespace {

std::string make_label_key(const std::vector<Label>& labels) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& label : labels) {
        if (!first) oss << ",";
        oss << label.key << "=" << label.value;
        first = false;
    }
    return oss.str();
}

std::vector<Label> parse_label_key(const std::string& key) {
    std::vector<Label> labels;
    std::istringstream iss(key);
    std::string pair;
    while (std::getline(iss, pair, ',')) {
        size_t eq_pos = pair.find('=');
        if (eq_pos != std::string::npos) {
            labels.push_back({pair.substr(0, eq_pos), pair.substr(eq_pos + 1)});
        }
    }
    return labels;
}

} // anonymous namespace

//==============================================================================
// Default Bucket Boundaries
//==============================================================================

const std::vector<double> Histogram::DEFAULT_LATENCY_BUCKETS_MS = {
    0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0, 25.0, 50.0, 100.0, 250.0, 500.0, 1000.0
};

const std::vector<double> Histogram::DEFAULT_DEPTH_BUCKETS = {
    1, 5, 10, 25, 50, 100, 250, 500, 1000, 5000
};

//==============================================================================
// Counter Implementation
//==============================================================================

Counter::Counter(std::string_view name, std::string_view description)
    : name_(name)
    , description_(description) {}

void Counter::increment(int64_t amount) {
    default_value_.fetch_add(amount, std::memory_order_relaxed);
}

void Counter::increment(const std::vector<Label>& labels, int64_t amount) {
    if (labels.empty()) {
        increment(amount);
        return;
    }

    std::string key = make_label_key(labels);
    std::lock_guard<std::mutex> lock(mutex_);
    labeled_values_[key] += amount;
}

int64_t Counter::value() const {
    return default_value_.load(std::memory_order_relaxed);
}

int64_t Counter::value(const std::vector<Label>& labels) const {
    if (labels.empty()) {
        return value();
    }

    std::string key = make_label_key(labels);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = labeled_values_.find(key);
    return it != labeled_values_.end() ? it->second : 0;
}

std::vector<MetricSample> Counter::collect() const {
    std::vector<MetricSample> samples;
    auto now = std::chrono::system_clock::now();

    MetricSample sample;
    sample.metric_name = name_;
    sample.kind = MetricSample::Kind::Counter;
    sample.value = static_cast<double>(value());
    sample.timestamp = now;
    samples.push_back(sample);

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, val] : labeled_values_) {
        MetricSample labeled = sample;
        labeled.labels = parse_label_key(key);
        labeled.value = static_cast<double>(val);
        samples.push_back(std::move(labeled));
    }

    return samples;
}

//==============================================================================
// Gauge Implementation
//==============================================================================

Gauge::Gauge(std::string_view name, std::string_view description)
    : name_(name)
    , description_(description) {}

void Gauge::set(double value) {
    value_.store(value, std::memory_order_relaxed);
}

void Gauge::increment(double amount) {
    double expected = value_.load(std::memory_order_relaxed);
    while (!value_.compare_exchange_weak(expected, expected + amount,
                                         std::memory_order_relaxed)) {}
}

void Gauge::decrement(double amount) {
    increment(-amount);
}

double Gauge::value() const {
    return value_.load(std::memory_order_relaxed);
}

std::vector<MetricSample> Gauge::collect() const {
    MetricSample sample;
    sample.metric_name = name_;
    sample.kind = MetricSample::Kind::Gauge;
    sample.value = value();
    sample.timestamp = std::chrono::system_clock::now();
    return {sample};
}

//==============================================================================
// Histogram Implementation
//==============================================================================

Histogram::Histogram(std::string_view name, std::string_view description,
                     std::vector<double> bucket_boundaries)
    : name_(name)
    , description_(description)
    , bucket_boundaries_(std::move(bucket_boundaries)) {
    std::sort(bucket_boundaries_.begin(), bucket_boundaries_.end());
    bucket_counts_.assign(bucket_boundaries_.size() + 1, 0);
}

void Histogram::observe(double value) {
    std::lock_guard<std::mutex> lock(mutex_);

    sum_ += value;
    count_++;
    min_ = std::min(min_, value);
    max_ = std::max(max_, value);

    auto it = std::upper_bound(bucket_boundaries_.begin(), bucket_boundaries_.end(), value);
    bucket_counts_[static_cast<size_t>(it - bucket_boundaries_.begin())]++;
}

Histogram::Stats Histogram::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Stats s;
    s.sum = sum_;
    s.count = count_;
    s.min = count_ > 0 ? min_ : 0.0;
    s.max = count_ > 0 ? max_ : 0.0;
    s.bucket_counts = bucket_counts_;
    return s;
}

double Histogram::percentile(double p) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (count_ == 0 || bucket_boundaries_.empty()) return 0.0;

    auto target = static_cast<uint64_t>(static_cast<double>(count_) * p);
    uint64_t cumulative = 0;

    for (size_t i = 0; i < bucket_counts_.size(); ++i) {
        cumulative += bucket_counts_[i];
        if (cumulative >= target && cumulative > 0) {
            // Overflow bucket reports the observed maximum
            return i < bucket_boundaries_.size() ? bucket_boundaries_[i] : max_;
        }
    }

    return max_;
}

std::vector<MetricSample> Histogram::collect() const {
    Stats s = stats();

    MetricSample sample;
    sample.metric_name = name_;
    sample.kind = MetricSample::Kind::Histogram;
    sample.value = s.sum;
    sample.count = s.count;
    sample.timestamp = std::chrono::system_clock::now();
    return {sample};
}

void Histogram::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sum_ = 0.0;
    count_ = 0;
    min_ = std::numeric_limits<double>::max();
    max_ = std::numeric_limits<double>::lowest();
    std::fill(bucket_counts_.begin(), bucket_counts_.end(), 0);
}

//==============================================================================
// Timer Implementation
//==============================================================================

Timer::Timer(Histogram& histogram)
    : histogram_(histogram)
    , start_(std::chrono::steady_clock::now()) {}

Timer::~Timer() {
    if (!stopped_) {
        stop();
    }
}

double Timer::stop() {
    double elapsed = elapsed_ms();
    if (!stopped_) {
        stopped_ = true;
        histogram_.observe(elapsed);
    }
    return elapsed;
}

double Timer::elapsed_ms() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(now - start_).count();
}

//==============================================================================
// Telemetry Registry Implementation
//==============================================================================

struct TelemetryRegistry::Impl {
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::unique_ptr<Counter>> counters;
    std::unordered_map<std::string, std::unique_ptr<Gauge>> gauges;
    std::unordered_map<std::string, std::unique_ptr<Histogram>> histograms;
};

TelemetryRegistry::TelemetryRegistry()
    : impl_(std::make_unique<Impl>()) {}

TelemetryRegistry::~TelemetryRegistry() = default;

TelemetryRegistry& TelemetryRegistry::instance() {
    static TelemetryRegistry instance;
    return instance;
}

Counter& TelemetryRegistry::counter(std::string_view name, std::string_view description) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto& slot = impl_->counters[std::string(name)];
    if (!slot) {
        slot = std::make_unique<Counter>(name, description);
    }
    return *slot;
}

Gauge& TelemetryRegistry::gauge(std::string_view name, std::string_view description) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto& slot = impl_->gauges[std::string(name)];
    if (!slot) {
        slot = std::make_unique<Gauge>(name, description);
    }
    return *slot;
}

Histogram& TelemetryRegistry::histogram(std::string_view name, std::string_view description,
                                         std::vector<double> bucket_boundaries) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto& slot = impl_->histograms[std::string(name)];
    if (!slot) {
        slot = std::make_unique<Histogram>(name, description, std::move(bucket_boundaries));
    }
    return *slot;
}

std::vector<MetricSample> TelemetryRegistry::collect() const {
    std::vector<MetricSample> samples;
    std::lock_guard<std::mutex> lock(impl_->mutex);

    for (const auto& [name, counter] : impl_->counters) {
        auto counter_samples = counter->collect();
        samples.insert(samples.end(), counter_samples.begin(), counter_samples.end());
    }
    for (const auto& [name, gauge] : impl_->gauges) {
        auto gauge_samples = gauge->collect();
        samples.insert(samples.end(), gauge_samples.begin(), gauge_samples.end());
    }
    for (const auto& [name, histogram] : impl_->histograms) {
        auto histogram_samples = histogram->collect();
        samples.insert(samples.end(), histogram_samples.begin(), histogram_samples.end());
    }

    return samples;
}

//==============================================================================
// Conflict Engine Metrics Implementation
//==============================================================================

namespace metrics {

ConflictEngineMetrics::ConflictEngineMetrics()
    : operations_processed(TelemetryRegistry::instance().counter(
          "tessera_operations_processed_total", "Operations accepted by the transform engine"))
    , operations_rejected(TelemetryRegistry::instance().counter(
          "tessera_operations_rejected_total", "Operations rejected by validation"))
    , operations_compressed(TelemetryRegistry::instance().counter(
          "tessera_operations_compressed_total", "Operations removed by compression"))
    , transform_latency_ms(TelemetryRegistry::instance().histogram(
          "tessera_transform_latency_ms", "Transform call latency"))
    , pending_queue_depth(TelemetryRegistry::instance().gauge(
          "tessera_pending_queue_depth", "Pending operations of the last transformed whiteboard"))
    , conflicts_detected(TelemetryRegistry::instance().counter(
          "tessera_conflicts_detected_total", "Conflicts detected by type"))
    , predictions_issued(TelemetryRegistry::instance().counter(
          "tessera_predictions_issued_total", "Conflict predictions issued"))
    , resolutions_succeeded(TelemetryRegistry::instance().counter(
          "tessera_resolutions_succeeded_total", "Automatic resolutions that succeeded"))
    , resolutions_failed(TelemetryRegistry::instance().counter(
          "tessera_resolutions_failed_total", "Automatic resolutions that failed"))
    , manual_interventions(TelemetryRegistry::instance().counter(
          "tessera_manual_interventions_total", "Conflicts escalated to manual review"))
    , resolution_latency_ms(TelemetryRegistry::instance().histogram(
          "tessera_resolution_latency_ms", "Automatic resolution latency"))
    , persistence_failures(TelemetryRegistry::instance().counter(
          "tessera_persistence_failures_total", "Suppressed audit/analytics failures"))
    , notification_failures(TelemetryRegistry::instance().counter(
          "tessera_notification_failures_total", "Suppressed notification failures"))
    , errors_total(TelemetryRegistry::instance().counter(
          "tessera_errors_total", "Errors by type")) {}

ConflictEngineMetrics& ConflictEngineMetrics::instance() {
    static ConflictEngineMetrics instance;
    return instance;
}

} // namespace metrics

} // namespace tessera::telemetry
