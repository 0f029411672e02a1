#pragma once
/**
 * @file config.h
 * @brief Configuration loading and management
 */

#include "tessera/core/types.h"
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace tessera::config {

/**
 * @brief Thrown for unreadable or out-of-range configuration (fatal at startup)
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Automatic resolution policy
 */
struct ResolutionSettings {
    bool automatic_resolution_enabled{true};
    UInt32 max_automatic_resolution_attempts{3};
    UInt32 conflict_timeout_ms{30000};
    Real min_automatic_confidence{0.6};     ///< Below this, escalate to manual review
    Real spatial_offset_spacing{10.0};      ///< Gap left by the spatial-offset strategy
    std::map<UserId, Real> user_priority_weights;
};

/**
 * @brief Conflict detection thresholds
 */
struct DetectionSettings {
    Real spatial_overlap_threshold_pct{10.0};   ///< Minimum overlap (IoU, percent)
    UInt32 temporal_window_ms{1000};
    UInt32 simultaneity_threshold_ms{100};
    UInt32 semantic_high_field_count{5};        ///< Incompatible fields that escalate to High
};

/**
 * @brief Transform engine limits
 */
struct TransformSettings {
    UInt32 recency_window_ms{5000};             ///< Detection scan window
    UInt32 pending_retention_ms{60000};         ///< Pending operations older than this are pruned
    SizeT max_conflict_history{1000};
    SizeT max_payload_fields{50};
    Real coordinate_limit{10000.0};
    SizeT element_cache_size{5000};
};

/**
 * @brief Operation compression limits
 */
struct CompressionSettings {
    bool enabled{true};
    UInt32 max_run_length{1000};                ///< Originals folded into one operation
};

/**
 * @brief Conflict prediction parameters
 */
struct PredictionSettings {
    bool enabled{true};
    Real cursor_proximity_threshold{100.0};
    UInt32 activity_ttl_ms{5000};
    SizeT max_tracked_cursors{5000};
};

/**
 * @brief Performance thresholds exposed for external backpressure policy
 */
struct PerformanceSettings {
    UInt32 max_latency_ms{500};
    UInt32 max_memory_mb{1024};
    SizeT max_queue_size{1000};
    UInt32 target_latency_ms{500};              ///< Adaptive throttling target
};

/**
 * @brief Runtime settings
 */
struct RuntimeSettings {
    SizeT actor_lanes{0};                       ///< 0 = hardware concurrency
    std::string log_level{"info"};
};

/**
 * @brief Engine configuration loaded from XML
 */
struct EngineConfig {
    ResolutionSettings resolution;
    DetectionSettings detection;
    TransformSettings transform;
    CompressionSettings compression;
    PredictionSettings prediction;
    PerformanceSettings performance;
    RuntimeSettings runtime;

    /**
     * @brief Load configuration from XML file
     * @throws ConfigurationError on parse failure or invalid values
     */
    static EngineConfig load(const std::string& path);

    /**
     * @brief Load configuration from an XML string
     * @throws ConfigurationError on parse failure or invalid values
     */
    static EngineConfig load_from_string(const std::string& xml);

    /**
     * @brief Create default configuration
     */
    static EngineConfig defaults();

    /**
     * @brief Preset for latency-sensitive deployments
     */
    static EngineConfig low_latency();

    /**
     * @brief Preset that escalates more conflicts to manual review
     */
    static EngineConfig strict();

    /**
     * @brief Check thresholds
     * @throws ConfigurationError naming the first invalid option
     */
    void validate() const;

    /**
     * @brief Save configuration to XML file
     */
    bool save(const std::string& path) const;
};

} // namespace tessera::config
