/**
 * @file config_loader.cpp
 * @brief XML configuration loading implementation
 *
 * Reads the <tessera_config> document with pugixml. Missing elements keep
 * their defaults; present elements are range-checked by validate().
 */

#include "tessera/interface/config.h"
#include "tessera/core/logging.h"
#include <pugixml.hpp>
#include <cmath>

namespace tessera::config {

namespace {

// ============================================================================
// Parse Helpers
// ============================================================================

UInt32 read_uint(const pugi::xml_node& parent, const char* name, UInt32 fallback) {
    return parent.child(name).text().as_uint(fallback);
}

SizeT read_size(const pugi::xml_node& parent, const char* name, SizeT fallback) {
    return static_cast<SizeT>(parent.child(name).text().as_ullong(
        static_cast<unsigned long long>(fallback)));
}

Real read_real(const pugi::xml_node& parent, const char* name, Real fallback) {
    return parent.child(name).text().as_double(fallback);
}

void require(bool condition, const std::string& option, const std::string& rule) {
    if (!condition) {
        throw ConfigurationError("Invalid configuration: " + option + " " + rule);
    }
}

EngineConfig parse_document(const pugi::xml_document& doc) {
    EngineConfig config = EngineConfig::defaults();

    auto root = doc.child("tessera_config");
    if (!root) {
        root = doc.child("config");
    }
    if (!root) {
        throw ConfigurationError("Invalid engine config XML: no <tessera_config> root element");
    }

    // Resolution settings
    if (auto res = root.child("resolution")) {
        auto& r = config.resolution;
        r.automatic_resolution_enabled = res.child("automatic_enabled").text().as_bool(
            r.automatic_resolution_enabled);
        r.max_automatic_resolution_attempts = read_uint(res, "max_attempts",
            r.max_automatic_resolution_attempts);
        r.conflict_timeout_ms = read_uint(res, "conflict_timeout_ms", r.conflict_timeout_ms);
        r.min_automatic_confidence = read_real(res, "min_confidence", r.min_automatic_confidence);
        r.spatial_offset_spacing = read_real(res, "spatial_offset_spacing", r.spatial_offset_spacing);

        for (auto weight : res.children("user_priority")) {
            std::string user = weight.attribute("user").as_string();
            if (user.empty()) {
                throw ConfigurationError("Invalid configuration: user_priority without user attribute");
            }
            r.user_priority_weights[user] = weight.text().as_double(1.0);
        }
    }

    // Detection settings
    if (auto det = root.child("detection")) {
        auto& d = config.detection;
        d.spatial_overlap_threshold_pct = read_real(det, "spatial_overlap_threshold_pct",
            d.spatial_overlap_threshold_pct);
        d.temporal_window_ms = read_uint(det, "temporal_window_ms", d.temporal_window_ms);
        d.simultaneity_threshold_ms = read_uint(det, "simultaneity_threshold_ms",
            d.simultaneity_threshold_ms);
        d.semantic_high_field_count = read_uint(det, "semantic_high_field_count",
            d.semantic_high_field_count);
    }

    // Transform settings
    if (auto tr = root.child("transform")) {
        auto& t = config.transform;
        t.recency_window_ms = read_uint(tr, "recency_window_ms", t.recency_window_ms);
        t.pending_retention_ms = read_uint(tr, "pending_retention_ms", t.pending_retention_ms);
        t.max_conflict_history = read_size(tr, "max_conflict_history", t.max_conflict_history);
        t.max_payload_fields = read_size(tr, "max_payload_fields", t.max_payload_fields);
        t.coordinate_limit = read_real(tr, "coordinate_limit", t.coordinate_limit);
        t.element_cache_size = read_size(tr, "element_cache_size", t.element_cache_size);
    }

    // Compression settings
    if (auto comp = root.child("compression")) {
        config.compression.enabled = comp.child("enabled").text().as_bool(config.compression.enabled);
        config.compression.max_run_length = read_uint(comp, "max_run_length",
            config.compression.max_run_length);
    }

    // Prediction settings
    if (auto pred = root.child("prediction")) {
        auto& p = config.prediction;
        p.enabled = pred.child("enabled").text().as_bool(p.enabled);
        p.cursor_proximity_threshold = read_real(pred, "cursor_proximity_threshold",
            p.cursor_proximity_threshold);
        p.activity_ttl_ms = read_uint(pred, "activity_ttl_ms", p.activity_ttl_ms);
        p.max_tracked_cursors = read_size(pred, "max_tracked_cursors", p.max_tracked_cursors);
    }

    // Performance thresholds
    if (auto perf = root.child("performance")) {
        auto& p = config.performance;
        p.max_latency_ms = read_uint(perf, "max_latency_ms", p.max_latency_ms);
        p.max_memory_mb = read_uint(perf, "max_memory_mb", p.max_memory_mb);
        p.max_queue_size = read_size(perf, "max_queue_size", p.max_queue_size);
        p.target_latency_ms = read_uint(perf, "target_latency_ms", p.target_latency_ms);
    }

    // Runtime settings
    if (auto rt = root.child("runtime")) {
        config.runtime.actor_lanes = read_size(rt, "actor_lanes", config.runtime.actor_lanes);
    }
    if (auto log = root.child("logging")) {
        config.runtime.log_level = log.child("level").text().as_string(config.runtime.log_level.c_str());
    }

    config.validate();
    return config;
}

} // anonymous namespace

// ============================================================================
// EngineConfig Implementation
// ============================================================================

EngineConfig EngineConfig::load(const std::string& path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());

    if (!result) {
        throw ConfigurationError("Failed to load config: " + path + ": " +
                                 std::string(result.description()));
    }

    EngineConfig config = parse_document(doc);
    logging::get_logger("tessera.config")->info("Loaded configuration from {}", path);
    return config;
}

EngineConfig EngineConfig::load_from_string(const std::string& xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(xml.c_str());

    if (!result) {
        throw ConfigurationError("Failed to parse config: " + std::string(result.description()));
    }

    return parse_document(doc);
}

EngineConfig EngineConfig::defaults() {
    return EngineConfig{};
}

EngineConfig EngineConfig::low_latency() {
    EngineConfig config;
    config.transform.recency_window_ms = 2000;
    config.performance.max_latency_ms = 100;
    config.performance.target_latency_ms = 50;
    config.resolution.max_automatic_resolution_attempts = 2;
    return config;
}

EngineConfig EngineConfig::strict() {
    EngineConfig config;
    config.resolution.min_automatic_confidence = 0.75;
    config.detection.spatial_overlap_threshold_pct = 5.0;
    config.detection.semantic_high_field_count = 3;
    return config;
}

void EngineConfig::validate() const {
    require(resolution.max_automatic_resolution_attempts >= 1 &&
            resolution.max_automatic_resolution_attempts <= 10,
            "resolution.max_attempts", "must be in [1, 10]");
    require(resolution.conflict_timeout_ms > 0,
            "resolution.conflict_timeout_ms", "must be positive");
    require(resolution.min_automatic_confidence >= 0.0 && resolution.min_automatic_confidence <= 1.0,
            "resolution.min_confidence", "must be in [0, 1]");
    require(std::isfinite(resolution.spatial_offset_spacing) && resolution.spatial_offset_spacing >= 0.0,
            "resolution.spatial_offset_spacing", "must be non-negative");
    for (const auto& [user, weight] : resolution.user_priority_weights) {
        require(std::isfinite(weight) && weight >= 0.0,
                "resolution.user_priority[" + user + "]", "must be non-negative");
    }

    require(detection.spatial_overlap_threshold_pct > 0.0 && detection.spatial_overlap_threshold_pct <= 100.0,
            "detection.spatial_overlap_threshold_pct", "must be in (0, 100]");
    require(detection.temporal_window_ms > 0,
            "detection.temporal_window_ms", "must be positive");
    require(detection.simultaneity_threshold_ms <= detection.temporal_window_ms,
            "detection.simultaneity_threshold_ms", "must not exceed temporal_window_ms");
    require(detection.semantic_high_field_count >= 1,
            "detection.semantic_high_field_count", "must be at least 1");

    require(transform.recency_window_ms > 0,
            "transform.recency_window_ms", "must be positive");
    require(transform.pending_retention_ms >= transform.recency_window_ms,
            "transform.pending_retention_ms", "must be at least recency_window_ms");
    require(transform.max_conflict_history > 0,
            "transform.max_conflict_history", "must be positive");
    require(transform.max_payload_fields > 0,
            "transform.max_payload_fields", "must be positive");
    require(std::isfinite(transform.coordinate_limit) && transform.coordinate_limit > 0.0,
            "transform.coordinate_limit", "must be positive");
    require(transform.element_cache_size > 0,
            "transform.element_cache_size", "must be positive");

    require(compression.max_run_length >= 1,
            "compression.max_run_length", "must be at least 1");

    require(prediction.cursor_proximity_threshold > 0.0,
            "prediction.cursor_proximity_threshold", "must be positive");
    require(prediction.activity_ttl_ms > 0,
            "prediction.activity_ttl_ms", "must be positive");
    require(prediction.max_tracked_cursors > 0,
            "prediction.max_tracked_cursors", "must be positive");

    require(performance.max_latency_ms > 0, "performance.max_latency_ms", "must be positive");
    require(performance.max_memory_mb > 0, "performance.max_memory_mb", "must be positive");
    require(performance.max_queue_size > 0, "performance.max_queue_size", "must be positive");
    require(performance.target_latency_ms > 0, "performance.target_latency_ms", "must be positive");

    require(logging::is_valid_level(runtime.log_level), "logging.level",
            "must be one of trace, debug, info, warn, error, critical, off");
}

bool EngineConfig::save(const std::string& path) const {
    pugi::xml_document doc;

    auto decl = doc.prepend_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("tessera_config");

    auto res = root.append_child("resolution");
    res.append_child("automatic_enabled").text().set(resolution.automatic_resolution_enabled);
    res.append_child("max_attempts").text().set(resolution.max_automatic_resolution_attempts);
    res.append_child("conflict_timeout_ms").text().set(resolution.conflict_timeout_ms);
    res.append_child("min_confidence").text().set(resolution.min_automatic_confidence);
    res.append_child("spatial_offset_spacing").text().set(resolution.spatial_offset_spacing);
    for (const auto& [user, weight] : resolution.user_priority_weights) {
        auto node = res.append_child("user_priority");
        node.append_attribute("user") = user.c_str();
        node.text().set(weight);
    }

    auto det = root.append_child("detection");
    det.append_child("spatial_overlap_threshold_pct").text().set(detection.spatial_overlap_threshold_pct);
    det.append_child("temporal_window_ms").text().set(detection.temporal_window_ms);
    det.append_child("simultaneity_threshold_ms").text().set(detection.simultaneity_threshold_ms);
    det.append_child("semantic_high_field_count").text().set(detection.semantic_high_field_count);

    auto tr = root.append_child("transform");
    tr.append_child("recency_window_ms").text().set(transform.recency_window_ms);
    tr.append_child("pending_retention_ms").text().set(transform.pending_retention_ms);
    tr.append_child("max_conflict_history").text().set(static_cast<unsigned long long>(transform.max_conflict_history));
    tr.append_child("max_payload_fields").text().set(static_cast<unsigned long long>(transform.max_payload_fields));
    tr.append_child("coordinate_limit").text().set(transform.coordinate_limit);
    tr.append_child("element_cache_size").text().set(static_cast<unsigned long long>(transform.element_cache_size));

    auto comp = root.append_child("compression");
    comp.append_child("enabled").text().set(compression.enabled);
    comp.append_child("max_run_length").text().set(compression.max_run_length);

    auto pred = root.append_child("prediction");
    pred.append_child("enabled").text().set(prediction.enabled);
    pred.append_child("cursor_proximity_threshold").text().set(prediction.cursor_proximity_threshold);
    pred.append_child("activity_ttl_ms").text().set(prediction.activity_ttl_ms);
    pred.append_child("max_tracked_cursors").text().set(static_cast<unsigned long long>(prediction.max_tracked_cursors));

    auto perf = root.append_child("performance");
    perf.append_child("max_latency_ms").text().set(performance.max_latency_ms);
    perf.append_child("max_memory_mb").text().set(performance.max_memory_mb);
    perf.append_child("max_queue_size").text().set(static_cast<unsigned long long>(performance.max_queue_size));
    perf.append_child("target_latency_ms").text().set(performance.target_latency_ms);

    auto rt = root.append_child("runtime");
    rt.append_child("actor_lanes").text().set(static_cast<unsigned long long>(runtime.actor_lanes));

    auto log = root.append_child("logging");
    log.append_child("level").text().set(runtime.log_level.c_str());

    return doc.save_file(path.c_str());
}

} // namespace tessera::config
