/**
 * @file operation_compressor.cpp
 * @brief Operation compressor implementation
 */

#include "tessera/sync/operation_compressor.h"
#include "tessera/core/logging.h"
#include "tessera/telemetry/telemetry.h"
#include <mutex>
#include <optional>
#include <unordered_map>

namespace tessera::sync {

CompressorConfig CompressorConfig::from_settings(const config::CompressionSettings& settings) {
    CompressorConfig config;
    config.enabled = settings.enabled;
    config.max_run_length = settings.max_run_length;
    return config;
}

namespace {

/**
 * @brief Per-element bookkeeping during a compression pass
 */
struct ElementTrack {
    std::vector<SizeT> live_slots;      ///< Output slots still holding an operation
    std::optional<SizeT> run_head;      ///< Slot of the open same-user run
};

void fold_into(Operation& head, const Operation& op) {
    for (const auto& [field, value] : op.payload) {
        head.payload[field] = value;
    }
    if (head.type != OperationType::Create && head.type != op.type) {
        head.type = OperationType::Update;
    }
    head.vector_clock.merge(op.vector_clock);
    head.id = op.id;
    head.lamport_timestamp = op.lamport_timestamp;
    head.version = op.version;
    head.timestamp = op.timestamp;
    head.has_conflict = head.has_conflict || op.has_conflict;
    head.compressed_count += op.compressed_count;
}

} // anonymous namespace

// ============================================================================
// Simple Operation Compressor
// ============================================================================

class SimpleOperationCompressor : public IOperationCompressor {
public:
    explicit SimpleOperationCompressor(const CompressorConfig& config)
        : config_(config) {}

    std::vector<Operation> compress_operations(
        const std::vector<Operation>& ops,
        const std::unordered_set<OperationId>& protected_ids) const override {
        if (!config_.enabled) {
            record(ops.size(), ops.size());
            return ops;
        }

        std::vector<std::optional<Operation>> slots(ops.size());
        std::vector<bool> pinned(ops.size(), false);
        std::unordered_map<ElementId, ElementTrack> tracks;

        for (SizeT i = 0; i < ops.size(); ++i) {
            const Operation& op = ops[i];
            ElementTrack& track = tracks[op.element_id];

            if (protected_ids.count(op.id) > 0) {
                slots[i] = op;
                pinned[i] = true;
                track.live_slots.push_back(i);
                track.run_head.reset();
                continue;
            }

            if (op.type == OperationType::Delete) {
                std::vector<SizeT> survivors;
                for (SizeT slot : track.live_slots) {
                    if (pinned[slot]) {
                        survivors.push_back(slot);
                    } else {
                        slots[slot].reset();
                    }
                }
                survivors.push_back(i);
                track.live_slots = std::move(survivors);
                track.run_head.reset();
                slots[i] = op;
                continue;
            }

            if (is_field_update(op.type) && track.run_head) {
                Operation& head = *slots[*track.run_head];
                if (head.user_id == op.user_id &&
                    head.compressed_count + op.compressed_count <= config_.max_run_length) {
                    // Merged operation moves to the position of its last constituent
                    const SizeT old_slot = *track.run_head;
                    fold_into(head, op);
                    slots[i] = std::move(slots[old_slot]);
                    slots[old_slot].reset();
                    for (auto& slot : track.live_slots) {
                        if (slot == old_slot) {
                            slot = i;
                        }
                    }
                    track.run_head = i;
                    continue;
                }
            }

            slots[i] = op;
            track.live_slots.push_back(i);
            if (op.type == OperationType::Create || is_field_update(op.type)) {
                track.run_head = i;
            } else {
                track.run_head.reset();
            }
        }

        std::vector<Operation> compressed;
        compressed.reserve(ops.size());
        for (auto& slot : slots) {
            if (slot) {
                compressed.push_back(std::move(*slot));
            }
        }

        record(ops.size(), compressed.size());
        return compressed;
    }

    std::vector<Operation> deduplicate_operations(const std::vector<Operation>& ops) const override {
        std::unordered_set<OperationId> seen_ids;
        std::unordered_set<std::string> seen_signatures;
        std::vector<Operation> unique;
        unique.reserve(ops.size());

        for (const auto& op : ops) {
            const std::string signature = operation_signature(op);
            if (seen_ids.count(op.id) > 0 || seen_signatures.count(signature) > 0) {
                continue;
            }
            seen_ids.insert(op.id);
            seen_signatures.insert(signature);
            unique.push_back(op);
        }

        if (unique.size() < ops.size()) {
            logging::get_logger("tessera.compressor")->debug(
                "Dropped {} duplicate operations", ops.size() - unique.size());
        }
        return unique;
    }

    CompressionStats get_last_stats() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_;
    }

    CompressionStats get_compression_stats() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_;
    }

    void reset_stats() override {
        std::lock_guard<std::mutex> lock(mutex_);
        last_ = CompressionStats{};
        total_ = CompressionStats{};
    }

    const CompressorConfig& config() const override { return config_; }

private:
    void record(SizeT original, SizeT compressed) const {
        std::lock_guard<std::mutex> lock(mutex_);
        last_ = CompressionStats{1, original, compressed, original - compressed};
        total_.calls++;
        total_.original_count += original;
        total_.compressed_count += compressed;
        total_.operations_saved += original - compressed;

        if (original > compressed) {
            telemetry::metrics::engine().operations_compressed.increment(
                static_cast<int64_t>(original - compressed));
        }
    }

    CompressorConfig config_;
    mutable std::mutex mutex_;
    mutable CompressionStats last_;
    mutable CompressionStats total_;
};

// ============================================================================
// Factory Functions
// ============================================================================

std::unique_ptr<IOperationCompressor> create_operation_compressor(const CompressorConfig& config) {
    return std::make_unique<SimpleOperationCompressor>(config);
}

} // namespace tessera::sync
