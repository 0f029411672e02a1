#pragma once
/**
 * @file operation_compressor.h
 * @brief Lossless-for-final-state reduction of operation sequences
 *
 * Key features:
 * - Same-user field update runs collapse, later values win per field
 * - Create followed by same-user updates collapses into one Create
 * - Delete absorbs every earlier operation on its element
 * - Protected (conflict evidence) and compound operations are never merged
 * - Exact-repeat de-duplication and compression statistics
 */

#include "tessera/interface/config.h"
#include "tessera/sync/operation.h"
#include <memory>
#include <unordered_set>
#include <vector>

namespace tessera::sync {

// ============================================================================
// Structs
// ============================================================================

/**
 * @brief Compressor configuration
 */
struct CompressorConfig {
    bool enabled{true};
    UInt32 max_run_length{1000};    ///< Upper bound on compressed_count of a merged operation

    static CompressorConfig from_settings(const config::CompressionSettings& settings);
};

/**
 * @brief Compression statistics
 */
struct CompressionStats {
    UInt64 calls{0};
    UInt64 original_count{0};
    UInt64 compressed_count{0};
    UInt64 operations_saved{0};

    /**
     * @brief compressed / original (1.0 when nothing was compressed)
     */
    Real compression_ratio() const {
        return original_count > 0
            ? static_cast<Real>(compressed_count) / static_cast<Real>(original_count) : 1.0;
    }
};

// ============================================================================
// Interfaces
// ============================================================================

/**
 * @brief Interface for operation compression
 */
class IOperationCompressor {
public:
    virtual ~IOperationCompressor() = default;

    /**
     * @brief Compress a sequence
     *
     * Replaying the result yields the same final element states as replaying
     * the input, and compressing the result again changes nothing.
     * @param protected_ids Operations that must survive untouched
     */
    virtual std::vector<Operation> compress_operations(
        const std::vector<Operation>& ops,
        const std::unordered_set<OperationId>& protected_ids = {}) const = 0;

    /**
     * @brief Drop repeated operations (same id, or same signature)
     */
    virtual std::vector<Operation> deduplicate_operations(const std::vector<Operation>& ops) const = 0;

    /**
     * @brief Statistics of the most recent compress call
     */
    virtual CompressionStats get_last_stats() const = 0;

    /**
     * @brief Cumulative statistics over every compress call
     */
    virtual CompressionStats get_compression_stats() const = 0;

    virtual void reset_stats() = 0;

    virtual const CompressorConfig& config() const = 0;
};

// ============================================================================
// Factory Functions
// ============================================================================

std::unique_ptr<IOperationCompressor> create_operation_compressor(const CompressorConfig& config = {});

} // namespace tessera::sync
