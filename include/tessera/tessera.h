#pragma once
/**
 * @file tessera.h
 * @brief Main include file for Tessera
 *
 * Tessera - Real-time conflict engine for collaborative whiteboards
 *
 * Include this single header to access all public Tessera APIs.
 */

#include "tessera/core/types.h"
#include "tessera/core/result.h"
#include "tessera/core/logging.h"

#include "tessera/interface/config.h"

#include "tessera/sync/vector_clock.h"
#include "tessera/sync/operation.h"
#include "tessera/sync/conflict.h"
#include "tessera/sync/conflict_detector.h"
#include "tessera/sync/transform_engine.h"
#include "tessera/sync/conflict_predictor.h"
#include "tessera/sync/operation_compressor.h"
#include "tessera/sync/conflict_resolution.h"
#include "tessera/sync/performance_analyzer.h"
#include "tessera/sync/session_manager.h"

/**
 * @namespace tessera
 * @brief Root namespace for all Tessera components
 */
namespace tessera {

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/**
 * @brief Get version string
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* GetVersionString() noexcept {
    return "0.1.0";
}

} // namespace tessera
