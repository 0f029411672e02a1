#pragma once
/**
 * @file result.h
 * @brief Result codes shared by the conflict engine
 *
 * Hot-path failures (validation, resolution) are returned to the caller as
 * typed results. Only fatal configuration problems are thrown, see
 * tessera/interface/config.h.
 */

#include "tessera/core/types.h"

namespace tessera {

/**
 * @brief Result codes for engine operations
 */
enum class EngineResult : UInt8 {
    Success = 0,

    // Operation errors
    ValidationError,        ///< Malformed operation, only that operation is rejected
    Duplicate,              ///< Operation id already pending, nothing changed

    // Resolution errors
    AutomaticResolutionDisabled,
    RiskTooHigh,            ///< Policy declined automatic resolution
    ResolutionExhausted,    ///< Every strategy attempt failed
    AlreadyProcessing,      ///< Conflict is in flight or past automatic resolution
    Cancelled,              ///< Abandoned between strategy attempts

    // Cold-path errors
    PersistenceError,       ///< Audit or analytics storage failure

    // Lookup errors
    NotFound,

    // Startup errors
    ConfigurationError
};

/**
 * @brief Convert EngineResult to string
 */
inline const char* engine_result_to_string(EngineResult result) {
    switch (result) {
        case EngineResult::Success: return "Success";
        case EngineResult::ValidationError: return "ValidationError";
        case EngineResult::Duplicate: return "Duplicate";
        case EngineResult::AutomaticResolutionDisabled: return "AutomaticResolutionDisabled";
        case EngineResult::RiskTooHigh: return "RiskTooHigh";
        case EngineResult::ResolutionExhausted: return "ResolutionExhausted";
        case EngineResult::AlreadyProcessing: return "AlreadyProcessing";
        case EngineResult::Cancelled: return "Cancelled";
        case EngineResult::PersistenceError: return "PersistenceError";
        case EngineResult::NotFound: return "NotFound";
        case EngineResult::ConfigurationError: return "ConfigurationError";
        default: return "Unknown";
    }
}

} // namespace tessera
