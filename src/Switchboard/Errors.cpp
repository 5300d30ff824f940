// =================================================================
// src/Switchboard/Errors.cpp
// =================================================================

#include "Switchboard/Errors.hpp"

namespace Switchboard {

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::CONFIG_ERROR: return "CONFIG_ERROR";
        case ErrorCode::CLASSIFICATION_TIMEOUT: return "CLASSIFICATION_TIMEOUT";
        case ErrorCode::CLASSIFICATION_FAILED: return "CLASSIFICATION_FAILED";
        case ErrorCode::POLICY_UNAVAILABLE: return "POLICY_UNAVAILABLE";
        case ErrorCode::NO_ELIGIBLE_CANDIDATES: return "NO_ELIGIBLE_CANDIDATES";
        case ErrorCode::SCORING_DATA_MISSING: return "SCORING_DATA_MISSING";
        case ErrorCode::CANCELLED: return "CANCELLED";
        case ErrorCode::CHECKPOINT_ERROR: return "CHECKPOINT_ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace Switchboard
