// =================================================================
// include/Switchboard/Errors.hpp
// =================================================================
// Exception types raised across the routing pipeline.

#pragma once

#include <stdexcept>
#include <string>

namespace Switchboard {

/**
 * @brief Error categories surfaced by the router and its collaborators
 */
enum class ErrorCode {
    CONFIG_ERROR,            ///< Malformed registration or configuration
    CLASSIFICATION_TIMEOUT,  ///< Classifier exceeded its deadline
    CLASSIFICATION_FAILED,   ///< Classifier unreachable or reply malformed
    POLICY_UNAVAILABLE,      ///< Policy store unreachable and nothing cached
    NO_ELIGIBLE_CANDIDATES,  ///< Nothing left to select from
    SCORING_DATA_MISSING,    ///< Candidate scored without an ability vector
    CANCELLED,               ///< Caller cancelled or deadline expired
    CHECKPOINT_ERROR         ///< Ability checkpoint could not be loaded
};

/**
 * @brief Convert an error code to its string form
 */
std::string errorCodeToString(ErrorCode code);

/**
 * @brief Base class for all Switchboard errors
 */
class SwitchboardError : public std::runtime_error {
public:
    SwitchboardError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), m_code(code) {}

    ErrorCode code() const { return m_code; }

private:
    ErrorCode m_code;
};

class ConfigError : public SwitchboardError {
public:
    explicit ConfigError(const std::string& message)
        : SwitchboardError(ErrorCode::CONFIG_ERROR, message) {}
};

class ClassificationTimeout : public SwitchboardError {
public:
    explicit ClassificationTimeout(const std::string& message)
        : SwitchboardError(ErrorCode::CLASSIFICATION_TIMEOUT, message) {}
};

class ClassificationFailed : public SwitchboardError {
public:
    explicit ClassificationFailed(const std::string& message)
        : SwitchboardError(ErrorCode::CLASSIFICATION_FAILED, message) {}
};

class PolicyUnavailable : public SwitchboardError {
public:
    explicit PolicyUnavailable(const std::string& message)
        : SwitchboardError(ErrorCode::POLICY_UNAVAILABLE, message) {}
};

class NoEligibleCandidates : public SwitchboardError {
public:
    explicit NoEligibleCandidates(const std::string& message)
        : SwitchboardError(ErrorCode::NO_ELIGIBLE_CANDIDATES, message) {}
};

class Cancelled : public SwitchboardError {
public:
    explicit Cancelled(const std::string& message)
        : SwitchboardError(ErrorCode::CANCELLED, message) {}
};

class CheckpointError : public SwitchboardError {
public:
    explicit CheckpointError(const std::string& message)
        : SwitchboardError(ErrorCode::CHECKPOINT_ERROR, message) {}
};

/**
 * @brief Raised by bounded sub-calls that ran out of time
 *
 * Components translate this into their own error type.
 */
class OperationTimeout : public std::runtime_error {
public:
    explicit OperationTimeout(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace Switchboard
