// =================================================================
// include/Switchboard/TaskClassifier.hpp
// =================================================================
// Bounded task classification with domain/action labels.

#pragma once

#include "Switchboard/Cancellation.hpp"
#include "Switchboard/FeatureExtractor.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Switchboard {

/**
 * @brief Domain/action label for one request
 */
struct Classification {
    std::string domain;                     ///< e.g. "programming"
    std::string action;                     ///< e.g. "code-generation"
    double confidence = 0.0;                ///< In [0, 1]
    std::string reasoning;                  ///< Short justification from the classifier
    bool is_fallback = false;               ///< True when substituted after a classifier failure
    std::string source;                     ///< Client name, or "fallback"
    std::chrono::milliseconds latency{0};   ///< Time spent classifying
};

/**
 * @brief External classification model contract
 *
 * One blocking call per request. Implementations throw on transport errors
 * or malformed replies; the caller bounds the call.
 */
class ClassifierClient {
public:
    virtual ~ClassifierClient() = default;

    /**
     * @brief Label a prompt
     * @param prompt Current request
     * @param context Recent turns, oldest first
     * @throws std::exception on transport errors or malformed replies
     */
    virtual Classification classify(const std::string& prompt,
                                    const std::vector<ConversationTurn>& context) = 0;

    virtual std::string getName() const = 0;
};

/**
 * @brief Classification timeouts and fallback label
 */
struct TaskClassifierConfig {
    std::chrono::milliseconds timeout{300};     ///< Bound on each classifier call
    std::string fallback_domain = "general";
    std::string fallback_action = "general";
    double fallback_confidence = 0.0;
};

/**
 * @brief Bounded wrapper around a ClassifierClient
 *
 * Validates and normalizes the client's reply and keeps per-domain
 * statistics. Substituting the fallback label is the caller's decision.
 */
class TaskClassifier {
public:
    explicit TaskClassifier(std::shared_ptr<ClassifierClient> client,
                            const TaskClassifierConfig& config = TaskClassifierConfig());

    /**
     * @brief Classify a prompt within the configured timeout
     * @param prompt Current request
     * @param context Recent turns, oldest first
     * @param token Optional cancellation token
     * @throws ClassificationTimeout if the client exceeds the timeout
     * @throws ClassificationFailed if the client fails or replies malformed
     * @throws Cancelled if the token fires first
     */
    Classification classify(const std::string& prompt,
                            const std::vector<ConversationTurn>& context = {},
                            const CancellationToken* token = nullptr);

    /**
     * @brief Build the configured fallback classification
     * @param reason Why the fallback was needed, kept as reasoning
     */
    Classification fallback(const std::string& reason) const;

    const TaskClassifierConfig& getConfig() const { return m_config; }

    std::string getClientName() const;

    std::unordered_map<std::string, size_t> getClassificationStats() const;
    size_t getTimeoutCount() const;
    size_t getFailureCount() const;
    void resetStats();

private:
    std::shared_ptr<ClassifierClient> m_client;
    TaskClassifierConfig m_config;

    mutable std::mutex m_stats_mutex;
    std::unordered_map<std::string, size_t> m_classification_counts;
    size_t m_timeout_count = 0;
    size_t m_failure_count = 0;

    Classification normalize(Classification result) const;
};

} // namespace Switchboard
