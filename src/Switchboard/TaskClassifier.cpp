// =================================================================
// src/Switchboard/TaskClassifier.cpp
// =================================================================
// Implementation of the bounded task classifier.

#include "Switchboard/TaskClassifier.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include "Switchboard/PolicySource.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace Switchboard {

TaskClassifier::TaskClassifier(std::shared_ptr<ClassifierClient> client, const TaskClassifierConfig& config)
    : m_client(std::move(client)), m_config(config) {
    if (!m_client) {
        throw ConfigError("TaskClassifier requires a classifier client");
    }
    if (m_config.timeout.count() <= 0) {
        throw ConfigError("Classifier timeout must be positive");
    }
}

Classification TaskClassifier::classify(const std::string& prompt,
                                        const std::vector<ConversationTurn>& context,
                                        const CancellationToken* token) {
    auto start_time = std::chrono::steady_clock::now();
    auto client = m_client;

    Classification result;
    try {
        result = runWithDeadline<Classification>(
            [client, prompt, context]() { return client->classify(prompt, context); },
            m_config.timeout, token, "Classification");
    } catch (const Cancelled&) {
        throw;
    } catch (const OperationTimeout&) {
        {
            std::lock_guard<std::mutex> lock(m_stats_mutex);
            m_timeout_count++;
        }
        throw ClassificationTimeout("Classifier " + client->getName() + " exceeded " +
                                    std::to_string(m_config.timeout.count()) + "ms");
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(m_stats_mutex);
            m_failure_count++;
        }
        throw ClassificationFailed("Classifier " + client->getName() + " failed: " + e.what());
    }

    try {
        result = normalize(std::move(result));
    } catch (const ClassificationFailed&) {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_failure_count++;
        throw;
    }

    result.is_fallback = false;
    if (result.source.empty()) {
        result.source = client->getName();
    }
    result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_classification_counts[result.domain]++;
    }

    Logger::getInstance().debug("TaskClassifier",
        "Classified as " + result.domain + "/" + result.action +
        " (confidence " + std::to_string(result.confidence) + ", " +
        std::to_string(result.latency.count()) + "ms)");

    return result;
}

Classification TaskClassifier::fallback(const std::string& reason) const {
    Classification result;
    result.domain = m_config.fallback_domain;
    result.action = m_config.fallback_action;
    result.confidence = m_config.fallback_confidence;
    result.reasoning = "Fallback classification: " + reason;
    result.is_fallback = true;
    result.source = "fallback";
    return result;
}

std::string TaskClassifier::getClientName() const {
    return m_client->getName();
}

Classification TaskClassifier::normalize(Classification result) const {
    result.domain = normalizeTaskLabel(result.domain);
    result.action = normalizeTaskLabel(result.action);

    if (result.domain.empty() || result.action.empty()) {
        throw ClassificationFailed("Classifier reply is missing domain or action");
    }
    if (!std::isfinite(result.confidence)) {
        throw ClassificationFailed("Classifier reply has a non-numeric confidence");
    }
    result.confidence = std::max(0.0, std::min(1.0, result.confidence));
    return result;
}

std::unordered_map<std::string, size_t> TaskClassifier::getClassificationStats() const {
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    return m_classification_counts;
}

size_t TaskClassifier::getTimeoutCount() const {
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    return m_timeout_count;
}

size_t TaskClassifier::getFailureCount() const {
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    return m_failure_count;
}

void TaskClassifier::resetStats() {
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    m_classification_counts.clear();
    m_timeout_count = 0;
    m_failure_count = 0;
}

} // namespace Switchboard
