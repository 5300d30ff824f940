// =================================================================
// include/Switchboard/Router.hpp
// =================================================================
// Request-to-decision pipeline: classify, look up policy, merge with live
// models, score, select and log.

#pragma once

#include "Switchboard/Cancellation.hpp"
#include "Switchboard/DecisionLog.hpp"
#include "Switchboard/ExecutorRegistry.hpp"
#include "Switchboard/FeatureExtractor.hpp"
#include "Switchboard/PolicyStore.hpp"
#include "Switchboard/ScoringEngine.hpp"
#include "Switchboard/TaskClassifier.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace Switchboard {

/**
 * @brief One routing request from the gateway
 */
struct RouteRequest {
    std::string prompt;
    std::vector<ConversationTurn> context;            ///< Prior turns, oldest first
    std::set<std::string> excluded_model_ids;         ///< Never selected for this request
    std::shared_ptr<CancellationToken> cancellation;  ///< Optional deadline or cancel signal
};

/**
 * @brief Result of one selection
 */
struct RoutingDecision {
    std::string decision_id;
    std::string request_id;
    size_t attempt = 1;
    std::string selected_model;
    std::string selected_executor;
    std::vector<CandidateScore> candidates;   ///< Remaining ranked candidates, winner first
    Classification classification;
    QueryFeatures features;
    std::string policy_match;
    bool policy_stale = false;
    std::chrono::milliseconds latency{0};
    double confidence = 0.0;                  ///< Success probability of the winner
    std::string reasoning;
};

class Router;

/**
 * @brief Ranked candidates of one request, reusable for fallback selection
 *
 * Classification, features and scores are computed once when the session
 * is created. Each select() call excludes everything excluded so far, so a
 * model rejected once never comes back for the same request.
 */
class RoutingSession {
    /// Only Router can mint one, so sessions are only built by Router::beginSession
    class ConstructionKey {
        friend class Router;
        ConstructionKey() {}
    };

public:
    explicit RoutingSession(ConstructionKey) {}

    /**
     * @brief Pick the best remaining candidate
     * @param excluded Additional model ids to exclude from now on
     * @throws NoEligibleCandidates when every ranked candidate is excluded
     */
    RoutingDecision select(const std::set<std::string>& excluded = {});

    const std::string& getRequestId() const { return m_request_id; }
    const Classification& getClassification() const { return m_classification; }
    const QueryFeatures& getFeatures() const { return m_features; }
    const std::vector<CandidateScore>& getRankedCandidates() const { return m_ranked; }
    std::set<std::string> getExcluded() const;
    size_t getAttemptCount() const;

private:
    friend class Router;

    DecisionRecord buildRecord() const;
    void writeRecord(DecisionRecord record) const;

    std::shared_ptr<DecisionLog> m_decision_log;

    std::string m_request_id;
    std::string m_prompt;
    size_t m_context_turns = 0;
    Classification m_classification;
    QueryFeatures m_features;
    std::vector<std::string> m_policy_candidates;
    std::string m_policy_match;
    bool m_policy_stale = false;
    std::string m_merge_summary;
    std::vector<CandidateScore> m_ranked;
    std::chrono::milliseconds m_pipeline_latency{0};

    mutable std::mutex m_mutex;
    std::set<std::string> m_excluded;
    size_t m_attempts = 0;
};

/**
 * @brief Stateless routing pipeline
 *
 * Holds only shared collaborators; every call builds its own session state
 * and reads registry and policy snapshots without modifying them, so one
 * Router may serve any number of concurrent requests.
 */
class Router {
public:
    /**
     * @param decision_log Optional; decisions are not recorded when null
     * @throws ConfigError if a required collaborator is missing
     */
    Router(std::shared_ptr<ExecutorRegistry> registry,
           std::shared_ptr<PolicyStore> policies,
           std::shared_ptr<TaskClassifier> classifier,
           std::shared_ptr<ScoringEngine> scoring,
           std::shared_ptr<FeatureExtractor> features,
           std::shared_ptr<DecisionLog> decision_log = nullptr);

    /**
     * @brief Run classification, policy lookup, merge and scoring
     *
     * Classifier timeouts and failures degrade to the fallback classification.
     *
     * @throws NoEligibleCandidates if no live, non-excluded candidate remains
     *         or the policy store is unavailable with nothing cached
     * @throws Cancelled if the request's token fires
     */
    std::unique_ptr<RoutingSession> beginSession(const RouteRequest& request) const;

    /**
     * @brief beginSession() followed by one select()
     */
    RoutingDecision route(const RouteRequest& request) const;

    std::shared_ptr<DecisionLog> getDecisionLog() const { return m_decision_log; }

private:
    std::shared_ptr<ExecutorRegistry> m_registry;
    std::shared_ptr<PolicyStore> m_policies;
    std::shared_ptr<TaskClassifier> m_classifier;
    std::shared_ptr<ScoringEngine> m_scoring;
    std::shared_ptr<FeatureExtractor> m_features;
    std::shared_ptr<DecisionLog> m_decision_log;

    Classification classifyOrFallback(const RouteRequest& request, const CancellationToken* token) const;
    void recordFailure(const RoutingSession& session, const std::string& error,
                       std::chrono::milliseconds latency) const;
};

} // namespace Switchboard
