// =================================================================
// include/Switchboard/RouterService.hpp
// =================================================================
// Builds and owns every routing component from a ServiceConfig.

#pragma once

#include "Switchboard/AbilityStore.hpp"
#include "Switchboard/DecisionLog.hpp"
#include "Switchboard/ExecutorRegistry.hpp"
#include "Switchboard/FeatureExtractor.hpp"
#include "Switchboard/PolicyStore.hpp"
#include "Switchboard/Router.hpp"
#include "Switchboard/ScoringEngine.hpp"
#include "Switchboard/ServiceConfig.hpp"
#include "Switchboard/TaskClassifier.hpp"
#include <memory>
#include <string>

namespace Switchboard {

/**
 * @brief Assembled router with its registry, stores and decision log
 */
class RouterService {
public:
    /**
     * @brief Build every component
     *
     * Executors that fail to register are logged and skipped.
     *
     * @throws ConfigError if a component cannot be built
     * @throws CheckpointError if the configured checkpoint cannot be loaded
     */
    explicit RouterService(const ServiceConfig& config);

    /**
     * @brief Stops probes and drains the decision log
     */
    ~RouterService();

    RouterService(const RouterService&) = delete;
    RouterService& operator=(const RouterService&) = delete;

    /**
     * @brief Probe every executor once, then start background probes if enabled
     * @return Number of live executors after the first pass
     */
    size_t start();

    void stop();

    RoutingDecision route(const RouteRequest& request) const;

    std::unique_ptr<RoutingSession> beginSession(const RouteRequest& request) const;

    /**
     * @brief Report how a decision turned out
     * @return False without a decision log or for unknown or repeated ids
     */
    bool recordOutcome(const std::string& decision_id, const DecisionOutcome& outcome);

    /**
     * @brief Reload the ability checkpoint
     * @param path Checkpoint file, empty for the configured one
     * @return True if the new checkpoint is now current
     */
    bool reloadCheckpoint(const std::string& path = "");

    std::string describeCheckpoint() const;

    /**
     * @brief Apply logging settings to the process-wide Logger
     */
    static void configureLogging(const LoggingSettings& logging);

    const ServiceConfig& getConfig() const { return m_config; }
    std::shared_ptr<ExecutorRegistry> getRegistry() const { return m_registry; }
    std::shared_ptr<PolicyStore> getPolicyStore() const { return m_policies; }
    std::shared_ptr<TaskClassifier> getClassifier() const { return m_classifier; }
    std::shared_ptr<ScoringEngine> getScoringEngine() const { return m_scoring; }
    std::shared_ptr<AbilityStore> getAbilityStore() const { return m_abilities; }
    std::shared_ptr<DecisionLog> getDecisionLog() const { return m_decision_log; }
    const Router& getRouter() const { return *m_router; }

private:
    ServiceConfig m_config;

    std::shared_ptr<ExecutorRegistry> m_registry;
    std::shared_ptr<FeatureExtractor> m_features;
    std::shared_ptr<TaskClassifier> m_classifier;
    std::shared_ptr<PolicyStore> m_policies;
    std::shared_ptr<AbilityStore> m_abilities;
    std::shared_ptr<ScoringEngine> m_scoring;
    std::shared_ptr<DecisionLog> m_decision_log;
    std::unique_ptr<Router> m_router;

    void buildRegistry();
    void buildClassifier();
    void buildPolicyStore();
    void buildScoring();
};

} // namespace Switchboard
