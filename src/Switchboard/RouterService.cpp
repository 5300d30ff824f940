// =================================================================
// src/Switchboard/RouterService.cpp
// =================================================================
// Assembly of the routing components from configuration.

#include "Switchboard/RouterService.hpp"
#include "Switchboard/DifficultyMapping.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/HttpClassifierClient.hpp"
#include "Switchboard/KeywordClassifierClient.hpp"
#include "Switchboard/Logger.hpp"
#include "Switchboard/PolicySource.hpp"

namespace Switchboard {

RouterService::RouterService(const ServiceConfig& config) : m_config(config) {
    m_features = std::make_shared<FeatureExtractor>(m_config.features);

    buildRegistry();
    buildClassifier();
    buildPolicyStore();
    buildScoring();

    if (m_config.decision_log.enabled) {
        auto sink = std::make_shared<JsonlDecisionSink>(m_config.decision_log.path);
        m_decision_log = std::make_shared<DecisionLog>(sink, m_config.decision_log.queue);
    }

    m_router = std::make_unique<Router>(m_registry, m_policies, m_classifier, m_scoring, m_features,
                                        m_decision_log);

    Logger::getInstance().info("RouterService", "Router assembled",
        "classifier=" + m_classifier->getClientName() + ", policies=" + m_policies->getSourceName() +
        ", decisions=" + (m_decision_log ? m_decision_log->getSinkName() : std::string("disabled")));
}

RouterService::~RouterService() {
    stop();
    if (m_decision_log) {
        m_decision_log->flush();
    }
}

void RouterService::configureLogging(const LoggingSettings& logging) {
    Logger& logger = Logger::getInstance();
    logger.setConsoleLogging(logging.console);
    try {
        logger.setConsoleLogLevel(Logger::parseLevel(logging.level));
        logger.setFileLogLevel(Logger::parseLevel(logging.file_level));
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
    LoggerConfig file_config;
    file_config.directory = logging.directory;
    logger.initialize(file_config);
}

void RouterService::buildRegistry() {
    RegistryConfig registry_config = m_config.registry;
    registry_config.auto_load = false;
    m_registry = std::make_shared<ExecutorRegistry>(registry_config);

    std::vector<RegistryStatus> loads;
    if (!registry_config.config_file_path.empty()) {
        loads.push_back(m_registry->loadFromConfig(registry_config.config_file_path));
    }
    loads.push_back(m_registry->registerAll(m_config.executors));

    for (const auto& status : loads) {
        for (const auto& result : status.results) {
            if (!result.success) {
                Logger::getInstance().warning("RouterService",
                    "Executor '" + result.executor_id + "' not registered", result.error_message);
            }
        }
    }
}

void RouterService::buildClassifier() {
    std::shared_ptr<ClassifierClient> client;
    if (m_config.classifier.backend == "http") {
        client = std::make_shared<HttpClassifierClient>(m_config.classifier.http);
    } else {
        client = std::make_shared<KeywordClassifierClient>();
    }
    m_classifier = std::make_shared<TaskClassifier>(client, m_config.classifier.bounds);
}

void RouterService::buildPolicyStore() {
    std::shared_ptr<PolicySource> source;
    if (m_config.policies.source == "http") {
        source = std::make_shared<HttpPolicySource>(m_config.policyLocation(),
                                                    m_config.policies.store.fetch_timeout);
    } else {
        source = std::make_shared<YamlPolicySource>(m_config.policyLocation());
    }
    m_policies = std::make_shared<PolicyStore>(source, m_config.policies.store);
}

void RouterService::buildScoring() {
    const size_t dimension = QueryFeatures::kDimension;
    const ScoringSettings& scoring = m_config.scoring;

    std::shared_ptr<const AbilityCheckpoint> initial;
    if (!scoring.checkpoint_path.empty()) {
        initial = std::make_shared<AbilityCheckpoint>(AbilityCheckpoint::loadFile(scoring.checkpoint_path));
    } else {
        AbilityCheckpoint checkpoint = AbilityCheckpoint::uniform(dimension);
        if (!scoring.weights.empty()) {
            if (scoring.weights.size() != dimension) {
                throw ConfigError("Scoring weights need " + std::to_string(dimension) + " entries, got " +
                                  std::to_string(scoring.weights.size()));
            }
            checkpoint.weights = scoring.weights;
        }
        initial = std::make_shared<AbilityCheckpoint>(checkpoint);
        Logger::getInstance().warning("RouterService",
            "No ability checkpoint configured; every model is scored with the missing-ability penalty");
    }

    m_abilities = std::make_shared<AbilityStore>(dimension, initial);
    auto mapping = std::make_shared<LinearDifficultyMapping>(scoring.difficulty_scale, scoring.difficulty_offset);
    m_scoring = std::make_shared<ScoringEngine>(m_abilities, mapping, scoring.engine);
}

size_t RouterService::start() {
    size_t live = m_registry->probeAll();
    Logger::getInstance().info("RouterService", std::to_string(live) + " executor(s) live after initial probe");
    if (m_config.registry.enable_background_probes) {
        m_registry->start();
    }
    return live;
}

void RouterService::stop() {
    if (m_registry && m_registry->isRunning()) {
        m_registry->stop();
    }
}

RoutingDecision RouterService::route(const RouteRequest& request) const {
    return m_router->route(request);
}

std::unique_ptr<RoutingSession> RouterService::beginSession(const RouteRequest& request) const {
    return m_router->beginSession(request);
}

bool RouterService::recordOutcome(const std::string& decision_id, const DecisionOutcome& outcome) {
    if (!m_decision_log) {
        return false;
    }
    return m_decision_log->recordOutcome(decision_id, outcome);
}

bool RouterService::reloadCheckpoint(const std::string& path) {
    std::string target = path.empty() ? m_config.scoring.checkpoint_path : path;
    if (target.empty()) {
        Logger::getInstance().warning("RouterService", "No checkpoint path to reload from");
        return false;
    }
    return m_abilities->reload(target);
}

std::string RouterService::describeCheckpoint() const {
    return m_abilities->describe();
}

} // namespace Switchboard
