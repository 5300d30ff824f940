// =================================================================
// src/Switchboard/ServiceConfig.cpp
// =================================================================
// Parsing and validation of the service configuration file.

#include "Switchboard/ServiceConfig.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include "Switchboard/SysInteraction.hpp"
#include <yaml-cpp/yaml.h>
#include <cmath>
#include <stdexcept>

namespace Switchboard {

namespace {

std::vector<std::string> readStringList(const YAML::Node& node) {
    std::vector<std::string> values;
    if (!node) {
        return values;
    }
    if (node.IsScalar()) {
        values.push_back(node.as<std::string>());
        return values;
    }
    for (const auto& item : node) {
        values.push_back(item.as<std::string>());
    }
    return values;
}

std::vector<double> readNumberList(const YAML::Node& node, const std::string& key) {
    std::vector<double> values;
    if (!node) {
        return values;
    }
    if (!node.IsSequence()) {
        throw ConfigError("'" + key + "' must be a list of numbers");
    }
    for (const auto& item : node) {
        double value = item.as<double>();
        if (!std::isfinite(value)) {
            throw ConfigError("'" + key + "' contains a non-finite number");
        }
        values.push_back(value);
    }
    return values;
}

std::chrono::milliseconds readMillis(const YAML::Node& section, const std::string& key,
                                     std::chrono::milliseconds fallback, bool allow_zero = false) {
    const YAML::Node node = section[key];
    if (!node) {
        return fallback;
    }
    long long value = node.as<long long>();
    if (value < 0 || (!allow_zero && value == 0)) {
        throw ConfigError("'" + key + "' must be " + (allow_zero ? "non-negative" : "positive") +
                          ", got " + std::to_string(value));
    }
    return std::chrono::milliseconds(value);
}

double readNonNegative(const YAML::Node& section, const std::string& key, double fallback) {
    const YAML::Node node = section[key];
    if (!node) {
        return fallback;
    }
    double value = node.as<double>();
    if (!std::isfinite(value) || value < 0.0) {
        throw ConfigError("'" + key + "' must be a non-negative number");
    }
    return value;
}

size_t readPositiveCount(const YAML::Node& section, const std::string& key, size_t fallback) {
    const YAML::Node node = section[key];
    if (!node) {
        return fallback;
    }
    long long value = node.as<long long>();
    if (value <= 0) {
        throw ConfigError("'" + key + "' must be a positive integer");
    }
    return static_cast<size_t>(value);
}

void requireMap(const YAML::Node& node, const std::string& name) {
    if (node && !node.IsMap()) {
        throw ConfigError("Section '" + name + "' must be a mapping");
    }
}

void parseLogging(const YAML::Node& node, LoggingSettings& logging) {
    requireMap(node, "logging");
    if (!node) {
        return;
    }
    logging.level = node["level"].as<std::string>(logging.level);
    logging.file_level = node["file_level"].as<std::string>(logging.file_level);
    logging.directory = node["directory"].as<std::string>(logging.directory);
    logging.console = node["console"].as<bool>(logging.console);

    try {
        Logger::parseLevel(logging.level);
        Logger::parseLevel(logging.file_level);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
}

void parseFeatures(const YAML::Node& node, FeatureExtractorConfig& features) {
    requireMap(node, "features");
    if (!node) {
        return;
    }
    if (node["max_context_turns"]) {
        long long turns = node["max_context_turns"].as<long long>();
        if (turns < 0) {
            throw ConfigError("'max_context_turns' must be non-negative");
        }
        features.max_context_turns = static_cast<size_t>(turns);
    }
    features.chars_per_token = readPositiveCount(node, "chars_per_token", features.chars_per_token);
}

void parseRegistry(const YAML::Node& node, RegistryConfig& registry) {
    requireMap(node, "registry");
    if (!node) {
        return;
    }
    registry.probe_interval = readMillis(node, "probe_interval_ms", registry.probe_interval);
    registry.probe_timeout = readMillis(node, "probe_timeout_ms", registry.probe_timeout);
    registry.liveness_grace_period = readMillis(node, "liveness_grace_period_ms",
                                                registry.liveness_grace_period, true);
    registry.enable_background_probes = node["background_probes"].as<bool>(registry.enable_background_probes);
    registry.config_file_path = node["executors_file"].as<std::string>(registry.config_file_path);
}

void parseClassifier(const YAML::Node& node, ClassifierSettings& classifier) {
    requireMap(node, "classifier");
    if (!node) {
        return;
    }
    classifier.backend = node["backend"].as<std::string>(classifier.backend);
    if (classifier.backend != "keyword" && classifier.backend != "http") {
        throw ConfigError("Unknown classifier backend '" + classifier.backend + "' (expected keyword or http)");
    }

    classifier.bounds.timeout = readMillis(node, "timeout_ms", classifier.bounds.timeout);
    classifier.bounds.fallback_domain = node["fallback_domain"].as<std::string>(classifier.bounds.fallback_domain);
    classifier.bounds.fallback_action = node["fallback_action"].as<std::string>(classifier.bounds.fallback_action);
    classifier.bounds.fallback_confidence =
        node["fallback_confidence"].as<double>(classifier.bounds.fallback_confidence);
    if (classifier.bounds.fallback_domain.empty() || classifier.bounds.fallback_action.empty()) {
        throw ConfigError("Fallback domain and action must not be empty");
    }
    if (!(classifier.bounds.fallback_confidence >= 0.0 && classifier.bounds.fallback_confidence <= 1.0)) {
        throw ConfigError("'fallback_confidence' must be within [0, 1]");
    }

    HttpClassifierConfig& http = classifier.http;
    http.endpoint = node["endpoint"].as<std::string>(http.endpoint);
    http.model = node["model"].as<std::string>(http.model);
    http.api_key = node["api_key"].as<std::string>(http.api_key);
    http.max_tokens = readPositiveCount(node, "max_tokens", http.max_tokens);
    // The HTTP client gives up with the classifier bound
    http.timeout = classifier.bounds.timeout;
    if (node["domains"]) {
        http.domains = readStringList(node["domains"]);
    }
    if (node["actions"]) {
        http.actions = readStringList(node["actions"]);
    }
}

void parsePolicyStore(const YAML::Node& node, PolicySettings& policies) {
    requireMap(node, "policy_store");
    if (!node) {
        return;
    }
    policies.source = node["source"].as<std::string>(policies.source);
    if (policies.source != "file" && policies.source != "http") {
        throw ConfigError("Unknown policy source '" + policies.source + "' (expected file or http)");
    }
    policies.location = node["location"].as<std::string>(policies.location);
    policies.store.cache_ttl = readMillis(node, "cache_ttl_ms", policies.store.cache_ttl, true);
    policies.store.fetch_timeout = readMillis(node, "fetch_timeout_ms", policies.store.fetch_timeout);
    policies.store.default_models = readStringList(node["default_models"]);

    if (policies.source == "http" && policies.location.empty()) {
        throw ConfigError("An http policy source needs a location URL");
    }
}

void parseScoring(const YAML::Node& node, ScoringSettings& scoring) {
    requireMap(node, "scoring");
    if (!node) {
        return;
    }
    scoring.checkpoint_path = node["checkpoint"].as<std::string>(scoring.checkpoint_path);
    scoring.weights = readNumberList(node["weights"], "weights");
    for (double weight : scoring.weights) {
        if (weight < 0.0) {
            throw ConfigError("Scoring weights must be non-negative");
        }
    }

    ScoringConfig& engine = scoring.engine;
    engine.missing_ability_penalty = readNonNegative(node, "missing_ability_penalty", engine.missing_ability_penalty);
    engine.cost_weight = readNonNegative(node, "cost_weight", engine.cost_weight);
    engine.fixed_overhead = readNonNegative(node, "fixed_overhead", engine.fixed_overhead);
    engine.cost_epsilon = readNonNegative(node, "cost_epsilon", engine.cost_epsilon);
    engine.probability_floor = readNonNegative(node, "probability_floor", engine.probability_floor);

    const YAML::Node difficulty = node["difficulty"];
    requireMap(difficulty, "scoring.difficulty");
    if (difficulty) {
        scoring.difficulty_scale = readNumberList(difficulty["scale"], "difficulty.scale");
        scoring.difficulty_offset = readNumberList(difficulty["offset"], "difficulty.offset");
    }
}

void parseDecisionLog(const YAML::Node& node, DecisionLogSettings& decision_log) {
    requireMap(node, "decision_log");
    if (!node) {
        return;
    }
    decision_log.enabled = node["enabled"].as<bool>(decision_log.enabled);
    decision_log.path = node["path"].as<std::string>(decision_log.path);
    decision_log.queue.queue_capacity = readPositiveCount(node, "queue_capacity",
                                                          decision_log.queue.queue_capacity);
    decision_log.queue.max_tracked_decisions = readPositiveCount(node, "max_tracked_decisions",
                                                                 decision_log.queue.max_tracked_decisions);
    if (decision_log.enabled && decision_log.path.empty()) {
        throw ConfigError("Decision log path must not be empty");
    }
}

ServiceConfig parseRoot(const YAML::Node& root, const std::string& base_path) {
    ServiceConfig config;
    config.source_path = base_path;

    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError("Service configuration must be a mapping");
    }

    try {
        parseLogging(root["logging"], config.logging);
        parseFeatures(root["features"], config.features);
        parseRegistry(root["registry"], config.registry);
        parseClassifier(root["classifier"], config.classifier);
        parsePolicyStore(root["policy_store"], config.policies);
        parseScoring(root["scoring"], config.scoring);
        parseDecisionLog(root["decision_log"], config.decision_log);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid service configuration" +
                          (base_path.empty() ? std::string() : " in " + base_path) + ": " + e.what());
    }

    config.executors = ExecutorRegistry::parseExecutors(root["executors"]);

    if (config.policies.source == "file" && config.policies.location.empty() && base_path.empty()) {
        throw ConfigError("A file policy source needs a location when the configuration has no file");
    }

    return config;
}

} // namespace

ServiceConfig ServiceConfig::loadFromFile(const std::string& path) {
    SysInteraction sys;
    if (!sys.fileExists(path)) {
        throw ConfigError("Configuration file not found: " + path);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse " + path + ": " + e.what());
    }
    return parseRoot(root, path);
}

ServiceConfig ServiceConfig::loadFromString(const std::string& yaml, const std::string& base_path) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Failed to parse configuration: ") + e.what());
    }
    return parseRoot(root, base_path);
}

std::string ServiceConfig::policyLocation() const {
    if (!policies.location.empty()) {
        return policies.location;
    }
    return source_path;
}

} // namespace Switchboard
