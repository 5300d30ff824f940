// =================================================================
// include/Switchboard/ServiceConfig.hpp
// =================================================================
// Typed view of the switchboard.yml service configuration.

#pragma once

#include "Switchboard/DecisionLog.hpp"
#include "Switchboard/ExecutorAdapter.hpp"
#include "Switchboard/ExecutorRegistry.hpp"
#include "Switchboard/FeatureExtractor.hpp"
#include "Switchboard/HttpClassifierClient.hpp"
#include "Switchboard/PolicyStore.hpp"
#include "Switchboard/ScoringEngine.hpp"
#include "Switchboard/TaskClassifier.hpp"
#include <string>
#include <vector>

namespace Switchboard {

struct LoggingSettings {
    std::string level = "info";            ///< Console level
    std::string file_level = "debug";
    std::string directory = ".switchboard/logs";
    bool console = true;
};

struct ClassifierSettings {
    std::string backend = "keyword";       ///< "keyword" or "http"
    HttpClassifierConfig http;
    TaskClassifierConfig bounds;
};

struct PolicySettings {
    std::string source = "file";           ///< "file" or "http"
    std::string location;                  ///< Policy file or base URL; empty means the service file
    PolicyStoreConfig store;
};

struct ScoringSettings {
    std::string checkpoint_path;           ///< Empty for a uniform checkpoint
    std::vector<double> weights;           ///< Weights of the uniform checkpoint, empty for ones
    ScoringConfig engine;
    std::vector<double> difficulty_scale;
    std::vector<double> difficulty_offset;
};

struct DecisionLogSettings {
    bool enabled = true;
    std::string path = ".switchboard/decisions.jsonl";
    DecisionLogConfig queue;
};

/**
 * @brief Complete service configuration
 *
 * Every section is optional; missing keys keep the defaults above.
 */
struct ServiceConfig {
    std::string source_path;               ///< File the configuration was read from
    LoggingSettings logging;
    FeatureExtractorConfig features;
    RegistryConfig registry;
    std::vector<ExecutorDescriptor> executors;   ///< Inline `executors:` entries
    ClassifierSettings classifier;
    PolicySettings policies;
    ScoringSettings scoring;
    DecisionLogSettings decision_log;

    /**
     * @brief Load and validate a service file
     * @throws ConfigError if the file is missing, malformed or holds invalid values
     */
    static ServiceConfig loadFromFile(const std::string& path);

    /**
     * @brief Parse a service configuration held in memory
     * @param base_path Reported as source_path and used for file policy sources
     * @throws ConfigError on malformed YAML or invalid values
     */
    static ServiceConfig loadFromString(const std::string& yaml, const std::string& base_path = "");

    /**
     * @brief Path of the policy file, or URL of the policy store
     */
    std::string policyLocation() const;
};

} // namespace Switchboard
