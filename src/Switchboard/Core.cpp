// =================================================================
// src/Switchboard/Core.cpp
// =================================================================
// Implementation of the command handlers of the switchboard CLI.

#include "Switchboard/Core.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include "Switchboard/RouterService.hpp"
#include "Switchboard/ServiceConfig.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>

namespace Switchboard {

namespace {

// Exit codes beyond the generic 1
constexpr int kExitNoCandidates = 3;
constexpr int kExitCancelled = 4;

void printDecision(const RoutingDecision& decision) {
    const Classification& classification = decision.classification;

    std::cout << "Selected: " << decision.selected_model << " (executor " << decision.selected_executor << ")\n";
    std::cout << "Classification: " << classification.domain << "/" << classification.action
              << std::fixed << std::setprecision(2) << " (confidence " << classification.confidence << ", "
              << classification.source << (classification.is_fallback ? ", fallback" : "") << ")\n";
    std::cout << "Policy match: " << decision.policy_match << (decision.policy_stale ? " (stale)" : "") << "\n";
    std::cout << "Candidates:\n";

    size_t position = 1;
    for (const auto& candidate : decision.candidates) {
        std::cout << "  " << position++ << ". " << candidate.model_id << " [" << candidate.executor_id << "]"
                  << std::setprecision(3) << "  p=" << candidate.success_probability
                  << "  weighted=" << candidate.weighted_score
                  << std::setprecision(2) << "  cost=" << candidate.cost_per_million_tokens << "/Mtok"
                  << (candidate.ability_missing ? "  (no ability vector)" : "") << "\n";
    }

    std::cout << "Confidence: " << std::setprecision(3) << decision.confidence << "\n";
    std::cout << "Reasoning: " << decision.reasoning << "\n";
    std::cout << "Decision id: " << decision.decision_id << "\n";
    std::cout << "Latency: " << decision.latency.count() << "ms" << std::endl;
}

} // namespace

Core::Core(const Commands& commands) : m_commands(commands) {}

Core::~Core() = default;

int Core::run() {
    auto start_time = std::chrono::steady_clock::now();

    try {
        m_config = std::make_unique<ServiceConfig>(ServiceConfig::loadFromFile(m_commands.config_path));
        if (m_commands.quiet) {
            m_config->logging.console = false;
        }
        RouterService::configureLogging(m_config->logging);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    Logger::getInstance().logSessionStart(m_commands.active_command, m_commands.prompt);

    int exit_code = 1;
    if (m_commands.active_command == "route") {
        exit_code = handleRoute();
    } else if (m_commands.active_command == "executors") {
        exit_code = handleExecutors();
    } else if (m_commands.active_command == "policy") {
        exit_code = handlePolicy();
    } else if (m_commands.active_command == "checkpoint") {
        exit_code = handleCheckpoint();
    } else if (m_commands.active_command.empty()) {
        exit_code = 0;
    } else {
        std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    Logger::getInstance().logSessionEnd(m_commands.active_command, exit_code, static_cast<long>(duration.count()));
    return exit_code;
}

RouterService& Core::service(bool with_decision_log) {
    if (!m_service) {
        ServiceConfig config = *m_config;
        // A CLI invocation probes once and exits
        config.registry.enable_background_probes = false;
        if (!with_decision_log) {
            config.decision_log.enabled = false;
        }
        m_service = std::make_unique<RouterService>(config);
    }
    return *m_service;
}

int Core::handleRoute() {
    try {
        RouterService& router = service(true);
        router.start();

        RouteRequest request;
        request.prompt = m_commands.prompt;
        for (const auto& turn : m_commands.context_turns) {
            request.context.push_back(ConversationTurn{"user", turn});
        }
        request.excluded_model_ids.insert(m_commands.excluded_models.begin(), m_commands.excluded_models.end());
        if (m_commands.timeout_ms > 0) {
            request.cancellation = CancellationToken::withTimeout(std::chrono::milliseconds(m_commands.timeout_ms));
        }

        RoutingDecision decision = router.route(request);
        printDecision(decision);
        return 0;

    } catch (const NoEligibleCandidates& e) {
        std::cerr << "✗ No eligible candidates: " << e.what() << std::endl;
        return kExitNoCandidates;
    } catch (const Cancelled& e) {
        std::cerr << "✗ " << e.what() << std::endl;
        return kExitCancelled;
    } catch (const SwitchboardError& e) {
        std::cerr << "✗ " << errorCodeToString(e.code()) << ": " << e.what() << std::endl;
        return 1;
    }
}

int Core::handleExecutors() {
    try {
        RouterService& router = service(false);
        if (m_commands.subcommand == "list") {
            size_t live = router.start();
            std::cout << router.getRegistry()->getAllExecutorsInfo() << std::endl;
            std::cout << live << " executor(s) live" << std::endl;
            return 0;
        }
    } catch (const SwitchboardError& e) {
        std::cerr << "✗ " << e.what() << std::endl;
        return 1;
    }

    std::cerr << "Error: Unknown executors subcommand '" << m_commands.subcommand << "'." << std::endl;
    return 1;
}

int Core::handlePolicy() {
    try {
        auto policies = service(false).getPolicyStore();

        if (m_commands.subcommand == "list") {
            auto entries = policies->listPolicies();
            if (entries.empty()) {
                std::cout << "No policies defined in " << policies->getSourceName() << std::endl;
                return 0;
            }
            std::cout << "Policies (" << policies->getSourceName() << "):" << std::endl;
            for (const auto& policy : entries) {
                std::cout << "  " << policy.domain << "/" << policy.action << " ->";
                for (const auto& model_id : policy.model_ids) {
                    std::cout << " " << model_id;
                }
                if (policy.priority != 0) {
                    std::cout << "  (priority " << policy.priority << ")";
                }
                std::cout << std::endl;
            }
            return 0;

        } else if (m_commands.subcommand == "set") {
            Policy policy;
            policy.domain = m_commands.domain;
            policy.action = m_commands.action;
            policy.model_ids = m_commands.model_ids;
            policy.priority = m_commands.priority;
            policies->upsertPolicy(policy);
            std::cout << "✓ Policy " << policy.domain << "/" << policy.action << " saved" << std::endl;
            return 0;

        } else if (m_commands.subcommand == "delete") {
            if (policies->removePolicy(m_commands.domain, m_commands.action)) {
                std::cout << "✓ Policy " << m_commands.domain << "/" << m_commands.action << " deleted" << std::endl;
                return 0;
            }
            std::cout << "✗ No policy for " << m_commands.domain << "/" << m_commands.action << std::endl;
            return 1;
        }
    } catch (const SwitchboardError& e) {
        std::cerr << "✗ " << e.what() << std::endl;
        return 1;
    } catch (const std::runtime_error& e) {
        // Policy source I/O failures
        std::cerr << "✗ " << e.what() << std::endl;
        return 1;
    }

    std::cerr << "Error: Unknown policy subcommand '" << m_commands.subcommand << "'." << std::endl;
    return 1;
}

int Core::handleCheckpoint() {
    try {
        RouterService& router = service(false);
        if (m_commands.subcommand == "info") {
            std::cout << router.describeCheckpoint() << std::endl;
            return 0;
        }
    } catch (const SwitchboardError& e) {
        std::cerr << "✗ " << e.what() << std::endl;
        return 1;
    }

    std::cerr << "Error: Unknown checkpoint subcommand '" << m_commands.subcommand << "'." << std::endl;
    return 1;
}

} // namespace Switchboard
