// =================================================================
// src/Switchboard/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Switchboard/CliParser.hpp"

namespace Switchboard {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Switchboard: cost-aware routing of LLM requests across live backends.");
    m_app->require_subcommand(1);

    m_app->add_option("-c,--config", m_commands.config_path, "Service configuration file (default: switchboard.yml)");
    m_app->add_flag("-q,--quiet", m_commands.quiet, "Only print results and errors");

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    // Define all commands
    setupRouteCommand(*m_app);
    setupExecutorsCommand(*m_app);
    setupPolicyCommand(*m_app);
    setupCheckpointCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupRouteCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("route", "Classify a prompt and print the routing decision.");
    sub->add_option("prompt", m_commands.prompt, "The prompt to route.")->required();
    sub->add_option("-x,--exclude", m_commands.excluded_models, "Model id that must not be selected (repeatable)");
    sub->add_option("--context", m_commands.context_turns, "Prior user turn, oldest first (repeatable)");
    sub->add_option("--timeout-ms", m_commands.timeout_ms, "Deadline for the routing decision in milliseconds")
        ->check(CLI::NonNegativeNumber);
}

void CliParser::setupExecutorsCommand(CLI::App& app) {
    auto* executors_cmd = app.add_subcommand("executors", "Inspect registered executors");
    executors_cmd->require_subcommand(1);

    auto* list_cmd = executors_cmd->add_subcommand("list", "Probe every executor and list its models and liveness");
    list_cmd->callback([this]() { m_commands.subcommand = "list"; });
}

void CliParser::setupPolicyCommand(CLI::App& app) {
    auto* policy_cmd = app.add_subcommand("policy", "Manage routing policies");
    policy_cmd->require_subcommand(1);

    // List subcommand
    auto* list_cmd = policy_cmd->add_subcommand("list", "List all policies");
    list_cmd->callback([this]() { m_commands.subcommand = "list"; });

    // Set subcommand
    auto* set_cmd = policy_cmd->add_subcommand("set", "Create or replace the policy for a domain/action pair");
    set_cmd->add_option("domain", m_commands.domain, "Domain, or * for any domain")->required();
    set_cmd->add_option("action", m_commands.action, "Action, or * for any action")->required();
    set_cmd->add_option("models", m_commands.model_ids, "Preferred model ids, best first")->required();
    set_cmd->add_option("--priority", m_commands.priority, "Priority among duplicate definitions");
    set_cmd->callback([this]() { m_commands.subcommand = "set"; });

    // Delete subcommand
    auto* delete_cmd = policy_cmd->add_subcommand("delete", "Delete the policy for a domain/action pair");
    delete_cmd->add_option("domain", m_commands.domain, "Domain of the policy")->required();
    delete_cmd->add_option("action", m_commands.action, "Action of the policy")->required();
    delete_cmd->callback([this]() { m_commands.subcommand = "delete"; });
}

void CliParser::setupCheckpointCommand(CLI::App& app) {
    auto* checkpoint_cmd = app.add_subcommand("checkpoint", "Inspect the ability checkpoint");
    checkpoint_cmd->require_subcommand(1);

    auto* info_cmd = checkpoint_cmd->add_subcommand("info", "Show the checkpoint version, weights and models");
    info_cmd->callback([this]() { m_commands.subcommand = "info"; });
}

} // namespace Switchboard
