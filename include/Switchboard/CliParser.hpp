// =================================================================
// include/Switchboard/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Switchboard {

// A simple struct to hold parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered
    std::string subcommand;     // Nested subcommand (list, set, delete, info)

    // Global options
    std::string config_path = "switchboard.yml";
    bool quiet = false;

    // Options for 'route'
    std::string prompt;
    std::vector<std::string> context_turns;
    std::vector<std::string> excluded_models;
    long timeout_ms = 0;        // 0 means no deadline

    // Options for 'policy'
    std::string domain;
    std::string action;
    std::vector<std::string> model_ids;
    int priority = 0;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupRouteCommand(CLI::App& app);
    void setupExecutorsCommand(CLI::App& app);
    void setupPolicyCommand(CLI::App& app);
    void setupCheckpointCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Switchboard
