// =================================================================
// include/Switchboard/Core.hpp
// =================================================================
// Dispatches parsed switchboard commands to the routing service.

#pragma once

#include "Switchboard/CliParser.hpp"
#include <memory>
#include <string>

namespace Switchboard {

class RouterService;
struct ServiceConfig;

/**
 * @brief Runs one CLI invocation
 *
 * The configuration is read once per run; the RouterService is only built
 * by the handlers that need executors or policies.
 */
class Core {
public:
    explicit Core(const Commands& commands);
    ~Core();

    /**
     * @brief Run the active subcommand
     * @return 0 on success, 3 with no eligible candidate, 4 when cancelled, 1 otherwise
     */
    int run();

private:
    int handleRoute();
    int handleExecutors();
    int handlePolicy();
    int handleCheckpoint();

    /**
     * @brief Build the service; the decision log is only opened for routing
     */
    RouterService& service(bool with_decision_log);

    const Commands& m_commands;
    std::unique_ptr<ServiceConfig> m_config;
    std::unique_ptr<RouterService> m_service;
};

} // namespace Switchboard
