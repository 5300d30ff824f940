// =================================================================
// src/Switchboard/CliExecutorAdapter.cpp
// =================================================================

#include "Switchboard/CliExecutorAdapter.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace Switchboard {

CliExecutorAdapter::CliExecutorAdapter(const ExecutorDescriptor& descriptor)
    : m_executor_id(descriptor.id),
      m_command(descriptor.endpoint),
      m_list_args(descriptor.list_args),
      m_health_args(descriptor.health_args),
      m_timeout(descriptor.timeout.count() > 0 ? descriptor.timeout : std::chrono::milliseconds(2000)) {}

std::vector<ModelInfo> CliExecutorAdapter::listModels() {
    CommandResult result = m_sys.executeCommand(m_command, m_list_args, m_timeout);
    if (result.timed_out) {
        throw std::runtime_error("'" + m_command + "' timed out after " + std::to_string(m_timeout.count()) + "ms");
    }
    if (result.exit_code != 0) {
        throw std::runtime_error("'" + m_command + "' exited with code " +
                                 std::to_string(result.exit_code) + ": " + result.output);
    }

    std::vector<ModelInfo> models;
    for (const auto& id : parseModelTable(result.output)) {
        ModelInfo model;
        model.id = id;
        model.executor_id = m_executor_id;
        model.display_name = id;
        models.push_back(model);
    }
    return models;
}

bool CliExecutorAdapter::healthCheck() {
    return m_sys.executeCommand(m_command, m_health_args, m_timeout).exit_code == 0;
}

TransportKind CliExecutorAdapter::getTransport() const {
    return TransportKind::CLI;
}

std::string CliExecutorAdapter::getExecutorId() const {
    return m_executor_id;
}

std::vector<std::string> CliExecutorAdapter::parseModelTable(const std::string& output) {
    std::vector<std::string> ids;
    std::istringstream stream(output);
    std::string line;
    bool first_row = true;
    
    while (std::getline(stream, line)) {
        std::istringstream columns(line);
        std::string first_column;
        if (!(columns >> first_column)) {
            continue;
        }
        
        if (first_row) {
            first_row = false;
            std::string upper = first_column;
            std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
            if (upper == "NAME" || upper == "MODEL") {
                continue;
            }
        }
        
        ids.push_back(first_column);
    }
    
    return ids;
}

} // namespace Switchboard
