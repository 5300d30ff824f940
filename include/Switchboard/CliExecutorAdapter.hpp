// =================================================================
// include/Switchboard/CliExecutorAdapter.hpp
// =================================================================
// Probes executors reachable only through a local command-line tool
// (e.g. `ollama list`).

#pragma once

#include "Switchboard/ExecutorAdapter.hpp"
#include "Switchboard/SysInteraction.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace Switchboard {

class CliExecutorAdapter : public ExecutorAdapter {
public:
    /**
     * @brief Constructs the subprocess adapter.
     * @param descriptor Validated descriptor; endpoint names the executable.
     */
    explicit CliExecutorAdapter(const ExecutorDescriptor& descriptor);

    std::vector<ModelInfo> listModels() override;
    bool healthCheck() override;
    TransportKind getTransport() const override;
    std::string getExecutorId() const override;

    /**
     * @brief Parse the tabular output of a model listing command
     *
     * The first column of each row is the model id. A leading header row
     * (first column "NAME" or "MODEL") is skipped, as are blank lines.
     */
    static std::vector<std::string> parseModelTable(const std::string& output);

private:
    std::string m_executor_id;
    std::string m_command;
    std::vector<std::string> m_list_args;
    std::vector<std::string> m_health_args;
    std::chrono::milliseconds m_timeout;
    SysInteraction m_sys;
};

} // namespace Switchboard
