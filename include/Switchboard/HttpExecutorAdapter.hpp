// =================================================================
// include/Switchboard/HttpExecutorAdapter.hpp
// =================================================================
// Probes executors that expose an OpenAI-compatible or Ollama HTTP API.

#pragma once

#include "Switchboard/ExecutorAdapter.hpp"
#include <chrono>
#include <string>

namespace Switchboard {

class HttpExecutorAdapter : public ExecutorAdapter {
public:
    /**
     * @brief Constructs the HTTP adapter.
     * @param descriptor Validated descriptor; endpoint is the server base URL
     *        (e.g., http://127.0.0.1:11434) and api selects "openai" or "ollama".
     */
    explicit HttpExecutorAdapter(const ExecutorDescriptor& descriptor);

    // ExecutorAdapter interface implementation
    std::vector<ModelInfo> listModels() override;
    bool healthCheck() override;
    TransportKind getTransport() const override;
    std::string getExecutorId() const override;

    /**
     * @brief Extract model ids from a model-listing response body
     *
     * Accepts both the OpenAI shape ({"data":[{"id":...}]}) and the Ollama
     * shape ({"models":[{"name":...}]}).
     * @throws std::runtime_error if the body is not a recognised listing
     */
    static std::vector<std::string> parseModelList(const std::string& body);

    /**
     * @brief Default health path for an API flavour
     */
    static std::string defaultHealthPath(const std::string& api);

    /**
     * @brief Default model listing path for an API flavour
     */
    static std::string modelListPath(const std::string& api);

private:
    std::string m_executor_id;
    std::string m_base_url;
    std::string m_api;
    std::string m_health_path;
    std::string m_api_key;
    std::chrono::milliseconds m_timeout;

    /**
     * @brief GET a path and return the status code and body
     * @throws std::runtime_error when the server cannot be reached
     */
    std::pair<int, std::string> httpGet(const std::string& path) const;
};

} // namespace Switchboard
