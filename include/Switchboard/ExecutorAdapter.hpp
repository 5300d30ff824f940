// =================================================================
// include/Switchboard/ExecutorAdapter.hpp
// =================================================================
// Transport-independent contract for probing an executor backend.

#pragma once

#include "Switchboard/ModelCapabilities.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace Switchboard {

/**
 * @brief How the router reaches an executor
 */
enum class TransportKind {
    HTTP,   ///< HTTP API (OpenAI-compatible or Ollama)
    CLI,    ///< Local subprocess
    RPC     ///< Caller-supplied RPC adapter
};

/**
 * @brief Registration record for one executor
 */
struct ExecutorDescriptor {
    std::string id;                               ///< Unique executor identifier
    std::string transport;                        ///< "http", "cli" or "rpc"
    std::string endpoint;                         ///< Base URL (http) or executable (cli)
    std::string api = "openai";                   ///< HTTP flavour: "openai" or "ollama"
    std::string health_path;                      ///< HTTP health path, empty for the API default
    std::vector<std::string> list_args{"list"};   ///< CLI arguments that print the model table
    std::vector<std::string> health_args{"--version"}; ///< CLI arguments used as a health check
    std::vector<std::string> capabilities;        ///< Declared executor capabilities
    double default_cost_per_million_tokens = 0.0; ///< Cost for models not declared below
    std::vector<ModelInfo> declared_models;       ///< Pricing / context / tags per model id
    std::chrono::milliseconds timeout{0};         ///< Per-call bound, 0 for the registry probe timeout
    std::unordered_map<std::string, std::string> attributes; ///< Transport-specific extras
};

/**
 * @brief Two-method probe contract every transport implements
 *
 * Implementations may block on I/O; the registry bounds each call and never
 * calls an adapter from the request path.
 */
class ExecutorAdapter {
public:
    virtual ~ExecutorAdapter() = default;

    /**
     * @brief Query the models the executor currently serves
     * @return Models with id and display name filled in
     * @throws std::exception when the executor cannot be queried
     */
    virtual std::vector<ModelInfo> listModels() = 0;

    /**
     * @brief Check whether the executor is alive
     * @return True if the executor answered as healthy
     */
    virtual bool healthCheck() = 0;

    virtual TransportKind getTransport() const = 0;

    virtual std::string getExecutorId() const = 0;
};

/**
 * @brief Builds an adapter for a validated descriptor
 */
using AdapterFactory = std::function<std::shared_ptr<ExecutorAdapter>(const ExecutorDescriptor&)>;

/**
 * @brief Convert transport kind to its configuration string
 */
std::string transportToString(TransportKind transport);

/**
 * @brief Parse a transport string ("http", "cli", "rpc", case-insensitive)
 * @throws ConfigError for unknown transports
 */
TransportKind stringToTransport(const std::string& str);

} // namespace Switchboard
