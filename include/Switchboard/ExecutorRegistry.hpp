// =================================================================
// include/Switchboard/ExecutorRegistry.hpp
// =================================================================
// Registry of executor backends, their models and liveness.

#pragma once

#include "Switchboard/ExecutorAdapter.hpp"
#include "Switchboard/ModelCapabilities.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace YAML {
class Node;
}

namespace Switchboard {

/**
 * @brief Registry configuration
 */
struct RegistryConfig {
    std::string config_file_path;                            ///< Optional executors file
    bool auto_load = false;                                  ///< Load config_file_path on construction
    bool enable_background_probes = true;                    ///< Run the probe thread after start()
    std::chrono::milliseconds probe_interval{5000};          ///< Delay between probe passes
    std::chrono::milliseconds probe_timeout{2000};           ///< Bound on each adapter call
    std::chrono::milliseconds liveness_grace_period{60000};  ///< Unhealthy time before eviction
};

/**
 * @brief Liveness view of one executor
 */
struct ExecutorStatus {
    std::string id;
    TransportKind transport = TransportKind::HTTP;
    std::string endpoint;
    std::vector<std::string> capabilities;
    bool is_live = false;
    std::chrono::system_clock::time_point last_probed;   ///< Epoch if never probed
    size_t consecutive_failures = 0;
    std::string last_error;
};

/**
 * @brief Immutable view of the registry at one point in time
 *
 * Published by the probe path and shared with readers; never modified after
 * publication.
 */
struct RegistrySnapshot {
    uint64_t version = 0;
    std::chrono::system_clock::time_point taken_at;
    std::vector<ExecutorStatus> executors;   ///< Sorted by executor id
    std::vector<ModelInfo> models;           ///< Last-known models, sorted by (model id, executor id)

    /**
     * @brief Cheapest healthy entry for a model id
     *
     * When several live executors serve the model, the lowest cost wins and
     * equal costs go to the lowest executor id.
     * @return Pointer into this snapshot, or nullptr if no live executor serves it
     */
    const ModelInfo* findHealthyModel(const std::string& model_id) const;

    std::vector<ModelInfo> healthyModels() const;

    const ExecutorStatus* findExecutor(const std::string& executor_id) const;
};

/**
 * @brief Registration result for one executor
 */
struct RegistrationResult {
    bool success = false;
    std::string executor_id;
    std::string error_message;
};

/**
 * @brief Outcome of a bulk load
 */
struct RegistryStatus {
    size_t total_configured = 0;
    size_t registered = 0;
    size_t failed = 0;
    std::vector<RegistrationResult> results;
};

/**
 * @brief Tracks executors and the models they serve
 *
 * Writers (registration and probes) serialize on an internal mutex and
 * publish a fresh RegistrySnapshot after each change; readers only load
 * the current snapshot pointer and never wait for a probe.
 */
class ExecutorRegistry {
public:
    explicit ExecutorRegistry(const RegistryConfig& config = RegistryConfig());

    virtual ~ExecutorRegistry();

    ExecutorRegistry(const ExecutorRegistry&) = delete;
    ExecutorRegistry& operator=(const ExecutorRegistry&) = delete;

    /**
     * @brief Register an adapter factory for a transport
     * @param transport Transport name ("http", "cli", "rpc")
     * @param factory Builds an adapter from a validated descriptor
     */
    void registerAdapterFactory(const std::string& transport, AdapterFactory factory);

    /**
     * @brief Add or replace an executor
     *
     * A replaced executor keeps its last-known models with health cleared
     * until its next probe.
     *
     * @throws ConfigError if the descriptor is malformed or no adapter can be built
     */
    void registerExecutor(const ExecutorDescriptor& descriptor);

    /**
     * @brief Remove an executor from future snapshots
     * @return True if the executor was known; unknown ids are a no-op
     */
    bool deregisterExecutor(const std::string& executor_id);

    /**
     * @brief Probe one executor and publish the result
     *
     * Adapter calls run outside the registry lock and are bounded by the
     * probe timeout. Failures only affect future snapshots.
     *
     * @return True if the executor answered as healthy
     */
    bool probe(const std::string& executor_id);

    /**
     * @brief Probe every registered executor concurrently
     * @return Number of live executors after the pass
     */
    size_t probeAll();

    /**
     * @brief Current immutable snapshot, safe to call from any thread
     */
    std::shared_ptr<const RegistrySnapshot> snapshot() const;

    /**
     * @brief Register every executor in an `executors:` YAML file
     */
    RegistryStatus loadFromConfig(const std::string& config_path);

    /**
     * @brief Register every executor in an `executors:` map node
     */
    RegistryStatus loadFromNode(const YAML::Node& executors);

    /**
     * @brief Register a list of descriptors, collecting per-executor results
     */
    RegistryStatus registerAll(const std::vector<ExecutorDescriptor>& descriptors);

    /**
     * @brief Parse an `executors:` map node into descriptors
     * @throws ConfigError on wrongly typed fields
     */
    static std::vector<ExecutorDescriptor> parseExecutors(const YAML::Node& executors);

    void start();
    void stop();
    bool isRunning() const;

    std::string getExecutorInfo(const std::string& executor_id) const;
    std::string getAllExecutorsInfo() const;

    RegistryConfig getConfig() const;

protected:
    /**
     * @brief Validate a descriptor before an adapter is built
     * @throws ConfigError describing the first problem found
     */
    virtual void validateDescriptor(const ExecutorDescriptor& descriptor) const;

private:
    struct ExecutorEntry {
        ExecutorDescriptor descriptor;
        std::shared_ptr<ExecutorAdapter> adapter;
        ExecutorStatus status;
        std::vector<ModelInfo> models;
        std::chrono::steady_clock::time_point last_healthy;
        uint64_t generation = 0;
    };

    struct ProbeOutcome {
        bool healthy = false;
        std::vector<ModelInfo> models;
        std::string error;
    };

    RegistryConfig m_config;
    std::unordered_map<std::string, AdapterFactory> m_factories;
    std::map<std::string, ExecutorEntry> m_executors;
    uint64_t m_generation_counter = 0;
    uint64_t m_snapshot_version = 0;
    mutable std::mutex m_registry_mutex;

    std::shared_ptr<const RegistrySnapshot> m_snapshot;

    std::unique_ptr<std::thread> m_probe_thread;
    std::atomic<bool> m_stop_probes{false};
    std::mutex m_probe_wait_mutex;
    std::condition_variable m_probe_cv;

    ProbeOutcome runProbe(const std::shared_ptr<ExecutorAdapter>& adapter,
                          const std::string& executor_id,
                          std::chrono::milliseconds timeout) const;
    std::vector<ModelInfo> enrichModels(const ExecutorDescriptor& descriptor,
                                        std::vector<ModelInfo> models) const;
    bool evictIfExpiredLocked(const std::string& executor_id);
    void publishSnapshotLocked();
    void probeLoop();
};

} // namespace Switchboard
