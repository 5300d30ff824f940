// =================================================================
// src/Switchboard/ExecutorRegistry.cpp
// =================================================================
// Implementation of the executor registry and its probe loop.

#include "Switchboard/ExecutorRegistry.hpp"
#include "Switchboard/Cancellation.hpp"
#include "Switchboard/CliExecutorAdapter.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/HttpExecutorAdapter.hpp"
#include "Switchboard/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <future>
#include <iomanip>
#include <sstream>

namespace Switchboard {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::vector<std::string> readStringList(const YAML::Node& node) {
    std::vector<std::string> values;
    if (!node) {
        return values;
    }
    if (node.IsScalar()) {
        values.push_back(node.as<std::string>());
        return values;
    }
    for (const auto& item : node) {
        values.push_back(item.as<std::string>());
    }
    return values;
}

std::string formatTime(std::chrono::system_clock::time_point time_point) {
    if (time_point.time_since_epoch().count() == 0) {
        return "never";
    }
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);
    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace

const ModelInfo* RegistrySnapshot::findHealthyModel(const std::string& model_id) const {
    const ModelInfo* best = nullptr;
    // Entries are ordered by executor id within a model id
    for (const auto& model : models) {
        if (model.id != model_id || !model.is_healthy) {
            continue;
        }
        if (!best || model.cost_per_million_tokens < best->cost_per_million_tokens) {
            best = &model;
        }
    }
    return best;
}

std::vector<ModelInfo> RegistrySnapshot::healthyModels() const {
    std::vector<ModelInfo> healthy;
    for (const auto& model : models) {
        if (model.is_healthy) {
            healthy.push_back(model);
        }
    }
    return healthy;
}

const ExecutorStatus* RegistrySnapshot::findExecutor(const std::string& executor_id) const {
    for (const auto& executor : executors) {
        if (executor.id == executor_id) {
            return &executor;
        }
    }
    return nullptr;
}

ExecutorRegistry::ExecutorRegistry(const RegistryConfig& config) : m_config(config) {
    // Register default adapter factories
    m_factories["http"] = [](const ExecutorDescriptor& descriptor) {
        return std::make_shared<HttpExecutorAdapter>(descriptor);
    };
    m_factories["cli"] = [](const ExecutorDescriptor& descriptor) {
        return std::make_shared<CliExecutorAdapter>(descriptor);
    };

    {
        std::lock_guard<std::mutex> lock(m_registry_mutex);
        publishSnapshotLocked();
    }

    if (m_config.auto_load && !m_config.config_file_path.empty()) {
        loadFromConfig(m_config.config_file_path);
    }
}

ExecutorRegistry::~ExecutorRegistry() {
    stop();
}

void ExecutorRegistry::registerAdapterFactory(const std::string& transport, AdapterFactory factory) {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    m_factories[toLower(transport)] = std::move(factory);
    Logger::getInstance().info("ExecutorRegistry", "Registered adapter factory for transport: " + transport);
}

void ExecutorRegistry::validateDescriptor(const ExecutorDescriptor& descriptor) const {
    if (descriptor.id.empty()) {
        throw ConfigError("Executor descriptor missing id");
    }
    if (descriptor.transport.empty()) {
        throw ConfigError("Executor '" + descriptor.id + "' missing transport");
    }

    TransportKind transport = stringToTransport(descriptor.transport);

    if (transport == TransportKind::HTTP) {
        if (descriptor.endpoint.empty()) {
            throw ConfigError("HTTP executor '" + descriptor.id + "' missing endpoint");
        }
        if (descriptor.endpoint.rfind("http://", 0) != 0 && descriptor.endpoint.rfind("https://", 0) != 0) {
            throw ConfigError("HTTP executor '" + descriptor.id + "' endpoint must start with http:// or https://");
        }
        if (descriptor.api != "openai" && descriptor.api != "ollama") {
            throw ConfigError("HTTP executor '" + descriptor.id + "' has unknown api: " + descriptor.api);
        }
    } else if (transport == TransportKind::CLI) {
        if (descriptor.endpoint.empty()) {
            throw ConfigError("CLI executor '" + descriptor.id + "' missing command");
        }
    }

    if (descriptor.default_cost_per_million_tokens < 0.0) {
        throw ConfigError("Executor '" + descriptor.id + "' has negative default cost");
    }
    if (descriptor.timeout.count() < 0) {
        throw ConfigError("Executor '" + descriptor.id + "' has negative timeout");
    }

    for (const auto& model : descriptor.declared_models) {
        if (model.id.empty()) {
            throw ConfigError("Executor '" + descriptor.id + "' declares a model without id");
        }
        if (model.cost_per_million_tokens < 0.0) {
            throw ConfigError("Model '" + model.id + "' on executor '" + descriptor.id + "' has negative cost");
        }
    }
}

void ExecutorRegistry::registerExecutor(const ExecutorDescriptor& descriptor) {
    validateDescriptor(descriptor);

    AdapterFactory factory;
    {
        std::lock_guard<std::mutex> lock(m_registry_mutex);
        auto factory_it = m_factories.find(toLower(descriptor.transport));
        if (factory_it == m_factories.end()) {
            throw ConfigError("No adapter factory registered for transport '" + descriptor.transport +
                              "' (executor '" + descriptor.id + "')");
        }
        factory = factory_it->second;
    }

    // Adapters bound their own calls by the same limit the probe deadline uses
    ExecutorDescriptor bounded = descriptor;
    if (bounded.timeout.count() <= 0) {
        bounded.timeout = m_config.probe_timeout;
    }

    std::shared_ptr<ExecutorAdapter> adapter;
    try {
        adapter = factory(bounded);
    } catch (const SwitchboardError&) {
        throw;
    } catch (const std::exception& e) {
        throw ConfigError("Failed to create adapter for executor '" + descriptor.id + "': " + e.what());
    }
    if (!adapter) {
        throw ConfigError("Adapter factory returned null for executor '" + descriptor.id + "'");
    }

    std::lock_guard<std::mutex> lock(m_registry_mutex);

    auto existing = m_executors.find(descriptor.id);
    bool replacing = existing != m_executors.end();

    ExecutorEntry entry;
    entry.descriptor = descriptor;
    entry.adapter = adapter;
    entry.generation = ++m_generation_counter;
    entry.last_healthy = std::chrono::steady_clock::now();
    entry.status.id = descriptor.id;
    entry.status.transport = stringToTransport(descriptor.transport);
    entry.status.endpoint = descriptor.endpoint;
    entry.status.capabilities = descriptor.capabilities;

    if (replacing) {
        entry.models = existing->second.models;
        for (auto& model : entry.models) {
            model.is_healthy = false;
        }
        entry.status.last_probed = existing->second.status.last_probed;
    }

    m_executors[descriptor.id] = std::move(entry);
    publishSnapshotLocked();

    Logger::getInstance().info("ExecutorRegistry",
        std::string(replacing ? "Updated" : "Registered") + " executor: " + descriptor.id +
        " (" + descriptor.transport + " " + descriptor.endpoint + ")");
}

bool ExecutorRegistry::deregisterExecutor(const std::string& executor_id) {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    auto it = m_executors.find(executor_id);
    if (it == m_executors.end()) {
        return false;
    }
    m_executors.erase(it);
    publishSnapshotLocked();
    Logger::getInstance().info("ExecutorRegistry", "Deregistered executor: " + executor_id);
    return true;
}

ExecutorRegistry::ProbeOutcome ExecutorRegistry::runProbe(const std::shared_ptr<ExecutorAdapter>& adapter,
                                                          const std::string& executor_id,
                                                          std::chrono::milliseconds timeout) const {
    ProbeOutcome outcome;
    try {
        bool healthy = runWithDeadline<bool>(
            [adapter]() { return adapter->healthCheck(); },
            timeout, nullptr, "Health check of " + executor_id);
        if (!healthy) {
            outcome.error = "health check failed";
            return outcome;
        }

        outcome.models = runWithDeadline<std::vector<ModelInfo>>(
            [adapter]() { return adapter->listModels(); },
            timeout, nullptr, "Model listing of " + executor_id);
        outcome.healthy = true;
    } catch (const std::exception& e) {
        outcome.healthy = false;
        outcome.models.clear();
        outcome.error = e.what();
    }
    return outcome;
}

std::vector<ModelInfo> ExecutorRegistry::enrichModels(const ExecutorDescriptor& descriptor,
                                                      std::vector<ModelInfo> models) const {
    for (auto& model : models) {
        model.executor_id = descriptor.id;
        model.is_healthy = true;
        model.cost_per_million_tokens = descriptor.default_cost_per_million_tokens;
        if (model.display_name.empty()) {
            model.display_name = model.id;
        }

        for (const auto& declared : descriptor.declared_models) {
            if (declared.id != model.id) {
                continue;
            }
            model.cost_per_million_tokens = declared.cost_per_million_tokens;
            if (declared.context_window > 0) {
                model.context_window = declared.context_window;
            }
            if (!declared.capabilities.empty()) {
                model.capabilities = declared.capabilities;
            }
            if (!declared.display_name.empty()) {
                model.display_name = declared.display_name;
            }
            break;
        }
    }

    // Duplicate listings would make snapshot lookups ambiguous
    std::sort(models.begin(), models.end(),
              [](const ModelInfo& a, const ModelInfo& b) { return a.id < b.id; });
    models.erase(std::unique(models.begin(), models.end(),
                             [](const ModelInfo& a, const ModelInfo& b) { return a.id == b.id; }),
                 models.end());
    return models;
}

bool ExecutorRegistry::probe(const std::string& executor_id) {
    std::shared_ptr<ExecutorAdapter> adapter;
    uint64_t generation = 0;
    std::chrono::milliseconds timeout;
    {
        std::lock_guard<std::mutex> lock(m_registry_mutex);
        auto it = m_executors.find(executor_id);
        if (it == m_executors.end()) {
            return false;
        }
        adapter = it->second.adapter;
        generation = it->second.generation;
        timeout = it->second.descriptor.timeout.count() > 0 ? it->second.descriptor.timeout
                                                            : m_config.probe_timeout;
    }

    auto start_time = std::chrono::steady_clock::now();
    ProbeOutcome outcome = runProbe(adapter, executor_id, timeout);
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    std::lock_guard<std::mutex> lock(m_registry_mutex);
    auto it = m_executors.find(executor_id);
    if (it == m_executors.end() || it->second.generation != generation) {
        // Deregistered or replaced while the probe was in flight
        return outcome.healthy;
    }

    ExecutorEntry& entry = it->second;
    entry.status.last_probed = std::chrono::system_clock::now();

    if (outcome.healthy) {
        entry.models = enrichModels(entry.descriptor, std::move(outcome.models));
        entry.status.is_live = true;
        entry.status.consecutive_failures = 0;
        entry.status.last_error.clear();
        entry.last_healthy = std::chrono::steady_clock::now();
    } else {
        entry.status.is_live = false;
        entry.status.consecutive_failures++;
        entry.status.last_error = outcome.error;
        for (auto& model : entry.models) {
            model.is_healthy = false;
        }
    }

    Logger::getInstance().logProbeResult(executor_id, outcome.healthy, entry.models.size(),
                                         duration.count(), outcome.error);

    if (!outcome.healthy) {
        evictIfExpiredLocked(executor_id);
    }

    publishSnapshotLocked();
    return outcome.healthy;
}

size_t ExecutorRegistry::probeAll() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(m_registry_mutex);
        for (const auto& [id, entry] : m_executors) {
            ids.push_back(id);
        }
    }

    std::vector<std::future<bool>> futures;
    futures.reserve(ids.size());
    for (const auto& id : ids) {
        futures.push_back(std::async(std::launch::async, [this, id]() { return probe(id); }));
    }

    size_t live_count = 0;
    for (auto& future : futures) {
        if (future.get()) {
            live_count++;
        }
    }

    Logger::getInstance().debug("ExecutorRegistry",
        "Probe pass complete: " + std::to_string(live_count) + "/" + std::to_string(ids.size()) + " live");
    return live_count;
}

bool ExecutorRegistry::evictIfExpiredLocked(const std::string& executor_id) {
    auto it = m_executors.find(executor_id);
    if (it == m_executors.end()) {
        return false;
    }

    auto unhealthy_for = std::chrono::steady_clock::now() - it->second.last_healthy;
    if (unhealthy_for < m_config.liveness_grace_period) {
        return false;
    }

    Logger::getInstance().warning("ExecutorRegistry",
        "Evicting executor after liveness grace period: " + executor_id,
        "last_error=" + it->second.status.last_error);
    m_executors.erase(it);
    return true;
}

void ExecutorRegistry::publishSnapshotLocked() {
    auto snapshot = std::make_shared<RegistrySnapshot>();
    snapshot->version = ++m_snapshot_version;
    snapshot->taken_at = std::chrono::system_clock::now();

    for (const auto& [id, entry] : m_executors) {
        snapshot->executors.push_back(entry.status);
        snapshot->models.insert(snapshot->models.end(), entry.models.begin(), entry.models.end());
    }

    std::sort(snapshot->models.begin(), snapshot->models.end(),
              [](const ModelInfo& a, const ModelInfo& b) {
                  if (a.id != b.id) {
                      return a.id < b.id;
                  }
                  return a.executor_id < b.executor_id;
              });

    std::atomic_store(&m_snapshot, std::shared_ptr<const RegistrySnapshot>(std::move(snapshot)));
}

std::shared_ptr<const RegistrySnapshot> ExecutorRegistry::snapshot() const {
    return std::atomic_load(&m_snapshot);
}

RegistryStatus ExecutorRegistry::registerAll(const std::vector<ExecutorDescriptor>& descriptors) {
    RegistryStatus status;
    status.total_configured = descriptors.size();

    for (const auto& descriptor : descriptors) {
        RegistrationResult result;
        result.executor_id = descriptor.id;
        try {
            registerExecutor(descriptor);
            result.success = true;
            status.registered++;
        } catch (const ConfigError& e) {
            result.error_message = e.what();
            status.failed++;
            Logger::getInstance().error("ExecutorRegistry",
                "Rejected executor registration: " + std::string(e.what()));
        }
        status.results.push_back(result);
    }

    Logger::getInstance().info("ExecutorRegistry",
        "Executor registration complete. Registered: " + std::to_string(status.registered) +
        "/" + std::to_string(status.total_configured));
    return status;
}

std::vector<ExecutorDescriptor> ExecutorRegistry::parseExecutors(const YAML::Node& executors) {
    std::vector<ExecutorDescriptor> descriptors;
    if (!executors || executors.IsNull()) {
        return descriptors;
    }
    if (!executors.IsMap()) {
        throw ConfigError("'executors' must be a map keyed by executor id");
    }

    for (YAML::const_iterator it = executors.begin(); it != executors.end(); ++it) {
        ExecutorDescriptor descriptor;
        try {
            descriptor.id = it->first.as<std::string>();
            const YAML::Node& node = it->second;

            if (node["transport"]) {
                descriptor.transport = node["transport"].as<std::string>();
            }
            if (node["endpoint"]) {
                descriptor.endpoint = node["endpoint"].as<std::string>();
            }
            if (node["api"]) {
                descriptor.api = toLower(node["api"].as<std::string>());
            }
            if (node["health_path"]) {
                descriptor.health_path = node["health_path"].as<std::string>();
            }
            if (node["list_args"]) {
                descriptor.list_args = readStringList(node["list_args"]);
            }
            if (node["health_args"]) {
                descriptor.health_args = readStringList(node["health_args"]);
            }
            descriptor.capabilities = readStringList(node["capabilities"]);
            if (node["default_cost_per_million_tokens"]) {
                descriptor.default_cost_per_million_tokens =
                    node["default_cost_per_million_tokens"].as<double>();
            }
            if (node["timeout_ms"]) {
                descriptor.timeout = std::chrono::milliseconds(node["timeout_ms"].as<long>());
            }

            if (node["models"]) {
                for (YAML::const_iterator model_it = node["models"].begin();
                     model_it != node["models"].end(); ++model_it) {
                    ModelInfo model;
                    model.id = model_it->first.as<std::string>();
                    model.executor_id = descriptor.id;
                    const YAML::Node& model_node = model_it->second;
                    if (model_node["display_name"]) {
                        model.display_name = model_node["display_name"].as<std::string>();
                    }
                    if (model_node["cost_per_million_tokens"]) {
                        model.cost_per_million_tokens = model_node["cost_per_million_tokens"].as<double>();
                    } else {
                        model.cost_per_million_tokens = descriptor.default_cost_per_million_tokens;
                    }
                    if (model_node["context_window"]) {
                        model.context_window = model_node["context_window"].as<size_t>();
                    }
                    if (model_node["capabilities"]) {
                        model.capabilities =
                            ModelCapabilityUtils::parseCapabilities(readStringList(model_node["capabilities"]));
                    }
                    descriptor.declared_models.push_back(model);
                }
            }

            if (node["attributes"]) {
                for (YAML::const_iterator attr_it = node["attributes"].begin();
                     attr_it != node["attributes"].end(); ++attr_it) {
                    descriptor.attributes[attr_it->first.as<std::string>()] =
                        attr_it->second.as<std::string>();
                }
            }
        } catch (const YAML::Exception& e) {
            throw ConfigError("Invalid executor entry '" + descriptor.id + "': " + e.what());
        } catch (const std::invalid_argument& e) {
            throw ConfigError("Invalid executor entry '" + descriptor.id + "': " + e.what());
        }

        descriptors.push_back(descriptor);
    }

    return descriptors;
}

RegistryStatus ExecutorRegistry::loadFromNode(const YAML::Node& executors) {
    return registerAll(parseExecutors(executors));
}

RegistryStatus ExecutorRegistry::loadFromConfig(const std::string& config_path) {
    Logger::getInstance().info("ExecutorRegistry", "Loading executors from configuration: " + config_path);

    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse executor configuration " + config_path + ": " + e.what());
    }

    if (!root["executors"]) {
        Logger::getInstance().warning("ExecutorRegistry", "No 'executors' section in " + config_path);
        return RegistryStatus();
    }
    return loadFromNode(root["executors"]);
}

void ExecutorRegistry::start() {
    if (!m_config.enable_background_probes) {
        return;
    }
    if (m_probe_thread && m_probe_thread->joinable()) {
        return; // Already running
    }

    m_stop_probes = false;
    m_probe_thread = std::make_unique<std::thread>(&ExecutorRegistry::probeLoop, this);
    Logger::getInstance().info("ExecutorRegistry",
        "Started probe thread (interval " + std::to_string(m_config.probe_interval.count()) + "ms)");
}

void ExecutorRegistry::stop() {
    if (!m_probe_thread) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_probe_wait_mutex);
        m_stop_probes = true;
    }
    m_probe_cv.notify_all();

    if (m_probe_thread->joinable()) {
        m_probe_thread->join();
    }
    m_probe_thread.reset();
    Logger::getInstance().info("ExecutorRegistry", "Stopped probe thread");
}

bool ExecutorRegistry::isRunning() const {
    return m_probe_thread && m_probe_thread->joinable() && !m_stop_probes;
}

void ExecutorRegistry::probeLoop() {
    while (!m_stop_probes) {
        try {
            probeAll();
        } catch (const std::exception& e) {
            Logger::getInstance().error("ExecutorRegistry", "Probe pass failed: " + std::string(e.what()));
        }

        std::unique_lock<std::mutex> lock(m_probe_wait_mutex);
        m_probe_cv.wait_for(lock, m_config.probe_interval, [this]() { return m_stop_probes.load(); });
    }
}

std::string ExecutorRegistry::getExecutorInfo(const std::string& executor_id) const {
    auto current = snapshot();
    const ExecutorStatus* status = current->findExecutor(executor_id);
    if (!status) {
        return "Executor not found: " + executor_id;
    }

    std::stringstream ss;
    ss << "Executor: " << status->id << "\n";
    ss << "  Transport: " << transportToString(status->transport) << "\n";
    ss << "  Endpoint: " << status->endpoint << "\n";
    ss << "  Status: " << (status->is_live ? "Live" : "Unhealthy") << "\n";
    ss << "  Last Probed: " << formatTime(status->last_probed) << "\n";
    if (!status->last_error.empty()) {
        ss << "  Last Error: " << status->last_error
           << " (" << status->consecutive_failures << " consecutive failures)\n";
    }
    if (!status->capabilities.empty()) {
        ss << "  Capabilities: ";
        for (size_t i = 0; i < status->capabilities.size(); ++i) {
            if (i > 0) ss << ", ";
            ss << status->capabilities[i];
        }
        ss << "\n";
    }

    ss << "  Models:\n";
    bool any_model = false;
    for (const auto& model : current->models) {
        if (model.executor_id != executor_id) {
            continue;
        }
        any_model = true;
        ss << "    - " << model.id << (model.is_healthy ? "" : " [unhealthy]")
           << "  cost=" << model.cost_per_million_tokens << "/Mtok";
        if (model.context_window > 0) {
            ss << "  ctx=" << model.context_window;
        }
        if (!model.capabilities.empty()) {
            ss << "  [" << ModelCapabilityUtils::joinCapabilities(model.capabilities) << "]";
        }
        ss << "\n";
    }
    if (!any_model) {
        ss << "    (none known)\n";
    }

    return ss.str();
}

std::string ExecutorRegistry::getAllExecutorsInfo() const {
    auto current = snapshot();
    std::stringstream ss;

    size_t live = 0;
    for (const auto& executor : current->executors) {
        if (executor.is_live) {
            live++;
        }
    }

    ss << "Executor Registry Status\n";
    ss << "========================\n";
    ss << "Registered Executors: " << current->executors.size() << "\n";
    ss << "Live Executors: " << live << "\n";
    ss << "Healthy Models: " << current->healthyModels().size() << "\n";
    ss << "Snapshot Version: " << current->version << "\n";

    if (current->executors.empty()) {
        ss << "\nNo executors registered.\n";
    } else {
        for (const auto& executor : current->executors) {
            ss << "\n" << getExecutorInfo(executor.id);
        }
    }

    return ss.str();
}

RegistryConfig ExecutorRegistry::getConfig() const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    return m_config;
}

} // namespace Switchboard
