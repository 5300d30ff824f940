// =================================================================
// tests/TestDoubles.hpp
// =================================================================
// In-memory fakes shared by the component tests.

#pragma once

#include "Switchboard/DecisionLog.hpp"
#include "Switchboard/ExecutorAdapter.hpp"
#include "Switchboard/ExecutorRegistry.hpp"
#include "Switchboard/PolicySource.hpp"
#include "Switchboard/TaskClassifier.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace SwitchboardTest {

using namespace Switchboard;

inline ModelInfo makeModel(const std::string& id, const std::string& executor_id, double cost) {
    ModelInfo model;
    model.id = id;
    model.executor_id = executor_id;
    model.display_name = id;
    model.cost_per_million_tokens = cost;
    model.is_healthy = true;
    return model;
}

/**
 * @brief Executor whose health, model list and latency are set by the test
 */
class FakeExecutorAdapter : public ExecutorAdapter {
public:
    FakeExecutorAdapter(const std::string& id, std::vector<ModelInfo> models)
        : m_id(id), m_models(std::move(models)) {}

    std::vector<ModelInfo> listModels() override {
        m_list_calls++;
        sleepIfConfigured();
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_fail_listing) {
            throw std::runtime_error("listing failed for " + m_id);
        }
        return m_models;
    }

    bool healthCheck() override {
        m_health_calls++;
        sleepIfConfigured();
        return m_healthy.load();
    }

    TransportKind getTransport() const override { return TransportKind::RPC; }
    std::string getExecutorId() const override { return m_id; }

    void setHealthy(bool healthy) { m_healthy = healthy; }
    void setDelay(std::chrono::milliseconds delay) { m_delay_ms = delay.count(); }
    void setFailListing(bool fail) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_fail_listing = fail;
    }
    void setModels(std::vector<ModelInfo> models) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_models = std::move(models);
    }

    size_t getHealthCalls() const { return m_health_calls.load(); }
    size_t getListCalls() const { return m_list_calls.load(); }

private:
    std::string m_id;
    std::mutex m_mutex;
    std::vector<ModelInfo> m_models;
    bool m_fail_listing = false;
    std::atomic<bool> m_healthy{true};
    std::atomic<long> m_delay_ms{0};
    std::atomic<size_t> m_health_calls{0};
    std::atomic<size_t> m_list_calls{0};

    void sleepIfConfigured() const {
        long delay = m_delay_ms.load();
        if (delay > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
    }
};

/**
 * @brief Hands out pre-built fake adapters to an ExecutorRegistry by executor id
 */
class FakeAdapterPool {
public:
    std::shared_ptr<FakeExecutorAdapter> add(const std::string& executor_id, std::vector<ModelInfo> models) {
        auto adapter = std::make_shared<FakeExecutorAdapter>(executor_id, std::move(models));
        std::lock_guard<std::mutex> lock(m_mutex);
        m_adapters[executor_id] = adapter;
        return adapter;
    }

    /**
     * @brief Factory for the "rpc" transport that returns the matching fake
     */
    AdapterFactory factory() {
        return [this](const ExecutorDescriptor& descriptor) -> std::shared_ptr<ExecutorAdapter> {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_adapters.find(descriptor.id);
            if (it == m_adapters.end()) {
                return nullptr;
            }
            return it->second;
        };
    }

    /**
     * @brief Register the fake under an rpc descriptor
     */
    void registerWith(ExecutorRegistry& registry, const std::string& executor_id,
                      const std::vector<ModelInfo>& declared = {}) {
        ExecutorDescriptor descriptor;
        descriptor.id = executor_id;
        descriptor.transport = "rpc";
        descriptor.declared_models = declared;
        registry.registerExecutor(descriptor);
    }

private:
    std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<FakeExecutorAdapter>> m_adapters;
};

/**
 * @brief Classifier returning a fixed label, optionally slowly or with an error
 */
class FakeClassifierClient : public ClassifierClient {
public:
    explicit FakeClassifierClient(const std::string& domain = "programming",
                                  const std::string& action = "code-generation",
                                  double confidence = 0.9) {
        m_result.domain = domain;
        m_result.action = action;
        m_result.confidence = confidence;
        m_result.reasoning = "fixed test label";
    }

    Classification classify(const std::string& prompt,
                            const std::vector<ConversationTurn>& context) override {
        (void)prompt;
        (void)context;
        m_calls++;
        long delay = m_delay_ms.load();
        if (delay > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_error.empty()) {
            throw std::runtime_error(m_error);
        }
        return m_result;
    }

    std::string getName() const override { return "fake"; }

    void setDelay(std::chrono::milliseconds delay) { m_delay_ms = delay.count(); }
    void setError(const std::string& error) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_error = error;
    }
    void setResult(const Classification& result) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_result = result;
    }
    size_t getCalls() const { return m_calls.load(); }

private:
    std::mutex m_mutex;
    Classification m_result;
    std::string m_error;
    std::atomic<long> m_delay_ms{0};
    std::atomic<size_t> m_calls{0};
};

/**
 * @brief Policy source held in memory, switchable between available and down
 */
class FakePolicySource : public PolicySource {
public:
    explicit FakePolicySource(std::vector<Policy> policies = {}) : m_policies(std::move(policies)) {}

    std::vector<Policy> fetchAll() override {
        m_fetches++;
        long delay = m_delay_ms.load();
        if (delay > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
        if (!m_available.load()) {
            throw std::runtime_error("policy store unreachable");
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_policies;
    }

    void upsert(const Policy& policy) override {
        validatePolicy(policy);
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& existing : m_policies) {
            if (existing.domain == policy.domain && existing.action == policy.action) {
                existing = policy;
                return;
            }
        }
        m_policies.push_back(policy);
    }

    bool remove(const std::string& domain, const std::string& action) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_policies.begin(); it != m_policies.end(); ++it) {
            if (it->domain == domain && it->action == action) {
                m_policies.erase(it);
                return true;
            }
        }
        return false;
    }

    std::string getName() const override { return "fake"; }

    void setAvailable(bool available) { m_available = available; }
    void setDelay(std::chrono::milliseconds delay) { m_delay_ms = delay.count(); }
    size_t getFetchCount() const { return m_fetches.load(); }

private:
    std::mutex m_mutex;
    std::vector<Policy> m_policies;
    std::atomic<bool> m_available{true};
    std::atomic<long> m_delay_ms{0};
    std::atomic<size_t> m_fetches{0};
};

inline Policy makePolicy(const std::string& domain, const std::string& action,
                         std::vector<std::string> model_ids, int priority = 0) {
    Policy policy;
    policy.domain = domain;
    policy.action = action;
    policy.model_ids = std::move(model_ids);
    policy.priority = priority;
    return policy;
}

/**
 * @brief Sink that always throws
 */
class FailingDecisionSink : public DecisionSink {
public:
    void write(const DecisionRecord& record) override {
        (void)record;
        throw std::runtime_error("sink offline");
    }
    void writeOutcome(const std::string& decision_id, const DecisionOutcome& outcome) override {
        (void)decision_id;
        (void)outcome;
        throw std::runtime_error("sink offline");
    }
    std::string getName() const override { return "failing"; }
};

/**
 * @brief Sink that blocks until released, for exercising a full queue
 */
class BlockingDecisionSink : public MemoryDecisionSink {
public:
    void write(const DecisionRecord& record) override {
        waitForRelease();
        MemoryDecisionSink::write(record);
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(m_gate_mutex);
            m_released = true;
        }
        m_gate_cv.notify_all();
    }

private:
    std::mutex m_gate_mutex;
    std::condition_variable m_gate_cv;
    bool m_released = false;

    void waitForRelease() {
        std::unique_lock<std::mutex> lock(m_gate_mutex);
        m_gate_cv.wait(lock, [this]() { return m_released; });
    }
};

} // namespace SwitchboardTest
