// =================================================================
// src/Switchboard/HttpExecutorAdapter.cpp
// =================================================================
// HTTP executor probing over cpp-httplib.

#include "Switchboard/HttpExecutorAdapter.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include <stdexcept>

namespace Switchboard {

HttpExecutorAdapter::HttpExecutorAdapter(const ExecutorDescriptor& descriptor)
    : m_executor_id(descriptor.id),
      m_base_url(descriptor.endpoint),
      m_api(descriptor.api.empty() ? "openai" : descriptor.api),
      m_timeout(descriptor.timeout.count() > 0 ? descriptor.timeout : std::chrono::milliseconds(2000)) {
    
    m_health_path = descriptor.health_path.empty() ? defaultHealthPath(m_api) : descriptor.health_path;
    
    auto key_it = descriptor.attributes.find("api_key");
    if (key_it != descriptor.attributes.end()) {
        m_api_key = key_it->second;
    }
}

std::vector<ModelInfo> HttpExecutorAdapter::listModels() {
    auto [status, body] = httpGet(modelListPath(m_api));
    if (status != 200) {
        throw std::runtime_error("Model listing returned status " + std::to_string(status) +
                                 " from " + m_base_url);
    }
    
    std::vector<ModelInfo> models;
    for (const auto& id : parseModelList(body)) {
        ModelInfo model;
        model.id = id;
        model.executor_id = m_executor_id;
        model.display_name = id;
        models.push_back(model);
    }
    return models;
}

bool HttpExecutorAdapter::healthCheck() {
    try {
        auto [status, body] = httpGet(m_health_path);
        return status == 200;
    } catch (const std::exception&) {
        // Unreachable counts as unhealthy
        return false;
    }
}

TransportKind HttpExecutorAdapter::getTransport() const {
    return TransportKind::HTTP;
}

std::string HttpExecutorAdapter::getExecutorId() const {
    return m_executor_id;
}

std::vector<std::string> HttpExecutorAdapter::parseModelList(const std::string& body) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Model listing is not valid JSON: ") + e.what());
    }
    
    std::vector<std::string> ids;
    if (root.is_object() && root.contains("data") && root["data"].is_array()) {
        for (const auto& entry : root["data"]) {
            if (entry.is_object() && entry.contains("id") && entry["id"].is_string()) {
                ids.push_back(entry["id"].get<std::string>());
            }
        }
        return ids;
    }
    
    if (root.is_object() && root.contains("models") && root["models"].is_array()) {
        for (const auto& entry : root["models"]) {
            if (!entry.is_object()) {
                continue;
            }
            if (entry.contains("name") && entry["name"].is_string()) {
                ids.push_back(entry["name"].get<std::string>());
            } else if (entry.contains("model") && entry["model"].is_string()) {
                ids.push_back(entry["model"].get<std::string>());
            }
        }
        return ids;
    }
    
    throw std::runtime_error("Unrecognised model listing shape");
}

std::string HttpExecutorAdapter::defaultHealthPath(const std::string& api) {
    return api == "ollama" ? "/api/tags" : "/health";
}

std::string HttpExecutorAdapter::modelListPath(const std::string& api) {
    return api == "ollama" ? "/api/tags" : "/v1/models";
}

std::pair<int, std::string> HttpExecutorAdapter::httpGet(const std::string& path) const {
    httplib::Client client(m_base_url);
    
    auto seconds = static_cast<time_t>(m_timeout.count() / 1000);
    auto micros = static_cast<time_t>((m_timeout.count() % 1000) * 1000);
    client.set_connection_timeout(seconds, micros);
    client.set_read_timeout(seconds, micros);
    
    if (!m_api_key.empty()) {
        client.set_bearer_token_auth(m_api_key);
    }
    
    auto res = client.Get(path);
    if (!res) {
        throw std::runtime_error("Failed to connect to executor at " + m_base_url +
                                 " (" + httplib::to_string(res.error()) + ")");
    }
    
    return {res->status, res->body};
}

} // namespace Switchboard
