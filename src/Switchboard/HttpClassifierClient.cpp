// =================================================================
// src/Switchboard/HttpClassifierClient.cpp
// =================================================================
// Implementation of the chat-completions classifier client.

#include "Switchboard/HttpClassifierClient.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include <sstream>
#include <stdexcept>

namespace Switchboard {

HttpClassifierClient::HttpClassifierClient(const HttpClassifierConfig& config) : m_config(config) {}

std::string HttpClassifierClient::getName() const {
    return "http:" + m_config.model;
}

std::string HttpClassifierClient::buildSystemPrompt() const {
    std::stringstream ss;
    ss << "You label user requests for a model router. Reply with one JSON object and nothing else: "
       << "{\"domain\": string, \"action\": string, \"confidence\": number between 0 and 1, "
       << "\"reasoning\": short string}.\nAllowed domains: ";
    for (size_t i = 0; i < m_config.domains.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << m_config.domains[i];
    }
    ss << ".\nAllowed actions: ";
    for (size_t i = 0; i < m_config.actions.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << m_config.actions[i];
    }
    ss << ".";
    return ss.str();
}

Classification HttpClassifierClient::classify(const std::string& prompt,
                                              const std::vector<ConversationTurn>& context) {
    httplib::Client client(m_config.endpoint.c_str());
    auto seconds = m_config.timeout.count() / 1000;
    auto micros = (m_config.timeout.count() % 1000) * 1000;
    client.set_connection_timeout(seconds, micros);
    client.set_read_timeout(seconds, micros);
    if (!m_config.api_key.empty()) {
        client.set_bearer_token_auth(m_config.api_key.c_str());
    }

    nlohmann::json messages = nlohmann::json::array();
    messages.push_back({{"role", "system"}, {"content", buildSystemPrompt()}});
    for (const auto& turn : context) {
        messages.push_back({{"role", turn.role.empty() ? "user" : turn.role}, {"content", turn.content}});
    }
    messages.push_back({{"role", "user"}, {"content", prompt}});

    nlohmann::json request_body = {
        {"model", m_config.model},
        {"messages", messages},
        {"temperature", 0},
        {"max_tokens", m_config.max_tokens},
        {"stream", false}
    };

    auto res = client.Post("/v1/chat/completions", request_body.dump(), "application/json");
    if (!res) {
        throw std::runtime_error("Failed to reach classifier at " + m_config.endpoint + ": " +
                                 httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw std::runtime_error("Classifier returned status " + std::to_string(res->status));
    }

    std::string content;
    try {
        auto body = nlohmann::json::parse(res->body);
        content = body.at("choices").at(0).at("message").at("content").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed chat-completions response: " + std::string(e.what()));
    }

    Classification result = parseClassification(content);
    result.source = getName();
    return result;
}

Classification HttpClassifierClient::parseClassification(const std::string& content) {
    size_t open = content.find('{');
    size_t close = content.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        throw std::runtime_error("Classifier reply contains no JSON object");
    }

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(content.substr(open, close - open + 1));
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Classifier reply is not valid JSON: " + std::string(e.what()));
    }

    if (!parsed.is_object() || !parsed.contains("domain") || !parsed["domain"].is_string() ||
        !parsed.contains("action") || !parsed["action"].is_string()) {
        throw std::runtime_error("Classifier reply is missing domain or action");
    }

    Classification result;
    result.domain = parsed["domain"].get<std::string>();
    result.action = parsed["action"].get<std::string>();
    result.confidence = 0.5;
    if (parsed.contains("confidence")) {
        if (!parsed["confidence"].is_number()) {
            throw std::runtime_error("Classifier confidence is not a number");
        }
        result.confidence = parsed["confidence"].get<double>();
    }
    if (parsed.contains("reasoning") && parsed["reasoning"].is_string()) {
        result.reasoning = parsed["reasoning"].get<std::string>();
    }
    return result;
}

} // namespace Switchboard
