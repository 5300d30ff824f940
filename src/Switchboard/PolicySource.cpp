// =================================================================
// src/Switchboard/PolicySource.cpp
// =================================================================
// YAML and HTTP policy stores.

#include "Switchboard/PolicySource.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include "Switchboard/SysInteraction.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <set>
#include <sstream>
#include <stdexcept>

namespace Switchboard {

namespace {

Policy policyFromJson(const nlohmann::json& node) {
    Policy policy;
    policy.domain = node.at("domain").get<std::string>();
    policy.action = node.at("action").get<std::string>();
    policy.model_ids = node.at("models").get<std::vector<std::string>>();
    policy.priority = node.value("priority", 0);
    return policy;
}

std::string encodePathSegment(const std::string& segment) {
    std::ostringstream encoded;
    for (unsigned char c : segment) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '*') {
            encoded << c;
        } else {
            encoded << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
                    << static_cast<int>(c) << std::nouppercase << std::dec;
        }
    }
    return encoded.str();
}

bool sameKey(const Policy& policy, const std::string& domain, const std::string& action) {
    return normalizeTaskLabel(policy.domain) == normalizeTaskLabel(domain) &&
           normalizeTaskLabel(policy.action) == normalizeTaskLabel(action);
}

} // namespace

std::string normalizeTaskLabel(const std::string& label) {
    std::string normalized = label;
    normalized.erase(0, normalized.find_first_not_of(" \t\n\r"));
    normalized.erase(normalized.find_last_not_of(" \t\n\r") + 1);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return c == '_' || c == ' ' ? '-' : static_cast<char>(std::tolower(c)); });
    return normalized;
}

void validatePolicy(const Policy& policy) {
    if (policy.domain.empty()) {
        throw ConfigError("Policy is missing a domain");
    }
    if (policy.action.empty()) {
        throw ConfigError("Policy " + policy.domain + "/? is missing an action");
    }
    if (policy.model_ids.empty()) {
        throw ConfigError("Policy " + policy.domain + "/" + policy.action + " lists no models");
    }

    std::set<std::string> seen;
    for (const auto& model_id : policy.model_ids) {
        if (model_id.empty()) {
            throw ConfigError("Policy " + policy.domain + "/" + policy.action + " contains an empty model id");
        }
        if (!seen.insert(model_id).second) {
            throw ConfigError("Policy " + policy.domain + "/" + policy.action +
                              " lists model '" + model_id + "' more than once");
        }
    }
}

// ---------------------------------------------------------------------------
// YamlPolicySource

YamlPolicySource::YamlPolicySource(const std::string& file_path) : m_file_path(file_path) {}

std::string YamlPolicySource::getName() const {
    return "file:" + m_file_path;
}

std::vector<Policy> YamlPolicySource::fetchAll() {
    SysInteraction sys;
    if (!sys.fileExists(m_file_path)) {
        throw std::runtime_error("Policy file not found: " + m_file_path);
    }

    std::vector<Policy> policies;
    try {
        YAML::Node root = YAML::LoadFile(m_file_path);
        YAML::Node entries = root["policies"];
        if (!entries) {
            return policies;
        }
        if (!entries.IsSequence()) {
            throw ConfigError("'policies' in " + m_file_path + " must be a list");
        }

        for (const auto& entry : entries) {
            Policy policy;
            policy.domain = entry["domain"].as<std::string>("");
            policy.action = entry["action"].as<std::string>("");
            if (entry["models"]) {
                for (const auto& model : entry["models"]) {
                    policy.model_ids.push_back(model.as<std::string>());
                }
            }
            policy.priority = entry["priority"].as<int>(0);
            policies.push_back(policy);
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse policy file " + m_file_path + ": " + e.what());
    }

    return policies;
}

void YamlPolicySource::save(const std::vector<Policy>& policies) {
    SysInteraction sys;

    // Keep any other sections of a shared configuration file
    YAML::Node root;
    if (sys.fileExists(m_file_path)) {
        root = YAML::LoadFile(m_file_path);
    }

    YAML::Node entries(YAML::NodeType::Sequence);
    for (const auto& policy : policies) {
        YAML::Node entry;
        entry["domain"] = policy.domain;
        entry["action"] = policy.action;
        YAML::Node models(YAML::NodeType::Sequence);
        for (const auto& model_id : policy.model_ids) {
            models.push_back(model_id);
        }
        models.SetStyle(YAML::EmitterStyle::Flow);
        entry["models"] = models;
        if (policy.priority != 0) {
            entry["priority"] = policy.priority;
        }
        entries.push_back(entry);
    }
    root["policies"] = entries;

    YAML::Emitter emitter;
    emitter << root;
    if (!sys.writeFile(m_file_path, std::string(emitter.c_str()) + "\n")) {
        throw std::runtime_error("Failed to write policy file: " + m_file_path);
    }
}

void YamlPolicySource::upsert(const Policy& policy) {
    validatePolicy(policy);
    std::lock_guard<std::mutex> lock(m_write_mutex);

    std::vector<Policy> policies;
    SysInteraction sys;
    if (sys.fileExists(m_file_path)) {
        policies = fetchAll();
    }

    policies.erase(std::remove_if(policies.begin(), policies.end(),
                                  [&policy](const Policy& existing) {
                                      return sameKey(existing, policy.domain, policy.action);
                                  }),
                   policies.end());
    policies.push_back(policy);
    save(policies);

    Logger::getInstance().info("PolicySource", "Saved policy " + policy.domain + "/" + policy.action +
                               " to " + m_file_path);
}

bool YamlPolicySource::remove(const std::string& domain, const std::string& action) {
    std::lock_guard<std::mutex> lock(m_write_mutex);

    std::vector<Policy> policies = fetchAll();
    size_t before = policies.size();
    policies.erase(std::remove_if(policies.begin(), policies.end(),
                                  [&](const Policy& existing) { return sameKey(existing, domain, action); }),
                   policies.end());
    if (policies.size() == before) {
        return false;
    }

    save(policies);
    Logger::getInstance().info("PolicySource", "Removed policy " + domain + "/" + action +
                               " from " + m_file_path);
    return true;
}

// ---------------------------------------------------------------------------
// HttpPolicySource

HttpPolicySource::HttpPolicySource(const std::string& base_url, std::chrono::milliseconds timeout)
    : m_base_url(base_url), m_timeout(timeout) {}

std::string HttpPolicySource::getName() const {
    return "http:" + m_base_url;
}

std::string HttpPolicySource::policyPath(const std::string& domain, const std::string& action) const {
    return "/policies/" + encodePathSegment(domain) + "/" + encodePathSegment(action);
}

std::vector<Policy> HttpPolicySource::fetchAll() {
    httplib::Client client(m_base_url.c_str());
    auto seconds = m_timeout.count() / 1000;
    auto micros = (m_timeout.count() % 1000) * 1000;
    client.set_connection_timeout(seconds, micros);
    client.set_read_timeout(seconds, micros);

    auto res = client.Get("/policies");
    if (!res) {
        throw std::runtime_error("Failed to reach policy store at " + m_base_url + ": " +
                                 httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw std::runtime_error("Policy store returned status " + std::to_string(res->status));
    }
    return parsePolicies(res->body);
}

void HttpPolicySource::upsert(const Policy& policy) {
    validatePolicy(policy);

    httplib::Client client(m_base_url.c_str());
    auto res = client.Put(policyPath(policy.domain, policy.action), serializePolicy(policy), "application/json");
    if (!res) {
        throw std::runtime_error("Failed to reach policy store at " + m_base_url + ": " +
                                 httplib::to_string(res.error()));
    }
    if (res->status != 200 && res->status != 201 && res->status != 204) {
        throw std::runtime_error("Policy store rejected update with status " + std::to_string(res->status) +
                                 ": " + res->body);
    }
}

bool HttpPolicySource::remove(const std::string& domain, const std::string& action) {
    httplib::Client client(m_base_url.c_str());
    auto res = client.Delete(policyPath(domain, action));
    if (!res) {
        throw std::runtime_error("Failed to reach policy store at " + m_base_url + ": " +
                                 httplib::to_string(res.error()));
    }
    if (res->status == 404) {
        return false;
    }
    if (res->status != 200 && res->status != 204) {
        throw std::runtime_error("Policy store rejected delete with status " + std::to_string(res->status));
    }
    return true;
}

std::vector<Policy> HttpPolicySource::parsePolicies(const std::string& body) {
    std::vector<Policy> policies;
    try {
        auto parsed = nlohmann::json::parse(body);
        const auto& entries = parsed.at("policies");
        if (!entries.is_array()) {
            throw std::runtime_error("'policies' is not an array");
        }
        for (const auto& entry : entries) {
            policies.push_back(policyFromJson(entry));
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed policy store response: " + std::string(e.what()));
    }
    return policies;
}

std::string HttpPolicySource::serializePolicy(const Policy& policy) {
    nlohmann::json node = {
        {"domain", policy.domain},
        {"action", policy.action},
        {"models", policy.model_ids},
        {"priority", policy.priority}
    };
    return node.dump();
}

} // namespace Switchboard
