// =================================================================
// src/Switchboard/ModelCapabilities.cpp
// =================================================================
// Implementation of model capability utilities.

#include "Switchboard/ModelCapabilities.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace Switchboard {

namespace {

const std::pair<ModelCapability, const char*> kCapabilityNames[] = {
    {ModelCapability::CODE, "CODE"},
    {ModelCapability::REASONING, "REASONING"},
    {ModelCapability::TOOL_USE, "TOOL_USE"},
    {ModelCapability::VISION, "VISION"},
    {ModelCapability::LONG_CONTEXT, "LONG_CONTEXT"},
    {ModelCapability::FAST_INFERENCE, "FAST_INFERENCE"},
    {ModelCapability::CHAT, "CHAT"},
    {ModelCapability::MULTILINGUAL, "MULTILINGUAL"},
    {ModelCapability::CREATIVE_WRITING, "CREATIVE_WRITING"},
    {ModelCapability::EMBEDDING, "EMBEDDING"},
};

std::string canonicalName(const std::string& str) {
    std::string name;
    name.reserve(str.size());
    for (unsigned char c : str) {
        if (c == '-' || c == ' ') {
            name += '_';
        } else {
            name += static_cast<char>(std::toupper(c));
        }
    }
    return name;
}

} // namespace

std::string ModelCapabilityUtils::capabilityToString(ModelCapability capability) {
    for (const auto& [value, name] : kCapabilityNames) {
        if (value == capability) {
            return name;
        }
    }
    throw std::invalid_argument("Unknown ModelCapability value");
}

ModelCapability ModelCapabilityUtils::stringToCapability(const std::string& str) {
    const std::string name = canonicalName(str);
    for (const auto& [value, known] : kCapabilityNames) {
        if (name == known) {
            return value;
        }
    }
    throw std::invalid_argument("Unknown capability: " + str);
}

bool ModelCapabilityUtils::hasCapability(const ModelInfo& model, ModelCapability capability) {
    return std::find(model.capabilities.begin(), model.capabilities.end(), capability) != model.capabilities.end();
}

std::string ModelCapabilityUtils::joinCapabilities(const std::vector<ModelCapability>& capabilities) {
    std::string joined;
    for (ModelCapability capability : capabilities) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += capabilityToString(capability);
    }
    return joined;
}

std::vector<ModelCapability> ModelCapabilityUtils::parseCapabilities(const std::vector<std::string>& capability_strings) {
    std::vector<ModelCapability> result;
    result.reserve(capability_strings.size());
    for (const auto& str : capability_strings) {
        result.push_back(stringToCapability(str));
    }
    return result;
}

} // namespace Switchboard
