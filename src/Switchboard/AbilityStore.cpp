// =================================================================
// src/Switchboard/AbilityStore.cpp
// =================================================================
// Implementation of ability checkpoint loading.

#include "Switchboard/AbilityStore.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include "Switchboard/SysInteraction.hpp"
#include "nlohmann/json.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace Switchboard {

namespace {

std::vector<double> readVector(const nlohmann::json& node, size_t dimension, const std::string& what) {
    if (!node.is_array()) {
        throw CheckpointError(what + " is not an array");
    }
    if (node.size() != dimension) {
        throw CheckpointError(what + " has " + std::to_string(node.size()) +
                              " entries, expected " + std::to_string(dimension));
    }

    std::vector<double> values;
    values.reserve(dimension);
    for (const auto& item : node) {
        if (!item.is_number()) {
            throw CheckpointError(what + " contains a non-numeric entry");
        }
        double value = item.get<double>();
        if (!std::isfinite(value)) {
            throw CheckpointError(what + " contains a non-finite entry");
        }
        values.push_back(value);
    }
    return values;
}

} // namespace

const std::vector<double>* AbilityCheckpoint::findAbility(const std::string& model_id) const {
    auto it = abilities.find(model_id);
    return it == abilities.end() ? nullptr : &it->second;
}

AbilityCheckpoint AbilityCheckpoint::fromJson(const std::string& text) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        throw CheckpointError("Checkpoint is not valid JSON: " + std::string(e.what()));
    }
    if (!root.is_object()) {
        throw CheckpointError("Checkpoint root must be an object");
    }

    AbilityCheckpoint checkpoint;

    if (!root.contains("version")) {
        throw CheckpointError("Checkpoint is missing 'version'");
    }
    checkpoint.version = root["version"].is_string() ? root["version"].get<std::string>()
                                                     : root["version"].dump();

    if (!root.contains("dimension") || !root["dimension"].is_number_unsigned() ||
        root["dimension"].get<size_t>() == 0) {
        throw CheckpointError("Checkpoint 'dimension' must be a positive integer");
    }
    checkpoint.dimension = root["dimension"].get<size_t>();

    if (root.contains("weights")) {
        checkpoint.weights = readVector(root["weights"], checkpoint.dimension, "weights");
    } else {
        checkpoint.weights.assign(checkpoint.dimension, 1.0);
    }

    if (!root.contains("abilities") || !root["abilities"].is_object()) {
        throw CheckpointError("Checkpoint 'abilities' must be an object keyed by model id");
    }
    for (const auto& [model_id, vector] : root["abilities"].items()) {
        checkpoint.abilities[model_id] = readVector(vector, checkpoint.dimension, "abilities." + model_id);
    }

    return checkpoint;
}

AbilityCheckpoint AbilityCheckpoint::loadFile(const std::string& path) {
    SysInteraction sys;
    std::string text;
    try {
        text = sys.readFile(path);
    } catch (const std::exception& e) {
        throw CheckpointError("Cannot read checkpoint " + path + ": " + e.what());
    }

    AbilityCheckpoint checkpoint = fromJson(text);
    checkpoint.source_path = path;
    return checkpoint;
}

AbilityCheckpoint AbilityCheckpoint::uniform(size_t dimension) {
    AbilityCheckpoint checkpoint;
    checkpoint.version = "uniform";
    checkpoint.dimension = dimension;
    checkpoint.weights.assign(dimension, 1.0);
    return checkpoint;
}

AbilityStore::AbilityStore(size_t expected_dimension, std::shared_ptr<const AbilityCheckpoint> initial)
    : m_expected_dimension(expected_dimension) {
    if (initial) {
        replace(std::move(initial));
    } else {
        std::atomic_store(&m_current, std::shared_ptr<const AbilityCheckpoint>(
            std::make_shared<AbilityCheckpoint>(AbilityCheckpoint::uniform(expected_dimension))));
    }
}

std::shared_ptr<const AbilityCheckpoint> AbilityStore::current() const {
    return std::atomic_load(&m_current);
}

void AbilityStore::replace(std::shared_ptr<const AbilityCheckpoint> checkpoint) {
    if (!checkpoint) {
        throw CheckpointError("Cannot install a null checkpoint");
    }
    if (checkpoint->dimension != m_expected_dimension) {
        throw CheckpointError("Checkpoint dimension " + std::to_string(checkpoint->dimension) +
                              " does not match feature dimension " + std::to_string(m_expected_dimension));
    }
    if (checkpoint->weights.size() != checkpoint->dimension) {
        throw CheckpointError("Checkpoint weights do not match its dimension");
    }
    for (const auto& [model_id, ability] : checkpoint->abilities) {
        if (ability.size() != checkpoint->dimension) {
            throw CheckpointError("Ability vector for " + model_id + " does not match the checkpoint dimension");
        }
    }
    std::atomic_store(&m_current, std::move(checkpoint));
}

void AbilityStore::load(const std::string& path) {
    auto checkpoint = std::make_shared<AbilityCheckpoint>(AbilityCheckpoint::loadFile(path));
    replace(checkpoint);
    Logger::getInstance().info("AbilityStore",
        "Loaded checkpoint version " + checkpoint->version + " with " +
        std::to_string(checkpoint->abilities.size()) + " models from " + path);
}

bool AbilityStore::reload(const std::string& path) {
    try {
        load(path);
        return true;
    } catch (const CheckpointError& e) {
        Logger::getInstance().error("AbilityStore",
            "Checkpoint reload failed, keeping version " + current()->version, e.what());
        return false;
    }
}

std::string AbilityStore::describe() const {
    auto checkpoint = current();
    std::stringstream ss;
    ss << "Ability Checkpoint\n";
    ss << "==================\n";
    ss << "Version: " << checkpoint->version << "\n";
    ss << "Source: " << (checkpoint->source_path.empty() ? "(built-in)" : checkpoint->source_path) << "\n";
    ss << "Dimension: " << checkpoint->dimension << "\n";
    ss << "Weights:";
    for (double weight : checkpoint->weights) {
        ss << " " << weight;
    }
    ss << "\n";
    ss << "Models: " << checkpoint->abilities.size() << "\n";
    std::vector<std::string> model_ids;
    for (const auto& [model_id, ability] : checkpoint->abilities) {
        model_ids.push_back(model_id);
    }
    std::sort(model_ids.begin(), model_ids.end());
    for (const auto& model_id : model_ids) {
        ss << "  - " << model_id << "\n";
    }
    return ss.str();
}

} // namespace Switchboard
