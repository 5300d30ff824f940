// =================================================================
// include/Switchboard/ModelCapabilities.hpp
// =================================================================
// Model capability tags and the model record shared by the registry,
// the scoring engine and the decision log.

#pragma once

#include <string>
#include <vector>

namespace Switchboard {

/**
 * @brief Capability tags a model may declare
 */
enum class ModelCapability {
    CODE,               ///< Code generation and editing
    REASONING,          ///< Multi-step logical reasoning
    TOOL_USE,           ///< Function / tool calling
    VISION,             ///< Image input
    LONG_CONTEXT,       ///< Extended context window (>32k tokens)
    FAST_INFERENCE,     ///< Optimized for latency over quality
    CHAT,               ///< Conversational tuning
    MULTILINGUAL,       ///< Strong non-English support
    CREATIVE_WRITING,   ///< Optimized for creative text
    EMBEDDING           ///< Produces embeddings rather than text
};

/**
 * @brief A model exposed by one executor
 *
 * Health and cost are refreshed only by the owning executor's probe.
 */
struct ModelInfo {
    std::string id;                          ///< Model identifier used by policies
    std::string executor_id;                 ///< Owning executor
    std::string display_name;                ///< Human-readable name
    double cost_per_million_tokens = 0.0;    ///< Serving cost, >= 0
    size_t context_window = 0;               ///< Context window in tokens, 0 if unknown
    std::vector<ModelCapability> capabilities; ///< Declared capability tags
    bool is_healthy = false;                 ///< Cleared when the owning executor fails a probe
};

/**
 * @brief Conversions between capability tags and their configuration names
 *
 * Names are case-insensitive and accept '-' or ' ' for '_', so `tool-use`
 * and `TOOL_USE` name the same tag.
 */
class ModelCapabilityUtils {
public:
    static std::string capabilityToString(ModelCapability capability);

    /**
     * @throws std::invalid_argument if the string names no capability
     */
    static ModelCapability stringToCapability(const std::string& str);

    static bool hasCapability(const ModelInfo& model, ModelCapability capability);

    /**
     * @brief Comma-separated names, for executor listings
     */
    static std::string joinCapabilities(const std::vector<ModelCapability>& capabilities);

    /**
     * @throws std::invalid_argument on the first unknown entry
     */
    static std::vector<ModelCapability> parseCapabilities(const std::vector<std::string>& capability_strings);
};

} // namespace Switchboard
