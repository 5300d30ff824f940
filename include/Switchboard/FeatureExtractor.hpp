// =================================================================
// include/Switchboard/FeatureExtractor.hpp
// =================================================================
// Deterministic prompt difficulty features for the scoring engine.

#pragma once

#include <cstddef>
#include <regex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace Switchboard {

/**
 * @brief One prior turn of the conversation
 */
struct ConversationTurn {
    std::string role;     ///< "user", "assistant" or "system"
    std::string content;
};

/**
 * @brief Difficulty features derived from one request
 */
struct QueryFeatures {
    size_t token_estimate = 0;                  ///< Approximate prompt + context tokens
    double complexity = 0.0;                    ///< Task complexity in [0, 1]
    bool has_code = false;                      ///< Prompt or context contains code
    size_t code_line_count = 0;                 ///< Lines recognized as code
    std::set<std::string> domain_indicators;    ///< Domains with matching keywords
    bool needs_tools = false;                   ///< Request asks for tool or live data use
    size_t conversation_depth = 0;              ///< Number of prior turns
    double ambiguity = 0.0;                     ///< Underspecification in [0, 1]

    static constexpr size_t kDimension = 8;

    /**
     * @brief Normalized feature vector, every entry in [0, 1]
     *
     * Order: tokens, complexity, code presence, code lines, domain breadth,
     * tool use, conversation depth, ambiguity.
     */
    std::vector<double> toVector() const;

    std::string toString() const;
};

/**
 * @brief Feature extraction settings
 */
struct FeatureExtractorConfig {
    size_t max_context_turns = 4;   ///< Most recent turns inspected
    size_t chars_per_token = 4;     ///< Characters per estimated token
};

/**
 * @brief Bounded copy of text for regular expression scans
 *
 * Keeps at most max_line_chars of each line and max_chars overall, and
 * collapses runs of blank lines. std::regex recursion depth grows with the
 * length of a match, so request text must be clipped before it is scanned.
 */
std::string clipForPatternScan(const std::string& text,
                               size_t max_chars = 16 * 1024,
                               size_t max_line_chars = 1024);

/**
 * @brief Pure prompt-to-features transform
 *
 * No I/O and no mutable state: identical input always yields identical
 * features, and one instance may be shared by any number of threads.
 */
class FeatureExtractor {
public:
    explicit FeatureExtractor(const FeatureExtractorConfig& config = FeatureExtractorConfig());

    /**
     * @brief Extract features from a prompt and its recent turns
     * @param prompt Current user request
     * @param context Prior turns, oldest first; only the newest max_context_turns are read
     */
    QueryFeatures extract(const std::string& prompt,
                          const std::vector<ConversationTurn>& context = {}) const;

    const FeatureExtractorConfig& getConfig() const { return m_config; }

    static const std::vector<std::string>& getFeatureNames();

private:
    FeatureExtractorConfig m_config;

    std::vector<std::pair<std::string, std::vector<std::regex>>> m_domain_patterns;
    std::vector<std::regex> m_code_line_patterns;
    std::vector<std::regex> m_tool_patterns;
    std::vector<std::regex> m_reasoning_patterns;
    std::vector<std::regex> m_vague_patterns;
    std::regex m_deictic_pattern;

    void initializeDefaultRules();
    size_t countCodeLines(const std::string& text, bool& saw_fence) const;
    size_t countMatches(const std::string& text, const std::vector<std::regex>& patterns) const;
    double computeComplexity(const QueryFeatures& features, size_t reasoning_markers) const;
    double computeAmbiguity(const std::string& prompt, const QueryFeatures& features) const;
};

} // namespace Switchboard
