// =================================================================
// src/Switchboard/FeatureExtractor.cpp
// =================================================================
// Implementation of deterministic prompt feature extraction.

#include "Switchboard/FeatureExtractor.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace Switchboard {

namespace {

// Longest line handed to a code-line pattern
constexpr size_t kMaxScanLine = 1024;

std::vector<std::regex> wordPatterns(const std::vector<std::string>& words) {
    std::vector<std::regex> patterns;
    patterns.reserve(words.size());
    for (const auto& word : words) {
        patterns.emplace_back("\\b" + word + "\\b", std::regex_constants::icase);
    }
    return patterns;
}

double clamp01(double value) {
    return std::max(0.0, std::min(1.0, value));
}

std::string trimLeft(const std::string& line) {
    size_t start = line.find_first_not_of(" \t\r");
    return start == std::string::npos ? "" : line.substr(start);
}

} // namespace

std::vector<double> QueryFeatures::toVector() const {
    return {
        clamp01(std::log1p(static_cast<double>(token_estimate)) / std::log1p(8192.0)),
        clamp01(complexity),
        has_code ? 1.0 : 0.0,
        clamp01(static_cast<double>(code_line_count) / 100.0),
        clamp01(static_cast<double>(domain_indicators.size()) / 4.0),
        needs_tools ? 1.0 : 0.0,
        clamp01(static_cast<double>(conversation_depth) / 10.0),
        clamp01(ambiguity)
    };
}

std::string QueryFeatures::toString() const {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(2);
    ss << "tokens=" << token_estimate
       << " complexity=" << complexity
       << " code=" << (has_code ? "yes(" + std::to_string(code_line_count) + " lines)" : "no")
       << " domains=[";
    bool first = true;
    for (const auto& domain : domain_indicators) {
        if (!first) ss << ",";
        ss << domain;
        first = false;
    }
    ss << "] tools=" << (needs_tools ? "yes" : "no")
       << " depth=" << conversation_depth
       << " ambiguity=" << ambiguity;
    return ss.str();
}

FeatureExtractor::FeatureExtractor(const FeatureExtractorConfig& config) : m_config(config) {
    if (m_config.chars_per_token == 0) {
        m_config.chars_per_token = 1;
    }
    initializeDefaultRules();
}

const std::vector<std::string>& FeatureExtractor::getFeatureNames() {
    static const std::vector<std::string> names = {
        "token_estimate", "complexity", "has_code", "code_line_count",
        "domain_breadth", "needs_tools", "conversation_depth", "ambiguity"
    };
    return names;
}

void FeatureExtractor::initializeDefaultRules() {
    // Ordered so indicator sets are built identically on every run
    m_domain_patterns = {
        {"data", wordPatterns({
            "dataset", "csv", "sql", "dataframe", "pandas", "statistics", "regression",
            "chart", "spreadsheet", "histogram", "aggregate", "pivot table"})},
        {"math", wordPatterns({
            "equation", "integral", "derivative", "theorem", "proof", "prove", "matrix",
            "probability", "calculus", "algebra", "polynomial", "eigenvalue", "solve for"})},
        {"programming", wordPatterns({
            "code", "function", "class", "method", "bug", "compile", "compiler", "api",
            "python", "javascript", "typescript", "java", "rust", "golang", "refactor",
            "debug", "stack trace", "exception", "variable", "algorithm", "segfault"})},
        {"translation", wordPatterns({
            "translate", "translation", "french", "spanish", "german", "japanese",
            "chinese", "portuguese", "italian"})},
        {"writing", wordPatterns({
            "essay", "story", "poem", "article", "blog", "email", "letter", "paragraph",
            "rewrite", "paraphrase", "proofread", "tone", "headline"})}
    };

    m_code_line_patterns = {
        std::regex(R"(^\s*(#include|def|class|fn|func|function|import|from\s+\S+\s+import|public|private|protected|static|return|const|let|var|package|using|struct|template)\b)"),
        std::regex(R"([;{}]\s*$)"),
        std::regex(R"(^\s*(if|for|while|switch)\s*\(.*\))"),
        std::regex(R"(^\s*(//|/\*|#!))")
    };

    m_tool_patterns = {
        std::regex(R"(\b(search|browse)\s+(the\s+)?(web|internet|online)\b)", std::regex_constants::icase),
        std::regex(R"(\blook\s+up\b)", std::regex_constants::icase),
        std::regex(R"(\b(fetch|download)\s+(the\s+|this\s+)?(url|page|file|website)\b)", std::regex_constants::icase),
        std::regex(R"(\b(run|execute)\s+(this|the|my)\s+(code|command|script|query)\b)", std::regex_constants::icase),
        std::regex(R"(\b(current|latest|today'?s|live)\s+(weather|price|prices|news|stock|exchange\s+rate)\b)", std::regex_constants::icase),
        std::regex(R"(\buse\s+(a|the)\s+tool\b)", std::regex_constants::icase),
        std::regex(R"(\bcall\s+(the|an|this)\s+(api|endpoint|function)\b)", std::regex_constants::icase),
        std::regex(R"(https?://)", std::regex_constants::icase)
    };

    m_reasoning_patterns = {
        std::regex(R"(\bstep[- ]by[- ]step\b)", std::regex_constants::icase),
        std::regex(R"(\b(prove|derive)\b)", std::regex_constants::icase),
        std::regex(R"(\boptimi[sz]e\b)", std::regex_constants::icase),
        std::regex(R"(\bcompare\b)", std::regex_constants::icase),
        std::regex(R"(\btrade-?offs?\b)", std::regex_constants::icase),
        std::regex(R"(\b(architecture|design)\b)", std::regex_constants::icase),
        std::regex(R"(\banaly[sz]e\b)", std::regex_constants::icase),
        std::regex(R"(\bexplain\s+why\b)", std::regex_constants::icase),
        std::regex(R"(\bedge\s+cases?\b)", std::regex_constants::icase),
        std::regex(R"(\b(concurrent|concurrency|thread-?safe)\b)", std::regex_constants::icase),
        std::regex(R"(\bmulti-?step\b)", std::regex_constants::icase)
    };

    m_vague_patterns = {
        std::regex(R"(\b(something|stuff|thing|things|somehow|whatever|etc)\b)", std::regex_constants::icase),
        std::regex(R"(\b(maybe|kind\s+of|sort\s+of)\b)", std::regex_constants::icase)
    };

    m_deictic_pattern = std::regex(R"(\b(it|this|that|these|those)\b)", std::regex_constants::icase);
}

std::string clipForPatternScan(const std::string& text, size_t max_chars, size_t max_line_chars) {
    std::string clipped;
    clipped.reserve(std::min(text.size(), max_chars));

    bool previous_blank = false;
    size_t start = 0;
    while (start < text.size() && clipped.size() < max_chars) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        size_t length = end - start;
        bool blank = text.find_first_not_of(" \t\r\f\v", start) >= end;
        if (!(blank && previous_blank)) {
            if (start > 0) {
                clipped += '\n';
            }
            if (!blank) {
                clipped.append(text, start, std::min(length, max_line_chars));
            }
        }
        previous_blank = blank;
        start = end + 1;
    }

    if (clipped.size() > max_chars) {
        clipped.resize(max_chars);
    }
    return clipped;
}

QueryFeatures FeatureExtractor::extract(const std::string& prompt,
                                        const std::vector<ConversationTurn>& context) const {
    QueryFeatures features;
    features.conversation_depth = context.size();

    // Only the most recent turns are inspected
    size_t first_turn = context.size() > m_config.max_context_turns
        ? context.size() - m_config.max_context_turns : 0;

    std::string combined = prompt;
    for (size_t i = first_turn; i < context.size(); ++i) {
        combined += "\n";
        combined += context[i].content;
    }

    size_t char_count = prompt.size();
    for (size_t i = first_turn; i < context.size(); ++i) {
        char_count += context[i].content.size();
    }
    features.token_estimate = (char_count + m_config.chars_per_token - 1) / m_config.chars_per_token;

    const std::string scan_combined = clipForPatternScan(combined);
    const std::string scan_prompt = clipForPatternScan(prompt);

    bool saw_fence = false;
    features.code_line_count = countCodeLines(combined, saw_fence);
    features.has_code = saw_fence || features.code_line_count > 0;

    for (const auto& [domain, patterns] : m_domain_patterns) {
        for (const auto& pattern : patterns) {
            if (std::regex_search(scan_combined, pattern)) {
                features.domain_indicators.insert(domain);
                break;
            }
        }
    }
    if (features.has_code) {
        features.domain_indicators.insert("programming");
    }

    for (const auto& pattern : m_tool_patterns) {
        if (std::regex_search(scan_prompt, pattern)) {
            features.needs_tools = true;
            break;
        }
    }

    size_t reasoning_markers = countMatches(scan_prompt, m_reasoning_patterns);
    features.complexity = computeComplexity(features, reasoning_markers);
    features.ambiguity = computeAmbiguity(scan_prompt, features);

    return features;
}

size_t FeatureExtractor::countCodeLines(const std::string& text, bool& saw_fence) const {
    size_t count = 0;
    bool in_fence = false;
    saw_fence = false;

    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        std::string trimmed = trimLeft(line);
        if (trimmed.rfind("```", 0) == 0) {
            in_fence = !in_fence;
            saw_fence = true;
            continue;
        }
        if (trimmed.empty()) {
            continue;
        }
        if (in_fence) {
            count++;
            continue;
        }
        if (line.size() > kMaxScanLine) {
            line.resize(kMaxScanLine);
        }
        for (const auto& pattern : m_code_line_patterns) {
            if (std::regex_search(line, pattern)) {
                count++;
                break;
            }
        }
    }
    return count;
}

size_t FeatureExtractor::countMatches(const std::string& text, const std::vector<std::regex>& patterns) const {
    size_t count = 0;
    for (const auto& pattern : patterns) {
        count += static_cast<size_t>(std::distance(
            std::sregex_iterator(text.begin(), text.end(), pattern), std::sregex_iterator()));
    }
    return count;
}

double FeatureExtractor::computeComplexity(const QueryFeatures& features, size_t reasoning_markers) const {
    double length_term = std::min(1.0, static_cast<double>(features.token_estimate) / 1024.0);
    double code_term = std::min(1.0, static_cast<double>(features.code_line_count) / 50.0);
    double breadth_term = std::min(1.0, static_cast<double>(features.domain_indicators.size()) / 3.0);
    double reasoning_term = std::min(1.0, static_cast<double>(reasoning_markers) / 3.0);
    double tool_term = features.needs_tools ? 1.0 : 0.0;

    return clamp01(0.30 * length_term + 0.20 * code_term + 0.15 * breadth_term +
                   0.25 * reasoning_term + 0.10 * tool_term);
}

double FeatureExtractor::computeAmbiguity(const std::string& prompt, const QueryFeatures& features) const {
    std::istringstream stream(prompt);
    size_t word_count = static_cast<size_t>(std::distance(
        std::istream_iterator<std::string>(stream), std::istream_iterator<std::string>()));
    if (word_count == 0) {
        return 1.0;
    }

    double ambiguity = 0.0;
    if (word_count < 4) {
        ambiguity += 0.4;
    } else if (word_count < 8) {
        ambiguity += 0.2;
    }

    ambiguity += std::min(0.3, 0.1 * static_cast<double>(countMatches(prompt, m_vague_patterns)));

    // References with nothing to refer back to
    if (features.conversation_depth == 0 && !features.has_code &&
        std::regex_search(prompt, m_deictic_pattern)) {
        ambiguity += 0.2;
    }

    if (features.domain_indicators.empty()) {
        ambiguity += 0.1;
    }
    if (features.has_code) {
        ambiguity -= 0.1;
    }

    return clamp01(ambiguity);
}

} // namespace Switchboard
