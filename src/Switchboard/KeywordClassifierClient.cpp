// =================================================================
// src/Switchboard/KeywordClassifierClient.cpp
// =================================================================
// Implementation of the offline keyword classifier.

#include "Switchboard/KeywordClassifierClient.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace Switchboard {

namespace {

const std::string kGeneral = "general";

std::regex icase(const std::string& pattern) {
    return std::regex(pattern, std::regex_constants::icase);
}

} // namespace

KeywordClassifierClient::KeywordClassifierClient() {
    initializeDefaultRules();
}

std::string KeywordClassifierClient::getName() const {
    return "keyword";
}

void KeywordClassifierClient::initializeDefaultRules() {
    m_domain_rules["programming"] = {
        {"code", "function", "class", "method", "bug", "compile", "api", "python", "javascript",
         "typescript", "java", "rust", "c++", "golang", "script", "library", "refactor", "unit test",
         "stack trace", "exception", "segfault", "regex", "endpoint"},
        {icase(R"(```)"),
         icase(R"(\b(def|fn|func|function|class|struct)\s+\w+)"),
         icase(R"(\b\w+\.(py|js|ts|cpp|hpp|rs|go|java|rb)\b)")}
    };

    m_domain_rules["math"] = {
        {"equation", "integral", "derivative", "theorem", "proof", "prove", "matrix", "probability",
         "calculus", "algebra", "polynomial", "eigenvalue", "geometry", "arithmetic"},
        {icase(R"(\bsolve\s+(for|the\s+equation))"),
         icase(R"(\d+\s*[\+\-\*/\^]\s*\d+)"),
         icase(R"(\b(sin|cos|tan|log|sqrt)\s*\()")}
    };

    m_domain_rules["writing"] = {
        {"essay", "story", "poem", "article", "blog", "email", "letter", "paragraph", "rewrite",
         "paraphrase", "proofread", "tone", "headline", "novel", "lyrics", "cover letter"},
        {icase(R"(\b(write|draft|compose)\s+(a|an|the)\s+(essay|story|poem|article|email|letter|post))"),
         icase(R"(\bmake\s+(it|this)\s+(sound|more)\b)")}
    };

    m_domain_rules["data"] = {
        {"dataset", "csv", "sql", "dataframe", "pandas", "statistics", "regression", "chart",
         "spreadsheet", "histogram", "pivot", "etl", "column", "rows"},
        {icase(R"(\b(select|group\s+by|join)\b.*\bfrom\b)"),
         icase(R"(\b(mean|median|variance|correlation)\s+of\b)")}
    };

    m_action_rules["code-generation"] = {
        {"implement", "generate code", "write code", "write a function", "create a class",
         "build a", "scaffold", "boilerplate"},
        {icase(R"(\b(create|write|implement|generate|build|make)\s+(a\s+|an\s+|the\s+)?(\w+\s+){0,2}(function|class|method|component|module|script|program|api|service)\b)"),
         icase(R"(\bimplement\s+\w+)")}
    };

    m_action_rules["debugging"] = {
        {"fix", "bug", "error", "broken", "crash", "fails", "failing", "debug", "stack trace",
         "exception", "not working", "segfault"},
        {icase(R"(\b(fix|debug|solve|resolve|repair)\s+(this\s+|the\s+|my\s+)?(bug|error|issue|problem|crash))"),
         icase(R"(\b(doesn't|does\s+not|won't|isn't)\s+work)")}
    };

    m_action_rules["code-review"] = {
        {"review", "refactor", "improve", "clean up", "code smell", "best practice", "optimize"},
        {icase(R"(\b(review|audit|critique)\s+(this|my|the)\s+(code|pr|pull\s+request|diff|function))"),
         icase(R"(\bhow\s+(can|could|should)\s+i\s+improve\b)")}
    };

    m_action_rules["explanation"] = {
        {"explain", "what does", "how does", "why does", "walk me through", "understand", "meaning of"},
        {icase(R"(\bexplain\s+(how|why|what|this|the))"),
         icase(R"(\bwhat\s+(does|is)\s+(this|the)\s+\w+)")}
    };

    m_action_rules["summarization"] = {
        {"summarize", "summarise", "summary", "tl;dr", "tldr", "condense", "key points", "shorten"},
        {icase(R"(\b(give|write)\s+(me\s+)?a\s+(short\s+|brief\s+)?summary)")}
    };

    m_action_rules["translation"] = {
        {"translate", "translation", "in french", "in spanish", "in german", "in japanese",
         "in chinese", "into english"},
        {icase(R"(\btranslate\s+.*\b(to|into)\s+\w+)")}
    };

    m_action_rules["creative-writing"] = {
        {"story", "poem", "lyrics", "haiku", "fiction", "creative", "novel", "limerick"},
        {icase(R"(\b(write|compose)\s+(a|an)\s+(short\s+)?(story|poem|song|haiku|limerick))")}
    };

    m_action_rules["analysis"] = {
        {"analyze", "analyse", "compare", "evaluate", "assess", "trend", "statistics", "correlation",
         "pros and cons", "trade-off"},
        {icase(R"(\b(analy[sz]e|compare|evaluate)\s+(the|this|these|my)\b)")}
    };

    m_action_rules["question-answering"] = {
        {"what is", "who is", "when did", "where is", "how many", "which"},
        {icase(R"(^\s*(what|who|when|where|which|how|why|is|are|can|does|do)\b)"),
         icase(R"(\?\s*$)")}
    };
}

std::string KeywordClassifierClient::normalizeText(const std::string& text) {
    std::string normalized = text;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::string collapsed;
    collapsed.reserve(normalized.size());
    for (char c : normalized) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!collapsed.empty() && collapsed.back() != ' ') {
                collapsed += ' ';
            }
        } else {
            collapsed += c;
        }
    }
    if (!collapsed.empty() && collapsed.back() == ' ') {
        collapsed.pop_back();
    }
    return collapsed;
}

std::map<std::string, double> KeywordClassifierClient::score(const std::string& normalized_text,
                                                             const std::string& raw_text,
                                                             const std::map<std::string, Rule>& rules,
                                                             std::vector<std::string>& matched) const {
    std::map<std::string, double> scores;
    std::string padded = " " + normalized_text + " ";

    for (const auto& [label, rule] : rules) {
        size_t keyword_hits = 0;
        for (const auto& keyword : rule.keywords) {
            // Whole-word match on the padded text
            size_t pos = padded.find(keyword);
            while (pos != std::string::npos) {
                bool starts = pos == 0 || !std::isalnum(static_cast<unsigned char>(padded[pos - 1]));
                size_t end = pos + keyword.size();
                bool ends = end >= padded.size() || !std::isalnum(static_cast<unsigned char>(padded[end]));
                if (starts && ends) {
                    keyword_hits++;
                    matched.push_back(keyword);
                    break;
                }
                pos = padded.find(keyword, pos + 1);
            }
        }

        size_t pattern_hits = 0;
        for (const auto& pattern : rule.patterns) {
            if (std::regex_search(raw_text, pattern)) {
                pattern_hits++;
            }
        }

        double keyword_score = std::min(1.0, static_cast<double>(keyword_hits) / 3.0);
        double pattern_score = rule.patterns.empty()
            ? 0.0 : static_cast<double>(pattern_hits) / static_cast<double>(rule.patterns.size());
        scores[label] = 0.6 * keyword_score + 0.4 * pattern_score;
    }

    return scores;
}

std::string KeywordClassifierClient::pickBest(const std::map<std::string, double>& scores,
                                              double& top, double& second) {
    std::string best = kGeneral;
    top = 0.0;
    second = 0.0;
    for (const auto& [label, value] : scores) {
        if (value > top) {
            second = top;
            top = value;
            best = label;
        } else if (value > second) {
            second = value;
        }
    }
    return best;
}

double KeywordClassifierClient::calculateConfidence(double top_score, double second_score) {
    if (top_score <= 0.0) {
        return 0.3;
    }
    // Separation from the runner-up
    double separation = (top_score - second_score) / top_score;
    return std::min(1.0, 0.4 + 0.6 * top_score * (0.5 + 0.5 * separation));
}

Classification KeywordClassifierClient::classify(const std::string& prompt,
                                                 const std::vector<ConversationTurn>& context) {
    const std::string scan_prompt = clipForPatternScan(prompt);
    std::string raw_text = scan_prompt;
    if (!context.empty()) {
        // The last turn often names the subject of a short follow-up
        raw_text = clipForPatternScan(context.back().content) + "\n" + scan_prompt;
    }
    std::string normalized = normalizeText(raw_text);

    std::vector<std::string> domain_matches;
    std::vector<std::string> action_matches;
    auto domain_scores = score(normalized, raw_text, m_domain_rules, domain_matches);
    // Actions are read from the prompt alone
    auto action_scores = score(normalizeText(scan_prompt), scan_prompt, m_action_rules, action_matches);

    double domain_top = 0.0;
    double domain_second = 0.0;
    double action_top = 0.0;
    double action_second = 0.0;

    Classification result;
    result.domain = pickBest(domain_scores, domain_top, domain_second);
    result.action = pickBest(action_scores, action_top, action_second);
    result.confidence = std::min(calculateConfidence(domain_top, domain_second),
                                 calculateConfidence(action_top, action_second));
    result.source = getName();

    std::stringstream reasoning;
    reasoning << "domain=" << result.domain << " (score " << domain_top << ")"
              << ", action=" << result.action << " (score " << action_top << ")";
    std::vector<std::string> all_matches = domain_matches;
    all_matches.insert(all_matches.end(), action_matches.begin(), action_matches.end());
    std::sort(all_matches.begin(), all_matches.end());
    all_matches.erase(std::unique(all_matches.begin(), all_matches.end()), all_matches.end());
    if (!all_matches.empty()) {
        reasoning << "; matched:";
        for (const auto& keyword : all_matches) {
            reasoning << " '" << keyword << "'";
        }
    }
    result.reasoning = reasoning.str();

    return result;
}

std::vector<std::string> KeywordClassifierClient::getDomains() const {
    std::vector<std::string> domains;
    for (const auto& [label, rule] : m_domain_rules) {
        domains.push_back(label);
    }
    domains.push_back(kGeneral);
    return domains;
}

std::vector<std::string> KeywordClassifierClient::getActions() const {
    std::vector<std::string> actions;
    for (const auto& [label, rule] : m_action_rules) {
        actions.push_back(label);
    }
    actions.push_back(kGeneral);
    return actions;
}

} // namespace Switchboard
