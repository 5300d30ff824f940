// =================================================================
// include/Switchboard/KeywordClassifierClient.hpp
// =================================================================
// Offline keyword and pattern classifier.

#pragma once

#include "Switchboard/TaskClassifier.hpp"
#include <map>
#include <regex>
#include <string>
#include <vector>

namespace Switchboard {

/**
 * @brief Deterministic classifier for deployments without a classification model
 *
 * Scores every domain and action by keyword hits (0.6) and regex pattern
 * hits (0.4) and picks the best of each; "general" wins when nothing matches.
 */
class KeywordClassifierClient : public ClassifierClient {
public:
    KeywordClassifierClient();

    Classification classify(const std::string& prompt,
                            const std::vector<ConversationTurn>& context) override;

    std::string getName() const override;

    std::vector<std::string> getDomains() const;
    std::vector<std::string> getActions() const;

private:
    struct Rule {
        std::vector<std::string> keywords;
        std::vector<std::regex> patterns;
    };

    // Ordered maps keep tie-breaking stable
    std::map<std::string, Rule> m_domain_rules;
    std::map<std::string, Rule> m_action_rules;

    void initializeDefaultRules();

    std::map<std::string, double> score(const std::string& normalized_text,
                                        const std::string& raw_text,
                                        const std::map<std::string, Rule>& rules,
                                        std::vector<std::string>& matched) const;

    static std::string pickBest(const std::map<std::string, double>& scores, double& top, double& second);
    static double calculateConfidence(double top_score, double second_score);
    static std::string normalizeText(const std::string& text);
};

} // namespace Switchboard
