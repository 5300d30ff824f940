// =================================================================
// include/Switchboard/HttpClassifierClient.hpp
// =================================================================
// Classifier client for a small OpenAI-compatible chat model.

#pragma once

#include "Switchboard/TaskClassifier.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace Switchboard {

/**
 * @brief Connection settings for the classification model
 */
struct HttpClassifierConfig {
    std::string endpoint = "http://localhost:8080";  ///< Server base URL
    std::string model = "router-classifier";         ///< Model name sent in the request
    std::string api_key;                             ///< Optional bearer token
    std::chrono::milliseconds timeout{300};          ///< Connection and read timeout
    size_t max_tokens = 128;
    std::vector<std::string> domains = {"programming", "math", "writing", "data", "general"};
    std::vector<std::string> actions = {
        "code-generation", "debugging", "code-review", "explanation", "summarization",
        "translation", "question-answering", "creative-writing", "analysis", "general"};
};

/**
 * @brief Calls POST /v1/chat/completions and parses a JSON label
 */
class HttpClassifierClient : public ClassifierClient {
public:
    explicit HttpClassifierClient(const HttpClassifierConfig& config);

    Classification classify(const std::string& prompt,
                            const std::vector<ConversationTurn>& context) override;

    std::string getName() const override;

    /**
     * @brief Parse the model's reply text
     *
     * Accepts a bare JSON object or one wrapped in a code fence or prose.
     *
     * @throws std::runtime_error if no object is found or domain/action is missing
     */
    static Classification parseClassification(const std::string& content);

    /**
     * @brief System prompt listing the allowed labels
     */
    std::string buildSystemPrompt() const;

private:
    HttpClassifierConfig m_config;
};

} // namespace Switchboard
