// =================================================================
// tests/TaskClassifierTest.cpp
// =================================================================
// Unit tests for TaskClassifier component and its clients.

#include "Switchboard/Cancellation.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/HttpClassifierClient.hpp"
#include "Switchboard/KeywordClassifierClient.hpp"
#include "Switchboard/Logger.hpp"
#include "Switchboard/TaskClassifier.hpp"
#include "TestDoubles.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

using namespace Switchboard;
using namespace SwitchboardTest;

class TaskClassifierTest {
private:
    TaskClassifierConfig shortTimeout(long ms) const {
        TaskClassifierConfig config;
        config.timeout = std::chrono::milliseconds(ms);
        return config;
    }

public:
    void testLabelNormalization() {
        std::cout << "Testing label normalization..." << std::endl;

        auto client = std::make_shared<FakeClassifierClient>();
        Classification raw;
        raw.domain = " Programming ";
        raw.action = "Code_Generation";
        raw.confidence = 1.7;
        client->setResult(raw);

        TaskClassifier classifier(client);
        Classification result = classifier.classify("Write a sorting function");
        assert(result.domain == "programming" && "Domain should be trimmed and lower-cased");
        assert(result.action == "code-generation" && "Underscores should become dashes");
        assert(result.confidence == 1.0 && "Confidence should be clamped to [0, 1]");
        assert(!result.is_fallback && "Client label is not a fallback");
        assert(result.source == "fake" && "Source should name the client");

        std::cout << "✓ Label normalization test passed" << std::endl;
    }

    void testMalformedReplies() {
        std::cout << "Testing malformed classifier replies..." << std::endl;

        auto client = std::make_shared<FakeClassifierClient>();
        TaskClassifier classifier(client);

        Classification missing_action;
        missing_action.domain = "math";
        client->setResult(missing_action);

        bool threw = false;
        try {
            classifier.classify("Integrate x squared");
        } catch (const ClassificationFailed&) {
            threw = true;
        }
        assert(threw && "Missing action should fail the classification");

        Classification not_a_number;
        not_a_number.domain = "math";
        not_a_number.action = "analysis";
        not_a_number.confidence = std::numeric_limits<double>::quiet_NaN();
        client->setResult(not_a_number);

        threw = false;
        try {
            classifier.classify("Integrate x squared");
        } catch (const ClassificationFailed&) {
            threw = true;
        }
        assert(threw && "NaN confidence should fail the classification");

        client->setError("connection reset by peer");
        threw = false;
        try {
            classifier.classify("Integrate x squared");
        } catch (const ClassificationFailed& e) {
            threw = true;
            assert(std::string(e.what()).find("connection reset") != std::string::npos &&
                   "Client error should be kept");
        }
        assert(threw && "Client exception should become ClassificationFailed");
        assert(classifier.getFailureCount() == 3 && "Every failure should be counted");

        std::cout << "✓ Malformed reply test passed" << std::endl;
    }

    void testTimeout() {
        std::cout << "Testing classifier timeout..." << std::endl;

        auto client = std::make_shared<FakeClassifierClient>();
        client->setDelay(std::chrono::milliseconds(400));
        TaskClassifier classifier(client, shortTimeout(30));

        auto start = std::chrono::steady_clock::now();
        bool threw = false;
        try {
            classifier.classify("Refactor this module");
        } catch (const ClassificationTimeout& e) {
            threw = true;
            assert(e.code() == ErrorCode::CLASSIFICATION_TIMEOUT && "Error code should match");
        }
        auto waited = std::chrono::steady_clock::now() - start;

        assert(threw && "Slow client should time out");
        assert(waited < std::chrono::milliseconds(300) && "Caller should not wait for the slow client");
        assert(classifier.getTimeoutCount() == 1 && "Timeout should be counted");

        std::cout << "✓ Timeout test passed" << std::endl;
    }

    void testCancellation() {
        std::cout << "Testing classification cancellation..." << std::endl;

        auto client = std::make_shared<FakeClassifierClient>();
        client->setDelay(std::chrono::milliseconds(400));
        TaskClassifier classifier(client, shortTimeout(2000));

        auto token = CancellationToken::withTimeout(std::chrono::milliseconds(20));
        bool threw = false;
        try {
            classifier.classify("Refactor this module", {}, token.get());
        } catch (const Cancelled&) {
            threw = true;
        }
        assert(threw && "Expired token should cancel the classification");
        assert(classifier.getTimeoutCount() == 0 && "Cancellation is not a timeout");
        assert(classifier.getFailureCount() == 0 && "Cancellation is not a failure");

        std::cout << "✓ Cancellation test passed" << std::endl;
    }

    void testFallbackLabel() {
        std::cout << "Testing fallback label..." << std::endl;

        TaskClassifierConfig config;
        config.fallback_domain = "general";
        config.fallback_action = "question-answering";
        config.fallback_confidence = 0.1;
        TaskClassifier classifier(std::make_shared<FakeClassifierClient>(), config);

        Classification fallback = classifier.fallback("timeout");
        assert(fallback.is_fallback && "Fallback should be flagged");
        assert(fallback.source == "fallback" && "Fallback source");
        assert(fallback.domain == "general" && fallback.action == "question-answering" && "Configured label");
        assert(fallback.confidence == 0.1 && "Configured confidence");
        assert(fallback.reasoning.find("timeout") != std::string::npos && "Reason should be kept");

        std::cout << "✓ Fallback label test passed" << std::endl;
    }

    void testConstructorValidation() {
        std::cout << "Testing classifier configuration validation..." << std::endl;

        bool threw = false;
        try {
            TaskClassifier classifier(nullptr);
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw && "Null client should be rejected");

        threw = false;
        try {
            TaskClassifier classifier(std::make_shared<FakeClassifierClient>(), shortTimeout(0));
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw && "Zero timeout should be rejected");

        std::cout << "✓ Configuration validation test passed" << std::endl;
    }

    void testClassificationStats() {
        std::cout << "Testing classification statistics..." << std::endl;

        auto client = std::make_shared<FakeClassifierClient>("math", "analysis", 0.8);
        TaskClassifier classifier(client);
        classifier.classify("Prove the theorem");
        classifier.classify("Solve for x");

        auto stats = classifier.getClassificationStats();
        assert(stats["math"] == 2 && "Per-domain counts should be kept");

        classifier.resetStats();
        assert(classifier.getClassificationStats().empty() && "Stats should reset");
        assert(classifier.getClientName() == "fake" && "Client name should be exposed");

        std::cout << "✓ Statistics test passed" << std::endl;
    }

    void testHttpReplyParsing() {
        std::cout << "Testing chat-completions reply parsing..." << std::endl;

        Classification bare = HttpClassifierClient::parseClassification(
            R"({"domain": "programming", "action": "debugging", "confidence": 0.82, "reasoning": "stack trace"})");
        assert(bare.domain == "programming" && bare.action == "debugging" && "Labels should be read");
        assert(bare.confidence == 0.82 && "Confidence should be read");
        assert(bare.reasoning == "stack trace" && "Reasoning should be read");

        Classification wrapped = HttpClassifierClient::parseClassification(
            "Sure! Here is the label:\n```json\n{\"domain\": \"writing\", \"action\": \"summarization\"}\n```");
        assert(wrapped.domain == "writing" && "Object inside a fence should be found");
        assert(wrapped.confidence == 0.5 && "Missing confidence defaults to 0.5");

        auto expectRejected = [](const std::string& content, const char* message) {
            bool threw = false;
            try {
                HttpClassifierClient::parseClassification(content);
            } catch (const std::runtime_error&) {
                threw = true;
            }
            assert(threw && message);
        };
        expectRejected("programming / debugging", "Reply without JSON should be rejected");
        expectRejected(R"({"domain": "programming"})", "Reply without action should be rejected");
        expectRejected(R"({"domain": "math", "action": "analysis", "confidence": "high"})",
                       "Non-numeric confidence should be rejected");
        expectRejected(R"({"domain": "math", "action": )", "Truncated JSON should be rejected");

        std::cout << "✓ Reply parsing test passed" << std::endl;
    }

    void testHttpClientPrompt() {
        std::cout << "Testing classifier system prompt..." << std::endl;

        HttpClassifierConfig config;
        config.domains = {"programming", "legal"};
        config.actions = {"drafting"};
        HttpClassifierClient client(config);

        std::string prompt = client.buildSystemPrompt();
        assert(prompt.find("programming, legal") != std::string::npos && "Domains should be listed");
        assert(prompt.find("drafting") != std::string::npos && "Actions should be listed");
        assert(client.getName() == "http:router-classifier" && "Name should include the model");

        std::cout << "✓ System prompt test passed" << std::endl;
    }

    void testUnreachableHttpClassifier() {
        std::cout << "Testing unreachable classifier endpoint..." << std::endl;

        HttpClassifierConfig config;
        config.endpoint = "http://127.0.0.1:1";
        config.timeout = std::chrono::milliseconds(200);
        TaskClassifier classifier(std::make_shared<HttpClassifierClient>(config), shortTimeout(2000));

        bool threw = false;
        try {
            classifier.classify("Summarize this article");
        } catch (const ClassificationFailed&) {
            threw = true;
        }
        assert(threw && "Unreachable endpoint should fail the classification");

        std::cout << "✓ Unreachable classifier test passed" << std::endl;
    }

    void testKeywordClassifier() {
        std::cout << "Testing keyword classifier..." << std::endl;

        auto keyword = std::make_shared<KeywordClassifierClient>();
        TaskClassifier classifier(keyword);

        Classification code = classifier.classify("Write a python function that parses a CSV file");
        assert(code.domain == "programming" && "Python function is programming");
        assert(code.action == "code-generation" && "Writing a function is code generation");
        assert(code.confidence > 0.3 && code.confidence <= 1.0 && "Matched label has some confidence");
        assert(code.source == "keyword" && "Source should name the client");
        assert(code.reasoning.find("'python'") != std::string::npos && "Matched keywords are listed");

        Classification translation = classifier.classify("Translate this paragraph into French");
        assert(translation.action == "translation" && "Translation request");
        assert(translation.domain == "writing" && "Paragraph is a writing indicator");

        Classification nothing = classifier.classify("hello there");
        assert(nothing.domain == "general" && nothing.action == "general" && "No match gives general");
        assert(nothing.confidence == 0.3 && "Unmatched label has the floor confidence");

        // A short follow-up borrows its subject from the previous turn
        std::vector<ConversationTurn> context = {{"user", "Here is my python script"}};
        Classification follow_up = classifier.classify("why does it crash?", context);
        assert(follow_up.domain == "programming" && "Domain should come from the context");

        auto domains = keyword->getDomains();
        assert(domains.back() == "general" && "General is always a domain");
        assert(keyword->getActions().size() == 10 && "Nine action rules plus general");

        std::cout << "✓ Keyword classifier test passed" << std::endl;
    }

    void testKeywordClassifierOversizedPrompt() {
        std::cout << "Testing keyword classifier on oversized prompts..." << std::endl;

        auto keyword = std::make_shared<KeywordClassifierClient>();
        Classification direct = keyword->classify("Please review " + std::string(200000, 'a') + ")", {});
        assert(direct.action == "code-review" && "Leading keyword survives a huge token");

        std::vector<ConversationTurn> context = {{"user", "def parse" + std::string(300000, 'x')}};
        TaskClassifier classifier(keyword, shortTimeout(5000));
        Classification routed = classifier.classify("Translate " + std::string(200000, ' ') + "into French", context);
        assert(routed.source == "keyword" && routed.action == "translation" &&
               "Huge prompt is classified by the client");

        std::cout << "✓ Oversized keyword prompt test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running TaskClassifier unit tests..." << std::endl;
        std::cout << "===================================" << std::endl << std::endl;

        testLabelNormalization();
        std::cout << std::endl;

        testMalformedReplies();
        std::cout << std::endl;

        testTimeout();
        std::cout << std::endl;

        testCancellation();
        std::cout << std::endl;

        testFallbackLabel();
        std::cout << std::endl;

        testConstructorValidation();
        std::cout << std::endl;

        testClassificationStats();
        std::cout << std::endl;

        testHttpReplyParsing();
        std::cout << std::endl;

        testHttpClientPrompt();
        std::cout << std::endl;

        testUnreachableHttpClassifier();
        std::cout << std::endl;

        testKeywordClassifier();
        std::cout << std::endl;

        testKeywordClassifierOversizedPrompt();
        std::cout << std::endl;

        std::cout << "All TaskClassifier tests passed!" << std::endl;
    }
};

int main() {
    Logger::getInstance().setConsoleLogging(false);

    try {
        TaskClassifierTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All TaskClassifier component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
