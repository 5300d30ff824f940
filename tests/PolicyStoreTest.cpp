// =================================================================
// tests/PolicyStoreTest.cpp
// =================================================================
// Unit tests for PolicyStore and the policy sources.

#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include "Switchboard/PolicySource.hpp"
#include "Switchboard/PolicyStore.hpp"
#include "TestDoubles.hpp"
#include <yaml-cpp/yaml.h>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;
using namespace Switchboard;
using namespace SwitchboardTest;

class PolicyStoreTest {
private:
    std::string test_policy_path = "test_policies.yml";

    std::shared_ptr<FakePolicySource> defaultSource() const {
        return std::make_shared<FakePolicySource>(std::vector<Policy>{
            makePolicy("programming", "code-generation", {"gpt-4", "claude"}),
            makePolicy("programming", "*", {"codellama-13b"}),
            makePolicy("*", "*", {"llama3"})
        });
    }

public:
    PolicyStoreTest() {
        std::ofstream config(test_policy_path);
        config << R"(
logging:
  level: info
policies:
  - domain: writing
    action: "*"
    models: [claude, gpt-4]
  - domain: "*"
    action: "*"
    models: [llama3]
)";
        config.close();
    }

    ~PolicyStoreTest() {
        if (fs::exists(test_policy_path)) {
            fs::remove(test_policy_path);
        }
    }

    void testResolutionOrder() {
        std::cout << "Testing wildcard resolution order..." << std::endl;

        PolicyStore store(defaultSource());

        PolicyLookup exact = store.getCandidates("programming", "code-generation");
        assert(exact.match == PolicyMatch::EXACT && "Exact policy should win");
        assert(exact.model_ids.size() == 2 && exact.model_ids[0] == "gpt-4" && "Order should be kept");
        assert(!exact.stale && "Fresh table is not stale");

        PolicyLookup domain = store.getCandidates("programming", "debugging");
        assert(domain.match == PolicyMatch::DOMAIN_WILDCARD && "Domain wildcard should be next");
        assert(domain.model_ids[0] == "codellama-13b" && "Domain wildcard list");

        PolicyLookup global = store.getCandidates("writing", "summarization");
        assert(global.match == PolicyMatch::GLOBAL_DEFAULT && "Global default should be last");
        assert(global.model_ids[0] == "llama3" && "Global default list");

        assert(policyMatchToString(PolicyMatch::DOMAIN_WILDCARD) == "domain-wildcard" && "Match names");

        std::cout << "✓ Resolution order test passed" << std::endl;
    }

    void testConfiguredDefaultAndNoMatch() {
        std::cout << "Testing configured default list..." << std::endl;

        auto source = std::make_shared<FakePolicySource>(std::vector<Policy>{
            makePolicy("math", "analysis", {"gpt-4"})
        });

        PolicyStore bare(source);
        PolicyLookup none = bare.getCandidates("writing", "creative-writing");
        assert(none.match == PolicyMatch::NONE && "Nothing should match");
        assert(none.model_ids.empty() && "No candidates without any default");

        PolicyStoreConfig config;
        config.default_models = {"llama3", "phi3"};
        PolicyStore with_default(source, config);
        PolicyLookup fallback = with_default.getCandidates("writing", "creative-writing");
        assert(fallback.match == PolicyMatch::CONFIG_DEFAULT && "Configured default should apply");
        assert(fallback.model_ids.size() == 2 && "Configured list should be returned");

        std::cout << "✓ Configured default test passed" << std::endl;
    }

    void testPriorityBetweenDuplicates() {
        std::cout << "Testing duplicate policy priority..." << std::endl;

        auto source = std::make_shared<FakePolicySource>(std::vector<Policy>{
            makePolicy("data", "analysis", {"gpt-4"}, 1),
            makePolicy("data", "analysis", {"claude"}, 5),
            makePolicy("data", "analysis", {"llama3"}, 2),
            makePolicy("data", "summarization", {"gpt-4", "gpt-4"})   // duplicate ids, skipped
        });
        PolicyStore store(source);

        PolicyLookup lookup = store.getCandidates("data", "analysis");
        assert(lookup.model_ids.size() == 1 && lookup.model_ids[0] == "claude" && "Highest priority wins");

        PolicyLookup skipped = store.getCandidates("data", "summarization");
        assert(skipped.match == PolicyMatch::NONE && "Invalid policy should be skipped");
        assert(store.listPolicies().size() == 1 && "Only valid keys are listed");

        std::cout << "✓ Priority test passed" << std::endl;
    }

    void testLabelNormalization() {
        std::cout << "Testing policy label normalization..." << std::endl;

        auto source = std::make_shared<FakePolicySource>(std::vector<Policy>{
            makePolicy("Programming", "code_generation", {"gpt-4"}),
            makePolicy(" Data ", "*", {"claude"}),
            makePolicy("*", "*", {"llama3"})
        });
        PolicyStore store(source);

        PolicyLookup exact = store.getCandidates("programming", "code-generation");
        assert(exact.match == PolicyMatch::EXACT && exact.model_ids[0] == "gpt-4" &&
               "Stored labels are matched in canonical form");
        assert(store.getCandidates("PROGRAMMING", "Code Generation").match == PolicyMatch::EXACT &&
               "Lookup labels are canonicalized too");
        assert(store.getCandidates("data", "analysis").match == PolicyMatch::DOMAIN_WILDCARD &&
               "Wildcard action is kept as is");
        assert(store.getCandidates("math", "proof").match == PolicyMatch::GLOBAL_DEFAULT && "Global default");

        store.upsertPolicy(makePolicy("Writing", "cover_letter", {"claude"}));
        bool stored_canonical = false;
        for (const auto& policy : source->fetchAll()) {
            stored_canonical = stored_canonical || (policy.domain == "writing" && policy.action == "cover-letter");
        }
        assert(stored_canonical && "Upserts are written in canonical form");
        assert(store.getCandidates("writing", "cover-letter").match == PolicyMatch::EXACT && "Upsert is visible");

        assert(store.removePolicy("WRITING", "Cover Letter") && "Removal accepts any spelling");
        assert(store.getCandidates("writing", "cover-letter").match == PolicyMatch::GLOBAL_DEFAULT &&
               "Removed policy no longer matches");

        assert(normalizeTaskLabel("*") == "*" && "Wildcard is untouched");

        std::cout << "✓ Label normalization test passed" << std::endl;
    }

    void testCachingAndInvalidation() {
        std::cout << "Testing cache lifetime and invalidation..." << std::endl;

        auto source = defaultSource();
        PolicyStore store(source);

        store.getCandidates("programming", "code-generation");
        store.getCandidates("math", "analysis");
        assert(source->getFetchCount() == 1 && "Fresh table should be reused");

        source->upsert(makePolicy("math", "analysis", {"gpt-4"}));
        assert(store.getCandidates("math", "analysis").match == PolicyMatch::GLOBAL_DEFAULT &&
               "Source changes are not visible before the cache expires");

        store.invalidate();
        assert(store.getCandidates("math", "analysis").match == PolicyMatch::EXACT &&
               "Invalidation should force a refetch");
        assert(source->getFetchCount() == 2 && "Exactly one refetch");

        PolicyStoreConfig short_ttl;
        short_ttl.cache_ttl = std::chrono::milliseconds(20);
        auto other = defaultSource();
        PolicyStore expiring(other, short_ttl);
        expiring.getCandidates("programming", "code-generation");
        std::this_thread::sleep_for(std::chrono::milliseconds(40));
        expiring.getCandidates("programming", "code-generation");
        assert(other->getFetchCount() == 2 && "Expired table should be refetched");
        assert(expiring.getRefreshCount() == 2 && "Refreshes should be counted");

        std::cout << "✓ Caching test passed" << std::endl;
    }

    void testStaleServingDuringOutage() {
        std::cout << "Testing stale table during an outage..." << std::endl;

        auto source = defaultSource();
        PolicyStore store(source);

        bool threw = false;
        source->setAvailable(false);
        try {
            store.getCandidates("programming", "code-generation");
        } catch (const PolicyUnavailable& e) {
            threw = true;
            assert(e.code() == ErrorCode::POLICY_UNAVAILABLE && "Error code should match");
        }
        assert(threw && "Outage with nothing cached should raise PolicyUnavailable");
        assert(!store.hasCachedTable() && "Nothing should be cached");

        source->setAvailable(true);
        store.getCandidates("programming", "code-generation");
        assert(store.hasCachedTable() && "Table should be cached");

        source->setAvailable(false);
        store.invalidate();
        PolicyLookup lookup = store.getCandidates("programming", "code-generation");
        assert(lookup.stale && "Cached table should be served as stale");
        assert(lookup.match == PolicyMatch::EXACT && lookup.model_ids[0] == "gpt-4" && "Last good table");
        assert(store.getFetchFailureCount() == 2 && "Both failed fetches should be counted");

        std::cout << "✓ Stale serving test passed" << std::endl;
    }

    void testSlowSourceIsBounded() {
        std::cout << "Testing slow policy source..." << std::endl;

        auto source = defaultSource();
        source->setDelay(std::chrono::milliseconds(500));
        PolicyStoreConfig config;
        config.fetch_timeout = std::chrono::milliseconds(30);
        PolicyStore store(source, config);

        auto start = std::chrono::steady_clock::now();
        bool threw = false;
        try {
            store.getCandidates("programming", "code-generation");
        } catch (const PolicyUnavailable&) {
            threw = true;
        }
        assert(threw && "Timed-out fetch with nothing cached is an outage");
        assert(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(400) &&
               "Lookup should not wait for the slow source");

        auto token = std::make_shared<CancellationToken>();
        token->cancel();
        threw = false;
        try {
            store.getCandidates("programming", "code-generation", token.get());
        } catch (const Cancelled&) {
            threw = true;
        }
        assert(threw && "Cancelled lookup should raise Cancelled");

        std::cout << "✓ Slow source test passed" << std::endl;
    }

    void testConcurrentLookups() {
        std::cout << "Testing concurrent lookups..." << std::endl;

        auto source = defaultSource();
        source->setDelay(std::chrono::milliseconds(20));
        PolicyStore store(source);

        std::atomic<size_t> wrong{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&store, &wrong]() {
                for (int j = 0; j < 20; ++j) {
                    PolicyLookup lookup = store.getCandidates("programming", "code-generation");
                    if (lookup.model_ids.empty() || lookup.model_ids[0] != "gpt-4") {
                        wrong++;
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        assert(wrong.load() == 0 && "Every reader sees a complete table");
        assert(source->getFetchCount() == 1 && "Only one caller should fetch");

        std::cout << "✓ Concurrent lookup test passed" << std::endl;
    }

    void testPolicyValidation() {
        std::cout << "Testing policy validation..." << std::endl;

        PolicyStore store(defaultSource());
        auto expectConfigError = [&store](const Policy& policy, const char* message) {
            bool threw = false;
            try {
                store.upsertPolicy(policy);
            } catch (const ConfigError&) {
                threw = true;
            }
            assert(threw && message);
        };

        expectConfigError(makePolicy("", "debugging", {"gpt-4"}), "Empty domain should be rejected");
        expectConfigError(makePolicy("programming", "", {"gpt-4"}), "Empty action should be rejected");
        expectConfigError(makePolicy("programming", "debugging", {}), "Empty model list should be rejected");
        expectConfigError(makePolicy("programming", "debugging", {"gpt-4", ""}), "Empty id should be rejected");
        expectConfigError(makePolicy("programming", "debugging", {"gpt-4", "gpt-4"}),
                          "Duplicate ids should be rejected");

        store.upsertPolicy(makePolicy("programming", "debugging", {"claude"}));
        assert(store.getCandidates("programming", "debugging").match == PolicyMatch::EXACT &&
               "Upsert should be visible immediately");
        assert(store.removePolicy("programming", "debugging") && "Existing policy should be removed");
        assert(!store.removePolicy("programming", "debugging") && "Second removal is a no-op");
        assert(store.getCandidates("programming", "debugging").match == PolicyMatch::DOMAIN_WILDCARD &&
               "Removal should be visible immediately");

        std::cout << "✓ Policy validation test passed" << std::endl;
    }

    void testYamlPolicySource() {
        std::cout << "Testing YAML policy file..." << std::endl;

        auto source = std::make_shared<YamlPolicySource>(test_policy_path);
        PolicyStore store(source);
        assert(store.getSourceName() == "file:" + test_policy_path && "Source name should include the path");

        PolicyLookup lookup = store.getCandidates("writing", "summarization");
        assert(lookup.match == PolicyMatch::DOMAIN_WILDCARD && "File policies should be loaded");
        assert(lookup.model_ids[0] == "claude" && "File order should be kept");

        store.upsertPolicy(makePolicy("math", "*", {"gpt-4", "llama3"}, 3));
        store.upsertPolicy(makePolicy("writing", "*", {"gpt-4"}));
        assert(store.removePolicy("*", "*") && "Global policy should be removed from the file");

        auto reread = YamlPolicySource(test_policy_path).fetchAll();
        assert(reread.size() == 2 && "File should hold the two remaining policies");
        for (const auto& policy : reread) {
            if (policy.domain == "math") {
                assert(policy.priority == 3 && policy.model_ids.size() == 2 && "Upserted policy is persisted");
            } else {
                assert(policy.domain == "writing" && policy.model_ids.size() == 1 && "Replaced policy is persisted");
            }
        }

        YAML::Node root = YAML::LoadFile(test_policy_path);
        assert(root["logging"]["level"].as<std::string>() == "info" && "Other sections should be kept");

        auto missing = std::make_shared<YamlPolicySource>("does_not_exist_policies.yml");
        bool threw = false;
        try {
            missing->fetchAll();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw && "Missing policy file should fail the fetch");

        std::cout << "✓ YAML policy file test passed" << std::endl;
    }

    void testHttpPolicyBodies() {
        std::cout << "Testing policy store wire format..." << std::endl;

        auto policies = HttpPolicySource::parsePolicies(R"({
            "policies": [
                {"domain": "programming", "action": "*", "models": ["gpt-4", "claude"], "priority": 2},
                {"domain": "*", "action": "*", "models": ["llama3"]}
            ]
        })");
        assert(policies.size() == 2 && "Both policies should be parsed");
        assert(policies[0].priority == 2 && "Priority should be read");
        assert(policies[1].priority == 0 && "Priority defaults to zero");

        std::string body = HttpPolicySource::serializePolicy(policies[0]);
        assert(body.find("\"models\":[\"gpt-4\",\"claude\"]") != std::string::npos && "Models are serialized");

        bool threw = false;
        try {
            HttpPolicySource::parsePolicies(R"({"policies": [{"domain": "math"}]})");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw && "Entry without models should be rejected");

        HttpPolicySource unreachable("http://127.0.0.1:1", std::chrono::milliseconds(200));
        PolicyStore store(std::make_shared<HttpPolicySource>("http://127.0.0.1:1", std::chrono::milliseconds(200)));
        threw = false;
        try {
            store.getCandidates("programming", "debugging");
        } catch (const PolicyUnavailable&) {
            threw = true;
        }
        assert(threw && "Unreachable store with nothing cached is unavailable");
        assert(unreachable.getName() == "http:http://127.0.0.1:1" && "Source name should include the URL");

        std::cout << "✓ Wire format test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running PolicyStore unit tests..." << std::endl;
        std::cout << "================================" << std::endl << std::endl;

        testResolutionOrder();
        std::cout << std::endl;

        testConfiguredDefaultAndNoMatch();
        std::cout << std::endl;

        testPriorityBetweenDuplicates();
        std::cout << std::endl;

        testLabelNormalization();
        std::cout << std::endl;

        testCachingAndInvalidation();
        std::cout << std::endl;

        testStaleServingDuringOutage();
        std::cout << std::endl;

        testSlowSourceIsBounded();
        std::cout << std::endl;

        testConcurrentLookups();
        std::cout << std::endl;

        testPolicyValidation();
        std::cout << std::endl;

        testYamlPolicySource();
        std::cout << std::endl;

        testHttpPolicyBodies();
        std::cout << std::endl;

        std::cout << "All PolicyStore tests passed!" << std::endl;
    }
};

int main() {
    Logger::getInstance().setConsoleLogging(false);

    try {
        PolicyStoreTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All PolicyStore component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
