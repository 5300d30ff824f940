// =================================================================
// tests/ExecutorAdapterTest.cpp
// =================================================================
// Unit tests for the HTTP and CLI executor adapters.

#include "Switchboard/CliExecutorAdapter.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/HttpExecutorAdapter.hpp"
#include "Switchboard/Logger.hpp"
#include "Switchboard/ModelCapabilities.hpp"
#include "Switchboard/SysInteraction.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace Switchboard;

class ExecutorAdapterTest {
public:
    void testOpenAiModelListing() {
        std::cout << "Testing OpenAI model listing parsing..." << std::endl;

        auto ids = HttpExecutorAdapter::parseModelList(R"({
            "object": "list",
            "data": [
                {"id": "gpt-4", "object": "model"},
                {"id": "gpt-4o-mini", "object": "model"},
                {"object": "model"}
            ]
        })");
        assert(ids.size() == 2 && "Entries without id should be skipped");
        assert(ids[0] == "gpt-4" && ids[1] == "gpt-4o-mini" && "Listing order should be kept");

        std::cout << "✓ OpenAI listing test passed" << std::endl;
    }

    void testOllamaModelListing() {
        std::cout << "Testing Ollama model listing parsing..." << std::endl;

        auto ids = HttpExecutorAdapter::parseModelList(R"({
            "models": [
                {"name": "llama3:8b", "size": 4661224676},
                {"model": "codellama:13b"},
                "not-an-object"
            ]
        })");
        assert(ids.size() == 2 && "Name or model field should be used");
        assert(ids[0] == "llama3:8b" && ids[1] == "codellama:13b" && "Ids should be extracted");

        std::cout << "✓ Ollama listing test passed" << std::endl;
    }

    void testMalformedModelListing() {
        std::cout << "Testing malformed model listings..." << std::endl;

        bool threw = false;
        try {
            HttpExecutorAdapter::parseModelList("<html>502 Bad Gateway</html>");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw && "Non-JSON body should be rejected");

        threw = false;
        try {
            HttpExecutorAdapter::parseModelList(R"({"result": []})");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw && "Unknown shape should be rejected");

        assert(HttpExecutorAdapter::parseModelList(R"({"data": []})").empty() && "Empty listing is valid");

        std::cout << "✓ Malformed listing test passed" << std::endl;
    }

    void testApiPaths() {
        std::cout << "Testing API flavour paths..." << std::endl;

        assert(HttpExecutorAdapter::defaultHealthPath("openai") == "/health" && "OpenAI health path");
        assert(HttpExecutorAdapter::defaultHealthPath("ollama") == "/api/tags" && "Ollama health path");
        assert(HttpExecutorAdapter::modelListPath("openai") == "/v1/models" && "OpenAI listing path");
        assert(HttpExecutorAdapter::modelListPath("ollama") == "/api/tags" && "Ollama listing path");

        std::cout << "✓ API path test passed" << std::endl;
    }

    void testUnreachableHttpExecutor() {
        std::cout << "Testing unreachable HTTP executor..." << std::endl;

        ExecutorDescriptor descriptor;
        descriptor.id = "nowhere";
        descriptor.transport = "http";
        descriptor.endpoint = "http://127.0.0.1:1";
        descriptor.timeout = std::chrono::milliseconds(300);

        HttpExecutorAdapter adapter(descriptor);
        assert(adapter.getTransport() == TransportKind::HTTP && "Transport should be HTTP");
        assert(adapter.getExecutorId() == "nowhere" && "Executor id should be kept");
        assert(!adapter.healthCheck() && "Unreachable executor is unhealthy");

        bool threw = false;
        try {
            adapter.listModels();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw && "Listing an unreachable executor should throw");

        std::cout << "✓ Unreachable executor test passed" << std::endl;
    }

    void testModelTableParsing() {
        std::cout << "Testing CLI model table parsing..." << std::endl;

        auto ids = CliExecutorAdapter::parseModelTable(
            "NAME               ID              SIZE      MODIFIED\n"
            "llama3:8b          365c0bd3c000    4.7 GB    2 days ago\n"
            "\n"
            "codellama:13b      9f438cb9cd58    7.4 GB    3 weeks ago\n");
        assert(ids.size() == 2 && "Header and blank lines should be skipped");
        assert(ids[0] == "llama3:8b" && ids[1] == "codellama:13b" && "First column is the id");

        auto bare = CliExecutorAdapter::parseModelTable("phi3\nmistral\n");
        assert(bare.size() == 2 && bare[0] == "phi3" && "Table without header keeps the first row");

        assert(CliExecutorAdapter::parseModelTable("").empty() && "Empty output lists nothing");

        std::cout << "✓ Model table test passed" << std::endl;
    }

    void testCliExecutorProbe() {
        std::cout << "Testing CLI executor probe..." << std::endl;

        ExecutorDescriptor descriptor;
        descriptor.id = "shell";
        descriptor.transport = "cli";
        descriptor.endpoint = "sh";
        descriptor.health_args = {"-c", "exit 0"};
        descriptor.list_args = {"-c", "printf 'NAME ID\\nllama3 abc\\nphi3 def\\n'"};

        CliExecutorAdapter adapter(descriptor);
        assert(adapter.getTransport() == TransportKind::CLI && "Transport should be CLI");
        assert(adapter.healthCheck() && "Zero exit code is healthy");

        auto models = adapter.listModels();
        assert(models.size() == 2 && "Both rows should be listed");
        assert(models[0].id == "llama3" && models[0].executor_id == "shell" && "Model should be attributed");

        descriptor.health_args = {"-c", "exit 3"};
        descriptor.list_args = {"-c", "echo boom; exit 2"};
        CliExecutorAdapter failing(descriptor);
        assert(!failing.healthCheck() && "Non-zero exit code is unhealthy");

        bool threw = false;
        try {
            failing.listModels();
        } catch (const std::runtime_error& e) {
            threw = true;
            assert(std::string(e.what()).find("boom") != std::string::npos && "Output should be reported");
        }
        assert(threw && "Failed listing command should throw");

        descriptor.list_args = {"-c", "sleep 5"};
        descriptor.timeout = std::chrono::milliseconds(300);
        CliExecutorAdapter hanging(descriptor);
        threw = false;
        try {
            hanging.listModels();
        } catch (const std::runtime_error& e) {
            threw = true;
            assert(std::string(e.what()).find("timed out") != std::string::npos && "Timeout should be reported");
        }
        assert(threw && "Hanging listing command should be stopped");

        assert(SysInteraction::buildCommandLine("ollama", {"list"}, std::chrono::milliseconds(1500)) ==
               "timeout -k 1 1.500 'ollama' 'list' 2>&1" && "Bounded command line");
        assert(SysInteraction::shellQuote("it's") == "'it'\\''s'" && "Single quotes are escaped");

        std::cout << "✓ CLI probe test passed" << std::endl;
    }

    void testTransportStrings() {
        std::cout << "Testing transport conversions..." << std::endl;

        assert(stringToTransport("HTTP") == TransportKind::HTTP && "Parsing is case-insensitive");
        assert(stringToTransport("cli") == TransportKind::CLI && "CLI transport");
        assert(transportToString(TransportKind::RPC) == "rpc" && "RPC transport");

        bool threw = false;
        try {
            stringToTransport("grpc-web");
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw && "Unknown transport should be a configuration error");

        std::cout << "✓ Transport conversion test passed" << std::endl;
    }

    void testCapabilityParsing() {
        std::cout << "Testing capability parsing..." << std::endl;

        auto capabilities = ModelCapabilityUtils::parseCapabilities({"code", "tool-use", "LONG_CONTEXT"});
        assert(capabilities.size() == 3 && "All capabilities should parse");
        assert(ModelCapabilityUtils::joinCapabilities(capabilities) == "CODE, TOOL_USE, LONG_CONTEXT" &&
               "Names are canonical when joined");

        ModelInfo model;
        model.capabilities = capabilities;
        assert(ModelCapabilityUtils::hasCapability(model, ModelCapability::TOOL_USE) && "Tag should be found");
        assert(!ModelCapabilityUtils::hasCapability(model, ModelCapability::VISION) && "Missing tag");

        bool threw = false;
        try {
            ModelCapabilityUtils::stringToCapability("TELEPATHY");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw && "Unknown capability should be rejected");

        std::cout << "✓ Capability parsing test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running executor adapter unit tests..." << std::endl;
        std::cout << "======================================" << std::endl << std::endl;

        testOpenAiModelListing();
        std::cout << std::endl;

        testOllamaModelListing();
        std::cout << std::endl;

        testMalformedModelListing();
        std::cout << std::endl;

        testApiPaths();
        std::cout << std::endl;

        testUnreachableHttpExecutor();
        std::cout << std::endl;

        testModelTableParsing();
        std::cout << std::endl;

        testCliExecutorProbe();
        std::cout << std::endl;

        testTransportStrings();
        std::cout << std::endl;

        testCapabilityParsing();
        std::cout << std::endl;

        std::cout << "All executor adapter tests passed!" << std::endl;
    }
};

int main() {
    Logger::getInstance().setConsoleLogging(false);

    try {
        ExecutorAdapterTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All executor adapter component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
