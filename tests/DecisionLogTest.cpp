// =================================================================
// tests/DecisionLogTest.cpp
// =================================================================
// Unit tests for DecisionLog component and its sinks.

#include "Switchboard/DecisionLog.hpp"
#include "Switchboard/Logger.hpp"
#include "TestDoubles.hpp"
#include "nlohmann/json.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <thread>

namespace fs = std::filesystem;
using namespace Switchboard;
using namespace SwitchboardTest;

namespace {

DecisionRecord makeRecord(const std::string& decision_id, const std::string& selected = "claude") {
    DecisionRecord record;
    record.decision_id = decision_id;
    record.request_id = "req-" + decision_id;
    record.prompt = "Write a python function that parses a CSV file";
    record.classification.domain = "programming";
    record.classification.action = "code-generation";
    record.classification.confidence = 0.9;
    record.classification.source = "keyword";
    record.policy_candidates = {"gpt-4", "claude", "codex"};
    record.policy_match = "exact";
    record.selected_model_id = selected;
    record.selected_executor_id = selected.empty() ? "" : "cloud";
    record.created_at = std::chrono::system_clock::now();
    record.latency = std::chrono::milliseconds(12);

    CandidateScore score;
    score.model_id = "claude";
    score.executor_id = "cloud";
    score.success_probability = 0.73;
    score.weighted_score = 0.56;
    score.cost_per_million_tokens = 3.0;
    score.explanation = "claude for programming/code-generation";
    record.scores.push_back(score);
    return record;
}

void waitForEmptyQueue(const DecisionLog& log) {
    for (int i = 0; i < 200 && log.getPendingCount() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

} // namespace

class DecisionLogTest {
private:
    std::string test_log_dir = "test_decision_log";

public:
    ~DecisionLogTest() {
        if (fs::exists(test_log_dir)) {
            fs::remove_all(test_log_dir);
        }
    }

    void testAppendAndFlush() {
        std::cout << "Testing append and flush..." << std::endl;

        auto sink = std::make_shared<MemoryDecisionSink>();
        DecisionLog log(sink);
        assert(log.getSinkName() == "memory" && "Sink name should be exposed");

        for (int i = 0; i < 10; ++i) {
            assert(log.append(makeRecord("dec-" + std::to_string(i))) && "Append should succeed");
        }
        log.flush();

        assert(sink->size() == 10 && "Every record should reach the sink");
        assert(log.getAppendedCount() == 10 && log.getWrittenCount() == 10 && "Counters should agree");
        assert(log.getDroppedCount() == 0 && "Nothing should be dropped");

        auto record = sink->findRecord("dec-3");
        assert(record.has_value() && record->selected_model_id == "claude" && "Record fields are kept");
        assert(!record->outcome.has_value() && "No outcome yet");
        assert(!sink->findRecord("dec-missing").has_value() && "Unknown id has no record");

        std::cout << "✓ Append test passed" << std::endl;
    }

    void testOutcomeRecordedOnce() {
        std::cout << "Testing outcome back-fill..." << std::endl;

        auto sink = std::make_shared<MemoryDecisionSink>();
        DecisionLog log(sink);
        log.append(makeRecord("dec-a"));

        DecisionOutcome outcome;
        outcome.success = false;
        outcome.status = "timeout";
        outcome.latency_ms = 30000.0;
        outcome.detail = "executor did not answer";

        assert(!log.recordOutcome("dec-unknown", outcome) && "Unknown decision is refused");
        assert(log.recordOutcome("dec-a", outcome) && "First outcome is accepted");
        assert(!log.recordOutcome("dec-a", outcome) && "Second outcome is refused");
        log.flush();

        auto record = sink->findRecord("dec-a");
        assert(record->outcome.has_value() && "Outcome should be attached");
        assert(record->outcome->status == "timeout" && !record->outcome->success && "Outcome fields");
        assert(record->outcome->recorded_at.time_since_epoch().count() != 0 && "Timestamp should be set");
        assert(record->selected_model_id == "claude" && "Decision fields do not change");
        assert(log.getOutcomeCount() == 1 && "One outcome should be counted");

        std::cout << "✓ Outcome test passed" << std::endl;
    }

    void testTrackedDecisionLimit() {
        std::cout << "Testing tracked decision limit..." << std::endl;

        DecisionLogConfig config;
        config.max_tracked_decisions = 2;
        auto sink = std::make_shared<MemoryDecisionSink>();
        DecisionLog log(sink, config);

        log.append(makeRecord("dec-1"));
        log.append(makeRecord("dec-2"));
        log.append(makeRecord("dec-3"));

        DecisionOutcome outcome;
        outcome.success = true;
        outcome.status = "ok";
        assert(!log.recordOutcome("dec-1", outcome) && "Oldest decision is no longer tracked");
        assert(log.recordOutcome("dec-3", outcome) && "Recent decision is tracked");

        std::cout << "✓ Tracked decision limit test passed" << std::endl;
    }

    void testFullQueueDrops() {
        std::cout << "Testing full queue..." << std::endl;

        DecisionLogConfig config;
        config.queue_capacity = 2;
        auto sink = std::make_shared<BlockingDecisionSink>();
        {
            DecisionLog log(sink, config);

            // Writer picks up the first record and blocks inside the sink
            assert(log.append(makeRecord("dec-1")) && "First append fits");
            waitForEmptyQueue(log);

            auto start = std::chrono::steady_clock::now();
            assert(log.append(makeRecord("dec-2")) && "Second append fits");
            assert(log.append(makeRecord("dec-3")) && "Third append fits");
            assert(!log.append(makeRecord("dec-4")) && "Append beyond capacity is dropped");
            assert(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(200) &&
                   "Append never waits for the sink");
            assert(log.getDroppedCount() == 1 && "Drop should be counted");

            DecisionOutcome outcome;
            outcome.status = "ok";
            assert(!log.recordOutcome("dec-2", outcome) && "Outcome is dropped while the queue is full");
            assert(!log.recordOutcome("dec-4", outcome) && "Dropped decision is unknown");

            sink->release();
            log.flush();
            assert(sink->size() == 3 && "Queued records are written after the sink recovers");
            assert(log.recordOutcome("dec-2", outcome) && "Outcome can be retried later");
        }
        assert(sink->findRecord("dec-2")->outcome.has_value() && "Destructor drains the outcome");

        std::cout << "✓ Full queue test passed" << std::endl;
    }

    void testFailingSink() {
        std::cout << "Testing failing sink..." << std::endl;

        DecisionLog log(std::make_shared<FailingDecisionSink>());
        assert(log.append(makeRecord("dec-x")) && "Append succeeds even if the sink is down");
        log.flush();

        assert(log.getWrittenCount() == 0 && "Nothing is written");
        assert(log.getDroppedCount() == 1 && "Failed write is counted as dropped");

        bool threw = false;
        try {
            DecisionLog no_sink(nullptr);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw && "Null sink should be rejected");

        std::cout << "✓ Failing sink test passed" << std::endl;
    }

    void testDestructorDrainsQueue() {
        std::cout << "Testing drain on shutdown..." << std::endl;

        auto sink = std::make_shared<MemoryDecisionSink>();
        {
            DecisionLog log(sink);
            for (int i = 0; i < 50; ++i) {
                log.append(makeRecord("dec-" + std::to_string(i)));
            }
        }
        assert(sink->size() == 50 && "Destructor should write every queued record");

        std::cout << "✓ Drain test passed" << std::endl;
    }

    void testConcurrentAppends() {
        std::cout << "Testing concurrent appends..." << std::endl;

        auto sink = std::make_shared<MemoryDecisionSink>();
        DecisionLogConfig config;
        config.queue_capacity = 10000;
        DecisionLog log(sink, config);

        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&log]() {
                for (int i = 0; i < 100; ++i) {
                    log.append(makeRecord(DecisionLog::generateDecisionId()));
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        log.flush();

        assert(sink->size() == 400 && "Every append should be written once");

        std::set<std::string> ids;
        for (const auto& record : sink->records()) {
            ids.insert(record.decision_id);
        }
        assert(ids.size() == 400 && "Decision ids are unique");
        assert(ids.begin()->rfind("dec-", 0) == 0 && "Ids carry the dec- prefix");

        std::cout << "✓ Concurrent append test passed" << std::endl;
    }

    void testJsonlSink() {
        std::cout << "Testing JSON lines sink..." << std::endl;

        std::string path = test_log_dir + "/nested/decisions.jsonl";
        auto sink = std::make_shared<JsonlDecisionSink>(path);
        assert(fs::exists(test_log_dir + "/nested") && "Parent directories should be created");
        assert(sink->getName() == "jsonl:" + path && "Sink name should include the path");

        {
            DecisionLog log(sink);
            DecisionRecord failed = makeRecord("dec-fail", "");
            failed.error = "NO_ELIGIBLE_CANDIDATES";
            failed.excluded_model_ids = {"claude"};
            log.append(makeRecord("dec-ok"));
            log.append(failed);

            DecisionOutcome outcome;
            outcome.success = true;
            outcome.status = "ok";
            outcome.latency_ms = 850.5;
            log.recordOutcome("dec-ok", outcome);
        }

        std::ifstream file(path);
        std::vector<nlohmann::json> lines;
        std::string line;
        while (std::getline(file, line)) {
            lines.push_back(nlohmann::json::parse(line));
        }
        assert(lines.size() == 3 && "Two decisions and one outcome");

        const auto& ok = lines[0];
        assert(ok["type"] == "decision" && ok["decision_id"] == "dec-ok" && "Decision line");
        assert(ok["selected"]["model_id"] == "claude" && "Selection should be serialized");
        assert(ok["classification"]["domain"] == "programming" && "Classification should be serialized");
        assert(ok["features"]["vector"].size() == QueryFeatures::kDimension && "Feature vector is included");
        assert(ok["policy"]["candidates"].size() == 3 && ok["policy"]["match"] == "exact" && "Policy lookup");
        assert(ok["scores"][0]["weighted_score"] == 0.56 && "Scores should be serialized");
        assert(ok["timestamp"].get<std::string>().back() == 'Z' && "Timestamps are UTC");
        assert(!ok.contains("error") && "Successful decision has no error");

        const auto& failed = lines[1];
        assert(failed["selected"].is_null() && "Failed decision selects nothing");
        assert(failed["error"] == "NO_ELIGIBLE_CANDIDATES" && "Error code should be serialized");
        assert(failed["excluded"][0] == "claude" && "Exclusions should be serialized");

        const auto& outcome = lines[2];
        assert(outcome["type"] == "outcome" && outcome["decision_id"] == "dec-ok" && "Outcome line");
        assert(outcome["latency_ms"] == 850.5 && outcome["success"] == true && "Outcome fields");

        std::cout << "✓ JSON lines sink test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running DecisionLog unit tests..." << std::endl;
        std::cout << "================================" << std::endl << std::endl;

        testAppendAndFlush();
        std::cout << std::endl;

        testOutcomeRecordedOnce();
        std::cout << std::endl;

        testTrackedDecisionLimit();
        std::cout << std::endl;

        testFullQueueDrops();
        std::cout << std::endl;

        testFailingSink();
        std::cout << std::endl;

        testDestructorDrainsQueue();
        std::cout << std::endl;

        testConcurrentAppends();
        std::cout << std::endl;

        testJsonlSink();
        std::cout << std::endl;

        std::cout << "All DecisionLog tests passed!" << std::endl;
    }
};

int main() {
    Logger::getInstance().setConsoleLogging(false);

    try {
        DecisionLogTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All DecisionLog component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
