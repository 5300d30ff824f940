// =================================================================
// include/Switchboard/DecisionLog.hpp
// =================================================================
// Append-only routing decision log with an asynchronous writer.

#pragma once

#include "Switchboard/FeatureExtractor.hpp"
#include "Switchboard/ScoringEngine.hpp"
#include "Switchboard/TaskClassifier.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace Switchboard {

/**
 * @brief Real-world result of executing a decision, reported by the caller
 */
struct DecisionOutcome {
    bool success = false;
    std::string status;                      ///< e.g. "ok", "error", "timeout"
    double latency_ms = 0.0;                 ///< Backend latency observed by the caller
    std::string detail;
    std::chrono::system_clock::time_point recorded_at;
};

/**
 * @brief Everything known about one routing decision
 *
 * Decision fields are fixed once the record is appended; only the outcome
 * is filled in later, once.
 */
struct DecisionRecord {
    std::string decision_id;
    std::string request_id;                         ///< Shared by every selection of one request
    size_t attempt = 1;                             ///< 1 for the first selection, then fallbacks
    std::string prompt;
    size_t context_turns = 0;
    Classification classification;
    QueryFeatures features;
    std::vector<std::string> policy_candidates;     ///< Ordered ids from the policy lookup
    std::string policy_match;
    bool policy_stale = false;
    std::vector<CandidateScore> scores;             ///< Ranked scores of the merged pool
    std::vector<std::string> excluded_model_ids;
    std::string selected_model_id;                  ///< Empty when the decision failed
    std::string selected_executor_id;
    std::string error;                              ///< Error code name when the decision failed
    std::chrono::system_clock::time_point created_at;
    std::chrono::milliseconds latency{0};
    std::optional<DecisionOutcome> outcome;
};

/**
 * @brief Destination for decision records
 *
 * Called from the log's single writer thread. Implementations throw on
 * failure; the entry is then dropped.
 */
class DecisionSink {
public:
    virtual ~DecisionSink() = default;

    virtual void write(const DecisionRecord& record) = 0;

    virtual void writeOutcome(const std::string& decision_id, const DecisionOutcome& outcome) = 0;

    virtual std::string getName() const = 0;
};

/**
 * @brief Appends JSON lines to a file
 *
 * Decisions are written as {"type":"decision",...} and outcomes as
 * {"type":"outcome","decision_id":...} lines.
 */
class JsonlDecisionSink : public DecisionSink {
public:
    explicit JsonlDecisionSink(const std::string& file_path);

    void write(const DecisionRecord& record) override;
    void writeOutcome(const std::string& decision_id, const DecisionOutcome& outcome) override;
    std::string getName() const override;

    static std::string serializeDecision(const DecisionRecord& record);
    static std::string serializeOutcome(const std::string& decision_id, const DecisionOutcome& outcome);

private:
    std::string m_file_path;

    void appendLine(const std::string& line);
};

/**
 * @brief In-memory sink and offline query surface
 */
class MemoryDecisionSink : public DecisionSink {
public:
    MemoryDecisionSink() = default;

    void write(const DecisionRecord& record) override;
    void writeOutcome(const std::string& decision_id, const DecisionOutcome& outcome) override;
    std::string getName() const override;

    std::optional<DecisionRecord> findRecord(const std::string& decision_id) const;
    std::vector<DecisionRecord> records() const;
    size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::vector<DecisionRecord> m_records;
    std::unordered_map<std::string, size_t> m_index;
};

/**
 * @brief Queue sizing
 */
struct DecisionLogConfig {
    size_t queue_capacity = 1024;          ///< Entries beyond this are dropped
    size_t max_tracked_decisions = 100000; ///< Decision ids remembered for outcome matching
};

/**
 * @brief Bounded queue drained by one writer thread
 *
 * append() and recordOutcome() only enqueue and never wait for the sink.
 */
class DecisionLog {
public:
    explicit DecisionLog(std::shared_ptr<DecisionSink> sink,
                         const DecisionLogConfig& config = DecisionLogConfig());

    /**
     * @brief Drains the queue and stops the writer
     */
    ~DecisionLog();

    DecisionLog(const DecisionLog&) = delete;
    DecisionLog& operator=(const DecisionLog&) = delete;

    /**
     * @brief Enqueue a record for writing
     * @return False if the queue was full and the record was dropped
     */
    bool append(DecisionRecord record);

    /**
     * @brief Attach an outcome to an appended decision
     * @return True the first time for a known decision id; false for unknown
     *         ids, repeated outcomes, or a full queue
     */
    bool recordOutcome(const std::string& decision_id, const DecisionOutcome& outcome);

    /**
     * @brief Block until every queued entry has been handed to the sink
     */
    void flush();

    size_t getAppendedCount() const { return m_appended.load(); }
    size_t getWrittenCount() const { return m_written.load(); }
    size_t getDroppedCount() const { return m_dropped.load(); }
    size_t getOutcomeCount() const { return m_outcomes.load(); }
    size_t getPendingCount() const;

    std::string getSinkName() const;

    /**
     * @brief Unique id for a new decision
     */
    static std::string generateDecisionId();

private:
    struct PendingEntry {
        bool is_outcome = false;
        DecisionRecord record;
        std::string decision_id;
        DecisionOutcome outcome;
    };

    std::shared_ptr<DecisionSink> m_sink;
    DecisionLogConfig m_config;

    mutable std::mutex m_queue_mutex;
    std::condition_variable m_queue_cv;
    std::condition_variable m_idle_cv;
    std::deque<PendingEntry> m_queue;
    bool m_writing = false;
    bool m_stopping = false;

    // Outcome bookkeeping, guarded by m_queue_mutex
    std::unordered_map<std::string, bool> m_outcome_recorded;
    std::deque<std::string> m_tracked_order;

    std::atomic<size_t> m_appended{0};
    std::atomic<size_t> m_written{0};
    std::atomic<size_t> m_dropped{0};
    std::atomic<size_t> m_outcomes{0};

    std::thread m_writer;

    void writerLoop();
    void trackDecisionLocked(const std::string& decision_id);
};

} // namespace Switchboard
