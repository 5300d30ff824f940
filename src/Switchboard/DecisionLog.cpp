// =================================================================
// src/Switchboard/DecisionLog.cpp
// =================================================================
// Implementation of the decision log, its writer thread and sinks.

#include "Switchboard/DecisionLog.hpp"
#include "Switchboard/Logger.hpp"
#include "nlohmann/json.hpp"
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace Switchboard {

namespace {

std::string formatIso8601(std::chrono::system_clock::time_point time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;
    std::tm tm_buf{};
    gmtime_r(&time_t, &tm_buf);

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

nlohmann::json classificationToJson(const Classification& classification) {
    return {
        {"domain", classification.domain},
        {"action", classification.action},
        {"confidence", classification.confidence},
        {"reasoning", classification.reasoning},
        {"is_fallback", classification.is_fallback},
        {"source", classification.source},
        {"latency_ms", classification.latency.count()}
    };
}

nlohmann::json featuresToJson(const QueryFeatures& features) {
    return {
        {"token_estimate", features.token_estimate},
        {"complexity", features.complexity},
        {"has_code", features.has_code},
        {"code_line_count", features.code_line_count},
        {"domain_indicators", features.domain_indicators},
        {"needs_tools", features.needs_tools},
        {"conversation_depth", features.conversation_depth},
        {"ambiguity", features.ambiguity},
        {"vector", features.toVector()}
    };
}

nlohmann::json scoreToJson(const CandidateScore& score) {
    return {
        {"model_id", score.model_id},
        {"executor_id", score.executor_id},
        {"success_probability", score.success_probability},
        {"weighted_score", score.weighted_score},
        {"cost_per_million_tokens", score.cost_per_million_tokens},
        {"declared_rank", score.declared_rank},
        {"ability_missing", score.ability_missing},
        {"explanation", score.explanation}
    };
}

} // namespace

// ---------------------------------------------------------------------------
// JsonlDecisionSink

JsonlDecisionSink::JsonlDecisionSink(const std::string& file_path) : m_file_path(file_path) {
    std::filesystem::path parent = std::filesystem::path(m_file_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
}

std::string JsonlDecisionSink::getName() const {
    return "jsonl:" + m_file_path;
}

std::string JsonlDecisionSink::serializeDecision(const DecisionRecord& record) {
    nlohmann::json scores = nlohmann::json::array();
    for (const auto& score : record.scores) {
        scores.push_back(scoreToJson(score));
    }

    nlohmann::json line = {
        {"type", "decision"},
        {"decision_id", record.decision_id},
        {"request_id", record.request_id},
        {"attempt", record.attempt},
        {"timestamp", formatIso8601(record.created_at)},
        {"prompt", record.prompt},
        {"context_turns", record.context_turns},
        {"classification", classificationToJson(record.classification)},
        {"features", featuresToJson(record.features)},
        {"policy", {
            {"candidates", record.policy_candidates},
            {"match", record.policy_match},
            {"stale", record.policy_stale}
        }},
        {"scores", scores},
        {"excluded", record.excluded_model_ids},
        {"latency_ms", record.latency.count()}
    };

    if (record.selected_model_id.empty()) {
        line["selected"] = nullptr;
    } else {
        line["selected"] = {
            {"model_id", record.selected_model_id},
            {"executor_id", record.selected_executor_id}
        };
    }
    if (!record.error.empty()) {
        line["error"] = record.error;
    }

    return line.dump();
}

std::string JsonlDecisionSink::serializeOutcome(const std::string& decision_id, const DecisionOutcome& outcome) {
    nlohmann::json line = {
        {"type", "outcome"},
        {"decision_id", decision_id},
        {"success", outcome.success},
        {"status", outcome.status},
        {"latency_ms", outcome.latency_ms},
        {"detail", outcome.detail},
        {"timestamp", formatIso8601(outcome.recorded_at)}
    };
    return line.dump();
}

void JsonlDecisionSink::appendLine(const std::string& line) {
    std::ofstream file(m_file_path, std::ios::app);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open decision log " + m_file_path);
    }
    file << line << '\n';
    file.flush();
    if (!file) {
        throw std::runtime_error("Failed to write decision log " + m_file_path);
    }
}

void JsonlDecisionSink::write(const DecisionRecord& record) {
    appendLine(serializeDecision(record));
}

void JsonlDecisionSink::writeOutcome(const std::string& decision_id, const DecisionOutcome& outcome) {
    appendLine(serializeOutcome(decision_id, outcome));
}

// ---------------------------------------------------------------------------
// MemoryDecisionSink

std::string MemoryDecisionSink::getName() const {
    return "memory";
}

void MemoryDecisionSink::write(const DecisionRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_index[record.decision_id] = m_records.size();
    m_records.push_back(record);
}

void MemoryDecisionSink::writeOutcome(const std::string& decision_id, const DecisionOutcome& outcome) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_index.find(decision_id);
    if (it == m_index.end()) {
        throw std::runtime_error("Outcome for unknown decision " + decision_id);
    }
    m_records[it->second].outcome = outcome;
}

std::optional<DecisionRecord> MemoryDecisionSink::findRecord(const std::string& decision_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_index.find(decision_id);
    if (it == m_index.end()) {
        return std::nullopt;
    }
    return m_records[it->second];
}

std::vector<DecisionRecord> MemoryDecisionSink::records() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records;
}

size_t MemoryDecisionSink::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.size();
}

// ---------------------------------------------------------------------------
// DecisionLog

DecisionLog::DecisionLog(std::shared_ptr<DecisionSink> sink, const DecisionLogConfig& config)
    : m_sink(std::move(sink)), m_config(config) {
    if (!m_sink) {
        throw std::invalid_argument("DecisionLog requires a sink");
    }
    if (m_config.queue_capacity == 0) {
        m_config.queue_capacity = 1;
    }
    m_writer = std::thread(&DecisionLog::writerLoop, this);
}

DecisionLog::~DecisionLog() {
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_stopping = true;
    }
    m_queue_cv.notify_all();
    if (m_writer.joinable()) {
        m_writer.join();
    }
}

std::string DecisionLog::getSinkName() const {
    return m_sink->getName();
}

std::string DecisionLog::generateDecisionId() {
    static const uint32_t process_salt = std::random_device{}();
    static std::atomic<uint64_t> counter{0};

    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::stringstream ss;
    ss << "dec-" << std::hex << now_ms << "-" << std::setw(8) << std::setfill('0') << process_salt
       << "-" << std::dec << ++counter;
    return ss.str();
}

void DecisionLog::trackDecisionLocked(const std::string& decision_id) {
    if (m_outcome_recorded.emplace(decision_id, false).second) {
        m_tracked_order.push_back(decision_id);
    }
    while (m_tracked_order.size() > m_config.max_tracked_decisions) {
        m_outcome_recorded.erase(m_tracked_order.front());
        m_tracked_order.pop_front();
    }
}

bool DecisionLog::append(DecisionRecord record) {
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        if (m_stopping || m_queue.size() >= m_config.queue_capacity) {
            m_dropped++;
            return false;
        }

        trackDecisionLocked(record.decision_id);

        PendingEntry entry;
        entry.record = std::move(record);
        m_queue.push_back(std::move(entry));
        m_appended++;
    }
    m_queue_cv.notify_one();
    return true;
}

bool DecisionLog::recordOutcome(const std::string& decision_id, const DecisionOutcome& outcome) {
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        auto it = m_outcome_recorded.find(decision_id);
        if (it == m_outcome_recorded.end() || it->second) {
            return false;
        }
        if (m_stopping || m_queue.size() >= m_config.queue_capacity) {
            m_dropped++;
            return false;
        }

        it->second = true;

        PendingEntry entry;
        entry.is_outcome = true;
        entry.decision_id = decision_id;
        entry.outcome = outcome;
        if (entry.outcome.recorded_at.time_since_epoch().count() == 0) {
            entry.outcome.recorded_at = std::chrono::system_clock::now();
        }
        m_queue.push_back(std::move(entry));
        m_outcomes++;
    }
    m_queue_cv.notify_one();
    return true;
}

void DecisionLog::flush() {
    std::unique_lock<std::mutex> lock(m_queue_mutex);
    m_idle_cv.wait(lock, [this]() { return m_queue.empty() && !m_writing; });
}

size_t DecisionLog::getPendingCount() const {
    std::lock_guard<std::mutex> lock(m_queue_mutex);
    return m_queue.size();
}

void DecisionLog::writerLoop() {
    while (true) {
        PendingEntry entry;
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            m_queue_cv.wait(lock, [this]() { return m_stopping || !m_queue.empty(); });
            if (m_queue.empty()) {
                // Stopping with nothing left to write
                m_idle_cv.notify_all();
                return;
            }
            entry = std::move(m_queue.front());
            m_queue.pop_front();
            m_writing = true;
        }

        try {
            if (entry.is_outcome) {
                m_sink->writeOutcome(entry.decision_id, entry.outcome);
            } else {
                m_sink->write(entry.record);
            }
            m_written++;
        } catch (const std::exception& e) {
            m_dropped++;
            Logger::getInstance().warning("DecisionLog",
                "Dropped entry after sink failure (" + m_sink->getName() + ")", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(m_queue_mutex);
            m_writing = false;
        }
        m_idle_cv.notify_all();
    }
}

} // namespace Switchboard
