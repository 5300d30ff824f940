// =================================================================
// include/Switchboard/Logger.hpp
// =================================================================
// Header for process-wide logging shared by routing and probe threads.

#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace Switchboard {

/**
 * @brief Severity of a log record, lowest first
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * @brief File output settings
 */
struct LoggerConfig {
    std::string directory = ".switchboard/logs";
    std::string file_prefix = "switchboard";
    size_t max_file_bytes = 10 * 1024 * 1024;   ///< Rotate once the active file reaches this size
    size_t max_files = 5;                       ///< Older files beyond this count are deleted
};

/**
 * @brief One line of log output
 */
struct LogRecord {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::thread::id thread;
    std::string component;
    std::string message;
    std::string context;       ///< Optional detail, usually key=value pairs
};

/**
 * @brief Logging system with console and rotating file output
 *
 * All public methods are safe to call concurrently; records are written
 * whole, one line at a time. Console output goes to stderr so command
 * results on stdout stay parseable. The file is opened lazily on the first
 * record that passes the file level.
 */
class Logger {
public:
    static Logger& getInstance();

    /**
     * @brief (Re)open the log file with new settings
     *
     * Falls back to the working directory if the configured one cannot be
     * created.
     */
    void initialize(const LoggerConfig& config);

    void setConsoleLogLevel(LogLevel level);
    void setFileLogLevel(LogLevel level);
    void setConsoleLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the outcome of one routing decision
     * @param selected_model Chosen model id, empty when nothing was eligible
     * @param candidate_count Candidates still ranked after the selection
     * @param fallback_classification Whether the classifier result was replaced
     */
    void logRoutingDecision(const std::string& selected_model, size_t candidate_count,
                            const std::string& domain, const std::string& action,
                            long latency_ms, bool fallback_classification);

    /**
     * @brief Log the result of probing one executor
     *
     * Healthy probes are DEBUG, failures WARNING.
     */
    void logProbeResult(const std::string& executor_id, bool healthy, size_t model_count,
                        long duration_ms, const std::string& error_message = "");

    void logSessionStart(const std::string& command, const std::string& user_prompt);
    void logSessionEnd(const std::string& command, int exit_code, long duration_ms);

    void flush();

    /**
     * @brief Parse a level name ("debug", "INFO", "warn", ...)
     * @throws std::invalid_argument for unknown names
     */
    static LogLevel parseLevel(const std::string& name);

    static std::string getLevelName(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LoggerConfig m_config;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    bool m_file_opened = false;
    size_t m_file_sequence = 0;

    std::unique_ptr<std::ofstream> m_file;
    size_t m_file_bytes = 0;
    std::mutex m_mutex;

    void write(LogLevel level, const std::string& component, const std::string& message,
               const std::string& context);
    void openFileLocked();
    void rotateIfNeededLocked();
    void pruneOldFilesLocked();
    std::string nextFilenameLocked();

    static std::string format(const LogRecord& record, bool color);
};

#define LOG_DEBUG(component, message) \
    Switchboard::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    Switchboard::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    Switchboard::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    Switchboard::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    Switchboard::Logger::getInstance().critical(component, message)

} // namespace Switchboard
