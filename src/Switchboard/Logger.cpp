// =================================================================
// src/Switchboard/Logger.cpp
// =================================================================
// Implementation for the logging system.

#include "Switchboard/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace Switchboard {

namespace {

const char* kColorReset = "\033[0m";

const char* levelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";
        case LogLevel::INFO: return "\033[36m";
        case LogLevel::WARNING: return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::CRITICAL: return "\033[1;91m";
    }
    return kColorReset;
}

std::tm toLocalTime(std::chrono::system_clock::time_point time_point) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time_point);
    std::tm local_tm{};
    localtime_r(&seconds, &local_tm);
    return local_tm;
}

// Short, stable tag for a thread so interleaved probe and routing lines can be told apart
std::string threadTag(std::thread::id id) {
    std::ostringstream tag;
    tag << std::hex << (std::hash<std::thread::id>()(id) & 0xffff);
    return tag.str();
}

} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const LoggerConfig& config) {
    std::string directory;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = config;
        if (m_config.max_files == 0) {
            m_config.max_files = 1;
        }
        m_file.reset();
        m_file_opened = false;
        openFileLocked();
        directory = m_config.directory;
    }
    info("Logger", "Logging to " + directory,
         "max_file_bytes=" + std::to_string(config.max_file_bytes) + " max_files=" + std::to_string(config.max_files));
}

void Logger::setConsoleLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_console_level = level;
}

void Logger::setFileLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_file_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_console_enabled = enabled;
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    write(LogLevel::DEBUG, component, message, context);
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    write(LogLevel::INFO, component, message, context);
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    write(LogLevel::WARNING, component, message, context);
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    write(LogLevel::ERROR, component, message, context);
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    write(LogLevel::CRITICAL, component, message, context);
}

void Logger::logRoutingDecision(const std::string& selected_model, size_t candidate_count,
                                const std::string& domain, const std::string& action,
                                long latency_ms, bool fallback_classification) {
    std::ostringstream context;
    context << "task=" << domain << "/" << action
            << " remaining=" << candidate_count
            << " latency_ms=" << latency_ms;
    if (fallback_classification) {
        context << " classification=fallback";
    }

    if (selected_model.empty()) {
        warning("Router", "No eligible candidate", context.str());
    } else {
        info("Router", "Routed to " + selected_model, context.str());
    }
}

void Logger::logProbeResult(const std::string& executor_id, bool healthy, size_t model_count,
                            long duration_ms, const std::string& error_message) {
    std::ostringstream context;
    context << "models=" << model_count << " duration_ms=" << duration_ms;
    if (!error_message.empty()) {
        context << " error=\"" << error_message << "\"";
    }

    if (healthy) {
        debug("ExecutorRegistry", executor_id + " is live", context.str());
    } else {
        warning("ExecutorRegistry", executor_id + " failed its probe", context.str());
    }
}

void Logger::logSessionStart(const std::string& command, const std::string& user_prompt) {
    info("Session", "Command '" + command + "' started",
         "prompt_chars=" + std::to_string(user_prompt.size()));
    if (!user_prompt.empty()) {
        debug("Session", "Prompt: " + user_prompt);
    }
}

void Logger::logSessionEnd(const std::string& command, int exit_code, long duration_ms) {
    std::string context = "exit_code=" + std::to_string(exit_code) + " duration_ms=" + std::to_string(duration_ms);
    if (exit_code == 0) {
        info("Session", "Command '" + command + "' finished", context);
    } else {
        error("Session", "Command '" + command + "' failed", context);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file && m_file->is_open()) {
        m_file->flush();
    }
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string normalized = name;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (normalized == "DEBUG") return LogLevel::DEBUG;
    if (normalized == "INFO") return LogLevel::INFO;
    if (normalized == "WARN" || normalized == "WARNING") return LogLevel::WARNING;
    if (normalized == "ERROR") return LogLevel::ERROR;
    if (normalized == "CRIT" || normalized == "CRITICAL") return LogLevel::CRITICAL;

    throw std::invalid_argument("Unknown log level: " + name);
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
    }
    return "UNKNOWN";
}

void Logger::write(LogLevel level, const std::string& component, const std::string& message,
                   const std::string& context) {
    std::lock_guard<std::mutex> lock(m_mutex);

    const bool to_console = m_console_enabled && level >= m_console_level;
    const bool to_file = level >= m_file_level;
    if (!to_console && !to_file) {
        return;
    }

    LogRecord record{std::chrono::system_clock::now(), level, std::this_thread::get_id(),
                     component, message, context};

    if (to_console) {
        std::cerr << format(record, true) << std::endl;
    }

    if (to_file) {
        if (!m_file_opened) {
            openFileLocked();
        }
        if (!m_file || !m_file->is_open()) {
            return;
        }
        rotateIfNeededLocked();
        std::string line = format(record, false);
        *m_file << line << '\n';
        m_file_bytes += line.size() + 1;
        if (level >= LogLevel::ERROR) {
            m_file->flush();
        }
    }
}

void Logger::openFileLocked() {
    m_file_opened = true;
    try {
        std::filesystem::create_directories(m_config.directory);
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[WARN] Cannot create log directory " << m_config.directory << ": " << e.what() << std::endl;
        m_config.directory = ".";
    }

    m_file = std::make_unique<std::ofstream>(nextFilenameLocked(), std::ios::app);
    m_file_bytes = 0;
    if (!m_file->is_open()) {
        std::cerr << "[WARN] Cannot open log file in " << m_config.directory << std::endl;
        m_file.reset();
    }
}

void Logger::rotateIfNeededLocked() {
    if (m_file_bytes < m_config.max_file_bytes) {
        return;
    }
    m_file->flush();
    m_file = std::make_unique<std::ofstream>(nextFilenameLocked());
    m_file_bytes = 0;
    pruneOldFilesLocked();
}

void Logger::pruneOldFilesLocked() {
    const std::string prefix = m_config.file_prefix + "_";
    std::vector<std::filesystem::path> files;
    try {
        for (const auto& entry : std::filesystem::directory_iterator(m_config.directory)) {
            const std::string name = entry.path().filename().string();
            if (entry.is_regular_file() && entry.path().extension() == ".log" && name.rfind(prefix, 0) == 0) {
                files.push_back(entry.path());
            }
        }
        // Names embed a timestamp and sequence number, so they sort oldest first
        std::sort(files.begin(), files.end());
        while (files.size() > m_config.max_files) {
            std::filesystem::remove(files.front());
            files.erase(files.begin());
        }
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[WARN] Log rotation failed: " << e.what() << std::endl;
    }
}

std::string Logger::nextFilenameLocked() {
    std::tm local_tm = toLocalTime(std::chrono::system_clock::now());
    std::ostringstream filename;
    filename << m_config.directory << "/" << m_config.file_prefix << "_"
             << std::put_time(&local_tm, "%Y%m%d_%H%M%S")
             << "_" << std::setfill('0') << std::setw(3) << m_file_sequence++ << ".log";
    return filename.str();
}

std::string Logger::format(const LogRecord& record, bool color) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        record.timestamp.time_since_epoch()).count() % 1000;
    std::tm local_tm = toLocalTime(record.timestamp);

    std::ostringstream line;
    line << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << "."
         << std::setfill('0') << std::setw(3) << millis << std::setfill(' ') << " ";

    if (color) {
        line << levelColor(record.level);
    }
    line << std::left << std::setw(5) << getLevelName(record.level) << std::right;
    if (color) {
        line << kColorReset;
    }

    line << " [" << threadTag(record.thread) << "] " << record.component << ": " << record.message;
    if (!record.context.empty()) {
        line << " | " << record.context;
    }
    return line.str();
}

} // namespace Switchboard
