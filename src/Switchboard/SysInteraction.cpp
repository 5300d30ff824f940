// =================================================================
// src/Switchboard/SysInteraction.cpp
// =================================================================
// Implementation for system-level operations.

#include "Switchboard/SysInteraction.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <sys/wait.h>

namespace Switchboard {

namespace {

// Exit status coreutils `timeout` reports when it had to stop the command
constexpr int kTimeoutExitCode = 124;

} // namespace

std::string SysInteraction::readFile(const std::string& file_path) {
    std::ifstream input(file_path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Cannot open " + file_path);
    }
    std::ostringstream content;
    content << input.rdbuf();
    return content.str();
}

bool SysInteraction::writeFile(const std::string& file_path, const std::string& content) {
    const std::string temp_path = file_path + ".tmp";
    {
        std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
        if (!output || !(output << content)) {
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, file_path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        return false;
    }
    return true;
}

bool SysInteraction::fileExists(const std::string& file_path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(file_path, ec);
}

std::string SysInteraction::shellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string SysInteraction::buildCommandLine(const std::string& command, const std::vector<std::string>& args,
                                             std::chrono::milliseconds timeout) {
    std::ostringstream line;
    if (timeout.count() > 0) {
        // SIGTERM at the bound, SIGKILL one second later
        line << "timeout -k 1 " << std::fixed << std::setprecision(3) << (timeout.count() / 1000.0) << " ";
    }
    line << shellQuote(command);
    for (const auto& arg : args) {
        line << " " << shellQuote(arg);
    }
    line << " 2>&1";
    return line.str();
}

CommandResult SysInteraction::executeCommand(const std::string& command, const std::vector<std::string>& args,
                                             std::chrono::milliseconds timeout) {
    const std::string command_line = buildCommandLine(command, args, timeout);

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(command_line.c_str(), "r"), pclose);
    if (!pipe) {
        throw std::runtime_error("Failed to start: " + command_line);
    }

    CommandResult result;
    char buffer[256];
    size_t read_bytes = 0;
    while ((read_bytes = fread(buffer, 1, sizeof(buffer), pipe.get())) > 0) {
        result.output.append(buffer, read_bytes);
    }

    int status = pclose(pipe.release());
    if (status != -1 && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }
    result.timed_out = timeout.count() > 0 && result.exit_code == kTimeoutExitCode;
    return result;
}

} // namespace Switchboard
