// =================================================================
// include/Switchboard/SysInteraction.hpp
// =================================================================
// File I/O and bounded external process execution.

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace Switchboard {

/**
 * @brief Outcome of one external command
 */
struct CommandResult {
    std::string output;        ///< Interleaved stdout and stderr
    int exit_code = -1;        ///< -1 if the process did not exit normally
    bool timed_out = false;    ///< Killed by the time bound
};

class SysInteraction {
public:
    /**
     * @throws std::runtime_error if the file cannot be opened
     */
    std::string readFile(const std::string& file_path);

    /**
     * @brief Replace a file atomically
     *
     * The content goes to a sibling temporary file which is renamed over the
     * target, so concurrent readers see either the old or the new content.
     * @return False if the temporary file cannot be written or renamed
     */
    bool writeFile(const std::string& file_path, const std::string& content);

    bool fileExists(const std::string& file_path);

    /**
     * @brief Run a command through /bin/sh and capture its output
     * @param timeout Upper bound on the run time, zero for none
     * @throws std::runtime_error if the shell cannot be started
     */
    CommandResult executeCommand(const std::string& command, const std::vector<std::string>& args,
                                 std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    /**
     * @brief Shell command line executeCommand() runs
     */
    static std::string buildCommandLine(const std::string& command, const std::vector<std::string>& args,
                                        std::chrono::milliseconds timeout);

    static std::string shellQuote(const std::string& arg);
};

} // namespace Switchboard
