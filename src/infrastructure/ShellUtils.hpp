/**
 * @file ShellUtils.hpp
 * @brief Helpers for driving external command-line tools.
 */

#pragma once

#include <string>

namespace bidlens::infrastructure {

/**
 * @struct CommandResult
 * @brief Captured stdout and decoded exit status of a shell command.
 */
struct CommandResult {
    std::string output;
    int exitCode = -1; ///< -1 when the command could not be spawned or did not exit normally.

    bool ok() const { return exitCode == 0; }
};

class ShellUtils {
public:
    /** @brief Runs a command through the shell; returns its exit code or -1. */
    static int Run(const std::string& cmd);

    /** @brief Runs a command and captures its stdout. */
    static CommandResult Capture(const std::string& cmd);

    /** @brief Single-quotes an argument for /bin/sh. */
    static std::string Quote(const std::string& arg);

    /** @brief True when an executable named `tool` is on PATH. */
    static bool FindInPath(const std::string& tool);

    /**
     * @brief Fresh path in the temp directory.
     *
     * Names combine the process id and a process-wide counter, so concurrent
     * callers never share a file.
     */
    static std::string UniqueTempPath(const std::string& suffix);
};

} // namespace bidlens::infrastructure
