/*
 * command.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Bounded subprocess execution for the fallback probes

**************************************************/

#ifndef AIRMON_SYSTEM_COMMAND_HPP
#define AIRMON_SYSTEM_COMMAND_HPP

#include <chrono>
#include <string>
#include <vector>

namespace airmon::system {

/**
 * @brief Exit status and captured standard output of a finished command.
 */
struct CommandResult {
    int exitCode{-1};
    std::string output;

    [[nodiscard]] auto succeeded() const -> bool { return exitCode == 0; }
};

/**
 * @brief Runs an external program and waits for it.
 *
 * Detectors only talk to this interface, which keeps their parsers testable
 * with a mocked runner.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Run argv[0] with the remaining arguments.
     *
     * The program is looked up in PATH. Standard error is discarded.
     * @throws airmon::error::CommandError when the program cannot be started
     * @throws airmon::error::CommandTimeout when it runs past `timeout`; the
     * child is killed before the exception is thrown
     */
    virtual auto run(const std::vector<std::string>& argv,
                     std::chrono::milliseconds timeout) -> CommandResult = 0;
};

/**
 * @brief CommandRunner backed by real OS processes.
 */
class ProcessCommandRunner : public CommandRunner {
public:
    auto run(const std::vector<std::string>& argv,
             std::chrono::milliseconds timeout) -> CommandResult override;
};

/**
 * @brief Render argv as a single space separated string for log messages.
 */
[[nodiscard]] auto formatCommand(const std::vector<std::string>& argv)
    -> std::string;

}  // namespace airmon::system

#endif  // AIRMON_SYSTEM_COMMAND_HPP
