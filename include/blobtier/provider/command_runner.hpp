/**
 * @file command_runner.hpp
 * @brief External command execution seam
 *
 * The az CLI session provider runs az through this interface so that tests
 * can script its output with mock_command_runner.
 */

#pragma once

#include <blobtier/core/result.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace blobtier::provider {

/**
 * @brief Exit status and captured output of a finished command
 */
struct command_result {
    /// Process exit code; 127 when the executable could not be started,
    /// negative signal number when the process was killed
    int exit_code{-1};

    std::string stdout_output;

    /// Empty for interactive commands (stderr goes to the terminal)
    std::string stderr_output;

    /// Killed because it exceeded command_options::timeout
    bool timed_out{false};

    [[nodiscard]] auto succeeded() const noexcept -> bool {
        return exit_code == 0 && !timed_out;
    }
};

/**
 * @brief How a command is run
 */
struct command_options {
    /// Leave stdin and stderr attached to the terminal so the user can
    /// complete prompts (e.g. a device-code login). Only stdout is captured.
    bool interactive{false};

    /// Zero disables the timeout
    std::chrono::seconds timeout{120};
};

/**
 * @brief Runs an external command and waits for it
 */
class command_runner {
public:
    virtual ~command_runner() = default;

    /**
     * @brief Run @p executable with @p args
     *
     * @param executable Program name, looked up on PATH when it has no '/'
     * @return The command result (including non-zero exits), or
     *         command_failed when the process could not be created
     */
    [[nodiscard]] virtual auto run(const std::string& executable,
                                   const std::vector<std::string>& args,
                                   const command_options& options)
        -> Result<command_result> = 0;

protected:
    command_runner() = default;
    command_runner(const command_runner&) = default;
    command_runner& operator=(const command_runner&) = default;
};

/**
 * @brief fork/exec implementation of command_runner
 */
class posix_command_runner final : public command_runner {
public:
    posix_command_runner() = default;
    ~posix_command_runner() override = default;

    [[nodiscard]] auto run(const std::string& executable,
                           const std::vector<std::string>& args,
                           const command_options& options)
        -> Result<command_result> override;
};

}  // namespace blobtier::provider
