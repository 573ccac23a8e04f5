/**
 * @file mock_command_runner.hpp
 * @brief Scripted command_runner for Azure CLI session tests
 */

#pragma once

#include <blobtier/provider/command_runner.hpp>

#include <deque>
#include <string>
#include <vector>

namespace blobtier::testing {

struct recorded_command {
    std::string executable;
    std::vector<std::string> args;
    provider::command_options options;
};

/**
 * @brief Returns queued command results in order
 *
 * When the queue is empty, run() fails with command_failed as if the
 * process could not be created.
 */
class mock_command_runner final : public provider::command_runner {
public:
    [[nodiscard]] auto run(const std::string& executable,
                           const std::vector<std::string>& args,
                           const provider::command_options& options)
        -> Result<provider::command_result> override {
        commands.push_back(recorded_command{executable, args, options});
        if (results.empty()) {
            return blobtier_error<provider::command_result>(
                error_codes::command_failed, "fork failed", "mock_command_runner");
        }
        auto result = results.front();
        results.pop_front();
        return result;
    }

    void enqueue(int exit_code, std::string stdout_output = {},
                 std::string stderr_output = {}) {
        provider::command_result result;
        result.exit_code = exit_code;
        result.stdout_output = std::move(stdout_output);
        result.stderr_output = std::move(stderr_output);
        results.push_back(std::move(result));
    }

    std::deque<provider::command_result> results;
    std::vector<recorded_command> commands;
};

}  // namespace blobtier::testing
