/**
 * @file command_runner.cpp
 * @brief fork/exec implementation of command_runner
 */

#include <blobtier/provider/command_runner.hpp>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace blobtier::provider {

namespace {

constexpr const char* kModule = "command_runner";

void drain(int fd, std::string& out, std::array<char, 4096>& buffer) {
    if (fd < 0) {
        return;
    }
    ssize_t n;
    while ((n = read(fd, buffer.data(), buffer.size())) > 0) {
        out.append(buffer.data(), static_cast<std::size_t>(n));
    }
}

void close_pipe(int (&fds)[2]) {
    if (fds[0] >= 0) {
        close(fds[0]);
    }
    if (fds[1] >= 0) {
        close(fds[1]);
    }
}

}  // namespace

auto posix_command_runner::run(const std::string& executable,
                               const std::vector<std::string>& args,
                               const command_options& options)
    -> Result<command_result> {
    command_result result;

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};

    if (pipe(stdout_pipe) != 0 ||
        (!options.interactive && pipe(stderr_pipe) != 0)) {
        const std::string reason = std::strerror(errno);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return blobtier_error<command_result>(
            error_codes::command_failed,
            "Failed to create pipes for " + executable + ": " + reason, kModule);
    }

    pid_t pid = fork();

    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return blobtier_error<command_result>(
            error_codes::command_failed, "Failed to fork for " + executable + ": " + reason,
            kModule);
    }

    if (pid == 0) {
        // Child process
        close(stdout_pipe[0]);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        close(stdout_pipe[1]);

        if (!options.interactive) {
            close(stderr_pipe[0]);
            dup2(stderr_pipe[1], STDERR_FILENO);
            close(stderr_pipe[1]);
        }

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(executable.c_str()));
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        execvp(executable.c_str(), argv.data());
        _exit(127);  // execvp failed
    }

    // Parent process
    close(stdout_pipe[1]);
    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    if (!options.interactive) {
        close(stderr_pipe[1]);
        fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);
    }

    const auto start = std::chrono::steady_clock::now();
    std::array<char, 4096> buffer{};
    int status = 0;
    bool child_exited = false;

    while (!child_exited) {
        if (options.timeout.count() > 0 &&
            std::chrono::steady_clock::now() - start >= options.timeout) {
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            result.timed_out = true;
            result.exit_code = -SIGKILL;
            break;
        }

        pid_t wait_result = waitpid(pid, &status, WNOHANG);
        if (wait_result > 0) {
            child_exited = true;
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.exit_code = -WTERMSIG(status);
            }
        } else if (wait_result < 0 && errno != EINTR) {
            break;
        }

        drain(stdout_pipe[0], result.stdout_output, buffer);
        drain(options.interactive ? -1 : stderr_pipe[0], result.stderr_output, buffer);

        if (!child_exited) {
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
        }
    }

    drain(stdout_pipe[0], result.stdout_output, buffer);
    drain(options.interactive ? -1 : stderr_pipe[0], result.stderr_output, buffer);

    close(stdout_pipe[0]);
    if (!options.interactive) {
        close(stderr_pipe[0]);
    }

    return result;
}

}  // namespace blobtier::provider
