/**
 * @file azure_cli_session.cpp
 * @brief Implementation of the Azure CLI session provider
 */

#include <blobtier/provider/azure_cli_session.hpp>

#include <nlohmann/json.hpp>

namespace blobtier::provider {

using json = nlohmann::json;

namespace {

constexpr const char* kModule = "azure_cli_session";

/// Exit code of a shell-style "command not found"
constexpr int kNotFoundExitCode = 127;

auto first_line(const std::string& text) -> std::string {
    auto end = text.find('\n');
    return text.substr(0, end);
}

auto describe_exit(const std::string& command, const command_result& result)
    -> std::string {
    if (result.timed_out) {
        return command + " timed out";
    }
    std::string message = command + " exited with code " + std::to_string(result.exit_code);
    if (!result.stderr_output.empty()) {
        message += ": " + first_line(result.stderr_output);
    }
    return message;
}

}  // namespace

auto parse_account_show(const std::string& json_text) -> Result<session_info> {
    try {
        auto doc = json::parse(json_text);
        if (!doc.is_object()) {
            return blobtier_error<session_info>(error_codes::command_output_error,
                                                "az account show did not print an object",
                                                kModule);
        }

        session_info info;
        info.tenant_id = doc.value("tenantId", "");
        info.subscription_id = doc.value("id", "");
        if (doc.contains("user") && doc["user"].is_object()) {
            info.user = doc["user"].value("name", "");
        }

        if (info.tenant_id.empty() || info.subscription_id.empty()) {
            return blobtier_error<session_info>(
                error_codes::command_output_error,
                "az account show output lacks tenantId or id", kModule);
        }
        return info;
    } catch (const json::exception& ex) {
        return blobtier_error<session_info>(
            error_codes::command_output_error,
            std::string("Failed to parse az account show output: ") + ex.what(), kModule);
    }
}

azure_cli_session::azure_cli_session(std::shared_ptr<command_runner> runner,
                                     std::string az_path,
                                     std::shared_ptr<di::ILogger> logger)
    : runner_(std::move(runner)),
      az_path_(std::move(az_path)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

auto azure_cli_session::current_session() -> Result<std::optional<session_info>> {
    command_options options;
    auto result = runner_->run(az_path_, {"account", "show", "--output", "json"}, options);
    if (result.is_err()) {
        return blobtier_error<std::optional<session_info>>(
            result.error().code, result.error().message, kModule);
    }

    const auto& outcome = result.value();
    if (outcome.exit_code == kNotFoundExitCode || outcome.timed_out) {
        return blobtier_error<std::optional<session_info>>(
            error_codes::command_failed, describe_exit(az_path_ + " account show", outcome),
            kModule);
    }
    if (outcome.exit_code != 0) {
        // az exits non-zero with "Please run 'az login'" when signed out
        logger_->debug_fmt("No active az session ({})",
                           describe_exit("az account show", outcome));
        return std::optional<session_info>{};
    }

    auto info = parse_account_show(outcome.stdout_output);
    if (info.is_err()) {
        return blobtier_error<std::optional<session_info>>(
            info.error().code, info.error().message, kModule);
    }

    logger_->debug_fmt("Active az session: user={} tenant={} subscription={}",
                       info.value().user, info.value().tenant_id,
                       info.value().subscription_id);
    return std::optional<session_info>{info.value()};
}

auto azure_cli_session::login(const std::string& tenant) -> VoidResult {
    logger_->info_fmt("Signing in to tenant {}", tenant);

    command_options options;
    options.interactive = true;
    options.timeout = std::chrono::seconds{0};

    auto result = runner_->run(az_path_, {"login", "--tenant", tenant, "--output", "none"},
                               options);
    if (result.is_err()) {
        return blobtier_void_error(result.error().code, result.error().message, kModule);
    }
    if (!result.value().succeeded()) {
        return blobtier_void_error(error_codes::command_failed,
                                   describe_exit("az login", result.value()), kModule);
    }
    return ok();
}

auto azure_cli_session::set_active_scope(const std::string& subscription) -> VoidResult {
    logger_->info_fmt("Switching active subscription to {}", subscription);

    command_options options;
    auto result = runner_->run(az_path_, {"account", "set", "--subscription", subscription},
                               options);
    if (result.is_err()) {
        return blobtier_void_error(result.error().code, result.error().message, kModule);
    }
    if (!result.value().succeeded()) {
        return blobtier_void_error(error_codes::command_failed,
                                   describe_exit("az account set", result.value()),
                                   kModule);
    }
    return ok();
}

}  // namespace blobtier::provider
