/**
 * @file azure_cli_session.hpp
 * @brief session_provider implementation on the Azure CLI
 *
 * Commands issued:
 * - az account show --output json
 * - az login --tenant <tenant> --output none
 * - az account set --subscription <subscription>
 */

#pragma once

#include <blobtier/di/ilogger.hpp>
#include <blobtier/provider/command_runner.hpp>
#include <blobtier/provider/session_provider.hpp>

#include <memory>
#include <optional>
#include <string>

namespace blobtier::provider {

/**
 * @brief Parse the JSON printed by "az account show"
 *
 * @return The session, or command_output_error when the output is not a
 *         JSON object carrying tenantId and id
 */
[[nodiscard]] auto parse_account_show(const std::string& json_text) -> Result<session_info>;

/**
 * @class azure_cli_session
 * @brief Session capability backed by the az command-line tool
 */
class azure_cli_session final : public session_provider {
public:
    /**
     * @param runner Command runner used to invoke az
     * @param az_path az executable (looked up on PATH when it has no '/')
     * @param logger Logger for command diagnostics
     */
    azure_cli_session(std::shared_ptr<command_runner> runner,
                      std::string az_path = "az",
                      std::shared_ptr<di::ILogger> logger = nullptr);

    ~azure_cli_session() override = default;

    [[nodiscard]] auto current_session()
        -> Result<std::optional<session_info>> override;

    [[nodiscard]] auto login(const std::string& tenant) -> VoidResult override;

    [[nodiscard]] auto set_active_scope(const std::string& subscription)
        -> VoidResult override;

private:
    std::shared_ptr<command_runner> runner_;
    std::string az_path_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace blobtier::provider
