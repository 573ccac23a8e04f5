/**
 * @file session_provider.hpp
 * @brief Authenticated session capability
 */

#pragma once

#include <blobtier/core/result.hpp>

#include <optional>
#include <string>

namespace blobtier::provider {

/**
 * @brief The directory and subscription a session is currently scoped to
 */
struct session_info {
    std::string tenant_id;
    std::string subscription_id;

    /// Signed-in principal, for log output only
    std::string user;
};

/**
 * @brief Query and change the authenticated session
 *
 * azure_cli_session implements this on top of the az CLI.
 */
class session_provider {
public:
    virtual ~session_provider() = default;

    /**
     * @brief Query the active session
     * @return nullopt when nobody is signed in, or an error when the
     *         session state could not be determined
     */
    [[nodiscard]] virtual auto current_session()
        -> Result<std::optional<session_info>> = 0;

    /**
     * @brief Sign in against a tenant (may block on an interactive login)
     */
    [[nodiscard]] virtual auto login(const std::string& tenant) -> VoidResult = 0;

    /**
     * @brief Switch the active subscription of the current session
     */
    [[nodiscard]] virtual auto set_active_scope(const std::string& subscription)
        -> VoidResult = 0;

protected:
    session_provider() = default;
    session_provider(const session_provider&) = default;
    session_provider& operator=(const session_provider&) = default;
};

}  // namespace blobtier::provider
