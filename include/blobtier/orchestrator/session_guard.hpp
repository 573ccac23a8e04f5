/**
 * @file session_guard.hpp
 * @brief Ensures an authenticated session scoped to the requested tenant
 *        and subscription
 */

#pragma once

#include <blobtier/core/result.hpp>
#include <blobtier/di/ilogger.hpp>
#include <blobtier/provider/session_provider.hpp>

#include <memory>
#include <string>

namespace blobtier::orchestrator {

/**
 * @class session_guard
 * @brief Brings the session into the required scope before any read
 *
 * Decision table:
 * | current session              | action                                 |
 * |------------------------------|----------------------------------------|
 * | none                         | login(tenant)                          |
 * | other tenant                 | login(tenant)                          |
 * | tenant ok, other subscription| set_active_scope, then re-query        |
 * | tenant and subscription ok   | nothing                                |
 *
 * After every change the session is queried again and verified; a
 * mismatch is a session_scope_error. Identifiers are compared without
 * regard to case.
 */
class session_guard {
public:
    explicit session_guard(std::shared_ptr<provider::session_provider> provider,
                           std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Ensure the session is scoped to @p tenant and @p subscription
     *
     * Idempotent: calling it again on a correctly scoped session changes
     * nothing. May block on an interactive login.
     *
     * @return ok, or an error with code session_scope_error
     */
    [[nodiscard]] auto ensure_session(const std::string& tenant,
                                      const std::string& subscription) -> VoidResult;

private:
    std::shared_ptr<provider::session_provider> provider_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace blobtier::orchestrator
