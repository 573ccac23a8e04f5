/**
 * @file session_guard.cpp
 * @brief Implementation of the session guard
 */

#include <blobtier/orchestrator/session_guard.hpp>

#include <algorithm>
#include <cctype>

namespace blobtier::orchestrator {

namespace {

constexpr const char* kModule = "session_guard";

auto same_id(const std::string& a, const std::string& b) -> bool {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

auto scope_error(const std::string& message) -> VoidResult {
    return blobtier_void_error(error_codes::session_scope_error, message, kModule);
}

}  // namespace

session_guard::session_guard(std::shared_ptr<provider::session_provider> provider,
                             std::shared_ptr<di::ILogger> logger)
    : provider_(std::move(provider)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

auto session_guard::ensure_session(const std::string& tenant,
                                   const std::string& subscription) -> VoidResult {
    auto current = provider_->current_session();
    if (current.is_err()) {
        return scope_error("Cannot determine the current session: " +
                           current.error().message);
    }

    auto session = current.value();

    if (!session || !same_id(session->tenant_id, tenant)) {
        if (session) {
            logger_->info_fmt("Session is on tenant {}, signing in to {}",
                              session->tenant_id, tenant);
        } else {
            logger_->info_fmt("No active session, signing in to tenant {}", tenant);
        }

        auto login = provider_->login(tenant);
        if (login.is_err()) {
            return scope_error("Login to tenant " + tenant + " failed: " +
                               login.error().message);
        }

        auto after_login = provider_->current_session();
        if (after_login.is_err()) {
            return scope_error("Cannot determine the session after login: " +
                               after_login.error().message);
        }
        session = after_login.value();
        if (!session || !same_id(session->tenant_id, tenant)) {
            return scope_error("Session is not scoped to tenant " + tenant +
                               " after login");
        }
    }

    if (!same_id(session->subscription_id, subscription)) {
        logger_->info_fmt("Session is on subscription {}, switching to {}",
                          session->subscription_id, subscription);

        auto switched = provider_->set_active_scope(subscription);
        if (switched.is_err()) {
            return scope_error("Cannot switch to subscription " + subscription + ": " +
                               switched.error().message);
        }

        auto verified = provider_->current_session();
        if (verified.is_err()) {
            return scope_error("Cannot verify the session after switching scope: " +
                               verified.error().message);
        }
        session = verified.value();
        if (!session || !same_id(session->tenant_id, tenant) ||
            !same_id(session->subscription_id, subscription)) {
            return scope_error("Session is not scoped to tenant " + tenant +
                               " / subscription " + subscription +
                               " after switching scope");
        }
    }

    logger_->info_fmt("Session scoped to tenant {} / subscription {}", tenant,
                      subscription);
    return ok();
}

}  // namespace blobtier::orchestrator
