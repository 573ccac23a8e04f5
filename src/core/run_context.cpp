/**
 * @file run_context.cpp
 * @brief Validation of the per-run configuration
 */

#include <blobtier/core/run_context.hpp>

#include <blobtier/compat/format.hpp>
#include <blobtier/core/timestamp.hpp>

namespace blobtier {

auto make_run_context(run_context draft) -> Result<run_context> {
    auto invalid = [](const std::string& message) {
        return blobtier_error<run_context>(error_codes::invalid_configuration,
                                           message, "run_context");
    };

    if (draft.account.empty()) {
        return invalid("Storage account name is required");
    }
    if (draft.tenant.empty()) {
        return invalid("Tenant is required");
    }
    if (draft.subscription.empty()) {
        return invalid("Subscription is required");
    }
    if (draft.container.empty()) {
        return invalid("Container name is required");
    }
    if (draft.criteria.start_time > draft.criteria.end_time) {
        return invalid(compat::format(
            "Window start {} is after window end {}",
            format_iso8601(draft.criteria.start_time),
            format_iso8601(draft.criteria.end_time)));
    }
    if (draft.criteria.tier == access_tier::unknown) {
        return invalid("Source tier must be one of Hot, Cool, Cold, Archive");
    }
    if (draft.request.target_tier == access_tier::unknown) {
        return invalid("Target tier must be one of Hot, Cool, Cold, Archive");
    }
    if (draft.criteria.tier == draft.request.target_tier) {
        return invalid(compat::format("Source and target tier are both {}",
                                      to_string(draft.criteria.tier)));
    }
    if (draft.audit_prefix.empty()) {
        draft.audit_prefix = "blobtier";
    }

    return draft;
}

}  // namespace blobtier
