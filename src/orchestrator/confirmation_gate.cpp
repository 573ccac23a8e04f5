/**
 * @file confirmation_gate.cpp
 * @brief Implementation of the confirmation gate and its sources
 */

#include <blobtier/orchestrator/confirmation_gate.hpp>

#include <blobtier/core/timestamp.hpp>

#include <istream>
#include <ostream>
#include <sstream>

namespace blobtier::orchestrator {

// =============================================================================
// Sources
// =============================================================================

stream_confirmation_source::stream_confirmation_source(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {}

void stream_confirmation_source::present(const std::string& summary) {
    out_ << summary << std::flush;
}

auto stream_confirmation_source::read_response() -> std::optional<std::string> {
    std::string line;
    if (!std::getline(in_, line)) {
        return std::nullopt;
    }
    return line;
}

constant_confirmation_source::constant_confirmation_source(std::optional<std::string> answer)
    : answer_(std::move(answer)) {}

void constant_confirmation_source::present(const std::string& summary) {
    last_summary_ = summary;
    ++prompts_;
}

auto constant_confirmation_source::read_response() -> std::optional<std::string> {
    return answer_;
}

// =============================================================================
// Gate
// =============================================================================

confirmation_gate::confirmation_gate(std::shared_ptr<confirmation_source> source,
                                     std::shared_ptr<di::ILogger> logger,
                                     std::set<std::string> affirmative)
    : source_(std::move(source)),
      logger_(logger ? std::move(logger) : di::null_logger()),
      affirmative_(std::move(affirmative)) {}

auto confirmation_gate::build_summary(
    const std::vector<blob_record>& candidates,
    const run_context& context,
    const std::optional<std::filesystem::path>& audit_location) -> std::string {
    std::uint64_t total_bytes = 0;
    for (const auto& record : candidates) {
        total_bytes += record.content_length;
    }

    std::ostringstream oss;
    oss << "\n"
        << "About to change the access tier of " << candidates.size() << " objects\n"
        << "  Account:   " << context.account << "\n"
        << "  Container: " << context.container << "\n"
        << "  Tier:      " << to_string(context.criteria.tier) << " -> "
        << to_string(context.request.target_tier) << "\n"
        << "  Window:    " << format_iso8601(context.criteria.start_time) << " .. "
        << format_iso8601(context.criteria.end_time) << "\n"
        << "  Size:      " << total_bytes << " bytes\n";
    if (context.criteria.tier == access_tier::archive) {
        oss << "  Priority:  " << to_string(context.request.priority) << "\n";
    }
    oss << "  Audit:     "
        << (audit_location ? audit_location->string() : std::string{"(not written)"})
        << "\n"
        << "Type y and press Enter to proceed. After Ctrl+C, press Enter to stop.\n"
        << "Proceed? [y/N] ";
    return oss.str();
}

auto confirmation_gate::require_confirmation(
    const std::vector<blob_record>& candidates,
    const run_context& context,
    const std::optional<std::filesystem::path>& audit_location,
    const kcenon::thread::cancellation_token& token) -> bool {
    if (token.is_cancelled()) {
        logger_->warn("Run cancelled before confirmation");
        return false;
    }

    source_->present(build_summary(candidates, context, audit_location));
    auto response = source_->read_response();

    if (token.is_cancelled()) {
        logger_->warn("Run cancelled while waiting for confirmation");
        return false;
    }
    if (!response) {
        logger_->info("No confirmation received (end of input)");
        return false;
    }

    const bool approved = affirmative_.count(*response) > 0;
    logger_->info_fmt("Operator answered '{}': {}", *response,
                      approved ? "proceeding" : "declined");
    return approved;
}

}  // namespace blobtier::orchestrator
