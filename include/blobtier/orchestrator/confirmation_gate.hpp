/**
 * @file confirmation_gate.hpp
 * @brief Operator checkpoint before any state-changing call
 */

#pragma once

#include <blobtier/core/blob_types.hpp>
#include <blobtier/core/run_context.hpp>
#include <blobtier/di/ilogger.hpp>

#include <kcenon/thread/core/cancellation_token.h>

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace blobtier::orchestrator {

/**
 * @brief Where the operator's answer comes from
 */
class confirmation_source {
public:
    virtual ~confirmation_source() = default;

    /**
     * @brief Show the summary the operator is asked to confirm
     */
    virtual void present(const std::string& summary) = 0;

    /**
     * @brief Block for one response line
     * @return The line without its terminator, or nullopt at end of input
     */
    [[nodiscard]] virtual auto read_response() -> std::optional<std::string> = 0;

protected:
    confirmation_source() = default;
};

/**
 * @brief Console source: prints to @p out and reads a line from @p in
 */
class stream_confirmation_source final : public confirmation_source {
public:
    stream_confirmation_source(std::istream& in, std::ostream& out);

    void present(const std::string& summary) override;

    [[nodiscard]] auto read_response() -> std::optional<std::string> override;

private:
    std::istream& in_;
    std::ostream& out_;
};

/**
 * @brief Pre-answered source (used by --yes and tests)
 */
class constant_confirmation_source final : public confirmation_source {
public:
    explicit constant_confirmation_source(std::optional<std::string> answer);

    void present(const std::string& summary) override;

    [[nodiscard]] auto read_response() -> std::optional<std::string> override;

    /// Summary passed to the last present() call
    [[nodiscard]] auto last_summary() const -> const std::string& { return last_summary_; }

    [[nodiscard]] auto prompt_count() const noexcept -> std::size_t { return prompts_; }

private:
    std::optional<std::string> answer_;
    std::string last_summary_;
    std::size_t prompts_{0};
};

/**
 * @class confirmation_gate
 * @brief Requires an exact affirmative answer before migration proceeds
 *
 * Only an exact match against the allow-list (default {"y", "Y"}) is
 * affirmative. Anything else declines: an empty line, "n", "yes", a padded
 * " y ", end of input, or a cancelled token.
 */
class confirmation_gate {
public:
    explicit confirmation_gate(std::shared_ptr<confirmation_source> source,
                               std::shared_ptr<di::ILogger> logger = nullptr,
                               std::set<std::string> affirmative = {"y", "Y"});

    /**
     * @brief Present the candidate summary and wait for the answer
     *
     * @param candidates Candidate set the operator is approving
     * @param context Run context (account, container, tiers)
     * @param audit_location Discovered audit artifact, if one was written
     * @param token Cancelled tokens always decline
     * @return true only when the operator affirmed
     */
    [[nodiscard]] auto require_confirmation(
        const std::vector<blob_record>& candidates,
        const run_context& context,
        const std::optional<std::filesystem::path>& audit_location,
        const kcenon::thread::cancellation_token& token) -> bool;

    /**
     * @brief Summary text shown to the operator
     */
    [[nodiscard]] static auto build_summary(
        const std::vector<blob_record>& candidates,
        const run_context& context,
        const std::optional<std::filesystem::path>& audit_location) -> std::string;

private:
    std::shared_ptr<confirmation_source> source_;
    std::shared_ptr<di::ILogger> logger_;
    std::set<std::string> affirmative_;
};

}  // namespace blobtier::orchestrator
