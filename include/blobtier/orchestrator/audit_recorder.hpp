/**
 * @file audit_recorder.hpp
 * @brief Durable, write-once CSV audit artifacts of each run phase
 *
 * Artifacts are named "<prefix>_<phase>_<YYYYMMDDTHHMMSS.mmmZ>.csv" and
 * carry one row per object:
 *
 *   container,name,version_id,tier,last_modified,last_accessed,
 *   content_length,rehydration_status,etag,tags
 *
 * The failure ledger appends error_code and error_message columns.
 */

#pragma once

#include <blobtier/core/blob_types.hpp>
#include <blobtier/core/result.hpp>
#include <blobtier/core/timestamp.hpp>
#include <blobtier/di/ilogger.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blobtier::orchestrator {

/**
 * @brief Pipeline phase an audit batch documents
 */
enum class audit_phase {
    /// Candidate set before any mutation
    discovered,

    /// Objects whose tier change was accepted
    migrated,

    /// Objects whose tier change failed
    failed
};

[[nodiscard]] constexpr auto to_string(audit_phase phase) noexcept -> std::string_view {
    switch (phase) {
        case audit_phase::discovered:
            return "discovered";
        case audit_phase::migrated:
            return "migrated";
        case audit_phase::failed:
            return "failed";
    }
    return "discovered";
}

/**
 * @brief A written audit artifact
 */
struct audit_batch {
    audit_phase phase{audit_phase::discovered};

    /// Creation timestamp, strictly increasing per recorder
    timestamp created_at;

    /// Location of the artifact
    std::filesystem::path path;

    std::size_t record_count{0};
};

/**
 * @brief Audit recorder settings
 */
struct audit_recorder_config {
    /// Directory the artifacts are written to (created when missing)
    std::filesystem::path directory{"audit"};

    /// File name prefix
    std::string prefix{"blobtier"};
};

/**
 * @brief Quote a CSV field per RFC 4180 when needed
 */
[[nodiscard]] auto csv_escape(std::string_view field) -> std::string;

/**
 * @class audit_recorder
 * @brief Writes audit batches as CSV files
 *
 * Thread Safety: record() and record_failures() are serialized internally.
 */
class audit_recorder {
public:
    using clock_function = std::function<timestamp()>;

    /**
     * @param config Output directory and prefix
     * @param logger Logger for written artifacts
     * @param clock Time source for creation timestamps (system clock when null)
     */
    explicit audit_recorder(audit_recorder_config config,
                            std::shared_ptr<di::ILogger> logger = nullptr,
                            clock_function clock = nullptr);

    /**
     * @brief Write the records of @p phase
     * @return The written batch, or audit_write_error. An existing artifact
     *         is never overwritten.
     */
    [[nodiscard]] auto record(audit_phase phase, const std::vector<blob_record>& records)
        -> Result<audit_batch>;

    /**
     * @brief Write the failure ledger (phase failed)
     */
    [[nodiscard]] auto record_failures(const std::vector<failed_migration>& failures)
        -> Result<audit_batch>;

    [[nodiscard]] auto config() const noexcept -> const audit_recorder_config& {
        return config_;
    }

private:
    /**
     * @brief Claim the next strictly increasing creation timestamp
     */
    [[nodiscard]] auto next_stamp() -> timestamp;

    /**
     * @brief Write @p content to a fresh artifact for @p phase
     */
    [[nodiscard]] auto write_artifact(audit_phase phase,
                                      const std::string& content,
                                      std::size_t record_count) -> Result<audit_batch>;

    audit_recorder_config config_;
    std::shared_ptr<di::ILogger> logger_;
    clock_function clock_;
    std::optional<timestamp> last_stamp_;
    std::mutex mutex_;
};

}  // namespace blobtier::orchestrator
