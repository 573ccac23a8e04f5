/**
 * @file timestamp.hpp
 * @brief Timestamp parsing and formatting helpers
 *
 * The provider reports times in RFC 1123 form ("Wed, 10 Apr 2024 10:15:30
 * GMT"); configuration and audit artifacts use ISO 8601 in UTC. All values
 * are std::chrono::system_clock time points.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace blobtier {

/// System clock time point used throughout the project
using timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Parse an RFC 1123 HTTP date
 * @param text e.g. "Wed, 10 Apr 2024 10:15:30 GMT"
 * @return Parsed time, or nullopt if the text is not a valid date
 */
[[nodiscard]] auto parse_rfc1123(std::string_view text) -> std::optional<timestamp>;

/**
 * @brief Parse an ISO 8601 date or date-time in UTC
 *
 * Accepted forms: "2024-04-10", "2024-04-10T10:15:30",
 * "2024-04-10T10:15:30Z", "2024-04-10T10:15:30.123Z" and
 * "2024-04-10 10:15:30". A date without a time is midnight UTC.
 *
 * @return Parsed time, or nullopt if the text is not a valid date
 */
[[nodiscard]] auto parse_iso8601(std::string_view text) -> std::optional<timestamp>;

/**
 * @brief Parse a provider timestamp in either supported form
 */
[[nodiscard]] auto parse_timestamp(std::string_view text) -> std::optional<timestamp>;

/**
 * @brief Format as ISO 8601 UTC with second precision ("2024-04-10T10:15:30Z")
 */
[[nodiscard]] auto format_iso8601(timestamp tp) -> std::string;

/**
 * @brief Format as RFC 1123 ("Wed, 10 Apr 2024 10:15:30 GMT")
 */
[[nodiscard]] auto format_rfc1123(timestamp tp) -> std::string;

/**
 * @brief Compact UTC stamp for file names ("20240410T101530.123Z")
 */
[[nodiscard]] auto format_file_stamp(timestamp tp) -> std::string;

}  // namespace blobtier
