/**
 * @file logger_adapter.hpp
 * @brief Adapter for migration logging using logger_system
 *
 * This file provides the logger_adapter class for integrating logger_system
 * with the tier migration orchestrator. It supports standard leveled logging
 * to console and a rotating log file, and an operational audit trail of
 * run events written as JSON lines.
 */

#pragma once

#include <blobtier/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

namespace blobtier::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @brief Parse a log level name ("trace" .. "fatal", "off"; "warning" is accepted)
 * @return true and sets @p level when the name is recognised
 */
[[nodiscard]] auto parse_log_level(const std::string& name, log_level& level) -> bool;

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{true};

    /// Enable the JSON-lines run event trail
    bool enable_audit_log{true};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{100};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{10};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

/**
 * @class logger_adapter
 * @brief Process-wide logging facade over logger_system
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/blobtier";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Discovered {} objects in {}", count, container);
 * logger_adapter::log_tier_changed("archive-data", "2024/04/a.bin", "Archive", "Hot");
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Initialize the logger with configuration
     *
     * Sets up console and file writers and the run event trail.
     * Subsequent calls are ignored until shutdown().
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release the writers
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     */
    static void log(log_level level, const std::string& message);

    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Run Event Trail
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record the start of a run
     */
    static void log_run_started(const std::string& account,
                                const std::string& container,
                                const std::string& source_tier,
                                const std::string& target_tier);

    /**
     * @brief Record that an audit artifact was written
     */
    static void log_batch_recorded(const std::string& phase,
                                   std::size_t record_count,
                                   const std::string& artifact_path);

    /**
     * @brief Record the operator's answer at the confirmation gate
     */
    static void log_confirmation(bool approved, std::size_t candidate_count);

    /**
     * @brief Record an accepted tier change
     */
    static void log_tier_changed(const std::string& container,
                                 const std::string& blob_name,
                                 const std::string& from_tier,
                                 const std::string& to_tier);

    /**
     * @brief Record a rejected tier change
     *
     * Writes the run trail entry; the text log line is DEBUG only.
     */
    static void log_tier_change_failed(const std::string& container,
                                       const std::string& blob_name,
                                       const std::string& to_tier,
                                       const std::string& reason);

    /**
     * @brief Record the end of a run
     */
    static void log_run_finished(const std::string& status,
                                 std::size_t migrated,
                                 std::size_t failed);

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

private:
    static void write_audit_log(const std::string& event_type,
                                const std::string& outcome,
                                const std::map<std::string, std::string>& fields);

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace blobtier::integration
