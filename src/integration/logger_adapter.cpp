/**
 * @file logger_adapter.cpp
 * @brief Implementation of the migration logging adapter
 */

#include <blobtier/integration/logger_adapter.hpp>

#include <blobtier/compat/time.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace blobtier::integration {

auto parse_log_level(const std::string& name, log_level& level) -> bool {
    if (name == "trace") {
        level = log_level::trace;
    } else if (name == "debug") {
        level = log_level::debug;
    } else if (name == "info") {
        level = log_level::info;
    } else if (name == "warn" || name == "warning") {
        level = log_level::warn;
    } else if (name == "error") {
        level = log_level::error;
    } else if (name == "fatal") {
        level = log_level::fatal;
    } else if (name == "off") {
        level = log_level::off;
    } else {
        return false;
    }
    return true;
}

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    impl() = default;
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);

        if (initialized_) {
            return;
        }

        config_ = config;
        min_level_.store(config.min_level);

        if (config.enable_file || config.enable_audit_log) {
            std::error_code ec;
            std::filesystem::create_directories(config.log_directory, ec);
        }

        logger_ = std::make_unique<kcenon::logger::logger>(
            config.async_mode, config.buffer_size);

        logger_->set_min_level(convert_log_level(config.min_level));

        if (config.enable_console) {
            logger_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }

        if (config.enable_file) {
            auto log_path = config.log_directory / "blobtier.log";
            auto writer = std::make_unique<kcenon::logger::rotating_file_writer>(
                log_path.string(),
                config.max_file_size_mb * 1024 * 1024,
                config.max_files);
            logger_->add_writer(std::move(writer));
        }

        logger_->start();

        if (config.enable_audit_log) {
            audit_log_path_ = config.log_directory / "audit.json";
        }

        initialized_ = true;
    }

    void shutdown() {
        std::lock_guard lock(mutex_);

        if (!initialized_) {
            return;
        }

        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }

        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const noexcept -> bool {
        return initialized_.load();
    }

    void log(log_level level, const std::string& message) {
        if (!initialized_ || !logger_) {
            return;
        }

        if (!is_level_enabled(level)) {
            return;
        }

        logger_->log(convert_log_level(level), message);
    }

    [[nodiscard]] auto is_level_enabled(log_level level) const noexcept -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void flush() {
        if (logger_) {
            logger_->flush();
        }
    }

    void set_min_level(log_level level) {
        min_level_.store(level);
        if (logger_) {
            logger_->set_min_level(convert_log_level(level));
        }
    }

    [[nodiscard]] auto get_min_level() const noexcept -> log_level {
        return min_level_.load();
    }

    [[nodiscard]] auto get_config() const -> const logger_config& { return config_; }

    void write_audit_log(const std::string& event_type,
                         const std::string& outcome,
                         const std::map<std::string, std::string>& fields) {
        if (!initialized_ || !config_.enable_audit_log) {
            return;
        }

        std::lock_guard lock(audit_mutex_);

        std::ofstream file(audit_log_path_, std::ios::app);
        if (!file) {
            return;
        }

        std::ostringstream json;
        json << "{";
        json << "\"timestamp\":\"" << format_iso8601() << "\",";
        json << "\"event_type\":\"" << escape_json(event_type) << "\",";
        json << "\"outcome\":\"" << escape_json(outcome) << "\"";

        for (const auto& [key, value] : fields) {
            json << ",\"" << escape_json(key) << "\":\"" << escape_json(value) << "\"";
        }

        json << "}\n";

        file << json.str();
        file.flush();
    }

private:
    [[nodiscard]] static auto convert_log_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace:
                return kcenon::logger::log_level::trace;
            case log_level::debug:
                return kcenon::logger::log_level::debug;
            case log_level::info:
                return kcenon::logger::log_level::info;
            case log_level::warn:
                return kcenon::logger::log_level::warn;
            case log_level::error:
                return kcenon::logger::log_level::error;
            case log_level::fatal:
                return kcenon::logger::log_level::fatal;
            case log_level::off:
            default:
                return kcenon::logger::log_level::off;
        }
    }

    [[nodiscard]] static auto format_iso8601() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;

        std::tm tm_val{};
        compat::gmtime_safe(&time_t_val, &tm_val);

        std::ostringstream oss;
        oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    [[nodiscard]] static auto escape_json(const std::string& str) -> std::string {
        std::ostringstream oss;
        for (char c : str) {
            switch (c) {
                case '"':
                    oss << "\\\"";
                    break;
                case '\\':
                    oss << "\\\\";
                    break;
                case '\b':
                    oss << "\\b";
                    break;
                case '\f':
                    oss << "\\f";
                    break;
                case '\n':
                    oss << "\\n";
                    break;
                case '\r':
                    oss << "\\r";
                    break;
                case '\t':
                    oss << "\\t";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 32) {
                        oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                            << static_cast<int>(c);
                    } else {
                        oss << c;
                    }
                    break;
            }
        }
        return oss.str();
    }

    mutable std::mutex mutex_;
    mutable std::mutex audit_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> logger_;
    std::filesystem::path audit_log_path_;
};

// =============================================================================
// Static Member Initialization
// =============================================================================

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Initialization
// =============================================================================

void logger_adapter::initialize(const logger_config& config) {
    pimpl_->initialize(config);
}

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool {
    return pimpl_->is_initialized();
}

// =============================================================================
// Standard Logging
// =============================================================================

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

// =============================================================================
// Run Event Trail
// =============================================================================

void logger_adapter::log_run_started(const std::string& account,
                                     const std::string& container,
                                     const std::string& source_tier,
                                     const std::string& target_tier) {
    info("Run started: account={} container={} {} -> {}",
         account, container, source_tier, target_tier);

    write_audit_log("RUN_STARTED", "success",
                    {{"account", account},
                     {"container", container},
                     {"source_tier", source_tier},
                     {"target_tier", target_tier}});
}

void logger_adapter::log_batch_recorded(const std::string& phase,
                                        std::size_t record_count,
                                        const std::string& artifact_path) {
    info("Audit batch '{}' recorded: {} objects -> {}",
         phase, record_count, artifact_path);

    write_audit_log("AUDIT_BATCH", "success",
                    {{"phase", phase},
                     {"record_count", std::to_string(record_count)},
                     {"artifact", artifact_path}});
}

void logger_adapter::log_confirmation(bool approved, std::size_t candidate_count) {
    if (approved) {
        info("Operator confirmed migration of {} objects", candidate_count);
    } else {
        info("Operator declined migration of {} objects", candidate_count);
    }

    write_audit_log("CONFIRMATION", approved ? "approved" : "declined",
                    {{"candidate_count", std::to_string(candidate_count)}});
}

void logger_adapter::log_tier_changed(const std::string& container,
                                      const std::string& blob_name,
                                      const std::string& from_tier,
                                      const std::string& to_tier) {
    debug("Tier changed: {}/{} {} -> {}", container, blob_name, from_tier, to_tier);

    write_audit_log("TIER_CHANGE", "success",
                    {{"container", container},
                     {"blob", blob_name},
                     {"from_tier", from_tier},
                     {"to_tier", to_tier}});
}

void logger_adapter::log_tier_change_failed(const std::string& container,
                                            const std::string& blob_name,
                                            const std::string& to_tier,
                                            const std::string& reason) {
    // The executor already reported the failure at ERROR
    debug("Tier change failed: {}/{} -> {}: {}", container, blob_name, to_tier, reason);

    write_audit_log("TIER_CHANGE", "failure",
                    {{"container", container},
                     {"blob", blob_name},
                     {"to_tier", to_tier},
                     {"reason", reason}});
}

void logger_adapter::log_run_finished(const std::string& status,
                                      std::size_t migrated,
                                      std::size_t failed) {
    if (failed == 0) {
        info("Run finished: status={} migrated={}", status, migrated);
    } else {
        warn("Run finished: status={} migrated={} failed={}", status, migrated, failed);
    }

    write_audit_log("RUN_FINISHED", status,
                    {{"migrated", std::to_string(migrated)},
                     {"failed", std::to_string(failed)}});
}

// =============================================================================
// Configuration
// =============================================================================

void logger_adapter::set_min_level(log_level level) {
    pimpl_->set_min_level(level);
}

auto logger_adapter::get_min_level() noexcept -> log_level {
    return pimpl_->get_min_level();
}

auto logger_adapter::get_config() -> const logger_config& {
    return pimpl_->get_config();
}

// =============================================================================
// Private Helpers
// =============================================================================

void logger_adapter::write_audit_log(
    const std::string& event_type,
    const std::string& outcome,
    const std::map<std::string, std::string>& fields) {
    pimpl_->write_audit_log(event_type, outcome, fields);
}

}  // namespace blobtier::integration
