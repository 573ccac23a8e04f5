/**
 * @file run_config.hpp
 * @brief Command-line, environment and JSON configuration of a run
 *
 * Sources are applied in override order:
 *   1. JSON file named by --config
 *   2. BLOBTIER_* environment variables
 *   3. command-line flags
 *
 * The JSON layout mirrors the dotted option names:
 * @code
 * {
 *   "account": { "name": "acct", "tenant": "...", "subscription": "...",
 *                "connection_string": "..." },
 *   "container": "archive-data",
 *   "window": { "start": "2024-01-01", "end": "2024-03-31T23:59:59Z" },
 *   "tier_filter": "Archive",
 *   "target_tier": "Hot",
 *   "rehydrate_priority": "Standard",
 *   "audit": { "directory": "audit", "prefix": "blobtier" },
 *   "journal": { "path": "blobtier.db" },
 *   "log": { "directory": "logs", "level": "info", "console": true },
 *   "assume_yes": false,
 *   "max_parallel": 1,
 *   "az_path": "az"
 * }
 * @endcode
 */

#pragma once

#include <blobtier/core/result.hpp>
#include <blobtier/core/run_context.hpp>
#include <blobtier/integration/logger_adapter.hpp>
#include <blobtier/provider/azure_auth.hpp>

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>

namespace blobtier::config {

/**
 * @brief Account identity and credentials
 *
 * Secrets are never written to logs; see describe().
 */
struct account_config {
    std::string name;
    std::string tenant;
    std::string subscription;
    std::string connection_string;
    std::string sas_token;
    std::string key;

    /// Blob endpoint override (Azurite, sovereign clouds)
    std::string endpoint;
};

struct audit_config {
    std::string directory{"audit"};
    std::string prefix{"blobtier"};
};

struct journal_config {
    /// SQLite file; empty disables the journal
    std::string path{"blobtier.db"};
};

struct log_config {
    std::string directory{"logs"};
    std::string level{"info"};
    bool console{true};
};

/**
 * @brief Raw settings before validation
 */
struct run_config {
    account_config account;
    std::string container;
    std::string window_start;
    std::string window_end;
    std::string tier_filter{"Archive"};
    std::string target_tier{"Hot"};
    std::string rehydrate_priority{"Standard"};
    audit_config audit;
    journal_config journal;
    log_config log;

    /// Skip the interactive prompt
    bool assume_yes{false};

    /// Tier changes in flight at once
    std::size_t max_parallel{1};

    /// Azure CLI executable
    std::string az_path{"az"};

    /// --help was given
    bool show_help{false};
};

/// Environment lookup; returns nullopt when the variable is unset
using env_lookup = std::function<std::optional<std::string>(const std::string&)>;

/**
 * @brief Lookup backed by std::getenv
 */
[[nodiscard]] auto process_environment() -> env_lookup;

/**
 * @brief Set one option by its dotted name ("account.name", "max_parallel")
 * @return invalid_configuration for an unknown name or a malformed value
 */
[[nodiscard]] auto set_option(run_config& config, const std::string& name,
                              const std::string& value) -> VoidResult;

/**
 * @brief Apply a JSON document
 *
 * Nested objects map to dotted option names; scalar values are accepted as
 * strings, numbers or booleans.
 */
[[nodiscard]] auto apply_json(run_config& config, const std::string& json_text)
    -> VoidResult;

/**
 * @brief Apply a JSON configuration file
 */
[[nodiscard]] auto load_config_file(run_config& config, const std::string& path)
    -> VoidResult;

/**
 * @brief Apply BLOBTIER_* variables
 *
 * The variable name is the option name upper-cased with '.' replaced by
 * '_', e.g. BLOBTIER_ACCOUNT_NAME, BLOBTIER_WINDOW_START.
 */
[[nodiscard]] auto apply_environment(run_config& config, const env_lookup& env)
    -> VoidResult;

/**
 * @brief Build the configuration from every source
 *
 * Flags use the option name with '.' and '_' replaced by '-', e.g.
 * --account-name, --window-start, --max-parallel. --yes and --no-console
 * take no value.
 *
 * @return The merged configuration, or invalid_configuration
 */
[[nodiscard]] auto parse_args(int argc, const char* const argv[], const env_lookup& env)
    -> Result<run_config>;

/**
 * @brief Validate the configuration into an immutable run_context
 */
[[nodiscard]] auto to_run_context(const run_config& config) -> Result<run_context>;

/**
 * @brief Resolve provider credentials
 *
 * A connection string wins over an explicit key, which wins over a SAS
 * token. The endpoint override applies to all three.
 */
[[nodiscard]] auto to_credentials(const run_config& config)
    -> Result<provider::azure_credentials>;

/**
 * @brief Logger settings derived from the log section
 */
[[nodiscard]] auto to_logger_config(const run_config& config)
    -> Result<integration::logger_config>;

/**
 * @brief One-line summary safe for logs (credentials redacted)
 */
[[nodiscard]] auto describe(const run_config& config) -> std::string;

void print_help(std::ostream& out);

}  // namespace blobtier::config
