/**
 * @file run_config.cpp
 * @brief Configuration sources and validation
 */

#include <blobtier/config/run_config.hpp>

#include <blobtier/compat/format.hpp>
#include <blobtier/core/timestamp.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <map>
#include <ostream>
#include <sstream>
#include <utility>
#include <vector>

namespace blobtier::config {

namespace {

using json = nlohmann::json;

constexpr const char* kModule = "run_config";

auto invalid(const std::string& message) -> VoidResult {
    return blobtier_void_error(error_codes::invalid_configuration, message, kModule);
}

auto parse_bool(const std::string& value, bool& out) -> bool {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
        out = true;
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
        out = false;
        return true;
    }
    return false;
}

using setter = std::function<VoidResult(run_config&, const std::string&)>;

auto string_setter(std::string run_config::*field) -> setter {
    return [field](run_config& config, const std::string& value) -> VoidResult {
        config.*field = value;
        return ok();
    };
}

template <typename Section>
auto section_setter(Section run_config::*section, std::string Section::*field) -> setter {
    return [section, field](run_config& config, const std::string& value) -> VoidResult {
        (config.*section).*field = value;
        return ok();
    };
}

auto bool_setter(const std::string& name, std::function<bool&(run_config&)> field) -> setter {
    return [name, field = std::move(field)](run_config& config,
                                            const std::string& value) -> VoidResult {
        bool parsed = false;
        if (!parse_bool(value, parsed)) {
            return invalid(compat::format("{} expects true or false, got '{}'", name, value));
        }
        field(config) = parsed;
        return ok();
    };
}

/**
 * @brief Option name -> setter
 */
auto option_table() -> const std::map<std::string, setter>& {
    static const std::map<std::string, setter> table = {
        {"account.name", section_setter(&run_config::account, &account_config::name)},
        {"account.tenant", section_setter(&run_config::account, &account_config::tenant)},
        {"account.subscription",
         section_setter(&run_config::account, &account_config::subscription)},
        {"account.connection_string",
         section_setter(&run_config::account, &account_config::connection_string)},
        {"account.sas_token", section_setter(&run_config::account, &account_config::sas_token)},
        {"account.key", section_setter(&run_config::account, &account_config::key)},
        {"account.endpoint", section_setter(&run_config::account, &account_config::endpoint)},
        {"container", string_setter(&run_config::container)},
        {"window.start", string_setter(&run_config::window_start)},
        {"window.end", string_setter(&run_config::window_end)},
        {"tier_filter", string_setter(&run_config::tier_filter)},
        {"target_tier", string_setter(&run_config::target_tier)},
        {"rehydrate_priority", string_setter(&run_config::rehydrate_priority)},
        {"audit.directory", section_setter(&run_config::audit, &audit_config::directory)},
        {"audit.prefix", section_setter(&run_config::audit, &audit_config::prefix)},
        {"journal.path", section_setter(&run_config::journal, &journal_config::path)},
        {"log.directory", section_setter(&run_config::log, &log_config::directory)},
        {"log.level", section_setter(&run_config::log, &log_config::level)},
        {"log.console",
         bool_setter("log.console", [](run_config& c) -> bool& { return c.log.console; })},
        {"assume_yes",
         bool_setter("assume_yes", [](run_config& c) -> bool& { return c.assume_yes; })},
        {"max_parallel",
         [](run_config& config, const std::string& value) -> VoidResult {
             std::size_t parsed = 0;
             auto [ptr, ec] =
                 std::from_chars(value.data(), value.data() + value.size(), parsed);
             if (ec != std::errc{} || ptr != value.data() + value.size() || parsed == 0) {
                 return invalid(compat::format(
                     "max_parallel expects a positive integer, got '{}'", value));
             }
             config.max_parallel = parsed;
             return ok();
         }},
        {"az_path", string_setter(&run_config::az_path)},
    };
    return table;
}

auto env_name(const std::string& option) -> std::string {
    std::string name = "BLOBTIER_";
    for (char c : option) {
        name += c == '.' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return name;
}

auto flag_name(const std::string& option) -> std::string {
    std::string name = "--";
    for (char c : option) {
        name += (c == '.' || c == '_') ? '-' : c;
    }
    return name;
}

/// Short spellings accepted in addition to the generated flag names
const std::map<std::string, std::string>& flag_aliases() {
    static const std::map<std::string, std::string> aliases = {
        {"--account", "account.name"},
        {"--tenant", "account.tenant"},
        {"--subscription", "account.subscription"},
        {"--connection-string", "account.connection_string"},
        {"--sas-token", "account.sas_token"},
        {"--endpoint", "account.endpoint"},
        {"--start", "window.start"},
        {"--end", "window.end"},
        {"--tier", "tier_filter"},
        {"--target", "target_tier"},
        {"--priority", "rehydrate_priority"},
        {"--audit-dir", "audit.directory"},
        {"--journal", "journal.path"},
        {"--log-dir", "log.directory"},
    };
    return aliases;
}

auto apply_json_node(run_config& config, const json& node, const std::string& prefix)
    -> VoidResult {
    for (auto it = node.begin(); it != node.end(); ++it) {
        const std::string name = prefix.empty() ? it.key() : prefix + "." + it.key();
        const auto& value = it.value();

        if (value.is_object()) {
            auto nested = apply_json_node(config, value, name);
            if (nested.is_err()) {
                return nested;
            }
            continue;
        }

        std::string text;
        if (value.is_null()) {
            continue;
        } else if (value.is_string()) {
            text = value.get<std::string>();
        } else if (value.is_boolean()) {
            text = value.get<bool>() ? "true" : "false";
        } else if (value.is_number()) {
            text = value.dump();
        } else {
            return invalid(compat::format("Option {} must be a scalar value", name));
        }

        auto set = set_option(config, name, text);
        if (set.is_err()) {
            return set;
        }
    }
    return ok();
}

auto parse_tier_option(const std::string& option, const std::string& value)
    -> Result<access_tier> {
    auto tier = access_tier_from_string(value);
    if (!tier) {
        return blobtier_error<access_tier>(
            error_codes::invalid_configuration,
            compat::format("{} must be one of Hot, Cool, Cold, Archive (got '{}')", option,
                           value),
            kModule);
    }
    return *tier;
}

auto parse_window_bound(const std::string& option, const std::string& value)
    -> Result<timestamp> {
    if (value.empty()) {
        return blobtier_error<timestamp>(error_codes::invalid_configuration,
                                         compat::format("{} is required", option), kModule);
    }
    auto parsed = parse_iso8601(value);
    if (!parsed) {
        return blobtier_error<timestamp>(
            error_codes::invalid_configuration,
            compat::format("{} is not an ISO 8601 date or date-time: '{}'", option, value),
            kModule);
    }
    return *parsed;
}

}  // namespace

// =============================================================================
// Sources
// =============================================================================

auto process_environment() -> env_lookup {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    };
}

auto set_option(run_config& config, const std::string& name, const std::string& value)
    -> VoidResult {
    const auto& table = option_table();
    auto it = table.find(name);
    if (it == table.end()) {
        return invalid(compat::format("Unknown option: {}", name));
    }
    return it->second(config, value);
}

auto apply_json(run_config& config, const std::string& json_text) -> VoidResult {
    try {
        auto document = json::parse(json_text);
        if (!document.is_object()) {
            return invalid("Configuration must be a JSON object");
        }
        return apply_json_node(config, document, "");
    } catch (const json::exception& ex) {
        return invalid(std::string("JSON parsing error: ") + ex.what());
    }
}

auto load_config_file(run_config& config, const std::string& path) -> VoidResult {
    std::ifstream file(path);
    if (!file.is_open()) {
        return invalid("Failed to open configuration file: " + path);
    }
    std::ostringstream content;
    content << file.rdbuf();

    auto applied = apply_json(config, content.str());
    if (applied.is_err()) {
        return invalid(compat::format("{}: {}", path, applied.error().message));
    }
    return ok();
}

auto apply_environment(run_config& config, const env_lookup& env) -> VoidResult {
    for (const auto& [name, apply] : option_table()) {
        if (auto value = env(env_name(name))) {
            auto set = apply(config, *value);
            if (set.is_err()) {
                return invalid(compat::format("{}: {}", env_name(name), set.error().message));
            }
        }
    }
    return ok();
}

auto parse_args(int argc, const char* const argv[], const env_lookup& env)
    -> Result<run_config> {
    run_config config;

    std::map<std::string, std::string> flags;
    for (const auto& [name, apply] : option_table()) {
        flags.emplace(flag_name(name), name);
    }
    for (const auto& [alias, name] : flag_aliases()) {
        flags.emplace(alias, name);
    }

    // Flags are collected first so --config can be applied before the environment
    std::optional<std::string> config_file;
    std::vector<std::pair<std::string, std::string>> overrides;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
            return config;
        }
        if (arg == "--yes" || arg == "-y") {
            overrides.emplace_back("assume_yes", "true");
            continue;
        }
        if (arg == "--no-console") {
            overrides.emplace_back("log.console", "false");
            continue;
        }

        std::string flag = arg;
        std::optional<std::string> inline_value;
        if (auto eq = arg.find('='); eq != std::string::npos && arg.starts_with("--")) {
            flag = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
        }

        const bool is_config = flag == "--config";
        auto known = flags.find(flag);
        if (!is_config && known == flags.end()) {
            return blobtier_error<run_config>(error_codes::invalid_configuration,
                                              "Unknown option: " + arg, kModule);
        }

        std::string value;
        if (inline_value) {
            value = *inline_value;
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            return blobtier_error<run_config>(error_codes::invalid_configuration,
                                              flag + " requires a value", kModule);
        }

        if (is_config) {
            config_file = value;
        } else {
            overrides.emplace_back(known->second, value);
        }
    }

    if (config_file) {
        auto loaded = load_config_file(config, *config_file);
        if (loaded.is_err()) {
            return blobtier_error<run_config>(loaded.error().code, loaded.error().message,
                                              kModule);
        }
    }

    auto from_env = apply_environment(config, env);
    if (from_env.is_err()) {
        return blobtier_error<run_config>(from_env.error().code, from_env.error().message,
                                          kModule);
    }

    for (const auto& [name, value] : overrides) {
        auto set = set_option(config, name, value);
        if (set.is_err()) {
            return blobtier_error<run_config>(set.error().code, set.error().message, kModule);
        }
    }

    return config;
}

// =============================================================================
// Validation
// =============================================================================

auto to_run_context(const run_config& config) -> Result<run_context> {
    auto source = parse_tier_option("tier_filter", config.tier_filter);
    if (source.is_err()) {
        return blobtier_error<run_context>(source.error().code, source.error().message,
                                           kModule);
    }
    auto target = parse_tier_option("target_tier", config.target_tier);
    if (target.is_err()) {
        return blobtier_error<run_context>(target.error().code, target.error().message,
                                           kModule);
    }
    auto priority = rehydrate_priority_from_string(config.rehydrate_priority);
    if (!priority) {
        return blobtier_error<run_context>(
            error_codes::invalid_configuration,
            compat::format("rehydrate_priority must be Standard or High (got '{}')",
                           config.rehydrate_priority),
            kModule);
    }
    auto start = parse_window_bound("window.start", config.window_start);
    if (start.is_err()) {
        return blobtier_error<run_context>(start.error().code, start.error().message,
                                           kModule);
    }
    auto end = parse_window_bound("window.end", config.window_end);
    if (end.is_err()) {
        return blobtier_error<run_context>(end.error().code, end.error().message, kModule);
    }

    run_context draft;
    draft.account = config.account.name;
    draft.tenant = config.account.tenant;
    draft.subscription = config.account.subscription;
    draft.container = config.container;
    draft.criteria.tier = source.value();
    draft.criteria.start_time = start.value();
    draft.criteria.end_time = end.value();
    draft.request.target_tier = target.value();
    draft.request.priority = *priority;
    draft.audit_directory = config.audit.directory;
    draft.audit_prefix = config.audit.prefix;

    return make_run_context(std::move(draft));
}

auto to_credentials(const run_config& config) -> Result<provider::azure_credentials> {
    provider::azure_credentials creds;

    if (!config.account.connection_string.empty()) {
        auto parsed = provider::parse_connection_string(config.account.connection_string);
        if (parsed.is_err()) {
            return parsed;
        }
        creds = parsed.value();
        if (!config.account.name.empty() && creds.account_name != config.account.name) {
            return blobtier_error<provider::azure_credentials>(
                error_codes::invalid_configuration,
                compat::format("Connection string is for account '{}', not '{}'",
                               creds.account_name, config.account.name),
                kModule);
        }
    } else if (!config.account.key.empty()) {
        creds.account_name = config.account.name;
        creds.account_key = config.account.key;
    } else if (!config.account.sas_token.empty()) {
        creds.account_name = config.account.name;
        const auto& token = config.account.sas_token;
        creds.sas_token = token.starts_with('?') ? token.substr(1) : token;
    } else {
        return blobtier_error<provider::azure_credentials>(
            error_codes::invalid_configuration,
            "One of account.connection_string, account.key or account.sas_token is required",
            kModule);
    }

    if (creds.account_name.empty()) {
        return blobtier_error<provider::azure_credentials>(
            error_codes::invalid_configuration, "account.name is required", kModule);
    }
    if (!config.account.endpoint.empty()) {
        creds.blob_endpoint = config.account.endpoint;
    }
    return creds;
}

auto to_logger_config(const run_config& config) -> Result<integration::logger_config> {
    integration::logger_config logger;
    if (!integration::parse_log_level(config.log.level, logger.min_level)) {
        return blobtier_error<integration::logger_config>(
            error_codes::invalid_configuration,
            compat::format("log.level must be one of trace, debug, info, warn, error, "
                           "fatal, off (got '{}')",
                           config.log.level),
            kModule);
    }
    logger.log_directory = config.log.directory;
    logger.enable_console = config.log.console;
    return logger;
}

auto describe(const run_config& config) -> std::string {
    std::string auth = "none";
    if (!config.account.connection_string.empty()) {
        auth = "connection string";
    } else if (!config.account.key.empty()) {
        auth = "shared key";
    } else if (!config.account.sas_token.empty()) {
        auth = "SAS token";
    }

    return compat::format(
        "account={} container={} tier={} target={} priority={} window=[{}, {}] auth={} "
        "audit={} journal={} max_parallel={}",
        config.account.name, config.container, config.tier_filter, config.target_tier,
        config.rehydrate_priority, config.window_start, config.window_end, auth,
        config.audit.directory, config.journal.path.empty() ? "(disabled)" : config.journal.path,
        config.max_parallel);
}

void print_help(std::ostream& out) {
    out << R"(
blobtier_migrate - Blob access tier migration

Usage: blobtier_migrate [OPTIONS]

Target:
  --account <name>              Storage account name
  --tenant <id>                 Directory (tenant) the session must use
  --subscription <id>           Subscription the session must use
  --container <name>            Container to migrate
  --connection-string <value>   Storage connection string
  --account-key <key>           Account key (SharedKey authorization)
  --sas-token <token>           SAS token
  --endpoint <url>              Blob endpoint override (e.g. Azurite)

Selection:
  --tier <tier>                 Current tier of the objects (default: Archive)
  --start <date>                Window start, ISO 8601 UTC (inclusive)
  --end <date>                  Window end, ISO 8601 UTC (inclusive)

Migration:
  --target <tier>               Target tier (default: Hot)
  --priority <Standard|High>    Rehydration priority (default: Standard)
  --max-parallel <n>            Tier changes in flight (default: 1)
  --yes, -y                     Do not prompt for confirmation

Output:
  --audit-dir <path>            Audit artifact directory (default: audit)
  --audit-prefix <prefix>       Audit file prefix (default: blobtier)
  --journal <path>              Run journal database; "" disables (default: blobtier.db)
  --log-dir <path>              Log directory (default: logs)
  --log-level <level>           trace, debug, info, warn, error, fatal, off
  --no-console                  Do not log to the console

Other:
  --config <file>               JSON configuration file
  --az-path <path>              Azure CLI executable (default: az)
  --help, -h                    Show this help message

Every option can also be set as BLOBTIER_<NAME>, e.g. BLOBTIER_ACCOUNT_NAME,
BLOBTIER_WINDOW_START. Flags override the environment, which overrides the
configuration file.

Exit status:
  0  completed, nothing to do, or declined
  1  fatal error
  2  usage or configuration error
  3  completed with per-object failures
  4  interrupted

)";
}

}  // namespace blobtier::config
