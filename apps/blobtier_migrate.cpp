/**
 * @file blobtier_migrate.cpp
 * @brief Command-line entry point of the blob tier migration
 *
 * Wires the Azure collaborators, the audit recorder, the optional run
 * journal and the console confirmation prompt into a tier_migration_runner
 * and returns the run's exit status.
 */

#include <blobtier/config/run_config.hpp>
#include <blobtier/core/run_outcome.hpp>
#include <blobtier/di/ilogger.hpp>
#include <blobtier/integration/logger_adapter.hpp>
#include <blobtier/integration/signal_handler.hpp>
#include <blobtier/integration/thread_pool_adapter.hpp>
#include <blobtier/orchestrator/tier_migration_runner.hpp>
#include <blobtier/provider/azure_blob_provider.hpp>
#include <blobtier/provider/azure_cli_session.hpp>
#include <blobtier/provider/command_runner.hpp>
#include <blobtier/provider/http_client.hpp>
#include <blobtier/storage/run_journal.hpp>

#include <kcenon/thread/core/cancellation_token.h>

#include <exception>
#include <iostream>
#include <memory>

using namespace blobtier;

namespace {

void print_outcome(const run_outcome& outcome) {
    std::cout << "\n"
              << "Status:        " << to_string(outcome.status) << "\n"
              << "Discovered:    " << outcome.discovered_count << "\n"
              << "Candidates:    " << outcome.candidate_count << "\n"
              << "Migrated:      " << outcome.migrated_count << "\n"
              << "Failed:        " << outcome.failed_count << "\n"
              << "Not attempted: " << outcome.not_attempted_count << "\n";
    if (outcome.discovered_artifact) {
        std::cout << "Discovered audit: " << outcome.discovered_artifact->string() << "\n";
    }
    if (outcome.migrated_artifact) {
        std::cout << "Migrated audit:   " << outcome.migrated_artifact->string() << "\n";
    }
    if (outcome.failed_artifact) {
        std::cout << "Failed ledger:    " << outcome.failed_artifact->string() << "\n";
    }
    if (outcome.kind && outcome.error) {
        std::cerr << "Error: " << to_string(*outcome.kind) << ": " << outcome.error->message
                  << "\n";
    }
}

auto run_migration(const config::run_config& settings, const run_context& context) -> int {
    auto logger = std::make_shared<di::LoggerService>();
    logger->info_fmt("Configuration: {}", config::describe(settings));

    auto credentials = config::to_credentials(settings);
    if (credentials.is_err()) {
        std::cerr << "Error: " << credentials.error().message << "\n";
        return exit_codes::usage_error;
    }

    provider::azure_blob_provider_config provider_config;
    provider_config.credentials = credentials.value();
    auto blob_provider = std::make_shared<provider::azure_blob_provider>(
        provider_config, std::make_shared<provider::network_http_client>(), logger);

    auto session = std::make_shared<provider::azure_cli_session>(
        std::make_shared<provider::posix_command_runner>(), settings.az_path, logger);

    std::shared_ptr<orchestrator::confirmation_source> source;
    if (settings.assume_yes) {
        source = std::make_shared<orchestrator::constant_confirmation_source>("y");
    } else {
        source = std::make_shared<orchestrator::stream_confirmation_source>(std::cin, std::cout);
    }

    std::shared_ptr<integration::thread_pool_adapter> pool;
    std::shared_ptr<orchestrator::migration_executor> executor;
    if (settings.max_parallel > 1) {
        integration::thread_pool_config pool_config;
        pool_config.worker_count = settings.max_parallel;
        pool = std::make_shared<integration::thread_pool_adapter>(pool_config);
        executor = std::make_shared<orchestrator::migration_executor>(
            blob_provider, logger, pool, settings.max_parallel);
    } else {
        executor = std::make_shared<orchestrator::migration_executor>(blob_provider, logger);
    }
    executor->set_progress_callback([](const orchestrator::migration_progress& progress) {
        std::cout << "\r[" << progress.completed << "/" << progress.total << "] "
                  << (progress.succeeded ? "ok    " : "failed") << std::flush;
        if (progress.completed == progress.total) {
            std::cout << "\n";
        }
    });

    orchestrator::audit_recorder_config audit_config;
    audit_config.directory = context.audit_directory;
    audit_config.prefix = context.audit_prefix;

    orchestrator::runner_components components;
    components.guard = std::make_shared<orchestrator::session_guard>(session, logger);
    components.enumerator =
        std::make_shared<orchestrator::blob_enumerator>(blob_provider, logger);
    components.filter = std::make_shared<orchestrator::tier_filter>(logger);
    components.recorder = std::make_shared<orchestrator::audit_recorder>(audit_config, logger);
    components.gate = std::make_shared<orchestrator::confirmation_gate>(source, logger);
    components.executor = executor;

    if (!settings.journal.path.empty()) {
        auto journal = storage::run_journal::open(settings.journal.path);
        if (journal.is_ok()) {
            components.journal = std::shared_ptr<storage::run_journal>(
                std::move(journal.value()));
        } else {
            logger->warn_fmt("Run journal disabled: {}", journal.error().message);
        }
    }

    auto token = kcenon::thread::cancellation_token::create();
    // Runs on the signal watcher thread, not in signal context
    integration::scoped_signal_handler signals([token]() mutable {
        token.cancel();
        std::cerr << "\nCancellation requested; finishing the current object. "
                     "At the confirmation prompt press Enter to stop "
                     "(Ctrl+C again terminates)\n";
    });

    orchestrator::tier_migration_runner runner(components, logger);
    auto outcome = runner.run(context, token);

    if (pool) {
        pool->shutdown(true);
    }

    print_outcome(outcome);
    return outcome.exit_code();
}

}  // namespace

int main(int argc, char* argv[]) {
    auto settings = config::parse_args(argc, argv, config::process_environment());
    if (settings.is_err()) {
        std::cerr << "Error: " << settings.error().message << "\n";
        std::cerr << "Use --help for usage information\n";
        return exit_codes::usage_error;
    }
    if (settings.value().show_help) {
        config::print_help(std::cout);
        return exit_codes::success;
    }

    auto context = config::to_run_context(settings.value());
    if (context.is_err()) {
        std::cerr << "Error: " << context.error().message << "\n";
        return exit_codes::usage_error;
    }

    auto logger_config = config::to_logger_config(settings.value());
    if (logger_config.is_err()) {
        std::cerr << "Error: " << logger_config.error().message << "\n";
        return exit_codes::usage_error;
    }

    integration::logger_adapter::initialize(logger_config.value());

    int exit_code = exit_codes::fatal;
    try {
        exit_code = run_migration(settings.value(), context.value());
    } catch (const std::exception& e) {
        integration::logger_adapter::fatal("Unhandled error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << "\n";
    }

    integration::logger_adapter::shutdown();
    return exit_code;
}
