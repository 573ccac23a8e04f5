/**
 * @file tier_migration_runner_test.cpp
 * @brief End-to-end run scenarios against in-memory providers
 */

#include <blobtier/orchestrator/tier_migration_runner.hpp>

#include "../mocks/mock_blob_provider.hpp"
#include "../mocks/mock_session_provider.hpp"
#include "../mocks/test_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <fstream>

using namespace blobtier;
using namespace blobtier::orchestrator;
using blobtier::testing::make_context;
using blobtier::testing::make_raw_object;
using blobtier::testing::mock_blob_provider;
using blobtier::testing::mock_session_provider;
using blobtier::testing::temp_directory;

namespace {

/**
 * @brief A wired runner over mock providers
 *
 * The container holds three Archive objects inside the Q1 2024 window,
 * one Archive object after it and one Hot object inside it.
 */
struct pipeline {
    explicit pipeline(const std::filesystem::path& audit_dir,
                      std::optional<std::string> answer = std::string{"y"})
        : context(make_context(audit_dir)) {
        blobs = std::make_shared<mock_blob_provider>();
        blobs->add_object(make_raw_object("q1/a.bin", "Archive", "Wed, 10 Jan 2024 08:00:00 GMT"));
        blobs->add_object(make_raw_object("q1/b.bin", "Archive", "Thu, 15 Feb 2024 08:00:00 GMT"));
        blobs->add_object(make_raw_object("q2/late.bin", "Archive", "Mon, 15 Apr 2024 08:00:00 GMT"));
        blobs->add_object(make_raw_object("q1/hot.bin", "Hot", "Fri, 12 Jan 2024 08:00:00 GMT"));
        blobs->add_object(make_raw_object("q1/c.bin", "Archive", "Sun, 31 Mar 2024 23:59:59 GMT"));

        sessions = std::make_shared<mock_session_provider>();
        sessions->session = provider::session_info{"tenant-1", "sub-1", "operator@example.com"};

        source = std::make_shared<constant_confirmation_source>(std::move(answer));

        components.guard = std::make_shared<session_guard>(sessions);
        components.enumerator = std::make_shared<blob_enumerator>(blobs);
        components.filter = std::make_shared<tier_filter>();
        components.recorder = std::make_shared<audit_recorder>(
            audit_recorder_config{context.audit_directory, context.audit_prefix});
        components.gate = std::make_shared<confirmation_gate>(source);
        components.executor = std::make_shared<migration_executor>(blobs);
    }

    auto run() -> run_outcome {
        tier_migration_runner runner(components);
        return runner.run(context, token);
    }

    run_context context;
    std::shared_ptr<mock_blob_provider> blobs;
    std::shared_ptr<mock_session_provider> sessions;
    std::shared_ptr<constant_confirmation_source> source;
    runner_components components;
    kcenon::thread::cancellation_token token = kcenon::thread::cancellation_token::create();
};

auto artifact_count(const std::filesystem::path& dir) -> std::size_t {
    if (!std::filesystem::exists(dir)) {
        return 0;
    }
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().extension() == ".csv") {
            ++count;
        }
    }
    return count;
}

}  // namespace

TEST_CASE("confirmed run migrates every candidate", "[orchestrator][runner]") {
    temp_directory dir;
    pipeline p(dir.path / "audit");

    auto outcome = p.run();

    CHECK(outcome.status == run_status::completed);
    CHECK(outcome.exit_code() == 0);
    CHECK(outcome.discovered_count == 5);
    CHECK(outcome.candidate_count == 3);
    CHECK(outcome.migrated_count == 3);
    CHECK(outcome.failed_count == 0);
    CHECK(p.source->prompt_count() == 1);

    auto calls = p.blobs->calls();
    REQUIRE(calls.size() == 3);
    CHECK(calls[0].name == "q1/a.bin");
    CHECK(calls[1].name == "q1/b.bin");
    CHECK(calls[2].name == "q1/c.bin");
    CHECK(calls[0].tier == access_tier::hot);
    CHECK(calls[0].priority == rehydrate_priority::standard);

    REQUIRE(outcome.discovered_artifact.has_value());
    REQUIRE(outcome.migrated_artifact.has_value());
    CHECK_FALSE(outcome.failed_artifact.has_value());
    CHECK(std::filesystem::exists(*outcome.discovered_artifact));
    CHECK(std::filesystem::exists(*outcome.migrated_artifact));
    CHECK(artifact_count(p.context.audit_directory) == 2);
}

TEST_CASE("empty candidate set ends without prompting", "[orchestrator][runner]") {
    temp_directory dir;
    pipeline p(dir.path / "audit");
    p.context.criteria.start_time = blobtier::testing::at("2023-01-01T00:00:00Z");
    p.context.criteria.end_time = blobtier::testing::at("2023-12-31T23:59:59Z");

    auto outcome = p.run();

    CHECK(outcome.status == run_status::no_work);
    CHECK(outcome.phase == run_phase::filtering);
    CHECK(outcome.exit_code() == 0);
    CHECK(outcome.candidate_count == 0);
    CHECK(p.source->prompt_count() == 0);
    CHECK(p.blobs->calls().empty());
    CHECK(artifact_count(p.context.audit_directory) == 0);
}

TEST_CASE("declined confirmation mutates nothing", "[orchestrator][runner]") {
    temp_directory dir;
    pipeline p(dir.path / "audit", std::string{"n"});

    auto outcome = p.run();

    CHECK(outcome.status == run_status::declined);
    CHECK(outcome.exit_code() == 0);
    CHECK(outcome.candidate_count == 3);
    CHECK(outcome.migrated_count == 0);
    CHECK(p.blobs->calls().empty());
    REQUIRE(outcome.discovered_artifact.has_value());
    CHECK_FALSE(outcome.migrated_artifact.has_value());
    CHECK(artifact_count(p.context.audit_directory) == 1);
}

TEST_CASE("end of input at the prompt declines", "[orchestrator][runner]") {
    temp_directory dir;
    pipeline p(dir.path / "audit", std::nullopt);

    auto outcome = p.run();
    CHECK(outcome.status == run_status::declined);
    CHECK(p.blobs->calls().empty());
}

TEST_CASE("partial failure writes the failure ledger", "[orchestrator][runner]") {
    temp_directory dir;
    pipeline p(dir.path / "audit");
    p.blobs->fail_object("q1/b.bin");

    auto outcome = p.run();

    CHECK(outcome.status == run_status::completed_with_errors);
    CHECK(outcome.exit_code() == 3);
    CHECK(outcome.migrated_count == 2);
    CHECK(outcome.failed_count == 1);
    CHECK(p.blobs->calls().size() == 3);

    REQUIRE(outcome.failed_artifact.has_value());
    auto ledger = blobtier::testing::read_file_contents(*outcome.failed_artifact);
    CHECK(ledger.find("q1/b.bin") != std::string::npos);
    CHECK(ledger.find("BlobBeingRehydrated") != std::string::npos);

    auto migrated = blobtier::testing::read_file_contents(*outcome.migrated_artifact);
    CHECK(migrated.find("q1/a.bin") != std::string::npos);
    CHECK(migrated.find("q1/b.bin") == std::string::npos);
    CHECK(artifact_count(p.context.audit_directory) == 3);
}

TEST_CASE("cancellation before confirmation", "[orchestrator][runner]") {
    temp_directory dir;
    pipeline p(dir.path / "audit");
    p.token.cancel();

    auto outcome = p.run();

    CHECK(outcome.status == run_status::interrupted);
    CHECK(outcome.phase == run_phase::confirmation);
    CHECK(outcome.exit_code() == 4);
    CHECK(outcome.not_attempted_count == 3);
    CHECK(p.source->prompt_count() == 0);
    CHECK(p.blobs->calls().empty());
}

TEST_CASE("cancellation during migration", "[orchestrator][runner]") {
    temp_directory dir;
    pipeline p(dir.path / "audit");
    auto token = p.token;
    p.blobs->set_hook([token](const blobtier::testing::set_tier_call&) mutable {
        token.cancel();
    });

    auto outcome = p.run();

    CHECK(outcome.status == run_status::interrupted);
    CHECK(outcome.phase == run_phase::migration);
    CHECK(outcome.migrated_count == 1);
    CHECK(outcome.not_attempted_count == 2);
    CHECK(p.blobs->calls().size() == 1);
    REQUIRE(outcome.migrated_artifact.has_value());
    CHECK(std::filesystem::exists(*outcome.migrated_artifact));
}

TEST_CASE("session failure is fatal before enumeration", "[orchestrator][runner]") {
    temp_directory dir;
    pipeline p(dir.path / "audit");
    p.sessions->query_error = "az: command not found";

    auto outcome = p.run();

    CHECK(outcome.status == run_status::fatal);
    REQUIRE(outcome.kind.has_value());
    CHECK(*outcome.kind == fatal_kind::session_scope);
    CHECK(outcome.phase == run_phase::session);
    CHECK(outcome.exit_code() == 1);
    REQUIRE(outcome.error.has_value());
    CHECK(outcome.error->code == error_codes::session_scope_error);
    CHECK(p.blobs->list_calls() == 0);
}

TEST_CASE("enumeration failure is fatal before any prompt", "[orchestrator][runner]") {
    temp_directory dir;
    pipeline p(dir.path / "audit");
    p.blobs->set_list_error(error_codes::provider_http_error, "503 ServerBusy");

    auto outcome = p.run();

    CHECK(outcome.status == run_status::fatal);
    REQUIRE(outcome.kind.has_value());
    CHECK(*outcome.kind == fatal_kind::enumeration);
    CHECK(outcome.phase == run_phase::enumeration);
    CHECK(p.source->prompt_count() == 0);
    CHECK(p.blobs->calls().empty());
}

TEST_CASE("audit failure after mutation is fatal", "[orchestrator][runner]") {
    temp_directory dir;
    const auto blocker = dir.path / "blocked";
    {
        std::ofstream file(blocker);
        file << "x";
    }
    pipeline p(blocker / "audit");

    auto outcome = p.run();

    // Discovery audit is best effort, so the batch still runs
    CHECK(p.source->prompt_count() == 1);
    CHECK(p.blobs->calls().size() == 3);
    CHECK_FALSE(outcome.discovered_artifact.has_value());

    CHECK(outcome.status == run_status::fatal);
    REQUIRE(outcome.kind.has_value());
    CHECK(*outcome.kind == fatal_kind::audit_write);
    CHECK(outcome.phase == run_phase::migration_audit);
    CHECK(outcome.migrated_count == 3);
}

TEST_CASE("run journal records the run", "[orchestrator][runner][journal]") {
    temp_directory dir;
    pipeline p(dir.path / "audit");
    p.blobs->fail_object("q1/c.bin");

    auto journal = storage::run_journal::open(":memory:");
    REQUIRE(journal.is_ok());
    std::shared_ptr<storage::run_journal> shared = std::move(journal.value());
    p.components.journal = shared;

    auto outcome = p.run();
    REQUIRE(outcome.status == run_status::completed_with_errors);

    auto row = shared->find_run(1);
    REQUIRE(row.is_ok());
    REQUIRE(row.value().has_value());
    const auto& run = *row.value();
    CHECK(run.account == "acct");
    CHECK(run.container == "archive-data");
    CHECK(run.source_tier == "Archive");
    CHECK(run.target_tier == "Hot");
    CHECK(run.status == "completed_with_errors");
    CHECK(run.candidates == 3);
    CHECK(run.migrated == 2);
    CHECK(run.failed == 1);
    CHECK_FALSE(run.failed_artifact.empty());

    CHECK(shared->count_outcomes(1, "succeeded").value() == 2);
    CHECK(shared->count_outcomes(1, "failed").value() == 1);
    CHECK(shared->count_outcomes(1, "not_attempted").value() == 0);
}

TEST_CASE("runner rejects missing components", "[orchestrator][runner]") {
    temp_directory dir;
    pipeline p(dir.path / "audit");
    p.components.executor.reset();

    CHECK_THROWS_AS(tier_migration_runner(p.components), std::invalid_argument);
}
