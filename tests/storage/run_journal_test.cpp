/**
 * @file run_journal_test.cpp
 * @brief Unit tests for the SQLite run journal
 */

#include <blobtier/storage/run_journal.hpp>

#include "../mocks/test_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace blobtier;
using namespace blobtier::storage;
using blobtier::testing::make_context;
using blobtier::testing::make_record;
using blobtier::testing::temp_directory;

namespace {

auto mixed_outcome() -> migration_outcome {
    migration_outcome outcome;
    outcome.attempted = 3;
    outcome.succeeded = {make_record("a", access_tier::archive, "2024-01-10T00:00:00Z"),
                         make_record("b", access_tier::archive, "2024-01-11T00:00:00Z")};
    outcome.failed = {failed_migration{
        make_record("c", access_tier::archive, "2024-01-12T00:00:00Z"),
        error_info{error_codes::per_object_migration_error, "409", "migration_executor"}}};
    outcome.not_attempted = {make_record("d", access_tier::archive, "2024-01-13T00:00:00Z")};
    return outcome;
}

}  // namespace

TEST_CASE("journal records a run lifecycle", "[storage][run_journal]") {
    temp_directory dir;
    auto opened = run_journal::open(":memory:");
    REQUIRE(opened.is_ok());
    auto& journal = *opened.value();

    auto run_id = journal.begin_run(make_context(dir.path));
    REQUIRE(run_id.is_ok());
    CHECK(run_id.value() == 1);

    SECTION("unfinished run has no status") {
        auto row = journal.find_run(run_id.value());
        REQUIRE(row.is_ok());
        REQUIRE(row.value().has_value());
        CHECK(row.value()->status.empty());
        CHECK(row.value()->finished_at.empty());
        CHECK(row.value()->account == "acct");
        CHECK(row.value()->source_tier == "Archive");
        CHECK(row.value()->target_tier == "Hot");
    }

    SECTION("outcomes and final state") {
        REQUIRE(journal.record_outcomes(run_id.value(), mixed_outcome(), access_tier::hot)
                    .is_ok());

        run_outcome outcome;
        outcome.status = run_status::interrupted;
        outcome.phase = run_phase::migration;
        outcome.discovered_count = 6;
        outcome.candidate_count = 4;
        outcome.migrated_count = 2;
        outcome.failed_count = 1;
        outcome.not_attempted_count = 1;
        outcome.migrated_artifact = dir.path / "run_migrated.csv";
        REQUIRE(journal.finish_run(run_id.value(), outcome).is_ok());

        auto row = journal.find_run(run_id.value());
        REQUIRE(row.is_ok());
        REQUIRE(row.value().has_value());
        const auto& run = *row.value();
        CHECK(run.status == "interrupted");
        CHECK(run.phase == "migration");
        CHECK(run.fatal_kind.empty());
        CHECK_FALSE(run.finished_at.empty());
        CHECK(run.discovered == 6);
        CHECK(run.candidates == 4);
        CHECK(run.migrated == 2);
        CHECK(run.failed == 1);
        CHECK(run.not_attempted == 1);
        CHECK(run.migrated_artifact == (dir.path / "run_migrated.csv").string());
        CHECK(run.discovered_artifact.empty());

        CHECK(journal.count_outcomes(run_id.value(), "succeeded").value() == 2);
        CHECK(journal.count_outcomes(run_id.value(), "failed").value() == 1);
        CHECK(journal.count_outcomes(run_id.value(), "not_attempted").value() == 1);
    }
}

TEST_CASE("fatal run keeps kind and message", "[storage][run_journal]") {
    temp_directory dir;
    auto opened = run_journal::open(":memory:");
    REQUIRE(opened.is_ok());
    auto& journal = *opened.value();
    auto run_id = journal.begin_run(make_context(dir.path)).value();

    run_outcome outcome;
    outcome.status = run_status::fatal;
    outcome.kind = fatal_kind::enumeration;
    outcome.phase = run_phase::enumeration;
    outcome.error = error_info{error_codes::enumeration_error, "503 ServerBusy", "test"};
    REQUIRE(journal.finish_run(run_id, outcome).is_ok());

    auto run = journal.find_run(run_id).value();
    REQUIRE(run.has_value());
    CHECK(run->status == "fatal");
    CHECK(run->fatal_kind == "EnumerationError");
    CHECK(run->error_message == "503 ServerBusy");
}

TEST_CASE("unknown runs", "[storage][run_journal]") {
    auto opened = run_journal::open(":memory:");
    REQUIRE(opened.is_ok());
    auto& journal = *opened.value();

    auto missing = journal.find_run(42);
    REQUIRE(missing.is_ok());
    CHECK_FALSE(missing.value().has_value());

    auto finished = journal.finish_run(42, run_outcome{});
    REQUIRE(finished.is_err());
    CHECK(finished.error().code == error_codes::journal_write_error);

    auto orphan = journal.record_outcomes(42, mixed_outcome(), access_tier::hot);
    CHECK(orphan.is_err());
    CHECK(journal.count_outcomes(42, "succeeded").value() == 0);
}

TEST_CASE("journal persists across reopen", "[storage][run_journal]") {
    temp_directory dir;
    const auto db_path = (dir.path / "journal.db").string();

    std::int64_t run_id = 0;
    {
        auto opened = run_journal::open(db_path);
        REQUIRE(opened.is_ok());
        CHECK(opened.value()->path() == db_path);
        run_id = opened.value()->begin_run(make_context(dir.path)).value();
    }

    auto reopened = run_journal::open(db_path);
    REQUIRE(reopened.is_ok());
    auto row = reopened.value()->find_run(run_id);
    REQUIRE(row.is_ok());
    CHECK(row.value().has_value());

    auto second = reopened.value()->begin_run(make_context(dir.path));
    REQUIRE(second.is_ok());
    CHECK(second.value() == run_id + 1);
}

TEST_CASE("journal in a missing directory fails to open", "[storage][run_journal]") {
    temp_directory dir;
    auto opened = run_journal::open((dir.path / "missing" / "journal.db").string());
    REQUIRE(opened.is_err());
    CHECK(opened.error().code == error_codes::journal_open_error);
}
