/**
 * @file run_journal.cpp
 * @brief SQLite implementation of the run journal
 */

#include <blobtier/storage/run_journal.hpp>

#include <blobtier/compat/format.hpp>
#include <blobtier/core/timestamp.hpp>

#include <sqlite3.h>

#include <chrono>

namespace blobtier::storage {

namespace {

constexpr const char* kModule = "run_journal";

constexpr const char* kSchemaV1 = R"(
    CREATE TABLE IF NOT EXISTS runs (
        run_id              INTEGER PRIMARY KEY AUTOINCREMENT,
        started_at          TEXT NOT NULL,
        finished_at         TEXT,
        account             TEXT NOT NULL,
        tenant              TEXT NOT NULL,
        subscription        TEXT NOT NULL,
        container           TEXT NOT NULL,
        source_tier         TEXT NOT NULL,
        target_tier         TEXT NOT NULL,
        window_start        TEXT NOT NULL,
        window_end          TEXT NOT NULL,
        status              TEXT,
        fatal_kind          TEXT,
        phase               TEXT,
        discovered          INTEGER DEFAULT 0,
        candidates          INTEGER DEFAULT 0,
        migrated            INTEGER DEFAULT 0,
        failed              INTEGER DEFAULT 0,
        not_attempted       INTEGER DEFAULT 0,
        discovered_artifact TEXT,
        migrated_artifact   TEXT,
        failed_artifact     TEXT,
        error_message       TEXT
    );

    CREATE TABLE IF NOT EXISTS object_outcomes (
        id            INTEGER PRIMARY KEY AUTOINCREMENT,
        run_id        INTEGER NOT NULL REFERENCES runs(run_id) ON DELETE CASCADE,
        container     TEXT NOT NULL,
        name          TEXT NOT NULL,
        version_id    TEXT,
        from_tier     TEXT NOT NULL,
        to_tier       TEXT NOT NULL,
        outcome       TEXT NOT NULL,
        error_code    INTEGER,
        error_message TEXT,
        recorded_at   TEXT NOT NULL
    );

    CREATE INDEX IF NOT EXISTS idx_object_outcomes_run
        ON object_outcomes(run_id, outcome);
)";

[[nodiscard]] std::string get_text_column(sqlite3_stmt* stmt, int col) {
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text) : std::string();
}

[[nodiscard]] std::size_t get_count_column(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return 0;
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt, col));
}

void bind_optional_text(sqlite3_stmt* stmt, int idx, const std::optional<std::string>& value) {
    if (value.has_value()) {
        sqlite3_bind_text(stmt, idx, value->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

void bind_optional_path(sqlite3_stmt* stmt, int idx,
                        const std::optional<std::filesystem::path>& value) {
    bind_optional_text(stmt, idx,
                       value ? std::optional<std::string>{value->string()} : std::nullopt);
}

[[nodiscard]] std::string now_iso8601() {
    return format_iso8601(std::chrono::system_clock::now());
}

}  // namespace

// =============================================================================
// Construction / Destruction
// =============================================================================

auto run_journal::open(std::string_view db_path) -> Result<std::unique_ptr<run_journal>> {
    sqlite3* db = nullptr;

    auto rc = sqlite3_open(std::string(db_path).c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string error_msg = db ? sqlite3_errmsg(db) : "Failed to allocate memory";
        if (db) {
            sqlite3_close(db);
        }
        return blobtier_error<std::unique_ptr<run_journal>>(
            error_codes::journal_open_error,
            compat::format("Failed to open run journal {}: {}", db_path, error_msg),
            kModule);
    }

    auto instance = std::unique_ptr<run_journal>(new run_journal(db, std::string(db_path)));

    auto pragma = instance->exec("PRAGMA foreign_keys = ON;");
    if (pragma.is_err()) {
        return blobtier_error<std::unique_ptr<run_journal>>(
            error_codes::journal_open_error, pragma.error().message, kModule);
    }

    auto schema = instance->apply_schema();
    if (schema.is_err()) {
        return blobtier_error<std::unique_ptr<run_journal>>(
            error_codes::journal_open_error,
            compat::format("Failed to prepare run journal schema: {}",
                           schema.error().message),
            kModule);
    }

    return instance;
}

run_journal::run_journal(sqlite3* db, std::string path)
    : db_(db), path_(std::move(path)) {}

run_journal::~run_journal() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

auto run_journal::exec(const char* sql) -> VoidResult {
    char* err = nullptr;
    auto rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        return blobtier_void_error(error_codes::journal_write_error, message, kModule);
    }
    return ok();
}

auto run_journal::apply_schema() -> VoidResult {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, &stmt, nullptr) != SQLITE_OK) {
        return blobtier_void_error(error_codes::journal_query_error,
                                   sqlite3_errmsg(db_), kModule);
    }
    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        version = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);

    if (version >= schema_version) {
        return ok();
    }

    auto begin = exec("BEGIN TRANSACTION;");
    if (begin.is_err()) {
        return begin;
    }

    auto created = exec(kSchemaV1);
    if (created.is_err()) {
        (void)exec("ROLLBACK;");
        return created;
    }

    auto versioned = exec(compat::format("PRAGMA user_version = {};", schema_version).c_str());
    if (versioned.is_err()) {
        (void)exec("ROLLBACK;");
        return versioned;
    }

    return exec("COMMIT;");
}

// =============================================================================
// Writes
// =============================================================================

auto run_journal::begin_run(const run_context& context) -> Result<std::int64_t> {
    static constexpr const char* sql = R"(
        INSERT INTO runs (
            started_at, account, tenant, subscription, container,
            source_tier, target_tier, window_start, window_end
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return blobtier_error<std::int64_t>(
            error_codes::journal_write_error,
            "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)), kModule);
    }

    const auto started = now_iso8601();
    const std::string source_tier{to_string(context.criteria.tier)};
    const std::string target_tier{to_string(context.request.target_tier)};
    const auto window_start = format_iso8601(context.criteria.start_time);
    const auto window_end = format_iso8601(context.criteria.end_time);

    int idx = 1;
    sqlite3_bind_text(stmt, idx++, started.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, context.account.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, context.tenant.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, context.subscription.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, context.container.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, source_tier.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, target_tier.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, window_start.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, window_end.c_str(), -1, SQLITE_TRANSIENT);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return blobtier_error<std::int64_t>(
            error_codes::journal_write_error,
            "Failed to insert run: " + std::string(sqlite3_errmsg(db_)), kModule);
    }

    return static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_));
}

auto run_journal::record_outcomes(std::int64_t run_id,
                                  const migration_outcome& outcome,
                                  access_tier target_tier) -> VoidResult {
    static constexpr const char* sql = R"(
        INSERT INTO object_outcomes (
            run_id, container, name, version_id, from_tier, to_tier,
            outcome, error_code, error_message, recorded_at
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

    auto begin = exec("BEGIN TRANSACTION;");
    if (begin.is_err()) {
        return begin;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::string message = "Failed to prepare statement: " +
                              std::string(sqlite3_errmsg(db_));
        (void)exec("ROLLBACK;");
        return blobtier_void_error(error_codes::journal_write_error, message, kModule);
    }

    const auto recorded_at = now_iso8601();
    const std::string to_tier{to_string(target_tier)};

    auto insert = [&](const blob_record& record, const char* result,
                      const std::optional<error_info>& error) -> bool {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);

        const std::string from_tier{to_string(record.tier)};
        int idx = 1;
        sqlite3_bind_int64(stmt, idx++, run_id);
        sqlite3_bind_text(stmt, idx++, record.container.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, idx++, record.name.c_str(), -1, SQLITE_TRANSIENT);
        bind_optional_text(stmt, idx++, record.version_id);
        sqlite3_bind_text(stmt, idx++, from_tier.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, idx++, to_tier.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, idx++, result, -1, SQLITE_STATIC);
        if (error) {
            sqlite3_bind_int(stmt, idx++, error->code);
            sqlite3_bind_text(stmt, idx++, error->message.c_str(), -1, SQLITE_TRANSIENT);
        } else {
            sqlite3_bind_null(stmt, idx++);
            sqlite3_bind_null(stmt, idx++);
        }
        sqlite3_bind_text(stmt, idx++, recorded_at.c_str(), -1, SQLITE_TRANSIENT);

        return sqlite3_step(stmt) == SQLITE_DONE;
    };

    bool written = true;
    for (const auto& record : outcome.succeeded) {
        written = written && insert(record, "succeeded", std::nullopt);
    }
    for (const auto& failure : outcome.failed) {
        written = written && insert(failure.record, "failed", failure.error);
    }
    for (const auto& record : outcome.not_attempted) {
        written = written && insert(record, "not_attempted", std::nullopt);
    }

    sqlite3_finalize(stmt);

    if (!written) {
        std::string message = "Failed to record object outcomes: " +
                              std::string(sqlite3_errmsg(db_));
        (void)exec("ROLLBACK;");
        return blobtier_void_error(error_codes::journal_write_error, message, kModule);
    }

    return exec("COMMIT;");
}

auto run_journal::finish_run(std::int64_t run_id, const run_outcome& outcome) -> VoidResult {
    static constexpr const char* sql = R"(
        UPDATE runs SET
            finished_at = ?, status = ?, fatal_kind = ?, phase = ?,
            discovered = ?, candidates = ?, migrated = ?, failed = ?, not_attempted = ?,
            discovered_artifact = ?, migrated_artifact = ?, failed_artifact = ?,
            error_message = ?
        WHERE run_id = ?
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return blobtier_void_error(
            error_codes::journal_write_error,
            "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)), kModule);
    }

    const auto finished = now_iso8601();
    const std::string status{to_string(outcome.status)};
    const std::string phase{to_string(outcome.phase)};

    int idx = 1;
    sqlite3_bind_text(stmt, idx++, finished.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, status.c_str(), -1, SQLITE_TRANSIENT);
    bind_optional_text(stmt, idx++,
                       outcome.kind ? std::optional<std::string>{std::string{
                                          to_string(*outcome.kind)}}
                                    : std::nullopt);
    sqlite3_bind_text(stmt, idx++, phase.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, idx++, static_cast<std::int64_t>(outcome.discovered_count));
    sqlite3_bind_int64(stmt, idx++, static_cast<std::int64_t>(outcome.candidate_count));
    sqlite3_bind_int64(stmt, idx++, static_cast<std::int64_t>(outcome.migrated_count));
    sqlite3_bind_int64(stmt, idx++, static_cast<std::int64_t>(outcome.failed_count));
    sqlite3_bind_int64(stmt, idx++, static_cast<std::int64_t>(outcome.not_attempted_count));
    bind_optional_path(stmt, idx++, outcome.discovered_artifact);
    bind_optional_path(stmt, idx++, outcome.migrated_artifact);
    bind_optional_path(stmt, idx++, outcome.failed_artifact);
    bind_optional_text(stmt, idx++,
                       outcome.error ? std::optional<std::string>{outcome.error->message}
                                     : std::nullopt);
    sqlite3_bind_int64(stmt, idx++, run_id);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return blobtier_void_error(
            error_codes::journal_write_error,
            "Failed to finish run: " + std::string(sqlite3_errmsg(db_)), kModule);
    }
    if (sqlite3_changes(db_) == 0) {
        return blobtier_void_error(error_codes::journal_write_error,
                                   compat::format("Run {} does not exist", run_id),
                                   kModule);
    }
    return ok();
}

// =============================================================================
// Queries
// =============================================================================

auto run_journal::find_run(std::int64_t run_id) const -> Result<std::optional<journal_run>> {
    static constexpr const char* sql = R"(
        SELECT run_id, started_at, finished_at, account, container,
               source_tier, target_tier, status, fatal_kind, phase,
               discovered, candidates, migrated, failed, not_attempted,
               discovered_artifact, migrated_artifact, failed_artifact, error_message
        FROM runs WHERE run_id = ?
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return blobtier_error<std::optional<journal_run>>(
            error_codes::journal_query_error,
            "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)), kModule);
    }

    sqlite3_bind_int64(stmt, 1, run_id);

    std::optional<journal_run> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        journal_run row;
        int col = 0;
        row.run_id = sqlite3_column_int64(stmt, col++);
        row.started_at = get_text_column(stmt, col++);
        row.finished_at = get_text_column(stmt, col++);
        row.account = get_text_column(stmt, col++);
        row.container = get_text_column(stmt, col++);
        row.source_tier = get_text_column(stmt, col++);
        row.target_tier = get_text_column(stmt, col++);
        row.status = get_text_column(stmt, col++);
        row.fatal_kind = get_text_column(stmt, col++);
        row.phase = get_text_column(stmt, col++);
        row.discovered = get_count_column(stmt, col++);
        row.candidates = get_count_column(stmt, col++);
        row.migrated = get_count_column(stmt, col++);
        row.failed = get_count_column(stmt, col++);
        row.not_attempted = get_count_column(stmt, col++);
        row.discovered_artifact = get_text_column(stmt, col++);
        row.migrated_artifact = get_text_column(stmt, col++);
        row.failed_artifact = get_text_column(stmt, col++);
        row.error_message = get_text_column(stmt, col++);
        result = std::move(row);
    }

    sqlite3_finalize(stmt);
    return result;
}

auto run_journal::count_outcomes(std::int64_t run_id, std::string_view outcome) const
    -> Result<std::size_t> {
    static constexpr const char* sql =
        "SELECT COUNT(*) FROM object_outcomes WHERE run_id = ? AND outcome = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return blobtier_error<std::size_t>(
            error_codes::journal_query_error,
            "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)), kModule);
    }

    sqlite3_bind_int64(stmt, 1, run_id);
    sqlite3_bind_text(stmt, 2, outcome.data(), static_cast<int>(outcome.size()),
                      SQLITE_TRANSIENT);

    std::size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = get_count_column(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return count;
}

}  // namespace blobtier::storage
