/**
 * @file audit_recorder.cpp
 * @brief Implementation of the CSV audit recorder
 */

#include <blobtier/orchestrator/audit_recorder.hpp>

#include <fstream>
#include <sstream>
#include <system_error>

namespace blobtier::orchestrator {

namespace {

constexpr const char* kModule = "audit_recorder";

constexpr const char* kRecordHeader =
    "container,name,version_id,tier,last_modified,last_accessed,"
    "content_length,rehydration_status,etag,tags";

auto format_tags(const std::map<std::string, std::string>& tags) -> std::string {
    std::string out;
    for (const auto& [key, value] : tags) {
        if (!out.empty()) {
            out += ';';
        }
        out += key + "=" + value;
    }
    return out;
}

void append_record_fields(std::ostringstream& row, const blob_record& record) {
    row << csv_escape(record.container) << ','
        << csv_escape(record.name) << ','
        << csv_escape(record.version_id.value_or("")) << ','
        << to_string(record.tier) << ','
        << csv_escape(record.last_modified ? format_iso8601(*record.last_modified)
                                           : record.last_modified_raw)
        << ','
        << (record.last_accessed ? format_iso8601(*record.last_accessed) : "") << ','
        << record.content_length << ','
        << to_string(record.rehydration) << ','
        << csv_escape(record.etag) << ','
        << csv_escape(format_tags(record.tags));
}

auto write_error(const std::string& message) -> Result<audit_batch> {
    return blobtier_error<audit_batch>(error_codes::audit_write_error, message, kModule);
}

}  // namespace

auto csv_escape(std::string_view field) -> std::string {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string{field};
    }

    std::string quoted;
    quoted.reserve(field.size() + 2);
    quoted.push_back('"');
    for (char c : field) {
        if (c == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

audit_recorder::audit_recorder(audit_recorder_config config,
                               std::shared_ptr<di::ILogger> logger,
                               clock_function clock)
    : config_(std::move(config)),
      logger_(logger ? std::move(logger) : di::null_logger()),
      clock_(clock ? std::move(clock)
                   : clock_function([] { return std::chrono::system_clock::now(); })) {}

auto audit_recorder::next_stamp() -> timestamp {
    auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(clock_());
    timestamp stamp = now;
    if (last_stamp_ && stamp <= *last_stamp_) {
        stamp = *last_stamp_ + std::chrono::milliseconds(1);
    }
    last_stamp_ = stamp;
    return stamp;
}

auto audit_recorder::record(audit_phase phase, const std::vector<blob_record>& records)
    -> Result<audit_batch> {
    std::ostringstream content;
    content << kRecordHeader << "\r\n";
    for (const auto& record : records) {
        append_record_fields(content, record);
        content << "\r\n";
    }

    return write_artifact(phase, content.str(), records.size());
}

auto audit_recorder::record_failures(const std::vector<failed_migration>& failures)
    -> Result<audit_batch> {
    std::ostringstream content;
    content << kRecordHeader << ",error_code,error_message\r\n";
    for (const auto& failure : failures) {
        append_record_fields(content, failure.record);
        content << ',' << failure.error.code << ','
                << csv_escape(failure.error.message) << "\r\n";
    }

    return write_artifact(audit_phase::failed, content.str(), failures.size());
}

auto audit_recorder::write_artifact(audit_phase phase,
                                    const std::string& content,
                                    std::size_t record_count) -> Result<audit_batch> {
    std::lock_guard lock(mutex_);

    std::error_code ec;
    std::filesystem::create_directories(config_.directory, ec);
    if (ec) {
        return write_error("Cannot create audit directory " + config_.directory.string() +
                           ": " + ec.message());
    }

    audit_batch batch;
    batch.phase = phase;
    batch.created_at = next_stamp();
    batch.record_count = record_count;
    batch.path = config_.directory /
                 (config_.prefix + "_" + std::string{to_string(phase)} + "_" +
                  format_file_stamp(batch.created_at) + ".csv");

    if (std::filesystem::exists(batch.path, ec)) {
        return write_error("Audit artifact already exists: " + batch.path.string());
    }

    auto temp_path = batch.path;
    temp_path += ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return write_error("Cannot open " + temp_path.string() + " for writing");
        }
        file << content;
        file.flush();
        if (!file) {
            file.close();
            std::filesystem::remove(temp_path, ec);
            return write_error("Failed writing audit artifact " + batch.path.string());
        }
    }

    if (std::filesystem::exists(batch.path, ec)) {
        std::filesystem::remove(temp_path, ec);
        return write_error("Audit artifact already exists: " + batch.path.string());
    }

    std::filesystem::rename(temp_path, batch.path, ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(temp_path, cleanup);
        return write_error("Cannot finalize audit artifact " + batch.path.string() + ": " +
                           ec.message());
    }

    logger_->info_fmt("Audit batch '{}' with {} records written to {}", to_string(phase),
                      record_count, batch.path.string());
    return batch;
}

}  // namespace blobtier::orchestrator
