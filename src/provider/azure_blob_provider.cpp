/**
 * @file azure_blob_provider.cpp
 * @brief Implementation of the Azure Blob REST provider
 */

#include <blobtier/provider/azure_blob_provider.hpp>

#include <blobtier/core/timestamp.hpp>

#include <pugixml.hpp>

#include <chrono>
#include <regex>
#include <sstream>
#include <string_view>

namespace blobtier::provider {

namespace {

constexpr const char* kModule = "azure_blob_provider";

// =============================================================================
// XML Helpers
// =============================================================================

auto load_xml(const std::string& xml, pugi::xml_document& doc) -> pugi::xml_parse_result {
    return doc.load_buffer(xml.data(), xml.size(), pugi::parse_default, pugi::encoding_utf8);
}

auto child_text(const pugi::xml_node& node, const char* name) -> std::string {
    return node.child(name).text().as_string();
}

auto optional_child_text(const pugi::xml_node& node, const char* name)
    -> std::optional<std::string> {
    auto child = node.child(name);
    if (!child) {
        return std::nullopt;
    }
    return std::string{child.text().as_string()};
}

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    return -1;
}

auto percent_decode(const std::string& text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int high = hex_value(text[i + 1]);
            const int low = hex_value(text[i + 2]);
            if (high >= 0 && low >= 0) {
                out.push_back(static_cast<char>((high << 4) | low));
                i += 2;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return out;
}

/**
 * @brief Blob name, percent-decoded when the service marks it Encoded
 *
 * Names holding characters that are invalid in XML are returned as
 * <Name Encoded="true"> with the UTF-8 bytes percent-encoded.
 */
auto blob_name(const pugi::xml_node& name_node) -> std::string {
    std::string name = name_node.text().as_string();
    if (name_node.attribute("Encoded").as_bool()) {
        return percent_decode(name);
    }
    return name;
}

auto parse_blob_element(const pugi::xml_node& blob) -> raw_object_metadata {
    raw_object_metadata meta;

    meta.name = blob_name(blob.child("Name"));
    meta.version_id = optional_child_text(blob, "VersionId");

    if (auto current = blob.child("IsCurrentVersion")) {
        meta.is_current_version = current.text().as_bool();
    }

    auto properties = blob.child("Properties");
    meta.access_tier = child_text(properties, "AccessTier");
    meta.last_modified = child_text(properties, "Last-Modified");
    meta.last_access_time = child_text(properties, "LastAccessTime");
    meta.content_length = child_text(properties, "Content-Length");
    meta.archive_status = child_text(properties, "ArchiveStatus");
    meta.rehydrate_priority = child_text(properties, "RehydratePriority");
    meta.etag = child_text(properties, "Etag");

    for (auto tag : blob.child("Tags").child("TagSet").children("Tag")) {
        auto key = tag.child("Key");
        if (key) {
            meta.tags[key.text().as_string()] = child_text(tag, "Value");
        }
    }

    return meta;
}

// =============================================================================
// Request Helpers
// =============================================================================

auto build_query_string(const std::map<std::string, std::string>& query) -> std::string {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : query) {
        oss << (first ? "?" : "&") << url_encode(key) << "=" << url_encode(value);
        first = false;
    }
    return oss.str();
}

auto describe_failure(const http_response& response) -> std::string {
    std::string detail = "HTTP " + std::to_string(response.status_code);

    pugi::xml_document doc;
    pugi::xml_node error;
    if (!response.body.empty() && load_xml(response.body, doc)) {
        error = doc.child("Error");
    }

    auto code = response.header("x-ms-error-code");
    if (code.empty()) {
        code = child_text(error, "Code");
    }
    if (!code.empty()) {
        detail += " " + code;
    }

    auto message = child_text(error, "Message");
    if (!message.empty()) {
        auto line_end = message.find('\n');
        detail += ": " + message.substr(0, line_end);
    }
    return detail;
}

/**
 * @brief Remove the SAS token and any signature value from a transport message
 */
auto redact_secrets(std::string message, const std::string& sas_token) -> std::string {
    constexpr std::string_view kRedacted = "<redacted>";
    if (!sas_token.empty()) {
        std::size_t pos = 0;
        while ((pos = message.find(sas_token, pos)) != std::string::npos) {
            message.replace(pos, sas_token.size(), kRedacted);
            pos += kRedacted.size();
        }
    }
    return redact_signature(message);
}

auto error_code_for_status(int status_code) -> int {
    switch (status_code) {
        case 401:
        case 403:
            return error_codes::provider_auth_error;
        case 404:
            return error_codes::object_not_found;
        default:
            return error_codes::provider_http_error;
    }
}

}  // namespace

// =============================================================================
// Free Functions
// =============================================================================

auto parse_tier_predicate(std::string_view filter_expr)
    -> Result<std::optional<access_tier>> {
    std::string expr{filter_expr};
    if (expr.find_first_not_of(" \t") == std::string::npos) {
        return std::optional<access_tier>{};
    }

    static const std::regex pattern(R"(^\s*AccessTier\s+eq\s+'([A-Za-z]+)'\s*$)",
                                    std::regex::icase);
    std::smatch match;
    if (!std::regex_match(expr, match, pattern)) {
        return blobtier_error<std::optional<access_tier>>(
            error_codes::invalid_filter_expression,
            "Unsupported filter expression: " + expr, kModule);
    }

    auto tier = access_tier_from_string(match[1].str());
    if (!tier) {
        return blobtier_error<std::optional<access_tier>>(
            error_codes::invalid_filter_expression,
            "Unknown tier in filter expression: " + match[1].str(), kModule);
    }
    return std::optional<access_tier>{*tier};
}

auto parse_list_blobs_page(const std::string& xml, std::string& next_marker)
    -> Result<std::vector<raw_object_metadata>> {
    next_marker.clear();

    pugi::xml_document doc;
    auto parsed = load_xml(xml, doc);
    if (!parsed) {
        return blobtier_error<std::vector<raw_object_metadata>>(
            error_codes::provider_response_error,
            std::string{"Malformed List Blobs response: "} + parsed.description() +
                " at offset " + std::to_string(parsed.offset),
            kModule);
    }

    auto results = doc.child("EnumerationResults");
    if (!results) {
        return blobtier_error<std::vector<raw_object_metadata>>(
            error_codes::provider_response_error,
            "List Blobs response has no EnumerationResults element", kModule);
    }

    std::vector<raw_object_metadata> page;
    for (auto blob : results.child("Blobs").children("Blob")) {
        page.push_back(parse_blob_element(blob));
    }
    next_marker = child_text(results, "NextMarker");
    return page;
}

// =============================================================================
// Construction
// =============================================================================

azure_blob_provider::azure_blob_provider(azure_blob_provider_config config,
                                         std::shared_ptr<http_client_interface> http_client,
                                         std::shared_ptr<di::ILogger> logger)
    : config_(std::move(config)),
      http_client_(std::move(http_client)),
      logger_(logger ? std::move(logger) : di::null_logger()),
      endpoint_(config_.credentials.resolve_blob_endpoint()) {
    auto scheme_end = endpoint_.find("://");
    auto authority_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    auto path_start = endpoint_.find('/', authority_start);
    if (path_start != std::string::npos) {
        base_path_ = endpoint_.substr(path_start);
    }
}

// =============================================================================
// blob_provider
// =============================================================================

auto azure_blob_provider::prepare_request(const std::string& method,
                                          const std::string& resource_path,
                                          const std::map<std::string, std::string>& query,
                                          std::map<std::string, std::string>& headers)
    -> Result<std::string> {
    headers["x-ms-version"] = config_.api_version;
    headers["x-ms-date"] = format_rfc1123(std::chrono::system_clock::now());

    auto url = endpoint_ + resource_path + build_query_string(query);

    if (config_.credentials.has_shared_key()) {
        signing_request request;
        request.method = method;
        request.path = base_path_ + resource_path;
        request.query = query;
        request.headers = headers;

        auto auth = sign_shared_key(config_.credentials, request);
        if (auth.is_err()) {
            return blobtier_error<std::string>(auth.error().code, auth.error().message,
                                               kModule);
        }
        headers["Authorization"] = auth.value();
    } else if (config_.credentials.has_sas()) {
        url += (query.empty() ? "?" : "&") + config_.credentials.sas_token;
    } else {
        return blobtier_error<std::string>(
            error_codes::provider_auth_error,
            "No account key or SAS token configured for " + config_.credentials.account_name,
            kModule);
    }

    return url;
}

auto azure_blob_provider::list_objects(const std::string& container,
                                       const std::string& filter_expr)
    -> Result<std::vector<raw_object_metadata>> {
    auto predicate = parse_tier_predicate(filter_expr);
    if (predicate.is_err()) {
        return blobtier_error<std::vector<raw_object_metadata>>(
            predicate.error().code, predicate.error().message, kModule);
    }
    const auto& wanted_tier = predicate.value();

    std::vector<raw_object_metadata> objects;
    std::string marker;
    std::size_t page_count = 0;

    do {
        std::map<std::string, std::string> query{
            {"restype", "container"},
            {"comp", "list"},
            {"include", config_.include_versions ? "metadata,tags,versions"
                                                 : "metadata,tags"},
            {"maxresults", std::to_string(config_.page_size)}};
        if (!marker.empty()) {
            query["marker"] = marker;
        }

        std::map<std::string, std::string> headers;
        auto url = prepare_request("GET", "/" + container, query, headers);
        if (url.is_err()) {
            return blobtier_error<std::vector<raw_object_metadata>>(
                url.error().code, url.error().message, kModule);
        }

        auto response = http_client_->get(url.value(), headers);
        if (response.is_err()) {
            return blobtier_error<std::vector<raw_object_metadata>>(
                response.error().code,
                "List Blobs on '" + container + "' failed: " +
                    redact_secrets(response.error().message,
                                   config_.credentials.sas_token),
                kModule);
        }
        if (response.value().status_code != 200) {
            return blobtier_error<std::vector<raw_object_metadata>>(
                error_code_for_status(response.value().status_code),
                "List Blobs on '" + container + "' failed: " +
                    describe_failure(response.value()),
                kModule);
        }

        auto page = parse_list_blobs_page(response.value().body, marker);
        if (page.is_err()) {
            return blobtier_error<std::vector<raw_object_metadata>>(
                page.error().code,
                "List Blobs on '" + container + "' failed: " + page.error().message,
                kModule);
        }
        ++page_count;

        std::size_t kept = 0;
        for (auto& meta : page.value()) {
            // Previous versions are only wanted when versions were asked for
            if (!config_.include_versions && meta.is_current_version == false) {
                continue;
            }
            if (wanted_tier) {
                auto tier = access_tier_from_string(meta.access_tier);
                if (!tier || *tier != *wanted_tier) {
                    continue;
                }
            }
            objects.push_back(std::move(meta));
            ++kept;
        }

        logger_->debug_fmt("List Blobs page {} of '{}': {} entries, {} kept",
                           page_count, container, page.value().size(), kept);
    } while (!marker.empty());

    return objects;
}

auto azure_blob_provider::set_tier(const std::string& container,
                                   const std::string& name,
                                   const std::optional<std::string>& version_id,
                                   access_tier tier,
                                   std::optional<rehydrate_priority> priority)
    -> VoidResult {
    std::map<std::string, std::string> query{{"comp", "tier"}};
    if (version_id) {
        query["versionid"] = *version_id;
    }

    std::map<std::string, std::string> headers;
    headers["x-ms-access-tier"] = std::string{to_string(tier)};
    if (priority) {
        headers["x-ms-rehydrate-priority"] = std::string{to_string(*priority)};
    }

    auto resource_path = "/" + container + "/" + url_encode(name, true);
    auto url = prepare_request("PUT", resource_path, query, headers);
    if (url.is_err()) {
        return blobtier_void_error(url.error().code, url.error().message, kModule);
    }

    auto response = http_client_->put(url.value(), "", headers);
    if (response.is_err()) {
        return blobtier_void_error(
            response.error().code,
            "Set Blob Tier on '" + container + "/" + name + "' failed: " +
                redact_secrets(response.error().message, config_.credentials.sas_token),
            kModule);
    }

    const auto status = response.value().status_code;
    if (status != 200 && status != 202) {
        return blobtier_void_error(
            error_code_for_status(status),
            "Set Blob Tier on '" + container + "/" + name + "' failed: " +
                describe_failure(response.value()),
            kModule);
    }

    return ok();
}

}  // namespace blobtier::provider
