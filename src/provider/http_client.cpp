/**
 * @file http_client.cpp
 * @brief network_system implementation of http_client_interface
 */

#include <blobtier/provider/http_client.hpp>

#include <kcenon/network/core/http_client.h>

#include <algorithm>
#include <cctype>
#include <regex>

namespace blobtier::provider {

namespace {

auto equals_ignore_case(const std::string& a, const std::string& b) -> bool {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

auto convert_response(const kcenon::network::internal::http_response& resp)
    -> http_response {
    http_response result;
    result.status_code = resp.status_code;
    for (const auto& [key, value] : resp.headers) {
        result.headers[key] = value;
    }
    result.body.assign(resp.body.begin(), resp.body.end());
    return result;
}

}  // namespace

auto strip_query(const std::string& url) -> std::string {
    return url.substr(0, url.find('?'));
}

auto redact_signature(const std::string& text) -> std::string {
    static const std::regex signature(R"((^|[?&\s])sig=[^&\s]*)", std::regex::icase);
    return std::regex_replace(text, signature, "$1sig=<redacted>");
}

auto http_response::header(const std::string& name) const -> std::string {
    for (const auto& [key, value] : headers) {
        if (equals_ignore_case(key, name)) {
            return value;
        }
    }
    return {};
}

network_http_client::network_http_client(std::chrono::milliseconds timeout)
    : client_(std::make_shared<kcenon::network::core::http_client>(timeout)) {}

network_http_client::~network_http_client() = default;

auto network_http_client::get(const std::string& url,
                              const std::map<std::string, std::string>& headers)
    -> Result<http_response> {
    auto response = client_->get(url, {}, headers);
    if (response.is_err()) {
        return blobtier_error<http_response>(
            error_codes::provider_http_error,
            "HTTP GET " + strip_query(url) + " failed: " +
                redact_signature(response.error().message),
            "http_client");
    }
    return convert_response(response.value());
}

auto network_http_client::put(const std::string& url,
                              const std::string& body,
                              const std::map<std::string, std::string>& headers)
    -> Result<http_response> {
    auto response = client_->put(url, body, headers);
    if (response.is_err()) {
        return blobtier_error<http_response>(
            error_codes::provider_http_error,
            "HTTP PUT " + strip_query(url) + " failed: " +
                redact_signature(response.error().message),
            "http_client");
    }
    return convert_response(response.value());
}

}  // namespace blobtier::provider
