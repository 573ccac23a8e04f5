/**
 * @file azure_auth.cpp
 * @brief Implementation of Azure Storage credentials and SharedKey signing
 */

#include <blobtier/provider/azure_auth.hpp>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace blobtier::provider {

namespace {

constexpr const char* kModule = "azure_auth";

auto get_openssl_error() -> std::string {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown error";
    }
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

auto trim_trailing_slash(std::string value) -> std::string {
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

}  // namespace

// =============================================================================
// Credentials
// =============================================================================

auto azure_credentials::resolve_blob_endpoint() const -> std::string {
    if (!blob_endpoint.empty()) {
        return trim_trailing_slash(blob_endpoint);
    }
    return protocol + "://" + account_name + ".blob." + endpoint_suffix;
}

auto parse_connection_string(std::string_view connection_string)
    -> Result<azure_credentials> {
    azure_credentials creds;

    std::size_t pos = 0;
    while (pos < connection_string.size()) {
        auto semi_pos = connection_string.find(';', pos);
        auto segment = connection_string.substr(
            pos, semi_pos == std::string_view::npos ? std::string_view::npos
                                                    : semi_pos - pos);
        pos = semi_pos == std::string_view::npos ? connection_string.size()
                                                 : semi_pos + 1;

        auto eq_pos = segment.find('=');
        if (segment.empty() || eq_pos == std::string_view::npos) {
            continue;
        }

        // Values such as base64 keys may themselves contain '='
        std::string key{segment.substr(0, eq_pos)};
        std::string value{segment.substr(eq_pos + 1)};

        if (key == "AccountName") {
            creds.account_name = value;
        } else if (key == "AccountKey") {
            creds.account_key = value;
        } else if (key == "EndpointSuffix") {
            creds.endpoint_suffix = value;
        } else if (key == "BlobEndpoint") {
            creds.blob_endpoint = value;
        } else if (key == "SharedAccessSignature") {
            creds.sas_token = value.starts_with('?') ? value.substr(1) : value;
        } else if (key == "DefaultEndpointsProtocol") {
            creds.protocol = value;
        }
    }

    if (creds.account_name.empty()) {
        return blobtier_error<azure_credentials>(
            error_codes::invalid_configuration,
            "Connection string does not name an account (AccountName)", kModule);
    }
    if (!creds.has_shared_key() && !creds.has_sas()) {
        return blobtier_error<azure_credentials>(
            error_codes::invalid_configuration,
            "Connection string carries neither AccountKey nor SharedAccessSignature",
            kModule);
    }

    return creds;
}

// =============================================================================
// Encoding Helpers
// =============================================================================

auto base64_encode(const std::vector<std::uint8_t>& data) -> std::string {
    if (data.empty()) {
        return {};
    }

    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

auto base64_decode(std::string_view encoded) -> Result<std::vector<std::uint8_t>> {
    if (encoded.empty()) {
        return std::vector<std::uint8_t>{};
    }
    if (encoded.size() % 4 != 0) {
        return blobtier_error<std::vector<std::uint8_t>>(
            error_codes::provider_auth_error,
            "Account key is not valid base64 (length is not a multiple of 4)", kModule);
    }

    std::vector<std::uint8_t> out(3 * (encoded.size() / 4));
    int decoded = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (decoded < 0) {
        return blobtier_error<std::vector<std::uint8_t>>(
            error_codes::provider_auth_error, "Account key is not valid base64", kModule);
    }

    // EVP_DecodeBlock counts the padding bytes as output
    std::size_t padding = 0;
    if (encoded.back() == '=') {
        ++padding;
        if (encoded[encoded.size() - 2] == '=') {
            ++padding;
        }
    }
    out.resize(static_cast<std::size_t>(decoded) - padding);
    return out;
}

auto hmac_sha256(const std::vector<std::uint8_t>& key, std::string_view data)
    -> Result<std::vector<std::uint8_t>> {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    auto* result = HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
                        reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                        digest, &digest_len);
    if (result == nullptr) {
        return blobtier_error<std::vector<std::uint8_t>>(
            error_codes::provider_auth_error,
            "HMAC-SHA256 failed: " + get_openssl_error(), kModule);
    }

    return std::vector<std::uint8_t>(digest, digest + digest_len);
}

auto url_encode(std::string_view value, bool keep_slash) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
            (keep_slash && c == '/')) {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

// =============================================================================
// SharedKey Signing
// =============================================================================

auto build_string_to_sign(const std::string& account_name,
                          const signing_request& request) -> std::string {
    auto get_header = [&request](const std::string& name) -> std::string {
        for (const auto& [key, value] : request.headers) {
            if (to_lower(key) == to_lower(name)) {
                return value;
            }
        }
        return {};
    };

    std::ostringstream string_to_sign;
    string_to_sign << request.method << "\n";
    string_to_sign << get_header("Content-Encoding") << "\n";
    string_to_sign << get_header("Content-Language") << "\n";
    string_to_sign << request.content_length << "\n";
    string_to_sign << get_header("Content-MD5") << "\n";
    string_to_sign << get_header("Content-Type") << "\n";
    string_to_sign << get_header("Date") << "\n";
    string_to_sign << get_header("If-Modified-Since") << "\n";
    string_to_sign << get_header("If-Match") << "\n";
    string_to_sign << get_header("If-None-Match") << "\n";
    string_to_sign << get_header("If-Unmodified-Since") << "\n";
    string_to_sign << get_header("Range") << "\n";

    // Canonicalized headers (x-ms-*), sorted by lowercase name
    std::map<std::string, std::string> ms_headers;
    for (const auto& [key, value] : request.headers) {
        auto lower_key = to_lower(key);
        if (lower_key.starts_with("x-ms-")) {
            ms_headers[lower_key] = value;
        }
    }
    for (const auto& [key, value] : ms_headers) {
        string_to_sign << key << ":" << value << "\n";
    }

    // Canonicalized resource
    string_to_sign << "/" << account_name << request.path;

    std::map<std::string, std::string> canonical_query;
    for (const auto& [key, value] : request.query) {
        canonical_query[to_lower(key)] = value;
    }
    for (const auto& [key, value] : canonical_query) {
        string_to_sign << "\n" << key << ":" << value;
    }

    return string_to_sign.str();
}

auto sign_shared_key(const azure_credentials& credentials,
                     const signing_request& request) -> Result<std::string> {
    auto key_bytes = base64_decode(credentials.account_key);
    if (key_bytes.is_err()) {
        return blobtier_error<std::string>(key_bytes.error().code,
                                           key_bytes.error().message, kModule);
    }

    auto string_to_sign = build_string_to_sign(credentials.account_name, request);
    auto signature = hmac_sha256(key_bytes.value(), string_to_sign);
    if (signature.is_err()) {
        return blobtier_error<std::string>(signature.error().code,
                                           signature.error().message, kModule);
    }

    return "SharedKey " + credentials.account_name + ":" +
           base64_encode(signature.value());
}

}  // namespace blobtier::provider
