/**
 * @file azure_auth_test.cpp
 * @brief Unit tests for credentials parsing and SharedKey signing
 */

#include <blobtier/provider/azure_auth.hpp>

#include <catch2/catch_test_macros.hpp>

#include <iomanip>
#include <sstream>

using namespace blobtier;
using namespace blobtier::provider;

namespace {

auto to_hex(const std::vector<std::uint8_t>& bytes) -> std::string {
    std::ostringstream oss;
    for (auto b : bytes) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return oss.str();
}

auto bytes(std::string_view text) -> std::vector<std::uint8_t> {
    return {text.begin(), text.end()};
}

}  // namespace

// =============================================================================
// Connection strings
// =============================================================================

TEST_CASE("parse_connection_string with account key", "[provider][azure_auth]") {
    auto creds = parse_connection_string(
        "DefaultEndpointsProtocol=https;AccountName=acct;"
        "AccountKey=a2V5MTIzNA==;EndpointSuffix=core.windows.net");
    REQUIRE(creds.is_ok());
    CHECK(creds.value().account_name == "acct");
    CHECK(creds.value().account_key == "a2V5MTIzNA==");
    CHECK(creds.value().has_shared_key());
    CHECK_FALSE(creds.value().has_sas());
    CHECK(creds.value().resolve_blob_endpoint() == "https://acct.blob.core.windows.net");
}

TEST_CASE("parse_connection_string with SAS and endpoint", "[provider][azure_auth]") {
    auto creds = parse_connection_string(
        "BlobEndpoint=http://127.0.0.1:10000/devstoreaccount1/;"
        "AccountName=devstoreaccount1;SharedAccessSignature=?sv=2022-11-02&sig=abc%3D");
    REQUIRE(creds.is_ok());
    CHECK(creds.value().sas_token == "sv=2022-11-02&sig=abc%3D");
    CHECK(creds.value().resolve_blob_endpoint() == "http://127.0.0.1:10000/devstoreaccount1");
}

TEST_CASE("parse_connection_string rejects incomplete input", "[provider][azure_auth]") {
    auto no_name = parse_connection_string("AccountKey=a2V5MTIzNA==");
    REQUIRE(no_name.is_err());
    CHECK(no_name.error().code == error_codes::invalid_configuration);

    auto no_secret = parse_connection_string("AccountName=acct;EndpointSuffix=x");
    REQUIRE(no_secret.is_err());
    CHECK(no_secret.error().code == error_codes::invalid_configuration);

    CHECK(parse_connection_string("").is_err());
}

TEST_CASE("endpoint honours protocol and suffix", "[provider][azure_auth]") {
    azure_credentials creds;
    creds.account_name = "acct";
    creds.protocol = "http";
    creds.endpoint_suffix = "core.chinacloudapi.cn";
    CHECK(creds.resolve_blob_endpoint() == "http://acct.blob.core.chinacloudapi.cn");
}

// =============================================================================
// Encoding helpers
// =============================================================================

TEST_CASE("base64 encode and decode", "[provider][azure_auth]") {
    CHECK(base64_encode(bytes("f")) == "Zg==");
    CHECK(base64_encode(bytes("fo")) == "Zm8=");
    CHECK(base64_encode(bytes("foo")) == "Zm9v");
    CHECK(base64_encode({}).empty());

    auto decoded = base64_decode("Zm9vYg==");
    REQUIRE(decoded.is_ok());
    CHECK(decoded.value() == bytes("foob"));

    auto bad = base64_decode("abc");
    REQUIRE(bad.is_err());
    CHECK(bad.error().code == error_codes::provider_auth_error);
}

TEST_CASE("hmac_sha256 matches RFC 4231", "[provider][azure_auth]") {
    auto mac = hmac_sha256(bytes("Jefe"), "what do ya want for nothing?");
    REQUIRE(mac.is_ok());
    CHECK(to_hex(mac.value()) ==
          "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST_CASE("url_encode", "[provider][azure_auth]") {
    CHECK(url_encode("AccessTier eq 'Archive'") == "AccessTier%20eq%20%27Archive%27");
    CHECK(url_encode("a/b c.txt") == "a%2Fb%20c.txt");
    CHECK(url_encode("a/b c.txt", true) == "a/b%20c.txt");
    CHECK(url_encode("~-_.") == "~-_.");
}

// =============================================================================
// SharedKey
// =============================================================================

TEST_CASE("string to sign layout", "[provider][azure_auth]") {
    signing_request request;
    request.method = "PUT";
    request.path = "/archive-data/q1/a.bin";
    request.query = {{"comp", "tier"}};
    request.headers = {{"x-ms-date", "Wed, 10 Apr 2024 10:15:30 GMT"},
                       {"x-ms-version", "2023-11-03"},
                       {"x-ms-access-tier", "Hot"},
                       {"X-MS-Rehydrate-Priority", "High"}};
    request.content_length = "";

    auto expected = std::string{"PUT\n\n\n\n\n\n\n\n\n\n\n\n"} +
                    "x-ms-access-tier:Hot\n"
                    "x-ms-date:Wed, 10 Apr 2024 10:15:30 GMT\n"
                    "x-ms-rehydrate-priority:High\n"
                    "x-ms-version:2023-11-03\n"
                    "/acct/archive-data/q1/a.bin\n"
                    "comp:tier";
    CHECK(build_string_to_sign("acct", request) == expected);
}

TEST_CASE("listing query parameters are canonicalized in order", "[provider][azure_auth]") {
    signing_request request;
    request.method = "GET";
    request.path = "/archive-data";
    request.query = {{"restype", "container"}, {"comp", "list"}, {"marker", "m1"}};
    request.headers = {{"x-ms-date", "d"}, {"x-ms-version", "v"}};

    auto sts = build_string_to_sign("acct", request);
    CHECK(sts.ends_with("/acct/archive-data\ncomp:list\nmarker:m1\nrestype:container"));
}

TEST_CASE("sign_shared_key", "[provider][azure_auth]") {
    azure_credentials creds;
    creds.account_name = "acct";
    creds.account_key = base64_encode(bytes("secret-key"));

    signing_request request;
    request.method = "GET";
    request.path = "/c";
    request.headers = {{"x-ms-date", "d"}, {"x-ms-version", "v"}};

    auto header = sign_shared_key(creds, request);
    REQUIRE(header.is_ok());

    auto expected_mac = hmac_sha256(bytes("secret-key"), build_string_to_sign("acct", request));
    REQUIRE(expected_mac.is_ok());
    CHECK(header.value() == "SharedKey acct:" + base64_encode(expected_mac.value()));

    SECTION("undecodable key is an auth error") {
        creds.account_key = "not base64";
        auto bad = sign_shared_key(creds, request);
        REQUIRE(bad.is_err());
        CHECK(bad.error().code == error_codes::provider_auth_error);
    }
}
