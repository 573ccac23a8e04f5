/**
 * @file azure_blob_provider_test.cpp
 * @brief Unit tests for the Azure Blob REST provider
 */

#include <blobtier/provider/azure_blob_provider.hpp>

#include "../mocks/mock_http_client.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace blobtier;
using namespace blobtier::provider;
using blobtier::testing::mock_http_client;

namespace {

constexpr const char* kFirstPage = R"(<?xml version="1.0" encoding="utf-8"?>
<EnumerationResults ServiceEndpoint="https://acct.blob.core.windows.net/" ContainerName="archive-data">
  <Blobs>
    <Blob>
      <Name>q1/a&amp;b.bin</Name>
      <VersionId>2024-01-10T08:00:00.0000000Z</VersionId>
      <Properties>
        <Last-Modified>Wed, 10 Jan 2024 08:00:00 GMT</Last-Modified>
        <Etag>0x8DC1</Etag>
        <Content-Length>2048</Content-Length>
        <AccessTier>Archive</AccessTier>
        <ArchiveStatus>rehydrate-pending-to-hot</ArchiveStatus>
        <RehydratePriority>Standard</RehydratePriority>
      </Properties>
      <Tags><TagSet><Tag><Key>owner</Key><Value>finance</Value></Tag></TagSet></Tags>
    </Blob>
    <Blob>
      <Name>q1/hot.bin</Name>
      <Properties>
        <Last-Modified>Fri, 12 Jan 2024 08:00:00 GMT</Last-Modified>
        <Content-Length>10</Content-Length>
        <AccessTier>Hot</AccessTier>
      </Properties>
    </Blob>
  </Blobs>
  <NextMarker>page-2</NextMarker>
</EnumerationResults>)";

constexpr const char* kSecondPage = R"(<?xml version="1.0" encoding="utf-8"?>
<EnumerationResults>
  <Blobs>
    <Blob>
      <Name>q2/c.bin</Name>
      <Properties>
        <Last-Modified>Mon, 15 Apr 2024 08:00:00 GMT</Last-Modified>
        <Content-Length>1</Content-Length>
        <AccessTier>archive</AccessTier>
      </Properties>
    </Blob>
  </Blobs>
  <NextMarker />
</EnumerationResults>)";

auto shared_key_config() -> azure_blob_provider_config {
    azure_blob_provider_config config;
    config.credentials.account_name = "acct";
    config.credentials.account_key = "c2VjcmV0LWtleQ==";
    return config;
}

auto sas_config() -> azure_blob_provider_config {
    azure_blob_provider_config config;
    config.credentials.account_name = "acct";
    config.credentials.sas_token = "sv=2022-11-02&sig=abc";
    return config;
}

}  // namespace

TEST_CASE("parse_tier_predicate", "[provider][azure_blob_provider]") {
    auto archive = parse_tier_predicate("AccessTier eq 'Archive'");
    REQUIRE(archive.is_ok());
    CHECK(archive.value() == access_tier::archive);

    auto relaxed = parse_tier_predicate("  accesstier EQ 'cool' ");
    REQUIRE(relaxed.is_ok());
    CHECK(relaxed.value() == access_tier::cool);

    auto empty = parse_tier_predicate("");
    REQUIRE(empty.is_ok());
    CHECK_FALSE(empty.value().has_value());

    auto garbage = parse_tier_predicate("Name eq 'x'");
    REQUIRE(garbage.is_err());
    CHECK(garbage.error().code == error_codes::invalid_filter_expression);

    auto unknown = parse_tier_predicate("AccessTier eq 'Premium'");
    REQUIRE(unknown.is_err());
    CHECK(unknown.error().code == error_codes::invalid_filter_expression);
}

TEST_CASE("parse_list_blobs_page", "[provider][azure_blob_provider]") {
    std::string marker;
    auto parsed = parse_list_blobs_page(kFirstPage, marker);
    REQUIRE(parsed.is_ok());
    const auto& page = parsed.value();

    CHECK(marker == "page-2");
    REQUIRE(page.size() == 2);

    const auto& first = page[0];
    CHECK(first.name == "q1/a&b.bin");
    CHECK(first.version_id == std::optional<std::string>{"2024-01-10T08:00:00.0000000Z"});
    CHECK(first.access_tier == "Archive");
    CHECK(first.last_modified == "Wed, 10 Jan 2024 08:00:00 GMT");
    CHECK(first.content_length == "2048");
    CHECK(first.archive_status == "rehydrate-pending-to-hot");
    CHECK(first.rehydrate_priority == "Standard");
    CHECK(first.etag == "0x8DC1");
    CHECK(first.tags.at("owner") == "finance");
    CHECK_FALSE(first.is_current_version.has_value());

    CHECK_FALSE(page[1].version_id.has_value());

    std::string last_marker = "stale";
    REQUIRE(parse_list_blobs_page(kSecondPage, last_marker).is_ok());
    CHECK(last_marker.empty());
}

TEST_CASE("parse_list_blobs_page decodes blob names", "[provider][azure_blob_provider]") {
    constexpr const char* page_xml = R"(<?xml version="1.0" encoding="utf-8"?>
<EnumerationResults>
  <Blobs>
    <Blob>
      <Name Encoded="true">bad%EF%BF%BEname.bin</Name>
      <Properties><AccessTier>Archive</AccessTier></Properties>
    </Blob>
    <Blob>
      <Name>amp&#38;num&#x2F;x.bin</Name>
      <Properties><AccessTier>Archive</AccessTier></Properties>
    </Blob>
    <Blob>
      <Name Encoded="false">100%25.bin</Name>
      <Properties><AccessTier>Archive</AccessTier></Properties>
    </Blob>
  </Blobs>
  <NextMarker />
</EnumerationResults>)";

    std::string marker;
    auto parsed = parse_list_blobs_page(page_xml, marker);
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.value().size() == 3);
    CHECK(parsed.value()[0].name == "bad\xEF\xBF\xBEname.bin");
    CHECK(parsed.value()[1].name == "amp&num/x.bin");
    CHECK(parsed.value()[2].name == "100%25.bin");
}

TEST_CASE("parse_list_blobs_page rejects malformed bodies", "[provider][azure_blob_provider]") {
    std::string marker = "stale";

    auto truncated = parse_list_blobs_page("<EnumerationResults><Blobs><Blob>", marker);
    REQUIRE(truncated.is_err());
    CHECK(truncated.error().code == error_codes::provider_response_error);
    CHECK(marker.empty());

    auto foreign = parse_list_blobs_page("<Error><Code>X</Code></Error>", marker);
    REQUIRE(foreign.is_err());
    CHECK(foreign.error().code == error_codes::provider_response_error);
}

TEST_CASE("list_objects follows NextMarker and keeps the tier",
          "[provider][azure_blob_provider]") {
    auto http = std::make_shared<mock_http_client>();
    http->enqueue(200, kFirstPage);
    http->enqueue(200, kSecondPage);
    azure_blob_provider provider(shared_key_config(), http);

    auto listing = provider.list_objects("archive-data", "AccessTier eq 'Archive'");
    REQUIRE(listing.is_ok());
    REQUIRE(listing.value().size() == 2);
    CHECK(listing.value()[0].name == "q1/a&b.bin");
    CHECK(listing.value()[1].name == "q2/c.bin");

    auto requests = http->requests();
    REQUIRE(requests.size() == 2);
    CHECK(requests[0].method == "GET");
    CHECK(requests[0].url.starts_with("https://acct.blob.core.windows.net/archive-data?"));
    CHECK(requests[0].url.find("comp=list") != std::string::npos);
    CHECK(requests[0].url.find("restype=container") != std::string::npos);
    CHECK(requests[0].url.find("marker=") == std::string::npos);
    CHECK(requests[1].url.find("marker=page-2") != std::string::npos);

    CHECK(requests[0].headers.at("Authorization").starts_with("SharedKey acct:"));
    CHECK(requests[0].headers.count("x-ms-date") == 1);
    CHECK(requests[0].headers.at("x-ms-version") == "2021-12-02");
}

TEST_CASE("list_objects without predicate keeps everything",
          "[provider][azure_blob_provider]") {
    auto http = std::make_shared<mock_http_client>();
    http->enqueue(200, kSecondPage);
    azure_blob_provider provider(shared_key_config(), http);

    auto listing = provider.list_objects("archive-data", "");
    REQUIRE(listing.is_ok());
    CHECK(listing.value().size() == 1);
}

TEST_CASE("list_objects never returns a partial listing", "[provider][azure_blob_provider]") {
    auto http = std::make_shared<mock_http_client>();
    http->enqueue(200, kFirstPage);
    http->enqueue(503, "<Error><Code>ServerBusy</Code><Message>busy</Message></Error>");
    azure_blob_provider provider(shared_key_config(), http);

    auto listing = provider.list_objects("archive-data", "AccessTier eq 'Archive'");
    REQUIRE(listing.is_err());
    CHECK(listing.error().code == error_codes::provider_http_error);
    CHECK(listing.error().message.find("503 ServerBusy") != std::string::npos);
}

TEST_CASE("list_objects maps status codes", "[provider][azure_blob_provider]") {
    auto http = std::make_shared<mock_http_client>();
    azure_blob_provider provider(shared_key_config(), http);

    SECTION("forbidden") {
        http->enqueue(403, "", {{"x-ms-error-code", "AuthorizationFailure"}});
        auto listing = provider.list_objects("archive-data", "");
        REQUIRE(listing.is_err());
        CHECK(listing.error().code == error_codes::provider_auth_error);
        CHECK(listing.error().message.find("AuthorizationFailure") != std::string::npos);
    }

    SECTION("missing container") {
        http->enqueue(404, "<Error><Code>ContainerNotFound</Code></Error>");
        auto listing = provider.list_objects("nope", "");
        REQUIRE(listing.is_err());
        CHECK(listing.error().code == error_codes::object_not_found);
    }

    SECTION("transport failure") {
        auto listing = provider.list_objects("archive-data", "");
        REQUIRE(listing.is_err());
        CHECK(listing.error().code == error_codes::provider_http_error);
        CHECK(listing.error().message.find("connection refused") != std::string::npos);
    }

    SECTION("bad predicate is rejected before any request") {
        auto listing = provider.list_objects("archive-data", "Size gt 10");
        REQUIRE(listing.is_err());
        CHECK(listing.error().code == error_codes::invalid_filter_expression);
        CHECK(http->requests().empty());
    }
}

TEST_CASE("set_tier request shape", "[provider][azure_blob_provider]") {
    auto http = std::make_shared<mock_http_client>();
    http->enqueue(202);
    azure_blob_provider provider(shared_key_config(), http);

    auto result = provider.set_tier("archive-data", "q1/a b.bin", std::string{"v1"},
                                    access_tier::hot, rehydrate_priority::high);
    REQUIRE(result.is_ok());

    auto requests = http->requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].method == "PUT");
    CHECK(requests[0].url.starts_with(
        "https://acct.blob.core.windows.net/archive-data/q1/a%20b.bin?"));
    CHECK(requests[0].url.find("comp=tier") != std::string::npos);
    CHECK(requests[0].url.find("versionid=v1") != std::string::npos);
    CHECK(requests[0].headers.at("x-ms-access-tier") == "Hot");
    CHECK(requests[0].headers.at("x-ms-rehydrate-priority") == "High");
}

TEST_CASE("set_tier without priority or version", "[provider][azure_blob_provider]") {
    auto http = std::make_shared<mock_http_client>();
    http->enqueue(200);
    azure_blob_provider provider(sas_config(), http);

    REQUIRE(provider.set_tier("c", "x.bin", std::nullopt, access_tier::cool, std::nullopt)
                .is_ok());

    auto requests = http->requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].headers.count("x-ms-rehydrate-priority") == 0);
    CHECK(requests[0].headers.count("Authorization") == 0);
    CHECK(requests[0].url.find("versionid") == std::string::npos);
    CHECK(requests[0].url.ends_with("?comp=tier&sv=2022-11-02&sig=abc"));
}

TEST_CASE("set_tier rejection carries the provider error", "[provider][azure_blob_provider]") {
    auto http = std::make_shared<mock_http_client>();
    http->enqueue(409,
                  "<Error><Code>BlobBeingRehydrated</Code>"
                  "<Message>This operation is not permitted because the blob is being "
                  "rehydrated.\nRequestId:1</Message></Error>");
    azure_blob_provider provider(shared_key_config(), http);

    auto result = provider.set_tier("c", "x.bin", std::nullopt, access_tier::hot,
                                    rehydrate_priority::standard);
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::provider_http_error);
    CHECK(result.error().message.find("HTTP 409 BlobBeingRehydrated") != std::string::npos);
    CHECK(result.error().message.find("RequestId") == std::string::npos);
}

TEST_CASE("emulator endpoint keeps its path", "[provider][azure_blob_provider]") {
    auto config = shared_key_config();
    config.credentials.blob_endpoint = "http://127.0.0.1:10000/devstoreaccount1/";
    auto http = std::make_shared<mock_http_client>();
    http->enqueue(200);
    azure_blob_provider provider(config, http);

    CHECK(provider.endpoint() == "http://127.0.0.1:10000/devstoreaccount1");
    REQUIRE(provider.set_tier("c", "x", std::nullopt, access_tier::hot, std::nullopt).is_ok());
    CHECK(http->requests()[0].url.starts_with("http://127.0.0.1:10000/devstoreaccount1/c/x?"));
}

TEST_CASE("provider without secrets refuses to send", "[provider][azure_blob_provider]") {
    azure_blob_provider_config config;
    config.credentials.account_name = "acct";
    auto http = std::make_shared<mock_http_client>();
    azure_blob_provider provider(config, http);

    auto result = provider.set_tier("c", "x", std::nullopt, access_tier::hot, std::nullopt);
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::provider_auth_error);
    CHECK(http->requests().empty());
}

TEST_CASE("encoded names reach Set Blob Tier decoded once", "[provider][azure_blob_provider]") {
    auto http = std::make_shared<mock_http_client>();
    http->enqueue(200, R"(<EnumerationResults><Blobs><Blob>
        <Name Encoded="true">q1/odd%EF%BF%BE.bin</Name>
        <Properties><AccessTier>Archive</AccessTier></Properties>
      </Blob></Blobs><NextMarker/></EnumerationResults>)");
    http->enqueue(202);
    azure_blob_provider provider(shared_key_config(), http);

    auto listing = provider.list_objects("c", "AccessTier eq 'Archive'");
    REQUIRE(listing.is_ok());
    REQUIRE(listing.value().size() == 1);
    const auto& name = listing.value()[0].name;
    CHECK(name == "q1/odd\xEF\xBF\xBE.bin");

    REQUIRE(provider.set_tier("c", name, std::nullopt, access_tier::hot, std::nullopt).is_ok());
    CHECK(http->requests()[1].url.starts_with(
        "https://acct.blob.core.windows.net/c/q1/odd%EF%BF%BE.bin?"));
}

TEST_CASE("list_objects keeps current versions by default", "[provider][azure_blob_provider]") {
    constexpr const char* versioned_page = R"(<EnumerationResults><Blobs>
    <Blob>
      <Name>v.bin</Name>
      <VersionId>2024-01-01T00:00:00.0000000Z</VersionId>
      <IsCurrentVersion>false</IsCurrentVersion>
      <Properties><AccessTier>Archive</AccessTier></Properties>
    </Blob>
    <Blob>
      <Name>v.bin</Name>
      <VersionId>2024-02-01T00:00:00.0000000Z</VersionId>
      <IsCurrentVersion>true</IsCurrentVersion>
      <Properties><AccessTier>Archive</AccessTier></Properties>
    </Blob>
  </Blobs><NextMarker/></EnumerationResults>)";

    auto http = std::make_shared<mock_http_client>();
    http->enqueue(200, versioned_page);

    SECTION("default lists current versions only") {
        azure_blob_provider provider(shared_key_config(), http);
        CHECK_FALSE(azure_blob_provider_config{}.include_versions);

        auto listing = provider.list_objects("c", "AccessTier eq 'Archive'");
        REQUIRE(listing.is_ok());
        REQUIRE(listing.value().size() == 1);
        CHECK(listing.value()[0].version_id ==
              std::optional<std::string>{"2024-02-01T00:00:00.0000000Z"});
        CHECK(http->requests()[0].url.find("include=metadata%2Ctags&") != std::string::npos);
    }

    SECTION("previous versions on request") {
        auto config = shared_key_config();
        config.include_versions = true;
        azure_blob_provider provider(config, http);

        auto listing = provider.list_objects("c", "AccessTier eq 'Archive'");
        REQUIRE(listing.is_ok());
        CHECK(listing.value().size() == 2);
        CHECK(http->requests()[0].url.find("versions") != std::string::npos);
    }
}

TEST_CASE("transport failures never carry the SAS signature", "[provider][azure_blob_provider]") {
    auto config = sas_config();
    config.credentials.sas_token = "sv=2022-11-02&ss=b&sig=SECRETSIGNATURE";
    auto http = std::make_shared<mock_http_client>();
    http->fail_with("request to {url} timed out");
    azure_blob_provider provider(config, http);

    auto listing = provider.list_objects("c", "");
    REQUIRE(listing.is_err());
    CHECK(listing.error().message.find("SECRETSIGNATURE") == std::string::npos);
    CHECK(listing.error().message.find("sig=") == std::string::npos);
    CHECK(listing.error().message.find("timed out") != std::string::npos);

    auto tier = provider.set_tier("c", "a.bin", std::nullopt, access_tier::hot, std::nullopt);
    REQUIRE(tier.is_err());
    CHECK(tier.error().message.find("SECRETSIGNATURE") == std::string::npos);
    CHECK(tier.error().message.find("timed out") != std::string::npos);
}

TEST_CASE("URL and message scrubbing helpers", "[provider][http_client]") {
    CHECK(strip_query("https://acct.blob.core.windows.net/c/a.bin?comp=tier&sig=abc") ==
          "https://acct.blob.core.windows.net/c/a.bin");
    CHECK(strip_query("https://acct.blob.core.windows.net/c") ==
          "https://acct.blob.core.windows.net/c");

    CHECK(redact_signature("GET /c?sv=1&sig=abc%2Bdef&se=2 refused") ==
          "GET /c?sv=1&sig=<redacted>&se=2 refused");
    CHECK(redact_signature("sig=abc") == "sig=<redacted>");
    CHECK(redact_signature("design=ok") == "design=ok");
}
