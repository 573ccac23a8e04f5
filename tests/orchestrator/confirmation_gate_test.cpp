/**
 * @file confirmation_gate_test.cpp
 * @brief Unit tests for the operator confirmation checkpoint
 */

#include <blobtier/orchestrator/confirmation_gate.hpp>

#include "../mocks/test_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>

using namespace blobtier;
using namespace blobtier::orchestrator;
using blobtier::testing::make_context;
using blobtier::testing::make_record;
using blobtier::testing::temp_directory;

namespace {

auto candidates() -> std::vector<blob_record> {
    return {make_record("a.bin", access_tier::archive, "2024-01-10T00:00:00Z"),
            make_record("b.bin", access_tier::archive, "2024-02-10T00:00:00Z")};
}

auto answer(const std::optional<std::string>& response) -> bool {
    temp_directory dir;
    auto source = std::make_shared<constant_confirmation_source>(response);
    confirmation_gate gate(source);
    auto token = kcenon::thread::cancellation_token::create();
    return gate.require_confirmation(candidates(), make_context(dir.path), std::nullopt, token);
}

}  // namespace

TEST_CASE("only exact allow-list answers proceed", "[orchestrator][confirmation_gate]") {
    CHECK(answer("y"));
    CHECK(answer("Y"));

    CHECK_FALSE(answer(""));
    CHECK_FALSE(answer("n"));
    CHECK_FALSE(answer("N"));
    CHECK_FALSE(answer("yes"));
    CHECK_FALSE(answer(" y"));
    CHECK_FALSE(answer("y "));
    CHECK_FALSE(answer("y\r"));
    CHECK_FALSE(answer(std::nullopt));
}

TEST_CASE("custom allow-list", "[orchestrator][confirmation_gate]") {
    temp_directory dir;
    auto source = std::make_shared<constant_confirmation_source>("MIGRATE");
    confirmation_gate gate(source, nullptr, {"MIGRATE"});
    auto token = kcenon::thread::cancellation_token::create();

    CHECK(gate.require_confirmation(candidates(), make_context(dir.path), std::nullopt, token));
}

TEST_CASE("cancelled token declines without prompting", "[orchestrator][confirmation_gate]") {
    temp_directory dir;
    auto source = std::make_shared<constant_confirmation_source>("y");
    confirmation_gate gate(source);
    auto token = kcenon::thread::cancellation_token::create();
    token.cancel();

    CHECK_FALSE(gate.require_confirmation(candidates(), make_context(dir.path), std::nullopt,
                                          token));
    CHECK(source->prompt_count() == 0);
}

TEST_CASE("summary names the run", "[orchestrator][confirmation_gate]") {
    temp_directory dir;
    auto context = make_context(dir.path);
    auto summary = confirmation_gate::build_summary(candidates(), context,
                                                    dir.path / "blobtier_discovered.csv");

    CHECK(summary.find("2 objects") != std::string::npos);
    CHECK(summary.find("acct") != std::string::npos);
    CHECK(summary.find("archive-data") != std::string::npos);
    CHECK(summary.find("Archive -> Hot") != std::string::npos);
    CHECK(summary.find("Standard") != std::string::npos);
    CHECK(summary.find("2048 bytes") != std::string::npos);
    CHECK(summary.find("blobtier_discovered.csv") != std::string::npos);
    CHECK(summary.find("[y/N]") != std::string::npos);
    CHECK(summary.find("After Ctrl+C, press Enter") != std::string::npos);

    auto without_audit = confirmation_gate::build_summary(candidates(), context, std::nullopt);
    CHECK(without_audit.find("(not written)") != std::string::npos);
}

TEST_CASE("stream source reads one line", "[orchestrator][confirmation_gate]") {
    std::istringstream in("y\nsecond line\n");
    std::ostringstream out;
    stream_confirmation_source source(in, out);

    source.present("Proceed? ");
    CHECK(out.str() == "Proceed? ");
    CHECK(source.read_response() == std::optional<std::string>{"y"});
    CHECK(source.read_response() == std::optional<std::string>{"second line"});
    CHECK_FALSE(source.read_response().has_value());
}

TEST_CASE("console gate end to end", "[orchestrator][confirmation_gate]") {
    temp_directory dir;
    std::istringstream in("Y\n");
    std::ostringstream out;
    confirmation_gate gate(std::make_shared<stream_confirmation_source>(in, out));
    auto token = kcenon::thread::cancellation_token::create();

    CHECK(gate.require_confirmation(candidates(), make_context(dir.path), std::nullopt, token));
    CHECK(out.str().find("Proceed?") != std::string::npos);
}
