#include <catch2/catch_test_macros.hpp>
#include "auth/token_extractor.hpp"

using namespace authguard;

namespace {

AuthHeader bearer_template() {
    auto header = AuthHeader::create("Authorization", "Bearer {token}");
    REQUIRE(header.has_value());
    return *header;
}

} // anonymous namespace

// ============================================================================
// Header extraction
// ============================================================================

TEST_CASE("Extract header: inner token returned", "[auth][extract]") {
    HeaderMap headers;
    headers.emplace("API-Key", "12345");
    headers.emplace("Authorization", "Bearer abc.def.ghi");

    const auto token = extract_from_header(bearer_template(), headers);
    REQUIRE(token.is_ok());
    CHECK(token.value() == "abc.def.ghi");
}

TEST_CASE("Extract header: missing field", "[auth][extract]") {
    const auto token = extract_from_header(bearer_template(), HeaderMap{});
    REQUIRE(token.is_error());
    CHECK(token.error_category() == ErrorCategory::MISSING_FIELD);
    CHECK(token.error_message().find("Authorization") != std::string::npos);
}

TEST_CASE("Extract header: field name is case-insensitive", "[auth][extract]") {
    HeaderMap headers;
    headers.emplace("authorization", "Bearer t0k3n");

    const auto token = extract_from_header(bearer_template(), headers);
    REQUIRE(token.is_ok());
    CHECK(token.value() == "t0k3n");
}

TEST_CASE("Extract header: identical repeated headers accepted", "[auth][extract]") {
    HeaderMap headers;
    headers.emplace("Authorization", "Bearer same");
    headers.emplace("authorization", "Bearer same");

    const auto token = extract_from_header(bearer_template(), headers);
    REQUIRE(token.is_ok());
    CHECK(token.value() == "same");
}

TEST_CASE("Extract header: conflicting repeated headers are malformed", "[auth][extract]") {
    HeaderMap headers;
    headers.emplace("Authorization", "Bearer first");
    headers.emplace("Authorization", "Bearer second");

    const auto token = extract_from_header(bearer_template(), headers);
    REQUIRE(token.is_error());
    CHECK(token.error_category() == ErrorCategory::MALFORMED);
    CHECK(token.error_message().find("repeated") != std::string::npos);
}

TEST_CASE("Extract header: absent prefix leaves value untouched", "[auth][extract]") {
    HeaderMap headers;
    headers.emplace("Authorization", "Token xyz");

    const auto token = extract_from_header(bearer_template(), headers);
    REQUIRE(token.is_ok());
    CHECK(token.value() == "Token xyz");
}

TEST_CASE("Extract header: repeated prefix is stripped", "[auth][extract]") {
    HeaderMap headers;
    headers.emplace("Authorization", "Bearer Bearer xyz");

    const auto token = extract_from_header(bearer_template(), headers);
    REQUIRE(token.is_ok());
    CHECK(token.value() == "xyz");
}

TEST_CASE("Extract header: prefix and suffix stripped", "[auth][extract]") {
    const auto tmpl = AuthHeader::create("X-Auth", "Key<{token}>");
    REQUIRE(tmpl.has_value());

    HeaderMap headers;
    headers.emplace("X-Auth", "Key<secret-value>");

    const auto token = extract_from_header(*tmpl, headers);
    REQUIRE(token.is_ok());
    CHECK(token.value() == "secret-value");
}

TEST_CASE("Extract header: non-text value is malformed", "[auth][extract]") {
    HeaderMap headers;
    headers.emplace("Authorization", std::string("Bearer \xff\xfe", 9));

    const auto token = extract_from_header(bearer_template(), headers);
    REQUIRE(token.is_error());
    CHECK(token.error_category() == ErrorCategory::MALFORMED);
}

// ============================================================================
// Frame extraction
// ============================================================================

TEST_CASE("Extract frame: string field returned", "[auth][extract]") {
    const auto frame = nlohmann::json{{"token", "abc"}, {"other", 1}};
    const auto token = extract_from_frame("token", frame);
    REQUIRE(token.is_ok());
    CHECK(token.value() == "abc");
}

TEST_CASE("Extract frame: non-object frame is invalid shape", "[auth][extract]") {
    for (const auto& frame : {nlohmann::json::array({1, 2}), nlohmann::json("token"),
                              nlohmann::json(42), nlohmann::json(nullptr)}) {
        const auto token = extract_from_frame("token", frame);
        REQUIRE(token.is_error());
        CHECK(token.error_category() == ErrorCategory::INVALID_REQUEST_SHAPE);
    }
}

TEST_CASE("Extract frame: missing field", "[auth][extract]") {
    const auto token = extract_from_frame("token", nlohmann::json{{"other", "x"}});
    REQUIRE(token.is_error());
    CHECK(token.error_category() == ErrorCategory::MISSING_FIELD);
}

TEST_CASE("Extract frame: non-string field is malformed", "[auth][extract]") {
    const auto token = extract_from_frame("token", nlohmann::json{{"token", 123}});
    REQUIRE(token.is_error());
    CHECK(token.error_category() == ErrorCategory::MALFORMED);
}
