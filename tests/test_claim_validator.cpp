#include <catch2/catch_test_macros.hpp>
#include "auth/claim_validator.hpp"
#include "mocks/token_factory.hpp"

using namespace authguard;
using authguard::testing::create_test_jwt;
using authguard::testing::kJwtSecret;

namespace {

constexpr int64_t kNow = 1'700'000'000;

std::string token_with(const std::string& claims) {
    return create_test_jwt(claims, kJwtSecret);
}

} // anonymous namespace

// ============================================================================
// Signature-only (disable_all)
// ============================================================================

TEST_CASE("ClaimCode: disable_all accepts matching signature", "[auth][jwt]") {
    const auto token = token_with(R"({"sub":"alice"})");
    CHECK(ClaimCode::disable_all().validate(kJwtSecret, token, kNow).is_ok());
}

TEST_CASE("ClaimCode: disable_all ignores expired token", "[auth][jwt]") {
    const auto token = token_with(R"({"sub":"alice","exp":1000,"nbf":9999999999})");
    CHECK(ClaimCode::disable_all().validate(kJwtSecret, token, kNow).is_ok());
}

TEST_CASE("ClaimCode: wrong secret is invalid signature", "[auth][jwt]") {
    const auto token = token_with(R"({"sub":"alice"})");
    const auto status = ClaimCode::disable_all().validate("other-secret", token, kNow);
    REQUIRE(status.is_error());
    CHECK(status.error_category() == ErrorCategory::INVALID_SIGNATURE);
}

TEST_CASE("ClaimCode: tampered claims segment fails signature", "[auth][jwt]") {
    const auto token = token_with(R"({"sub":"alice"})");
    const auto forged = token_with(R"({"sub":"admin"})");

    // forged claims with the original signature
    const std::string spliced = forged.substr(0, forged.rfind('.')) + token.substr(token.rfind('.'));

    const auto status = ClaimCode::disable_all().validate(kJwtSecret, spliced, kNow);
    REQUIRE(status.is_error());
    CHECK(status.error_category() == ErrorCategory::INVALID_SIGNATURE);
}

TEST_CASE("ClaimCode: HS384 and HS512 verify", "[auth][jwt]") {
    for (const std::string alg : {"HS384", "HS512"}) {
        const auto token = create_test_jwt(R"({"sub":"alice"})", kJwtSecret, alg);
        CHECK(ClaimCode::disable_all().validate(kJwtSecret, token, kNow).is_ok());
    }
}

TEST_CASE("ClaimCode: unsupported alg is malformed", "[auth][jwt]") {
    const auto token = create_test_jwt(R"({"sub":"alice"})", kJwtSecret, "none");
    const auto status = ClaimCode::disable_all().validate(kJwtSecret, token, kNow);
    REQUIRE(status.is_error());
    CHECK(status.error_category() == ErrorCategory::MALFORMED);
}

TEST_CASE("ClaimCode: structurally broken tokens are malformed", "[auth][jwt]") {
    for (const std::string bad : {"", "abc", "abc.def", "a.b.c.d", "!!!.###.$$$"}) {
        const auto status = ClaimCode::disable_all().validate(kJwtSecret, bad, kNow);
        REQUIRE(status.is_error());
        CHECK(status.error_category() == ErrorCategory::MALFORMED);
    }
}

// ============================================================================
// Selected claims
// ============================================================================

TEST_CASE("ClaimCode: exp enforced when selected", "[auth][jwt]") {
    const auto code = ClaimCode::disable_all().enable(ClaimCode::EXP);

    const auto expired = token_with(R"({"exp":)" + std::to_string(kNow - 10) + "}");
    const auto status = code.validate(kJwtSecret, expired, kNow);
    REQUIRE(status.is_error());
    CHECK(status.error_category() == ErrorCategory::EXPIRED);

    const auto fresh = token_with(R"({"exp":)" + std::to_string(kNow + 3600) + "}");
    CHECK(code.validate(kJwtSecret, fresh, kNow).is_ok());
}

TEST_CASE("ClaimCode: exp uses wall clock by default", "[auth][jwt]") {
    const auto code = ClaimCode::disable_all().enable(ClaimCode::EXP);
    const auto expired = token_with(
        R"({"exp":)" + std::to_string(authguard::testing::now_seconds() - 60) + "}");
    const auto status = code.validate(kJwtSecret, expired);
    REQUIRE(status.is_error());
    CHECK(status.error_category() == ErrorCategory::EXPIRED);
}

TEST_CASE("ClaimCode: leeway tolerates small clock skew", "[auth][jwt]") {
    auto code = ClaimCode::disable_all().enable(ClaimCode::EXP);
    code.leeway(30);
    const auto token = token_with(R"({"exp":)" + std::to_string(kNow - 10) + "}");
    CHECK(code.validate(kJwtSecret, token, kNow).is_ok());
}

TEST_CASE("ClaimCode: far-future exp never expires", "[auth][jwt]") {
    auto code = ClaimCode::disable_all().enable(ClaimCode::EXP).enable(ClaimCode::NBF);
    code.leeway(60);

    SECTION("int64 max") {
        const auto token = token_with(R"({"exp":9223372036854775807,"nbf":0})");
        CHECK(code.validate(kJwtSecret, token, kNow).is_ok());
    }

    SECTION("uint64 max") {
        const auto token = token_with(R"({"exp":18446744073709551615,"nbf":0})");
        CHECK(code.validate(kJwtSecret, token, kNow).is_ok());
    }

    SECTION("out-of-range double") {
        const auto token = token_with(R"({"exp":1e300,"nbf":-1e300})");
        CHECK(code.validate(kJwtSecret, token, kNow).is_ok());
    }
}

TEST_CASE("ClaimCode: far-past exp and far-future nbf are rejected", "[auth][jwt]") {
    auto code = ClaimCode::disable_all();
    code.leeway(60);

    const auto expired = code.enable(ClaimCode::EXP).validate(
        kJwtSecret, token_with(R"({"exp":-1e300})"), kNow);
    REQUIRE(expired.is_error());
    CHECK(expired.error_category() == ErrorCategory::EXPIRED);

    const auto early = ClaimCode::disable_all().enable(ClaimCode::NBF).leeway(60).validate(
        kJwtSecret, token_with(R"({"nbf":18446744073709551615})"), kNow);
    REQUIRE(early.is_error());
    CHECK(early.error_category() == ErrorCategory::NOT_YET_VALID);
}

TEST_CASE("ClaimCode: leeway boundary is inclusive", "[auth][jwt]") {
    auto code = ClaimCode::disable_all().enable(ClaimCode::EXP);
    code.leeway(30);

    CHECK(code.validate(kJwtSecret,
        token_with(R"({"exp":)" + std::to_string(kNow - 30) + "}"), kNow).is_ok());

    const auto status = code.validate(kJwtSecret,
        token_with(R"({"exp":)" + std::to_string(kNow - 31) + "}"), kNow);
    REQUIRE(status.is_error());
    CHECK(status.error_category() == ErrorCategory::EXPIRED);
}

TEST_CASE("ClaimCode: negative leeway counts as zero", "[auth][jwt]") {
    auto code = ClaimCode::disable_all().enable(ClaimCode::EXP);
    code.leeway(-100);
    CHECK(code.leeway_seconds() == 0);
    CHECK(code.validate(kJwtSecret,
        token_with(R"({"exp":)" + std::to_string(kNow + 50) + "}"), kNow).is_ok());
}

TEST_CASE("ClaimCode: selected exp missing is a claim mismatch", "[auth][jwt]") {
    const auto code = ClaimCode::disable_all().enable(ClaimCode::EXP);
    const auto status = code.validate(kJwtSecret, token_with(R"({"sub":"x"})"), kNow);
    REQUIRE(status.is_error());
    CHECK(status.error_category() == ErrorCategory::CLAIM_MISMATCH);
    CHECK(status.error_message().find("exp") != std::string::npos);
}

TEST_CASE("ClaimCode: nbf in the future is not yet valid", "[auth][jwt]") {
    const auto code = ClaimCode::disable_all().enable(ClaimCode::NBF);

    const auto early = token_with(R"({"nbf":)" + std::to_string(kNow + 600) + "}");
    const auto status = code.validate(kJwtSecret, early, kNow);
    REQUIRE(status.is_error());
    CHECK(status.error_category() == ErrorCategory::NOT_YET_VALID);

    const auto ready = token_with(R"({"nbf":)" + std::to_string(kNow - 1) + "}");
    CHECK(code.validate(kJwtSecret, ready, kNow).is_ok());
}

TEST_CASE("ClaimCode: issuer mismatch", "[auth][jwt]") {
    auto code = ClaimCode::disable_all();
    code.expect_issuer("test-issuer");

    CHECK(code.validate(kJwtSecret, token_with(R"({"iss":"test-issuer"})"), kNow).is_ok());

    const auto status = code.validate(kJwtSecret, token_with(R"({"iss":"evil"})"), kNow);
    REQUIRE(status.is_error());
    CHECK(status.error_category() == ErrorCategory::CLAIM_MISMATCH);
    CHECK(status.error_message().find("iss") != std::string::npos);
}

TEST_CASE("ClaimCode: audience as string or array", "[auth][jwt]") {
    auto code = ClaimCode::disable_all();
    code.expect_audience("authguard");

    CHECK(code.validate(kJwtSecret, token_with(R"({"aud":"authguard"})"), kNow).is_ok());
    CHECK(code.validate(kJwtSecret, token_with(R"({"aud":["web","authguard"]})"), kNow).is_ok());

    const auto status = code.validate(kJwtSecret, token_with(R"({"aud":["web"]})"), kNow);
    REQUIRE(status.is_error());
    CHECK(status.error_category() == ErrorCategory::CLAIM_MISMATCH);
}

TEST_CASE("ClaimCode: subject required when selected", "[auth][jwt]") {
    const auto code = ClaimCode::disable_all().enable(ClaimCode::SUB);
    CHECK(code.validate(kJwtSecret, token_with(R"({"sub":"alice"})"), kNow).is_ok());

    const auto status = code.validate(kJwtSecret, token_with(R"({"iss":"x"})"), kNow);
    REQUIRE(status.is_error());
    CHECK(status.error_category() == ErrorCategory::CLAIM_MISMATCH);
}

TEST_CASE("ClaimCode: signature is checked before claims", "[auth][jwt]") {
    const auto code = ClaimCode::disable_all().enable(ClaimCode::EXP);
    const auto expired = token_with(R"({"exp":1})");
    const auto status = code.validate("wrong", expired, kNow);
    REQUIRE(status.is_error());
    CHECK(status.error_category() == ErrorCategory::INVALID_SIGNATURE);
}

TEST_CASE("ClaimCode: parse_claim names", "[auth][jwt]") {
    CHECK(parse_claim("exp") == ClaimCode::EXP);
    CHECK(parse_claim("NBF") == ClaimCode::NBF);
    CHECK(parse_claim("iss") == ClaimCode::ISS);
    CHECK(parse_claim("aud") == ClaimCode::AUD);
    CHECK(parse_claim("sub") == ClaimCode::SUB);
    CHECK_FALSE(parse_claim("jti").has_value());
}
