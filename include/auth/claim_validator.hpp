#pragma once

#include "core/error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace authguard {

/**
 * @brief Selects which registered JWT claims are enforced
 *
 * The signature is always verified. Claims outside the selection are never
 * inspected, even when present and invalid, so disable_all() amounts to
 * signature-only verification.
 *
 * Supported algorithms: HS256, HS384, HS512, all keyed by the same secret.
 */
class ClaimCode {
public:
    enum Claim : uint8_t {
        EXP = 1 << 0,   // expiry
        NBF = 1 << 1,   // not-before
        ISS = 1 << 2,   // issuer
        AUD = 1 << 3,   // audience
        SUB = 1 << 4,   // subject
    };

    [[nodiscard]] static ClaimCode disable_all() { return ClaimCode{}; }

    ClaimCode& enable(Claim claim) {
        flags_ |= claim;
        return *this;
    }

    ClaimCode& expect_issuer(std::string issuer) {
        issuer_ = std::move(issuer);
        return enable(ISS);
    }

    ClaimCode& expect_audience(std::string audience) {
        audience_ = std::move(audience);
        return enable(AUD);
    }

    ClaimCode& expect_subject(std::string subject) {
        subject_ = std::move(subject);
        return enable(SUB);
    }

    // Negative values count as zero
    ClaimCode& leeway(int64_t seconds) {
        leeway_seconds_ = seconds > 0 ? seconds : 0;
        return *this;
    }

    [[nodiscard]] bool enabled(Claim claim) const { return (flags_ & claim) != 0; }
    [[nodiscard]] int64_t leeway_seconds() const { return leeway_seconds_; }

    /**
     * @brief Verify signature and selected claims against the current time
     * @param secret Shared HMAC secret
     * @param token Compact JWS "header.claims.signature"
     */
    [[nodiscard]] Status validate(std::string_view secret, std::string_view token) const;

    // Same as above with an explicit Unix time in seconds
    [[nodiscard]] Status validate(std::string_view secret, std::string_view token,
                                  int64_t now) const;

private:
    uint8_t flags_ = 0;
    int64_t leeway_seconds_ = 0;
    std::optional<std::string> issuer_;
    std::optional<std::string> audience_;
    std::optional<std::string> subject_;
};

/// Parse a claim name ("exp", "nbf", "iss", "aud", "sub")
[[nodiscard]] std::optional<ClaimCode::Claim> parse_claim(std::string_view name);

} // namespace authguard
