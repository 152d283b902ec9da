#pragma once

#include "auth/auth_location.hpp"
#include "auth/auth_request.hpp"
#include "auth/claim_validator.hpp"
#include "auth/nonce_store.hpp"
#include "core/error.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace authguard {

struct AuthConfig;

enum class AuthKind { NONE, JWT, API_KEY };

[[nodiscard]] inline constexpr std::string_view to_string(AuthKind kind) {
    switch (kind) {
        case AuthKind::NONE:    return "none";
        case AuthKind::JWT:     return "jwt";
        case AuthKind::API_KEY: return "apikey";
    }
    return "unknown";
}

struct NoAuth {};

/**
 * @brief Bearer-token verification
 *
 * A header location pairs with header requests, a frame field with frames.
 */
struct JwtMode {
    AuthLocation location;
    std::shared_ptr<const std::string> signing_secret;
    ClaimCode claims;

    JwtMode(AuthLocation loc, std::string secret, ClaimCode claim_code = ClaimCode::disable_all());
};

/**
 * @brief Per-frame HMAC over (resource path, expected nonce, payload)
 *
 * Frames only. The nonce capability is owned here and shared by copies;
 * it must tolerate concurrent calls. on_verified, when set, runs after each
 * successful validation and is the store's cue to advance the key's nonce.
 */
struct ApiKeyMode {
    AuthField fields;
    std::shared_ptr<const std::string> signing_secret;
    std::string resource_path;
    NonceLookup nonce_lookup;
    NonceCommit on_verified;

    /// @throws ConfigurationError without sign/payload fields or a lookup
    ApiKeyMode(AuthField auth_fields, std::string secret, std::string path,
               NonceLookup lookup, NonceCommit commit = {});
};

/**
 * @brief Selected authentication scheme
 *
 * Immutable once built; validate() is const and may run concurrently from
 * any number of threads on a shared instance.
 */
class AuthMode {
public:
    AuthMode() = default;
    AuthMode(NoAuth none) : mode_(none) {}
    AuthMode(JwtMode jwt) : mode_(std::move(jwt)) {}
    AuthMode(ApiKeyMode apikey) : mode_(std::move(apikey)) {}

    /// "Authorization: Bearer {token}", signature-only checks
    [[nodiscard]] static AuthMode default_jwt_from(std::string signing_secret);

    [[nodiscard]] AuthKind kind() const;

    /// Whether validate() can handle requests of this shape
    [[nodiscard]] bool accepts(RequestShape shape) const;

    /// Wiring-time check; @throws ConfigurationError if !accepts(shape)
    void require(RequestShape shape) const;

    /**
     * @brief Decide whether the request carries valid credentials
     * @return ok, or the rejection reason for an "unauthorized" response
     * @throws ConfigurationError when the request shape does not fit the mode
     */
    [[nodiscard]] Status validate(const AuthRequest& request) const;

    [[nodiscard]] const std::variant<NoAuth, JwtMode, ApiKeyMode>& get() const { return mode_; }

private:
    std::variant<NoAuth, JwtMode, ApiKeyMode> mode_;
};

/**
 * @brief Build a mode from loaded configuration
 * @param lookup Nonce capability, required for the API-key mode
 * @param commit Optional post-verification hook for the API-key mode
 * @throws ConfigurationError on an incomplete configuration
 */
[[nodiscard]] AuthMode make_auth_mode(const AuthConfig& config,
                                      NonceLookup lookup = {},
                                      NonceCommit commit = {});

} // namespace authguard
