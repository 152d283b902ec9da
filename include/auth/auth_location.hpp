#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace authguard {

// Marks where the credential sits inside a header template
inline constexpr std::string_view kTokenPlaceholder = "{token}";

/**
 * @brief Header holding a credential, with literal text around it
 *
 * "Bearer {token}" yields prefix "Bearer " and no suffix. Only obtainable
 * through create(), so every instance has passed template validation.
 */
class AuthHeader {
public:
    using TokenBound = std::pair<std::optional<std::string>, std::optional<std::string>>;

    /**
     * @brief Build from a field name and a boundary template
     * @param field Header name (e.g. "Authorization")
     * @param template_string Text containing exactly one "{token}"
     * @return nullopt when the placeholder is missing or repeated
     */
    [[nodiscard]] static std::optional<AuthHeader> create(
        std::string field, std::string_view template_string);

    // Authorization: Bearer {token}
    [[nodiscard]] static AuthHeader bearer();

    [[nodiscard]] const std::string& field() const { return field_; }
    [[nodiscard]] const TokenBound& token_bound() const { return token_bound_; }
    [[nodiscard]] const std::optional<std::string>& prefix() const { return token_bound_.first; }
    [[nodiscard]] const std::optional<std::string>& suffix() const { return token_bound_.second; }

private:
    AuthHeader(std::string field, TokenBound bound)
        : field_(std::move(field)), token_bound_(std::move(bound)) {}

    std::string field_;
    TokenBound token_bound_;
};

// Field of a structured frame holding the credential
struct FrameField {
    std::string name;

    explicit FrameField(std::string field_name);
};

/**
 * @brief Field names used by frame-borne credentials
 *
 * A JWT frame only needs key_or_token. API-key signing needs all three,
 * which api_key() enforces.
 */
class AuthField {
public:
    [[nodiscard]] static AuthField token(std::string key_or_token);

    /// @throws ConfigurationError if a name is empty or two names collide
    [[nodiscard]] static AuthField api_key(
        std::string key_or_token, std::string sign, std::string payload);

    [[nodiscard]] const std::string& key_or_token() const { return key_or_token_; }
    [[nodiscard]] const std::optional<std::string>& sign() const { return sign_; }
    [[nodiscard]] const std::optional<std::string>& payload() const { return payload_; }

    [[nodiscard]] bool signs_payload() const { return sign_.has_value() && payload_.has_value(); }

private:
    AuthField(std::string key, std::optional<std::string> sign, std::optional<std::string> payload)
        : key_or_token_(std::move(key)), sign_(std::move(sign)), payload_(std::move(payload)) {}

    std::string key_or_token_;
    std::optional<std::string> sign_;
    std::optional<std::string> payload_;
};

using AuthLocation = std::variant<AuthHeader, FrameField>;

} // namespace authguard
