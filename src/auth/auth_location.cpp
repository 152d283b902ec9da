#include "auth/auth_location.hpp"
#include "core/error.hpp"

#include <format>

namespace authguard {

std::optional<AuthHeader> AuthHeader::create(
    std::string field, const std::string_view template_string) {

    const auto pos = template_string.find(kTokenPlaceholder);
    if (pos == std::string_view::npos) return std::nullopt;

    const auto tail_start = pos + kTokenPlaceholder.size();
    if (template_string.find(kTokenPlaceholder, tail_start) != std::string_view::npos) {
        return std::nullopt;
    }

    TokenBound bound;
    if (pos > 0) {
        bound.first = std::string(template_string.substr(0, pos));
    }
    if (tail_start < template_string.size()) {
        bound.second = std::string(template_string.substr(tail_start));
    }
    return AuthHeader(std::move(field), std::move(bound));
}

AuthHeader AuthHeader::bearer() {
    return AuthHeader("Authorization", TokenBound{std::string("Bearer "), std::nullopt});
}

FrameField::FrameField(std::string field_name) : name(std::move(field_name)) {
    if (name.empty()) {
        throw ConfigurationError("frame field name must not be empty");
    }
}

AuthField AuthField::token(std::string key_or_token) {
    if (key_or_token.empty()) {
        throw ConfigurationError("token field name must not be empty");
    }
    return AuthField(std::move(key_or_token), std::nullopt, std::nullopt);
}

AuthField AuthField::api_key(std::string key_or_token, std::string sign, std::string payload) {
    if (key_or_token.empty() || sign.empty() || payload.empty()) {
        throw ConfigurationError("api-key fields require key, signature and payload names");
    }
    if (key_or_token == sign || key_or_token == payload || sign == payload) {
        throw ConfigurationError(std::format(
            "api-key field names must be distinct (key='{}', sign='{}', payload='{}')",
            key_or_token, sign, payload));
    }
    return AuthField(std::move(key_or_token), std::move(sign), std::move(payload));
}

} // namespace authguard
