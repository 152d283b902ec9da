#pragma once

#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace authguard {

/**
 * @brief Data covered by an API-key signature
 *
 * Assembled per request from the mode's resource path, the nonce the store
 * expects for the key, and the frame's payload field.
 */
struct ApiKeyCandidate {
    std::string resource_path;
    uint64_t nonce = 0;
    nlohmann::json payload;
};

namespace apikey {

/**
 * @brief Canonical signed message
 *
 * resource_path, then the nonce in decimal ASCII without padding, then the
 * compact JSON dump of the payload (object keys in lexicographic order).
 * No separators are inserted.
 */
[[nodiscard]] std::string canonical_message(const ApiKeyCandidate& candidate);

/// Lowercase hex HMAC-SHA256 of canonical_message(candidate)
[[nodiscard]] std::string sign(std::string_view secret, const ApiKeyCandidate& candidate);

/**
 * @brief Check a hex signature against the candidate
 * @return MALFORMED if the signature is not hex, INVALID_SIGNATURE on mismatch
 */
[[nodiscard]] Status validate(std::string_view secret, const ApiKeyCandidate& candidate,
                              std::string_view supplied_signature_hex);

} // namespace apikey

} // namespace authguard
