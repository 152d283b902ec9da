#include "auth/api_key_validator.hpp"
#include "core/utils.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <array>
#include <stdexcept>

namespace authguard::apikey {

namespace {

using Mac = std::array<unsigned char, EVP_MAX_MD_SIZE>;

unsigned int hmac_sha256(std::string_view secret, const std::string& message, Mac& out) {
    unsigned int len = 0;
    const auto* res = HMAC(EVP_sha256(),
        secret.data(), static_cast<int>(secret.size()),
        reinterpret_cast<const unsigned char*>(message.data()),
        message.size(),
        out.data(), &len);
    if (res == nullptr) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    return len;
}

} // anonymous namespace

std::string canonical_message(const ApiKeyCandidate& candidate) {
    std::string message = candidate.resource_path;
    message += std::to_string(candidate.nonce);
    message += candidate.payload.dump();
    return message;
}

std::string sign(const std::string_view secret, const ApiKeyCandidate& candidate) {
    Mac mac{};
    const auto len = hmac_sha256(secret, canonical_message(candidate), mac);
    return utils::bytes_to_hex(mac.data(), len);
}

Status validate(const std::string_view secret, const ApiKeyCandidate& candidate,
                const std::string_view supplied_signature_hex) {
    const auto supplied = utils::hex_to_bytes(supplied_signature_hex);
    if (!supplied) {
        return Status::error(ErrorCategory::MALFORMED, "signature must be a hex string");
    }

    Mac mac{};
    const auto len = hmac_sha256(secret, canonical_message(candidate), mac);

    if (supplied->size() != len ||
        CRYPTO_memcmp(mac.data(), supplied->data(), len) != 0) {
        return Status::error(ErrorCategory::INVALID_SIGNATURE, "Invalid API-key signature");
    }
    return Status::ok();
}

} // namespace authguard::apikey
