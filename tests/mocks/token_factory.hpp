#pragma once

#include "core/base64.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <chrono>
#include <cstdint>
#include <string>

namespace authguard::testing {

inline const std::string kJwtSecret = "test-secret-key-for-jwt";

inline int64_t now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/**
 * @brief Build a compact HMAC-signed JWT
 * @param payload_json Raw claims JSON
 * @param alg "HS256", "HS384" or "HS512"; any other value is written to the
 *        header as-is and signed with SHA-256
 */
inline std::string create_test_jwt(const std::string& payload_json,
                                   const std::string& secret,
                                   const std::string& alg = "HS256") {
    const std::string header = R"({"alg":")" + alg + R"(","typ":"JWT"})";
    const std::string signing_input =
        base64::url_encode(header) + "." + base64::url_encode(payload_json);

    const EVP_MD* md = EVP_sha256();
    if (alg == "HS384") md = EVP_sha384();
    if (alg == "HS512") md = EVP_sha512();

    unsigned char hmac_result[EVP_MAX_MD_SIZE];
    unsigned int hmac_len = 0;
    HMAC(md, secret.data(), static_cast<int>(secret.size()),
         reinterpret_cast<const unsigned char*>(signing_input.data()),
         signing_input.size(), hmac_result, &hmac_len);

    const std::string sig(reinterpret_cast<char*>(hmac_result), hmac_len);
    return signing_input + "." + base64::url_encode(sig);
}

} // namespace authguard::testing
