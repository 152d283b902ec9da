#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace authguard::base64 {

// URL-safe alphabet, no padding (RFC 7515 §2)
inline std::string url_encode(std::string_view data) {
    static const char kChars[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    std::string result;
    result.reserve(4 * ((data.size() + 2) / 3));

    const size_t len = data.size();
    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(static_cast<uint8_t>(data[i])) << 16;
        if (i + 1 < len) n |= static_cast<uint32_t>(static_cast<uint8_t>(data[i + 1])) << 8;
        if (i + 2 < len) n |= static_cast<uint32_t>(static_cast<uint8_t>(data[i + 2]));

        result += kChars[(n >> 18) & 0x3F];
        result += kChars[(n >> 12) & 0x3F];
        if (i + 1 < len) result += kChars[(n >> 6) & 0x3F];
        if (i + 2 < len) result += kChars[n & 0x3F];
    }
    return result;
}

/**
 * @brief Strict base64url decode
 *
 * Accepts trailing '=' padding. Any character outside the URL-safe alphabet,
 * or a length that cannot come from an encoder, yields nullopt.
 */
inline std::optional<std::string> url_decode(std::string_view encoded) {
    static const uint8_t kTable[128] = {
        64,64,64,64,64,64,64,64,64,64,64,64,64,64,64,64,
        64,64,64,64,64,64,64,64,64,64,64,64,64,64,64,64,
        64,64,64,64,64,64,64,64,64,64,64,64,64,62,64,64,
        52,53,54,55,56,57,58,59,60,61,64,64,64,64,64,64,
        64, 0, 1, 2, 3, 4, 5, 6, 7, 8, 9,10,11,12,13,14,
        15,16,17,18,19,20,21,22,23,24,25,64,64,64,64,63,
        64,26,27,28,29,30,31,32,33,34,35,36,37,38,39,40,
        41,42,43,44,45,46,47,48,49,50,51,64,64,64,64,64
    };

    while (!encoded.empty() && encoded.back() == '=') encoded.remove_suffix(1);
    if (encoded.size() % 4 == 1) return std::nullopt;

    std::string result;
    result.reserve(3 * encoded.size() / 4);

    uint32_t buf = 0;
    int bits = 0;
    for (const char c : encoded) {
        const auto uc = static_cast<unsigned char>(c);
        if (uc >= 128) return std::nullopt;
        const uint8_t val = kTable[uc];
        if (val == 64) return std::nullopt;

        buf = (buf << 6) | val;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<char>((buf >> bits) & 0xFF));
        }
    }
    return result;
}

} // namespace authguard::base64
