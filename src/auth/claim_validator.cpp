#include "auth/claim_validator.hpp"
#include "core/base64.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <format>
#include <limits>

namespace authguard {

namespace {

struct DecodedToken {
    nlohmann::json header;
    nlohmann::json claims;
    std::string signing_input;     // "header_b64.claims_b64"
    std::string signature;         // raw MAC bytes
};

Result<nlohmann::json> decode_segment(std::string_view segment, std::string_view what) {
    const auto raw = base64::url_decode(segment);
    if (!raw) {
        return Result<nlohmann::json>::error(ErrorCategory::MALFORMED,
            std::format("Invalid JWT: {} is not base64url", what));
    }
    auto parsed = nlohmann::json::parse(*raw, nullptr, /*allow_exceptions=*/false);
    if (!parsed.is_object()) {
        return Result<nlohmann::json>::error(ErrorCategory::MALFORMED,
            std::format("Invalid JWT: {} is not a JSON object", what));
    }
    return Result<nlohmann::json>::ok(std::move(parsed));
}

Result<DecodedToken> decode(std::string_view token) {
    // Split into header.payload.signature
    const auto dot1 = token.find('.');
    if (dot1 == std::string_view::npos) {
        return Result<DecodedToken>::error(ErrorCategory::MALFORMED, "Invalid JWT: missing first dot");
    }
    const auto dot2 = token.find('.', dot1 + 1);
    if (dot2 == std::string_view::npos) {
        return Result<DecodedToken>::error(ErrorCategory::MALFORMED, "Invalid JWT: missing second dot");
    }
    if (token.find('.', dot2 + 1) != std::string_view::npos) {
        return Result<DecodedToken>::error(ErrorCategory::MALFORMED, "Invalid JWT: too many segments");
    }

    auto header = decode_segment(token.substr(0, dot1), "header");
    if (header.is_error()) return Result<DecodedToken>::error(header.failure());

    auto claims = decode_segment(token.substr(dot1 + 1, dot2 - dot1 - 1), "claims");
    if (claims.is_error()) return Result<DecodedToken>::error(claims.failure());

    auto signature = base64::url_decode(token.substr(dot2 + 1));
    if (!signature || signature->empty()) {
        return Result<DecodedToken>::error(ErrorCategory::MALFORMED,
            "Invalid JWT: signature is not base64url");
    }

    DecodedToken decoded;
    decoded.header = std::move(header.value());
    decoded.claims = std::move(claims.value());
    decoded.signing_input = std::string(token.substr(0, dot2));
    decoded.signature = std::move(*signature);
    return Result<DecodedToken>::ok(std::move(decoded));
}

const EVP_MD* digest_for(const nlohmann::json& header) {
    const auto alg = header.find("alg");
    if (alg == header.end() || !alg->is_string()) return nullptr;

    const auto& name = alg->get_ref<const std::string&>();
    if (name == "HS256") return EVP_sha256();
    if (name == "HS384") return EVP_sha384();
    if (name == "HS512") return EVP_sha512();
    return nullptr;
}

bool verify_hmac(const EVP_MD* md, std::string_view secret,
                 const std::string& signing_input, const std::string& signature) {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;

    const auto* out = HMAC(md,
        secret.data(), static_cast<int>(secret.size()),
        reinterpret_cast<const unsigned char*>(signing_input.data()),
        signing_input.size(),
        mac, &mac_len);
    if (out == nullptr) return false;

    if (mac_len != signature.size()) return false;
    return CRYPTO_memcmp(mac, signature.data(), mac_len) == 0;
}

// NumericDate as int64, saturated at the type's bounds
std::optional<int64_t> numeric_claim(const nlohmann::json& claims, const char* name) {
    using Limits = std::numeric_limits<int64_t>;

    const auto it = claims.find(name);
    if (it == claims.end() || !it->is_number()) return std::nullopt;

    if (it->is_number_unsigned()) {
        const auto value = it->get<uint64_t>();
        return value > static_cast<uint64_t>(Limits::max()) ? Limits::max()
                                                            : static_cast<int64_t>(value);
    }
    if (it->is_number_float()) {
        const double value = it->get<double>();
        // 2^63 is exact as a double; anything at or past it saturates
        if (value >= 9223372036854775808.0) return Limits::max();
        if (value <= -9223372036854775808.0) return Limits::min();
        return static_cast<int64_t>(value);
    }
    return it->get<int64_t>();
}

bool audience_contains(const nlohmann::json& aud, const std::string& expected) {
    if (aud.is_string()) return aud.get_ref<const std::string&>() == expected;
    if (!aud.is_array()) return false;
    for (const auto& entry : aud) {
        if (entry.is_string() && entry.get_ref<const std::string&>() == expected) return true;
    }
    return false;
}

Status claim_mismatch(std::string_view claim, std::string_view detail) {
    return Status::error(ErrorCategory::CLAIM_MISMATCH,
        std::format("JWT claim '{}' rejected: {}", claim, detail));
}

} // anonymous namespace

std::optional<ClaimCode::Claim> parse_claim(const std::string_view name) {
    const std::string lower = utils::to_lower(name);
    if (lower == "exp") return ClaimCode::EXP;
    if (lower == "nbf") return ClaimCode::NBF;
    if (lower == "iss") return ClaimCode::ISS;
    if (lower == "aud") return ClaimCode::AUD;
    if (lower == "sub") return ClaimCode::SUB;
    return std::nullopt;
}

Status ClaimCode::validate(const std::string_view secret, const std::string_view token) const {
    return validate(secret, token, utils::unix_now());
}

Status ClaimCode::validate(const std::string_view secret, const std::string_view token,
                           const int64_t now) const {
    auto decoded = decode(token);
    if (decoded.is_error()) return Status::error(decoded.failure());
    const auto& jwt = decoded.value();

    const EVP_MD* md = digest_for(jwt.header);
    if (md == nullptr) {
        return Status::error(ErrorCategory::MALFORMED, "Invalid JWT: unsupported alg");
    }
    if (!verify_hmac(md, secret, jwt.signing_input, jwt.signature)) {
        return Status::error(ErrorCategory::INVALID_SIGNATURE, "Invalid JWT signature");
    }

    const auto& claims = jwt.claims;

    if (enabled(EXP)) {
        const auto exp = numeric_claim(claims, "exp");
        if (!exp) return claim_mismatch("exp", "missing or not numeric");
        if (now - leeway_seconds_ > *exp) {
            return Status::error(ErrorCategory::EXPIRED, "JWT expired");
        }
    }

    if (enabled(NBF)) {
        const auto nbf = numeric_claim(claims, "nbf");
        if (!nbf) return claim_mismatch("nbf", "missing or not numeric");
        if (*nbf > now && *nbf - now > leeway_seconds_) {
            return Status::error(ErrorCategory::NOT_YET_VALID, "JWT not yet valid");
        }
    }

    if (enabled(ISS)) {
        const auto iss = claims.find("iss");
        if (iss == claims.end() || !iss->is_string()) return claim_mismatch("iss", "missing");
        if (issuer_ && iss->get_ref<const std::string&>() != *issuer_) {
            return claim_mismatch("iss", std::format("expected={}, got={}",
                *issuer_, iss->get_ref<const std::string&>()));
        }
    }

    if (enabled(AUD)) {
        const auto aud = claims.find("aud");
        if (aud == claims.end()) return claim_mismatch("aud", "missing");
        if (audience_ && !audience_contains(*aud, *audience_)) {
            return claim_mismatch("aud", std::format("expected={}", *audience_));
        }
    }

    if (enabled(SUB)) {
        const auto sub = claims.find("sub");
        if (sub == claims.end() || !sub->is_string()) return claim_mismatch("sub", "missing");
        if (subject_ && sub->get_ref<const std::string&>() != *subject_) {
            return claim_mismatch("sub", std::format("expected={}, got={}",
                *subject_, sub->get_ref<const std::string&>()));
        }
    }

    return Status::ok();
}

} // namespace authguard
