#include "auth/auth_mode.hpp"
#include "auth/api_key_validator.hpp"
#include "auth/token_extractor.hpp"
#include "config/config_types.hpp"
#include "core/utils.hpp"

#include <exception>
#include <format>

namespace authguard {

namespace {

[[noreturn]] void wiring_fault(AuthKind kind, RequestShape shape, std::string_view detail) {
    const auto message = std::format("{} mode cannot validate a {} request: {}",
        to_string(kind), to_string(shape), detail);
    utils::log::error(message);
    throw ConfigurationError(message);
}

std::shared_ptr<const std::string> share_secret(std::string secret, std::string_view mode) {
    if (secret.empty()) {
        throw ConfigurationError(std::format("{} signing secret must not be empty", mode));
    }
    return std::make_shared<const std::string>(std::move(secret));
}

Result<std::string> extract_token(const JwtMode& jwt, const AuthRequest& request) {
    const auto& req = request.get();
    if (const auto* header = std::get_if<AuthHeader>(&jwt.location)) {
        const auto* http = std::get_if<HttpHeaderRequest>(&req);
        if (http == nullptr) {
            wiring_fault(AuthKind::JWT, request.shape(), "location is a header");
        }
        return extract_from_header(*header, http->headers.get());
    }

    const auto& field = std::get<FrameField>(jwt.location);
    const auto* frame = std::get_if<FrameRequest>(&req);
    if (frame == nullptr) {
        wiring_fault(AuthKind::JWT, request.shape(), "location is a frame field");
    }
    return extract_from_frame(field.name, frame->frame);
}

Status validate_jwt(const JwtMode& jwt, const AuthRequest& request) {
    const auto token = extract_token(jwt, request);
    if (token.is_error()) return Status::error(token.failure());
    return jwt.claims.validate(*jwt.signing_secret, token.value());
}

std::optional<uint64_t> resolve_nonce(const ApiKeyMode& mode, const std::string& api_key) {
    try {
        return mode.nonce_lookup(api_key);
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Nonce lookup failed: {}", e.what()));
        return std::nullopt;
    }
}

Status validate_api_key(const ApiKeyMode& mode, const AuthRequest& request) {
    const auto* frame_req = std::get_if<FrameRequest>(&request.get());
    if (frame_req == nullptr) {
        wiring_fault(AuthKind::API_KEY, request.shape(), "api-key signatures cover frames only");
    }
    const auto& frame = frame_req->frame;

    const auto& key_field = mode.fields.key_or_token();
    auto api_key = extract_from_frame(key_field, frame);
    if (api_key.is_error()) return Status::error(api_key.failure());

    auto signature = extract_from_frame(*mode.fields.sign(), frame);
    if (signature.is_error()) return Status::error(signature.failure());

    const auto nonce = resolve_nonce(mode, api_key.value());
    if (!nonce) {
        return Status::error(ErrorCategory::INVALID_CREDENTIAL,
            std::format("invalid \"{}\"", key_field));
    }

    const auto& payload_field = *mode.fields.payload();
    const auto payload = frame.find(payload_field);
    if (payload == frame.end()) {
        return Status::error(ErrorCategory::MISSING_FIELD,
            std::format("\"{}\" not found", payload_field));
    }

    ApiKeyCandidate candidate;
    candidate.resource_path = mode.resource_path;
    candidate.nonce = *nonce;
    candidate.payload = *payload;

    auto status = apikey::validate(*mode.signing_secret, candidate, signature.value());
    if (status.is_ok() && mode.on_verified) {
        mode.on_verified(api_key.value(), *nonce);
    }
    return status;
}

} // anonymous namespace

// ============================================================================
// Mode construction
// ============================================================================

JwtMode::JwtMode(AuthLocation loc, std::string secret, ClaimCode claim_code)
    : location(std::move(loc)),
      signing_secret(share_secret(std::move(secret), "jwt")),
      claims(std::move(claim_code)) {}

ApiKeyMode::ApiKeyMode(AuthField auth_fields, std::string secret, std::string path,
                       NonceLookup lookup, NonceCommit commit)
    : fields(std::move(auth_fields)),
      signing_secret(share_secret(std::move(secret), "apikey")),
      resource_path(std::move(path)),
      nonce_lookup(std::move(lookup)),
      on_verified(std::move(commit)) {
    if (!fields.signs_payload()) {
        throw ConfigurationError("apikey mode requires signature and payload field names");
    }
    if (!nonce_lookup) {
        throw ConfigurationError("apikey mode requires a nonce lookup");
    }
}

AuthMode AuthMode::default_jwt_from(std::string signing_secret) {
    return AuthMode(JwtMode(AuthHeader::bearer(), std::move(signing_secret)));
}

// ============================================================================
// Dispatch
// ============================================================================

AuthKind AuthMode::kind() const {
    if (std::holds_alternative<JwtMode>(mode_)) return AuthKind::JWT;
    if (std::holds_alternative<ApiKeyMode>(mode_)) return AuthKind::API_KEY;
    return AuthKind::NONE;
}

bool AuthMode::accepts(const RequestShape shape) const {
    if (const auto* jwt = std::get_if<JwtMode>(&mode_)) {
        const bool header_location = std::holds_alternative<AuthHeader>(jwt->location);
        return header_location == (shape == RequestShape::HTTP_HEADER);
    }
    if (std::holds_alternative<ApiKeyMode>(mode_)) {
        return shape == RequestShape::FRAME;
    }
    return true;
}

void AuthMode::require(const RequestShape shape) const {
    if (!accepts(shape)) {
        wiring_fault(kind(), shape, "check the handler wiring for this route");
    }
}

Status AuthMode::validate(const AuthRequest& request) const {
    if (const auto* jwt = std::get_if<JwtMode>(&mode_)) {
        return validate_jwt(*jwt, request);
    }
    if (const auto* apikey = std::get_if<ApiKeyMode>(&mode_)) {
        return validate_api_key(*apikey, request);
    }
    return Status::ok();
}

// ============================================================================
// Construction from configuration
// ============================================================================

AuthMode make_auth_mode(const AuthConfig& config, NonceLookup lookup, NonceCommit commit) {
    const std::string mode = utils::to_lower(config.mode_str);

    if (mode == "none") {
        return AuthMode(NoAuth{});
    }

    if (mode == "jwt") {
        const auto& jwt = config.jwt;

        ClaimCode claims = ClaimCode::disable_all();
        for (const auto& name : jwt.claims) {
            const auto claim = parse_claim(name);
            if (!claim) {
                throw ConfigurationError(std::format("unknown JWT claim '{}'", name));
            }
            claims.enable(*claim);
        }
        if (!jwt.issuer.empty()) claims.expect_issuer(jwt.issuer);
        if (!jwt.audience.empty()) claims.expect_audience(jwt.audience);
        if (!jwt.subject.empty()) claims.expect_subject(jwt.subject);
        claims.leeway(jwt.leeway_seconds);

        const std::string location = utils::to_lower(jwt.location);
        if (location == "header") {
            auto header = AuthHeader::create(jwt.header, jwt.header_template);
            if (!header) {
                throw ConfigurationError(std::format(
                    "header template '{}' must contain {} exactly once",
                    jwt.header_template, kTokenPlaceholder));
            }
            return AuthMode(JwtMode(std::move(*header), jwt.secret, std::move(claims)));
        }
        if (location == "frame") {
            return AuthMode(JwtMode(FrameField(jwt.field), jwt.secret, std::move(claims)));
        }
        throw ConfigurationError(std::format("unknown JWT location '{}'", jwt.location));
    }

    if (mode == "apikey") {
        const auto& ak = config.apikey;
        return AuthMode(ApiKeyMode(
            AuthField::api_key(ak.key_field, ak.sign_field, ak.payload_field),
            ak.secret, ak.resource_path, std::move(lookup), std::move(commit)));
    }

    throw ConfigurationError(std::format("unknown auth mode '{}'", config.mode_str));
}

} // namespace authguard
