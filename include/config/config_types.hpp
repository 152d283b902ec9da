#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace authguard {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct JwtAuthConfig {
    std::string location = "header";               // "header" | "frame"
    std::string header = "Authorization";
    std::string header_template = "Bearer {token}";
    std::string field = "token";                   // Frame field (location = "frame")
    std::string secret;
    std::vector<std::string> claims;               // Enforced claims; empty = signature only
    std::string issuer;
    std::string audience;
    std::string subject;
    int64_t leeway_seconds = 0;
};

struct ApiKeyAuthConfig {
    std::string key_field = "apikey";
    std::string sign_field = "sig";
    std::string payload_field = "data";
    std::string secret;
    std::string resource_path;
};

struct AuthConfig {
    std::string mode_str = "none";   // "jwt" | "apikey" | "none" (parsed at use site)
    JwtAuthConfig jwt;
    ApiKeyAuthConfig apikey;
};

// ============================================================================
// GuardConfig - Complete parsed configuration
// ============================================================================

struct GuardConfig {
    LoggingConfig logging;
    AuthConfig auth;
};

} // namespace authguard
