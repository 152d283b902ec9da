#include "config/config_loader.hpp"
#include "auth/auth_location.hpp"
#include "auth/claim_validator.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace authguard {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

JwtAuthConfig extract_jwt(const toml::table& auth) {
    JwtAuthConfig cfg;
    const auto* jwt = auth["jwt"].as_table();
    if (!jwt) return cfg;
    const auto& j = *jwt;

    cfg.location = j["location"].value_or("header"s);
    cfg.header = j["header"].value_or("Authorization"s);
    cfg.header_template = j["template"].value_or("Bearer {token}"s);
    cfg.field = j["field"].value_or("token"s);
    cfg.secret = j["secret"].value_or(""s);
    cfg.claims = toml_string_array(j, "claims");
    cfg.issuer = j["issuer"].value_or(""s);
    cfg.audience = j["audience"].value_or(""s);
    cfg.subject = j["subject"].value_or(""s);
    cfg.leeway_seconds = j["leeway_seconds"].value_or(int64_t{0});
    return cfg;
}

ApiKeyAuthConfig extract_apikey(const toml::table& auth) {
    ApiKeyAuthConfig cfg;
    const auto* apikey = auth["apikey"].as_table();
    if (!apikey) return cfg;
    const auto& a = *apikey;

    cfg.key_field = a["key_field"].value_or("apikey"s);
    cfg.sign_field = a["sign_field"].value_or("sig"s);
    cfg.payload_field = a["payload_field"].value_or("data"s);
    cfg.secret = a["secret"].value_or(""s);
    cfg.resource_path = a["resource_path"].value_or(""s);
    return cfg;
}

AuthConfig extract_auth(const toml::table& root) {
    AuthConfig cfg;
    const auto* auth = root["auth"].as_table();
    if (!auth) return cfg;

    cfg.mode_str = (*auth)["mode"].value_or("none"s);
    cfg.jwt = extract_jwt(*auth);
    cfg.apikey = extract_apikey(*auth);
    return cfg;
}

GuardConfig extract_all_sections(const toml::table& tbl) {
    GuardConfig config;
    config.logging = extract_logging(tbl);
    config.auth = extract_auth(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(GuardConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GuardConfig& config) {
    std::vector<std::string> errors;

    const std::string level = utils::to_lower(config.logging.level);
    if (level != "info" && level != "warn" && level != "warning" && level != "error") {
        errors.push_back(std::format("logging.level must be info, warn or error, got '{}'",
            config.logging.level));
    }

    const auto& auth = config.auth;
    const std::string mode = utils::to_lower(auth.mode_str);

    if (mode == "jwt") {
        const auto& jwt = auth.jwt;
        if (jwt.secret.empty()) {
            errors.push_back("auth.jwt.secret required when mode is jwt");
        }

        const std::string location = utils::to_lower(jwt.location);
        if (location == "header") {
            if (jwt.header.empty()) {
                errors.push_back("auth.jwt.header must not be empty");
            }
            if (!AuthHeader::create(jwt.header, jwt.header_template)) {
                errors.push_back(std::format(
                    "auth.jwt.template must contain {} exactly once, got '{}'",
                    kTokenPlaceholder, jwt.header_template));
            }
        } else if (location == "frame") {
            if (jwt.field.empty()) {
                errors.push_back("auth.jwt.field must not be empty for frame location");
            }
        } else {
            errors.push_back(std::format("auth.jwt.location must be header or frame, got '{}'",
                jwt.location));
        }

        for (const auto& claim : jwt.claims) {
            if (!parse_claim(claim)) {
                errors.push_back(std::format("auth.jwt.claims: unknown claim '{}'", claim));
            }
        }
        if (jwt.leeway_seconds < 0) {
            errors.push_back(std::format("auth.jwt.leeway_seconds must be >= 0, got {}",
                jwt.leeway_seconds));
        }
    } else if (mode == "apikey") {
        const auto& ak = auth.apikey;
        if (ak.secret.empty()) {
            errors.push_back("auth.apikey.secret required when mode is apikey");
        }
        if (ak.key_field.empty() || ak.sign_field.empty() || ak.payload_field.empty()) {
            errors.push_back("auth.apikey key_field, sign_field and payload_field must not be empty");
        } else if (ak.key_field == ak.sign_field || ak.key_field == ak.payload_field ||
                   ak.sign_field == ak.payload_field) {
            errors.push_back("auth.apikey field names must be distinct");
        }
    } else if (mode != "none") {
        errors.push_back(std::format("auth.mode must be jwt, apikey or none, got '{}'",
            auth.mode_str));
    }

    return errors;
}

} // namespace authguard
