#pragma once

#include "auth/auth_location.hpp"
#include "auth/auth_request.hpp"
#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace authguard {

/**
 * @brief Pull the credential out of a header map
 *
 * Boundary text is stripped on a best-effort basis: a prefix or suffix that
 * does not match leaves the value untouched instead of failing.
 */
[[nodiscard]] Result<std::string> extract_from_header(
    const AuthHeader& tmpl, const HeaderMap& headers);

/**
 * @brief Pull a string field out of an object-shaped frame
 */
[[nodiscard]] Result<std::string> extract_from_frame(
    std::string_view field_name, const nlohmann::json& frame);

} // namespace authguard
