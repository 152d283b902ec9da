#include "auth/token_extractor.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <iterator>

namespace authguard {

namespace {

// Header values are text only when every byte is visible ASCII or tab
bool is_header_text(std::string_view value) {
    return std::all_of(value.begin(), value.end(), [](const char c) {
        const auto uc = static_cast<unsigned char>(c);
        return uc == '\t' || (uc >= 0x20 && uc < 0x7F);
    });
}

} // anonymous namespace

Result<std::string> extract_from_header(const AuthHeader& tmpl, const HeaderMap& headers) {
    const auto range = headers.equal_range(tmpl.field());
    const auto first = range.first;
    const auto last = range.second;
    if (first == last) {
        return Result<std::string>::error(ErrorCategory::MISSING_FIELD,
            std::format("Missing field '{}'", tmpl.field()));
    }

    // The header container keeps no order among repeats, so they must agree
    const bool conflicting = std::any_of(std::next(first), last, [&](const auto& entry) {
        return entry.second != first->second;
    });
    if (conflicting) {
        return Result<std::string>::error(ErrorCategory::MALFORMED,
            std::format("Header '{}' repeated with different values", tmpl.field()));
    }

    std::string_view token = first->second;
    if (!is_header_text(token)) {
        return Result<std::string>::error(ErrorCategory::MALFORMED,
            std::format("Header '{}' is not visible ASCII", tmpl.field()));
    }

    if (const auto& prefix = tmpl.prefix()) {
        token = utils::strip_prefix(token, *prefix);
    }
    if (const auto& suffix = tmpl.suffix()) {
        token = utils::strip_suffix(token, *suffix);
    }
    return Result<std::string>::ok(std::string(token));
}

Result<std::string> extract_from_frame(const std::string_view field_name, const nlohmann::json& frame) {
    if (!frame.is_object()) {
        return Result<std::string>::error(ErrorCategory::INVALID_REQUEST_SHAPE,
            "request must be an object");
    }

    const auto it = frame.find(std::string(field_name));
    if (it == frame.end()) {
        return Result<std::string>::error(ErrorCategory::MISSING_FIELD,
            std::format("\"{}\" not found", field_name));
    }
    if (!it->is_string()) {
        return Result<std::string>::error(ErrorCategory::MALFORMED,
            std::format("\"{}\" must be a string", field_name));
    }
    return Result<std::string>::ok(it->get<std::string>());
}

} // namespace authguard
