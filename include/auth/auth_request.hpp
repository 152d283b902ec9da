#pragma once

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <functional>
#include <string_view>
#include <utility>
#include <variant>

namespace authguard {

// Header container of the HTTP layer (case-insensitive names, repeatable)
using HeaderMap = httplib::Headers;

enum class RequestShape { HTTP_HEADER, FRAME };

[[nodiscard]] inline constexpr std::string_view to_string(RequestShape shape) {
    return shape == RequestShape::HTTP_HEADER ? "http_header" : "frame";
}

struct HttpHeaderRequest {
    std::reference_wrapper<const HeaderMap> headers;
};

struct FrameRequest {
    nlohmann::json frame;
};

/**
 * @brief One inbound request, in either accepted shape
 *
 * Built per validation call. The header variant borrows the caller's map and
 * must not outlive it; the frame variant owns its value tree.
 */
class AuthRequest {
public:
    AuthRequest(const HeaderMap& headers) : request_(HttpHeaderRequest{std::cref(headers)}) {}
    AuthRequest(nlohmann::json frame) : request_(FrameRequest{std::move(frame)}) {}

    // A temporary map would dangle
    AuthRequest(HeaderMap&&) = delete;

    [[nodiscard]] RequestShape shape() const {
        return std::holds_alternative<HttpHeaderRequest>(request_)
            ? RequestShape::HTTP_HEADER
            : RequestShape::FRAME;
    }

    [[nodiscard]] const std::variant<HttpHeaderRequest, FrameRequest>& get() const {
        return request_;
    }

private:
    std::variant<HttpHeaderRequest, FrameRequest> request_;
};

} // namespace authguard
