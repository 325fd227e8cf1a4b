#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "core/errors/scriptbox_errors.hpp"

namespace scriptbox::net {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpUrl {
    std::string host;
    std::uint16_t port = 80;
    std::string path = "/";
};

// Accepts http://host[:port][/path]. IPv6 hosts go in brackets.
core::errors::Result<HttpUrl> parse_http_url(std::string_view url);

struct HttpRequest {
    std::string method;
    std::string target = "/";
    HttpHeaders headers;
    std::string body;

    std::optional<std::string> header(std::string_view name) const;
};

struct HttpResponse {
    int status = 200;
    std::string reason;
    HttpHeaders headers;
    std::string body;

    std::optional<std::string> header(std::string_view name) const;
};

inline constexpr std::size_t kMaxHeaderBytes = 16 * 1024;

std::string reason_phrase(int status);

// Both serializers add Content-Length and "Connection: close".
std::string serialize_request(const HttpRequest& request, const HttpUrl& url);
std::string serialize_response(const HttpResponse& response);

// Incremental parsers over everything received so far. nullopt means more
// bytes are needed. Errors use code "malformed_http", "header_too_large" or
// "payload_too_large".
core::errors::Result<std::optional<HttpRequest>> parse_request(
    std::string_view buffer, std::size_t max_body_bytes);

// `at_eof` marks that the peer closed the connection, which completes a
// response that has neither Content-Length nor chunked framing.
core::errors::Result<std::optional<HttpResponse>> parse_response(
    std::string_view buffer, bool at_eof, std::size_t max_body_bytes);

}  // namespace scriptbox::net
