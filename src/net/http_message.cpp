#include "net/http_message.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

namespace scriptbox::net {

using core::errors::ErrorCategory;
using core::errors::ScriptboxError;

namespace {

struct MessageHead {
    std::string start_line;
    HttpHeaders headers;
    std::size_t body_offset = 0;
};

ScriptboxError malformed(const std::string& message) {
    return ScriptboxError{ErrorCategory::Input, message, "malformed_http"};
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    return text;
}

std::optional<std::string> find_header(const HttpHeaders& headers, std::string_view name) {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

core::errors::Result<std::optional<MessageHead>> parse_head(std::string_view buffer) {
    const auto head_end = buffer.find("\r\n\r\n");
    if (head_end == std::string_view::npos) {
        if (buffer.size() > kMaxHeaderBytes) {
            return ScriptboxError{ErrorCategory::Input, "HTTP header section too large",
                                  "header_too_large"};
        }
        return std::optional<MessageHead>{};
    }
    if (head_end > kMaxHeaderBytes) {
        return ScriptboxError{ErrorCategory::Input, "HTTP header section too large",
                              "header_too_large"};
    }

    MessageHead head;
    head.body_offset = head_end + 4;
    std::string_view lines = buffer.substr(0, head_end);
    bool first = true;
    while (!lines.empty() || first) {
        const auto line_end = lines.find("\r\n");
        const std::string_view line = lines.substr(0, line_end);
        lines = line_end == std::string_view::npos ? std::string_view{}
                                                   : lines.substr(line_end + 2);
        if (first) {
            head.start_line = std::string(line);
            first = false;
            continue;
        }
        const auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return malformed("Malformed HTTP header line");
        }
        head.headers.emplace_back(std::string(trim(line.substr(0, colon))),
                                  std::string(trim(line.substr(colon + 1))));
    }
    if (head.start_line.empty()) {
        return malformed("Missing HTTP start line");
    }
    return std::optional<MessageHead>(std::move(head));
}

core::errors::Result<std::optional<std::string>> decode_chunked(
    std::string_view data, const std::size_t max_body_bytes) {
    std::string body;
    std::size_t pos = 0;
    while (true) {
        const auto line_end = data.find("\r\n", pos);
        if (line_end == std::string_view::npos) {
            return std::optional<std::string>{};
        }
        std::string_view size_text = data.substr(pos, line_end - pos);
        size_text = trim(size_text.substr(0, size_text.find(';')));
        std::size_t chunk_size = 0;
        const auto [ptr, ec] = std::from_chars(
            size_text.data(), size_text.data() + size_text.size(), chunk_size, 16);
        if (size_text.empty() || ec != std::errc() ||
            ptr != size_text.data() + size_text.size()) {
            return malformed("Invalid chunk size in chunked body");
        }
        pos = line_end + 2;

        if (chunk_size == 0) {
            // Trailer section ends with an empty line.
            while (true) {
                const auto trailer_end = data.find("\r\n", pos);
                if (trailer_end == std::string_view::npos) {
                    return std::optional<std::string>{};
                }
                if (trailer_end == pos) {
                    return std::optional<std::string>(std::move(body));
                }
                pos = trailer_end + 2;
            }
        }

        if (chunk_size > max_body_bytes || body.size() + chunk_size > max_body_bytes) {
            return ScriptboxError{ErrorCategory::Input, "HTTP body too large",
                                  "payload_too_large"};
        }
        if (data.size() < pos + chunk_size + 2) {
            return std::optional<std::string>{};
        }
        body.append(data.substr(pos, chunk_size));
        if (data.substr(pos + chunk_size, 2) != "\r\n") {
            return malformed("Missing CRLF after chunk data");
        }
        pos += chunk_size + 2;
    }
}

// Body framing shared by requests and responses. Without Content-Length or
// chunked encoding a request has no body while a response runs to EOF.
core::errors::Result<std::optional<std::string>> read_body(
    const HttpHeaders& headers, std::string_view rest, const bool at_eof,
    const bool eof_delimited, const std::size_t max_body_bytes) {
    const auto transfer_encoding = find_header(headers, "Transfer-Encoding");
    if (transfer_encoding.has_value()) {
        std::string lowered = *transfer_encoding;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lowered.find("chunked") == std::string::npos) {
            return malformed("Unsupported Transfer-Encoding: " + *transfer_encoding);
        }
        auto decoded = decode_chunked(rest, max_body_bytes);
        if (core::errors::is_error(decoded)) {
            return core::errors::get_error(decoded);
        }
        if (!core::errors::get_value(decoded).has_value() && at_eof) {
            return malformed("Connection closed inside a chunked body");
        }
        return decoded;
    }

    const auto content_length = find_header(headers, "Content-Length");
    if (content_length.has_value()) {
        std::size_t length = 0;
        const std::string& text = *content_length;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), length);
        if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
            return malformed("Invalid Content-Length: " + text);
        }
        if (length > max_body_bytes) {
            return ScriptboxError{ErrorCategory::Input, "HTTP body too large",
                                  "payload_too_large"};
        }
        if (rest.size() < length) {
            if (at_eof) {
                return malformed("Connection closed before the full body arrived");
            }
            return std::optional<std::string>{};
        }
        return std::optional<std::string>(std::string(rest.substr(0, length)));
    }

    if (!eof_delimited) {
        return std::optional<std::string>(std::string());
    }
    if (rest.size() > max_body_bytes) {
        return ScriptboxError{ErrorCategory::Input, "HTTP body too large",
                              "payload_too_large"};
    }
    if (!at_eof) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>(std::string(rest));
}

}  // namespace

core::errors::Result<HttpUrl> parse_http_url(std::string_view url) {
    constexpr std::string_view kScheme = "http://";
    if (url.size() < kScheme.size() || !iequals(url.substr(0, kScheme.size()), kScheme)) {
        return ScriptboxError{ErrorCategory::Input,
                              "Unsupported runner URL: '" + std::string(url) + "'",
                              "invalid_url", "Use the form http://host[:port]/path."};
    }
    std::string_view rest = url.substr(kScheme.size());
    const auto fragment = rest.find('#');
    if (fragment != std::string_view::npos) {
        rest = rest.substr(0, fragment);
    }

    const auto path_start = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, path_start);
    HttpUrl parsed;
    if (path_start != std::string_view::npos) {
        parsed.path = std::string(rest.substr(path_start));
        if (parsed.path.front() == '?') {
            parsed.path.insert(parsed.path.begin(), '/');
        }
    }

    std::string_view port_text;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return ScriptboxError{ErrorCategory::Input,
                                  "Unterminated IPv6 address in URL: '" + std::string(url) + "'",
                                  "invalid_url"};
        }
        parsed.host = std::string(authority.substr(1, close - 1));
        const std::string_view after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return ScriptboxError{ErrorCategory::Input,
                                      "Malformed authority in URL: '" + std::string(url) + "'",
                                      "invalid_url"};
            }
            port_text = after.substr(1);
        }
    } else {
        const auto colon = authority.rfind(':');
        parsed.host = std::string(authority.substr(0, colon));
        if (colon != std::string_view::npos) {
            port_text = authority.substr(colon + 1);
        }
    }

    if (parsed.host.empty()) {
        return ScriptboxError{ErrorCategory::Input,
                              "Missing host in URL: '" + std::string(url) + "'", "invalid_url"};
    }
    if (!port_text.empty() || (authority.size() > 0 && authority.back() == ':')) {
        std::uint16_t port = 0;
        const auto [ptr, ec] =
            std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        if (port_text.empty() || ec != std::errc() ||
            ptr != port_text.data() + port_text.size() || port == 0) {
            return ScriptboxError{ErrorCategory::Input,
                                  "Invalid port in URL: '" + std::string(url) + "'",
                                  "invalid_url", "Ports range from 1 to 65535."};
        }
        parsed.port = port;
    }
    return parsed;
}

std::optional<std::string> HttpRequest::header(std::string_view name) const {
    return find_header(headers, name);
}

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    return find_header(headers, name);
}

std::string reason_phrase(const int status) {
    switch (status) {
        case 200:
            return "OK";
        case 400:
            return "Bad Request";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 408:
            return "Request Timeout";
        case 413:
            return "Payload Too Large";
        case 431:
            return "Request Header Fields Too Large";
        case 500:
            return "Internal Server Error";
        case 503:
            return "Service Unavailable";
        default:
            return "Unknown";
    }
}

std::string serialize_request(const HttpRequest& request, const HttpUrl& url) {
    const bool ipv6 = url.host.find(':') != std::string::npos;
    std::string out = request.method + " " + request.target + " HTTP/1.1\r\n";
    out += "Host: " + (ipv6 ? "[" + url.host + "]" : url.host);
    if (url.port != 80) {
        out += ":" + std::to_string(url.port);
    }
    out += "\r\n";
    for (const auto& [name, value] : request.headers) {
        out += name + ": " + value + "\r\n";
    }
    out += "Content-Length: " + std::to_string(request.body.size()) + "\r\n";
    out += "Connection: close\r\n\r\n";
    out += request.body;
    return out;
}

std::string serialize_response(const HttpResponse& response) {
    const std::string reason =
        response.reason.empty() ? reason_phrase(response.status) : response.reason;
    std::string out = "HTTP/1.1 " + std::to_string(response.status) + " " + reason + "\r\n";
    for (const auto& [name, value] : response.headers) {
        out += name + ": " + value + "\r\n";
    }
    out += "Content-Length: " + std::to_string(response.body.size()) + "\r\n";
    out += "Connection: close\r\n\r\n";
    out += response.body;
    return out;
}

core::errors::Result<std::optional<HttpRequest>> parse_request(
    std::string_view buffer, const std::size_t max_body_bytes) {
    auto head_result = parse_head(buffer);
    if (core::errors::is_error(head_result)) {
        return core::errors::get_error(head_result);
    }
    const auto& head = core::errors::get_value(head_result);
    if (!head.has_value()) {
        return std::optional<HttpRequest>{};
    }

    HttpRequest request;
    const auto first_space = head->start_line.find(' ');
    const auto second_space = head->start_line.find(' ', first_space + 1);
    if (first_space == std::string::npos || second_space == std::string::npos ||
        head->start_line.compare(second_space + 1, 5, "HTTP/") != 0) {
        return malformed("Malformed request line: " + head->start_line);
    }
    request.method = head->start_line.substr(0, first_space);
    request.target = head->start_line.substr(first_space + 1, second_space - first_space - 1);
    request.headers = head->headers;

    auto body = read_body(request.headers, buffer.substr(head->body_offset), false, false,
                          max_body_bytes);
    if (core::errors::is_error(body)) {
        return core::errors::get_error(body);
    }
    auto& body_text = std::get<std::optional<std::string>>(body);
    if (!body_text.has_value()) {
        return std::optional<HttpRequest>{};
    }
    request.body = std::move(*body_text);
    return std::optional<HttpRequest>(std::move(request));
}

core::errors::Result<std::optional<HttpResponse>> parse_response(
    std::string_view buffer, const bool at_eof, const std::size_t max_body_bytes) {
    auto head_result = parse_head(buffer);
    if (core::errors::is_error(head_result)) {
        return core::errors::get_error(head_result);
    }
    const auto& head = core::errors::get_value(head_result);
    if (!head.has_value()) {
        if (at_eof) {
            return malformed("Connection closed before the response headers arrived");
        }
        return std::optional<HttpResponse>{};
    }

    HttpResponse response;
    const std::string& line = head->start_line;
    const auto first_space = line.find(' ');
    if (line.compare(0, 5, "HTTP/") != 0 || first_space == std::string::npos) {
        return malformed("Malformed status line: " + line);
    }
    const auto code_end = line.find(' ', first_space + 1);
    const std::string code = line.substr(first_space + 1, code_end == std::string::npos
                                                              ? std::string::npos
                                                              : code_end - first_space - 1);
    int status = 0;
    const auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), status);
    if (code.size() != 3 || ec != std::errc() || ptr != code.data() + code.size()) {
        return malformed("Malformed status code: " + line);
    }
    response.status = status;
    response.reason = code_end == std::string::npos ? "" : line.substr(code_end + 1);
    response.headers = head->headers;

    auto body = read_body(response.headers, buffer.substr(head->body_offset), at_eof, true,
                          max_body_bytes);
    if (core::errors::is_error(body)) {
        return core::errors::get_error(body);
    }
    auto& body_text = std::get<std::optional<std::string>>(body);
    if (!body_text.has_value()) {
        return std::optional<HttpResponse>{};
    }
    response.body = std::move(*body_text);
    return std::optional<HttpResponse>(std::move(response));
}

}  // namespace scriptbox::net
