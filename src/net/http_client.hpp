#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include "core/errors/scriptbox_errors.hpp"
#include "net/http_message.hpp"

namespace scriptbox::net {

// Blocking HTTP/1.1 client over POSIX sockets, one connection per request.
// Every failure (name resolution, connect, send, receive, framing, deadline)
// is reported with ErrorCategory::BackendUnavailable.
class HttpClient {
public:
    explicit HttpClient(std::chrono::milliseconds deadline,
                        std::size_t max_response_bytes = 128 * 1024 * 1024);

    core::errors::Result<HttpResponse> send(const HttpUrl& url,
                                            const HttpRequest& request) const;

    core::errors::Result<HttpResponse> post_json(const HttpUrl& url,
                                                 const std::string& body) const;

private:
    std::chrono::milliseconds deadline_;
    std::size_t max_response_bytes_;
};

}  // namespace scriptbox::net
