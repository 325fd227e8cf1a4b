#include "net/http_client.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <condition_variable>
#include <cstring>
#include <memory>
#include <mutex>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace scriptbox::net {

using core::errors::ErrorCategory;
using core::errors::ScriptboxError;

namespace {

using Clock = std::chrono::steady_clock;

class SocketHandle {
public:
    explicit SocketHandle(const int fd) : fd_(fd) {}
    ~SocketHandle() {
        if (fd_ >= 0) {
            static_cast<void>(close(fd_));
        }
    }

    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

enum class WaitOutcome { Ready, TimedOut, Failed };

ScriptboxError unavailable(const std::string& message, const std::string& code) {
    return ScriptboxError{ErrorCategory::BackendUnavailable, message, code};
}

int remaining_ms(const Clock::time_point deadline) {
    const auto left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    if (left <= 0) {
        return 0;
    }
    return static_cast<int>(std::min<long long>(left, INT_MAX));
}

WaitOutcome wait_for(const int fd, const short events, const Clock::time_point deadline) {
    while (true) {
        const int timeout = remaining_ms(deadline);
        if (timeout == 0) {
            return WaitOutcome::TimedOut;
        }
        pollfd pfd{fd, events, 0};
        const int rc = poll(&pfd, 1, timeout);
        if (rc > 0) {
            return WaitOutcome::Ready;
        }
        if (rc == 0) {
            return WaitOutcome::TimedOut;
        }
        if (errno != EINTR) {
            return WaitOutcome::Failed;
        }
    }
}

std::string endpoint_text(const HttpUrl& url) {
    return url.host + ":" + std::to_string(url.port);
}

// Result of one getaddrinfo() call, shared with the thread that performs it.
struct Resolution {
    Resolution() = default;
    Resolution(const Resolution&) = delete;
    Resolution& operator=(const Resolution&) = delete;
    ~Resolution() {
        if (addresses != nullptr) {
            freeaddrinfo(addresses);
        }
    }

    std::mutex mutex;
    std::condition_variable finished;
    bool done = false;
    int status = 0;
    addrinfo* addresses = nullptr;
};

// getaddrinfo() has no timeout of its own. Numeric hosts resolve inline; names
// are looked up on a detached thread that the caller stops waiting for at the
// deadline. The thread keeps the Resolution alive until it returns.
core::errors::Result<std::shared_ptr<Resolution>> resolve(const HttpUrl& url,
                                                          const Clock::time_point deadline) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICHOST;
    const std::string port = std::to_string(url.port);

    auto resolution = std::make_shared<Resolution>();
    int status = getaddrinfo(url.host.c_str(), port.c_str(), &hints, &resolution->addresses);
    if (status == EAI_NONAME) {
        hints.ai_flags = 0;
        try {
            std::thread([resolution, host = url.host, port, hints]() {
                addrinfo* addresses = nullptr;
                const int rc = getaddrinfo(host.c_str(), port.c_str(), &hints, &addresses);
                std::lock_guard<std::mutex> lock(resolution->mutex);
                resolution->status = rc;
                resolution->addresses = addresses;
                resolution->done = true;
                resolution->finished.notify_all();
            }).detach();
        } catch (const std::system_error& e) {
            return unavailable("Failed to resolve " + url.host + ": " + e.what(), "dns_failure");
        }

        std::unique_lock<std::mutex> lock(resolution->mutex);
        if (!resolution->finished.wait_until(lock, deadline,
                                             [&resolution]() { return resolution->done; })) {
            return unavailable("Timed out resolving " + url.host, "transport_timeout");
        }
        status = resolution->status;
    }
    if (status != 0) {
        return unavailable("Failed to resolve " + url.host + ": " + gai_strerror(status),
                           "dns_failure");
    }
    return resolution;
}

core::errors::Result<int> connect_to(const HttpUrl& url, const Clock::time_point deadline) {
    auto resolved = resolve(url, deadline);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::shared_ptr<Resolution> resolution = core::errors::get_value(resolved);

    std::string last_error = "no addresses";
    bool timed_out = false;
    int connected = -1;
    for (addrinfo* ai = resolution->addresses; ai != nullptr && connected < 0;
         ai = ai->ai_next) {
        const int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC | SOCK_NONBLOCK,
                              ai->ai_protocol);
        if (fd < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            connected = fd;
            break;
        }
        if (errno != EINPROGRESS) {
            last_error = std::strerror(errno);
            static_cast<void>(close(fd));
            continue;
        }

        const WaitOutcome outcome = wait_for(fd, POLLOUT, deadline);
        if (outcome == WaitOutcome::TimedOut) {
            timed_out = true;
            static_cast<void>(close(fd));
            break;
        }
        int so_error = 0;
        socklen_t length = sizeof(so_error);
        if (outcome == WaitOutcome::Failed ||
            getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &length) != 0) {
            last_error = std::strerror(errno);
            static_cast<void>(close(fd));
            continue;
        }
        if (so_error != 0) {
            last_error = std::strerror(so_error);
            static_cast<void>(close(fd));
            continue;
        }
        connected = fd;
    }

    if (connected >= 0) {
        return connected;
    }
    if (timed_out) {
        return unavailable("Timed out connecting to " + endpoint_text(url), "transport_timeout");
    }
    return unavailable("Failed to connect to " + endpoint_text(url) + ": " + last_error,
                       "connect_failed");
}

}  // namespace

HttpClient::HttpClient(const std::chrono::milliseconds deadline,
                       const std::size_t max_response_bytes)
    : deadline_(deadline), max_response_bytes_(max_response_bytes) {}

core::errors::Result<HttpResponse> HttpClient::send(const HttpUrl& url,
                                                    const HttpRequest& request) const {
    const auto deadline = Clock::now() + deadline_;
    auto connected = connect_to(url, deadline);
    if (core::errors::is_error(connected)) {
        return core::errors::get_error(connected);
    }
    const SocketHandle socket_handle(core::errors::get_value(connected));
    const int fd = socket_handle.get();

    const std::string wire = serialize_request(request, url);
    std::size_t sent = 0;
    while (sent < wire.size()) {
        const ssize_t n = ::send(fd, wire.data() + sent, wire.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            const WaitOutcome outcome = wait_for(fd, POLLOUT, deadline);
            if (outcome == WaitOutcome::TimedOut) {
                return unavailable("Timed out sending request to " + endpoint_text(url),
                                   "transport_timeout");
            }
            if (outcome == WaitOutcome::Failed) {
                return unavailable("poll() failed while sending: " +
                                       std::string(std::strerror(errno)),
                                   "send_failed");
            }
            continue;
        }
        return unavailable("Failed to send request to " + endpoint_text(url) + ": " +
                               std::strerror(errno),
                           "send_failed");
    }

    // The connection is closed by the peer after the response, so the buffer is
    // only re-parsed after it has grown substantially or at EOF.
    std::string buffer;
    std::size_t next_parse_at = 0;
    char chunk[16384];
    while (true) {
        const WaitOutcome outcome = wait_for(fd, POLLIN, deadline);
        if (outcome == WaitOutcome::TimedOut) {
            return unavailable("Timed out waiting for response from " + endpoint_text(url),
                               "transport_timeout");
        }
        if (outcome == WaitOutcome::Failed) {
            return unavailable("poll() failed while receiving: " +
                                   std::string(std::strerror(errno)),
                               "receive_failed");
        }

        const ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            return unavailable("Failed to read response from " + endpoint_text(url) + ": " +
                                   std::strerror(errno),
                               "receive_failed");
        }

        const bool at_eof = n == 0;
        buffer.append(chunk, static_cast<std::size_t>(n));
        if (buffer.size() > max_response_bytes_ + kMaxHeaderBytes) {
            return unavailable("Response from " + endpoint_text(url) + " is too large",
                               "response_too_large");
        }
        if (!at_eof && buffer.size() < next_parse_at) {
            continue;
        }

        auto parsed = parse_response(buffer, at_eof, max_response_bytes_);
        if (core::errors::is_error(parsed)) {
            return unavailable("Malformed HTTP response from " + endpoint_text(url) + ": " +
                                   core::errors::get_error(parsed).message,
                               "malformed_response");
        }
        auto& response = std::get<std::optional<HttpResponse>>(parsed);
        if (response.has_value()) {
            return std::move(*response);
        }
        if (at_eof) {
            return unavailable("Connection closed before a complete response from " +
                                   endpoint_text(url),
                               "malformed_response");
        }
        next_parse_at = std::max<std::size_t>(buffer.size() * 2, buffer.size() + 4096);
    }
}

core::errors::Result<HttpResponse> HttpClient::post_json(const HttpUrl& url,
                                                         const std::string& body) const {
    HttpRequest request;
    request.method = "POST";
    request.target = url.path;
    request.headers = {{"Content-Type", "application/json"},
                       {"Accept", "application/json"},
                       {"User-Agent", "scriptbox"}};
    request.body = body;
    return send(url, request);
}

}  // namespace scriptbox::net
