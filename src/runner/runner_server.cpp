#include "runner/runner_server.hpp"

#include <cerrno>
#include <climits>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <optional>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace scriptbox::runner {

using core::errors::ErrorCategory;
using core::errors::ScriptboxError;
using net::HttpRequest;
using net::HttpResponse;

namespace {

constexpr int kListenBacklog = 64;
constexpr int kAcceptPollMs = 200;
constexpr int kBusyDrainMs = 100;

HttpResponse json_response(const int status, const nlohmann::json& body) {
    HttpResponse response;
    response.status = status;
    response.reason = net::reason_phrase(status);
    response.headers = {{"Content-Type", "application/json"}};
    response.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return response;
}

HttpResponse error_response(const int status, const std::string& message) {
    return json_response(status, nlohmann::json{{"error", message}});
}

bool send_all(const int fd, const std::string& data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return false;
    }
    return true;
}

void set_io_timeout(const int fd, const std::chrono::seconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count());
    static_cast<void>(setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)));
    static_cast<void>(setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)));
}

std::string path_of(const std::string& target) {
    return target.substr(0, target.find('?'));
}

}  // namespace

RunnerServer::RunnerServer(RunnerServerOptions options,
                           std::shared_ptr<const backends::ExecutionBackend> backend)
    : options_(std::move(options)), backend_(std::move(backend)) {}

RunnerServer::~RunnerServer() {
    if (listen_fd_ >= 0) {
        static_cast<void>(close(listen_fd_));
    }
}

core::errors::Result<std::uint16_t> RunnerServer::bind() {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;
    addrinfo* resolved = nullptr;
    const std::string port = std::to_string(options_.port);
    const int gai = getaddrinfo(options_.host.c_str(), port.c_str(), &hints, &resolved);
    if (gai != 0) {
        return ScriptboxError{ErrorCategory::Input,
                              "Cannot resolve listen address '" + options_.host +
                                  "': " + gai_strerror(gai),
                              "invalid_listen_address"};
    }

    std::string last_error = "no usable address";
    for (addrinfo* ai = resolved; ai != nullptr; ai = ai->ai_next) {
        const int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        int true_ = 1;
        static_cast<void>(setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &true_, sizeof(true_)));
        if (::bind(fd, ai->ai_addr, ai->ai_addrlen) != 0 || listen(fd, kListenBacklog) != 0) {
            last_error = std::strerror(errno);
            static_cast<void>(close(fd));
            continue;
        }
        listen_fd_ = fd;
        break;
    }
    freeaddrinfo(resolved);

    if (listen_fd_ < 0) {
        return ScriptboxError{ErrorCategory::Internal,
                              "Failed to listen on " + options_.host + ":" + port + ": " +
                                  last_error,
                              "bind_failed", "Is another process using the port?"};
    }

    sockaddr_storage bound{};
    socklen_t length = sizeof(bound);
    if (getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &length) != 0) {
        return ScriptboxError{ErrorCategory::Internal,
                              "getsockname() failed: " + std::string(std::strerror(errno)),
                              "bind_failed"};
    }
    const std::uint16_t bound_port =
        bound.ss_family == AF_INET6
            ? ntohs(reinterpret_cast<const sockaddr_in6*>(&bound)->sin6_port)
            : ntohs(reinterpret_cast<const sockaddr_in*>(&bound)->sin_port);
    LOG_INFO("Runner listening on " + options_.host + ":" + std::to_string(bound_port));
    return bound_port;
}

void RunnerServer::serve() {
    while (!stopping_.load()) {
        reap_workers(false);
        pollfd pfd{listen_fd_, POLLIN, 0};
        const int ready = poll(&pfd, 1, kAcceptPollMs);
        if (ready <= 0) {
            continue;
        }

        const int client_fd = accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) {
            continue;
        }

        reap_workers(false);
        if (workers_.size() >= options_.max_concurrent_requests) {
            reject_busy(client_fd);
            continue;
        }

        Worker worker;
        worker.finished = std::make_unique<std::atomic<bool>>(false);
        std::atomic<bool>* finished = worker.finished.get();
        try {
            worker.thread = std::thread([this, client_fd, finished]() {
                serve_connection(client_fd);
                finished->store(true);
            });
        } catch (const std::system_error& e) {
            LOG_ERROR("Cannot start connection thread: " + std::string(e.what()));
            reject_busy(client_fd);
            continue;
        }
        workers_.push_back(std::move(worker));
    }

    reap_workers(true);
    LOG_INFO("Runner stopped");
}

void RunnerServer::reap_workers(const bool all) {
    auto it = workers_.begin();
    while (it != workers_.end()) {
        if (all || it->finished->load()) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void RunnerServer::stop() {
    stopping_.store(true);
}

void RunnerServer::reject_busy(const int client_fd) const {
    LOG_WARN("Runner busy; rejecting connection with 503");
    // Consume the request bytes that arrive promptly so close() does not reset
    // the connection before the client reads the reply.
    pollfd pfd{client_fd, POLLIN, 0};
    if (poll(&pfd, 1, kBusyDrainMs) > 0) {
        char discard[16384];
        static_cast<void>(recv(client_fd, discard, sizeof(discard), MSG_DONTWAIT));
    }
    static_cast<void>(
        send_all(client_fd, net::serialize_response(error_response(503, "Runner is busy"))));
    static_cast<void>(shutdown(client_fd, SHUT_WR));
    static_cast<void>(close(client_fd));
}

void RunnerServer::serve_connection(const int client_fd) {
    set_io_timeout(client_fd, options_.io_timeout);

    std::string buffer;
    char chunk[16384];
    std::optional<HttpResponse> response;
    while (!response.has_value()) {
        const ssize_t n = recv(client_fd, chunk, sizeof(chunk), 0);
        if (n == 0) {
            break;
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                response = error_response(408, "Timed out reading request");
            }
            break;
        }
        buffer.append(chunk, static_cast<std::size_t>(n));

        auto parsed = net::parse_request(buffer, options_.max_body_bytes);
        if (core::errors::is_error(parsed)) {
            const auto& error = core::errors::get_error(parsed);
            if (error.code == "payload_too_large") {
                response = error_response(413, "Request body too large");
            } else if (error.code == "header_too_large") {
                response = error_response(431, "Request headers too large");
            } else {
                response = error_response(400, "Malformed HTTP request");
            }
            break;
        }
        const auto& request = core::errors::get_value(parsed);
        if (request.has_value()) {
            response = handle(*request);
            LOG_INFO(request->method + " " + path_of(request->target) + " -> " +
                     std::to_string(response->status));
        }
    }

    if (response.has_value() && !send_all(client_fd, net::serialize_response(*response))) {
        LOG_WARN("Failed to send response: " + std::string(std::strerror(errno)));
    }
    static_cast<void>(shutdown(client_fd, SHUT_WR));
    static_cast<void>(close(client_fd));
}

HttpResponse RunnerServer::handle(const HttpRequest& request) const {
    const std::string path = path_of(request.target);
    if (path == "/health") {
        if (request.method != "GET") {
            return error_response(405, "Method not allowed");
        }
        return json_response(200, nlohmann::json{{"ok", true}});
    }
    if (path == "/run") {
        if (request.method != "POST") {
            return error_response(405, "Method not allowed");
        }
        return handle_run(request);
    }
    return error_response(404, "Not found");
}

HttpResponse RunnerServer::handle_run(const HttpRequest& request) const {
    const auto body = nlohmann::json::parse(request.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return error_response(400, "Request body must be a JSON object");
    }

    const auto harness = body.find("harness");
    if (harness == body.end() || !harness->is_string() ||
        harness->get_ref<const std::string&>().empty()) {
        return error_response(400, "Missing or invalid 'harness'");
    }

    std::chrono::seconds timeout = options_.default_timeout;
    const auto timeout_field = body.find("timeout");
    if (timeout_field != body.end() && !timeout_field->is_null()) {
        if (!timeout_field->is_number()) {
            return error_response(400, "Invalid 'timeout'");
        }
        const double seconds = timeout_field->get<double>();
        if (seconds < 1 || seconds > INT_MAX) {
            return error_response(400, "Invalid 'timeout'");
        }
        timeout = std::chrono::seconds(static_cast<long long>(seconds));
    }

    auto result = backend_->run(harness->get_ref<const std::string&>(), timeout);
    nlohmann::json reply;
    if (core::errors::is_error(result)) {
        const auto& error = core::errors::get_error(result);
        LOG_ERROR("Execution fault [" + error.code + "]: " + error.message);
        reply["stdout"] = "";
        reply["stderr"] = "Runner internal error: " + error.message;
        reply["return_code"] = protocol::kExitBackendFault;
    } else {
        const auto& raw = core::errors::get_value(result);
        reply["stdout"] = raw.stdout_text;
        reply["stderr"] = raw.stderr_text;
        reply["return_code"] = raw.exit_status;
    }
    return json_response(200, reply);
}

}  // namespace scriptbox::runner
