#include <arpa/inet.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <netinet/in.h>
#include <optional>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "backends/remote_backend.hpp"
#include "net/http_client.hpp"
#include "net/http_message.hpp"
#include "runner/runner_server.hpp"

namespace {

using scriptbox::backends::ExecutionBackend;
using scriptbox::backends::RemoteBackend;
using scriptbox::core::errors::ErrorCategory;
using scriptbox::core::errors::get_error;
using scriptbox::core::errors::get_value;
using scriptbox::core::errors::is_error;
using scriptbox::core::errors::Result;
using scriptbox::core::errors::ScriptboxError;
using scriptbox::net::HttpUrl;
using scriptbox::protocol::BackendKind;
using scriptbox::protocol::RawExecutionResult;
using scriptbox::runner::RunnerServer;
using scriptbox::runner::RunnerServerOptions;

class FakeBackend : public ExecutionBackend {
public:
    explicit FakeBackend(Result<RawExecutionResult> reply) : reply_(std::move(reply)) {}

    Result<RawExecutionResult> run(const std::string& harness_source,
                                   std::chrono::seconds timeout) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        last_harness_ = harness_source;
        last_timeout_ = timeout;
        return reply_;
    }

    BackendKind kind() const override { return BackendKind::Local; }

    std::string last_harness() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_harness_;
    }
    std::chrono::seconds last_timeout() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_timeout_;
    }

private:
    Result<RawExecutionResult> reply_;
    mutable std::mutex mutex_;
    mutable std::string last_harness_;
    mutable std::chrono::seconds last_timeout_{0};
};

class RunningServer {
public:
    explicit RunningServer(std::shared_ptr<const ExecutionBackend> backend)
        : server_(loopback_options(), std::move(backend)) {
        auto bound = server_.bind();
        if (!is_error(bound)) {
            port_ = get_value(bound);
        }
        thread_ = std::thread([this]() { server_.serve(); });
    }

    ~RunningServer() {
        server_.stop();
        thread_.join();
    }

    HttpUrl run_url() const { return HttpUrl{"127.0.0.1", port_, "/run"}; }

private:
    static RunnerServerOptions loopback_options() {
        RunnerServerOptions options;
        options.host = "127.0.0.1";
        options.port = 0;
        return options;
    }

    RunnerServer server_;
    std::uint16_t port_ = 0;
    std::thread thread_;
};

// Accepts one connection, reads a full request and answers with fixed bytes.
// Without a reply it holds the connection open until destroyed.
class CannedServer {
public:
    explicit CannedServer(std::optional<std::string> reply) : reply_(std::move(reply)) {
        listen_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        address.sin_port = 0;
        if (listen_fd_ >= 0 &&
            ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&address), sizeof(address)) == 0 &&
            listen(listen_fd_, 4) == 0) {
            socklen_t length = sizeof(address);
            if (getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&address), &length) == 0) {
                port_ = ntohs(address.sin_port);
            }
        }
        thread_ = std::thread([this]() { serve_once(); });
    }

    ~CannedServer() {
        done_ = true;
        thread_.join();
        if (listen_fd_ >= 0) {
            close(listen_fd_);
        }
    }

    HttpUrl run_url() const { return HttpUrl{"127.0.0.1", port_, "/run"}; }

    std::string received_body() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_body_;
    }

private:
    bool wait_readable(const int fd) const {
        while (!done_) {
            pollfd pfd{fd, POLLIN, 0};
            if (poll(&pfd, 1, 100) > 0) {
                return true;
            }
        }
        return false;
    }

    void serve_once() {
        if (listen_fd_ < 0 || !wait_readable(listen_fd_)) {
            return;
        }
        const int client = accept(listen_fd_, nullptr, nullptr);
        if (client < 0) {
            return;
        }

        std::string buffer;
        char chunk[4096];
        while (wait_readable(client)) {
            const ssize_t n = recv(client, chunk, sizeof(chunk), 0);
            if (n <= 0) {
                break;
            }
            buffer.append(chunk, static_cast<std::size_t>(n));
            auto parsed = scriptbox::net::parse_request(buffer, 1024 * 1024);
            if (is_error(parsed) || get_value(parsed).has_value()) {
                if (!is_error(parsed)) {
                    std::lock_guard<std::mutex> lock(mutex_);
                    received_body_ = get_value(parsed)->body;
                }
                break;
            }
        }

        if (reply_.has_value()) {
            const std::string& bytes = *reply_;
            std::size_t sent = 0;
            while (sent < bytes.size()) {
                const ssize_t n =
                    send(client, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
                if (n <= 0) {
                    break;
                }
                sent += static_cast<std::size_t>(n);
            }
        } else {
            while (!done_) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        }
        close(client);
    }

    std::optional<std::string> reply_;
    int listen_fd_ = -1;
    std::uint16_t port_ = 0;
    std::atomic<bool> done_{false};
    mutable std::mutex mutex_;
    std::string received_body_;
    std::thread thread_;
};

std::string http_reply(const int status, const std::string& body) {
    scriptbox::net::HttpResponse response;
    response.status = status;
    response.reason = scriptbox::net::reason_phrase(status);
    response.headers = {{"Content-Type", "application/json"}};
    response.body = body;
    return scriptbox::net::serialize_response(response);
}

TEST(RemoteBackendTest, TransportDeadlineOutlivesExecutionTimeout) {
    const RemoteBackend backend(HttpUrl{"runner", 5000, "/run"}, std::chrono::seconds(10));
    EXPECT_EQ(backend.transport_deadline(std::chrono::seconds(5)).count(), 10);
    EXPECT_EQ(backend.transport_deadline(std::chrono::seconds(30)).count(), 32);
    EXPECT_EQ(backend.kind(), BackendKind::Remote);
}

TEST(RemoteBackendTest, MapsRunnerReplyThroughRealServer) {
    RawExecutionResult canned;
    canned.stdout_text = "out\n";
    canned.stderr_text = "err\n";
    canned.exit_status = 2;
    auto fake = std::make_shared<FakeBackend>(canned);
    RunningServer server(fake);

    const RemoteBackend backend(server.run_url(), std::chrono::seconds(5));
    auto result = backend.run("print('harness')\n", std::chrono::seconds(4));
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    const auto& raw = get_value(result);
    EXPECT_EQ(raw.stdout_text, "out\n");
    EXPECT_EQ(raw.stderr_text, "err\n");
    EXPECT_EQ(raw.exit_status, 2);
    EXPECT_FALSE(raw.fallback_note.has_value());
    EXPECT_EQ(fake->last_harness(), "print('harness')\n");
    EXPECT_EQ(fake->last_timeout().count(), 4);
}

TEST(RemoteBackendTest, RunnerFaultArrivesAsBackendFaultStatus) {
    auto fake = std::make_shared<FakeBackend>(
        ScriptboxError{ErrorCategory::Internal, "no interpreter", "interpreter_start_failed"});
    RunningServer server(fake);

    const RemoteBackend backend(server.run_url(), std::chrono::seconds(5));
    auto result = backend.run("x = 1\n", std::chrono::seconds(1));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_status, scriptbox::protocol::kExitBackendFault);
    EXPECT_EQ(get_value(result).stderr_text, "Runner internal error: no interpreter");
}

TEST(RemoteBackendTest, SendsHarnessAndTimeoutAsJson) {
    CannedServer server(http_reply(200, R"({"stdout": "", "stderr": "", "return_code": 0})"));
    const RemoteBackend backend(server.run_url(), std::chrono::seconds(5));

    auto result = backend.run("print(\"é\")\n", std::chrono::seconds(3));
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    const auto sent = nlohmann::json::parse(server.received_body(), nullptr, false);
    ASSERT_TRUE(sent.is_object());
    EXPECT_EQ(sent["harness"], "print(\"é\")\n");
    EXPECT_EQ(sent["timeout"], 3);
}

TEST(RemoteBackendTest, ConnectionRefusedIsUnavailable) {
    std::uint16_t port = 0;
    {
        CannedServer closed(std::nullopt);
        port = closed.run_url().port;
    }
    const RemoteBackend backend(HttpUrl{"127.0.0.1", port, "/run"}, std::chrono::seconds(2));

    auto result = backend.run("x = 1\n", std::chrono::seconds(1));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::BackendUnavailable);
    EXPECT_EQ(get_error(result).code, "connect_failed");
}

TEST(RemoteBackendTest, NonSuccessStatusIsUnavailable) {
    CannedServer server(http_reply(500, R"({"error": "boom"})"));
    const RemoteBackend backend(server.run_url(), std::chrono::seconds(5));

    auto result = backend.run("x = 1\n", std::chrono::seconds(1));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::BackendUnavailable);
    EXPECT_EQ(get_error(result).code, "runner_http_status");
    EXPECT_EQ(get_error(result).message, "Runner responded with HTTP 500");
}

TEST(RemoteBackendTest, RejectsRepliesOfTheWrongShape) {
    for (const std::string body :
         {std::string("not json"), std::string("[1, 2]"),
          std::string(R"({"stdout": "", "stderr": ""})"),
          std::string(R"({"stdout": 1, "stderr": "", "return_code": 0})"),
          std::string(R"({"stdout": "", "stderr": "", "return_code": "0"})"),
          std::string(R"({"stdout": "", "stderr": "", "return_code": 1.5})"),
          std::string(R"({"stdout": "", "stderr": "", "return_code": 99999999999})")}) {
        CannedServer server(http_reply(200, body));
        const RemoteBackend backend(server.run_url(), std::chrono::seconds(5));

        auto result = backend.run("x = 1\n", std::chrono::seconds(1));
        ASSERT_TRUE(is_error(result)) << body;
        EXPECT_EQ(get_error(result).category, ErrorCategory::BackendUnavailable) << body;
        EXPECT_EQ(get_error(result).code, "invalid_runner_reply") << body;
    }
}

TEST(RemoteBackendTest, ClientGivesUpOnSilentRunner) {
    CannedServer silent(std::nullopt);
    const scriptbox::net::HttpClient client(std::chrono::milliseconds(300));

    const auto started = std::chrono::steady_clock::now();
    auto result = client.post_json(silent.run_url(), R"({"harness": "x"})");
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::BackendUnavailable);
    EXPECT_EQ(get_error(result).code, "transport_timeout");
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(RemoteBackendTest, ResolvesHostNames) {
    CannedServer server(http_reply(200, R"({"stdout": "", "stderr": "", "return_code": 0})"));
    const scriptbox::net::HttpClient client(std::chrono::seconds(5));

    auto result = client.post_json(HttpUrl{"localhost", server.run_url().port, "/run"},
                                   R"({"harness": "x"})");
    ASSERT_FALSE(is_error(result)) << get_error(result).message;
    EXPECT_EQ(get_value(result).status, 200);
}

TEST(RemoteBackendTest, NameLookupStaysWithinTheDeadline) {
    const scriptbox::net::HttpClient client(std::chrono::milliseconds(500));

    const auto started = std::chrono::steady_clock::now();
    auto result = client.post_json(HttpUrl{"scriptbox-runner.invalid", 5000, "/run"},
                                   R"({"harness": "x"})");
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::BackendUnavailable);
    EXPECT_TRUE(get_error(result).code == "dns_failure" ||
                get_error(result).code == "transport_timeout")
        << get_error(result).code;
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

}  // namespace
