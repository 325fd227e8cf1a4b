#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "backends/execution_backend.hpp"
#include "core/errors/scriptbox_errors.hpp"
#include "net/http_message.hpp"

namespace scriptbox::runner {

struct RunnerServerOptions {
    std::string host = "0.0.0.0";
    // 0 binds an ephemeral port; bind() reports the one chosen.
    std::uint16_t port = 5000;
    std::size_t max_concurrent_requests = 8;
    std::size_t max_body_bytes = 1024 * 1024;
    std::chrono::seconds default_timeout{5};
    // Bound on receiving one request and on each blocking send.
    std::chrono::seconds io_timeout{30};
};

// HTTP front of an execution backend:
//   POST /run    {"harness", "timeout"} -> {"stdout", "stderr", "return_code"}
//   GET  /health {"ok": true}
// Each connection is served on its own thread; connections beyond
// max_concurrent_requests get 503.
class RunnerServer {
public:
    RunnerServer(RunnerServerOptions options,
                 std::shared_ptr<const backends::ExecutionBackend> backend);
    ~RunnerServer();

    RunnerServer(const RunnerServer&) = delete;
    RunnerServer& operator=(const RunnerServer&) = delete;

    // Binds and listens. Returns the bound port.
    core::errors::Result<std::uint16_t> bind();

    // Accepts connections until stop(); joins every connection thread before
    // returning, so no worker outlives the call.
    void serve();

    // Only stores a flag, so it may be called from a signal handler.
    void stop();

    net::HttpResponse handle(const net::HttpRequest& request) const;

private:
    struct Worker {
        std::thread thread;
        std::unique_ptr<std::atomic<bool>> finished;
    };

    // Joins finished workers, or all of them when `all` is set.
    void reap_workers(bool all);
    void serve_connection(int client_fd);
    void reject_busy(int client_fd) const;
    net::HttpResponse handle_run(const net::HttpRequest& request) const;

    RunnerServerOptions options_;
    std::shared_ptr<const backends::ExecutionBackend> backend_;
    int listen_fd_ = -1;
    std::atomic<bool> stopping_{false};

    // Owned by the serve() thread.
    std::vector<Worker> workers_;
};

}  // namespace scriptbox::runner
