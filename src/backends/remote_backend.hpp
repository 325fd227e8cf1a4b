#pragma once

#include <chrono>
#include <string>
#include "backends/execution_backend.hpp"
#include "net/http_message.hpp"

namespace scriptbox::backends {

// Posts {"harness", "timeout"} to a runner service and maps its
// {"stdout", "stderr", "return_code"} reply. Anything other than a 2xx reply of
// exactly that shape is reported as BackendUnavailable.
class RemoteBackend : public ExecutionBackend {
public:
    RemoteBackend(net::HttpUrl endpoint, std::chrono::seconds request_timeout);

    core::errors::Result<protocol::RawExecutionResult> run(
        const std::string& harness_source, std::chrono::seconds timeout) const override;

    protocol::BackendKind kind() const override { return protocol::BackendKind::Remote; }

    // The transport deadline always outlives the execution timeout so a slow
    // but healthy runner is not mistaken for an unreachable one.
    std::chrono::seconds transport_deadline(std::chrono::seconds timeout) const;

    const net::HttpUrl& endpoint() const { return endpoint_; }

private:
    net::HttpUrl endpoint_;
    std::chrono::seconds request_timeout_;
};

}  // namespace scriptbox::backends
