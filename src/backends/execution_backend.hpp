#pragma once

#include <chrono>
#include <string>
#include "core/errors/scriptbox_errors.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/execution_request.hpp"

namespace scriptbox::backends {

// Runs one harness to completion or timeout. A BackendUnavailable error means
// the backend could not be reached and another backend may be tried; any other
// error is a fault of the backend itself.
class ExecutionBackend {
public:
    virtual ~ExecutionBackend() = default;

    virtual core::errors::Result<protocol::RawExecutionResult> run(
        const std::string& harness_source, std::chrono::seconds timeout) const = 0;

    virtual protocol::BackendKind kind() const = 0;
};

}  // namespace scriptbox::backends
