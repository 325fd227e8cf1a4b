#pragma once

#include <memory>
#include <optional>
#include "backends/execution_backend.hpp"
#include "core/config/runtime_config.hpp"
#include "core/errors/scriptbox_errors.hpp"
#include "policy/script_validator.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/execution_request.hpp"

namespace scriptbox::runtime {

// Normalized response plus the raw result it came from. `raw` is empty when no
// backend ran (input or validation rejection).
struct ExecutionReport {
    protocol::NormalizedResponse response;
    std::optional<protocol::RawExecutionResult> raw;
    protocol::BackendKind backend = protocol::BackendKind::None;
};

// Validate, build the harness, run it on the remote backend and fall back to
// the local one when the remote is unreachable, then normalize. Immutable
// after construction and safe to share between threads.
class ScriptExecutor {
public:
    // `remote` may be null, in which case the local backend runs directly.
    ScriptExecutor(policy::ScriptValidator validator,
                   std::shared_ptr<const backends::ExecutionBackend> remote,
                   std::shared_ptr<const backends::ExecutionBackend> local);

    static core::errors::Result<ScriptExecutor> from_config(
        const core::config::RuntimeConfig& config);

    protocol::NormalizedResponse execute(const protocol::ExecutionRequest& request) const;

    ExecutionReport execute_detailed(const protocol::ExecutionRequest& request) const;

    const policy::ScriptValidator& validator() const { return validator_; }

private:
    protocol::RawExecutionResult run_with_fallback(const std::string& harness_source,
                                                   std::chrono::seconds timeout,
                                                   protocol::BackendKind& used) const;

    policy::ScriptValidator validator_;
    std::shared_ptr<const backends::ExecutionBackend> remote_;
    std::shared_ptr<const backends::ExecutionBackend> local_;
};

}  // namespace scriptbox::runtime
