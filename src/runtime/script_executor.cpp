#include "runtime/script_executor.hpp"

#include <utility>
#include "backends/local_backend.hpp"
#include "backends/remote_backend.hpp"
#include "core/logging/logger.hpp"
#include "harness/harness_builder.hpp"
#include "net/http_message.hpp"
#include "runtime/result_normalizer.hpp"

namespace scriptbox::runtime {

using core::errors::ErrorCategory;
using core::errors::ScriptboxError;
using protocol::BackendKind;
using protocol::ExecutionRequest;
using protocol::NormalizedResponse;
using protocol::RawExecutionResult;

namespace {

RawExecutionResult backend_fault(const ScriptboxError& error) {
    RawExecutionResult raw;
    raw.stderr_text = "Runner internal error: " + error.message;
    raw.exit_status = protocol::kExitBackendFault;
    return raw;
}

}  // namespace

ScriptExecutor::ScriptExecutor(policy::ScriptValidator validator,
                               std::shared_ptr<const backends::ExecutionBackend> remote,
                               std::shared_ptr<const backends::ExecutionBackend> local)
    : validator_(std::move(validator)), remote_(std::move(remote)), local_(std::move(local)) {}

core::errors::Result<ScriptExecutor> ScriptExecutor::from_config(
    const core::config::RuntimeConfig& config) {
    backends::LocalBackendOptions local_options;
    local_options.interpreter_command = config.interpreter_command;
    local_options.max_output_bytes = config.max_output_bytes;
    auto local = std::make_shared<const backends::LocalBackend>(std::move(local_options));

    std::shared_ptr<const backends::ExecutionBackend> remote;
    if (!config.runner_url.empty()) {
        auto endpoint = net::parse_http_url(config.runner_url);
        if (core::errors::is_error(endpoint)) {
            auto error = core::errors::get_error(endpoint);
            error.hint = "Set RUNNER_URL to http://host[:port]/path, or to an empty value "
                         "to run locally only.";
            return error;
        }
        remote = std::make_shared<const backends::RemoteBackend>(
            core::errors::get_value(endpoint), config.runner_request_timeout);
    }

    return ScriptExecutor(policy::ScriptValidator(), std::move(remote), std::move(local));
}

NormalizedResponse ScriptExecutor::execute(const ExecutionRequest& request) const {
    return execute_detailed(request).response;
}

ExecutionReport ScriptExecutor::execute_detailed(const ExecutionRequest& request) const {
    ExecutionReport report;
    if (request.timeout.count() <= 0) {
        report.response.error = "Timeout must be a positive number of seconds.";
        return report;
    }

    const auto validation = validator_.validate(request.script);
    if (!validation.accepted()) {
        LOG_INFO("Script rejected: " + validation.summary());
        report.response.error = validation.summary();
        return report;
    }

    LOG_DEBUG("Memory limit of " + std::to_string(request.memory_limit_mb) +
              " MB requested; not enforced by the execution backends");
    const std::string harness_source = harness::build_harness(request.script);
    RawExecutionResult raw = run_with_fallback(harness_source, request.timeout, report.backend);
    LOG_DEBUG("Backend " + protocol::to_string(report.backend) + " finished: " +
              protocol::describe_exit_status(raw.exit_status));

    report.response = normalize(raw, request.timeout);
    report.raw = std::move(raw);
    return report;
}

RawExecutionResult ScriptExecutor::run_with_fallback(const std::string& harness_source,
                                                     const std::chrono::seconds timeout,
                                                     BackendKind& used) const {
    std::optional<std::string> fallback_note;
    if (remote_) {
        used = BackendKind::Remote;
        auto remote_result = remote_->run(harness_source, timeout);
        if (!core::errors::is_error(remote_result)) {
            return core::errors::get_value(remote_result);
        }
        const auto& error = core::errors::get_error(remote_result);
        if (error.category != ErrorCategory::BackendUnavailable) {
            LOG_ERROR("Runner fault [" + error.code + "]: " + error.message);
            return backend_fault(error);
        }
        LOG_WARN("Runner unavailable [" + error.code + "], running locally: " + error.message);
        fallback_note = "[runner-unavailable] " + error.message;
    }

    used = BackendKind::Local;
    auto local_result = local_->run(harness_source, timeout);
    RawExecutionResult raw;
    if (core::errors::is_error(local_result)) {
        const auto& error = core::errors::get_error(local_result);
        LOG_ERROR("Local execution fault [" + error.code + "]: " + error.message);
        raw = backend_fault(error);
    } else {
        raw = core::errors::get_value(local_result);
    }

    if (fallback_note.has_value()) {
        raw.stderr_text =
            raw.stderr_text.empty() ? *fallback_note : *fallback_note + "\n" + raw.stderr_text;
        raw.fallback_note = fallback_note;
    }
    return raw;
}

}  // namespace scriptbox::runtime
