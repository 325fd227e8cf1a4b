#include "backends/remote_backend.hpp"

#include <algorithm>
#include <limits>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "net/http_client.hpp"

namespace scriptbox::backends {

using core::errors::ErrorCategory;
using core::errors::ScriptboxError;
using protocol::RawExecutionResult;

namespace {

constexpr std::chrono::seconds kTransportGrace{2};

ScriptboxError bad_reply(const std::string& message) {
    return ScriptboxError{ErrorCategory::BackendUnavailable, message, "invalid_runner_reply"};
}

}  // namespace

RemoteBackend::RemoteBackend(net::HttpUrl endpoint, const std::chrono::seconds request_timeout)
    : endpoint_(std::move(endpoint)), request_timeout_(request_timeout) {}

std::chrono::seconds RemoteBackend::transport_deadline(const std::chrono::seconds timeout) const {
    return std::max(request_timeout_, timeout + kTransportGrace);
}

core::errors::Result<RawExecutionResult> RemoteBackend::run(
    const std::string& harness_source, const std::chrono::seconds timeout) const {
    nlohmann::json payload;
    payload["harness"] = harness_source;
    payload["timeout"] = timeout.count();
    const std::string body =
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    const net::HttpClient client(transport_deadline(timeout));
    auto sent = client.post_json(endpoint_, body);
    if (core::errors::is_error(sent)) {
        return core::errors::get_error(sent);
    }
    const auto& response = core::errors::get_value(sent);
    LOG_DEBUG("Runner replied with HTTP " + std::to_string(response.status));

    if (response.status < 200 || response.status > 299) {
        return ScriptboxError{ErrorCategory::BackendUnavailable,
                              "Runner responded with HTTP " + std::to_string(response.status),
                              "runner_http_status"};
    }

    const auto reply = nlohmann::json::parse(response.body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        return bad_reply("Runner reply is not a JSON object");
    }
    const auto stdout_it = reply.find("stdout");
    const auto stderr_it = reply.find("stderr");
    const auto code_it = reply.find("return_code");
    if (stdout_it == reply.end() || !stdout_it->is_string() || stderr_it == reply.end() ||
        !stderr_it->is_string() || code_it == reply.end() || !code_it->is_number_integer()) {
        return bad_reply("Runner reply lacks string 'stdout', string 'stderr' or integer "
                         "'return_code'");
    }
    const auto code = code_it->get<long long>();
    if (code < std::numeric_limits<int>::min() || code > std::numeric_limits<int>::max()) {
        return bad_reply("Runner reply 'return_code' is out of range");
    }

    RawExecutionResult result;
    result.stdout_text = stdout_it->get<std::string>();
    result.stderr_text = stderr_it->get<std::string>();
    result.exit_status = static_cast<int>(code);
    return result;
}

}  // namespace scriptbox::backends
