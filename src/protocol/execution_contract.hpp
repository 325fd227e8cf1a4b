#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace scriptbox::protocol {

// Prefix of the single stdout line carrying the script's JSON return value.
inline constexpr std::string_view kResultMarker = "<<<__PY_RESULT__>>>";

// Key of the object the harness emits when the return value cannot be serialized.
inline constexpr std::string_view kSerializationErrorKey = "__error__";

// Process exit statuses shared by both backends.
inline constexpr int kExitSuccess = 0;
inline constexpr int kExitUserException = 1;
inline constexpr int kExitNotSerializable = 2;
inline constexpr int kExitTimedOut = -1;
inline constexpr int kExitBackendFault = -2;

struct RawExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_status = kExitSuccess;
    std::optional<std::string> fallback_note;
};

// Exactly one of `result` / `error` is set on a well-formed run. A script
// returning None yields a JSON null `result`.
struct NormalizedResponse {
    std::optional<nlohmann::json> result;
    std::string stdout_text;
    std::optional<std::string> error;
};

inline nlohmann::json to_json(const NormalizedResponse& response) {
    nlohmann::json payload;
    payload["result"] = response.result.has_value() ? response.result.value()
                                                    : nlohmann::json(nullptr);
    payload["stdout"] = response.stdout_text;
    payload["error"] = response.error.has_value() ? nlohmann::json(response.error.value())
                                                  : nlohmann::json(nullptr);
    return payload;
}

inline std::string describe_exit_status(const int status) {
    switch (status) {
        case kExitSuccess:
            return "success";
        case kExitUserException:
            return "user_exception";
        case kExitNotSerializable:
            return "not_serializable";
        case kExitTimedOut:
            return "timed_out";
        case kExitBackendFault:
            return "backend_fault";
        default:
            return status < 0 ? "backend_fault" : "exit_" + std::to_string(status);
    }
}

}  // namespace scriptbox::protocol
