#pragma once
#include <string>
#include <variant>

namespace scriptbox::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,              // E.g., invalid CLI flag or malformed environment value
        Validation,         // E.g., script rejected by the static validator
        Execution,          // E.g., the interpreter process could not be driven
        BackendUnavailable, // E.g., remote runner refused the connection or timed out
        Internal            // E.g., pipe/fork/tempfile failures
    };

    // The standardized error payload
    struct ScriptboxError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a ScriptboxError.
    template <typename T>
    using Result = std::variant<T, ScriptboxError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ScriptboxError>(result);
    }

    template <typename T>
    const ScriptboxError& get_error(const Result<T>& result) {
        return std::get<ScriptboxError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:              return "input";
            case ErrorCategory::Validation:         return "validation";
            case ErrorCategory::Execution:          return "execution";
            case ErrorCategory::BackendUnavailable: return "backend_unavailable";
            case ErrorCategory::Internal:           return "internal";
            default: return "unknown";
        }
    }

} // namespace scriptbox::core::errors
