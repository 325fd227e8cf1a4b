#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace scriptbox::protocol {

    // One logical execute_script call.
    struct ExecutionRequest {
        std::string script;
        std::chrono::seconds timeout{5};
        // Accepted and carried for forward compatibility; neither backend enforces it.
        std::uint32_t memory_limit_mb = 128;
    };

    enum class BackendKind {
        None,
        Remote,
        Local
    };

    inline std::string to_string(const BackendKind kind) {
        switch (kind) {
            case BackendKind::None:
                return "none";
            case BackendKind::Remote:
                return "remote";
            case BackendKind::Local:
                return "local";
            default:
                return "unknown";
        }
    }

} // namespace scriptbox::protocol
