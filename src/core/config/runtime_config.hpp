#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/scriptbox_errors.hpp"
#include "core/logging/logger.hpp"

namespace scriptbox::core::config {

using EnvironmentLookup =
    std::function<std::optional<std::string>(const std::string& name)>;

struct RuntimeConfig {
    // Empty disables the remote path; the local backend is then used directly.
    std::string runner_url = "http://sandbox-runner:5000/run";
    std::chrono::seconds runner_request_timeout{10};
    std::chrono::seconds default_timeout{5};
    std::uint32_t default_memory_limit_mb = 128;
    std::vector<std::string> interpreter_command = {"python3"};
    std::size_t max_output_bytes = 16 * 1024 * 1024;
    logging::LogLevel log_level = logging::LogLevel::INFO;
};

errors::Result<RuntimeConfig> load_runtime_config(const EnvironmentLookup& lookup);

errors::Result<RuntimeConfig> load_runtime_config_from_environment();

}  // namespace scriptbox::core::config
