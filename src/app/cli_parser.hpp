#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/scriptbox_errors.hpp"

namespace scriptbox::app::cli {

    enum class Command {
        Run,
        Validate
    };

    struct CliRequest {
        Command command = Command::Run;
        // Exactly one of the two is set.
        std::optional<std::string> code;
        std::optional<std::filesystem::path> script_file;
        // Unset values fall back to the environment configuration.
        std::optional<std::uint32_t> timeout_seconds;
        std::optional<std::uint32_t> memory_limit_mb;
        std::optional<std::string> runner_url;
        bool local_only = false;
        bool verbose = false;
    };

    struct RunnerCliOptions {
        std::string host = "0.0.0.0";
        std::uint16_t port = 5000;
        std::uint32_t max_concurrent_requests = 8;
        bool verbose = false;
    };

    scriptbox::core::errors::Result<CliRequest> parse_and_validate(int argc, char* argv[]);

    scriptbox::core::errors::Result<RunnerCliOptions> parse_runner_options(int argc, char* argv[]);

    // Returns the --code text or the contents of --script-file.
    scriptbox::core::errors::Result<std::string> load_script(const CliRequest& request);

} // namespace scriptbox::app::cli
