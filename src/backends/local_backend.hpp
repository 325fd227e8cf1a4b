#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "backends/execution_backend.hpp"

namespace scriptbox::backends {

struct LocalBackendOptions {
    // argv prefix; the harness file path is appended as the last argument.
    std::vector<std::string> interpreter_command = {"python3"};
    std::size_t max_output_bytes = 16 * 1024 * 1024;
    // Where the ephemeral harness file is created. Empty means the system
    // temporary directory.
    std::filesystem::path temp_directory;
};

// Child-process backend. Each run writes the harness to a private temporary
// file, runs the interpreter in its own process group and kills the whole
// group when the timeout expires.
class LocalBackend : public ExecutionBackend {
public:
    explicit LocalBackend(LocalBackendOptions options = {});

    core::errors::Result<protocol::RawExecutionResult> run(
        const std::string& harness_source, std::chrono::seconds timeout) const override;

    protocol::BackendKind kind() const override { return protocol::BackendKind::Local; }

    const LocalBackendOptions& options() const { return options_; }

private:
    LocalBackendOptions options_;
};

}  // namespace scriptbox::backends
