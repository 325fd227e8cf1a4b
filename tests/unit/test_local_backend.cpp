#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "backends/local_backend.hpp"
#include "core/config/request_id.hpp"
#include "harness/harness_builder.hpp"
#include "protocol/execution_contract.hpp"

namespace {

using scriptbox::backends::LocalBackend;
using scriptbox::backends::LocalBackendOptions;
using scriptbox::core::errors::ErrorCategory;
using scriptbox::core::errors::get_error;
using scriptbox::core::errors::get_value;
using scriptbox::core::errors::is_error;
using scriptbox::harness::build_harness;

bool python_available() {
    static const bool available = std::system("command -v python3 >/dev/null 2>&1") == 0;
    return available;
}

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_local_backend_" + scriptbox::core::config::generate_request_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

    bool empty() const { return std::filesystem::is_empty(root_); }

private:
    std::filesystem::path root_;
};

LocalBackend backend_in(const TempWorkspace& workspace, std::size_t max_output_bytes = 1024 * 1024) {
    LocalBackendOptions options;
    options.temp_directory = workspace.root();
    options.max_output_bytes = max_output_bytes;
    return LocalBackend(options);
}

class LocalBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!python_available()) {
            GTEST_SKIP() << "python3 is not on PATH";
        }
    }

    TempWorkspace workspace_;
};

TEST_F(LocalBackendTest, RunsHarnessAndCapturesStreams) {
    const auto backend = backend_in(workspace_);
    auto result = backend.run(
        build_harness("import sys\n"
                      "def main():\n"
                      "    print('to stdout')\n"
                      "    print('to stderr', file=sys.stderr)\n"
                      "    return 42\n"),
        std::chrono::seconds(10));
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    const auto& raw = get_value(result);
    EXPECT_EQ(raw.exit_status, 0);
    EXPECT_EQ(raw.stdout_text,
              "to stdout\n" + std::string(scriptbox::protocol::kResultMarker) + "42\n");
    EXPECT_EQ(raw.stderr_text, "to stderr\n");
    EXPECT_FALSE(raw.fallback_note.has_value());
    EXPECT_TRUE(workspace_.empty());
}

TEST_F(LocalBackendTest, UserExceptionExitsWithOne) {
    const auto backend = backend_in(workspace_);
    auto result = backend.run(build_harness("def main():\n    return 1 / 0\n"),
                              std::chrono::seconds(10));
    ASSERT_FALSE(is_error(result));

    const auto& raw = get_value(result);
    EXPECT_EQ(raw.exit_status, scriptbox::protocol::kExitUserException);
    EXPECT_NE(raw.stderr_text.find("ZeroDivisionError"), std::string::npos);
    EXPECT_EQ(raw.stdout_text.find(std::string(scriptbox::protocol::kResultMarker)),
              std::string::npos);
}

TEST_F(LocalBackendTest, TimeoutKillsProcessAndRemovesHarnessFile) {
    const auto backend = backend_in(workspace_);
    const auto started = std::chrono::steady_clock::now();
    auto result = backend.run(build_harness("import time\n"
                                            "def main():\n"
                                            "    print('started', flush=True)\n"
                                            "    time.sleep(30)\n"
                                            "    return 1\n"),
                              std::chrono::seconds(1));
    const auto elapsed = std::chrono::steady_clock::now() - started;
    ASSERT_FALSE(is_error(result));

    const auto& raw = get_value(result);
    EXPECT_EQ(raw.exit_status, scriptbox::protocol::kExitTimedOut);
    EXPECT_TRUE(raw.stdout_text.empty());
    EXPECT_EQ(raw.stderr_text, "Execution timed out after 1 seconds");
    EXPECT_LT(elapsed, std::chrono::seconds(10));
    EXPECT_TRUE(workspace_.empty());
}

TEST_F(LocalBackendTest, TimeoutAlsoKillsChildProcesses) {
    const auto backend = backend_in(workspace_);
    const auto started = std::chrono::steady_clock::now();
    auto result = backend.run("import subprocess, time\n"
                              "subprocess.Popen(['sleep', '30'])\n"
                              "time.sleep(30)\n",
                              std::chrono::seconds(1));
    const auto elapsed = std::chrono::steady_clock::now() - started;
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_status, scriptbox::protocol::kExitTimedOut);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST_F(LocalBackendTest, SignalDeathMapsTo128PlusSignal) {
    const auto backend = backend_in(workspace_);
    auto result = backend.run("import os, signal\nos.kill(os.getpid(), signal.SIGKILL)\n",
                              std::chrono::seconds(10));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_status, 128 + 9);
}

TEST_F(LocalBackendTest, CapsCapturedOutput) {
    const auto backend = backend_in(workspace_, 100);
    auto result = backend.run("print('x' * 5000)\n", std::chrono::seconds(10));
    ASSERT_FALSE(is_error(result));

    const auto& raw = get_value(result);
    EXPECT_EQ(raw.exit_status, 0);
    EXPECT_EQ(raw.stdout_text, std::string(100, 'x'));
    EXPECT_EQ(raw.stderr_text, "[scriptbox] stdout truncated at 100 bytes; 4901 bytes dropped.");
}

TEST_F(LocalBackendTest, StdinIsEmpty) {
    const auto backend = backend_in(workspace_);
    auto result = backend.run("import sys\nprint(repr(sys.stdin.read()))\n", std::chrono::seconds(10));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_text, "''\n");
}

TEST_F(LocalBackendTest, RepeatedRunsAreIdentical) {
    const auto backend = backend_in(workspace_);
    const std::string harness =
        build_harness("def main():\n    print('same')\n    return sorted({3, 1, 2})\n");

    auto first = backend.run(harness, std::chrono::seconds(10));
    auto second = backend.run(harness, std::chrono::seconds(10));
    ASSERT_FALSE(is_error(first));
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(first).stdout_text, get_value(second).stdout_text);
    EXPECT_EQ(get_value(first).stderr_text, get_value(second).stderr_text);
    EXPECT_EQ(get_value(first).exit_status, get_value(second).exit_status);
}

TEST(LocalBackendStartTest, MissingInterpreterIsInternalError) {
    TempWorkspace workspace;
    LocalBackendOptions options;
    options.interpreter_command = {"/nonexistent/scriptbox-python"};
    options.temp_directory = workspace.root();
    const LocalBackend backend(options);

    auto result = backend.run("print(1)\n", std::chrono::seconds(5));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Internal);
    EXPECT_EQ(get_error(result).code, "interpreter_start_failed");
    EXPECT_TRUE(workspace.empty());
}

TEST(LocalBackendStartTest, EmptyInterpreterCommandIsRejected) {
    LocalBackendOptions options;
    options.interpreter_command.clear();
    const LocalBackend backend(options);

    auto result = backend.run("print(1)\n", std::chrono::seconds(5));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_interpreter");
}

TEST(LocalBackendStartTest, UnwritableTempDirectoryIsInternalError) {
    LocalBackendOptions options;
    options.temp_directory = std::filesystem::current_path() / "__missing_scriptbox_tmp_dir__";
    const LocalBackend backend(options);

    auto result = backend.run("print(1)\n", std::chrono::seconds(5));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Internal);
    EXPECT_EQ(get_error(result).code, "tempfile_create_failed");
}

}  // namespace
