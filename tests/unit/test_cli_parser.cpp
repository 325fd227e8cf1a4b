#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/config/request_id.hpp"
#include "core/errors/scriptbox_errors.hpp"

namespace {

using scriptbox::app::cli::CliRequest;
using scriptbox::app::cli::Command;
using scriptbox::app::cli::load_script;
using scriptbox::app::cli::parse_and_validate;
using scriptbox::app::cli::parse_runner_options;
using scriptbox::app::cli::RunnerCliOptions;
using scriptbox::core::errors::ErrorCategory;
using scriptbox::core::errors::get_error;
using scriptbox::core::errors::get_value;
using scriptbox::core::errors::is_error;

std::vector<char*> make_argv(std::vector<std::string>& owned_args) {
    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }
    return argv;
}

scriptbox::core::errors::Result<CliRequest> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("scriptbox");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    auto argv = make_argv(owned_args);
    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

scriptbox::core::errors::Result<RunnerCliOptions> parse_runner_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.emplace_back("scriptbox-runner");
    owned_args.insert(owned_args.end(), tokens.begin(), tokens.end());

    auto argv = make_argv(owned_args);
    return parse_runner_options(static_cast<int>(argv.size()), argv.data());
}

class TempScriptFile {
public:
    explicit TempScriptFile(const std::string& content) {
        path_ = std::filesystem::current_path() /
                (".tmp_cli_parser_" + scriptbox::core::config::generate_request_id() + ".py");
        std::ofstream out(path_);
        out << content;
    }

    ~TempScriptFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, FailsWhenCodeOrScriptFileMissing) {
    auto result = parse_tokens({"run"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenCodeAndScriptFileBothProvided) {
    auto result = parse_tokens({"run", "--code", "def main(): return 1", "--script-file", "a.py"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "conflicting_flags");
}

TEST(CliParserTest, FailsWhenLocalOnlyAndRunnerUrlBothProvided) {
    auto result = parse_tokens({"run", "--code", "x", "--local-only", "--runner-url",
                                "http://localhost:5000/run"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "conflicting_flags");
}

TEST(CliParserTest, FailsWhenFlagValueMissing) {
    auto result = parse_tokens({"run", "--code"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsWhenArgumentUnknown) {
    auto result = parse_tokens({"run", "--code", "x", "--memory", "12"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenTimeoutNotNumeric) {
    auto result = parse_tokens({"run", "--code", "x", "--timeout", "abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenTimeoutHasTrailingCharacters) {
    auto result = parse_tokens({"run", "--code", "x", "--timeout", "5s"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenTimeoutOutOfBounds) {
    auto zero = parse_tokens({"run", "--code", "x", "--timeout", "0"});
    ASSERT_TRUE(is_error(zero));
    EXPECT_EQ(get_error(zero).code, "bounds_error");

    auto large = parse_tokens({"run", "--code", "x", "--timeout", "301"});
    ASSERT_TRUE(is_error(large));
    EXPECT_EQ(get_error(large).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenMemoryOutOfBounds) {
    auto result = parse_tokens({"run", "--code", "x", "--memory-mb", "65537"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenScriptFileMissing) {
    const auto missing_file =
        std::filesystem::current_path() / "__definitely_missing_cli_parser_script__.py";
    auto result = parse_tokens({"validate", "--script-file", missing_file.string()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, ParsesValidCodeRequest) {
    auto result = parse_tokens({"run", "--code", "def main(): return 1", "--timeout", "12",
                                "--memory-mb", "256", "--runner-url",
                                "http://localhost:5000/run", "--verbose"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.command, Command::Run);
    ASSERT_TRUE(req.code.has_value());
    EXPECT_EQ(req.code.value(), "def main(): return 1");
    EXPECT_FALSE(req.script_file.has_value());
    ASSERT_TRUE(req.timeout_seconds.has_value());
    EXPECT_EQ(req.timeout_seconds.value(), 12u);
    ASSERT_TRUE(req.memory_limit_mb.has_value());
    EXPECT_EQ(req.memory_limit_mb.value(), 256u);
    ASSERT_TRUE(req.runner_url.has_value());
    EXPECT_EQ(req.runner_url.value(), "http://localhost:5000/run");
    EXPECT_FALSE(req.local_only);
    EXPECT_TRUE(req.verbose);
}

TEST(CliParserTest, ParsesValidScriptFileRequestAndLoadsIt) {
    TempScriptFile script("def main():\n    return [1, 2]\n");
    auto result = parse_tokens({"validate", "--script-file", script.path().string(),
                                "--local-only"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.command, Command::Validate);
    ASSERT_TRUE(req.script_file.has_value());
    EXPECT_FALSE(req.timeout_seconds.has_value());
    EXPECT_FALSE(req.memory_limit_mb.has_value());
    EXPECT_TRUE(req.local_only);
    EXPECT_FALSE(req.verbose);

    auto loaded = load_script(req);
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded), "def main():\n    return [1, 2]\n");
}

TEST(CliParserTest, RunnerOptionsUseDefaults) {
    auto result = parse_runner_tokens({});
    ASSERT_FALSE(is_error(result));
    const auto& options = get_value(result);
    EXPECT_EQ(options.host, "0.0.0.0");
    EXPECT_EQ(options.port, 5000);
    EXPECT_EQ(options.max_concurrent_requests, 8u);
    EXPECT_FALSE(options.verbose);
}

TEST(CliParserTest, RunnerOptionsAcceptEphemeralPort) {
    auto result = parse_runner_tokens({"--host", "127.0.0.1", "--port", "0",
                                       "--max-concurrent", "2", "--verbose"});
    ASSERT_FALSE(is_error(result));
    const auto& options = get_value(result);
    EXPECT_EQ(options.host, "127.0.0.1");
    EXPECT_EQ(options.port, 0);
    EXPECT_EQ(options.max_concurrent_requests, 2u);
    EXPECT_TRUE(options.verbose);
}

TEST(CliParserTest, RunnerOptionsRejectPortOutOfRange) {
    auto result = parse_runner_tokens({"--port", "70000"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

}  // namespace
