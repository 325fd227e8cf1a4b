#include "cli_parser.hpp"
#include <charconv>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

namespace scriptbox::app::cli {

    using namespace scriptbox::core::errors;

    namespace {

        constexpr const char* kUsage =
            "Usage: scriptbox run|validate (--script-file PATH | --code TEXT) "
            "[--timeout N] [--memory-mb N] [--runner-url URL] [--local-only] [--verbose]";

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> code;
            std::optional<std::string> script_file;
            std::optional<std::string> timeout;
            std::optional<std::string> memory_mb;
            std::optional<std::string> runner_url;
            bool local_only = false;
            bool verbose = false;
        };

        struct RawRunnerOptions {
            std::optional<std::string> host;
            std::optional<std::string> port;
            std::optional<std::string> max_concurrent;
            bool verbose = false;
        };

        std::vector<std::string> collect_args(int argc, char* argv[], int first) {
            std::vector<std::string> args;
            for (int i = first; i < argc; ++i) {
                args.push_back(argv[i]);
            }
            return args;
        }

        // Exception-free integer parsing with inclusive bounds
        template <typename T>
        Result<T> parse_bounded(const std::string& flag, const std::string& text, T min, T max) {
            T value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (text.empty() || ec != std::errc() || ptr != end) {
                return ScriptboxError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer",
                                      "Provide a non-negative integer."};
            }
            if (value < min || value > max) {
                return ScriptboxError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                                      "Must be between " + std::to_string(min) + " and " + std::to_string(max) + "."};
            }
            return value;
        }

        ScriptboxError missing_value(const std::string& flag) {
            return ScriptboxError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
        }

    } // namespace

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return ScriptboxError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        const std::string command = argv[1];
        CliRequest req;
        if (command == "run") {
            req.command = Command::Run;
        } else if (command == "validate") {
            req.command = Command::Validate;
        } else {
            return ScriptboxError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command",
                                  "Supported commands are 'run' and 'validate'."};
        }

        RawCliOptions raw;
        const std::vector<std::string> args = collect_args(argc, argv, 2);

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--code") {
                if (i + 1 < args.size()) raw.code = args[++i];
                else return missing_value("--code");
            } else if (args[i] == "--script-file") {
                if (i + 1 < args.size()) raw.script_file = args[++i];
                else return missing_value("--script-file");
            } else if (args[i] == "--timeout") {
                if (i + 1 < args.size()) raw.timeout = args[++i];
                else return missing_value("--timeout");
            } else if (args[i] == "--memory-mb") {
                if (i + 1 < args.size()) raw.memory_mb = args[++i];
                else return missing_value("--memory-mb");
            } else if (args[i] == "--runner-url") {
                if (i + 1 < args.size()) raw.runner_url = args[++i];
                else return missing_value("--runner-url");
            } else if (args[i] == "--local-only") {
                raw.local_only = true;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return ScriptboxError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", kUsage};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        req.verbose = raw.verbose;
        req.local_only = raw.local_only;

        // Mutual Exclusion XOR check
        if (!raw.code.has_value() && !raw.script_file.has_value()) {
            return ScriptboxError{ErrorCategory::Input, "Must provide either --code or --script-file",
                                  "missing_required_flag"};
        }
        if (raw.code.has_value() && raw.script_file.has_value()) {
            return ScriptboxError{ErrorCategory::Input, "Cannot provide both --code and --script-file",
                                  "conflicting_flags"};
        }
        if (raw.local_only && raw.runner_url.has_value()) {
            return ScriptboxError{ErrorCategory::Input, "Cannot provide both --local-only and --runner-url",
                                  "conflicting_flags"};
        }

        req.code = raw.code;
        req.runner_url = raw.runner_url;

        if (raw.timeout) {
            auto timeout = parse_bounded<std::uint32_t>("--timeout", raw.timeout.value(), 1, 300);
            if (is_error(timeout)) return get_error(timeout);
            req.timeout_seconds = get_value(timeout);
        }
        if (raw.memory_mb) {
            auto memory = parse_bounded<std::uint32_t>("--memory-mb", raw.memory_mb.value(), 1, 65536);
            if (is_error(memory)) return get_error(memory);
            req.memory_limit_mb = get_value(memory);
        }

        // Path validation
        if (raw.script_file) {
            std::filesystem::path p(raw.script_file.value());
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return ScriptboxError{ErrorCategory::Input, "Script file does not exist or is not a regular file",
                                      "invalid_path"};
            }
            req.script_file = std::move(p);
        }

        return req;
    }

    Result<RunnerCliOptions> parse_runner_options(int argc, char* argv[]) {
        RawRunnerOptions raw;
        const std::vector<std::string> args = collect_args(argc, argv, 1);

        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--host") {
                if (i + 1 < args.size()) raw.host = args[++i];
                else return missing_value("--host");
            } else if (args[i] == "--port") {
                if (i + 1 < args.size()) raw.port = args[++i];
                else return missing_value("--port");
            } else if (args[i] == "--max-concurrent") {
                if (i + 1 < args.size()) raw.max_concurrent = args[++i];
                else return missing_value("--max-concurrent");
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return ScriptboxError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument",
                                      "Usage: scriptbox-runner [--host HOST] [--port N] [--max-concurrent N] [--verbose]"};
            }
        }

        RunnerCliOptions options;
        options.verbose = raw.verbose;
        if (raw.host) {
            if (raw.host->empty()) {
                return ScriptboxError{ErrorCategory::Input, "--host must not be empty", "invalid_host"};
            }
            options.host = raw.host.value();
        }
        if (raw.port) {
            auto port = parse_bounded<std::uint32_t>("--port", raw.port.value(), 0, 65535);
            if (is_error(port)) return get_error(port);
            options.port = static_cast<std::uint16_t>(get_value(port));
        }
        if (raw.max_concurrent) {
            auto limit = parse_bounded<std::uint32_t>("--max-concurrent", raw.max_concurrent.value(), 1, 1024);
            if (is_error(limit)) return get_error(limit);
            options.max_concurrent_requests = get_value(limit);
        }
        return options;
    }

    Result<std::string> load_script(const CliRequest& request) {
        if (request.code.has_value()) {
            return request.code.value();
        }
        if (!request.script_file.has_value()) {
            return ScriptboxError{ErrorCategory::Input, "No script provided", "missing_required_flag"};
        }

        std::ifstream in(request.script_file.value(), std::ios::binary);
        if (!in) {
            return ScriptboxError{ErrorCategory::Input,
                                  "Cannot open script file: " + request.script_file->string(), "unreadable_file"};
        }
        std::ostringstream contents;
        contents << in.rdbuf();
        if (in.bad()) {
            return ScriptboxError{ErrorCategory::Input,
                                  "Failed to read script file: " + request.script_file->string(), "unreadable_file"};
        }
        return contents.str();
    }

} // namespace scriptbox::app::cli
