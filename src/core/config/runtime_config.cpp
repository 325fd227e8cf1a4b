#include "core/config/runtime_config.hpp"

#include <charconv>
#include <cstdlib>
#include <sstream>
#include <system_error>

namespace scriptbox::core::config {

using errors::ErrorCategory;
using errors::ScriptboxError;

namespace {

template <typename Integer>
errors::Result<Integer> parse_positive(const std::string& name,
                                       const std::string& text) {
    Integer value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        return ScriptboxError{ErrorCategory::Input,
                              "Invalid number in " + name + ": '" + text + "'",
                              "invalid_integer", "Provide a positive integer."};
    }
    if (value == 0) {
        return ScriptboxError{ErrorCategory::Input, name + " must be positive",
                              "bounds_error", "Provide a positive integer."};
    }
    return value;
}

std::vector<std::string> split_command(const std::string& text) {
    std::istringstream in(text);
    std::vector<std::string> parts;
    std::string part;
    while (in >> part) {
        parts.push_back(part);
    }
    return parts;
}

}  // namespace

errors::Result<RuntimeConfig> load_runtime_config(const EnvironmentLookup& lookup) {
    RuntimeConfig config;

    if (const auto url = lookup("RUNNER_URL")) {
        config.runner_url = *url;
    }

    if (const auto request_timeout = lookup("RUNNER_REQUEST_TIMEOUT")) {
        auto parsed = parse_positive<std::uint32_t>("RUNNER_REQUEST_TIMEOUT",
                                                    *request_timeout);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.runner_request_timeout = std::chrono::seconds(errors::get_value(parsed));
    }

    if (const auto python = lookup("SCRIPTBOX_PYTHON")) {
        auto command = split_command(*python);
        if (command.empty()) {
            return ScriptboxError{ErrorCategory::Input,
                                  "SCRIPTBOX_PYTHON cannot be blank",
                                  "invalid_interpreter",
                                  "Set it to an interpreter path such as /usr/bin/python3."};
        }
        config.interpreter_command = std::move(command);
    }

    if (const auto max_output = lookup("SCRIPTBOX_MAX_OUTPUT_BYTES")) {
        auto parsed = parse_positive<std::size_t>("SCRIPTBOX_MAX_OUTPUT_BYTES",
                                                  *max_output);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.max_output_bytes = errors::get_value(parsed);
    }

    if (const auto level = lookup("SCRIPTBOX_LOG_LEVEL")) {
        const auto parsed = logging::parse_log_level(*level);
        if (!parsed.has_value()) {
            return ScriptboxError{ErrorCategory::Input,
                                  "Unknown log level in SCRIPTBOX_LOG_LEVEL: '" +
                                      *level + "'",
                                  "invalid_log_level",
                                  "Use one of: debug, info, warn, error."};
        }
        config.log_level = *parsed;
    }

    return config;
}

errors::Result<RuntimeConfig> load_runtime_config_from_environment() {
    return load_runtime_config([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

}  // namespace scriptbox::core::config
