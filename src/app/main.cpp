#include <chrono>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/config/request_id.hpp"
#include "core/config/runtime_config.hpp"
#include "core/errors/scriptbox_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/script_validator.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/execution_request.hpp"
#include "runtime/script_executor.hpp"

namespace {

void report_error(const std::string& what, const scriptbox::core::errors::ScriptboxError& err) {
    LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

void print_json(const nlohmann::json& payload) {
    std::cout << payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

nlohmann::json validation_to_json(const scriptbox::policy::ValidationReport& report) {
    nlohmann::json issues = nlohmann::json::array();
    for (const auto& issue : report.issues()) {
        issues.push_back({{"kind", scriptbox::policy::to_string(issue.kind)},
                          {"detail", issue.detail},
                          {"line", issue.line}});
    }
    return {{"accepted", report.accepted()}, {"issues", issues}, {"summary", report.summary()}};
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Generate a request ID and register it with the global logger
    scriptbox::core::logging::Logger::get().set_run_id(scriptbox::core::config::generate_request_id());

    // 2. Parse CLI input and return normalized input errors
    auto parsed = scriptbox::app::cli::parse_and_validate(argc, argv);
    if (scriptbox::core::errors::is_error(parsed)) {
        report_error("Input error", scriptbox::core::errors::get_error(parsed));
        return 2;
    }
    const auto& req = scriptbox::core::errors::get_value(parsed);

    auto script = scriptbox::app::cli::load_script(req);
    if (scriptbox::core::errors::is_error(script)) {
        report_error("Input error", scriptbox::core::errors::get_error(script));
        return 2;
    }

    // 3. Environment configuration, overridden by flags
    auto loaded = scriptbox::core::config::load_runtime_config_from_environment();
    if (scriptbox::core::errors::is_error(loaded)) {
        report_error("Configuration error", scriptbox::core::errors::get_error(loaded));
        return 3;
    }
    auto config = scriptbox::core::errors::get_value(loaded);
    if (req.runner_url) {
        config.runner_url = req.runner_url.value();
    }
    if (req.local_only) {
        config.runner_url.clear();
    }
    if (req.verbose) {
        config.log_level = scriptbox::core::logging::LogLevel::DEBUG;
    }
    scriptbox::core::logging::Logger::get().set_min_level(config.log_level);

    if (req.command == scriptbox::app::cli::Command::Validate) {
        const scriptbox::policy::ScriptValidator validator;
        const auto report = validator.validate(scriptbox::core::errors::get_value(script));
        print_json(validation_to_json(report));
        return report.accepted() ? 0 : 1;
    }

    auto built = scriptbox::runtime::ScriptExecutor::from_config(config);
    if (scriptbox::core::errors::is_error(built)) {
        report_error("Configuration error", scriptbox::core::errors::get_error(built));
        return 3;
    }
    const auto& executor = scriptbox::core::errors::get_value(built);

    // 4. Execute and print the normalized response
    scriptbox::protocol::ExecutionRequest request;
    request.script = scriptbox::core::errors::get_value(script);
    request.timeout = req.timeout_seconds ? std::chrono::seconds(req.timeout_seconds.value())
                                          : config.default_timeout;
    request.memory_limit_mb = req.memory_limit_mb.value_or(config.default_memory_limit_mb);

    const auto report = executor.execute_detailed(request);
    LOG_DEBUG("Backend used: " + scriptbox::protocol::to_string(report.backend));
    if (report.raw && report.raw->fallback_note) {
        LOG_INFO(report.raw->fallback_note.value());
    }
    print_json(scriptbox::protocol::to_json(report.response));
    return report.response.error.has_value() ? 1 : 0;
}
