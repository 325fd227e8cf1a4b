#include <csignal>
#include <memory>
#include <string>
#include <utility>
#include "app/cli_parser.hpp"
#include "backends/local_backend.hpp"
#include "core/config/runtime_config.hpp"
#include "core/errors/scriptbox_errors.hpp"
#include "core/logging/logger.hpp"
#include "runner/runner_server.hpp"

namespace {

scriptbox::runner::RunnerServer* g_server = nullptr;

void handle_stop_signal(int) {
    if (g_server != nullptr) {
        g_server->stop();
    }
}

void install_stop_handlers() {
    struct sigaction action {};
    action.sa_handler = handle_stop_signal;
    sigemptyset(&action.sa_mask);
    static_cast<void>(sigaction(SIGINT, &action, nullptr));
    static_cast<void>(sigaction(SIGTERM, &action, nullptr));
}

}  // namespace

int main(int argc, char* argv[]) {
    scriptbox::core::logging::Logger::get().set_run_id("runner");

    auto parsed = scriptbox::app::cli::parse_runner_options(argc, argv);
    if (scriptbox::core::errors::is_error(parsed)) {
        const auto& err = scriptbox::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& cli = scriptbox::core::errors::get_value(parsed);

    auto loaded = scriptbox::core::config::load_runtime_config_from_environment();
    if (scriptbox::core::errors::is_error(loaded)) {
        const auto& err = scriptbox::core::errors::get_error(loaded);
        LOG_ERROR("Configuration error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 3;
    }
    const auto& config = scriptbox::core::errors::get_value(loaded);
    scriptbox::core::logging::Logger::get().set_min_level(
        cli.verbose ? scriptbox::core::logging::LogLevel::DEBUG : config.log_level);

    scriptbox::backends::LocalBackendOptions local_options;
    local_options.interpreter_command = config.interpreter_command;
    local_options.max_output_bytes = config.max_output_bytes;

    scriptbox::runner::RunnerServerOptions options;
    options.host = cli.host;
    options.port = cli.port;
    options.max_concurrent_requests = cli.max_concurrent_requests;
    options.default_timeout = config.default_timeout;

    scriptbox::runner::RunnerServer server(
        options, std::make_shared<const scriptbox::backends::LocalBackend>(std::move(local_options)));
    auto bound = server.bind();
    if (scriptbox::core::errors::is_error(bound)) {
        const auto& err = scriptbox::core::errors::get_error(bound);
        LOG_ERROR("Failed to start runner [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 3;
    }

    g_server = &server;
    install_stop_handlers();
    server.serve();
    g_server = nullptr;
    return 0;
}
