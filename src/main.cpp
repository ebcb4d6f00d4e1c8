/**
 * @file main.cpp
 * @brief sandgate - sandbox lifecycle gateway - command-line interface
 *
 * Entry point for the gateway. By default it serves the sandbox tools to an
 * agent runtime over stdio (JSON-RPC, one message per line). The create and
 * teardown subcommands run a single operation from a shell, which is handy
 * for checking engine connectivity and for cleaning up leaked sandboxes.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include "sandgate/core/errors.hpp"
#include "sandgate/core/gateway_config.hpp"
#include "sandgate/core/logging.hpp"
#include "sandgate/core/sandbox_creation.hpp"
#include "sandgate/core/sandbox_teardown.hpp"
#include "sandgate/engine/client_factory.hpp"
#include "sandgate/tools/sandbox_tools.hpp"
#include "sandgate/tools/tool_server.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

/*******************************************************************************
 * Process Setup
 ******************************************************************************/

// libcurl global state must exist before any easy handle and outlive all of them
class CurlGlobal {
public:
    CurlGlobal() {
        if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    }
    ~CurlGlobal() { curl_global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    // Before anything can log: stdout is the protocol channel
    sandgate::core::InstallStderrLogger();

    CLI::App app{"sandgate - sandbox lifecycle gateway for agent tool calls"};
    app.set_version_flag("--version", sandgate::tools::kGatewayVersion);
    app.require_subcommand(0, 1);

    std::string config_path;
    std::string host;
    int timeout_seconds = -1;
    bool verbose = false;
    std::string log_file;

    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("--host", host, "Container engine address (overrides DOCKER_HOST)");
    app.add_option("--timeout", timeout_seconds, "Deadline per operation in seconds (0 = none)")
        ->check(CLI::NonNegativeNumber);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("--log-file", log_file, "Also write logs to this file");

    app.add_subcommand("serve", "Serve the sandbox tools on stdio (default)");

    auto* create_cmd = app.add_subcommand("create", "Create and start one sandbox");
    std::string image;
    create_cmd->add_option("-i,--image", image, "Local image to use (default from config)");

    auto* teardown_cmd = app.add_subcommand("teardown", "Stop and remove one sandbox");
    std::string container_id;
    teardown_cmd->add_option("container_id", container_id, "Container identity")
        ->required();

    CLI11_PARSE(app, argc, argv);

    try {
        // Configuration: defaults < file < environment < flags
        sandgate::core::GatewayConfig config;
        if (!config_path.empty()) {
            config = sandgate::core::LoadGatewayConfig(config_path);
        }
        sandgate::core::ApplyEngineEnvironment(config, sandgate::core::ProcessEnvironment());

        if (!host.empty()) {
            config.engine.host = host;
        }
        if (timeout_seconds >= 0) {
            config.server.operation_timeout = std::chrono::seconds(timeout_seconds);
        }
        if (verbose) {
            config.logging.level = "debug";
        }
        if (!log_file.empty()) {
            config.logging.file = log_file;
        }

        sandgate::core::ConfigureLogging(config.logging);
        spdlog::debug("Verbose logging enabled");
        spdlog::debug("Engine host: {}", config.engine.host);

        CurlGlobal curl;

        sandgate::engine::DockerClientFactory factory(config.engine);
        sandgate::core::SandboxCreationService creation(factory, config.sandbox);
        sandgate::core::SandboxTeardownService teardown(factory, config.teardown);
        sandgate::tools::SandboxTools sandbox_tools(creation, teardown);

        auto make_context = [&config]() {
            if (config.server.operation_timeout.count() > 0) {
                return sandgate::core::OperationContext::WithTimeout(config.server.operation_timeout);
            }
            return sandgate::core::OperationContext();
        };

        if (*create_cmd) {
            json arguments = json::object();
            if (!image.empty()) {
                arguments["image"] = image;
            }
            auto text = sandbox_tools.InitializeEnvironment(arguments, make_context());
            std::cout << text << std::endl;
            return sandgate::tools::SandboxTools::IsErrorResult(text) ? 1 : 0;
        }

        if (*teardown_cmd) {
            auto text = sandbox_tools.StopContainer({{"container_id", container_id}}, make_context());
            std::cout << text << std::endl;
            return sandgate::tools::SandboxTools::IsErrorResult(text) ? 1 : 0;
        }

        // serve, explicitly or by default
        sandgate::tools::ServerOptions options;
        options.name = config.server.name;
        options.operation_timeout = config.server.operation_timeout;

        sandgate::tools::ToolServer server(options);
        sandbox_tools.RegisterWith(server);
        server.Serve(std::cin, std::cout);

        return 0;

    } catch (const sandgate::core::SandboxError& e) {
        spdlog::error("[{}] {}", sandgate::core::ErrorCodeName(e.GetErrorCode()), e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
