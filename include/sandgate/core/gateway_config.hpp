/**
 * @file gateway_config.hpp
 * @brief Gateway configuration: defaults, JSON file, environment
 *
 * Precedence (lowest to highest): built-in defaults, JSON config file,
 * DOCKER_* environment variables, command-line flags (applied by main).
 *
 * **Config File Example**:
 * @code{.json}
 * {
 *   "engine":   { "host": "unix:///var/run/docker.sock", "request_timeout_seconds": 60 },
 *   "sandbox":  { "default_image": "python:3.12-slim-bookworm", "working_dir": "/app",
 *                 "memory_limit_mb": 1024, "pids_limit": 256,
 *                 "remove_on_start_failure": false },
 *   "teardown": { "stop_grace_seconds": 10 },
 *   "server":   { "operation_timeout_seconds": 120 },
 *   "logging":  { "level": "info", "file": "" }
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "sandgate/core/sandbox_creation.hpp"
#include "sandgate/core/sandbox_teardown.hpp"
#include "sandgate/engine/engine_config.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace sandgate {
namespace core {

/**
 * @struct ServerConfig
 * @brief Tool server settings
 */
struct ServerConfig {
    std::string name{"sandgate"};                        ///< serverInfo.name
    std::chrono::seconds operation_timeout{120};         ///< Deadline per tool call
};

/**
 * @struct LoggingConfig
 * @brief spdlog settings
 */
struct LoggingConfig {
    std::string level{"info"};        ///< trace|debug|info|warn|error|critical|off
    std::filesystem::path file;       ///< Optional log file (in addition to stderr)
};

/**
 * @struct GatewayConfig
 * @brief Complete gateway configuration
 */
struct GatewayConfig {
    engine::EngineConfig engine;
    SandboxPolicy sandbox;
    TeardownPolicy teardown;
    ServerConfig server;
    LoggingConfig logging;
};

/// Environment lookup: returns std::nullopt for unset variables
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/**
 * @brief Lookup backed by the process environment
 */
EnvLookup ProcessEnvironment();

/**
 * @brief Parse a configuration document on top of defaults
 *
 * @param text JSON document
 * @return Parsed configuration
 *
 * @throws SandboxError(CONFIG_INVALID) on malformed JSON or wrongly typed values
 */
GatewayConfig ParseGatewayConfig(const std::string& text);

/**
 * @brief Load a configuration file
 *
 * @throws SandboxError(CONFIG_INVALID) if the file is unreadable or invalid
 */
GatewayConfig LoadGatewayConfig(const std::filesystem::path& path);

/**
 * @brief Fold host-standard engine variables into @p config
 *
 * Honors DOCKER_HOST, DOCKER_API_VERSION, DOCKER_TLS_VERIFY and
 * DOCKER_CERT_PATH (ca.pem, cert.pem, key.pem).
 */
void ApplyEngineEnvironment(GatewayConfig& config, const EnvLookup& env);

} // namespace core
} // namespace sandgate
