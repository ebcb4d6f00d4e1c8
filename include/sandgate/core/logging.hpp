/**
 * @file logging.hpp
 * @brief spdlog setup for the gateway process
 *
 * stdout carries protocol messages while serving, so no sink ever writes
 * there. InstallStderrLogger() runs first thing in main so that errors
 * raised while the configuration is still being loaded cannot leak onto
 * stdout through spdlog's default console logger.
 *
 * @date 2025
 */

#pragma once

#include "sandgate/core/gateway_config.hpp"

namespace sandgate {
namespace core {

/// Name of the process-wide logger
inline constexpr const char* kLoggerName = "sandgate";

/**
 * @brief Replace the default logger with a stderr-only logger at info level
 */
void InstallStderrLogger();

/**
 * @brief Replace the default logger according to @p config
 *
 * Logs go to stderr and, if LoggingConfig::file is set, to that file too.
 *
 * **Usage Example**:
 * @code
 * InstallStderrLogger();
 * auto config = LoadGatewayConfig("sandgate.json");
 * ConfigureLogging(config.logging);
 * @endcode
 *
 * @throws spdlog::spdlog_ex if the log file cannot be opened
 */
void ConfigureLogging(const LoggingConfig& config);

} // namespace core
} // namespace sandgate
