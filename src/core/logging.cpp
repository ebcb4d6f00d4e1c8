/**
 * @file logging.cpp
 * @brief spdlog setup for the gateway process
 *
 * @date 2025
 */

#include "sandgate/core/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace sandgate {
namespace core {

namespace {

constexpr const char* kLogPattern = "[%H:%M:%S] [%^%l%$] %v";

void InstallLogger(std::vector<spdlog::sink_ptr> sinks, spdlog::level::level_enum level) {
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    spdlog::set_level(level);
    spdlog::set_pattern(kLogPattern);
    spdlog::flush_on(spdlog::level::warn);
}

} // anonymous namespace

void InstallStderrLogger() {
    InstallLogger({std::make_shared<spdlog::sinks::stderr_color_sink_mt>()}, spdlog::level::info);
}

void ConfigureLogging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!config.file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file.string()));
    }

    InstallLogger(std::move(sinks), spdlog::level::from_str(config.level));
}

} // namespace core
} // namespace sandgate
