/**
 * @file gateway_config.cpp
 * @brief Configuration loading
 *
 * @date 2025
 */

#include "sandgate/core/gateway_config.hpp"
#include "sandgate/core/errors.hpp"
#include "sandgate/utils/string_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

using json = nlohmann::json;

namespace sandgate {
namespace core {

namespace {

const json& Section(const json& root, const char* name) {
    static const json kEmpty = json::object();
    if (!root.contains(name)) {
        return kEmpty;
    }
    const json& section = root.at(name);
    if (!section.is_object()) {
        throw SandboxError(ErrorCode::CONFIG_INVALID,
                           std::string("section '") + name + "' must be an object");
    }
    return section;
}

std::int64_t NonNegative(const json& section, const char* key, std::int64_t fallback) {
    auto value = section.value(key, fallback);
    if (value < 0) {
        throw SandboxError(ErrorCode::CONFIG_INVALID,
                           std::string("'") + key + "' must not be negative");
    }
    return value;
}

bool IsKnownLogLevel(const std::string& level) {
    static const std::vector<std::string> kLevels = {
        "trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"
    };
    return std::find(kLevels.begin(), kLevels.end(), level) != kLevels.end();
}

void ParseEngine(const json& section, engine::EngineConfig& config) {
    config.host = section.value("host", config.host);
    config.api_version = section.value("api_version", config.api_version);
    config.request_timeout = std::chrono::seconds(
        NonNegative(section, "request_timeout_seconds", config.request_timeout.count()));
    config.connect_timeout = std::chrono::seconds(
        NonNegative(section, "connect_timeout_seconds", config.connect_timeout.count()));

    if (section.contains("tls")) {
        const json& tls = section.at("tls");
        config.tls.enabled = tls.value("enabled", config.tls.enabled);
        config.tls.verify = tls.value("verify", config.tls.verify);
        config.tls.ca_file = tls.value("ca_file", config.tls.ca_file.string());
        config.tls.cert_file = tls.value("cert_file", config.tls.cert_file.string());
        config.tls.key_file = tls.value("key_file", config.tls.key_file.string());
    }
}

void ParseSandbox(const json& section, SandboxPolicy& policy) {
    policy.default_image = section.value("default_image", policy.default_image);
    policy.working_dir = section.value("working_dir", policy.working_dir);
    policy.command = section.value("command", policy.command);
    policy.tty = section.value("tty", policy.tty);
    policy.open_stdin = section.value("open_stdin", policy.open_stdin);
    policy.labels = section.value("labels", policy.labels);
    policy.memory_limit_mb = static_cast<std::size_t>(
        NonNegative(section, "memory_limit_mb", static_cast<std::int64_t>(policy.memory_limit_mb)));
    policy.pids_limit = NonNegative(section, "pids_limit", policy.pids_limit);
    policy.cpu_limit = section.value("cpu_limit", policy.cpu_limit);
    policy.remove_on_start_failure =
        section.value("remove_on_start_failure", policy.remove_on_start_failure);

    if (policy.cpu_limit < 0.0) {
        throw SandboxError(ErrorCode::CONFIG_INVALID, "'cpu_limit' must not be negative");
    }
    if (utils::StringUtils::Trim(policy.default_image).empty()) {
        throw SandboxError(ErrorCode::CONFIG_INVALID, "'default_image' must not be empty");
    }
    if (policy.command.empty()) {
        throw SandboxError(ErrorCode::CONFIG_INVALID, "'command' must not be empty");
    }
}

void ParseTeardown(const json& section, TeardownPolicy& policy) {
    policy.stop_grace = std::chrono::seconds(
        NonNegative(section, "stop_grace_seconds", policy.stop_grace.count()));
}

void ParseServer(const json& section, ServerConfig& config) {
    config.name = section.value("name", config.name);
    config.operation_timeout = std::chrono::seconds(
        NonNegative(section, "operation_timeout_seconds", config.operation_timeout.count()));
}

void ParseLogging(const json& section, LoggingConfig& config) {
    config.level = utils::StringUtils::ToLower(section.value("level", config.level));
    config.file = section.value("file", config.file.string());

    if (!IsKnownLogLevel(config.level)) {
        throw SandboxError(ErrorCode::CONFIG_INVALID, "unknown log level '" + config.level + "'");
    }
}

} // anonymous namespace

EnvLookup ProcessEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

GatewayConfig ParseGatewayConfig(const std::string& text) {
    GatewayConfig config;

    try {
        json root = json::parse(text);
        if (!root.is_object()) {
            throw SandboxError(ErrorCode::CONFIG_INVALID, "configuration must be a JSON object");
        }

        ParseEngine(Section(root, "engine"), config.engine);
        ParseSandbox(Section(root, "sandbox"), config.sandbox);
        ParseTeardown(Section(root, "teardown"), config.teardown);
        ParseServer(Section(root, "server"), config.server);
        ParseLogging(Section(root, "logging"), config.logging);
    }
    catch (const json::exception& e) {
        throw SandboxError(ErrorCode::CONFIG_INVALID, "malformed configuration", e.what());
    }

    return config;
}

GatewayConfig LoadGatewayConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw SandboxError(ErrorCode::CONFIG_INVALID,
                           "cannot open configuration file " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    spdlog::debug("Loading configuration from {}", path.string());
    return ParseGatewayConfig(buffer.str());
}

void ApplyEngineEnvironment(GatewayConfig& config, const EnvLookup& env) {
    auto& engine = config.engine;

    if (auto host = env("DOCKER_HOST"); host && !host->empty()) {
        engine.host = *host;
    }

    if (auto version = env("DOCKER_API_VERSION"); version && !version->empty()) {
        engine.api_version = *version;
    }

    if (auto verify = env("DOCKER_TLS_VERIFY"); verify && !verify->empty()) {
        engine.tls.enabled = true;
        engine.tls.verify = true;
    }

    if (auto cert_path = env("DOCKER_CERT_PATH"); cert_path && !cert_path->empty()) {
        std::filesystem::path dir(*cert_path);
        engine.tls.enabled = true;
        engine.tls.ca_file = dir / "ca.pem";
        engine.tls.cert_file = dir / "cert.pem";
        engine.tls.key_file = dir / "key.pem";

        // Same rule as the docker CLI: certificates without DOCKER_TLS_VERIFY skip verification
        auto verify = env("DOCKER_TLS_VERIFY");
        engine.tls.verify = verify && !verify->empty();
    }
}

} // namespace core
} // namespace sandgate
