/**
 * @file client_factory.cpp
 * @brief Docker client factory: endpoint parsing and version negotiation
 *
 * @date 2025
 */

#include "sandgate/engine/client_factory.hpp"
#include "sandgate/engine/api_version.hpp"
#include "sandgate/engine/docker_client.hpp"
#include "sandgate/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace sandgate {
namespace engine {

DockerClientFactory::DockerClientFactory(EngineConfig config)
    : config_(std::move(config)) {
}

std::unique_ptr<EngineClient> DockerClientFactory::Connect(const core::OperationContext& ctx) {
    ctx.ThrowIfDone();

    EngineEndpoint endpoint;
    try {
        endpoint = EngineEndpoint::Parse(config_.host, config_.tls.enabled);
    }
    catch (const std::invalid_argument& e) {
        throw core::SandboxError(core::ErrorCode::CONNECTION_ERROR,
                                 "invalid container engine configuration", e.what());
    }

    std::unique_ptr<DockerEngineClient> client;
    try {
        client = std::make_unique<DockerEngineClient>(endpoint, config_);
    }
    catch (const std::runtime_error& e) {
        throw core::SandboxError(core::ErrorCode::CONNECTION_ERROR,
                                 "failed to create Docker client", e.what());
    }

    // A pinned version skips negotiation entirely
    if (!config_.api_version.empty()) {
        auto pinned = ApiVersion::Parse(config_.api_version);
        if (!pinned) {
            throw core::SandboxError(core::ErrorCode::CONNECTION_ERROR,
                                     "invalid container engine configuration",
                                     "unparsable API version '" + config_.api_version + "'");
        }
        client->SetApiVersion(pinned->ToString());
        spdlog::debug("Using pinned engine API version {}", client->ApiVersion());
        return client;
    }

    try {
        auto server_version = client->Ping(ctx);
        client->SetApiVersion(NegotiateApiVersion(kClientMaxApiVersion, server_version));
    }
    catch (const EngineError& e) {
        throw core::SandboxError(core::ErrorCode::CONNECTION_ERROR,
                                 "failed to create Docker client", e.what());
    }

    spdlog::debug("Connected to container engine at {} (API {})",
                  config_.host, client->ApiVersion());
    return client;
}

} // namespace engine
} // namespace sandgate
