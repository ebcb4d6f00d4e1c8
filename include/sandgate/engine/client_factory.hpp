/**
 * @file client_factory.hpp
 * @brief Runtime client factory
 *
 * Produces one EngineClient per logical operation. The factory itself is
 * cheap to construct and performs no I/O; Connect() reaches the engine and
 * negotiates the API version.
 *
 * @date 2025
 */

#pragma once

#include "sandgate/engine/engine_client.hpp"
#include "sandgate/engine/engine_config.hpp"

#include <memory>

namespace sandgate {
namespace engine {

/**
 * @class RuntimeClientFactory
 * @brief Source of scoped engine connections
 */
class RuntimeClientFactory {
public:
    virtual ~RuntimeClientFactory() = default;

    /**
     * @brief Open a connection handle to the engine
     *
     * The handle is released when the returned pointer goes out of scope.
     *
     * @param ctx Deadline/cancellation for connection setup
     * @return Connected client
     *
     * @throws SandboxError(CONNECTION_ERROR) if the engine is unreachable or
     *         the configuration is invalid
     */
    virtual std::unique_ptr<EngineClient> Connect(const core::OperationContext& ctx) = 0;
};

/**
 * @class DockerClientFactory
 * @brief Factory for DockerEngineClient handles
 *
 * **Usage Example**:
 * @code
 * EngineConfig config;
 * config.host = "unix:///run/user/1000/docker.sock";
 * DockerClientFactory factory(config);
 *
 * auto client = factory.Connect(ctx);   // ping + version negotiation
 * client->ImageExists("alpine:3.20", ctx);
 * @endcode
 */
class DockerClientFactory : public RuntimeClientFactory {
public:
    explicit DockerClientFactory(EngineConfig config);

    std::unique_ptr<EngineClient> Connect(const core::OperationContext& ctx) override;

    const EngineConfig& GetConfig() const { return config_; }

private:
    EngineConfig config_;
};

} // namespace engine
} // namespace sandgate
