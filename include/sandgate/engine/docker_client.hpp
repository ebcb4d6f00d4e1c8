/**
 * @file docker_client.hpp
 * @brief Docker Engine API client over libcurl
 *
 * Speaks the Docker Engine HTTP API over a local socket or TCP(+TLS).
 * Only the calls the sandbox lifecycle needs are implemented: ping,
 * image inspect, container create/start/stop/remove.
 *
 * One instance wraps one curl easy handle, so connections are reused
 * between the requests of a single operation and closed when the client
 * is destroyed. Instances are not thread-safe; use one per operation.
 *
 * @date 2025
 */

#pragma once

#include "sandgate/engine/engine_client.hpp"
#include "sandgate/engine/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace sandgate {
namespace engine {

/**
 * @class DockerEngineClient
 * @brief EngineClient backed by the Docker Engine HTTP API
 *
 * **Usage Example**:
 * @code
 * EngineConfig config;
 * auto endpoint = EngineEndpoint::Parse(config.host, config.tls.enabled);
 * DockerEngineClient client(endpoint, config);
 *
 * auto ctx = core::OperationContext::WithTimeout(std::chrono::seconds(30));
 * client.SetApiVersion(NegotiateApiVersion(kClientMaxApiVersion, client.Ping(ctx)));
 *
 * if (client.ImageExists("python:3.12-slim-bookworm", ctx)) { ... }
 * @endcode
 */
class DockerEngineClient : public EngineClient {
public:
    /**
     * @throws std::runtime_error if libcurl cannot allocate a handle
     */
    DockerEngineClient(EngineEndpoint endpoint, EngineConfig config);
    ~DockerEngineClient() override;

    DockerEngineClient(const DockerEngineClient&) = delete;
    DockerEngineClient& operator=(const DockerEngineClient&) = delete;

    /**
     * @brief GET /_ping
     * @return Value of the API-Version response header (may be empty)
     * @throws EngineError if the engine cannot be reached
     */
    std::string Ping(const core::OperationContext& ctx);

    void SetApiVersion(const std::string& version);
    std::string ApiVersion() const override;

    bool ImageExists(const std::string& image_reference,
                     const core::OperationContext& ctx) override;

    std::string CreateContainer(const ContainerSpec& spec,
                                const core::OperationContext& ctx) override;

    void StartContainer(const std::string& container_id,
                        const core::OperationContext& ctx) override;

    void StopContainer(const std::string& container_id,
                       std::chrono::seconds grace,
                       const core::OperationContext& ctx) override;

    void RemoveContainer(const std::string& container_id,
                         const RemoveOptions& options,
                         const core::OperationContext& ctx) override;

    /**
     * @brief Body of POST /containers/create for @p spec
     */
    static nlohmann::json BuildCreateBody(const ContainerSpec& spec);

    /**
     * @brief Human readable error text of an engine response
     *
     * Uses the "message" field of a JSON error body, the raw body
     * otherwise, and the status code when the body is empty.
     */
    static std::string ExtractErrorMessage(long status_code, const std::string& body);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace engine
} // namespace sandgate
