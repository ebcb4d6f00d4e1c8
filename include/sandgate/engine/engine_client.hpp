/**
 * @file engine_client.hpp
 * @brief Connection handle to the container engine control API
 *
 * EngineClient is the seam between the lifecycle services and a concrete
 * engine. DockerEngineClient talks to the Docker Engine HTTP API; tests
 * plug in an in-memory engine.
 *
 * A handle is scoped to one logical operation. Destroying it releases the
 * underlying connection.
 *
 * @date 2025
 */

#pragma once

#include "sandgate/core/operation_context.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace sandgate {
namespace engine {

/**
 * @struct ResourceLimits
 * @brief Host-side resource constraints (0 = engine default)
 */
struct ResourceLimits {
    std::int64_t memory_bytes{0};   ///< HostConfig.Memory
    std::int64_t nano_cpus{0};      ///< HostConfig.NanoCpus (1e9 = one core)
    std::int64_t pids_limit{0};     ///< HostConfig.PidsLimit
};

/**
 * @struct ContainerSpec
 * @brief Engine-facing parameters of a container create request
 */
struct ContainerSpec {
    std::string image;                           ///< Image reference
    std::string working_dir;                     ///< WorkingDir
    bool tty{false};                             ///< Allocate a pseudo-terminal
    bool open_stdin{false};                      ///< Keep stdin open
    bool stdin_once{false};                      ///< Close stdin after first attach
    std::vector<std::string> command;            ///< Cmd
    std::map<std::string, std::string> labels;   ///< Labels
    ResourceLimits limits;                       ///< HostConfig constraints
};

/**
 * @struct RemoveOptions
 * @brief Container removal flags
 */
struct RemoveOptions {
    bool force{false};            ///< Kill the container if running
    bool remove_volumes{false};   ///< Remove anonymous volumes
};

/**
 * @class EngineError
 * @brief Failure reported by the engine or by the transport
 *
 * Status code 0 means the request never got an HTTP answer (connection
 * refused, TLS failure, transfer timeout).
 */
class EngineError : public std::runtime_error {
public:
    EngineError(long status_code, const std::string& message)
        : std::runtime_error(message), status_code_(status_code) {}

    long StatusCode() const noexcept { return status_code_; }
    bool IsTransportError() const noexcept { return status_code_ == 0; }
    bool IsNotFound() const noexcept { return status_code_ == 404; }

private:
    long status_code_;
};

/**
 * @class EngineClient
 * @brief Abstract container engine connection
 *
 * All calls may block on the network and honor the supplied context:
 * cancellation throws SandboxError(OPERATION_CANCELLED), deadline expiry
 * throws SandboxError(DEADLINE_EXCEEDED). Every other failure is an
 * EngineError.
 */
class EngineClient {
public:
    virtual ~EngineClient() = default;

    /**
     * @brief API version requests are issued with
     */
    virtual std::string ApiVersion() const = 0;

    /**
     * @brief Check the local image store (never pulls)
     * @return true if the image exists locally, false on 404
     */
    virtual bool ImageExists(const std::string& image_reference,
                             const core::OperationContext& ctx) = 0;

    /**
     * @brief Create a container
     * @return Engine-assigned container id
     */
    virtual std::string CreateContainer(const ContainerSpec& spec,
                                        const core::OperationContext& ctx) = 0;

    virtual void StartContainer(const std::string& container_id,
                                const core::OperationContext& ctx) = 0;

    /**
     * @brief Stop a container, letting its process exit within @p grace
     */
    virtual void StopContainer(const std::string& container_id,
                               std::chrono::seconds grace,
                               const core::OperationContext& ctx) = 0;

    virtual void RemoveContainer(const std::string& container_id,
                                 const RemoveOptions& options,
                                 const core::OperationContext& ctx) = 0;
};

} // namespace engine
} // namespace sandgate
