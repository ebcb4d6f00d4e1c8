/**
 * @file sandbox_creation.hpp
 * @brief Sandbox creation service
 *
 * Validates the requested image against the local-only policy, provisions
 * a container that stays alive indefinitely, starts it and hands back the
 * engine-assigned identity. Nothing is remembered between calls.
 *
 * @date 2025
 */

#pragma once

#include "sandgate/core/operation_context.hpp"
#include "sandgate/engine/client_factory.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sandgate {
namespace core {

/// Image used when the caller does not name one
constexpr const char* kDefaultSandboxImage = "python:3.12-slim-bookworm";

/**
 * @struct SandboxPolicy
 * @brief Container parameters fixed for every sandbox
 *
 * Only the image varies between creation calls.
 */
struct SandboxPolicy {
    std::string default_image{kDefaultSandboxImage};        ///< Fallback image
    std::string working_dir{"/app"};                        ///< Working directory
    std::vector<std::string> command{"sleep", "infinity"};  ///< Keep-alive command
    bool tty{true};                                         ///< Allocate a pseudo-terminal
    bool open_stdin{true};                                  ///< Keep stdin open
    std::map<std::string, std::string> labels;              ///< Labels applied to every sandbox

    // Resource constraints (0 = engine default)
    std::size_t memory_limit_mb{0};   ///< Memory limit
    double cpu_limit{0.0};            ///< CPU cores
    std::int64_t pids_limit{0};       ///< Process limit

    /// Force-remove a created container whose start failed
    bool remove_on_start_failure{false};
};

/**
 * @brief Check that @p reference is a syntactically valid image reference
 *
 * Accepts "name", "name:tag", "registry:5000/ns/name:tag" and
 * "name@sha256:<hex>" forms. Rejects whitespace, query/fragment markers,
 * ".." path segments and leading separators, so the reference can be
 * placed in a request path verbatim.
 */
bool IsValidImageReference(const std::string& reference);

/**
 * @class SandboxCreationService
 * @brief create_sandbox: image policy check, create, start
 *
 * **Usage Example**:
 * @code
 * engine::DockerClientFactory factory(engine_config);
 * SandboxCreationService creation(factory, SandboxPolicy{});
 *
 * auto ctx = OperationContext::WithTimeout(std::chrono::seconds(120));
 * std::string id = creation.CreateSandbox("python:3.12-slim-bookworm", ctx);
 * @endcode
 */
class SandboxCreationService {
public:
    /**
     * @param factory Connection source (must outlive the service)
     * @param policy Container parameters
     */
    SandboxCreationService(engine::RuntimeClientFactory& factory, SandboxPolicy policy);

    /**
     * @brief Create and start a sandbox
     *
     * @param image_reference Requested image; absent or blank selects the default
     * @param ctx Deadline/cancellation for every engine call
     * @return Engine-assigned container identity
     *
     * @throws SandboxError(IMAGE_NOT_AVAILABLE) if the image is not in the
     *         local store (no create/start is issued)
     * @throws SandboxError(CONNECTION_ERROR) if the engine cannot be reached
     * @throws SandboxError(ENGINE_CREATE_FAILED) if the engine rejects create
     * @throws SandboxError(ENGINE_START_FAILED) if the engine rejects start
     * @throws SandboxError(OPERATION_CANCELLED / DEADLINE_EXCEEDED) if @p ctx ends
     */
    std::string CreateSandbox(const std::optional<std::string>& image_reference,
                              const OperationContext& ctx);

    /**
     * @brief Image a request resolves to
     */
    std::string ResolveImage(const std::optional<std::string>& image_reference) const;

    /**
     * @brief Engine create request for @p image under this policy
     */
    engine::ContainerSpec BuildContainerSpec(const std::string& image) const;

    const SandboxPolicy& GetPolicy() const { return policy_; }

private:
    engine::RuntimeClientFactory& factory_;
    SandboxPolicy policy_;

    void DiscardOrphan(engine::EngineClient& client, const std::string& container_id);
};

} // namespace core
} // namespace sandgate
