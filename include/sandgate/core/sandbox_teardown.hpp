/**
 * @file sandbox_teardown.hpp
 * @brief Sandbox teardown service
 *
 * @date 2025
 */

#pragma once

#include "sandgate/core/operation_context.hpp"
#include "sandgate/engine/client_factory.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace sandgate {
namespace core {

/**
 * @struct TeardownPolicy
 * @brief Stop/remove parameters
 */
struct TeardownPolicy {
    std::chrono::seconds stop_grace{10};   ///< Time the sandbox process gets to exit
};

/**
 * @struct TeardownOutcome
 * @brief What happened during a teardown
 *
 * The stop step is advisory: stop_error is informational only. The
 * sandbox is reclaimed when removed is true.
 */
struct TeardownOutcome {
    std::string container_id;               ///< Identity that was torn down
    bool stop_attempted{false};             ///< Stop request was issued
    std::optional<std::string> stop_error;  ///< Ignored stop failure, if any
    bool removed{false};                    ///< Container is gone
    bool already_absent{false};             ///< Engine no longer knew the container
};

/**
 * @class SandboxTeardownService
 * @brief teardown_sandbox: best-effort stop, then authoritative force remove
 *
 * Calling it twice on the same identity is safe: removal of a container
 * the engine no longer knows is reported as success.
 */
class SandboxTeardownService {
public:
    SandboxTeardownService(engine::RuntimeClientFactory& factory, TeardownPolicy policy);

    /**
     * @brief Stop and remove a sandbox
     *
     * @param container_id Identity issued by SandboxCreationService
     * @param ctx Deadline/cancellation for every engine call
     * @return Teardown outcome (removed is always true on return)
     *
     * @throws SandboxError(MISSING_IDENTITY) for an empty identity; the
     *         engine is not contacted
     * @throws SandboxError(CONNECTION_ERROR) if the engine cannot be reached
     * @throws SandboxError(REMOVAL_FAILED) if the engine could not remove it
     * @throws SandboxError(OPERATION_CANCELLED / DEADLINE_EXCEEDED) if @p ctx ends
     */
    TeardownOutcome TeardownSandbox(const std::string& container_id,
                                    const OperationContext& ctx);

    const TeardownPolicy& GetPolicy() const { return policy_; }

private:
    engine::RuntimeClientFactory& factory_;
    TeardownPolicy policy_;
};

} // namespace core
} // namespace sandgate
