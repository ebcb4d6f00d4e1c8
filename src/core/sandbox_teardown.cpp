/**
 * @file sandbox_teardown.cpp
 * @brief Two-step sandbox cleanup
 *
 * **Teardown Flow**:
 * ```
 * Step 1: stop (grace period)      → failure logged and ignored
 * Step 2: remove (force, volumes)  → failure is the operation's failure
 * ```
 *
 * A container in an unknown or already terminated state must still be
 * reclaimed, so only the removal result counts. A 404 on removal means
 * the container is already gone and is reported as success.
 *
 * @date 2025
 */

#include "sandgate/core/sandbox_teardown.hpp"
#include "sandgate/core/errors.hpp"
#include "sandgate/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace sandgate {
namespace core {

SandboxTeardownService::SandboxTeardownService(engine::RuntimeClientFactory& factory,
                                               TeardownPolicy policy)
    : factory_(factory)
    , policy_(policy) {
}

TeardownOutcome SandboxTeardownService::TeardownSandbox(const std::string& container_id,
                                                        const OperationContext& ctx) {
    const std::string id = utils::StringUtils::Trim(container_id);
    if (id.empty()) {
        throw SandboxError(ErrorCode::MISSING_IDENTITY, "container_id is required");
    }

    spdlog::info("Tearing down sandbox {}", id);

    TeardownOutcome outcome;
    outcome.container_id = id;

    auto client = factory_.Connect(ctx);

    // Step 1: best effort. Cancellation/deadline (SandboxError) still propagates.
    outcome.stop_attempted = true;
    try {
        client->StopContainer(id, policy_.stop_grace, ctx);
        spdlog::debug("Container {} stopped", id);
    }
    catch (const engine::EngineError& e) {
        outcome.stop_error = e.what();
        spdlog::warn("Ignoring stop failure for {}: {}", id, e.what());
    }

    // Step 2: authoritative, always forced and always with volumes
    engine::RemoveOptions options;
    options.force = true;
    options.remove_volumes = true;

    try {
        client->RemoveContainer(id, options, ctx);
    }
    catch (const engine::EngineError& e) {
        if (!e.IsNotFound()) {
            spdlog::error("Failed to remove container {} (sandbox may be leaked): {}", id, e.what());
            throw SandboxError(ErrorCode::REMOVAL_FAILED, "failed to remove container", e.what());
        }
        outcome.already_absent = true;
        spdlog::info("Container {} already removed", id);
    }

    outcome.removed = true;
    spdlog::info("Sandbox {} torn down", id);
    return outcome;
}

} // namespace core
} // namespace sandgate
