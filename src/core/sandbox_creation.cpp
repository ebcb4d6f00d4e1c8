/**
 * @file sandbox_creation.cpp
 * @brief Sandbox creation: local image check, create, start
 *
 * **Creation Flow**:
 * ```
 * resolve image → connect → inspect image (local only) → create → start → id
 * ```
 *
 * The image check never falls back to a pull. Sandboxes may run in
 * air-gapped deployments, so a missing image is reported to the caller,
 * who has to load it explicitly.
 *
 * A start failure leaves the created container behind unless
 * SandboxPolicy::remove_on_start_failure is set.
 *
 * @date 2025
 */

#include "sandgate/core/sandbox_creation.hpp"
#include "sandgate/core/errors.hpp"
#include "sandgate/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <regex>

namespace sandgate {
namespace core {

namespace {

// Budget for removing an orphan once the caller's context is gone
constexpr std::chrono::seconds kOrphanCleanupTimeout{30};

} // anonymous namespace

bool IsValidImageReference(const std::string& reference) {
    static const std::regex kReferencePattern(
        R"(^[A-Za-z0-9][A-Za-z0-9._\-]*(:[0-9]+)?(/[A-Za-z0-9][A-Za-z0-9._\-]*)*(:[A-Za-z0-9_][A-Za-z0-9._\-]{0,127})?(@[A-Za-z0-9_+.\-]+:[A-Fa-f0-9]{32,})?$)");

    if (reference.empty() || reference.size() > 512) {
        return false;
    }
    if (utils::StringUtils::Contains(reference, "..")) {
        return false;
    }
    return std::regex_match(reference, kReferencePattern);
}

SandboxCreationService::SandboxCreationService(engine::RuntimeClientFactory& factory,
                                               SandboxPolicy policy)
    : factory_(factory)
    , policy_(std::move(policy)) {
}

std::string SandboxCreationService::ResolveImage(
    const std::optional<std::string>& image_reference) const {
    if (image_reference) {
        std::string image = utils::StringUtils::Trim(*image_reference);
        if (!image.empty()) {
            return image;
        }
    }
    return policy_.default_image;
}

engine::ContainerSpec SandboxCreationService::BuildContainerSpec(const std::string& image) const {
    engine::ContainerSpec spec;
    spec.image = image;
    spec.working_dir = policy_.working_dir;
    spec.tty = policy_.tty;
    spec.open_stdin = policy_.open_stdin;
    spec.stdin_once = false;
    spec.command = policy_.command;
    spec.labels = policy_.labels;

    spec.limits.memory_bytes = static_cast<std::int64_t>(policy_.memory_limit_mb) * 1024 * 1024;
    spec.limits.nano_cpus = static_cast<std::int64_t>(std::llround(policy_.cpu_limit * 1e9));
    spec.limits.pids_limit = policy_.pids_limit;

    return spec;
}

std::string SandboxCreationService::CreateSandbox(
    const std::optional<std::string>& image_reference,
    const OperationContext& ctx) {

    const std::string image = ResolveImage(image_reference);

    if (!IsValidImageReference(image)) {
        spdlog::warn("Rejected malformed image reference: {}", image);
        throw SandboxError(ErrorCode::IMAGE_NOT_AVAILABLE,
                           "invalid image reference '" + image + "'");
    }

    spdlog::info("Creating sandbox from image {}", image);
    spdlog::debug("Sandbox command: {} (workdir {})",
                  utils::StringUtils::Join(policy_.command, " "), policy_.working_dir);

    auto client = factory_.Connect(ctx);

    // Local store only, never pull
    bool present = false;
    try {
        present = client->ImageExists(image, ctx);
    }
    catch (const engine::EngineError& e) {
        // With a pinned API version this is the first request on the wire
        if (e.IsTransportError()) {
            spdlog::error("Container engine unreachable: {}", e.what());
            throw SandboxError(ErrorCode::CONNECTION_ERROR,
                               "failed to reach container engine", e.what());
        }
        throw SandboxError(ErrorCode::IMAGE_NOT_AVAILABLE,
                           "unable to verify docker image " + image + " is available locally",
                           e.what());
    }

    if (!present) {
        spdlog::warn("Image {} not present in the local store", image);
        throw SandboxError(ErrorCode::IMAGE_NOT_AVAILABLE,
                           "docker image " + image +
                           " not found locally. Please build or load it before initializing a sandbox");
    }

    std::string container_id;
    try {
        container_id = client->CreateContainer(BuildContainerSpec(image), ctx);
    }
    catch (const engine::EngineError& e) {
        spdlog::error("Failed to create container from {}: {}", image, e.what());
        throw SandboxError(ErrorCode::ENGINE_CREATE_FAILED, "failed to create container", e.what());
    }

    spdlog::info("Container created: {}", container_id);

    try {
        client->StartContainer(container_id, ctx);
    }
    catch (const engine::EngineError& e) {
        spdlog::error("Failed to start container {}: {}", container_id, e.what());
        if (policy_.remove_on_start_failure) {
            DiscardOrphan(*client, container_id);
        }
        throw SandboxError(ErrorCode::ENGINE_START_FAILED,
                           "failed to start container " + container_id, e.what());
    }
    catch (const SandboxError& e) {
        // Cancelled or expired between create and start: name the container
        spdlog::error("Container {} created but not started: {}", container_id, e.what());
        if (policy_.remove_on_start_failure) {
            DiscardOrphan(*client, container_id);
        }
        throw SandboxError(e.GetErrorCode(),
                           e.Summary() + " after container " + container_id + " was created",
                           e.Cause());
    }

    spdlog::info("Sandbox ready: {}", container_id);
    return container_id;
}

void SandboxCreationService::DiscardOrphan(engine::EngineClient& client,
                                           const std::string& container_id) {
    spdlog::info("Removing unstarted container {}", container_id);

    engine::RemoveOptions options;
    options.force = true;
    options.remove_volumes = true;

    // The caller's context may already be done; cleanup gets its own budget
    auto cleanup_ctx = OperationContext::WithTimeout(kOrphanCleanupTimeout);

    try {
        client.RemoveContainer(container_id, options, cleanup_ctx);
        spdlog::info("Unstarted container {} removed", container_id);
    }
    catch (const engine::EngineError& e) {
        spdlog::error("Container {} leaked, removal failed: {}", container_id, e.what());
    }
    catch (const SandboxError& e) {
        spdlog::error("Container {} leaked, removal failed: {}", container_id, e.what());
    }
}

} // namespace core
} // namespace sandgate
