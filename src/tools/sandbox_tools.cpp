/**
 * @file sandbox_tools.cpp
 * @brief Tool handlers wrapping the sandbox services
 *
 * @date 2025
 */

#include "sandgate/tools/sandbox_tools.hpp"
#include "sandgate/tools/tool_server.hpp"
#include "sandgate/core/errors.hpp"
#include "sandgate/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <optional>

using json = nlohmann::json;

namespace sandgate {
namespace tools {

namespace {

// Missing and non-string values are both treated as absent
std::optional<std::string> StringArgument(const json& arguments, const char* key) {
    if (!arguments.is_object()) {
        return std::nullopt;
    }
    auto it = arguments.find(key);
    if (it == arguments.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::string ErrorText(const std::string& message) {
    return std::string(kErrorPrefix) + message;
}

} // anonymous namespace

SandboxTools::SandboxTools(core::SandboxCreationService& creation,
                           core::SandboxTeardownService& teardown)
    : creation_(creation)
    , teardown_(teardown) {
}

bool SandboxTools::IsErrorResult(const std::string& text) {
    return utils::StringUtils::StartsWith(text, kErrorPrefix);
}

std::string SandboxTools::InitializeEnvironment(const json& arguments,
                                                const core::OperationContext& ctx) {
    auto image = StringArgument(arguments, "image");

    try {
        std::string container_id = creation_.CreateSandbox(image, ctx);
        return "container_id: " + container_id;
    }
    catch (const core::SandboxError& e) {
        spdlog::error("initialize_environment failed [{}]: {}",
                      core::ErrorCodeName(e.GetErrorCode()), e.what());
        return ErrorText(e.what());
    }
    catch (const std::exception& e) {
        spdlog::error("initialize_environment failed: {}", e.what());
        return ErrorText(e.what());
    }
}

std::string SandboxTools::StopContainer(const json& arguments,
                                        const core::OperationContext& ctx) {
    auto container_id = StringArgument(arguments, "container_id");
    if (!container_id || utils::StringUtils::Trim(*container_id).empty()) {
        return ErrorText("container_id is required");
    }

    try {
        auto outcome = teardown_.TeardownSandbox(*container_id, ctx);
        return "Successfully stopped and removed container: " + outcome.container_id;
    }
    catch (const core::SandboxError& e) {
        spdlog::error("stop_container failed [{}]: {}",
                      core::ErrorCodeName(e.GetErrorCode()), e.what());
        return ErrorText(e.what());
    }
    catch (const std::exception& e) {
        spdlog::error("stop_container failed: {}", e.what());
        return ErrorText(e.what());
    }
}

void SandboxTools::RegisterWith(ToolServer& server) {
    server.RegisterTool({
        kInitializeToolName,
        "Initialize a new compute environment for code execution. "
        "Creates a container based on the specified docker image, which must already "
        "be present on the host. Returns the container_id used by the other tools.",
        {{"image", "string",
          std::string("Docker image to use as the base environment (default: ") +
              creation_.GetPolicy().default_image + ")",
          false}},
        [this](const json& arguments, const core::OperationContext& ctx) {
            return InitializeEnvironment(arguments, ctx);
        }
    });

    server.RegisterTool({
        kStopToolName,
        "Stop and remove a running container sandbox. "
        "Gracefully stops the container, then force-removes it with its volumes.",
        {{"container_id", "string", "ID of the container to stop and remove", true}},
        [this](const json& arguments, const core::OperationContext& ctx) {
            return StopContainer(arguments, ctx);
        }
    });
}

} // namespace tools
} // namespace sandgate
