/**
 * @file sandbox_tools.hpp
 * @brief Agent-facing sandbox tools
 *
 * Adapts the creation and teardown services to the text-in/text-out
 * contract of the tool surface. Neither tool raises: failures come back
 * as text starting with "Error: ".
 *
 * @date 2025
 */

#pragma once

#include "sandgate/core/operation_context.hpp"
#include "sandgate/core/sandbox_creation.hpp"
#include "sandgate/core/sandbox_teardown.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace sandgate {
namespace tools {

class ToolServer;

/// Registered tool names
inline constexpr const char* kInitializeToolName = "sandbox_initialize";
inline constexpr const char* kStopToolName = "sandbox_stop";

/// Prefix marking a failed tool result
inline constexpr const char* kErrorPrefix = "Error: ";

/**
 * @class SandboxTools
 * @brief initialize_environment and stop_container
 *
 * **Usage Example**:
 * @code
 * SandboxTools sandbox_tools(creation, teardown);
 * sandbox_tools.RegisterWith(server);
 *
 * // Or directly:
 * auto text = sandbox_tools.InitializeEnvironment({{"image", "alpine:3.20"}}, ctx);
 * // "container_id: 3f2a9c1b..." or "Error: docker image alpine:3.20 not found locally..."
 * @endcode
 */
class SandboxTools {
public:
    SandboxTools(core::SandboxCreationService& creation,
                 core::SandboxTeardownService& teardown);

    /**
     * @brief Create and start a sandbox
     *
     * @param arguments Tool arguments; optional string "image"
     * @param ctx Deadline/cancellation
     * @return "container_id: <id>" or "Error: <message>"
     */
    std::string InitializeEnvironment(const nlohmann::json& arguments,
                                      const core::OperationContext& ctx);

    /**
     * @brief Stop and remove a sandbox
     *
     * @param arguments Tool arguments; required string "container_id"
     * @param ctx Deadline/cancellation
     * @return "Successfully stopped and removed container: <id>" or "Error: <message>"
     */
    std::string StopContainer(const nlohmann::json& arguments,
                              const core::OperationContext& ctx);

    /**
     * @brief Register both tools on @p server
     */
    void RegisterWith(ToolServer& server);

    /**
     * @brief true if @p text is a failed tool result
     */
    static bool IsErrorResult(const std::string& text);

private:
    core::SandboxCreationService& creation_;
    core::SandboxTeardownService& teardown_;
};

} // namespace tools
} // namespace sandgate
