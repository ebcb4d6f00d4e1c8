/**
 * @file tool_server.hpp
 * @brief Line-delimited JSON-RPC 2.0 tool server (Model Context Protocol)
 *
 * The server owns a registry of named tools and speaks the subset of MCP
 * an agent runtime needs to discover and invoke them: initialize, ping,
 * tools/list, tools/call and notifications/cancelled. Messages are read
 * one per line from an input stream and answered one per line on an
 * output stream. Logs never go to that stream.
 *
 * **Protocol Flow**:
 * ```
 * → {"jsonrpc":"2.0","id":1,"method":"initialize","params":{...}}
 * ← {"jsonrpc":"2.0","id":1,"result":{"protocolVersion":"2024-11-05",...}}
 * → {"jsonrpc":"2.0","method":"notifications/initialized"}
 * → {"jsonrpc":"2.0","id":2,"method":"tools/call",
 *    "params":{"name":"sandbox_initialize","arguments":{}}}
 * ← {"jsonrpc":"2.0","id":2,"result":{"content":[{"type":"text","text":"container_id: 3f2a..."}]}}
 * ```
 *
 * @date 2025
 */

#pragma once

#include "sandgate/core/operation_context.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <iosfwd>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sandgate {
namespace tools {

/// Gateway version reported in serverInfo and by --version
inline constexpr const char* kGatewayVersion = "1.0.0";

/// MCP revision implemented by ToolServer
inline constexpr const char* kProtocolVersion = "2024-11-05";

/**
 * @brief JSON-RPC 2.0 error codes
 */
namespace rpc_error {
inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;
} // namespace rpc_error

/**
 * @struct ToolParam
 * @brief One named argument of a tool
 */
struct ToolParam {
    std::string name;
    std::string type;          ///< JSON-Schema type ("string", "number", ...)
    std::string description;
    bool required{false};
};

/// Tool body: receives the call arguments (always an object) and the
/// per-call context, returns the text payload
using ToolHandler = std::function<std::string(const nlohmann::json& arguments,
                                              const core::OperationContext& ctx)>;

/**
 * @struct ToolDefinition
 * @brief A tool as advertised by tools/list
 */
struct ToolDefinition {
    std::string name;
    std::string description;
    std::vector<ToolParam> params;
    ToolHandler handler;

    /**
     * @brief JSON-Schema object describing params
     */
    nlohmann::json InputSchema() const;
};

/**
 * @struct ServerOptions
 * @brief Identity and limits of a ToolServer
 */
struct ServerOptions {
    std::string name{"sandgate"};
    std::string version{kGatewayVersion};
    std::chrono::seconds operation_timeout{120};   ///< Deadline per tools/call (0 = none)
};

/**
 * @class ToolServer
 * @brief Tool registry plus JSON-RPC dispatcher
 *
 * HandleMessage() processes one decoded message synchronously, which is
 * what the unit tests drive. Serve() runs the stdio loop: every
 * tools/call is executed on its own task so a slow engine call does not
 * block pings or cancellation notices, and responses are written under
 * a lock as they complete.
 *
 * **Usage Example**:
 * @code
 * ToolServer server(options);
 * server.RegisterTool({"echo", "Echo text", {{"text", "string", "Text", true}},
 *                      [](const json& args, const core::OperationContext&) {
 *                          return args.value("text", "");
 *                      }});
 * server.Serve(std::cin, std::cout);
 * @endcode
 */
class ToolServer {
public:
    explicit ToolServer(ServerOptions options);
    ~ToolServer();

    ToolServer(const ToolServer&) = delete;
    ToolServer& operator=(const ToolServer&) = delete;

    /**
     * @brief Add a tool to the registry
     * @throws std::invalid_argument on empty name, missing handler or duplicate name
     */
    void RegisterTool(ToolDefinition tool);

    /**
     * @brief Names of registered tools, in registration order
     */
    std::vector<std::string> ToolNames() const;

    /**
     * @brief Process one decoded JSON-RPC message
     * @return Response, or std::nullopt for notifications
     */
    std::optional<nlohmann::json> HandleMessage(const nlohmann::json& message);

    /**
     * @brief Process one raw line (parse errors become -32700 responses)
     */
    std::optional<nlohmann::json> HandleLine(const std::string& line);

    /**
     * @brief Run until @p in reaches EOF; waits for in-flight calls before returning
     */
    void Serve(std::istream& in, std::ostream& out);

    /**
     * @brief Cancel the in-flight tools/call with JSON-RPC id @p request_id
     * @return true if a matching call was running
     */
    bool CancelRequest(const nlohmann::json& request_id);

    /**
     * @brief Number of tools/call requests currently executing
     */
    std::size_t InFlightCount() const;

    const ServerOptions& GetOptions() const { return options_; }

private:
    struct Request {
        nlohmann::json id;
        std::string method;
        nlohmann::json params;
        bool is_notification{false};
    };

    // Validates envelope; on failure returns the error response in @p error
    std::optional<Request> DecodeRequest(const nlohmann::json& message,
                                         std::optional<nlohmann::json>& error) const;

    std::optional<nlohmann::json> Dispatch(const Request& request);

    nlohmann::json HandleInitialize(const nlohmann::json& params) const;
    nlohmann::json HandleToolsList() const;
    void HandleCancelled(const nlohmann::json& params);

    // Returns a full response (result or error) for a tools/call
    nlohmann::json ExecuteToolCall(const Request& request, const core::OperationContext& ctx);

    // std::nullopt if a call with the same id is already running
    std::optional<core::OperationContext> BeginCall(const nlohmann::json& request_id);
    void EndCall(const nlohmann::json& request_id);

    core::OperationContext NewCallContext() const;

    ServerOptions options_;
    std::vector<ToolDefinition> tools_;

    mutable std::mutex in_flight_mutex_;
    std::map<std::string, core::OperationContext> in_flight_;   ///< keyed by id.dump()
};

/**
 * @brief Build a JSON-RPC success response
 */
nlohmann::json MakeResult(const nlohmann::json& id, nlohmann::json result);

/**
 * @brief Build a JSON-RPC error response
 */
nlohmann::json MakeError(const nlohmann::json& id, int code, const std::string& message);

/**
 * @brief MCP tool result carrying a single text block
 */
nlohmann::json MakeTextContent(const std::string& text);

} // namespace tools
} // namespace sandgate
