/**
 * @file tool_server.cpp
 * @brief JSON-RPC dispatch and the stdio serving loop
 *
 * **Message Handling**:
 * ```
 * line ─► parse ─► envelope check ─► method
 *   │        │            │             ├─ initialize / ping / tools/list  (inline)
 *   │        │            │             ├─ notifications/*                 (no response)
 *   │        │            │             └─ tools/call ─► task ─► handler ─► response
 *   │        │            └─► -32600
 *   │        └─► -32700
 *   └─ blank lines are skipped
 * ```
 *
 * @date 2025
 */

#include "sandgate/tools/tool_server.hpp"
#include "sandgate/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <istream>
#include <ostream>
#include <stdexcept>

using json = nlohmann::json;

namespace sandgate {
namespace tools {

namespace {

std::string IdKey(const json& id) {
    return id.dump();
}

std::string StringField(const json& object, const char* key, const std::string& fallback) {
    auto it = object.find(key);
    return (it != object.end() && it->is_string()) ? it->get<std::string>() : fallback;
}

std::string Serialize(const json& message) {
    // Engine error text is not guaranteed to be valid UTF-8
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // anonymous namespace

// ============================================================================
// RESPONSE BUILDERS
// ============================================================================

json MakeResult(const json& id, json result) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

json MakeError(const json& id, int code, const std::string& message) {
    return json{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

json MakeTextContent(const std::string& text) {
    return json{{"content", json::array({{{"type", "text"}, {"text", text}}})}};
}

json ToolDefinition::InputSchema() const {
    json properties = json::object();
    json required = json::array();

    for (const auto& param : params) {
        properties[param.name] = {{"type", param.type}, {"description", param.description}};
        if (param.required) {
            required.push_back(param.name);
        }
    }

    json schema = {{"type", "object"}, {"properties", properties}};
    if (!required.empty()) {
        schema["required"] = required;
    }
    return schema;
}

// ============================================================================
// REGISTRY
// ============================================================================

ToolServer::ToolServer(ServerOptions options)
    : options_(std::move(options)) {
}

ToolServer::~ToolServer() = default;

void ToolServer::RegisterTool(ToolDefinition tool) {
    if (tool.name.empty()) {
        throw std::invalid_argument("tool name must not be empty");
    }
    if (!tool.handler) {
        throw std::invalid_argument("tool '" + tool.name + "' has no handler");
    }

    auto existing = std::find_if(tools_.begin(), tools_.end(),
                                 [&](const ToolDefinition& t) { return t.name == tool.name; });
    if (existing != tools_.end()) {
        throw std::invalid_argument("tool '" + tool.name + "' is already registered");
    }

    spdlog::debug("Registered tool {}", tool.name);
    tools_.push_back(std::move(tool));
}

std::vector<std::string> ToolServer::ToolNames() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& tool : tools_) {
        names.push_back(tool.name);
    }
    return names;
}

// ============================================================================
// IN-FLIGHT TRACKING
// ============================================================================

core::OperationContext ToolServer::NewCallContext() const {
    if (options_.operation_timeout.count() > 0) {
        return core::OperationContext::WithTimeout(options_.operation_timeout);
    }
    return core::OperationContext();
}

std::optional<core::OperationContext> ToolServer::BeginCall(const json& request_id) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    auto key = IdKey(request_id);
    if (in_flight_.count(key) != 0) {
        return std::nullopt;
    }
    auto ctx = NewCallContext();
    in_flight_.emplace(key, ctx);
    return ctx;
}

void ToolServer::EndCall(const json& request_id) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    in_flight_.erase(IdKey(request_id));
}

bool ToolServer::CancelRequest(const json& request_id) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    auto it = in_flight_.find(IdKey(request_id));
    if (it == in_flight_.end()) {
        return false;
    }
    it->second.Cancel();
    return true;
}

std::size_t ToolServer::InFlightCount() const {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    return in_flight_.size();
}

// ============================================================================
// DISPATCH
// ============================================================================

std::optional<ToolServer::Request> ToolServer::DecodeRequest(
    const json& message, std::optional<json>& error) const {

    error.reset();

    if (!message.is_object()) {
        error = MakeError(nullptr, rpc_error::kInvalidRequest, "request must be a JSON object");
        return std::nullopt;
    }

    Request request;
    request.is_notification = !message.contains("id");
    if (!request.is_notification) {
        request.id = message.at("id");
        if (!request.id.is_string() && !request.id.is_number_integer()) {
            error = MakeError(nullptr, rpc_error::kInvalidRequest,
                              "id must be a string or an integer");
            return std::nullopt;
        }
    }

    auto version = message.find("jsonrpc");
    if (version == message.end() || !version->is_string() || version->get<std::string>() != "2.0") {
        if (!request.is_notification) {
            error = MakeError(request.id, rpc_error::kInvalidRequest, "jsonrpc must be \"2.0\"");
        }
        return std::nullopt;
    }

    auto method = message.find("method");
    if (method == message.end() || !method->is_string()) {
        if (!request.is_notification) {
            error = MakeError(request.id, rpc_error::kInvalidRequest, "method must be a string");
        }
        return std::nullopt;
    }
    request.method = method->get<std::string>();

    request.params = json::object();
    if (auto params = message.find("params"); params != message.end() && !params->is_null()) {
        request.params = *params;
    }

    return request;
}

std::optional<json> ToolServer::HandleMessage(const json& message) {
    std::optional<json> error;
    auto request = DecodeRequest(message, error);
    if (!request) {
        return error;
    }
    return Dispatch(*request);
}

std::optional<json> ToolServer::HandleLine(const std::string& line) {
    json message;
    try {
        message = json::parse(line);
    }
    catch (const json::parse_error& e) {
        spdlog::warn("Unparsable message: {}", e.what());
        return MakeError(nullptr, rpc_error::kParseError, "parse error");
    }
    return HandleMessage(message);
}

std::optional<json> ToolServer::Dispatch(const Request& request) {
    spdlog::debug("<- {}", request.method);

    if (request.method == "notifications/cancelled") {
        HandleCancelled(request.params);
        return std::nullopt;
    }
    if (utils::StringUtils::StartsWith(request.method, "notifications/")) {
        return std::nullopt;
    }

    if (request.is_notification) {
        spdlog::debug("Ignoring notification-style call of {}", request.method);
        return std::nullopt;
    }

    if (request.method == "initialize") {
        return MakeResult(request.id, HandleInitialize(request.params));
    }
    if (request.method == "ping") {
        return MakeResult(request.id, json::object());
    }
    if (request.method == "tools/list") {
        return MakeResult(request.id, HandleToolsList());
    }
    if (request.method == "tools/call") {
        auto ctx = BeginCall(request.id);
        if (!ctx) {
            return MakeError(request.id, rpc_error::kInvalidRequest, "request id already in use");
        }
        json response = ExecuteToolCall(request, *ctx);
        EndCall(request.id);
        return response;
    }

    spdlog::warn("Unknown method: {}", request.method);
    return MakeError(request.id, rpc_error::kMethodNotFound, "Method not found: " + request.method);
}

json ToolServer::HandleInitialize(const json& params) const {
    if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
        const auto& client = params["clientInfo"];
        spdlog::info("Client connected: {} {}",
                     StringField(client, "name", "unknown"), StringField(client, "version", ""));
    }

    return json{
        {"protocolVersion", kProtocolVersion},
        {"capabilities", {{"tools", {{"listChanged", false}}}}},
        {"serverInfo", {{"name", options_.name}, {"version", options_.version}}}
    };
}

json ToolServer::HandleToolsList() const {
    json list = json::array();
    for (const auto& tool : tools_) {
        list.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.InputSchema()}
        });
    }
    return json{{"tools", list}};
}

void ToolServer::HandleCancelled(const json& params) {
    if (!params.is_object() || !params.contains("requestId")) {
        return;
    }

    const auto& request_id = params["requestId"];
    if (CancelRequest(request_id)) {
        spdlog::info("Cancelling request {} ({})", request_id.dump(),
                     StringField(params, "reason", "no reason given"));
    } else {
        spdlog::debug("Cancellation for unknown request {}", request_id.dump());
    }
}

json ToolServer::ExecuteToolCall(const Request& request, const core::OperationContext& ctx) {
    const json& params = request.params;
    if (!params.is_object()) {
        return MakeError(request.id, rpc_error::kInvalidParams, "params must be an object");
    }

    auto name = params.find("name");
    if (name == params.end() || !name->is_string()) {
        return MakeError(request.id, rpc_error::kInvalidParams, "missing tool name");
    }
    const std::string tool_name = name->get<std::string>();

    auto tool = std::find_if(tools_.begin(), tools_.end(),
                             [&](const ToolDefinition& t) { return t.name == tool_name; });
    if (tool == tools_.end()) {
        return MakeError(request.id, rpc_error::kInvalidParams, "Unknown tool: " + tool_name);
    }

    json arguments = json::object();
    if (auto it = params.find("arguments"); it != params.end() && !it->is_null()) {
        arguments = *it;
    }
    if (!arguments.is_object()) {
        return MakeError(request.id, rpc_error::kInvalidParams, "arguments must be an object");
    }

    spdlog::info("Calling tool {}", tool_name);
    try {
        std::string text = tool->handler(arguments, ctx);
        return MakeResult(request.id, MakeTextContent(text));
    }
    catch (const std::exception& e) {
        spdlog::error("Tool {} failed: {}", tool_name, e.what());
        return MakeError(request.id, rpc_error::kInternalError, e.what());
    }
}

// ============================================================================
// STDIO LOOP
// ============================================================================

void ToolServer::Serve(std::istream& in, std::ostream& out) {
    std::mutex out_mutex;
    std::vector<std::future<void>> pending;

    auto write = [&out, &out_mutex](const json& message) {
        std::lock_guard<std::mutex> lock(out_mutex);
        out << Serialize(message) << '\n';
        out.flush();
    };

    spdlog::info("{} {} serving {} tools on stdio", options_.name, options_.version, tools_.size());

    std::string line;
    while (std::getline(in, line)) {
        if (utils::StringUtils::Trim(line).empty()) {
            continue;
        }

        // Reap finished calls
        pending.erase(std::remove_if(pending.begin(), pending.end(),
                                     [](std::future<void>& f) {
                                         return f.wait_for(std::chrono::seconds(0)) ==
                                                std::future_status::ready;
                                     }),
                      pending.end());

        json message;
        try {
            message = json::parse(line);
        }
        catch (const json::parse_error& e) {
            spdlog::warn("Unparsable message: {}", e.what());
            write(MakeError(nullptr, rpc_error::kParseError, "parse error"));
            continue;
        }

        std::optional<json> error;
        auto request = DecodeRequest(message, error);
        if (!request) {
            if (error) {
                write(*error);
            }
            continue;
        }

        if (request->method == "tools/call" && !request->is_notification) {
            auto ctx = BeginCall(request->id);
            if (!ctx) {
                write(MakeError(request->id, rpc_error::kInvalidRequest, "request id already in use"));
                continue;
            }

            pending.push_back(std::async(std::launch::async,
                [this, req = *request, call_ctx = *ctx, &write]() {
                    json response = ExecuteToolCall(req, call_ctx);
                    EndCall(req.id);
                    write(response);
                }));
            continue;
        }

        if (auto response = Dispatch(*request)) {
            write(*response);
        }
    }

    if (!pending.empty()) {
        spdlog::info("Input closed, waiting for {} running call(s)", pending.size());
    }
    for (auto& f : pending) {
        f.get();
    }

    spdlog::info("Tool server stopped");
}

} // namespace tools
} // namespace sandgate
