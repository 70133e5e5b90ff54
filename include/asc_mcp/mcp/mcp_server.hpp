#pragma once

#include <asc_mcp/core/result.hpp>
#include <asc_mcp/mcp/protocol.hpp>
#include <asc_mcp/mcp/tool_registry.hpp>

#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace asc_mcp {

// ---------------------------------------------------------------------------
// McpServer - MCP 2024-11-05 server over line-delimited JSON-RPC 2.0.
//
// Methods:
//   - initialize                  (any state, moves the session to Ready)
//   - notifications/initialized   (notification, never answered)
//   - tools/list                  (Ready only)
//   - tools/call                  (Ready only)
//
// One request is handled to completion before the next line is read. Send()
// serializes and writes a whole line under a lock, so it may also be called
// from other threads.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ToolRegistry registry,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    // Run the read loop until end of input.
    void Run();

    // Parse one input line and write the response, if any. Blank lines are
    // ignored.
    void HandleLine(const std::string& line);

    // Process a single decoded message and return the response, or nullopt
    // when none is due (notifications).
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    // Write one response line and flush.
    void Send(const nlohmann::json& response);

    [[nodiscard]] bool IsInitialized() const noexcept { return session_.initialized; }
    [[nodiscard]] bool IsClientReady() const noexcept { return session_.client_ready; }

private:
    struct Session {
        bool initialized = false;
        bool client_ready = false;
    };

    using MethodHandler =
        std::function<Result<nlohmann::json, RpcError>(const nlohmann::json& params)>;

    struct Method {
        bool requires_ready = false;
        MethodHandler handler;
    };

    Result<nlohmann::json, RpcError> HandleInitialize(const nlohmann::json& params);
    Result<nlohmann::json, RpcError> HandleInitialized(const nlohmann::json& params);
    Result<nlohmann::json, RpcError> HandleToolsList(const nlohmann::json& params);
    Result<nlohmann::json, RpcError> HandleToolsCall(const nlohmann::json& params);

    ToolRegistry registry_;
    std::istream& in_;
    std::ostream& out_;
    std::mutex write_mutex_;
    Session session_;
    std::map<std::string, Method> methods_;
};

} // namespace asc_mcp
