#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace asc_mcp {

inline constexpr const char* kJsonRpcVersion = "2.0";
inline constexpr const char* kProtocolVersion = "2024-11-05";
inline constexpr const char* kServerName = "asc-mcp";

// JSON-RPC 2.0 error codes, plus the MCP "server not initialized" code.
inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;
inline constexpr int kNotInitialized = -32002;

// ---------------------------------------------------------------------------
// RpcError - the "error" member of a JSON-RPC response.
// ---------------------------------------------------------------------------
struct RpcError {
    int code = kInternalError;
    std::string message;
    std::optional<std::string> data;

    [[nodiscard]] nlohmann::json ToJson() const {
        nlohmann::json j = {{"code", code}, {"message", message}};
        if (data.has_value()) {
            j["data"] = *data;
        }
        return j;
    }
};

// Build a response envelope. An empty optional omits "id"; a JSON null id
// is echoed as null.
inline nlohmann::json MakeResponse(const std::optional<nlohmann::json>& id,
                                   const std::string& member,
                                   nlohmann::json value) {
    nlohmann::json response = {{"jsonrpc", kJsonRpcVersion}};
    if (id.has_value()) {
        response["id"] = *id;
    }
    response[member] = std::move(value);
    return response;
}

inline nlohmann::json MakeResultResponse(const std::optional<nlohmann::json>& id,
                                         nlohmann::json result) {
    return MakeResponse(id, "result", std::move(result));
}

inline nlohmann::json MakeErrorResponse(const std::optional<nlohmann::json>& id,
                                        const RpcError& error) {
    return MakeResponse(id, "error", error.ToJson());
}

} // namespace asc_mcp
