#include <asc_mcp/mcp/mcp_server.hpp>

#include <asc_mcp/core/log.hpp>
#include <asc_mcp/core/version.hpp>

#include <algorithm>
#include <string>

namespace asc_mcp {

namespace {

using MethodResult = Result<nlohmann::json, RpcError>;

bool IsBlankLine(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    });
}

// The id to echo, if the message carries one of a permitted type.
std::optional<nlohmann::json> RecoverId(const nlohmann::json& message) {
    if (!message.is_object()) return std::nullopt;
    auto it = message.find("id");
    if (it == message.end()) return std::nullopt;
    if (it->is_string() || it->is_number() || it->is_null()) return *it;
    return std::nullopt;
}

bool IsEnvelope(const nlohmann::json& message) {
    if (!message.is_object()) return false;
    auto version = message.find("jsonrpc");
    auto method = message.find("method");
    return version != message.end() && version->is_string() &&
           method != message.end() && method->is_string();
}

RpcError InvalidParams(const std::string& detail) {
    return RpcError{kInvalidParams, "Invalid params", detail};
}

} // anonymous namespace

McpServer::McpServer(ToolRegistry registry,
                     std::istream& in,
                     std::ostream& out)
    : registry_(std::move(registry)), in_(in), out_(out) {
    methods_["initialize"] = {
        false, [this](const nlohmann::json& p) { return HandleInitialize(p); }};
    methods_["notifications/initialized"] = {
        false, [this](const nlohmann::json& p) { return HandleInitialized(p); }};
    methods_["tools/list"] = {
        true, [this](const nlohmann::json& p) { return HandleToolsList(p); }};
    methods_["tools/call"] = {
        true, [this](const nlohmann::json& p) { return HandleToolsCall(p); }};
}

// ---------------------------------------------------------------------------
// Read loop
// ---------------------------------------------------------------------------
void McpServer::Run() {
    LogInfo("mcp", std::string("server ") + kServerName + " " + kVersion +
                       " reading requests");
    std::string line;
    while (std::getline(in_, line)) {
        HandleLine(line);
    }
    if (in_.bad()) {
        LogError("mcp", "input stream failed, stopping");
        return;
    }
    LogInfo("mcp", "client disconnected");
}

void McpServer::HandleLine(const std::string& line) {
    if (IsBlankLine(line)) return;

    auto message = nlohmann::json::parse(line, nullptr, false);
    if (message.is_discarded()) {
        LogWarn("mcp", "unparseable input line (" + std::to_string(line.size()) +
                           " bytes)");
        Send(MakeErrorResponse(std::nullopt,
                               RpcError{kParseError, "Parse error",
                                        std::string("invalid JSON")}));
        return;
    }

    auto response = HandleMessage(message);
    if (response.has_value()) {
        Send(*response);
    }
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------
std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    const auto id = RecoverId(message);

    if (!IsEnvelope(message)) {
        return MakeErrorResponse(
            id, RpcError{kParseError, "Parse error",
                         std::string("expected a JSON-RPC request object")});
    }

    // A present "id", even null, makes this a request.
    const bool is_notification = !message.contains("id");
    const auto method_name = message["method"].get<std::string>();

    auto respond = [&](const RpcError& error) -> std::optional<nlohmann::json> {
        if (is_notification) {
            LogDebug("mcp", "dropping error for notification " + method_name +
                                ": " + error.message);
            return std::nullopt;
        }
        return MakeErrorResponse(id, error);
    };

    if (message["jsonrpc"].get<std::string>() != kJsonRpcVersion) {
        return respond(RpcError{kInvalidRequest, "Invalid Request",
                                std::string("jsonrpc must be 2.0")});
    }

    auto it = methods_.find(method_name);
    if (it == methods_.end()) {
        return respond(RpcError{kMethodNotFound, "Method not found", method_name});
    }
    if (it->second.requires_ready && !session_.initialized) {
        return respond(RpcError{kNotInitialized, "Not initialized",
                                std::string("initialize must be called first")});
    }

    const auto params = message.contains("params") ? message["params"]
                                                   : nlohmann::json();

    MethodResult result = MethodResult::Ok(nlohmann::json());
    try {
        result = it->second.handler(params);
    } catch (const std::exception& e) {
        LogError("mcp", method_name + " failed: " + e.what());
        return respond(RpcError{kInternalError, "Internal error",
                                std::string(e.what())});
    }

    if (result.IsErr()) {
        return respond(result.Error());
    }
    if (is_notification) {
        return std::nullopt;
    }
    return MakeResultResponse(id, std::move(result).Value());
}

// ---------------------------------------------------------------------------
// Writer
// ---------------------------------------------------------------------------
void McpServer::Send(const nlohmann::json& response) {
    const auto line =
        response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(write_mutex_);
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        LogError("mcp", "failed to write response");
    }
}

// ---------------------------------------------------------------------------
// Methods
// ---------------------------------------------------------------------------
MethodResult McpServer::HandleInitialize(const nlohmann::json& params) {
    if (!params.is_null() && !params.is_object()) {
        return MethodResult::Err(InvalidParams("params must be an object"));
    }

    std::string client_name = "unknown";
    std::string client_version = "unknown";
    if (params.is_object()) {
        auto info = params.find("clientInfo");
        if (info != params.end() && info->is_object()) {
            auto name = info->find("name");
            auto version = info->find("version");
            if (name != info->end() && name->is_string()) {
                client_name = name->get<std::string>();
            }
            if (version != info->end() && version->is_string()) {
                client_version = version->get<std::string>();
            }
        }
    }
    LogInfo("mcp", "initializing with client: " + client_name + " " + client_version);

    session_.initialized = true;

    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", {{"listChanged", false}}}
    };
    result["serverInfo"] = {
        {"name", kServerName},
        {"version", kVersion}
    };
    return MethodResult::Ok(std::move(result));
}

MethodResult McpServer::HandleInitialized(const nlohmann::json& /*params*/) {
    session_.client_ready = true;
    LogInfo("mcp", "client initialized");
    return MethodResult::Ok(nlohmann::json());
}

MethodResult McpServer::HandleToolsList(const nlohmann::json& /*params*/) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }
    return MethodResult::Ok(nlohmann::json{{"tools", tools}});
}

MethodResult McpServer::HandleToolsCall(const nlohmann::json& params) {
    if (!params.is_object()) {
        return MethodResult::Err(InvalidParams("params must be an object"));
    }
    auto name = params.find("name");
    if (name == params.end() || !name->is_string()) {
        return MethodResult::Err(InvalidParams("'name' must be a string"));
    }

    nlohmann::json arguments = nlohmann::json::object();
    auto args = params.find("arguments");
    if (args != params.end() && !args->is_null()) {
        if (!args->is_object()) {
            return MethodResult::Err(InvalidParams("'arguments' must be an object"));
        }
        arguments = *args;
    }

    const auto tool_name = name->get<std::string>();
    LogInfo("mcp", "tools/call " + tool_name);
    auto result = registry_.Execute(tool_name, arguments);

    nlohmann::json response_result;
    response_result["content"] = result.content;
    if (result.is_error) {
        response_result["isError"] = true;
    }
    return MethodResult::Ok(std::move(response_result));
}

} // namespace asc_mcp
