#include <envsense/mcp/mcp_server.hpp>

#include <envsense/core/log.hpp>
#include <envsense/core/version.hpp>
#include <envsense/mcp/result_formatter.hpp>

#include <array>
#include <exception>

namespace envsense {

namespace {

// Newest first.
constexpr std::array<const char*, 3> kProtocolVersions = {
    "2025-06-18",
    "2025-03-26",
    "2024-11-05",
};

constexpr const char* kInstructions =
    "envsense reports the state of the local machine and its surroundings: "
    "user idle time, displays, network interfaces, USB devices, batteries, "
    "nearby Bluetooth LE devices, git repositories, CPU/memory/disk/process "
    "statistics and the weather. All tools are read-only.";

size_t SkipSpace(const std::string& text, size_t pos) {
    while (pos < text.size() &&
           (text[pos] == ' ' || text[pos] == '\t' || text[pos] == '\r' || text[pos] == '\n')) {
        ++pos;
    }
    return pos;
}

// `pos` is on an opening quote. Returns the index just past the closing
// quote, or npos when the string is cut off.
size_t SkipString(const std::string& text, size_t pos) {
    for (size_t i = pos + 1; i < text.size(); ++i) {
        if (text[i] == '\\') {
            ++i;
        } else if (text[i] == '"') {
            return i + 1;
        }
    }
    return std::string::npos;
}

// A string or integer id starting at `pos`.
std::optional<nlohmann::json> ParseIdToken(const std::string& text, size_t pos) {
    if (pos >= text.size()) return std::nullopt;

    size_t end = pos;
    if (text[pos] == '"') {
        end = SkipString(text, pos);
        if (end == std::string::npos) return std::nullopt;
    } else {
        if (text[end] == '-') ++end;
        const size_t digits = end;
        while (end < text.size() && text[end] >= '0' && text[end] <= '9') ++end;
        if (end == digits) return std::nullopt;
    }

    auto id = nlohmann::json::parse(text.substr(pos, end - pos), nullptr, false);
    if (id.is_discarded()) {
        return std::nullopt;
    }
    return id;
}

} // anonymous namespace

std::optional<nlohmann::json> RecoverRequestId(const std::string& raw) {
    const size_t n = raw.size();
    size_t i = SkipSpace(raw, 0);
    if (i >= n || raw[i] != '{') {
        return std::nullopt;
    }

    // Only a top-level "id" member belongs to the request itself.
    int depth = 0;
    while (i < n) {
        const char c = raw[i];
        if (c == '"') {
            const size_t end = SkipString(raw, i);
            if (end == std::string::npos) return std::nullopt;
            if (depth == 1 && raw.compare(i, end - i, "\"id\"") == 0) {
                size_t j = SkipSpace(raw, end);
                if (j < n && raw[j] == ':') {
                    return ParseIdToken(raw, SkipSpace(raw, j + 1));
                }
            }
            i = end;
            continue;
        }
        if (c == '{' || c == '[') {
            ++depth;
        } else if (c == '}' || c == ']') {
            --depth;
        }
        ++i;
    }
    return std::nullopt;
}

std::string NegotiateProtocolVersion(const nlohmann::json& requested) {
    if (requested.is_string()) {
        const auto version = requested.get<std::string>();
        for (const char* supported : kProtocolVersions) {
            if (version == supported) return version;
        }
    }
    return kProtocolVersions.front();
}

McpServer::McpServer(ToolRegistry registry,
                     std::istream& in,
                     std::ostream& out)
    : registry_(std::move(registry)), in_(in), out_(out) {}

void McpServer::Run() {
    LogInfo("mcp", "serving " + std::to_string(registry_.Tools().size()) +
                       " tools on stdio");
    std::string line;
    while (std::getline(in_, line)) {
        std::optional<nlohmann::json> response;
        try {
            response = HandleLine(line);
        } catch (const std::exception& e) {
            LogError("mcp", std::string("request failed: ") + e.what());
            if (auto id = RecoverRequestId(line)) {
                response = MakeError(*id, -32603, "Internal error");
            }
        }
        if (response) {
            // Provider text is not guaranteed to be valid UTF-8.
            out_ << response->dump(-1, ' ', false,
                                   nlohmann::json::error_handler_t::replace)
                 << "\n";
            out_.flush();
        }
    }
    LogInfo("mcp", "input closed, shutting down");
}

std::optional<nlohmann::json> McpServer::HandleLine(const std::string& line) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
        return std::nullopt;
    }

    auto message = nlohmann::json::parse(line, nullptr, false);
    if (message.is_discarded()) {
        auto id = RecoverRequestId(line);
        if (!id) {
            LogWarn("mcp", "discarding undecodable line (" +
                               std::to_string(line.size()) + " bytes)");
            return std::nullopt;
        }
        LogWarn("mcp", "parse error in request " + id->dump());
        return MakeError(*id, -32700, "Parse error");
    }
    return HandleMessage(message);
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeError(nullptr, -32600, "Invalid Request");
    }

    // Check for JSON-RPC 2.0.
    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        if (message.contains("id")) {
            return MakeError(message["id"], -32600, "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    const std::string method =
        message.contains("method") && message["method"].is_string()
            ? message["method"].get<std::string>()
            : std::string();
    auto params = message.value("params", nlohmann::json::object());

    // Notifications have no "id" and never get a response.
    if (!message.contains("id")) {
        LogDebug("mcp", "notification " + method);
        return std::nullopt;
    }

    const auto& id = message["id"];
    LogDebug("mcp", "request " + id.dump() + " " + method);

    if (method == "initialize") {
        return HandleInitialize(params, id);
    } else if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    }
    return MakeError(id, -32601, "Method not found: " + method);
}

nlohmann::json McpServer::HandleInitialize(
    const nlohmann::json& params, const nlohmann::json& id) {
    const auto version = NegotiateProtocolVersion(
        params.is_object() ? params.value("protocolVersion", nlohmann::json())
                           : nlohmann::json());
    if (params.is_object() && params.contains("clientInfo") &&
        params["clientInfo"].is_object()) {
        const auto& client = params["clientInfo"];
        const std::string name = client.contains("name") && client["name"].is_string()
                                     ? client["name"].get<std::string>()
                                     : std::string("?");
        LogInfo("mcp", "client " + name + " connected (protocol " + version + ")");
    }

    nlohmann::json result;
    result["protocolVersion"] = version;
    result["capabilities"] = {
        {"tools", {{"listChanged", false}}}
    };
    result["serverInfo"] = {
        {"name", kServerName},
        {"version", kVersion}
    };
    result["instructions"] = kInstructions;

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& descriptor : registry_.Tools()) {
        tools.push_back(descriptor.ToJson());
    }
    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return MakeError(id, -32602, "Missing 'name' parameter");
    }

    Invocation invocation;
    invocation.tool_name = params["name"].get<std::string>();
    invocation.arguments = params.value("arguments", nlohmann::json::object());

    return MakeResult(id, FormatToolOutcome(registry_.Dispatch(invocation)));
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace envsense
