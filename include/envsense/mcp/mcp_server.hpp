#pragma once

#include <envsense/mcp/tool_registry.hpp>

#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace envsense {

// ---------------------------------------------------------------------------
// McpServer: MCP server over newline-delimited JSON-RPC 2.0 on stdin/stdout.
//
// Methods:
//   - initialize   (protocol versions 2025-06-18, 2025-03-26, 2024-11-05)
//   - ping
//   - tools/list
//   - tools/call
//   - notifications/* (no response)
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ToolRegistry registry,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    // Run the server loop (blocks until EOF on the input stream).
    void Run();

    // Process a single decoded JSON-RPC message and return the response.
    // Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    // Process one raw input line; nullopt when nothing should be written.
    [[nodiscard]] std::optional<nlohmann::json> HandleLine(const std::string& line);

private:
    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);
    static nlohmann::json MakeError(const nlohmann::json& id,
                                    int code, const std::string& message);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);

    ToolRegistry registry_;
    std::istream& in_;
    std::ostream& out_;
};

// Best-effort recovery of the "id" member from text that failed to parse.
[[nodiscard]] std::optional<nlohmann::json> RecoverRequestId(const std::string& raw);

// The client's version when supported, otherwise the newest supported one.
[[nodiscard]] std::string NegotiateProtocolVersion(const nlohmann::json& requested);

} // namespace envsense
