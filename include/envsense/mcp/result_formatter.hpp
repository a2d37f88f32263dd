#pragma once

#include <envsense/mcp/tool_registry.hpp>

#include <string>

#include <nlohmann/json.hpp>

namespace envsense {

// "<Kind> (<category>): <message>", e.g.
// "Provider error (device_unavailable): No battery present ...".
[[nodiscard]] std::string RenderFailureText(const Error& error);

// The `result` object of a tools/call response:
//   {"content": [{"type": "text", "text": ...}],
//    "structuredContent": {...},
//    "isError": bool}
// Failures carry {"error": Error::ToJson()} as structured content.
[[nodiscard]] nlohmann::json FormatToolOutcome(const ToolOutcome& outcome);

} // namespace envsense
