#include <envsense/mcp/result_formatter.hpp>

namespace envsense {

namespace {

const char* KindLabel(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::UnknownTool:      return "Unknown tool";
        case ErrorCategory::InvalidArguments: return "Invalid arguments";
        case ErrorCategory::TransportDecode:  return "Transport decode error";
        case ErrorCategory::Config:           return "Config error";
        default:                              return "Provider error";
    }
}

nlohmann::json TextContent(const std::string& text) {
    return nlohmann::json::array({{{"type", "text"}, {"text", text}}});
}

} // anonymous namespace

std::string RenderFailureText(const Error& error) {
    std::string text = std::string(KindLabel(error.category)) + " (" +
                       error.CategoryName() + "): " + error.message;
    if (error.detail && !error.detail->empty()) {
        text += " [" + *error.detail + "]";
    }
    return text;
}

nlohmann::json FormatToolOutcome(const ToolOutcome& outcome) {
    if (outcome.IsOk()) {
        const auto& output = outcome.Value();
        nlohmann::json result = {{"content", TextContent(output.text)},
                                 {"isError", false}};
        // structuredContent must be an object.
        if (output.structured.is_object()) {
            result["structuredContent"] = output.structured;
        } else if (!output.structured.is_null()) {
            result["structuredContent"] = {{"result", output.structured}};
        }
        return result;
    }

    const auto& error = outcome.Error();
    return {{"content", TextContent(RenderFailureText(error))},
            {"structuredContent", {{"error", error.ToJson()}}},
            {"isError", true}};
}

} // namespace envsense
