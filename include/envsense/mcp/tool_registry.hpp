#pragma once

#include <envsense/core/result.hpp>
#include <envsense/mcp/input_schema.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace envsense {

// ---------------------------------------------------------------------------
// ToolDescriptor: what tools/list advertises for one tool.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    InputSchema input_schema;
    nlohmann::json output_schema;  // JSON Schema of the structured payload; may be null

    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// ToolOutput: a successful reading: machine-readable payload plus the
// human-readable rendering of the same data.
// ---------------------------------------------------------------------------
struct ToolOutput {
    nlohmann::json structured;
    std::string text;
};

using ToolOutcome = Result<ToolOutput, Error>;

// Handlers receive validated arguments with defaults filled in.
using ToolHandler = std::function<ToolOutcome(const nlohmann::json& args)>;

struct Invocation {
    std::string tool_name;
    nlohmann::json arguments;
};

// ---------------------------------------------------------------------------
// ToolRegistry: name -> (descriptor, handler) table.
//
// Registration happens at startup; Freeze() closes the table. Dispatch never
// throws: unknown names, invalid arguments and handler exceptions all come
// back as an Err outcome.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    // Throws std::logic_error on an empty or duplicate name, or once frozen.
    void Register(ToolDescriptor descriptor, ToolHandler handler);

    void Freeze() noexcept { frozen_ = true; }

    // In registration order.
    [[nodiscard]] const std::vector<ToolDescriptor>& Tools() const noexcept {
        return descriptors_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;
    [[nodiscard]] const ToolDescriptor* Find(const std::string& name) const;

    [[nodiscard]] ToolOutcome Dispatch(const Invocation& invocation) const;

private:
    std::vector<ToolDescriptor> descriptors_;
    std::map<std::string, ToolHandler> handlers_;
    bool frozen_ = false;
};

} // namespace envsense
