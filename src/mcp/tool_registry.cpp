#include <envsense/mcp/tool_registry.hpp>

#include <envsense/core/log.hpp>

#include <chrono>
#include <stdexcept>

namespace envsense {

nlohmann::json ToolDescriptor::ToJson() const {
    nlohmann::json j = {{"name", name},
                        {"description", description},
                        {"inputSchema", input_schema.ToJson()}};
    if (!output_schema.is_null()) {
        j["outputSchema"] = output_schema;
    }
    return j;
}

void ToolRegistry::Register(ToolDescriptor descriptor, ToolHandler handler) {
    if (frozen_) {
        throw std::logic_error("ToolRegistry: cannot register '" + descriptor.name +
                               "' after the table is frozen");
    }
    if (descriptor.name.empty()) {
        throw std::logic_error("ToolRegistry: tool name must not be empty");
    }
    if (!handler) {
        throw std::logic_error("ToolRegistry: tool '" + descriptor.name +
                               "' has no handler");
    }
    if (handlers_.count(descriptor.name) > 0) {
        throw std::logic_error("ToolRegistry: duplicate tool name '" +
                               descriptor.name + "'");
    }
    handlers_.emplace(descriptor.name, std::move(handler));
    descriptors_.push_back(std::move(descriptor));
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

const ToolDescriptor* ToolRegistry::Find(const std::string& name) const {
    for (const auto& descriptor : descriptors_) {
        if (descriptor.name == name) return &descriptor;
    }
    return nullptr;
}

ToolOutcome ToolRegistry::Dispatch(const Invocation& invocation) const {
    const auto* descriptor = Find(invocation.tool_name);
    auto handler = handlers_.find(invocation.tool_name);
    if (descriptor == nullptr || handler == handlers_.end()) {
        LogWarn("router", "unknown tool '" + invocation.tool_name + "'");
        return ToolOutcome::Err(Error::Make(
            "ToolRegistry", "Unknown tool: " + invocation.tool_name,
            ErrorCategory::UnknownTool));
    }

    auto args = descriptor->input_schema.Validate(invocation.arguments);
    if (args.IsErr()) {
        LogDebug("router", invocation.tool_name + ": " + args.Error().message);
        return ToolOutcome::Err(std::move(args).Error());
    }

    const auto started = std::chrono::steady_clock::now();
    ToolOutcome outcome = [&]() {
        try {
            return handler->second(args.Value());
        } catch (const std::exception& e) {
            LogError("router", invocation.tool_name + " threw: " + e.what());
            return ToolOutcome::Err(Error::Make(
                invocation.tool_name, std::string("Unexpected failure: ") + e.what(),
                ErrorCategory::Internal));
        }
    }();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (outcome.IsOk()) {
        LogDebug("router", invocation.tool_name + " ok in " +
                               std::to_string(elapsed.count()) + " ms");
    } else {
        LogWarn("router", invocation.tool_name + " failed in " +
                              std::to_string(elapsed.count()) + " ms: " +
                              outcome.Error().ToString());
    }
    return outcome;
}

} // namespace envsense
