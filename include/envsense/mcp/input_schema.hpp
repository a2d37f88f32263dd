#pragma once

#include <envsense/core/result.hpp>

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace envsense {

enum class ArgType { String, Integer, Number, Boolean };

[[nodiscard]] const char* ArgTypeName(ArgType type) noexcept;

// ---------------------------------------------------------------------------
// ArgSpec: one named argument of a tool.
// ---------------------------------------------------------------------------
struct ArgSpec {
    std::string name;
    ArgType type = ArgType::String;
    std::string description;
    bool required = false;
    std::vector<std::string> enum_values;  // String only
    std::optional<double> minimum;         // Integer / Number
    std::optional<double> maximum;
    std::optional<nlohmann::json> default_value;
};

// ---------------------------------------------------------------------------
// InputSchema: declared arguments of a tool, rendered as JSON Schema and
// used to validate `tools/call` arguments before the handler runs.
//
//   InputSchema()
//       .Integer("count", "Number of commits").Min(1).Max(100).Default(10)
//       .String("path", "Repository path");
//
// Min/Max/Default/Required apply to the most recently added argument.
// ---------------------------------------------------------------------------
class InputSchema {
public:
    InputSchema& String(std::string name, std::string description);
    InputSchema& Integer(std::string name, std::string description);
    InputSchema& Number(std::string name, std::string description);
    InputSchema& Boolean(std::string name, std::string description);
    InputSchema& Enum(std::string name, std::string description,
                      std::vector<std::string> values);

    InputSchema& Required();
    InputSchema& Min(double minimum);
    InputSchema& Max(double maximum);
    InputSchema& Default(nlohmann::json value);

    [[nodiscard]] const std::vector<ArgSpec>& Args() const noexcept { return args_; }
    [[nodiscard]] const ArgSpec* Find(const std::string& name) const;

    [[nodiscard]] nlohmann::json ToJson() const;

    // Returns the arguments with defaults filled in. Null or absent arguments
    // count as {}; undeclared fields are dropped. Integral floats (5.0) are
    // accepted for Integer arguments.
    [[nodiscard]] Result<nlohmann::json, Error> Validate(
        const nlohmann::json& arguments) const;

private:
    InputSchema& Add(std::string name, ArgType type, std::string description);
    ArgSpec& Last();

    std::vector<ArgSpec> args_;
};

} // namespace envsense
