#include <envsense/mcp/input_schema.hpp>

#include <envsense/core/text_format.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>

namespace envsense {

namespace {

Error InvalidArgument(const std::string& message) {
    return Error::Make("ToolRegistry", message, ErrorCategory::InvalidArguments);
}

std::string FormatBound(double value) {
    if (std::floor(value) == value && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<long long>(value));
    }
    return FormatFixed(value, 2);
}

const char* JsonTypeName(const nlohmann::json& value) {
    return value.type_name();
}

// Integer arguments arrive as JSON integers, or as floats with no fraction
// from clients that only have doubles.
std::optional<int64_t> AsInteger(const nlohmann::json& value) {
    if (value.is_number_integer()) return value.get<int64_t>();
    if (value.is_number_float()) {
        const double d = value.get<double>();
        if (std::isfinite(d) && std::floor(d) == d &&
            d >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
            d <= static_cast<double>(std::numeric_limits<int64_t>::max())) {
            return static_cast<int64_t>(d);
        }
    }
    return std::nullopt;
}

} // anonymous namespace

const char* ArgTypeName(ArgType type) noexcept {
    switch (type) {
        case ArgType::String:  return "string";
        case ArgType::Integer: return "integer";
        case ArgType::Number:  return "number";
        case ArgType::Boolean: return "boolean";
    }
    return "string";
}

InputSchema& InputSchema::Add(std::string name, ArgType type, std::string description) {
    if (Find(name) != nullptr) {
        throw std::logic_error("InputSchema: duplicate argument '" + name + "'");
    }
    ArgSpec spec;
    spec.name = std::move(name);
    spec.type = type;
    spec.description = std::move(description);
    args_.push_back(std::move(spec));
    return *this;
}

ArgSpec& InputSchema::Last() {
    if (args_.empty()) {
        throw std::logic_error("InputSchema: modifier used before any argument");
    }
    return args_.back();
}

InputSchema& InputSchema::String(std::string name, std::string description) {
    return Add(std::move(name), ArgType::String, std::move(description));
}

InputSchema& InputSchema::Integer(std::string name, std::string description) {
    return Add(std::move(name), ArgType::Integer, std::move(description));
}

InputSchema& InputSchema::Number(std::string name, std::string description) {
    return Add(std::move(name), ArgType::Number, std::move(description));
}

InputSchema& InputSchema::Boolean(std::string name, std::string description) {
    return Add(std::move(name), ArgType::Boolean, std::move(description));
}

InputSchema& InputSchema::Enum(std::string name, std::string description,
                               std::vector<std::string> values) {
    Add(std::move(name), ArgType::String, std::move(description));
    Last().enum_values = std::move(values);
    return *this;
}

InputSchema& InputSchema::Required() {
    Last().required = true;
    return *this;
}

InputSchema& InputSchema::Min(double minimum) {
    Last().minimum = minimum;
    return *this;
}

InputSchema& InputSchema::Max(double maximum) {
    Last().maximum = maximum;
    return *this;
}

InputSchema& InputSchema::Default(nlohmann::json value) {
    Last().default_value = std::move(value);
    return *this;
}

const ArgSpec* InputSchema::Find(const std::string& name) const {
    for (const auto& arg : args_) {
        if (arg.name == name) return &arg;
    }
    return nullptr;
}

nlohmann::json InputSchema::ToJson() const {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();

    for (const auto& arg : args_) {
        nlohmann::json prop = {{"type", ArgTypeName(arg.type)},
                               {"description", arg.description}};
        if (!arg.enum_values.empty()) prop["enum"] = arg.enum_values;
        if (arg.minimum) {
            if (arg.type == ArgType::Integer) {
                prop["minimum"] = static_cast<int64_t>(*arg.minimum);
            } else {
                prop["minimum"] = *arg.minimum;
            }
        }
        if (arg.maximum) {
            if (arg.type == ArgType::Integer) {
                prop["maximum"] = static_cast<int64_t>(*arg.maximum);
            } else {
                prop["maximum"] = *arg.maximum;
            }
        }
        if (arg.default_value) prop["default"] = *arg.default_value;
        properties[arg.name] = std::move(prop);
        if (arg.required) required.push_back(arg.name);
    }

    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

Result<nlohmann::json, Error> InputSchema::Validate(const nlohmann::json& arguments) const {
    if (!arguments.is_null() && !arguments.is_object()) {
        return Result<nlohmann::json, Error>::Err(InvalidArgument(
            std::string("arguments: expected object, got ") + JsonTypeName(arguments)));
    }

    nlohmann::json normalized = nlohmann::json::object();
    for (const auto& arg : args_) {
        const bool present = arguments.is_object() && arguments.contains(arg.name) &&
                             !arguments[arg.name].is_null();
        if (!present) {
            if (arg.required) {
                return Result<nlohmann::json, Error>::Err(
                    InvalidArgument(arg.name + ": required argument is missing"));
            }
            if (arg.default_value) normalized[arg.name] = *arg.default_value;
            continue;
        }

        const auto& value = arguments[arg.name];
        auto type_error = [&]() {
            return Result<nlohmann::json, Error>::Err(InvalidArgument(
                arg.name + ": expected " + ArgTypeName(arg.type) + ", got " +
                JsonTypeName(value)));
        };

        std::optional<double> numeric;
        switch (arg.type) {
            case ArgType::String: {
                if (!value.is_string()) return type_error();
                const auto text = value.get<std::string>();
                if (!arg.enum_values.empty()) {
                    bool allowed = false;
                    std::string choices;
                    for (const auto& choice : arg.enum_values) {
                        if (choice == text) allowed = true;
                        if (!choices.empty()) choices += ", ";
                        choices += choice;
                    }
                    if (!allowed) {
                        return Result<nlohmann::json, Error>::Err(InvalidArgument(
                            arg.name + ": must be one of " + choices + " (got '" +
                            text + "')"));
                    }
                }
                normalized[arg.name] = text;
                break;
            }
            case ArgType::Integer: {
                auto integer = AsInteger(value);
                if (!integer) return type_error();
                numeric = static_cast<double>(*integer);
                normalized[arg.name] = *integer;
                break;
            }
            case ArgType::Number: {
                if (!value.is_number()) return type_error();
                numeric = value.get<double>();
                normalized[arg.name] = *numeric;
                break;
            }
            case ArgType::Boolean: {
                if (!value.is_boolean()) return type_error();
                normalized[arg.name] = value.get<bool>();
                break;
            }
        }

        if (numeric) {
            if (arg.minimum && *numeric < *arg.minimum) {
                return Result<nlohmann::json, Error>::Err(InvalidArgument(
                    arg.name + ": must be >= " + FormatBound(*arg.minimum) + " (got " +
                    value.dump() + ")"));
            }
            if (arg.maximum && *numeric > *arg.maximum) {
                return Result<nlohmann::json, Error>::Err(InvalidArgument(
                    arg.name + ": must be <= " + FormatBound(*arg.maximum) + " (got " +
                    value.dump() + ")"));
            }
        }
    }

    return Result<nlohmann::json, Error>::Ok(std::move(normalized));
}

} // namespace envsense
