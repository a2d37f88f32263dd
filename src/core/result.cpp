#include <envsense/core/result.hpp>

#include <cerrno>
#include <cstring>
#include <sstream>

namespace envsense {

const char* CategoryName(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::UnknownTool:         return "unknown_tool";
        case ErrorCategory::InvalidArguments:    return "invalid_arguments";
        case ErrorCategory::PermissionDenied:    return "permission_denied";
        case ErrorCategory::DeviceUnavailable:   return "device_unavailable";
        case ErrorCategory::Timeout:             return "timeout";
        case ErrorCategory::PlatformUnsupported: return "platform_unsupported";
        case ErrorCategory::NotFound:            return "not_found";
        case ErrorCategory::Io:                  return "io";
        case ErrorCategory::Network:             return "network";
        case ErrorCategory::TransportDecode:     return "transport_decode";
        case ErrorCategory::Config:              return "config";
        case ErrorCategory::Internal:            return "internal";
    }
    return "internal";
}

Error Error::FromErrno(const std::string& operation, int err,
                       const std::string& subject) {
    ErrorCategory category;
    switch (err) {
        case EACCES:
        case EPERM:
            category = ErrorCategory::PermissionDenied;
            break;
        case ENOENT:
        case ENODEV:
        case ENXIO:
            category = ErrorCategory::DeviceUnavailable;
            break;
        case ETIMEDOUT:
            category = ErrorCategory::Timeout;
            break;
        case ENOSYS:
        case EOPNOTSUPP:
            category = ErrorCategory::PlatformUnsupported;
            break;
        default:
            category = ErrorCategory::Io;
            break;
    }

    std::string message = std::strerror(err);
    if (!subject.empty()) {
        message = subject + ": " + message;
    }
    return Error{operation, std::move(message), category,
                 "errno " + std::to_string(err)};
}

std::string Error::Kind() const {
    switch (category) {
        case ErrorCategory::UnknownTool:      return "unknown_tool";
        case ErrorCategory::InvalidArguments: return "invalid_arguments";
        case ErrorCategory::TransportDecode:  return "transport_decode_error";
        case ErrorCategory::Config:           return "config_error";
        default:                              return "provider_error";
    }
}

bool Error::IsProviderError() const noexcept {
    switch (category) {
        case ErrorCategory::UnknownTool:
        case ErrorCategory::InvalidArguments:
        case ErrorCategory::TransportDecode:
        case ErrorCategory::Config:
            return false;
        default:
            return true;
    }
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation << " (" << CategoryName() << "): " << message;
    if (detail.has_value() && !detail->empty()) {
        oss << " [" << *detail << "]";
    }
    return oss.str();
}

nlohmann::json Error::ToJson() const {
    nlohmann::json j = {
        {"kind", Kind()},
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
    };
    if (detail.has_value()) {
        j["detail"] = *detail;
    }
    return j;
}

} // namespace envsense
