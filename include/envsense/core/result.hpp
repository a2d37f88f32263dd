#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

namespace envsense {

// ---------------------------------------------------------------------------
// Result<T, E>: holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T fallback) const& {
        return IsOk() ? std::get<0>(storage_) : std::move(fallback);
    }

    // fn: T -> Result<U, E>
    template <typename Fn>
    auto AndThen(Fn&& fn) const& -> std::invoke_result_t<Fn, const T&> {
        using Next = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(storage_));
        }
        return Next::Err(std::get<1>(storage_));
    }

    // fn: T -> U
    template <typename Fn>
    auto Map(Fn&& fn) const& -> Result<std::invoke_result_t<Fn, const T&>, E> {
        using U = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(storage_)));
        }
        return Result<U, E>::Err(std::get<1>(storage_));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E>: success carries no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(std::nullopt); }
    static Result Err(const E& error) { return Result(std::optional<E>(error)); }
    static Result Err(E&& error) { return Result(std::optional<E>(std::move(error))); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    explicit Result(std::optional<E> error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory: what went wrong, as reported to the MCP caller.
//
// PermissionDenied .. Network are provider failures; the rest belong to the
// router, the transport or startup.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    UnknownTool,
    InvalidArguments,
    PermissionDenied,
    DeviceUnavailable,
    Timeout,
    PlatformUnsupported,
    NotFound,
    Io,
    Network,
    TransportDecode,
    Config,
    Internal,
};

// Stable snake_case name of a category ("device_unavailable").
[[nodiscard]] const char* CategoryName(ErrorCategory category) noexcept;

// ---------------------------------------------------------------------------
// Error: structured failure for router, providers and config.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;   // "Battery", "ToolRegistry", "ConfigLoader", ...
    std::string message;
    ErrorCategory category = ErrorCategory::Internal;
    std::optional<std::string> detail;

    static Error Make(std::string operation, std::string message,
                      ErrorCategory category) {
        return Error{std::move(operation), std::move(message), category,
                     std::nullopt};
    }

    /// Translate an errno value into a categorised error. `subject` is the
    /// path or resource that was being accessed.
    static Error FromErrno(const std::string& operation, int err,
                           const std::string& subject);

    // Error kind as seen by the caller: unknown_tool, invalid_arguments,
    // provider_error, transport_decode_error, config_error.
    [[nodiscard]] std::string Kind() const;

    [[nodiscard]] bool IsProviderError() const noexcept;

    [[nodiscard]] std::string CategoryName() const {
        return envsense::CategoryName(category);
    }

    [[nodiscard]] std::string ToString() const;

    [[nodiscard]] nlohmann::json ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation && message == other.message &&
               category == other.category && detail == other.detail;
    }

    bool operator!=(const Error& other) const { return !(*this == other); }
};

} // namespace envsense
