#pragma once

#include <envsense/core/result.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace envsense {

using HttpHeaders = std::map<std::string, std::string>;

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;

    [[nodiscard]] bool IsSuccess() const noexcept {
        return status_code >= 200 && status_code < 300;
    }
};

// Percent-encode per RFC 3986; unreserved characters pass through.
[[nodiscard]] std::string UrlEncode(std::string_view value);

// ---------------------------------------------------------------------------
// IHttpClient: GET-only client bound to one base URL.
//
// Transport failures come back as Network or Timeout errors; HTTP status
// codes are returned as-is for the caller to interpret.
// ---------------------------------------------------------------------------
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    IHttpClient(const IHttpClient&) = delete;
    IHttpClient& operator=(const IHttpClient&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {}) = 0;

protected:
    IHttpClient() = default;
};

struct HttpClientOptions {
    std::chrono::seconds connect_timeout{5};
    std::chrono::seconds read_timeout{10};
    std::string user_agent;
};

// ---------------------------------------------------------------------------
// HttplibClient: cpp-httplib implementation (pimpl keeps httplib.h out of
// the public header).
// ---------------------------------------------------------------------------
class HttplibClient : public IHttpClient {
public:
    HttplibClient(const std::string& base_url, const HttpClientOptions& options);
    ~HttplibClient() override;

    [[nodiscard]] Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {}) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace envsense
