#include <envsense/platform/http_client.hpp>

#include <envsense/core/log.hpp>

#include <httplib.h>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace envsense {

namespace {

ErrorCategory CategoryFromTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Network;
    }
}

} // anonymous namespace

std::string UrlEncode(std::string_view value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct HttplibClient::Impl {
    std::string base_url;
    httplib::Client client;
    HttpClientOptions options;

    Impl(const std::string& url, const HttpClientOptions& opts)
        : base_url(url), client(url), options(opts) {
        client.set_connection_timeout(opts.connect_timeout);
        client.set_read_timeout(opts.read_timeout);
        client.set_follow_location(true);
    }
};

HttplibClient::HttplibClient(const std::string& base_url,
                             const HttpClientOptions& options)
    : impl_(std::make_unique<Impl>(base_url, options)) {}

HttplibClient::~HttplibClient() = default;

Result<HttpResponse, Error> HttplibClient::Get(std::string_view path,
                                               const HttpHeaders& headers) {
    httplib::Headers hdrs;
    for (const auto& [key, value] : headers) {
        hdrs.emplace(key, value);
    }
    if (!impl_->options.user_agent.empty() && hdrs.count("User-Agent") == 0) {
        hdrs.emplace("User-Agent", impl_->options.user_agent);
    }

    LogDebug("http", "GET " + impl_->base_url + std::string(path));
    auto res = impl_->client.Get(std::string(path), hdrs);
    if (!res) {
        const auto http_error = res.error();
        return Result<HttpResponse, Error>::Err(Error{
            "Http", "HTTP request failed: " + httplib::to_string(http_error),
            CategoryFromTransportError(http_error),
            impl_->base_url + std::string(path)});
    }

    HttpResponse response;
    response.status_code = res->status;
    response.body = res->body;
    for (const auto& [key, value] : res->headers) {
        response.headers[key] = value;
    }
    LogDebug("http", "-> " + std::to_string(response.status_code) + " (" +
                         std::to_string(response.body.size()) + " bytes)");
    return Result<HttpResponse, Error>::Ok(std::move(response));
}

} // namespace envsense
