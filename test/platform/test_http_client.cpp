#include <catch2/catch_test_macros.hpp>

#include <envsense/platform/http_client.hpp>

#include <httplib.h>

#include <chrono>
#include <string>
#include <thread>

using namespace envsense;

namespace {

// Starts an httplib::Server on a free loopback port for the lifetime of
// the object.
class LocalServer {
public:
    explicit LocalServer(httplib::Server& svr) : svr_(svr) {
        port_ = svr_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { svr_.listen_after_bind(); });
        svr_.wait_until_ready();
    }

    ~LocalServer() {
        svr_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    [[nodiscard]] int Port() const noexcept { return port_; }
    [[nodiscard]] std::string BaseUrl() const {
        return "http://127.0.0.1:" + std::to_string(port_);
    }

    LocalServer(const LocalServer&) = delete;
    LocalServer& operator=(const LocalServer&) = delete;

private:
    httplib::Server& svr_;
    int port_ = 0;
    std::thread thread_;
};

HttpClientOptions ShortTimeouts() {
    HttpClientOptions options;
    options.connect_timeout = std::chrono::seconds(2);
    options.read_timeout = std::chrono::seconds(2);
    options.user_agent = "envsense-test";
    return options;
}

} // anonymous namespace

// ===========================================================================
// UrlEncode
// ===========================================================================

TEST_CASE("UrlEncode: unreserved characters pass through", "[platform][http]") {
    CHECK(UrlEncode("Berlin") == "Berlin");
    CHECK(UrlEncode("a-b_c.d~e") == "a-b_c.d~e");
    CHECK(UrlEncode("") == "");
}

TEST_CASE("UrlEncode: everything else is percent-encoded", "[platform][http]") {
    CHECK(UrlEncode("New York") == "New%20York");
    CHECK(UrlEncode("S\xC3\xA3o Paulo") == "S%C3%A3o%20Paulo");
    CHECK(UrlEncode("a/b?c=d&e") == "a%2Fb%3Fc%3Dd%26e");
    CHECK(UrlEncode("~Z,") == "~Z%2C");
}

// ===========================================================================
// HttplibClient against a loopback server
// ===========================================================================

TEST_CASE("HttplibClient: GET returns status, body and headers", "[platform][http]") {
    httplib::Server svr;
    std::string seen_agent;
    std::string seen_query;
    svr.Get("/Berlin", [&](const httplib::Request& req, httplib::Response& res) {
        seen_agent = req.get_header_value("User-Agent");
        seen_query = req.get_param_value("format");
        res.set_header("X-Test", "yes");
        res.set_content("{\"ok\":true}", "application/json");
    });
    LocalServer server(svr);

    HttplibClient client(server.BaseUrl(), ShortTimeouts());
    auto result = client.Get("/Berlin?format=j1");
    REQUIRE(result.IsOk());
    CHECK(result.Value().status_code == 200);
    CHECK(result.Value().IsSuccess());
    CHECK(result.Value().body == "{\"ok\":true}");
    CHECK(result.Value().headers.at("X-Test") == "yes");
    CHECK(seen_agent == "envsense-test");
    CHECK(seen_query == "j1");
}

TEST_CASE("HttplibClient: explicit User-Agent wins", "[platform][http]") {
    httplib::Server svr;
    std::string seen_agent;
    svr.Get("/", [&](const httplib::Request& req, httplib::Response& res) {
        seen_agent = req.get_header_value("User-Agent");
        res.set_content("ok", "text/plain");
    });
    LocalServer server(svr);

    HttplibClient client(server.BaseUrl(), ShortTimeouts());
    auto result = client.Get("/", {{"User-Agent", "curl/8.0"}});
    REQUIRE(result.IsOk());
    CHECK(seen_agent == "curl/8.0");
}

TEST_CASE("HttplibClient: HTTP error statuses are returned as-is", "[platform][http]") {
    httplib::Server svr;
    svr.Get("/missing", [](const httplib::Request&, httplib::Response& res) {
        res.status = 404;
        res.set_content("Unknown location", "text/plain");
    });
    LocalServer server(svr);

    HttplibClient client(server.BaseUrl(), ShortTimeouts());
    auto result = client.Get("/missing");
    REQUIRE(result.IsOk());
    CHECK(result.Value().status_code == 404);
    CHECK_FALSE(result.Value().IsSuccess());
    CHECK(result.Value().body == "Unknown location");
}

TEST_CASE("HttplibClient: connection refused is a Network error", "[platform][http]") {
    int port = 0;
    {
        httplib::Server svr;
        LocalServer server(svr);
        port = server.Port();
    }
    HttplibClient client("http://127.0.0.1:" + std::to_string(port), ShortTimeouts());
    auto result = client.Get("/anything");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Network);
    CHECK(result.Error().operation == "Http");
    REQUIRE(result.Error().detail.has_value());
    CHECK(result.Error().detail->find("/anything") != std::string::npos);
}
