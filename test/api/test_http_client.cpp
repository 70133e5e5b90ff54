#include <catch2/catch_test_macros.hpp>

#include <asc_mcp/api/http_client.hpp>
#include <asc_mcp/api/transport.hpp>
#include "../../test/mocks/mock_http_client.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <thread>

using namespace asc_mcp;
using namespace asc_mcp::testing;

namespace {

// Starts an httplib::Server on a background thread and stops it on
// destruction.
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
    HttpClientOptions opts;
    opts.connect_timeout = std::chrono::seconds{2};
    opts.read_timeout = std::chrono::seconds{2};
    opts.write_timeout = std::chrono::seconds{2};
    return opts;
}

} // anonymous namespace

TEST_CASE("HttplibClient: GET returns status, headers and body", "[api][http]") {
    httplib::Server svr;
    std::string seen_auth;
    svr.Get("/v1/apps", [&](const httplib::Request& req, httplib::Response& res) {
        seen_auth = req.get_header_value("Authorization");
        res.set_header("X-Rate-Limit", "user-hour-lim:3500;user-hour-rem:3499;");
        res.set_content(R"({"data":[]})", "application/json");
    });
    LocalServer server(svr);

    HttplibClient client(server.BaseUrl(), ShortTimeouts());
    auto result = client.Get("/v1/apps", {{"Authorization", "Bearer t"}});
    REQUIRE(result.IsOk());
    CHECK(result.Value().status_code == 200);
    CHECK(result.Value().body == R"({"data":[]})");
    CHECK(result.Value().headers.count("X-Rate-Limit") == 1);
    CHECK(seen_auth == "Bearer t");
    CHECK(client.BaseUrl() == server.BaseUrl());
}

TEST_CASE("HttplibClient: trailing slash and path on the base URL are dropped", "[api][http]") {
    httplib::Server svr;
    svr.Get("/v1/apps", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"data":[]})", "application/json");
    });
    LocalServer server(svr);

    HttplibClient slash(server.BaseUrl() + "/", ShortTimeouts());
    CHECK(slash.BaseUrl() == server.BaseUrl());
    auto first = slash.Get("/v1/apps");
    REQUIRE(first.IsOk());
    CHECK(first.Value().status_code == 200);

    HttplibClient with_path(server.BaseUrl() + "/ignored", ShortTimeouts());
    CHECK(with_path.BaseUrl() == server.BaseUrl());
    auto second = with_path.Get("/v1/apps");
    REQUIRE(second.IsOk());
    CHECK(second.Value().status_code == 200);
}

TEST_CASE("HttplibClient: non-2xx statuses are results, not errors", "[api][http]") {
    httplib::Server svr;
    svr.Get("/v1/apps/missing", [](const httplib::Request&, httplib::Response& res) {
        res.status = 404;
        res.set_content(R"({"errors":[{"title":"Not Found","detail":"gone"}]})",
                        "application/json");
    });
    LocalServer server(svr);

    HttplibClient client(server.BaseUrl(), ShortTimeouts());
    auto result = client.Get("/v1/apps/missing");
    REQUIRE(result.IsOk());
    CHECK(result.Value().status_code == 404);
}

TEST_CASE("HttplibClient: POST, PATCH and DELETE reach the server", "[api][http]") {
    httplib::Server svr;
    std::string post_body;
    std::string post_type;
    std::string patch_body;
    bool deleted = false;
    svr.Post("/v1/devices", [&](const httplib::Request& req, httplib::Response& res) {
        post_body = req.body;
        post_type = req.get_header_value("Content-Type");
        res.status = 201;
        res.set_content(R"({"data":{"id":"d1"}})", "application/json");
    });
    svr.Patch("/v1/devices/d1", [&](const httplib::Request& req, httplib::Response& res) {
        patch_body = req.body;
        res.set_content("{}", "application/json");
    });
    svr.Delete("/v1/devices/d1", [&](const httplib::Request&, httplib::Response& res) {
        deleted = true;
        res.status = 204;
    });
    LocalServer server(svr);

    HttplibClient client(server.BaseUrl(), ShortTimeouts());
    auto post = client.Post("/v1/devices", R"({"x":1})", "application/json");
    REQUIRE(post.IsOk());
    CHECK(post.Value().status_code == 201);
    CHECK(post_body == R"({"x":1})");
    CHECK(post_type == "application/json");

    auto patch = client.Patch("/v1/devices/d1", R"({"y":2})", "application/json");
    REQUIRE(patch.IsOk());
    CHECK(patch_body == R"({"y":2})");

    auto del = client.Delete("/v1/devices/d1");
    REQUIRE(del.IsOk());
    CHECK(del.Value().status_code == 204);
    CHECK(deleted);
}

TEST_CASE("HttplibClient: connection refused is a non-rejection error", "[api][http]") {
    // Nothing listens on port 1.
    HttplibClient client("http://127.0.0.1:1", ShortTimeouts());
    auto result = client.Get("/v1/apps");
    REQUIRE(result.IsErr());
    CHECK_FALSE(result.Error().IsRejection());
    CHECK(result.Error().message.rfind("HTTP request failed: ", 0) == 0);
}

TEST_CASE("Transport over HttplibClient: pagination against a live server", "[api][http][list]") {
    httplib::Server svr;
    svr.Get("/v1/apps", [](const httplib::Request& req, httplib::Response& res) {
        nlohmann::json doc;
        if (req.has_param("cursor")) {
            doc["data"] = {{{"type", "apps"}, {"id", "2"}}};
            doc["links"] = {{"self", "x"}};
        } else {
            doc["data"] = {{{"type", "apps"}, {"id", "1"}}};
            doc["links"] = {{"next", "/v1/apps?cursor=AQ&limit=1"}};
            doc["meta"] = {{"paging", {{"total", 2}, {"limit", 1}}}};
        }
        res.set_content(doc.dump(), "application/json");
    });
    LocalServer server(svr);

    HttplibClient client(server.BaseUrl(), ShortTimeouts());
    FakeTokenProvider tokens;
    Transport transport(client, tokens);

    auto result = transport.List("/v1/apps", {}, 10);
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().data.size() == 2);
    CHECK(result.Value().data[1]["id"] == "2");
    CHECK(*result.Value().total == 2);
}
