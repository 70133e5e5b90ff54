#include <catch2/catch_test_macros.hpp>

#include <asc_mcp/core/url.hpp>

using namespace asc_mcp;

TEST_CASE("UrlEncode: unreserved chars passthrough", "[core][url]") {
    CHECK(UrlEncode("abc123") == "abc123");
    CHECK(UrlEncode("a-b_c.d~e") == "a-b_c.d~e");
}

TEST_CASE("UrlEncode: reserved chars encoded", "[core][url]") {
    CHECK(UrlEncode("filter[app]") == "filter%5Bapp%5D");
    CHECK(UrlEncode("a/b") == "a%2Fb");
    CHECK(UrlEncode("hello world") == "hello%20world");
    CHECK(UrlEncode("a=b&c") == "a%3Db%26c");
    CHECK(UrlEncode("") == "");
}

TEST_CASE("BuildQueryString: keeps order and encodes", "[core][url]") {
    QueryParams params = {{"filter[app]", "123"}, {"limit", "50"}};
    CHECK(BuildQueryString(params) == "filter%5Bapp%5D=123&limit=50");
    CHECK(BuildQueryString({}) == "");
}

TEST_CASE("BuildRequestTarget: appends or extends query", "[core][url]") {
    CHECK(BuildRequestTarget("/v1/apps", {}) == "/v1/apps");
    CHECK(BuildRequestTarget("/v1/apps", {{"limit", "5"}}) == "/v1/apps?limit=5");
    CHECK(BuildRequestTarget("/v1/apps?sort=name", {{"limit", "5"}}) ==
          "/v1/apps?sort=name&limit=5");
}

TEST_CASE("SplitUrl: origin and target", "[core][url]") {
    auto parts = SplitUrl("https://api.appstoreconnect.apple.com/v1/apps?cursor=AB&limit=2");
    REQUIRE(parts.has_value());
    CHECK(parts->origin == "https://api.appstoreconnect.apple.com");
    CHECK(parts->target == "/v1/apps?cursor=AB&limit=2");
}

TEST_CASE("SplitUrl: keeps port, defaults target to slash", "[core][url]") {
    auto parts = SplitUrl("http://127.0.0.1:8080");
    REQUIRE(parts.has_value());
    CHECK(parts->origin == "http://127.0.0.1:8080");
    CHECK(parts->target == "/");
}

TEST_CASE("SplitUrl: query directly after host", "[core][url]") {
    auto parts = SplitUrl("https://example.com?x=1");
    REQUIRE(parts.has_value());
    CHECK(parts->target == "/?x=1");
}

TEST_CASE("SplitUrl: rejects non-http and hostless URLs", "[core][url]") {
    CHECK_FALSE(SplitUrl("ftp://example.com/x").has_value());
    CHECK_FALSE(SplitUrl("/v1/apps").has_value());
    CHECK_FALSE(SplitUrl("https://").has_value());
    CHECK_FALSE(SplitUrl("https:///v1").has_value());
}
