#include <doctest/doctest.h>

#include <httplib.h>

#include "utils/HttpMessage.hpp"
#include "utils/RestClient.hpp"

using namespace vitco;

TEST_CASE("URLs split into origin and path") {
    SUBCASE("http with base path") {
        const auto origin{http::splitOrigin("http://127.0.0.1:3001/api/v1/attendance/status")};
        REQUIRE(origin.ok());
        CHECK(origin.value.schemeHostPort == "http://127.0.0.1:3001");
        CHECK(origin.value.path == "/api/v1/attendance/status");
    }

    SUBCASE("https keeps the scheme") {
        const auto origin{http::splitOrigin("https://attendance.example.com/api/v1/users/me?fields=name")};
        REQUIRE(origin.ok());
        CHECK(origin.value.schemeHostPort == "https://attendance.example.com");
        CHECK(origin.value.path == "/api/v1/users/me?fields=name");
    }

    SUBCASE("bare origin") {
        const auto origin{http::splitOrigin("http://10.0.0.5:3001")};
        REQUIRE(origin.ok());
        CHECK(origin.value.schemeHostPort == "http://10.0.0.5:3001");
        CHECK(origin.value.path.empty());
    }

    SUBCASE("rejected") {
        CHECK(http::splitOrigin("ftp://files.example.com/x").status.code == ErrorCode::InvalidArgument);
        CHECK(http::splitOrigin("attendance.example.com/api").status.code == ErrorCode::InvalidArgument);
        CHECK(http::splitOrigin("http:///api/v1").status.code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("Endpoint paths join with a single slash") {
    CHECK(http::joinUrl("http://h/api/v1", "/attendance/status") == "http://h/api/v1/attendance/status");
    CHECK(http::joinUrl("http://h/api/v1/", "attendance/status") == "http://h/api/v1/attendance/status");
    CHECK(http::joinUrl("http://h/api/v1//", "//auth/refresh") == "http://h/api/v1/auth/refresh");
}

TEST_CASE("Header lookup ignores case") {
    const http::Headers headers{{"content-type", "application/json"}, {"Authorization", "Bearer a"}, {"authorization", "Bearer b"}};

    CHECK(http::findHeader(headers, "Content-Type") == std::optional<std::string>{"application/json"});
    CHECK(http::findHeader(headers, "AUTHORIZATION") == std::optional<std::string>{"Bearer a"});
    CHECK_FALSE(http::findHeader(headers, "Accept").has_value());
}

TEST_CASE("Transport headers are not carried across hops") {
    httplib::Request incoming{};
    incoming.method = "POST";
    incoming.path = "/attendance/check-in";
    incoming.target = "/attendance/check-in?mobile=1";
    incoming.body = "{}";
    incoming.headers.emplace("Host", "192.168.1.20:3002");
    incoming.headers.emplace("Content-Length", "2");
    incoming.headers.emplace("REMOTE_ADDR", "192.168.1.44");
    incoming.headers.emplace("Authorization", "Bearer mobile");

    const auto request{http::fromLibrary(incoming)};
    CHECK(request.method == "POST");
    CHECK(request.target == "/attendance/check-in?mobile=1");
    CHECK(request.body == "{}");
    REQUIRE(request.headers.size() == 1);
    CHECK(request.headers[0].first == "Authorization");

    httplib::Response outgoing{};
    http::toLibrary(http::Response{
        .status = 201,
        .headers = {{"Content-Type", "application/json"}, {"Transfer-Encoding", "chunked"}, {"Connection", "close"}},
        .body = R"({"success":true})",
    }, outgoing);
    CHECK(outgoing.status == 201);
    CHECK(outgoing.body == R"({"success":true})");
    CHECK(outgoing.get_header_value("Content-Type") == "application/json");
    CHECK_FALSE(outgoing.has_header("Transfer-Encoding"));
    CHECK_FALSE(outgoing.has_header("Connection"));
}

TEST_CASE("The client accepts https and reports transport failures") {
    const http::RestClient client{};

    SUBCASE("https reaches the connect stage") {
        const auto response{client.send("https://127.0.0.1:1/api/v1/attendance/status", http::Request{}, 2000)};
        REQUIRE(response.failed());
        CHECK((response.status.code == ErrorCode::NetworkError || response.status.code == ErrorCode::Timeout));
    }

    SUBCASE("unsupported scheme") {
        const auto response{client.send("ws://127.0.0.1:1/socket", http::Request{}, 2000)};
        CHECK(response.status.code == ErrorCode::InvalidArgument);
    }
}
