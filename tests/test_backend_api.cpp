#include <doctest/doctest.h>

#include <ArduinoJson.h>
#include <httplib.h>

#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "Fakes.hpp"
#include "services/BackendApi.hpp"

using namespace vitco;
using namespace vitco::test;

namespace {
    /**
     * Local stand-in for the attendance server. Answers by path, records every request.
     */
    class StubServer {
    public:
        StubServer() {
            const auto handler = [this](const httplib::Request& req, httplib::Response& res) {
                http::toLibrary(answer(http::fromLibrary(req)), res);
            };
            m_server.Get(R"(.*)", handler);
            m_server.Post(R"(.*)", handler);
            m_server.Delete(R"(.*)", handler);

            m_port = m_server.bind_to_any_port("127.0.0.1");
            REQUIRE(m_port > 0);
            m_thread = std::thread([this] { m_server.listen_after_bind(); });
            m_server.wait_until_ready();
        }

        ~StubServer() {
            m_server.stop();
            m_thread.join();
        }

        void on(const std::string& target, const int status, std::string body) {
            std::lock_guard lock{m_mutex};
            m_routes[target] = http::Response{
                .status = status,
                .headers = {{"Content-Type", "application/json"}},
                .body = std::move(body),
            };
        }

        [[nodiscard]] std::string baseUrl() const {
            return "http://127.0.0.1:" + std::to_string(m_port) + "/api/v1/";
        }

        [[nodiscard]] std::vector<http::Request> requests() const {
            std::lock_guard lock{m_mutex};
            return m_requests;
        }

        [[nodiscard]] http::Request last() const {
            std::lock_guard lock{m_mutex};
            REQUIRE_FALSE(m_requests.empty());
            return m_requests.back();
        }

    private:
        http::Response answer(const http::Request& request) {
            std::lock_guard lock{m_mutex};
            m_requests.push_back(request);
            if (const auto it{m_routes.find(request.target)}; it != m_routes.end()) {
                return it->second;
            }
            return http::Response{.status = 404, .headers = {}, .body = R"({"success":false,"message":"Route not found"})"};
        }

        mutable std::mutex m_mutex{};
        std::map<std::string, http::Response> m_routes{};
        std::vector<http::Request> m_requests{};
        httplib::Server m_server{};
        int m_port{0};
        std::thread m_thread{};
    };

    struct BackendFixture {
        StubServer stub{};
        FakeSession session{};
        BackendApi api{ApiConfig{.baseUrl = stub.baseUrl(), .timeoutMs = 5000}, session};

        static JsonDocument parse(const std::string& body) {
            JsonDocument doc;
            REQUIRE(deserializeJson(doc, body) == DeserializationError::Ok);
            return doc;
        }
    };
}

TEST_CASE("Base URL is normalized") {
    CHECK(BackendApi::normalizeBaseUrl("http://localhost:3001/api/v1/") == "http://127.0.0.1:3001/api/v1");
    CHECK(BackendApi::normalizeBaseUrl("http://10.0.0.5:3001/api/v1") == "http://10.0.0.5:3001/api/v1");
    CHECK(BackendApi::normalizeBaseUrl("http://attendance.local//") == "http://attendance.local");
}

TEST_CASE("Envelope message prefers error over message") {
    JsonDocument doc;

    SUBCASE("error") {
        deserializeJson(doc, R"({"success":false,"error":"Token expired","message":"Unauthorized"})");
        CHECK(BackendApi::envelopeMessage(doc.as<JsonVariantConst>()) == "Token expired");
    }
    SUBCASE("message") {
        deserializeJson(doc, R"({"success":false,"error":"","message":"Too early to check in"})");
        CHECK(BackendApi::envelopeMessage(doc.as<JsonVariantConst>()) == "Too early to check in");
    }
    SUBCASE("neither") {
        deserializeJson(doc, R"({"success":false})");
        CHECK(BackendApi::envelopeMessage(doc.as<JsonVariantConst>()).empty());
    }
}

TEST_CASE_FIXTURE(BackendFixture, "Status is read from the data envelope with the bearer token") {
    stub.on("/api/v1/attendance/status", 200, R"({"success":true,"data":{"status":"CHECKED_IN"}})");

    const auto status{api.getStatus()};

    REQUIRE(status.ok());
    CHECK(status.value == AttendanceStatus::CheckedIn);
    const auto request{stub.last()};
    CHECK(request.method == "GET");
    CHECK(http::findHeader(request.headers, "Authorization") == std::optional<std::string>{"Bearer token-1"});
}

TEST_CASE_FIXTURE(BackendFixture, "Unknown status text is a JSON error") {
    stub.on("/api/v1/attendance/status", 200, R"({"success":true,"data":{"status":"ON_BREAK"}})");

    const auto status{api.getStatus()};

    CHECK(status.status.code == ErrorCode::JsonError);
}

TEST_CASE_FIXTURE(BackendFixture, "Check-in sends the network, source and fingerprint") {
    stub.on("/api/v1/attendance/check-in", 201, R"({"success":true,"data":{"id":"att-77","status":"CHECKED_IN"}})");

    const auto record{api.checkIn(CheckInRequest{
        .network = WifiNetwork{.ssid = "Office", .bssid = "AA:BB:CC:DD:EE:FF"},
        .systemFingerprint = "fp_0123456789abcdef",
    })};

    REQUIRE(record.ok());
    CHECK(record.value.id == "att-77");

    const auto body{parse(stub.last().body)};
    CHECK(body["source"].as<std::string>() == "desktop");
    CHECK(body["wifi"]["ssid"].as<std::string>() == "Office");
    CHECK(body["wifi"]["bssid"].as<std::string>() == "AA:BB:CC:DD:EE:FF");
    CHECK(body["systemFingerprint"].as<std::string>() == "fp_0123456789abcdef");
    CHECK(body["ethernet"].isNull());
}

TEST_CASE_FIXTURE(BackendFixture, "Check-out reports an explicit time in ISO 8601") {
    stub.on("/api/v1/attendance/check-out", 200, R"({"success":true,"data":{"id":"att-77","status":"CHECKED_OUT"}})");

    const auto record{api.checkOut(CheckOutRequest{
        .network = EthernetNetwork{.macAddress = "00:11:22:33:44:55"},
        .checkOutTimeMs = 1'700'000'000'000ULL,
    })};

    REQUIRE(record.ok());
    const auto body{parse(stub.last().body)};
    CHECK(body["checkOutTime"].as<std::string>() == "2023-11-14T22:13:20.000Z");
    CHECK(body["ethernet"]["macAddress"].as<std::string>() == "00:11:22:33:44:55");
    CHECK(body["systemFingerprint"].isNull());
}

TEST_CASE_FIXTURE(BackendFixture, "Rejections carry status, message and server code") {
    SUBCASE("with error code") {
        stub.on("/api/v1/attendance/check-in", 400,
                R"({"success":false,"message":"Check-in window has not opened","errorCode":"TOO_EARLY"})");
        const auto record{api.checkIn(CheckInRequest{.network = WifiNetwork{.ssid = "Office"}})};
        CHECK(record.status.code == ErrorCode::HttpError);
        CHECK(record.status.httpStatus == 400);
        CHECK(record.status.message == "Check-in window has not opened");
        CHECK(record.status.reasonCode == "TOO_EARLY");
    }

    SUBCASE("unauthorized") {
        stub.on("/api/v1/attendance/check-out", 401, R"({"success":false,"error":"Token expired"})");
        const auto record{api.checkOut(CheckOutRequest{})};
        CHECK(record.status.code == ErrorCode::AuthError);
        CHECK(record.status.isUnauthorized());
        CHECK(record.status.message == "Token expired");
    }

    SUBCASE("no body") {
        stub.on("/api/v1/attendance/status", 502, "");
        const auto status{api.getStatus()};
        CHECK(status.status.httpStatus == 502);
        CHECK(status.status.message == "Request failed with status code 502");
    }

    SUBCASE("success flag false on 200") {
        stub.on("/api/v1/attendance/check-in", 200, R"({"success":false,"message":"Already checked in today"})");
        const auto record{api.checkIn(CheckInRequest{.network = WifiNetwork{.ssid = "Office"}})};
        CHECK(record.failed());
        CHECK(record.status.message == "Already checked in today");
    }
}

TEST_CASE_FIXTURE(BackendFixture, "Unreachable server is a transport failure") {
    BackendApi offline{ApiConfig{.baseUrl = "http://127.0.0.1:1/api/v1", .timeoutMs = 2000}, session};

    const auto status{offline.getStatus()};

    CHECK(status.failed());
    CHECK((status.status.code == ErrorCode::NetworkError || status.status.code == ErrorCode::Timeout));
    CHECK(status.status.httpStatus == 0);
}

TEST_CASE_FIXTURE(BackendFixture, "Network validation sends the attachment identifiers") {
    stub.on("/api/v1/wifi/validate", 200, R"({"success":true,"data":{"allowed":false,"reason":"Network not in approved list"}})");

    const auto validation{api.validateNetwork(WifiNetwork{.ssid = "Cafe", .bssid = "11:22:33:44:55:66"})};

    REQUIRE(validation.ok());
    CHECK_FALSE(validation.value.allowed);
    CHECK(validation.value.reason == "Network not in approved list");
    const auto body{parse(stub.last().body)};
    CHECK(body["ssid"].as<std::string>() == "Cafe");
    CHECK(body["bssid"].as<std::string>() == "11:22:33:44:55:66");

    CHECK(api.validateNetwork(std::monostate{}).status.code == ErrorCode::InvalidArgument);
}

TEST_CASE_FIXTURE(BackendFixture, "Proxy registry calls use the given token") {
    stub.on("/api/v1/proxy/register", 200, R"({"success":true})");
    stub.on("/api/v1/proxy/heartbeat", 200, R"({"success":true})");
    stub.on("/api/v1/proxy/unregister", 200, R"({"success":true})");

    REQUIRE(api.registerProxy("token-9", ProxyAnnouncement{.ipAddress = "192.168.1.20", .port = 3002, .deviceName = "desk-7"}).ok());
    const auto announcement{parse(stub.last().body)};
    CHECK(announcement["ipAddress"].as<std::string>() == "192.168.1.20");
    CHECK(announcement["port"].as<int>() == 3002);
    CHECK(announcement["deviceName"].as<std::string>() == "desk-7");

    REQUIRE(api.heartbeat("token-9").ok());
    REQUIRE(api.unregister("token-9").ok());

    const auto requests{stub.requests()};
    REQUIRE(requests.size() == 3);
    CHECK(requests[2].method == "DELETE");
    for (const auto& request : requests) {
        CHECK(http::findHeader(request.headers, "Authorization") == std::optional<std::string>{"Bearer token-9"});
    }
}

TEST_CASE_FIXTURE(BackendFixture, "Forwarding relays the request unchanged below the base URL") {
    stub.on("/api/v1/users/me?fields=name", 200, R"({"success":true,"data":{"name":"Ana"}})");

    const auto response{api.forward(http::Request{
        .method = "GET",
        .target = "/users/me?fields=name",
        .headers = {{"Host", "192.168.1.20:3002"}, {"Authorization", "Bearer mobile-token"}},
    })};

    REQUIRE(response.ok());
    CHECK(response.value.status == 200);
    CHECK(parse(response.value.body)["data"]["name"].as<std::string>() == "Ana");

    const auto request{stub.last()};
    CHECK(http::findHeader(request.headers, "Authorization") == std::optional<std::string>{"Bearer mobile-token"});
    CHECK(http::findHeader(request.headers, "Host") != std::optional<std::string>{"192.168.1.20:3002"});
}
