#include <doctest/doctest.h>

#include <ArduinoJson.h>

#include <memory>
#include <string>

#include "Fakes.hpp"
#include "core/EventBus.hpp"
#include "services/ProxyService.hpp"
#include "utils/RestClient.hpp"

using namespace vitco;
using namespace vitco::test;

namespace {
    struct ProxyFixture {
        FakeClock clock{};
        FakeProxyApi api{};
        FakeSession session{};
        FakeNetwork network{};
        EventBus bus{EventBus::Config{}};
        ProxyConfig cfg{};
        std::unique_ptr<ProxyService> proxy{};

        ProxyFixture() {
            cfg.port = 0;  // ephemeral, tests run in parallel with other listeners
        }

        ProxyService& make() {
            proxy = std::make_unique<ProxyService>(bus, clock, api, session, network, cfg, "http://10.0.0.5:3001/api/v1");
            return *proxy;
        }

        static JsonDocument parse(const std::string& body) {
            JsonDocument doc;
            REQUIRE(deserializeJson(doc, body) == DeserializationError::Ok);
            return doc;
        }
    };

    std::optional<std::string> header(const http::Response& response, const char* name) {
        return http::findHeader(response.headers, name);
    }
}

TEST_CASE("Registration backoff doubles up to the cap") {
    const ProxyConfig cfg{};
    CHECK(ProxyService::backoffDelayMs(cfg, 0) == 1000u);
    CHECK(ProxyService::backoffDelayMs(cfg, 1) == 2000u);
    CHECK(ProxyService::backoffDelayMs(cfg, 2) == 4000u);
    CHECK(ProxyService::backoffDelayMs(cfg, 3) == 4000u);
}

TEST_CASE_FIXTURE(ProxyFixture, "Failed registration retries with backoff and the relay keeps serving") {
    api.registerDefault = Status::HttpError(503, "Service unavailable");
    auto& service{make()};

    const auto endpoint{service.start()};
    REQUIRE(endpoint.ok());
    CHECK(endpoint.value.ipAddress == "192.168.1.20");
    CHECK(endpoint.value.port != 0);

    CHECK(api.registerTokens.size() == 4);
    CHECK(clock.sleeps() == std::vector<std::uint32_t>{1000, 2000, 4000});

    const auto state{service.status()};
    CHECK(state.isRunning);
    CHECK_FALSE(state.isRegistered);
    CHECK(state.lastError == std::optional<std::string>{"Service unavailable"});
    CHECK(state.lastAttemptMs.has_value());

    const auto health{service.handleRequest(http::Request{.method = "GET", .target = "/health"})};
    CHECK(health.status == 200);
    const auto doc{parse(health.body)};
    CHECK(doc["success"].as<bool>());
    CHECK(doc["proxy"]["isRunning"].as<bool>());
    CHECK(doc["proxy"]["ip"].as<std::string>() == "192.168.1.20");
}

TEST_CASE_FIXTURE(ProxyFixture, "Registration announces the LAN address and device name") {
    auto& service{make()};

    REQUIRE(service.start().ok());

    REQUIRE(api.announcements.size() == 1);
    CHECK(api.announcements[0].ipAddress == "192.168.1.20");
    CHECK(api.announcements[0].port == service.status().port);
    CHECK(api.announcements[0].deviceName == service.deviceName());
    CHECK_FALSE(service.deviceName().empty());
    CHECK(service.status().isRegistered);
    CHECK(clock.sleeps().empty());
}

TEST_CASE_FIXTURE(ProxyFixture, "Starting without a LAN address fails") {
    network.setIpv4(std::nullopt);
    auto& service{make()};

    const auto endpoint{service.start()};

    CHECK(endpoint.status.code == ErrorCode::NetworkError);
    CHECK(endpoint.status.message == "No network interface found");
    CHECK_FALSE(service.status().isRunning);
    CHECK(api.registerTokens.empty());
}

TEST_CASE_FIXTURE(ProxyFixture, "An expired token is refreshed once during registration") {
    auto& service{make()};

    SUBCASE("refresh helps") {
        api.registerAnswers.push_back(Status::HttpError(401, "Unauthorized"));
        REQUIRE(service.start().ok());

        CHECK(api.registerTokens == std::vector<std::string>{"token-1", "token-2"});
        CHECK(service.status().isRegistered);
    }

    SUBCASE("still unauthorized after refresh") {
        api.registerDefault = Status::HttpError(401, "Unauthorized");
        REQUIRE(service.start().ok());

        CHECK(api.registerTokens == std::vector<std::string>{"token-1", "token-2"});
        CHECK_FALSE(service.status().isRegistered);
        CHECK(clock.sleeps().empty());
    }

    SUBCASE("refresh fails") {
        api.registerDefault = Status::HttpError(401, "Unauthorized");
        session.refreshResult = Result<std::string>(Status::HttpError(401, "Refresh token expired"));
        REQUIRE(service.start().ok());

        CHECK(api.registerTokens == std::vector<std::string>{"token-1"});
        CHECK_FALSE(service.status().isRegistered);
    }

    CHECK(session.refreshCount() == 1);
}

TEST_CASE_FIXTURE(ProxyFixture, "Registration requires a signed-in user") {
    auto& service{make()};

    SUBCASE("no user") {
        session.authenticated = false;
        const auto status{service.registerWithServer()};
        CHECK(status.code == ErrorCode::AuthError);
        CHECK(status.message == "Cannot register - user not authenticated");
    }

    SUBCASE("no token") {
        session.token.clear();
        const auto status{service.registerWithServer()};
        CHECK(status.code == ErrorCode::AuthError);
        CHECK(status.message == "Cannot register - no valid session");
    }

    CHECK(api.registerTokens.empty());
    CHECK_FALSE(service.status().isRegistered);
}

TEST_CASE_FIXTURE(ProxyFixture, "Heartbeat refreshes an expired token once") {
    auto& service{make()};

    SUBCASE("refresh helps") {
        api.heartbeatAnswers.push_back(Status::HttpError(401, "Unauthorized"));
        service.sendHeartbeat();
        CHECK(api.heartbeatTokens == std::vector<std::string>{"token-1", "token-2"});
    }

    SUBCASE("still unauthorized") {
        api.heartbeatDefault = Status::HttpError(401, "Unauthorized");
        service.sendHeartbeat();
        CHECK(api.heartbeatTokens.size() == 2);
    }

    CHECK(session.refreshCount() == 1);
}

TEST_CASE_FIXTURE(ProxyFixture, "Heartbeat failures other than 401 do not refresh") {
    auto& service{make()};
    api.heartbeatDefault = Status::Error(ErrorCode::NetworkError, "connect: Connection refused");

    service.sendHeartbeat();

    CHECK(api.heartbeatTokens.size() == 1);
    CHECK(session.refreshCount() == 0);
}

TEST_CASE_FIXTURE(ProxyFixture, "Relay answers preflight and adds CORS headers everywhere") {
    auto& service{make()};

    SUBCASE("preflight") {
        const auto response{service.handleRequest(http::Request{.method = "OPTIONS", .target = "/attendance/check-in"})};
        CHECK(response.status == 200);
        CHECK(response.body.empty());
        CHECK(header(response, "Access-Control-Allow-Origin") == std::optional<std::string>{"*"});
        CHECK(header(response, "Access-Control-Allow-Methods") == std::optional<std::string>{"GET, POST, PUT, DELETE, OPTIONS"});
        CHECK(header(response, "Access-Control-Allow-Headers") == std::optional<std::string>{"Content-Type, Authorization"});
        CHECK(api.forwarded.empty());
    }

    SUBCASE("forwarded response keeps upstream headers") {
        api.forwardResult = Result<http::Response>(http::Response{
            .status = 201,
            .headers = {{"Content-Type", "application/json"}, {"access-control-allow-origin", "https://example.com"}},
            .body = R"({"success":true})",
        });
        const auto response{service.handleRequest(http::Request{
            .method = "POST",
            .target = "/attendance/check-in?mobile=1",
            .headers = {{"Authorization", "Bearer abc"}},
            .body = "{}",
        })};

        CHECK(response.status == 201);
        CHECK(response.body == R"({"success":true})");
        CHECK(header(response, "Content-Type") == std::optional<std::string>{"application/json"});
        CHECK(header(response, "Access-Control-Allow-Origin") == std::optional<std::string>{"*"});

        REQUIRE(api.forwarded.size() == 1);
        CHECK(api.forwarded[0].target == "/attendance/check-in?mobile=1");
        CHECK(header(http::Response{.headers = api.forwarded[0].headers}, "Authorization") == std::optional<std::string>{"Bearer abc"});
    }
}

TEST_CASE_FIXTURE(ProxyFixture, "Upstream failure becomes a 500 JSON error") {
    auto& service{make()};

    SUBCASE("with message") {
        api.forwardResult = Result<http::Response>(ErrorCode::NetworkError, "connect: Connection refused");
        const auto response{service.handleRequest(http::Request{.method = "GET", .target = "/users/me"})};
        CHECK(response.status == 500);
        const auto doc{parse(response.body)};
        CHECK_FALSE(doc["success"].as<bool>());
        CHECK(doc["message"].as<std::string>() == "connect: Connection refused");
    }

    SUBCASE("without message") {
        api.forwardResult = Result<http::Response>(ErrorCode::NetworkError, "");
        const auto response{service.handleRequest(http::Request{.method = "GET", .target = "/users/me"})};
        CHECK(response.status == 500);
        CHECK(parse(response.body)["message"].as<std::string>() == "Proxy error");
        CHECK(header(response, "Access-Control-Allow-Origin") == std::optional<std::string>{"*"});
    }
}

TEST_CASE_FIXTURE(ProxyFixture, "Health is answered locally only for the exact path") {
    auto& service{make()};

    const auto health{service.handleRequest(http::Request{.method = "GET", .target = "/health"})};
    const auto doc{parse(health.body)};
    CHECK_FALSE(doc["proxy"]["isRunning"].as<bool>());
    CHECK(doc["proxy"]["ip"].isNull());
    CHECK(doc["proxy"]["userId"].as<std::string>() == "user-42");
    CHECK(doc["proxy"]["deviceName"].as<std::string>() == service.deviceName());

    session.authenticated = false;
    const auto signedOut{parse(service.handleRequest(http::Request{.method = "GET", .target = "/health"}).body)};
    CHECK(signedOut["proxy"]["userId"].isNull());

    (void)service.handleRequest(http::Request{.method = "GET", .target = "/health?verbose=1"});
    REQUIRE(api.forwarded.size() == 1);
    CHECK(api.forwarded[0].target == "/health?verbose=1");
}

TEST_CASE_FIXTURE(ProxyFixture, "Periodic check re-registers after an address change or a lost registration") {
    auto& service{make()};
    REQUIRE(service.start().ok());
    REQUIRE(api.announcements.size() == 1);

    SUBCASE("unchanged and registered") {
        service.checkRegistration();
        CHECK(api.announcements.size() == 1);
    }

    SUBCASE("address changed") {
        network.setIpv4("192.168.1.77");
        service.checkRegistration();
        REQUIRE(api.announcements.size() == 2);
        CHECK(api.announcements[1].ipAddress == "192.168.1.77");
        CHECK(service.status().ipAddress == std::optional<std::string>{"192.168.1.77"});
    }

    SUBCASE("address lost") {
        network.setIpv4(std::nullopt);
        service.checkRegistration();
        CHECK(api.announcements.size() == 1);
        CHECK(service.status().ipAddress == std::optional<std::string>{"192.168.1.20"});
    }

    SUBCASE("previous registration failed") {
        api.registerAnswers.push_back(Status::HttpError(401, "Unauthorized"));
        api.registerAnswers.push_back(Status::HttpError(401, "Unauthorized"));
        REQUIRE(service.registerWithServer().failed());
        REQUIRE_FALSE(service.status().isRegistered);

        service.checkRegistration();
        CHECK(service.status().isRegistered);
    }
}

TEST_CASE_FIXTURE(ProxyFixture, "Stopping unregisters and closes the relay") {
    auto& service{make()};
    REQUIRE(service.start().ok());

    service.stop();

    CHECK(api.unregisterTokens == std::vector<std::string>{"token-1"});
    const auto state{service.status()};
    CHECK_FALSE(state.isRunning);
    CHECK_FALSE(state.isRegistered);
    CHECK_FALSE(state.ipAddress.has_value());

    service.stop();
    CHECK(api.unregisterTokens.size() == 1);
}

TEST_CASE_FIXTURE(ProxyFixture, "Relay serves health over a real socket") {
    auto& service{make()};
    const auto endpoint{service.start()};
    REQUIRE(endpoint.ok());

    const http::RestClient client{};
    const auto url{"http://127.0.0.1:" + std::to_string(endpoint.value.port) + "/health"};
    const auto response{client.send(url, http::Request{.method = "GET"}, 5000)};

    REQUIRE(response.ok());
    CHECK(response.value.status == 200);
    CHECK(header(response.value, "Access-Control-Allow-Origin") == std::optional<std::string>{"*"});
    const auto doc{parse(response.value.body)};
    CHECK(doc["proxy"]["isRunning"].as<bool>());
    CHECK(doc["proxy"]["port"].as<unsigned>() == unsigned{endpoint.value.port});
}
