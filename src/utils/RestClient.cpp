#include "utils/RestClient.hpp"

#include "core/Logger.hpp"

#include <httplib.h>

#include <chrono>

namespace vitco::http {
    namespace {
        constexpr auto *HTTP_TAG{"RestClient"};

        Status transportError(const httplib::Error error, const std::string &origin) {
            if (error == httplib::Error::ConnectionTimeout) {
                return Status::Error(ErrorCode::Timeout, "request timed out");
            }
            return Status::Error(ErrorCode::NetworkError, origin + ": " + httplib::to_string(error));
        }
    }

    Result<Response> RestClient::send(const std::string &url, const Request &request, const std::uint32_t timeoutMs) const {
        const auto origin{splitOrigin(url)};
        if (origin.failed()) {
            return Result<Response>::Error(origin.status);
        }

        httplib::Client client{origin.value.schemeHostPort};
        if (!client.is_valid()) {
            return Result<Response>::Error(ErrorCode::InvalidArgument, "cannot open a client for " + origin.value.schemeHostPort);
        }
        const std::chrono::milliseconds timeout{timeoutMs};
        client.set_connection_timeout(timeout);
        client.set_read_timeout(timeout);
        client.set_write_timeout(timeout);

        httplib::Request outgoing{};
        outgoing.method = request.method;
        outgoing.path = origin.value.path.empty() ? std::string{"/"} : origin.value.path;
        outgoing.body = request.body;
        for (const auto &[name, value] : request.headers) {
            if (!isTransportHeader(name)) {
                outgoing.headers.emplace(name, value);
            }
        }

        const auto result{client.send(outgoing)};
        if (!result) {
            const auto status{transportError(result.error(), origin.value.schemeHostPort)};
            LOG_DEBUG(HTTP_TAG, "%s %s: %s", request.method.c_str(), url.c_str(), status.message.c_str());
            return Result<Response>::Error(status);
        }

        Response response{.status = result->status};
        for (const auto &[name, value] : result->headers) {
            response.headers.emplace_back(name, value);
        }
        response.body = result->body;
        return Result<Response>::Ok(std::move(response));
    }

}
