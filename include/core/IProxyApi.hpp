#ifndef VITCO_CORE_IPROXYAPI_HPP
#define VITCO_CORE_IPROXYAPI_HPP

/**
 * @file IProxyApi.hpp
 * @brief Remote proxy registry endpoints plus the raw relay used by the proxy.
 */

#include <cstdint>
#include <string>

#include "core/Result.hpp"
#include "utils/HttpMessage.hpp"

namespace vitco {

    struct ProxyAnnouncement {
        std::string ipAddress{};
        std::uint16_t port{0};
        std::string deviceName{};
    };

    class IProxyApi {
    public:
        virtual ~IProxyApi() = default;

        /**
         * @brief `POST proxy/register`. Succeeds only on a `success:true` body.
         */
        [[nodiscard]] virtual Status registerProxy(const std::string& accessToken, const ProxyAnnouncement& announcement) = 0;

        [[nodiscard]] virtual Status heartbeat(const std::string& accessToken) = 0;

        [[nodiscard]] virtual Status unregister(const std::string& accessToken) = 0;

        /**
         * @brief Relay a request to `<api base>` + `request.target` unchanged.
         */
        [[nodiscard]] virtual Result<http::Response> forward(const http::Request& request) = 0;
    };

}

#endif  // VITCO_CORE_IPROXYAPI_HPP
