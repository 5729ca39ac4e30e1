#ifndef VITCO_UTILS_RESTCLIENT_HPP
#define VITCO_UTILS_RESTCLIENT_HPP

/**
 * @file RestClient.hpp
 * @brief One-shot requests to the attendance server through cpp-httplib.
 *
 * Accepts http and https URLs. The timeout is applied to connect, read
 * and write separately. Transport failures come back as `NetworkError`
 * or `Timeout`; any HTTP status is a successful transport result and is
 * left to the caller.
 */

#include <cstdint>
#include <string>

#include "core/Result.hpp"
#include "utils/HttpMessage.hpp"

namespace vitco::http {

    class RestClient {
    public:
        RestClient() = default;

        /**
         * @brief Send `request` to the absolute `url`; `request.target` is ignored.
         */
        [[nodiscard]] Result<Response> send(const std::string& url, const Request& request, std::uint32_t timeoutMs) const;
    };

}

#endif  // VITCO_UTILS_RESTCLIENT_HPP
