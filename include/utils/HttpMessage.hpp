#ifndef VITCO_UTILS_HTTPMESSAGE_HPP
#define VITCO_UTILS_HTTPMESSAGE_HPP

/**
 * @file HttpMessage.hpp
 * @brief Plain request/response values passed between the relay and the API client.
 *
 * Keeps cpp-httplib out of the module seams (`IProxyApi`) so fakes can
 * build messages directly. Conversions to and from the httplib types live
 * here too.
 */

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/Result.hpp"

namespace httplib {
    struct Request;
    struct Response;
}

namespace vitco::http {

    using Headers = std::vector<std::pair<std::string, std::string>>;

    struct Request {
        std::string method{"GET"};
        std::string target{"/"};  // path plus query, as received
        Headers headers{};
        std::string body{};
    };

    struct Response {
        int status{200};
        Headers headers{};
        std::string body{};
    };

    /**
     * @brief `scheme://host[:port]` and the rest of the URL, as httplib::Client wants them.
     */
    struct Origin {
        std::string schemeHostPort{};
        std::string path{};  // path plus query, empty for the bare origin
    };

    /**
     * @brief Split an absolute http or https URL.
     */
    [[nodiscard]] Result<Origin> splitOrigin(std::string_view url);

    /**
     * @brief Join a base URL and an endpoint path with exactly one slash.
     */
    [[nodiscard]] std::string joinUrl(std::string_view base, std::string_view path);

    [[nodiscard]] bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept;

    /**
     * @brief Case-insensitive header lookup (first match).
     */
    [[nodiscard]] std::optional<std::string> findHeader(const Headers& headers, std::string_view name);

    /**
     * @brief Headers the transport owns (framing, connection, Host) or that
     *        httplib adds on the server side (REMOTE_ADDR and friends).
     *        They are never copied from one hop to the next.
     */
    [[nodiscard]] bool isTransportHeader(std::string_view name) noexcept;

    [[nodiscard]] Request fromLibrary(const httplib::Request& request);

    void toLibrary(const Response& response, httplib::Response& out);

}

#endif  // VITCO_UTILS_HTTPMESSAGE_HPP
