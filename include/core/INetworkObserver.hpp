#ifndef VITCO_CORE_INETWORKOBSERVER_HPP
#define VITCO_CORE_INETWORKOBSERVER_HPP

#include <optional>
#include <string>

#include "core/Types.hpp"

namespace vitco {

    class INetworkObserver {
    public:
        virtual ~INetworkObserver() = default;

        /**
         * @brief Read the current attachment now.
         */
        [[nodiscard]] virtual NetworkInfo currentNetwork() = 0;

        /**
         * @brief First non-loopback IPv4 address, if any.
         */
        [[nodiscard]] virtual std::optional<std::string> localIpv4Address() = 0;
    };

}

#endif  // VITCO_CORE_INETWORKOBSERVER_HPP
