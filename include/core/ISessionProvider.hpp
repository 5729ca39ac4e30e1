#ifndef VITCO_CORE_ISESSIONPROVIDER_HPP
#define VITCO_CORE_ISESSIONPROVIDER_HPP

/**
 * @file ISessionProvider.hpp
 * @brief Signed-in user and bearer tokens.
 */

#include <optional>
#include <string>

#include "core/Result.hpp"
#include "core/Types.hpp"

namespace vitco {

    class ISessionProvider {
    public:
        virtual ~ISessionProvider() = default;

        /**
         * @brief True when a user and a refresh token are present.
         */
        [[nodiscard]] virtual bool isAuthenticated() = 0;

        /**
         * @brief Current access token, empty when signed out.
         */
        [[nodiscard]] virtual std::string accessToken() = 0;

        [[nodiscard]] virtual std::optional<UserInfo> user() = 0;

        /**
         * @brief Exchange the refresh token for a new access token.
         */
        [[nodiscard]] virtual Result<std::string> refreshAccessToken() = 0;
    };

}

#endif  // VITCO_CORE_ISESSIONPROVIDER_HPP
