#ifndef VITCO_CORE_IUSERPROMPT_HPP
#define VITCO_CORE_IUSERPROMPT_HPP

/**
 * @file IUserPrompt.hpp
 * @brief Blocking dialogs and fire-and-forget notifications.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/Result.hpp"

namespace vitco {

    enum class PromptLevel : std::uint8_t {
        Info,
        Warning,
        Error,
    };
    [[nodiscard]] constexpr const char* toString(const PromptLevel level) noexcept {
        switch (level) {
            case PromptLevel::Info:    return "info";
            case PromptLevel::Warning: return "warning";
            case PromptLevel::Error:   return "error";
            default:                   return "unknown";
        }
    }

    struct PromptRequest {
        std::string title{};
        std::string message{};
        std::string detail{};
        std::vector<std::string> options{};
        PromptLevel level{PromptLevel::Info};
    };

    class IUserPrompt {
    public:
        virtual ~IUserPrompt() = default;

        /**
         * @brief Show a modal question and block until answered.
         * @return Index into `options` of the chosen button
         */
        [[nodiscard]] virtual Result<std::size_t> confirm(const PromptRequest& request) = 0;

        virtual void notify(const std::string& title, const std::string& body, PromptLevel level) = 0;
    };

}

#endif  // VITCO_CORE_IUSERPROMPT_HPP
