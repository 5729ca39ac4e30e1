#ifndef VITCO_SERVICES_USERFEEDBACKSERVICE_HPP
#define VITCO_SERVICES_USERFEEDBACKSERVICE_HPP

/**
 * @file UserFeedbackService.hpp
 * @brief Desktop dialogs and notifications for the vitco agent.
 *
 * Dialogs go through `zenity`, notifications through `notify-send`. Both
 * run as child processes so the agent never links a GUI toolkit.
 */

#include <cstdint>
#include <string>
#include <vector>

#include "core/IUserPrompt.hpp"
#include "core/Result.hpp"

namespace vitco {

    /**
     * @brief User feedback service backed by the desktop tools.
     *
     * Design:
     * - `confirm()` blocks the calling worker until the dialog is answered
     * - `notify()` is fire-and-forget; a missing daemon is only logged
     * - Markup characters in titles and messages are escaped
     */
    class UserFeedbackService : public IUserPrompt {
    public:
        UserFeedbackService() = default;
        ~UserFeedbackService() override = default;

        // Non-copyable, non-movable
        UserFeedbackService(const UserFeedbackService&) = delete;
        UserFeedbackService& operator=(const UserFeedbackService&) = delete;
        UserFeedbackService(UserFeedbackService&&) = delete;
        UserFeedbackService& operator=(UserFeedbackService&&) = delete;

        [[nodiscard]] Result<std::size_t> confirm(const PromptRequest& request) override;

        void notify(const std::string& title, const std::string& body, PromptLevel level) override;

        /**
         * @brief zenity command line for a dialog.
         */
        [[nodiscard]] static std::vector<std::string> dialogCommand(const PromptRequest& request);

        /**
         * @brief Map zenity's exit code and stdout back to an option index.
         */
        [[nodiscard]] static Result<std::size_t> interpretDialogResult(const PromptRequest& request, int exitCode, const std::string& out);

        [[nodiscard]] static std::string escapeMarkup(const std::string& text);

        static constexpr std::uint32_t DIALOG_TIMEOUT_MS = 10 * 60 * 1000;
        static constexpr std::uint32_t NOTIFY_TIMEOUT_MS = 5000;
    };

}

#endif  // VITCO_SERVICES_USERFEEDBACKSERVICE_HPP
