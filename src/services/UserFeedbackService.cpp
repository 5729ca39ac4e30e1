#include "services/UserFeedbackService.hpp"

#include "AppConfig.hpp"
#include "core/Logger.hpp"
#include "platform/PlatformProcess.hpp"

namespace vitco {

    namespace {
        constexpr auto* FEEDBACK_TAG = "Feedback";

        // zenity exits 1 for Cancel and for extra buttons, 5 on --timeout, -1 when closed.
        constexpr int ZENITY_OK = 0;
        constexpr int ZENITY_CANCEL = 1;

        const char* dialogKind(const PromptLevel level) {
            switch (level) {
                case PromptLevel::Warning: return "--warning";
                case PromptLevel::Error:   return "--error";
                default:                   return "--info";
            }
        }

        const char* urgency(const PromptLevel level) {
            switch (level) {
                case PromptLevel::Error:   return "critical";
                case PromptLevel::Warning: return "normal";
                default:                   return "low";
            }
        }

        const char* iconName(const PromptLevel level) {
            switch (level) {
                case PromptLevel::Warning: return "dialog-warning";
                case PromptLevel::Error:   return "dialog-error";
                default:                   return "dialog-information";
            }
        }

        std::string trimNewline(std::string s) {
            while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
                s.pop_back();
            }
            return s;
        }
    }

    std::string UserFeedbackService::escapeMarkup(const std::string& text) {
        std::string out{};
        out.reserve(text.size());
        for (const char c : text) {
            switch (c) {
                case '&': out += "&amp;"; break;
                case '<': out += "&lt;"; break;
                case '>': out += "&gt;"; break;
                default:  out += c; break;
            }
        }
        return out;
    }

    std::vector<std::string> UserFeedbackService::dialogCommand(const PromptRequest& request) {
        std::string text{"<b>" + escapeMarkup(request.message) + "</b>"};
        if (!request.detail.empty()) {
            text += "\n\n" + escapeMarkup(request.detail);
        }

        std::vector<std::string> argv{"zenity"};
        if (request.options.size() <= 1) {
            argv.emplace_back(dialogKind(request.level));
            argv.emplace_back("--title=" + request.title);
            argv.emplace_back("--text=" + text);
            if (!request.options.empty()) {
                argv.emplace_back("--ok-label=" + request.options.front());
            }
            return argv;
        }

        argv.emplace_back("--question");
        argv.emplace_back("--title=" + request.title);
        argv.emplace_back("--text=" + text);
        argv.emplace_back(std::string{"--icon-name="} + iconName(request.level));
        argv.emplace_back("--ok-label=" + request.options[0]);
        argv.emplace_back("--cancel-label=" + request.options[1]);
        for (std::size_t i = 2; i < request.options.size(); ++i) {
            argv.emplace_back("--extra-button=" + request.options[i]);
        }
        return argv;
    }

    Result<std::size_t> UserFeedbackService::interpretDialogResult(const PromptRequest& request, const int exitCode, const std::string& out) {
        if (request.options.size() <= 1) {
            return Result<std::size_t>::Ok(0);
        }

        if (exitCode == ZENITY_OK) {
            return Result<std::size_t>::Ok(0);
        }

        if (exitCode == ZENITY_CANCEL) {
            // Extra buttons print their label and exit like Cancel.
            const auto label{trimNewline(out)};
            for (std::size_t i = 2; i < request.options.size(); ++i) {
                if (request.options[i] == label) {
                    return Result<std::size_t>::Ok(i);
                }
            }
            return Result<std::size_t>::Ok(1);
        }

        return Result<std::size_t>::Error(ErrorCode::Cancelled, "Dialog dismissed (exit " + std::to_string(exitCode) + ")");
    }

    Result<std::size_t> UserFeedbackService::confirm(const PromptRequest& request) {
        LOG_INFO(FEEDBACK_TAG, "Dialog '%s': %s", request.title.c_str(), request.message.c_str());

        const auto res{platform::runCommand(dialogCommand(request), DIALOG_TIMEOUT_MS)};
        if (res.failed()) {
            LOG_WARNING(FEEDBACK_TAG, "Dialog '%s' unavailable: %s", request.title.c_str(), res.status.message.c_str());
            return Result<std::size_t>::Error(res.status);
        }

        auto choice{interpretDialogResult(request, res.value.exitCode, res.value.out)};
        if (choice.ok() && choice.value < request.options.size()) {
            LOG_INFO(FEEDBACK_TAG, "Dialog '%s' answered: %s", request.title.c_str(), request.options[choice.value].c_str());
        }
        return choice;
    }

    void UserFeedbackService::notify(const std::string& title, const std::string& body, const PromptLevel level) {
        LOG_DEBUG(FEEDBACK_TAG, "Notify [%s] %s: %s", toString(level), title.c_str(), body.c_str());

        const std::vector<std::string> argv{
            "notify-send",
            "--app-name=" + std::string{defaults::APP_NAME},
            std::string{"--urgency="} + urgency(level),
            std::string{"--icon="} + iconName(level),
            title,
            escapeMarkup(body),
        };

        const auto res{platform::runCommand(argv, NOTIFY_TIMEOUT_MS)};
        if (res.failed()) {
            LOG_WARNING(FEEDBACK_TAG, "Notification not shown: %s", res.status.message.c_str());
        } else if (res.value.exitCode != 0) {
            LOG_WARNING(FEEDBACK_TAG, "notify-send exited with %d", res.value.exitCode);
        }
    }

}
