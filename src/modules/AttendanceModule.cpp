#include "modules/AttendanceModule.hpp"

#include "core/Logger.hpp"
#include "modules/ErrorClassifier.hpp"
#include "utils/TimeFormat.hpp"

#include <ArduinoJson.h>

#include <chrono>

namespace vitco {
    namespace {
        constexpr auto *ATT_TAG{"Attendance"};
        constexpr auto *FINGERPRINT_FAILED{"Failed to generate system fingerprint. Cannot mark attendance."};

        std::string networkName(const NetworkInfo &network) {
            if (const auto *wifi{std::get_if<WifiNetwork>(&network)}) {
                return wifi->ssid.empty() ? std::string{"Office Wi-Fi"} : wifi->ssid;
            }
            return "Office Network";
        }

        template<typename Fill>
        std::string details(Fill &&fill) {
            JsonDocument doc;
            fill(doc.to<JsonObject>());
            std::string out;
            serializeJson(doc, out);
            return out;
        }

        void writeFailure(JsonObject obj, const ClassifiedError &classified, const Status &error) {
            if (!classified.errorCode.empty()) {
                obj["errorCode"] = classified.errorCode;
            }
            obj["errorType"] = toString(classified.type);
            obj["statusCode"] = error.httpStatus != 0 ? error.httpStatus : 500;
            obj["originalError"] = error.message;
        }
    }

    AttendanceModule::AttendanceModule(EventBus &bus, const AttendanceContext &ctx, const AppConfig &cfg, const bool developmentBuild)
        : ModuleBase(bus, EventFilter::only(EventType::AppStarted)
                     .include(EventType::UserLoggedIn)
                     .include(EventType::NetworkChanged)
                     .include(EventType::SystemResumed)),
          m_ctx(ctx), m_eligibility(ctx.api, ctx.session), m_developmentBuild(developmentBuild), m_cfg(cfg) {
        setState(ModuleState::Ready);
    }

    AttendanceModule::~AttendanceModule() {
        stop();
    }

    void AttendanceModule::onStart() {
        {
            std::lock_guard lock{m_jobMutex};
            m_stopping = false;
        }
        m_worker = std::thread(&AttendanceModule::workerTask, this);

        const auto cfg{config()};
        LOG_INFO(ATT_TAG, "AttendanceModule started: auto check-in=%s, debounce=%ums, dev=%s",
                 cfg.attendance.autoCheckInEnabled ? "on" : "off", unsigned{cfg.attendance.debounceMs}, m_developmentBuild ? "yes" : "no");
    }

    void AttendanceModule::onStop() {
        m_wakeTimer.cancel();
        {
            std::lock_guard lock{m_jobMutex};
            m_stopping = true;
            m_jobs.clear();
        }
        m_jobCv.notify_all();

        if (m_worker.joinable()) {
            m_worker.join();
        }
        m_idleCv.notify_all();
        LOG_INFO(ATT_TAG, "AttendanceModule stopped");
    }

    void AttendanceModule::processEvent(const Event &event) {
        switch (event.type) {
            case EventType::AppStarted:
                (void)enqueueCheckIn(Trigger::AppStart);
                break;
            case EventType::UserLoggedIn:
                (void)enqueueCheckIn(Trigger::Login);
                break;
            case EventType::NetworkChanged: {
                if (const auto *nc = std::get_if<NetworkChangedEvent>(&event.payload)) {
                    if (isConnected(nc->current)) {
                        (void)enqueueCheckIn(Trigger::NetworkChange);
                    } else {
                        LOG_DEBUG(ATT_TAG, "Network lost, nothing to do");
                    }
                }
                break;
            }
            case EventType::SystemResumed: {
                const auto delayMs{config().attendance.wakeCheckInDelayMs};
                LOG_INFO(ATT_TAG, "System resumed, check-in in %ums", unsigned{delayMs});
                m_wakeTimer.startOnce(delayMs, [this] {
                    (void)enqueueCheckIn(Trigger::SystemWake);
                });
                break;
            }
            default:
                break;
        }
    }

    void AttendanceModule::onConfigUpdate(const AppConfig &config) {
        std::lock_guard lock{m_cfgMutex};
        m_cfg = config;
        LOG_INFO(ATT_TAG, "Config updated: auto check-in=%s, auto check-out=%s, debounce=%ums",
                 m_cfg.attendance.autoCheckInEnabled ? "on" : "off",
                 m_cfg.checkout.autoCheckoutOnShutdownEnabled ? "on" : "off",
                 unsigned{m_cfg.attendance.debounceMs});
    }

    AppConfig AttendanceModule::config() const {
        std::lock_guard lock{m_cfgMutex};
        return m_cfg;
    }

    // ==================== Job Queue ====================

    bool AttendanceModule::enqueueCheckIn(const Trigger trigger) {
        if (!isRunning()) {
            return false;
        }

        {
            std::lock_guard lock{m_jobMutex};
            if (m_stopping) {
                return false;
            }
            if (m_jobs.size() >= JOB_QUEUE_SIZE) {
                LOG_WARNING(ATT_TAG, "Job queue full, dropping %s trigger", toString(trigger));
                return false;
            }
            m_jobs.push_back(trigger);
        }
        m_jobCv.notify_one();
        LOG_DEBUG(ATT_TAG, "Queued check-in for trigger %s", toString(trigger));
        return true;
    }

    bool AttendanceModule::waitIdle(const std::uint32_t timeoutMs) {
        std::unique_lock lock{m_jobMutex};
        return m_idleCv.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this] {
            return m_jobs.empty() && !m_busy;
        });
    }

    void AttendanceModule::workerTask() {
        LOG_DEBUG(ATT_TAG, "Worker started");

        for (;;) {
            Trigger trigger{};
            {
                std::unique_lock lock{m_jobMutex};
                m_jobCv.wait(lock, [this] { return m_stopping || !m_jobs.empty(); });
                if (m_stopping) {
                    break;
                }
                trigger = m_jobs.front();
                m_jobs.pop_front();
                m_busy = true;
            }

            const auto result{attemptCheckIn(trigger)};
            LOG_DEBUG(ATT_TAG, "Trigger %s finished: success=%s", toString(trigger), result.success ? "yes" : "no");

            {
                std::lock_guard lock{m_jobMutex};
                m_busy = false;
            }
            m_idleCv.notify_all();
        }

        LOG_DEBUG(ATT_TAG, "Worker exiting");
    }

    // ==================== Check-in ====================

    AttemptResult AttendanceModule::attemptCheckIn(const Trigger trigger) {
        std::lock_guard lock{m_attemptMutex};

        const auto cfg{config()};
        const auto now{m_ctx.clock.nowMs()};
        const auto *label{toString(trigger)};

        AttemptResult result{};
        result.timestampMs = now;

        LOG_INFO(ATT_TAG, "Attempting auto check-in - trigger: %s", label);

        // Only successes are in the ledger, so a failed attempt never delays a retry
        if (const auto last{m_ctx.storage.lastTriggerSuccess(trigger)}; last && (now < *last || now - *last < cfg.attendance.debounceMs)) {
            result.reason = "Skipped due to debouncing (recent successful attempt within 30 seconds)";
            LOG_INFO(ATT_TAG, "Check-in skipped: last success %llums ago",
                     static_cast<unsigned long long>(now > *last ? now - *last : 0));
            m_ctx.audit.record(label, AuditOutcome::Skipped, result.reason);
            publishAttempt(trigger, AttendanceIntent::CheckIn, result);
            return result;
        }

        const auto network{m_ctx.network.currentNetwork()};
        if (!isConnected(network)) {
            result.reason = "No network connection";
            result.errorType = ErrorType::Network;
            LOG_WARNING(ATT_TAG, "Check-in failed: %s", result.reason.c_str());
            m_ctx.audit.record(label, AuditOutcome::Failed, result.reason);
            publishAttempt(trigger, AttendanceIntent::CheckIn, result);
            return result;
        }

        const auto eligibility{m_eligibility.evaluateCheckIn(cfg.attendance, network)};
        if (!eligibility.eligible) {
            result.reason = eligibility.reason;
            result.errorType = eligibility.errorType;
            LOG_INFO(ATT_TAG, "Not eligible for check-in: %s", result.reason.c_str());
            m_ctx.audit.record(label, AuditOutcome::Skipped, result.reason, details([&](JsonObject obj) {
                obj["networkType"] = toString(networkType(network));
                if (eligibility.status) {
                    obj["status"] = toString(*eligibility.status);
                }
            }));
            publishAttempt(trigger, AttendanceIntent::CheckIn, result);
            return result;
        }

        CheckInRequest request{};
        request.network = network;

        if (const auto fp{m_ctx.fingerprint.getFingerprint()}; fp.ok() && !fp.value.empty()) {
            request.systemFingerprint = fp.value;
        } else if (m_developmentBuild) {
            LOG_WARNING(ATT_TAG, "No system fingerprint (%s), continuing in development mode", fp.status.message.c_str());
        } else {
            LOG_ERROR(ATT_TAG, "No system fingerprint: %s", fp.status.message.c_str());
            return failCheckIn(trigger, Status::Error(ErrorCode::OperationFailed, FINGERPRINT_FAILED), network);
        }

        const auto record{m_ctx.api.checkIn(request)};
        if (!record.ok()) {
            return failCheckIn(trigger, record.status, network);
        }

        result.success = true;
        result.attendanceId = record.value.id;
        LOG_INFO(ATT_TAG, "Check-in successful, attendance id %s", result.attendanceId.c_str());

        checkStored(m_ctx.storage.recordTriggerSuccess(trigger, now), "trigger ledger");
        checkStored(m_ctx.storage.setLastCheckInAttempt(now, result.attendanceId), "last check-in");
        checkStored(m_ctx.storage.setLastNetworkUsed(network), "last network");
        checkStored(m_ctx.storage.saveSessionState(SessionStateUpdate{
            .lastCheckInTimestamp = now,
            .lastNetworkInfo = network,
            .systemFingerprint = request.systemFingerprint,
            .pendingCheckout = false,
        }), "session state");

        m_ctx.audit.record(label, AuditOutcome::Success, "", details([&](JsonObject obj) {
            obj["attendanceId"] = result.attendanceId;
            obj["networkType"] = toString(networkType(network));
        }));

        if (cfg.attendance.showNotifications) {
            m_ctx.prompt.notify("Attendance Marked",
                                "You have been automatically checked in (" + networkName(network) + " detected)",
                                PromptLevel::Info);
        }

        publishAttempt(trigger, AttendanceIntent::CheckIn, result);
        return result;
    }

    AttemptResult AttendanceModule::failCheckIn(const Trigger trigger, const Status &error, const NetworkInfo &network) {
        const auto classified{classifier::classifyCheckIn(error)};

        AttemptResult result{};
        result.timestampMs = m_ctx.clock.nowMs();
        result.reason = classified.userMessage;
        result.errorCode = classified.errorCode;
        result.errorType = classified.type;

        LOG_ERROR(ATT_TAG, "Check-in failed (%s, %s): %s", toString(classified.type),
                  classified.errorCode.empty() ? "no code" : classified.errorCode.c_str(), error.message.c_str());

        m_ctx.audit.record(toString(trigger), AuditOutcome::Failed, result.reason, details([&](JsonObject obj) {
            writeFailure(obj, classified, error);
            obj["networkType"] = toString(networkType(network));
        }));

        switch (classified.type) {
            case ErrorType::Validation:
                m_ctx.prompt.notify("Check-In Failed", result.reason, PromptLevel::Error);
                break;
            case ErrorType::Network:
                m_ctx.prompt.notify("Network Error", result.reason, PromptLevel::Error);
                break;
            case ErrorType::Authentication:
                LOG_WARNING(ATT_TAG, "Authentication error - user may need to sign in again");
                break;
            default:
                m_ctx.prompt.notify("Check-In Failed", "Unable to mark attendance. Please try again or contact support.", PromptLevel::Error);
                break;
        }

        publishAttempt(trigger, AttendanceIntent::CheckIn, result);
        return result;
    }

    // ==================== Check-out ====================

    AttemptResult AttendanceModule::attemptCheckOut(const Trigger trigger, const bool fastMode,
                                                    std::optional<NetworkInfo> networkHint,
                                                    std::optional<std::uint64_t> explicitTimeMs) {
        std::lock_guard lock{m_attemptMutex};

        const auto cfg{config()};
        const auto now{m_ctx.clock.nowMs()};
        const auto label{std::string{"checkout_"} + toString(trigger)};

        AttemptResult result{};
        result.timestampMs = now;

        LOG_INFO(ATT_TAG, "Attempting check-out - trigger: %s, fastMode: %s, time: %s", toString(trigger),
                 fastMode ? "yes" : "no", explicitTimeMs ? utils::toIso8601(*explicitTimeMs).c_str() : "current");

        const auto eligibility{m_eligibility.evaluateCheckOut(cfg.checkout)};
        if (!eligibility.eligible) {
            result.reason = eligibility.reason;
            result.errorType = eligibility.errorType;
            LOG_INFO(ATT_TAG, "Not eligible for check-out: %s", result.reason.c_str());
            if (!eligibility.benign) {
                m_ctx.audit.record(label, AuditOutcome::Failed, result.reason);
            }
            publishAttempt(trigger, AttendanceIntent::CheckOut, result);
            return result;
        }

        auto network{networkHint ? *networkHint : m_ctx.network.currentNetwork()};
        if (!isConnected(network)) {
            if (auto last{m_ctx.storage.lastNetworkUsed()}) {
                LOG_DEBUG(ATT_TAG, "No network, reporting last used %s", describe(*last).c_str());
                network = std::move(*last);
            }
        }

        CheckOutRequest request{};
        request.network = network;
        request.checkOutTimeMs = explicitTimeMs;

        if (const auto fp{m_ctx.fingerprint.getFingerprint()}; fp.ok() && !fp.value.empty()) {
            request.systemFingerprint = fp.value;
        } else if (fastMode) {
            LOG_WARNING(ATT_TAG, "No system fingerprint (%s), continuing in fast mode", fp.status.message.c_str());
        } else {
            LOG_ERROR(ATT_TAG, "No system fingerprint: %s", fp.status.message.c_str());
            return failCheckOut(trigger, Status::Error(ErrorCode::OperationFailed, FINGERPRINT_FAILED), network, cfg);
        }

        const auto record{m_ctx.api.checkOut(request)};
        if (!record.ok()) {
            return failCheckOut(trigger, record.status, network, cfg);
        }

        result.success = true;
        result.attendanceId = record.value.id;
        LOG_INFO(ATT_TAG, "Check-out successful, attendance id %s", result.attendanceId.c_str());

        std::optional<NetworkInfo> storedNetwork{};
        if (isConnected(network)) {
            storedNetwork = network;
            checkStored(m_ctx.storage.setLastNetworkUsed(network), "last network");
        }
        checkStored(m_ctx.storage.setLastCheckOutAttempt(now, result.attendanceId), "last check-out");
        checkStored(m_ctx.storage.saveSessionState(SessionStateUpdate{
            .lastCheckOutTimestamp = now,
            .lastNetworkInfo = storedNetwork,
            .systemFingerprint = request.systemFingerprint,
            .pendingCheckout = false,
        }), "session state");

        m_ctx.audit.record(label, AuditOutcome::Success, "", details([&](JsonObject obj) {
            obj["attendanceId"] = result.attendanceId;
            obj["networkType"] = toString(networkType(network));
        }));

        if (cfg.checkout.checkoutNotificationsEnabled) {
            m_ctx.prompt.notify("Check-out Successful",
                                "You have been checked out successfully (" + networkName(network) + ")",
                                PromptLevel::Info);
        }

        publishAttempt(trigger, AttendanceIntent::CheckOut, result);
        return result;
    }

    AttemptResult AttendanceModule::failCheckOut(const Trigger trigger, const Status &error, const NetworkInfo &network, const AppConfig &cfg) {
        const auto classified{classifier::classifyCheckOut(error)};

        AttemptResult result{};
        result.timestampMs = m_ctx.clock.nowMs();
        result.reason = classified.userMessage;
        result.errorCode = classified.errorCode;
        result.errorType = classified.type;

        // The status changed between the eligibility check and the submission
        if (classified.errorCode == "ALREADY_CHECKED_OUT" || classified.errorCode == "INVALID_STATUS") {
            LOG_INFO(ATT_TAG, "Check-out not needed: %s", error.message.c_str());
            result.reason = "Already checked out or invalid status";
            publishAttempt(trigger, AttendanceIntent::CheckOut, result);
            return result;
        }

        LOG_ERROR(ATT_TAG, "Check-out failed (%s, %s): %s", toString(classified.type),
                  classified.errorCode.empty() ? "no code" : classified.errorCode.c_str(), error.message.c_str());

        m_ctx.audit.record(std::string{"checkout_"} + toString(trigger), AuditOutcome::Failed, result.reason, details([&](JsonObject obj) {
            writeFailure(obj, classified, error);
            obj["networkType"] = toString(networkType(network));
        }));

        if (cfg.checkout.checkoutNotificationsEnabled && classified.type != ErrorType::Authentication) {
            m_ctx.prompt.notify("Check-out Failed", result.reason, PromptLevel::Error);
        }

        publishAttempt(trigger, AttendanceIntent::CheckOut, result);
        return result;
    }

    // ==================== Helpers ====================

    void AttendanceModule::publishAttempt(const Trigger trigger, const AttendanceIntent intent, const AttemptResult &result) {
        const Event evt{
            .type = EventType::AttendanceAttempted,
            .payload = AttendanceAttemptedEvent{
                .trigger = trigger,
                .intent = intent,
                .success = result.success,
                .reason = result.reason,
            },
            .timestampMs = result.timestampMs,
        };
        (void)publish(evt);
    }

    void AttendanceModule::checkStored(const Status &status, const char *what) const {
        if (status.failed()) {
            LOG_ERROR(ATT_TAG, "Failed to persist %s: %s", what, status.message.c_str());
        }
    }

}
