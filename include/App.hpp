#ifndef VITCO_APP_HPP
#define VITCO_APP_HPP

#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "core/Clock.hpp"
#include "core/EventBus.hpp"
#include "core/IQuitVeto.hpp"
#include "core/ModuleManager.hpp"

#include "modules/AttendanceModule.hpp"
#include "modules/RecoveryModule.hpp"
#include "modules/ShutdownModule.hpp"

#include "services/AuditLogService.hpp"
#include "services/BackendApi.hpp"
#include "services/ConfigService.hpp"
#include "services/FingerprintService.hpp"
#include "services/NetworkService.hpp"
#include "services/PowerService.hpp"
#include "services/ProxyService.hpp"
#include "services/SessionService.hpp"
#include "services/StorageService.hpp"
#include "services/UserFeedbackService.hpp"

namespace vitco
{

/**
 * @brief Owns every service and module of the agent and runs it until quit.
 *
 * Services are created in dependency order by begin(). The process stays up
 * until a ShutdownRequested event arrives and every quit hold was released.
 */
class App : public IQuitVeto, public IEventListener
{
public:
    struct Options
    {
        std::optional<std::string> dataDir{};
        std::optional<std::string> logLevel{};
        bool developmentBuild{false};
    };

    enum class AppState
    {
        Uninitialized,
        Initializing,
        Running,
        Stopping,
        Stopped,
        Error
    };

    explicit App(Options options);
    App(const App &) = delete;
    App &operator=(const App &) = delete;
    ~App() override;

    // Lifecycle
    [[nodiscard]] Status begin();

    /**
     * @brief Block until quit was requested and no flow holds the quit.
     */
    void run();

    /**
     * @brief Ask the agent to quit, as if the OS had sent a shutdown signal.
     */
    void requestQuit();

    /**
     * @brief Stop everything in reverse start order. Safe to call twice.
     */
    void shutdown();

    [[nodiscard]] AppState getState() const
    {
        return m_appState;
    }

    [[nodiscard]] const std::string &dataDir() const
    {
        return m_dataDir;
    }

    // ==================== IQuitVeto ====================
    void hold(const std::string &reason) override;
    void release(const std::string &reason) override;

    // ==================== IEventListener ====================
    void onEvent(const Event &event) override;

private:
    void applyLogConfig(const AppConfig &config);
    void applyAutostart(const AppConfig &config);
    void startProxy();

    static constexpr std::uint32_t BUS_DRAIN_TIMEOUT_MS = 2000;
    static constexpr std::uint32_t MODULE_DRAIN_TIMEOUT_MS = 5000;

    Options m_options;
    std::string m_dataDir{};

    SystemClock m_clock{};
    std::unique_ptr<EventBus> m_eventBus{};

    std::unique_ptr<ConfigService> m_configService{};
    std::unique_ptr<StorageService> m_storageService{};
    std::unique_ptr<AuditLogService> m_auditLog{};
    std::unique_ptr<SessionService> m_sessionService{};
    std::unique_ptr<BackendApi> m_backendApi{};
    std::unique_ptr<NetworkService> m_networkService{};
    std::unique_ptr<PowerService> m_powerService{};
    std::unique_ptr<FingerprintService> m_fingerprintService{};
    std::unique_ptr<UserFeedbackService> m_feedbackService{};
    std::unique_ptr<ProxyService> m_proxyService{};

    std::unique_ptr<AttendanceModule> m_attendanceModule{};
    std::unique_ptr<ShutdownModule> m_shutdownModule{};
    std::unique_ptr<RecoveryModule> m_recoveryModule{};
    std::unique_ptr<ModuleManager> m_moduleManager{};

    EventBus::ListenerId m_listenerId{0};

    // Quit handling
    std::mutex m_quitMutex{};
    std::condition_variable m_quitCv{};
    bool m_quitRequested{false};
    std::map<std::string, std::uint32_t> m_holds{};
    std::uint32_t m_holdCount{0};

    // State
    AppState m_appState{AppState::Uninitialized};
};
} // namespace vitco

#endif // VITCO_APP_HPP
