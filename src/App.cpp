#include "App.hpp"

#include "core/Logger.hpp"
#include "platform/PlatformPower.hpp"
#include "platform/PlatformSystem.hpp"
#include "utils/FileUtils.hpp"

namespace vitco
{
namespace
{
constexpr auto *APP_TAG{"App"};
constexpr auto *QUIT_HOLD_TAG{"quit"};
} // namespace

App::App(Options options) : m_options(std::move(options))
{
}

App::~App()
{
    shutdown();
}

Status App::begin()
{
    LOG_INFO(APP_TAG, "========================================");
    LOG_INFO(APP_TAG, "  %.*s v%.*s",
             static_cast<int>(defaults::APP_NAME.size()), defaults::APP_NAME.data(),
             static_cast<int>(defaults::AGENT_VERSION.size()), defaults::AGENT_VERSION.data());
    LOG_INFO(APP_TAG, "========================================");
    m_appState = AppState::Initializing;

    // Signals must be blocked before any thread exists so every thread inherits the mask
    if (const auto status = platform::blockPowerSignals(); status.failed())
    {
        LOG_ERROR(APP_TAG, "Cannot block power signals: %s", status.message.c_str());
        m_appState = AppState::Error;
        return status;
    }

    // 1. Data directory
    LOG_INFO(APP_TAG, "[1/10] Resolving data directory...");
    const auto dataDir = platform::resolveDataDir(m_options.dataDir);
    if (dataDir.failed())
    {
        LOG_ERROR(APP_TAG, "Data directory unavailable: %s", dataDir.status.message.c_str());
        m_appState = AppState::Error;
        return dataDir.status;
    }
    m_dataDir = dataDir.value;
    if (const auto status = utils::ensureDirectory(m_dataDir + "/logs"); status.failed())
    {
        LOG_ERROR(APP_TAG, "Cannot create log directory: %s", status.message.c_str());
        m_appState = AppState::Error;
        return status;
    }
    LOG_INFO(APP_TAG, "Data directory: %s", m_dataDir.c_str());

    // 2. EventBus
    LOG_INFO(APP_TAG, "[2/10] Initializing EventBus...");
    const EventBus::Config busConfig{
        .queueLength = defaults::EVENTBUS_QUEUE_SIZE,
        .highPriorityQueueLength = defaults::EVENTBUS_HIGH_PRIORITY_QUEUE_SIZE,
    };
    m_eventBus = std::make_unique<EventBus>(busConfig);
    m_eventBus->start();

    // 3. Configuration
    LOG_INFO(APP_TAG, "[3/10] Initializing ConfigService...");
    m_configService = std::make_unique<ConfigService>(*m_eventBus, m_dataDir);
    if (const auto status = m_configService->begin(); status.failed())
    {
        LOG_WARNING(APP_TAG, "ConfigService init failed: %s (using defaults)", status.message.c_str());
    }
    const auto &config = m_configService->get();
    applyLogConfig(config);

    // 4. Persistent state and audit log
    LOG_INFO(APP_TAG, "[4/10] Initializing StorageService and AuditLogService...");
    m_storageService = std::make_unique<StorageService>(m_dataDir);
    if (const auto status = m_storageService->begin(); status.failed())
    {
        LOG_ERROR(APP_TAG, "StorageService init failed: %s", status.message.c_str());
        m_appState = AppState::Error;
        return status;
    }
    m_auditLog = std::make_unique<AuditLogService>(m_clock, m_dataDir);
    if (const auto status = m_auditLog->begin(); status.failed())
    {
        LOG_WARNING(APP_TAG, "AuditLogService init failed: %s (continuing)", status.message.c_str());
    }
    else
    {
        const auto removed = m_auditLog->cleanOldLogs(config.log.auditRetentionDays);
        LOG_DEBUG(APP_TAG, "Removed %u old audit log(s)", static_cast<unsigned>(removed));
    }

    // 5. Session and remote API
    LOG_INFO(APP_TAG, "[5/10] Initializing SessionService and BackendApi...");
    m_sessionService = std::make_unique<SessionService>(*m_eventBus, m_clock, m_dataDir, config.api);
    if (const auto status = m_sessionService->begin(); status.failed())
    {
        LOG_WARNING(APP_TAG, "No usable session yet: %s", status.message.c_str());
    }
    m_backendApi = std::make_unique<BackendApi>(config.api, *m_sessionService);
    LOG_INFO(APP_TAG, "Main server: %s", m_backendApi->baseUrl().c_str());

    // 6. Network observer
    LOG_INFO(APP_TAG, "[6/10] Initializing NetworkService...");
    m_networkService = std::make_unique<NetworkService>(*m_eventBus, m_clock);
    if (const auto status = m_networkService->begin(config.attendance); status.failed())
    {
        LOG_ERROR(APP_TAG, "NetworkService init failed: %s", status.message.c_str());
        m_appState = AppState::Error;
        return status;
    }

    // 7. Power signals and wake locks
    LOG_INFO(APP_TAG, "[7/10] Initializing PowerService...");
    m_powerService = std::make_unique<PowerService>(*m_eventBus, m_clock);
    if (const auto status = m_powerService->begin(); status.failed())
    {
        LOG_ERROR(APP_TAG, "PowerService init failed: %s", status.message.c_str());
        m_appState = AppState::Error;
        return status;
    }

    // 8. Fingerprint and desktop feedback
    LOG_INFO(APP_TAG, "[8/10] Initializing FingerprintService and UserFeedbackService...");
    m_fingerprintService = std::make_unique<FingerprintService>(m_dataDir);
    m_feedbackService = std::make_unique<UserFeedbackService>();

    // 9. Modules
    LOG_INFO(APP_TAG, "[9/10] Initializing modules...");
    const AttendanceContext attendanceCtx{
        .clock = m_clock,
        .api = *m_backendApi,
        .session = *m_sessionService,
        .network = *m_networkService,
        .fingerprint = *m_fingerprintService,
        .prompt = *m_feedbackService,
        .storage = *m_storageService,
        .audit = *m_auditLog,
    };
    m_attendanceModule = std::make_unique<AttendanceModule>(*m_eventBus, attendanceCtx, config, m_options.developmentBuild);

    const ShutdownContext shutdownCtx{
        .clock = m_clock,
        .api = *m_backendApi,
        .session = *m_sessionService,
        .prompt = *m_feedbackService,
        .storage = *m_storageService,
        .veto = *this,
        .wakeLocks = *m_powerService,
    };
    m_shutdownModule = std::make_unique<ShutdownModule>(*m_eventBus, shutdownCtx, *m_attendanceModule, config);

    const RecoveryContext recoveryCtx{
        .clock = m_clock,
        .api = *m_backendApi,
        .session = *m_sessionService,
        .prompt = *m_feedbackService,
        .storage = *m_storageService,
    };
    m_recoveryModule = std::make_unique<RecoveryModule>(*m_eventBus, recoveryCtx, *m_attendanceModule, config);

    m_moduleManager = std::make_unique<ModuleManager>(*m_eventBus);
    m_moduleManager->addModule(*m_attendanceModule);
    m_moduleManager->addModule(*m_shutdownModule);
    m_moduleManager->addModule(*m_recoveryModule);

    // Subscribed after the modules so a shutdown flow holds the quit before we see the request
    m_listenerId = m_eventBus->subscribe(this, EventFilter::only(EventType::ShutdownRequested)
                                                   .include(EventType::ConfigUpdated));

    // 10. Proxy
    LOG_INFO(APP_TAG, "[10/10] Initializing ProxyService...");
    m_proxyService = std::make_unique<ProxyService>(*m_eventBus, m_clock, *m_backendApi, *m_sessionService,
                                                    *m_networkService, config.proxy, m_backendApi->baseUrl());

    applyAutostart(config);

    LOG_INFO(APP_TAG, "Starting modules...");
    m_moduleManager->startAll();

    if (config.proxy.autoStartEnabled)
    {
        startProxy();
    }

    m_appState = AppState::Running;
    (void)m_eventBus->publish(Event{
        .type = EventType::AppStarted,
        .timestampMs = m_clock.nowMs(),
    });

    LOG_INFO(APP_TAG, "========================================");
    LOG_INFO(APP_TAG, "  Agent Initialization Complete");
    LOG_INFO(APP_TAG, "  Session: %s", m_sessionService->isAuthenticated() ? "authenticated" : "signed out");
    LOG_INFO(APP_TAG, "========================================");

    return Status::OK();
}

void App::run()
{
    if (m_appState != AppState::Running)
    {
        return;
    }

    std::unique_lock lock{m_quitMutex};
    m_quitCv.wait(lock, [this] { return m_quitRequested && m_holdCount == 0; });
    LOG_INFO(APP_TAG, "Quit requested and no holds left");
}

void App::requestQuit()
{
    {
        std::lock_guard lock{m_quitMutex};
        m_quitRequested = true;
    }
    m_quitCv.notify_all();
}

void App::shutdown()
{
    if (m_appState == AppState::Stopped || m_appState == AppState::Uninitialized)
    {
        return;
    }
    m_appState = AppState::Stopping;
    LOG_INFO(APP_TAG, "=== Stopping Agent ===");

    if (m_shutdownModule)
    {
        if (const auto status = m_shutdownModule->finalizeOnQuit(); status.failed())
        {
            LOG_WARNING(APP_TAG, "Final session save failed: %s", status.message.c_str());
        }
    }

    if (m_proxyService)
    {
        m_proxyService->stop();
    }
    if (m_eventBus && m_listenerId != 0)
    {
        m_eventBus->unsubscribe(m_listenerId);
        m_listenerId = 0;
    }
    if (m_moduleManager)
    {
        if (!m_moduleManager->drain(MODULE_DRAIN_TIMEOUT_MS))
        {
            LOG_WARNING(APP_TAG, "Stopping with work in flight: %s", m_moduleManager->summary().c_str());
        }
        m_moduleManager->stopAll();
    }
    if (m_networkService)
    {
        m_networkService->stop();
    }
    if (m_powerService)
    {
        m_powerService->stop();
    }
    if (m_sessionService)
    {
        m_sessionService->stop();
    }
    if (m_eventBus)
    {
        (void)m_eventBus->waitIdle(BUS_DRAIN_TIMEOUT_MS);
        m_eventBus->stop();
    }

    m_appState = AppState::Stopped;
    LOG_INFO(APP_TAG, "=== Agent Stopped ===");
    logging::detachFile();
}

// ==================== IQuitVeto ====================

void App::hold(const std::string &reason)
{
    std::lock_guard lock{m_quitMutex};
    ++m_holds[reason];
    ++m_holdCount;
    LOG_DEBUG(QUIT_HOLD_TAG, "Quit held by %s (%u active)", reason.c_str(), m_holdCount);
}

void App::release(const std::string &reason)
{
    {
        std::lock_guard lock{m_quitMutex};
        const auto it = m_holds.find(reason);
        if (it == m_holds.end())
        {
            LOG_WARNING(QUIT_HOLD_TAG, "Release of %s without a matching hold", reason.c_str());
            return;
        }
        if (--it->second == 0)
        {
            m_holds.erase(it);
        }
        --m_holdCount;
        LOG_DEBUG(QUIT_HOLD_TAG, "Quit released by %s (%u active)", reason.c_str(), m_holdCount);
    }
    m_quitCv.notify_all();
}

// ==================== Events ====================

void App::onEvent(const Event &event)
{
    switch (event.type)
    {
    case EventType::ShutdownRequested:
        LOG_INFO(APP_TAG, "Shutdown requested");
        requestQuit();
        break;

    case EventType::ConfigUpdated:
        if (const auto *cfgEvt = std::get_if<ConfigUpdatedEvent>(&event.payload); cfgEvt && cfgEvt->config)
        {
            const auto &config = *cfgEvt->config;
            applyLogConfig(config);
            applyAutostart(config);
            m_backendApi->updateConfig(config.api);
            m_sessionService->updateConfig(config.api);
            LOG_INFO(APP_TAG, "Configuration applied");
        }
        break;

    default:
        break;
    }
}

// ==================== Helpers ====================

void App::applyLogConfig(const AppConfig &config)
{
    const auto &levelName = m_options.logLevel ? *m_options.logLevel : config.log.level;
    if (const auto level = logging::parseLevel(levelName))
    {
        logging::setLevel(*level);
    }
    else
    {
        LOG_WARNING(APP_TAG, "Unknown log level '%s', keeping %s", levelName.c_str(), toString(logging::level()));
    }

    if (config.log.fileEnabled)
    {
        const auto path = m_dataDir + "/logs/vitco-agent.log";
        if (!logging::attachFile(path))
        {
            LOG_WARNING(APP_TAG, "Cannot open log file %s", path.c_str());
        }
    }
    else
    {
        logging::detachFile();
    }
}

void App::applyAutostart(const AppConfig &config)
{
    const auto status = platform::setAutostart(config.attendance.autoStartEnabled, platform::currentExecutablePath());
    if (status.failed())
    {
        LOG_WARNING(APP_TAG, "Autostart update failed: %s", status.message.c_str());
        return;
    }
    LOG_DEBUG(APP_TAG, "Autostart %s", config.attendance.autoStartEnabled ? "enabled" : "disabled");
}

void App::startProxy()
{
    const auto endpoint = m_proxyService->start();
    if (endpoint.failed())
    {
        LOG_WARNING(APP_TAG, "Proxy not started: %s (continuing)", endpoint.status.message.c_str());
        return;
    }
    LOG_INFO(APP_TAG, "Proxy available at http://%s:%u", endpoint.value.ipAddress.c_str(), unsigned{endpoint.value.port});
}
} // namespace vitco
