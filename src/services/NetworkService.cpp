#include "services/NetworkService.hpp"

#include "core/Logger.hpp"
#include "platform/PlatformNetwork.hpp"

namespace vitco {
    namespace {
        constexpr auto* NETWORK_TAG{"Network"};
    }

    NetworkService::NetworkService(EventBus& bus, IClock& clock) : m_bus(bus), m_clock(clock) {
    }

    NetworkService::~NetworkService() {
        stop();
    }

    Status NetworkService::begin(const AttendanceConfig& cfg) {
        const auto initial{platform::detectNetwork(COMMAND_TIMEOUT_MS)};
        {
            std::lock_guard lock{m_mutex};
            m_settleMs = cfg.networkSettleMs;
            m_stable = initial;
            m_candidate.reset();
        }
        LOG_INFO(NETWORK_TAG, "Initial network: %s", describe(initial).c_str());

        m_pollTimer.startPeriodic(cfg.networkPollIntervalMs, [this] {
            observe(platform::detectNetwork(COMMAND_TIMEOUT_MS));
        });
        return Status::OK();
    }

    void NetworkService::stop() {
        m_pollTimer.cancel();
    }

    NetworkInfo NetworkService::currentNetwork() {
        const auto info{platform::detectNetwork(COMMAND_TIMEOUT_MS)};
        LOG_DEBUG(NETWORK_TAG, "Current network: %s", describe(info).c_str());
        return info;
    }

    std::optional<std::string> NetworkService::localIpv4Address() {
        return platform::firstNonLoopbackIpv4();
    }

    NetworkInfo NetworkService::lastKnown() const {
        std::lock_guard lock{m_mutex};
        return m_stable;
    }

    void NetworkService::observe(const NetworkInfo& reading) {
        const auto now{m_clock.nowMs()};
        NetworkInfo previous{};
        {
            std::lock_guard lock{m_mutex};
            if (reading == m_stable) {
                m_candidate.reset();
                return;
            }

            if (!m_candidate || *m_candidate != reading) {
                LOG_DEBUG(NETWORK_TAG, "Network changing to %s, settling", describe(reading).c_str());
                m_candidate = reading;
                m_candidateSinceMs = now;
                if (m_settleMs > 0) {
                    return;
                }
            }

            if (now - m_candidateSinceMs < m_settleMs) {
                return;
            }

            previous = m_stable;
            m_stable = reading;
            m_candidate.reset();
        }

        LOG_INFO(NETWORK_TAG, "Network changed: %s -> %s", describe(previous).c_str(), describe(reading).c_str());
        const Event evt{
            .type = EventType::NetworkChanged,
            .payload = NetworkChangedEvent{
                .previous = previous,
                .current = reading,
            },
            .timestampMs = now,
        };
        (void)m_bus.publish(evt);
    }

}
