#ifndef VITCO_SERVICES_FINGERPRINTSERVICE_HPP
#define VITCO_SERVICES_FINGERPRINTSERVICE_HPP

/**
 * @file FingerprintService.hpp
 * @brief Stable machine identifier sent with attendance submissions.
 *
 * The fingerprint is `fp_` plus the first 16 hex digits of the SHA-256 of
 * the host facts joined with `|`. It is computed once and cached in
 * `<dataDir>/system_fingerprint.txt` so hardware churn (a new USB network
 * adapter) does not change it later.
 */

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/IFingerprintProvider.hpp"
#include "core/Result.hpp"

namespace vitco {

    class FingerprintService : public IFingerprintProvider {
    public:
        explicit FingerprintService(std::string dataDir);
        FingerprintService(const FingerprintService&) = delete;
        FingerprintService& operator=(const FingerprintService&) = delete;
        ~FingerprintService() override = default;

        [[nodiscard]] Result<std::string> getFingerprint() override;

        /**
         * @brief Hash already collected components into an `fp_` identifier.
         */
        [[nodiscard]] static Result<std::string> fromComponents(const std::vector<std::string>& components);

        /**
         * @brief Host facts in hashing order.
         */
        [[nodiscard]] std::vector<std::string> collectComponents() const;

        [[nodiscard]] const std::string& path() const noexcept {
            return m_path;
        }

        static constexpr const char* PREFIX = "fp_";
        static constexpr std::size_t HEX_DIGITS = 16;

    private:
        std::string m_dataDir;
        std::string m_path;
        std::optional<std::string> m_cached{};
        std::mutex m_mutex{};
    };

}

#endif  // VITCO_SERVICES_FINGERPRINTSERVICE_HPP
