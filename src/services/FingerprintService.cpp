#include "services/FingerprintService.hpp"

#include "core/Logger.hpp"
#include "platform/PlatformNetwork.hpp"
#include "platform/PlatformSystem.hpp"
#include "utils/FileUtils.hpp"

#include <mbedtls/sha256.h>
#include <mbedtls/version.h>

#include <array>
#include <cstdio>

namespace vitco {
    namespace {
        constexpr auto* FINGERPRINT_TAG{"Fingerprint"};
        constexpr auto* FINGERPRINT_FILE_NAME{"system_fingerprint.txt"};
        constexpr std::size_t SHA256_DIGEST_SIZE{32};

        std::string trim(const std::string& s) {
            const auto first{s.find_first_not_of(" \t\r\n")};
            if (first == std::string::npos) {
                return {};
            }
            const auto last{s.find_last_not_of(" \t\r\n")};
            return s.substr(first, last - first + 1);
        }

        int sha256(const std::string& input, std::array<unsigned char, SHA256_DIGEST_SIZE>& digest) {
            mbedtls_sha256_context ctx;
            mbedtls_sha256_init(&ctx);
#if MBEDTLS_VERSION_MAJOR >= 3
            int rc{mbedtls_sha256_starts(&ctx, 0)};
            if (rc == 0) {
                rc = mbedtls_sha256_update(&ctx, reinterpret_cast<const unsigned char*>(input.data()), input.size());
            }
            if (rc == 0) {
                rc = mbedtls_sha256_finish(&ctx, digest.data());
            }
#else
            int rc{mbedtls_sha256_starts_ret(&ctx, 0)};
            if (rc == 0) {
                rc = mbedtls_sha256_update_ret(&ctx, reinterpret_cast<const unsigned char*>(input.data()), input.size());
            }
            if (rc == 0) {
                rc = mbedtls_sha256_finish_ret(&ctx, digest.data());
            }
#endif
            mbedtls_sha256_free(&ctx);
            return rc;
        }
    }

    FingerprintService::FingerprintService(std::string dataDir) : m_dataDir(std::move(dataDir)) {
        m_path = m_dataDir + "/" + FINGERPRINT_FILE_NAME;
    }

    Result<std::string> FingerprintService::getFingerprint() {
        std::lock_guard lock{m_mutex};
        if (m_cached) {
            return Result<std::string>::Ok(*m_cached);
        }

        if (const auto file{utils::readTextFile(m_path)}; file.ok()) {
            const auto stored{trim(file.value)};
            if (stored.rfind(PREFIX, 0) == 0) {
                m_cached = stored;
                LOG_DEBUG(FINGERPRINT_TAG, "Using stored fingerprint %s", stored.c_str());
                return Result<std::string>::Ok(stored);
            }
            LOG_WARNING(FINGERPRINT_TAG, "Ignoring malformed fingerprint in %s", m_path.c_str());
        } else if (file.status.code != ErrorCode::NotFound) {
            LOG_WARNING(FINGERPRINT_TAG, "Cannot read %s: %s", m_path.c_str(), file.status.message.c_str());
        }

        auto generated{fromComponents(collectComponents())};
        if (generated.failed()) {
            LOG_ERROR(FINGERPRINT_TAG, "Fingerprint generation failed: %s", generated.status.message.c_str());
            return generated;
        }

        if (auto status{utils::writeTextFileAtomic(m_path, generated.value)}; status.failed()) {
            LOG_WARNING(FINGERPRINT_TAG, "Fingerprint not cached on disk: %s", status.message.c_str());
        }
        m_cached = generated.value;
        LOG_INFO(FINGERPRINT_TAG, "Generated fingerprint %s", generated.value.c_str());
        return generated;
    }

    std::vector<std::string> FingerprintService::collectComponents() const {
        const auto host{platform::collectHostInfo()};

        std::string macs{};
        for (const auto& mac : platform::hardwareAddresses()) {
            if (!macs.empty()) {
                macs += ',';
            }
            macs += mac;
        }

        return {
            host.hostname,
            host.platform,
            host.arch,
            host.cpuModel,
            std::to_string(host.cpuCores),
            std::to_string(host.totalMemoryBytes),
            macs,
            host.userName,
            m_dataDir,
        };
    }

    Result<std::string> FingerprintService::fromComponents(const std::vector<std::string>& components) {
        std::string joined{};
        for (std::size_t i = 0; i < components.size(); ++i) {
            if (i > 0) {
                joined += '|';
            }
            joined += components[i];
        }

        std::array<unsigned char, SHA256_DIGEST_SIZE> digest{};
        if (const int rc{sha256(joined, digest)}; rc != 0) {
            return Result<std::string>::Error(ErrorCode::OperationFailed, "SHA-256 failed: " + std::to_string(rc));
        }

        std::string out{PREFIX};
        char hex[3]{};
        for (std::size_t i = 0; i < HEX_DIGITS / 2; ++i) {
            std::snprintf(hex, sizeof(hex), "%02x", digest[i]);
            out += hex;
        }
        return Result<std::string>::Ok(std::move(out));
    }

}
