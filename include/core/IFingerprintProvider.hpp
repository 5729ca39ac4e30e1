#ifndef VITCO_CORE_IFINGERPRINTPROVIDER_HPP
#define VITCO_CORE_IFINGERPRINTPROVIDER_HPP

#include <string>

#include "core/Result.hpp"

namespace vitco {

    class IFingerprintProvider {
    public:
        virtual ~IFingerprintProvider() = default;

        /**
         * @brief Stable `fp_<16 hex>` identifier of this machine.
         */
        [[nodiscard]] virtual Result<std::string> getFingerprint() = 0;
    };

}

#endif  // VITCO_CORE_IFINGERPRINTPROVIDER_HPP
