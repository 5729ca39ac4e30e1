#ifndef VITCO_CORE_CLOCK_HPP
#define VITCO_CORE_CLOCK_HPP

/**
 * @file Clock.hpp
 * @brief Wall clock and blocking delay source.
 *
 * Every timestamp the agent persists or compares comes from an `IClock`,
 * so tests can pin "now" and observe the delays a component asks for.
 */

#include <cstdint>

namespace vitco {

    class IClock {
    public:
        virtual ~IClock() = default;

        /**
         * @brief Milliseconds since the Unix epoch.
         */
        [[nodiscard]] virtual std::uint64_t nowMs() const = 0;

        /**
         * @brief Block the calling thread for the given duration.
         */
        virtual void sleepFor(std::uint32_t ms) = 0;
    };

    class SystemClock final : public IClock {
    public:
        [[nodiscard]] std::uint64_t nowMs() const override;
        void sleepFor(std::uint32_t ms) override;
    };

}

#endif  // VITCO_CORE_CLOCK_HPP
