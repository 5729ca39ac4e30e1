#ifndef VITCO_UTILS_TIMEFORMAT_HPP
#define VITCO_UTILS_TIMEFORMAT_HPP

/**
 * @file TimeFormat.hpp
 * @brief ISO-8601 conversions for persisted and transmitted timestamps.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vitco::utils {

    /**
     * @brief Epoch milliseconds to `YYYY-MM-DDTHH:MM:SS.mmmZ` (UTC).
     */
    [[nodiscard]] std::string toIso8601(std::uint64_t epochMs);

    /**
     * @brief Parse `YYYY-MM-DDTHH:MM:SS[.fff](Z|+HH:MM|-HH:MM)`.
     * @return Epoch milliseconds, or nullopt on malformed input
     */
    [[nodiscard]] std::optional<std::uint64_t> parseIso8601(std::string_view text);

    /**
     * @brief Local wall-clock rendering used in dialogs, e.g. `2026-10-19 18:05`.
     */
    [[nodiscard]] std::string toLocalDisplay(std::uint64_t epochMs);

}

#endif  // VITCO_UTILS_TIMEFORMAT_HPP
