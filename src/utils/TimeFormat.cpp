#include "utils/TimeFormat.hpp"

#include <cstdio>
#include <ctime>

namespace vitco::utils {
    namespace {
        bool readDigits(std::string_view text, std::size_t pos, std::size_t count, int& out) {
            if (pos + count > text.size()) {
                return false;
            }
            int value{0};
            for (std::size_t i = 0; i < count; ++i) {
                const auto ch{text[pos + i]};
                if (ch < '0' || ch > '9') {
                    return false;
                }
                value = value * 10 + (ch - '0');
            }
            out = value;
            return true;
        }

        // Days since 1970-01-01 for a proleptic Gregorian date.
        std::int64_t daysFromCivil(int y, const unsigned m, const unsigned d) {
            y -= m <= 2 ? 1 : 0;
            const std::int64_t era{(y >= 0 ? y : y - 399) / 400};
            const auto yoe{static_cast<unsigned>(y - era * 400)};
            const unsigned doy{(153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1};
            const unsigned doe{yoe * 365 + yoe / 4 - yoe / 100 + doy};
            return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
        }
    }

    std::string toIso8601(const std::uint64_t epochMs) {
        const auto secs{static_cast<std::time_t>(epochMs / 1000)};
        const auto millis{static_cast<int>(epochMs % 1000)};

        std::tm utc{};
        gmtime_r(&secs, &utc);

        char buffer[32]{};
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                      utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                      utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
        return buffer;
    }

    std::optional<std::uint64_t> parseIso8601(std::string_view text) {
        int year{0};
        int month{0};
        int day{0};
        int hour{0};
        int minute{0};
        int second{0};

        if (!readDigits(text, 0, 4, year) || text.size() < 19 || text[4] != '-' || !readDigits(text, 5, 2, month)
            || text[7] != '-' || !readDigits(text, 8, 2, day) || (text[10] != 'T' && text[10] != ' ')
            || !readDigits(text, 11, 2, hour) || text[13] != ':' || !readDigits(text, 14, 2, minute)
            || text[16] != ':' || !readDigits(text, 17, 2, second)) {
            return std::nullopt;
        }

        if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
            return std::nullopt;
        }

        std::size_t pos{19};
        int millis{0};
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            int scale{100};
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                millis += (text[pos] - '0') * scale;
                scale /= 10;
                ++pos;
            }
        }

        std::int64_t offsetMinutes{0};
        if (pos < text.size()) {
            const auto designator{text[pos]};
            if (designator == 'Z') {
                ++pos;
            } else if (designator == '+' || designator == '-') {
                int offH{0};
                int offM{0};
                if (!readDigits(text, pos + 1, 2, offH) || pos + 3 >= text.size() || text[pos + 3] != ':'
                    || !readDigits(text, pos + 4, 2, offM)) {
                    return std::nullopt;
                }
                offsetMinutes = (designator == '+' ? 1 : -1) * (offH * 60 + offM);
                pos += 6;
            } else {
                return std::nullopt;
            }
        }

        if (pos != text.size()) {
            return std::nullopt;
        }

        const auto days{daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day))};
        const std::int64_t secs{days * 86400 + hour * 3600 + minute * 60 + second - offsetMinutes * 60};
        if (secs < 0) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(secs) * 1000 + static_cast<std::uint64_t>(millis);
    }

    std::string toLocalDisplay(const std::uint64_t epochMs) {
        const auto secs{static_cast<std::time_t>(epochMs / 1000)};

        std::tm local{};
        localtime_r(&secs, &local);

        char buffer[32]{};
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M", &local);
        return buffer;
    }

}
