#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

#include "errors.h"

// =============================================================================
// civdoc::LocalDate
//
// Calendar date without time zone.  Applicant documents store dates as epoch
// milliseconds of UTC midnight; LocalDate converts in both directions and
// parses the strict "yyyy-MM-dd" form accepted from date questions.
//
// Day-count conversions use the proleptic Gregorian civil-day algorithms
// (days_from_civil / civil_from_days).
// =============================================================================

namespace civdoc {

struct LocalDate {
    int      year  = 1970;
    unsigned month = 1;   // 1..12
    unsigned day   = 1;   // 1..days_in_month

    static constexpr std::int64_t millis_per_day = 86400000LL;

    static constexpr bool is_leap(int y) noexcept {
        return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    }

    static constexpr unsigned days_in_month(int y, unsigned m) noexcept {
        constexpr unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        return (m == 2 && is_leap(y)) ? 29u : days[m - 1];
    }

    /**
     * Parse exactly "yyyy-MM-dd".  Throws input_format_error on any other
     * shape, on month outside 1..12, on a day the month does not have, and
     * on year 0000.
     */
    static LocalDate parse(std::string_view text) {
        auto fail = [&text](const char* why) {
            return input_format_error("Text '" + std::string(text) +
                                      "' could not be parsed as yyyy-MM-dd: " + why);
        };
        if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
            throw fail("unexpected layout");
        }
        auto digits = [&](std::size_t pos, std::size_t n) {
            int v = 0;
            for (std::size_t i = pos; i < pos + n; ++i) {
                char c = text[i];
                if (c < '0' || c > '9') throw fail("non-digit character");
                v = v * 10 + (c - '0');
            }
            return v;
        };
        LocalDate d;
        d.year  = digits(0, 4);
        d.month = static_cast<unsigned>(digits(5, 2));
        d.day   = static_cast<unsigned>(digits(8, 2));
        if (d.year == 0) throw fail("year out of range");
        if (d.month < 1 || d.month > 12) throw fail("month out of range");
        if (d.day < 1 || d.day > days_in_month(d.year, d.month)) throw fail("day out of range");
        return d;
    }

    static LocalDate from_epoch_millis(std::int64_t millis) {
        std::int64_t days = millis / millis_per_day;
        if (millis % millis_per_day < 0) --days;  // floor toward negative infinity
        return from_epoch_days(days);
    }

    static LocalDate from_epoch_days(std::int64_t z) {
        z += 719468;
        const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(z - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp  = (5 * doy + 2) / 153;
        LocalDate d;
        d.day   = doy - (153 * mp + 2) / 5 + 1;
        d.month = mp < 10 ? mp + 3 : mp - 9;
        d.year  = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 + (d.month <= 2 ? 1 : 0));
        return d;
    }

    std::int64_t to_epoch_days() const noexcept {
        std::int64_t y = year - (month <= 2 ? 1 : 0);
        const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
    }

    /** Milliseconds since the epoch at the start of this day, UTC. */
    std::int64_t to_epoch_millis() const noexcept {
        return to_epoch_days() * millis_per_day;
    }

    std::string to_string() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
        return buf;
    }

    bool operator==(const LocalDate& o) const noexcept {
        return year == o.year && month == o.month && day == o.day;
    }
    bool operator!=(const LocalDate& o) const noexcept { return !(*this == o); }
    bool operator<(const LocalDate& o) const noexcept {
        return to_epoch_days() < o.to_epoch_days();
    }
};

} // namespace civdoc
