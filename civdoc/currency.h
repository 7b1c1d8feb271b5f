#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include "errors.h"

// =============================================================================
// civdoc::Currency
//
// A dollar amount held as integer cents.  parse() accepts the text entered
// in currency questions:
//
//     1234      1234.50      1,234      1,234.50      0.99
//
// i.e. plain digits or 1-3 digits followed by ",ddd" groups, then an optional
// decimal point with exactly two digits.
//
// parse() never yields a negative amount, but stored cents can be negative
// (hydrated or merged documents); those render with a leading '-'.
// =============================================================================

namespace civdoc {

class Currency {
public:
    Currency() noexcept : cents_(0) {}
    explicit Currency(std::int64_t cents) noexcept : cents_(cents) {}

    /** Throws input_format_error when dollars is not a currency amount. */
    static Currency parse(std::string_view dollars) {
        auto fail = [&dollars](const char* why) {
            return input_format_error("Currency '" + std::string(dollars) + "' is invalid: " + why);
        };

        std::string_view whole = dollars;
        std::string_view fraction;
        std::size_t point = dollars.find('.');
        if (point != std::string_view::npos) {
            whole    = dollars.substr(0, point);
            fraction = dollars.substr(point + 1);
            if (fraction.size() != 2) throw fail("exactly two digits must follow the decimal point");
        }
        if (whole.empty()) throw fail("missing whole dollars");

        std::size_t first = whole.find(',');
        if (first != std::string_view::npos) {
            // 1-3 leading digits, then groups of exactly three.
            if (first == 0 || first > 3 || (whole.size() - first) % 4 != 0) {
                throw fail("misplaced thousands separator");
            }
            for (std::size_t i = first; i < whole.size(); ++i) {
                bool separator_slot = (i - first) % 4 == 0;
                if (separator_slot != (whole[i] == ',')) throw fail("misplaced thousands separator");
            }
        }

        constexpr std::int64_t max = std::numeric_limits<std::int64_t>::max();
        std::int64_t dollars_value = 0;
        for (char c : whole) {
            if (c == ',') continue;
            if (c < '0' || c > '9') throw fail("non-digit character");
            int digit = c - '0';
            if (dollars_value > (max - digit) / 10) throw fail("amount too large");
            dollars_value = dollars_value * 10 + digit;
        }

        std::int64_t cents_value = 0;
        for (char c : fraction) {
            if (c < '0' || c > '9') throw fail("non-digit character");
            cents_value = cents_value * 10 + (c - '0');
        }

        if (dollars_value > (max - cents_value) / 100) throw fail("amount too large");
        return Currency(dollars_value * 100 + cents_value);
    }

    std::int64_t cents() const noexcept { return cents_; }

    /** "1234.50"; negative amounts render as "-1.50". */
    std::string dollars_string() const {
        std::uint64_t whole = magnitude() / 100;
        std::string out = sign() + std::to_string(whole);
        append_cents(out);
        return out;
    }

    /** "$1,234.50"; negative amounts render as "-$1.50". */
    std::string pretty_print() const {
        std::string digits = std::to_string(magnitude() / 100);
        std::string out = std::string(sign()) + "$";
        std::size_t lead = digits.size() % 3;
        for (std::size_t i = 0; i < digits.size(); ++i) {
            if (i != 0 && i >= lead && (i - lead) % 3 == 0) out += ',';
            out += digits[i];
        }
        append_cents(out);
        return out;
    }

    bool operator==(const Currency& o) const noexcept { return cents_ == o.cents_; }
    bool operator!=(const Currency& o) const noexcept { return cents_ != o.cents_; }

private:
    std::int64_t cents_;

    // Absolute value without overflowing on INT64_MIN.
    std::uint64_t magnitude() const noexcept {
        return cents_ < 0 ? 0 - static_cast<std::uint64_t>(cents_)
                          : static_cast<std::uint64_t>(cents_);
    }

    const char* sign() const noexcept { return cents_ < 0 ? "-" : ""; }

    void append_cents(std::string& out) const {
        std::uint64_t rem = magnitude() % 100;
        out += '.';
        if (rem < 10) out += '0';
        out += std::to_string(rem);
    }
};

} // namespace civdoc
