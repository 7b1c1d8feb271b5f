#pragma once

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "currency.h"
#include "errors.h"
#include "json_value.h"
#include "local_date.h"

// =============================================================================
// Typed scalar coercion.
//
// Two directions:
//
//   raw input text  -> stored json_value   parse_long / LocalDate::parse /
//                                          Currency::parse (throw
//                                          input_format_error)
//   stored node     -> domain type         coerce_* (never throw; report
//                                          found / absent / mismatch)
//
// A coerce_* function takes the node found at a path, or nullptr when the
// path does not exist.  A stored JSON null counts as absent.
// =============================================================================

namespace civdoc {

enum class lookup_status : unsigned char {
    found,
    absent,
    mismatch   // a value is stored but it is not of the requested kind
};

template<typename T>
struct coerced {
    lookup_status status = lookup_status::absent;
    T             value{};

    bool found()    const noexcept { return status == lookup_status::found; }
    bool mismatch() const noexcept { return status == lookup_status::mismatch; }

    std::optional<T> to_optional() const {
        if (!found()) return std::nullopt;
        return value;
    }

    static coerced absent()    { return coerced{lookup_status::absent, T{}}; }
    static coerced mismatched() { return coerced{lookup_status::mismatch, T{}}; }
    static coerced of(T v)     { return coerced{lookup_status::found, std::move(v)}; }
};

// ---- raw text -> value ----

/**
 * Decimal integer with an optional leading '+' or '-'.  Throws
 * input_format_error on anything else, including out-of-range values.
 */
inline std::int64_t parse_long(std::string_view text) {
    std::string_view digits = text;
    if (digits.size() > 1 && digits.front() == '+' && digits[1] != '-') {
        digits.remove_prefix(1);
    }
    std::int64_t value = 0;
    const char* end = digits.data() + digits.size();
    auto result = std::from_chars(digits.data(), end, value);
    if (digits.empty() || result.ec == std::errc::invalid_argument || result.ptr != end) {
        throw input_format_error("For input string: \"" + std::string(text) + "\"");
    }
    if (result.ec == std::errc::result_out_of_range) {
        throw input_format_error("Value out of range for long: \"" + std::string(text) + "\"");
    }
    return value;
}

/**
 * Well-formed UTF-8: no overlong forms, no surrogates, nothing above
 * U+10FFFF.  Stored text must pass this, since the persisted document is
 * JSON.
 */
inline bool is_valid_utf8(std::string_view text) noexcept {
    std::size_t i = 0;
    while (i < text.size()) {
        auto byte = [&text](std::size_t k) { return static_cast<unsigned char>(text[k]); };
        unsigned char c = byte(i);
        if (c < 0x80) {
            ++i;
            continue;
        }
        std::size_t len;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        } else {
            return false;
        }
        if (i + len > text.size()) return false;
        // Only the second byte has a narrowed range.
        if (byte(i + 1) < lo || byte(i + 1) > hi) return false;
        for (std::size_t k = i + 2; k < i + len; ++k) {
            if (byte(k) < 0x80 || byte(k) > 0xBF) return false;
        }
        i += len;
    }
    return true;
}

// ---- stored node -> domain type ----

inline coerced<std::string> coerce_string(const json_value* node) {
    if (node == nullptr || node->is_null()) return coerced<std::string>::absent();
    if (!node->is_string()) return coerced<std::string>::mismatched();
    return coerced<std::string>::of(node->get_string());
}

inline coerced<std::int64_t> coerce_long(const json_value* node) {
    if (node == nullptr || node->is_null()) return coerced<std::int64_t>::absent();
    if (!node->is_int()) return coerced<std::int64_t>::mismatched();
    return coerced<std::int64_t>::of(node->get_int());
}

inline coerced<LocalDate> coerce_date(const json_value* node) {
    coerced<std::int64_t> millis = coerce_long(node);
    if (!millis.found()) return coerced<LocalDate>{millis.status, LocalDate{}};
    return coerced<LocalDate>::of(LocalDate::from_epoch_millis(millis.value));
}

inline coerced<Currency> coerce_currency(const json_value* node) {
    coerced<std::int64_t> cents = coerce_long(node);
    if (!cents.found()) return coerced<Currency>{cents.status, Currency(0)};
    return coerced<Currency>::of(Currency(cents.value));
}

/** Homogeneous array of integers; any other element kind is a mismatch. */
inline coerced<std::vector<std::int64_t>> coerce_long_list(const json_value* node) {
    using result = coerced<std::vector<std::int64_t>>;
    if (node == nullptr || node->is_null()) return result::absent();
    if (!node->is_array()) return result::mismatched();
    std::vector<std::int64_t> out;
    out.reserve(node->size());
    for (const auto& elem : node->elements()) {
        if (!elem.is_int()) return result::mismatched();
        out.push_back(elem.get_int());
    }
    return result::of(std::move(out));
}

/** "[1, 2, 3]"; "[]" for an empty list. */
inline std::string format_long_list(const std::vector<std::int64_t>& values) {
    std::string out = "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i != 0) out += ", ";
        out += std::to_string(values[i]);
    }
    out += ']';
    return out;
}

} // namespace civdoc
