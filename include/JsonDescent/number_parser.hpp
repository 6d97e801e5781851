#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include "errors.hpp"
#include "fp_parse.hpp"
#include "source_concept.hpp"

namespace JsonDescent {

__extension__ typedef __int128 int128_t;
__extension__ typedef unsigned __int128 uint128_t;

/// A number as classified by the parser: exact integers stay integers,
/// everything with a fraction, an exponent or too many digits is a double.
struct ParsedNumber {
    enum class Kind {
        unsigned_integer,
        signed_integer,
        floating
    };

    Kind kind = Kind::unsigned_integer;
    std::uint64_t u = 0;
    std::int64_t i = 0;
    double f = 0;

    static constexpr ParsedNumber from_u64(std::uint64_t v) {
        ParsedNumber n;
        n.kind = Kind::unsigned_integer;
        n.u = v;
        return n;
    }
    static constexpr ParsedNumber from_i64(std::int64_t v) {
        ParsedNumber n;
        n.kind = Kind::signed_integer;
        n.i = v;
        return n;
    }
    static constexpr ParsedNumber from_f64(double v) {
        ParsedNumber n;
        n.kind = Kind::floating;
        n.f = v;
        return n;
    }

    constexpr Unexpected unexpected() const {
        switch (kind) {
        case Kind::unsigned_integer: return Unexpected::unsigned_integer(u);
        case Kind::signed_integer:   return Unexpected::signed_integer(i);
        case Kind::floating:         return Unexpected::floating(f);
        }
        return Unexpected{};
    }
};

/// Scans the remainder of a number token. The caller has already consumed
/// a leading '-' if there was one; the first digit is still pending.
/// Shares the engine's source, scratch buffer and error slot.
template <source::SourceLike Source>
class NumberParser {
public:
    constexpr NumberParser(Source& source, std::string& scratch, Error& error)
        : m_source(source), m_scratch(scratch), m_error(error) {}

    constexpr bool parse_integer(bool positive, ParsedNumber& out) {
        std::optional<std::uint8_t> first;
        if (!m_source.next(first, m_error)) {
            return false;
        }
        if (!first) {
            return fail(ErrorCode::EOF_WHILE_PARSING_VALUE);
        }
        if (*first == '0') {
            // only one leading zero
            std::uint8_t c = 0;
            if (!peek_or_null(c)) {
                return false;
            }
            if (is_digit(c)) {
                return fail_peek(ErrorCode::INVALID_NUMBER);
            }
            return parse_number(positive, 0, out);
        }
        if (!is_digit(*first)) {
            return fail(ErrorCode::INVALID_NUMBER);
        }

        std::uint64_t significand = *first - '0';
        for (;;) {
            std::uint8_t c = 0;
            if (!peek_or_null(c)) {
                return false;
            }
            if (!is_digit(c)) {
                return parse_number(positive, significand, out);
            }
            const std::uint64_t digit = c - '0';
            if (overflows_u64(significand, digit)) {
                double f = 0;
                if (!parse_long_integer(positive, significand, f)) {
                    return false;
                }
                out = ParsedNumber::from_f64(f);
                return true;
            }
            m_source.discard();
            significand = significand * 10 + digit;
        }
    }

    // Validates a number token without classifying it.
    constexpr bool ignore_integer() {
        std::uint8_t c = 0;
        if (!next_or_null(c)) {
            return false;
        }
        if (c == '0') {
            if (!peek_or_null(c)) {
                return false;
            }
            if (is_digit(c)) {
                return fail_peek(ErrorCode::INVALID_NUMBER);
            }
        } else if (c >= '1' && c <= '9') {
            if (!skip_digits()) {
                return false;
            }
        } else {
            return fail(ErrorCode::INVALID_NUMBER);
        }

        if (!peek_or_null(c)) {
            return false;
        }
        if (c == '.') {
            return ignore_decimal();
        }
        if (c == 'e' || c == 'E') {
            return ignore_exponent();
        }
        return true;
    }

    /// Integer-only scan for 128-bit targets. `overflow` is set when the
    /// magnitude does not fit in 128 bits; the digits are still consumed.
    constexpr bool scan_integer128(uint128_t& magnitude, bool& overflow) {
        overflow = false;
        std::uint8_t c = 0;
        if (!next_or_null(c)) {
            return false;
        }
        if (c == '0') {
            magnitude = 0;
            if (!peek_or_null(c)) {
                return false;
            }
            if (is_digit(c)) {
                return fail_peek(ErrorCode::INVALID_NUMBER);
            }
            return true;
        }
        if (c < '1' || c > '9') {
            return fail(ErrorCode::INVALID_NUMBER);
        }
        constexpr uint128_t max = ~uint128_t{0};
        magnitude = c - '0';
        for (;;) {
            if (!peek_or_null(c)) {
                return false;
            }
            if (!is_digit(c)) {
                return true;
            }
            m_source.discard();
            const unsigned digit = c - '0';
            if (!overflow) {
                if (magnitude > (max - digit) / 10) {
                    overflow = true;
                } else {
                    magnitude = magnitude * 10 + digit;
                }
            }
        }
    }

private:
    Source& m_source;
    std::string& m_scratch;
    Error& m_error;

    static constexpr bool is_digit(std::uint8_t c) {
        return c >= '0' && c <= '9';
    }

    static constexpr bool overflows_u64(std::uint64_t acc, std::uint64_t digit) {
        constexpr std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
        return acc >= max / 10 && (acc > max / 10 || digit > max % 10);
    }

    static constexpr bool overflows_i32(std::int32_t acc, std::int32_t digit) {
        constexpr std::int32_t max = std::numeric_limits<std::int32_t>::max();
        return acc >= max / 10 && (acc > max / 10 || digit > max % 10);
    }

    static constexpr std::int32_t saturating_add(std::int32_t a, std::int32_t b) {
        const std::int64_t r = static_cast<std::int64_t>(a) + b;
        if (r > std::numeric_limits<std::int32_t>::max()) return std::numeric_limits<std::int32_t>::max();
        if (r < std::numeric_limits<std::int32_t>::min()) return std::numeric_limits<std::int32_t>::min();
        return static_cast<std::int32_t>(r);
    }

    constexpr bool fail(ErrorCode code) {
        m_error = m_source.error_at_position(code);
        return false;
    }

    constexpr bool fail_peek(ErrorCode code) {
        const Position p = m_source.peek_position();
        m_error = Error::syntax(code, p.line, p.column);
        return false;
    }

    constexpr bool peek_or_null(std::uint8_t& c) {
        std::optional<std::uint8_t> b;
        if (!m_source.peek(b, m_error)) {
            return false;
        }
        c = b.value_or(0);
        return true;
    }

    constexpr bool next_or_null(std::uint8_t& c) {
        std::optional<std::uint8_t> b;
        if (!m_source.next(b, m_error)) {
            return false;
        }
        c = b.value_or(0);
        return true;
    }

    constexpr bool skip_digits() {
        for (;;) {
            std::uint8_t c = 0;
            if (!peek_or_null(c)) {
                return false;
            }
            if (!is_digit(c)) {
                return true;
            }
            m_source.discard();
        }
    }

    constexpr bool parse_number(bool positive, std::uint64_t significand, ParsedNumber& out) {
        std::uint8_t c = 0;
        if (!peek_or_null(c)) {
            return false;
        }
        double f = 0;
        switch (c) {
        case '.':
            if (!parse_decimal(positive, significand, f)) {
                return false;
            }
            out = ParsedNumber::from_f64(f);
            return true;
        case 'e':
        case 'E':
            if (!parse_exponent(positive, significand, 0, f)) {
                return false;
            }
            out = ParsedNumber::from_f64(f);
            return true;
        default:
            break;
        }
        if (positive) {
            out = ParsedNumber::from_u64(significand);
            return true;
        }
        // -0 and magnitudes past i64 keep their sign only as a double
        const std::int64_t neg = static_cast<std::int64_t>(std::uint64_t{0} - significand);
        if (neg >= 0) {
            out = ParsedNumber::from_f64(-static_cast<double>(significand));
        } else {
            out = ParsedNumber::from_i64(neg);
        }
        return true;
    }

    constexpr bool missing_fraction_digit() {
        std::optional<std::uint8_t> b;
        if (!m_source.peek(b, m_error)) {
            return false;
        }
        return fail_peek(b ? ErrorCode::INVALID_NUMBER : ErrorCode::EOF_WHILE_PARSING_VALUE);
    }

    constexpr bool parse_decimal(bool positive, std::uint64_t significand, double& out) {
        m_source.discard();  // '.'

        std::int32_t exponent = 0;
        bool at_least_one_digit = false;
        for (;;) {
            std::uint8_t c = 0;
            if (!peek_or_null(c)) {
                return false;
            }
            if (!is_digit(c)) {
                break;
            }
            const std::uint64_t digit = c - '0';
            if (overflows_u64(significand, digit)) {
                return parse_decimal_overflow(positive, significand, exponent, out);
            }
            m_source.discard();
            significand = significand * 10 + digit;
            if (exponent > std::numeric_limits<std::int32_t>::min()) {
                --exponent;
            }
            at_least_one_digit = true;
        }

        if (!at_least_one_digit) {
            return missing_fraction_digit();
        }

        std::uint8_t c = 0;
        if (!peek_or_null(c)) {
            return false;
        }
        if (c == 'e' || c == 'E') {
            return parse_exponent(positive, significand, exponent, out);
        }
        return from_parts(positive, significand, exponent, out);
    }

    // Reads "e[+-]digits" into `exp`; `overflowed` reports an exponent past i32.
    constexpr bool scan_exponent(bool& positive_exp, std::int32_t& exp, bool& overflowed) {
        m_source.discard();  // 'e' or 'E'

        positive_exp = true;
        std::uint8_t c = 0;
        if (!peek_or_null(c)) {
            return false;
        }
        if (c == '+') {
            m_source.discard();
        } else if (c == '-') {
            m_source.discard();
            positive_exp = false;
        }

        std::optional<std::uint8_t> first;
        if (!m_source.next(first, m_error)) {
            return false;
        }
        if (!first) {
            return fail(ErrorCode::EOF_WHILE_PARSING_VALUE);
        }
        if (!is_digit(*first)) {
            return fail(ErrorCode::INVALID_NUMBER);
        }

        overflowed = false;
        exp = *first - '0';
        for (;;) {
            if (!peek_or_null(c)) {
                return false;
            }
            if (!is_digit(c)) {
                return true;
            }
            m_source.discard();
            const std::int32_t digit = c - '0';
            if (overflows_i32(exp, digit)) {
                overflowed = true;
                return true;
            }
            exp = exp * 10 + digit;
        }
    }

    constexpr bool parse_exponent(bool positive, std::uint64_t significand, std::int32_t starting_exp, double& out) {
        bool positive_exp = true;
        bool overflowed = false;
        std::int32_t exp = 0;
        if (!scan_exponent(positive_exp, exp, overflowed)) {
            return false;
        }
        if (overflowed) {
            return parse_exponent_overflow(positive, significand == 0, positive_exp, out);
        }
        const std::int32_t final_exp = positive_exp ? saturating_add(starting_exp, exp)
                                                    : saturating_add(starting_exp, -exp);
        return from_parts(positive, significand, final_exp, out);
    }

    constexpr bool parse_exponent_overflow(bool positive, bool zero_significand, bool positive_exp, double& out) {
        // never produce an infinity
        if (!zero_significand && positive_exp) {
            return fail(ErrorCode::NUMBER_OUT_OF_RANGE);
        }
        if (!skip_digits()) {
            return false;
        }
        out = positive ? 0.0 : -0.0;
        return true;
    }

    constexpr bool from_parts(bool positive, std::uint64_t significand, std::int32_t exponent, double& out) {
        if (!fp_parse_detail::f64_from_parts(positive, significand, exponent, out)) {
            return fail(ErrorCode::NUMBER_OUT_OF_RANGE);
        }
        return true;
    }

    // ---- slow path: digits collected as text in the scratch buffer ----

    constexpr bool parse_long_integer(bool positive, std::uint64_t significand, double& out) {
        m_scratch.clear();
        fp_parse_detail::append_decimal(m_scratch, significand);
        for (;;) {
            std::uint8_t c = 0;
            if (!peek_or_null(c)) {
                return false;
            }
            if (is_digit(c)) {
                m_scratch.push_back(static_cast<char>(c));
                m_source.discard();
                continue;
            }
            if (c == '.') {
                m_source.discard();
                return parse_long_decimal(positive, m_scratch.size(), out);
            }
            if (c == 'e' || c == 'E') {
                return parse_long_exponent(positive, m_scratch.size(), out);
            }
            return long_from_parts(positive, m_scratch.size(), 0, out);
        }
    }

    constexpr bool parse_decimal_overflow(bool positive, std::uint64_t significand, std::int32_t exponent, double& out) {
        const std::size_t fraction_digits = static_cast<std::size_t>(-static_cast<std::int64_t>(exponent));
        m_scratch.clear();
        fp_parse_detail::append_decimal(m_scratch, significand);
        if (m_scratch.size() < fraction_digits + 1) {
            m_scratch.insert(std::size_t{0}, fraction_digits + 1 - m_scratch.size(), '0');
        }
        return parse_long_decimal(positive, m_scratch.size() - fraction_digits, out);
    }

    constexpr bool parse_long_decimal(bool positive, std::size_t integer_end, double& out) {
        bool at_least_one_digit = integer_end < m_scratch.size();
        for (;;) {
            std::uint8_t c = 0;
            if (!peek_or_null(c)) {
                return false;
            }
            if (!is_digit(c)) {
                break;
            }
            m_scratch.push_back(static_cast<char>(c));
            m_source.discard();
            at_least_one_digit = true;
        }

        if (!at_least_one_digit) {
            return missing_fraction_digit();
        }

        std::uint8_t c = 0;
        if (!peek_or_null(c)) {
            return false;
        }
        if (c == 'e' || c == 'E') {
            return parse_long_exponent(positive, integer_end, out);
        }
        return long_from_parts(positive, integer_end, 0, out);
    }

    constexpr bool parse_long_exponent(bool positive, std::size_t integer_end, double& out) {
        bool positive_exp = true;
        bool overflowed = false;
        std::int32_t exp = 0;
        if (!scan_exponent(positive_exp, exp, overflowed)) {
            return false;
        }
        if (overflowed) {
            bool zero_significand = true;
            for (char d : m_scratch) {
                if (d != '0') {
                    zero_significand = false;
                    break;
                }
            }
            return parse_exponent_overflow(positive, zero_significand, positive_exp, out);
        }
        return long_from_parts(positive, integer_end, positive_exp ? exp : -exp, out);
    }

    constexpr bool long_from_parts(bool positive, std::size_t integer_end, std::int32_t exponent, double& out) {
        std::string text;
        if (!fp_parse_detail::f64_long_from_parts(positive, m_scratch, integer_end, exponent, text, out)) {
            return fail(ErrorCode::NUMBER_OUT_OF_RANGE);
        }
        return true;
    }

    constexpr bool ignore_decimal() {
        m_source.discard();  // '.'
        bool at_least_one_digit = false;
        for (;;) {
            std::uint8_t c = 0;
            if (!peek_or_null(c)) {
                return false;
            }
            if (!is_digit(c)) {
                break;
            }
            m_source.discard();
            at_least_one_digit = true;
        }
        if (!at_least_one_digit) {
            return fail_peek(ErrorCode::INVALID_NUMBER);
        }
        std::uint8_t c = 0;
        if (!peek_or_null(c)) {
            return false;
        }
        if (c == 'e' || c == 'E') {
            return ignore_exponent();
        }
        return true;
    }

    constexpr bool ignore_exponent() {
        m_source.discard();  // 'e' or 'E'
        std::uint8_t c = 0;
        if (!peek_or_null(c)) {
            return false;
        }
        if (c == '+' || c == '-') {
            m_source.discard();
        }
        if (!next_or_null(c)) {
            return false;
        }
        if (!is_digit(c)) {
            return fail(ErrorCode::INVALID_NUMBER);
        }
        return skip_digits();
    }
};

} // namespace JsonDescent
