#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "errors.hpp"
#include "number_parser.hpp"
#include "source_concept.hpp"
#include "visitor.hpp"

#ifndef JSONDESCENT_RECURSION_LIMIT
#define JSONDESCENT_RECURSION_LIMIT 128
#endif

namespace JsonDescent {

template <source::SourceLike Source> class Deserializer;
template <source::SourceLike Source> class SeqAccess;
template <source::SourceLike Source> class MapAccess;
template <source::SourceLike Source> class MapKey;
template <source::SourceLike Source> class VariantAccess;
template <source::SourceLike Source> class UnitVariantAccess;

namespace deserializer_detail {

constexpr bool is_digit(std::uint8_t c) {
    return c >= '0' && c <= '9';
}

// Integer syntax accepted inside quoted map keys: optional sign, digits only.
template <class Int>
constexpr bool parse_integer_text(std::string_view s, Int& out) {
    std::size_t i = 0;
    bool negative = false;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
        negative = s[i] == '-';
        ++i;
    }
    if (i == s.size()) {
        return false;
    }
    if (negative && !std::is_signed_v<Int>) {
        return false;
    }
    constexpr std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t magnitude = 0;
    for (; i < s.size(); ++i) {
        const std::uint8_t c = static_cast<std::uint8_t>(s[i]);
        if (!is_digit(c)) {
            return false;
        }
        const std::uint64_t digit = c - '0';
        if (magnitude > (max - digit) / 10) {
            return false;
        }
        magnitude = magnitude * 10 + digit;
    }
    if constexpr (std::is_signed_v<Int>) {
        constexpr std::uint64_t pos_limit = static_cast<std::uint64_t>(std::numeric_limits<Int>::max());
        if (negative) {
            if (magnitude > pos_limit + 1) {
                return false;
            }
            out = static_cast<Int>(-static_cast<std::int64_t>(magnitude - 1) - 1);
        } else {
            if (magnitude > pos_limit) {
                return false;
            }
            out = static_cast<Int>(magnitude);
        }
    } else {
        if (magnitude > static_cast<std::uint64_t>(std::numeric_limits<Int>::max())) {
            return false;
        }
        out = static_cast<Int>(magnitude);
    }
    return true;
}

// 128-bit form: yields sign and magnitude, range checks are left to the caller.
constexpr bool parse_integer128_text(std::string_view s, bool& negative, uint128_t& magnitude) {
    std::size_t i = 0;
    negative = false;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
        negative = s[i] == '-';
        ++i;
    }
    if (i == s.size()) {
        return false;
    }
    constexpr uint128_t max = ~uint128_t{0};
    magnitude = 0;
    for (; i < s.size(); ++i) {
        const std::uint8_t c = static_cast<std::uint8_t>(s[i]);
        if (!is_digit(c)) {
            return false;
        }
        const uint128_t digit = c - '0';
        if (magnitude > (max - digit) / 10) {
            return false;
        }
        magnitude = magnitude * 10 + digit;
    }
    return true;
}

} // namespace deserializer_detail


/// Recursive-descent JSON deserializer over a byte source.
///
/// A Deserializer reads one value per deserialize_* call and reports it to a
/// visitor. Composite values are handed to the visitor as cursors
/// (SeqAccess, MapAccess, VariantAccess) that re-enter the engine for each
/// element. Values nobody wants are skipped without recursion.
///
/// Every call returns false on failure; error() then describes it.
template <source::SourceLike Source>
class Deserializer {
public:
    using source_type = Source;
    static constexpr std::size_t RecursionLimit = JSONDESCENT_RECURSION_LIMIT;

    constexpr explicit Deserializer(Source source) : m_source(std::move(source)) {}

    /// Removes the nesting ceiling. The caller becomes responsible for
    /// protecting the native stack against deeply nested input.
    constexpr void disable_recursion_limit() {
        m_disable_recursion_limit = true;
    }

    /// Succeeds when nothing but whitespace remains in the input.
    constexpr bool end() {
        std::optional<std::uint8_t> peek;
        if (!parse_whitespace(peek)) {
            return false;
        }
        if (peek) {
            return fail_peek(ErrorCode::TRAILING_CHARACTERS);
        }
        return true;
    }

    constexpr const Error& error() const {
        return m_error;
    }

    constexpr Source& source() {
        return m_source;
    }

    constexpr const Source& source() const {
        return m_source;
    }

    constexpr std::size_t byte_offset() const {
        return m_source.byte_offset();
    }

    /// Skips JSON whitespace; `out` receives the following byte, empty at end of input.
    constexpr bool parse_whitespace(std::optional<std::uint8_t>& out) {
        for (;;) {
            if (!m_source.peek(out, m_error)) {
                return false;
            }
            if (!out) {
                return true;
            }
            switch (*out) {
            case ' ':
            case '\n':
            case '\t':
            case '\r':
                m_source.discard();
                break;
            default:
                return true;
            }
        }
    }

    // ========== Visitor entry points ==========

    template <class V>
    constexpr bool deserialize_any(V& visitor) {
        std::optional<std::uint8_t> peek;
        if (!parse_whitespace(peek)) {
            return false;
        }
        if (!peek) {
            return fail_peek(ErrorCode::EOF_WHILE_PARSING_VALUE);
        }

        bool ok = false;
        switch (*peek) {
        case 'n':
            eat_char();
            ok = parse_ident("ull") && visitor.visit_unit(m_error);
            break;
        case 't':
            eat_char();
            ok = parse_ident("rue") && visitor.visit_bool(true, m_error);
            break;
        case 'f':
            eat_char();
            ok = parse_ident("alse") && visitor.visit_bool(false, m_error);
            break;
        case '-':
            eat_char();
            ok = parse_and_visit_number(false, visitor);
            break;
        case '0': case '1': case '2': case '3': case '4':
        case '5': case '6': case '7': case '8': case '9':
            ok = parse_and_visit_number(true, visitor);
            break;
        case '"':
            eat_char();
            ok = parse_and_visit_str(visitor);
            break;
        case '[':
            ok = visit_array(visitor);
            break;
        case '{':
            ok = visit_object(visitor);
            break;
        default:
            return fail_peek(ErrorCode::EXPECTED_SOME_VALUE);
        }
        return ok || fixed_failure();
    }

    template <class V>
    constexpr bool deserialize_bool(V& visitor) {
        std::optional<std::uint8_t> peek;
        if (!parse_whitespace(peek)) {
            return false;
        }
        if (!peek) {
            return fail_peek(ErrorCode::EOF_WHILE_PARSING_VALUE);
        }

        bool ok = false;
        switch (*peek) {
        case 't':
            eat_char();
            ok = parse_ident("rue") && visitor.visit_bool(true, m_error);
            break;
        case 'f':
            eat_char();
            ok = parse_ident("alse") && visitor.visit_bool(false, m_error);
            break;
        default:
            return peek_invalid_type(visitor);
        }
        return ok || fixed_failure();
    }

    /// Shared by every integer and floating point width; the visitor
    /// range-checks the classified number.
    template <class V>
    constexpr bool deserialize_number(V& visitor) {
        std::optional<std::uint8_t> peek;
        if (!parse_whitespace(peek)) {
            return false;
        }
        if (!peek) {
            return fail_peek(ErrorCode::EOF_WHILE_PARSING_VALUE);
        }

        bool ok = false;
        if (*peek == '-') {
            eat_char();
            ok = parse_and_visit_number(false, visitor);
        } else if (deserializer_detail::is_digit(*peek)) {
            ok = parse_and_visit_number(true, visitor);
        } else {
            return peek_invalid_type(visitor);
        }
        return ok || fixed_failure();
    }

    template <class Int, class V>
    constexpr bool deserialize_integer(V& visitor) {
        return deserialize_number(visitor);
    }

    template <class Float, class V>
    constexpr bool deserialize_float(V& visitor) {
        return deserialize_number(visitor);
    }

    template <class V>
    constexpr bool deserialize_i128(V& visitor) {
        std::optional<std::uint8_t> peek;
        if (!parse_whitespace(peek)) {
            return false;
        }
        if (!peek) {
            return fail_peek(ErrorCode::EOF_WHILE_PARSING_VALUE);
        }

        bool negative = false;
        if (*peek == '-') {
            eat_char();
            negative = true;
        } else if (!deserializer_detail::is_digit(*peek)) {
            return peek_invalid_type(visitor);
        }

        uint128_t magnitude = 0;
        bool overflow = false;
        if (!number_parser().scan_integer128(magnitude, overflow)) {
            return false;
        }
        constexpr uint128_t limit = uint128_t{1} << 127;
        if (overflow || (negative ? magnitude > limit : magnitude >= limit)) {
            return fail(ErrorCode::NUMBER_OUT_OF_RANGE);
        }
        const int128_t value = negative ? static_cast<int128_t>(uint128_t{0} - magnitude)
                                        : static_cast<int128_t>(magnitude);
        return visitor.visit_i128(value, m_error) || fixed_failure();
    }

    template <class V>
    constexpr bool deserialize_u128(V& visitor) {
        std::optional<std::uint8_t> peek;
        if (!parse_whitespace(peek)) {
            return false;
        }
        if (!peek) {
            return fail_peek(ErrorCode::EOF_WHILE_PARSING_VALUE);
        }
        if (*peek == '-') {
            return fail_peek(ErrorCode::NUMBER_OUT_OF_RANGE);
        }
        if (!deserializer_detail::is_digit(*peek)) {
            return peek_invalid_type(visitor);
        }

        uint128_t magnitude = 0;
        bool overflow = false;
        if (!number_parser().scan_integer128(magnitude, overflow)) {
            return false;
        }
        if (overflow) {
            return fail(ErrorCode::NUMBER_OUT_OF_RANGE);
        }
        return visitor.visit_u128(magnitude, m_error) || fixed_failure();
    }

    template <class V>
    constexpr bool deserialize_str(V& visitor) {
        std::optional<std::uint8_t> peek;
        if (!parse_whitespace(peek)) {
            return false;
        }
        if (!peek) {
            return fail_peek(ErrorCode::EOF_WHILE_PARSING_VALUE);
        }
        if (*peek != '"') {
            return peek_invalid_type(visitor);
        }
        eat_char();
        return parse_and_visit_str(visitor) || fixed_failure();
    }

    template <class V>
    constexpr bool deserialize_string(V& visitor) {
        return deserialize_str(visitor);
    }

    template <class V>
    constexpr bool deserialize_identifier(V& visitor) {
        return deserialize_str(visitor);
    }

    /// Byte strings skip UTF-8 validation and keep unpaired surrogates.
    /// An array of numbers is accepted as well.
    template <class V>
    constexpr bool deserialize_bytes(V& visitor) {
        std::optional<std::uint8_t> peek;
        if (!parse_whitespace(peek)) {
            return false;
        }
        if (!peek) {
            return fail_peek(ErrorCode::EOF_WHILE_PARSING_VALUE);
        }

        bool ok = false;
        switch (*peek) {
        case '"': {
            eat_char();
            m_scratch.clear();
            Reference ref;
            if (!m_source.parse_str_raw(m_scratch, ref, m_error)) {
                return false;
            }
            ok = ref.is_borrowed() ? visitor.visit_borrowed_bytes(ref.text, m_error)
                                   : visitor.visit_bytes(ref.text, m_error);
            break;
        }
        case '[':
            ok = visit_array(visitor);
            break;
        default:
            return peek_invalid_type(visitor);
        }
        return ok || fixed_failure();
    }

    template <class V>
    constexpr bool deserialize_byte_buf(V& visitor) {
        return deserialize_bytes(visitor);
    }

    template <class V>
    constexpr bool deserialize_option(V& visitor) {
        std::optional<std::uint8_t> peek;
        if (!parse_whitespace(peek)) {
            return false;
        }
        if (peek && *peek == 'n') {
            eat_char();
            if (!parse_ident("ull")) {
                return false;
            }
            return visitor.visit_none(m_error) || fixed_failure();
        }
        return visitor.visit_some(*this, m_error);
    }

    template <class V>
    constexpr bool deserialize_unit(V& visitor) {
        std::optional<std::uint8_t> peek;
        if (!parse_whitespace(peek)) {
            return false;
        }
        if (!peek) {
            return fail_peek(ErrorCode::EOF_WHILE_PARSING_VALUE);
        }
        if (*peek != 'n') {
            return peek_invalid_type(visitor);
        }
        eat_char();
        if (!parse_ident("ull")) {
            return false;
        }
        return visitor.visit_unit(m_error) || fixed_failure();
    }

    template <class V>
    constexpr bool deserialize_newtype_struct(V& visitor) {
        return visitor.visit_newtype_struct(*this, m_error);
    }

    template <class V>
    constexpr bool deserialize_seq(V& visitor) {
        std::optional<std::uint8_t> peek;
        if (!parse_whitespace(peek)) {
            return false;
        }
        if (!peek) {
            return fail_peek(ErrorCode::EOF_WHILE_PARSING_VALUE);
        }
        if (*peek != '[') {
            return peek_invalid_type(visitor);
        }
        return visit_array(visitor) || fixed_failure();
    }

    template <class V>
    constexpr bool deserialize_tuple(std::size_t, V& visitor) {
        return deserialize_seq(visitor);
    }

    template <class V>
    constexpr bool deserialize_map(V& visitor) {
        std::optional<std::uint8_t> peek;
        if (!parse_whitespace(peek)) {
            return false;
        }
        if (!peek) {
            return fail_peek(ErrorCode::EOF_WHILE_PARSING_VALUE);
        }
        if (*peek != '{') {
            return peek_invalid_type(visitor);
        }
        return visit_object(visitor) || fixed_failure();
    }

    /// Structs come either as an object keyed by field name or as an array
    /// of fields in declaration order.
    template <class V>
    constexpr bool deserialize_struct(V& visitor) {
        std::optional<std::uint8_t> peek;
        if (!parse_whitespace(peek)) {
            return false;
        }
        if (!peek) {
            return fail_peek(ErrorCode::EOF_WHILE_PARSING_VALUE);
        }

        bool ok = false;
        switch (*peek) {
        case '[':
            ok = visit_array(visitor);
            break;
        case '{':
            ok = visit_object(visitor);
            break;
        default:
            return peek_invalid_type(visitor);
        }
        return ok || fixed_failure();
    }

    /// Enums are either a bare string naming a unit variant or a
    /// single-entry object {"Variant": payload}.
    template <class V>
    constexpr bool deserialize_enum(V& visitor) {
        std::optional<std::uint8_t> peek;
        if (!parse_whitespace(peek)) {
            return false;
        }
        if (!peek) {
            return fail_peek(ErrorCode::EOF_WHILE_PARSING_VALUE);
        }

        switch (*peek) {
        case '{': {
            {
                DepthGuard guard(*this);
                if (!guard.enter()) {
                    return false;
                }
                eat_char();
                VariantAccess<Source> access(*this);
                if (!visitor.visit_enum(access, m_error)) {
                    return fixed_failure();
                }
            }
            if (!parse_whitespace(peek)) {
                return false;
            }
            if (!peek) {
                return fail(ErrorCode::EOF_WHILE_PARSING_OBJECT);
            }
            if (*peek != '}') {
                return fail(ErrorCode::EXPECTED_SOME_VALUE);
            }
            eat_char();
            return true;
        }
        case '"': {
            UnitVariantAccess<Source> access(*this);
            return visitor.visit_enum(access, m_error) || fixed_failure();
        }
        default:
            return fail_peek(ErrorCode::EXPECTED_SOME_VALUE);
        }
    }

    template <class V>
    constexpr bool deserialize_ignored_any(V& visitor) {
        if (!ignore_value()) {
            return false;
        }
        return visitor.visit_unit(m_error) || fixed_failure();
    }

private:
    template <source::SourceLike> friend class SeqAccess;
    template <source::SourceLike> friend class MapAccess;
    template <source::SourceLike> friend class MapKey;
    template <source::SourceLike> friend class VariantAccess;
    template <source::SourceLike> friend class UnitVariantAccess;

    Source m_source;
    std::string m_scratch;
    Error m_error;
    std::size_t m_remaining_depth = RecursionLimit;
    bool m_disable_recursion_limit = false;

    // Spends one level of the nesting budget and gives it back on scope exit.
    class DepthGuard {
    public:
        constexpr explicit DepthGuard(Deserializer& de) : m_de(de) {}
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

        constexpr bool enter() {
            if (m_de.m_disable_recursion_limit) {
                return true;
            }
            if (m_de.m_remaining_depth == 0) {
                return m_de.fail_peek(ErrorCode::RECURSION_LIMIT_EXCEEDED);
            }
            --m_de.m_remaining_depth;
            m_entered = true;
            return true;
        }

        constexpr ~DepthGuard() {
            if (m_entered) {
                ++m_de.m_remaining_depth;
            }
        }

    private:
        Deserializer& m_de;
        bool m_entered = false;
    };

    constexpr NumberParser<Source> number_parser() {
        return NumberParser<Source>(m_source, m_scratch, m_error);
    }

    constexpr void eat_char() {
        m_source.discard();
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

    // Stamps a positionless error (raised by a visitor) with the position
    // of the last consumed byte.
    constexpr bool fixed_failure() {
        const Position p = m_source.position();
        m_error.fix_position(p.line, p.column);
        return false;
    }

    constexpr bool parse_ident(std::string_view ident) {
        for (char expected : ident) {
            std::optional<std::uint8_t> c;
            if (!m_source.next(c, m_error)) {
                return false;
            }
            if (!c) {
                return fail(ErrorCode::EOF_WHILE_PARSING_VALUE);
            }
            if (*c != static_cast<std::uint8_t>(expected)) {
                return fail(ErrorCode::EXPECTED_SOME_IDENT);
            }
        }
        return true;
    }

    template <class V>
    constexpr bool parse_and_visit_number(bool positive, V& visitor) {
        ParsedNumber n;
        if (!number_parser().parse_integer(positive, n)) {
            return false;
        }
        switch (n.kind) {
        case ParsedNumber::Kind::unsigned_integer:
            return visitor.visit_u64(n.u, m_error);
        case ParsedNumber::Kind::signed_integer:
            return visitor.visit_i64(n.i, m_error);
        case ParsedNumber::Kind::floating:
            return visitor.visit_f64(n.f, m_error);
        }
        return false;
    }

    // Opening quote already consumed.
    template <class V>
    constexpr bool parse_and_visit_str(V& visitor) {
        m_scratch.clear();
        Reference ref;
        if (!m_source.parse_str(m_scratch, ref, m_error)) {
            return false;
        }
        return ref.is_borrowed() ? visitor.visit_borrowed_str(ref.text, m_error)
                                 : visitor.visit_str(ref.text, m_error);
    }

    template <class V>
    constexpr bool visit_array(V& visitor) {
        {
            DepthGuard guard(*this);
            if (!guard.enter()) {
                return false;
            }
            eat_char();
            SeqAccess<Source> seq(*this);
            if (!visitor.visit_seq(seq, m_error)) {
                return false;
            }
        }
        return end_seq();
    }

    template <class V>
    constexpr bool visit_object(V& visitor) {
        {
            DepthGuard guard(*this);
            if (!guard.enter()) {
                return false;
            }
            eat_char();
            MapAccess<Source> map(*this);
            if (!visitor.visit_map(map, m_error)) {
                return false;
            }
        }
        return end_map();
    }

    // Parses the offending value far enough to describe it, then reports
    // it against what the visitor expected.
    template <class V>
    constexpr bool peek_invalid_type(V& visitor) {
        std::optional<std::uint8_t> peek;
        if (!m_source.peek(peek, m_error)) {
            return false;
        }

        Unexpected unexp;
        switch (peek.value_or(0)) {
        case 'n':
            eat_char();
            if (!parse_ident("ull")) {
                return false;
            }
            unexp = Unexpected::of(Unexpected::Kind::unit);
            break;
        case 't':
            eat_char();
            if (!parse_ident("rue")) {
                return false;
            }
            unexp = Unexpected::boolean(true);
            break;
        case 'f':
            eat_char();
            if (!parse_ident("alse")) {
                return false;
            }
            unexp = Unexpected::boolean(false);
            break;
        case '-':
        case '0': case '1': case '2': case '3': case '4':
        case '5': case '6': case '7': case '8': case '9': {
            const bool positive = *peek != '-';
            if (!positive) {
                eat_char();
            }
            ParsedNumber n;
            if (!number_parser().parse_integer(positive, n)) {
                return false;
            }
            unexp = n.unexpected();
            break;
        }
        case '"': {
            eat_char();
            m_scratch.clear();
            Reference ref;
            if (!m_source.parse_str(m_scratch, ref, m_error)) {
                return false;
            }
            unexp = Unexpected::string(ref.text);
            break;
        }
        case '[':
            unexp = Unexpected::of(Unexpected::Kind::seq);
            break;
        case '{':
            unexp = Unexpected::of(Unexpected::Kind::map);
            break;
        default:
            return fail_peek(ErrorCode::EXPECTED_SOME_VALUE);
        }
        m_error = Error::invalid_type(std::move(unexp), visitor.expecting());
        return fixed_failure();
    }

    constexpr bool end_seq() {
        std::optional<std::uint8_t> peek;
        if (!parse_whitespace(peek)) {
            return false;
        }
        if (!peek) {
            return fail_peek(ErrorCode::EOF_WHILE_PARSING_LIST);
        }
        if (*peek == ']') {
            eat_char();
            return true;
        }
        if (*peek == ',') {
            eat_char();
            if (!parse_whitespace(peek)) {
                return false;
            }
            if (peek && *peek == ']') {
                return fail_peek(ErrorCode::TRAILING_COMMA);
            }
        }
        return fail_peek(ErrorCode::TRAILING_CHARACTERS);
    }

    constexpr bool end_map() {
        std::optional<std::uint8_t> peek;
        if (!parse_whitespace(peek)) {
            return false;
        }
        if (!peek) {
            return fail_peek(ErrorCode::EOF_WHILE_PARSING_OBJECT);
        }
        switch (*peek) {
        case '}':
            eat_char();
            return true;
        case ',':
            return fail_peek(ErrorCode::TRAILING_COMMA);
        default:
            return fail_peek(ErrorCode::TRAILING_CHARACTERS);
        }
    }

    constexpr bool parse_object_colon() {
        std::optional<std::uint8_t> peek;
        if (!parse_whitespace(peek)) {
            return false;
        }
        if (!peek) {
            return fail_peek(ErrorCode::EOF_WHILE_PARSING_OBJECT);
        }
        if (*peek != ':') {
            return fail_peek(ErrorCode::EXPECTED_COLON);
        }
        eat_char();
        return true;
    }

    // Validates and discards one value. Nesting is tracked with an explicit
    // stack of open brackets kept in the scratch buffer, so arbitrarily deep
    // ignored input neither recurses nor spends the recursion budget.
    constexpr bool ignore_value() {
        m_scratch.clear();
        std::uint8_t enclosing = 0;

        for (;;) {
            std::optional<std::uint8_t> peek;
            if (!parse_whitespace(peek)) {
                return false;
            }
            if (!peek) {
                return fail_peek(ErrorCode::EOF_WHILE_PARSING_VALUE);
            }

            std::uint8_t frame = 0;
            switch (*peek) {
            case 'n':
                eat_char();
                if (!parse_ident("ull")) {
                    return false;
                }
                break;
            case 't':
                eat_char();
                if (!parse_ident("rue")) {
                    return false;
                }
                break;
            case 'f':
                eat_char();
                if (!parse_ident("alse")) {
                    return false;
                }
                break;
            case '-':
                eat_char();
                if (!number_parser().ignore_integer()) {
                    return false;
                }
                break;
            case '0': case '1': case '2': case '3': case '4':
            case '5': case '6': case '7': case '8': case '9':
                if (!number_parser().ignore_integer()) {
                    return false;
                }
                break;
            case '"':
                eat_char();
                if (!m_source.ignore_str(m_error)) {
                    return false;
                }
                break;
            case '[':
            case '{':
                if (enclosing != 0) {
                    m_scratch.push_back(static_cast<char>(enclosing));
                    enclosing = 0;
                }
                eat_char();
                frame = *peek;
                break;
            default:
                return fail_peek(ErrorCode::EXPECTED_SOME_VALUE);
            }

            bool accept_comma = false;
            if (frame != 0) {
                accept_comma = false;
            } else if (enclosing != 0) {
                frame = enclosing;
                enclosing = 0;
                accept_comma = true;
            } else if (!m_scratch.empty()) {
                frame = static_cast<std::uint8_t>(m_scratch.back());
                m_scratch.pop_back();
                accept_comma = true;
            } else {
                return true;
            }

            for (;;) {
                if (!parse_whitespace(peek)) {
                    return false;
                }
                if (!peek) {
                    return fail_peek(frame == '[' ? ErrorCode::EOF_WHILE_PARSING_LIST
                                                  : ErrorCode::EOF_WHILE_PARSING_OBJECT);
                }
                const std::uint8_t c = *peek;
                const std::uint8_t close = frame == '[' ? ']' : '}';
                if (c == ',' && accept_comma) {
                    eat_char();
                    if (!parse_whitespace(peek)) {
                        return false;
                    }
                    if (peek && *peek == close) {
                        return fail_peek(ErrorCode::TRAILING_COMMA);
                    }
                    break;
                }
                if (c == close) {
                    eat_char();
                    if (m_scratch.empty()) {
                        return true;
                    }
                    frame = static_cast<std::uint8_t>(m_scratch.back());
                    m_scratch.pop_back();
                    accept_comma = true;
                    continue;
                }
                if (accept_comma) {
                    return fail_peek(frame == '[' ? ErrorCode::EXPECTED_LIST_COMMA_OR_END
                                                  : ErrorCode::EXPECTED_OBJECT_COMMA_OR_END);
                }
                break;
            }

            if (frame == '{') {
                if (!parse_whitespace(peek)) {
                    return false;
                }
                if (!peek) {
                    return fail_peek(ErrorCode::EOF_WHILE_PARSING_OBJECT);
                }
                if (*peek != '"') {
                    return fail_peek(ErrorCode::KEY_MUST_BE_A_STRING);
                }
                eat_char();
                if (!m_source.ignore_str(m_error)) {
                    return false;
                }
                if (!parse_object_colon()) {
                    return false;
                }
            }
            enclosing = frame;
        }
    }
};


/// Cursor over the elements of an array, handed to Visitor::visit_seq.
template <source::SourceLike Source>
class SeqAccess {
public:
    constexpr explicit SeqAccess(Deserializer<Source>& de) : m_de(de) {}

    /// Reads the next element into `out`; `has_value` turns false at the
    /// closing bracket.
    template <class T>
    constexpr bool next_element(T& out, bool& has_value) {
        has_value = false;
        std::optional<std::uint8_t> peek;
        if (!m_de.parse_whitespace(peek)) {
            return false;
        }
        if (!peek) {
            return m_de.fail_peek(ErrorCode::EOF_WHILE_PARSING_LIST);
        }
        if (*peek == ']') {
            return true;
        }
        if (!m_first) {
            if (*peek != ',') {
                return m_de.fail_peek(ErrorCode::EXPECTED_LIST_COMMA_OR_END);
            }
            m_de.eat_char();
            if (!m_de.parse_whitespace(peek)) {
                return false;
            }
            if (!peek) {
                return m_de.fail_peek(ErrorCode::EOF_WHILE_PARSING_VALUE);
            }
            if (*peek == ']') {
                return m_de.fail_peek(ErrorCode::TRAILING_COMMA);
            }
        }
        m_first = false;
        has_value = true;
        return Deserialize<T>::deserialize(m_de, out);
    }

private:
    Deserializer<Source>& m_de;
    bool m_first = true;
};


/// Cursor over the entries of an object, handed to Visitor::visit_map.
/// Calls alternate: next_key, then next_value for the same entry.
template <source::SourceLike Source>
class MapAccess {
public:
    constexpr explicit MapAccess(Deserializer<Source>& de) : m_de(de) {}

    template <class K>
    constexpr bool next_key(K& out, bool& has_key) {
        has_key = false;
        std::optional<std::uint8_t> peek;
        if (!m_de.parse_whitespace(peek)) {
            return false;
        }
        if (!peek) {
            return m_de.fail_peek(ErrorCode::EOF_WHILE_PARSING_OBJECT);
        }
        if (*peek == '}') {
            return true;
        }
        if (!m_first) {
            if (*peek != ',') {
                return m_de.fail_peek(ErrorCode::EXPECTED_OBJECT_COMMA_OR_END);
            }
            m_de.eat_char();
            if (!m_de.parse_whitespace(peek)) {
                return false;
            }
            if (!peek) {
                return m_de.fail_peek(ErrorCode::EOF_WHILE_PARSING_VALUE);
            }
        }
        m_first = false;

        switch (*peek) {
        case '"': {
            has_key = true;
            MapKey<Source> key(m_de);
            return Deserialize<K>::deserialize(key, out);
        }
        case '}':
            return m_de.fail_peek(ErrorCode::TRAILING_COMMA);
        default:
            return m_de.fail_peek(ErrorCode::KEY_MUST_BE_A_STRING);
        }
    }

    template <class T>
    constexpr bool next_value(T& out) {
        if (!m_de.parse_object_colon()) {
            return false;
        }
        return Deserialize<T>::deserialize(m_de, out);
    }

private:
    Deserializer<Source>& m_de;
    bool m_first = true;
};


/// Deserializer for a quoted object key (lookahead is the opening quote).
/// Integer targets read the key text as a number and fall back to handing
/// the visitor the plain string when it is not one.
template <source::SourceLike Source>
class MapKey {
public:
    constexpr explicit MapKey(Deserializer<Source>& de) : m_de(de) {}

    template <class V>
    constexpr bool deserialize_any(V& visitor) {
        Reference ref;
        if (!read_key(ref)) {
            return false;
        }
        return visit_key_str(ref, visitor) || m_de.fixed_failure();
    }

    template <class Int, class V>
    constexpr bool deserialize_integer(V& visitor) {
        Reference ref;
        if (!read_key(ref)) {
            return false;
        }
        Int value{};
        bool ok = false;
        if (deserializer_detail::parse_integer_text(ref.text, value)) {
            if constexpr (std::is_signed_v<Int>) {
                ok = visitor.visit_i64(static_cast<std::int64_t>(value), m_de.m_error);
            } else {
                ok = visitor.visit_u64(static_cast<std::uint64_t>(value), m_de.m_error);
            }
        } else {
            ok = visit_key_str(ref, visitor);
        }
        return ok || m_de.fixed_failure();
    }

    template <class Float, class V>
    constexpr bool deserialize_float(V& visitor) { return deserialize_any(visitor); }
    template <class V>
    constexpr bool deserialize_number(V& visitor) { return deserialize_any(visitor); }
    template <class V>
    constexpr bool deserialize_bool(V& visitor) { return deserialize_any(visitor); }

    template <class V>
    constexpr bool deserialize_i128(V& visitor) {
        Reference ref;
        if (!read_key(ref)) {
            return false;
        }
        constexpr uint128_t limit = uint128_t{1} << 127;
        bool negative = false;
        uint128_t magnitude = 0;
        bool ok = false;
        if (deserializer_detail::parse_integer128_text(ref.text, negative, magnitude) &&
            (negative ? magnitude <= limit : magnitude < limit)) {
            const int128_t value = negative ? static_cast<int128_t>(uint128_t{0} - magnitude)
                                            : static_cast<int128_t>(magnitude);
            ok = visitor.visit_i128(value, m_de.m_error);
        } else {
            ok = visit_key_str(ref, visitor);
        }
        return ok || m_de.fixed_failure();
    }

    template <class V>
    constexpr bool deserialize_u128(V& visitor) {
        Reference ref;
        if (!read_key(ref)) {
            return false;
        }
        bool negative = false;
        uint128_t magnitude = 0;
        bool ok = false;
        if (deserializer_detail::parse_integer128_text(ref.text, negative, magnitude) && !negative) {
            ok = visitor.visit_u128(magnitude, m_de.m_error);
        } else {
            ok = visit_key_str(ref, visitor);
        }
        return ok || m_de.fixed_failure();
    }

    template <class V>
    constexpr bool deserialize_str(V& visitor) { return deserialize_any(visitor); }
    template <class V>
    constexpr bool deserialize_string(V& visitor) { return deserialize_any(visitor); }
    template <class V>
    constexpr bool deserialize_identifier(V& visitor) { return deserialize_any(visitor); }
    template <class V>
    constexpr bool deserialize_unit(V& visitor) { return deserialize_any(visitor); }
    template <class V>
    constexpr bool deserialize_seq(V& visitor) { return deserialize_any(visitor); }
    template <class V>
    constexpr bool deserialize_tuple(std::size_t, V& visitor) { return deserialize_any(visitor); }
    template <class V>
    constexpr bool deserialize_map(V& visitor) { return deserialize_any(visitor); }
    template <class V>
    constexpr bool deserialize_struct(V& visitor) { return deserialize_any(visitor); }
    template <class V>
    constexpr bool deserialize_ignored_any(V& visitor) { return deserialize_any(visitor); }

    template <class V>
    constexpr bool deserialize_bytes(V& visitor) { return m_de.deserialize_bytes(visitor); }
    template <class V>
    constexpr bool deserialize_byte_buf(V& visitor) { return m_de.deserialize_bytes(visitor); }
    template <class V>
    constexpr bool deserialize_enum(V& visitor) { return m_de.deserialize_enum(visitor); }

    // A key is never null.
    template <class V>
    constexpr bool deserialize_option(V& visitor) {
        return visitor.visit_some(*this, m_de.m_error);
    }

    template <class V>
    constexpr bool deserialize_newtype_struct(V& visitor) {
        return visitor.visit_newtype_struct(*this, m_de.m_error);
    }

private:
    Deserializer<Source>& m_de;

    constexpr bool read_key(Reference& ref) {
        m_de.eat_char();
        m_de.m_scratch.clear();
        return m_de.m_source.parse_str(m_de.m_scratch, ref, m_de.m_error);
    }

    template <class V>
    constexpr bool visit_key_str(const Reference& ref, V& visitor) {
        return ref.is_borrowed() ? visitor.visit_borrowed_str(ref.text, m_de.m_error)
                                 : visitor.visit_str(ref.text, m_de.m_error);
    }
};


/// Enum in object form: {"Variant": payload}. variant() reads the name and
/// the colon; exactly one of the *_variant() calls then reads the payload.
template <source::SourceLike Source>
class VariantAccess {
public:
    constexpr explicit VariantAccess(Deserializer<Source>& de) : m_de(de) {}

    template <class Id>
    constexpr bool variant(Id& out) {
        if (!Deserialize<Id>::deserialize(m_de, out)) {
            return false;
        }
        return m_de.parse_object_colon();
    }

    constexpr bool unit_variant() {
        UnitVisitor visitor;
        return m_de.deserialize_unit(visitor);
    }

    template <class T>
    constexpr bool newtype_variant(T& out) {
        return Deserialize<T>::deserialize(m_de, out);
    }

    template <class V>
    constexpr bool tuple_variant(std::size_t len, V& visitor) {
        return m_de.deserialize_tuple(len, visitor);
    }

    template <class V>
    constexpr bool struct_variant(V& visitor) {
        return m_de.deserialize_struct(visitor);
    }

private:
    Deserializer<Source>& m_de;
};


/// Enum in string form: only a unit variant can be spelled this way.
template <source::SourceLike Source>
class UnitVariantAccess {
public:
    constexpr explicit UnitVariantAccess(Deserializer<Source>& de) : m_de(de) {}

    template <class Id>
    constexpr bool variant(Id& out) {
        return Deserialize<Id>::deserialize(m_de, out);
    }

    constexpr bool unit_variant() {
        return true;
    }

    template <class T>
    constexpr bool newtype_variant(T&) {
        return reject("newtype variant");
    }

    template <class V>
    constexpr bool tuple_variant(std::size_t, V&) {
        return reject("tuple variant");
    }

    template <class V>
    constexpr bool struct_variant(V&) {
        return reject("struct variant");
    }

private:
    Deserializer<Source>& m_de;

    constexpr bool reject(std::string_view expected) {
        m_de.m_error = Error::invalid_type(Unexpected::of(Unexpected::Kind::unit_variant), expected);
        return false;
    }
};

} // namespace JsonDescent
