#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "errors.hpp"

namespace JsonDescent::string_detail {

// Bytes that end the fast scan of a string body: control characters,
// the closing quote and the escape introducer.
inline constexpr std::array<bool, 256> kEscape = [] {
    std::array<bool, 256> t{};
    for (std::size_t c = 0; c < 0x20; ++c) {
        t[c] = true;
    }
    t['"'] = true;
    t['\\'] = true;
    return t;
}();

constexpr bool needs_escape_handling(std::uint8_t c) {
    return kEscape[c];
}

constexpr int hex_value(std::uint8_t c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/// Encodes a code point as UTF-8. Surrogates are written in their
/// three-byte form, which only the raw (byte string) path can produce.
constexpr void push_wtf8_codepoint(std::uint32_t n, std::string& out) {
    if (n < 0x80) {
        out.push_back(static_cast<char>(n));
    } else if (n < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (n >> 6)));
        out.push_back(static_cast<char>(0x80 | (n & 0x3F)));
    } else if (n < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (n >> 12)));
        out.push_back(static_cast<char>(0x80 | ((n >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (n & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (n >> 18)));
        out.push_back(static_cast<char>(0x80 | ((n >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((n >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (n & 0x3F)));
    }
}

// Well-formed UTF-8 per RFC 3629: no overlongs, no surrogates, nothing past U+10FFFF.
constexpr bool is_valid_utf8(std::string_view s) {
    std::size_t i = 0;
    const std::size_t n = s.size();
    while (i < n) {
        const std::uint8_t c = static_cast<std::uint8_t>(s[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }
        std::size_t len = 0;
        std::uint8_t lo = 0x80, hi = 0xBF;
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
        if (n - i < len) {
            return false;
        }
        const std::uint8_t c1 = static_cast<std::uint8_t>(s[i + 1]);
        if (c1 < lo || c1 > hi) {
            return false;
        }
        for (std::size_t k = 2; k < len; ++k) {
            const std::uint8_t ck = static_cast<std::uint8_t>(s[i + k]);
            if (ck < 0x80 || ck > 0xBF) {
                return false;
            }
        }
        i += len;
    }
    return true;
}

// Shared escape decoding for every source kind. Expects the backslash to be
// consumed already. Src provides next/peek/discard, decode_hex_escape and
// error_at_position.
template<class Src>
constexpr bool parse_escape(Src& src, bool validate, std::string& scratch, Error& err);

template<class Src>
constexpr bool parse_unicode_escape(Src& src, bool validate, std::string& scratch, Error& err) {
    std::uint16_t first = 0;
    if (!src.decode_hex_escape(first, err)) {
        return false;
    }
    std::uint32_t n = first;

    if (validate && n >= 0xDC00 && n <= 0xDFFF) {
        // low surrogate with nothing before it
        err = src.error_at_position(ErrorCode::INVALID_UNICODE_CODE_POINT);
        return false;
    }

    for (;;) {
        if (n < 0xD800 || n > 0xDBFF) {
            push_wtf8_codepoint(n, scratch);
            return true;
        }

        const std::uint32_t n1 = n;
        std::optional<std::uint8_t> c;

        if (!src.peek(c, err)) {
            return false;
        }
        if (!c) {
            err = src.error_at_position(ErrorCode::EOF_WHILE_PARSING_STRING);
            return false;
        }
        if (*c == '\\') {
            src.discard();
        } else {
            if (validate) {
                src.discard();
                err = src.error_at_position(ErrorCode::INVALID_UNICODE_CODE_POINT);
                return false;
            }
            push_wtf8_codepoint(n1, scratch);
            return true;
        }

        if (!src.peek(c, err)) {
            return false;
        }
        if (!c) {
            err = src.error_at_position(ErrorCode::EOF_WHILE_PARSING_STRING);
            return false;
        }
        if (*c == 'u') {
            src.discard();
        } else {
            if (validate) {
                src.discard();
                err = src.error_at_position(ErrorCode::INVALID_UNICODE_CODE_POINT);
                return false;
            }
            push_wtf8_codepoint(n1, scratch);
            // the backslash already belongs to the next escape
            return parse_escape(src, validate, scratch, err);
        }

        std::uint16_t second = 0;
        if (!src.decode_hex_escape(second, err)) {
            return false;
        }
        const std::uint32_t n2 = second;

        if (n2 < 0xDC00 || n2 > 0xDFFF) {
            if (validate) {
                err = src.error_at_position(ErrorCode::INVALID_UNICODE_CODE_POINT);
                return false;
            }
            push_wtf8_codepoint(n1, scratch);
            // n2 may itself open a new pair
            n = n2;
            continue;
        }

        const std::uint32_t combined = (((n1 - 0xD800) << 10) | (n2 - 0xDC00)) + 0x10000;
        push_wtf8_codepoint(combined, scratch);
        return true;
    }
}

template<class Src>
constexpr bool parse_escape(Src& src, bool validate, std::string& scratch, Error& err) {
    std::optional<std::uint8_t> c;
    if (!src.next(c, err)) {
        return false;
    }
    if (!c) {
        err = src.error_at_position(ErrorCode::EOF_WHILE_PARSING_STRING);
        return false;
    }
    switch (*c) {
    case '"':  scratch.push_back('"'); break;
    case '\\': scratch.push_back('\\'); break;
    case '/':  scratch.push_back('/'); break;
    case 'b':  scratch.push_back('\b'); break;
    case 'f':  scratch.push_back('\f'); break;
    case 'n':  scratch.push_back('\n'); break;
    case 'r':  scratch.push_back('\r'); break;
    case 't':  scratch.push_back('\t'); break;
    case 'u':
        return parse_unicode_escape(src, validate, scratch, err);
    default:
        err = src.error_at_position(ErrorCode::INVALID_ESCAPE);
        return false;
    }
    return true;
}

// Validates escape syntax without decoding; surrogate pairing is not checked.
template<class Src>
constexpr bool ignore_escape(Src& src, Error& err) {
    std::optional<std::uint8_t> c;
    if (!src.next(c, err)) {
        return false;
    }
    if (!c) {
        err = src.error_at_position(ErrorCode::EOF_WHILE_PARSING_STRING);
        return false;
    }
    switch (*c) {
    case '"':
    case '\\':
    case '/':
    case 'b':
    case 'f':
    case 'n':
    case 'r':
    case 't':
        return true;
    case 'u': {
        std::uint16_t ignored = 0;
        return src.decode_hex_escape(ignored, err);
    }
    default:
        err = src.error_at_position(ErrorCode::INVALID_ESCAPE);
        return false;
    }
}

} // namespace JsonDescent::string_detail
