#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "source_concept.hpp"
#include "string_decoding.hpp"

namespace JsonDescent {

/// In-memory source. Strings without escapes are returned as views into the
/// input. With TrustedUtf8 the caller guarantees the input is valid UTF-8 and
/// extracted text is not validated again.
template<bool TrustedUtf8>
class MemorySource {
public:
    static constexpr bool fail_fast = false;

    constexpr explicit MemorySource(std::string_view input)
        : m_data(input.data()), m_size(input.size()) {}

    MemorySource(const std::uint8_t* data, std::size_t size)
        : m_data(reinterpret_cast<const char*>(data)), m_size(size) {}

    constexpr bool peek(std::optional<std::uint8_t>& out, Error&) const {
        if (m_index < m_size) {
            out = at(m_index);
        } else {
            out.reset();
        }
        return true;
    }

    constexpr bool next(std::optional<std::uint8_t>& out, Error&) {
        if (m_index < m_size) {
            out = at(m_index++);
        } else {
            out.reset();
        }
        return true;
    }

    constexpr void discard() {
        ++m_index;
    }

    constexpr Position position() const {
        return position_of_index(m_index);
    }

    constexpr Position peek_position() const {
        return position_of_index(std::min(m_size, m_index + 1));
    }

    constexpr std::size_t byte_offset() const {
        return m_index;
    }

    constexpr Error error_at_position(ErrorCode code) const {
        const Position p = position();
        return Error::syntax(code, p.line, p.column);
    }

    constexpr bool parse_str(std::string& scratch, Reference& out, Error& err) {
        if (!parse_str_bytes(scratch, true, out, err)) {
            return false;
        }
        if constexpr (!TrustedUtf8) {
            if (!string_detail::is_valid_utf8(out.text)) {
                err = error_at_position(ErrorCode::INVALID_UNICODE_CODE_POINT);
                return false;
            }
        }
        return true;
    }

    constexpr bool parse_str_raw(std::string& scratch, Reference& out, Error& err) {
        return parse_str_bytes(scratch, false, out, err);
    }

    constexpr bool ignore_str(Error& err) {
        for (;;) {
            skip_to_escape();
            if (m_index == m_size) {
                err = error_at_position(ErrorCode::EOF_WHILE_PARSING_STRING);
                return false;
            }
            switch (at(m_index)) {
            case '"':
                ++m_index;
                return true;
            case '\\':
                ++m_index;
                if (!string_detail::ignore_escape(*this, err)) {
                    return false;
                }
                break;
            default:
                ++m_index;
                err = error_at_position(ErrorCode::CONTROL_CHARACTER_IN_STRING);
                return false;
            }
        }
    }

    constexpr bool decode_hex_escape(std::uint16_t& out, Error& err) {
        if (m_size - m_index < 4) {
            m_index = m_size;
            err = error_at_position(ErrorCode::EOF_WHILE_PARSING_STRING);
            return false;
        }
        std::uint16_t n = 0;
        for (int i = 0; i < 4; ++i) {
            const int v = string_detail::hex_value(at(m_index));
            ++m_index;
            if (v < 0) {
                err = error_at_position(ErrorCode::INVALID_ESCAPE);
                return false;
            }
            n = static_cast<std::uint16_t>((n << 4) + v);
        }
        out = n;
        return true;
    }

    // Replaying is possible, so instead of latching, everything after the
    // failure point is dropped and iteration ends there.
    constexpr void set_failed() {
        m_size = m_index;
    }

    constexpr bool failed() const {
        return false;
    }

private:
    const char* m_data;
    std::size_t m_size;
    std::size_t m_index = 0;

    constexpr std::uint8_t at(std::size_t i) const {
        return static_cast<std::uint8_t>(m_data[i]);
    }

    constexpr Position position_of_index(std::size_t i) const {
        Position p{1, 0};
        for (std::size_t k = 0; k < i; ++k) {
            if (m_data[k] == '\n') {
                ++p.line;
                p.column = 0;
            } else {
                ++p.column;
            }
        }
        return p;
    }

    constexpr void skip_to_escape() {
        while (m_index < m_size && !string_detail::needs_escape_handling(at(m_index))) {
            ++m_index;
        }
    }

    constexpr bool parse_str_bytes(std::string& scratch, bool validate, Reference& out, Error& err) {
        std::size_t start = m_index;
        for (;;) {
            skip_to_escape();
            if (m_index == m_size) {
                err = error_at_position(ErrorCode::EOF_WHILE_PARSING_STRING);
                return false;
            }
            switch (at(m_index)) {
            case '"':
                if (scratch.empty()) {
                    out = Reference::borrowed(std::string_view(m_data + start, m_index - start));
                } else {
                    scratch.append(m_data + start, m_index - start);
                    out = Reference::copied(scratch);
                }
                ++m_index;
                return true;
            case '\\':
                scratch.append(m_data + start, m_index - start);
                ++m_index;
                if (!string_detail::parse_escape(*this, validate, scratch, err)) {
                    return false;
                }
                start = m_index;
                break;
            default:
                ++m_index;
                if (validate) {
                    err = error_at_position(ErrorCode::CONTROL_CHARACTER_IN_STRING);
                    return false;
                }
                // raw mode keeps control characters as they are
                break;
            }
        }
    }
};

/// Slice of bytes of unknown encoding; text extraction validates UTF-8.
using SliceSource = MemorySource<false>;

/// Text already known to be valid UTF-8.
using StrSource = MemorySource<true>;

static_assert(source::SourceLike<SliceSource>);
static_assert(source::SourceLike<StrSource>);

} // namespace JsonDescent
