#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "io.hpp"
#include "source_concept.hpp"
#include "string_decoding.hpp"

#ifndef JSONDESCENT_STREAM_BUFFER_SIZE
#define JSONDESCENT_STREAM_BUFFER_SIZE 4096
#endif

namespace JsonDescent {

/// Incremental source over a ByteReaderLike. Nothing can be borrowed: every
/// string is decoded into the scratch buffer. Line and column are counted as
/// bytes are pulled, including the one held as lookahead.
template <ByteReaderLike Reader>
class StreamSource {
public:
    static constexpr bool fail_fast = true;
    static constexpr std::size_t BufferSize = JSONDESCENT_STREAM_BUFFER_SIZE;

    explicit StreamSource(Reader reader) : m_reader(std::move(reader)) {}

    bool peek(std::optional<std::uint8_t>& out, Error& err) {
        if (!m_peeked) {
            if (!pull(m_peeked, err)) {
                return false;
            }
        }
        out = m_peeked;
        return true;
    }

    bool next(std::optional<std::uint8_t>& out, Error& err) {
        if (m_peeked) {
            out = m_peeked;
            m_peeked.reset();
            return true;
        }
        return pull(out, err);
    }

    void discard() {
        m_peeked.reset();
    }

    Position position() const {
        return Position{m_line, m_column};
    }

    Position peek_position() const {
        // the lookahead byte is already counted
        return position();
    }

    std::size_t byte_offset() const {
        return m_consumed - (m_peeked ? 1 : 0);
    }

    Error error_at_position(ErrorCode code) const {
        return Error::syntax(code, m_line, m_column);
    }

    bool parse_str(std::string& scratch, Reference& out, Error& err) {
        if (!parse_str_bytes(scratch, true, err)) {
            return false;
        }
        if (!string_detail::is_valid_utf8(scratch)) {
            err = error_at_position(ErrorCode::INVALID_UNICODE_CODE_POINT);
            return false;
        }
        out = Reference::copied(scratch);
        return true;
    }

    bool parse_str_raw(std::string& scratch, Reference& out, Error& err) {
        if (!parse_str_bytes(scratch, false, err)) {
            return false;
        }
        out = Reference::copied(scratch);
        return true;
    }

    bool ignore_str(Error& err) {
        for (;;) {
            std::optional<std::uint8_t> c;
            if (!next(c, err)) {
                return false;
            }
            if (!c) {
                err = error_at_position(ErrorCode::EOF_WHILE_PARSING_STRING);
                return false;
            }
            if (!string_detail::needs_escape_handling(*c)) {
                continue;
            }
            switch (*c) {
            case '"':
                return true;
            case '\\':
                if (!string_detail::ignore_escape(*this, err)) {
                    return false;
                }
                break;
            default:
                err = error_at_position(ErrorCode::CONTROL_CHARACTER_IN_STRING);
                return false;
            }
        }
    }

    bool decode_hex_escape(std::uint16_t& out, Error& err) {
        std::uint16_t n = 0;
        for (int i = 0; i < 4; ++i) {
            std::optional<std::uint8_t> c;
            if (!next(c, err)) {
                return false;
            }
            if (!c) {
                err = error_at_position(ErrorCode::EOF_WHILE_PARSING_STRING);
                return false;
            }
            const int v = string_detail::hex_value(*c);
            if (v < 0) {
                err = error_at_position(ErrorCode::INVALID_ESCAPE);
                return false;
            }
            n = static_cast<std::uint16_t>((n << 4) + v);
        }
        out = n;
        return true;
    }

    void set_failed() {
        m_failed = true;
    }

    bool failed() const {
        return m_failed;
    }

    Reader& reader() {
        return m_reader;
    }

private:
    Reader m_reader;
    std::array<char, BufferSize> m_buffer{};
    std::size_t m_pos = 0;
    std::size_t m_len = 0;
    bool m_eof = false;

    std::optional<std::uint8_t> m_peeked;
    std::size_t m_consumed = 0;
    std::size_t m_line = 1;
    std::size_t m_column = 0;
    bool m_failed = false;

    bool pull(std::optional<std::uint8_t>& out, Error& err) {
        if (m_pos == m_len) {
            if (m_eof) {
                out.reset();
                return true;
            }
            std::size_t got = 0;
            if (!m_reader.read_some(m_buffer.data(), m_buffer.size(), got)) {
                err = Error::io(m_reader.error_message());
                return false;
            }
            m_pos = 0;
            m_len = got;
            if (got == 0) {
                m_eof = true;
                out.reset();
                return true;
            }
        }
        const std::uint8_t c = static_cast<std::uint8_t>(m_buffer[m_pos++]);
        ++m_consumed;
        if (c == '\n') {
            ++m_line;
            m_column = 0;
        } else {
            ++m_column;
        }
        out = c;
        return true;
    }

    bool parse_str_bytes(std::string& scratch, bool validate, Error& err) {
        for (;;) {
            std::optional<std::uint8_t> c;
            if (!next(c, err)) {
                return false;
            }
            if (!c) {
                err = error_at_position(ErrorCode::EOF_WHILE_PARSING_STRING);
                return false;
            }
            if (!string_detail::needs_escape_handling(*c)) {
                scratch.push_back(static_cast<char>(*c));
                continue;
            }
            switch (*c) {
            case '"':
                return true;
            case '\\':
                if (!string_detail::parse_escape(*this, validate, scratch, err)) {
                    return false;
                }
                break;
            default:
                if (validate) {
                    err = error_at_position(ErrorCode::CONTROL_CHARACTER_IN_STRING);
                    return false;
                }
                scratch.push_back(static_cast<char>(*c));
                break;
            }
        }
    }
};

/// Stream source over a std::istream.
using IstreamSource = StreamSource<IstreamReader>;

static_assert(source::SourceLike<IstreamSource>);

} // namespace JsonDescent
