#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string_view>
#include <utility>

#include "deserialize.hpp"
#include "deserializer.hpp"
#include "errors.hpp"
#include "io.hpp"
#include "slice_source.hpp"
#include "source_concept.hpp"
#include "stream_source.hpp"

namespace JsonDescent {

enum class NextStatus {
    ok,
    end,
    error
};

/// Reads a sequence of whitespace-separated (or directly adjacent) JSON
/// values of type T from one source:
///
///     auto values = IterateValues<Value>(R"({"k": 3}1"cool" [0, 1])");
///     Value v;
///     while (values.next(v) == NextStatus::ok) { ... }
///
/// Numbers and literals must be followed by whitespace, a bracket, a quote,
/// a comma, a colon or end of input; objects, arrays and strings need no
/// separator. After a failed value a stream source stays failed and every
/// later call reports end; an in-memory source ends at the failure point.
template <source::SourceLike Source, class T>
class StreamDeserializer {
public:
    constexpr explicit StreamDeserializer(Source source) : m_de(std::move(source)) {}

    constexpr NextStatus next(T& out) {
        if constexpr (Source::fail_fast) {
            if (m_de.source().failed()) {
                return NextStatus::end;
            }
        }

        std::optional<std::uint8_t> peek;
        if (!m_de.parse_whitespace(peek)) {
            return latch(m_de.error());
        }
        if (!peek) {
            m_offset = m_de.byte_offset();
            return NextStatus::end;
        }

        const bool self_delineated = *peek == '{' || *peek == '[' || *peek == '"';
        m_offset = m_de.byte_offset();
        if (!Deserialize<T>::deserialize(m_de, out)) {
            return latch(m_de.error());
        }
        m_offset = m_de.byte_offset();

        if (self_delineated) {
            return NextStatus::ok;
        }
        Error err;
        if (!m_de.source().peek(peek, err)) {
            return latch(std::move(err));
        }
        if (!peek || is_value_boundary(*peek)) {
            return NextStatus::ok;
        }
        const Position p = m_de.source().peek_position();
        m_error = Error::syntax(ErrorCode::TRAILING_CHARACTERS, p.line, p.column);
        return NextStatus::error;
    }

    /// Bytes consumed so far: the start of the value being read, or the end
    /// of the last value read.
    constexpr std::size_t byte_offset() const {
        return m_offset;
    }

    constexpr const Error& error() const {
        return m_error;
    }

    constexpr Deserializer<Source>& deserializer() {
        return m_de;
    }

private:
    Deserializer<Source> m_de;
    Error m_error;
    std::size_t m_offset = 0;

    constexpr NextStatus latch(Error err) {
        m_error = std::move(err);
        m_de.source().set_failed();
        return NextStatus::error;
    }

    static constexpr bool is_value_boundary(std::uint8_t c) {
        switch (c) {
        case ' ': case '\n': case '\t': case '\r':
        case '"': case '[': case ']': case '{': case '}': case ',': case ':':
            return true;
        default:
            return false;
        }
    }
};

template <class T>
constexpr StreamDeserializer<SliceSource, T> IterateValues(std::string_view input) {
    return StreamDeserializer<SliceSource, T>(SliceSource(input));
}

template <class T>
StreamDeserializer<IstreamSource, T> IterateValues(std::istream& in) {
    return StreamDeserializer<IstreamSource, T>(IstreamSource(IstreamReader(in)));
}

} // namespace JsonDescent
