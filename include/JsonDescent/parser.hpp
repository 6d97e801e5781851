#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string_view>
#include <utility>

#include "deserialize.hpp"
#include "deserializer.hpp"
#include "io.hpp"
#include "parse_result.hpp"
#include "slice_source.hpp"
#include "source_concept.hpp"
#include "stream_source.hpp"

namespace JsonDescent {

/// Reads exactly one value of type T; anything but whitespace after it is
/// TRAILING_CHARACTERS.
template <class T, source::SourceLike Source>
constexpr ParseResult FromSource(T& obj, Source source) {
    Deserializer<Source> de(std::move(source));
    if (!Deserialize<T>::deserialize(de, obj) || !de.end()) {
        return ParseResult(de.error(), de.byte_offset());
    }
    return ParseResult(Error{}, de.byte_offset());
}

template <class T>
constexpr ParseResult Parse(T& obj, std::string_view input) {
    return FromSource(obj, SliceSource(input));
}

template <class T>
ParseResult ParseBytes(T& obj, const std::uint8_t* data, std::size_t size) {
    return FromSource(obj, SliceSource(data, size));
}

/// `input` must already be valid UTF-8; extracted strings are not checked again.
template <class T>
constexpr ParseResult ParseUtf8(T& obj, std::string_view input) {
    return FromSource(obj, StrSource(input));
}

template <class T>
ParseResult ParseStream(T& obj, std::istream& in) {
    return FromSource(obj, IstreamSource(IstreamReader(in)));
}

} // namespace JsonDescent
