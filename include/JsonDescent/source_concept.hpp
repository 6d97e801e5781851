#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "errors.hpp"

namespace JsonDescent {

struct Position {
    std::size_t line = 1;
    std::size_t column = 0;
};

/// Result of a string extraction: either a view into the original input
/// (lives as long as the input) or a view into the engine's scratch buffer
/// (valid until the next extraction).
struct Reference {
    enum class Kind {
        borrowed,
        copied
    };

    Kind kind = Kind::copied;
    std::string_view text;

    static constexpr Reference borrowed(std::string_view s) {
        return Reference{Kind::borrowed, s};
    }
    static constexpr Reference copied(std::string_view s) {
        return Reference{Kind::copied, s};
    }
    constexpr bool is_borrowed() const {
        return kind == Kind::borrowed;
    }
};

namespace source {

/// SourceLike is the byte-level interface the Deserializer is generic over.
/// Every fallible operation returns false after storing the failure in `err`;
/// an empty optional from peek/next means end of input, which is not a failure.
template<typename S>
concept SourceLike = requires(S& s,
                              const S& cs,
                              std::optional<std::uint8_t>& byte,
                              std::string& scratch,
                              Reference& ref,
                              Error& err,
                              ErrorCode code) {
    // Sources that cannot rewind after a failed value latch instead
    { S::fail_fast } -> std::convertible_to<bool>;

    // ========== Byte Access ==========
    { s.peek(byte, err) } -> std::same_as<bool>;
    { s.next(byte, err) } -> std::same_as<bool>;
    { s.discard() } -> std::same_as<void>;

    // ========== Location ==========
    { cs.position() } -> std::same_as<Position>;
    { cs.peek_position() } -> std::same_as<Position>;
    { cs.byte_offset() } -> std::same_as<std::size_t>;
    { cs.error_at_position(code) } -> std::same_as<Error>;

    // ========== Strings (opening quote already consumed) ==========
    { s.parse_str(scratch, ref, err) } -> std::same_as<bool>;
    { s.parse_str_raw(scratch, ref, err) } -> std::same_as<bool>;
    { s.ignore_str(err) } -> std::same_as<bool>;

    // ========== Failure latch ==========
    { s.set_failed() } -> std::same_as<void>;
    { cs.failed() } -> std::same_as<bool>;
};

template<typename S>
constexpr bool is_source_like_v = SourceLike<S>;

} // namespace source

} // namespace JsonDescent
