#pragma once

#include <cstdint>
#include <limits>
#include <string_view>
#include <utility>

#include "errors.hpp"
#include "number_parser.hpp"

namespace JsonDescent {

/// Deserialize<T> is specialized for every type that can be read out of a
/// deserializer. Implementations provide
///     template<class De> static constexpr bool deserialize(De& de, T& out);
/// which drives `de` with a visitor and returns false with the error stored
/// in the deserializer.
template <class T>
struct Deserialize;

/// Base for visitors: the callbacks the Deserializer makes once it has
/// recognized a value. Every callback returns true on success, or false after
/// storing an error in `err`. Unhandled callbacks reject the value as
/// INVALID_TYPE, naming Derived::expecting().
///
/// Derived classes hide the callbacks they accept:
///
///     struct BoolVisitor : Visitor<BoolVisitor> {
///         bool* out;
///         constexpr std::string_view expecting() const { return "a boolean"; }
///         constexpr bool visit_bool(bool v, Error&) { *out = v; return true; }
///     };
template <class Derived>
struct Visitor {
    constexpr Derived& self() {
        return static_cast<Derived&>(*this);
    }

    constexpr bool reject(Unexpected unexp, Error& err) {
        err = Error::invalid_type(std::move(unexp), self().expecting());
        return false;
    }

    constexpr bool visit_unit(Error& err) {
        return reject(Unexpected::of(Unexpected::Kind::unit), err);
    }
    constexpr bool visit_bool(bool v, Error& err) {
        return reject(Unexpected::boolean(v), err);
    }
    constexpr bool visit_u64(std::uint64_t v, Error& err) {
        return reject(Unexpected::unsigned_integer(v), err);
    }
    constexpr bool visit_i64(std::int64_t v, Error& err) {
        return reject(Unexpected::signed_integer(v), err);
    }
    constexpr bool visit_u128(uint128_t v, Error& err) {
        if (v <= std::numeric_limits<std::uint64_t>::max()) {
            return self().visit_u64(static_cast<std::uint64_t>(v), err);
        }
        return reject(Unexpected::other("128-bit integer"), err);
    }
    constexpr bool visit_i128(int128_t v, Error& err) {
        if (v >= std::numeric_limits<std::int64_t>::min() && v <= std::numeric_limits<std::int64_t>::max()) {
            return self().visit_i64(static_cast<std::int64_t>(v), err);
        }
        return reject(Unexpected::other("128-bit integer"), err);
    }
    constexpr bool visit_f64(double v, Error& err) {
        return reject(Unexpected::floating(v), err);
    }
    constexpr bool visit_str(std::string_view v, Error& err) {
        return reject(Unexpected::string(v), err);
    }
    constexpr bool visit_borrowed_str(std::string_view v, Error& err) {
        return self().visit_str(v, err);
    }
    constexpr bool visit_bytes(std::string_view, Error& err) {
        return reject(Unexpected::of(Unexpected::Kind::bytes), err);
    }
    constexpr bool visit_borrowed_bytes(std::string_view v, Error& err) {
        return self().visit_bytes(v, err);
    }
    constexpr bool visit_none(Error& err) {
        return reject(Unexpected::of(Unexpected::Kind::option), err);
    }
    template <class De>
    constexpr bool visit_some(De&, Error& err) {
        return reject(Unexpected::of(Unexpected::Kind::option), err);
    }
    template <class De>
    constexpr bool visit_newtype_struct(De&, Error& err) {
        return reject(Unexpected::of(Unexpected::Kind::newtype_struct), err);
    }
    template <class Seq>
    constexpr bool visit_seq(Seq&, Error& err) {
        return reject(Unexpected::of(Unexpected::Kind::seq), err);
    }
    template <class Map>
    constexpr bool visit_map(Map&, Error& err) {
        return reject(Unexpected::of(Unexpected::Kind::map), err);
    }
    template <class Enum>
    constexpr bool visit_enum(Enum&, Error& err) {
        return reject(Unexpected::of(Unexpected::Kind::enumeration), err);
    }
};

/// Accepts `null` and nothing else.
struct UnitVisitor : Visitor<UnitVisitor> {
    constexpr std::string_view expecting() const {
        return "unit";
    }
    constexpr bool visit_unit(Error&) {
        return true;
    }
};

} // namespace JsonDescent
