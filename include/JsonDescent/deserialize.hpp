#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "errors.hpp"
#include "fp_parse.hpp"
#include "number_parser.hpp"
#include "struct_introspection.hpp"
#include "visitor.hpp"

namespace JsonDescent {

/// Owned byte string. Accepts a JSON string (escapes decoded, no UTF-8
/// check) or an array of small integers.
struct ByteBuf {
    std::vector<std::uint8_t> data;

    constexpr bool operator==(const ByteBuf&) const = default;
};

/// Accepts and discards any well-formed value.
struct IgnoredAny {};

/// The JSON `null` value.
struct Unit {
    constexpr bool operator==(const Unit&) const = default;
};

template <>
struct Deserialize<IgnoredAny> {
    template <class De>
    static constexpr bool deserialize(De& de, IgnoredAny& out);
};

namespace deserialize_detail {

template <class T>
struct is_optional : std::false_type {};
template <class T>
struct is_optional<std::optional<T>> : std::true_type {};

template <class T>
struct is_std_array : std::false_type {};
template <class T, std::size_t N>
struct is_std_array<std::array<T, N>> : std::true_type {};

template <class T>
concept CharacterType = std::is_same_v<T, char> || std::is_same_v<T, signed char> ||
                        std::is_same_v<T, unsigned char> || std::is_same_v<T, wchar_t> ||
                        std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t> ||
                        std::is_same_v<T, char32_t>;

// std::uint8_t is unsigned char; it is read as a number, plain char is not.
template <class T>
concept Integer = std::is_integral_v<T> && !std::is_same_v<T, bool> && sizeof(T) <= 8 &&
                  (!CharacterType<T> || std::is_same_v<T, signed char> || std::is_same_v<T, unsigned char>);

template <class T>
concept MapKeyType = Integer<T> || std::is_same_v<T, int128_t> || std::is_same_v<T, uint128_t> ||
                     std::is_same_v<T, std::string>;

template <class T>
concept StructType = introspection::ReflectableStruct<T> && !is_std_array<T>::value;

template <class Int>
constexpr std::string_view integer_name() {
    if constexpr (std::is_signed_v<Int>) {
        switch (sizeof(Int)) {
        case 1: return "i8";
        case 2: return "i16";
        case 4: return "i32";
        default: return "i64";
        }
    } else {
        switch (sizeof(Int)) {
        case 1: return "u8";
        case 2: return "u16";
        case 4: return "u32";
        default: return "u64";
        }
    }
}

template <class Int>
struct IntegerVisitor : Visitor<IntegerVisitor<Int>> {
    Int* out;

    constexpr explicit IntegerVisitor(Int& o) : out(&o) {}

    constexpr std::string_view expecting() const {
        return integer_name<Int>();
    }

    constexpr bool visit_u64(std::uint64_t v, Error& err) {
        if (v > static_cast<std::uint64_t>(std::numeric_limits<Int>::max())) {
            err = Error::invalid_value(Unexpected::unsigned_integer(v), expecting());
            return false;
        }
        *out = static_cast<Int>(v);
        return true;
    }

    constexpr bool visit_i64(std::int64_t v, Error& err) {
        bool in_range = false;
        if constexpr (std::is_signed_v<Int>) {
            in_range = v >= static_cast<std::int64_t>(std::numeric_limits<Int>::min()) &&
                       v <= static_cast<std::int64_t>(std::numeric_limits<Int>::max());
        } else {
            in_range = v >= 0 && static_cast<std::uint64_t>(v) <= static_cast<std::uint64_t>(std::numeric_limits<Int>::max());
        }
        if (!in_range) {
            err = Error::invalid_value(Unexpected::signed_integer(v), expecting());
            return false;
        }
        *out = static_cast<Int>(v);
        return true;
    }
};

template <class Wide>
struct Integer128Visitor : Visitor<Integer128Visitor<Wide>> {
    Wide* out;

    constexpr explicit Integer128Visitor(Wide& o) : out(&o) {}

    constexpr std::string_view expecting() const {
        return std::is_same_v<Wide, int128_t> ? "i128" : "u128";
    }

    constexpr bool visit_u64(std::uint64_t v, Error&) {
        *out = static_cast<Wide>(v);
        return true;
    }

    constexpr bool visit_i64(std::int64_t v, Error& err) {
        if constexpr (std::is_same_v<Wide, uint128_t>) {
            if (v < 0) {
                err = Error::invalid_value(Unexpected::signed_integer(v), expecting());
                return false;
            }
        }
        *out = static_cast<Wide>(v);
        return true;
    }

    constexpr bool visit_u128(uint128_t v, Error& err) {
        if constexpr (std::is_same_v<Wide, int128_t>) {
            if (v > (uint128_t{1} << 127) - 1) {
                err = Error::invalid_value(Unexpected::other("128-bit integer"), expecting());
                return false;
            }
        }
        *out = static_cast<Wide>(v);
        return true;
    }

    constexpr bool visit_i128(int128_t v, Error& err) {
        if constexpr (std::is_same_v<Wide, uint128_t>) {
            if (v < 0) {
                err = Error::invalid_value(Unexpected::other("128-bit integer"), expecting());
                return false;
            }
        }
        *out = static_cast<Wide>(v);
        return true;
    }
};

template <class F>
struct FloatVisitor : Visitor<FloatVisitor<F>> {
    F* out;

    constexpr explicit FloatVisitor(F& o) : out(&o) {}

    constexpr std::string_view expecting() const {
        return std::is_same_v<F, float> ? "f32" : "f64";
    }
    constexpr bool visit_u64(std::uint64_t v, Error&) {
        *out = static_cast<F>(v);
        return true;
    }
    constexpr bool visit_i64(std::int64_t v, Error&) {
        *out = static_cast<F>(v);
        return true;
    }
    constexpr bool visit_f64(double v, Error&) {
        *out = static_cast<F>(v);
        return true;
    }
};

struct BoolVisitor : Visitor<BoolVisitor> {
    bool* out;

    constexpr explicit BoolVisitor(bool& o) : out(&o) {}

    constexpr std::string_view expecting() const {
        return "a boolean";
    }
    constexpr bool visit_bool(bool v, Error&) {
        *out = v;
        return true;
    }
};

struct StringVisitor : Visitor<StringVisitor> {
    std::string* out;

    constexpr explicit StringVisitor(std::string& o) : out(&o) {}

    constexpr std::string_view expecting() const {
        return "a string";
    }
    constexpr bool visit_str(std::string_view v, Error&) {
        out->assign(v.data(), v.size());
        return true;
    }
};

// Only a string that could be returned without copying points into the input.
struct BorrowedStrVisitor : Visitor<BorrowedStrVisitor> {
    std::string_view* out;

    constexpr explicit BorrowedStrVisitor(std::string_view& o) : out(&o) {}

    constexpr std::string_view expecting() const {
        return "a borrowed string";
    }
    constexpr bool visit_borrowed_str(std::string_view v, Error&) {
        *out = v;
        return true;
    }
};

struct ByteBufVisitor : Visitor<ByteBufVisitor> {
    ByteBuf* out;

    constexpr explicit ByteBufVisitor(ByteBuf& o) : out(&o) {}

    constexpr std::string_view expecting() const {
        return "a byte array";
    }
    constexpr bool visit_bytes(std::string_view v, Error&) {
        out->data.assign(v.begin(), v.end());
        return true;
    }
    constexpr bool visit_str(std::string_view v, Error&) {
        out->data.assign(v.begin(), v.end());
        return true;
    }
    template <class Seq>
    constexpr bool visit_seq(Seq& seq, Error&) {
        out->data.clear();
        for (;;) {
            std::uint8_t byte = 0;
            bool has = false;
            if (!seq.next_element(byte, has)) {
                return false;
            }
            if (!has) {
                return true;
            }
            out->data.push_back(byte);
        }
    }
};

struct IgnoredAnyVisitor : Visitor<IgnoredAnyVisitor> {
    constexpr std::string_view expecting() const {
        return "anything at all";
    }
    constexpr bool visit_unit(Error&) { return true; }
    constexpr bool visit_bool(bool, Error&) { return true; }
    constexpr bool visit_u64(std::uint64_t, Error&) { return true; }
    constexpr bool visit_i64(std::int64_t, Error&) { return true; }
    constexpr bool visit_u128(uint128_t, Error&) { return true; }
    constexpr bool visit_i128(int128_t, Error&) { return true; }
    constexpr bool visit_f64(double, Error&) { return true; }
    constexpr bool visit_str(std::string_view, Error&) { return true; }
    constexpr bool visit_bytes(std::string_view, Error&) { return true; }
    constexpr bool visit_none(Error&) { return true; }

    template <class De>
    constexpr bool visit_some(De& de, Error&) {
        IgnoredAny ignored;
        return Deserialize<IgnoredAny>::deserialize(de, ignored);
    }
    template <class De>
    constexpr bool visit_newtype_struct(De& de, Error&) {
        IgnoredAny ignored;
        return Deserialize<IgnoredAny>::deserialize(de, ignored);
    }
    template <class Seq>
    constexpr bool visit_seq(Seq& seq, Error&) {
        for (;;) {
            IgnoredAny ignored;
            bool has = false;
            if (!seq.next_element(ignored, has)) {
                return false;
            }
            if (!has) {
                return true;
            }
        }
    }
    template <class Map>
    constexpr bool visit_map(Map& map, Error&) {
        for (;;) {
            IgnoredAny key;
            bool has = false;
            if (!map.next_key(key, has)) {
                return false;
            }
            if (!has) {
                return true;
            }
            IgnoredAny value;
            if (!map.next_value(value)) {
                return false;
            }
        }
    }
};

template <class T>
struct OptionVisitor : Visitor<OptionVisitor<T>> {
    std::optional<T>* out;

    constexpr explicit OptionVisitor(std::optional<T>& o) : out(&o) {}

    constexpr std::string_view expecting() const {
        return "option";
    }
    constexpr bool visit_none(Error&) {
        out->reset();
        return true;
    }
    template <class De>
    constexpr bool visit_some(De& de, Error&) {
        return Deserialize<T>::deserialize(de, out->emplace());
    }
};

template <class T>
struct VectorVisitor : Visitor<VectorVisitor<T>> {
    std::vector<T>* out;

    constexpr explicit VectorVisitor(std::vector<T>& o) : out(&o) {}

    constexpr std::string_view expecting() const {
        return "a sequence";
    }
    template <class Seq>
    constexpr bool visit_seq(Seq& seq, Error&) {
        out->clear();
        for (;;) {
            T value{};
            bool has = false;
            if (!seq.next_element(value, has)) {
                return false;
            }
            if (!has) {
                return true;
            }
            out->push_back(std::move(value));
        }
    }
};

template <class T, std::size_t N>
struct ArrayVisitor : Visitor<ArrayVisitor<T, N>> {
    std::array<T, N>* out;

    constexpr explicit ArrayVisitor(std::array<T, N>& o) : out(&o) {}

    constexpr std::string_view expecting() const {
        return "an array";
    }
    template <class Seq>
    constexpr bool visit_seq(Seq& seq, Error& err) {
        for (std::size_t i = 0; i < N; ++i) {
            bool has = false;
            if (!seq.next_element((*out)[i], has)) {
                return false;
            }
            if (!has) {
                std::string expected = "an array of length ";
                fp_parse_detail::append_decimal(expected, N);
                err = Error::invalid_length(i, expected);
                return false;
            }
        }
        return true;
    }
};

// Later duplicates of a key replace earlier ones.
template <class MapT>
struct MapVisitor : Visitor<MapVisitor<MapT>> {
    MapT* out;

    constexpr explicit MapVisitor(MapT& o) : out(&o) {}

    constexpr std::string_view expecting() const {
        return "a map";
    }
    template <class Map>
    constexpr bool visit_map(Map& map, Error&) {
        out->clear();
        for (;;) {
            typename MapT::key_type key{};
            bool has = false;
            if (!map.next_key(key, has)) {
                return false;
            }
            if (!has) {
                return true;
            }
            typename MapT::mapped_type value{};
            if (!map.next_value(value)) {
                return false;
            }
            out->insert_or_assign(std::move(key), std::move(value));
        }
    }
};

/// Aggregate struct, read either from an object keyed by member name or
/// from an array holding the members in declaration order.
template <class T>
struct StructVisitor : Visitor<StructVisitor<T>> {
    static constexpr std::size_t FieldCount = introspection::structureElementsCount<T>;

    T* out;

    constexpr explicit StructVisitor(T& o) : out(&o) {}

    constexpr std::string_view expecting() const {
        return "a struct";
    }

    template <class Seq>
    constexpr bool visit_seq(Seq& seq, Error& err) {
        bool ok = true;
        [&]<std::size_t... Is>(std::index_sequence<Is...>) {
            ((ok = ok && read_positional<Is>(seq, err)), ...);
        }(std::make_index_sequence<FieldCount>{});
        return ok;
    }

    template <class Map>
    constexpr bool visit_map(Map& map, Error& err) {
        std::array<bool, FieldCount> seen{};
        std::string key;
        for (;;) {
            key.clear();
            bool has = false;
            if (!map.next_key(key, has)) {
                return false;
            }
            if (!has) {
                break;
            }
            const std::size_t index = introspection::field_index<T>(key);
            if (index == introspection::NOT_A_FIELD) {
                IgnoredAny ignored;
                if (!map.next_value(ignored)) {
                    return false;
                }
                continue;
            }
            if (seen[index]) {
                err = Error::duplicate_field(key);
                return false;
            }
            seen[index] = true;
            const bool read = introspection::visit_field<T>(index, [&](auto I) {
                return map.next_value(introspection::getStructElementByIndex<decltype(I)::value>(*out));
            });
            if (!read) {
                return false;
            }
        }

        bool ok = true;
        [&]<std::size_t... Is>(std::index_sequence<Is...>) {
            ((ok = ok && check_present<Is>(seen, err)), ...);
        }(std::make_index_sequence<FieldCount>{});
        return ok;
    }

private:
    template <std::size_t I, class Seq>
    constexpr bool read_positional(Seq& seq, Error& err) {
        bool has = false;
        if (!seq.next_element(introspection::getStructElementByIndex<I>(*out), has)) {
            return false;
        }
        if (!has) {
            std::string expected = "struct with ";
            fp_parse_detail::append_decimal(expected, FieldCount);
            expected += " elements";
            err = Error::invalid_length(I, expected);
            return false;
        }
        return true;
    }

    // Absent optional members read as empty.
    template <std::size_t I>
    constexpr bool check_present(const std::array<bool, FieldCount>& seen, Error& err) {
        if (seen[I]) {
            return true;
        }
        using FieldT = introspection::structureElementTypeByIndex<I, T>;
        if constexpr (is_optional<FieldT>::value) {
            introspection::getStructElementByIndex<I>(*out).reset();
            return true;
        } else {
            err = Error::missing_field(introspection::structureElementNameByIndex<I, T>);
            return false;
        }
    }
};

} // namespace deserialize_detail


template <>
struct Deserialize<bool> {
    template <class De>
    static constexpr bool deserialize(De& de, bool& out) {
        deserialize_detail::BoolVisitor visitor(out);
        return de.deserialize_bool(visitor);
    }
};

template <class T>
    requires deserialize_detail::Integer<T>
struct Deserialize<T> {
    template <class De>
    static constexpr bool deserialize(De& de, T& out) {
        deserialize_detail::IntegerVisitor<T> visitor(out);
        return de.template deserialize_integer<T>(visitor);
    }
};

template <>
struct Deserialize<int128_t> {
    template <class De>
    static constexpr bool deserialize(De& de, int128_t& out) {
        deserialize_detail::Integer128Visitor<int128_t> visitor(out);
        return de.deserialize_i128(visitor);
    }
};

template <>
struct Deserialize<uint128_t> {
    template <class De>
    static constexpr bool deserialize(De& de, uint128_t& out) {
        deserialize_detail::Integer128Visitor<uint128_t> visitor(out);
        return de.deserialize_u128(visitor);
    }
};

template <>
struct Deserialize<float> {
    template <class De>
    static constexpr bool deserialize(De& de, float& out) {
        deserialize_detail::FloatVisitor<float> visitor(out);
        return de.template deserialize_float<float>(visitor);
    }
};

template <>
struct Deserialize<double> {
    template <class De>
    static constexpr bool deserialize(De& de, double& out) {
        deserialize_detail::FloatVisitor<double> visitor(out);
        return de.template deserialize_float<double>(visitor);
    }
};

template <>
struct Deserialize<std::string> {
    template <class De>
    static constexpr bool deserialize(De& de, std::string& out) {
        deserialize_detail::StringVisitor visitor(out);
        return de.deserialize_string(visitor);
    }
};

template <>
struct Deserialize<std::string_view> {
    template <class De>
    static constexpr bool deserialize(De& de, std::string_view& out) {
        deserialize_detail::BorrowedStrVisitor visitor(out);
        return de.deserialize_str(visitor);
    }
};

template <>
struct Deserialize<ByteBuf> {
    template <class De>
    static constexpr bool deserialize(De& de, ByteBuf& out) {
        deserialize_detail::ByteBufVisitor visitor(out);
        return de.deserialize_byte_buf(visitor);
    }
};

template <>
struct Deserialize<Unit> {
    template <class De>
    static constexpr bool deserialize(De& de, Unit&) {
        UnitVisitor visitor;
        return de.deserialize_unit(visitor);
    }
};

template <>
struct Deserialize<std::monostate> {
    template <class De>
    static constexpr bool deserialize(De& de, std::monostate&) {
        UnitVisitor visitor;
        return de.deserialize_unit(visitor);
    }
};

template <class De>
constexpr bool Deserialize<IgnoredAny>::deserialize(De& de, IgnoredAny&) {
    deserialize_detail::IgnoredAnyVisitor visitor;
    return de.deserialize_ignored_any(visitor);
}

template <class T>
struct Deserialize<std::optional<T>> {
    template <class De>
    static constexpr bool deserialize(De& de, std::optional<T>& out) {
        deserialize_detail::OptionVisitor<T> visitor(out);
        return de.deserialize_option(visitor);
    }
};

template <class T>
struct Deserialize<std::unique_ptr<T>> {
    template <class De>
    static constexpr bool deserialize(De& de, std::unique_ptr<T>& out) {
        auto value = std::make_unique<T>();
        if (!Deserialize<T>::deserialize(de, *value)) {
            return false;
        }
        out = std::move(value);
        return true;
    }
};

template <class T>
struct Deserialize<std::vector<T>> {
    template <class De>
    static constexpr bool deserialize(De& de, std::vector<T>& out) {
        deserialize_detail::VectorVisitor<T> visitor(out);
        return de.deserialize_seq(visitor);
    }
};

template <class T, std::size_t N>
struct Deserialize<std::array<T, N>> {
    template <class De>
    static constexpr bool deserialize(De& de, std::array<T, N>& out) {
        deserialize_detail::ArrayVisitor<T, N> visitor(out);
        return de.deserialize_tuple(N, visitor);
    }
};

template <class K, class V, class Cmp, class Alloc>
    requires deserialize_detail::MapKeyType<K>
struct Deserialize<std::map<K, V, Cmp, Alloc>> {
    using MapT = std::map<K, V, Cmp, Alloc>;

    template <class De>
    static bool deserialize(De& de, MapT& out) {
        deserialize_detail::MapVisitor<MapT> visitor(out);
        return de.deserialize_map(visitor);
    }
};

template <class K, class V, class Hash, class Eq, class Alloc>
    requires deserialize_detail::MapKeyType<K>
struct Deserialize<std::unordered_map<K, V, Hash, Eq, Alloc>> {
    using MapT = std::unordered_map<K, V, Hash, Eq, Alloc>;

    template <class De>
    static bool deserialize(De& de, MapT& out) {
        deserialize_detail::MapVisitor<MapT> visitor(out);
        return de.deserialize_map(visitor);
    }
};

template <class T>
    requires deserialize_detail::StructType<T>
struct Deserialize<T> {
    template <class De>
    static constexpr bool deserialize(De& de, T& out) {
        deserialize_detail::StructVisitor<T> visitor(out);
        return de.deserialize_struct(visitor);
    }
};

} // namespace JsonDescent
