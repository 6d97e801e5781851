#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "deserialize.hpp"
#include "errors.hpp"
#include "visitor.hpp"

namespace JsonDescent {

/// A JSON number exactly as the numeric parser classified it.
class Number {
public:
    enum class Kind {
        unsigned_integer,
        signed_integer,
        floating
    };

    constexpr Number() = default;

    static constexpr Number from_u64(std::uint64_t v) {
        Number n;
        n.m_kind = Kind::unsigned_integer;
        n.m_u = v;
        return n;
    }
    static constexpr Number from_i64(std::int64_t v) {
        Number n;
        n.m_kind = Kind::signed_integer;
        n.m_i = v;
        return n;
    }
    static constexpr Number from_f64(double v) {
        Number n;
        n.m_kind = Kind::floating;
        n.m_f = v;
        return n;
    }

    constexpr Kind kind() const { return m_kind; }
    constexpr bool is_u64() const { return m_kind == Kind::unsigned_integer; }
    constexpr bool is_i64() const { return m_kind == Kind::signed_integer; }
    constexpr bool is_f64() const { return m_kind == Kind::floating; }

    constexpr std::optional<std::uint64_t> as_u64() const {
        if (is_u64()) {
            return m_u;
        }
        return std::nullopt;
    }
    constexpr std::optional<std::int64_t> as_i64() const {
        if (is_i64()) {
            return m_i;
        }
        if (is_u64() && m_u <= static_cast<std::uint64_t>(INT64_MAX)) {
            return static_cast<std::int64_t>(m_u);
        }
        return std::nullopt;
    }
    // Integers convert, possibly losing precision.
    constexpr double as_f64() const {
        switch (m_kind) {
        case Kind::unsigned_integer:
            return static_cast<double>(m_u);
        case Kind::signed_integer:
            return static_cast<double>(m_i);
        case Kind::floating:
            break;
        }
        return m_f;
    }

    constexpr bool operator==(const Number& other) const {
        if (m_kind != other.m_kind) {
            return false;
        }
        switch (m_kind) {
        case Kind::unsigned_integer:
            return m_u == other.m_u;
        case Kind::signed_integer:
            return m_i == other.m_i;
        case Kind::floating:
            break;
        }
        return m_f == other.m_f;
    }

private:
    Kind m_kind = Kind::unsigned_integer;
    std::uint64_t m_u = 0;
    std::int64_t m_i = 0;
    double m_f = 0;
};

class Value;

using Array = std::vector<Value>;

/// Object entries in document order. Inserting an existing key replaces its
/// value in place.
class Map {
public:
    using Entry = std::pair<std::string, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;

    void insert_or_assign(std::string key, Value value);
    const Value* find(std::string_view key) const;

    std::size_t size() const;
    bool empty() const;
    const_iterator begin() const;
    const_iterator end() const;

    // Entry order does not take part in comparison.
    bool operator==(const Map& other) const;

private:
    struct KeyHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view key) const { return std::hash<std::string_view>{}(key); }
    };

    // Entries keep insertion order; the index maps each key to its slot.
    std::vector<Entry> m_entries;
    std::unordered_map<std::string, std::size_t, KeyHash, std::equal_to<>> m_index;
};

/// Dynamically typed JSON document.
class Value {
public:
    enum class Type {
        null,
        boolean,
        number,
        string,
        array,
        object
    };

    Value() = default;
    explicit Value(bool v) : m_data(v) {}
    explicit Value(Number v) : m_data(v) {}
    explicit Value(std::string v) : m_data(std::move(v)) {}
    explicit Value(Array v) : m_data(std::move(v)) {}
    explicit Value(Map v) : m_data(std::move(v)) {}

    Type type() const { return static_cast<Type>(m_data.index()); }

    bool is_null() const { return type() == Type::null; }
    bool is_bool() const { return type() == Type::boolean; }
    bool is_number() const { return type() == Type::number; }
    bool is_string() const { return type() == Type::string; }
    bool is_array() const { return type() == Type::array; }
    bool is_object() const { return type() == Type::object; }

    const bool* as_bool() const { return std::get_if<bool>(&m_data); }
    const Number* as_number() const { return std::get_if<Number>(&m_data); }
    const std::string* as_string() const { return std::get_if<std::string>(&m_data); }
    const Array* as_array() const { return std::get_if<Array>(&m_data); }
    const Map* as_object() const { return std::get_if<Map>(&m_data); }

    /// Member lookup; null when this is not an object or the key is absent.
    const Value* find(std::string_view key) const {
        const Map* m = as_object();
        return m ? m->find(key) : nullptr;
    }

    bool operator==(const Value& other) const { return m_data == other.m_data; }

private:
    std::variant<std::monostate, bool, Number, std::string, Array, Map> m_data;
};

inline std::size_t Map::size() const {
    return m_entries.size();
}

inline bool Map::empty() const {
    return m_entries.empty();
}

inline Map::const_iterator Map::begin() const {
    return m_entries.begin();
}

inline Map::const_iterator Map::end() const {
    return m_entries.end();
}

inline void Map::insert_or_assign(std::string key, Value value) {
    auto [it, inserted] = m_index.try_emplace(key, m_entries.size());
    if (!inserted) {
        m_entries[it->second].second = std::move(value);
        return;
    }
    m_entries.emplace_back(std::move(key), std::move(value));
}

inline const Value* Map::find(std::string_view key) const {
    auto it = m_index.find(key);
    return it == m_index.end() ? nullptr : &m_entries[it->second].second;
}

inline bool Map::operator==(const Map& other) const {
    if (size() != other.size()) {
        return false;
    }
    for (const Entry& e : m_entries) {
        const Value* v = other.find(e.first);
        if (!v || !(*v == e.second)) {
            return false;
        }
    }
    return true;
}

template <>
struct Deserialize<Value> {
    template <class De>
    static bool deserialize(De& de, Value& out);
};

namespace value_detail {

struct ValueVisitor : Visitor<ValueVisitor> {
    Value* out;

    explicit ValueVisitor(Value& o) : out(&o) {}

    std::string_view expecting() const {
        return "any valid JSON value";
    }

    bool visit_unit(Error&) {
        *out = Value();
        return true;
    }
    bool visit_none(Error&) {
        *out = Value();
        return true;
    }
    bool visit_bool(bool v, Error&) {
        *out = Value(v);
        return true;
    }
    bool visit_u64(std::uint64_t v, Error&) {
        *out = Value(Number::from_u64(v));
        return true;
    }
    bool visit_i64(std::int64_t v, Error&) {
        *out = Value(Number::from_i64(v));
        return true;
    }
    bool visit_f64(double v, Error&) {
        *out = Value(Number::from_f64(v));
        return true;
    }
    bool visit_str(std::string_view v, Error&) {
        *out = Value(std::string(v));
        return true;
    }

    template <class De>
    bool visit_some(De& de, Error&) {
        return Deserialize<Value>::deserialize(de, *out);
    }

    template <class Seq>
    bool visit_seq(Seq& seq, Error&) {
        Array items;
        for (;;) {
            Value item;
            bool has = false;
            if (!seq.next_element(item, has)) {
                return false;
            }
            if (!has) {
                break;
            }
            items.push_back(std::move(item));
        }
        *out = Value(std::move(items));
        return true;
    }

    template <class MapA>
    bool visit_map(MapA& map, Error&) {
        Map entries;
        for (;;) {
            std::string key;
            bool has = false;
            if (!map.next_key(key, has)) {
                return false;
            }
            if (!has) {
                break;
            }
            Value item;
            if (!map.next_value(item)) {
                return false;
            }
            entries.insert_or_assign(std::move(key), std::move(item));
        }
        *out = Value(std::move(entries));
        return true;
    }
};

} // namespace value_detail

template <class De>
bool Deserialize<Value>::deserialize(De& de, Value& out) {
    value_detail::ValueVisitor visitor(out);
    return de.deserialize_any(visitor);
}

} // namespace JsonDescent
