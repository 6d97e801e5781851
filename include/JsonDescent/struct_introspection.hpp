#pragma once

#include <cstddef>
#include <string_view>
#include <type_traits>
#include <utility>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

namespace JsonDescent {

namespace introspection {

/// Aggregates whose members are reachable through pfr are read field by
/// field, keyed by the member names pfr recovers.
template <class T>
concept ReflectableStruct = std::is_aggregate_v<T> && std::is_class_v<T> && !std::is_array_v<T>;

namespace detail {

template <class T>
struct IntrospectionImpl {
    using StructT = std::remove_cv_t<T>;

    template <std::size_t Index>
    static constexpr decltype(auto) getStructElementByIndex(StructT& s) {
        return (pfr::get<Index>(s));
    }

    static constexpr std::size_t structureElementsCount = pfr::tuple_size_v<StructT>;

    template <std::size_t Index>
    using structureElementTypeByIndex = pfr::tuple_element_t<Index, StructT>;

    template <std::size_t Index>
    static constexpr std::string_view structureElementNameByIndex = pfr::get_name<Index, StructT>();
};

} // namespace detail

template <std::size_t Index, class StructT>
constexpr decltype(auto) getStructElementByIndex(StructT& s) {
    return (detail::IntrospectionImpl<StructT>::template getStructElementByIndex<Index>(s));
}

template <class StructT>
inline constexpr std::size_t structureElementsCount =
    detail::IntrospectionImpl<std::remove_cv_t<StructT>>::structureElementsCount;

template <std::size_t Index, class StructT>
using structureElementTypeByIndex =
    typename detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementTypeByIndex<Index>;

template <std::size_t Index, class StructT>
inline constexpr std::string_view structureElementNameByIndex =
    detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementNameByIndex<Index>;

inline constexpr std::size_t NOT_A_FIELD = static_cast<std::size_t>(-1);

namespace detail {

template <class T, std::size_t... Is>
constexpr std::size_t field_index_impl(std::string_view name, std::index_sequence<Is...>) {
    std::size_t result = NOT_A_FIELD;
    (
        [&] {
            if (result == NOT_A_FIELD && structureElementNameByIndex<Is, T> == name) {
                result = Is;
            }
        }(),
        ...);
    return result;
}

} // namespace detail

/// Index of the member called `name`, or NOT_A_FIELD.
template <class T>
constexpr std::size_t field_index(std::string_view name) {
    return detail::field_index_impl<T>(name, std::make_index_sequence<structureElementsCount<T>>{});
}

/// Calls f(std::integral_constant<std::size_t, I>{}) for the member at a
/// runtime index. Returns f's result, or `otherwise` when out of range.
template <class T, class F>
constexpr bool visit_field(std::size_t index, F&& f, bool otherwise = false) {
    bool result = otherwise;
    [&]<std::size_t... Is>(std::index_sequence<Is...>) {
        (
            [&] {
                if (index == Is) {
                    result = f(std::integral_constant<std::size_t, Is>{});
                }
            }(),
            ...);
    }(std::make_index_sequence<structureElementsCount<T>>{});
    return result;
}

} // namespace introspection

} // namespace JsonDescent
