#pragma once

#include <cstddef>
#include <string_view>
#include <type_traits>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

namespace JsonFork {
namespace introspection {

namespace detail {

template<class T>
struct IntrospectionImpl {
    using StructT = std::remove_cv_t<T>;

    template<std::size_t Index>
    static constexpr decltype(auto) getStructElementByIndex(StructT & s) {
        return (pfr::get<Index>(s));
    }

    template<std::size_t Index>
    static constexpr decltype(auto) getStructElementByIndex(const StructT & s) {
        return (pfr::get<Index>(s));
    }

    static constexpr std::size_t structureElementsCount = pfr::tuple_size_v<StructT>;

    template<std::size_t Index>
    using structureElementTypeByIndex = pfr::tuple_element_t<Index, StructT>;

    template<std::size_t Index>
    static constexpr std::string_view structureElementNameByIndex = pfr::get_name<Index, StructT>();
};

} // namespace detail

template<std::size_t Index, class StructT>
constexpr decltype(auto) getStructElementByIndex(StructT & s) {
    using Impl = detail::IntrospectionImpl<std::remove_cv_t<StructT>>;
    return (Impl::template getStructElementByIndex<Index>(s));
}

template<class StructT>
inline constexpr std::size_t structureElementsCount = detail::IntrospectionImpl<std::remove_cv_t<StructT>>::structureElementsCount;

template<std::size_t Index, class StructT>
using structureElementTypeByIndex = typename detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementTypeByIndex<Index>;

template<std::size_t Index, class StructT>
inline constexpr std::string_view structureElementNameByIndex = detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementNameByIndex<Index>;

} // namespace introspection
} // namespace JsonFork
