#pragma once

#include <array>
#include <cstddef>
#include <string_view>
#include <utility>

#include "options.hpp"
#include "struct_introspection.hpp"

namespace JsonFork {

namespace struct_fields_helper {

template<class T, std::size_t I>
static consteval bool fieldIsNotJSON() {
    using Opts = options::detail::aggregate_field_opts_getter<T, I>;
    return Opts::template has_option<options::detail::exclude_tag>;
}

template<class T, std::size_t I>
static consteval bool fieldIsUnknownSink() {
    using Opts = options::detail::aggregate_field_opts_getter<T, I>;
    return Opts::template has_option<options::detail::unknown_members_tag>;
}

template<class T, std::size_t I>
static consteval bool fieldOmitsZero() {
    using Opts = options::detail::aggregate_field_opts_getter<T, I>;
    return Opts::template has_option<options::detail::omit_zero_tag>;
}

struct FieldDescr {
    std::string_view name;
    std::size_t index = 0;
};

template<class T>
struct FieldsHelper {
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    static constexpr std::size_t rawFieldsCount = introspection::structureElementsCount<T>;

    template<std::size_t I>
    static consteval bool isNamedField() {
        return !fieldIsNotJSON<T, I>() && !fieldIsUnknownSink<T, I>();
    }

    static constexpr std::size_t fieldsCount = []<std::size_t... I>(std::index_sequence<I...>) consteval {
        return (std::size_t{0} + ... + (isNamedField<I>() ? 1 : 0));
    }(std::make_index_sequence<rawFieldsCount>{});

    template<std::size_t I>
    static consteval std::string_view fieldName() {
        using Opts = options::detail::aggregate_field_opts_getter<T, I>;
        if constexpr (Opts::template has_option<options::detail::key_tag>) {
            using KeyOpt = typename Opts::template get_option<options::detail::key_tag>;
            return KeyOpt::desc.toStringView();
        } else {
            return introspection::structureElementNameByIndex<I, T>;
        }
    }

    static constexpr std::array<FieldDescr, fieldsCount> fieldIndexesToFieldNames =
        []<std::size_t... I>(std::index_sequence<I...>) consteval {
            std::array<FieldDescr, fieldsCount> arr{};
            std::size_t index = 0;
            auto add_one = [&](auto ic) consteval {
                constexpr std::size_t J = decltype(ic)::value;
                if constexpr (isNamedField<J>()) {
                    arr[index++] = FieldDescr{ fieldName<J>(), J };
                }
            };
            (add_one(std::integral_constant<std::size_t, I>{}), ...);
            return arr;
        }(std::make_index_sequence<rawFieldsCount>{});

    static constexpr std::size_t unknownSinkIndex = []<std::size_t... I>(std::index_sequence<I...>) consteval {
        std::size_t found = npos;
        ((fieldIsUnknownSink<T, I>() && found == npos ? (found = I, 0) : 0), ...);
        return found;
    }(std::make_index_sequence<rawFieldsCount>{});

    // Position in fieldIndexesToFieldNames, or npos.
    static constexpr std::size_t find(std::string_view name) {
        for (std::size_t i = 0; i < fieldsCount; ++i) {
            if (fieldIndexesToFieldNames[i].name == name) {
                return i;
            }
        }
        return npos;
    }
};

} // namespace struct_fields_helper
} // namespace JsonFork
