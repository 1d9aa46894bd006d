#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "annotated.hpp"
#include "const_string.hpp"
#include "struct_introspection.hpp"

namespace JsonFork {

// Runtime knobs, threaded by const reference through every decode hook.
struct DecodeOptions {
    // Fail on object members that map to no field, even when an unknown_members sink exists.
    bool reject_unknown_members = false;
    // Bytes buffered per branch while an Either duplicates a composite value.
    std::size_t tee_capacity = 4096;
};

struct EncodeOptions {
    // Empty means compact output.
    std::string indent;
};

namespace options {

namespace detail {

struct exclude_tag{};
struct key_tag{};
struct omit_zero_tag{};
struct unknown_members_tag{};

}

struct exclude {
    using tag = detail::exclude_tag;
    static constexpr std::string_view to_string() {
        return "exclude";
    }
};

template<ConstString Desc>
struct key {
    static_assert(Desc.check(), "[[[ JsonFork ]]] key contains control characters");
    using tag = detail::key_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "key";
    }
};

struct omit_zero {
    using tag = detail::omit_zero_tag;
    static constexpr std::string_view to_string() {
        return "omit_zero";
    }
};

// Marks a std::map<std::string, RawValue> member that collects unrecognized members.
struct unknown_members {
    using tag = detail::unknown_members_tag;
    static constexpr std::string_view to_string() {
        return "unknown_members";
    }
};

namespace detail {

template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};


template<class Tag, class... Opts>
struct find_option_by_tag;

template<class Tag>
struct find_option_by_tag<Tag> {
    using type = void;
};

template<class Tag, class First, class... Rest>
struct find_option_by_tag<Tag, First, Rest...> {
private:
    using next = typename find_option_by_tag<Tag, Rest...>::type;

public:
    using type = std::conditional_t<
        option_matches_tag<First, Tag>::value,
        First,
        next
        >;
};

struct no_options {
    template<class Tag>
    static constexpr bool has_option = false;

    template<class Tag>
    using get_option = void;
};

template<class OptPack> struct field_options;
template<class... Opts>
struct field_options<OptionsPack<Opts...>> {

    template<class Tag>
    using option_type = typename detail::find_option_by_tag<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = !std::is_void_v<option_type<Tag>>;

    template<class Tag>
    using get_option = option_type<Tag>;
};


template<class Field>
struct annotation_meta {
    using value_t = Field;
    using options = no_options;
    static constexpr decltype(auto) getRef(Field & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const Field & f) {
        return (f);
    }
};

template<class T, class... Opts>
struct annotation_meta<std::optional<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ JsonFork ]]] Use Annotated<std::optional<T>, ...> instead of std::optional<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using value_t = T;
    using options = field_options<OptionsPack<Opts...>>;

    static constexpr decltype(auto) getRef(Annotated<T, Opts...> & f) {
        return (f.value);
    }
    static constexpr decltype(auto) getRef(const Annotated<T, Opts...> & f) {
        return (f.value);
    }
};

template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};

template<class AggregateT, std::size_t Index>
using aggregate_field_opts_getter = typename annotation_meta_getter<
    introspection::structureElementTypeByIndex<Index, std::remove_cvref_t<AggregateT>>
>::options;

} // namespace detail

} // namespace options

} // namespace JsonFork
