#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>

#include "decode_result.hpp"
#include "options.hpp"

namespace JsonFork {

// Verbatim JSON text of one value, kept undecoded.
struct RawValue {
    std::string text;

    bool empty() const {
        return text.empty();
    }
    friend bool operator==(const RawValue&, const RawValue&) = default;
};

namespace static_schema {

template<class T>
using AnnotatedValue = typename options::detail::annotation_meta_getter<T>::value_t;

template<class T>
struct is_std_optional : std::false_type {};
template<class T>
struct is_std_optional<std::optional<T>> : std::true_type {};

template<class T>
struct is_std_array : std::false_type {};
template<class T, std::size_t N>
struct is_std_array<std::array<T, N>> : std::true_type {
    static constexpr std::size_t size = N;
};

// Customization points: a type decodes/encodes itself from/to the token stream.
template<class T, class Reader>
concept HasUnmarshalHook = requires(T & t, Reader & r, const DecodeOptions & o) {
    { t.json_unmarshal_from(r, o) } -> std::same_as<DecodeResult>;
};

template<class T, class Writer>
concept HasMarshalHook = requires(const T & t, Writer & w, const EncodeOptions & o) {
    { t.json_marshal_to(w, o) } -> std::same_as<EncodeResult>;
};

template<class C>
concept JsonBool = std::same_as<C, bool>;

template<class C>
concept JsonNumber = (std::is_integral_v<C> && !std::same_as<C, bool>) || std::is_floating_point_v<C>;

template<class C>
concept JsonString = std::same_as<C, std::string>;

template<class C>
concept JsonRaw = std::same_as<C, RawValue>;

template<class C>
concept JsonNullableValue = is_std_optional<C>::value;

template<class S>
concept ConsumingStreamerLike = requires(S & s, const typename S::value_type & v, bool ok) {
    typename S::value_type;
    { s.reset() };
    { s.consume(v) } -> std::same_as<bool>;
    { s.finalize(ok) } -> std::same_as<bool>;
};

template<class C>
concept JsonFixedArray = is_std_array<C>::value;

template<class C>
concept JsonDynamicArray = !JsonString<C> && requires(C & c) {
    typename C::value_type;
    c.emplace_back();
    c.clear();
    c.begin();
    c.end();
} && !requires { typename C::mapped_type; };

template<class C>
concept JsonMapKey = JsonString<C> || (std::is_integral_v<C> && !std::same_as<C, bool>);

template<class C>
concept JsonMap = requires(C & c, const typename C::key_type & k) {
    typename C::key_type;
    typename C::mapped_type;
    c.try_emplace(k);
    c.contains(k);
    c.clear();
} && JsonMapKey<typename C::key_type>;

template<class C>
concept JsonArray = JsonFixedArray<C> || JsonDynamicArray<C> || ConsumingStreamerLike<C>;

template<class C>
concept JsonObject = std::is_class_v<C> && std::is_aggregate_v<C>
    && !JsonString<C> && !JsonRaw<C> && !JsonNullableValue<C> && !JsonArray<C> && !JsonMap<C>;


// Element sinks used while decoding arrays: allocate_slot() hands out storage for
// the next element, commit() accepts it once decoded.
template<class C>
struct array_write_cursor;

template<JsonDynamicArray C>
struct array_write_cursor<C> {
    using element_type = typename C::value_type;
    C & container;

    void reset() {
        container.clear();
    }
    element_type * allocate_slot() {
        return &container.emplace_back();
    }
    bool commit() {
        return true;
    }
    bool finalize(bool) {
        return true;
    }
};

// Elements past the JSON array's length keep their zero value.
template<JsonFixedArray C>
struct array_write_cursor<C> {
    using element_type = typename C::value_type;
    C & container;
    std::size_t index = 0;

    void reset() {
        index = 0;
    }
    element_type * allocate_slot() {
        if (index >= container.size()) {
            return nullptr;
        }
        container[index] = element_type{};
        return &container[index++];
    }
    bool commit() {
        return true;
    }
    bool finalize(bool) {
        for (std::size_t i = index; i < container.size(); ++i) {
            container[i] = element_type{};
        }
        return true;
    }
};

template<ConsumingStreamerLike S>
    requires (!JsonDynamicArray<S> && !JsonFixedArray<S>)
struct array_write_cursor<S> {
    using element_type = typename S::value_type;
    S & streamer;
    element_type buffer{};

    void reset() {
        streamer.reset();
    }
    element_type * allocate_slot() {
        buffer = element_type{};
        return &buffer;
    }
    bool commit() {
        return streamer.consume(buffer);
    }
    bool finalize(bool success) {
        return streamer.finalize(success);
    }
};

template<class T>
bool IsZero(const T & v) {
    if constexpr (requires { { v.is_zero() } -> std::convertible_to<bool>; }) {
        return v.is_zero();
    } else if constexpr (requires { { v.empty() } -> std::convertible_to<bool>; }) {
        return v.empty();
    } else if constexpr (std::is_default_constructible_v<T> && std::equality_comparable<T>) {
        return v == T{};
    } else {
        return false;
    }
}

} // namespace static_schema
} // namespace JsonFork
