#pragma once

#include <cstddef>
#include <type_traits>

#include "static_schema.hpp"

namespace JsonFork {
namespace streamers {

template <class ValueT>
struct CountingStreamer {
    using value_type = ValueT;

    std::size_t counter = 0;

    void reset() {
        counter = 0;
    }

    bool consume(const ValueT &) {
        counter ++;
        return true;
    }

    bool finalize(bool) {
        return true;
    }
};


template<auto Fn>
struct CallbackStreamer;

namespace detail {

template<typename>
struct callback_streamer_traits;

// Supported callable shape: bool(*)(Ctx*, const Arg&)
template<typename Ctx, typename Arg>
struct callback_streamer_traits<bool(*)(Ctx*, const Arg&)> {
    using ctx_type   = Ctx;
    using value_type = std::remove_cvref_t<Arg>;
};

template<typename T>
struct callback_streamer_traits {
    static_assert(sizeof(T) == 0,
                  "CallbackStreamer: Fn must be callable as bool(Ctx*, const Value&)");
};

} // namespace detail

// Hands every decoded array element to Fn(ctx, element). Returning false from
// Fn aborts the decode with DATA_CONSUMER_ERROR.
template<auto Fn>
struct CallbackStreamer {
    // Captureless lambdas decay to a function pointer here.
    using fn_ptr   = decltype(+Fn);
    using traits   = detail::callback_streamer_traits<fn_ptr>;

    using ctx_type   = typename traits::ctx_type;
    using value_type = typename traits::value_type;

    ctx_type* ctx = nullptr;

    void reset() {}

    bool consume(const value_type& v) {
        return Fn(ctx, v);
    }

    bool finalize(bool success) {
        return success;
    }
};

static_assert(static_schema::ConsumingStreamerLike<CountingStreamer<int>>);

} // namespace streamers
} // namespace JsonFork
