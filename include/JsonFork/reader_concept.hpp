#pragma once

#include <concepts>
#include <cstddef>
#include <string>
#include <utility>

#include "errors.hpp"
#include "token.hpp"

namespace JsonFork {

namespace reader {
enum class TryParseStatus {
    no_match,   // clean end of input, nothing consumed
    ok,         // token read and consumed
    error       // malformed, reader already has error
};

/// TokenReaderLike is the cursor interface the binder, the tee and the
/// resolver are written against. Any forward-only JSON token source works.
template<typename R>
concept TokenReaderLike = requires(R & reader, Token & tok, std::string & raw, std::size_t depth) {
    typename R::error_type;

    { reader.peek_kind() } -> std::same_as<Kind>;
    { reader.read_token(tok) } -> std::same_as<TryParseStatus>;
    { reader.read_value(raw) } -> std::same_as<bool>;
    { reader.skip_value() } -> std::same_as<bool>;

    { reader.stack_depth() } -> std::same_as<std::size_t>;
    { reader.stack_index(depth) } -> std::same_as<std::pair<Kind, std::size_t>>;
    { reader.stack_pointer() } -> std::same_as<std::string>;

    { reader.getError() } -> std::same_as<ReaderError>;
    { reader.offset() } -> std::same_as<std::size_t>;
    { reader.errorOffset() } -> std::same_as<std::size_t>;
    { reader.finish() } -> std::same_as<bool>;
};

} // namespace reader
} // namespace JsonFork
