#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "decode_result.hpp"
#include "json_pointer.hpp"
#include "reader_concept.hpp"
#include "token.hpp"

namespace JsonFork {

namespace read_at_detail {

template<class Reader>
DecodeResult ReaderFailure(Reader & reader) {
    ReaderError rerr = reader.getError();
    std::size_t offset = reader.errorOffset();
    if (rerr == ReaderError::NO_ERROR) {
        rerr = ReaderError::UNEXPECTED_END_OF_DATA;
        offset = reader.offset();
    }
    return DecodeResult(DecodeError::READER_ERROR, rerr, Kind::Invalid, offset, reader.stack_pointer());
}

// Consumes what is left of every container opened above depth `base`.
// Inside an object an odd token count means a name is waiting for its value.
template<class Reader>
bool CloseEnclosing(Reader & reader, std::size_t base) {
    Token tok;
    while (reader.stack_depth() > base) {
        const auto [container, length] = reader.stack_index(reader.stack_depth());
        if (container == Kind::BeginObject && length % 2 == 1) {
            if (!reader.skip_value()) {
                return false;
            }
            continue;
        }
        const Kind next = reader.peek_kind();
        if (next == Kind::Invalid) {
            return false;
        }
        if (next == Kind::EndObject || next == Kind::EndArray || container == Kind::BeginObject) {
            if (reader.read_token(tok) != reader::TryParseStatus::ok) {
                return false;
            }
            continue;
        }
        if (!reader.skip_value()) {
            return false;
        }
    }
    return true;
}

} // namespace read_at_detail


// Moves to the value at `pointer` (relative to the value under the cursor) and
// calls fn(reader) there. Whatever happens, the reader ends right after the
// value it started on. Absent values give NOT_FOUND.
template<reader::TokenReaderLike Reader, class Fn>
DecodeResult ReadAt(Reader & reader, std::string_view pointer, Fn && fn) {
    const std::size_t base = reader.stack_depth();
    const std::size_t started = reader.stack_index(base).second;
    auto notFound = [&](Kind k) {
        return DecodeResult(DecodeError::NOT_FOUND, ReaderError::NO_ERROR, k, reader.offset(), std::string(pointer));
    };

    DecodeResult res = [&]() -> DecodeResult {
        auto tokens = json_pointer::Tokens(pointer);
        if (!tokens) {
            if (!reader.skip_value()) {
                return read_at_detail::ReaderFailure(reader);
            }
            return notFound(Kind::Invalid);
        }
        Token tok;
        for (const std::string & step : *tokens) {
            const Kind k = reader.peek_kind();
            if (k == Kind::BeginObject) {
                if (reader.read_token(tok) != reader::TryParseStatus::ok) {
                    return read_at_detail::ReaderFailure(reader);
                }
                while (true) {
                    const Kind next = reader.peek_kind();
                    if (next == Kind::Invalid) {
                        return read_at_detail::ReaderFailure(reader);
                    }
                    if (next == Kind::EndObject) {
                        return notFound(next);
                    }
                    if (reader.read_token(tok) != reader::TryParseStatus::ok) {
                        return read_at_detail::ReaderFailure(reader);
                    }
                    if (tok.text() == step) {
                        break;
                    }
                    if (!reader.skip_value()) {
                        return read_at_detail::ReaderFailure(reader);
                    }
                }
            } else if (k == Kind::BeginArray) {
                const auto index = json_pointer::ParseIndex(step);
                if (reader.read_token(tok) != reader::TryParseStatus::ok) {
                    return read_at_detail::ReaderFailure(reader);
                }
                if (!index) {
                    return notFound(k);
                }
                for (std::size_t i = 0; i <= *index; ++i) {
                    const Kind next = reader.peek_kind();
                    if (next == Kind::Invalid) {
                        return read_at_detail::ReaderFailure(reader);
                    }
                    if (next == Kind::EndArray) {
                        return notFound(next);
                    }
                    if (i < *index && !reader.skip_value()) {
                        return read_at_detail::ReaderFailure(reader);
                    }
                }
            } else if (k == Kind::Invalid) {
                return read_at_detail::ReaderFailure(reader);
            } else {
                if (!reader.skip_value()) {
                    return read_at_detail::ReaderFailure(reader);
                }
                return notFound(k);
            }
        }
        return std::forward<Fn>(fn)(reader);
    }();

    bool closed = read_at_detail::CloseEnclosing(reader, base);
    if (closed && reader.stack_index(base).second == started) {
        // fn gave up before touching the value
        closed = reader.skip_value();
    }
    if (!closed && (res || res.error() == DecodeError::NOT_FOUND)) {
        return read_at_detail::ReaderFailure(reader);
    }
    return res;
}

} // namespace JsonFork
