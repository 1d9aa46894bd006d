#pragma once

#include <cfloat>
#include <cmath>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

#include "decode_result.hpp"
#include "io.hpp"
#include "json_pointer.hpp"
#include "options.hpp"
#include "reader.hpp"
#include "static_schema.hpp"
#include "struct_fields_helper.hpp"

namespace JsonFork {

namespace decoder_detail {

template<class Reader>
std::string PendingPointer(Reader & reader) {
    const std::size_t depth = reader.stack_depth();
    std::string pointer = reader.stack_pointer();
    if (depth == 0) {
        return pointer;
    }
    const auto [kind, length] = reader.stack_index(depth);
    if (kind != Kind::BeginArray) {
        return pointer;
    }
    if (length > 0) {
        pointer.erase(pointer.rfind('/'));
    }
    json_pointer::AppendIndex(pointer, length);
    return pointer;
}

template<class Reader>
class DecodeContext {
    Reader & m_reader;
    const DecodeOptions & m_opts;
    DecodeResult m_result;
public:
    using reader_type = Reader;

    DecodeContext(Reader & r, const DecodeOptions & o): m_reader(r), m_opts(o) {}

    Reader & reader() {
        return m_reader;
    }
    const DecodeOptions & options() const {
        return m_opts;
    }

    bool withError(DecodeError e, Kind k) {
        m_result = DecodeResult(e, m_reader.getError(), k, m_reader.offset(), m_reader.stack_pointer());
        return false;
    }

    // The offending value was only peeked: point at it rather than at its predecessor.
    bool withShapeError(DecodeError e, Kind k) {
        m_result = DecodeResult(e, m_reader.getError(), k, m_reader.offset(), PendingPointer(m_reader));
        return false;
    }

    bool withMemberError(DecodeError e, std::string name) {
        m_result = DecodeResult(e, m_reader.getError(), Kind::String, m_reader.offset(), m_reader.stack_pointer());
        m_result.set_member(std::move(name));
        return false;
    }

    bool withReaderError() {
        ReaderError rerr = m_reader.getError();
        std::size_t offset = m_reader.errorOffset();
        if (rerr == ReaderError::NO_ERROR) {
            rerr = ReaderError::UNEXPECTED_END_OF_DATA;
            offset = m_reader.offset();
        }
        m_result = DecodeResult(DecodeError::READER_ERROR, rerr, Kind::Invalid, offset, m_reader.stack_pointer());
        return false;
    }

    bool withResult(DecodeResult r) {
        m_result = std::move(r);
        return false;
    }

    DecodeResult result() {
        return std::move(m_result);
    }
};

template<class T, class Ctx>
bool DecodeValue(T & field, Ctx & ctx);

template<class Ctx>
bool ReadExpected(Ctx & ctx, Token & tok) {
    if (ctx.reader().read_token(tok) != reader::TryParseStatus::ok) {
        return ctx.withReaderError();
    }
    return true;
}

template<static_schema::JsonBool V, class Ctx>
bool DecodeNonNull(V & obj, Kind k, Ctx & ctx) {
    if (k != Kind::True && k != Kind::False) {
        return ctx.withShapeError(DecodeError::NON_BOOL_IN_BOOL_VALUE, k);
    }
    Token tok;
    if (!ReadExpected(ctx, tok)) {
        return false;
    }
    obj = tok.as_bool();
    return true;
}

template<static_schema::JsonNumber V, class Ctx>
bool DecodeNonNull(V & obj, Kind k, Ctx & ctx) {
    if (k != Kind::Number) {
        return ctx.withShapeError(DecodeError::NON_NUMERIC_IN_NUMERIC_STORAGE, k);
    }
    Token tok;
    if (!ReadExpected(ctx, tok)) {
        return false;
    }
    if constexpr (std::is_integral_v<V>) {
        if (!tok.is_integer()) {
            return ctx.withError(DecodeError::FLOAT_VALUE_IN_INTEGER_STORAGE, k);
        }
        if (!tok.to_integer(obj)) {
            return ctx.withError(DecodeError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE, k);
        }
    } else {
        double d = 0;
        if (!tok.to_double(d)) {
            return ctx.withError(DecodeError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE, k);
        }
        if constexpr (std::is_same_v<V, float>) {
            if (std::fabs(d) > FLT_MAX) {
                return ctx.withError(DecodeError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE, k);
            }
        }
        obj = static_cast<V>(d);
    }
    return true;
}

template<static_schema::JsonString V, class Ctx>
bool DecodeNonNull(V & obj, Kind k, Ctx & ctx) {
    if (k != Kind::String) {
        return ctx.withShapeError(DecodeError::NON_STRING_IN_STRING_STORAGE, k);
    }
    Token tok;
    if (!ReadExpected(ctx, tok)) {
        return false;
    }
    obj = std::move(tok.text());
    return true;
}

template<static_schema::JsonRaw V, class Ctx>
bool DecodeNonNull(V & obj, Kind, Ctx & ctx) {
    obj.text.clear();
    if (!ctx.reader().read_value(obj.text)) {
        return ctx.withReaderError();
    }
    return true;
}

template<static_schema::JsonArray V, class Ctx>
bool DecodeNonNull(V & obj, Kind k, Ctx & ctx) {
    if (k != Kind::BeginArray) {
        return ctx.withShapeError(DecodeError::NON_ARRAY_IN_ARRAY_LIKE_VALUE, k);
    }
    Token tok;
    if (!ReadExpected(ctx, tok)) {
        return false;
    }
    static_schema::array_write_cursor<V> cursor{obj};
    cursor.reset();
    while (true) {
        Kind next = ctx.reader().peek_kind();
        if (next == Kind::Invalid) {
            cursor.finalize(false);
            return ctx.withReaderError();
        }
        if (next == Kind::EndArray) {
            if (!ReadExpected(ctx, tok)) {
                cursor.finalize(false);
                return false;
            }
            break;
        }
        auto * slot = cursor.allocate_slot();
        if (slot == nullptr) {
            cursor.finalize(false);
            return ctx.withShapeError(DecodeError::FIXED_SIZE_CONTAINER_OVERFLOW, next);
        }
        if (!DecodeValue(*slot, ctx)) {
            cursor.finalize(false);
            return false;
        }
        if (!cursor.commit()) {
            cursor.finalize(false);
            return ctx.withError(DecodeError::DATA_CONSUMER_ERROR, next);
        }
    }
    if (!cursor.finalize(true)) {
        return ctx.withError(DecodeError::DATA_CONSUMER_ERROR, Kind::EndArray);
    }
    return true;
}

template<static_schema::JsonMap V, class Ctx>
bool DecodeNonNull(V & obj, Kind k, Ctx & ctx) {
    using key_type = typename V::key_type;
    if (k != Kind::BeginObject) {
        return ctx.withShapeError(DecodeError::NON_MAP_IN_MAP_LIKE_VALUE, k);
    }
    Token tok;
    if (!ReadExpected(ctx, tok)) {
        return false;
    }
    obj.clear();
    while (true) {
        Kind next = ctx.reader().peek_kind();
        if (next == Kind::Invalid) {
            return ctx.withReaderError();
        }
        if (!ReadExpected(ctx, tok)) {
            return false;
        }
        if (next == Kind::EndObject) {
            return true;
        }
        key_type key{};
        if constexpr (static_schema::JsonString<key_type>) {
            key = std::move(tok.text());
        } else {
            if (!token_detail::parse_decimal_integer<key_type>(tok.text(), key)) {
                return ctx.withMemberError(DecodeError::ILLFORMED_MAP_KEY, tok.text());
            }
        }
        if (obj.contains(key)) {
            return ctx.withMemberError(DecodeError::DUPLICATE_KEY, tok.text());
        }
        auto [it, inserted] = obj.try_emplace(std::move(key));
        if (!DecodeValue(it->second, ctx)) {
            return false;
        }
    }
}

template<class V, class Ctx, std::size_t... I>
bool DecodeFieldByIndex(V & obj, std::size_t raw, Ctx & ctx, std::index_sequence<I...>) {
    bool ok = true;
    ((raw == I ? (ok = DecodeValue(introspection::getStructElementByIndex<I>(obj), ctx), true) : false) || ...);
    return ok;
}

template<static_schema::JsonObject V, class Ctx>
bool DecodeNonNull(V & obj, Kind k, Ctx & ctx) {
    using FH = struct_fields_helper::FieldsHelper<V>;
    if (k != Kind::BeginObject) {
        return ctx.withShapeError(DecodeError::NON_OBJECT_IN_STRUCT, k);
    }
    Token tok;
    if (!ReadExpected(ctx, tok)) {
        return false;
    }

    std::array<bool, FH::fieldsCount> seen{};

    auto * unknown = [&]() {
        if constexpr (FH::unknownSinkIndex != FH::npos) {
            auto & sink = options::detail::annotation_meta_getter<
                introspection::structureElementTypeByIndex<FH::unknownSinkIndex, V>
            >::getRef(introspection::getStructElementByIndex<FH::unknownSinkIndex>(obj));
            sink.clear();
            return &sink;
        } else {
            return static_cast<void*>(nullptr);
        }
    }();

    while (true) {
        Kind next = ctx.reader().peek_kind();
        if (next == Kind::Invalid) {
            return ctx.withReaderError();
        }
        if (!ReadExpected(ctx, tok)) {
            return false;
        }
        if (next == Kind::EndObject) {
            return true;
        }

        const std::size_t pos = FH::find(tok.text());
        if (pos != FH::npos) {
            if (seen[pos]) {
                return ctx.withMemberError(DecodeError::DUPLICATE_KEY, tok.text());
            }
            seen[pos] = true;
            if (!DecodeFieldByIndex(obj, FH::fieldIndexesToFieldNames[pos].index, ctx,
                                    std::make_index_sequence<FH::rawFieldsCount>{})) {
                return false;
            }
            continue;
        }

        if (ctx.options().reject_unknown_members) {
            return ctx.withMemberError(DecodeError::UNKNOWN_MEMBER, tok.text());
        }
        if constexpr (FH::unknownSinkIndex != FH::npos) {
            if (unknown->contains(tok.text())) {
                return ctx.withMemberError(DecodeError::DUPLICATE_KEY, tok.text());
            }
            RawValue raw;
            if (!ctx.reader().read_value(raw.text)) {
                return ctx.withReaderError();
            }
            unknown->emplace(tok.text(), std::move(raw));
        } else {
            if (!ctx.reader().skip_value()) {
                return ctx.withReaderError();
            }
        }
    }
}

template<class T, class Ctx>
bool DecodeValue(T & field, Ctx & ctx) {
    auto & obj = options::detail::annotation_meta_getter<T>::getRef(field);
    using V = std::remove_cvref_t<decltype(obj)>;

    if constexpr (static_schema::HasUnmarshalHook<V, typename Ctx::reader_type>) {
        DecodeResult r = obj.json_unmarshal_from(ctx.reader(), ctx.options());
        if (!r) {
            return ctx.withResult(std::move(r));
        }
        return true;
    } else if constexpr (static_schema::JsonNullableValue<V>) {
        Kind k = ctx.reader().peek_kind();
        if (k == Kind::Invalid) {
            return ctx.withReaderError();
        }
        if (k == Kind::Null) {
            Token tok;
            if (!ReadExpected(ctx, tok)) {
                return false;
            }
            obj.reset();
            return true;
        }
        typename V::value_type scratch{};
        if (!DecodeNonNull(scratch, k, ctx)) {
            return false;
        }
        obj = std::move(scratch);
        return true;
    } else {
        Kind k = ctx.reader().peek_kind();
        if (k == Kind::Invalid) {
            return ctx.withReaderError();
        }
        if (k == Kind::Null && !static_schema::JsonRaw<V>) {
            return ctx.withShapeError(DecodeError::NULL_IN_NON_OPTIONAL, k);
        }
        return DecodeNonNull(obj, k, ctx);
    }
}

} // namespace decoder_detail


// Decodes exactly one value and leaves the reader right after it.
template<class T, reader::TokenReaderLike Reader>
DecodeResult UnmarshalDecode(T & obj, Reader & reader, const DecodeOptions & opts = {}) {
    decoder_detail::DecodeContext<Reader> ctx(reader, opts);
    if (!decoder_detail::DecodeValue(obj, ctx)) {
        return ctx.result();
    }
    return {};
}

template<class T>
DecodeResult Unmarshal(T & obj, std::string_view json, const DecodeOptions & opts = {}) {
    auto reader = MakeReader(json);
    DecodeResult r = UnmarshalDecode(obj, reader, opts);
    if (!r) {
        return r;
    }
    if (!reader.finish()) {
        return DecodeResult(DecodeError::READER_ERROR, reader.getError(), Kind::Invalid, reader.errorOffset(), {});
    }
    return r;
}

// Decodes one value from a byte source; a failing source surfaces as SOURCE_FAULT.
template<class T, ByteSourceLike Source>
DecodeResult UnmarshalRead(T & obj, Source & source, const DecodeOptions & opts = {}) {
    SourceCursor<Source> cursor(source);
    StreamReader<Source> reader(SourceIterator<SourceCursor<Source>>(cursor), std::default_sentinel);
    DecodeResult r = UnmarshalDecode(obj, reader, opts);
    if (r && !reader.finish()) {
        r = DecodeResult(DecodeError::READER_ERROR, reader.getError(), Kind::Invalid, reader.errorOffset(), {});
    }
    if (!r && r.error() == DecodeError::READER_ERROR && cursor.failed()) {
        return DecodeResult(DecodeError::SOURCE_FAULT, r.readerError(), r.kind(), r.offset(), r.pointer());
    }
    return r;
}

} // namespace JsonFork
