#pragma once

#include <string>
#include <utility>

#include "decode_result.hpp"
#include "options.hpp"
#include "static_schema.hpp"
#include "struct_fields_helper.hpp"
#include "writer.hpp"

namespace JsonFork {

namespace encoder_detail {

template<class Writer>
class EncodeContext {
    Writer & m_writer;
    const EncodeOptions & m_opts;
    EncodeResult m_result;
public:
    using writer_type = Writer;

    EncodeContext(Writer & w, const EncodeOptions & o): m_writer(w), m_opts(o) {}

    Writer & writer() {
        return m_writer;
    }
    const EncodeOptions & options() const {
        return m_opts;
    }
    bool write(const Token & t) {
        if (!m_writer.write_token(t)) {
            m_result = EncodeResult(EncodeError::WRITER_ERROR, m_writer.getError());
            return false;
        }
        return true;
    }
    bool withResult(EncodeResult r) {
        m_result = std::move(r);
        return false;
    }
    EncodeResult result() {
        return std::move(m_result);
    }
};

template<class T, class Ctx>
bool EncodeValue(const T & field, Ctx & ctx);

template<class V, class Ctx, std::size_t I>
bool EncodeField(const V & obj, Ctx & ctx) {
    using FH = struct_fields_helper::FieldsHelper<V>;
    if constexpr (!FH::template isNamedField<I>()) {
        return true;
    } else {
        const auto & field = introspection::getStructElementByIndex<I>(obj);
        if constexpr (struct_fields_helper::fieldOmitsZero<V, I>()) {
            const auto & value = options::detail::annotation_meta_getter<decltype(field)>::getRef(field);
            if (static_schema::IsZero(value)) {
                return true;
            }
        }
        return ctx.write(Token::String(FH::template fieldName<I>())) && EncodeValue(field, ctx);
    }
}

template<class V, class Ctx, std::size_t... I>
bool EncodeFields(const V & obj, Ctx & ctx, std::index_sequence<I...>) {
    return (EncodeField<V, Ctx, I>(obj, ctx) && ...);
}

template<class T, class Ctx>
bool EncodeValue(const T & field, Ctx & ctx) {
    const auto & obj = options::detail::annotation_meta_getter<T>::getRef(field);
    using V = std::remove_cvref_t<decltype(obj)>;

    if constexpr (static_schema::HasMarshalHook<V, typename Ctx::writer_type>) {
        EncodeResult r = obj.json_marshal_to(ctx.writer(), ctx.options());
        if (!r) {
            return ctx.withResult(std::move(r));
        }
        return true;
    } else if constexpr (static_schema::JsonNullableValue<V>) {
        if (!obj.has_value()) {
            return ctx.write(Token::Null());
        }
        return EncodeValue(*obj, ctx);
    } else if constexpr (static_schema::JsonBool<V>) {
        return ctx.write(Token::Bool(obj));
    } else if constexpr (static_schema::JsonNumber<V>) {
        if constexpr (std::is_integral_v<V>) {
            return ctx.write(Token::Int(obj));
        } else {
            return ctx.write(Token::Float(static_cast<double>(obj)));
        }
    } else if constexpr (static_schema::JsonString<V>) {
        return ctx.write(Token::String(obj));
    } else if constexpr (static_schema::JsonRaw<V>) {
        if (!ctx.writer().write_value(obj.text)) {
            return ctx.withResult(EncodeResult(EncodeError::WRITER_ERROR, ctx.writer().getError()));
        }
        return true;
    } else if constexpr (static_schema::JsonFixedArray<V> || static_schema::JsonDynamicArray<V>) {
        if (!ctx.write(Token::BeginArray())) {
            return false;
        }
        for (const auto & e : obj) {
            if (!EncodeValue(e, ctx)) {
                return false;
            }
        }
        return ctx.write(Token::EndArray());
    } else if constexpr (static_schema::JsonMap<V>) {
        if (!ctx.write(Token::BeginObject())) {
            return false;
        }
        for (const auto & [k, v] : obj) {
            if constexpr (static_schema::JsonString<typename V::key_type>) {
                if (!ctx.write(Token::String(k))) {
                    return false;
                }
            } else {
                if (!ctx.write(Token::String(Token::Int(k).text()))) {
                    return false;
                }
            }
            if (!EncodeValue(v, ctx)) {
                return false;
            }
        }
        return ctx.write(Token::EndObject());
    } else if constexpr (static_schema::JsonObject<V>) {
        using FH = struct_fields_helper::FieldsHelper<V>;
        if (!ctx.write(Token::BeginObject())) {
            return false;
        }
        if (!EncodeFields(obj, ctx, std::make_index_sequence<FH::rawFieldsCount>{})) {
            return false;
        }
        if constexpr (FH::unknownSinkIndex != FH::npos) {
            const auto & sink = options::detail::annotation_meta_getter<
                introspection::structureElementTypeByIndex<FH::unknownSinkIndex, V>
            >::getRef(introspection::getStructElementByIndex<FH::unknownSinkIndex>(obj));
            for (const auto & [name, raw] : sink) {
                if (!ctx.write(Token::String(name)) || !EncodeValue(raw, ctx)) {
                    return false;
                }
            }
        }
        return ctx.write(Token::EndObject());
    } else {
        static_assert(!sizeof(V), "[[[ JsonFork ]]] Type is not encodable");
        return false;
    }
}

} // namespace encoder_detail


template<class T, TokenWriterLike Writer>
EncodeResult MarshalEncode(const T & obj, Writer & writer, const EncodeOptions & opts = {}) {
    encoder_detail::EncodeContext<Writer> ctx(writer, opts);
    if (!encoder_detail::EncodeValue(obj, ctx)) {
        return ctx.result();
    }
    return {};
}

template<class T, ByteSinkLike Sink>
EncodeResult MarshalWrite(const T & obj, Sink & sink, const EncodeOptions & opts = {}) {
    TokenWriter<Sink> writer(sink, WriterOptions{opts.indent, false});
    return MarshalEncode(obj, writer, opts);
}

template<class T>
EncodeResult Marshal(const T & obj, std::string & out, const EncodeOptions & opts = {}) {
    out.clear();
    StringSink sink(out);
    return MarshalWrite(obj, sink, opts);
}

} // namespace JsonFork
