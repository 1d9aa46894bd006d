#pragma once

#include <utility>

#include "decode_result.hpp"
#include "decoder.hpp"
#include "encoder.hpp"
#include "options.hpp"
#include "reader_concept.hpp"
#include "token.hpp"

namespace JsonFork {

// null or V. Zero when None, so omit_zero drops a None member.
template<class V>
class Option {
    bool m_some = false;
    V m_value{};

public:
    using value_type = V;

    Option() = default;

    static Option None() {
        return Option{};
    }
    static Option Some(V v) {
        Option o;
        o.m_some = true;
        o.m_value = std::move(v);
        return o;
    }

    bool is_none() const {
        return !m_some;
    }
    bool is_some() const {
        return m_some;
    }
    bool is_zero() const {
        return is_none();
    }
    const V & value() const {
        return m_value;
    }

    friend bool operator==(const Option&, const Option&) = default;

    template<reader::TokenReaderLike Reader>
    DecodeResult json_unmarshal_from(Reader & reader, const DecodeOptions & opts) {
        if (reader.peek_kind() == Kind::Null) {
            Token tok;
            if (reader.read_token(tok) != reader::TryParseStatus::ok) {
                return DecodeResult(DecodeError::READER_ERROR, reader.getError(), Kind::Null,
                                    reader.errorOffset(), reader.stack_pointer());
            }
            *this = None();
            return {};
        }
        V v{};
        DecodeResult r = UnmarshalDecode(v, reader, opts);
        if (!r) {
            return r;
        }
        *this = Some(std::move(v));
        return {};
    }

    template<TokenWriterLike Writer>
    EncodeResult json_marshal_to(Writer & writer, const EncodeOptions & opts) const {
        if (m_some) {
            return MarshalEncode(m_value, writer, opts);
        }
        if (!writer.write_token(Token::Null())) {
            return EncodeResult(EncodeError::WRITER_ERROR, writer.getError());
        }
        return {};
    }
};


// Absent, null or V. Meant for members marked omit_zero: an absent member
// stays Undefined on decode and is left out on encode.
template<class V>
class Und {
    Option<Option<V>> m_opt;

public:
    using value_type = V;

    Und() = default;

    static Und Undefined() {
        return Und{};
    }
    static Und Null() {
        Und u;
        u.m_opt = Option<Option<V>>::Some(Option<V>::None());
        return u;
    }
    static Und Defined(V v) {
        Und u;
        u.m_opt = Option<Option<V>>::Some(Option<V>::Some(std::move(v)));
        return u;
    }

    bool is_undefined() const {
        return m_opt.is_none();
    }
    bool is_null() const {
        return m_opt.is_some() && m_opt.value().is_none();
    }
    bool is_defined() const {
        return m_opt.is_some() && m_opt.value().is_some();
    }
    bool is_zero() const {
        return is_undefined();
    }
    const V & value() const {
        return m_opt.value().value();
    }

    friend bool operator==(const Und&, const Und&) = default;

    template<reader::TokenReaderLike Reader>
    DecodeResult json_unmarshal_from(Reader & reader, const DecodeOptions & opts) {
        Option<V> inner;
        DecodeResult r = inner.json_unmarshal_from(reader, opts);
        if (!r) {
            return r;
        }
        m_opt = Option<Option<V>>::Some(std::move(inner));
        return {};
    }

    // Undefined outside an omit_zero member encodes as null.
    template<TokenWriterLike Writer>
    EncodeResult json_marshal_to(Writer & writer, const EncodeOptions & opts) const {
        if (is_defined()) {
            return MarshalEncode(value(), writer, opts);
        }
        if (!writer.write_token(Token::Null())) {
            return EncodeResult(EncodeError::WRITER_ERROR, writer.getError());
        }
        return {};
    }
};

} // namespace JsonFork
