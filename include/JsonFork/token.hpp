#pragma once

#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace JsonFork {

enum class Kind : char {
    Invalid     = 0,
    Null        = 'n',
    False       = 'f',
    True        = 't',
    String      = '"',
    Number      = '0',
    BeginObject = '{',
    EndObject   = '}',
    BeginArray  = '[',
    EndArray    = ']'
};

constexpr bool is_scalar(Kind k) {
    switch(k) {
    case Kind::Null:
    case Kind::False:
    case Kind::True:
    case Kind::String:
    case Kind::Number:
        return true;
    default:
        return false;
    }
}

constexpr std::string_view kind_to_string(Kind k) {
    switch(k) {
    case Kind::Invalid: return "invalid"; break;
    case Kind::Null: return "null"; break;
    case Kind::False:
    case Kind::True: return "boolean"; break;
    case Kind::String: return "string"; break;
    case Kind::Number: return "number"; break;
    case Kind::BeginObject: return "object"; break;
    case Kind::EndObject: return "end of object"; break;
    case Kind::BeginArray: return "array"; break;
    case Kind::EndArray: return "end of array"; break;
    }
    return "N/A";
}

namespace token_detail {

constexpr std::size_t NumberBufSize = 40;

// text: optional leading '-' then digits only.
// Returns false on overflow, on '-' for unsigned types, or on any non-digit.
template <class Int>
constexpr bool parse_decimal_integer(std::string_view text, Int& out) noexcept {
    static_assert(std::is_integral_v<Int>, "[[[ JsonFork ]]] Int must be an integral type");

    using Limits   = std::numeric_limits<Int>;
    using Unsigned = std::make_unsigned_t<Int>;

    std::size_t i = 0;
    bool negative = false;
    if (i < text.size() && text[i] == '-') {
        if constexpr (!std::is_signed_v<Int>) {
            return false;
        }
        negative = true;
        ++i;
    }
    if (i == text.size()) {
        return false;
    }

    Unsigned value = 0;
    Unsigned limit;
    if constexpr (std::is_signed_v<Int>) {
        limit = negative ? Unsigned(Limits::max()) + 1u
                         : Unsigned(Limits::max());
    } else {
        limit = std::numeric_limits<Unsigned>::max();
    }

    for (; i < text.size(); ++i) {
        char c = text[i];
        if (c < '0' || c > '9') {
            return false;
        }
        unsigned digit = static_cast<unsigned>(c - '0');
        if (value > (limit - digit) / 10u)  {
            return false;
        }
        value = static_cast<Unsigned>(value * 10u + digit);
    }

    if constexpr (std::is_signed_v<Int>) {
        if (negative) {
            if (value == Unsigned(Limits::max()) + 1u) {
                out = Limits::min();
            } else {
                out = static_cast<Int>(-static_cast<Int>(value));
            }
        } else {
            out = static_cast<Int>(value);
        }
    } else {
        out = static_cast<Int>(value);
    }
    return true;
}

constexpr bool is_integer_literal(std::string_view text) {
    for (char c : text) {
        if (c == '.' || c == 'e' || c == 'E') {
            return false;
        }
    }
    return true;
}

} // namespace token_detail

// One lexical unit of JSON. Strings carry their unescaped contents,
// numbers carry the literal exactly as it appeared on the wire.
class Token {
    Kind m_kind = Kind::Invalid;
    std::string m_text;

    Token(Kind k, std::string text = {}): m_kind(k), m_text(std::move(text)) {}
public:
    Token() = default;

    static Token Null() { return Token(Kind::Null); }
    static Token Bool(bool b) { return Token(b ? Kind::True : Kind::False); }
    static Token String(std::string_view s) { return Token(Kind::String, std::string(s)); }
    static Token Number(std::string_view literal) { return Token(Kind::Number, std::string(literal)); }
    static Token BeginObject() { return Token(Kind::BeginObject); }
    static Token EndObject() { return Token(Kind::EndObject); }
    static Token BeginArray() { return Token(Kind::BeginArray); }
    static Token EndArray() { return Token(Kind::EndArray); }

    template<class IntT>
        requires (std::is_integral_v<IntT> && !std::is_same_v<IntT, bool>)
    static Token Int(IntT v) {
        char buf[token_detail::NumberBufSize];
        auto [p, ec] = std::to_chars(buf, buf + sizeof(buf), v);
        return Token(Kind::Number, std::string(buf, p));
    }

    static Token Float(double v) {
        if (std::isnan(v) || std::isinf(v)) {
            return Token(Kind::Number, "0");
        }
        char buf[token_detail::NumberBufSize];
        auto [p, ec] = std::to_chars(buf, buf + sizeof(buf), v);
        if (ec != std::errc{}) {
            return Token(Kind::Number, "0");
        }
        return Token(Kind::Number, std::string(buf, p));
    }

    Kind kind() const { return m_kind; }
    const std::string & text() const { return m_text; }
    std::string & text() { return m_text; }

    bool as_bool() const { return m_kind == Kind::True; }

    template<class IntT>
    bool to_integer(IntT & out) const {
        return m_kind == Kind::Number && token_detail::parse_decimal_integer<IntT>(m_text, out);
    }

    bool is_integer() const {
        return m_kind == Kind::Number && token_detail::is_integer_literal(m_text);
    }

    bool to_double(double & out) const {
        if (m_kind != Kind::Number) {
            return false;
        }
        auto [p, ec] = std::from_chars(m_text.data(), m_text.data() + m_text.size(), out);
        return ec == std::errc{} && p == m_text.data() + m_text.size();
    }

    friend bool operator==(const Token&, const Token&) = default;
};

} // namespace JsonFork
