#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "io.hpp"
#include "json_pointer.hpp"
#include "reader_concept.hpp"
#include "token.hpp"

namespace JsonFork {

// Forward-only JSON token cursor. Works over single-pass input iterators:
// the iterator is never copied to look ahead.
template<class It, class Sent, std::size_t MaxNesting = 10000>
class TokenReader {
public:
    using iterator_type = It;
    using error_type = ReaderError;

    TokenReader(It first, Sent last)
        : current_(std::move(first)), end_(std::move(last)) {}

    TokenReader(const TokenReader&) = delete;
    TokenReader& operator=(const TokenReader&) = delete;

    Kind peek_kind() {
        if (!prepare()) {
            return Kind::Invalid;
        }
        if (atEnd()) {
            if (m_state != State::TopValue) {
                setError(ReaderError::UNEXPECTED_END_OF_DATA);
            }
            return Kind::Invalid;
        }
        switch (*current_) {
        case 'n': return Kind::Null;
        case 't': return Kind::True;
        case 'f': return Kind::False;
        case '"': return Kind::String;
        case '{': return Kind::BeginObject;
        case '}': return Kind::EndObject;
        case '[': return Kind::BeginArray;
        case ']': return Kind::EndArray;
        case '-':
        case '0': case '1': case '2': case '3': case '4':
        case '5': case '6': case '7': case '8': case '9':
            return Kind::Number;
        default:
            setError(ReaderError::UNEXPECTED_CHARACTER);
            return Kind::Invalid;
        }
    }

    reader::TryParseStatus read_token(Token & out) {
        if (!prepare()) {
            return reader::TryParseStatus::error;
        }
        if (atEnd()) {
            if (m_state == State::TopValue) {
                return reader::TryParseStatus::no_match;
            }
            setError(ReaderError::UNEXPECTED_END_OF_DATA);
            return reader::TryParseStatus::error;
        }

        const char c = *current_;

        if (c == '}') {
            if (m_state != State::ObjectFirstName && m_state != State::ObjectCommaOrClose) {
                setError(ReaderError::ILLFORMED_OBJECT);
                return reader::TryParseStatus::error;
            }
            bump();
            m_stack.pop_back();
            after_value();
            out = Token::EndObject();
            return reader::TryParseStatus::ok;
        }
        if (c == ']') {
            if (m_state != State::ArrayFirstValue && m_state != State::ArrayCommaOrClose) {
                setError(ReaderError::ILLFORMED_ARRAY);
                return reader::TryParseStatus::error;
            }
            bump();
            m_stack.pop_back();
            after_value();
            out = Token::EndArray();
            return reader::TryParseStatus::ok;
        }

        switch (m_state) {
        case State::ObjectFirstName:
        case State::ObjectName: {
            if (c != '"') {
                setError(ReaderError::ILLFORMED_OBJECT);
                return reader::TryParseStatus::error;
            }
            std::string name;
            if (!read_string(name)) {
                return reader::TryParseStatus::error;
            }
            Frame & f = m_stack.back();
            f.name = name;
            f.length ++;
            m_state = State::ObjectColon;
            m_prepared = false;
            out = Token::String(name);
            return reader::TryParseStatus::ok;
        }
        case State::ObjectCommaOrClose:
            setError(ReaderError::ILLFORMED_OBJECT);
            return reader::TryParseStatus::error;
        case State::ArrayCommaOrClose:
            setError(ReaderError::ILLFORMED_ARRAY);
            return reader::TryParseStatus::error;
        default:
            break;
        }

        begin_value();
        switch (c) {
        case '{':
        case '[': {
            if (m_stack.size() >= MaxNesting) {
                setError(ReaderError::NESTING_TOO_DEEP);
                return reader::TryParseStatus::error;
            }
            bump();
            m_prepared = false;
            if (c == '{') {
                m_stack.push_back(Frame{Kind::BeginObject});
                m_state = State::ObjectFirstName;
                out = Token::BeginObject();
            } else {
                m_stack.push_back(Frame{Kind::BeginArray});
                m_state = State::ArrayFirstValue;
                out = Token::BeginArray();
            }
            return reader::TryParseStatus::ok;
        }
        case '"': {
            std::string s;
            if (!read_string(s)) {
                return reader::TryParseStatus::error;
            }
            out = Token::String(s);
            break;
        }
        case 't':
            if (!match_literal("true", ReaderError::ILLFORMED_BOOL)) {
                return reader::TryParseStatus::error;
            }
            out = Token::Bool(true);
            break;
        case 'f':
            if (!match_literal("false", ReaderError::ILLFORMED_BOOL)) {
                return reader::TryParseStatus::error;
            }
            out = Token::Bool(false);
            break;
        case 'n':
            if (!match_literal("null", ReaderError::ILLFORMED_NULL)) {
                return reader::TryParseStatus::error;
            }
            out = Token::Null();
            break;
        default: {
            if (c != '-' && (c < '0' || c > '9')) {
                setError(ReaderError::UNEXPECTED_CHARACTER);
                return reader::TryParseStatus::error;
            }
            std::string literal;
            if (!read_number_token(literal)) {
                return reader::TryParseStatus::error;
            }
            out = Token::Number(literal);
            break;
        }
        }
        after_value();
        return reader::TryParseStatus::ok;
    }

    // Consumes one complete value and appends it to raw without insignificant whitespace.
    bool read_value(std::string & raw) {
        if (!at_value_start()) {
            return false;
        }
        std::string * prev = m_capture;
        m_capture = &raw;
        bool ok = consume_value();
        m_capture = prev;
        return ok;
    }

    bool skip_value() {
        if (!at_value_start()) {
            return false;
        }
        return consume_value();
    }

    bool finish() {
        if (m_error != ReaderError::NO_ERROR) {
            return false;
        }
        if (!m_stack.empty()) {
            setError(ReaderError::UNEXPECTED_END_OF_DATA);
            return false;
        }
        skip_whitespace();
        if (!atEnd()) {
            setError(ReaderError::EXCESS_CHARACTERS);
            return false;
        }
        return true;
    }

    std::size_t stack_depth() const {
        return m_stack.size();
    }

    // Container kind at depth and the number of tokens it produced so far
    // (names and values both count inside objects). Depth 0 is the top level.
    std::pair<Kind, std::size_t> stack_index(std::size_t depth) const {
        if (depth == 0) {
            return {Kind::Invalid, m_topCount};
        }
        if (depth > m_stack.size()) {
            return {Kind::Invalid, 0};
        }
        const Frame & f = m_stack[depth - 1];
        return {f.kind, f.length};
    }

    // Pointer to the most recently started value, relative to where this reader began.
    std::string stack_pointer() const {
        std::string out;
        for (const Frame & f : m_stack) {
            if (f.length == 0) {
                break;
            }
            if (f.kind == Kind::BeginObject) {
                json_pointer::AppendToken(out, f.name);
            } else {
                json_pointer::AppendIndex(out, f.length - 1);
            }
        }
        return out;
    }

    ReaderError getError() const {
        return m_error;
    }

    std::size_t offset() const {
        return m_offset;
    }

    std::size_t errorOffset() const {
        return m_errorOffset;
    }

private:
    enum class State : std::uint8_t {
        TopValue,
        ObjectFirstName,
        ObjectName,
        ObjectColon,
        ObjectValue,
        ObjectCommaOrClose,
        ArrayFirstValue,
        ArrayValue,
        ArrayCommaOrClose
    };

    struct Frame {
        Kind kind = Kind::Invalid;
        std::size_t length = 0;
        std::string name;
    };

    It current_;
    Sent end_;
    ReaderError m_error = ReaderError::NO_ERROR;
    std::size_t m_offset = 0;
    std::size_t m_errorOffset = 0;
    std::vector<Frame> m_stack;
    State m_state = State::TopValue;
    bool m_prepared = false;
    std::size_t m_topCount = 0;
    std::string * m_capture = nullptr;

    void setError(ReaderError e) {
        if (m_error == ReaderError::NO_ERROR) {
            m_error = e;
            m_errorOffset = m_offset;
        }
    }

    bool atEnd() {
        return current_ == end_;
    }

    void bump() {
        if (m_capture) {
            m_capture->push_back(*current_);
        }
        ++current_;
        ++m_offset;
    }

    static constexpr bool isSpace(char c) noexcept {
        return c == ' ' || c == '\n' || c == '\r' || c == '\t';
    }

    static constexpr bool isPlainEnd(char a) noexcept {
        switch(a) {
        case ']':
        case ',':
        case '}':
        case 0x20:
        case 0x0A:
        case 0x0D:
        case 0x09:
            return true;
        }
        return false;
    }

    void skip_whitespace() {
        while (!atEnd() && isSpace(*current_)) {
            ++current_;
            ++m_offset;
        }
    }

    // Consumes whitespace and the separator owed before the next token.
    bool prepare() {
        if (m_error != ReaderError::NO_ERROR) {
            return false;
        }
        if (m_prepared) {
            return true;
        }
        skip_whitespace();
        switch (m_state) {
        case State::ObjectColon:
            if (atEnd()) {
                setError(ReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            if (*current_ != ':') {
                setError(ReaderError::ILLFORMED_OBJECT);
                return false;
            }
            bump();
            skip_whitespace();
            m_state = State::ObjectValue;
            break;
        case State::ObjectCommaOrClose:
            if (!atEnd() && *current_ == ',') {
                bump();
                skip_whitespace();
                m_state = State::ObjectName;
            }
            break;
        case State::ArrayCommaOrClose:
            if (!atEnd() && *current_ == ',') {
                bump();
                skip_whitespace();
                m_state = State::ArrayValue;
            }
            break;
        default:
            break;
        }
        m_prepared = true;
        return true;
    }

    void begin_value() {
        if (m_stack.empty()) {
            m_topCount ++;
        } else {
            m_stack.back().length ++;
        }
    }

    void after_value() {
        m_prepared = false;
        if (m_stack.empty()) {
            m_state = State::TopValue;
        } else if (m_stack.back().kind == Kind::BeginObject) {
            m_state = State::ObjectCommaOrClose;
        } else {
            m_state = State::ArrayCommaOrClose;
        }
    }

    bool at_value_start() {
        Kind k = peek_kind();
        if (k == Kind::Invalid) {
            setError(ReaderError::UNEXPECTED_END_OF_DATA);
            return false;
        }
        switch (m_state) {
        case State::TopValue:
        case State::ObjectValue:
        case State::ArrayValue:
            return true;
        case State::ArrayFirstValue:
            if (k != Kind::EndArray) {
                return true;
            }
            setError(ReaderError::ILLFORMED_ARRAY);
            return false;
        case State::ArrayCommaOrClose:
            setError(ReaderError::ILLFORMED_ARRAY);
            return false;
        default:
            setError(ReaderError::ILLFORMED_OBJECT);
            return false;
        }
    }

    bool consume_value() {
        const std::size_t depth = m_stack.size();
        Token tok;
        do {
            if (read_token(tok) != reader::TryParseStatus::ok) {
                setError(ReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
        } while (m_stack.size() > depth);
        return true;
    }

    bool match_literal(std::string_view lit, ReaderError err) {
        for (char c : lit) {
            if (atEnd())  {
                setError(ReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            if (*current_ != c)  {
                setError(err);
                return false;
            }
            bump();
        }
        if (!atEnd() && !isPlainEnd(*current_)) {
            setError(err);
            return false;
        }
        return true;
    }

    // RFC 8259 number grammar. The literal is kept verbatim.
    bool read_number_token(std::string & out) {
        bool seenDot = false;
        bool inExp = false;
        bool seenDigitBeforeExp = false;
        bool seenDigitAfterExp = false;
        bool leadingZero = false;

        if (*current_ == '-') {
            out.push_back('-');
            bump();
        }

        while (!atEnd() && !isPlainEnd(*current_)) {
            char c = *current_;

            if (c >= '0' && c <= '9') {
                if (!inExp) {
                    if (leadingZero && !seenDot) {
                        setError(ReaderError::ILLFORMED_NUMBER);
                        return false;
                    }
                    if (!seenDigitBeforeExp && !seenDot && c == '0') {
                        leadingZero = true;
                    }
                    seenDigitBeforeExp = true;
                } else {
                    seenDigitAfterExp = true;
                }
                out.push_back(c);
                bump();
                continue;
            }

            if (c == '.' && !seenDot && !inExp) {
                if (!seenDigitBeforeExp) {
                    setError(ReaderError::ILLFORMED_NUMBER);
                    return false;
                }
                seenDot = true;
                out.push_back(c);
                bump();
                if (atEnd() || !(*current_ >= '0' && *current_ <= '9')) {
                    setError(ReaderError::ILLFORMED_NUMBER);
                    return false;
                }
                continue;
            }

            if ((c == 'e' || c == 'E') && !inExp && seenDigitBeforeExp) {
                inExp = true;
                out.push_back(c);
                bump();
                if (!atEnd() && (*current_ == '+' || *current_ == '-')) {
                    out.push_back(*current_);
                    bump();
                }
                continue;
            }

            setError(ReaderError::ILLFORMED_NUMBER);
            return false;
        }

        if (!seenDigitBeforeExp || (inExp && !seenDigitAfterExp)) {
            setError(atEnd() ? ReaderError::UNEXPECTED_END_OF_DATA : ReaderError::ILLFORMED_NUMBER);
            return false;
        }
        return true;
    }

    bool readHex4(std::uint16_t & out) {
        out = 0;
        for (int i = 0; i < 4; ++i) {
            if (atEnd()) {
                setError(ReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            char currChar = *current_;
            std::uint8_t v;
            if (currChar >= '0' && currChar <= '9') {
                v = static_cast<std::uint8_t>(currChar - '0');
            } else if (currChar >= 'A' && currChar <= 'F') {
                v = static_cast<std::uint8_t>(currChar - 'A' + 10);
            } else if (currChar >= 'a' && currChar <= 'f') {
                v = static_cast<std::uint8_t>(currChar - 'a' + 10);
            } else  {
                setError(ReaderError::ILLFORMED_STRING);
                return false;
            }
            out = static_cast<std::uint16_t>((out << 4) | v);
            bump();
        }
        return true;
    }

    static void append_utf8(std::string & out, std::uint32_t codepoint) {
        if (codepoint <= 0x7Fu) {
            out.push_back(static_cast<char>(codepoint));
        } else if (codepoint <= 0x7FFu) {
            out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else if (codepoint <= 0xFFFFu) {
            out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        }
    }

    // Cursor on the opening quote. Unescapes into out.
    bool read_string(std::string & out) {
        bump();
        while (true) {
            if (atEnd()) {
                setError(ReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            char c = *current_;
            if (c == '"') {
                bump();
                return true;
            }
            if (static_cast<unsigned char>(c) <= 0x1F) {
                setError(ReaderError::ILLFORMED_STRING);
                return false;
            }
            if (c != '\\') {
                out.push_back(c);
                bump();
                continue;
            }

            bump();
            if (atEnd()) {
                setError(ReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            char esc = *current_;
            bump();
            switch (esc) {
            case '"':  out.push_back('"');  continue;
            case '/':  out.push_back('/');  continue;
            case '\\': out.push_back('\\'); continue;
            case 'b':  out.push_back('\b'); continue;
            case 'f':  out.push_back('\f'); continue;
            case 'r':  out.push_back('\r'); continue;
            case 'n':  out.push_back('\n'); continue;
            case 't':  out.push_back('\t'); continue;
            case 'u':  break;
            default:
                setError(ReaderError::ILLFORMED_STRING);
                return false;
            }

            std::uint16_t u1 = 0;
            if (!readHex4(u1)) {
                return false;
            }
            std::uint32_t codepoint = u1;
            if (u1 >= 0xD800u && u1 <= 0xDBFFu) {
                // High surrogate, a low one must follow
                if (atEnd()) {
                    setError(ReaderError::UNEXPECTED_END_OF_DATA);
                    return false;
                }
                if (*current_ != '\\') {
                    setError(ReaderError::ILLFORMED_STRING);
                    return false;
                }
                bump();
                if (atEnd()) {
                    setError(ReaderError::UNEXPECTED_END_OF_DATA);
                    return false;
                }
                if (*current_ != 'u') {
                    setError(ReaderError::ILLFORMED_STRING);
                    return false;
                }
                bump();
                std::uint16_t u2 = 0;
                if (!readHex4(u2)) {
                    return false;
                }
                if (u2 < 0xDC00u || u2 > 0xDFFFu) {
                    setError(ReaderError::ILLFORMED_STRING);
                    return false;
                }
                codepoint = 0x10000u
                            + ((static_cast<std::uint32_t>(u1) - 0xD800u) << 10)
                            + (static_cast<std::uint32_t>(u2) - 0xDC00u);
            } else if (u1 >= 0xDC00u && u1 <= 0xDFFFu) {
                setError(ReaderError::ILLFORMED_STRING);
                return false;
            }
            append_utf8(out, codepoint);
        }
    }
};

template<std::size_t MaxNesting = 10000>
using StringReader = TokenReader<const char*, const char*, MaxNesting>;

template<class Source, std::size_t MaxNesting = 10000>
using StreamReader = TokenReader<SourceIterator<SourceCursor<Source>>, std::default_sentinel_t, MaxNesting>;

inline StringReader<> MakeReader(std::string_view text) {
    return StringReader<>(text.data(), text.data() + text.size());
}

static_assert(reader::TokenReaderLike<StringReader<>>);
static_assert(reader::TokenReaderLike<StreamReader<StringSource>>);

} // namespace JsonFork
