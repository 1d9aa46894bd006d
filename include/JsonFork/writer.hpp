#pragma once

#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "errors.hpp"
#include "reader.hpp"
#include "token.hpp"

namespace JsonFork {

template<class S>
concept ByteSinkLike = requires(S & s, const char * data, std::size_t n) {
    { s.write(data, n) } -> std::same_as<bool>;
};

class StringSink {
    std::string * m_out;
public:
    explicit StringSink(std::string & out): m_out(&out) {}
    bool write(const char * data, std::size_t n) {
        m_out->append(data, n);
        return true;
    }
};

struct WriterOptions {
    // Empty means compact output.
    std::string indent;
    // Stream encoders terminate every top-level value with '\n'.
    bool newline_after_value = false;
};

template<class W>
concept TokenWriterLike = requires(W & w, const Token & t, std::string_view raw) {
    { w.write_token(t) } -> std::same_as<bool>;
    { w.write_value(raw) } -> std::same_as<bool>;
    { w.stack_depth() } -> std::same_as<std::size_t>;
    { w.getError() } -> std::same_as<WriterError>;
};

// Stateful JSON emitter: callers hand over tokens, separators and
// indentation are placed here.
template<ByteSinkLike Sink>
class TokenWriter {
public:
    using error_type = WriterError;

    explicit TokenWriter(Sink & sink, WriterOptions opts = {})
        : m_sink(&sink), m_opts(std::move(opts)) {}

    bool write_token(const Token & t) {
        if (m_error != WriterError::NO_ERROR) {
            return false;
        }
        const Kind k = t.kind();

        if (k == Kind::EndObject || k == Kind::EndArray) {
            const Kind open = k == Kind::EndObject ? Kind::BeginObject : Kind::BeginArray;
            if (m_stack.empty() || m_stack.back().kind != open) {
                setError(WriterError::MISMATCHED_CLOSE);
                return false;
            }
            if (m_stack.back().expect_value) {
                setError(WriterError::INVALID_TOKEN_POSITION);
                return false;
            }
            if (m_stack.back().members > 0 && !write_newline(m_stack.size() - 1)) {
                return false;
            }
            if (!put(k == Kind::EndObject ? '}' : ']')) {
                return false;
            }
            m_stack.pop_back();
            return after_value();
        }

        if (!m_stack.empty() && m_stack.back().kind == Kind::BeginObject && !m_stack.back().expect_value) {
            if (k != Kind::String) {
                setError(WriterError::INVALID_TOKEN_POSITION);
                return false;
            }
            Frame & f = m_stack.back();
            if (f.members > 0 && !put(',')) {
                return false;
            }
            if (!write_newline(m_stack.size())) {
                return false;
            }
            if (!write_quoted(t.text()) || !put(':')) {
                return false;
            }
            if (!m_opts.indent.empty() && !put(' ')) {
                return false;
            }
            f.expect_value = true;
            return true;
        }

        if (!begin_value()) {
            return false;
        }

        switch (k) {
        case Kind::Null:
            return put("null") && after_value();
        case Kind::True:
            return put("true") && after_value();
        case Kind::False:
            return put("false") && after_value();
        case Kind::Number:
            return put(t.text()) && after_value();
        case Kind::String:
            return write_quoted(t.text()) && after_value();
        case Kind::BeginObject:
            if (!put('{')) {
                return false;
            }
            m_stack.push_back(Frame{Kind::BeginObject});
            return true;
        case Kind::BeginArray:
            if (!put('[')) {
                return false;
            }
            m_stack.push_back(Frame{Kind::BeginArray});
            return true;
        default:
            setError(WriterError::INVALID_TOKEN_POSITION);
            return false;
        }
    }

    // Writes one complete raw JSON value, re-tokenized so the layout
    // follows this writer's options.
    bool write_value(std::string_view raw) {
        if (m_error != WriterError::NO_ERROR) {
            return false;
        }
        if (!m_stack.empty() && m_stack.back().kind == Kind::BeginObject && !m_stack.back().expect_value) {
            setError(WriterError::INVALID_TOKEN_POSITION);
            return false;
        }
        auto in = MakeReader(raw);
        const std::size_t depth = m_stack.size();
        Token tok;
        bool started = false;
        while (!started || m_stack.size() > depth) {
            if (in.read_token(tok) != reader::TryParseStatus::ok) {
                setError(WriterError::INVALID_RAW_VALUE);
                return false;
            }
            started = true;
            if (!write_token(tok)) {
                return false;
            }
        }
        if (!in.finish()) {
            setError(WriterError::INVALID_RAW_VALUE);
            return false;
        }
        return true;
    }

    std::size_t stack_depth() const {
        return m_stack.size();
    }

    WriterError getError() const {
        return m_error;
    }

    std::size_t bytesWritten() const {
        return m_bytesWritten;
    }

private:
    struct Frame {
        Kind kind = Kind::Invalid;
        std::size_t members = 0;
        bool expect_value = false;
    };

    Sink * m_sink;
    WriterOptions m_opts;
    std::vector<Frame> m_stack;
    WriterError m_error = WriterError::NO_ERROR;
    std::size_t m_bytesWritten = 0;
    std::size_t m_topCount = 0;

    void setError(WriterError e) {
        if (m_error == WriterError::NO_ERROR) {
            m_error = e;
        }
    }

    bool put(std::string_view s) {
        if (s.empty()) {
            return true;
        }
        if (!m_sink->write(s.data(), s.size())) {
            setError(WriterError::OUTPUT_FAILED);
            return false;
        }
        m_bytesWritten += s.size();
        return true;
    }

    bool put(char c) {
        return put(std::string_view(&c, 1));
    }

    bool write_newline(std::size_t depth) {
        if (m_opts.indent.empty()) {
            return true;
        }
        if (!put('\n')) {
            return false;
        }
        for (std::size_t i = 0; i < depth; ++i) {
            if (!put(m_opts.indent)) {
                return false;
            }
        }
        return true;
    }

    bool begin_value() {
        if (m_stack.empty()) {
            if (m_topCount > 0 && !m_opts.newline_after_value) {
                return put('\n');
            }
            return true;
        }
        Frame & f = m_stack.back();
        if (f.kind == Kind::BeginObject) {
            f.expect_value = false;
            return true;
        }
        if (f.members > 0 && !put(',')) {
            return false;
        }
        return write_newline(m_stack.size());
    }

    bool after_value() {
        if (!m_stack.empty()) {
            m_stack.back().members ++;
            return true;
        }
        m_topCount ++;
        if (m_opts.newline_after_value) {
            return put('\n');
        }
        return true;
    }

    bool write_quoted(std::string_view s) {
        constexpr char hex[] = "0123456789abcdef";
        if (!put('"')) {
            return false;
        }
        std::size_t p = 0;
        while (p < s.size()) {
            std::size_t run = p;
            while (run < s.size()) {
                unsigned char uc = static_cast<unsigned char>(s[run]);
                if (s[run] == '"' || s[run] == '\\' || uc < 0x20) break;
                ++run;
            }
            if (!put(s.substr(p, run - p))) {
                return false;
            }
            p = run;
            if (p == s.size()) {
                break;
            }

            unsigned char uc = static_cast<unsigned char>(s[p++]);
            bool ok = true;
            switch (uc) {
            case '"':  ok = put("\\\""); break;
            case '\\': ok = put("\\\\"); break;
            case '\b': ok = put("\\b");  break;
            case '\f': ok = put("\\f");  break;
            case '\n': ok = put("\\n");  break;
            case '\r': ok = put("\\r");  break;
            case '\t': ok = put("\\t");  break;
            default: {
                const char esc[6] = {'\\', 'u', '0', '0', hex[(uc >> 4) & 0xF], hex[uc & 0xF]};
                ok = put(std::string_view(esc, 6));
                break;
            }
            }
            if (!ok) {
                return false;
            }
        }
        return put('"');
    }
};

static_assert(TokenWriterLike<TokenWriter<StringSink>>);

} // namespace JsonFork
