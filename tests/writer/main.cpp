#include "../test_helpers.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include <JsonFork/writer.hpp>

using namespace JsonFork;
using TestHelpers::passed;

namespace {

std::string WriteAll(const std::vector<Token> & toks, WriterOptions opts = {}) {
    std::string out;
    StringSink sink(out);
    TokenWriter<StringSink> w(sink, opts);
    for (const auto & t : toks) {
        assert(w.write_token(t));
    }
    assert(w.stack_depth() == 0);
    return out;
}

void test_compact_output() {
    auto out = WriteAll({
        Token::BeginObject(),
        Token::String("a"), Token::Int(1),
        Token::String("b"), Token::BeginArray(), Token::Bool(true), Token::Null(), Token::Float(2.5), Token::EndArray(),
        Token::String("c"), Token::BeginObject(), Token::EndObject(),
        Token::EndObject(),
    });
    assert(out == R"({"a":1,"b":[true,null,2.5],"c":{}})");
    passed("compact output places separators");
}

void test_indented_output() {
    auto out = WriteAll({
        Token::BeginObject(),
        Token::String("a"), Token::Int(-7),
        Token::String("b"), Token::BeginArray(), Token::Int(2), Token::String("x"), Token::EndArray(),
        Token::String("e"), Token::BeginArray(), Token::EndArray(),
        Token::EndObject(),
    }, WriterOptions{"  ", true});
    const std::string expected =
        "{\n"
        "  \"a\": -7,\n"
        "  \"b\": [\n"
        "    2,\n"
        "    \"x\"\n"
        "  ],\n"
        "  \"e\": []\n"
        "}\n";
    assert(out == expected);
    passed("indented output with trailing newline");
}

void test_top_level_sequence() {
    assert(WriteAll({Token::Int(1), Token::String("s"), Token::BeginArray(), Token::EndArray()}) == "1\n\"s\"\n[]");
    assert(WriteAll({Token::Int(1), Token::Int(2)}, WriterOptions{"", true}) == "1\n2\n");
    passed("top-level values are newline separated");
}

void test_string_escaping() {
    auto out = WriteAll({Token::String(std::string("a\"b\\c\n\t\x01/", 9))});
    assert(out == R"("a\"b\\c\n\t\u0001/")");
    passed("string escaping");
}

void test_numbers() {
    assert(WriteAll({Token::Int(std::numeric_limits<std::int64_t>::min())}) == "-9223372036854775808");
    assert(WriteAll({Token::Int(std::numeric_limits<std::uint64_t>::max())}) == "18446744073709551615");
    assert(WriteAll({Token::Float(0.1)}) == "0.1");
    assert(WriteAll({Token::Float(std::nan(""))}) == "0");
    assert(WriteAll({Token::Float(std::numeric_limits<double>::infinity())}) == "0");
    assert(WriteAll({Token::Number("1.50e3")}) == "1.50e3");
    passed("numbers");
}

void test_position_errors() {
    std::string out;
    StringSink sink(out);
    {
        TokenWriter<StringSink> w(sink);
        assert(w.write_token(Token::BeginObject()));
        assert(!w.write_token(Token::Int(1)));
        assert(w.getError() == WriterError::INVALID_TOKEN_POSITION);
        // sticky
        assert(!w.write_token(Token::String("a")));
    }
    {
        TokenWriter<StringSink> w(sink);
        assert(w.write_token(Token::BeginArray()));
        assert(!w.write_token(Token::EndObject()));
        assert(w.getError() == WriterError::MISMATCHED_CLOSE);
    }
    {
        TokenWriter<StringSink> w(sink);
        assert(w.write_token(Token::BeginObject()));
        assert(w.write_token(Token::String("k")));
        assert(!w.write_token(Token::EndObject()));
        assert(w.getError() == WriterError::INVALID_TOKEN_POSITION);
    }
    {
        TokenWriter<StringSink> w(sink);
        assert(!w.write_token(Token::EndArray()));
        assert(w.getError() == WriterError::MISMATCHED_CLOSE);
    }
    passed("token position is validated");
}

void test_write_value() {
    std::string out;
    StringSink sink(out);
    TokenWriter<StringSink> w(sink);
    assert(w.write_token(Token::BeginObject()));
    assert(w.write_token(Token::String("raw")));
    assert(w.write_value(R"( { "x" : [1, 2] , "y" : null } )"));
    assert(w.write_token(Token::String("n")));
    assert(w.write_value("42"));
    assert(w.write_token(Token::EndObject()));
    assert(out == R"({"raw":{"x":[1,2],"y":null},"n":42})");

    std::string bad;
    StringSink badSink(bad);
    TokenWriter<StringSink> w2(badSink);
    assert(!w2.write_value("[1,"));
    assert(w2.getError() == WriterError::INVALID_RAW_VALUE);

    TokenWriter<StringSink> w3(badSink);
    assert(w3.write_token(Token::BeginObject()));
    assert(!w3.write_value("1"));
    assert(w3.getError() == WriterError::INVALID_TOKEN_POSITION);
    passed("raw values are re-tokenized");
}

struct LimitedSink {
    std::string out;
    std::size_t limit;
    bool write(const char * data, std::size_t n) {
        if (out.size() + n > limit) {
            return false;
        }
        out.append(data, n);
        return true;
    }
};

void test_sink_failure() {
    LimitedSink sink{{}, 4};
    TokenWriter<LimitedSink> w(sink);
    assert(w.write_token(Token::BeginArray()));
    assert(w.write_token(Token::Int(12)));
    assert(!w.write_token(Token::Int(345)));
    assert(w.getError() == WriterError::OUTPUT_FAILED);
    assert(w.bytesWritten() == 4);
    passed("sink failure stops the writer");
}

} // namespace

int main() {
    test_compact_output();
    test_indented_output();
    test_top_level_sequence();
    test_string_escaping();
    test_numbers();
    test_position_errors();
    test_write_value();
    test_sink_failure();
    std::cout << "All writer tests passed." << std::endl;
}
