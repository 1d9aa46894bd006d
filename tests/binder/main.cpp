#include "../test_helpers.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <JsonFork/annotated.hpp>
#include <JsonFork/io.hpp>
#include <JsonFork/options.hpp>

using namespace JsonFork;
using namespace JsonFork::options;
using TestHelpers::passed;
using TestHelpers::DecodeSucceeds;
using TestHelpers::DecodeFailsWith;
using TestHelpers::EncodesAs;

namespace binder_models {

struct Inner {
    int x = 0;
    std::string s;

    bool operator==(const Inner&) const = default;
};

struct Record {
    int id = 0;
    std::string name;
    std::vector<int> values;
    std::optional<double> ratio;
    Inner inner;
    std::map<std::string, int> counts;
    std::array<int, 3> triple{};
};

struct Foos {
    std::vector<int> Foo;
};

struct Small {
    std::uint8_t v = 0;
};

struct Tagged {
    Annotated<int, key<"user_id">> id;
    Annotated<std::string, exclude> secret;
    Annotated<int, omit_zero> count;
    Annotated<std::vector<int>, omit_zero> tags;
};

struct WithExtras {
    Annotated<std::map<std::string, RawValue>, unknown_members> X;
    std::string Foo;
    int Bar = 0;
    bool Baz = false;
};

struct Envelope {
    std::string kind;
    RawValue payload;
};

struct MaybeInt {
    std::optional<int> v;
};

} // namespace binder_models

using namespace binder_models;

namespace {

void test_decode_struct() {
    Record r;
    assert(DecodeSucceeds(r, R"({
        "id": 7, "name": "n", "values": [1, 2], "ratio": 0.5,
        "inner": {"x": 1, "s": "a"}, "counts": {"a": 1, "b": 2}, "triple": [1, 2]
    })"));
    assert(r.id == 7);
    assert(r.name == "n");
    assert((r.values == std::vector<int>{1, 2}));
    assert(r.ratio && *r.ratio == 0.5);
    assert((r.inner == Inner{1, "a"}));
    assert((r.counts == std::map<std::string, int>{{"a", 1}, {"b", 2}}));
    assert((r.triple == std::array<int, 3>{1, 2, 0}));

    // Members that are absent keep their values.
    assert(DecodeSucceeds(r, R"({"name":"m"})"));
    assert(r.id == 7 && r.name == "m");
    passed("struct decoding");
}

void test_encode_struct() {
    Record r;
    r.id = 7;
    r.name = "n";
    r.values = {1, 2};
    r.inner = {1, "a"};
    r.counts = {{"b", 2}, {"a", 1}};
    r.triple = {1, 2, 0};
    assert(EncodesAs(r, R"({"id":7,"name":"n","values":[1,2],"ratio":null,"inner":{"x":1,"s":"a"},"counts":{"a":1,"b":2},"triple":[1,2,0]})"));

    EncodeOptions opts;
    opts.indent = "  ";
    assert(EncodesAs(Inner{1, "a"}, "{\n  \"x\": 1,\n  \"s\": \"a\"\n}", opts));
    passed("struct encoding");
}

void test_shape_errors_point_at_value() {
    {
        Foos f;
        const std::string_view json = R"({"Foo": ["a"]})";
        auto res = Unmarshal(f, json);
        assert(!res);
        assert(res.error() == DecodeError::NON_NUMERIC_IN_NUMERIC_STORAGE);
        assert(res.kind() == Kind::String);
        assert(res.pointer() == "/Foo/0");
        assert(res.offset() == 9);
        assert(DecodeResultToString(res) == R"(cannot decode JSON string into numeric storage within "/Foo/0" at offset 9)");
        assert(DecodeResultToString(res, json).find("<<HERE>>") != std::string::npos);
    }
    {
        Foos f;
        auto res = Unmarshal(f, R"({"Foo":[1,"a"]})");
        assert(res.error() == DecodeError::NON_NUMERIC_IN_NUMERIC_STORAGE);
        assert(res.pointer() == "/Foo/1");
        assert(res.offset() == 10);
    }
    {
        Record r;
        auto res = Unmarshal(r, R"({"id":"x"})");
        assert(res.error() == DecodeError::NON_NUMERIC_IN_NUMERIC_STORAGE);
        assert(res.pointer() == "/id");
        assert(res.offset() == 6);

        res = Unmarshal(r, R"({"id":1.5})");
        assert(res.error() == DecodeError::FLOAT_VALUE_IN_INTEGER_STORAGE);
        assert(res.pointer() == "/id");

        res = Unmarshal(r, R"({"id":null})");
        assert(res.error() == DecodeError::NULL_IN_NON_OPTIONAL);

        res = Unmarshal(r, R"({"inner":[]})");
        assert(res.error() == DecodeError::NON_OBJECT_IN_STRUCT);
        assert(res.kind() == Kind::BeginArray);

        res = Unmarshal(r, R"({"counts":{"a":true}})");
        assert(res.error() == DecodeError::NON_NUMERIC_IN_NUMERIC_STORAGE);
        assert(res.pointer() == "/counts/a");

        res = Unmarshal(r, R"({"triple":[1,2,3,4]})");
        assert(res.error() == DecodeError::FIXED_SIZE_CONTAINER_OVERFLOW);
        assert(res.pointer() == "/triple/3");

        res = Unmarshal(r, R"({"values":{}})");
        assert(res.error() == DecodeError::NON_ARRAY_IN_ARRAY_LIKE_VALUE);
    }
    {
        Small s;
        assert(DecodeFailsWith(s, R"({"v":256})", DecodeError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE));
        assert(DecodeFailsWith(s, R"({"v":-1})", DecodeError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE));
        assert(DecodeSucceeds(s, R"({"v":255})") && s.v == 255);
    }
    {
        int i = 0;
        auto res = Unmarshal(i, R"("s")");
        assert(res.error() == DecodeError::NON_NUMERIC_IN_NUMERIC_STORAGE);
        assert(res.pointer().empty());
        std::string str;
        assert(DecodeFailsWith(str, "12", DecodeError::NON_STRING_IN_STRING_STORAGE));
        bool b = false;
        assert(DecodeFailsWith(b, "0", DecodeError::NON_BOOL_IN_BOOL_VALUE));
    }
    passed("shape errors point at the offending value");
}

void test_reader_errors() {
    Record r;
    assert(TestHelpers::DecodeFailsWithReaderError(r, R"({"id":1)", ReaderError::UNEXPECTED_END_OF_DATA));
    assert(TestHelpers::DecodeFailsWithReaderError(r, R"({"id":1} {})", ReaderError::EXCESS_CHARACTERS));
    assert(TestHelpers::DecodeFailsWithReaderError(r, R"({"id":01})", ReaderError::ILLFORMED_NUMBER));
    passed("reader errors surface as READER_ERROR");
}

void test_field_options() {
    Tagged t;
    t.id = 5;
    t.secret = std::string("hidden");
    assert(EncodesAs(t, R"({"user_id":5})"));
    t.count = 3;
    t.tags = std::vector<int>{1};
    assert(EncodesAs(t, R"({"user_id":5,"count":3,"tags":[1]})"));

    Tagged d;
    assert(DecodeSucceeds(d, R"({"user_id":9,"secret":"s","count":2})"));
    assert(d.id == 9);
    assert(d.secret.value.empty());
    assert(d.count == 2);

    DecodeOptions strict;
    strict.reject_unknown_members = true;
    auto res = Unmarshal(d, R"({"user_id":9,"secret":"s"})", strict);
    assert(res.error() == DecodeError::UNKNOWN_MEMBER);
    assert(res.member() == "secret");
    res = Unmarshal(d, R"({"id":1})", strict);
    assert(res.error() == DecodeError::UNKNOWN_MEMBER);
    assert(res.member() == "id");
    passed("key, exclude and omit_zero");
}

void test_unknown_members() {
    const std::string_view input = R"({"Foo":"foo","Bar":12,"Baz":true,"Qux":"qux","Quux":"what!?"})";
    WithExtras s;
    assert(DecodeSucceeds(s, input));
    assert(s.Foo == "foo" && s.Bar == 12 && s.Baz);
    const std::map<std::string, RawValue> expected{
        {"Qux", RawValue{R"("qux")"}},
        {"Quux", RawValue{R"("what!?")"}},
    };
    assert(s.X.value == expected);
    assert(EncodesAs(s, R"({"Foo":"foo","Bar":12,"Baz":true,"Quux":"what!?","Qux":"qux"})"));

    DecodeOptions strict;
    strict.reject_unknown_members = true;
    auto res = Unmarshal(s, input, strict);
    assert(!res);
    assert(res.error() == DecodeError::UNKNOWN_MEMBER);
    assert(DecodeResultToString(res).starts_with(R"(unknown object member name "Qux")"));

    assert(DecodeFailsWith(s, R"({"Qux":1,"Qux":2})", DecodeError::DUPLICATE_KEY));
    passed("unknown members are captured or rejected");
}

void test_duplicate_keys() {
    Record r;
    auto res = Unmarshal(r, R"({"id":1,"id":2})");
    assert(res.error() == DecodeError::DUPLICATE_KEY);
    assert(res.member() == "id");

    std::map<std::string, int> m;
    assert(DecodeFailsWith(m, R"({"a":1,"a":2})", DecodeError::DUPLICATE_KEY));
    passed("duplicate member names");
}

void test_integer_map_keys() {
    std::map<int, std::string> m;
    assert(DecodeSucceeds(m, R"({"1":"a","-2":"b"})"));
    assert((m == std::map<int, std::string>{{1, "a"}, {-2, "b"}}));
    assert(EncodesAs(m, R"({"-2":"b","1":"a"})"));

    auto res = Unmarshal(m, R"({"x":"a"})");
    assert(res.error() == DecodeError::ILLFORMED_MAP_KEY);
    assert(res.member() == "x");
    passed("integer map keys");
}

void test_raw_values() {
    Envelope e;
    assert(DecodeSucceeds(e, R"({"kind":"a","payload": {"x" : [1, 2]}})"));
    assert(e.payload.text == R"({"x":[1,2]})");
    assert(EncodesAs(e, R"({"kind":"a","payload":{"x":[1,2]}})"));

    assert(DecodeSucceeds(e, R"({"kind":"b","payload":null})"));
    assert(e.payload.text == "null");

    Envelope bad{"c", RawValue{"[1,"}};
    std::string out;
    auto res = Marshal(bad, out);
    assert(!res);
    assert(res.error() == EncodeError::WRITER_ERROR);
    assert(res.writerError() == WriterError::INVALID_RAW_VALUE);
    assert(EncodeResultToString(res).starts_with("write error: "));
    passed("raw values");
}

void test_optional() {
    MaybeInt m;
    m.v = 1;
    assert(DecodeSucceeds(m, R"({"v":null})"));
    assert(!m.v);
    assert(DecodeSucceeds(m, R"({"v":3})"));
    assert(m.v == 3);
    // A failed decode leaves the previous value alone.
    assert(DecodeFailsWith(m, R"({"v":"x"})", DecodeError::NON_NUMERIC_IN_NUMERIC_STORAGE));
    assert(m.v == 3);
    passed("std::optional members");
}

struct FailingSource {
    std::string_view data;
    SourceChunk read(char * buf, std::size_t n) {
        if (data.empty()) {
            return {0, SourceStatus::failed};
        }
        const std::size_t cnt = std::min(n, data.size());
        data.copy(buf, cnt);
        data.remove_prefix(cnt);
        return {cnt, SourceStatus::ok};
    }
};

void test_unmarshal_read() {
    Record r;
    StringSource source(R"({"id":3,"values":[4,5,6]})", 2);
    assert(UnmarshalRead(r, source));
    assert(r.id == 3 && r.values.size() == 3);

    StringSource trailing(R"({"id":3} 1)");
    auto res = UnmarshalRead(r, trailing);
    assert(res.error() == DecodeError::READER_ERROR);
    assert(res.readerError() == ReaderError::EXCESS_CHARACTERS);

    FailingSource failing{R"({"id":3,"values":[4,)"};
    res = UnmarshalRead(r, failing);
    assert(res.is_source_fault());
    assert(res.readerError() == ReaderError::UNEXPECTED_END_OF_DATA);
    passed("decoding from a byte source");
}

void test_marshal_write_sink() {
    std::string out;
    StringSink sink(out);
    assert(MarshalWrite(std::vector<std::string>{"a", "b"}, sink));
    assert(out == R"(["a","b"])");
    passed("encoding into a sink");
}

} // namespace

int main() {
    test_decode_struct();
    test_encode_struct();
    test_shape_errors_point_at_value();
    test_reader_errors();
    test_field_options();
    test_unknown_members();
    test_duplicate_keys();
    test_integer_map_keys();
    test_raw_values();
    test_optional();
    test_unmarshal_read();
    test_marshal_write_sink();
    std::cout << "All binder tests passed." << std::endl;
}
