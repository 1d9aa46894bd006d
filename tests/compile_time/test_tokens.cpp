#include <cstdint>
#include <string>
#include <string_view>

#include <JsonFork/json_pointer.hpp>
#include <JsonFork/pipe.hpp>
#include <JsonFork/token.hpp>

using namespace JsonFork;

static_assert(kind_to_string(Kind::True) == "boolean");
static_assert(kind_to_string(Kind::False) == "boolean");
static_assert(kind_to_string(Kind::BeginObject) == "object");
static_assert(kind_to_string(Kind::EndArray) == "end of array");

static_assert(close_cause_to_string(CloseCause::failed_early) == "failed early");

constexpr bool parses(std::string_view text, std::int64_t expected) {
    std::int64_t v = 0;
    return token_detail::parse_decimal_integer(text, v) && v == expected;
}

static_assert(parses("0", 0));
static_assert(parses("-42", -42));
static_assert(parses("9223372036854775807", INT64_MAX));
static_assert(parses("-9223372036854775808", INT64_MIN));
static_assert(!parses("9223372036854775808", 0));
static_assert(!parses("-", 0));
static_assert(!parses("1.0", 1));

constexpr bool parses_unsigned(std::string_view text) {
    std::uint8_t v = 0;
    return token_detail::parse_decimal_integer(text, v);
}

static_assert(parses_unsigned("255"));
static_assert(!parses_unsigned("256"));
static_assert(!parses_unsigned("-1"));

static_assert(token_detail::is_integer_literal("-12"));
static_assert(!token_detail::is_integer_literal("1e3"));
static_assert(!token_detail::is_integer_literal("0.5"));

constexpr std::string pointer_of(std::string_view name, std::size_t index) {
    std::string p;
    json_pointer::AppendToken(p, name);
    json_pointer::AppendIndex(p, index);
    return p;
}

static_assert(pointer_of("a/b~", 12) == "/a~1b~0/12");

static_assert(json_pointer::Tokens("/a~1b/0")->size() == 2);
static_assert((*json_pointer::Tokens("/a~1b/0"))[0] == "a/b");
static_assert(!json_pointer::Tokens("x").has_value());
static_assert(*json_pointer::LastToken("/foo/bar") == "bar");
static_assert(json_pointer::Contains("/foo", "/foo/bar"));
static_assert(!json_pointer::Contains("/foo", "/foobar"));
static_assert(*json_pointer::ParseIndex("10") == 10);
static_assert(!json_pointer::ParseIndex("010").has_value());
