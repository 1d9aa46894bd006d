#include "../test_helpers.hpp"

#include <string>
#include <vector>

#include <JsonFork/json_pointer.hpp>

using namespace JsonFork;
using TestHelpers::passed;

namespace {

void test_append() {
    std::string p;
    json_pointer::AppendToken(p, "a/b");
    json_pointer::AppendToken(p, "m~n");
    json_pointer::AppendIndex(p, 0);
    json_pointer::AppendIndex(p, 105);
    json_pointer::AppendToken(p, "");
    assert(p == "/a~1b/m~0n/0/105/");
    passed("escaped tokens and indexes are appended");
}

void test_tokens() {
    auto t = json_pointer::Tokens("/a~1b/m~0n/0//x");
    assert(t);
    assert((*t == std::vector<std::string>{"a/b", "m~n", "0", "", "x"}));

    auto root = json_pointer::Tokens("");
    assert(root && root->empty());

    assert(!json_pointer::Tokens("a"));
    assert(!json_pointer::Tokens("/~2"));
    assert(!json_pointer::Tokens("/a~"));

    assert(json_pointer::LastToken("/foo/bar") == "bar");
    assert(json_pointer::LastToken("/foo/a~1b") == "a/b");
    assert(!json_pointer::LastToken(""));
    passed("pointers split into unescaped tokens");
}

void test_contains() {
    assert(json_pointer::Contains("", "/x"));
    assert(json_pointer::Contains("/a", "/a"));
    assert(json_pointer::Contains("/a", "/a/b"));
    assert(!json_pointer::Contains("/a", "/ab"));
    assert(!json_pointer::Contains("/a/b", "/a"));
    passed("containment");
}

void test_parse_index() {
    assert(json_pointer::ParseIndex("0") == 0u);
    assert(json_pointer::ParseIndex("42") == 42u);
    assert(!json_pointer::ParseIndex(""));
    assert(!json_pointer::ParseIndex("01"));
    assert(!json_pointer::ParseIndex("-1"));
    assert(!json_pointer::ParseIndex("1a"));
    assert(!json_pointer::ParseIndex("99999999999999999999999"));
    passed("array index tokens");
}

} // namespace

int main() {
    test_append();
    test_tokens();
    test_contains();
    test_parse_index();
    std::cout << "All json_pointer tests passed." << std::endl;
}
