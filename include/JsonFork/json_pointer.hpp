#pragma once

#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace JsonFork {
namespace json_pointer {

// RFC 6901 JSON Pointers: "" is the whole value, "/a/0" is member a, element 0.

constexpr void AppendToken(std::string & pointer, std::string_view token) {
    pointer.push_back('/');
    for (char c : token) {
        switch (c) {
        case '~': pointer += "~0"; break;
        case '/': pointer += "~1"; break;
        default: pointer.push_back(c); break;
        }
    }
}

constexpr void AppendIndex(std::string & pointer, std::size_t index) {
    char buf[24];
    std::size_t n = 0;
    do {
        buf[n++] = static_cast<char>('0' + index % 10);
        index /= 10;
    } while (index != 0);
    pointer.push_back('/');
    while (n > 0) {
        pointer.push_back(buf[--n]);
    }
}

// Splits and unescapes; nullopt when the pointer is malformed.
constexpr std::optional<std::vector<std::string>> Tokens(std::string_view pointer) {
    std::vector<std::string> out;
    if (pointer.empty()) {
        return out;
    }
    if (pointer.front() != '/') {
        return std::nullopt;
    }
    std::string current;
    for (std::size_t i = 1; i <= pointer.size(); ++i) {
        if (i == pointer.size() || pointer[i] == '/') {
            out.push_back(current);
            current.clear();
            continue;
        }
        if (pointer[i] == '~') {
            if (i + 1 == pointer.size()) {
                return std::nullopt;
            }
            char e = pointer[++i];
            if (e == '0') {
                current.push_back('~');
            } else if (e == '1') {
                current.push_back('/');
            } else {
                return std::nullopt;
            }
            continue;
        }
        current.push_back(pointer[i]);
    }
    return out;
}

constexpr std::optional<std::string> LastToken(std::string_view pointer) {
    auto tokens = Tokens(pointer);
    if (!tokens || tokens->empty()) {
        return std::nullopt;
    }
    return tokens->back();
}

// True when child is parent itself or lies below it.
constexpr bool Contains(std::string_view parent, std::string_view child) {
    if (child.size() < parent.size() || child.substr(0, parent.size()) != parent) {
        return false;
    }
    return child.size() == parent.size() || child[parent.size()] == '/';
}

// Decimal array index; nullopt for anything RFC 6901 does not accept as an index.
constexpr std::optional<std::size_t> ParseIndex(std::string_view token) {
    if (token.empty() || (token.size() > 1 && token[0] == '0')) {
        return std::nullopt;
    }
    std::size_t v = 0;
    for (char c : token) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        std::size_t digit = static_cast<std::size_t>(c - '0');
        if (v > (std::numeric_limits<std::size_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        v = v * 10 + digit;
    }
    return v;
}

} // namespace json_pointer
} // namespace JsonFork
