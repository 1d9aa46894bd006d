#pragma once

#include <cstddef>
#include <format>
#include <string>
#include <string_view>

#include "decode_result.hpp"
#include "errors.hpp"
#include "token.hpp"

namespace JsonFork {

namespace error_formatting_detail {

inline constexpr const char* ws = " \t\n\r\f\v";

inline std::string& rtrim(std::string& s, const char* t = ws)
{
    s.erase(s.find_last_not_of(t) + 1);
    return s;
}

inline std::string& ltrim(std::string& s, const char* t = ws)
{
    s.erase(0, s.find_first_not_of(t));
    return s;
}

inline std::string& trim(std::string& s, const char* t = ws)
{
    return ltrim(rtrim(s, t), t);
}

inline std::string describe(const DecodeResult & res) {
    const std::string_view kind = kind_to_string(res.kind());
    switch (res.error()) {
    case DecodeError::NO_ERROR:
        return "no error";
    case DecodeError::FIXED_SIZE_CONTAINER_OVERFLOW:
        return "JSON array is longer than its fixed-size storage";
    case DecodeError::NON_NUMERIC_IN_NUMERIC_STORAGE:
        return std::format("cannot decode JSON {} into numeric storage", kind);
    case DecodeError::FLOAT_VALUE_IN_INTEGER_STORAGE:
        return "cannot decode fractional JSON number into integer storage";
    case DecodeError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE:
        return "JSON number is out of range of its storage";
    case DecodeError::NON_BOOL_IN_BOOL_VALUE:
        return std::format("cannot decode JSON {} into bool storage", kind);
    case DecodeError::NON_STRING_IN_STRING_STORAGE:
        return std::format("cannot decode JSON {} into string storage", kind);
    case DecodeError::NON_ARRAY_IN_ARRAY_LIKE_VALUE:
        return std::format("cannot decode JSON {} into array storage", kind);
    case DecodeError::NON_MAP_IN_MAP_LIKE_VALUE:
        return std::format("cannot decode JSON {} into map storage", kind);
    case DecodeError::NON_OBJECT_IN_STRUCT:
        return std::format("cannot decode JSON {} into struct", kind);
    case DecodeError::NULL_IN_NON_OPTIONAL:
        return "cannot decode JSON null into non-optional storage";
    case DecodeError::ILLFORMED_MAP_KEY:
        return std::format("ill-formed map key \"{}\"", res.member());
    case DecodeError::UNKNOWN_MEMBER:
        return std::format("unknown object member name \"{}\"", res.member());
    case DecodeError::DUPLICATE_KEY:
        return std::format("duplicate object member name \"{}\"", res.member());
    case DecodeError::DATA_CONSUMER_ERROR:
        return "data consumer rejected a value";
    case DecodeError::NOT_FOUND:
        return "no value found";
    case DecodeError::BOTH_ALTERNATIVES_FAILED:
        return "Either: unmarshal failed for both alternatives";
    case DecodeError::SOURCE_FAULT:
        return std::format("source fault: {}", reader_error_to_string(res.readerError()));
    case DecodeError::READER_ERROR:
        return std::format("read error: {}", reader_error_to_string(res.readerError()));
    }
    return std::string(error_to_string(res.error()));
}

} // namespace error_formatting_detail


// One line per result. An Either failure nests both causes, left first.
inline std::string DecodeResultToString(const DecodeResult & res) {
    if (res) {
        return "no error";
    }
    std::string out = error_formatting_detail::describe(res);
    if (res.has_causes()) {
        out += std::format(": left = ({}), right = ({})",
                           DecodeResultToString(res.left_cause()),
                           DecodeResultToString(res.right_cause()));
    }
    if (!res.pointer().empty()) {
        out += std::format(" within \"{}\"", res.pointer());
    }
    out += std::format(" at offset {}", res.offset());
    return out;
}

// Same, followed by the input around the failing offset.
inline std::string DecodeResultToString(const DecodeResult & res, std::string_view input, std::size_t window = 40) {
    std::string out = DecodeResultToString(res);
    if (res) {
        return out;
    }
    const std::size_t pos = res.offset() < input.size() ? res.offset() : input.size();
    const std::size_t from = pos >= window ? pos - window : 0;
    std::string before(input.substr(from, pos - from));
    std::string after(input.substr(pos, window));
    error_formatting_detail::trim(before);
    error_formatting_detail::trim(after);
    return out + std::format(": '...{}<<HERE>>{}...'", before, after);
}

inline std::string EncodeResultToString(const EncodeResult & res) {
    if (res) {
        return "no error";
    }
    if (res.error() == EncodeError::WRITER_ERROR) {
        return std::format("write error: {}", writer_error_to_string(res.writerError()));
    }
    return std::format("encode error: {}", error_to_string(res.error()));
}

} // namespace JsonFork
