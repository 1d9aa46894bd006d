#pragma once

#undef NDEBUG
#include <cassert>
#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>

#include <JsonFork/decoder.hpp>
#include <JsonFork/encoder.hpp>
#include <JsonFork/error_formatting.hpp>

namespace TestHelpers {

inline int test_counter = 0;

inline void passed(std::string_view name) {
    std::cout << "Test " << ++test_counter << ": " << name << " PASSED" << std::endl;
}

template<typename T>
bool DecodeSucceeds(T & obj, std::string_view json, const JsonFork::DecodeOptions & opts = {}) {
    auto res = JsonFork::Unmarshal(obj, json, opts);
    if (!res) {
        std::cerr << JsonFork::DecodeResultToString(res, json) << std::endl;
    }
    return static_cast<bool>(res);
}

template<typename T>
bool DecodeFailsWith(T & obj, std::string_view json, JsonFork::DecodeError expected,
                     const JsonFork::DecodeOptions & opts = {}) {
    auto res = JsonFork::Unmarshal(obj, json, opts);
    return !res && res.error() == expected;
}

template<typename T>
bool DecodeFailsWithReaderError(T & obj, std::string_view json, JsonFork::ReaderError expected) {
    auto res = JsonFork::Unmarshal(obj, json);
    return !res && res.error() == JsonFork::DecodeError::READER_ERROR && res.readerError() == expected;
}

template<typename T>
bool EncodesAs(const T & obj, std::string_view expected, const JsonFork::EncodeOptions & opts = {}) {
    std::string out;
    auto res = JsonFork::Marshal(obj, out, opts);
    if (!res) {
        std::cerr << JsonFork::EncodeResultToString(res) << std::endl;
        return false;
    }
    if (out != expected) {
        std::cerr << "expected: " << expected << "\nactual:   " << out << std::endl;
        return false;
    }
    return true;
}

} // namespace TestHelpers
