#pragma once

#include <string_view>

namespace JsonFork {

enum class ReaderError {
    NO_ERROR,
    UNEXPECTED_END_OF_DATA,
    EXCESS_CHARACTERS,
    UNEXPECTED_CHARACTER,
    ILLFORMED_NULL,
    ILLFORMED_BOOL,
    ILLFORMED_OBJECT,
    ILLFORMED_STRING,
    ILLFORMED_NUMBER,
    ILLFORMED_ARRAY,
    NESTING_TOO_DEEP
};

constexpr std::string_view reader_error_to_string(ReaderError e) {
    switch(e) {
    case ReaderError::NO_ERROR: return "NO_ERROR"; break;
    case ReaderError::UNEXPECTED_END_OF_DATA: return "UNEXPECTED_END_OF_DATA"; break;
    case ReaderError::EXCESS_CHARACTERS: return "EXCESS_CHARACTERS"; break;
    case ReaderError::UNEXPECTED_CHARACTER: return "UNEXPECTED_CHARACTER"; break;
    case ReaderError::ILLFORMED_NULL: return "ILLFORMED_NULL"; break;
    case ReaderError::ILLFORMED_BOOL: return "ILLFORMED_BOOL"; break;
    case ReaderError::ILLFORMED_OBJECT: return "ILLFORMED_OBJECT"; break;
    case ReaderError::ILLFORMED_STRING: return "ILLFORMED_STRING"; break;
    case ReaderError::ILLFORMED_NUMBER: return "ILLFORMED_NUMBER"; break;
    case ReaderError::ILLFORMED_ARRAY: return "ILLFORMED_ARRAY"; break;
    case ReaderError::NESTING_TOO_DEEP: return "NESTING_TOO_DEEP"; break;
    }
    return "N/A";
}

enum class WriterError {
    NO_ERROR,
    OUTPUT_FAILED,
    INVALID_TOKEN_POSITION,
    MISMATCHED_CLOSE,
    INVALID_RAW_VALUE
};

constexpr std::string_view writer_error_to_string(WriterError e) {
    switch(e) {
    case WriterError::NO_ERROR: return "NO_ERROR"; break;
    case WriterError::OUTPUT_FAILED: return "OUTPUT_FAILED"; break;
    case WriterError::INVALID_TOKEN_POSITION: return "INVALID_TOKEN_POSITION"; break;
    case WriterError::MISMATCHED_CLOSE: return "MISMATCHED_CLOSE"; break;
    case WriterError::INVALID_RAW_VALUE: return "INVALID_RAW_VALUE"; break;
    }
    return "N/A";
}

enum class DecodeError {
    NO_ERROR,

    FIXED_SIZE_CONTAINER_OVERFLOW,

    NON_NUMERIC_IN_NUMERIC_STORAGE,
    FLOAT_VALUE_IN_INTEGER_STORAGE,
    NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE,
    NON_BOOL_IN_BOOL_VALUE,
    NON_STRING_IN_STRING_STORAGE,
    NON_ARRAY_IN_ARRAY_LIKE_VALUE,
    NON_MAP_IN_MAP_LIKE_VALUE,
    NON_OBJECT_IN_STRUCT,
    NULL_IN_NON_OPTIONAL,
    ILLFORMED_MAP_KEY,

    UNKNOWN_MEMBER,
    DUPLICATE_KEY,

    DATA_CONSUMER_ERROR,
    NOT_FOUND,
    BOTH_ALTERNATIVES_FAILED,
    SOURCE_FAULT,
    READER_ERROR
};

constexpr std::string_view error_to_string(DecodeError e) {
    switch(e) {
    case DecodeError::NO_ERROR: return "NO_ERROR"; break;
    case DecodeError::FIXED_SIZE_CONTAINER_OVERFLOW: return "FIXED_SIZE_CONTAINER_OVERFLOW"; break;
    case DecodeError::NON_NUMERIC_IN_NUMERIC_STORAGE: return "NON_NUMERIC_IN_NUMERIC_STORAGE"; break;
    case DecodeError::FLOAT_VALUE_IN_INTEGER_STORAGE: return "FLOAT_VALUE_IN_INTEGER_STORAGE"; break;
    case DecodeError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE: return "NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE"; break;
    case DecodeError::NON_BOOL_IN_BOOL_VALUE: return "NON_BOOL_IN_BOOL_VALUE"; break;
    case DecodeError::NON_STRING_IN_STRING_STORAGE: return "NON_STRING_IN_STRING_STORAGE"; break;
    case DecodeError::NON_ARRAY_IN_ARRAY_LIKE_VALUE: return "NON_ARRAY_IN_ARRAY_LIKE_VALUE"; break;
    case DecodeError::NON_MAP_IN_MAP_LIKE_VALUE: return "NON_MAP_IN_MAP_LIKE_VALUE"; break;
    case DecodeError::NON_OBJECT_IN_STRUCT: return "NON_OBJECT_IN_STRUCT"; break;
    case DecodeError::NULL_IN_NON_OPTIONAL: return "NULL_IN_NON_OPTIONAL"; break;
    case DecodeError::ILLFORMED_MAP_KEY: return "ILLFORMED_MAP_KEY"; break;
    case DecodeError::UNKNOWN_MEMBER: return "UNKNOWN_MEMBER"; break;
    case DecodeError::DUPLICATE_KEY: return "DUPLICATE_KEY"; break;
    case DecodeError::DATA_CONSUMER_ERROR: return "DATA_CONSUMER_ERROR"; break;
    case DecodeError::NOT_FOUND: return "NOT_FOUND"; break;
    case DecodeError::BOTH_ALTERNATIVES_FAILED: return "BOTH_ALTERNATIVES_FAILED"; break;
    case DecodeError::SOURCE_FAULT: return "SOURCE_FAULT"; break;
    case DecodeError::READER_ERROR: return "READER_ERROR"; break;
    }
    return "N/A";
}

enum class EncodeError {
    NO_ERROR,
    WRITER_ERROR,
    DATA_PRODUCER_ERROR
};

constexpr std::string_view error_to_string(EncodeError e) {
    switch(e) {
    case EncodeError::NO_ERROR: return "NO_ERROR"; break;
    case EncodeError::WRITER_ERROR: return "WRITER_ERROR"; break;
    case EncodeError::DATA_PRODUCER_ERROR: return "DATA_PRODUCER_ERROR"; break;
    }
    return "N/A";
}

} // namespace JsonFork
