#pragma once

#include <string_view>

namespace ShapeFusion {


enum class SerializeError {
    NO_ERROR,

    UNSUPPORTED_SHAPE,      // format cannot represent the value (e.g. 128-bit integers)
    LENGTH_REQUIRED,        // format needs the element count up front
    LENGTH_MISMATCH,        // declared length differs from elements written
    KEY_MUST_BE_STRING,
    SESSION_MISUSE,         // begin/end pairing or key/value order violated
    WRITER_ERROR,           // sink exhausted or I/O fault
    UNKNOWN_VARIANT,        // enum value with no declared variant
    CUSTOM                  // mapping logic refused the value
};

constexpr std::string_view error_to_string(SerializeError e) {
    switch(e) {
    case SerializeError::NO_ERROR: return "NO_ERROR";
    case SerializeError::UNSUPPORTED_SHAPE: return "UNSUPPORTED_SHAPE";
    case SerializeError::LENGTH_REQUIRED: return "LENGTH_REQUIRED";
    case SerializeError::LENGTH_MISMATCH: return "LENGTH_MISMATCH";
    case SerializeError::KEY_MUST_BE_STRING: return "KEY_MUST_BE_STRING";
    case SerializeError::SESSION_MISUSE: return "SESSION_MISUSE";
    case SerializeError::WRITER_ERROR: return "WRITER_ERROR";
    case SerializeError::UNKNOWN_VARIANT: return "UNKNOWN_VARIANT";
    case SerializeError::CUSTOM: return "CUSTOM";
    }
    return "N/A";
}


enum class DeserializeError {
    NO_ERROR,

    // Input bytes are bad
    UNEXPECTED_END_OF_DATA,
    ILLFORMED_INPUT,
    INVALID_UTF8,
    TRAILING_ENTRIES,       // sequence/map has elements the visitor did not consume
    TRAILING_DATA,          // input continues after the top-level value
    LENGTH_MISMATCH,        // declared element count differs from the entries present
    NOT_SELF_DESCRIBING,    // shape cannot be determined from the input alone
    NESTING_TOO_DEEP,

    // Input bytes are fine, but the visitor cannot build from them
    INVALID_TYPE,
    INVALID_VALUE,
    INVALID_LENGTH,
    BORROW_UNAVAILABLE,
    UNKNOWN_FIELD,
    UNKNOWN_VARIANT,
    MISSING_FIELD,
    DUPLICATE_FIELD,
    DUPLICATE_KEY,
    CUSTOM
};

/// Lets callers tell "bad bytes" from "bytes were fine, but semantically unrecognized".
enum class ErrorClass {
    none,
    syntax,
    semantic
};

constexpr ErrorClass error_class(DeserializeError e) {
    switch(e) {
    case DeserializeError::NO_ERROR:
        return ErrorClass::none;
    case DeserializeError::UNEXPECTED_END_OF_DATA:
    case DeserializeError::ILLFORMED_INPUT:
    case DeserializeError::INVALID_UTF8:
    case DeserializeError::TRAILING_ENTRIES:
    case DeserializeError::TRAILING_DATA:
    case DeserializeError::LENGTH_MISMATCH:
    case DeserializeError::NOT_SELF_DESCRIBING:
    case DeserializeError::NESTING_TOO_DEEP:
        return ErrorClass::syntax;
    default:
        return ErrorClass::semantic;
    }
}

constexpr std::string_view error_to_string(DeserializeError e) {
    switch(e) {
    case DeserializeError::NO_ERROR: return "NO_ERROR";
    case DeserializeError::UNEXPECTED_END_OF_DATA: return "UNEXPECTED_END_OF_DATA";
    case DeserializeError::ILLFORMED_INPUT: return "ILLFORMED_INPUT";
    case DeserializeError::INVALID_UTF8: return "INVALID_UTF8";
    case DeserializeError::TRAILING_ENTRIES: return "TRAILING_ENTRIES";
    case DeserializeError::TRAILING_DATA: return "TRAILING_DATA";
    case DeserializeError::LENGTH_MISMATCH: return "LENGTH_MISMATCH";
    case DeserializeError::NOT_SELF_DESCRIBING: return "NOT_SELF_DESCRIBING";
    case DeserializeError::NESTING_TOO_DEEP: return "NESTING_TOO_DEEP";
    case DeserializeError::INVALID_TYPE: return "INVALID_TYPE";
    case DeserializeError::INVALID_VALUE: return "INVALID_VALUE";
    case DeserializeError::INVALID_LENGTH: return "INVALID_LENGTH";
    case DeserializeError::BORROW_UNAVAILABLE: return "BORROW_UNAVAILABLE";
    case DeserializeError::UNKNOWN_FIELD: return "UNKNOWN_FIELD";
    case DeserializeError::UNKNOWN_VARIANT: return "UNKNOWN_VARIANT";
    case DeserializeError::MISSING_FIELD: return "MISSING_FIELD";
    case DeserializeError::DUPLICATE_FIELD: return "DUPLICATE_FIELD";
    case DeserializeError::DUPLICATE_KEY: return "DUPLICATE_KEY";
    case DeserializeError::CUSTOM: return "CUSTOM";
    }
    return "N/A";
}

} // namespace ShapeFusion
