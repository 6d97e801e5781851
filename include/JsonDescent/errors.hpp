#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace JsonDescent {


enum class ErrorCode {
    NO_ERROR,

    // End of input in the middle of a production
    EOF_WHILE_PARSING_LIST,
    EOF_WHILE_PARSING_OBJECT,
    EOF_WHILE_PARSING_STRING,
    EOF_WHILE_PARSING_VALUE,

    // Syntax
    EXPECTED_COLON,
    EXPECTED_LIST_COMMA_OR_END,
    EXPECTED_OBJECT_COMMA_OR_END,
    EXPECTED_SOME_IDENT,
    EXPECTED_SOME_VALUE,
    INVALID_ESCAPE,
    INVALID_NUMBER,
    NUMBER_OUT_OF_RANGE,
    INVALID_UNICODE_CODE_POINT,
    CONTROL_CHARACTER_IN_STRING,
    KEY_MUST_BE_A_STRING,
    TRAILING_COMMA,
    TRAILING_CHARACTERS,
    RECURSION_LIMIT_EXCEEDED,

    // Rejected by the target type
    INVALID_TYPE,
    INVALID_VALUE,
    INVALID_LENGTH,
    UNKNOWN_VARIANT,
    UNKNOWN_FIELD,
    MISSING_FIELD,
    DUPLICATE_FIELD,
    CUSTOM,

    IO_ERROR
};

constexpr std::string_view error_to_string(ErrorCode e) {
    switch(e) {
    case ErrorCode::NO_ERROR: return "NO_ERROR"; break;
    case ErrorCode::EOF_WHILE_PARSING_LIST: return "EOF_WHILE_PARSING_LIST"; break;
    case ErrorCode::EOF_WHILE_PARSING_OBJECT: return "EOF_WHILE_PARSING_OBJECT"; break;
    case ErrorCode::EOF_WHILE_PARSING_STRING: return "EOF_WHILE_PARSING_STRING"; break;
    case ErrorCode::EOF_WHILE_PARSING_VALUE: return "EOF_WHILE_PARSING_VALUE"; break;
    case ErrorCode::EXPECTED_COLON: return "EXPECTED_COLON"; break;
    case ErrorCode::EXPECTED_LIST_COMMA_OR_END: return "EXPECTED_LIST_COMMA_OR_END"; break;
    case ErrorCode::EXPECTED_OBJECT_COMMA_OR_END: return "EXPECTED_OBJECT_COMMA_OR_END"; break;
    case ErrorCode::EXPECTED_SOME_IDENT: return "EXPECTED_SOME_IDENT"; break;
    case ErrorCode::EXPECTED_SOME_VALUE: return "EXPECTED_SOME_VALUE"; break;
    case ErrorCode::INVALID_ESCAPE: return "INVALID_ESCAPE"; break;
    case ErrorCode::INVALID_NUMBER: return "INVALID_NUMBER"; break;
    case ErrorCode::NUMBER_OUT_OF_RANGE: return "NUMBER_OUT_OF_RANGE"; break;
    case ErrorCode::INVALID_UNICODE_CODE_POINT: return "INVALID_UNICODE_CODE_POINT"; break;
    case ErrorCode::CONTROL_CHARACTER_IN_STRING: return "CONTROL_CHARACTER_IN_STRING"; break;
    case ErrorCode::KEY_MUST_BE_A_STRING: return "KEY_MUST_BE_A_STRING"; break;
    case ErrorCode::TRAILING_COMMA: return "TRAILING_COMMA"; break;
    case ErrorCode::TRAILING_CHARACTERS: return "TRAILING_CHARACTERS"; break;
    case ErrorCode::RECURSION_LIMIT_EXCEEDED: return "RECURSION_LIMIT_EXCEEDED"; break;
    case ErrorCode::INVALID_TYPE: return "INVALID_TYPE"; break;
    case ErrorCode::INVALID_VALUE: return "INVALID_VALUE"; break;
    case ErrorCode::INVALID_LENGTH: return "INVALID_LENGTH"; break;
    case ErrorCode::UNKNOWN_VARIANT: return "UNKNOWN_VARIANT"; break;
    case ErrorCode::UNKNOWN_FIELD: return "UNKNOWN_FIELD"; break;
    case ErrorCode::MISSING_FIELD: return "MISSING_FIELD"; break;
    case ErrorCode::DUPLICATE_FIELD: return "DUPLICATE_FIELD"; break;
    case ErrorCode::CUSTOM: return "CUSTOM"; break;
    case ErrorCode::IO_ERROR: return "IO_ERROR"; break;
    }
    return "N/A";
}

enum class ErrorCategory {
    io,      // the byte source failed to read
    syntax,  // malformed JSON
    data,    // well-formed JSON of the wrong shape for the target
    eof      // input ended in the middle of a value
};

constexpr ErrorCategory category_of(ErrorCode e) {
    switch(e) {
    case ErrorCode::EOF_WHILE_PARSING_LIST:
    case ErrorCode::EOF_WHILE_PARSING_OBJECT:
    case ErrorCode::EOF_WHILE_PARSING_STRING:
    case ErrorCode::EOF_WHILE_PARSING_VALUE:
        return ErrorCategory::eof;
    case ErrorCode::INVALID_TYPE:
    case ErrorCode::INVALID_VALUE:
    case ErrorCode::INVALID_LENGTH:
    case ErrorCode::UNKNOWN_VARIANT:
    case ErrorCode::UNKNOWN_FIELD:
    case ErrorCode::MISSING_FIELD:
    case ErrorCode::DUPLICATE_FIELD:
    case ErrorCode::CUSTOM:
        return ErrorCategory::data;
    case ErrorCode::IO_ERROR:
        return ErrorCategory::io;
    default:
        return ErrorCategory::syntax;
    }
}

/// What the input actually contained when a target type rejected it.
struct Unexpected {
    enum class Kind {
        none,
        boolean,
        unsigned_integer,
        signed_integer,
        floating,
        string,
        bytes,
        unit,
        option,
        newtype_struct,
        seq,
        map,
        enumeration,
        unit_variant,
        newtype_variant,
        tuple_variant,
        struct_variant,
        other
    };

    Kind kind = Kind::none;
    bool b = false;
    std::uint64_t u = 0;
    std::int64_t i = 0;
    double f = 0;
    std::string text;  // string contents, or a free-form description for Kind::other

    static constexpr Unexpected of(Kind k) {
        Unexpected r;
        r.kind = k;
        return r;
    }
    static constexpr Unexpected boolean(bool v) {
        Unexpected r = of(Kind::boolean);
        r.b = v;
        return r;
    }
    static constexpr Unexpected unsigned_integer(std::uint64_t v) {
        Unexpected r = of(Kind::unsigned_integer);
        r.u = v;
        return r;
    }
    static constexpr Unexpected signed_integer(std::int64_t v) {
        Unexpected r = of(Kind::signed_integer);
        r.i = v;
        return r;
    }
    static constexpr Unexpected floating(double v) {
        Unexpected r = of(Kind::floating);
        r.f = v;
        return r;
    }
    static constexpr Unexpected string(std::string_view v) {
        Unexpected r = of(Kind::string);
        r.text.assign(v.data(), v.size());
        return r;
    }
    static constexpr Unexpected other(std::string_view what) {
        Unexpected r = of(Kind::other);
        r.text.assign(what.data(), what.size());
        return r;
    }
};


class Error {
    ErrorCode m_code = ErrorCode::NO_ERROR;
    std::size_t m_line = 0;
    std::size_t m_column = 0;
    Unexpected m_unexpected{};
    std::string m_detail;
    std::size_t m_length = 0;

    constexpr Error(ErrorCode code, std::string_view detail) : m_code(code) {
        if (!detail.empty()) {
            m_detail.assign(detail.data(), detail.size());
        }
    }

public:
    constexpr Error() = default;

    static constexpr Error syntax(ErrorCode code, std::size_t line, std::size_t column) {
        Error e(code, {});
        e.m_line = line;
        e.m_column = column;
        return e;
    }

    static constexpr Error io(std::string_view message) {
        return Error(ErrorCode::IO_ERROR, message);
    }

    static constexpr Error invalid_type(Unexpected unexp, std::string_view expected) {
        Error e(ErrorCode::INVALID_TYPE, expected);
        e.m_unexpected = std::move(unexp);
        return e;
    }

    static constexpr Error invalid_value(Unexpected unexp, std::string_view expected) {
        Error e(ErrorCode::INVALID_VALUE, expected);
        e.m_unexpected = std::move(unexp);
        return e;
    }

    static constexpr Error invalid_length(std::size_t len, std::string_view expected) {
        Error e(ErrorCode::INVALID_LENGTH, expected);
        e.m_length = len;
        return e;
    }

    static constexpr Error unknown_variant(std::string_view variant) {
        return Error(ErrorCode::UNKNOWN_VARIANT, variant);
    }
    static constexpr Error unknown_field(std::string_view field) {
        return Error(ErrorCode::UNKNOWN_FIELD, field);
    }
    static constexpr Error missing_field(std::string_view field) {
        return Error(ErrorCode::MISSING_FIELD, field);
    }
    static constexpr Error duplicate_field(std::string_view field) {
        return Error(ErrorCode::DUPLICATE_FIELD, field);
    }
    static constexpr Error custom(std::string_view message) {
        return Error(ErrorCode::CUSTOM, message);
    }

    constexpr ErrorCode code() const {
        return m_code;
    }
    constexpr ErrorCategory classify() const {
        return category_of(m_code);
    }
    constexpr bool is_io() const {
        return classify() == ErrorCategory::io;
    }
    constexpr bool is_syntax() const {
        return classify() == ErrorCategory::syntax;
    }
    constexpr bool is_data() const {
        return classify() == ErrorCategory::data;
    }
    constexpr bool is_eof() const {
        return classify() == ErrorCategory::eof;
    }

    /// 1-based line, 0 when the error carries no position
    constexpr std::size_t line() const {
        return m_line;
    }
    /// Bytes consumed on the error's line
    constexpr std::size_t column() const {
        return m_column;
    }
    constexpr bool has_position() const {
        return m_line != 0;
    }

    constexpr const Unexpected& unexpected() const {
        return m_unexpected;
    }
    /// Expected-type description, field or variant name, or custom message
    constexpr std::string_view detail() const {
        return m_detail;
    }
    /// Number of elements seen, for INVALID_LENGTH
    constexpr std::size_t length() const {
        return m_length;
    }

    // Errors raised by a target type are positionless until the engine
    // stamps them; I/O errors never get a position.
    constexpr void fix_position(std::size_t line, std::size_t column) {
        if (m_line == 0 && m_code != ErrorCode::IO_ERROR) {
            m_line = line;
            m_column = column;
        }
    }
};

} // namespace JsonDescent
