#pragma once

#include <cstddef>
#include <format>
#include <string>
#include <string_view>

#include "errors.hpp"
#include "parse_result.hpp"

namespace JsonDescent {

namespace error_formatting_detail {

inline constexpr const char* ws = " \t\n\r\f\v";

inline std::string& rtrim(std::string& s, const char* t = ws) {
    s.erase(s.find_last_not_of(t) + 1);
    return s;
}

inline std::string& ltrim(std::string& s, const char* t = ws) {
    s.erase(0, s.find_first_not_of(t));
    return s;
}

inline std::string& trim(std::string& s, const char* t = ws) {
    return ltrim(rtrim(s, t), t);
}

} // namespace error_formatting_detail

/// What was found, e.g. "integer `5`" or "string \"abc\"".
inline std::string UnexpectedToString(const Unexpected& u) {
    using Kind = Unexpected::Kind;
    switch (u.kind) {
    case Kind::boolean:          return std::format("boolean `{}`", u.b);
    case Kind::unsigned_integer: return std::format("integer `{}`", u.u);
    case Kind::signed_integer:   return std::format("integer `{}`", u.i);
    case Kind::floating:         return std::format("floating point `{}`", u.f);
    case Kind::string:           return std::format("string \"{}\"", u.text);
    case Kind::bytes:            return "byte array";
    case Kind::unit:             return "null";
    case Kind::option:           return "option";
    case Kind::newtype_struct:   return "newtype struct";
    case Kind::seq:              return "sequence";
    case Kind::map:              return "map";
    case Kind::enumeration:      return "enum";
    case Kind::unit_variant:     return "unit variant";
    case Kind::newtype_variant:  return "newtype variant";
    case Kind::tuple_variant:    return "tuple variant";
    case Kind::struct_variant:   return "struct variant";
    case Kind::other:            return u.text;
    case Kind::none:             break;
    }
    return "N/A";
}

inline std::string ErrorToString(const Error& err) {
    std::string msg;
    switch (err.code()) {
    case ErrorCode::INVALID_TYPE:
        msg = std::format("invalid type: {}, expected {}", UnexpectedToString(err.unexpected()), err.detail());
        break;
    case ErrorCode::INVALID_VALUE:
        msg = std::format("invalid value: {}, expected {}", UnexpectedToString(err.unexpected()), err.detail());
        break;
    case ErrorCode::INVALID_LENGTH:
        msg = std::format("invalid length {}, expected {}", err.length(), err.detail());
        break;
    case ErrorCode::UNKNOWN_VARIANT:
        msg = std::format("unknown variant `{}`", err.detail());
        break;
    case ErrorCode::UNKNOWN_FIELD:
        msg = std::format("unknown field `{}`", err.detail());
        break;
    case ErrorCode::MISSING_FIELD:
        msg = std::format("missing field `{}`", err.detail());
        break;
    case ErrorCode::DUPLICATE_FIELD:
        msg = std::format("duplicate field `{}`", err.detail());
        break;
    case ErrorCode::CUSTOM:
        msg = std::string(err.detail());
        break;
    case ErrorCode::IO_ERROR:
        msg = std::format("{}: {}", error_to_string(err.code()), err.detail());
        break;
    default:
        msg = std::string(error_to_string(err.code()));
        break;
    }
    if (err.has_position()) {
        msg += std::format(" at line {} column {}", err.line(), err.column());
    }
    return msg;
}

/// Message plus an excerpt of the input around the point where parsing stopped.
inline std::string ParseResultToString(const ParseResult& res, std::string_view input, std::size_t window = 40) {
    if (res) {
        return std::string(error_to_string(ErrorCode::NO_ERROR));
    }
    const std::size_t pos = res.offset() < input.size() ? res.offset() : input.size();
    const std::size_t from = pos > window ? pos - window : 0;
    const std::size_t to = pos + window < input.size() ? pos + window : input.size();
    std::string before(input.substr(from, pos - from));
    std::string after(input.substr(pos, to - pos));
    error_formatting_detail::trim(before);
    error_formatting_detail::trim(after);
    return std::format("{}: '...{}>>{}...'", ErrorToString(res.error()), before, after);
}

} // namespace JsonDescent
