#pragma once

#include <cstddef>
#include <utility>

#include "errors.hpp"

namespace JsonDescent {

class ParseResult {
    Error m_error;
    std::size_t m_offset = 0;

public:
    constexpr ParseResult() = default;
    constexpr ParseResult(Error err, std::size_t offset) : m_error(std::move(err)), m_offset(offset) {}

    constexpr operator bool() const {
        return m_error.code() == ErrorCode::NO_ERROR;
    }

    constexpr const Error& error() const {
        return m_error;
    }
    constexpr ErrorCode code() const {
        return m_error.code();
    }
    constexpr std::size_t line() const {
        return m_error.line();
    }
    constexpr std::size_t column() const {
        return m_error.column();
    }
    /// Bytes consumed from the input when parsing stopped
    constexpr std::size_t offset() const {
        return m_offset;
    }
};

} // namespace JsonDescent
