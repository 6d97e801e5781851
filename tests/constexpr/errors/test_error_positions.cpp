#include "../test_helpers.hpp"
#include <JsonDescent/parser.hpp>
#include <optional>
#include <string>
#include <vector>

using namespace TestHelpers;
using JsonDescent::ErrorCode;

// ============================================================================
// Test: Error Line and Column
// ============================================================================
//
// Lines start at 1. The column counts bytes consumed on the error's line.
// Syntax errors point just past the offending lookahead byte; errors raised
// by a target type point just past the value it rejected.

struct IntValue {
    int value;
};

struct ByteValue {
    std::uint8_t value;
};

struct WithOptional {
    int x;
    std::optional<int> y;
};

// Syntax
static_assert(TestParseErrorAt<std::vector<int>>(R"([1 2])", ErrorCode::EXPECTED_LIST_COMMA_OR_END, 1, 4),
              "Position: missing list comma");
static_assert(TestParseErrorAt<IntValue>(R"({"value" 1})", ErrorCode::EXPECTED_COLON, 1, 10),
              "Position: missing colon");
static_assert(TestParseErrorAt<std::vector<int>>("[\n  1,\n]", ErrorCode::TRAILING_COMMA, 3, 1),
              "Position: trailing comma on a later line");
static_assert(TestParseErrorAt<std::vector<int>>("[1] x", ErrorCode::TRAILING_CHARACTERS, 1, 5),
              "Position: trailing characters");
static_assert(TestParseErrorAt<int>("", ErrorCode::EOF_WHILE_PARSING_VALUE, 1, 0), "Position: empty input");
static_assert(TestParseErrorAt<std::vector<int>>("[1,", ErrorCode::EOF_WHILE_PARSING_VALUE, 1, 3),
              "Position: EOF after comma");
static_assert(TestParseErrorAt<std::vector<int>>("[1", ErrorCode::EOF_WHILE_PARSING_LIST, 1, 2),
              "Position: EOF inside list");
static_assert(TestParseErrorAt<std::string>(R"("abc)", ErrorCode::EOF_WHILE_PARSING_STRING, 1, 4),
              "Position: unterminated string");
static_assert(TestParseErrorAt<std::optional<int>>("nul", ErrorCode::EOF_WHILE_PARSING_VALUE, 1, 3),
              "Position: truncated literal");
static_assert(TestParseErrorAt<std::optional<int>>("nulx", ErrorCode::EXPECTED_SOME_IDENT, 1, 4),
              "Position: misspelled literal");
static_assert(TestParseErrorAt<std::string>("\"a\x01\"", ErrorCode::CONTROL_CHARACTER_IN_STRING, 1, 3),
              "Position: control character");

// Rejected by the target type
static_assert(TestParseErrorAt<IntValue>(R"({"value": "x"})", ErrorCode::INVALID_TYPE, 1, 13),
              "Position: string into int member");
static_assert(TestParseErrorAt<ByteValue>(R"({"value": 300})", ErrorCode::INVALID_VALUE, 1, 13),
              "Position: out of range integer");
static_assert(TestParseErrorAt<IntValue>("{\n  \"value\": true\n}", ErrorCode::INVALID_TYPE, 2, 15),
              "Position: data error on second line");
static_assert(TestParseErrorAt<WithOptional>(R"({"y": 5})", ErrorCode::MISSING_FIELD, 1, 7),
              "Position: missing member reported at the end of the last entry");
static_assert(TestParseErrorAt<WithOptional>(R"({"x": 1, "x": 2})", ErrorCode::DUPLICATE_FIELD, 1, 12),
              "Position: duplicate member reported after its key");
static_assert(TestParseErrorAt<IntValue>(R"({"value": [1]})", ErrorCode::INVALID_TYPE, 1, 10),
              "Position: container rejected before it is read");
