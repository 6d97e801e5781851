#include "../test_helpers.hpp"
#include <JsonDescent/parser.hpp>
#include <vector>

using namespace TestHelpers;
using JsonDescent::ErrorCode;

// ============================================================================
// Test: JSON Whitespace (space, tab, line feed, carriage return only)
// ============================================================================

struct Simple {
    int value;
};

static_assert(TestParse(" \t\n\r{ \"value\"\n:\r1\t}\n ", Simple{1}), "Whitespace: around every token");
static_assert(TestParse("[\n  1,\n  2\n]", std::vector<int>{1, 2}), "Whitespace: pretty-printed array");
static_assert(TestParse("{}", std::vector<int>{}) == false, "Whitespace: object is not an array");

// Other space characters are not JSON whitespace
static_assert(TestParseError<int>("\f1", ErrorCode::EXPECTED_SOME_VALUE), "Whitespace: form feed");
static_assert(TestParseError<int>("\v1", ErrorCode::EXPECTED_SOME_VALUE), "Whitespace: vertical tab");
static_assert(TestParseError<int>("\xC2\xA0" "1", ErrorCode::EXPECTED_SOME_VALUE), "Whitespace: no-break space");
static_assert(TestParseError<int>("1\f", ErrorCode::TRAILING_CHARACTERS), "Whitespace: trailing form feed");

// Line feeds advance the line counter used in error positions
static_assert(TestParseErrorAt<int>("\n\n  x", ErrorCode::EXPECTED_SOME_VALUE, 3, 3),
              "Whitespace: position after two line feeds");
static_assert(TestParseErrorAt<int>("\r\n1 2", ErrorCode::TRAILING_CHARACTERS, 2, 3),
              "Whitespace: carriage return counts as a column");
