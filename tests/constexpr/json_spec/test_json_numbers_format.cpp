#include "../test_helpers.hpp"
#include <JsonDescent/parser.hpp>
#include <bit>
#include <cstdint>
#include <vector>

using namespace TestHelpers;
using JsonDescent::ErrorCode;

// ============================================================================
// Test: JSON Number Grammar (RFC 8259 Section 6)
// ============================================================================

// Integers
static_assert(TestParse(R"(0)", std::uint64_t{0}), "Number: zero");
static_assert(TestParse(R"(-7)", std::int64_t{-7}), "Number: negative");
static_assert(TestParse(R"(18446744073709551615)", UINT64_MAX), "Number: u64 max");
static_assert(TestParse(R"(-9223372036854775808)", INT64_MIN), "Number: i64 min");

// Fractions and exponents
static_assert(TestParse(R"(1.5)", 1.5), "Number: fraction");
static_assert(TestParse(R"(-2.25)", -2.25), "Number: negative fraction");
static_assert(TestParse(R"(1e2)", 100.0), "Number: exponent");
static_assert(TestParse(R"(1E+2)", 100.0), "Number: upper-case exponent with sign");
static_assert(TestParse(R"(1E-2)", 0.01), "Number: negative exponent");
static_assert(TestParse(R"(-2.5e-3)", -0.0025), "Number: fraction and exponent");
static_assert(TestParse(R"(12345678.9)", 12345678.9), "Number: long fraction");
static_assert(TestParse(R"(0.000)", 0.0), "Number: zero with fraction digits");
static_assert(TestParse(R"(0e-0)", 0.0), "Number: zero with negative zero exponent");
static_assert(TestParse(R"(0E+0)", 0.0), "Number: zero with upper-case signed exponent");
static_assert(TestParse<double>(R"(-0e0)", [](const double& d) {
                  return d == 0.0 && (std::bit_cast<std::uint64_t>(d) >> 63) == 1;
              }), "Number: negative zero with exponent keeps its sign");
static_assert(TestParseError<std::int64_t>(R"(0e0)", ErrorCode::INVALID_TYPE),
              "Number: zero with exponent is not an integer");

// Exponent extremes that never reach the slow path
static_assert(TestParse(R"(0e400)", 0.0), "Number: zero significand ignores a huge exponent");
static_assert(TestParse(R"(0e99999999999)", 0.0), "Number: zero significand, exponent past i32");
static_assert(TestParse(R"(1e-99999999999)", 0.0), "Number: negative exponent past i32 is zero");
static_assert(TestParseError<double>(R"(1e400)", ErrorCode::NUMBER_OUT_OF_RANGE), "Number: overflow");
static_assert(TestParseError<double>(R"(1e99999999999)", ErrorCode::NUMBER_OUT_OF_RANGE),
              "Number: exponent past i32");

// Grammar violations
static_assert(TestParseError<int>(R"(01)", ErrorCode::INVALID_NUMBER), "Number: leading zero");
static_assert(TestParseError<int>(R"(-01)", ErrorCode::INVALID_NUMBER), "Number: negative leading zero");
static_assert(TestParseError<int>(R"(-)", ErrorCode::EOF_WHILE_PARSING_VALUE), "Number: lone minus");
static_assert(TestParseError<int>(R"(-a)", ErrorCode::INVALID_NUMBER), "Number: minus without digits");
static_assert(TestParseError<double>(R"(1.)", ErrorCode::EOF_WHILE_PARSING_VALUE), "Number: missing fraction at end");
static_assert(TestParseError<double>(R"(1.e5)", ErrorCode::INVALID_NUMBER), "Number: missing fraction digits");
static_assert(TestParseError<double>(R"(1e)", ErrorCode::EOF_WHILE_PARSING_VALUE), "Number: missing exponent at end");
static_assert(TestParseError<double>(R"(1e+)", ErrorCode::EOF_WHILE_PARSING_VALUE), "Number: sign without exponent");
static_assert(TestParseError<double>(R"(1ea)", ErrorCode::INVALID_NUMBER), "Number: non-digit exponent");
static_assert(TestParseError<double>(R"(.5)", ErrorCode::EXPECTED_SOME_VALUE), "Number: no integer part");
static_assert(TestParseError<int>(R"(+1)", ErrorCode::EXPECTED_SOME_VALUE), "Number: plus sign");
static_assert(TestParseError<int>(R"(0x10)", ErrorCode::TRAILING_CHARACTERS), "Number: hex");
static_assert(TestParseError<std::vector<int>>(R"([1.5.2])", ErrorCode::EXPECTED_LIST_COMMA_OR_END),
              "Number: second decimal point");

// Classification: -0 is a float, integers beyond i64 min are floats
static_assert(TestParseError<int>(R"(-0)", ErrorCode::INVALID_TYPE), "Number: -0 is not an integer");
static_assert(TestParse(R"(-0)", -0.0), "Number: -0 as double");
static_assert(TestParseError<std::int64_t>(R"(-9223372036854775809)", ErrorCode::INVALID_TYPE),
              "Number: below i64 min is a float");
static_assert(TestParseError<int>(R"(1.0)", ErrorCode::INVALID_TYPE), "Number: fraction is not an integer");
static_assert(TestParseError<int>(R"(1e0)", ErrorCode::INVALID_TYPE), "Number: exponent is not an integer");
