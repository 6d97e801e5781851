#include "../test_helpers.hpp"
#include <JsonDescent/parser.hpp>
#include <cstdint>
#include <limits>

using namespace TestHelpers;
using JsonDescent::ErrorCode;

// ============================================================================
// Test: Integer Targets (every width is range-checked)
// ============================================================================

struct AllInts {
    std::int8_t i8;
    std::int16_t i16;
    std::int32_t i32;
    std::int64_t i64;
    std::uint8_t u8;
    std::uint16_t u16;
    std::uint32_t u32;
    std::uint64_t u64;
};

static_assert(
    TestParse(R"({"i8": -128, "i16": -32768, "i32": -2147483648, "i64": -9223372036854775808,
                  "u8": 255, "u16": 65535, "u32": 4294967295, "u64": 18446744073709551615})",
              AllInts{INT8_MIN, INT16_MIN, INT32_MIN, INT64_MIN, UINT8_MAX, UINT16_MAX, UINT32_MAX, UINT64_MAX}),
    "Integers: limits of every width"
);

static_assert(TestParse(R"(127)", std::int8_t{127}), "Integers: i8 max");
static_assert(TestParse(R"(0)", std::uint8_t{0}), "Integers: u8 zero");
static_assert(TestParse(R"(9223372036854775807)", INT64_MAX), "Integers: i64 max from an unsigned token");

// Out of range for the target width
static_assert(TestParseError<std::int8_t>(R"(128)", ErrorCode::INVALID_VALUE), "Integers: i8 overflow");
static_assert(TestParseError<std::int8_t>(R"(-129)", ErrorCode::INVALID_VALUE), "Integers: i8 underflow");
static_assert(TestParseError<std::uint8_t>(R"(256)", ErrorCode::INVALID_VALUE), "Integers: u8 overflow");
static_assert(TestParseError<std::uint32_t>(R"(-1)", ErrorCode::INVALID_VALUE), "Integers: negative into unsigned");
static_assert(TestParseError<std::int32_t>(R"(2147483648)", ErrorCode::INVALID_VALUE), "Integers: i32 overflow");
static_assert(TestParseError<std::int64_t>(R"(9223372036854775808)", ErrorCode::INVALID_VALUE),
              "Integers: i64 overflow");

// Wrong JSON type
static_assert(TestParseError<int>(R"("1")", ErrorCode::INVALID_TYPE), "Integers: string");
static_assert(TestParseError<int>(R"(true)", ErrorCode::INVALID_TYPE), "Integers: boolean");
static_assert(TestParseError<int>(R"(null)", ErrorCode::INVALID_TYPE), "Integers: null");
static_assert(TestParseError<int>(R"([1])", ErrorCode::INVALID_TYPE), "Integers: array");
static_assert(TestParseError<int>(R"({})", ErrorCode::INVALID_TYPE), "Integers: object");
static_assert(TestParseError<int>(R"(2.5)", ErrorCode::INVALID_TYPE), "Integers: float");

// The rejected value is described in the error
static_assert([] {
    int v = 0;
    auto r = JsonDescent::Parse(v, R"(2.5)");
    return !r && r.error().unexpected().kind == JsonDescent::Unexpected::Kind::floating &&
           r.error().unexpected().f == 2.5 && r.error().detail() == "i32";
}(), "Integers: error names the found float and the expected width");

static_assert([] {
    std::uint8_t v = 0;
    auto r = JsonDescent::Parse(v, R"(-3)");
    return !r && r.error().unexpected().kind == JsonDescent::Unexpected::Kind::signed_integer &&
           r.error().unexpected().i == -3 && r.error().detail() == "u8";
}(), "Integers: error keeps the rejected negative value");
