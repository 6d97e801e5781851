#include "../test_helpers.hpp"
#include <JsonDescent/parser.hpp>
#include <array>
#include <optional>
#include <string>
#include <vector>

using namespace TestHelpers;
using JsonDescent::ErrorCode;

// ============================================================================
// Test: Sequences and Optionals
// ============================================================================

static_assert(TestParse(R"([1, null, 3])", std::vector<std::optional<int>>{1, std::nullopt, 3}),
              "Vector: optional elements");
static_assert(TestParse(R"(["a", "", "c"])", std::vector<std::string>{"a", "", "c"}), "Vector: strings");
static_assert(TestParse(R"([[], [[]], [[1]]])", std::vector<std::vector<std::vector<int>>>{{}, {{}}, {{1}}}),
              "Vector: three levels");
static_assert(TestParseError<std::vector<int>>(R"([1, "2"])", ErrorCode::INVALID_TYPE), "Vector: wrong element type");
static_assert(TestParseError<std::vector<int>>(R"({"0": 1})", ErrorCode::INVALID_TYPE), "Vector: object");
static_assert(TestParseError<std::vector<int>>(R"(null)", ErrorCode::INVALID_TYPE), "Vector: null");

// Fixed-size arrays
static_assert(TestParse(R"([1, 2, 3])", std::array<int, 3>{1, 2, 3}), "Array: exact length");
static_assert(TestParse(R"([])", std::array<int, 0>{}), "Array: zero length");
static_assert(TestParseError<std::array<int, 3>>(R"([1, 2])", ErrorCode::INVALID_LENGTH), "Array: too short");
static_assert(TestParseError<std::array<int, 3>>(R"([1, 2, 3, 4])", ErrorCode::TRAILING_CHARACTERS), "Array: too long");
static_assert([] {
    std::array<int, 3> v{};
    auto r = JsonDescent::Parse(v, R"([1])");
    return !r && r.error().length() == 1 && r.error().detail() == "an array of length 3";
}(), "Array: length error names the expected length");

// Optionals
static_assert(TestParse(R"(5)", std::optional<int>{5}), "Optional: value");
static_assert(TestParse(R"(null)", std::optional<std::vector<int>>{}), "Optional: null");
static_assert(TestParse(R"([1])", std::optional<std::vector<int>>{std::vector<int>{1}}), "Optional: container");
static_assert(TestParseError<std::optional<int>>(R"("x")", ErrorCode::INVALID_TYPE), "Optional: wrong inner type");
static_assert(TestParseError<std::optional<int>>(R"(nulL)", ErrorCode::EXPECTED_SOME_IDENT), "Optional: misspelled null");
