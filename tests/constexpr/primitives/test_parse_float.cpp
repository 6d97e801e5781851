#include "../test_helpers.hpp"
#include <JsonDescent/parser.hpp>

using namespace TestHelpers;
using JsonDescent::ErrorCode;

// ============================================================================
// Test: Floating Point Targets
// ============================================================================

struct Point {
    double x;
    float y;
};

static_assert(TestParse(R"({"x": 1.25, "y": -0.5})", Point{1.25, -0.5f}), "Float: double and float members");
static_assert(TestParse(R"({"x": 3, "y": -4})", Point{3.0, -4.0f}), "Float: integers are accepted");
static_assert(TestParse(R"(1e308)", 1e308), "Float: largest table power");
static_assert(TestParse(R"(0.5e1)", 5.0), "Float: fraction with positive exponent");

static_assert(TestParseError<double>(R"("1.5")", ErrorCode::INVALID_TYPE), "Float: string");
static_assert(TestParseError<double>(R"(null)", ErrorCode::INVALID_TYPE), "Float: null");
static_assert(TestParseError<float>(R"([])", ErrorCode::INVALID_TYPE), "Float: array");
static_assert(TestParseError<double>(R"(1e309)", ErrorCode::NUMBER_OUT_OF_RANGE), "Float: past the table");
