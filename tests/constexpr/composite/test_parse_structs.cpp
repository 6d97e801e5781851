#include "../test_helpers.hpp"
#include <JsonDescent/parser.hpp>
#include <optional>
#include <string>
#include <vector>

using namespace TestHelpers;
using JsonDescent::ErrorCode;

// ============================================================================
// Test: Aggregate Structs
// ============================================================================

struct Inner {
    int a;
    std::string b;
};

struct Outer {
    Inner inner;
    std::vector<Inner> list;
    std::optional<Inner> extra;
};

struct WithOptional {
    int x;
    std::optional<int> y;
};

struct Empty {};

// Nesting
static_assert(
    TestParse(R"({"inner": {"a": 1, "b": "one"}, "list": [{"a": 2, "b": "two"}, {"b": "three", "a": 3}], "extra": null})",
              Outer{{1, "one"}, {{2, "two"}, {3, "three"}}, std::nullopt}),
    "Struct: nested structs and vectors of structs"
);

static_assert(
    TestParse(R"({"inner": [1, "one"], "list": [], "extra": [4, "four"]})",
              Outer{{1, "one"}, {}, Inner{4, "four"}}),
    "Struct: inner structs in positional form"
);

// Optional members
static_assert(TestParse(R"({"x": 1})", WithOptional{1, std::nullopt}), "Struct: absent optional member");
static_assert(TestParse(R"({"x": 1, "y": null})", WithOptional{1, std::nullopt}), "Struct: null optional member");
static_assert(TestParse(R"({"y": 2, "x": 1})", WithOptional{1, 2}), "Struct: present optional member");

// Unknown members
static_assert(TestParse(R"({"z": [1, {"q": null}], "x": 1, "w": "s"})", WithOptional{1, std::nullopt}),
              "Struct: unknown members skipped");

// Empty struct
static_assert(TestParse<Empty>(R"({})", [](const Empty&) { return true; }), "Struct: empty object");
static_assert(TestParse<Empty>(R"([])", [](const Empty&) { return true; }), "Struct: empty array");
static_assert(TestParse<Empty>(R"({"ignored": 1})", [](const Empty&) { return true; }), "Struct: only unknown members");

// Member errors
static_assert(TestParseError<WithOptional>(R"({})", ErrorCode::MISSING_FIELD), "Struct: missing required member");
static_assert(TestParseError<WithOptional>(R"({"x": 1, "x": 2})", ErrorCode::DUPLICATE_FIELD), "Struct: duplicate member");
static_assert(TestParseError<WithOptional>(R"({"y": 1, "y": null, "x": 1})", ErrorCode::DUPLICATE_FIELD),
              "Struct: duplicate optional member");
static_assert(TestParseError<WithOptional>(R"({"x": "1"})", ErrorCode::INVALID_TYPE), "Struct: wrong member type");
static_assert(TestParseError<Outer>(R"({"inner": {"a": 1}, "list": []})", ErrorCode::MISSING_FIELD),
              "Struct: missing member of a nested struct");
static_assert(TestParseError<WithOptional>(R"("x")", ErrorCode::INVALID_TYPE), "Struct: string");
static_assert(TestParseError<WithOptional>(R"(null)", ErrorCode::INVALID_TYPE), "Struct: null");

// Positional form
static_assert(TestParse(R"([1, 2])", WithOptional{1, 2}), "Struct: positional");
static_assert(TestParse(R"([1, null])", WithOptional{1, std::nullopt}), "Struct: positional null");
static_assert(TestParseError<WithOptional>(R"([1])", ErrorCode::INVALID_LENGTH), "Struct: positional too short");
static_assert(TestParseError<WithOptional>(R"([1, 2, 3])", ErrorCode::TRAILING_CHARACTERS), "Struct: positional too long");

// Error details
static_assert([] {
    WithOptional v{};
    auto r = JsonDescent::Parse(v, R"({"y": 5})");
    return !r && r.error().detail() == "x" && r.error().is_data();
}(), "Struct: missing member is named");

static_assert([] {
    WithOptional v{};
    auto r = JsonDescent::Parse(v, R"([7])");
    return !r && r.error().length() == 1 && r.error().detail() == "struct with 2 elements";
}(), "Struct: positional length error describes the expected shape");
