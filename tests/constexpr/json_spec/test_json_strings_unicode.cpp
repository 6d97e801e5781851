#include "../test_helpers.hpp"
#include <JsonDescent/deserialize.hpp>
#include <JsonDescent/parser.hpp>
#include <string>
#include <string_view>

using namespace TestHelpers;
using JsonDescent::ByteBuf;
using JsonDescent::ErrorCode;

// ============================================================================
// Test: JSON String Handling (RFC 8259 Section 7)
// ============================================================================

struct WithString {
    std::string text;
};

// Test 1: Simple escapes
static_assert(TestParse(R"({"text": "\"\\\/\b\f\n\r\t"})", WithString{"\"\\/\b\f\n\r\t"}),
              "Escapes: all two-character escapes");
static_assert(TestParse(R"({"text": "a\nb"})", WithString{"a\nb"}), "Escapes: escape between text");

// Test 2: Unicode escapes
static_assert(TestParse(R"({"text": "\u0041"})", WithString{"A"}), "Unicode: escaped A");
static_assert(TestParse(R"({"text": "a\u0020b"})", WithString{"a b"}), "Unicode: escaped space in middle of string");
static_assert(TestParse(R"({"text": "\u00E9"})", WithString{"\xC3\xA9"}), "Unicode: two-byte sequence");
static_assert(TestParse(R"({"text": "\u4e2D"})", WithString{"\xE4\xB8\xAD"}), "Unicode: mixed-case hex digits");
static_assert(TestParse(R"({"text": "\uD83D\uDE00"})", WithString{"\xF0\x9F\x98\x80"}),
              "Unicode: surrogate pair");
static_assert(TestParse(R"({"text": "\u0000"})", WithString{std::string(1, '\0')}), "Unicode: escaped NUL");

// Test 3: Raw UTF-8 passes through
static_assert(TestParse("{\"text\": \"\xE4\xB8\xAD\xF0\x9F\x98\x80\"}", WithString{"\xE4\xB8\xAD\xF0\x9F\x98\x80"}),
              "UTF-8: multibyte text");

// Test 4: Broken escapes
static_assert(TestParseError<WithString>(R"({"text": "\x"})", ErrorCode::INVALID_ESCAPE), "Escapes: unknown escape");
static_assert(TestParseError<WithString>(R"({"text": "\u12G4"})", ErrorCode::INVALID_ESCAPE), "Escapes: bad hex digit");
static_assert(TestParseError<WithString>(R"({"text": "\u12"})", ErrorCode::EOF_WHILE_PARSING_STRING),
              "Escapes: short unicode escape");
static_assert(TestParseError<std::string>(R"("abc)", ErrorCode::EOF_WHILE_PARSING_STRING), "Strings: unterminated");
static_assert(TestParseError<std::string>(R"("abc\)", ErrorCode::EOF_WHILE_PARSING_STRING),
              "Strings: input ends inside an escape");

// Test 5: Control characters must be escaped
static_assert(TestParseError<std::string>("\"a\x01" "b\"", ErrorCode::CONTROL_CHARACTER_IN_STRING),
              "Strings: raw control character");
static_assert(TestParseError<std::string>("\"a\nb\"", ErrorCode::CONTROL_CHARACTER_IN_STRING),
              "Strings: raw line feed");
static_assert(TestParseError<std::string>("\"a\tb\"", ErrorCode::CONTROL_CHARACTER_IN_STRING),
              "Strings: raw tab");

// Test 6: Unpaired surrogates are rejected in text
static_assert(TestParseError<std::string>(R"("\uDC00")", ErrorCode::INVALID_UNICODE_CODE_POINT),
              "Unicode: lone low surrogate");
static_assert(TestParseError<std::string>(R"("\uD800")", ErrorCode::INVALID_UNICODE_CODE_POINT),
              "Unicode: lone high surrogate");
static_assert(TestParseError<std::string>(R"("\uD800A")", ErrorCode::INVALID_UNICODE_CODE_POINT),
              "Unicode: high surrogate followed by a non-surrogate");
static_assert(TestParseError<std::string>(R"("\uD800\n")", ErrorCode::INVALID_UNICODE_CODE_POINT),
              "Unicode: high surrogate followed by another escape");

// Test 7: Invalid UTF-8 in the input
static_assert(TestParseError<std::string>("\"\xFF\"", ErrorCode::INVALID_UNICODE_CODE_POINT), "UTF-8: invalid byte");
static_assert(TestParseError<std::string>("\"\xC0\xAF\"", ErrorCode::INVALID_UNICODE_CODE_POINT), "UTF-8: overlong");
static_assert(TestParseError<std::string>("\"\xED\xA0\x80\"", ErrorCode::INVALID_UNICODE_CODE_POINT),
              "UTF-8: encoded surrogate");

// Test 8: Byte strings keep what text rejects
static_assert(TestParse<ByteBuf>(R"("\uD800")", [](const ByteBuf& b) {
                  return b.data.size() == 3 && b.data[0] == 0xED && b.data[1] == 0xA0 && b.data[2] == 0x80;
              }),
              "Bytes: lone surrogate in its three-byte form");
static_assert(TestParse<ByteBuf>(R"("\uD800A")", [](const ByteBuf& b) {
                  return b.data.size() == 4 && b.data[0] == 0xED && b.data[3] == 'A';
              }),
              "Bytes: unpaired surrogate followed by a letter");
static_assert(TestParse<ByteBuf>("\"\xFF\"", [](const ByteBuf& b) {
                  return b.data.size() == 1 && b.data[0] == 0xFF;
              }),
              "Bytes: invalid UTF-8 is kept");
static_assert(TestParse<ByteBuf>(R"([1, 2, 255])", [](const ByteBuf& b) {
                  return b.data.size() == 3 && b.data[2] == 255;
              }),
              "Bytes: array of numbers");
static_assert(TestParseError<ByteBuf>(R"([256])", ErrorCode::INVALID_VALUE), "Bytes: element out of range");

// Test 9: Borrowed views exist only for strings without escapes
static_assert(TestParse<std::string_view>(R"("plain")", [](const std::string_view& s) { return s == "plain"; }),
              "Borrow: plain string");
static_assert(TestParseError<std::string_view>(R"("a\nb")", ErrorCode::INVALID_TYPE),
              "Borrow: escaped string needs a copy");

// Test 10: The trusted text source skips validation
static_assert(TestParseUtf8<std::string>(R"("\u00e9")", [](const std::string& s) { return s == "\xC3\xA9"; }),
              "Utf8 source: escapes still decoded");
static_assert(TestParseUtf8<std::string_view>(R"("abc")", [](const std::string_view& s) { return s == "abc"; }),
              "Utf8 source: borrows");
