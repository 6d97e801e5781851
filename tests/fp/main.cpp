#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <limits>
#include <random>
#include <string>
#include <vector>

#include <JsonDescent/parser.hpp>
#include <JsonDescent/value.hpp>

using JsonDescent::ErrorCode;

struct Kept {
    int kept;
};

bool parse_double(const std::string& text, double& out) {
    return static_cast<bool>(JsonDescent::Parse(out, text));
}

bool close_enough(double ours, double ref, double max_rel_error) {
    if (ours == ref) {
        return true;
    }
    const double rel = std::abs(ours - ref) / std::max(std::abs(ours), std::abs(ref));
    return rel <= max_rel_error;
}

void expect_double(const std::string& text, double expected, double max_rel_error = 0) {
    double parsed = 0;
    if (!parse_double(text, parsed)) {
        std::cerr << "Rejected number: " << text << "\n";
        std::abort();
    }
    if (!close_enough(parsed, expected, max_rel_error) || std::signbit(parsed) != std::signbit(expected)) {
        std::cerr << "Number mismatch:\n"
                  << "  text     : " << text << "\n"
                  << "  parsed   : " << std::setprecision(17) << parsed << "\n"
                  << "  expected : " << expected << "\n";
        std::abort();
    }
}

template <class T>
void expect_error(const std::string& text, ErrorCode code) {
    T value{};
    auto res = JsonDescent::Parse(value, text);
    if (res || res.code() != code) {
        std::cerr << "Expected " << JsonDescent::error_to_string(code) << " for: " << text
                  << ", got " << JsonDescent::error_to_string(res.code()) << "\n";
        std::abort();
    }
}

void long_numbers() {
    // Past u64: integers become doubles
    expect_double("18446744073709551616", 18446744073709551616.0);
    expect_double("-9223372036854775809", -9223372036854775809.0);
    expect_double("123456789012345678901234567890", 123456789012345678901234567890.0, 1e-15);
    expect_double("123456789012345678901234567890e-10", 12345678901234567890.123456789, 1e-15);
    expect_double("0.1000000000000000055511151231257827021181583404541015625", 0.1);
    expect_double("3.14159265358979323846264338327950288", 3.141592653589793);
    expect_double("1.00000000000000000000000000000000000001e2", 100.0);
    expect_double("-0.00000000000000000000000000000000000000001", -1e-41, 1e-15);

    std::uint64_t u = 0;
    if (!JsonDescent::Parse(u, "18446744073709551615") || u != std::numeric_limits<std::uint64_t>::max()) {
        std::cerr << "u64 max not exact\n";
        std::abort();
    }
    expect_error<std::uint64_t>("18446744073709551616", ErrorCode::INVALID_TYPE);

    std::int64_t i = 0;
    if (!JsonDescent::Parse(i, "-9223372036854775808") || i != std::numeric_limits<std::int64_t>::min()) {
        std::cerr << "i64 min not exact\n";
        std::abort();
    }
    expect_error<std::int64_t>("-9223372036854775809", ErrorCode::INVALID_TYPE);

    JsonDescent::Value v;
    if (!JsonDescent::Parse(v, "[18446744073709551615, 18446744073709551616, -1, 1.0]")) {
        std::cerr << "Value with long numbers rejected\n";
        std::abort();
    }
    const auto& items = *v.as_array();
    if (!items[0].as_number()->is_u64() || !items[1].as_number()->is_f64() || !items[2].as_number()->is_i64() ||
        !items[3].as_number()->is_f64()) {
        std::cerr << "Number classification mismatch\n";
        std::abort();
    }
}

void extremes() {
    expect_double("1e-400", 0.0);
    expect_double("-1e-400", -0.0);
    expect_double("-0", -0.0);
    expect_double("-0.0", -0.0);
    expect_double("0e999999999999", 0.0);
    expect_double("1e-999999999999", 0.0);
    expect_double("-1e-999999999999", -0.0);
    expect_double("0.0000000000000000000000000e99999999999999", 0.0);
    expect_double("1.5e308", 1.5e308, 1e-15);
    expect_double("2.2250738585072014e-308", std::numeric_limits<double>::min(), 1e-15);
    expect_double("1e308", 1e308);

    expect_error<double>("9e308", ErrorCode::NUMBER_OUT_OF_RANGE);
    expect_error<double>("-9e308", ErrorCode::NUMBER_OUT_OF_RANGE);
    expect_error<double>("1e400", ErrorCode::NUMBER_OUT_OF_RANGE);
    expect_error<double>("1.5e999999999999", ErrorCode::NUMBER_OUT_OF_RANGE);
    expect_error<double>("2" + std::string(308, '0'), ErrorCode::NUMBER_OUT_OF_RANGE);
    expect_error<double>("0.2e310" + std::string(30, '0'), ErrorCode::NUMBER_OUT_OF_RANGE);

    // Ignored numbers are still validated, but never converted
    Kept k{};
    if (!JsonDescent::Parse(k, R"({"skip": 9e999, "kept": 1})") || k.kept != 1) {
        std::cerr << "Skipped number was converted\n";
        std::abort();
    }
    if (JsonDescent::Parse(k, R"({"skip": 1.e5, "kept": 1})").code() != ErrorCode::INVALID_NUMBER) {
        std::cerr << "Skipped malformed number accepted\n";
        std::abort();
    }
}

std::string random_json_number(std::mt19937_64& rng, bool& exact) {
    std::uniform_int_distribution<int> digit(0, 9);
    std::uniform_int_distribution<int> coin(0, 1);
    std::uniform_int_distribution<int> int_len(1, 24);
    std::uniform_int_distribution<int> frac_len(0, 12);
    std::uniform_int_distribution<int> exp_val(-290, 290);

    std::string s;
    if (coin(rng)) {
        s.push_back('-');
    }
    const int n_int = int_len(rng);
    s.push_back(static_cast<char>('1' + digit(rng) % 9));
    for (int i = 1; i < n_int; ++i) {
        s.push_back(static_cast<char>('0' + digit(rng)));
    }
    const int n_frac = frac_len(rng);
    if (n_frac > 0) {
        s.push_back('.');
        for (int i = 0; i < n_frac; ++i) {
            s.push_back(static_cast<char>('0' + digit(rng)));
        }
    }
    int exponent = 0;
    if (coin(rng)) {
        exponent = exp_val(rng);
        s.push_back(coin(rng) ? 'e' : 'E');
        s += std::to_string(exponent);
    }
    // Significand and power of ten both exact in a double: one rounding
    exact = n_int + n_frac <= 15 && exponent - n_frac >= -22 && exponent - n_frac <= 22;
    return s;
}

void fuzz_parse_vs_strtod(std::size_t iterations, double max_rel_error) {
    std::mt19937_64 rng(424242);

    for (std::size_t i = 0; i < iterations; ++i) {
        bool exact = false;
        const std::string s = random_json_number(rng, exact);

        double ours = 0;
        if (!parse_double(s, ours)) {
            std::cerr << "Our parser rejected: " << s << "\n";
            std::abort();
        }

        char* endp = nullptr;
        const double ref = std::strtod(s.c_str(), &endp);
        if (endp != s.c_str() + s.size()) {
            continue;
        }

        if (!close_enough(ours, ref, exact ? 0 : max_rel_error)) {
            std::cerr << "Parse mismatch vs strtod:\n"
                      << "  text : " << s << "\n"
                      << "  our  : " << std::setprecision(17) << ours << "\n"
                      << "  ref  : " << ref << "\n";
            std::abort();
        }
    }
}

void float_targets() {
    float f = 0;
    if (!JsonDescent::Parse(f, "0.5") || f != 0.5f) {
        std::cerr << "f32 mismatch\n";
        std::abort();
    }
    if (!JsonDescent::Parse(f, "16777217") || f != 16777216.0f) {
        std::cerr << "f32 from integer mismatch\n";
        std::abort();
    }
}

int main() {
    long_numbers();
    extremes();
    float_targets();
    fuzz_parse_vs_strtod(200000, 1e-14);
    std::cout << "fp tests passed\n";
    return 0;
}
