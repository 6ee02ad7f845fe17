#include "rpncalc/number.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>

namespace rpncalc {

using Int = std::int64_t;

static constexpr Int kIntMax = std::numeric_limits<Int>::max();
static constexpr Int kIntMin = std::numeric_limits<Int>::min();

double to_double(const Number& n) {
    if (is_integer(n)) return static_cast<double>(std::get<Int>(n));
    return std::get<double>(n);
}

bool is_zero(const Number& n) {
    if (is_integer(n)) return std::get<Int>(n) == 0;
    return std::get<double>(n) == 0.0;
}

static bool all_digits(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s)
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    return true;
}

std::optional<Number> parse_number(std::string_view text) {
    const auto dot = text.find('.');

    if (dot == std::string_view::npos) {
        if (!all_digits(text)) return std::nullopt;
        Int v = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
        if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
        return Number{v};
    }

    if (!all_digits(text.substr(0, dot)) || !all_digits(text.substr(dot + 1))) return std::nullopt;

    // strtod needs a terminated buffer
    std::string buf(text);
    char* end = nullptr;
    double v = std::strtod(buf.c_str(), &end);
    if (end != buf.c_str() + buf.size() || !std::isfinite(v)) return std::nullopt;
    return Number{v};
}

std::string to_string(const Number& n) {
    if (is_integer(n)) return fmt::format("{}", std::get<Int>(n));

    std::string s = fmt::format("{}", std::get<double>(n));
    if (s.find_first_of(".en") == std::string::npos) s += ".0";
    return s;
}

// -----------------------------
// checked integer helpers
// -----------------------------
static Int checked_add(Int a, Int b) {
    if ((b > 0 && a > kIntMax - b) || (b < 0 && a < kIntMin - b))
        throw std::overflow_error("integer overflow in addition");
    return a + b;
}

static Int checked_sub(Int a, Int b) {
    if ((b < 0 && a > kIntMax + b) || (b > 0 && a < kIntMin + b))
        throw std::overflow_error("integer overflow in subtraction");
    return a - b;
}

static Int checked_mul(Int a, Int b) {
    if (a == 0 || b == 0) return 0;
    if ((a == -1 && b == kIntMin) || (b == -1 && a == kIntMin))
        throw std::overflow_error("integer overflow in multiplication");
    if (a != -1 && b != -1) {
        bool overflow = false;
        if (a > 0) {
            overflow = (b > 0) ? (a > kIntMax / b) : (b < kIntMin / a);
        } else {
            overflow = (b > 0) ? (a < kIntMin / b) : (a < kIntMax / b);
        }
        if (overflow) throw std::overflow_error("integer overflow in multiplication");
    }
    return a * b;
}

static Int int_pow(Int base, Int exp) {
    Int result = 1;
    while (exp > 0) {
        if (exp & 1) result = checked_mul(result, base);
        exp >>= 1;
        if (exp > 0) base = checked_mul(base, base);
    }
    return result;
}

// -----------------------------
// kernels
// -----------------------------
Number add(const Number& a, const Number& b) {
    if (is_integer(a) && is_integer(b)) return checked_add(std::get<Int>(a), std::get<Int>(b));
    return to_double(a) + to_double(b);
}

Number sub(const Number& a, const Number& b) {
    if (is_integer(a) && is_integer(b)) return checked_sub(std::get<Int>(a), std::get<Int>(b));
    return to_double(a) - to_double(b);
}

Number mul(const Number& a, const Number& b) {
    if (is_integer(a) && is_integer(b)) return checked_mul(std::get<Int>(a), std::get<Int>(b));
    return to_double(a) * to_double(b);
}

Number true_div(const Number& a, const Number& b) {
    if (is_zero(b)) throw std::domain_error("division by zero");
    return to_double(a) / to_double(b);
}

Number floor_div(const Number& a, const Number& b) {
    if (is_zero(b)) throw std::domain_error("integer division or modulo by zero");

    if (is_integer(a) && is_integer(b)) {
        Int x = std::get<Int>(a);
        Int y = std::get<Int>(b);
        if (x == kIntMin && y == -1) throw std::overflow_error("integer overflow in floor division");
        Int q = x / y;
        if (x % y != 0 && ((x < 0) != (y < 0))) --q;
        return q;
    }
    return std::floor(to_double(a) / to_double(b));
}

Number mod(const Number& a, const Number& b) {
    if (is_zero(b)) throw std::domain_error("integer division or modulo by zero");

    if (is_integer(a) && is_integer(b)) {
        Int x = std::get<Int>(a);
        Int y = std::get<Int>(b);
        if (y == -1) return Int{0};
        Int r = x % y;
        if (r != 0 && ((r < 0) != (y < 0))) r += y;
        return r;
    }
    double x = to_double(a);
    double y = to_double(b);
    double r = std::fmod(x, y);
    if (r != 0.0 && ((r < 0.0) != (y < 0.0))) r += y;
    return r;
}

Number power(const Number& a, const Number& b) {
    if (is_integer(a) && is_integer(b) && std::get<Int>(b) >= 0)
        return int_pow(std::get<Int>(a), std::get<Int>(b));

    double x = to_double(a);
    double y = to_double(b);

    if (x == 0.0 && y < 0.0) throw std::domain_error("0 cannot be raised to a negative power");
    if (x < 0.0 && std::isfinite(y) && y != std::floor(y))
        throw std::domain_error("negative number cannot be raised to a fractional power");

    double r = std::pow(x, y);
    if (!std::isfinite(r) && std::isfinite(x) && std::isfinite(y))
        throw std::overflow_error("numerical result out of range");
    return r;
}

Number pos(const Number& a) {
    return a;
}

Number neg(const Number& a) {
    if (is_integer(a)) {
        Int v = std::get<Int>(a);
        if (v == kIntMin) throw std::overflow_error("integer overflow in negation");
        return -v;
    }
    return -std::get<double>(a);
}

} // namespace rpncalc
