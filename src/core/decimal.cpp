#include "decimal.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace arbx {

namespace {

using raw_t = Decimal::raw_type;
__extension__ typedef unsigned __int128 magnitude_t;

constexpr magnitude_t pow10(int exponent) {
    magnitude_t value = 1;
    for (int i = 0; i < exponent; ++i) {
        value *= 10;
    }
    return value;
}

constexpr magnitude_t kScale = static_cast<magnitude_t>(Decimal::SCALE);
constexpr magnitude_t kMaxRaw = pow10(36);

[[noreturn]] void throw_overflow() {
    throw std::overflow_error("Decimal overflow");
}

magnitude_t magnitude(raw_t value) {
    return value < 0 ? static_cast<magnitude_t>(-value) : static_cast<magnitude_t>(value);
}

magnitude_t checked_mul(magnitude_t a, magnitude_t b) {
    magnitude_t out;
    if (__builtin_mul_overflow(a, b, &out) || out > kMaxRaw) {
        throw_overflow();
    }
    return out;
}

magnitude_t checked_add(magnitude_t a, magnitude_t b) {
    magnitude_t out = a + b;
    if (out > kMaxRaw) {
        throw_overflow();
    }
    return out;
}

// Adds one unit when the discarded part is above half, or exactly half with
// an odd result.
magnitude_t round_half_even(magnitude_t result, magnitude_t remainder, magnitude_t divisor) {
    magnitude_t twice = remainder * 2;
    if (twice > divisor || (twice == divisor && result % 2 != 0)) {
        return checked_add(result, 1);
    }
    return result;
}

raw_t with_sign(magnitude_t value, bool negative) {
    return negative ? -static_cast<raw_t>(value) : static_cast<raw_t>(value);
}

std::string digits_of(magnitude_t value) {
    if (value == 0) {
        return "0";
    }
    std::string out;
    while (value != 0) {
        out.insert(out.begin(), static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    return out;
}

} // namespace

Decimal Decimal::checked(raw_type raw) {
    if (magnitude(raw) > kMaxRaw) {
        throw_overflow();
    }
    return from_raw(raw);
}

Decimal Decimal::max_value() {
    return from_raw(static_cast<raw_type>(kMaxRaw));
}

Decimal Decimal::from_int(int64_t value) {
    return checked(static_cast<raw_type>(value) * SCALE);
}

Decimal Decimal::from_string(std::string_view text) {
    if (text.empty()) {
        throw std::invalid_argument("Empty decimal string");
    }

    size_t pos = 0;
    bool negative = false;
    if (text[0] == '-' || text[0] == '+') {
        negative = text[0] == '-';
        pos = 1;
    }

    magnitude_t integer_part = 0;
    magnitude_t fraction_part = 0;
    int fraction_digits = 0;
    bool seen_dot = false;
    bool seen_digit = false;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.') {
            if (seen_dot) {
                throw std::invalid_argument("Malformed decimal: " + std::string(text));
            }
            seen_dot = true;
            continue;
        }
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Malformed decimal: " + std::string(text));
        }
        seen_digit = true;
        if (seen_dot) {
            if (++fraction_digits > PRECISION) {
                throw std::invalid_argument("Decimal has more than 12 fractional digits: " + std::string(text));
            }
            fraction_part = fraction_part * 10 + static_cast<magnitude_t>(c - '0');
        } else {
            integer_part = integer_part * 10 + static_cast<magnitude_t>(c - '0');
            if (integer_part > kMaxRaw / kScale) {
                throw std::overflow_error("Decimal overflow: " + std::string(text));
            }
        }
    }

    if (!seen_digit) {
        throw std::invalid_argument("Malformed decimal: " + std::string(text));
    }

    for (int i = fraction_digits; i < PRECISION; ++i) {
        fraction_part *= 10;
    }

    magnitude_t scaled = checked_add(integer_part * kScale, fraction_part);
    return from_raw(with_sign(scaled, negative));
}

Decimal Decimal::from_double(double value) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("Decimal from non-finite double");
    }
    long double scaled = std::round(static_cast<long double>(value) * SCALE);
    if (std::fabs(scaled) > 1e36L) {
        throw_overflow();
    }
    return checked(static_cast<raw_type>(scaled));
}

std::string Decimal::to_string() const {
    magnitude_t abs_value = magnitude(value_);
    magnitude_t fraction_part = abs_value % kScale;

    std::string out = value_ < 0 ? "-" : "";
    out += digits_of(abs_value / kScale);
    if (fraction_part != 0) {
        std::string digits = digits_of(fraction_part);
        digits.insert(0, PRECISION - digits.size(), '0');
        while (!digits.empty() && digits.back() == '0') {
            digits.pop_back();
        }
        out += "." + digits;
    }
    return out;
}

Decimal Decimal::operator+(Decimal rhs) const {
    return checked(value_ + rhs.value_);
}

Decimal Decimal::operator-(Decimal rhs) const {
    return checked(value_ - rhs.value_);
}

// Splitting each operand at the decimal point keeps every partial product
// inside 128 bits: (ah + al)(bh + bl) / S = ah*bh*S + ah*bl + al*bh + al*bl/S.
Decimal Decimal::operator*(Decimal rhs) const {
    const magnitude_t a = magnitude(value_);
    const magnitude_t b = magnitude(rhs.value_);
    const magnitude_t ah = a / kScale;
    const magnitude_t al = a % kScale;
    const magnitude_t bh = b / kScale;
    const magnitude_t bl = b % kScale;

    magnitude_t result = checked_mul(checked_mul(ah, bh), kScale);
    result = checked_add(result, checked_mul(ah, bl));
    result = checked_add(result, checked_mul(al, bh));

    const magnitude_t low = al * bl;
    result = checked_add(result, low / kScale);
    result = round_half_even(result, low % kScale, kScale);

    return from_raw(with_sign(result, (value_ < 0) != (rhs.value_ < 0)));
}

// Long division, one fractional digit at a time.
Decimal Decimal::operator/(Decimal rhs) const {
    if (rhs.value_ == 0) {
        throw std::domain_error("Decimal division by zero");
    }
    const magnitude_t a = magnitude(value_);
    const magnitude_t b = magnitude(rhs.value_);

    magnitude_t result = checked_mul(a / b, kScale);
    magnitude_t remainder = a % b;
    magnitude_t fraction = 0;
    for (int i = 0; i < PRECISION; ++i) {
        remainder *= 10;
        fraction = fraction * 10 + remainder / b;
        remainder %= b;
    }
    result = checked_add(result, fraction);
    result = round_half_even(result, remainder, b);

    return from_raw(with_sign(result, (value_ < 0) != (rhs.value_ < 0)));
}

Decimal Decimal::operator-() const {
    return from_raw(-value_);
}

Decimal Decimal::truncate(int digits) const {
    if (digits >= PRECISION) {
        return *this;
    }
    raw_type step = 1;
    for (int i = digits; i < PRECISION; ++i) {
        step *= 10;
    }
    return from_raw((value_ / step) * step);
}

std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.to_string();
}

void to_json(nlohmann::json& j, const Decimal& value) {
    j = value.to_string();
}

void from_json(const nlohmann::json& j, Decimal& value) {
    if (j.is_string()) {
        value = Decimal::from_string(j.get<std::string>());
    } else if (j.is_number_integer()) {
        value = Decimal::from_int(j.get<int64_t>());
    } else if (j.is_number()) {
        value = Decimal::from_double(j.get<double>());
    } else {
        throw std::invalid_argument("Decimal must be a JSON string or number");
    }
}

} // namespace arbx
