#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace arbx {

// Fixed-point decimal for exact financial arithmetic.
// Stores value * 10^PRECISION in a signed 128-bit integer; magnitudes up to
// 10^24 are representable. Products and quotients are rounded half-to-even at
// the last digit, so every result is a pure function of its operands.
class Decimal {
public:
    __extension__ typedef __int128 raw_type;

    static constexpr int PRECISION = 12;
    static constexpr int64_t SCALE = 1000000000000LL;

    constexpr Decimal() noexcept : value_(0) {}

    static constexpr Decimal from_scaled(int64_t scaled) noexcept {
        Decimal d;
        d.value_ = scaled;
        return d;
    }

    static Decimal from_int(int64_t value);
    static Decimal from_string(std::string_view text);

    // Only for values that arrive as binary floats (JSON numbers); rounds to
    // the nearest representable decimal.
    static Decimal from_double(double value);

    double to_double() const noexcept {
        return static_cast<double>(value_) / static_cast<double>(SCALE);
    }

    std::string to_string() const;

    Decimal operator+(Decimal rhs) const;
    Decimal operator-(Decimal rhs) const;
    Decimal operator*(Decimal rhs) const;
    Decimal operator/(Decimal rhs) const;
    Decimal operator-() const;

    Decimal& operator+=(Decimal rhs) { return *this = *this + rhs; }
    Decimal& operator-=(Decimal rhs) { return *this = *this - rhs; }
    Decimal& operator*=(Decimal rhs) { return *this = *this * rhs; }
    Decimal& operator/=(Decimal rhs) { return *this = *this / rhs; }

    constexpr bool operator==(Decimal rhs) const noexcept { return value_ == rhs.value_; }
    constexpr bool operator!=(Decimal rhs) const noexcept { return value_ != rhs.value_; }
    constexpr bool operator<(Decimal rhs) const noexcept { return value_ < rhs.value_; }
    constexpr bool operator<=(Decimal rhs) const noexcept { return value_ <= rhs.value_; }
    constexpr bool operator>(Decimal rhs) const noexcept { return value_ > rhs.value_; }
    constexpr bool operator>=(Decimal rhs) const noexcept { return value_ >= rhs.value_; }

    constexpr Decimal abs() const noexcept { return from_raw(value_ < 0 ? -value_ : value_); }
    constexpr bool is_zero() const noexcept { return value_ == 0; }
    constexpr bool is_positive() const noexcept { return value_ > 0; }
    constexpr bool is_negative() const noexcept { return value_ < 0; }

    // Truncates toward zero to the given number of fractional digits.
    Decimal truncate(int digits) const;

    static constexpr Decimal zero() noexcept { return from_scaled(0); }
    static constexpr Decimal one() noexcept { return from_scaled(SCALE); }
    static constexpr Decimal hundred() noexcept { return from_scaled(100 * SCALE); }

    // Largest representable magnitude.
    static Decimal max_value();

private:
    static constexpr Decimal from_raw(raw_type raw) noexcept {
        Decimal d;
        d.value_ = raw;
        return d;
    }

    static Decimal checked(raw_type raw);

    raw_type value_;
};

inline Decimal min(Decimal a, Decimal b) { return b < a ? b : a; }
inline Decimal max(Decimal a, Decimal b) { return a < b ? b : a; }

std::ostream& operator<<(std::ostream& os, const Decimal& value);

void to_json(nlohmann::json& j, const Decimal& value);
void from_json(const nlohmann::json& j, Decimal& value);

} // namespace arbx
