#ifndef LEDGERCALC_MONEY_HPP
#define LEDGERCALC_MONEY_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <boost/multiprecision/cpp_dec_float.hpp>

namespace ledgercalc {

// Base-10 arithmetic for rates and intermediate products. Values parsed from
// text ("0.001") are exact; products of exact values stay exact well past the
// precision any monetary computation here needs.
using Decimal = boost::multiprecision::cpp_dec_float_50;

enum class RoundingMode : uint8_t {
    HalfUp = 0,     // ties away from zero
    HalfEven = 1,   // banker's rounding
    Up = 2,         // away from zero
    Down = 3        // toward zero (truncate)
};

std::string rounding_mode_to_string(RoundingMode mode);
RoundingMode rounding_mode_from_string(const std::string& name);

// Parse a decimal literal such as "0.001" or "-12.5" exactly.
// Throws std::invalid_argument on malformed text.
Decimal parse_decimal(const std::string& text);

// Round to an integer using the given mode.
// Throws std::overflow_error if the result does not fit in 64 bits.
int64_t round_to_integer(const Decimal& value, RoundingMode mode);

// Round to a number of fractional digits using the given mode.
Decimal round_decimal(const Decimal& value, int digits, RoundingMode mode);

// Fixed-point money in integer minor units (cents).
// Arithmetic between Money values is exact; converting from a Decimal always
// names the rounding mode, so rounding is never implicit.
class Money {
public:
    static constexpr int MINOR_DIGITS = 2;
    static constexpr int64_t MINOR_PER_UNIT = 100;

    Money() : minor_(0) {}

    static Money from_minor(int64_t minor_units);
    static Money from_units(int64_t whole_units);
    static Money from_decimal(const Decimal& value, RoundingMode mode);

    // Exact parse of "1000", "1000.5", "-0.01". More than MINOR_DIGITS
    // fractional digits is rejected rather than rounded.
    static Money parse(const std::string& text);

    static Money zero() { return Money(); }

    int64_t minor_units() const { return minor_; }
    Decimal to_decimal() const;
    std::string to_string() const;

    bool is_zero() const { return minor_ == 0; }
    bool is_negative() const { return minor_ < 0; }
    bool is_positive() const { return minor_ > 0; }
    Money abs() const;

    Money operator+(const Money& other) const;
    Money operator-(const Money& other) const;
    Money operator-() const;
    Money operator*(int64_t factor) const;
    Money& operator+=(const Money& other);
    Money& operator-=(const Money& other);

    bool operator==(const Money& other) const { return minor_ == other.minor_; }
    bool operator!=(const Money& other) const { return minor_ != other.minor_; }
    bool operator<(const Money& other) const { return minor_ < other.minor_; }
    bool operator<=(const Money& other) const { return minor_ <= other.minor_; }
    bool operator>(const Money& other) const { return minor_ > other.minor_; }
    bool operator>=(const Money& other) const { return minor_ >= other.minor_; }

private:
    explicit Money(int64_t minor_units) : minor_(minor_units) {}

    int64_t minor_;
};

std::ostream& operator<<(std::ostream& os, const Money& money);

} // namespace ledgercalc

#endif // LEDGERCALC_MONEY_HPP
