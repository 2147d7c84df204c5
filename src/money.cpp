#include "money.hpp"
#include <cctype>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace ledgercalc {

namespace {

const Decimal& half() {
    static const Decimal value("0.5");
    return value;
}

Decimal power_of_ten(int digits) {
    Decimal scale = 1;
    for (int i = 0; i < digits; ++i) {
        scale *= 10;
    }
    return scale;
}

constexpr int64_t MAX_MINOR = std::numeric_limits<int64_t>::max();
constexpr int64_t MIN_MINOR = std::numeric_limits<int64_t>::min();

int64_t checked_add(int64_t a, int64_t b) {
    if ((b > 0 && a > MAX_MINOR - b) || (b < 0 && a < MIN_MINOR - b)) {
        throw std::overflow_error("Money addition overflows 64-bit minor units");
    }
    return a + b;
}

int64_t checked_sub(int64_t a, int64_t b) {
    if ((b < 0 && a > MAX_MINOR + b) || (b > 0 && a < MIN_MINOR + b)) {
        throw std::overflow_error("Money subtraction overflows 64-bit minor units");
    }
    return a - b;
}

int64_t checked_mul(int64_t a, int64_t b) {
    if (a == 0 || b == 0) {
        return 0;
    }
    // -1 * MIN and MIN / -1 both overflow
    if ((a == -1 && b == MIN_MINOR) || (b == -1 && a == MIN_MINOR)) {
        throw std::overflow_error("Money multiplication overflows 64-bit minor units");
    }
    const bool overflow = a > 0
        ? (b > 0 ? a > MAX_MINOR / b : b < MIN_MINOR / a)
        : (b > 0 ? a < MIN_MINOR / b : a < MAX_MINOR / b);
    if (overflow) {
        throw std::overflow_error("Money multiplication overflows 64-bit minor units");
    }
    return a * b;
}

} // namespace

std::string rounding_mode_to_string(RoundingMode mode) {
    switch (mode) {
        case RoundingMode::HalfUp: return "HALF_UP";
        case RoundingMode::HalfEven: return "HALF_EVEN";
        case RoundingMode::Up: return "UP";
        case RoundingMode::Down: return "DOWN";
        default: return "UNKNOWN";
    }
}

RoundingMode rounding_mode_from_string(const std::string& name) {
    if (name == "HALF_UP") return RoundingMode::HalfUp;
    if (name == "HALF_EVEN") return RoundingMode::HalfEven;
    if (name == "UP") return RoundingMode::Up;
    if (name == "DOWN") return RoundingMode::Down;
    throw std::invalid_argument("Unknown rounding mode: " + name);
}

Decimal parse_decimal(const std::string& text) {
    size_t pos = 0;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        ++pos;
    }

    size_t digits = 0;
    bool seen_point = false;
    for (; pos < text.size(); ++pos) {
        const unsigned char c = static_cast<unsigned char>(text[pos]);
        if (std::isdigit(c)) {
            ++digits;
        } else if (c == '.' && !seen_point) {
            seen_point = true;
        } else {
            throw std::invalid_argument("Malformed decimal: '" + text + "'");
        }
    }
    if (digits == 0) {
        throw std::invalid_argument("Malformed decimal: '" + text + "'");
    }

    return Decimal(text);
}

int64_t round_to_integer(const Decimal& value, RoundingMode mode) {
    const bool negative = value < 0;
    const Decimal magnitude = boost::multiprecision::abs(value);

    static const Decimal limit(std::numeric_limits<int64_t>::max() - 1);
    if (magnitude > limit) {
        throw std::overflow_error("Value does not fit in 64-bit integer: " +
                                  value.str(0, std::ios_base::fixed));
    }

    const Decimal whole = boost::multiprecision::floor(magnitude);
    const Decimal fraction = magnitude - whole;
    int64_t result = whole.convert_to<int64_t>();

    switch (mode) {
        case RoundingMode::HalfUp:
            if (fraction >= half()) {
                ++result;
            }
            break;
        case RoundingMode::HalfEven:
            if (fraction > half() || (fraction == half() && (result % 2) != 0)) {
                ++result;
            }
            break;
        case RoundingMode::Up:
            if (fraction > 0) {
                ++result;
            }
            break;
        case RoundingMode::Down:
            break;
    }

    return negative ? -result : result;
}

Decimal round_decimal(const Decimal& value, int digits, RoundingMode mode) {
    if (digits < 0) {
        throw std::invalid_argument("Rounding digits must be non-negative");
    }
    const Decimal scale = power_of_ten(digits);
    return Decimal(round_to_integer(value * scale, mode)) / scale;
}

// ============================================================================
// Money Implementation
// ============================================================================

Money Money::from_minor(int64_t minor_units) {
    return Money(minor_units);
}

Money Money::from_units(int64_t whole_units) {
    return Money(checked_mul(whole_units, MINOR_PER_UNIT));
}

Money Money::from_decimal(const Decimal& value, RoundingMode mode) {
    return Money(round_to_integer(value * MINOR_PER_UNIT, mode));
}

Money Money::parse(const std::string& text) {
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    int64_t whole = 0;
    size_t whole_digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        whole = checked_add(checked_mul(whole, 10), text[pos] - '0');
        ++whole_digits;
        ++pos;
    }

    int64_t fraction = 0;
    size_t fraction_digits = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (fraction_digits == MINOR_DIGITS) {
                throw std::invalid_argument("Money has more than 2 decimal places: '" + text + "'");
            }
            fraction = fraction * 10 + (text[pos] - '0');
            ++fraction_digits;
            ++pos;
        }
    }

    if (pos != text.size() || (whole_digits == 0 && fraction_digits == 0)) {
        throw std::invalid_argument("Malformed money amount: '" + text + "'");
    }

    for (size_t i = fraction_digits; i < MINOR_DIGITS; ++i) {
        fraction *= 10;
    }

    const int64_t minor = checked_add(checked_mul(whole, MINOR_PER_UNIT), fraction);
    return Money(negative ? -minor : minor);
}

Decimal Money::to_decimal() const {
    return Decimal(minor_) / MINOR_PER_UNIT;
}

std::string Money::to_string() const {
    const uint64_t magnitude = minor_ < 0
        ? static_cast<uint64_t>(-(minor_ + 1)) + 1
        : static_cast<uint64_t>(minor_);

    std::ostringstream oss;
    if (minor_ < 0) {
        oss << '-';
    }
    oss << magnitude / MINOR_PER_UNIT << '.'
        << std::setw(MINOR_DIGITS) << std::setfill('0') << magnitude % MINOR_PER_UNIT;
    return oss.str();
}

Money Money::abs() const {
    return minor_ < 0 ? -*this : *this;
}

Money Money::operator+(const Money& other) const {
    return Money(checked_add(minor_, other.minor_));
}

Money Money::operator-(const Money& other) const {
    return Money(checked_sub(minor_, other.minor_));
}

Money Money::operator-() const {
    return Money(checked_sub(0, minor_));
}

Money Money::operator*(int64_t factor) const {
    return Money(checked_mul(minor_, factor));
}

Money& Money::operator+=(const Money& other) {
    minor_ = checked_add(minor_, other.minor_);
    return *this;
}

Money& Money::operator-=(const Money& other) {
    minor_ = checked_sub(minor_, other.minor_);
    return *this;
}

std::ostream& operator<<(std::ostream& os, const Money& money) {
    return os << money.to_string();
}

} // namespace ledgercalc
