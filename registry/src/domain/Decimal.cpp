#include "domain/Decimal.hpp"

#include <cctype>
#include <stdexcept>
#include <utility>

namespace registry::domain {

namespace {

using Mantissa = Decimal::Mantissa;

constexpr long MAX_EXPONENT = 1000;

Mantissa powerOfTen(unsigned exponent) {
    return boost::multiprecision::pow(Mantissa(10), exponent);
}

} // namespace

Decimal::Decimal(Mantissa mantissa, unsigned scale)
    : mantissa_(std::move(mantissa)), scale_(scale) {}

Decimal Decimal::parse(const std::string& text) {
    size_t pos = 0;
    bool negative = false;

    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }

    std::string digits;
    size_t fractionDigits = 0;
    bool seenPoint = false;
    bool seenDigit = false;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits.push_back(c);
            seenDigit = true;
            if (seenPoint) {
                ++fractionDigits;
            }
        } else if (c == '.' && !seenPoint) {
            seenPoint = true;
        } else {
            break;
        }
    }

    if (!seenDigit) {
        throw std::invalid_argument("Not a decimal number: '" + text + "'");
    }

    long exponent = 0;
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        bool negativeExponent = false;
        if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            negativeExponent = text[pos] == '-';
            ++pos;
        }
        size_t start = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            exponent = exponent * 10 + (text[pos] - '0');
            if (exponent > MAX_EXPONENT) {
                throw std::invalid_argument("Decimal exponent out of range: '" + text + "'");
            }
            ++pos;
        }
        if (pos == start) {
            throw std::invalid_argument("Not a decimal number: '" + text + "'");
        }
        if (negativeExponent) {
            exponent = -exponent;
        }
    }

    if (pos != text.size()) {
        throw std::invalid_argument("Not a decimal number: '" + text + "'");
    }

    // cpp_int трактует ведущий ноль как восьмеричный префикс
    size_t firstSignificant = digits.find_first_not_of('0');
    digits = firstSignificant == std::string::npos ? "0" : digits.substr(firstSignificant);

    Mantissa mantissa(digits.c_str());
    if (negative) {
        mantissa = -mantissa;
    }

    long scale = static_cast<long>(fractionDigits) - exponent;
    if (scale < 0) {
        mantissa *= powerOfTen(static_cast<unsigned>(-scale));
        scale = 0;
    }
    if (scale > static_cast<long>(MAX_SCALE)) {
        throw std::invalid_argument("Decimal scale out of range: '" + text + "'");
    }

    return Decimal(mantissa, static_cast<unsigned>(scale));
}

Decimal Decimal::fromInteger(int64_t value) {
    return Decimal(Mantissa(value), 0);
}

Decimal Decimal::rescaled(unsigned scale) const {
    if (scale > MAX_SCALE) {
        throw std::invalid_argument("Decimal scale out of range: " + std::to_string(scale));
    }
    if (scale == scale_) {
        return *this;
    }
    if (scale > scale_) {
        return Decimal(mantissa_ * powerOfTen(scale - scale_), scale);
    }

    Mantissa divisor = powerOfTen(scale_ - scale);
    Mantissa quotient = mantissa_ / divisor;
    Mantissa remainder = mantissa_ % divisor;

    // HALF_DOWN: от нуля только если остаток строго больше половины
    Mantissa twice = remainder < 0 ? Mantissa(-remainder * 2) : Mantissa(remainder * 2);
    if (twice > divisor) {
        quotient += (mantissa_ < 0) ? -1 : 1;
    }

    return Decimal(quotient, scale);
}

std::string Decimal::toString() const {
    bool negative = mantissa_ < 0;
    std::string digits = (negative ? Mantissa(-mantissa_) : mantissa_).str();

    if (digits.size() <= scale_) {
        digits.insert(0, scale_ - digits.size() + 1, '0');
    }

    std::string result;
    if (negative) {
        result.push_back('-');
    }
    result += digits.substr(0, digits.size() - scale_);
    if (scale_ > 0) {
        result.push_back('.');
        result += digits.substr(digits.size() - scale_);
    }
    return result;
}

int Decimal::compare(const Decimal& other) const {
    unsigned common = scale_ > other.scale_ ? scale_ : other.scale_;
    Mantissa lhs = mantissa_ * powerOfTen(common - scale_);
    Mantissa rhs = other.mantissa_ * powerOfTen(common - other.scale_);
    if (lhs < rhs) return -1;
    if (lhs > rhs) return 1;
    return 0;
}

} // namespace registry::domain
