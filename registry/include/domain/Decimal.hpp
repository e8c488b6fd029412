#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <string>

namespace registry::domain {

/**
 * @brief Десятичное число с фиксированной шкалой
 *
 * Хранит мантиссу произвольной точности и количество знаков после запятой:
 * value = mantissa / 10^scale. Используется для денежных сумм и количеств,
 * где double недопустим.
 *
 * Округление при уменьшении шкалы: HALF_DOWN (половина округляется к нулю).
 */
class Decimal {
public:
    using Mantissa = boost::multiprecision::cpp_int;

    /// Максимальная шкала, которую принимает rescaled()
    static constexpr unsigned MAX_SCALE = 64;

    Decimal() = default;

    Decimal(Mantissa mantissa, unsigned scale);

    /**
     * @brief Разобрать строку вида "-123.4500" или "1.5e3"
     * @throws std::invalid_argument если строка не является числом
     */
    static Decimal parse(const std::string& text);

    static Decimal fromInteger(int64_t value);

    /**
     * @brief Привести к заданной шкале
     *
     * Увеличение шкалы точное, уменьшение округляет HALF_DOWN.
     * @throws std::invalid_argument если scale > MAX_SCALE
     */
    Decimal rescaled(unsigned scale) const;

    /**
     * @brief Запись с фиксированной точкой, ровно scale знаков после запятой
     */
    std::string toString() const;

    const Mantissa& mantissa() const { return mantissa_; }
    unsigned scale() const { return scale_; }

    bool isZero() const { return mantissa_ == 0; }
    bool isNegative() const { return mantissa_ < 0; }

    /**
     * @brief Числовое сравнение без учёта шкалы: 1.50 == 1.5
     * @return <0, 0, >0
     */
    int compare(const Decimal& other) const;

    bool operator==(const Decimal& other) const { return compare(other) == 0; }
    bool operator!=(const Decimal& other) const { return compare(other) != 0; }
    bool operator<(const Decimal& other) const { return compare(other) < 0; }
    bool operator>(const Decimal& other) const { return compare(other) > 0; }
    bool operator<=(const Decimal& other) const { return compare(other) <= 0; }
    bool operator>=(const Decimal& other) const { return compare(other) >= 0; }

private:
    Mantissa mantissa_ = 0;
    unsigned scale_ = 0;
};

} // namespace registry::domain
