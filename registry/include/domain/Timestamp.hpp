#pragma once

#include <string>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <ctime>
#include <cstdint>
#include <cctype>

namespace registry::domain {

/**
 * @brief Временная метка UTC с точностью до миллисекунд
 *
 * Текстовая форма ISO 8601: "2025-12-16T10:30:00.125Z".
 * Точность ограничена миллисекундами, чтобы toString/fromString
 * давали точный round-trip при сохранении журнала.
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(truncate(std::chrono::system_clock::now())) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(truncate(tp)) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Создать Timestamp из ISO 8601 строки
     * @param isoString "2025-12-16T10:30:00Z" или "2025-12-16T10:30:00.125Z"
     * @throws std::invalid_argument если строка не распознана
     */
    static Timestamp fromString(const std::string& isoString) {
        std::tm tm = {};
        std::istringstream ss(isoString);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");

        if (ss.fail()) {
            throw std::invalid_argument("Invalid ISO 8601 timestamp: " + isoString);
        }

        int64_t millis = 0;
        if (ss.peek() == '.') {
            ss.get();
            std::string fraction;
            while (std::isdigit(ss.peek())) {
                fraction.push_back(static_cast<char>(ss.get()));
            }
            if (fraction.empty() || fraction.size() > 3) {
                throw std::invalid_argument("Invalid ISO 8601 timestamp: " + isoString);
            }
            fraction.resize(3, '0');
            millis = std::stoll(fraction);
        }

        if (ss.get() != 'Z' || ss.peek() != std::char_traits<char>::eof()) {
            throw std::invalid_argument("Invalid ISO 8601 timestamp: " + isoString);
        }

        auto tp = std::chrono::system_clock::from_time_t(timegm(&tm))
                + std::chrono::milliseconds(millis);
        return Timestamp(tp);
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);

        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            value.time_since_epoch()
        ).count() % 1000;
        if (millis < 0) {
            millis += 1000;
        }

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
        return ss.str();
    }

    // Операторы сравнения
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }

private:
    static std::chrono::system_clock::time_point truncate(std::chrono::system_clock::time_point tp) {
        return std::chrono::time_point_cast<std::chrono::milliseconds>(tp);
    }
};

} // namespace registry::domain
