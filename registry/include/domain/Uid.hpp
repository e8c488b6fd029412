#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <stdexcept>
#include <string>

namespace registry::domain {

/**
 * @brief Детерминированный идентификатор сущности
 *
 * 256-битный дайджест (SHA-256) канонического набора ключевых полей.
 * Текстовая форма: 64 шестнадцатеричных символа в нижнем регистре.
 * Значение неизменно на всё время жизни логической записи.
 */
class Uid {
public:
    static constexpr size_t SIZE = 32;
    using Bytes = std::array<uint8_t, SIZE>;

    Uid() { bytes_.fill(0); }

    explicit Uid(const Bytes& bytes) : bytes_(bytes) {}

    /**
     * @brief Разобрать текстовую форму
     * @throws std::invalid_argument если строка не 64 hex символа
     */
    static Uid fromString(const std::string& hex) {
        if (hex.size() != SIZE * 2) {
            throw std::invalid_argument("Uid must be 64 hex characters: " + hex);
        }

        Bytes bytes;
        for (size_t i = 0; i < SIZE; ++i) {
            int hi = hexValue(hex[2 * i]);
            int lo = hexValue(hex[2 * i + 1]);
            if (hi < 0 || lo < 0) {
                throw std::invalid_argument("Uid contains non-hex character: " + hex);
            }
            bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
        }
        return Uid(bytes);
    }

    std::string toString() const {
        static const char* digits = "0123456789abcdef";
        std::string result;
        result.reserve(SIZE * 2);
        for (uint8_t b : bytes_) {
            result.push_back(digits[b >> 4]);
            result.push_back(digits[b & 0x0F]);
        }
        return result;
    }

    /**
     * @brief Короткая форма для логов (первые 12 символов)
     */
    std::string shortString() const {
        return toString().substr(0, 12);
    }

    const Bytes& bytes() const { return bytes_; }


    bool operator==(const Uid& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Uid& other) const { return bytes_ != other.bytes_; }
    bool operator<(const Uid& other) const { return bytes_ < other.bytes_; }
    bool operator>(const Uid& other) const { return bytes_ > other.bytes_; }

private:
    Bytes bytes_;

    static int hexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
};

} // namespace registry::domain

namespace std {

template <>
struct hash<registry::domain::Uid> {
    size_t operator()(const registry::domain::Uid& uid) const {
        // Дайджест уже равномерно распределён, достаточно первых байт
        size_t value = 0;
        std::memcpy(&value, uid.bytes().data(), sizeof(value));
        return value;
    }
};

} // namespace std
