#pragma once

#include <string>
#include <stdexcept>

namespace registry::domain {

/**
 * @brief Логический тип поля записи
 */
enum class FieldType {
    STRING,
    DECIMAL,
    INTEGER,
    BOOLEAN,
    UID
};

inline std::string toString(FieldType type) {
    switch (type) {
        case FieldType::STRING:  return "string";
        case FieldType::DECIMAL: return "decimal";
        case FieldType::INTEGER: return "integer";
        case FieldType::BOOLEAN: return "boolean";
        case FieldType::UID:     return "uid";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline FieldType fieldTypeFromString(const std::string& str) {
    if (str == "string")  return FieldType::STRING;
    if (str == "decimal") return FieldType::DECIMAL;
    if (str == "integer") return FieldType::INTEGER;
    if (str == "boolean") return FieldType::BOOLEAN;
    if (str == "uid")     return FieldType::UID;
    throw std::invalid_argument("Unknown FieldType: " + str);
}

} // namespace registry::domain
