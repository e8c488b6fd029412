#pragma once

#include "domain/Decimal.hpp"
#include "domain/Uid.hpp"
#include "domain/enums/FieldType.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace registry::domain {

/**
 * @brief Значение поля записи
 *
 * std::monostate означает отсутствие значения (null).
 */
using FieldValue = std::variant<std::monostate, bool, int64_t, Decimal, std::string, Uid>;

/**
 * @brief Набор полей, упорядоченный по имени
 */
using FieldMap = std::map<std::string, FieldValue>;

// Явные конструкторы: const char* в variant иначе может уйти в bool
inline FieldValue textValue(const std::string& value) { return FieldValue(std::in_place_type<std::string>, value); }
inline FieldValue decimalValue(const std::string& value) { return FieldValue(Decimal::parse(value)); }
inline FieldValue decimalValue(const Decimal& value) { return FieldValue(value); }
inline FieldValue integerValue(int64_t value) { return FieldValue(std::in_place_type<int64_t>, value); }
inline FieldValue booleanValue(bool value) { return FieldValue(std::in_place_type<bool>, value); }
inline FieldValue uidValue(const Uid& value) { return FieldValue(value); }

inline bool isNull(const FieldValue& value) {
    return std::holds_alternative<std::monostate>(value);
}

/**
 * @brief Логический тип значения
 * @return nullopt для null
 */
std::optional<FieldType> fieldTypeOf(const FieldValue& value);

/**
 * @brief Человекочитаемое представление для логов и сообщений об ошибках
 */
std::string toDisplayString(const FieldValue& value);

/**
 * @brief Сериализация с явным типом: {"type": "decimal", "value": "150.00"}
 *
 * Decimal пишется строкой, чтобы сохранить шкалу.
 */
nlohmann::json fieldValueToJson(const FieldValue& value);

/**
 * @throws std::invalid_argument при неизвестном типе или некорректном значении
 */
FieldValue fieldValueFromJson(const nlohmann::json& j);

nlohmann::json fieldMapToJson(const FieldMap& fields);
FieldMap fieldMapFromJson(const nlohmann::json& j);

/**
 * @brief Точное равенство: тип, значение и шкала decimal
 *
 * operator== у variant сравнивает Decimal численно; для проверки
 * совпадения записи с журналом нужна и одинаковая шкала.
 */
bool identical(const FieldValue& lhs, const FieldValue& rhs);
bool identical(const FieldMap& lhs, const FieldMap& rhs);

} // namespace registry::domain
