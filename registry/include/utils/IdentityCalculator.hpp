#pragma once

#include "domain/EntitySchema.hpp"
#include "domain/FieldValue.hpp"
#include "domain/Uid.hpp"
#include <string>

namespace registry::utils {

/**
 * @brief Вычисление Uid по ключевым полям сущности
 *
 * Uid = SHA-256 от канонической записи: тег вида и ключевые поля в
 * лексикографическом порядке имён. Перед хешированием значения
 * нормализуются:
 * - строки: удаляются пробельные символы в конце;
 * - decimal (и целые для decimal-полей): приводятся к шкале KEY_SCALE
 *   с округлением HALF_DOWN;
 * - Uid: допускается hex-строка, хранится как Uid.
 *
 * Не зависит от настроек: Uid должен оставаться стабильным, даже если
 * точность хранения полей изменится.
 *
 * @note Чистая функция, потокобезопасна
 */
class IdentityCalculator {
public:
    /// Шкала decimal ключевых полей. Меняет все Uid, не трогать.
    static constexpr unsigned KEY_SCALE = 9;

    /**
     * @brief Вычислить Uid
     * @throws InvalidKeyError если нет обязательного поля, тип неверен
     *         или поле не объявлено ключевым
     */
    static domain::Uid compute(const domain::EntitySchema& schema, const domain::FieldMap& keyFields);

    /**
     * @brief Нормализовать ключевые поля
     *
     * Отсутствующие и null необязательные поля в результат не попадают.
     * @throws InvalidKeyError
     */
    static domain::FieldMap canonicalize(const domain::EntitySchema& schema, const domain::FieldMap& keyFields);

    /**
     * @brief Каноническая байтовая запись (вход для SHA-256)
     */
    static std::string encode(const std::string& kind, const domain::FieldMap& canonical);

    /**
     * @brief SHA-256 от произвольных байт
     */
    static domain::Uid digest(const std::string& data);

private:
    static domain::FieldValue canonicalValue(const domain::KeyFieldSpec& spec, const domain::FieldValue& value);
    static std::string encodeValue(const domain::FieldValue& value);
};

} // namespace registry::utils
