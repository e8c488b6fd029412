#pragma once

#include "domain/FieldValue.hpp"
#include "domain/Uid.hpp"
#include "domain/enums/EntityState.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace registry::domain {

/**
 * @brief Сериализуемый снимок состояния сущности
 *
 * Проекция журнала: replay() журнала обязан давать запись, совпадающую
 * с этой. decimalScale фиксируется при создании и больше не меняется,
 * даже если настройки точности изменились.
 */
struct EntityRecord {
    Uid uid;                                ///< Идентичность сущности
    std::string kind;                       ///< Вид ("account", "position", ...)
    uint64_t version = 0;                   ///< Версия последней применённой записи журнала
    unsigned decimalScale = 0;              ///< Шкала decimal-полей, не ключевых
    EntityState state = EntityState::ACTIVE;
    FieldMap fields;                        ///< Текущие значения полей
    std::map<Uid, std::string> links;       ///< Зависимости: uid -> роль

    EntityRecord() = default;

    EntityRecord(const Uid& uid, const std::string& kind, unsigned decimalScale)
        : uid(uid), kind(kind), decimalScale(decimalScale) {}

    /**
     * @brief Значение поля или nullopt, если поле не задано
     */
    std::optional<FieldValue> field(const std::string& name) const {
        auto it = fields.find(name);
        if (it == fields.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool isRetired() const {
        return state == EntityState::RETIRED;
    }

    /**
     * @brief Полное совпадение состояния, включая шкалы decimal
     */
    bool sameState(const EntityRecord& other) const;

    nlohmann::json toJson() const;

    /**
     * @throws std::invalid_argument если JSON не описывает запись
     */
    static EntityRecord fromJson(const nlohmann::json& j);
};

} // namespace registry::domain
