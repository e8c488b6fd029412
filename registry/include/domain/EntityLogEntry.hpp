#pragma once

#include "domain/FieldValue.hpp"
#include "domain/Timestamp.hpp"
#include "domain/Uid.hpp"
#include "domain/enums/ModificationType.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace registry::domain {

/**
 * @brief Неизменяемая запись журнала аудита
 *
 * version является логическим временем: 1 у CREATED, далее +1 на запись.
 * Набор заполненных полей зависит от what:
 * - CREATED:  initialFields, decimalScale
 * - UPDATED:  field, oldValue, newValue
 * - LINKED / UNLINKED: target, role
 * - RETIRED:  только общие поля
 */
struct EntityLogEntry {
    uint64_t version = 0;
    ModificationType what = ModificationType::UPDATED;
    Timestamp timestamp;
    std::string actor;              ///< Кто выполнил изменение
    std::string reason;             ///< Почему (может быть пустым)

    std::string field;
    FieldValue oldValue;
    FieldValue newValue;

    FieldMap initialFields;
    unsigned decimalScale = 0;

    std::optional<Uid> target;
    std::string role;

    nlohmann::json toJson() const;

    /**
     * @throws std::invalid_argument если JSON не описывает запись журнала
     */
    static EntityLogEntry fromJson(const nlohmann::json& j);
};

} // namespace registry::domain
