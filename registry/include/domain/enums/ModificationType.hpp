#pragma once

#include <string>
#include <stdexcept>

namespace registry::domain {

/**
 * @brief Тип записи в журнале сущности
 */
enum class ModificationType {
    CREATED,    ///< Первая запись журнала, содержит начальные поля
    UPDATED,    ///< Изменение одного поля
    LINKED,     ///< Добавлена зависимость от другой сущности
    UNLINKED,   ///< Зависимость удалена
    RETIRED     ///< Терминальная запись
};

inline std::string toString(ModificationType type) {
    switch (type) {
        case ModificationType::CREATED:  return "CREATED";
        case ModificationType::UPDATED:  return "UPDATED";
        case ModificationType::LINKED:   return "LINKED";
        case ModificationType::UNLINKED: return "UNLINKED";
        case ModificationType::RETIRED:  return "RETIRED";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline ModificationType modificationTypeFromString(const std::string& str) {
    if (str == "CREATED")  return ModificationType::CREATED;
    if (str == "UPDATED")  return ModificationType::UPDATED;
    if (str == "LINKED")   return ModificationType::LINKED;
    if (str == "UNLINKED") return ModificationType::UNLINKED;
    if (str == "RETIRED")  return ModificationType::RETIRED;
    throw std::invalid_argument("Unknown ModificationType: " + str);
}

} // namespace registry::domain
