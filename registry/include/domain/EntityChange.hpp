#pragma once

#include "domain/EntityLogEntry.hpp"
#include "domain/EntityRecord.hpp"
#include "domain/Uid.hpp"
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

namespace registry::domain {

/**
 * @brief Изменение ребра графа зависимостей: from зависит от to
 */
struct EdgeDelta {
    Uid from;
    Uid to;
    std::string role;
    bool added = true;
};

/**
 * @brief Единица сохранения после подтверждённой операции
 *
 * Снимок записи после операции, новые записи журнала и изменения рёбер.
 */
struct EntityChange {
    EntityRecord record;
    std::vector<EntityLogEntry> entries;
    std::vector<EdgeDelta> edges;

    const Uid& uid() const { return record.uid; }
    const std::string& kind() const { return record.kind; }
};

/**
 * @brief Сохранённое состояние сущности для гидратации
 *
 * dependedBy хранится отдельно, чтобы при загрузке проверить
 * симметричность графа.
 */
struct PersistedEntity {
    EntityRecord record;
    std::vector<EntityLogEntry> log;
    std::set<Uid> dependedBy;

    nlohmann::json toJson() const;

    /**
     * @throws std::invalid_argument если JSON не описывает сущность
     */
    static PersistedEntity fromJson(const nlohmann::json& j);
};

} // namespace registry::domain
