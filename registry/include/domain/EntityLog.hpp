#pragma once

#include "domain/EntityLogEntry.hpp"
#include "domain/EntityRecord.hpp"
#include "domain/Uid.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace registry::domain {

/**
 * @brief Журнал аудита одной сущности (append-only)
 *
 * Записи неизменяемы и образуют цепочку: версия каждой следующей на
 * единицу больше, oldValue изменения совпадает с текущим значением поля
 * в проекции. Журнал является источником истины, запись сущности это
 * кэшированная проекция; replay() восстанавливает её с нуля.
 *
 * Не потокобезопасен: сериализацию обеспечивает владеющая Entity.
 */
class EntityLog {
public:
    EntityLog(const Uid& uid, const std::string& kind);

    /**
     * @brief Восстановить журнал из сохранённых записей
     *
     * Каждая запись проходит те же проверки, что и append().
     * @throws LogConflictError если записи не образуют цепочку
     */
    static EntityLog restore(const Uid& uid, const std::string& kind,
                             const std::vector<EntityLogEntry>& entries);

    /**
     * @brief Добавить запись в конец журнала
     * @throws RetiredEntityError если последняя запись RETIRED
     * @throws LogConflictError если запись не продолжает цепочку
     */
    void append(const EntityLogEntry& entry);

    /**
     * @brief Проверить запись без добавления
     */
    void check(const EntityLogEntry& entry) const;

    /**
     * @brief Свернуть все записи с начала и получить запись сущности
     * @throws LogConflictError если журнал пуст
     */
    EntityRecord replay() const;

    /**
     * @brief Применить запись к записи сущности
     *
     * Единственное место, где определена семантика свёртки.
     */
    static void apply(EntityRecord& record, const EntityLogEntry& entry);

    const std::vector<EntityLogEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    uint64_t lastVersion() const { return entries_.empty() ? 0 : entries_.back().version; }

    const Uid& uid() const { return uid_; }
    const std::string& kind() const { return kind_; }

private:
    Uid uid_;
    std::string kind_;
    std::vector<EntityLogEntry> entries_;
    EntityRecord projection_;   ///< Свёртка entries_, для проверки цепочки
};

} // namespace registry::domain
