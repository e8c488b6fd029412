#pragma once

#include "domain/EntityChange.hpp"
#include "domain/EntityDependents.hpp"
#include "domain/EntityLog.hpp"
#include "domain/EntityRecord.hpp"
#include "domain/EntitySchema.hpp"
#include "domain/FieldValue.hpp"
#include "domain/Uid.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace registry::application {
class EntityStore;
}

namespace registry::domain {

/**
 * @brief Кто и зачем выполняет изменение
 *
 * Пустой actor заменяется актором по умолчанию из настроек хранилища.
 */
struct AuditContext {
    std::string actor;
    std::string reason;
};

/**
 * @brief Получатель подтверждённых изменений (слой сохранения)
 *
 * Вызывается до применения изменения в памяти; исключение из него
 * отменяет операцию.
 */
using ChangeSink = std::function<void(const EntityChange&)>;

/**
 * @brief Базовая доменная сущность
 *
 * Объединяет идентичность, запись, журнал аудита и связи зависимостей.
 * Конкретные виды (Account, Position, Transaction) задают схему полей
 * и правила валидации.
 *
 * Все операции над одной сущностью сериализуются её мьютексом; порядок
 * записей журнала совпадает с порядком допуска операций.
 *
 * Экземпляры создаются и гидратируются только через EntityStore,
 * который гарантирует один живой объект на Uid.
 */
class Entity {
public:
    virtual ~Entity() = default;

    Entity(const Entity&) = delete;
    Entity& operator=(const Entity&) = delete;

    const Uid& uid() const { return uid_; }
    const std::string& kind() const { return kind_; }

    EntityState state() const;
    bool isRetired() const;

    /**
     * @brief Значение поля или nullopt
     */
    std::optional<FieldValue> get(const std::string& field) const;

    /// Снимок текущей записи
    EntityRecord record() const;

    /// Снимок журнала
    std::vector<EntityLogEntry> logEntries() const;
    size_t logSize() const;

    /**
     * @brief Восстановить запись из журнала с нуля
     */
    EntityRecord replay() const;

    std::set<Uid> dependsOn() const;
    std::set<Uid> dependedBy() const;

    /**
     * @brief Изменить поле
     *
     * Проверяет тип и правила вида, затем сохраняет изменение, затем
     * обновляет запись и добавляет ровно одну запись в журнал.
     *
     * @throws RetiredEntityError если сущность выведена
     * @throws ValidationError при неизвестном поле, неверном типе,
     *         изменении ключевого поля или нарушении правил вида
     */
    void mutate(const std::string& field, const FieldValue& value,
                const AuditContext& context = {});

    /**
     * @brief Зарегистрировать зависимость this -> other
     *
     * Обновляет связи обеих сущностей симметрично и добавляет запись
     * LINKED в журнал this.
     *
     * @throws SelfReferenceError если other это this и вид запрещает ссылку на себя
     * @throws RetiredEntityError если одна из сущностей выведена
     * @throws ValidationError если связь уже существует
     */
    void link(Entity& other, const std::string& role, const AuditContext& context = {});

    /**
     * @brief Удалить зависимость this -> other
     * @throws NoSuchLinkError если связи нет
     * @throws RetiredEntityError если this выведена
     */
    void unlink(Entity& other, const AuditContext& context = {});

    /**
     * @brief Схема вида
     */
    virtual const EntitySchema& schema() const = 0;

protected:
    Entity(EntityRecord record, EntityLog log);

    /**
     * @brief Правила вида для одного поля
     *
     * Вызывается под мьютексом сущности с уже нормализованным значением;
     * current() отражает состояние до изменения.
     * @throws ValidationError
     */
    virtual void validateField(const std::string& field, const FieldValue& value) const;

    /**
     * @brief Правила, связывающие несколько полей
     *
     * Вызывается с записью в том виде, какой она станет после изменения.
     */
    virtual void validateRecord(const EntityRecord& next) const;

    virtual bool allowsSelfReference() const { return false; }

    const EntityRecord& current() const { return record_; }

    /// Проверки для наследников
    void requireNonEmpty(const std::string& field, const FieldValue& value) const;
    void requireNonNegative(const std::string& field, const FieldValue& value) const;

private:
    friend class application::EntityStore;

    using Locks = std::vector<std::unique_lock<std::mutex>>;

    /**
     * @brief Захватить мьютексы набора сущностей в порядке Uid
     */
    static Locks lockInOrder(std::vector<Entity*> entities);

    void ensureActive() const;
    FieldValue normalize(const std::string& field, const FieldValue& value) const;

    /**
     * @brief Первая запись журнала (CREATED) для новой сущности
     *
     * keyFields уже канонизированы; initial нормализуются и проверяются
     * правилами вида. Ключевые поля в initial запрещены.
     */
    void initialize(const FieldMap& keyFields, const FieldMap& initial, const AuditContext& context);

    EntityLogEntry makeEntry(ModificationType what, const AuditContext& context) const;
    void commit(EntityRecord next, const EntityLogEntry& entry, const std::vector<EdgeDelta>& edges);

    // Вызываются при уже захваченных мьютексах всех участников
    void linkLocked(Entity& other, const std::string& role, const AuditContext& context);
    void unlinkLocked(Entity& other, const AuditContext& context);
    void retireLocked(const std::vector<Entity*>& dependencies, const AuditContext& context);

    const Uid uid_;
    const std::string kind_;

    mutable std::mutex mutex_;
    EntityRecord record_;
    EntityLog log_;
    EntityDependents dependents_;

    ChangeSink sink_;
    std::string defaultActor_;
};

} // namespace registry::domain
