#pragma once

#include "domain/Entity.hpp"
#include "domain/EntityChange.hpp"
#include "domain/FieldValue.hpp"
#include "domain/Uid.hpp"
#include <map>
#include <set>
#include <memory>
#include <string>
#include <vector>

namespace registry::ports::input {

/**
 * @brief Количество сущностей одного вида
 */
struct KindStatistics {
    size_t active = 0;
    size_t retired = 0;
};

/**
 * @brief Интерфейс реестра сущностей
 *
 * Input Port: единственная точка входа для создания, поиска и вывода
 * сущностей. Гарантирует не более одного живого объекта на Uid.
 */
class IEntityStore {
public:
    virtual ~IEntityStore() = default;

    /**
     * @brief Найти или создать сущность по ключу
     *
     * Если сущность уже есть, возвращается она, initial игнорируется.
     * Иначе создаётся новая с записью CREATED в журнале. Для одного Uid
     * объект создаётся ровно один раз, даже при конкурентных вызовах.
     *
     * @param kind Тег вида ("account", "position", "transaction")
     * @param key Ключевые поля
     * @param initial Начальные значения неключевых полей
     * @param context Кто и зачем создаёт
     * @throws InvalidKeyError при некорректном ключе или неизвестном виде
     * @throws ValidationError если initial нарушает правила вида
     * @throws RetiredEntityError если сущность с этим Uid выведена
     */
    virtual std::shared_ptr<domain::Entity> getOrCreate(
        const std::string& kind,
        const domain::FieldMap& key,
        const domain::FieldMap& initial = {},
        const domain::AuditContext& context = {}
    ) = 0;

    /**
     * @brief Найти активную сущность
     *
     * @return nullptr если сущности нет или она выведена
     */
    virtual std::shared_ptr<domain::Entity> get(const domain::Uid& uid) const = 0;

    /**
     * @brief Вывести сущность из реестра
     *
     * Удаляет исходящие связи сущности и добавляет RETIRED в журнал.
     *
     * @throws ReferentialIntegrityError если от сущности зависят другие
     * @throws UnknownEntityError если Uid не зарегистрирован
     * @throws RetiredEntityError если сущность уже выведена
     */
    virtual void retire(const domain::Uid& uid, const domain::AuditContext& context = {}) = 0;

    /**
     * @brief Загрузить сохранённые сущности
     *
     * Вся пачка проверяется до вставки; уже загруженные Uid пропускаются.
     *
     * @return Количество добавленных сущностей
     * @throws CorruptStateError если пачка нарушает целостность
     */
    virtual size_t hydrateAll(const std::vector<domain::PersistedEntity>& records) = 0;

    /**
     * @brief Загрузить всё из подключённого репозитория
     */
    virtual size_t load() = 0;

    /// Количество активных сущностей
    virtual size_t size() const = 0;

    virtual std::vector<domain::Uid> uids() const = 0;

    /**
     * @brief Замыкание по dependsOn от заданных корней
     */
    virtual std::set<domain::Uid> reachableUids(const std::vector<domain::Uid>& roots) const = 0;

    /**
     * @brief Вывести все активные сущности, недостижимые из корней
     *
     * @return Количество выведенных сущностей
     */
    virtual size_t sweep(const std::vector<domain::Uid>& roots, const domain::AuditContext& context = {}) = 0;

    /**
     * @brief Проверить журналы и симметричность связей
     *
     * @throws CorruptStateError при первом нарушении
     */
    virtual void verify() const = 0;

    /**
     * @brief Сводка по видам: активные и выведенные
     */
    virtual std::map<std::string, KindStatistics> statistics() const = 0;
};

} // namespace registry::ports::input
