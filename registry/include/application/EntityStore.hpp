#pragma once

#include "domain/Entity.hpp"
#include "domain/EntityFactory.hpp"
#include "ports/input/IEntityStore.hpp"
#include "ports/output/IEntityRepository.hpp"
#include "settings/StoreSettings.hpp"
#include <ThreadSafeMap.hpp>
#include <map>
#include <memory>
#include <mutex>

namespace registry::application {

/**
 * @brief Реестр сущностей Uid -> живой объект
 *
 * Реализует IEntityStore. Создаётся явно и передаётся зависимостям,
 * глобального экземпляра нет.
 *
 * Блокировки:
 * - check-and-insert в getOrCreate выполняется под unique_lock карты
 *   активных сущностей, поэтому объект на Uid создаётся один раз;
 * - операции над несколькими сущностями захватывают их мьютексы
 *   в порядке Uid.
 *
 * Выведенные сущности переходят в карту надгробий и больше не
 * возвращаются get(); повторное создание того же Uid запрещено.
 */
class EntityStore : public ports::input::IEntityStore {
public:
    EntityStore(
        std::shared_ptr<ports::output::IEntityRepository> repository,
        std::shared_ptr<domain::EntityFactory> factory,
        std::shared_ptr<settings::StoreSettings> settings
    );

    std::shared_ptr<domain::Entity> getOrCreate(
        const std::string& kind,
        const domain::FieldMap& key,
        const domain::FieldMap& initial = {},
        const domain::AuditContext& context = {}
    ) override;

    std::shared_ptr<domain::Entity> get(const domain::Uid& uid) const override;

    void retire(const domain::Uid& uid, const domain::AuditContext& context = {}) override;

    size_t hydrateAll(const std::vector<domain::PersistedEntity>& records) override;

    size_t load() override;

    size_t size() const override;

    std::vector<domain::Uid> uids() const override;

    std::set<domain::Uid> reachableUids(const std::vector<domain::Uid>& roots) const override;

    size_t sweep(const std::vector<domain::Uid>& roots, const domain::AuditContext& context = {}) override;

    /**
     * @note Сравнивает снимки сущностей; рассчитана на состояние без
     *       конкурентных изменений (старт, офлайн-проверка).
     */
    void verify() const override;

    std::map<std::string, ports::input::KindStatistics> statistics() const override;

    /**
     * @brief Uid для ключа без обращения к реестру
     * @throws InvalidKeyError
     */
    domain::Uid identify(const std::string& kind, const domain::FieldMap& key) const;

private:
    struct PreparedEntity;

    void attach(domain::Entity& entity) const;

    PreparedEntity prepare(const domain::PersistedEntity& persisted) const;
    void checkFields(const domain::EntitySchema& schema, const domain::EntityRecord& record) const;
    void checkLinks(const std::vector<PreparedEntity>& batch,
                    const std::map<domain::Uid, const domain::PersistedEntity*>& stored) const;

    /**
     * @brief Снять рёбра неопубликованных сущностей с активных целей
     */
    void unwire(const std::map<domain::Uid, std::shared_ptr<domain::Entity>>& created) const;

    std::shared_ptr<ports::output::IEntityRepository> repository_;
    std::shared_ptr<domain::EntityFactory> factory_;
    std::shared_ptr<settings::StoreSettings> settings_;

    ThreadSafeMap<domain::Uid, domain::Entity> live_;
    ThreadSafeMap<domain::Uid, domain::Entity> retired_;

    std::mutex hydrationMutex_;   ///< hydrateAll выполняется по одному
};

} // namespace registry::application
