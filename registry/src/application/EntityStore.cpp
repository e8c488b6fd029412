#include "application/EntityStore.hpp"
#include "domain/errors/RegistryException.hpp"
#include "utils/IdentityCalculator.hpp"

#include <iostream>
#include <set>
#include <string>

namespace registry::application {

using domain::AuditContext;
using domain::CorruptStateError;
using domain::Entity;
using domain::EntityDependents;
using domain::EntityLog;
using domain::EntityRecord;
using domain::FieldMap;
using domain::PersistedEntity;
using domain::Uid;
using utils::IdentityCalculator;

struct EntityStore::PreparedEntity {
    const PersistedEntity* persisted;
    EntityLog log;
};

EntityStore::EntityStore(
    std::shared_ptr<ports::output::IEntityRepository> repository,
    std::shared_ptr<domain::EntityFactory> factory,
    std::shared_ptr<settings::StoreSettings> settings
) : repository_(std::move(repository))
  , factory_(std::move(factory))
  , settings_(std::move(settings))
{
    std::cout << "[EntityStore] Created (decimal scale " << settings_->getDecimalScale()
              << ", default actor '" << settings_->getDefaultActor() << "')" << std::endl;
}

std::shared_ptr<Entity> EntityStore::getOrCreate(
    const std::string& kind,
    const FieldMap& key,
    const FieldMap& initial,
    const AuditContext& context
) {
    const auto& schema = factory_->schema(kind);
    FieldMap canonical = IdentityCalculator::canonicalize(schema, key);
    Uid uid = IdentityCalculator::digest(IdentityCalculator::encode(schema.kind, canonical));

    auto [entity, created] = live_.getOrInsert(uid, [&]() {
        if (retired_.contains(uid)) {
            throw domain::RetiredEntityError(uid);
        }
        auto fresh = factory_->create(
            EntityRecord(uid, schema.kind, settings_->getDecimalScale()),
            EntityLog(uid, schema.kind));
        attach(*fresh);
        fresh->initialize(canonical, initial, context);
        return fresh;
    });

    if (created) {
        std::cout << "[EntityStore] Created " << kind << " " << uid.shortString() << std::endl;
    } else if (entity->isRetired()) {
        // retire() переносит сущность в надгробия чуть позже смены состояния
        throw domain::RetiredEntityError(uid);
    }
    return entity;
}

std::shared_ptr<Entity> EntityStore::get(const Uid& uid) const {
    auto entity = live_.find(uid);
    if (entity && entity->isRetired()) {
        return nullptr;
    }
    return entity;
}

void EntityStore::retire(const Uid& uid, const AuditContext& context) {
    auto entity = live_.find(uid);
    if (!entity) {
        if (retired_.contains(uid)) {
            throw domain::RetiredEntityError(uid);
        }
        throw domain::UnknownEntityError(uid);
    }

    for (;;) {
        std::set<Uid> targets = entity->dependsOn();

        std::vector<std::shared_ptr<Entity>> dependencies;
        std::vector<Entity*> participants{entity.get()};
        for (const auto& target : targets) {
            if (target == uid) {
                dependencies.push_back(entity);
                continue;
            }
            auto dependency = live_.find(target);
            if (!dependency) {
                throw CorruptStateError("depends on unregistered entity " + target.shortString(), uid);
            }
            dependencies.push_back(dependency);
            participants.push_back(dependency.get());
        }

        auto locks = Entity::lockInOrder(participants);
        if (entity->dependents_.dependsOn() != targets) {
            // связи изменились между снимком и захватом блокировок
            continue;
        }

        const auto& dependedBy = entity->dependents_.dependedBy();
        size_t dependents = dependedBy.size() - (dependedBy.count(uid) ? 1 : 0);
        if (dependents > 0) {
            throw domain::ReferentialIntegrityError(uid, dependents);
        }

        std::vector<Entity*> removal;
        removal.reserve(dependencies.size());
        for (const auto& dependency : dependencies) {
            removal.push_back(dependency.get());
        }
        entity->retireLocked(removal, context);

        retired_.insert(uid, entity);
        live_.remove(uid);
        break;
    }

    std::cout << "[EntityStore] Retired " << entity->kind() << " " << uid.shortString() << std::endl;
}

size_t EntityStore::hydrateAll(const std::vector<PersistedEntity>& records) {
    std::lock_guard<std::mutex> lock(hydrationMutex_);

    // Фаза 1: проверка всей пачки, реестр не меняется
    std::map<Uid, const PersistedEntity*> stored;
    for (const auto& persisted : records) {
        if (!stored.emplace(persisted.record.uid, &persisted).second) {
            throw CorruptStateError("duplicate record in hydration batch", persisted.record.uid);
        }
    }

    std::vector<PreparedEntity> batch;
    size_t skipped = 0;
    for (const auto& persisted : records) {
        const Uid& uid = persisted.record.uid;
        if (live_.contains(uid) || retired_.contains(uid)) {
            ++skipped;
            continue;
        }
        batch.push_back(prepare(persisted));
    }
    checkLinks(batch, stored);

    // Фаза 2: рёбра проводятся до публикации; неудачная пачка не оставляет
    // ни сущностей в реестре, ни обратных ссылок на активных целях
    std::map<Uid, std::shared_ptr<Entity>> created;
    for (auto& prepared : batch) {
        const EntityRecord& record = prepared.persisted->record;
        auto entity = factory_->create(record, std::move(prepared.log));
        attach(*entity);
        created.emplace(record.uid, std::move(entity));
    }

    try {
        for (const auto& [uid, entity] : created) {
            for (const auto& [target, role] : entity->record_.links) {
                auto inBatch = created.find(target);
                auto dependency = inBatch != created.end() ? inBatch->second : live_.find(target);
                if (!dependency) {
                    throw CorruptStateError("dependency " + target.shortString()
                                                + " disappeared during hydration", uid);
                }
                auto locks = Entity::lockInOrder({entity.get(), dependency.get()});
                if (dependency->record_.isRetired()) {
                    throw CorruptStateError("dependency " + target.shortString()
                                                + " was retired during hydration", uid);
                }
                EntityDependents::addEdge(entity->dependents_, uid,
                                          dependency->dependents_, dependency->uid());
            }
        }

        std::vector<Uid> published;
        for (const auto& [uid, entity] : created) {
            auto& bucket = entity->record_.isRetired() ? retired_ : live_;
            if (!bucket.insertIfAbsent(uid, entity)) {
                for (const auto& done : published) {
                    live_.remove(done);
                    retired_.remove(done);
                }
                throw CorruptStateError("entity was created concurrently with hydration", uid);
            }
            published.push_back(uid);
        }
    } catch (const CorruptStateError&) {
        unwire(created);
        throw;
    }

    std::cout << "[EntityStore] Hydrated " << created.size() << " entities ("
              << skipped << " already loaded)" << std::endl;
    return created.size();
}

size_t EntityStore::load() {
    if (!repository_) {
        return 0;
    }
    return hydrateAll(repository_->loadAll());
}

size_t EntityStore::size() const {
    return live_.size();
}

std::vector<Uid> EntityStore::uids() const {
    return live_.keys();
}

std::set<Uid> EntityStore::reachableUids(const std::vector<Uid>& roots) const {
    std::set<Uid> visited;
    std::vector<Uid> pending;
    for (const auto& root : roots) {
        if (live_.contains(root)) {
            pending.push_back(root);
        }
    }

    while (!pending.empty()) {
        Uid uid = pending.back();
        pending.pop_back();
        if (!visited.insert(uid).second) {
            continue;
        }
        auto entity = live_.find(uid);
        if (!entity) {
            continue;
        }
        for (const auto& target : entity->dependsOn()) {
            if (!visited.count(target)) {
                pending.push_back(target);
            }
        }
    }
    return visited;
}

size_t EntityStore::sweep(const std::vector<Uid>& roots, const AuditContext& context) {
    auto reachable = reachableUids(roots);

    std::vector<std::shared_ptr<Entity>> unreachable;
    for (const auto& entity : live_.values()) {
        if (!reachable.count(entity->uid())) {
            unreachable.push_back(entity);
        }
    }

    // Сначала рвём исходящие связи, иначе недостижимые сущности,
    // зависящие друг от друга, блокируют вывод
    for (const auto& entity : unreachable) {
        for (const auto& target : entity->dependsOn()) {
            auto dependency = target == entity->uid() ? entity : live_.find(target);
            if (!dependency) {
                throw CorruptStateError("depends on unregistered entity " + target.shortString(),
                                        entity->uid());
            }
            entity->unlink(*dependency, context);
        }
    }
    for (const auto& entity : unreachable) {
        retire(entity->uid(), context);
    }

    std::cout << "[EntityStore] Sweep retired " << unreachable.size() << " of "
              << unreachable.size() + reachable.size() << " entities" << std::endl;
    return unreachable.size();
}

void EntityStore::verify() const {
    auto checkReplay = [](const Entity& entity, const EntityRecord& record) {
        EntityRecord replayed;
        try {
            replayed = entity.replay();
        } catch (const domain::LogConflictError& e) {
            throw CorruptStateError(std::string("log cannot be replayed: ") + e.what(), entity.uid());
        }
        if (!replayed.sameState(record)) {
            throw CorruptStateError("log does not replay to the live record", entity.uid());
        }
    };

    auto live = live_.values();
    for (const auto& entity : live) {
        const Uid& uid = entity->uid();
        EntityRecord record = entity->record();
        checkReplay(*entity, record);
        if (record.isRetired()) {
            throw CorruptStateError("retired entity is still registered as active", uid);
        }

        auto dependsOn = entity->dependsOn();
        std::set<Uid> linked;
        for (const auto& [target, role] : record.links) {
            linked.insert(target);
        }
        if (linked != dependsOn) {
            throw CorruptStateError("record links differ from dependents", uid);
        }

        for (const auto& target : dependsOn) {
            auto dependency = target == uid ? entity : live_.find(target);
            if (!dependency) {
                throw CorruptStateError("depends on missing entity " + target.shortString(), uid);
            }
            if (!dependency->dependedBy().count(uid)) {
                throw CorruptStateError("asymmetric link to " + target.shortString(), uid);
            }
        }
        for (const auto& source : entity->dependedBy()) {
            auto dependent = source == uid ? entity : live_.find(source);
            if (!dependent || !dependent->dependsOn().count(uid)) {
                throw CorruptStateError("asymmetric back-link from " + source.shortString(), uid);
            }
        }
    }

    auto retired = retired_.values();
    for (const auto& entity : retired) {
        EntityRecord record = entity->record();
        checkReplay(*entity, record);
        if (!entity->dependsOn().empty() || !entity->dependedBy().empty()) {
            throw CorruptStateError("retired entity still has links", entity->uid());
        }
    }

    std::cout << "[EntityStore] Verified " << live.size() << " active and "
              << retired.size() << " retired entities" << std::endl;
}

std::map<std::string, ports::input::KindStatistics> EntityStore::statistics() const {
    std::map<std::string, ports::input::KindStatistics> result;
    for (const auto& kind : factory_->kinds()) {
        result.emplace(kind, ports::input::KindStatistics{});
    }
    for (const auto& entity : live_.values()) {
        ++result[entity->kind()].active;
    }
    for (const auto& entity : retired_.values()) {
        ++result[entity->kind()].retired;
    }
    return result;
}

Uid EntityStore::identify(const std::string& kind, const FieldMap& key) const {
    return IdentityCalculator::compute(factory_->schema(kind), key);
}

void EntityStore::attach(Entity& entity) const {
    if (repository_) {
        auto repository = repository_;
        entity.sink_ = [repository](const domain::EntityChange& change) {
            repository->save(change);
        };
    }
    entity.defaultActor_ = settings_->getDefaultActor();
}

void EntityStore::unwire(const std::map<Uid, std::shared_ptr<Entity>>& created) const {
    for (const auto& [uid, entity] : created) {
        for (const auto& target : std::set<Uid>(entity->dependents_.dependsOn())) {
            if (created.count(target)) {
                continue;
            }
            auto dependency = live_.find(target);
            if (!dependency) {
                continue;
            }
            auto locks = Entity::lockInOrder({entity.get(), dependency.get()});
            EntityDependents::removeEdge(entity->dependents_, uid,
                                         dependency->dependents_, dependency->uid());
        }
    }
}

EntityStore::PreparedEntity EntityStore::prepare(const PersistedEntity& persisted) const {
    const EntityRecord& record = persisted.record;
    if (!factory_->hasKind(record.kind)) {
        throw CorruptStateError("unknown entity kind '" + record.kind + "'", record.uid);
    }
    const auto& schema = factory_->schema(record.kind);

    FieldMap key;
    for (const auto& spec : schema.keyFields) {
        if (auto value = record.field(spec.name)) {
            key[spec.name] = *value;
        }
    }

    Uid computed;
    try {
        computed = IdentityCalculator::compute(schema, key);
    } catch (const domain::InvalidKeyError& e) {
        throw CorruptStateError(std::string("stored key fields are invalid: ") + e.what(), record.uid);
    }
    if (computed != record.uid) {
        throw CorruptStateError("stored uid does not match key fields (computed "
                                    + computed.shortString() + ")", record.uid);
    }

    checkFields(schema, record);

    try {
        EntityLog log = EntityLog::restore(record.uid, record.kind, persisted.log);
        if (!log.replay().sameState(record)) {
            throw CorruptStateError("log does not replay to the stored record", record.uid);
        }
        return PreparedEntity{&persisted, std::move(log)};
    } catch (const CorruptStateError&) {
        throw;
    } catch (const domain::RegistryException& e) {
        throw CorruptStateError(std::string("stored log is rejected: ") + e.what(), record.uid);
    }
}

void EntityStore::checkFields(const domain::EntitySchema& schema, const EntityRecord& record) const {
    if (record.decimalScale > domain::Decimal::MAX_SCALE) {
        throw CorruptStateError("decimal scale " + std::to_string(record.decimalScale)
                                    + " is out of range", record.uid);
    }

    for (const auto& [name, value] : record.fields) {
        auto declared = schema.fieldType(name);
        if (!declared) {
            throw CorruptStateError("unknown field '" + name + "' for kind " + record.kind, record.uid);
        }
        auto actual = domain::fieldTypeOf(value);
        if (actual != declared) {
            throw CorruptStateError("field '" + name + "' expects " + domain::toString(*declared) + ", got "
                                        + (actual ? domain::toString(*actual) : std::string("null")),
                                    record.uid);
        }
        if (const auto* number = std::get_if<domain::Decimal>(&value)) {
            // ключевые decimal-поля хранятся в шкале идентичности
            unsigned expected = schema.isKeyField(name) ? IdentityCalculator::KEY_SCALE : record.decimalScale;
            if (number->scale() != expected) {
                throw CorruptStateError("field '" + name + "' has scale " + std::to_string(number->scale())
                                            + ", record scale is " + std::to_string(expected),
                                        record.uid);
            }
        }
    }
}

void EntityStore::checkLinks(const std::vector<PreparedEntity>& batch,
                             const std::map<Uid, const PersistedEntity*>& stored) const {
    for (const auto& prepared : batch) {
        const EntityRecord& record = prepared.persisted->record;
        const auto& backLinks = prepared.persisted->dependedBy;

        if (record.isRetired() && !backLinks.empty()) {
            throw CorruptStateError("retired entity still has dependents", record.uid);
        }

        for (const auto& [target, role] : record.links) {
            auto it = stored.find(target);
            if (it != stored.end()) {
                if (it->second->record.isRetired()) {
                    throw CorruptStateError("depends on retired entity " + target.shortString(), record.uid);
                }
                if (!it->second->dependedBy.count(record.uid)) {
                    throw CorruptStateError("asymmetric link: " + target.shortString()
                                                + " does not list the back-link", record.uid);
                }
            } else if (!live_.contains(target)) {
                throw CorruptStateError("depends on missing entity " + target.shortString(), record.uid);
            }
        }

        for (const auto& source : backLinks) {
            auto it = stored.find(source);
            if (it != stored.end()) {
                if (!it->second->record.links.count(record.uid)) {
                    throw CorruptStateError("asymmetric back-link from " + source.shortString(), record.uid);
                }
                continue;
            }
            auto dependent = live_.find(source);
            if (!dependent || !dependent->dependsOn().count(record.uid)) {
                throw CorruptStateError("back-link from unknown entity " + source.shortString(), record.uid);
            }
        }
    }
}

} // namespace registry::application
