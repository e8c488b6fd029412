#pragma once

#include "domain/Entity.hpp"
#include "domain/EntityLog.hpp"
#include "domain/EntityRecord.hpp"
#include "domain/EntitySchema.hpp"
#include <memory>
#include <string>
#include <vector>

namespace registry::domain {

/**
 * @brief Фабрика сущностей по тегу вида
 */
class EntityFactory {
public:
    virtual ~EntityFactory() = default;

    /**
     * @brief Схема вида
     * @throws UnknownKindError если вид не зарегистрирован
     */
    virtual const EntitySchema& schema(const std::string& kind) const = 0;

    virtual bool hasKind(const std::string& kind) const = 0;

    virtual std::vector<std::string> kinds() const = 0;

    /**
     * @brief Создать объект сущности из записи и журнала
     * @throws UnknownKindError если вид не зарегистрирован
     */
    virtual std::shared_ptr<Entity> create(EntityRecord record, EntityLog log) const = 0;
};

} // namespace registry::domain
