#pragma once

#include "domain/EntityChange.hpp"
#include <vector>

namespace registry::ports::output {

/**
 * @brief Интерфейс долговременного хранилища сущностей
 *
 * Output Port: EntityStore вызывает save() после каждой подтверждённой
 * операции, до применения её в памяти. Исключение из save() отменяет
 * операцию.
 */
class IEntityRepository {
public:
    virtual ~IEntityRepository() = default;

    /**
     * @brief Загрузить все сохранённые сущности
     *
     * @return Записи, журналы и обратные связи, пригодные для hydrateAll()
     */
    virtual std::vector<domain::PersistedEntity> loadAll() = 0;

    /**
     * @brief Сохранить изменение одной сущности
     *
     * @param change Снимок записи, новые записи журнала и изменения рёбер
     */
    virtual void save(const domain::EntityChange& change) = 0;
};

} // namespace registry::ports::output
