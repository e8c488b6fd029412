#pragma once

#include "domain/Entity.hpp"
#include "domain/EntitySchema.hpp"

namespace registry::domain {

/**
 * @brief Позиция по инструменту на счёте
 *
 * Ключ: account (Uid счёта) + instrument.
 */
class Position final : public Entity {
public:
    static constexpr const char* KIND = "position";

    static const EntitySchema& entitySchema();

    Position(EntityRecord record, EntityLog log)
        : Entity(std::move(record), std::move(log)) {}

    const EntitySchema& schema() const override { return entitySchema(); }

protected:
    void validateField(const std::string& field, const FieldValue& value) const override;
};

} // namespace registry::domain
