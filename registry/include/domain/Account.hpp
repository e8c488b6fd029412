#pragma once

#include "domain/Entity.hpp"
#include "domain/EntitySchema.hpp"

namespace registry::domain {

/**
 * @brief Брокерский счёт
 *
 * Ключ: name + currency. Валюта это три заглавные латинские буквы (ISO 4217).
 */
class Account final : public Entity {
public:
    static constexpr const char* KIND = "account";

    static const EntitySchema& entitySchema();

    Account(EntityRecord record, EntityLog log)
        : Entity(std::move(record), std::move(log)) {}

    const EntitySchema& schema() const override { return entitySchema(); }

protected:
    void validateField(const std::string& field, const FieldValue& value) const override;
};

} // namespace registry::domain
