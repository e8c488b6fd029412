#pragma once

#include "domain/Entity.hpp"
#include "domain/EntitySchema.hpp"

namespace registry::domain {

/**
 * @brief Операция по счёту: покупка, продажа, дивиденд, процент, комиссия
 *
 * Ключ: account + type + date (+ reference, если задан), где date
 * имеет формат YYYY-MM-DD.
 */
class Transaction final : public Entity {
public:
    static constexpr const char* KIND = "transaction";

    static const EntitySchema& entitySchema();

    Transaction(EntityRecord record, EntityLog log)
        : Entity(std::move(record), std::move(log)) {}

    const EntitySchema& schema() const override { return entitySchema(); }

protected:
    void validateField(const std::string& field, const FieldValue& value) const override;
    void validateRecord(const EntityRecord& next) const override;

private:
    static bool isCalendarDate(const std::string& text);
};

} // namespace registry::domain
