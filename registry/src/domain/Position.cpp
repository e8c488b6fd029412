#include "domain/Position.hpp"
#include "domain/errors/RegistryException.hpp"

namespace registry::domain {

const EntitySchema& Position::entitySchema() {
    static const EntitySchema schema{
        KIND,
        {
            {"account", FieldType::UID},
            {"instrument", FieldType::STRING},
        },
        {
            {"account", FieldType::UID},
            {"instrument", FieldType::STRING},
            {"quantity", FieldType::DECIMAL},
            {"averagePrice", FieldType::DECIMAL},
        }};
    return schema;
}

void Position::validateField(const std::string& field, const FieldValue& value) const {
    if (field == "instrument") {
        requireNonEmpty(field, value);
    } else if (field == "averagePrice") {
        requireNonNegative(field, value);
    }
}

} // namespace registry::domain
