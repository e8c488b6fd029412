#pragma once

#include "domain/Entity.hpp"
#include "domain/EntitySchema.hpp"

namespace registry::tests {

/**
 * @brief Вид для тестов: узел графа, которому разрешена ссылка на себя
 */
class Node final : public domain::Entity {
public:
    static constexpr const char* KIND = "node";

    static const domain::EntitySchema& entitySchema() {
        static const domain::EntitySchema schema{
            KIND,
            {{"name", domain::FieldType::STRING}},
            {
                {"name", domain::FieldType::STRING},
                {"weight", domain::FieldType::DECIMAL},
            }};
        return schema;
    }

    Node(domain::EntityRecord record, domain::EntityLog log)
        : Entity(std::move(record), std::move(log)) {}

    const domain::EntitySchema& schema() const override { return entitySchema(); }

protected:
    bool allowsSelfReference() const override { return true; }
};

} // namespace registry::tests
