#pragma once

#include "domain/enums/FieldType.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace registry::domain {

/**
 * @brief Объявление ключевого поля
 */
struct KeyFieldSpec {
    std::string name;
    FieldType type;
    bool required = true;
};

/**
 * @brief Схема вида сущности
 *
 * keyFields определяют идентичность (Uid), fields перечисляют все
 * допустимые поля записи, включая ключевые.
 */
struct EntitySchema {
    std::string kind;
    std::vector<KeyFieldSpec> keyFields;
    std::map<std::string, FieldType> fields;

    const KeyFieldSpec* findKeyField(const std::string& name) const {
        for (const auto& spec : keyFields) {
            if (spec.name == name) {
                return &spec;
            }
        }
        return nullptr;
    }

    bool isKeyField(const std::string& name) const {
        return findKeyField(name) != nullptr;
    }

    std::optional<FieldType> fieldType(const std::string& name) const {
        auto it = fields.find(name);
        if (it == fields.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

} // namespace registry::domain
