#pragma once

#include "domain/Account.hpp"
#include "domain/EntityFactory.hpp"
#include "domain/Position.hpp"
#include "domain/Transaction.hpp"
#include "domain/errors/RegistryException.hpp"
#include <functional>
#include <iostream>
#include <unordered_map>

namespace registry::application {

/**
 * @brief Фабрика сущностей с авторегистрацией
 *
 * Все встроенные виды регистрируются в конструкторе.
 * При добавлении нового вида добавить его в registerAllKinds().
 */
class SimpleEntityFactory final : public domain::EntityFactory {
public:
    using Creator = std::function<std::shared_ptr<domain::Entity>(domain::EntityRecord, domain::EntityLog)>;

    SimpleEntityFactory() {
        registerAllKinds();
    }

    const domain::EntitySchema& schema(const std::string& kind) const override {
        return find(kind).schema;
    }

    bool hasKind(const std::string& kind) const override {
        return kinds_.count(kind) > 0;
    }

    std::vector<std::string> kinds() const override {
        std::vector<std::string> result;
        result.reserve(kinds_.size());
        for (const auto& [kind, registration] : kinds_) {
            result.push_back(kind);
        }
        return result;
    }

    std::shared_ptr<domain::Entity> create(domain::EntityRecord record, domain::EntityLog log) const override {
        return find(record.kind).creator(std::move(record), std::move(log));
    }

    /**
     * @brief Ручная регистрация вида (для расширения)
     *
     * Регистрация выполняется до начала работы хранилища.
     */
    void registerKind(const domain::EntitySchema& schema, Creator creator) {
        kinds_[schema.kind] = Registration{schema, std::move(creator)};
    }

    template <typename T>
    void registerKind() {
        registerKind(T::entitySchema(), [](domain::EntityRecord record, domain::EntityLog log) {
            return std::make_shared<T>(std::move(record), std::move(log));
        });
    }

private:
    struct Registration {
        domain::EntitySchema schema;
        Creator creator;
    };

    const Registration& find(const std::string& kind) const {
        auto it = kinds_.find(kind);
        if (it == kinds_.end()) {
            throw domain::UnknownKindError(kind);
        }
        return it->second;
    }

    void registerAllKinds() {
        registerKind<domain::Account>();
        registerKind<domain::Position>();
        registerKind<domain::Transaction>();

        std::cout << "[SimpleEntityFactory] Registered "
                  << kinds_.size() << " entity kinds" << std::endl;
    }

    std::unordered_map<std::string, Registration> kinds_;
};

} // namespace registry::application
