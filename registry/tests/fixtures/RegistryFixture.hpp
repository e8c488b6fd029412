#pragma once

#include <gtest/gtest.h>

#include "adapters/secondary/persistence/InMemoryEntityRepository.hpp"
#include "application/EntityStore.hpp"
#include "application/SimpleEntityFactory.hpp"
#include "domain/errors/RegistryException.hpp"
#include "settings/StoreSettings.hpp"
#include "../mocks/TestKinds.hpp"

namespace registry::tests {

/**
 * @brief Хранилище поверх InMemoryEntityRepository со шкалой 2
 */
class RegistryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        repository_ = std::make_shared<adapters::secondary::InMemoryEntityRepository>();
        factory_ = std::make_shared<application::SimpleEntityFactory>();
        factory_->registerKind<Node>();
        settings_ = std::make_shared<settings::StoreSettings>(2, "tester");
        store_ = makeStore();
    }

    std::shared_ptr<application::EntityStore> makeStore(unsigned decimalScale = 2) {
        return std::make_shared<application::EntityStore>(
            repository_, factory_, std::make_shared<settings::StoreSettings>(decimalScale, "tester"));
    }

    std::shared_ptr<domain::Entity> account(const std::string& name, const std::string& currency = "USD",
                                            const domain::FieldMap& initial = {}) {
        return store_->getOrCreate("account",
                                   {{"name", domain::textValue(name)}, {"currency", domain::textValue(currency)}},
                                   initial);
    }

    std::shared_ptr<domain::Entity> position(const domain::Entity& owner, const std::string& instrument,
                                             const domain::FieldMap& initial = {}) {
        return store_->getOrCreate("position",
                                   {{"account", domain::uidValue(owner.uid())},
                                    {"instrument", domain::textValue(instrument)}},
                                   initial);
    }

    std::shared_ptr<domain::Entity> transaction(const domain::Entity& owner, const std::string& type,
                                                const std::string& date, const std::string& reference = "",
                                                const domain::FieldMap& initial = {}) {
        domain::FieldMap key{
            {"account", domain::uidValue(owner.uid())},
            {"type", domain::textValue(type)},
            {"date", domain::textValue(date)}};
        if (!reference.empty()) {
            key["reference"] = domain::textValue(reference);
        }
        return store_->getOrCreate("transaction", key, initial);
    }

    std::shared_ptr<domain::Entity> node(const std::string& name) {
        return store_->getOrCreate("node", {{"name", domain::textValue(name)}});
    }

    static size_t countEntries(const domain::Entity& entity, domain::ModificationType what) {
        size_t count = 0;
        for (const auto& entry : entity.logEntries()) {
            if (entry.what == what) {
                ++count;
            }
        }
        return count;
    }

    static std::string decimalText(const domain::Entity& entity, const std::string& field) {
        auto value = entity.get(field);
        if (!value || !std::holds_alternative<domain::Decimal>(*value)) {
            return "<none>";
        }
        return std::get<domain::Decimal>(*value).toString();
    }

    std::shared_ptr<adapters::secondary::InMemoryEntityRepository> repository_;
    std::shared_ptr<application::SimpleEntityFactory> factory_;
    std::shared_ptr<settings::StoreSettings> settings_;
    std::shared_ptr<application::EntityStore> store_;
};

} // namespace registry::tests
