/**
 * @file InMemoryEntityRepositoryTest.cpp
 * @brief Unit tests for InMemoryEntityRepository
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryEntityRepository.hpp"
#include "utils/IdentityCalculator.hpp"

using namespace registry::domain;
using registry::adapters::secondary::InMemoryEntityRepository;
using registry::utils::IdentityCalculator;

class InMemoryEntityRepositoryTest : public ::testing::Test {
protected:
    static EntityChange created(const Uid& uid) {
        EntityLogEntry entry;
        entry.version = 1;
        entry.what = ModificationType::CREATED;
        entry.actor = "tester";
        entry.initialFields = {{"name", textValue(uid.shortString())}};

        EntityChange change;
        change.record = EntityRecord(uid, "node", 2);
        change.record.version = 1;
        change.record.fields = entry.initialFields;
        change.entries.push_back(entry);
        return change;
    }

    static EntityChange linked(const Uid& from, const Uid& to, uint64_t version, bool added) {
        EntityLogEntry entry;
        entry.version = version;
        entry.what = added ? ModificationType::LINKED : ModificationType::UNLINKED;
        entry.target = to;
        entry.role = "peer";

        EntityChange change;
        change.record = EntityRecord(from, "node", 2);
        change.record.version = version;
        if (added) {
            change.record.links[to] = "peer";
        }
        change.entries.push_back(entry);
        change.edges.push_back(EdgeDelta{from, to, "peer", added});
        return change;
    }

    InMemoryEntityRepository repository;
    Uid first = IdentityCalculator::digest("first");
    Uid second = IdentityCalculator::digest("second");
};

TEST_F(InMemoryEntityRepositoryTest, Save_AccumulatesLog) {
    repository.save(created(first));
    repository.save(linked(first, second, 2, true));

    auto stored = repository.find(first);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->log.size(), 2u);
    EXPECT_EQ(stored->record.version, 2u);
    EXPECT_EQ(repository.saveCount(), 2u);
}

TEST_F(InMemoryEntityRepositoryTest, Save_RepeatedVersionSkipped) {
    repository.save(created(first));
    repository.save(created(first));

    EXPECT_EQ(repository.find(first)->log.size(), 1u);
}

TEST_F(InMemoryEntityRepositoryTest, Save_EdgesMaintainBackLinks) {
    repository.save(created(first));
    repository.save(created(second));
    repository.save(linked(first, second, 2, true));

    EXPECT_EQ(repository.find(second)->dependedBy, std::set<Uid>{first});

    repository.save(linked(first, second, 3, false));

    EXPECT_TRUE(repository.find(second)->dependedBy.empty());
}

TEST_F(InMemoryEntityRepositoryTest, LoadAll_ReturnsEverything) {
    repository.save(created(first));
    repository.save(created(second));

    EXPECT_EQ(repository.loadAll().size(), 2u);
    EXPECT_FALSE(repository.find(IdentityCalculator::digest("third")).has_value());

    repository.clear();
    EXPECT_EQ(repository.size(), 0u);
    EXPECT_TRUE(repository.loadAll().empty());
}
