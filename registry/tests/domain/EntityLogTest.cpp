/**
 * @file EntityLogTest.cpp
 * @brief Unit tests for EntityLog chaining and replay
 */

#include <gtest/gtest.h>
#include "domain/EntityLog.hpp"
#include "domain/errors/RegistryException.hpp"
#include "utils/IdentityCalculator.hpp"

using namespace registry::domain;

class EntityLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        uid_ = registry::utils::IdentityCalculator::digest("account|Brokerage|USD");
        target_ = registry::utils::IdentityCalculator::digest("transaction|T1");
    }

    EntityLogEntry created(FieldMap fields = {}) {
        EntityLogEntry entry;
        entry.version = 1;
        entry.what = ModificationType::CREATED;
        entry.initialFields = std::move(fields);
        entry.decimalScale = 2;
        return entry;
    }

    EntityLogEntry updated(uint64_t version, const std::string& field,
                           FieldValue oldValue, FieldValue newValue) {
        EntityLogEntry entry;
        entry.version = version;
        entry.what = ModificationType::UPDATED;
        entry.field = field;
        entry.oldValue = std::move(oldValue);
        entry.newValue = std::move(newValue);
        return entry;
    }

    EntityLogEntry linkEntry(uint64_t version, ModificationType what) {
        EntityLogEntry entry;
        entry.version = version;
        entry.what = what;
        entry.target = target_;
        entry.role = "dependent";
        return entry;
    }

    EntityLogEntry retired(uint64_t version) {
        EntityLogEntry entry;
        entry.version = version;
        entry.what = ModificationType::RETIRED;
        return entry;
    }

    Uid uid_;
    Uid target_;
};

// ============================================================================
// CHAINING
// ============================================================================

TEST_F(EntityLogTest, Append_FirstEntryMustBeCreated) {
    EntityLog log(uid_, "account");

    EXPECT_THROW(log.append(updated(1, "balance", {}, decimalValue("1.00"))), LogConflictError);
    EXPECT_TRUE(log.empty());

    log.append(created());
    EXPECT_EQ(log.size(), 1u);
    EXPECT_EQ(log.lastVersion(), 1u);
}

TEST_F(EntityLogTest, Append_SecondCreated_Conflicts) {
    EntityLog log(uid_, "account");
    log.append(created());

    auto again = created();
    again.version = 2;
    EXPECT_THROW(log.append(again), LogConflictError);
}

TEST_F(EntityLogTest, Append_VersionGap_Conflicts) {
    EntityLog log(uid_, "account");
    log.append(created());

    EXPECT_THROW(log.append(updated(3, "balance", {}, decimalValue("1.00"))), LogConflictError);
    EXPECT_EQ(log.size(), 1u);
}

TEST_F(EntityLogTest, Append_OldValueMustMatchProjection) {
    EntityLog log(uid_, "account");
    log.append(created({{"balance", decimalValue("100.00")}}));

    // пропущено промежуточное изменение 100.00 -> 120.00
    EXPECT_THROW(log.append(updated(2, "balance", decimalValue("120.00"), decimalValue("150.00"))),
                 LogConflictError);

    log.append(updated(2, "balance", decimalValue("100.00"), decimalValue("150.00")));
    EXPECT_EQ(log.size(), 2u);
}

TEST_F(EntityLogTest, Append_OldValueScaleMismatch_Conflicts) {
    EntityLog log(uid_, "account");
    log.append(created({{"balance", decimalValue("100.00")}}));

    EXPECT_THROW(log.append(updated(2, "balance", decimalValue("100.0"), decimalValue("1.00"))),
                 LogConflictError);
}

TEST_F(EntityLogTest, Append_LinkTwice_Conflicts) {
    EntityLog log(uid_, "account");
    log.append(created());
    log.append(linkEntry(2, ModificationType::LINKED));

    EXPECT_THROW(log.append(linkEntry(3, ModificationType::LINKED)), LogConflictError);
}

TEST_F(EntityLogTest, Append_UnlinkMissing_Conflicts) {
    EntityLog log(uid_, "account");
    log.append(created());

    EXPECT_THROW(log.append(linkEntry(2, ModificationType::UNLINKED)), LogConflictError);
}

TEST_F(EntityLogTest, Append_AfterRetired_ThrowsRetired) {
    EntityLog log(uid_, "account");
    log.append(created());
    log.append(retired(2));

    EXPECT_THROW(log.append(updated(3, "balance", {}, decimalValue("1.00"))), RetiredEntityError);
}

// ============================================================================
// REPLAY
// ============================================================================

TEST_F(EntityLogTest, Replay_FoldsAllEntries) {
    EntityLog log(uid_, "account");
    log.append(created({{"name", textValue("Brokerage")}, {"balance", decimalValue("0.00")}}));
    log.append(updated(2, "balance", decimalValue("0.00"), decimalValue("100.00")));
    log.append(updated(3, "balance", decimalValue("100.00"), decimalValue("150.00")));
    log.append(linkEntry(4, ModificationType::LINKED));
    log.append(updated(5, "description", {}, textValue("main")));
    log.append(updated(6, "description", textValue("main"), FieldValue{}));

    EntityRecord record = log.replay();

    EXPECT_EQ(record.version, 6u);
    EXPECT_EQ(record.decimalScale, 2u);
    EXPECT_EQ(std::get<Decimal>(*record.field("balance")).toString(), "150.00");
    EXPECT_FALSE(record.field("description").has_value());
    EXPECT_EQ(record.links.at(target_), "dependent");
}

TEST_F(EntityLogTest, Replay_Retired_ClearsLinks) {
    EntityLog log(uid_, "account");
    log.append(created());
    log.append(linkEntry(2, ModificationType::LINKED));
    log.append(retired(3));

    EntityRecord record = log.replay();

    EXPECT_TRUE(record.isRetired());
    EXPECT_TRUE(record.links.empty());
}

TEST_F(EntityLogTest, Replay_Empty_Conflicts) {
    EntityLog log(uid_, "account");

    EXPECT_THROW(log.replay(), LogConflictError);
}

TEST_F(EntityLogTest, Restore_RejectsBrokenChain) {
    std::vector<EntityLogEntry> entries{
        created({{"balance", decimalValue("1.00")}}),
        updated(2, "balance", decimalValue("2.00"), decimalValue("3.00"))};

    EXPECT_THROW(EntityLog::restore(uid_, "account", entries), LogConflictError);
}
