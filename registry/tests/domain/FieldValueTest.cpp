/**
 * @file FieldValueTest.cpp
 * @brief Unit tests for FieldValue, EntityRecord and EntityLogEntry serialization
 */

#include <gtest/gtest.h>
#include "domain/EntityChange.hpp"
#include "domain/FieldValue.hpp"
#include "utils/IdentityCalculator.hpp"

using namespace registry::domain;
using registry::utils::IdentityCalculator;

namespace {

Uid uidOf(const std::string& text) {
    return IdentityCalculator::digest(text);
}

} // namespace

// ============================================================================
// FIELD VALUES
// ============================================================================

TEST(FieldValueTest, TypeOf_EachAlternative) {
    EXPECT_EQ(fieldTypeOf(textValue("x")), FieldType::STRING);
    EXPECT_EQ(fieldTypeOf(decimalValue("1.0")), FieldType::DECIMAL);
    EXPECT_EQ(fieldTypeOf(integerValue(5)), FieldType::INTEGER);
    EXPECT_EQ(fieldTypeOf(booleanValue(true)), FieldType::BOOLEAN);
    EXPECT_EQ(fieldTypeOf(uidValue(uidOf("a"))), FieldType::UID);
    EXPECT_FALSE(fieldTypeOf(FieldValue{}).has_value());
}

TEST(FieldValueTest, Json_DecimalKeepsScale) {
    auto json = fieldValueToJson(decimalValue("150.00"));

    EXPECT_EQ(json["type"], "decimal");
    EXPECT_EQ(json["value"], "150.00");

    auto restored = fieldValueFromJson(json);
    EXPECT_TRUE(identical(restored, decimalValue("150.00")));
    EXPECT_FALSE(identical(restored, decimalValue("150.0")));
}

TEST(FieldValueTest, Json_NullAndUid) {
    EXPECT_TRUE(fieldValueToJson(FieldValue{}).is_null());
    EXPECT_TRUE(isNull(fieldValueFromJson(nullptr)));

    Uid uid = uidOf("account");
    auto restored = fieldValueFromJson(fieldValueToJson(uidValue(uid)));
    EXPECT_EQ(std::get<Uid>(restored), uid);
}

TEST(FieldValueTest, Json_Malformed_Throws) {
    EXPECT_THROW(fieldValueFromJson(nlohmann::json{{"type", "decimal"}}), std::invalid_argument);
    EXPECT_THROW(fieldValueFromJson(nlohmann::json{{"type", "money"}, {"value", "1"}}), std::invalid_argument);
    EXPECT_THROW(fieldValueFromJson(nlohmann::json{{"type", "integer"}, {"value", "one"}}), std::invalid_argument);
    EXPECT_THROW(fieldValueFromJson(nlohmann::json{{"type", "uid"}, {"value", "zz"}}), std::invalid_argument);
}

TEST(FieldValueTest, DisplayString_QuotesText) {
    EXPECT_EQ(toDisplayString(textValue("USD")), "\"USD\"");
    EXPECT_EQ(toDisplayString(booleanValue(false)), "false");
    EXPECT_EQ(toDisplayString(FieldValue{}), "null");
}

// ============================================================================
// RECORDS AND LOG ENTRIES
// ============================================================================

TEST(FieldValueTest, RecordJson_PreservesState) {
    EntityRecord record(uidOf("t1"), "transaction", 4);
    record.version = 3;
    record.fields["type"] = textValue("buy");
    record.fields["quantity"] = decimalValue("10.0000");
    record.links[uidOf("a1")] = "account";

    auto restored = EntityRecord::fromJson(nlohmann::json::parse(record.toJson().dump()));

    EXPECT_TRUE(restored.sameState(record));
    EXPECT_EQ(restored.links.at(uidOf("a1")), "account");
}

TEST(FieldValueTest, RecordJson_MissingFields_Throws) {
    EXPECT_THROW(EntityRecord::fromJson(nlohmann::json{{"kind", "account"}}), std::invalid_argument);
}

TEST(FieldValueTest, LogEntryJson_Updated) {
    EntityLogEntry entry;
    entry.version = 2;
    entry.what = ModificationType::UPDATED;
    entry.timestamp = Timestamp::fromString("2024-03-01T10:15:30.250Z");
    entry.actor = "importer";
    entry.reason = "daily sync";
    entry.field = "balance";
    entry.oldValue = decimalValue("100.00");
    entry.newValue = decimalValue("150.00");

    auto restored = EntityLogEntry::fromJson(entry.toJson());

    EXPECT_EQ(restored.version, 2u);
    EXPECT_EQ(restored.what, ModificationType::UPDATED);
    EXPECT_EQ(restored.timestamp.toString(), "2024-03-01T10:15:30.250Z");
    EXPECT_EQ(restored.actor, "importer");
    EXPECT_EQ(restored.reason, "daily sync");
    EXPECT_EQ(restored.field, "balance");
    EXPECT_TRUE(identical(restored.oldValue, entry.oldValue));
    EXPECT_TRUE(identical(restored.newValue, entry.newValue));
}

TEST(FieldValueTest, LogEntryJson_Linked) {
    EntityLogEntry entry;
    entry.version = 4;
    entry.what = ModificationType::LINKED;
    entry.target = uidOf("a1");
    entry.role = "account";

    auto restored = EntityLogEntry::fromJson(entry.toJson());

    ASSERT_TRUE(restored.target.has_value());
    EXPECT_EQ(*restored.target, uidOf("a1"));
    EXPECT_EQ(restored.role, "account");
}

TEST(FieldValueTest, PersistedEntityJson_KeepsBackLinks) {
    PersistedEntity persisted;
    persisted.record = EntityRecord(uidOf("a1"), "account", 2);
    persisted.dependedBy = {uidOf("t1"), uidOf("t2")};

    auto restored = PersistedEntity::fromJson(persisted.toJson());

    EXPECT_EQ(restored.dependedBy, persisted.dependedBy);
    EXPECT_TRUE(restored.log.empty());
}
