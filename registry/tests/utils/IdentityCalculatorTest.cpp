/**
 * @file IdentityCalculatorTest.cpp
 * @brief Unit tests for IdentityCalculator
 */

#include <gtest/gtest.h>
#include "domain/Account.hpp"
#include "domain/Position.hpp"
#include "domain/Transaction.hpp"
#include "domain/errors/RegistryException.hpp"
#include "utils/IdentityCalculator.hpp"

using namespace registry::domain;
using registry::utils::IdentityCalculator;

namespace {

const EntitySchema& priceSchema() {
    static const EntitySchema schema{
        "price",
        {
            {"instrument", FieldType::STRING},
            {"level", FieldType::DECIMAL},
            {"lot", FieldType::INTEGER, false},
            {"adjusted", FieldType::BOOLEAN, false},
        },
        {}};
    return schema;
}

} // namespace

TEST(IdentityCalculatorTest, Digest_IsSha256) {
    EXPECT_EQ(IdentityCalculator::digest("abc").toString(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(IdentityCalculatorTest, Compute_IsDeterministic) {
    FieldMap key{{"name", textValue("Brokerage")}, {"currency", textValue("USD")}};

    auto first = IdentityCalculator::compute(Account::entitySchema(), key);
    auto second = IdentityCalculator::compute(Account::entitySchema(), key);

    EXPECT_EQ(first, second);
    EXPECT_EQ(first.toString().size(), 64u);
}

TEST(IdentityCalculatorTest, Compute_TrailingWhitespaceIgnored) {
    auto plain = IdentityCalculator::compute(Account::entitySchema(),
        {{"name", textValue("Brokerage")}, {"currency", textValue("USD")}});
    auto padded = IdentityCalculator::compute(Account::entitySchema(),
        {{"currency", textValue("USD\t")}, {"name", textValue("Brokerage  ")}});
    auto leading = IdentityCalculator::compute(Account::entitySchema(),
        {{"name", textValue(" Brokerage")}, {"currency", textValue("USD")}});

    EXPECT_EQ(plain, padded);
    EXPECT_NE(plain, leading);
}

TEST(IdentityCalculatorTest, Compute_DecimalRepresentationIgnored) {
    auto text = IdentityCalculator::compute(priceSchema(),
        {{"instrument", textValue("AAPL")}, {"level", decimalValue("100")}});
    auto scaled = IdentityCalculator::compute(priceSchema(),
        {{"instrument", textValue("AAPL")}, {"level", decimalValue("100.000")}});
    auto integer = IdentityCalculator::compute(priceSchema(),
        {{"instrument", textValue("AAPL")}, {"level", integerValue(100)}});
    auto exponent = IdentityCalculator::compute(priceSchema(),
        {{"instrument", textValue("AAPL")}, {"level", decimalValue("1e2")}});

    EXPECT_EQ(text, scaled);
    EXPECT_EQ(text, integer);
    EXPECT_EQ(text, exponent);
}

TEST(IdentityCalculatorTest, Compute_BeyondKeyScale_RoundsHalfDown) {
    auto base = IdentityCalculator::compute(priceSchema(),
        {{"instrument", textValue("AAPL")}, {"level", decimalValue("0.1")}});
    auto tie = IdentityCalculator::compute(priceSchema(),
        {{"instrument", textValue("AAPL")}, {"level", decimalValue("0.1000000005")}});
    auto above = IdentityCalculator::compute(priceSchema(),
        {{"instrument", textValue("AAPL")}, {"level", decimalValue("0.1000000006")}});

    EXPECT_EQ(base, tie);
    EXPECT_NE(base, above);
}

TEST(IdentityCalculatorTest, Compute_KindTagSeparatesIdentities) {
    Uid owner = IdentityCalculator::digest("owner");
    FieldMap key{{"account", uidValue(owner)}, {"instrument", textValue("AAPL")}};

    auto position = IdentityCalculator::compute(Position::entitySchema(), key);
    EntitySchema renamed = Position::entitySchema();
    renamed.kind = "holding";

    EXPECT_NE(position, IdentityCalculator::compute(renamed, key));
}

TEST(IdentityCalculatorTest, Compute_UidAcceptsHexString) {
    Uid owner = IdentityCalculator::digest("owner");

    auto fromUid = IdentityCalculator::compute(Position::entitySchema(),
        {{"account", uidValue(owner)}, {"instrument", textValue("AAPL")}});
    auto fromText = IdentityCalculator::compute(Position::entitySchema(),
        {{"account", textValue(owner.toString())}, {"instrument", textValue("AAPL")}});

    EXPECT_EQ(fromUid, fromText);
    EXPECT_THROW(IdentityCalculator::compute(Position::entitySchema(),
                     {{"account", textValue("not-a-uid")}, {"instrument", textValue("AAPL")}}),
                 InvalidKeyError);
}

TEST(IdentityCalculatorTest, Compute_OptionalAbsentEqualsNull) {
    Uid owner = IdentityCalculator::digest("owner");
    FieldMap key{
        {"account", uidValue(owner)}, {"type", textValue("buy")}, {"date", textValue("2024-01-02")}};
    FieldMap withNull = key;
    withNull["reference"] = FieldValue{};
    FieldMap withReference = key;
    withReference["reference"] = textValue("T-1");

    auto absent = IdentityCalculator::compute(Transaction::entitySchema(), key);

    EXPECT_EQ(absent, IdentityCalculator::compute(Transaction::entitySchema(), withNull));
    EXPECT_NE(absent, IdentityCalculator::compute(Transaction::entitySchema(), withReference));
}

TEST(IdentityCalculatorTest, Compute_MissingRequired_Throws) {
    EXPECT_THROW(IdentityCalculator::compute(Account::entitySchema(), {{"name", textValue("Brokerage")}}),
                 InvalidKeyError);
    EXPECT_THROW(IdentityCalculator::compute(Account::entitySchema(),
                     {{"name", textValue("Brokerage")}, {"currency", FieldValue{}}}),
                 InvalidKeyError);
}

TEST(IdentityCalculatorTest, Compute_WrongType_Throws) {
    EXPECT_THROW(IdentityCalculator::compute(Account::entitySchema(),
                     {{"name", textValue("Brokerage")}, {"currency", integerValue(840)}}),
                 InvalidKeyError);
    EXPECT_THROW(IdentityCalculator::compute(priceSchema(),
                     {{"instrument", textValue("AAPL")}, {"level", textValue("100")}}),
                 InvalidKeyError);
    EXPECT_THROW(IdentityCalculator::compute(priceSchema(),
                     {{"instrument", textValue("AAPL")}, {"level", integerValue(1)}, {"lot", decimalValue("1")}}),
                 InvalidKeyError);
}

TEST(IdentityCalculatorTest, Compute_UndeclaredField_Throws) {
    EXPECT_THROW(IdentityCalculator::compute(Account::entitySchema(),
                     {{"name", textValue("Brokerage")}, {"currency", textValue("USD")},
                      {"balance", decimalValue("1")}}),
                 InvalidKeyError);
}

TEST(IdentityCalculatorTest, Canonicalize_NormalizesValues) {
    auto canonical = IdentityCalculator::canonicalize(priceSchema(),
        {{"instrument", textValue("AAPL \n")}, {"level", integerValue(7)}, {"adjusted", booleanValue(true)}});

    EXPECT_EQ(std::get<std::string>(canonical.at("instrument")), "AAPL");
    EXPECT_EQ(std::get<Decimal>(canonical.at("level")).toString(), "7.000000000");
    EXPECT_TRUE(std::get<bool>(canonical.at("adjusted")));
    EXPECT_EQ(canonical.count("lot"), 0u);
}

TEST(IdentityCalculatorTest, Encode_LengthPrefixedInNameOrder) {
    auto encoded = IdentityCalculator::encode("account",
        {{"name", textValue("A\x1e" "B")}, {"currency", textValue("USD")}});

    EXPECT_EQ(encoded, std::string("account") + "\x1e" "currency=string\x1f" "3:USD"
                                              + "\x1e" "name=string\x1f" "3:A\x1e" "B");
}
