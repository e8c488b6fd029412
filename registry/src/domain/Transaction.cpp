#include "domain/Transaction.hpp"
#include "domain/enums/TransactionType.hpp"
#include "domain/errors/RegistryException.hpp"

#include <cctype>

namespace registry::domain {

const EntitySchema& Transaction::entitySchema() {
    static const EntitySchema schema{
        KIND,
        {
            {"account", FieldType::UID},
            {"type", FieldType::STRING},
            {"date", FieldType::STRING},
            {"reference", FieldType::STRING, false},
        },
        {
            {"account", FieldType::UID},
            {"type", FieldType::STRING},
            {"date", FieldType::STRING},
            {"reference", FieldType::STRING},
            {"quantity", FieldType::DECIMAL},
            {"consideration", FieldType::DECIMAL},
            {"fees", FieldType::DECIMAL},
        }};
    return schema;
}

void Transaction::validateField(const std::string& field, const FieldValue& value) const {
    if (field == "type") {
        const auto* text = std::get_if<std::string>(&value);
        if (!text || !transactionTypeFromString(*text)) {
            throw ValidationError("transaction.type must be one of buy, sell, dividend, interest, fee, got "
                                      + toDisplayString(value), uid());
        }
    } else if (field == "date") {
        const auto* text = std::get_if<std::string>(&value);
        if (!text || !isCalendarDate(*text)) {
            throw ValidationError("transaction.date must be YYYY-MM-DD, got " + toDisplayString(value), uid());
        }
    } else if (field == "quantity" || field == "fees") {
        requireNonNegative(field, value);
    }
}

void Transaction::validateRecord(const EntityRecord& next) const {
    auto typeField = next.field("type");
    if (!typeField) {
        return;
    }
    auto type = transactionTypeFromString(std::get<std::string>(*typeField));
    if (!type) {
        return;
    }

    auto quantity = next.field("quantity");
    if (!affectsHoldings(*type) && quantity && !std::get<Decimal>(*quantity).isZero()) {
        throw ValidationError("transaction.quantity applies only to buy and sell, got "
                                  + toDisplayString(*quantity) + " for " + toString(*type), uid());
    }

    auto consideration = next.field("consideration");
    if (isIncome(*type) && consideration && std::get<Decimal>(*consideration).isNegative()) {
        throw ValidationError("transaction.consideration of " + toString(*type)
                                  + " must not be negative", uid());
    }
}

bool Transaction::isCalendarDate(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return false;
    }
    for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }

    int year = std::stoi(text.substr(0, 4));
    int month = std::stoi(text.substr(5, 2));
    int day = std::stoi(text.substr(8, 2));
    if (month < 1 || month > 12 || day < 1) {
        return false;
    }

    static const int daysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    int limit = daysInMonth[month - 1] + (month == 2 && leap ? 1 : 0);
    return day <= limit;
}

} // namespace registry::domain
