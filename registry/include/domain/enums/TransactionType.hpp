#pragma once

#include <optional>
#include <string>

namespace registry::domain {

/**
 * @brief Тип транзакции по счёту
 */
enum class TransactionType {
    BUY,
    SELL,
    DIVIDEND,
    INTEREST,
    FEE
};

inline std::string toString(TransactionType type) {
    switch (type) {
        case TransactionType::BUY:      return "buy";
        case TransactionType::SELL:     return "sell";
        case TransactionType::DIVIDEND: return "dividend";
        case TransactionType::INTEREST: return "interest";
        case TransactionType::FEE:      return "fee";
    }
    return "unknown";
}

/**
 * @brief Разобрать тип транзакции
 * @return nullopt если строка не распознана
 */
inline std::optional<TransactionType> transactionTypeFromString(const std::string& str) {
    if (str == "buy")      return TransactionType::BUY;
    if (str == "sell")     return TransactionType::SELL;
    if (str == "dividend") return TransactionType::DIVIDEND;
    if (str == "interest") return TransactionType::INTEREST;
    if (str == "fee")      return TransactionType::FEE;
    return std::nullopt;
}

/**
 * @brief Меняет ли транзакция количество бумаг в позиции
 */
inline bool affectsHoldings(TransactionType type) {
    return type == TransactionType::BUY || type == TransactionType::SELL;
}

/**
 * @brief Доходная транзакция (дивиденды, проценты)
 */
inline bool isIncome(TransactionType type) {
    return type == TransactionType::DIVIDEND || type == TransactionType::INTEREST;
}

} // namespace registry::domain
