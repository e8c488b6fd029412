#pragma once

#include "domain/Uid.hpp"
#include <optional>
#include <stdexcept>
#include <string>

/**
 * @file RegistryException.hpp
 * @brief Типизированные ошибки реестра сущностей
 *
 * Каждая ошибка несёт ErrorCode и, если применимо, Uid сущности.
 * Ни одна операция не оставляет частичных изменений при ошибке.
 */

namespace registry::domain {

enum class ErrorCode {
    INVALID_KEY,
    VALIDATION,
    RETIRED_ENTITY,
    REFERENTIAL_INTEGRITY,
    SELF_REFERENCE,
    NO_SUCH_LINK,
    LOG_CONFLICT,
    CORRUPT_STATE,
    UNKNOWN_ENTITY
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_KEY:           return "InvalidKey";
        case ErrorCode::VALIDATION:            return "Validation";
        case ErrorCode::RETIRED_ENTITY:        return "RetiredEntity";
        case ErrorCode::REFERENTIAL_INTEGRITY: return "ReferentialIntegrity";
        case ErrorCode::SELF_REFERENCE:        return "SelfReference";
        case ErrorCode::NO_SUCH_LINK:          return "NoSuchLink";
        case ErrorCode::LOG_CONFLICT:          return "LogConflict";
        case ErrorCode::CORRUPT_STATE:         return "CorruptState";
        case ErrorCode::UNKNOWN_ENTITY:        return "UnknownEntity";
    }
    return "Unknown";
}

/**
 * @brief Базовое исключение реестра
 */
class RegistryException : public std::runtime_error {
public:
    RegistryException(ErrorCode code, const std::string& message,
                      std::optional<Uid> uid = std::nullopt)
        : std::runtime_error(toString(code) + ": " + message)
        , code_(code)
        , uid_(uid) {}

    ErrorCode code() const { return code_; }
    const std::optional<Uid>& uid() const { return uid_; }

private:
    ErrorCode code_;
    std::optional<Uid> uid_;
};

/**
 * @brief Некорректный набор ключевых полей (нет обязательного, неверный тип, лишнее поле)
 */
class InvalidKeyError : public RegistryException {
public:
    explicit InvalidKeyError(const std::string& message)
        : RegistryException(ErrorCode::INVALID_KEY, message) {}
};

/**
 * @brief Для вида сущности не зарегистрирована схема
 */
class UnknownKindError : public InvalidKeyError {
public:
    explicit UnknownKindError(const std::string& kind)
        : InvalidKeyError("unknown entity kind '" + kind + "'") {}
};

/**
 * @brief Нарушено доменное правило вида сущности
 */
class ValidationError : public RegistryException {
public:
    ValidationError(const std::string& message, std::optional<Uid> uid = std::nullopt)
        : RegistryException(ErrorCode::VALIDATION, message, uid) {}
};

class RetiredEntityError : public RegistryException {
public:
    explicit RetiredEntityError(const Uid& uid)
        : RegistryException(ErrorCode::RETIRED_ENTITY,
                            "entity " + uid.shortString() + " is retired", uid) {}
};

/**
 * @brief Сущность нельзя вывести: от неё зависят другие
 */
class ReferentialIntegrityError : public RegistryException {
public:
    ReferentialIntegrityError(const Uid& uid, size_t dependents)
        : RegistryException(ErrorCode::REFERENTIAL_INTEGRITY,
                            "entity " + uid.shortString() + " still has "
                                + std::to_string(dependents) + " dependent(s)", uid) {}
};

class SelfReferenceError : public RegistryException {
public:
    explicit SelfReferenceError(const Uid& uid)
        : RegistryException(ErrorCode::SELF_REFERENCE,
                            "entity " + uid.shortString() + " cannot depend on itself", uid) {}
};

class NoSuchLinkError : public RegistryException {
public:
    NoSuchLinkError(const Uid& from, const Uid& to)
        : RegistryException(ErrorCode::NO_SUCH_LINK,
                            "no link " + from.shortString() + " -> " + to.shortString(), from) {}
};

/**
 * @brief Запись журнала не продолжает цепочку
 *
 * Означает потерю синхронизации, сущность дальше использовать нельзя.
 */
class LogConflictError : public RegistryException {
public:
    LogConflictError(const Uid& uid, const std::string& message)
        : RegistryException(ErrorCode::LOG_CONFLICT, message, uid) {}
};

/**
 * @brief Нарушение целостности при гидратации
 */
class CorruptStateError : public RegistryException {
public:
    explicit CorruptStateError(const std::string& message, std::optional<Uid> uid = std::nullopt)
        : RegistryException(ErrorCode::CORRUPT_STATE, message, uid) {}
};

class UnknownEntityError : public RegistryException {
public:
    explicit UnknownEntityError(const Uid& uid)
        : RegistryException(ErrorCode::UNKNOWN_ENTITY,
                            "entity " + uid.shortString() + " is not registered", uid) {}
};

} // namespace registry::domain
