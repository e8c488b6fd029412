#pragma once

#include <string>
#include <stdexcept>

namespace registry::domain {

/**
 * @brief Состояние сущности
 *
 * ACTIVE -> RETIRED, обратного перехода нет.
 */
enum class EntityState {
    ACTIVE,
    RETIRED
};

inline std::string toString(EntityState state) {
    switch (state) {
        case EntityState::ACTIVE:  return "ACTIVE";
        case EntityState::RETIRED: return "RETIRED";
    }
    return "UNKNOWN";
}

inline EntityState entityStateFromString(const std::string& str) {
    if (str == "ACTIVE")  return EntityState::ACTIVE;
    if (str == "RETIRED") return EntityState::RETIRED;
    throw std::invalid_argument("Unknown EntityState: " + str);
}

} // namespace registry::domain
