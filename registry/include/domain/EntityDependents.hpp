#pragma once

#include "domain/Uid.hpp"
#include <set>

namespace registry::application {
class EntityStore;
}

namespace registry::domain {

class Entity;

/**
 * @brief Двусторонние связи зависимостей одной сущности
 *
 * Инвариант: B ∈ A.dependsOn ⇔ A ∈ B.dependedBy.
 * Изменяется только парными addEdge/removeEdge, которые доступны
 * Entity и EntityStore; одностороннего мутатора нет.
 */
class EntityDependents {
public:
    const std::set<Uid>& dependsOn() const { return dependsOn_; }
    const std::set<Uid>& dependedBy() const { return dependedBy_; }

    bool dependsOnUid(const Uid& uid) const { return dependsOn_.count(uid) > 0; }

private:
    friend class Entity;
    friend class application::EntityStore;

    /**
     * @brief from начинает зависеть от to
     *
     * from и to могут быть одним объектом (разрешённая ссылка на себя).
     */
    static void addEdge(EntityDependents& from, const Uid& fromUid,
                        EntityDependents& to, const Uid& toUid) {
        from.dependsOn_.insert(toUid);
        to.dependedBy_.insert(fromUid);
    }

    static void removeEdge(EntityDependents& from, const Uid& fromUid,
                           EntityDependents& to, const Uid& toUid) {
        from.dependsOn_.erase(toUid);
        to.dependedBy_.erase(fromUid);
    }

    std::set<Uid> dependsOn_;
    std::set<Uid> dependedBy_;
};

} // namespace registry::domain
