#pragma once

#include "ports/output/IEntityRepository.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <iostream>

namespace registry::adapters::secondary {

/**
 * @brief In-memory реализация хранилища сущностей
 *
 * Хранит последний снимок записи, накопленный журнал и обратные связи
 * по каждому Uid. Используется по умолчанию и в тестах.
 */
class InMemoryEntityRepository : public ports::output::IEntityRepository {
public:
    InMemoryEntityRepository() {
        std::cout << "[InMemoryEntityRepository] Initialized" << std::endl;
    }

    /**
     * @brief Загрузить все сущности
     */
    std::vector<domain::PersistedEntity> loadAll() override {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<domain::PersistedEntity> result;
        result.reserve(entities_.size());
        for (const auto& [uid, stored] : entities_) {
            domain::PersistedEntity persisted;
            persisted.record = stored.record;
            persisted.log = stored.log;
            auto backLinks = backLinks_.find(uid);
            if (backLinks != backLinks_.end()) {
                persisted.dependedBy = backLinks->second;
            }
            result.push_back(std::move(persisted));
        }
        return result;
    }

    /**
     * @brief Сохранить изменение
     *
     * Записи журнала с уже сохранённой версией пропускаются.
     */
    void save(const domain::EntityChange& change) override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto& stored = entities_[change.uid()];
        stored.record = change.record;
        for (const auto& entry : change.entries) {
            if (stored.log.empty() || entry.version > stored.log.back().version) {
                stored.log.push_back(entry);
            }
        }

        for (const auto& edge : change.edges) {
            if (edge.added) {
                backLinks_[edge.to].insert(edge.from);
            } else {
                backLinks_[edge.to].erase(edge.from);
            }
        }
        ++saves_;
    }

    /**
     * @brief Сохранённое состояние одной сущности
     */
    std::optional<domain::PersistedEntity> find(const domain::Uid& uid) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entities_.find(uid);
        if (it == entities_.end()) {
            return std::nullopt;
        }
        domain::PersistedEntity persisted;
        persisted.record = it->second.record;
        persisted.log = it->second.log;
        auto backLinks = backLinks_.find(uid);
        if (backLinks != backLinks_.end()) {
            persisted.dependedBy = backLinks->second;
        }
        return persisted;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entities_.size();
    }

    /// Количество вызовов save()
    size_t saveCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return saves_;
    }

    /**
     * @brief Очистить репозиторий
     */
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entities_.clear();
        backLinks_.clear();
        saves_ = 0;
    }

private:
    struct StoredEntity {
        domain::EntityRecord record;
        std::vector<domain::EntityLogEntry> log;
    };

    mutable std::mutex mutex_;
    std::map<domain::Uid, StoredEntity> entities_;
    std::map<domain::Uid, std::set<domain::Uid>> backLinks_;    // to -> {from}
    size_t saves_ = 0;
};

} // namespace registry::adapters::secondary
