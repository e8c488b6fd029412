#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

/**
 * @file ThreadSafeMap.hpp
 * @brief Потокобезопасный реестр shared_ptr по ключу
 *
 * Чтения идут под shared_lock, записи под unique_lock.
 * getOrInsert() выполняет check-and-insert атомарно: фабрика вызывается
 * не более одного раза на ключ, все конкурирующие вызовы получают победителя.
 */
template <typename K, typename V, typename Hash = std::hash<K>>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_[key] = value;
    }

    /**
     * @brief Вставить значение, если ключа ещё нет
     * @return true если значение вставлено
     */
    bool insertIfAbsent(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.emplace(key, value).second;
    }

    /**
     * @brief Найти значение или создать его фабрикой
     *
     * Быстрый путь под shared_lock; при промахе повторная проверка под
     * unique_lock и вызов factory(). Если factory() бросает исключение,
     * в карте ничего не остаётся.
     *
     * @return {значение, true если создано этим вызовом}
     */
    template <typename Factory>
    std::pair<std::shared_ptr<V>, bool> getOrInsert(const K &key, Factory &&factory)
    {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = map_.find(key);
            if (it != map_.end()) {
                return {it->second, false};
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end()) {
            return {it->second, false};
        }

        std::shared_ptr<V> created = factory();
        map_.emplace(key, created);
        return {created, true};
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    bool remove(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    void clear()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.clear();
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

    std::vector<K> keys() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<K> result;
        result.reserve(map_.size());
        for (const auto &entry : map_) {
            result.push_back(entry.first);
        }
        return result;
    }

    std::vector<std::shared_ptr<V>> values() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<std::shared_ptr<V>> result;
        result.reserve(map_.size());
        for (const auto &entry : map_) {
            result.push_back(entry.second);
        }
        return result;
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>, Hash> map_;
};
