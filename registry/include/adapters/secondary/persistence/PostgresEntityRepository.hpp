#pragma once

#include "ports/output/IEntityRepository.hpp"
#include <nlohmann/json.hpp>
#include <pqxx/pqxx>
#include <map>
#include <mutex>
#include <memory>
#include <stdexcept>
#include <iostream>

namespace registry::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища сущностей
 *
 * Таблицы (см. registry/sql/schema.sql):
 * - entities     (uid, kind, record jsonb)
 * - entity_log   (uid, version, entry jsonb)
 * - entity_links (from_uid, to_uid, role)
 *
 * Каждый save() выполняется одной транзакцией.
 */
class PostgresEntityRepository : public ports::output::IEntityRepository {
public:
    /**
     * @brief Конструктор с connection string
     */
    explicit PostgresEntityRepository(const std::string& connectionString)
    {
        std::cout << "[PostgresEntityRepo] Connecting to PostgreSQL..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(connectionString);
            std::cout << "[PostgresEntityRepo] Connected successfully" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresEntityRepo] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresEntityRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    /**
     * @brief Загрузить все сущности
     */
    std::vector<domain::PersistedEntity> loadAll() override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            std::map<domain::Uid, domain::PersistedEntity> entities;

            auto records = txn.exec("SELECT uid, record FROM entities ORDER BY uid");
            for (const auto& row : records) {
                auto uid = domain::Uid::fromString(row["uid"].as<std::string>());
                entities[uid].record = domain::EntityRecord::fromJson(
                    nlohmann::json::parse(row["record"].as<std::string>()));
            }

            auto entries = txn.exec("SELECT uid, entry FROM entity_log ORDER BY uid, version");
            for (const auto& row : entries) {
                auto uid = domain::Uid::fromString(row["uid"].as<std::string>());
                auto it = entities.find(uid);
                if (it == entities.end()) {
                    throw std::runtime_error("log entries for unknown entity " + uid.toString());
                }
                it->second.log.push_back(domain::EntityLogEntry::fromJson(
                    nlohmann::json::parse(row["entry"].as<std::string>())));
            }

            auto links = txn.exec("SELECT from_uid, to_uid FROM entity_links");
            for (const auto& row : links) {
                auto from = domain::Uid::fromString(row["from_uid"].as<std::string>());
                auto to = domain::Uid::fromString(row["to_uid"].as<std::string>());
                auto it = entities.find(to);
                if (it == entities.end()) {
                    throw std::runtime_error("link to unknown entity " + to.toString());
                }
                it->second.dependedBy.insert(from);
            }

            txn.commit();

            std::vector<domain::PersistedEntity> result;
            result.reserve(entities.size());
            for (auto& [uid, persisted] : entities) {
                result.push_back(std::move(persisted));
            }
            std::cout << "[PostgresEntityRepo] Loaded " << result.size() << " entities" << std::endl;
            return result;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresEntityRepo] loadAll() failed: " << e.what() << std::endl;
            throw;
        }
    }

    /**
     * @brief Сохранить изменение одной транзакцией
     */
    void save(const domain::EntityChange& change) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            const std::string uid = change.uid().toString();

            txn.exec_params(
                R"(
                    INSERT INTO entities (uid, kind, record)
                    VALUES ($1, $2, $3::jsonb)
                    ON CONFLICT (uid) DO UPDATE SET
                        record = EXCLUDED.record,
                        updated_at = NOW()
                )",
                uid,
                change.kind(),
                change.record.toJson().dump()
            );

            for (const auto& entry : change.entries) {
                txn.exec_params(
                    R"(
                        INSERT INTO entity_log (uid, version, entry)
                        VALUES ($1, $2, $3::jsonb)
                    )",
                    uid,
                    static_cast<long long>(entry.version),
                    entry.toJson().dump()
                );
            }

            for (const auto& edge : change.edges) {
                if (edge.added) {
                    txn.exec_params(
                        R"(
                            INSERT INTO entity_links (from_uid, to_uid, role)
                            VALUES ($1, $2, $3)
                            ON CONFLICT (from_uid, to_uid) DO UPDATE SET role = EXCLUDED.role
                        )",
                        edge.from.toString(),
                        edge.to.toString(),
                        edge.role
                    );
                } else {
                    txn.exec_params(
                        "DELETE FROM entity_links WHERE from_uid = $1 AND to_uid = $2",
                        edge.from.toString(),
                        edge.to.toString()
                    );
                }
            }

            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresEntityRepo] save() failed for " << change.uid().shortString()
                      << ": " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;
};

} // namespace registry::adapters::secondary
