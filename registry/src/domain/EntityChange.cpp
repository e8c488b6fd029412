#include "domain/EntityChange.hpp"

#include <stdexcept>

namespace registry::domain {

nlohmann::json PersistedEntity::toJson() const {
    nlohmann::json j;
    j["record"] = record.toJson();

    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : log) {
        entries.push_back(entry.toJson());
    }
    j["log"] = entries;

    nlohmann::json backLinks = nlohmann::json::array();
    for (const auto& uid : dependedBy) {
        backLinks.push_back(uid.toString());
    }
    j["dependedBy"] = backLinks;
    return j;
}

PersistedEntity PersistedEntity::fromJson(const nlohmann::json& j) {
    try {
        PersistedEntity persisted;
        persisted.record = EntityRecord::fromJson(j.at("record"));
        for (const auto& entry : j.at("log")) {
            persisted.log.push_back(EntityLogEntry::fromJson(entry));
        }
        for (const auto& uid : j.value("dependedBy", nlohmann::json::array())) {
            persisted.dependedBy.insert(Uid::fromString(uid.get<std::string>()));
        }
        return persisted;
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Malformed persisted entity: ") + e.what());
    }
}

} // namespace registry::domain
