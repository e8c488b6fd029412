#include "domain/EntityLogEntry.hpp"

#include <stdexcept>

namespace registry::domain {

nlohmann::json EntityLogEntry::toJson() const {
    nlohmann::json j;
    j["version"] = version;
    j["what"] = toString(what);
    j["timestamp"] = timestamp.toString();
    j["actor"] = actor;
    j["reason"] = reason;

    switch (what) {
        case ModificationType::CREATED:
            j["initialFields"] = fieldMapToJson(initialFields);
            j["decimalScale"] = decimalScale;
            break;
        case ModificationType::UPDATED:
            j["field"] = field;
            j["oldValue"] = fieldValueToJson(oldValue);
            j["newValue"] = fieldValueToJson(newValue);
            break;
        case ModificationType::LINKED:
        case ModificationType::UNLINKED:
            j["target"] = target ? target->toString() : std::string();
            j["role"] = role;
            break;
        case ModificationType::RETIRED:
            break;
    }
    return j;
}

EntityLogEntry EntityLogEntry::fromJson(const nlohmann::json& j) {
    try {
        EntityLogEntry entry;
        entry.version = j.at("version").get<uint64_t>();
        entry.what = modificationTypeFromString(j.at("what").get<std::string>());
        entry.timestamp = Timestamp::fromString(j.at("timestamp").get<std::string>());
        entry.actor = j.value("actor", "");
        entry.reason = j.value("reason", "");

        switch (entry.what) {
            case ModificationType::CREATED:
                entry.initialFields = fieldMapFromJson(j.at("initialFields"));
                entry.decimalScale = j.at("decimalScale").get<unsigned>();
                break;
            case ModificationType::UPDATED:
                entry.field = j.at("field").get<std::string>();
                entry.oldValue = fieldValueFromJson(j.at("oldValue"));
                entry.newValue = fieldValueFromJson(j.at("newValue"));
                break;
            case ModificationType::LINKED:
            case ModificationType::UNLINKED:
                entry.target = Uid::fromString(j.at("target").get<std::string>());
                entry.role = j.value("role", "");
                break;
            case ModificationType::RETIRED:
                break;
        }
        return entry;
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Malformed log entry: ") + e.what());
    }
}

} // namespace registry::domain
