#include "domain/EntityRecord.hpp"

#include <stdexcept>

namespace registry::domain {

bool EntityRecord::sameState(const EntityRecord& other) const {
    return uid == other.uid
        && kind == other.kind
        && version == other.version
        && decimalScale == other.decimalScale
        && state == other.state
        && links == other.links
        && identical(fields, other.fields);
}

nlohmann::json EntityRecord::toJson() const {
    nlohmann::json j;
    j["uid"] = uid.toString();
    j["kind"] = kind;
    j["version"] = version;
    j["decimalScale"] = decimalScale;
    j["state"] = toString(state);
    j["fields"] = fieldMapToJson(fields);

    nlohmann::json jsonLinks = nlohmann::json::array();
    for (const auto& [target, role] : links) {
        jsonLinks.push_back({{"uid", target.toString()}, {"role", role}});
    }
    j["links"] = jsonLinks;
    return j;
}

EntityRecord EntityRecord::fromJson(const nlohmann::json& j) {
    try {
        EntityRecord record;
        record.uid = Uid::fromString(j.at("uid").get<std::string>());
        record.kind = j.at("kind").get<std::string>();
        record.version = j.at("version").get<uint64_t>();
        record.decimalScale = j.at("decimalScale").get<unsigned>();
        record.state = entityStateFromString(j.at("state").get<std::string>());
        record.fields = fieldMapFromJson(j.at("fields"));

        for (const auto& link : j.value("links", nlohmann::json::array())) {
            record.links[Uid::fromString(link.at("uid").get<std::string>())] =
                link.at("role").get<std::string>();
        }
        return record;
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Malformed entity record: ") + e.what());
    }
}

} // namespace registry::domain
