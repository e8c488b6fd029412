#include "domain/FieldValue.hpp"

#include <stdexcept>

namespace registry::domain {

std::optional<FieldType> fieldTypeOf(const FieldValue& value) {
    switch (value.index()) {
        case 1: return FieldType::BOOLEAN;
        case 2: return FieldType::INTEGER;
        case 3: return FieldType::DECIMAL;
        case 4: return FieldType::STRING;
        case 5: return FieldType::UID;
        default: return std::nullopt;
    }
}

std::string toDisplayString(const FieldValue& value) {
    if (auto b = std::get_if<bool>(&value)) return *b ? "true" : "false";
    if (auto i = std::get_if<int64_t>(&value)) return std::to_string(*i);
    if (auto d = std::get_if<Decimal>(&value)) return d->toString();
    if (auto s = std::get_if<std::string>(&value)) return "\"" + *s + "\"";
    if (auto u = std::get_if<Uid>(&value)) return u->toString();
    return "null";
}

nlohmann::json fieldValueToJson(const FieldValue& value) {
    auto type = fieldTypeOf(value);
    if (!type) {
        return nullptr;
    }

    nlohmann::json j;
    j["type"] = toString(*type);
    switch (*type) {
        case FieldType::BOOLEAN: j["value"] = std::get<bool>(value); break;
        case FieldType::INTEGER: j["value"] = std::get<int64_t>(value); break;
        case FieldType::DECIMAL: j["value"] = std::get<Decimal>(value).toString(); break;
        case FieldType::STRING:  j["value"] = std::get<std::string>(value); break;
        case FieldType::UID:     j["value"] = std::get<Uid>(value).toString(); break;
    }
    return j;
}

FieldValue fieldValueFromJson(const nlohmann::json& j) {
    if (j.is_null()) {
        return FieldValue{};
    }
    if (!j.is_object() || !j.contains("type") || !j.contains("value")) {
        throw std::invalid_argument("Field value must be {type, value}: " + j.dump());
    }

    try {
        switch (fieldTypeFromString(j.at("type").get<std::string>())) {
            case FieldType::BOOLEAN: return booleanValue(j.at("value").get<bool>());
            case FieldType::INTEGER: return integerValue(j.at("value").get<int64_t>());
            case FieldType::DECIMAL: return decimalValue(j.at("value").get<std::string>());
            case FieldType::STRING:  return textValue(j.at("value").get<std::string>());
            case FieldType::UID:     return uidValue(Uid::fromString(j.at("value").get<std::string>()));
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument("Malformed field value " + j.dump() + ": " + e.what());
    }
    throw std::invalid_argument("Malformed field value: " + j.dump());
}

nlohmann::json fieldMapToJson(const FieldMap& fields) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [name, value] : fields) {
        j[name] = fieldValueToJson(value);
    }
    return j;
}

FieldMap fieldMapFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Field map must be a JSON object: " + j.dump());
    }
    FieldMap fields;
    for (auto it = j.begin(); it != j.end(); ++it) {
        fields[it.key()] = fieldValueFromJson(it.value());
    }
    return fields;
}

bool identical(const FieldValue& lhs, const FieldValue& rhs) {
    if (lhs != rhs) {
        return false;
    }
    if (auto l = std::get_if<Decimal>(&lhs)) {
        return l->scale() == std::get<Decimal>(rhs).scale();
    }
    return true;
}

bool identical(const FieldMap& lhs, const FieldMap& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    auto l = lhs.begin();
    auto r = rhs.begin();
    for (; l != lhs.end(); ++l, ++r) {
        if (l->first != r->first || !identical(l->second, r->second)) {
            return false;
        }
    }
    return true;
}

} // namespace registry::domain
