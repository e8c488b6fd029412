#include "utils/IdentityCalculator.hpp"
#include "domain/errors/RegistryException.hpp"

#include <openssl/sha.h>

namespace registry::utils {

using domain::FieldMap;
using domain::FieldType;
using domain::FieldValue;
using domain::InvalidKeyError;

namespace {

constexpr char RECORD_SEPARATOR = '\x1e';
constexpr char UNIT_SEPARATOR = '\x1f';

std::string rstrip(const std::string& text) {
    auto end = text.find_last_not_of(" \t\r\n\f\v");
    return end == std::string::npos ? std::string() : text.substr(0, end + 1);
}

} // namespace

domain::Uid IdentityCalculator::compute(const domain::EntitySchema& schema, const FieldMap& keyFields) {
    return digest(encode(schema.kind, canonicalize(schema, keyFields)));
}

FieldMap IdentityCalculator::canonicalize(const domain::EntitySchema& schema, const FieldMap& keyFields) {
    for (const auto& [name, value] : keyFields) {
        if (!schema.isKeyField(name)) {
            throw InvalidKeyError("field '" + name + "' is not a key field of " + schema.kind);
        }
    }

    FieldMap canonical;
    for (const auto& spec : schema.keyFields) {
        auto it = keyFields.find(spec.name);
        if (it == keyFields.end() || domain::isNull(it->second)) {
            if (spec.required) {
                throw InvalidKeyError("missing required key field '" + spec.name + "' of " + schema.kind);
            }
            continue;
        }
        canonical[spec.name] = canonicalValue(spec, it->second);
    }
    return canonical;
}

FieldValue IdentityCalculator::canonicalValue(const domain::KeyFieldSpec& spec, const FieldValue& value) {
    switch (spec.type) {
        case FieldType::STRING:
            if (const auto* text = std::get_if<std::string>(&value)) {
                return domain::textValue(rstrip(*text));
            }
            break;
        case FieldType::DECIMAL:
            if (const auto* number = std::get_if<domain::Decimal>(&value)) {
                return number->rescaled(KEY_SCALE);
            }
            if (const auto* integer = std::get_if<int64_t>(&value)) {
                return domain::Decimal::fromInteger(*integer).rescaled(KEY_SCALE);
            }
            break;
        case FieldType::INTEGER:
            if (std::holds_alternative<int64_t>(value)) {
                return value;
            }
            break;
        case FieldType::BOOLEAN:
            if (std::holds_alternative<bool>(value)) {
                return value;
            }
            break;
        case FieldType::UID:
            if (std::holds_alternative<domain::Uid>(value)) {
                return value;
            }
            if (const auto* text = std::get_if<std::string>(&value)) {
                try {
                    return domain::uidValue(domain::Uid::fromString(*text));
                } catch (const std::invalid_argument& e) {
                    throw InvalidKeyError("key field '" + spec.name + "': " + e.what());
                }
            }
            break;
    }

    auto actual = domain::fieldTypeOf(value);
    throw InvalidKeyError("key field '" + spec.name + "' expects " + domain::toString(spec.type)
                          + ", got " + domain::toString(*actual));
}

std::string IdentityCalculator::encode(const std::string& kind, const FieldMap& canonical) {
    std::string out = kind;
    for (const auto& [name, value] : canonical) {
        std::string encoded = encodeValue(value);
        out += RECORD_SEPARATOR;
        out += name;
        out += '=';
        out += domain::toString(*domain::fieldTypeOf(value));
        out += UNIT_SEPARATOR;
        out += std::to_string(encoded.size());
        out += ':';
        out += encoded;
    }
    return out;
}

std::string IdentityCalculator::encodeValue(const FieldValue& value) {
    if (const auto* flag = std::get_if<bool>(&value)) {
        return *flag ? "true" : "false";
    }
    if (const auto* integer = std::get_if<int64_t>(&value)) {
        return std::to_string(*integer);
    }
    if (const auto* number = std::get_if<domain::Decimal>(&value)) {
        return number->toString();
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    return std::get<domain::Uid>(value).toString();
}

domain::Uid IdentityCalculator::digest(const std::string& data) {
    domain::Uid::Bytes bytes{};
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), bytes.data());
    return domain::Uid(bytes);
}

} // namespace registry::utils
