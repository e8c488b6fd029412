#include "domain/Account.hpp"
#include "domain/errors/RegistryException.hpp"

#include <cctype>

namespace registry::domain {

const EntitySchema& Account::entitySchema() {
    static const EntitySchema schema{
        KIND,
        {
            {"name", FieldType::STRING},
            {"currency", FieldType::STRING},
        },
        {
            {"name", FieldType::STRING},
            {"currency", FieldType::STRING},
            {"balance", FieldType::DECIMAL},
            {"description", FieldType::STRING},
        }};
    return schema;
}

void Account::validateField(const std::string& field, const FieldValue& value) const {
    if (field == "name") {
        requireNonEmpty(field, value);
    } else if (field == "currency") {
        const auto* code = std::get_if<std::string>(&value);
        bool valid = code && code->size() == 3;
        for (size_t i = 0; valid && i < code->size(); ++i) {
            valid = std::isupper(static_cast<unsigned char>((*code)[i])) != 0;
        }
        if (!valid) {
            throw ValidationError("account.currency must be a 3-letter uppercase code, got "
                                      + toDisplayString(value), uid());
        }
    }
}

} // namespace registry::domain
