#include "domain/EntityLog.hpp"
#include "domain/errors/RegistryException.hpp"

namespace registry::domain {

EntityLog::EntityLog(const Uid& uid, const std::string& kind)
    : uid_(uid), kind_(kind), projection_(uid, kind, 0) {}

EntityLog EntityLog::restore(const Uid& uid, const std::string& kind,
                             const std::vector<EntityLogEntry>& entries) {
    EntityLog log(uid, kind);
    for (const auto& entry : entries) {
        log.append(entry);
    }
    return log;
}

void EntityLog::check(const EntityLogEntry& entry) const {
    if (entries_.empty()) {
        if (entry.what != ModificationType::CREATED) {
            throw LogConflictError(uid_, "first log entry must be CREATED, got " + toString(entry.what));
        }
        if (entry.version != 1) {
            throw LogConflictError(uid_, "CREATED entry must have version 1, got "
                                             + std::to_string(entry.version));
        }
        return;
    }

    if (projection_.isRetired()) {
        throw RetiredEntityError(uid_);
    }
    if (entry.what == ModificationType::CREATED) {
        throw LogConflictError(uid_, "CREATED entry after version " + std::to_string(lastVersion()));
    }
    if (entry.version != lastVersion() + 1) {
        throw LogConflictError(uid_, "expected version " + std::to_string(lastVersion() + 1)
                                         + ", got " + std::to_string(entry.version));
    }

    switch (entry.what) {
        case ModificationType::UPDATED: {
            FieldValue current = projection_.field(entry.field).value_or(FieldValue{});
            if (!identical(current, entry.oldValue)) {
                throw LogConflictError(uid_, "field '" + entry.field + "' is "
                                                 + toDisplayString(current) + ", entry expects "
                                                 + toDisplayString(entry.oldValue));
            }
            break;
        }
        case ModificationType::LINKED:
            if (!entry.target) {
                throw LogConflictError(uid_, "LINKED entry without target");
            }
            if (projection_.links.count(*entry.target)) {
                throw LogConflictError(uid_, "link to " + entry.target->shortString() + " already exists");
            }
            break;
        case ModificationType::UNLINKED:
            if (!entry.target || !projection_.links.count(*entry.target)) {
                throw LogConflictError(uid_, "UNLINKED entry for a link that does not exist");
            }
            break;
        case ModificationType::CREATED:
        case ModificationType::RETIRED:
            break;
    }
}

void EntityLog::append(const EntityLogEntry& entry) {
    check(entry);
    apply(projection_, entry);
    entries_.push_back(entry);
}

EntityRecord EntityLog::replay() const {
    if (entries_.empty()) {
        throw LogConflictError(uid_, "cannot replay an empty log");
    }

    EntityRecord record(uid_, kind_, 0);
    for (const auto& entry : entries_) {
        apply(record, entry);
    }
    return record;
}

void EntityLog::apply(EntityRecord& record, const EntityLogEntry& entry) {
    switch (entry.what) {
        case ModificationType::CREATED:
            record.decimalScale = entry.decimalScale;
            record.state = EntityState::ACTIVE;
            record.fields = entry.initialFields;
            record.links.clear();
            break;
        case ModificationType::UPDATED:
            if (isNull(entry.newValue)) {
                record.fields.erase(entry.field);
            } else {
                record.fields[entry.field] = entry.newValue;
            }
            break;
        case ModificationType::LINKED:
            record.links[*entry.target] = entry.role;
            break;
        case ModificationType::UNLINKED:
            record.links.erase(*entry.target);
            break;
        case ModificationType::RETIRED:
            record.state = EntityState::RETIRED;
            record.links.clear();
            break;
    }
    record.version = entry.version;
}

} // namespace registry::domain
