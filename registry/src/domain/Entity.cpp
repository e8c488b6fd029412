#include "domain/Entity.hpp"
#include "domain/errors/RegistryException.hpp"

#include <algorithm>

namespace registry::domain {

Entity::Entity(EntityRecord record, EntityLog log)
    : uid_(record.uid)
    , kind_(record.kind)
    , record_(std::move(record))
    , log_(std::move(log))
    , defaultActor_("system") {}

EntityState Entity::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_.state;
}

bool Entity::isRetired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_.isRetired();
}

std::optional<FieldValue> Entity::get(const std::string& field) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_.field(field);
}

EntityRecord Entity::record() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_;
}

std::vector<EntityLogEntry> Entity::logEntries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_.entries();
}

size_t Entity::logSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_.size();
}

EntityRecord Entity::replay() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_.replay();
}

std::set<Uid> Entity::dependsOn() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dependents_.dependsOn();
}

std::set<Uid> Entity::dependedBy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dependents_.dependedBy();
}

void Entity::mutate(const std::string& field, const FieldValue& value, const AuditContext& context) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureActive();

    if (schema().isKeyField(field)) {
        throw ValidationError("key field '" + field + "' of " + kind_ + " is immutable", uid_);
    }
    FieldValue normalized = normalize(field, value);
    validateField(field, normalized);

    EntityLogEntry entry = makeEntry(ModificationType::UPDATED, context);
    entry.field = field;
    entry.oldValue = record_.field(field).value_or(FieldValue{});
    entry.newValue = normalized;
    log_.check(entry);

    EntityRecord next = record_;
    EntityLog::apply(next, entry);
    validateRecord(next);
    commit(std::move(next), entry, {});
}

void Entity::link(Entity& other, const std::string& role, const AuditContext& context) {
    if (other.uid_ == uid_ && !allowsSelfReference()) {
        throw SelfReferenceError(uid_);
    }
    auto locks = lockInOrder({this, &other});
    linkLocked(other, role, context);
}

void Entity::unlink(Entity& other, const AuditContext& context) {
    auto locks = lockInOrder({this, &other});
    unlinkLocked(other, context);
}

void Entity::validateField(const std::string&, const FieldValue&) const {}

void Entity::validateRecord(const EntityRecord&) const {}

void Entity::requireNonEmpty(const std::string& field, const FieldValue& value) const {
    if (const auto* text = std::get_if<std::string>(&value)) {
        if (text->find_first_not_of(" \t\r\n") == std::string::npos) {
            throw ValidationError(kind_ + "." + field + " must not be empty", uid_);
        }
    }
}

void Entity::requireNonNegative(const std::string& field, const FieldValue& value) const {
    if (const auto* number = std::get_if<Decimal>(&value)) {
        if (number->isNegative()) {
            throw ValidationError(kind_ + "." + field + " must not be negative, got "
                                      + number->toString(), uid_);
        }
    }
}

Entity::Locks Entity::lockInOrder(std::vector<Entity*> entities) {
    std::sort(entities.begin(), entities.end(), [](const Entity* lhs, const Entity* rhs) {
        return lhs->uid_ < rhs->uid_;
    });
    entities.erase(std::unique(entities.begin(), entities.end()), entities.end());

    Locks locks;
    locks.reserve(entities.size());
    for (Entity* entity : entities) {
        locks.emplace_back(entity->mutex_);
    }
    return locks;
}

void Entity::ensureActive() const {
    if (record_.isRetired()) {
        throw RetiredEntityError(uid_);
    }
}

FieldValue Entity::normalize(const std::string& field, const FieldValue& value) const {
    auto declared = schema().fieldType(field);
    if (!declared) {
        throw ValidationError("unknown field '" + field + "' for kind " + kind_, uid_);
    }
    if (isNull(value)) {
        return value;
    }

    if (*declared == FieldType::DECIMAL) {
        if (const auto* number = std::get_if<Decimal>(&value)) {
            return number->rescaled(record_.decimalScale);
        }
        if (const auto* integer = std::get_if<int64_t>(&value)) {
            return Decimal::fromInteger(*integer).rescaled(record_.decimalScale);
        }
    } else if (fieldTypeOf(value) == declared) {
        return value;
    }

    auto actual = fieldTypeOf(value);
    throw ValidationError("field '" + field + "' of " + kind_ + " expects " + toString(*declared)
                              + ", got " + (actual ? toString(*actual) : std::string("null")),
                          uid_);
}

void Entity::initialize(const FieldMap& keyFields, const FieldMap& initial,
                        const AuditContext& context) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!log_.empty()) {
        throw LogConflictError(uid_, "entity is already initialized");
    }

    FieldMap fields = keyFields;
    for (const auto& [name, value] : initial) {
        if (schema().isKeyField(name)) {
            throw ValidationError("key field '" + name + "' must be passed as part of the key", uid_);
        }
        FieldValue normalized = normalize(name, value);
        if (!isNull(normalized)) {
            fields[name] = std::move(normalized);
        }
    }
    for (const auto& [name, value] : fields) {
        validateField(name, value);
    }

    EntityLogEntry entry = makeEntry(ModificationType::CREATED, context);
    entry.initialFields = std::move(fields);
    entry.decimalScale = record_.decimalScale;
    log_.check(entry);

    EntityRecord next = record_;
    EntityLog::apply(next, entry);
    validateRecord(next);
    commit(std::move(next), entry, {});
}

EntityLogEntry Entity::makeEntry(ModificationType what, const AuditContext& context) const {
    EntityLogEntry entry;
    entry.version = log_.lastVersion() + 1;
    entry.what = what;
    entry.timestamp = Timestamp::now();
    entry.actor = context.actor.empty() ? defaultActor_ : context.actor;
    entry.reason = context.reason;
    return entry;
}

void Entity::commit(EntityRecord next, const EntityLogEntry& entry, const std::vector<EdgeDelta>& edges) {
    if (sink_) {
        EntityChange change;
        change.record = next;
        change.entries.push_back(entry);
        change.edges = edges;
        sink_(change);
    }
    log_.append(entry);
    record_ = std::move(next);
}

void Entity::linkLocked(Entity& other, const std::string& role, const AuditContext& context) {
    ensureActive();
    other.ensureActive();
    if (dependents_.dependsOnUid(other.uid_)) {
        throw ValidationError(kind_ + " " + uid_.shortString() + " already depends on "
                                  + other.uid_.shortString(), uid_);
    }

    EntityLogEntry entry = makeEntry(ModificationType::LINKED, context);
    entry.target = other.uid_;
    entry.role = role;
    log_.check(entry);

    EntityRecord next = record_;
    EntityLog::apply(next, entry);
    commit(std::move(next), entry, {EdgeDelta{uid_, other.uid_, role, true}});
    EntityDependents::addEdge(dependents_, uid_, other.dependents_, other.uid_);
}

void Entity::unlinkLocked(Entity& other, const AuditContext& context) {
    ensureActive();
    if (!dependents_.dependsOnUid(other.uid_)) {
        throw NoSuchLinkError(uid_, other.uid_);
    }

    EntityLogEntry entry = makeEntry(ModificationType::UNLINKED, context);
    entry.target = other.uid_;
    auto link = record_.links.find(other.uid_);
    if (link != record_.links.end()) {
        entry.role = link->second;
    }
    log_.check(entry);

    EntityRecord next = record_;
    EntityLog::apply(next, entry);
    commit(std::move(next), entry, {EdgeDelta{uid_, other.uid_, entry.role, false}});
    EntityDependents::removeEdge(dependents_, uid_, other.dependents_, other.uid_);
}

void Entity::retireLocked(const std::vector<Entity*>& dependencies, const AuditContext& context) {
    ensureActive();

    EntityLogEntry entry = makeEntry(ModificationType::RETIRED, context);
    log_.check(entry);

    std::vector<EdgeDelta> edges;
    for (const auto& [target, role] : record_.links) {
        edges.push_back(EdgeDelta{uid_, target, role, false});
    }

    EntityRecord next = record_;
    EntityLog::apply(next, entry);
    commit(std::move(next), entry, edges);

    for (Entity* dependency : dependencies) {
        EntityDependents::removeEdge(dependents_, uid_, dependency->dependents_, dependency->uid_);
    }
}

} // namespace registry::domain
