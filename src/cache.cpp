// ═══════════════════════════════════════════════════════════════════
//  src/cache.cpp — Type cache
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/cache.h"
#include "gqlpp/console.h"

namespace gqlpp {

const CacheEntry* TypeCache::get(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].entry;
}

NamedType& TypeCache::put(const std::string& name, Definition definition,
                          std::unique_ptr<NamedType> implementation) {
    if (!implementation) {
        throw InternalConsistencyError("Cannot register '" + name + "' without an implementation");
    }
    if (name.empty() || implementation->name() != name) {
        throw InternalConsistencyError("Cache key '" + name + "' does not match type name '" +
                                       implementation->name() + "'");
    }
    if (has(name)) {
        throw InternalConsistencyError("Type '" + name + "' is already registered");
    }

    NamedType* raw = implementation.get();
    index_.emplace(name, entries_.size());
    entries_.push_back(Slot{name, CacheEntry{definition, raw}, std::move(implementation)});

    console::debug("cache: registered", toString(raw->kind()), name);
    return *raw;
}

const ListType& TypeCache::listOf(const GraphQLType& ofType) {
    auto& slot = lists_[&ofType];
    if (!slot) slot = std::make_unique<ListType>(ofType);
    return *slot;
}

const NonNullType& TypeCache::nonNullOf(const GraphQLType& ofType) {
    if (ofType.kind() == TypeKind::NonNull) {
        throw InternalConsistencyError("Cannot wrap non-null type '" + ofType.toString() +
                                       "' in another non-null");
    }
    auto& slot = nonNulls_[&ofType];
    if (!slot) slot = std::make_unique<NonNullType>(ofType);
    return *slot;
}

void TypeCache::truncate(std::size_t size) {
    std::unordered_set<const GraphQLType*> dropped;
    while (entries_.size() > size) {
        Slot& slot = entries_.back();
        console::debug("cache: dropped", toString(slot.owned->kind()), slot.name);
        dropped.insert(slot.owned.get());
        index_.erase(slot.name);
        entries_.pop_back();
    }
    if (!dropped.empty()) dropWrappers(std::move(dropped));
}

void TypeCache::dropWrappers(std::unordered_set<const GraphQLType*> dropped) {
    // [[T!]] over a dropped T goes too; repeat until nothing new drops.
    bool changed = true;
    while (changed) {
        changed = false;
        for (auto it = lists_.begin(); it != lists_.end();) {
            if (dropped.count(it->first)) {
                dropped.insert(it->second.get());
                it = lists_.erase(it);
                changed = true;
            } else {
                ++it;
            }
        }
        for (auto it = nonNulls_.begin(); it != nonNulls_.end();) {
            if (dropped.count(it->first)) {
                dropped.insert(it->second.get());
                it = nonNulls_.erase(it);
                changed = true;
            } else {
                ++it;
            }
        }
    }
}

std::vector<const NamedType*> TypeCache::typesAfter(std::size_t size) const {
    std::vector<const NamedType*> result;
    for (std::size_t i = size; i < entries_.size(); ++i) {
        result.push_back(entries_[i].owned.get());
    }
    return result;
}

std::vector<std::string> TypeCache::names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& slot : entries_) {
        result.push_back(slot.name);
    }
    return result;
}

} // namespace gqlpp
