#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/cache.h — Name-indexed type cache
// ═══════════════════════════════════════════════════════════════════
//
//  Owns every concrete type produced by a build and maps each name to
//  its (definition, implementation) pair. A name is inserted once;
//  lookups always hand back the same instance. Builders insert a
//  skeleton before doing any work that could reach the same name
//  again, which is what stops recursive type graphs from looping.
//
//  Not synchronized: a cache belongs to one build at a time.
//
// ═══════════════════════════════════════════════════════════════════

#include "definitions.h"
#include "types.h"
#include <deque>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace gqlpp {

using Definition = std::variant<const TypeDefinition*, const EnumDefinition*,
                                const UnionDefinition*, const ScalarDefinition*>;

struct CacheEntry {
    Definition definition;
    NamedType* implementation = nullptr;
};

class TypeCache {
public:
    TypeCache() = default;

    TypeCache(const TypeCache&) = delete;
    TypeCache& operator=(const TypeCache&) = delete;

    // nullptr when the name is unknown
    const CacheEntry* get(const std::string& name) const;
    bool has(const std::string& name) const { return index_.count(name) != 0; }

    // Typed lookup. nullptr on a miss; InternalConsistencyError when
    // the name is taken by a type of another kind.
    template <typename T>
    T* getAs(const std::string& name) const {
        const CacheEntry* entry = get(name);
        if (!entry) return nullptr;
        auto* typed = dynamic_cast<T*>(entry->implementation);
        if (!typed) {
            throw InternalConsistencyError("Type name '" + name + "' is already used by a " +
                                           gqlpp::toString(entry->implementation->kind()) +
                                           " type");
        }
        return typed;
    }

    // Takes ownership. Throws InternalConsistencyError if the name is
    // already registered or does not match implementation->name().
    NamedType& put(const std::string& name, Definition definition,
                   std::unique_ptr<NamedType> implementation);

    // Wrappers are memoized per inner type.
    const ListType& listOf(const GraphQLType& ofType);
    const NonNullType& nonNullOf(const GraphQLType& ofType);

    // Drops the newest entries until `size` remain, together with every
    // wrapper built over a dropped type. Used to roll back a failed build;
    // `size()` taken before the build is the checkpoint.
    void truncate(std::size_t size);

    // Types registered after the first `size` entries, oldest first.
    std::vector<const NamedType*> typesAfter(std::size_t size) const;

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Registration order
    std::vector<std::string> names() const;

    auto begin() const { return entries_.begin(); }
    auto end() const { return entries_.end(); }

private:
    struct Slot {
        std::string name;
        CacheEntry entry;
        std::unique_ptr<NamedType> owned;
    };

    std::deque<Slot> entries_;
    std::unordered_map<std::string, std::size_t> index_;
    std::unordered_map<const GraphQLType*, std::unique_ptr<ListType>> lists_;
    std::unordered_map<const GraphQLType*, std::unique_ptr<NonNullType>> nonNulls_;

    void dropWrappers(std::unordered_set<const GraphQLType*> dropped);
};

} // namespace gqlpp
