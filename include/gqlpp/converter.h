#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/converter.h — Definition graph -> concrete schema types
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto cache = std::make_shared<TypeCache>();
//    Converter converter(cache);
//    const GraphQLType& t = converter.getGraphQLType(TypeRef::named(point));
//    converter.finalize();   // populate every deferred field map
//
//  The convert:: functions are the individual builders; each takes the
//  BuildContext explicitly. Converter bundles a cache and a context and
//  runs every entry point as a transaction: a call that throws leaves
//  the cache as it found it.
//
// ═══════════════════════════════════════════════════════════════════

#include "cache.h"
#include "context.h"
#include "definitions.h"
#include "types.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gqlpp {

namespace convert {

// ── Type dispatcher ──

// Resolves a reference with its modifiers: NonNull unless Optional.
const GraphQLType& resolveType(BuildContext& ctx, const TypeRef& ref);

// Resolves without the outer NonNull: named types, unions, lists.
const GraphQLType& resolveNamedType(BuildContext& ctx, const TypeRef& ref);

// ── Modifier composer ──
struct Modifiers {
    bool list = false;
    bool optional = false;
};

// List first, then NonNull unless optional.
const GraphQLType& applyModifiers(TypeCache& cache, const GraphQLType& inner, Modifiers modifiers);

// ── Builders ──
const ObjectType& fromObjectType(BuildContext& ctx, const TypeDefinition& definition);
const InterfaceType& fromInterface(BuildContext& ctx, const TypeDefinition& definition);
const InputObjectType& fromInputObjectType(BuildContext& ctx, const TypeDefinition& definition);
const EnumType& fromEnum(BuildContext& ctx, const EnumDefinition& definition);
const ScalarType& fromScalar(BuildContext& ctx, const ScalarMarker& marker);
const UnionType& fromUnion(BuildContext& ctx, const UnionDefinition& definition);

// Default union type resolver: matches a value's dynamic type against
// each member's TypeDefinition::origin.
TypeResolver defaultTypeResolver(const UnionDefinition& definition, const TypeCache& cache);

// ── Fields, arguments, directives ──
Field fromField(BuildContext& ctx, const FieldDefinition& definition);
InputField fromInputField(BuildContext& ctx, const FieldDefinition& definition);
Argument fromArgument(BuildContext& ctx, const ArgumentDefinition& definition);
ArgumentMap fromArguments(BuildContext& ctx, const std::vector<ArgumentDefinition>& arguments,
                          const std::string& owner);
std::optional<JsonValue> fromDefaultValue(const DefaultValue& value);
Directive fromDirective(BuildContext& ctx, const DirectiveDefinition& definition);

} // namespace convert

// ═══════════════════════════════════════════
//  class Converter
//  Owns a build context over a (possibly shared) cache.
// ═══════════════════════════════════════════
class Converter {
public:
    explicit Converter(std::shared_ptr<TypeCache> cache = nullptr, ConverterOptions options = {});

    Converter(const Converter&) = delete;
    Converter& operator=(const Converter&) = delete;

    const GraphQLType& getGraphQLType(const TypeRef& ref) {
        return context_->transaction(
            [&]() -> const GraphQLType& { return convert::resolveType(*context_, ref); });
    }
    const ObjectType& fromObjectType(const TypeDefinition& definition) {
        return context_->transaction(
            [&]() -> const ObjectType& { return convert::fromObjectType(*context_, definition); });
    }
    const InterfaceType& fromInterface(const TypeDefinition& definition) {
        return context_->transaction(
            [&]() -> const InterfaceType& { return convert::fromInterface(*context_, definition); });
    }
    const InputObjectType& fromInputObjectType(const TypeDefinition& definition) {
        return context_->transaction(
            [&]() -> const InputObjectType& { return convert::fromInputObjectType(*context_, definition); });
    }
    const EnumType& fromEnum(const EnumDefinition& definition) {
        return context_->transaction(
            [&]() -> const EnumType& { return convert::fromEnum(*context_, definition); });
    }
    const ScalarType& fromScalar(const ScalarMarker& marker) {
        return context_->transaction(
            [&]() -> const ScalarType& { return convert::fromScalar(*context_, marker); });
    }
    const UnionType& fromUnion(const UnionDefinition& definition) {
        return context_->transaction(
            [&]() -> const UnionType& { return convert::fromUnion(*context_, definition); });
    }
    Directive fromDirective(const DirectiveDefinition& definition) {
        return context_->transaction([&] { return convert::fromDirective(*context_, definition); });
    }

    // Phase 2: populate every deferred field map reached so far.
    std::size_t finalize();

    TypeCache& typeMap() { return *cache_; }
    const TypeCache& typeMap() const { return *cache_; }
    std::shared_ptr<TypeCache> sharedTypeMap() const { return cache_; }
    BuildContext& context() { return *context_; }

private:
    std::shared_ptr<TypeCache> cache_;
    // Declared after cache_: destroyed first, detaching pending skeletons.
    std::unique_ptr<BuildContext> context_;
};

} // namespace gqlpp
