// ═══════════════════════════════════════════════════════════════════
//  src/union.cpp — Union builder and the default type resolver
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/converter.h"

#include <typeindex>

namespace gqlpp::convert {

namespace {

const TypeRef& stripOptional(const TypeRef& ref) {
    const TypeRef* current = &ref;
    while (current->isOptional()) current = &current->child();
    return *current;
}

} // namespace

TypeResolver defaultTypeResolver(const UnionDefinition& definition, const TypeCache& cache) {
    const UnionDefinition* union_ = &definition;
    const TypeCache* types = &cache;

    return [union_, types](const std::any& value, const ResolveInfo& info) -> const ObjectType& {
        if (value.has_value()) {
            std::type_index actual(value.type());
            for (const auto& ref : union_->types) {
                const TypeRef& member = stripOptional(ref);
                if (member.kind() != TypeRef::Kind::Object) continue;

                const TypeDefinition& object = member.typeDefinition();
                if (!object.origin || *object.origin != actual) continue;
                if (const auto* type = types->getAs<const ObjectType>(object.name)) {
                    return *type;
                }
            }
        }
        throw WrongReturnTypeForUnion(info.fieldName,
                                      value.has_value() ? "<unknown>" : "null");
    };
}

const UnionType& fromUnion(BuildContext& ctx, const UnionDefinition& definition) {
    if (definition.name.empty()) {
        throw InternalConsistencyError("Union definition has no name");
    }

    // Don't rebuild known types
    if (auto* existing = ctx.cache().getAs<UnionType>(definition.name)) {
        return *existing;
    }

    std::vector<const ObjectType*> members;
    members.reserve(definition.types.size());
    for (const auto& ref : definition.types) {
        // A nested union is never an object; reject it before resolving,
        // a union listing itself would otherwise recurse forever.
        if (stripOptional(ref).kind() == TypeRef::Kind::Union) {
            throw UnallowedReturnTypeForUnion(definition.name, ref.describe());
        }
        const GraphQLType& resolved = resolveNamedType(ctx, ref);
        const auto* object = typeAs<ObjectType>(resolved);
        if (!object) {
            throw UnallowedReturnTypeForUnion(definition.name, resolved.toString());
        }
        members.push_back(object);
    }

    TypeResolver resolver = definition.typeResolverFactory
        ? definition.typeResolverFactory(ctx.cache())
        : defaultTypeResolver(definition, ctx.cache());

    auto type = std::make_unique<UnionType>(definition.name, definition.description,
                                            std::move(members), std::move(resolver));
    return static_cast<const UnionType&>(
        ctx.cache().put(definition.name, &definition, std::move(type)));
}

} // namespace gqlpp::convert
