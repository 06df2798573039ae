// ═══════════════════════════════════════════════════════════════════
//  src/dispatcher.cpp — Type dispatch and modifier composition
// ═══════════════════════════════════════════════════════════════════
//
//  resolveType() is the entry point for every field and argument type:
//
//    Optional(T)      -> resolveNamedType(T)
//    List(T)          -> NonNull(List(resolveType(T)))
//    T                -> NonNull(resolveNamedType(T))
//
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/converter.h"

namespace gqlpp {

namespace convert {

const GraphQLType& applyModifiers(TypeCache& cache, const GraphQLType& inner, Modifiers modifiers) {
    const GraphQLType* type = &inner;
    if (modifiers.list) {
        type = &cache.listOf(*type);
    }
    if (!modifiers.optional) {
        type = &cache.nonNullOf(*type);
    }
    return *type;
}

const GraphQLType& resolveType(BuildContext& ctx, const TypeRef& ref) {
    const TypeRef* current = &ref;
    Modifiers modifiers;

    while (current->kind() == TypeRef::Kind::Optional) {
        modifiers.optional = true;
        current = &current->child();
    }

    if (current->kind() == TypeRef::Kind::List) {
        modifiers.list = true;
        const GraphQLType& item = resolveType(ctx, current->child());
        return applyModifiers(ctx.cache(), item, modifiers);
    }

    return applyModifiers(ctx.cache(), resolveNamedType(ctx, *current), modifiers);
}

const GraphQLType& resolveNamedType(BuildContext& ctx, const TypeRef& ref) {
    switch (ref.kind()) {
        case TypeRef::Kind::Object:
            return fromObjectType(ctx, ref.typeDefinition());
        case TypeRef::Kind::Input:
            return fromInputObjectType(ctx, ref.typeDefinition());
        case TypeRef::Kind::Interface:
            return fromInterface(ctx, ref.typeDefinition());
        case TypeRef::Kind::Enum:
            return fromEnum(ctx, ref.enumDefinition());
        case TypeRef::Kind::Scalar:
            return fromScalar(ctx, ref.scalarMarker());
        case TypeRef::Kind::Union:
            return fromUnion(ctx, ref.unionDefinition());
        case TypeRef::Kind::List:
            return ctx.cache().listOf(resolveType(ctx, ref.child()));
        case TypeRef::Kind::Optional:
            return resolveNamedType(ctx, ref.child());
    }
    throw UnrecognizedTypeKind(static_cast<int>(ref.kind()));
}

} // namespace convert

// ═══════════════════════════════════════════
//  Converter
// ═══════════════════════════════════════════

Converter::Converter(std::shared_ptr<TypeCache> cache, ConverterOptions options)
    : cache_(cache ? std::move(cache) : std::make_shared<TypeCache>()),
      context_(std::make_unique<BuildContext>(*cache_, std::move(options))) {}

std::size_t Converter::finalize() {
    return context_->transaction([this] { return context_->populatePending(); });
}

} // namespace gqlpp
