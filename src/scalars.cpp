// ═══════════════════════════════════════════════════════════════════
//  src/scalars.cpp — Built-in scalars and the default registry
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/scalars.h"

namespace gqlpp {

const ScalarType& builtinScalar(BuiltinScalar scalar) {
    static const ScalarType str("String",
        "The `String` scalar type represents textual data, represented as UTF-8 "
        "character sequences.");
    static const ScalarType integer("Int",
        "The `Int` scalar type represents non-fractional signed whole numeric values. "
        "Int can represent values between -(2^31) and 2^31 - 1.");
    static const ScalarType floating("Float",
        "The `Float` scalar type represents signed double-precision fractional values "
        "as specified by IEEE 754.");
    static const ScalarType boolean("Boolean",
        "The `Boolean` scalar type represents `true` or `false`.");
    static const ScalarType id("ID",
        "The `ID` scalar type represents a unique identifier, often used to refetch an "
        "object or as key for a cache.");

    switch (scalar) {
        case BuiltinScalar::String:  return str;
        case BuiltinScalar::Int:     return integer;
        case BuiltinScalar::Float:   return floating;
        case BuiltinScalar::Boolean: return boolean;
        case BuiltinScalar::ID:      return id;
    }
    throw UnrecognizedTypeKind(static_cast<int>(scalar));
}

const ScalarType& DefaultScalarRegistry::resolve(const ScalarMarker& marker, TypeCache& cache) {
    if (auto* builtin = std::get_if<BuiltinScalar>(&marker)) {
        return builtinScalar(*builtin);
    }

    const ScalarDefinition* definition = std::get<const ScalarDefinition*>(marker);
    if (!definition || definition->name.empty()) {
        throw InternalConsistencyError("Custom scalar has no name");
    }
    if (auto* existing = cache.getAs<ScalarType>(definition->name)) {
        return *existing;
    }

    auto scalar = std::make_unique<ScalarType>(
        definition->name, definition->description, definition->serialize,
        definition->parseValue, definition->parseLiteral, definition->specifiedByUrl);
    return static_cast<const ScalarType&>(
        cache.put(definition->name, definition, std::move(scalar)));
}

} // namespace gqlpp
