// ═══════════════════════════════════════════════════════════════════
//  src/types.cpp — Concrete schema types and definition helpers
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/types.h"
#include "gqlpp/definitions.h"

#include <algorithm>

namespace gqlpp {

std::string toString(TypeKind kind) {
    return nlohmann::json(kind).get<std::string>();
}

std::string toString(BuiltinScalar scalar) {
    return nlohmann::json(scalar).get<std::string>();
}

std::string toString(TypeDefinition::Kind kind) {
    return nlohmann::json(kind).get<std::string>();
}

const NamedType& namedTypeOf(const GraphQLType& type) {
    const GraphQLType* current = &type;
    while (true) {
        if (auto* list = typeAs<ListType>(*current)) {
            current = &list->ofType();
        } else if (auto* nonNull = typeAs<NonNullType>(*current)) {
            current = &nonNull->ofType();
        } else {
            break;
        }
    }
    return static_cast<const NamedType&>(*current);
}

// ═══════════════════════════════════════════
//  Named types
// ═══════════════════════════════════════════

const EnumValue* EnumType::value(std::string_view name) const {
    for (const auto& v : values_) {
        if (v.name == name) return &v;
    }
    return nullptr;
}

const EnumValue* EnumType::valueFor(const JsonValue& internal) const {
    for (const auto& v : values_) {
        if (v.value == internal) return &v;
    }
    return nullptr;
}

bool ObjectType::implements(const InterfaceType& iface) const {
    return std::find(interfaces_.begin(), interfaces_.end(), &iface) != interfaces_.end();
}

bool UnionType::hasMember(const ObjectType& type) const {
    return std::find(types_.begin(), types_.end(), &type) != types_.end();
}

const ObjectType& UnionType::resolveType(const std::any& value, const ResolveInfo& info) const {
    if (!resolveType_) {
        throw InternalConsistencyError("Union '" + name() + "' has no type resolver");
    }
    const ObjectType& resolved = resolveType_(value, info);
    if (!hasMember(resolved)) {
        throw WrongReturnTypeForUnion(info.fieldName, resolved.name());
    }
    return resolved;
}

// ═══════════════════════════════════════════
//  TypeRef
// ═══════════════════════════════════════════

TypeRef::TypeRef(Kind kind, const TypeDefinition& definition)
    : kind_(kind), payload_(&definition) {}

TypeRef TypeRef::named(const TypeDefinition& definition) {
    switch (definition.kind) {
        case TypeDefinition::Kind::Object:    return TypeRef(Kind::Object, definition);
        case TypeDefinition::Kind::Input:     return TypeRef(Kind::Input, definition);
        case TypeDefinition::Kind::Interface: return TypeRef(Kind::Interface, definition);
    }
    throw InternalConsistencyError("Type '" + definition.name + "' has an unknown definition kind");
}

TypeRef TypeRef::enumeration(const EnumDefinition& definition) {
    return TypeRef(Kind::Enum, Payload(&definition));
}

TypeRef TypeRef::scalar(BuiltinScalar scalar) {
    return TypeRef(Kind::Scalar, Payload(ScalarMarker(scalar)));
}

TypeRef TypeRef::scalar(const ScalarDefinition& definition) {
    return TypeRef(Kind::Scalar, Payload(ScalarMarker(&definition)));
}

TypeRef TypeRef::unionOf(const UnionDefinition& definition) {
    return TypeRef(Kind::Union, Payload(&definition));
}

TypeRef TypeRef::list(TypeRef of) {
    return TypeRef(Kind::List, Payload(std::make_shared<const TypeRef>(std::move(of))));
}

TypeRef TypeRef::optional(TypeRef of) {
    return TypeRef(Kind::Optional, Payload(std::make_shared<const TypeRef>(std::move(of))));
}

namespace {

template <typename T>
const T& payloadAs(const std::variant<std::monostate, const TypeDefinition*, const EnumDefinition*,
                                      const UnionDefinition*, ScalarMarker,
                                      std::shared_ptr<const TypeRef>>& payload,
                   const char* what) {
    if (auto* p = std::get_if<const T*>(&payload); p && *p) return **p;
    throw InternalConsistencyError(std::string("Type reference does not hold ") + what);
}

} // namespace

const TypeDefinition& TypeRef::typeDefinition() const {
    return payloadAs<TypeDefinition>(payload_, "a type definition");
}

const EnumDefinition& TypeRef::enumDefinition() const {
    return payloadAs<EnumDefinition>(payload_, "an enum definition");
}

const UnionDefinition& TypeRef::unionDefinition() const {
    return payloadAs<UnionDefinition>(payload_, "a union definition");
}

const ScalarMarker& TypeRef::scalarMarker() const {
    if (auto* marker = std::get_if<ScalarMarker>(&payload_)) return *marker;
    throw InternalConsistencyError("Type reference does not hold a scalar");
}

const TypeRef& TypeRef::child() const {
    if (auto* child = std::get_if<std::shared_ptr<const TypeRef>>(&payload_); child && *child) {
        return **child;
    }
    throw InternalConsistencyError("Type reference has no child");
}

std::string TypeRef::describe() const {
    switch (kind_) {
        case Kind::Object:
        case Kind::Input:
        case Kind::Interface:
            return typeDefinition().name;
        case Kind::Enum:
            return enumDefinition().name;
        case Kind::Union:
            return unionDefinition().name;
        case Kind::Scalar: {
            const auto& marker = scalarMarker();
            if (auto* builtin = std::get_if<BuiltinScalar>(&marker)) return toString(*builtin);
            return std::get<const ScalarDefinition*>(marker)->name;
        }
        case Kind::List:
            return "[" + child().describe() + "]";
        case Kind::Optional:
            return "Optional<" + child().describe() + ">";
    }
    return "<kind " + std::to_string(static_cast<int>(kind_)) + ">";
}

} // namespace gqlpp
