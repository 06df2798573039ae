#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/definitions.h — The type-definition graph fed to the converter
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    TypeDefinition point{.name = "Point", .kind = TypeDefinition::Kind::Object};
//    point.fields.push_back({.name = "x", .type = TypeRef::scalar(BuiltinScalar::Int)});
//    point.fields.push_back({.name = "y", .type = TypeRef::scalar(BuiltinScalar::Int)});
//
//  Definitions are owned by whoever produced them and must outlive the
//  build. References between definitions are plain pointers, so types
//  can point at each other before either is complete.
//
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include "types.h"
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <variant>
#include <vector>

namespace gqlpp {

class TypeCache;
struct TypeDefinition;
struct EnumDefinition;
struct UnionDefinition;
struct ScalarDefinition;

enum class BuiltinScalar { String, Int, Float, Boolean, ID };

NLOHMANN_JSON_SERIALIZE_ENUM(BuiltinScalar, {
    {BuiltinScalar::String, "String"},
    {BuiltinScalar::Int, "Int"},
    {BuiltinScalar::Float, "Float"},
    {BuiltinScalar::Boolean, "Boolean"},
    {BuiltinScalar::ID, "ID"},
})

std::string toString(BuiltinScalar scalar);

using ScalarMarker = std::variant<BuiltinScalar, const ScalarDefinition*>;

// ═══════════════════════════════════════════
//  class TypeRef
//  Reference to a type from a field or argument, tagged with a closed
//  set of kinds. List and Optional wrap a child reference.
// ═══════════════════════════════════════════
class TypeRef {
public:
    enum class Kind { Object, Input, Interface, Enum, Scalar, Union, List, Optional };

    // The tag is taken as given; a mismatch with definition.kind is
    // reported by the builder.
    TypeRef(Kind kind, const TypeDefinition& definition);

    // Tag derived from definition.kind.
    static TypeRef named(const TypeDefinition& definition);
    static TypeRef enumeration(const EnumDefinition& definition);
    static TypeRef scalar(BuiltinScalar scalar);
    static TypeRef scalar(const ScalarDefinition& definition);
    static TypeRef unionOf(const UnionDefinition& definition);
    static TypeRef list(TypeRef of);
    static TypeRef optional(TypeRef of);

    Kind kind() const { return kind_; }
    bool isList() const { return kind_ == Kind::List; }
    bool isOptional() const { return kind_ == Kind::Optional; }

    // Payload accessors throw InternalConsistencyError on a payload
    // that does not match the tag.
    const TypeDefinition& typeDefinition() const;
    const EnumDefinition& enumDefinition() const;
    const UnionDefinition& unionDefinition() const;
    const ScalarMarker& scalarMarker() const;
    const TypeRef& child() const;

    // "Point", "[Int]", "Optional<Point>"; for messages only
    std::string describe() const;

private:
    using Payload = std::variant<std::monostate, const TypeDefinition*, const EnumDefinition*,
                                 const UnionDefinition*, ScalarMarker,
                                 std::shared_ptr<const TypeRef>>;

    TypeRef(Kind kind, Payload payload) : kind_(kind), payload_(std::move(payload)) {}

    Kind kind_;
    Payload payload_;
};

// ═══════════════════════════════════════════
//  class DefaultValue
//  NotProvided, an explicit null, or a value.
// ═══════════════════════════════════════════
class DefaultValue {
public:
    enum class State { NotProvided, Null, Value };

    DefaultValue() = default;

    static DefaultValue notProvided() { return DefaultValue(); }
    static DefaultValue null() { return DefaultValue(State::Null, JsonValue::null()); }

    // A JSON null given as a value is the explicit-null default.
    static DefaultValue of(JsonValue value) {
        if (value.isNull()) return null();
        return DefaultValue(State::Value, std::move(value));
    }

    State state() const { return state_; }
    bool isProvided() const { return state_ != State::NotProvided; }
    bool isNull() const { return state_ == State::Null; }

    const JsonValue& value() const {
        if (state_ != State::Value) {
            throw InternalConsistencyError("Default value has no payload");
        }
        return value_;
    }

private:
    DefaultValue(State state, JsonValue value) : state_(state), value_(std::move(value)) {}

    State state_ = State::NotProvided;
    JsonValue value_;
};

// ═══════════════════════════════════════════
//  Definitions
// ═══════════════════════════════════════════
struct ArgumentDefinition {
    std::string name;
    TypeRef type;
    DefaultValue defaultValue;
    std::optional<std::string> description;
};

struct FieldDefinition {
    std::string name;
    TypeRef type;
    std::optional<std::string> description;
    std::vector<ArgumentDefinition> arguments;
    DefaultValue defaultValue;   // input fields only
    std::optional<std::string> deprecationReason;
    bool isSubscription = false;
    Resolver resolver;
};

struct TypeDefinition {
    enum class Kind { Object, Input, Interface };

    std::string name;
    Kind kind = Kind::Object;
    std::optional<std::string> description;
    // Native type of runtime values; drives ObjectType::isTypeOf.
    std::optional<std::type_index> origin;
    std::vector<FieldDefinition> fields;
    std::vector<const TypeDefinition*> interfaces;
};

NLOHMANN_JSON_SERIALIZE_ENUM(TypeDefinition::Kind, {
    {TypeDefinition::Kind::Object, "object type"},
    {TypeDefinition::Kind::Input, "input type"},
    {TypeDefinition::Kind::Interface, "interface"},
})

std::string toString(TypeDefinition::Kind kind);

struct EnumValueDefinition {
    std::string name;
    JsonValue value;
};

struct EnumDefinition {
    std::string name;
    std::optional<std::string> description;
    std::vector<EnumValueDefinition> values;
};

struct ScalarDefinition {
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> specifiedByUrl;
    ScalarType::Serializer serialize;
    ScalarType::Parser parseValue;
    ScalarType::Parser parseLiteral;
};

// Builds a union's type resolver once its members are in the cache.
using TypeResolverFactory = std::function<TypeResolver(const TypeCache& cache)>;

struct UnionDefinition {
    std::string name;
    std::optional<std::string> description;
    std::vector<TypeRef> types;
    // Unset: members are matched by their TypeDefinition::origin.
    TypeResolverFactory typeResolverFactory;
};

struct DirectiveDefinition {
    std::string name;
    std::vector<DirectiveLocation> locations;
    std::vector<ArgumentDefinition> arguments;
    std::optional<std::string> description;
};

} // namespace gqlpp
