#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/types.h — Concrete schema types handed to the executor
// ═══════════════════════════════════════════════════════════════════
//
//  Named types (scalars, enums, objects, interfaces, unions, input
//  objects) are owned by a TypeCache and referenced everywhere else
//  by plain pointers/references, so cyclic graphs need no shared
//  ownership. List and NonNull wrappers are owned by the cache too.
//
//  Object, interface and input-object types start as skeletons: their
//  field map is a thunk evaluated on first access (or by the build
//  context's populate pass) with whichever context owns the skeleton.
//
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include "errors.h"
#include <any>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gqlpp {

class BuildContext;
class ObjectType;
class InterfaceType;

// ── Per-call execution info supplied by the executor ──
struct ResolveInfo {
    std::string fieldName;
    std::string parentTypeName;
    JsonValue context;
};

// ── Resolver: (source, arguments, info) -> result ──
using Resolver = std::function<std::any(const std::any& source, const JsonValue& args,
                                        const ResolveInfo& info)>;

// ── Maps a runtime value of an abstract type to its object type ──
using TypeResolver = std::function<const ObjectType&(const std::any& value,
                                                     const ResolveInfo& info)>;

enum class TypeKind { Scalar, Object, Interface, Union, Enum, InputObject, List, NonNull };

NLOHMANN_JSON_SERIALIZE_ENUM(TypeKind, {
    {TypeKind::Scalar, "SCALAR"},
    {TypeKind::Object, "OBJECT"},
    {TypeKind::Interface, "INTERFACE"},
    {TypeKind::Union, "UNION"},
    {TypeKind::Enum, "ENUM"},
    {TypeKind::InputObject, "INPUT_OBJECT"},
    {TypeKind::List, "LIST"},
    {TypeKind::NonNull, "NON_NULL"},
})

std::string toString(TypeKind kind);

// ═══════════════════════════════════════════
//  Type hierarchy
// ═══════════════════════════════════════════
class GraphQLType {
public:
    virtual ~GraphQLType() = default;

    GraphQLType(const GraphQLType&) = delete;
    GraphQLType& operator=(const GraphQLType&) = delete;

    TypeKind kind() const { return kind_; }

    // Type as written in SDL: "Point", "[Int!]!"
    virtual std::string toString() const = 0;

protected:
    explicit GraphQLType(TypeKind kind) : kind_(kind) {}

private:
    TypeKind kind_;
};

class NamedType : public GraphQLType {
public:
    const std::string& name() const { return name_; }
    const std::optional<std::string>& description() const { return description_; }

    std::string toString() const override { return name_; }

protected:
    NamedType(TypeKind kind, std::string name, std::optional<std::string> description)
        : GraphQLType(kind), name_(std::move(name)), description_(std::move(description)) {}

private:
    std::string name_;
    std::optional<std::string> description_;
};

class ListType : public GraphQLType {
public:
    explicit ListType(const GraphQLType& ofType) : GraphQLType(TypeKind::List), ofType_(ofType) {}

    const GraphQLType& ofType() const { return ofType_; }
    std::string toString() const override { return "[" + ofType_.toString() + "]"; }

private:
    const GraphQLType& ofType_;
};

class NonNullType : public GraphQLType {
public:
    explicit NonNullType(const GraphQLType& ofType)
        : GraphQLType(TypeKind::NonNull), ofType_(ofType) {}

    const GraphQLType& ofType() const { return ofType_; }
    std::string toString() const override { return ofType_.toString() + "!"; }

private:
    const GraphQLType& ofType_;
};

// Strips every List/NonNull wrapper.
const NamedType& namedTypeOf(const GraphQLType& type);

template <typename T>
const T* typeAs(const GraphQLType& type) {
    return dynamic_cast<const T*>(&type);
}

// ═══════════════════════════════════════════
//  Fields and arguments
// ═══════════════════════════════════════════

// Ordered name -> value list; definition order is schema order.
template <typename T>
using NamedMap = std::vector<std::pair<std::string, T>>;

template <typename T>
const T* lookup(const NamedMap<T>& map, std::string_view name) {
    for (const auto& [key, value] : map) {
        if (key == name) return &value;
    }
    return nullptr;
}

struct Argument {
    const GraphQLType* type = nullptr;
    // nullopt: no default; a JSON null: the default is explicitly null.
    std::optional<JsonValue> defaultValue;
    std::optional<std::string> description;

    bool hasDefault() const { return defaultValue.has_value(); }
};

using ArgumentMap = NamedMap<Argument>;

struct Field {
    const GraphQLType* type = nullptr;
    ArgumentMap args;
    Resolver resolve;     // empty: the executor's default property resolver
    Resolver subscribe;   // set only on subscription fields
    std::optional<std::string> description;
    std::optional<std::string> deprecationReason;

    bool isDeprecated() const { return deprecationReason.has_value(); }
    const Argument* arg(std::string_view name) const { return lookup(args, name); }
};

using FieldMap = NamedMap<Field>;

struct InputField {
    const GraphQLType* type = nullptr;
    std::optional<JsonValue> defaultValue;
    std::optional<std::string> description;

    bool hasDefault() const { return defaultValue.has_value(); }
};

using InputFieldMap = NamedMap<InputField>;

// ═══════════════════════════════════════════
//  Deferred field maps
// ═══════════════════════════════════════════

// A skeleton whose fields have not been computed yet. It is owned by
// at most one build context at a time; the owner runs its thunk.
class PendingFields {
public:
    virtual ~PendingFields() = default;

    virtual bool populated() const = 0;
    virtual void populate() const = 0;

    virtual BuildContext* context() const = 0;
    virtual void attach(BuildContext& ctx) const = 0;

    // Reads throw until another context attaches.
    virtual void detach() const = 0;

    // Forgets a computed map so it is rebuilt on the next read.
    virtual void reset() const = 0;
};

template <typename Map>
class FieldContainer : public PendingFields {
public:
    using Thunk = std::function<Map(BuildContext& ctx, const PendingFields& self)>;

    bool populated() const override { return map_.has_value(); }
    void populate() const override { (void)fieldMap(); }

    BuildContext* context() const override { return context_; }
    void attach(BuildContext& ctx) const override { context_ = &ctx; }
    void detach() const override { context_ = nullptr; }
    void reset() const override { map_.reset(); }

protected:
    FieldContainer(std::string owner, Thunk thunk)
        : owner_(std::move(owner)), thunk_(std::move(thunk)) {}

    const Map& fieldMap() const {
        if (map_) return *map_;
        if (!context_) {
            throw InternalConsistencyError("Fields of '" + owner_ +
                                           "' requested with no live build context");
        }
        if (resolving_) {
            throw InternalConsistencyError("Fields of '" + owner_ +
                                           "' requested while they are being populated");
        }
        resolving_ = true;
        try {
            map_ = thunk_(*context_, *this);
        } catch (...) {
            resolving_ = false;
            throw;
        }
        resolving_ = false;
        return *map_;
    }

private:
    std::string owner_;
    Thunk thunk_;
    mutable std::optional<Map> map_;
    mutable BuildContext* context_ = nullptr;
    mutable bool resolving_ = false;
};

// ═══════════════════════════════════════════
//  Named types
// ═══════════════════════════════════════════
class ScalarType : public NamedType {
public:
    using Serializer = std::function<JsonValue(const std::any& value)>;
    using Parser = std::function<std::any(const JsonValue& input)>;

    // Empty functions leave coercion to the executor (built-in scalars).
    ScalarType(std::string name, std::optional<std::string> description,
               Serializer serialize = nullptr, Parser parseValue = nullptr,
               Parser parseLiteral = nullptr,
               std::optional<std::string> specifiedByUrl = std::nullopt)
        : NamedType(TypeKind::Scalar, std::move(name), std::move(description)),
          serialize_(std::move(serialize)), parseValue_(std::move(parseValue)),
          parseLiteral_(std::move(parseLiteral)), specifiedByUrl_(std::move(specifiedByUrl)) {}

    const Serializer& serialize() const { return serialize_; }
    const Parser& parseValue() const { return parseValue_; }
    const Parser& parseLiteral() const { return parseLiteral_; }
    const std::optional<std::string>& specifiedByUrl() const { return specifiedByUrl_; }

private:
    Serializer serialize_;
    Parser parseValue_;
    Parser parseLiteral_;
    std::optional<std::string> specifiedByUrl_;
};

struct EnumValue {
    std::string name;
    JsonValue value;
};

class EnumType : public NamedType {
public:
    EnumType(std::string name, std::optional<std::string> description,
             std::vector<EnumValue> values)
        : NamedType(TypeKind::Enum, std::move(name), std::move(description)),
          values_(std::move(values)) {}

    const std::vector<EnumValue>& values() const { return values_; }

    const EnumValue* value(std::string_view name) const;
    // Reverse lookup used when serializing: internal value -> enum value.
    const EnumValue* valueFor(const JsonValue& internal) const;

private:
    std::vector<EnumValue> values_;
};

class InterfaceType : public NamedType, public FieldContainer<FieldMap> {
public:
    InterfaceType(std::string name, std::optional<std::string> description, Thunk fields)
        : NamedType(TypeKind::Interface, name, std::move(description)),
          FieldContainer<FieldMap>(name, std::move(fields)) {}

    const FieldMap& fields() const { return fieldMap(); }
    const Field* field(std::string_view name) const { return lookup(fields(), name); }

    const std::vector<const InterfaceType*>& interfaces() const { return interfaces_; }
    void setInterfaces(std::vector<const InterfaceType*> interfaces) {
        interfaces_ = std::move(interfaces);
    }

private:
    std::vector<const InterfaceType*> interfaces_;
};

class ObjectType : public NamedType, public FieldContainer<FieldMap> {
public:
    using IsTypeOf = std::function<bool(const std::any& value)>;

    ObjectType(std::string name, std::optional<std::string> description, Thunk fields,
               IsTypeOf isTypeOf = nullptr)
        : NamedType(TypeKind::Object, name, std::move(description)),
          FieldContainer<FieldMap>(name, std::move(fields)),
          isTypeOf_(std::move(isTypeOf)) {}

    const FieldMap& fields() const { return fieldMap(); }
    const Field* field(std::string_view name) const { return lookup(fields(), name); }

    const std::vector<const InterfaceType*>& interfaces() const { return interfaces_; }
    void setInterfaces(std::vector<const InterfaceType*> interfaces) {
        interfaces_ = std::move(interfaces);
    }
    bool implements(const InterfaceType& iface) const;

    // Without a bound native type the check is left to the executor.
    bool hasIsTypeOf() const { return static_cast<bool>(isTypeOf_); }
    bool isTypeOf(const std::any& value) const { return isTypeOf_ && isTypeOf_(value); }

private:
    std::vector<const InterfaceType*> interfaces_;
    IsTypeOf isTypeOf_;
};

class UnionType : public NamedType {
public:
    UnionType(std::string name, std::optional<std::string> description,
              std::vector<const ObjectType*> types, TypeResolver resolveType)
        : NamedType(TypeKind::Union, std::move(name), std::move(description)),
          types_(std::move(types)), resolveType_(std::move(resolveType)) {}

    const std::vector<const ObjectType*>& types() const { return types_; }
    bool hasMember(const ObjectType& type) const;

    // Throws WrongReturnTypeForUnion when the value belongs to no member.
    const ObjectType& resolveType(const std::any& value, const ResolveInfo& info) const;

private:
    std::vector<const ObjectType*> types_;
    TypeResolver resolveType_;
};

class InputObjectType : public NamedType, public FieldContainer<InputFieldMap> {
public:
    InputObjectType(std::string name, std::optional<std::string> description, Thunk fields)
        : NamedType(TypeKind::InputObject, name, std::move(description)),
          FieldContainer<InputFieldMap>(name, std::move(fields)) {}

    const InputFieldMap& fields() const { return fieldMap(); }
    const InputField* field(std::string_view name) const { return lookup(fields(), name); }
};

// ═══════════════════════════════════════════
//  Directives
// ═══════════════════════════════════════════
enum class DirectiveLocation {
    // executable
    Query, Mutation, Subscription, Field, FragmentDefinition, FragmentSpread,
    InlineFragment, VariableDefinition,
    // type system
    Schema, Scalar, Object, FieldDefinition, ArgumentDefinition, Interface, Union,
    Enum, EnumValue, InputObject, InputFieldDefinition,
};

NLOHMANN_JSON_SERIALIZE_ENUM(DirectiveLocation, {
    {DirectiveLocation::Query, "QUERY"},
    {DirectiveLocation::Mutation, "MUTATION"},
    {DirectiveLocation::Subscription, "SUBSCRIPTION"},
    {DirectiveLocation::Field, "FIELD"},
    {DirectiveLocation::FragmentDefinition, "FRAGMENT_DEFINITION"},
    {DirectiveLocation::FragmentSpread, "FRAGMENT_SPREAD"},
    {DirectiveLocation::InlineFragment, "INLINE_FRAGMENT"},
    {DirectiveLocation::VariableDefinition, "VARIABLE_DEFINITION"},
    {DirectiveLocation::Schema, "SCHEMA"},
    {DirectiveLocation::Scalar, "SCALAR"},
    {DirectiveLocation::Object, "OBJECT"},
    {DirectiveLocation::FieldDefinition, "FIELD_DEFINITION"},
    {DirectiveLocation::ArgumentDefinition, "ARGUMENT_DEFINITION"},
    {DirectiveLocation::Interface, "INTERFACE"},
    {DirectiveLocation::Union, "UNION"},
    {DirectiveLocation::Enum, "ENUM"},
    {DirectiveLocation::EnumValue, "ENUM_VALUE"},
    {DirectiveLocation::InputObject, "INPUT_OBJECT"},
    {DirectiveLocation::InputFieldDefinition, "INPUT_FIELD_DEFINITION"},
})

struct Directive {
    std::string name;
    std::vector<DirectiveLocation> locations;
    ArgumentMap args;
    std::optional<std::string> description;

    const Argument* arg(std::string_view name) const { return lookup(args, name); }
};

} // namespace gqlpp
