#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/errors.h — Schema construction and type-resolution errors
// ═══════════════════════════════════════════════════════════════════
//
//  Everything thrown by the converter derives from SchemaError.
//  All but WrongReturnTypeForUnion abort the schema build; that one
//  is raised by a union's type resolver while a query executes.
//
// ═══════════════════════════════════════════════════════════════════

#include <stdexcept>
#include <string>

namespace gqlpp {

class SchemaError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ── A TypeRef carries a tag outside the closed set of kinds ──
class UnrecognizedTypeKind : public SchemaError {
public:
    explicit UnrecognizedTypeKind(int tag)
        : SchemaError("Unexpected type kind tag " + std::to_string(tag)), tag_(tag) {}

    int tag() const { return tag_; }

private:
    int tag_;
};

// ── A definition of one kind was handed to another kind's builder ──
class WrongKindForBuilder : public SchemaError {
public:
    WrongKindForBuilder(const std::string& typeName, const std::string& actual,
                        const std::string& expected)
        : SchemaError("Type '" + typeName + "' is " + actual + ", expected " + expected),
          typeName_(typeName), actual_(actual), expected_(expected) {}

    const std::string& typeName() const { return typeName_; }
    const std::string& actualKind() const { return actual_; }
    const std::string& expectedKind() const { return expected_; }

private:
    std::string typeName_;
    std::string actual_;
    std::string expected_;
};

// ── A union member does not resolve to an object type ──
class UnallowedReturnTypeForUnion : public SchemaError {
public:
    UnallowedReturnTypeForUnion(const std::string& unionName, const std::string& memberName)
        : SchemaError("The type \"" + memberName + "\" cannot be a member of union \"" +
                      unionName + "\": union members must be object types"),
          unionName_(unionName), memberName_(memberName) {}

    const std::string& unionName() const { return unionName_; }
    const std::string& memberName() const { return memberName_; }

private:
    std::string unionName_;
    std::string memberName_;
};

// ── A resolved value matches none of a union's members ──
class WrongReturnTypeForUnion : public SchemaError {
public:
    WrongReturnTypeForUnion(const std::string& fieldName, const std::string& returnType)
        : SchemaError("The type \"" + returnType + "\" cannot be resolved for the field \"" +
                      fieldName + "\": it matches no member of the union"),
          fieldName_(fieldName), returnType_(returnType) {}

    const std::string& fieldName() const { return fieldName_; }
    const std::string& returnType() const { return returnType_; }

private:
    std::string fieldName_;
    std::string returnType_;
};

// ── The input graph or the cache broke a structural assumption ──
class InternalConsistencyError : public SchemaError {
public:
    using SchemaError::SchemaError;
};

} // namespace gqlpp
