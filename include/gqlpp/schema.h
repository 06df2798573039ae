#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/schema.h — Assemble root types, extra types and directives
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    SchemaDefinition def;
//    def.query = &queryDefinition;
//    auto schema = Schema::build(def);
//    schema.queryType().field("user");
//
// ═══════════════════════════════════════════════════════════════════

#include "cache.h"
#include "converter.h"
#include "definitions.h"
#include "types.h"
#include <memory>
#include <string>
#include <vector>

namespace gqlpp {

struct SchemaDefinition {
    const TypeDefinition* query = nullptr;
    const TypeDefinition* mutation = nullptr;
    const TypeDefinition* subscription = nullptr;
    // Types not reachable from the roots
    std::vector<TypeRef> types;
    std::vector<DirectiveDefinition> directives;
};

struct SchemaOptions {
    ConverterOptions converter;
    bool populateEagerly = true;          // run phase 2 before returning
    std::shared_ptr<TypeCache> cache;     // share type identity with other schemas
};

class Schema {
public:
    // Throws the converter's SchemaError on any build failure.
    static Schema build(const SchemaDefinition& definition, SchemaOptions options = {});

    Schema(Schema&&) noexcept = default;
    Schema& operator=(Schema&&) noexcept = default;

    const ObjectType& queryType() const { return *query_; }
    const ObjectType* mutationType() const { return mutation_; }
    const ObjectType* subscriptionType() const { return subscription_; }

    const NamedType* getType(const std::string& name) const;

    const std::vector<Directive>& directives() const { return directives_; }
    const Directive* directive(const std::string& name) const;

    const TypeCache& typeMap() const { return converter_->typeMap(); }
    std::shared_ptr<TypeCache> sharedTypeMap() const { return converter_->sharedTypeMap(); }

private:
    Schema() = default;

    // Kept alive so fields not populated eagerly can still be read.
    std::unique_ptr<Converter> converter_;
    const ObjectType* query_ = nullptr;
    const ObjectType* mutation_ = nullptr;
    const ObjectType* subscription_ = nullptr;
    std::vector<Directive> directives_;
};

} // namespace gqlpp
